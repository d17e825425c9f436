#include <QtTest/QtTest>

#include <cmath>

#include "forecast/DailyAggregator.hpp"
#include "psychro/HumidityProjector.hpp"

using ventcast::forecast::aggregateByDay;
using ventcast::forecast::DailyAverage;
using ventcast::forecast::ForecastSample;
using ventcast::forecast::toDaySample;

namespace {

ForecastSample makeSample(const QDate& date, int hour, double temperature, double humidity)
{
    ForecastSample sample;
    sample.timestamp = QDateTime(date, QTime(hour, 0), Qt::UTC);
    sample.temperatureCelsius = temperature;
    sample.relativeHumidityPercent = humidity;
    return sample;
}

} // namespace

class DailyAggregatorTest : public QObject {
    Q_OBJECT

private slots:
    void averagesTwoSamplesOfOneDay();
    void splitsTwoFullDays();
    void keepsSingleSampleDays();
    void averagesPartialFinalDay();
    void returnsEmptyForEmptyInput();
    void anchorsDaySampleAtMidnight();
};

void DailyAggregatorTest::averagesTwoSamplesOfOneDay()
{
    const QDate day(2024, 3, 14);
    const QVector<ForecastSample> samples{
        makeSample(day, 8, 22.0, 50.0),
        makeSample(day, 20, 18.0, 70.0),
    };

    const auto days = aggregateByDay(samples);
    QCOMPARE(days.size(), 1);
    QCOMPARE(days.first().date, day);
    QCOMPARE(days.first().sampleCount, 2);
    QCOMPARE(days.first().meanTemperature, 20.0);
    QCOMPARE(days.first().meanHumidity, 60.0);

    const auto morning = ventcast::psychro::projectHumidity(22.0, 50.0, {22.0});
    QCOMPARE(morning.first(), 50.0);
}

void DailyAggregatorTest::splitsTwoFullDays()
{
    const QDate first(2024, 3, 14);
    QVector<ForecastSample> samples;
    double expectedTemperature[2] = {0.0, 0.0};
    double expectedHumidity[2] = {0.0, 0.0};
    for (int hour = 0; hour < 48; ++hour) {
        const int dayIndex = hour / 24;
        const double temperature = 5.0 + (hour % 24) * 0.5 + dayIndex;
        const double humidity = 90.0 - (hour % 24) - dayIndex * 3.0;
        samples.append(makeSample(first.addDays(dayIndex), hour % 24, temperature, humidity));
        expectedTemperature[dayIndex] += temperature;
        expectedHumidity[dayIndex] += humidity;
    }

    const auto days = aggregateByDay(samples);
    QCOMPARE(days.size(), 2);
    for (int i = 0; i < 2; ++i) {
        QCOMPARE(days.at(i).date, first.addDays(i));
        QCOMPARE(days.at(i).sampleCount, 24);
        QVERIFY(std::abs(days.at(i).meanTemperature - expectedTemperature[i] / 24.0) < 1e-9);
        QVERIFY(std::abs(days.at(i).meanHumidity - expectedHumidity[i] / 24.0) < 1e-9);
    }
}

void DailyAggregatorTest::keepsSingleSampleDays()
{
    const QVector<ForecastSample> samples{
        makeSample(QDate(2024, 3, 14), 23, 7.5, 81.0),
        makeSample(QDate(2024, 3, 15), 0, 7.0, 83.0),
        makeSample(QDate(2024, 3, 15), 1, 6.0, 85.0),
    };

    const auto days = aggregateByDay(samples);
    QCOMPARE(days.size(), 2);
    QCOMPARE(days.at(0).sampleCount, 1);
    QCOMPARE(days.at(0).meanTemperature, 7.5);
    QCOMPARE(days.at(0).meanHumidity, 81.0);
    QCOMPARE(days.at(1).sampleCount, 2);
    QCOMPARE(days.at(1).meanTemperature, 6.5);
    QCOMPARE(days.at(1).meanHumidity, 84.0);
}

void DailyAggregatorTest::averagesPartialFinalDay()
{
    QVector<ForecastSample> samples;
    const QDate day(2024, 3, 14);
    for (int hour = 0; hour < 24; ++hour)
        samples.append(makeSample(day, hour, 10.0, 60.0));
    samples.append(makeSample(day.addDays(1), 0, 4.0, 90.0));
    samples.append(makeSample(day.addDays(1), 1, 2.0, 92.0));
    samples.append(makeSample(day.addDays(1), 2, 3.0, 94.0));

    const auto days = aggregateByDay(samples);
    QCOMPARE(days.size(), 2);
    QCOMPARE(days.last().sampleCount, 3);
    QCOMPARE(days.last().meanTemperature, 3.0);
    QCOMPARE(days.last().meanHumidity, 92.0);
}

void DailyAggregatorTest::returnsEmptyForEmptyInput()
{
    QVERIFY(aggregateByDay({}).isEmpty());
}

void DailyAggregatorTest::anchorsDaySampleAtMidnight()
{
    DailyAverage average;
    average.date = QDate(2024, 3, 15);
    average.meanTemperature = 12.25;
    average.meanHumidity = 66.5;
    average.sampleCount = 24;

    const ForecastSample sample = toDaySample(average);
    QCOMPARE(sample.timestamp, QDateTime(QDate(2024, 3, 15), QTime(0, 0), Qt::UTC));
    QCOMPARE(sample.temperatureCelsius, 12.25);
    QCOMPARE(sample.relativeHumidityPercent, 66.5);
}

QTEST_GUILESS_MAIN(DailyAggregatorTest)
#include "DailyAggregatorTest.moc"
