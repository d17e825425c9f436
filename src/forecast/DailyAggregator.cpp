#include "DailyAggregator.hpp"

namespace ventcast::forecast {

namespace {

DailyAverage finishGroup(const QDate& date, double temperatureSum, double humiditySum, int count)
{
    DailyAverage average;
    average.date = date;
    average.sampleCount = count;
    average.meanTemperature = temperatureSum / count;
    average.meanHumidity = humiditySum / count;
    return average;
}

} // namespace

QVector<DailyAverage> aggregateByDay(const QVector<ForecastSample>& samples)
{
    QVector<DailyAverage> days;

    QDate currentDate;
    double temperatureSum = 0.0;
    double humiditySum = 0.0;
    int count = 0;

    for (const auto& sample : samples) {
        const QDate date = civilDateTime(sample.timestamp).date();
        if (count > 0 && date != currentDate) {
            days.append(finishGroup(currentDate, temperatureSum, humiditySum, count));
            temperatureSum = 0.0;
            humiditySum = 0.0;
            count = 0;
        }
        currentDate = date;
        temperatureSum += sample.temperatureCelsius;
        humiditySum += sample.relativeHumidityPercent;
        ++count;
    }
    if (count > 0)
        days.append(finishGroup(currentDate, temperatureSum, humiditySum, count));

    return days;
}

ForecastSample toDaySample(const DailyAverage& average)
{
    ForecastSample sample;
    sample.timestamp = QDateTime(average.date, QTime(0, 0), Qt::UTC);
    sample.temperatureCelsius = average.meanTemperature;
    sample.relativeHumidityPercent = average.meanHumidity;
    return sample;
}

} // namespace ventcast::forecast
