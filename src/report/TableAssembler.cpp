#include "TableAssembler.hpp"

#include <QLocale>
#include <QLoggingCategory>

#include "forecast/DailyAggregator.hpp"
#include "forecast/SeriesWindower.hpp"
#include "psychro/HumidityProjector.hpp"

Q_LOGGING_CATEGORY(lcReport, "ventcast.report")

namespace ventcast::report {

QString tableTitle(TableKind kind)
{
    switch (kind) {
    case TableKind::Hourly:
        return QStringLiteral("Hourly");
    case TableKind::Daily:
        return QStringLiteral("Daily");
    }
    return {};
}

QString rowLabel(TableKind kind, const QDateTime& timestamp)
{
    const QLocale locale = QLocale::c();
    if (kind == TableKind::Daily)
        return locale.toString(timestamp.date(), QStringLiteral("dddd, MMM dd"));
    return locale.toString(timestamp, QStringLiteral("ddd HH:mm"));
}

ProjectedTable assembleTable(TableKind kind,
                             const QVector<forecast::ForecastSample>& samples,
                             const QVector<double>& referenceTemperatures)
{
    ProjectedTable table;
    table.kind = kind;
    table.title = tableTitle(kind);
    table.referenceTemperatures = referenceTemperatures;
    table.rows.reserve(samples.size());

    for (const auto& sample : samples) {
        ProjectedRow row;
        row.label = rowLabel(kind, sample.timestamp);
        row.observedTemperature = sample.temperatureCelsius;
        row.projectedHumidity = psychro::projectHumidity(
            sample.temperatureCelsius, sample.relativeHumidityPercent, referenceTemperatures);
        table.rows.append(row);
    }
    return table;
}

ProjectedTable hourlyTable(const QVector<forecast::ForecastSample>& samples,
                           const QVector<double>& referenceTemperatures,
                           const QDateTime& now,
                           int count)
{
    const auto window = forecast::windowSeries(samples, forecast::kHourBucket, 1, count, now);
    qCDebug(lcReport) << "Hourly window holds" << window.size() << "of" << samples.size() << "samples";
    return assembleTable(TableKind::Hourly, window, referenceTemperatures);
}

ProjectedTable dailyTable(const QVector<forecast::ForecastSample>& samples,
                          const QVector<double>& referenceTemperatures,
                          const QDateTime& now,
                          int count)
{
    const auto days = forecast::aggregateByDay(samples);

    QVector<forecast::ForecastSample> daySamples;
    daySamples.reserve(days.size());
    for (const auto& day : days) {
        if (day.sampleCount < 24)
            qCDebug(lcReport) << "Partial day" << day.date << "averaged over" << day.sampleCount << "samples";
        daySamples.append(forecast::toDaySample(day));
    }

    const auto window = forecast::windowSeries(daySamples, forecast::kDayBucket, 1, count, now);
    return assembleTable(TableKind::Daily, window, referenceTemperatures);
}

} // namespace ventcast::report
