#pragma once

#include <QDate>
#include <QDateTime>
#include <QVector>

namespace ventcast::forecast {

// Timestamps are civil wall-clock values of the forecast location, tagged Qt::UTC so that
// comparisons and arithmetic never apply time-zone or DST rules.
struct ForecastSample {
    QDateTime timestamp;
    double temperatureCelsius = 0.0;
    double relativeHumidityPercent = 0.0;
};

struct DailyAverage {
    QDate date;
    double meanTemperature = 0.0;
    double meanHumidity = 0.0;
    int sampleCount = 0;
};

//! Same wall-clock date and time as `value`, re-tagged as a civil (Qt::UTC) timestamp.
inline QDateTime civilDateTime(const QDateTime& value)
{
    if (!value.isValid() || value.timeSpec() == Qt::UTC)
        return value;
    return QDateTime(value.date(), value.time(), Qt::UTC);
}

} // namespace ventcast::forecast
