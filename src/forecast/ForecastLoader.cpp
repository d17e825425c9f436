#include "ForecastLoader.hpp"

#include <QFile>
#include <QFileInfo>
#include <QIODevice>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QLoggingCategory>
#include <QObject>

#include <cstdio>

Q_LOGGING_CATEGORY(lcForecast, "ventcast.forecast")

namespace {

const QString kHourlyKey = QStringLiteral("hourly");
const QString kUnitsKey = QStringLiteral("hourly_units");
const QString kTimeKey = QStringLiteral("time");
const QString kTemperatureKey = QStringLiteral("temperature_2m");
const QString kHumidityKey = QStringLiteral("relative_humidity_2m");

std::optional<QVector<ventcast::forecast::ForecastSample>> reject(QString* errorMessage, const QString& message)
{
    qCWarning(lcForecast) << "Rejected forecast document:" << message;
    if (errorMessage)
        *errorMessage = message;
    return std::nullopt;
}

bool checkUnit(const QJsonObject& units, const QString& key, const QString& expected, QString* message)
{
    const QJsonValue value = units.value(key);
    if (value.isUndefined() || value.isNull())
        return true;
    const QString unit = value.toString().trimmed();
    if (unit == expected)
        return true;
    *message = QObject::tr("Unsupported unit '%1' for %2, expected '%3'.").arg(unit, key, expected);
    return false;
}

} // namespace

namespace ventcast::forecast {

QDateTime parseCivilDateTime(const QString& text)
{
    const QString trimmed = text.trimmed();
    const int separator = trimmed.indexOf(QLatin1Char('T'));
    if (separator <= 0)
        return {};

    const QDate date = QDate::fromString(trimmed.left(separator), Qt::ISODate);
    const QTime time = QTime::fromString(trimmed.mid(separator + 1), Qt::ISODate);
    if (!date.isValid() || !time.isValid())
        return {};
    return QDateTime(date, time, Qt::UTC);
}

std::optional<QVector<ForecastSample>> parseForecast(const QByteArray& document, QString* errorMessage)
{
    QJsonParseError error{};
    const QJsonDocument doc = QJsonDocument::fromJson(document, &error);
    if (error.error != QJsonParseError::NoError)
        return reject(errorMessage, QObject::tr("Invalid forecast JSON: %1 (offset %2).")
                                        .arg(error.errorString())
                                        .arg(error.offset));
    if (!doc.isObject())
        return reject(errorMessage, QObject::tr("Forecast JSON must be an object."));

    const QJsonObject root = doc.object();
    const QJsonValue hourlyValue = root.value(kHourlyKey);
    if (!hourlyValue.isObject())
        return reject(errorMessage, QObject::tr("Forecast is missing the '%1' object.").arg(kHourlyKey));

    const QJsonObject units = root.value(kUnitsKey).toObject();
    QString unitError;
    if (!checkUnit(units, kTemperatureKey, QStringLiteral("°C"), &unitError)
        || !checkUnit(units, kHumidityKey, QStringLiteral("%"), &unitError))
        return reject(errorMessage, unitError);

    const QJsonObject hourly = hourlyValue.toObject();
    for (const QString& key : {kTimeKey, kTemperatureKey, kHumidityKey}) {
        if (!hourly.value(key).isArray())
            return reject(errorMessage, QObject::tr("Forecast is missing the 'hourly.%1' array.").arg(key));
    }

    const QJsonArray times = hourly.value(kTimeKey).toArray();
    const QJsonArray temperatures = hourly.value(kTemperatureKey).toArray();
    const QJsonArray humidities = hourly.value(kHumidityKey).toArray();
    if (times.size() != temperatures.size() || times.size() != humidities.size())
        return reject(errorMessage, QObject::tr("Hourly arrays differ in length (time %1, %2 %3, %4 %5).")
                                        .arg(times.size())
                                        .arg(kTemperatureKey)
                                        .arg(temperatures.size())
                                        .arg(kHumidityKey)
                                        .arg(humidities.size()));

    QVector<ForecastSample> samples;
    samples.reserve(times.size());
    for (int i = 0; i < times.size(); ++i) {
        ForecastSample sample;
        sample.timestamp = parseCivilDateTime(times.at(i).toString());
        if (!sample.timestamp.isValid())
            return reject(errorMessage, QObject::tr("Invalid timestamp at hourly.time[%1].").arg(i));
        if (!samples.isEmpty() && !(samples.constLast().timestamp < sample.timestamp))
            return reject(errorMessage, QObject::tr("Timestamps are not strictly increasing at hourly.time[%1].").arg(i));

        const QJsonValue temperature = temperatures.at(i);
        const QJsonValue humidity = humidities.at(i);
        if (!temperature.isDouble())
            return reject(errorMessage, QObject::tr("Missing temperature at hourly.%1[%2].").arg(kTemperatureKey).arg(i));
        if (!humidity.isDouble())
            return reject(errorMessage, QObject::tr("Missing humidity at hourly.%1[%2].").arg(kHumidityKey).arg(i));

        sample.temperatureCelsius = temperature.toDouble();
        sample.relativeHumidityPercent = humidity.toDouble();
        samples.append(sample);
    }

    qCDebug(lcForecast) << "Loaded" << samples.size() << "hourly samples for time zone"
                        << root.value(QStringLiteral("timezone")).toString();
    return samples;
}

std::optional<QVector<ForecastSample>> loadForecast(QIODevice& device, QString* errorMessage)
{
    if (!device.isOpen() && !device.open(QIODevice::ReadOnly))
        return reject(errorMessage, QObject::tr("Unable to open forecast input: %1").arg(device.errorString()));
    return parseForecast(device.readAll(), errorMessage);
}

std::optional<QVector<ForecastSample>> loadForecastFile(const QString& path, QString* errorMessage)
{
    QFile file;
    if (path == QStringLiteral("-")) {
        if (!file.open(stdin, QIODevice::ReadOnly))
            return reject(errorMessage, QObject::tr("Unable to read forecast from standard input: %1")
                                            .arg(file.errorString()));
    } else {
        file.setFileName(path);
        if (!file.exists())
            return reject(errorMessage, QObject::tr("Forecast file does not exist: %1")
                                            .arg(QFileInfo(path).absoluteFilePath()));
        if (!file.open(QIODevice::ReadOnly))
            return reject(errorMessage, QObject::tr("Unable to open forecast file %1: %2").arg(path, file.errorString()));
    }
    return loadForecast(file, errorMessage);
}

} // namespace ventcast::forecast
