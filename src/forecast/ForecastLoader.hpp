#pragma once

#include <QByteArray>
#include <QString>
#include <QVector>

#include <optional>

#include "ForecastTypes.hpp"

class QIODevice;

namespace ventcast::forecast {

/**
 * @brief Reads an Open-Meteo hourly forecast document into civil-time samples.
 *
 * Expected shape: `{"hourly": {"time": [...], "temperature_2m": [...],
 * "relative_humidity_2m": [...]}}`, optionally with `hourly_units`. Timestamps must be
 * strictly increasing. Any defect rejects the whole document.
 */
std::optional<QVector<ForecastSample>> parseForecast(const QByteArray& document,
                                                     QString* errorMessage = nullptr);

std::optional<QVector<ForecastSample>> loadForecast(QIODevice& device, QString* errorMessage = nullptr);

//! `-` reads standard input.
std::optional<QVector<ForecastSample>> loadForecastFile(const QString& path,
                                                        QString* errorMessage = nullptr);

//! Parses `yyyy-MM-ddTHH:mm[:ss]` as a civil timestamp without consulting the local time zone.
QDateTime parseCivilDateTime(const QString& text);

} // namespace ventcast::forecast
