#pragma once

#include <QDateTime>
#include <QVector>

#include "ProjectedTable.hpp"
#include "forecast/ForecastTypes.hpp"

namespace ventcast::report {

inline constexpr int kDefaultHourlyRows = 10;
inline constexpr int kDefaultDailyRows = 7;

QString tableTitle(TableKind kind);

//! Row label: "ddd HH:mm" for hourly tables, "dddd, MMM dd" for daily ones (C locale).
QString rowLabel(TableKind kind, const QDateTime& timestamp);

//! One row per sample, projected onto every reference temperature.
ProjectedTable assembleTable(TableKind kind,
                             const QVector<forecast::ForecastSample>& samples,
                             const QVector<double>& referenceTemperatures);

//! Next `count` hourly samples starting at the current hour.
ProjectedTable hourlyTable(const QVector<forecast::ForecastSample>& samples,
                           const QVector<double>& referenceTemperatures,
                           const QDateTime& now,
                           int count = kDefaultHourlyRows);

//! Daily means of the series, starting with today, at most `count` days.
ProjectedTable dailyTable(const QVector<forecast::ForecastSample>& samples,
                          const QVector<double>& referenceTemperatures,
                          const QDateTime& now,
                          int count = kDefaultDailyRows);

} // namespace ventcast::report
