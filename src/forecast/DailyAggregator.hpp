#pragma once

#include <QVector>

#include "ForecastTypes.hpp"

namespace ventcast::forecast {

//! One mean temperature/humidity per calendar date, in order of first appearance.
//! Consecutive samples sharing a civil date form a group; the input must be chronological.
QVector<DailyAverage> aggregateByDay(const QVector<ForecastSample>& samples);

//! Daily aggregate expressed as a sample anchored at 00:00 of its date.
ForecastSample toDaySample(const DailyAverage& average);

} // namespace ventcast::forecast
