#pragma once

#include <QDateTime>
#include <QVector>

#include <chrono>

#include "ForecastTypes.hpp"

namespace ventcast::forecast {

inline constexpr std::chrono::seconds kHourBucket = std::chrono::hours(1);
inline constexpr std::chrono::seconds kDayBucket = std::chrono::hours(24);

//! Floors the civil value of `value` to the start of its `bucket` interval.
//! A non-positive bucket leaves the value untouched.
QDateTime truncateToBucket(const QDateTime& value, std::chrono::seconds bucket);

/**
 * @brief Selects the part of a chronological series that is shown to the user.
 *
 * Samples earlier than `referenceNow` floored to `bucket` are skipped (skip-while: the input
 * must already be sorted ascending, it is not re-checked). From the first remaining sample
 * every `step`-th element is kept, up to `count` elements. Short input yields short output.
 */
QVector<ForecastSample> windowSeries(const QVector<ForecastSample>& samples,
                                     std::chrono::seconds bucket,
                                     int step,
                                     int count,
                                     const QDateTime& referenceNow);

} // namespace ventcast::forecast
