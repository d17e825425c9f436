#pragma once

#include <QString>
#include <QVector>

namespace ventcast::psychro {

inline constexpr double kDefaultReferenceMin = 16.0;
inline constexpr double kDefaultReferenceMax = 22.0;
inline constexpr double kDefaultReferenceStep = 0.5;

//! Actual partial pressure of water vapour (Pa) for an air sample.
double vaporPressure(double temperatureCelsius, double relativeHumidityPercent);

//! Relative humidity (%) the sample would reach at each reference temperature, same order.
//! The vapour pressure is held constant. Results above 100 are kept as-is.
QVector<double> projectHumidity(double observedTemperature,
                                double observedRhPercent,
                                const QVector<double>& referenceTemperatures);

//! 16.0 .. 22.0 °C in 0.5 °C steps.
QVector<double> defaultReferenceTemperatures();

//! Inclusive range [minimum, maximum] sampled every `step`. Returns an empty set and sets
//! `errorMessage` when the parameters cannot produce a strictly increasing, non-empty set.
QVector<double> referenceTemperatureRange(double minimum, double maximum, double step,
                                          QString* errorMessage = nullptr);

bool isValidReferenceSet(const QVector<double>& temperatures);

} // namespace ventcast::psychro
