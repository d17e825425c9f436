#pragma once

namespace ventcast::psychro {

inline constexpr double kCelsiusOffset = 273.15;

inline constexpr double celsiusToKelvin(double celsius) { return celsius + kCelsiusOffset; }

//! Saturation vapour pressure of water in Pa for a temperature in degrees Celsius.
//! Wagner & Pruß (DOI:10.1063/1.1461829), finite for the whole weather range.
double saturationPressure(double temperatureCelsius);

} // namespace ventcast::psychro
