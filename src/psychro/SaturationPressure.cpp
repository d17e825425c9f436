#include "SaturationPressure.hpp"

#include <QLoggingCategory>

#include <array>
#include <cmath>
#include <utility>

Q_LOGGING_CATEGORY(lcPsychro, "ventcast.psychro")

namespace {

constexpr double kCriticalPressurePa = 22.064e6;
constexpr double kCriticalTemperatureK = 647.096;

// Empirical coefficients and exponents of the reduced-temperature series.
constexpr std::array<std::pair<double, double>, 6> kWagnerTerms{{
    {-7.85951783, 1.0},
    {1.84408259, 1.5},
    {-11.7866497, 3.0},
    {22.6807411, 3.5},
    {-15.9618719, 4.0},
    {1.80122502, 7.5},
}};

} // namespace

namespace ventcast::psychro {

double saturationPressure(double temperatureCelsius)
{
    const double kelvin = celsiusToKelvin(temperatureCelsius);
    const double tau = 1.0 - kelvin / kCriticalTemperatureK;

    double sum = 0.0;
    for (const auto& [coefficient, exponent] : kWagnerTerms)
        sum += coefficient * std::pow(tau, exponent);

    const double pressure = kCriticalPressurePa * std::exp(sum * kCriticalTemperatureK / kelvin);
    if (!std::isfinite(pressure)) {
        qCCritical(lcPsychro) << "Saturation pressure is not finite for" << temperatureCelsius << "°C";
    }
    return pressure;
}

} // namespace ventcast::psychro
