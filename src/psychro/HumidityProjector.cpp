#include "HumidityProjector.hpp"

#include "SaturationPressure.hpp"

#include <QObject>

#include <cmath>

namespace {

constexpr int kMaxReferenceColumns = 64;

} // namespace

namespace ventcast::psychro {

double vaporPressure(double temperatureCelsius, double relativeHumidityPercent)
{
    return relativeHumidityPercent / 100.0 * saturationPressure(temperatureCelsius);
}

QVector<double> projectHumidity(double observedTemperature,
                                double observedRhPercent,
                                const QVector<double>& referenceTemperatures)
{
    // 100 * vaporPressure / saturationPressure(reference), kept as a pressure ratio so that
    // projecting onto the observed temperature returns the observed humidity bit for bit.
    const double observedSaturation = saturationPressure(observedTemperature);

    QVector<double> projected;
    projected.reserve(referenceTemperatures.size());
    for (const double reference : referenceTemperatures)
        projected.append(observedRhPercent * (observedSaturation / saturationPressure(reference)));
    return projected;
}

QVector<double> defaultReferenceTemperatures()
{
    return referenceTemperatureRange(kDefaultReferenceMin, kDefaultReferenceMax, kDefaultReferenceStep);
}

QVector<double> referenceTemperatureRange(double minimum, double maximum, double step, QString* errorMessage)
{
    auto fail = [errorMessage](const QString& message) {
        if (errorMessage)
            *errorMessage = message;
        return QVector<double>{};
    };

    if (!std::isfinite(minimum) || !std::isfinite(maximum) || !std::isfinite(step))
        return fail(QObject::tr("Reference temperatures must be finite numbers."));
    if (maximum < minimum)
        return fail(QObject::tr("Reference maximum %1 is below minimum %2.").arg(maximum).arg(minimum));
    if (step <= 0.0)
        return fail(QObject::tr("Reference step must be positive (got %1).").arg(step));

    // Tolerance keeps the maximum when it lies on the step grid.
    const double columns = std::floor((maximum - minimum) / step + 1e-9) + 1.0;
    if (!std::isfinite(columns) || columns > kMaxReferenceColumns)
        return fail(QObject::tr("Reference range yields %1 columns, at most %2 are supported.")
                        .arg(columns, 0, 'g', 3)
                        .arg(kMaxReferenceColumns));
    const int intervals = static_cast<int>(columns) - 1;

    QVector<double> temperatures;
    temperatures.reserve(intervals + 1);
    for (int i = 0; i <= intervals; ++i)
        temperatures.append(minimum + i * step);
    return temperatures;
}

bool isValidReferenceSet(const QVector<double>& temperatures)
{
    if (temperatures.isEmpty())
        return false;
    for (int i = 1; i < temperatures.size(); ++i) {
        if (!(temperatures.at(i) > temperatures.at(i - 1)))
            return false;
    }
    return true;
}

} // namespace ventcast::psychro
