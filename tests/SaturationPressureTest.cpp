#include <QtTest/QtTest>

#include <cmath>

#include "psychro/SaturationPressure.hpp"

using ventcast::psychro::celsiusToKelvin;
using ventcast::psychro::saturationPressure;

class SaturationPressureTest : public QObject {
    Q_OBJECT

private slots:
    void matchesReferenceValues();
    void increasesStrictlyOverWeatherRange();
    void staysFiniteOverExtendedRange();
    void convertsCelsiusToKelvin();
};

void SaturationPressureTest::matchesReferenceValues()
{
    // IAPWS tables: 611.2 Pa at 0 °C, 2339.2 Pa at 20 °C, 101418 Pa at 100 °C.
    QVERIFY(std::abs(saturationPressure(0.0) - 611.2) < 0.5);
    QVERIFY(std::abs(saturationPressure(20.0) - 2339.2) < 1.0);
    QVERIFY(std::abs(saturationPressure(100.0) - 101418.0) < 50.0);
}

void SaturationPressureTest::increasesStrictlyOverWeatherRange()
{
    double previous = saturationPressure(-20.0);
    for (int tenths = -199; tenths <= 450; ++tenths) {
        const double current = saturationPressure(tenths / 10.0);
        QVERIFY2(current > previous, qPrintable(QStringLiteral("not increasing at %1 °C").arg(tenths / 10.0)));
        previous = current;
    }
}

void SaturationPressureTest::staysFiniteOverExtendedRange()
{
    for (int celsius = -50; celsius <= 60; ++celsius) {
        const double pressure = saturationPressure(celsius);
        QVERIFY(std::isfinite(pressure));
        QVERIFY(pressure > 0.0);
    }
}

void SaturationPressureTest::convertsCelsiusToKelvin()
{
    QCOMPARE(celsiusToKelvin(0.0), 273.15);
    QCOMPARE(celsiusToKelvin(-273.15), 0.0);
}

QTEST_GUILESS_MAIN(SaturationPressureTest)
#include "SaturationPressureTest.moc"
