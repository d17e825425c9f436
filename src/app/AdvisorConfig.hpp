#pragma once

#include <QDateTime>
#include <QString>
#include <QVector>

#include "report/TableAssembler.hpp"
#include "report/TableRenderer.hpp"

struct AdvisorConfig {
    QString forecastPath = QStringLiteral("-");
    QVector<double> referenceTemperatures;
    int hourlyRows = ventcast::report::kDefaultHourlyRows;
    int dailyRows = ventcast::report::kDefaultDailyRows;
    //! Civil reference instant; invalid means "current local wall-clock time".
    QDateTime now;
    ventcast::report::Charset charset = ventcast::report::Charset::Utf8;
    bool styled = false;
    bool showDescription = true;
};
