#pragma once

#include <QString>
#include <QVector>

namespace ventcast::report {

enum class TableKind {
    Hourly,
    Daily,
};

struct ProjectedRow {
    QString label;
    double observedTemperature = 0.0;
    QVector<double> projectedHumidity;
};

struct ProjectedTable {
    TableKind kind = TableKind::Hourly;
    QString title;
    QVector<double> referenceTemperatures;
    QVector<ProjectedRow> rows;
};

} // namespace ventcast::report
