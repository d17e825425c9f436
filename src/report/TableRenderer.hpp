#pragma once

#include <QString>
#include <QStringList>

#include "ProjectedTable.hpp"

namespace ventcast::report {

enum class Charset {
    Utf8,
    Ascii,
};

struct RenderOptions {
    Charset charset = Charset::Utf8;
    //! ANSI italic/bold header attributes; only meaningful on a terminal.
    bool styled = false;
};

QString formatTemperature(double celsius);
QString formatHumidity(double percent);

QStringList headerCells(const ProjectedTable& table);
QStringList rowCells(const ProjectedRow& row);

//! Condensed box-drawn table, one line per row, terminated by a newline.
QString renderTable(const ProjectedTable& table, const RenderOptions& options = {});

} // namespace ventcast::report
