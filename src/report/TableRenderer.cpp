#include "TableRenderer.hpp"

#include <QVector>

#include <algorithm>

namespace {

using ventcast::report::Charset;

struct BoxGlyphs {
    QString topLeft;
    QString topJoin;
    QString topRight;
    QString horizontal;
    QString vertical;
    QString headerLeft;
    QString headerJoin;
    QString headerRight;
    QString headerLine;
    QString bottomLeft;
    QString bottomJoin;
    QString bottomRight;
};

const BoxGlyphs& glyphsFor(Charset charset)
{
    static const BoxGlyphs ascii{
        QStringLiteral("+"), QStringLiteral("+"), QStringLiteral("+"), QStringLiteral("-"),
        QStringLiteral("|"), QStringLiteral("+"), QStringLiteral("+"), QStringLiteral("+"),
        QStringLiteral("="), QStringLiteral("+"), QStringLiteral("+"), QStringLiteral("+"),
    };
    static const BoxGlyphs utf8{
        QStringLiteral("┌"), QStringLiteral("┬"), QStringLiteral("┐"), QStringLiteral("─"),
        QStringLiteral("│"), QStringLiteral("╞"), QStringLiteral("╪"), QStringLiteral("╡"),
        QStringLiteral("═"), QStringLiteral("└"), QStringLiteral("┴"), QStringLiteral("┘"),
    };
    return charset == Charset::Ascii ? ascii : utf8;
}

int displayWidth(const QString& text)
{
    return static_cast<int>(text.toUcs4().size());
}

QString ruleLine(const QVector<int>& widths, const QString& left, const QString& join,
                 const QString& right, const QString& fill)
{
    QStringList segments;
    segments.reserve(widths.size());
    for (const int width : widths)
        segments.append(fill.repeated(width + 2));
    return left + segments.join(join) + right + QLatin1Char('\n');
}

QString contentLine(const QVector<int>& widths, const QStringList& cells, const QStringList& styledCells,
                    const QString& vertical)
{
    QString line = vertical;
    for (int i = 0; i < widths.size(); ++i) {
        const QString plain = i < cells.size() ? cells.at(i) : QString();
        const QString shown = i < styledCells.size() ? styledCells.at(i) : plain;
        line += QLatin1Char(' ') + shown + QString(widths.at(i) - displayWidth(plain) + 1, QLatin1Char(' '))
              + vertical;
    }
    return line + QLatin1Char('\n');
}

QString ansi(const QString& text, const char* code)
{
    return QStringLiteral("\x1b[%1m%2\x1b[0m").arg(QLatin1String(code), text);
}

} // namespace

namespace ventcast::report {

QString formatTemperature(double celsius)
{
    return QString::number(celsius, 'f', 1) + QStringLiteral("°C");
}

QString formatHumidity(double percent)
{
    return QString::number(percent, 'f', 1) + QLatin1Char('%');
}

QStringList headerCells(const ProjectedTable& table)
{
    QStringList cells;
    cells.reserve(table.referenceTemperatures.size() + 1);
    cells.append(table.title);
    for (const double temperature : table.referenceTemperatures)
        cells.append(formatTemperature(temperature));
    return cells;
}

QStringList rowCells(const ProjectedRow& row)
{
    QStringList cells;
    cells.reserve(row.projectedHumidity.size() + 1);
    cells.append(QStringLiteral("%1 (%2)").arg(row.label, formatTemperature(row.observedTemperature)));
    for (const double humidity : row.projectedHumidity)
        cells.append(formatHumidity(humidity));
    return cells;
}

QString renderTable(const ProjectedTable& table, const RenderOptions& options)
{
    const BoxGlyphs& glyphs = glyphsFor(options.charset);

    const QStringList header = headerCells(table);
    QVector<QStringList> body;
    body.reserve(table.rows.size());
    for (const auto& row : table.rows)
        body.append(rowCells(row));

    int columns = header.size();
    for (const auto& cells : body)
        columns = std::max(columns, static_cast<int>(cells.size()));

    QVector<int> widths(columns, 0);
    auto measure = [&widths](const QStringList& cells) {
        for (int i = 0; i < cells.size(); ++i)
            widths[i] = std::max(widths[i], displayWidth(cells.at(i)));
    };
    measure(header);
    for (const auto& cells : body)
        measure(cells);

    QStringList styledHeader = header;
    if (options.styled) {
        for (int i = 0; i < styledHeader.size(); ++i)
            styledHeader[i] = ansi(header.at(i), i == 0 ? "3" : "1");
    }

    QString out;
    out += ruleLine(widths, glyphs.topLeft, glyphs.topJoin, glyphs.topRight, glyphs.horizontal);
    out += contentLine(widths, header, styledHeader, glyphs.vertical);
    if (!body.isEmpty()) {
        out += ruleLine(widths, glyphs.headerLeft, glyphs.headerJoin, glyphs.headerRight, glyphs.headerLine);
        for (const auto& cells : body)
            out += contentLine(widths, cells, cells, glyphs.vertical);
    }
    out += ruleLine(widths, glyphs.bottomLeft, glyphs.bottomJoin, glyphs.bottomRight, glyphs.horizontal);
    return out;
}

} // namespace ventcast::report
