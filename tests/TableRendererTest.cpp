#include <QtTest/QtTest>

#include "report/TableRenderer.hpp"

using namespace ventcast::report;

namespace {

ProjectedTable sampleTable()
{
    ProjectedTable table;
    table.kind = TableKind::Hourly;
    table.title = QStringLiteral("Hourly");
    table.referenceTemperatures = {16.0, 22.0};

    ProjectedRow row;
    row.label = QStringLiteral("Sat 09:00");
    row.observedTemperature = 12.0;
    row.projectedHumidity = {75.3, 51.0};
    table.rows.append(row);
    return table;
}

} // namespace

class TableRendererTest : public QObject {
    Q_OBJECT

private slots:
    void formatsCells();
    void keepsHumidityAboveHundred();
    void rendersAsciiTable();
    void rendersUtf8Table();
    void rendersHeaderOnlyWhenEmpty();
    void stylesHeaderWithoutBreakingAlignment();
};

void TableRendererTest::formatsCells()
{
    QCOMPARE(formatTemperature(16.0), QStringLiteral("16.0°C"));
    QCOMPARE(formatTemperature(-3.04), QStringLiteral("-3.0°C"));
    QCOMPARE(formatHumidity(54.63), QStringLiteral("54.6%"));

    const ProjectedTable table = sampleTable();
    QCOMPARE(headerCells(table),
             (QStringList{QStringLiteral("Hourly"), QStringLiteral("16.0°C"), QStringLiteral("22.0°C")}));
    QCOMPARE(rowCells(table.rows.first()),
             (QStringList{QStringLiteral("Sat 09:00 (12.0°C)"), QStringLiteral("75.3%"), QStringLiteral("51.0%")}));
}

void TableRendererTest::keepsHumidityAboveHundred()
{
    QCOMPARE(formatHumidity(139.43), QStringLiteral("139.4%"));
}

void TableRendererTest::rendersAsciiTable()
{
    RenderOptions options;
    options.charset = Charset::Ascii;

    const QString expected = QStringLiteral(
        "+--------------------+--------+--------+\n"
        "| Hourly             | 16.0°C | 22.0°C |\n"
        "+====================+========+========+\n"
        "| Sat 09:00 (12.0°C) | 75.3%  | 51.0%  |\n"
        "+--------------------+--------+--------+\n");
    QCOMPARE(renderTable(sampleTable(), options), expected);
}

void TableRendererTest::rendersUtf8Table()
{
    const QString expected = QStringLiteral(
        "┌────────────────────┬────────┬────────┐\n"
        "│ Hourly             │ 16.0°C │ 22.0°C │\n"
        "╞════════════════════╪════════╪════════╡\n"
        "│ Sat 09:00 (12.0°C) │ 75.3%  │ 51.0%  │\n"
        "└────────────────────┴────────┴────────┘\n");
    QCOMPARE(renderTable(sampleTable()), expected);
}

void TableRendererTest::rendersHeaderOnlyWhenEmpty()
{
    ProjectedTable table = sampleTable();
    table.rows.clear();

    RenderOptions options;
    options.charset = Charset::Ascii;
    const QString expected = QStringLiteral(
        "+--------+--------+--------+\n"
        "| Hourly | 16.0°C | 22.0°C |\n"
        "+--------+--------+--------+\n");
    QCOMPARE(renderTable(table, options), expected);
}

void TableRendererTest::stylesHeaderWithoutBreakingAlignment()
{
    RenderOptions options;
    options.charset = Charset::Ascii;
    options.styled = true;

    const QStringList lines = renderTable(sampleTable(), options).split(QLatin1Char('\n'));
    QCOMPARE(lines.at(1),
             QStringLiteral("| \x1b[3mHourly\x1b[0m             | \x1b[1m16.0°C\x1b[0m | \x1b[1m22.0°C\x1b[0m |"));
    QCOMPARE(lines.at(3), QStringLiteral("| Sat 09:00 (12.0°C) | 75.3%  | 51.0%  |"));
}

QTEST_GUILESS_MAIN(TableRendererTest)
#include "TableRendererTest.moc"
