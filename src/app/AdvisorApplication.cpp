#include "AdvisorApplication.hpp"

#include <QCommandLineParser>
#include <QFuture>
#include <QLoggingCategory>
#include <QTextStream>
#include <QtConcurrent>
#include <QtGlobal>

#include <cstdlib>
#include <optional>
#include <utility>

#if defined(Q_OS_UNIX)
#    include <cstdio>
#    include <unistd.h>
#endif

#include "forecast/ForecastLoader.hpp"
#include "psychro/HumidityProjector.hpp"
#include "report/TableAssembler.hpp"
#include "report/TableRenderer.hpp"

Q_LOGGING_CATEGORY(lcApp, "ventcast.app")

namespace {

const QByteArray kAsciiEnv = QByteArrayLiteral("VENTCAST_ASCII");
const QByteArray kNowEnv = QByteArrayLiteral("VENTCAST_NOW");
const QByteArray kNoColorEnv = QByteArrayLiteral("NO_COLOR");

std::optional<QString> envValue(const QByteArray& key)
{
    if (!qEnvironmentVariableIsSet(key.constData()))
        return std::nullopt;
    return qEnvironmentVariable(key.constData());
}

std::optional<bool> envBool(const QByteArray& key)
{
    const auto valueOpt = envValue(key);
    if (!valueOpt.has_value())
        return std::nullopt;
    const QString normalized = valueOpt->trimmed().toLower();
    if (normalized.isEmpty())
        return std::nullopt;
    if (normalized == QStringLiteral("1") || normalized == QStringLiteral("true") ||
        normalized == QStringLiteral("yes") || normalized == QStringLiteral("on"))
        return true;
    if (normalized == QStringLiteral("0") || normalized == QStringLiteral("false") ||
        normalized == QStringLiteral("no") || normalized == QStringLiteral("off"))
        return false;
    qCWarning(lcApp) << "Invalid value" << *valueOpt << "in" << QString::fromUtf8(key)
                     << "- expected a boolean (true/false).";
    return std::nullopt;
}

bool stdoutIsTerminal()
{
#if defined(Q_OS_UNIX)
    return ::isatty(::fileno(stdout)) == 1;
#else
    return false;
#endif
}

bool setError(QString* errorMessage, const QString& message)
{
    if (errorMessage)
        *errorMessage = message;
    return false;
}

std::optional<int> parseRowCount(const QString& raw)
{
    bool ok = false;
    const int value = raw.trimmed().toInt(&ok);
    if (!ok || value < 0)
        return std::nullopt;
    return value;
}

std::optional<double> parseDouble(const QString& raw)
{
    bool ok = false;
    const double value = raw.trimmed().toDouble(&ok);
    if (!ok)
        return std::nullopt;
    return value;
}

} // namespace

AdvisorApplication::AdvisorApplication(QObject* parent)
    : QObject(parent)
{
    m_config.referenceTemperatures = ventcast::psychro::defaultReferenceTemperatures();
}

QString AdvisorApplication::description()
{
    return tr("Opening the window will bring indoor humidity closer to the value indicated in the "
              "column corresponding to the indoor temperature");
}

void AdvisorApplication::configureParser(QCommandLineParser& parser) const
{
    parser.setApplicationDescription(description());
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("forecast"),
                                 tr("Open-Meteo hourly forecast JSON, '-' reads standard input"),
                                 QStringLiteral("[forecast]"));
    parser.addOption({"ascii", tr("Forces output to use ASCII only")});
    parser.addOption({"hours", tr("Number of hourly rows"), tr("count"),
                      QString::number(ventcast::report::kDefaultHourlyRows)});
    parser.addOption({"days", tr("Number of daily rows"), tr("count"),
                      QString::number(ventcast::report::kDefaultDailyRows)});
    parser.addOption({"now", tr("Reference local time (yyyy-MM-ddTHH:mm), defaults to the current time"),
                      tr("datetime"), QString()});
    parser.addOption({"reference-min", tr("Lowest indoor temperature column (°C)"), tr("celsius"),
                      QString::number(ventcast::psychro::kDefaultReferenceMin, 'f', 1)});
    parser.addOption({"reference-max", tr("Highest indoor temperature column (°C)"), tr("celsius"),
                      QString::number(ventcast::psychro::kDefaultReferenceMax, 'f', 1)});
    parser.addOption({"reference-step", tr("Indoor temperature column spacing (°C)"), tr("celsius"),
                      QString::number(ventcast::psychro::kDefaultReferenceStep, 'f', 1)});
    parser.addOption({"no-doc", tr("Do not print the explanation above the tables")});
}

bool AdvisorApplication::applyParser(const QCommandLineParser& parser, QString* errorMessage)
{
    AdvisorConfig config;

    const QStringList positional = parser.positionalArguments();
    if (positional.size() > 1)
        return setError(errorMessage, tr("Expected at most one forecast file, got %1.").arg(positional.size()));
    if (!positional.isEmpty() && !positional.first().trimmed().isEmpty())
        config.forecastPath = positional.first().trimmed();

    const auto hours = parseRowCount(parser.value("hours"));
    if (!hours.has_value())
        return setError(errorMessage, tr("Invalid --hours value: %1").arg(parser.value("hours")));
    config.hourlyRows = *hours;

    const auto days = parseRowCount(parser.value("days"));
    if (!days.has_value())
        return setError(errorMessage, tr("Invalid --days value: %1").arg(parser.value("days")));
    config.dailyRows = *days;

    const auto minimum = parseDouble(parser.value("reference-min"));
    const auto maximum = parseDouble(parser.value("reference-max"));
    const auto step = parseDouble(parser.value("reference-step"));
    if (!minimum.has_value() || !maximum.has_value() || !step.has_value())
        return setError(errorMessage, tr("Reference temperatures must be numbers."));
    QString rangeError;
    config.referenceTemperatures = ventcast::psychro::referenceTemperatureRange(*minimum, *maximum, *step, &rangeError);
    if (!ventcast::psychro::isValidReferenceSet(config.referenceTemperatures))
        return setError(errorMessage, rangeError);

    QString nowRaw = parser.value("now").trimmed();
    if (nowRaw.isEmpty()) {
        if (const auto envNow = envValue(kNowEnv); envNow.has_value())
            nowRaw = envNow->trimmed();
    }
    if (!nowRaw.isEmpty()) {
        config.now = ventcast::forecast::parseCivilDateTime(nowRaw);
        if (!config.now.isValid())
            return setError(errorMessage, tr("Invalid reference time: %1").arg(nowRaw));
    }

    bool ascii = parser.isSet("ascii");
    if (!ascii) {
        if (const auto envAscii = envBool(kAsciiEnv); envAscii.has_value())
            ascii = *envAscii;
    }
    config.charset = ascii ? ventcast::report::Charset::Ascii : ventcast::report::Charset::Utf8;
    config.styled = stdoutIsTerminal() && !qEnvironmentVariableIsSet(kNoColorEnv.constData());
    config.showDescription = !parser.isSet("no-doc");

    m_config = config;
    qCDebug(lcApp) << "Forecast source" << m_config.forecastPath << "reference columns"
                   << m_config.referenceTemperatures.size() << "rows" << m_config.hourlyRows << m_config.dailyRows;
    return true;
}

bool AdvisorApplication::loadForecast(QString* errorMessage)
{
    auto samples = ventcast::forecast::loadForecastFile(m_config.forecastPath, errorMessage);
    if (!samples.has_value())
        return false;
    m_samples = std::move(*samples);
    return true;
}

QDateTime AdvisorApplication::referenceNow() const
{
    if (m_config.now.isValid())
        return ventcast::forecast::civilDateTime(m_config.now);
    return ventcast::forecast::civilDateTime(QDateTime::currentDateTime());
}

QPair<ventcast::report::ProjectedTable, ventcast::report::ProjectedTable> AdvisorApplication::buildTables() const
{
    const QDateTime now = referenceNow();
    const auto samples = m_samples;
    const auto references = m_config.referenceTemperatures;
    const int dailyRows = m_config.dailyRows;

    QFuture<ventcast::report::ProjectedTable> daily = QtConcurrent::run([samples, references, now, dailyRows]() {
        return ventcast::report::dailyTable(samples, references, now, dailyRows);
    });
    const auto hourly = ventcast::report::hourlyTable(samples, references, now, m_config.hourlyRows);
    return {hourly, daily.result()};
}

QString AdvisorApplication::renderReport() const
{
    ventcast::report::RenderOptions options;
    options.charset = m_config.charset;
    options.styled = m_config.styled;

    const auto tables = buildTables();

    QString report;
    if (m_config.showDescription)
        report += description() + QStringLiteral("\n\n");
    report += ventcast::report::renderTable(tables.first, options);
    report += QLatin1Char('\n');
    report += ventcast::report::renderTable(tables.second, options);
    return report;
}

int AdvisorApplication::exec()
{
    QString error;
    if (!loadForecast(&error)) {
        QTextStream(stderr) << error << Qt::endl;
        return EXIT_FAILURE;
    }
    if (m_samples.isEmpty())
        qCWarning(lcApp) << "Forecast contains no samples";

    QTextStream out(stdout);
    out << renderReport();
    out.flush();
    return EXIT_SUCCESS;
}
