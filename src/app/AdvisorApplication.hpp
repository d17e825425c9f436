#pragma once

#include <QObject>
#include <QPair>
#include <QString>
#include <QVector>

#include "AdvisorConfig.hpp"
#include "forecast/ForecastTypes.hpp"
#include "report/ProjectedTable.hpp"

class QCommandLineParser;

class AdvisorApplication : public QObject {
    Q_OBJECT
public:
    explicit AdvisorApplication(QObject* parent = nullptr);

    static QString description();

    void configureParser(QCommandLineParser& parser) const;
    bool applyParser(const QCommandLineParser& parser, QString* errorMessage = nullptr);

    const AdvisorConfig& config() const { return m_config; }
    void setConfig(const AdvisorConfig& config) { m_config = config; }

    bool loadForecast(QString* errorMessage = nullptr);
    void setSamples(const QVector<ventcast::forecast::ForecastSample>& samples) { m_samples = samples; }
    const QVector<ventcast::forecast::ForecastSample>& samples() const { return m_samples; }

    QDateTime referenceNow() const;

    //! Hourly and daily tables; the daily one is assembled on the global thread pool.
    QPair<ventcast::report::ProjectedTable, ventcast::report::ProjectedTable> buildTables() const;

    //! Description, hourly table and daily table as written to standard output.
    QString renderReport() const;

    //! Loads the forecast and prints the report. Returns the process exit code.
    int exec();

private:
    AdvisorConfig m_config;
    QVector<ventcast::forecast::ForecastSample> m_samples;
};
