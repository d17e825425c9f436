#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include <cstdlib>

#include "app/AdvisorApplication.hpp"

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("ventcast"));
    QCoreApplication::setApplicationName(QStringLiteral("ventcast"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    AdvisorApplication controller;

    QCommandLineParser parser;
    controller.configureParser(parser);
    parser.process(app);

    QString error;
    if (!controller.applyParser(parser, &error)) {
        QTextStream(stderr) << error << Qt::endl;
        return EXIT_FAILURE;
    }

    return controller.exec();
}
