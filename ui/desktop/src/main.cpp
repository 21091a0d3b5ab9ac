#include <QApplication>
#include <QDebug>
#include <QFileInfo>
#include <QMessageBox>

#include <exception>

#include "config/Parser.hpp"
#include "mainwindow.h"
#include "scanworker.h"
#include "util/Logging.hpp"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    QApplication::setApplicationName("First Candle Scanner");
    QApplication::setApplicationVersion("1.0.0");
    QApplication::setOrganizationName("FirstCandleScanner");

    qRegisterMetaType<fcs::CycleReport>("fcs::CycleReport");
    qRegisterMetaType<fcs::ScannerSettings>("fcs::ScannerSettings");
    qRegisterMetaType<fcs::ConnectionConfig>("fcs::ConnectionConfig");

    QString configPath = argc > 1 ? QString::fromLocal8Bit(argv[1]) : QString("config/scanner.conf");
    fcs::AppConfig config;
    if (QFileInfo::exists(configPath)) {
        try {
            config = fcs::parseConfigFile(configPath.toStdString());
        } catch (const std::exception &ex) {
            QMessageBox::warning(nullptr, "Configuration Error",
                                 QString("Failed to load %1:\n%2\n\nUsing defaults.").arg(configPath, ex.what()));
            config = fcs::AppConfig{};
        }
    } else {
        qInfo() << "No configuration at" << configPath << "- using defaults";
    }

    fcs::Logger::instance().setLevel(fcs::parseLogLevel(config.logLevel));
    if (!fcs::Logger::instance().setLogFile(config.logFile)) {
        qWarning() << "Failed to open log file" << QString::fromStdString(config.logFile);
    }
    fcs::logInfo("First Candle Scanner starting (broker " + config.broker + ")");

    MainWindow window(config);
    window.setWindowTitle("First Candle Scanner");
    window.resize(1500, 850);
    window.show();

    return app.exec();
}
