#include "scanworker.h"

#include <QDebug>

#include <exception>

#include "util/MarketTime.hpp"

ScanWorker::ScanWorker(const fcs::AppConfig &config, QObject *parent)
    : QObject(parent)
    , config(config)
    , settings(config.scanner)
    , timer(nullptr)
    , cancelFlag(false)
    , monitoring(false)
{
}

ScanWorker::~ScanWorker() = default;

void ScanWorker::requestCancel()
{
    cancelFlag.store(true);
}

void ScanWorker::connectBroker(const fcs::ConnectionConfig &connection)
{
    if (broker && broker->isConnected()) {
        broker->disconnect();
    }
    config.connection = connection;
    broker = fcs::createBrokerClient(config);
    if (!broker) {
        emit connectionFailed(QString("Unsupported broker: %1").arg(QString::fromStdString(config.broker)));
        return;
    }
    emit statusMessage(QString("Connecting to %1:%2...").arg(QString::fromStdString(connection.host)).arg(connection.port));
    bool ok = false;
    try {
        ok = broker->connect(connection);
    } catch (const std::exception &ex) {
        qWarning() << "Broker connect threw:" << ex.what();
    }
    if (!ok) {
        broker.reset();
        emit connectionFailed(QString("Could not connect to %1 at %2:%3")
                                  .arg(QString::fromStdString(config.broker), QString::fromStdString(connection.host))
                                  .arg(connection.port));
        return;
    }
    emit connected(QString("%1 %2:%3 (client %4)")
                       .arg(QString::fromStdString(config.broker), QString::fromStdString(connection.host))
                       .arg(connection.port)
                       .arg(connection.clientId));
}

void ScanWorker::disconnectBroker()
{
    stopMonitoring();
    if (broker) {
        broker->disconnect();
        broker.reset();
    }
    emit disconnected();
}

void ScanWorker::startMonitoring(const fcs::ScannerSettings &newSettings, int intervalSeconds)
{
    if (!broker || !broker->isConnected()) {
        emit statusMessage("Connect to the broker before monitoring");
        return;
    }
    settings = newSettings;
    cancelFlag.store(false);
    if (!timer) {
        timer = new QTimer(this);
        connect(timer, &QTimer::timeout, this, &ScanWorker::onTimer);
    }
    timer->setInterval(qMax(1, intervalSeconds) * 1000);
    timer->start();
    monitoring = true;
    emit monitoringChanged(true);
    onTimer();
}

void ScanWorker::stopMonitoring()
{
    if (timer) {
        timer->stop();
    }
    if (monitoring) {
        monitoring = false;
        emit monitoringChanged(false);
    }
}

void ScanWorker::scanOnce(const fcs::ScannerSettings &newSettings)
{
    settings = newSettings;
    cancelFlag.store(false);
    runScan();
}

void ScanWorker::updateSettings(const fcs::ScannerSettings &newSettings)
{
    settings = newSettings;
}

void ScanWorker::shutdown()
{
    stopMonitoring();
    // The timer belongs to this thread; it must not outlive it.
    delete timer;
    timer = nullptr;
    if (broker) {
        broker->disconnect();
        broker.reset();
    }
}

void ScanWorker::onTimer()
{
    // A tick queued ahead of stopMonitoring() must not scan.
    if (!monitoring || cancelFlag.load()) {
        return;
    }
    // The replay broker has no trading hours of its own.
    if (config.broker != "replay" && !fcs::isMarketOpen(fcs::nowUtc())) {
        emit marketClosed();
        return;
    }
    runScan();
}

void ScanWorker::runScan()
{
    if (!broker || !broker->isConnected()) {
        emit statusMessage("Not connected");
        return;
    }
    emit scanStarted();

    fcs::ScanRequest request;
    request.settings = settings;
    request.maxRows = config.maxRows;
    if (config.broker != "replay") {
        request.asOfUtc = fcs::nowUtc();
    }
    fcs::Scanner scanner(*broker);
    fcs::CycleReport report = scanner.runCycle(request, &cancelFlag);
    emit scanFinished(report);
    if (!broker->isConnected()) {
        qWarning() << "Broker connection lost during scan";
        stopMonitoring();
        broker.reset();
        emit disconnected();
    }
}
