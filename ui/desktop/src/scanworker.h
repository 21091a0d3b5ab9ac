#ifndef SCANWORKER_H
#define SCANWORKER_H

#include <QObject>
#include <QString>
#include <QTimer>

#include <atomic>
#include <memory>

#include "config/Settings.hpp"
#include "scan/BrokerClient.hpp"
#include "scan/Scanner.hpp"

Q_DECLARE_METATYPE(fcs::CycleReport)
Q_DECLARE_METATYPE(fcs::ScannerSettings)
Q_DECLARE_METATYPE(fcs::ConnectionConfig)

// Owns the broker connection and runs scan cycles. Lives on its own QThread;
// every slot runs there. Only requestCancel() may be called from other threads.
class ScanWorker : public QObject
{
    Q_OBJECT

public:
    explicit ScanWorker(const fcs::AppConfig &config, QObject *parent = nullptr);
    ~ScanWorker() override;

    void requestCancel();

public slots:
    void connectBroker(const fcs::ConnectionConfig &connection);
    void disconnectBroker();
    void startMonitoring(const fcs::ScannerSettings &settings, int intervalSeconds);
    void stopMonitoring();
    void scanOnce(const fcs::ScannerSettings &settings);
    void updateSettings(const fcs::ScannerSettings &settings);
    void shutdown();

signals:
    void connected(const QString &description);
    void connectionFailed(const QString &reason);
    void disconnected();
    void scanStarted();
    void scanFinished(const fcs::CycleReport &report);
    void marketClosed();
    void monitoringChanged(bool active);
    void statusMessage(const QString &message);

private slots:
    void onTimer();

private:
    void runScan();

    fcs::AppConfig config;
    fcs::ScannerSettings settings;
    std::unique_ptr<fcs::BrokerClient> broker;
    QTimer *timer;
    std::atomic<bool> cancelFlag;
    bool monitoring;
};

#endif
