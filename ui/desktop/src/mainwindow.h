#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QComboBox>
#include <QLabel>
#include <QMainWindow>
#include <QPushButton>
#include <QSplitter>
#include <QThread>
#include <QTimer>

#include <memory>

#include "config/Settings.hpp"
#include "scan/Scanner.hpp"
#include "scanworker.h"
#include "settingsstore.h"

class ChartWidget;
class ResultsWidget;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(const fcs::AppConfig &config, QWidget *parent = nullptr);
    ~MainWindow() override;

signals:
    void connectRequested(const fcs::ConnectionConfig &connection);
    void disconnectRequested();
    void monitoringRequested(const fcs::ScannerSettings &settings, int intervalSeconds);
    void stopRequested();
    void scanOnceRequested(const fcs::ScannerSettings &settings);
    void settingsChanged(const fcs::ScannerSettings &settings);

private slots:
    void onConnectClicked();
    void onDisconnectClicked();
    void onSettingsClicked();
    void onStartClicked();
    void onStopClicked();
    void onScanOnceClicked();
    void onSettingsApplied(const fcs::ScannerSettings &settings, bool persist);
    void onConnected(const QString &description);
    void onConnectionFailed(const QString &reason);
    void onDisconnected();
    void onScanStarted();
    void onScanFinished(const fcs::CycleReport &report);
    void onMarketClosed();
    void onMonitoringChanged(bool active);
    void onHistorySelected(int index);
    void updateClock();

private:
    void setupUi();
    void startWorker();
    void connectSignals();
    void refreshSettingsSummary();
    void refreshHistoryCombo();
    void updateButtons();

    fcs::AppConfig config;
    fcs::ScannerSettings settings;
    SettingsStore settingsStore;
    fcs::ScanHistory history;

    ChartWidget *chartWidget;
    ResultsWidget *resultsWidget;
    QSplitter *mainSplitter;

    QPushButton *connectButton;
    QPushButton *disconnectButton;
    QPushButton *settingsButton;
    QPushButton *startButton;
    QPushButton *stopButton;
    QPushButton *scanOnceButton;
    QLabel *settingsSummaryLabel;
    QComboBox *historyCombo;

    QLabel *statusLabel;
    QLabel *scanCountLabel;
    QLabel *clockLabel;
    QLabel *connectionLabel;
    QTimer *clockTimer;

    std::unique_ptr<QThread> workerThread;
    std::unique_ptr<ScanWorker> worker;

    bool isConnected;
    bool isMonitoring;
    bool isScanning;
    int scanCount;
};

#endif
