#include "mainwindow.h"
#include "chartwidget.h"
#include "connectiondialog.h"
#include "resultswidget.h"
#include "settingsdialog.h"

#include <QDebug>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QMessageBox>
#include <QStatusBar>
#include <QVBoxLayout>
#include <QWidget>

#include "util/Format.hpp"
#include "util/MarketTime.hpp"

MainWindow::MainWindow(const fcs::AppConfig &config, QWidget *parent)
    : QMainWindow(parent)
    , config(config)
    , settingsStore(QString::fromStdString(config.settingsFile))
    , history(static_cast<std::size_t>(config.historyLimit))
    , chartWidget(nullptr)
    , resultsWidget(nullptr)
    , mainSplitter(nullptr)
    , clockTimer(nullptr)
    , isConnected(false)
    , isMonitoring(false)
    , isScanning(false)
    , scanCount(0)
{
    settings = settingsStore.load();
    setupUi();
    startWorker();
    connectSignals();
    refreshSettingsSummary();
    updateButtons();
    updateClock();
}

MainWindow::~MainWindow()
{
    if (worker) {
        worker->requestCancel();
        QMetaObject::invokeMethod(worker.get(), "shutdown", Qt::BlockingQueuedConnection);
    }
    if (workerThread) {
        workerThread->quit();
        workerThread->wait();
    }
}

void MainWindow::setupUi()
{
    QWidget *centralWidget = new QWidget(this);
    setCentralWidget(centralWidget);

    QGroupBox *controlGroup = new QGroupBox("Scanner", this);
    connectButton = new QPushButton("Connect...", this);
    disconnectButton = new QPushButton("Disconnect", this);
    settingsButton = new QPushButton("Settings...", this);
    startButton = new QPushButton("Start Monitoring", this);
    stopButton = new QPushButton("Stop", this);
    scanOnceButton = new QPushButton("Scan Once", this);
    settingsSummaryLabel = new QLabel(this);
    historyCombo = new QComboBox(this);
    historyCombo->setMinimumWidth(220);

    QHBoxLayout *buttonRow = new QHBoxLayout();
    buttonRow->addWidget(connectButton);
    buttonRow->addWidget(disconnectButton);
    buttonRow->addSpacing(16);
    buttonRow->addWidget(settingsButton);
    buttonRow->addWidget(startButton);
    buttonRow->addWidget(stopButton);
    buttonRow->addWidget(scanOnceButton);
    buttonRow->addStretch();
    buttonRow->addWidget(new QLabel("Previous runs:", this));
    buttonRow->addWidget(historyCombo);

    QVBoxLayout *controlLayout = new QVBoxLayout(controlGroup);
    controlLayout->addLayout(buttonRow);
    controlLayout->addWidget(settingsSummaryLabel);

    mainSplitter = new QSplitter(Qt::Horizontal, this);
    resultsWidget = new ResultsWidget(this);
    chartWidget = new ChartWidget(this);
    mainSplitter->addWidget(resultsWidget);
    mainSplitter->addWidget(chartWidget);
    mainSplitter->setStretchFactor(0, 3);
    mainSplitter->setStretchFactor(1, 2);

    QVBoxLayout *mainLayout = new QVBoxLayout(centralWidget);
    mainLayout->addWidget(controlGroup);
    mainLayout->addWidget(mainSplitter, 1);

    statusLabel = new QLabel("Ready", this);
    scanCountLabel = new QLabel("Scans: 0", this);
    clockLabel = new QLabel(this);
    connectionLabel = new QLabel("Disconnected", this);
    statusBar()->addWidget(statusLabel, 1);
    statusBar()->addPermanentWidget(scanCountLabel);
    statusBar()->addPermanentWidget(clockLabel);
    statusBar()->addPermanentWidget(connectionLabel);

    clockTimer = new QTimer(this);
    clockTimer->setInterval(1000);
    clockTimer->start();
}

void MainWindow::startWorker()
{
    workerThread = std::make_unique<QThread>();
    worker = std::make_unique<ScanWorker>(config);  // no parent, moved to the thread
    worker->moveToThread(workerThread.get());
    workerThread->start();
}

void MainWindow::connectSignals()
{
    connect(connectButton, &QPushButton::clicked, this, &MainWindow::onConnectClicked);
    connect(disconnectButton, &QPushButton::clicked, this, &MainWindow::onDisconnectClicked);
    connect(settingsButton, &QPushButton::clicked, this, &MainWindow::onSettingsClicked);
    connect(startButton, &QPushButton::clicked, this, &MainWindow::onStartClicked);
    connect(stopButton, &QPushButton::clicked, this, &MainWindow::onStopClicked);
    connect(scanOnceButton, &QPushButton::clicked, this, &MainWindow::onScanOnceClicked);
    connect(historyCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &MainWindow::onHistorySelected);
    connect(resultsWidget, &ResultsWidget::resultSelected, chartWidget, &ChartWidget::showResult);
    connect(clockTimer, &QTimer::timeout, this, &MainWindow::updateClock);

    ScanWorker *w = worker.get();
    connect(this, &MainWindow::connectRequested, w, &ScanWorker::connectBroker, Qt::QueuedConnection);
    connect(this, &MainWindow::disconnectRequested, w, &ScanWorker::disconnectBroker, Qt::QueuedConnection);
    connect(this, &MainWindow::monitoringRequested, w, &ScanWorker::startMonitoring, Qt::QueuedConnection);
    connect(this, &MainWindow::stopRequested, w, &ScanWorker::stopMonitoring, Qt::QueuedConnection);
    connect(this, &MainWindow::scanOnceRequested, w, &ScanWorker::scanOnce, Qt::QueuedConnection);
    connect(this, &MainWindow::settingsChanged, w, &ScanWorker::updateSettings, Qt::QueuedConnection);

    connect(w, &ScanWorker::connected, this, &MainWindow::onConnected, Qt::QueuedConnection);
    connect(w, &ScanWorker::connectionFailed, this, &MainWindow::onConnectionFailed, Qt::QueuedConnection);
    connect(w, &ScanWorker::disconnected, this, &MainWindow::onDisconnected, Qt::QueuedConnection);
    connect(w, &ScanWorker::scanStarted, this, &MainWindow::onScanStarted, Qt::QueuedConnection);
    connect(w, &ScanWorker::scanFinished, this, &MainWindow::onScanFinished, Qt::QueuedConnection);
    connect(w, &ScanWorker::marketClosed, this, &MainWindow::onMarketClosed, Qt::QueuedConnection);
    connect(w, &ScanWorker::monitoringChanged, this, &MainWindow::onMonitoringChanged, Qt::QueuedConnection);
    connect(w, &ScanWorker::statusMessage, statusLabel, &QLabel::setText, Qt::QueuedConnection);
}

void MainWindow::onConnectClicked()
{
    ConnectionDialog dialog(config.connection, this);
    if (dialog.exec() != QDialog::Accepted) {
        return;
    }
    config.connection = dialog.connection();
    connectButton->setEnabled(false);
    connectionLabel->setText("Connecting...");
    emit connectRequested(config.connection);
}

void MainWindow::onDisconnectClicked()
{
    worker->requestCancel();
    emit disconnectRequested();
}

void MainWindow::onSettingsClicked()
{
    SettingsDialog dialog(settings, this);
    connect(&dialog, &SettingsDialog::settingsApplied, this, &MainWindow::onSettingsApplied);
    dialog.exec();
}

void MainWindow::onSettingsApplied(const fcs::ScannerSettings &newSettings, bool persist)
{
    settings = newSettings;
    if (persist && !settingsStore.save(settings)) {
        QMessageBox::warning(this, "Save Failed", QString("Could not write settings to %1").arg(settingsStore.path()));
    }
    refreshSettingsSummary();
    emit settingsChanged(settings);
    statusLabel->setText(persist ? "Settings saved and applied" : "Settings applied");
}

void MainWindow::onStartClicked()
{
    emit monitoringRequested(settings, config.scanIntervalSeconds);
}

void MainWindow::onStopClicked()
{
    worker->requestCancel();
    emit stopRequested();
    statusLabel->setText("Stopping...");
}

void MainWindow::onScanOnceClicked()
{
    emit scanOnceRequested(settings);
}

void MainWindow::onConnected(const QString &description)
{
    isConnected = true;
    connectionLabel->setText(QString("Connected: %1").arg(description));
    statusLabel->setText("Connected");
    qInfo() << "Connected to" << description;
    updateButtons();
}

void MainWindow::onConnectionFailed(const QString &reason)
{
    isConnected = false;
    connectionLabel->setText("Disconnected");
    statusLabel->setText("Connection failed");
    updateButtons();

    QMessageBox msgBox(this);
    msgBox.setIcon(QMessageBox::Critical);
    msgBox.setWindowTitle("Connection Failed");
    msgBox.setText(reason);
    msgBox.setInformativeText("Check that:\n"
                              "- TWS or IB Gateway is running\n"
                              "- API connections are enabled (Configure > API > Settings)\n"
                              "- The port matches (7497 paper, 7496 live)\n"
                              "- The client ID is not already in use");
    msgBox.exec();
}

void MainWindow::onDisconnected()
{
    isConnected = false;
    isMonitoring = false;
    isScanning = false;
    connectionLabel->setText("Disconnected");
    statusLabel->setText("Disconnected");
    updateButtons();
}

void MainWindow::onScanStarted()
{
    isScanning = true;
    statusLabel->setText("Scanning...");
    updateButtons();
}

void MainWindow::onScanFinished(const fcs::CycleReport &report)
{
    isScanning = false;
    ++scanCount;
    scanCountLabel->setText(QString("Scans: %1").arg(scanCount));
    updateButtons();

    if (report.failed) {
        // Keep the previous table.
        statusLabel->setText(QString("Scan failed: %1").arg(QString::fromStdString(report.failure)));
        qWarning() << "Scan failed:" << QString::fromStdString(report.failure);
        return;
    }

    history.add(report);
    refreshHistoryCombo();
    resultsWidget->showReport(report);
    chartWidget->clearChart();
    QString status = QString("Found %1 stocks meeting criteria").arg(report.results.size());
    if (report.cancelled) {
        status += " (scan stopped early)";
    }
    statusLabel->setText(status);
}

void MainWindow::onMarketClosed()
{
    statusLabel->setText("Market is closed");
}

void MainWindow::onMonitoringChanged(bool active)
{
    isMonitoring = active;
    if (!active && !isScanning) {
        statusLabel->setText("Monitoring stopped");
    }
    updateButtons();
}

void MainWindow::onHistorySelected(int index)
{
    if (index < 0 || static_cast<std::size_t>(index) >= history.size()) {
        return;
    }
    resultsWidget->showReport(history.at(static_cast<std::size_t>(index)));
    chartWidget->clearChart();
}

void MainWindow::updateClock()
{
    std::int64_t now = fcs::nowUtc();
    bool open = fcs::isMarketOpen(now);
    clockLabel->setText(QString("%1 | %2").arg(QString::fromStdString(fcs::formatEasternTime(now)), open ? "OPEN" : "CLOSED"));
    clockLabel->setStyleSheet(open ? "color: #28a745;" : "color: #dc3545;");
}

void MainWindow::refreshSettingsSummary()
{
    QString detectors;
    if (settings.detectHeikinAshi) {
        detectors += "HA";
    }
    if (settings.detectNormal) {
        detectors += detectors.isEmpty() ? "Normal" : " + Normal";
    }
    if (detectors.isEmpty()) {
        detectors = "any candle";
    }
    settingsSummaryLabel->setText(QString("%1 | %2 | Cap: %3-%4 | Signals: %5 | Every %6 s")
                                      .arg(QString::fromStdString(fcs::exchangeToString(settings.exchange)),
                                           QString::fromStdString(fcs::describeParameters(settings)),
                                           QString::fromStdString(fcs::formatMarketCap(settings.minMarketCap)),
                                           QString::fromStdString(fcs::formatMarketCap(settings.maxMarketCap)), detectors)
                                      .arg(config.scanIntervalSeconds));
}

void MainWindow::refreshHistoryCombo()
{
    historyCombo->blockSignals(true);
    historyCombo->clear();
    for (std::size_t i = 0; i < history.size(); ++i) {
        const fcs::CycleReport &entry = history.at(i);
        historyCombo->addItem(QString("%1 - %2 matches")
                                  .arg(QString::fromStdString(fcs::formatEasternTime(entry.startedUtc)))
                                  .arg(entry.results.size()));
    }
    historyCombo->setCurrentIndex(history.empty() ? -1 : 0);
    historyCombo->blockSignals(false);
}

void MainWindow::updateButtons()
{
    connectButton->setEnabled(!isConnected);
    disconnectButton->setEnabled(isConnected);
    startButton->setEnabled(isConnected && !isMonitoring);
    stopButton->setEnabled(isMonitoring || isScanning);
    scanOnceButton->setEnabled(isConnected && !isScanning && !isMonitoring);
}
