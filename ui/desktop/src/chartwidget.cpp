#include "chartwidget.h"

#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QFileDialog>
#include <QHBoxLayout>
#include <QLabel>
#include <QMessageBox>
#include <QPushButton>
#include <QTextStream>
#include <QVBoxLayout>
#include <QtCharts/QCandlestickSet>

#include <algorithm>

#include "candle/HeikinAshi.hpp"
#include "util/MarketTime.hpp"

namespace {

QString easternLabel(std::int64_t utcSeconds)
{
    fcs::LocalDateTime local = fcs::toEasternTime(utcSeconds);
    return QString("%1:%2").arg(local.hour, 2, 10, QChar('0')).arg(local.minute, 2, 10, QChar('0'));
}

}

ChartWidget::ChartWidget(QWidget *parent)
    : QWidget(parent)
    , chartView(nullptr)
    , chart(nullptr)
    , rawSeries(nullptr)
    , haSeries(nullptr)
    , axisX(nullptr)
    , axisY(nullptr)
    , modeCombo(nullptr)
    , timeframeMinutes(0)
{
    setupChart();
}

void ChartWidget::setupChart()
{
    chart = new QChart();
    chart->setTitle("Select a result to chart its session");
    chart->setAnimationOptions(QChart::NoAnimation);
    chart->legend()->setVisible(false);

    rawSeries = new QCandlestickSeries();
    rawSeries->setName("Candles");
    rawSeries->setIncreasingColor(QColor("#28a745"));
    rawSeries->setDecreasingColor(QColor("#dc3545"));
    chart->addSeries(rawSeries);

    haSeries = new QCandlestickSeries();
    haSeries->setName("Heikin Ashi");
    haSeries->setIncreasingColor(QColor("#28a745"));
    haSeries->setDecreasingColor(QColor("#dc3545"));
    haSeries->setVisible(false);
    chart->addSeries(haSeries);

    axisX = new QBarCategoryAxis();
    axisX->setTitleText("Time (ET)");
    chart->addAxis(axisX, Qt::AlignBottom);
    rawSeries->attachAxis(axisX);
    haSeries->attachAxis(axisX);

    axisY = new QValueAxis();
    axisY->setTitleText("Price (USD)");
    axisY->setLabelFormat("%.2f");
    chart->addAxis(axisY, Qt::AlignLeft);
    rawSeries->attachAxis(axisY);
    haSeries->attachAxis(axisY);

    chartView = new QChartView(chart, this);
    chartView->setRenderHint(QPainter::Antialiasing);

    modeCombo = new QComboBox(this);
    modeCombo->addItems({"Candles", "Heikin Ashi"});
    connect(modeCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &ChartWidget::onModeChanged);

    QPushButton *exportPNGBtn = new QPushButton("Export Chart (PNG)", this);
    QPushButton *exportCSVBtn = new QPushButton("Export Data (CSV)", this);
    connect(exportPNGBtn, &QPushButton::clicked, this, &ChartWidget::exportToPNG);
    connect(exportCSVBtn, &QPushButton::clicked, this, &ChartWidget::exportToCSV);

    QHBoxLayout *buttonLayout = new QHBoxLayout();
    buttonLayout->addWidget(new QLabel("Style:", this));
    buttonLayout->addWidget(modeCombo);
    buttonLayout->addStretch();
    buttonLayout->addWidget(exportPNGBtn);
    buttonLayout->addWidget(exportCSVBtn);

    QVBoxLayout *layout = new QVBoxLayout(this);
    layout->addWidget(chartView);
    layout->addLayout(buttonLayout);
    layout->setContentsMargins(0, 0, 0, 0);
}

void ChartWidget::showResult(const fcs::ScanResult &result)
{
    symbol = QString::fromStdString(result.symbol);
    bars = result.sessionBars;
    haBars = fcs::computeHeikinAshiSeries(bars);
    timeframeMinutes = bars.size() > 1 ? static_cast<int>((bars[1].time - bars[0].time) / 60) : 0;
    rebuildSeries();
}

void ChartWidget::clearChart()
{
    symbol.clear();
    bars.clear();
    haBars.clear();
    rebuildSeries();
    chart->setTitle("Select a result to chart its session");
}

void ChartWidget::rebuildSeries()
{
    rawSeries->clear();
    haSeries->clear();
    axisX->clear();
    if (bars.empty()) {
        return;
    }

    QStringList categories;
    double low = bars.front().low;
    double high = bars.front().high;
    for (std::size_t i = 0; i < bars.size(); ++i) {
        const fcs::Bar &bar = bars[i];
        const fcs::HeikinAshiBar &ha = haBars[i];
        qreal stamp = static_cast<qreal>(bar.time) * 1000.0;
        rawSeries->append(new QCandlestickSet(bar.open, bar.high, bar.low, bar.close, stamp));
        haSeries->append(new QCandlestickSet(ha.open, ha.high, ha.low, ha.close, stamp));
        categories << easternLabel(bar.time);
        low = std::min({low, bar.low, ha.low});
        high = std::max({high, bar.high, ha.high});
    }
    axisX->append(categories);
    double pad = (high - low) * 0.05;
    axisY->setRange(low - pad, high + pad);

    QString title = symbol;
    if (timeframeMinutes > 0) {
        title += QString(" %1m").arg(timeframeMinutes);
    }
    title += QString(" - %1").arg(QString::fromStdString(fcs::toString(fcs::toEasternTime(bars.front().time).date)));
    chart->setTitle(title);
    onModeChanged(modeCombo->currentIndex());
}

void ChartWidget::onModeChanged(int index)
{
    rawSeries->setVisible(index == 0);
    haSeries->setVisible(index == 1);
}

void ChartWidget::exportToPNG()
{
    QString defaultName = QString("chart_%1_%2.png")
                              .arg(symbol.isEmpty() ? QString("empty") : symbol)
                              .arg(QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss"));
    QString fileName = QFileDialog::getSaveFileName(this, "Export Chart as PNG", defaultName, "PNG Image (*.png)");
    if (fileName.isEmpty()) {
        return;
    }
    QPixmap pixmap = chartView->grab();
    if (pixmap.save(fileName, "PNG")) {
        qInfo() << "Chart exported to PNG:" << fileName;
    } else {
        QMessageBox::critical(this, "Export Failed", QString("Failed to save chart to:\n%1").arg(fileName));
        qWarning() << "Failed to export chart to PNG:" << fileName;
    }
}

void ChartWidget::exportToCSV()
{
    if (bars.empty()) {
        QMessageBox::information(this, "Export Data", "No chart data to export.");
        return;
    }
    QString defaultName = QString("chart_data_%1_%2.csv").arg(symbol, QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss"));
    QString fileName = QFileDialog::getSaveFileName(this, "Export Chart Data as CSV", defaultName, "CSV File (*.csv)");
    if (fileName.isEmpty()) {
        return;
    }
    QFile file(fileName);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        QMessageBox::critical(this, "Export Failed", QString("Failed to open file for writing:\n%1").arg(fileName));
        return;
    }
    QTextStream out(&file);
    out << "time,open,high,low,close,volume,ha_open,ha_high,ha_low,ha_close\n";
    for (std::size_t i = 0; i < bars.size(); ++i) {
        const fcs::Bar &bar = bars[i];
        const fcs::HeikinAshiBar &ha = haBars[i];
        out << bar.time << ',' << bar.open << ',' << bar.high << ',' << bar.low << ',' << bar.close << ',' << bar.volume << ','
            << ha.open << ',' << ha.high << ',' << ha.low << ',' << ha.close << '\n';
    }
    file.close();
    qInfo() << "Chart data exported to CSV:" << fileName;
}
