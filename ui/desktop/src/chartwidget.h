#ifndef CHARTWIDGET_H
#define CHARTWIDGET_H

#include <QComboBox>
#include <QWidget>
#include <QtCharts/QBarCategoryAxis>
#include <QtCharts/QCandlestickSeries>
#include <QtCharts/QChart>
#include <QtCharts/QChartView>
#include <QtCharts/QValueAxis>

#include <vector>

#include "model/Types.hpp"

QT_CHARTS_USE_NAMESPACE

// Session candles of the selected symbol, raw or Heikin Ashi.
class ChartWidget : public QWidget
{
    Q_OBJECT

public:
    explicit ChartWidget(QWidget *parent = nullptr);

public slots:
    void showResult(const fcs::ScanResult &result);
    void clearChart();
    void exportToPNG();
    void exportToCSV();

private slots:
    void onModeChanged(int index);

private:
    void setupChart();
    void rebuildSeries();

    QChartView *chartView;
    QChart *chart;
    QCandlestickSeries *rawSeries;
    QCandlestickSeries *haSeries;
    QBarCategoryAxis *axisX;
    QValueAxis *axisY;
    QComboBox *modeCombo;

    QString symbol;
    int timeframeMinutes;
    std::vector<fcs::Bar> bars;
    std::vector<fcs::HeikinAshiBar> haBars;
};

#endif
