#ifndef RESULTSWIDGET_H
#define RESULTSWIDGET_H

#include <QLabel>
#include <QTableWidget>
#include <QWidget>

#include <vector>

#include "model/Types.hpp"
#include "scan/Scanner.hpp"

// Results of one scan cycle as a table, one row per matching symbol.
class ResultsWidget : public QWidget
{
    Q_OBJECT

public:
    explicit ResultsWidget(QWidget *parent = nullptr);

    void showReport(const fcs::CycleReport &report);
    void clearResults();
    int rowCount() const;

signals:
    void resultSelected(const fcs::ScanResult &result);

public slots:
    void exportToCSV();

private slots:
    void onSelectionChanged();

private:
    void setupUi();
    QTableWidgetItem *makeItem(const QString &text, Qt::Alignment alignment = Qt::AlignRight | Qt::AlignVCenter) const;
    QTableWidgetItem *makeSignalItem(bool bullish) const;

    QTableWidget *table;
    QLabel *summaryLabel;
    std::vector<fcs::ScanResult> results;
};

#endif
