#include "resultswidget.h"

#include <QBrush>
#include <QColor>
#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QFileDialog>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QMessageBox>
#include <QPushButton>
#include <QVBoxLayout>

#include <sstream>

#include "io/BarCsv.hpp"
#include "util/Format.hpp"

namespace {

const QColor kBullishColor("#28a745");
const QColor kBearishColor("#dc3545");

enum Column {
    ColTicker,
    ColLast,
    ColChange,
    ColBid,
    ColAsk,
    ColMarketCap,
    ColVolume,
    ColFirstVolume,
    ColHa,
    ColNormal,
    ColScanTime,
    ColumnCount
};

QString qs(const std::string &text)
{
    return QString::fromStdString(text);
}

}

ResultsWidget::ResultsWidget(QWidget *parent)
    : QWidget(parent)
    , table(nullptr)
    , summaryLabel(nullptr)
{
    setupUi();
}

void ResultsWidget::setupUi()
{
    table = new QTableWidget(0, ColumnCount, this);
    table->setHorizontalHeaderLabels({"Ticker", "Last", "Change %", "Bid", "Ask", "Market Cap", "Volume", "1st Candle Vol", "HA",
                                      "Normal", "Scan Time"});
    table->setEditTriggers(QAbstractItemView::NoEditTriggers);
    table->setSelectionBehavior(QAbstractItemView::SelectRows);
    table->setSelectionMode(QAbstractItemView::SingleSelection);
    table->setAlternatingRowColors(true);
    table->verticalHeader()->setVisible(false);
    table->horizontalHeader()->setSectionResizeMode(QHeaderView::ResizeToContents);
    table->horizontalHeader()->setStretchLastSection(true);
    connect(table, &QTableWidget::itemSelectionChanged, this, &ResultsWidget::onSelectionChanged);

    summaryLabel = new QLabel("No scan yet", this);
    QPushButton *exportButton = new QPushButton("Export Results (CSV)", this);
    connect(exportButton, &QPushButton::clicked, this, &ResultsWidget::exportToCSV);

    QHBoxLayout *footer = new QHBoxLayout();
    footer->addWidget(summaryLabel, 1);
    footer->addWidget(exportButton);

    QVBoxLayout *layout = new QVBoxLayout(this);
    layout->addWidget(table);
    layout->addLayout(footer);
    layout->setContentsMargins(0, 0, 0, 0);
}

QTableWidgetItem *ResultsWidget::makeItem(const QString &text, Qt::Alignment alignment) const
{
    QTableWidgetItem *item = new QTableWidgetItem(text);
    item->setTextAlignment(alignment);
    return item;
}

QTableWidgetItem *ResultsWidget::makeSignalItem(bool bullish) const
{
    QTableWidgetItem *item = makeItem(bullish ? "Bullish" : "Bearish", Qt::AlignCenter);
    item->setForeground(QBrush(Qt::white));
    item->setBackground(QBrush(bullish ? kBullishColor : kBearishColor));
    return item;
}

void ResultsWidget::showReport(const fcs::CycleReport &report)
{
    results = report.results;
    table->setSortingEnabled(false);
    table->clearContents();
    table->setRowCount(static_cast<int>(results.size()));
    for (int row = 0; row < static_cast<int>(results.size()); ++row) {
        const fcs::ScanResult &r = results[static_cast<std::size_t>(row)];
        QTableWidgetItem *ticker = makeItem(qs(r.symbol), Qt::AlignLeft | Qt::AlignVCenter);
        ticker->setData(Qt::UserRole, row);
        table->setItem(row, ColTicker, ticker);
        table->setItem(row, ColLast, makeItem(qs(fcs::formatPrice(r.lastPrice))));
        QTableWidgetItem *change = makeItem(qs(fcs::formatPercent(r.changePercent)));
        change->setForeground(QBrush(r.changePercent >= 0.0 ? kBullishColor : kBearishColor));
        table->setItem(row, ColChange, change);
        table->setItem(row, ColBid, makeItem(qs(fcs::formatPrice(r.bid))));
        table->setItem(row, ColAsk, makeItem(qs(fcs::formatPrice(r.ask))));
        table->setItem(row, ColMarketCap, makeItem(qs(fcs::formatMarketCap(r.marketCapBillions))));
        table->setItem(row, ColVolume, makeItem(qs(fcs::formatVolume(r.volume))));
        table->setItem(row, ColFirstVolume, makeItem(qs(fcs::formatVolume(r.firstCandleVolume))));
        table->setItem(row, ColHa, makeSignalItem(r.haBullish));
        table->setItem(row, ColNormal, makeSignalItem(r.normalBullish));
        table->setItem(row, ColScanTime, makeItem(qs(fcs::formatEasternTime(r.scanTime)), Qt::AlignLeft | Qt::AlignVCenter));
    }
    table->setSortingEnabled(true);

    QString text = QString("%1 matches | %2 | %3 ms")
                       .arg(results.size())
                       .arg(qs(report.parametersUsed))
                       .arg(report.elapsedMs, 0, 'f', 0);
    if (report.cancelled) {
        text += " | cancelled";
    }
    summaryLabel->setText(text);
    summaryLabel->setToolTip(qs(report.summary()));
}

void ResultsWidget::clearResults()
{
    results.clear();
    table->setRowCount(0);
    summaryLabel->setText("No scan yet");
}

int ResultsWidget::rowCount() const
{
    return table->rowCount();
}

void ResultsWidget::onSelectionChanged()
{
    QList<QTableWidgetItem *> selected = table->selectedItems();
    if (selected.isEmpty()) {
        return;
    }
    // Rows may be re-sorted, so map back through the ticker cell.
    QTableWidgetItem *ticker = table->item(selected.first()->row(), ColTicker);
    if (!ticker) {
        return;
    }
    int index = ticker->data(Qt::UserRole).toInt();
    if (index >= 0 && index < static_cast<int>(results.size())) {
        emit resultSelected(results[static_cast<std::size_t>(index)]);
    }
}

void ResultsWidget::exportToCSV()
{
    if (results.empty()) {
        QMessageBox::information(this, "Export Results", "There are no results to export.");
        return;
    }
    QString defaultName = QString("scan_results_%1.csv").arg(QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss"));
    QString fileName = QFileDialog::getSaveFileName(this, "Export Results as CSV", defaultName, "CSV File (*.csv)");
    if (fileName.isEmpty()) {
        return;
    }

    std::ostringstream out;
    fcs::writeResultsCsvHeader(out);
    for (const auto &result : results) {
        fcs::writeResultCsvRow(out, result);
    }

    QFile file(fileName);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        QMessageBox::critical(this, "Export Failed", QString("Failed to open file for writing:\n%1").arg(fileName));
        return;
    }
    file.write(QByteArray::fromStdString(out.str()));
    file.close();
    qInfo() << "Results exported to CSV:" << fileName;
}
