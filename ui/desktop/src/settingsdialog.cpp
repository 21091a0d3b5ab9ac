#include "settingsdialog.h"

#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QMessageBox>
#include <QPushButton>
#include <QStringList>
#include <QVBoxLayout>

SettingsDialog::SettingsDialog(const fcs::ScannerSettings &current, QWidget *parent)
    : QDialog(parent)
{
    setWindowTitle("Scanner Settings");
    setupUi();
    loadFrom(current);
}

void SettingsDialog::setupUi()
{
    QGroupBox *marketGroup = new QGroupBox("Market", this);
    QFormLayout *marketForm = new QFormLayout(marketGroup);

    exchangeCombo = new QComboBox();
    exchangeCombo->addItem("NASDAQ", static_cast<int>(fcs::Exchange::Nasdaq));
    exchangeCombo->addItem("NYSE", static_cast<int>(fcs::Exchange::Nyse));
    exchangeCombo->addItem("BOTH", static_cast<int>(fcs::Exchange::Both));
    marketForm->addRow("Exchange:", exchangeCombo);

    timeframeCombo = new QComboBox();
    for (int minutes : fcs::availableTimeframes()) {
        timeframeCombo->addItem(QString("%1 min").arg(minutes), minutes);
    }
    marketForm->addRow("First candle:", timeframeCombo);

    QGroupBox *filterGroup = new QGroupBox("Filters", this);
    QFormLayout *filterForm = new QFormLayout(filterGroup);

    minPriceSpin = new QDoubleSpinBox();
    minPriceSpin->setRange(0.0, 100000.0);
    minPriceSpin->setDecimals(2);
    minPriceSpin->setPrefix("$");
    maxPriceSpin = new QDoubleSpinBox();
    maxPriceSpin->setRange(0.0, 100000.0);
    maxPriceSpin->setDecimals(2);
    maxPriceSpin->setPrefix("$");
    QHBoxLayout *priceRow = new QHBoxLayout();
    priceRow->addWidget(minPriceSpin);
    priceRow->addWidget(maxPriceSpin);
    filterForm->addRow("Price range:", priceRow);

    minCapSpin = new QDoubleSpinBox();
    minCapSpin->setRange(0.0, 10000.0);
    minCapSpin->setDecimals(2);
    minCapSpin->setSuffix(" B");
    maxCapSpin = new QDoubleSpinBox();
    maxCapSpin->setRange(0.0, 10000.0);
    maxCapSpin->setDecimals(2);
    maxCapSpin->setSuffix(" B");
    QHBoxLayout *capRow = new QHBoxLayout();
    capRow->addWidget(minCapSpin);
    capRow->addWidget(maxCapSpin);
    filterForm->addRow("Market cap:", capRow);

    minVolumeSpin = new QSpinBox();
    minVolumeSpin->setRange(0, 2000000000);
    minVolumeSpin->setSingleStep(10000);
    minVolumeSpin->setGroupSeparatorShown(true);
    filterForm->addRow("Min first candle volume:", minVolumeSpin);

    QGroupBox *signalGroup = new QGroupBox("Signals", this);
    QVBoxLayout *signalLayout = new QVBoxLayout(signalGroup);
    haCheckbox = new QCheckBox("Bullish Heikin Ashi first candle");
    normalCheckbox = new QCheckBox("Bullish normal first candle");
    signalLayout->addWidget(haCheckbox);
    signalLayout->addWidget(normalCheckbox);

    QPushButton *applyButton = new QPushButton("Apply", this);
    QPushButton *saveButton = new QPushButton("Save && Apply", this);
    QPushButton *cancelButton = new QPushButton("Cancel", this);
    saveButton->setDefault(true);
    connect(applyButton, &QPushButton::clicked, this, &SettingsDialog::onApply);
    connect(saveButton, &QPushButton::clicked, this, &SettingsDialog::onSaveAndApply);
    connect(cancelButton, &QPushButton::clicked, this, &QDialog::reject);

    QHBoxLayout *buttonLayout = new QHBoxLayout();
    buttonLayout->addStretch();
    buttonLayout->addWidget(applyButton);
    buttonLayout->addWidget(saveButton);
    buttonLayout->addWidget(cancelButton);

    QVBoxLayout *layout = new QVBoxLayout(this);
    layout->addWidget(marketGroup);
    layout->addWidget(filterGroup);
    layout->addWidget(signalGroup);
    layout->addLayout(buttonLayout);
}

void SettingsDialog::loadFrom(const fcs::ScannerSettings &settings)
{
    exchangeCombo->setCurrentIndex(exchangeCombo->findData(static_cast<int>(settings.exchange)));
    int tfIndex = timeframeCombo->findData(settings.timeframeMinutes);
    timeframeCombo->setCurrentIndex(tfIndex >= 0 ? tfIndex : timeframeCombo->findData(2));
    minPriceSpin->setValue(settings.minPrice);
    maxPriceSpin->setValue(settings.maxPrice);
    minCapSpin->setValue(settings.minMarketCap);
    maxCapSpin->setValue(settings.maxMarketCap);
    minVolumeSpin->setValue(static_cast<int>(qMin<std::int64_t>(settings.minVolume, 2000000000)));
    haCheckbox->setChecked(settings.detectHeikinAshi);
    normalCheckbox->setChecked(settings.detectNormal);
}

fcs::ScannerSettings SettingsDialog::settings() const
{
    fcs::ScannerSettings settings;
    settings.exchange = static_cast<fcs::Exchange>(exchangeCombo->currentData().toInt());
    settings.timeframeMinutes = timeframeCombo->currentData().toInt();
    settings.minPrice = minPriceSpin->value();
    settings.maxPrice = maxPriceSpin->value();
    settings.minMarketCap = minCapSpin->value();
    settings.maxMarketCap = maxCapSpin->value();
    settings.minVolume = minVolumeSpin->value();
    settings.detectHeikinAshi = haCheckbox->isChecked();
    settings.detectNormal = normalCheckbox->isChecked();
    return settings;
}

bool SettingsDialog::validate()
{
    auto errors = fcs::validateSettings(settings());
    if (errors.empty()) {
        return true;
    }
    QStringList lines;
    for (const auto &error : errors) {
        lines << QString::fromStdString(error);
    }
    QMessageBox::warning(this, "Invalid Settings", lines.join("\n"));
    return false;
}

void SettingsDialog::onApply()
{
    if (!validate()) {
        return;
    }
    emit settingsApplied(settings(), false);
    accept();
}

void SettingsDialog::onSaveAndApply()
{
    if (!validate()) {
        return;
    }
    emit settingsApplied(settings(), true);
    accept();
}
