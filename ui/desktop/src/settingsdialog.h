#ifndef SETTINGSDIALOG_H
#define SETTINGSDIALOG_H

#include <QCheckBox>
#include <QComboBox>
#include <QDialog>
#include <QDoubleSpinBox>
#include <QSpinBox>

#include "config/Settings.hpp"

class SettingsDialog : public QDialog
{
    Q_OBJECT

public:
    explicit SettingsDialog(const fcs::ScannerSettings &current, QWidget *parent = nullptr);

    fcs::ScannerSettings settings() const;

signals:
    // `persist` is true for "Save & Apply".
    void settingsApplied(const fcs::ScannerSettings &settings, bool persist);

private slots:
    void onApply();
    void onSaveAndApply();

private:
    void setupUi();
    void loadFrom(const fcs::ScannerSettings &settings);
    bool validate();

    QComboBox *exchangeCombo;
    QComboBox *timeframeCombo;
    QDoubleSpinBox *minPriceSpin;
    QDoubleSpinBox *maxPriceSpin;
    QDoubleSpinBox *minCapSpin;
    QDoubleSpinBox *maxCapSpin;
    QSpinBox *minVolumeSpin;
    QCheckBox *haCheckbox;
    QCheckBox *normalCheckbox;
};

#endif
