#ifndef CONNECTIONDIALOG_H
#define CONNECTIONDIALOG_H

#include <QComboBox>
#include <QDialog>
#include <QLineEdit>
#include <QSpinBox>

#include "config/Settings.hpp"

class ConnectionDialog : public QDialog
{
    Q_OBJECT

public:
    explicit ConnectionDialog(const fcs::ConnectionConfig &current, QWidget *parent = nullptr);

    fcs::ConnectionConfig connection() const;

private:
    QLineEdit *hostEdit;
    QComboBox *presetCombo;
    QSpinBox *portSpin;
    QSpinBox *clientIdSpin;
    int timeoutSeconds;
};

#endif
