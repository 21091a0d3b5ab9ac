#include "connectiondialog.h"

#include <QDialogButtonBox>
#include <QFormLayout>
#include <QPushButton>
#include <QVBoxLayout>

namespace {

constexpr int kPaperPort = 7497;
constexpr int kLivePort = 7496;

}

ConnectionDialog::ConnectionDialog(const fcs::ConnectionConfig &current, QWidget *parent)
    : QDialog(parent)
    , timeoutSeconds(current.requestTimeoutSeconds)
{
    setWindowTitle("Connect to TWS");

    hostEdit = new QLineEdit(QString::fromStdString(current.host));
    hostEdit->setPlaceholderText("127.0.0.1");

    presetCombo = new QComboBox();
    presetCombo->addItem("Paper trading", kPaperPort);
    presetCombo->addItem("Live trading", kLivePort);
    presetCombo->addItem("Custom", 0);

    portSpin = new QSpinBox();
    portSpin->setRange(1, 65535);
    portSpin->setValue(current.port);
    if (current.port == kPaperPort) {
        presetCombo->setCurrentIndex(0);
    } else if (current.port == kLivePort) {
        presetCombo->setCurrentIndex(1);
    } else {
        presetCombo->setCurrentIndex(2);
    }
    connect(presetCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this](int index) {
        int port = presetCombo->itemData(index).toInt();
        if (port > 0) {
            portSpin->setValue(port);
        }
    });

    clientIdSpin = new QSpinBox();
    clientIdSpin->setRange(0, 999999);
    clientIdSpin->setValue(current.clientId);

    QFormLayout *form = new QFormLayout();
    form->addRow("Host:", hostEdit);
    form->addRow("Account:", presetCombo);
    form->addRow("Port:", portSpin);
    form->addRow("Client ID:", clientIdSpin);

    QDialogButtonBox *buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel);
    buttons->button(QDialogButtonBox::Ok)->setText("Connect");
    connect(buttons, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);

    QVBoxLayout *layout = new QVBoxLayout(this);
    layout->addLayout(form);
    layout->addWidget(buttons);
}

fcs::ConnectionConfig ConnectionDialog::connection() const
{
    fcs::ConnectionConfig config;
    QString host = hostEdit->text().trimmed();
    config.host = host.isEmpty() ? "127.0.0.1" : host.toStdString();
    config.port = portSpin->value();
    config.clientId = clientIdSpin->value();
    config.requestTimeoutSeconds = timeoutSeconds;
    return config;
}
