#include "settingsstore.h"

#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>

#include <stdexcept>

SettingsStore::SettingsStore(const QString &path)
    : filePath(path)
{
}

fcs::ScannerSettings SettingsStore::load() const
{
    fcs::ScannerSettings settings;
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qInfo() << "No saved settings at" << filePath << "- using defaults";
        return settings;
    }
    QByteArray data = file.readAll();
    file.close();

    QJsonDocument doc = QJsonDocument::fromJson(data);
    if (doc.isNull() || !doc.isObject()) {
        qWarning() << "Settings file" << filePath << "is corrupted - backing up and using defaults";
        backupCorrupt();
        return settings;
    }

    QJsonObject root = doc.object();
    try {
        settings.exchange = fcs::parseExchange(root["exchange"].toString("BOTH").toStdString());
    } catch (const std::runtime_error &ex) {
        qWarning() << "Ignoring saved exchange:" << ex.what();
    }
    settings.minPrice = root["min_price"].toDouble(settings.minPrice);
    settings.maxPrice = root["max_price"].toDouble(settings.maxPrice);
    settings.minMarketCap = root["min_market_cap"].toDouble(settings.minMarketCap);
    settings.maxMarketCap = root["max_market_cap"].toDouble(settings.maxMarketCap);
    settings.minVolume = static_cast<std::int64_t>(root["min_volume"].toDouble(static_cast<double>(settings.minVolume)));
    settings.timeframeMinutes = root["timeframe_minutes"].toInt(settings.timeframeMinutes);
    settings.detectHeikinAshi = root["detect_ha_candle"].toBool(settings.detectHeikinAshi);
    settings.detectNormal = root["detect_normal_candle"].toBool(settings.detectNormal);

    auto errors = fcs::validateSettings(settings);
    if (!errors.empty()) {
        qWarning() << "Saved settings are invalid:" << QString::fromStdString(errors.front()) << "- using defaults";
        return fcs::ScannerSettings{};
    }
    qInfo() << "Loaded settings from" << filePath;
    return settings;
}

bool SettingsStore::save(const fcs::ScannerSettings &settings) const
{
    QJsonObject root;
    root["exchange"] = QString::fromStdString(fcs::exchangeToString(settings.exchange));
    root["min_price"] = settings.minPrice;
    root["max_price"] = settings.maxPrice;
    root["min_market_cap"] = settings.minMarketCap;
    root["max_market_cap"] = settings.maxMarketCap;
    root["min_volume"] = static_cast<double>(settings.minVolume);
    root["timeframe_minutes"] = settings.timeframeMinutes;
    root["detect_ha_candle"] = settings.detectHeikinAshi;
    root["detect_normal_candle"] = settings.detectNormal;

    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "Failed to write settings to" << filePath;
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    file.close();
    qInfo() << "Settings saved to" << filePath;
    return true;
}

void SettingsStore::backupCorrupt() const
{
    QString timestamp = QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss");
    QString backupPath = QString("%1.bak.%2").arg(filePath, timestamp);
    if (QFile::copy(filePath, backupPath)) {
        qInfo() << "Backed up corrupted settings to" << backupPath;
    } else {
        qWarning() << "Failed to back up corrupted settings file";
    }
}
