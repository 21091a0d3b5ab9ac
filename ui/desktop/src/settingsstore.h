#ifndef SETTINGSSTORE_H
#define SETTINGSSTORE_H

#include <QString>

#include "config/Settings.hpp"

// Persists ScannerSettings as JSON. A missing file yields defaults; a corrupt
// one is copied to "<path>.bak.<yyyyMMdd_HHmmss>" and defaults are used.
class SettingsStore
{
public:
    explicit SettingsStore(const QString &path);

    fcs::ScannerSettings load() const;
    bool save(const fcs::ScannerSettings &settings) const;

    const QString &path() const { return filePath; }

private:
    void backupCorrupt() const;

    QString filePath;
};

#endif
