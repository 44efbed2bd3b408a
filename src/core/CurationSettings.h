#pragma once

#include <QObject>
#include <QSettings>
#include "CurationConfig.h"

// INI-backed persistence for CurationConfig. The file path is explicit so
// tests and multiple catalogs never share state.
class CurationSettings : public QObject {
    Q_OBJECT

public:
    explicit CurationSettings(const QString& iniPath, QObject* parent = nullptr);

    QString fileName() const { return m_settings.fileName(); }

    // Missing keys fall back to the preset of the stored mode. An invalid
    // stored combination is reported and replaced by that preset.
    CurationConfig load(QString* errorString = nullptr) const;
    bool save(const CurationConfig& config, QString* errorString = nullptr);

    QString lastLibraryPath() const;
    void setLastLibraryPath(const QString& path);

    void sync() { m_settings.sync(); }

signals:
    void configChanged();

private:
    mutable QSettings m_settings;
};
