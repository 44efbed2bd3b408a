#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>
#include <atomic>
#include <optional>

#include "../CatalogData.h"

struct BackupEntry {
    QString originalPath;
    QString backupPath;
    qint64  size = 0;
    QString checksum;     // SHA-256 hex of the copied bytes
};

struct BackupManifest {
    static const QString kFileName;   // "manifest.json"

    QString   backupId;               // "backup_YYYYMMDD_HHMMSS"
    QDateTime createdAt;
    QString   backupDirectory;
    QVector<BackupEntry> entries;

    qint64 totalBytes() const;
    QString manifestPath() const;

    QJsonObject toJson() const;
    static std::optional<BackupManifest> fromJson(const QJsonObject& obj,
                                                  QString* errorString = nullptr);
};

struct RestoreResult {
    int restored = 0;
    int skipped = 0;      // original already present and overwrite off
    int failed = 0;
    QVector<FileError> errors;

    bool success() const { return failed == 0; }
};

// Copies delete candidates into a fresh timestamped directory under the
// backup root. A batch is all or nothing: on any failure the partial
// directory is removed and no manifest exists.
class BackupManager {
public:
    explicit BackupManager(const QString& backupRoot);

    QString backupRoot() const { return m_root; }

    std::optional<BackupManifest> backupFiles(const QStringList& paths,
                                              QString* errorString = nullptr,
                                              const std::atomic<bool>* cancel = nullptr);

    static std::optional<BackupManifest> loadManifest(const QString& manifestPath,
                                                      QString* errorString = nullptr);

    // Copies every entry back to its original path after checking the
    // backup copy against its recorded checksum.
    static RestoreResult restore(const BackupManifest& manifest, bool overwrite = false);

    static QString sha256File(const QString& path, QString* errorString = nullptr);

    // dir/name, or dir/stem_N.ext for the first free N.
    static QString uniqueTargetPath(const QString& dir, const QString& fileName);

private:
    bool writeManifest(const BackupManifest& manifest, QString* errorString) const;

    QString m_root;
};
