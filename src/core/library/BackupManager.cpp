#include "BackupManager.h"

#include <QCryptographicHash>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>
#include <QDebug>

const QString BackupManifest::kFileName = QStringLiteral("manifest.json");

// ═════════════════════════════════════════════════════════════════════
//  BackupManifest
// ═════════════════════════════════════════════════════════════════════

qint64 BackupManifest::totalBytes() const
{
    qint64 total = 0;
    for (const BackupEntry& e : entries)
        total += e.size;
    return total;
}

QString BackupManifest::manifestPath() const
{
    return QDir(backupDirectory).filePath(kFileName);
}

QJsonObject BackupManifest::toJson() const
{
    QJsonArray arr;
    for (const BackupEntry& e : entries) {
        QJsonObject o;
        o[QStringLiteral("original_path")] = e.originalPath;
        o[QStringLiteral("backup_path")] = e.backupPath;
        o[QStringLiteral("size")] = double(e.size);
        o[QStringLiteral("checksum")] = e.checksum;
        arr.append(o);
    }

    QJsonObject obj;
    obj[QStringLiteral("backup_id")] = backupId;
    obj[QStringLiteral("created_at")] = createdAt.toString(Qt::ISODate);
    obj[QStringLiteral("backup_dir")] = backupDirectory;
    obj[QStringLiteral("file_count")] = entries.size();
    obj[QStringLiteral("total_bytes")] = double(totalBytes());
    obj[QStringLiteral("files")] = arr;
    return obj;
}

std::optional<BackupManifest> BackupManifest::fromJson(const QJsonObject& obj, QString* errorString)
{
    if (!obj.contains(QStringLiteral("backup_id")) || !obj.value(QStringLiteral("files")).isArray()) {
        if (errorString) *errorString = QStringLiteral("Manifest is missing backup_id or files");
        return std::nullopt;
    }

    BackupManifest m;
    m.backupId = obj.value(QStringLiteral("backup_id")).toString();
    m.createdAt = QDateTime::fromString(obj.value(QStringLiteral("created_at")).toString(), Qt::ISODate);
    m.backupDirectory = obj.value(QStringLiteral("backup_dir")).toString();

    const QJsonArray arr = obj.value(QStringLiteral("files")).toArray();
    for (const QJsonValue& v : arr) {
        const QJsonObject o = v.toObject();
        BackupEntry e;
        e.originalPath = o.value(QStringLiteral("original_path")).toString();
        e.backupPath = o.value(QStringLiteral("backup_path")).toString();
        e.size = qint64(o.value(QStringLiteral("size")).toDouble());
        e.checksum = o.value(QStringLiteral("checksum")).toString();
        if (e.originalPath.isEmpty() || e.backupPath.isEmpty()) {
            if (errorString) *errorString = QStringLiteral("Manifest entry without paths");
            return std::nullopt;
        }
        m.entries.append(e);
    }
    return m;
}

// ═════════════════════════════════════════════════════════════════════
//  BackupManager
// ═════════════════════════════════════════════════════════════════════

BackupManager::BackupManager(const QString& backupRoot)
    : m_root(backupRoot)
{
}

QString BackupManager::sha256File(const QString& path, QString* errorString)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorString) *errorString = QStringLiteral("Cannot open %1: %2").arg(path, file.errorString());
        return QString();
    }
    QCryptographicHash hasher(QCryptographicHash::Sha256);
    if (!hasher.addData(&file)) {
        if (errorString) *errorString = QStringLiteral("Read error on %1").arg(path);
        return QString();
    }
    return QString::fromLatin1(hasher.result().toHex());
}

QString BackupManager::uniqueTargetPath(const QString& dir, const QString& fileName)
{
    QDir d(dir);
    QString candidate = d.filePath(fileName);
    if (!QFileInfo::exists(candidate))
        return candidate;

    const QFileInfo fi(fileName);
    const QString stem = fi.completeBaseName();
    const QString suffix = fi.suffix();
    for (int n = 1;; ++n) {
        const QString name = suffix.isEmpty()
            ? QStringLiteral("%1_%2").arg(stem).arg(n)
            : QStringLiteral("%1_%2.%3").arg(stem).arg(n).arg(suffix);
        candidate = d.filePath(name);
        if (!QFileInfo::exists(candidate))
            return candidate;
    }
}

std::optional<BackupManifest> BackupManager::backupFiles(const QStringList& paths,
                                                         QString* errorString,
                                                         const std::atomic<bool>* cancel)
{
    QDir root(m_root);
    if (m_root.isEmpty() || (!root.exists() && !root.mkpath(QStringLiteral(".")))) {
        if (errorString) *errorString = QStringLiteral("Cannot create backup root %1").arg(m_root);
        qWarning() << "[Backup] Cannot create backup root" << m_root;
        return std::nullopt;
    }

    BackupManifest manifest;
    manifest.createdAt = QDateTime::currentDateTime();
    const QString baseId = QStringLiteral("backup_") + manifest.createdAt.toString(QStringLiteral("yyyyMMdd_HHmmss"));
    manifest.backupId = baseId;
    for (int n = 1; root.exists(manifest.backupId); ++n)
        manifest.backupId = QStringLiteral("%1_%2").arg(baseId).arg(n);

    if (!root.mkdir(manifest.backupId)) {
        if (errorString) *errorString = QStringLiteral("Cannot create %1").arg(root.filePath(manifest.backupId));
        return std::nullopt;
    }
    manifest.backupDirectory = root.filePath(manifest.backupId);

    auto abort = [&](const QString& msg) -> std::optional<BackupManifest> {
        qWarning() << "[Backup]" << msg << "- removing partial backup" << manifest.backupDirectory;
        QDir(manifest.backupDirectory).removeRecursively();
        if (errorString) *errorString = msg;
        return std::nullopt;
    };

    for (const QString& path : paths) {
        if (cancel && *cancel)
            return abort(QStringLiteral("Backup cancelled"));

        QFileInfo src(path);
        if (!src.exists() || !src.isFile())
            return abort(QStringLiteral("Source missing: %1").arg(path));

        QString err;
        const QString sourceSum = sha256File(path, &err);
        if (sourceSum.isEmpty())
            return abort(err);

        BackupEntry entry;
        entry.originalPath = src.absoluteFilePath();
        entry.backupPath = uniqueTargetPath(manifest.backupDirectory, src.fileName());
        entry.size = src.size();

        if (!QFile::copy(path, entry.backupPath))
            return abort(QStringLiteral("Copy failed: %1 -> %2").arg(path, entry.backupPath));

        entry.checksum = sha256File(entry.backupPath, &err);
        if (entry.checksum.isEmpty())
            return abort(err);
        if (entry.checksum != sourceSum)
            return abort(QStringLiteral("Checksum mismatch after copy: %1").arg(path));

        manifest.entries.append(entry);
        qDebug() << "[Backup] Backed up:" << path << "->" << entry.backupPath;
    }

    QString err;
    if (!writeManifest(manifest, &err))
        return abort(err);

    qDebug() << "[Backup]" << manifest.entries.size() << "files," << formatBytes(manifest.totalBytes())
             << "in" << manifest.backupDirectory;
    return manifest;
}

bool BackupManager::writeManifest(const BackupManifest& manifest, QString* errorString) const
{
    QSaveFile file(manifest.manifestPath());
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorString) *errorString = QStringLiteral("Cannot write manifest: %1").arg(file.errorString());
        return false;
    }
    file.write(QJsonDocument(manifest.toJson()).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        if (errorString) *errorString = QStringLiteral("Cannot commit manifest: %1").arg(file.errorString());
        return false;
    }
    return true;
}

std::optional<BackupManifest> BackupManager::loadManifest(const QString& manifestPath, QString* errorString)
{
    QFile file(manifestPath);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorString) *errorString = QStringLiteral("Cannot open %1: %2").arg(manifestPath, file.errorString());
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorString) *errorString = QStringLiteral("Invalid manifest %1: %2").arg(manifestPath, parseError.errorString());
        return std::nullopt;
    }

    auto manifest = BackupManifest::fromJson(doc.object(), errorString);
    if (manifest && manifest->backupDirectory.isEmpty())
        manifest->backupDirectory = QFileInfo(manifestPath).absolutePath();
    return manifest;
}

// Streams src into a temp file beside dst and renames it over dst on
// commit. dst is untouched if anything fails before the rename.
static bool writeOver(const QString& src, const QString& dst, QString* errorString)
{
    QFile in(src);
    if (!in.open(QIODevice::ReadOnly)) {
        if (errorString) *errorString = QStringLiteral("Cannot read %1: %2").arg(src, in.errorString());
        return false;
    }
    QSaveFile out(dst);
    if (!out.open(QIODevice::WriteOnly)) {
        if (errorString) *errorString = QStringLiteral("Cannot write %1: %2").arg(dst, out.errorString());
        return false;
    }
    while (!in.atEnd()) {
        const QByteArray chunk = in.read(1 << 20);
        if (chunk.isEmpty() && in.error() != QFileDevice::NoError) {
            out.cancelWriting();
            if (errorString) *errorString = QStringLiteral("Read error on %1: %2").arg(src, in.errorString());
            return false;
        }
        if (out.write(chunk) != chunk.size()) {
            out.cancelWriting();
            if (errorString) *errorString = QStringLiteral("Write error on %1: %2").arg(dst, out.errorString());
            return false;
        }
    }
    if (!out.commit()) {
        if (errorString) *errorString = QStringLiteral("Cannot replace %1: %2").arg(dst, out.errorString());
        return false;
    }
    return true;
}

RestoreResult BackupManager::restore(const BackupManifest& manifest, bool overwrite)
{
    RestoreResult result;
    for (const BackupEntry& e : manifest.entries) {
        auto fail = [&](const QString& msg) {
            ++result.failed;
            result.errors.append({ e.originalPath, CurationError::IOError, msg });
            qWarning() << "[Backup] Restore failed:" << msg;
        };

        if (QFileInfo::exists(e.originalPath) && !overwrite) {
            ++result.skipped;
            continue;
        }

        // The original is only replaced once the backup proves intact.
        QString err;
        const QString sum = sha256File(e.backupPath, &err);
        if (sum.isEmpty()) {
            fail(err);
            continue;
        }
        if (!e.checksum.isEmpty() && sum != e.checksum) {
            fail(QStringLiteral("Checksum mismatch for backup %1").arg(e.backupPath));
            continue;
        }

        QDir().mkpath(QFileInfo(e.originalPath).absolutePath());
        if (!writeOver(e.backupPath, e.originalPath, &err)) {
            fail(err);
            continue;
        }
        ++result.restored;
    }

    qDebug() << "[Backup] Restore of" << manifest.backupId << "-" << result.restored << "restored,"
             << result.skipped << "skipped," << result.failed << "failed";
    return result;
}
