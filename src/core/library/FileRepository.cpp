#include "FileRepository.h"
#include "DatabaseContext.h"
#include "HashCalculator.h"

#include <QSqlQuery>
#include <QSqlError>
#include <QFileInfo>
#include <QDebug>
#include <QElapsedTimer>
#include <QMutexLocker>

static const int kMarkInactiveChunk = 500;

// ── Constructor ──────────────────────────────────────────────────────
FileRepository::FileRepository(DatabaseContext* ctx)
    : m_ctx(ctx)
{
}

// ── Existence / metadata ─────────────────────────────────────────────
bool FileRepository::fileExists(const QString& filePath) const
{
    QMutexLocker lock(m_ctx->readMutex);
    QSqlQuery q(*m_ctx->readDb);
    q.prepare(QStringLiteral("SELECT COUNT(*) FROM library_index WHERE file_path = ?"));
    q.addBindValue(filePath);
    if (q.exec() && q.next()) {
        return q.value(0).toInt() > 0;
    }
    return false;
}

QHash<QString, QPair<qint64, qint64>> FileRepository::allFileMeta() const
{
    QMutexLocker lock(m_ctx->readMutex);
    QElapsedTimer t; t.start();
    QHash<QString, QPair<qint64, qint64>> result;
    QSqlQuery q(*m_ctx->readDb);
    if (!q.exec(QStringLiteral("SELECT file_path, file_size, file_mtime FROM library_index"))) {
        qWarning() << "[Catalog] allFileMeta failed:" << q.lastError().text();
        return result;
    }
    while (q.next()) {
        result.insert(q.value(0).toString(),
                      qMakePair(q.value(1).toLongLong(), q.value(2).toLongLong()));
    }
    qDebug() << "[TIMING] allFileMeta:" << result.size() << "entries in" << t.elapsed() << "ms";
    return result;
}

// ── Writes ───────────────────────────────────────────────────────────
qint64 FileRepository::upsertFile(const LibraryFile& file, bool force, UpsertOutcome* outcome)
{
    auto report = [outcome](UpsertOutcome o) { if (outcome) *outcome = o; };

    if (file.filePath.isEmpty()) {
        qWarning() << "[Catalog] upsertFile: empty file_path";
        report(UpsertOutcome::Failed);
        return 0;
    }

    QMutexLocker lock(m_ctx->writeMutex);
    QSqlDatabase& db = *m_ctx->writeDb;

    qint64 existingId = 0;
    qint64 storedSize = -1;
    qint64 storedMtime = -1;
    bool storedActive = true;
    {
        QSqlQuery q(db);
        q.prepare(QStringLiteral(
            "SELECT id, file_size, file_mtime, is_active FROM library_index WHERE file_path = ?"));
        q.addBindValue(file.filePath);
        if (!q.exec()) {
            qWarning() << "[Catalog] upsertFile lookup failed:" << q.lastError().text();
            report(UpsertOutcome::Failed);
            return 0;
        }
        if (q.next()) {
            existingId   = q.value(0).toLongLong();
            storedSize   = q.value(1).toLongLong();
            storedMtime  = q.value(2).toLongLong();
            storedActive = q.value(3).toInt() != 0;
        }
    }

    const QString now = DatabaseContext::nowIso();
    const QString filename = file.filename.isEmpty()
        ? QFileInfo(file.filePath).fileName() : file.filename;
    const QString metaHash = file.metadataHash.isEmpty()
        ? HashCalculator::metadataHash(file.artist, file.title) : file.metadataHash;
    const QString artistKey = HashCalculator::normalizeArtistKey(file.artist);
    QString format = file.fileFormat.isEmpty()
        ? QFileInfo(file.filePath).suffix().toLower() : file.fileFormat.toLower();
    if (format.isNull()) format = QStringLiteral("");

    if (existingId > 0 && !force
        && storedSize == file.fileSize && storedMtime == file.fileMtime) {
        if (storedActive) {
            report(UpsertOutcome::Unchanged);
            return existingId;
        }
        QSqlQuery q(db);
        q.prepare(QStringLiteral(
            "UPDATE library_index SET is_active = 1, last_verified = ? WHERE id = ?"));
        q.addBindValue(now);
        q.addBindValue(existingId);
        if (!q.exec()) {
            qWarning() << "[Catalog] reactivate failed:" << q.lastError().text();
            report(UpsertOutcome::Failed);
            return 0;
        }
        report(UpsertOutcome::Reactivated);
        return existingId;
    }

    QSqlQuery q(db);
    if (existingId > 0) {
        q.prepare(QStringLiteral(
            "UPDATE library_index SET "
            "  filename = ?, artist = ?, artist_key = ?, title = ?, album = ?, year = ?, "
            "  duration = ?, file_format = ?, bitrate = ?, variable_bitrate = ?, "
            "  sample_rate = ?, file_size = ?, metadata_hash = ?, file_content_hash = ?, "
            "  file_mtime = ?, last_verified = ?, is_active = 1 "
            "WHERE id = ?"));
    } else {
        q.prepare(QStringLiteral(
            "INSERT INTO library_index ("
            "  filename, artist, artist_key, title, album, year, "
            "  duration, file_format, bitrate, variable_bitrate, "
            "  sample_rate, file_size, metadata_hash, file_content_hash, "
            "  file_mtime, last_verified, is_active, file_path, indexed_at"
            ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, 1, ?, ?)"));
    }

    q.addBindValue(filename);
    q.addBindValue(file.artist);
    q.addBindValue(artistKey);
    q.addBindValue(file.title);
    q.addBindValue(file.album);
    q.addBindValue(file.year);
    q.addBindValue(file.duration);
    q.addBindValue(format);
    q.addBindValue(file.bitrate);
    q.addBindValue(file.variableBitrate ? 1 : 0);
    q.addBindValue(file.sampleRate);
    q.addBindValue(file.fileSize);
    q.addBindValue(metaHash);
    q.addBindValue(file.contentHash);
    q.addBindValue(file.fileMtime);
    q.addBindValue(now);
    if (existingId > 0) {
        q.addBindValue(existingId);
    } else {
        q.addBindValue(file.filePath);
        q.addBindValue(file.indexedAt.isValid() ? DatabaseContext::toIso(file.indexedAt) : now);
    }

    if (!q.exec()) {
        qWarning() << "[Catalog] upsertFile failed for" << file.filePath
                   << ":" << q.lastError().text();
        report(UpsertOutcome::Failed);
        return 0;
    }

    if (existingId > 0) {
        report(UpsertOutcome::Updated);
        return existingId;
    }
    report(UpsertOutcome::Inserted);
    return q.lastInsertId().toLongLong();
}

bool FileRepository::setState(qint64 id, LifecycleState state)
{
    QMutexLocker lock(m_ctx->writeMutex);
    QSqlQuery q(*m_ctx->writeDb);
    q.prepare(QStringLiteral(
        "UPDATE library_index SET is_active = ?, last_verified = ? WHERE id = ?"));
    q.addBindValue(state == LifecycleState::Active ? 1 : 0);
    q.addBindValue(DatabaseContext::nowIso());
    q.addBindValue(id);
    if (!q.exec()) {
        qWarning() << "[Catalog] setState failed:" << q.lastError().text();
        return false;
    }
    return q.numRowsAffected() > 0;
}

int FileRepository::markInactiveByPaths(const QStringList& paths)
{
    if (paths.isEmpty()) return 0;

    QMutexLocker lock(m_ctx->writeMutex);
    QSqlDatabase& db = *m_ctx->writeDb;
    QElapsedTimer t; t.start();

    if (!db.transaction()) {
        qWarning() << "[Catalog] markInactiveByPaths: transaction failed:" << db.lastError().text();
        return -1;
    }

    int marked = 0;
    const QString now = DatabaseContext::nowIso();
    for (int i = 0; i < paths.size(); i += kMarkInactiveChunk) {
        const QStringList chunk = paths.mid(i, kMarkInactiveChunk);
        QStringList placeholders;
        for (int j = 0; j < chunk.size(); ++j)
            placeholders << QStringLiteral("?");

        QSqlQuery q(db);
        q.prepare(QStringLiteral(
            "UPDATE library_index SET is_active = 0, last_verified = ? "
            "WHERE is_active = 1 AND file_path IN (%1)").arg(placeholders.join(QLatin1Char(','))));
        q.addBindValue(now);
        for (const QString& p : chunk)
            q.addBindValue(p);
        if (!q.exec()) {
            qWarning() << "[Catalog] markInactiveByPaths failed:" << q.lastError().text();
            db.rollback();
            return -1;
        }
        marked += q.numRowsAffected();
    }

    if (!db.commit()) {
        qWarning() << "[Catalog] markInactiveByPaths commit failed:" << db.lastError().text();
        db.rollback();
        return -1;
    }
    qDebug() << "[Catalog] Marked" << marked << "rows inactive in" << t.elapsed() << "ms";
    return marked;
}

int FileRepository::purgeInactive()
{
    QMutexLocker lock(m_ctx->writeMutex);
    QSqlQuery q(*m_ctx->writeDb);
    if (!q.exec(QStringLiteral("DELETE FROM library_index WHERE is_active = 0"))) {
        qWarning() << "[Catalog] purgeInactive failed:" << q.lastError().text();
        return -1;
    }
    int removed = q.numRowsAffected();
    qDebug() << "[Catalog] Purged" << removed << "inactive rows";
    return removed;
}

bool FileRepository::clearAll()
{
    QMutexLocker lock(m_ctx->writeMutex);
    QSqlQuery q(*m_ctx->writeDb);
    if (!q.exec(QStringLiteral("DELETE FROM library_index"))) {
        qWarning() << "[Catalog] clearAll failed:" << q.lastError().text();
        return false;
    }
    return true;
}

// ── Queries ──────────────────────────────────────────────────────────
QVector<LibraryFile> FileRepository::selectFiles(const QString& where,
                                                 const QVariantList& binds) const
{
    QMutexLocker lock(m_ctx->readMutex);
    QVector<LibraryFile> result;
    QSqlQuery q(*m_ctx->readDb);
    QString sql = QStringLiteral("SELECT %1 FROM library_index").arg(DatabaseContext::kFileColumns);
    if (!where.isEmpty())
        sql += QStringLiteral(" WHERE ") + where;
    sql += QStringLiteral(" ORDER BY id");
    q.prepare(sql);
    for (const QVariant& v : binds)
        q.addBindValue(v);
    if (!q.exec()) {
        qWarning() << "[Catalog] query failed:" << q.lastError().text() << sql;
        return result;
    }
    while (q.next())
        result.append(m_ctx->fileFromQuery(q));
    return result;
}

std::optional<LibraryFile> FileRepository::fileById(qint64 id) const
{
    auto rows = selectFiles(QStringLiteral("id = ?"), { id });
    if (rows.isEmpty()) return std::nullopt;
    return rows.first();
}

std::optional<LibraryFile> FileRepository::fileByPath(const QString& filePath) const
{
    auto rows = selectFiles(QStringLiteral("file_path = ?"), { filePath });
    if (rows.isEmpty()) return std::nullopt;
    return rows.first();
}

QVector<LibraryFile> FileRepository::findByMetadataHash(const QString& hash, bool activeOnly) const
{
    if (HashCalculator::isSentinel(hash)) return {};
    return selectFiles(activeOnly
        ? QStringLiteral("is_active = 1 AND metadata_hash = ?")
        : QStringLiteral("metadata_hash = ?"), { hash });
}

QVector<LibraryFile> FileRepository::findByContentHash(const QString& hash, bool activeOnly) const
{
    if (!HashCalculator::isUsableContentHash(hash)) return {};
    return selectFiles(activeOnly
        ? QStringLiteral("is_active = 1 AND file_content_hash = ?")
        : QStringLiteral("file_content_hash = ?"), { hash });
}

QVector<LibraryFile> FileRepository::findCandidatesByArtist(const QString& artist) const
{
    const QString key = HashCalculator::normalizeArtistKey(artist);
    if (key.isEmpty()) return {};
    return selectFiles(QStringLiteral("is_active = 1 AND artist_key = ?"), { key });
}

QVector<LibraryFile> FileRepository::allFiles(bool activeOnly) const
{
    return selectFiles(activeOnly ? QStringLiteral("is_active = 1") : QString(), {});
}

int FileRepository::fileCount(bool activeOnly) const
{
    QMutexLocker lock(m_ctx->readMutex);
    QSqlQuery q(*m_ctx->readDb);
    const QString sql = activeOnly
        ? QStringLiteral("SELECT COUNT(*) FROM library_index WHERE is_active = 1")
        : QStringLiteral("SELECT COUNT(*) FROM library_index");
    if (q.exec(sql) && q.next())
        return q.value(0).toInt();
    return 0;
}
