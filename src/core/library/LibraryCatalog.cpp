#include "LibraryCatalog.h"
#include "HashCalculator.h"

#include <QSqlQuery>
#include <QSqlRecord>
#include <QSqlError>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QDebug>
#include <QVariant>
#include <QElapsedTimer>
#include <QJsonDocument>
#include <QJsonObject>
#include <atomic>

static std::atomic<int> s_connectionCounter{0};

LibraryCatalog::LibraryCatalog(const QString& dbPath, QObject* parent)
    : QObject(parent)
    , m_dbPath(dbPath)
{
    const int n = ++s_connectionCounter;
    m_writeName = QStringLiteral("catalog_write_%1").arg(n);
    m_readName  = QStringLiteral("catalog_read_%1").arg(n);

    m_ctx.writeDb = &m_db;
    m_ctx.readDb = &m_readDb;
    m_ctx.writeMutex = &m_writeMutex;
    m_ctx.readMutex = &m_readMutex;

    m_fileRepo = new FileRepository(&m_ctx);
    m_historyRepo = new VettingHistoryRepository(&m_ctx);
    m_candidateRepo = new CandidateHistoryRepository(&m_ctx);
}

LibraryCatalog::~LibraryCatalog()
{
    close();
    delete m_fileRepo;
    delete m_historyRepo;
    delete m_candidateRepo;
}

// ── open / close ────────────────────────────────────────────────────
bool LibraryCatalog::openConnections(QString* errorString)
{
    m_db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), m_writeName);
    m_db.setDatabaseName(m_dbPath);
    if (!m_db.open()) {
        const QString msg = QStringLiteral("Failed to open write connection: %1")
                                .arg(m_db.lastError().text());
        qWarning() << "[Catalog]" << msg;
        if (errorString) *errorString = msg;
        return false;
    }

    QSqlQuery pragma(m_db);
    if (pragma.exec(QStringLiteral("PRAGMA journal_mode=WAL")) && pragma.next()) {
        QString mode = pragma.value(0).toString().toLower();
        if (mode != QStringLiteral("wal"))
            qWarning() << "[Catalog] WAL mode not activated, got:" << mode;
    }
    pragma.exec(QStringLiteral("PRAGMA synchronous=NORMAL"));
    pragma.exec(QStringLiteral("PRAGMA cache_size=-16384"));     // 16MB page cache
    pragma.exec(QStringLiteral("PRAGMA temp_store=MEMORY"));
    pragma.exec(QStringLiteral("PRAGMA busy_timeout=5000"));

    // Read connection, separate from the writer for WAL concurrency
    m_readDb = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), m_readName);
    m_readDb.setDatabaseName(m_dbPath);
    if (!m_readDb.open()) {
        const QString msg = QStringLiteral("Failed to open read connection: %1")
                                .arg(m_readDb.lastError().text());
        qWarning() << "[Catalog]" << msg;
        if (errorString) *errorString = msg;
        return false;
    }

    QSqlQuery readPragma(m_readDb);
    readPragma.exec(QStringLiteral("PRAGMA journal_mode=WAL"));
    readPragma.exec(QStringLiteral("PRAGMA cache_size=-16384"));
    readPragma.exec(QStringLiteral("PRAGMA temp_store=MEMORY"));
    readPragma.exec(QStringLiteral("PRAGMA busy_timeout=5000"));
    readPragma.exec(QStringLiteral("PRAGMA query_only=ON"));
    return true;
}

bool LibraryCatalog::open(QString* errorString)
{
    QMutexLocker writeLock(&m_writeMutex);
    QMutexLocker readLock(&m_readMutex);
    if (m_db.isOpen()) return true;

    QFileInfo dbInfo(m_dbPath);
    if (!QDir().mkpath(dbInfo.absolutePath())) {
        const QString msg = QStringLiteral("Cannot create catalog directory %1")
                                .arg(dbInfo.absolutePath());
        qWarning() << "[Catalog]" << msg;
        if (errorString) *errorString = msg;
        return false;
    }

    if (!openConnections(errorString))
        return false;

    // Integrity check, detect corruption early. A file that is not a
    // database at all fails the pragma itself.
    QString integrity;
    {
        QSqlQuery check(m_readDb);
        if (check.exec(QStringLiteral("PRAGMA quick_check")) && check.next())
            integrity = check.value(0).toString();
        else
            integrity = check.lastError().text();
    }

    if (integrity != QStringLiteral("ok")) {
        qWarning() << "[Catalog] Integrity check FAILED:" << integrity;
        m_readDb.close();
        m_db.close();
        QString corruptPath = m_dbPath + QStringLiteral(".corrupt.")
            + QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd_HHmmss"));
        if (!QFile::rename(m_dbPath, corruptPath)) {
            const QString msg = QStringLiteral("Catalog is corrupt and could not be moved aside: %1")
                                    .arg(m_dbPath);
            qWarning() << "[Catalog]" << msg;
            if (errorString) *errorString = msg;
            return false;
        }
        QFile::remove(m_dbPath + QStringLiteral("-wal"));
        QFile::remove(m_dbPath + QStringLiteral("-shm"));
        qWarning() << "[Catalog] Corrupt DB moved to:" << corruptPath;

        // Reopen; a fresh store is created and the next index pass repopulates it
        if (!m_db.open() || !m_readDb.open()) {
            const QString msg = QStringLiteral("Failed to reopen catalog after corruption");
            qWarning() << "[Catalog]" << msg;
            if (errorString) *errorString = msg;
            return false;
        }
        QSqlQuery p2(m_db);
        p2.exec(QStringLiteral("PRAGMA journal_mode=WAL"));
        p2.exec(QStringLiteral("PRAGMA synchronous=NORMAL"));
        QSqlQuery r2(m_readDb);
        r2.exec(QStringLiteral("PRAGMA query_only=ON"));
    } else {
        qDebug() << "[Catalog] Integrity check: OK";
    }

    if (!createTables()) {
        if (errorString) *errorString = QStringLiteral("Failed to create catalog tables");
        return false;
    }
    migrateColumns();
    createIndexes();

    qDebug() << "[Catalog] Opened at" << m_dbPath;
    return true;
}

void LibraryCatalog::close()
{
    bool readWasOpen = false, writeWasOpen = false;
    {
        QMutexLocker lock(&m_readMutex);
        if (m_readDb.isOpen()) {
            m_readDb.close();
            readWasOpen = true;
        }
        m_readDb = QSqlDatabase();  // drop reference before removeDatabase
    }
    {
        QMutexLocker lock(&m_writeMutex);
        if (m_db.isOpen()) {
            m_db.close();
            writeWasOpen = true;
        }
        m_db = QSqlDatabase();
    }
    if (readWasOpen)
        QSqlDatabase::removeDatabase(m_readName);
    if (writeWasOpen)
        QSqlDatabase::removeDatabase(m_writeName);
}

bool LibraryCatalog::isOpen() const
{
    QMutexLocker lock(&m_writeMutex);
    return m_db.isOpen();
}

// ── Schema ──────────────────────────────────────────────────────────
bool LibraryCatalog::createTables()
{
    QSqlQuery q(m_db);

    bool ok = q.exec(QStringLiteral(
        "CREATE TABLE IF NOT EXISTS library_index ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  file_path TEXT UNIQUE NOT NULL,"
        "  filename TEXT NOT NULL,"
        "  artist TEXT,"
        "  artist_key TEXT,"
        "  title TEXT,"
        "  album TEXT,"
        "  year INTEGER,"
        "  duration REAL,"
        "  file_format TEXT NOT NULL,"
        "  bitrate INTEGER DEFAULT 0,"
        "  variable_bitrate INTEGER DEFAULT 0,"
        "  sample_rate INTEGER DEFAULT 0,"
        "  file_size INTEGER NOT NULL,"
        "  metadata_hash TEXT NOT NULL,"
        "  file_content_hash TEXT,"
        "  indexed_at TEXT NOT NULL,"
        "  file_mtime INTEGER NOT NULL,"
        "  last_verified TEXT,"
        "  is_active INTEGER DEFAULT 1"
        ")"
    ));

    ok = q.exec(QStringLiteral(
        "CREATE TABLE IF NOT EXISTS vetting_history ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  import_folder TEXT NOT NULL,"
        "  total_files INTEGER,"
        "  duplicates_found INTEGER,"
        "  new_songs INTEGER,"
        "  uncertain_matches INTEGER,"
        "  previously_reviewed INTEGER DEFAULT 0,"
        "  error_count INTEGER DEFAULT 0,"
        "  threshold_used REAL,"
        "  stopped INTEGER DEFAULT 0,"
        "  vetted_at TEXT NOT NULL"
        ")"
    )) && ok;

    ok = q.exec(QStringLiteral(
        "CREATE TABLE IF NOT EXISTS candidate_history ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  filename TEXT NOT NULL UNIQUE,"
        "  added_at TEXT NOT NULL,"
        "  source_path TEXT"
        ")"
    )) && ok;

    ok = q.exec(QStringLiteral(
        "CREATE TABLE IF NOT EXISTS library_stats ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  total_files INTEGER,"
        "  total_size INTEGER,"
        "  formats_breakdown TEXT,"
        "  artists_count INTEGER,"
        "  albums_count INTEGER,"
        "  last_index_time TEXT,"
        "  index_duration REAL,"
        "  created_at TEXT"
        ")"
    )) && ok;

    if (!ok)
        qWarning() << "[Catalog] createTables failed:" << q.lastError().text();
    return ok;
}

void LibraryCatalog::createIndexes()
{
    QSqlQuery q(m_db);
    const QStringList statements = {
        QStringLiteral("CREATE INDEX IF NOT EXISTS idx_metadata_hash ON library_index(metadata_hash)"),
        QStringLiteral("CREATE INDEX IF NOT EXISTS idx_content_hash ON library_index(file_content_hash)"),
        QStringLiteral("CREATE INDEX IF NOT EXISTS idx_artist_key ON library_index(artist_key)"),
        QStringLiteral("CREATE INDEX IF NOT EXISTS idx_is_active ON library_index(is_active)"),
        QStringLiteral("CREATE INDEX IF NOT EXISTS idx_active_metadata ON library_index(is_active, metadata_hash)"),
        QStringLiteral("CREATE INDEX IF NOT EXISTS idx_active_content ON library_index(is_active, file_content_hash)"),
        QStringLiteral("CREATE INDEX IF NOT EXISTS idx_artist_title ON library_index(artist, title)"),
        QStringLiteral("CREATE INDEX IF NOT EXISTS idx_file_format ON library_index(file_format)"),
        QStringLiteral("CREATE INDEX IF NOT EXISTS idx_vetting_history_date ON vetting_history(vetted_at DESC)"),
        QStringLiteral("CREATE INDEX IF NOT EXISTS idx_candidate_filename ON candidate_history(filename)"),
    };
    for (const QString& sql : statements) {
        if (!q.exec(sql))
            qWarning() << "[Catalog] Index creation failed:" << q.lastError().text();
    }
}

// Stores created by older tool versions lack the stream-property and
// artist_key columns.
void LibraryCatalog::migrateColumns()
{
    auto columnsOf = [this](const QString& table) {
        QStringList cols;
        QSqlQuery pragma(m_db);
        pragma.exec(QStringLiteral("PRAGMA table_info(%1)").arg(table));
        while (pragma.next())
            cols.append(pragma.value(1).toString());
        return cols;
    };

    auto addColumnIfMissing = [this](const QStringList& existing, const QString& table,
                                     const QString& column, const QString& decl) {
        if (existing.contains(column)) return;
        QSqlQuery alter(m_db);
        if (alter.exec(QStringLiteral("ALTER TABLE %1 ADD COLUMN %2 %3").arg(table, column, decl)))
            qDebug() << "[Catalog] Added column" << table << column;
        else
            qWarning() << "[Catalog] Failed to add column" << column << alter.lastError().text();
    };

    const QStringList indexCols = columnsOf(QStringLiteral("library_index"));
    addColumnIfMissing(indexCols, QStringLiteral("library_index"), QStringLiteral("artist_key"), QStringLiteral("TEXT"));
    addColumnIfMissing(indexCols, QStringLiteral("library_index"), QStringLiteral("bitrate"), QStringLiteral("INTEGER DEFAULT 0"));
    addColumnIfMissing(indexCols, QStringLiteral("library_index"), QStringLiteral("variable_bitrate"), QStringLiteral("INTEGER DEFAULT 0"));
    addColumnIfMissing(indexCols, QStringLiteral("library_index"), QStringLiteral("sample_rate"), QStringLiteral("INTEGER DEFAULT 0"));

    const QStringList historyCols = columnsOf(QStringLiteral("vetting_history"));
    addColumnIfMissing(historyCols, QStringLiteral("vetting_history"), QStringLiteral("error_count"), QStringLiteral("INTEGER DEFAULT 0"));
    addColumnIfMissing(historyCols, QStringLiteral("vetting_history"), QStringLiteral("previously_reviewed"), QStringLiteral("INTEGER DEFAULT 0"));
    addColumnIfMissing(historyCols, QStringLiteral("vetting_history"), QStringLiteral("stopped"), QStringLiteral("INTEGER DEFAULT 0"));

    if (!indexCols.contains(QStringLiteral("artist_key"))) {
        // Backfill keys from existing artist values
        QSqlQuery sel(m_db);
        if (!sel.exec(QStringLiteral("SELECT id, artist FROM library_index"))) {
            qWarning() << "[Catalog] artist_key backfill read failed:" << sel.lastError().text();
            return;
        }
        QVector<QPair<qint64, QString>> rows;
        while (sel.next())
            rows.append({ sel.value(0).toLongLong(), sel.value(1).toString() });
        m_db.transaction();
        for (const auto& row : rows) {
            QSqlQuery upd(m_db);
            upd.prepare(QStringLiteral("UPDATE library_index SET artist_key = ? WHERE id = ?"));
            upd.addBindValue(HashCalculator::normalizeArtistKey(row.second));
            upd.addBindValue(row.first);
            if (!upd.exec()) {
                qWarning() << "[Catalog] artist_key backfill failed:" << upd.lastError().text();
                m_db.rollback();
                return;
            }
        }
        if (!m_db.commit()) {
            qWarning() << "[Catalog] artist_key backfill commit failed:" << m_db.lastError().text();
            return;
        }
        qDebug() << "[Catalog] Backfilled artist_key for" << rows.size() << "rows";
    }
}

// ── Files ───────────────────────────────────────────────────────────
qint64 LibraryCatalog::upsertFile(const LibraryFile& file, bool force, UpsertOutcome* outcome)
{
    return m_fileRepo->upsertFile(file, force, outcome);
}

std::optional<LibraryFile> LibraryCatalog::fileById(qint64 id) const { return m_fileRepo->fileById(id); }
std::optional<LibraryFile> LibraryCatalog::fileByPath(const QString& filePath) const { return m_fileRepo->fileByPath(filePath); }

QVector<LibraryFile> LibraryCatalog::findByMetadataHash(const QString& hash, bool activeOnly) const
{
    return m_fileRepo->findByMetadataHash(hash, activeOnly);
}

QVector<LibraryFile> LibraryCatalog::findByContentHash(const QString& hash, bool activeOnly) const
{
    return m_fileRepo->findByContentHash(hash, activeOnly);
}

QVector<LibraryFile> LibraryCatalog::findCandidatesByArtist(const QString& artist) const
{
    return m_fileRepo->findCandidatesByArtist(artist);
}

QVector<LibraryFile> LibraryCatalog::allFiles(bool activeOnly) const { return m_fileRepo->allFiles(activeOnly); }
QHash<QString, QPair<qint64, qint64>> LibraryCatalog::allFileMeta() const { return m_fileRepo->allFileMeta(); }
int LibraryCatalog::fileCount(bool activeOnly) const { return m_fileRepo->fileCount(activeOnly); }

// ── Lifecycle ───────────────────────────────────────────────────────
bool LibraryCatalog::markInactive(qint64 id) { return m_fileRepo->setState(id, LifecycleState::Inactive); }
bool LibraryCatalog::markActive(qint64 id) { return m_fileRepo->setState(id, LifecycleState::Active); }
int LibraryCatalog::markInactiveByPaths(const QStringList& paths) { return m_fileRepo->markInactiveByPaths(paths); }

int LibraryCatalog::purgeInactive()
{
    int removed = m_fileRepo->purgeInactive();
    if (removed > 0)
        emit catalogChanged();
    return removed;
}

// ── Statistics ──────────────────────────────────────────────────────
CatalogStatistics LibraryCatalog::statistics() const
{
    QMutexLocker lock(&m_readMutex);
    CatalogStatistics stats;
    QSqlQuery q(m_readDb);

    if (q.exec(QStringLiteral(
            "SELECT COUNT(*), COALESCE(SUM(file_size), 0) FROM library_index WHERE is_active = 1"))
        && q.next()) {
        stats.totalFiles = q.value(0).toInt();
        stats.totalSize  = q.value(1).toLongLong();
    } else {
        qWarning() << "[Catalog] statistics totals failed:" << q.lastError().text();
    }

    if (q.exec(QStringLiteral(
            "SELECT file_format, COUNT(*) FROM library_index WHERE is_active = 1 "
            "GROUP BY file_format"))) {
        while (q.next())
            stats.formatBreakdown.insert(q.value(0).toString(), q.value(1).toInt());
    }

    if (q.exec(QStringLiteral(
            "SELECT COUNT(DISTINCT artist) FROM library_index "
            "WHERE is_active = 1 AND artist IS NOT NULL AND artist != ''")) && q.next())
        stats.uniqueArtists = q.value(0).toInt();

    if (q.exec(QStringLiteral(
            "SELECT COUNT(DISTINCT album) FROM library_index "
            "WHERE is_active = 1 AND album IS NOT NULL AND album != ''")) && q.next())
        stats.uniqueAlbums = q.value(0).toInt();

    if (q.exec(QStringLiteral("SELECT COUNT(*) FROM library_index WHERE is_active = 0")) && q.next())
        stats.inactiveFiles = q.value(0).toInt();

    if (q.exec(QStringLiteral(
            "SELECT last_index_time, index_duration FROM library_stats "
            "ORDER BY created_at DESC, id DESC LIMIT 1")) && q.next()) {
        stats.lastIndexedAt = DatabaseContext::fromIso(q.value(0).toString());
        stats.lastIndexDuration = q.value(1).toDouble();
    }

    return stats;
}

bool LibraryCatalog::saveIndexStatistics(const CatalogStatistics& stats)
{
    QJsonObject formats;
    for (auto it = stats.formatBreakdown.constBegin(); it != stats.formatBreakdown.constEnd(); ++it)
        formats.insert(it.key(), it.value());

    QMutexLocker lock(&m_writeMutex);
    QSqlQuery q(m_db);
    q.prepare(QStringLiteral(
        "INSERT INTO library_stats ("
        "  total_files, total_size, formats_breakdown, artists_count, albums_count, "
        "  last_index_time, index_duration, created_at"
        ") VALUES (?, ?, ?, ?, ?, ?, ?, ?)"));
    q.addBindValue(stats.totalFiles);
    q.addBindValue(stats.totalSize);
    q.addBindValue(QString::fromUtf8(QJsonDocument(formats).toJson(QJsonDocument::Compact)));
    q.addBindValue(stats.uniqueArtists);
    q.addBindValue(stats.uniqueAlbums);
    q.addBindValue(DatabaseContext::toIso(stats.lastIndexedAt));
    q.addBindValue(stats.lastIndexDuration);
    q.addBindValue(DatabaseContext::nowIso());
    if (!q.exec()) {
        qWarning() << "[Catalog] saveIndexStatistics failed:" << q.lastError().text();
        return false;
    }
    return true;
}

// ── Vetting history ─────────────────────────────────────────────────
qint64 LibraryCatalog::saveVettingSession(const VettingSession& session)
{
    return m_historyRepo->insertSession(session);
}

QVector<VettingSession> LibraryCatalog::vettingHistory(int limit) const
{
    return m_historyRepo->history(limit);
}

// ── Candidate history ───────────────────────────────────────────────
bool LibraryCatalog::addReviewedFile(const QString& filename, const QString& sourcePath, bool* added)
{
    return m_candidateRepo->addFile(filename, sourcePath, added);
}

std::optional<QDateTime> LibraryCatalog::reviewedAt(const QString& filename) const
{
    return m_candidateRepo->reviewedAt(filename);
}

CandidateHistoryStats LibraryCatalog::candidateHistoryStats() const
{
    return m_candidateRepo->stats();
}

// ── Transaction helpers ─────────────────────────────────────────────
bool LibraryCatalog::beginTransaction() { QMutexLocker lock(&m_writeMutex); return m_db.transaction(); }
bool LibraryCatalog::commitTransaction() { QMutexLocker lock(&m_writeMutex); return m_db.commit(); }
bool LibraryCatalog::rollbackTransaction() { QMutexLocker lock(&m_writeMutex); return m_db.rollback(); }

// ── Maintenance ─────────────────────────────────────────────────────
bool LibraryCatalog::checkIntegrity() const
{
    QMutexLocker lock(&m_readMutex);
    QSqlQuery q(m_readDb);
    if (!q.exec(QStringLiteral("PRAGMA integrity_check")) || !q.next()) {
        qWarning() << "[Catalog] integrity_check failed:" << q.lastError().text();
        return false;
    }
    const QString result = q.value(0).toString();
    if (result != QStringLiteral("ok")) {
        qWarning() << "[Catalog] Integrity check FAILED:" << result;
        return false;
    }
    return true;
}

bool LibraryCatalog::optimize()
{
    QMutexLocker lock(&m_writeMutex);
    QElapsedTimer t; t.start();
    QSqlQuery q(m_db);
    if (!q.exec(QStringLiteral("VACUUM"))) {
        qWarning() << "[Catalog] VACUUM failed:" << q.lastError().text();
        return false;
    }
    qDebug() << "[TIMING] VACUUM:" << t.elapsed() << "ms";
    return true;
}

void LibraryCatalog::clearAllData()
{
    {
        QMutexLocker lock(&m_writeMutex);
        m_fileRepo->clearAll();
        m_historyRepo->clearAll();
        m_candidateRepo->clearAll();
        QSqlQuery q(m_db);
        if (!q.exec(QStringLiteral("DELETE FROM library_stats")))
            qWarning() << "[Catalog] clear library_stats failed:" << q.lastError().text();
    }
    emit catalogChanged();
}

// ── Database backup / rollback ──────────────────────────────────────
bool LibraryCatalog::createBackup()
{
    QMutexLocker lock(&m_writeMutex);
    QString backupFile = m_dbPath + QStringLiteral(".backup");

    // Fold the WAL into the main file so the copy is self-contained
    QSqlQuery q(m_db);
    if (!q.exec(QStringLiteral("PRAGMA wal_checkpoint(TRUNCATE)")))
        qWarning() << "[Catalog] wal_checkpoint failed:" << q.lastError().text();

    if (QFile::exists(backupFile))
        QFile::remove(backupFile);

    bool ok = QFile::copy(m_dbPath, backupFile);
    if (ok)
        qDebug() << "[Catalog] Backup created:" << backupFile;
    else
        qWarning() << "[Catalog] Backup FAILED for" << m_dbPath;
    return ok;
}

bool LibraryCatalog::restoreFromBackup()
{
    QString backupFile = m_dbPath + QStringLiteral(".backup");
    if (!QFile::exists(backupFile)) {
        qWarning() << "[Catalog] No backup found at" << backupFile;
        return false;
    }

    close();

    QFile::remove(m_dbPath + QStringLiteral("-wal"));
    QFile::remove(m_dbPath + QStringLiteral("-shm"));
    QFile::remove(m_dbPath);
    bool ok = QFile::copy(backupFile, m_dbPath);

    QString error;
    if (!open(&error)) {
        qWarning() << "[Catalog] Reopen after restore failed:" << error;
        return false;
    }

    if (ok) {
        qDebug() << "[Catalog] Restored from backup";
        emit catalogChanged();
    } else {
        qWarning() << "[Catalog] Restore FAILED";
    }
    return ok;
}

bool LibraryCatalog::hasBackup() const
{
    return QFile::exists(m_dbPath + QStringLiteral(".backup"));
}

QDateTime LibraryCatalog::backupTimestamp() const
{
    QFileInfo info(m_dbPath + QStringLiteral(".backup"));
    return info.exists() ? info.lastModified() : QDateTime();
}
