#pragma once

#include <QObject>
#include <QSqlDatabase>
#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QVector>
#include <QHash>
#include <QMutex>
#include <optional>

#include "../CatalogData.h"
#include "DatabaseContext.h"
#include "FileRepository.h"
#include "VettingHistoryRepository.h"
#include "CandidateHistoryRepository.h"

// Durable SQLite index of library files plus vetting history and index
// statistics. One instance per database file; pass it explicitly to every
// component that needs catalog access.
class LibraryCatalog : public QObject {
    Q_OBJECT

public:
    explicit LibraryCatalog(const QString& dbPath, QObject* parent = nullptr);
    ~LibraryCatalog() override;

    bool open(QString* errorString = nullptr);
    void close();
    bool isOpen() const;
    QString databasePath() const { return m_dbPath; }

    // ── Files ────────────────────────────────────────────────────────
    qint64 upsertFile(const LibraryFile& file, bool force = false,
                      UpsertOutcome* outcome = nullptr);
    std::optional<LibraryFile> fileById(qint64 id) const;
    std::optional<LibraryFile> fileByPath(const QString& filePath) const;
    QVector<LibraryFile> findByMetadataHash(const QString& hash, bool activeOnly = true) const;
    QVector<LibraryFile> findByContentHash(const QString& hash, bool activeOnly = true) const;
    QVector<LibraryFile> findCandidatesByArtist(const QString& artist) const;
    QVector<LibraryFile> allFiles(bool activeOnly = true) const;
    QHash<QString, QPair<qint64, qint64>> allFileMeta() const;  // path → (size, mtime)
    int fileCount(bool activeOnly = true) const;

    // ── Lifecycle ────────────────────────────────────────────────────
    bool markInactive(qint64 id);
    bool markActive(qint64 id);
    int  markInactiveByPaths(const QStringList& paths);
    int  purgeInactive();   // physical delete; not used by curation workflows

    // ── Statistics ───────────────────────────────────────────────────
    CatalogStatistics statistics() const;
    bool saveIndexStatistics(const CatalogStatistics& stats);

    // ── Vetting history ──────────────────────────────────────────────
    qint64 saveVettingSession(const VettingSession& session);
    QVector<VettingSession> vettingHistory(int limit = VettingHistoryRepository::kDefaultLimit) const;

    // ── Candidate history ────────────────────────────────────────────
    bool addReviewedFile(const QString& filename, const QString& sourcePath, bool* added = nullptr);
    std::optional<QDateTime> reviewedAt(const QString& filename) const;
    CandidateHistoryStats candidateHistoryStats() const;

    // ── Transaction helpers ──────────────────────────────────────────
    bool beginTransaction();
    bool commitTransaction();
    bool rollbackTransaction();

    // ── Maintenance ──────────────────────────────────────────────────
    bool checkIntegrity() const;
    bool optimize();
    void clearAllData();

    // ── Database backup / rollback ───────────────────────────────────
    bool createBackup();
    bool restoreFromBackup();
    bool hasBackup() const;
    QDateTime backupTimestamp() const;

signals:
    void catalogChanged();

private:
    bool openConnections(QString* errorString);
    bool createTables();
    void createIndexes();
    void migrateColumns();

    QSqlDatabase m_db;        // write connection (indexer, lifecycle updates)
    QSqlDatabase m_readDb;    // read connection (matching, statistics, history)
    QString m_dbPath;
    QString m_writeName;
    QString m_readName;
    mutable QRecursiveMutex m_writeMutex;
    mutable QRecursiveMutex m_readMutex;

    DatabaseContext m_ctx;
    FileRepository* m_fileRepo = nullptr;
    VettingHistoryRepository* m_historyRepo = nullptr;
    CandidateHistoryRepository* m_candidateRepo = nullptr;
};
