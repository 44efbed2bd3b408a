#pragma once

#include <QHash>
#include <QPair>
#include <QVector>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <optional>
#include "../CatalogData.h"

struct DatabaseContext;

enum class UpsertOutcome {
    Inserted,
    Updated,
    Unchanged,
    Reactivated,   // unchanged on disk, row was Inactive
    Failed
};

class FileRepository {
public:
    explicit FileRepository(DatabaseContext* ctx);

    // ── Existence / metadata ─────────────────────────────────────────
    bool fileExists(const QString& filePath) const;
    QHash<QString, QPair<qint64, qint64>> allFileMeta() const;  // path -> (size, mtime)

    // ── Writes ───────────────────────────────────────────────────────
    qint64 upsertFile(const LibraryFile& file, bool force, UpsertOutcome* outcome);
    bool setState(qint64 id, LifecycleState state);
    int  markInactiveByPaths(const QStringList& paths);
    int  purgeInactive();
    bool clearAll();

    // ── Queries ──────────────────────────────────────────────────────
    std::optional<LibraryFile> fileById(qint64 id) const;
    std::optional<LibraryFile> fileByPath(const QString& filePath) const;
    QVector<LibraryFile> findByMetadataHash(const QString& hash, bool activeOnly) const;
    QVector<LibraryFile> findByContentHash(const QString& hash, bool activeOnly) const;
    QVector<LibraryFile> findCandidatesByArtist(const QString& artist) const;
    QVector<LibraryFile> allFiles(bool activeOnly) const;
    int fileCount(bool activeOnly) const;

private:
    QVector<LibraryFile> selectFiles(const QString& where, const QVariantList& binds) const;

    DatabaseContext* m_ctx;
};
