#pragma once
#include <QDateTime>
#include <QString>
#include <optional>
#include "../CatalogData.h"

struct DatabaseContext;

// Filenames already reviewed in an earlier import session, keyed by bare
// filename so a re-downloaded copy in another folder is still recognised.
class CandidateHistoryRepository {
public:
    explicit CandidateHistoryRepository(DatabaseContext* ctx);

    // false on a store error. *added is false when the filename was
    // already recorded.
    bool addFile(const QString& filename, const QString& sourcePath, bool* added = nullptr);
    std::optional<QDateTime> reviewedAt(const QString& filename) const;
    CandidateHistoryStats stats() const;
    bool clearAll();

private:
    DatabaseContext* m_ctx;
};
