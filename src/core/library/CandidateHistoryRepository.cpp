#include "CandidateHistoryRepository.h"
#include "DatabaseContext.h"

#include <QSqlQuery>
#include <QSqlError>
#include <QDebug>
#include <QMutexLocker>

CandidateHistoryRepository::CandidateHistoryRepository(DatabaseContext* ctx)
    : m_ctx(ctx)
{
}

bool CandidateHistoryRepository::addFile(const QString& filename, const QString& sourcePath, bool* added)
{
    if (added) *added = false;
    if (filename.isEmpty())
        return false;

    QMutexLocker lock(m_ctx->writeMutex);
    QSqlQuery q(*m_ctx->writeDb);
    q.prepare(QStringLiteral(
        "INSERT OR IGNORE INTO candidate_history (filename, added_at, source_path) "
        "VALUES (?, ?, ?)"));
    q.addBindValue(filename);
    q.addBindValue(DatabaseContext::nowIso());
    q.addBindValue(sourcePath);
    if (!q.exec()) {
        qWarning() << "[Catalog] candidate_history insert failed:" << q.lastError().text();
        return false;
    }
    if (added) *added = q.numRowsAffected() > 0;
    return true;
}

std::optional<QDateTime> CandidateHistoryRepository::reviewedAt(const QString& filename) const
{
    QMutexLocker lock(m_ctx->readMutex);
    QSqlQuery q(*m_ctx->readDb);
    q.prepare(QStringLiteral("SELECT added_at FROM candidate_history WHERE filename = ?"));
    q.addBindValue(filename);
    if (!q.exec()) {
        qWarning() << "[Catalog] candidate_history lookup failed:" << q.lastError().text();
        return std::nullopt;
    }
    if (!q.next())
        return std::nullopt;
    return DatabaseContext::fromIso(q.value(0).toString());
}

CandidateHistoryStats CandidateHistoryRepository::stats() const
{
    QMutexLocker lock(m_ctx->readMutex);
    CandidateHistoryStats s;
    QSqlQuery q(*m_ctx->readDb);
    if (!q.exec(QStringLiteral("SELECT COUNT(*), MAX(added_at) FROM candidate_history")) || !q.next()) {
        qWarning() << "[Catalog] candidate_history stats failed:" << q.lastError().text();
        return s;
    }
    s.totalFiles = q.value(0).toInt();
    if (!q.value(1).isNull())
        s.lastAdded = DatabaseContext::fromIso(q.value(1).toString());
    return s;
}

bool CandidateHistoryRepository::clearAll()
{
    QMutexLocker lock(m_ctx->writeMutex);
    QSqlQuery q(*m_ctx->writeDb);
    if (!q.exec(QStringLiteral("DELETE FROM candidate_history"))) {
        qWarning() << "[Catalog] clear candidate_history failed:" << q.lastError().text();
        return false;
    }
    return true;
}
