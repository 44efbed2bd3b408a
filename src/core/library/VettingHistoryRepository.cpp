#include "VettingHistoryRepository.h"
#include "DatabaseContext.h"

#include <QSqlQuery>
#include <QSqlError>
#include <QDebug>
#include <QMutexLocker>

VettingHistoryRepository::VettingHistoryRepository(DatabaseContext* ctx)
    : m_ctx(ctx)
{
}

qint64 VettingHistoryRepository::insertSession(const VettingSession& session)
{
    QMutexLocker lock(m_ctx->writeMutex);
    QSqlQuery q(*m_ctx->writeDb);
    q.prepare(QStringLiteral(
        "INSERT INTO vetting_history ("
        "  import_folder, total_files, duplicates_found, new_songs, "
        "  uncertain_matches, previously_reviewed, error_count, threshold_used, "
        "  stopped, vetted_at"
        ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)"));
    q.addBindValue(session.importFolder);
    q.addBindValue(session.fileCount);
    q.addBindValue(session.duplicateCount);
    q.addBindValue(session.newCount);
    q.addBindValue(session.uncertainCount);
    q.addBindValue(session.previouslyReviewedCount);
    q.addBindValue(session.errorCount);
    q.addBindValue(session.thresholdUsed);
    q.addBindValue(session.stopped ? 1 : 0);
    q.addBindValue(session.scannedAt.isValid()
        ? DatabaseContext::toIso(session.scannedAt) : DatabaseContext::nowIso());
    if (!q.exec()) {
        qWarning() << "[Catalog] insertSession failed:" << q.lastError().text();
        return 0;
    }
    return q.lastInsertId().toLongLong();
}

QVector<VettingSession> VettingHistoryRepository::history(int limit) const
{
    if (limit < 1 || limit > kMaxLimit) {
        qWarning() << "[Catalog] history limit" << limit << "out of range, clamping";
        limit = qBound(1, limit, kMaxLimit);
    }

    QMutexLocker lock(m_ctx->readMutex);
    QVector<VettingSession> result;
    QSqlQuery q(*m_ctx->readDb);
    q.prepare(QStringLiteral(
        "SELECT * FROM vetting_history ORDER BY vetted_at DESC, id DESC LIMIT ?"));
    q.addBindValue(limit);
    if (!q.exec()) {
        qWarning() << "[Catalog] history query failed:" << q.lastError().text();
        return result;
    }
    while (q.next())
        result.append(m_ctx->sessionFromQuery(q));
    return result;
}

int VettingHistoryRepository::sessionCount() const
{
    QMutexLocker lock(m_ctx->readMutex);
    QSqlQuery q(*m_ctx->readDb);
    if (q.exec(QStringLiteral("SELECT COUNT(*) FROM vetting_history")) && q.next())
        return q.value(0).toInt();
    return 0;
}

bool VettingHistoryRepository::clearAll()
{
    QMutexLocker lock(m_ctx->writeMutex);
    QSqlQuery q(*m_ctx->writeDb);
    if (!q.exec(QStringLiteral("DELETE FROM vetting_history"))) {
        qWarning() << "[Catalog] clear vetting_history failed:" << q.lastError().text();
        return false;
    }
    return true;
}
