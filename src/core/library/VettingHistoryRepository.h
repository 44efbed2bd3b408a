#pragma once
#include <QVector>
#include <QString>
#include "../CatalogData.h"

struct DatabaseContext;

class VettingHistoryRepository {
public:
    static constexpr int kDefaultLimit = 10;
    static constexpr int kMaxLimit = 1000;

    explicit VettingHistoryRepository(DatabaseContext* ctx);

    qint64 insertSession(const VettingSession& session);
    QVector<VettingSession> history(int limit = kDefaultLimit) const;
    int sessionCount() const;
    bool clearAll();

private:
    DatabaseContext* m_ctx;
};
