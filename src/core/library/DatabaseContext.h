#pragma once

#include <QSqlDatabase>
#include <QRecursiveMutex>
#include <QDateTime>
#include "../CatalogData.h"

class QSqlQuery;

// Shared database infrastructure passed to the repository classes.
// Holds pointers to the read/write connections and mutexes owned by
// LibraryCatalog, plus row-mapping helpers.
struct DatabaseContext {
    QSqlDatabase* writeDb = nullptr;
    QSqlDatabase* readDb = nullptr;
    QRecursiveMutex* writeMutex = nullptr;
    QRecursiveMutex* readMutex = nullptr;

    // Column list matching fileFromQuery()
    static const QString kFileColumns;

    LibraryFile fileFromQuery(const QSqlQuery& query) const;
    VettingSession sessionFromQuery(const QSqlQuery& query) const;

    static QString toIso(const QDateTime& dt);
    static QDateTime fromIso(const QString& text);
    static QString nowIso();
};
