#pragma once

#include <QString>
#include "CatalogData.h"

// Progress callbacks from the indexer, vetter and cleanup workflow.
// Called from the thread running the operation.
class ICurationEventSink {
public:
    virtual ~ICurationEventSink() = default;

    virtual void onFileProcessed(const QString& filePath, int current, int total) = 0;
    virtual void onGroupValidated(const QString& groupId, bool passed) = 0;
    virtual void onPhaseComplete(const QString& phase, qint64 elapsedMs) = 0;
};

class NullEventSink : public ICurationEventSink {
public:
    static NullEventSink* instance()
    {
        static NullEventSink s;
        return &s;
    }

    void onFileProcessed(const QString&, int, int) override {}
    void onGroupValidated(const QString&, bool) override {}
    void onPhaseComplete(const QString&, qint64) override {}
};
