#pragma once

#include <QMutex>
#include <QMutexLocker>
#include <QStringList>
#include "ICurationEventSink.h"

class RecordingEventSink : public ICurationEventSink {
public:
    void onFileProcessed(const QString& filePath, int current, int total) override
    {
        QMutexLocker lock(&m_mutex);
        files.append(filePath);
        lastCurrent = current;
        lastTotal = total;
    }

    void onGroupValidated(const QString& groupId, bool passed) override
    {
        QMutexLocker lock(&m_mutex);
        (passed ? passedGroups : failedGroups).append(groupId);
    }

    void onPhaseComplete(const QString& phase, qint64) override
    {
        QMutexLocker lock(&m_mutex);
        phases.append(phase);
    }

    QStringList files;
    QStringList passedGroups;
    QStringList failedGroups;
    QStringList phases;
    int lastCurrent = 0;
    int lastTotal = 0;

private:
    QMutex m_mutex;
};
