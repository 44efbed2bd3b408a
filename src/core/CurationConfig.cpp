#include "CurationConfig.h"

#include <QThread>

QString scanModeName(ScanMode mode)
{
    switch (mode) {
    case ScanMode::Quick:  return QStringLiteral("quick");
    case ScanMode::Deep:   return QStringLiteral("deep");
    case ScanMode::Custom: return QStringLiteral("custom");
    }
    return QStringLiteral("deep");
}

ScanMode scanModeFromName(const QString& name, bool* ok)
{
    const QString n = name.trimmed().toLower();
    if (ok) *ok = true;
    if (n == QLatin1String("quick"))  return ScanMode::Quick;
    if (n == QLatin1String("deep"))   return ScanMode::Deep;
    if (n == QLatin1String("custom")) return ScanMode::Custom;
    if (ok) *ok = false;
    return ScanMode::Deep;
}

CurationConfig CurationConfig::forMode(ScanMode mode)
{
    CurationConfig c;
    c.mode = mode;
    switch (mode) {
    case ScanMode::Quick:
        c.threshold = 0.9;
        c.useContentHash = false;
        c.thoroughGrouping = false;
        break;
    case ScanMode::Deep:
        c.threshold = 0.8;
        c.useContentHash = true;
        c.thoroughGrouping = true;
        break;
    case ScanMode::Custom:
        c.threshold = 0.85;
        c.useContentHash = true;
        c.thoroughGrouping = false;
        break;
    }
    return c;
}

bool CurationConfig::validate(QString* errorString) const
{
    auto fail = [errorString](const QString& msg) {
        if (errorString) *errorString = msg;
        return false;
    };

    if (threshold < 0.0 || threshold > 1.0)
        return fail(QStringLiteral("threshold must be within [0, 1], got %1").arg(threshold));
    if (uncertainFloor < 0.0 || uncertainFloor > threshold)
        return fail(QStringLiteral("uncertainFloor must be within [0, threshold], got %1")
                        .arg(uncertainFloor));
    if (workerThreads < 0)
        return fail(QStringLiteral("workerThreads must not be negative"));
    if (batchSize <= 0)
        return fail(QStringLiteral("batchSize must be positive"));
    if (historyLimit < 1 || historyLimit > 1000)
        return fail(QStringLiteral("historyLimit must be within [1, 1000], got %1")
                        .arg(historyLimit));
    if (minFreeSpaceMarginBytes < 0)
        return fail(QStringLiteral("minFreeSpaceMarginBytes must not be negative"));
    if (weights.referenceBitrateKbps <= 0 || weights.standardSampleRateHz <= 0)
        return fail(QStringLiteral("quality weights need positive reference bitrate and sample rate"));

    if (errorString) errorString->clear();
    return true;
}

int CurationConfig::effectiveWorkerThreads() const
{
    if (workerThreads > 0)
        return workerThreads;
    return qMax(1, QThread::idealThreadCount());
}
