#pragma once

#include <QString>
#include "library/QualityScorer.h"

enum class ScanMode {
    Quick,    // metadata-hash grouping, fuzzy threshold 0.9, no content hashing
    Deep,     // content hashing and thorough grouping, threshold 0.8
    Custom
};

QString scanModeName(ScanMode mode);
ScanMode scanModeFromName(const QString& name, bool* ok = nullptr);

// Everything the curation workflows read at run time. Defaults are the
// Deep preset; call validate() before handing a hand-built config to
// CurationService.
struct CurationConfig {
    ScanMode mode = ScanMode::Deep;

    // ── Matching ─────────────────────────────────────────────────────
    double threshold = 0.8;
    double uncertainFloor = 0.7;
    bool   useContentHash = true;
    bool   thoroughGrouping = true;

    // ── Vetting exports ──────────────────────────────────────────────
    bool    exportNew = true;
    bool    exportDuplicates = false;
    bool    exportUncertain = false;
    bool    exportPreviouslyReviewed = false;
    QString exportDir;           // empty: the vetted folder

    // ── Workers ──────────────────────────────────────────────────────
    int workerThreads = 0;       // 0: QThread::idealThreadCount()
    int batchSize = 100;

    // ── Cleanup ──────────────────────────────────────────────────────
    QString backupDir;
    QString reportsDir;
    bool    dryRun = false;
    qint64  minFreeSpaceMarginBytes = 100LL * 1024 * 1024;

    int historyLimit = 10;

    QualityWeights weights = QualityWeights::defaults();

    static CurationConfig forMode(ScanMode mode);

    bool validate(QString* errorString = nullptr) const;
    int effectiveWorkerThreads() const;
};
