#pragma once

#include <QString>
#include <QVector>
#include <atomic>
#include <memory>

#include "../CatalogData.h"
#include "../CurationConfig.h"
#include "SafetyValidator.h"
#include "QualityScorer.h"
#include "SimilarityStrategy.h"

class LibraryCatalog;
class ICleanupReviewer;
class ICurationEventSink;

enum class CleanupState {
    Idle, Scanning, Reviewing, Validating, BackingUp, Deleting, Reporting, Done,
    Cancelled, Failed
};

enum class CleanupMode {
    Fast,       // metadata hash only
    Thorough    // + content hash + similar filenames within one artist
};

QString cleanupStateName(CleanupState state);
QString cleanupModeName(CleanupMode mode);

struct CleanupPlan {
    QString sessionId;
    QString backupDir;
    bool    dryRun = false;
    QVector<DuplicateGroup> groups;   // validated groups only

    int filesToDelete() const;
    qint64 bytesToRecover() const;
};

struct CleanupAction {
    QString groupId;
    QString action;       // KEEP, DELETE, PLANNED_DELETE, DELETE_FAILED
    LibraryFile file;
    int qualityScore = 0;
};

struct CleanupReport {
    QString sessionId;                // yyyyMMdd_HHmmss
    CleanupState finalState = CleanupState::Idle;
    CleanupMode mode = CleanupMode::Fast;
    bool dryRun = false;

    int totalFilesScanned = 0;
    int groupsFound = 0;
    int groupsValidated = 0;
    int groupsExcluded = 0;
    int filesDeleted = 0;
    int deleteFailures = 0;
    qint64 bytesRecovered = 0;
    double scanDuration = 0.0;        // seconds
    double cleanupDuration = 0.0;

    QString manifestPath;
    QString csvReportPath;
    QString jsonReportPath;

    QVector<DuplicateGroup> groups;
    QVector<CleanupAction> actions;
    QVector<FileError> errors;

    CurationError error = CurationError::None;
    QString errorMessage;

    bool success() const { return finalState == CleanupState::Done; }
};

// Finds duplicate groups among active catalog rows, keeps the best copy of
// each and removes the rest after review, validation, confirmation and a
// verified backup.
class SmartCleanup {
public:
    SmartCleanup(LibraryCatalog* catalog, const CurationConfig& config,
                 ICleanupReviewer* reviewer, ICurationEventSink* sink = nullptr);
    ~SmartCleanup();

    CleanupReport run(CleanupMode mode, const QString& backupDir);

    // ── Individual phases ────────────────────────────────────────────
    QVector<DuplicateGroup> findGroups(CleanupMode mode, int* scanned = nullptr) const;
    void rankGroups(QVector<DuplicateGroup>& groups) const;
    CleanupPlan buildPlan(const QVector<DuplicateGroup>& groups, const QString& backupDir) const;

    static bool exportPlan(const CleanupPlan& plan, const QString& filePath,
                           QString* errorString = nullptr);

    void requestCancel() { m_cancelRequested = true; }
    CleanupState state() const { return m_state; }

    QualityScorer& scorer() { return m_scorer; }
    void setSimilarityStrategy(std::unique_ptr<ISimilarityStrategy> strategy);

private:
    void setState(CleanupState state);
    void review(QVector<DuplicateGroup>& groups);
    bool writeReports(CleanupReport& report, const QString& dir) const;
    CleanupReport finish(CleanupReport& report, CleanupState state);

    LibraryCatalog* m_catalog;
    CurationConfig m_config;
    ICleanupReviewer* m_reviewer;
    ICurationEventSink* m_sink;
    QualityScorer m_scorer;
    std::unique_ptr<ISimilarityStrategy> m_similarity;

    std::atomic<CleanupState> m_state{CleanupState::Idle};
    std::atomic<bool> m_cancelRequested{false};
};
