#pragma once

#include <QString>
#include <QVector>
#include <memory>

#include "CatalogData.h"
#include "CurationConfig.h"
#include "library/LibraryIndexer.h"
#include "library/ImportVetter.h"
#include "library/SmartCleanup.h"
#include "library/BackupManager.h"

class LibraryCatalog;
class IMetadataExtractor;
class ICleanupReviewer;
class ICurationEventSink;

// Entry point for front ends. Owns nothing but the extractor it creates
// when none is supplied; the catalog, reviewer and sink belong to the
// caller and must outlive the service.
class CurationService {
public:
    CurationService(LibraryCatalog* catalog, const CurationConfig& config = CurationConfig(),
                    IMetadataExtractor* extractor = nullptr,
                    ICleanupReviewer* reviewer = nullptr,
                    ICurationEventSink* sink = nullptr);
    ~CurationService();

    const CurationConfig& config() const { return m_config; }
    bool setConfig(const CurationConfig& config, QString* errorString = nullptr);
    void setReviewer(ICleanupReviewer* reviewer) { m_reviewer = reviewer; }

    // ── Operations ───────────────────────────────────────────────────
    IndexResult index(const QString& libraryPath, bool rescan = false, bool incremental = true);
    VettingReport vet(const QString& importFolder, double threshold, const ExportFlags& exportFlags);
    VettingReport vet(const QString& importFolder);   // threshold and exports from config
    VerifyResult verify(const QString& libraryPath = QString());
    CatalogStatistics stats() const;
    QVector<VettingSession> history(int limit) const;
    QVector<VettingSession> history() const { return history(m_config.historyLimit); }
    CleanupReport cleanup(CleanupMode mode, const QString& backupDir);
    CleanupReport cleanup();                          // mode and backup dir from config

    // ── Extras ───────────────────────────────────────────────────────
    MatchVerdict checkFile(const QString& filePath, QString* errorString = nullptr);
    ReviewRecordResult recordReviewed(const QString& folder);
    CandidateHistoryStats reviewHistoryStats() const;
    RestoreResult restoreBackup(const QString& manifestPath, bool overwrite = false,
                                QString* errorString = nullptr);

private:
    LibraryCatalog* m_catalog;
    CurationConfig m_config;
    std::unique_ptr<IMetadataExtractor> m_ownedExtractor;
    IMetadataExtractor* m_extractor;
    ICleanupReviewer* m_reviewer;
    ICurationEventSink* m_sink;
};
