#include "CurationService.h"
#include "ICurationEventSink.h"
#include "audio/FileMetadataExtractor.h"
#include "library/LibraryCatalog.h"
#include "library/DuplicateMatcher.h"

#include <QDebug>
#include <QFileInfo>

CurationService::CurationService(LibraryCatalog* catalog, const CurationConfig& config,
                                 IMetadataExtractor* extractor, ICleanupReviewer* reviewer,
                                 ICurationEventSink* sink)
    : m_catalog(catalog)
    , m_config(config)
    , m_extractor(extractor)
    , m_reviewer(reviewer)
    , m_sink(sink ? sink : NullEventSink::instance())
{
    if (!m_extractor) {
        m_ownedExtractor = std::make_unique<FileMetadataExtractor>();
        m_extractor = m_ownedExtractor.get();
    }

    QString err;
    if (!m_config.validate(&err)) {
        qWarning() << "[Curation] Invalid config:" << err << "- using"
                   << scanModeName(config.mode) << "preset";
        m_config = CurationConfig::forMode(config.mode);
    }
}

CurationService::~CurationService() = default;

bool CurationService::setConfig(const CurationConfig& config, QString* errorString)
{
    if (!config.validate(errorString))
        return false;
    m_config = config;
    return true;
}

IndexResult CurationService::index(const QString& libraryPath, bool rescan, bool incremental)
{
    LibraryIndexer indexer(m_catalog, m_extractor, m_config, m_sink);
    return indexer.index(libraryPath, rescan, incremental);
}

VettingReport CurationService::vet(const QString& importFolder, double threshold,
                                   const ExportFlags& exportFlags)
{
    ImportVetter vetter(m_catalog, m_extractor, m_config, m_sink);
    return vetter.vet(importFolder, threshold, exportFlags);
}

VettingReport CurationService::vet(const QString& importFolder)
{
    ExportFlags flags;
    flags.newSongs = m_config.exportNew;
    flags.duplicates = m_config.exportDuplicates;
    flags.uncertain = m_config.exportUncertain;
    flags.previouslyReviewed = m_config.exportPreviouslyReviewed;
    flags.outputDir = m_config.exportDir;
    return vet(importFolder, m_config.threshold, flags);
}

VerifyResult CurationService::verify(const QString& libraryPath)
{
    LibraryIndexer indexer(m_catalog, m_extractor, m_config, m_sink);
    return indexer.verify(libraryPath);
}

CatalogStatistics CurationService::stats() const
{
    if (!m_catalog || !m_catalog->isOpen()) {
        qWarning() << "[Curation] stats() on a closed catalog";
        return CatalogStatistics{};
    }
    return m_catalog->statistics();
}

QVector<VettingSession> CurationService::history(int limit) const
{
    if (!m_catalog || !m_catalog->isOpen()) {
        qWarning() << "[Curation] history() on a closed catalog";
        return {};
    }
    return m_catalog->vettingHistory(limit);
}

CleanupReport CurationService::cleanup(CleanupMode mode, const QString& backupDir)
{
    SmartCleanup cleanup(m_catalog, m_config, m_reviewer, m_sink);
    return cleanup.run(mode, backupDir);
}

CleanupReport CurationService::cleanup()
{
    return cleanup(m_config.thoroughGrouping ? CleanupMode::Thorough : CleanupMode::Fast,
                   m_config.backupDir);
}

MatchVerdict CurationService::checkFile(const QString& filePath, QString* errorString)
{
    DuplicateMatcher matcher(m_catalog);
    matcher.setThreshold(m_config.threshold);
    matcher.setUncertainFloor(m_config.uncertainFloor);
    matcher.setUseContentHash(m_config.useContentHash);
    return matcher.checkFile(filePath, m_extractor, errorString);
}

ReviewRecordResult CurationService::recordReviewed(const QString& folder)
{
    ImportVetter vetter(m_catalog, m_extractor, m_config, m_sink);
    return vetter.recordReviewed(folder);
}

CandidateHistoryStats CurationService::reviewHistoryStats() const
{
    if (!m_catalog || !m_catalog->isOpen())
        return CandidateHistoryStats{};
    return m_catalog->candidateHistoryStats();
}

RestoreResult CurationService::restoreBackup(const QString& manifestPath, bool overwrite,
                                             QString* errorString)
{
    QString err;
    auto manifest = BackupManager::loadManifest(manifestPath, &err);
    if (!manifest) {
        qWarning() << "[Curation] Cannot restore:" << err;
        if (errorString) *errorString = err;
        RestoreResult failed;
        failed.failed = 1;
        failed.errors.append({ manifestPath, CurationError::IOError, err });
        return failed;
    }

    RestoreResult result = BackupManager::restore(*manifest, overwrite);

    // Restored files are back on disk; their rows become Active again.
    if (m_catalog && m_catalog->isOpen()) {
        for (const BackupEntry& e : manifest->entries) {
            auto row = m_catalog->fileByPath(e.originalPath);
            if (row && !row->isActive() && QFileInfo::exists(e.originalPath))
                m_catalog->markActive(row->id);
        }
    }
    return result;
}
