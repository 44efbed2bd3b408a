#include "LibraryIndexer.h"
#include "LibraryCatalog.h"
#include "HashCalculator.h"
#include "../audio/IMetadataExtractor.h"
#include "../ICurationEventSink.h"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QDateTime>
#include <QDebug>
#include <QElapsedTimer>
#include <QThreadPool>
#include <QtConcurrent>

LibraryIndexer::LibraryIndexer(LibraryCatalog* catalog, IMetadataExtractor* extractor,
                               const CurationConfig& config, ICurationEventSink* sink)
    : m_catalog(catalog)
    , m_extractor(extractor)
    , m_config(config)
    , m_sink(sink ? sink : NullEventSink::instance())
{
}

const QStringList& LibraryIndexer::supportedExtensions()
{
    static const QStringList exts = {
        QStringLiteral("mp3"),
        QStringLiteral("flac"),
        QStringLiteral("m4a"),
        QStringLiteral("wav"),
        QStringLiteral("ogg"),
        QStringLiteral("opus"),
        QStringLiteral("aiff"),
        QStringLiteral("aif")
    };
    return exts;
}

bool LibraryIndexer::isSupportedFile(const QString& filePath)
{
    return supportedExtensions().contains(QFileInfo(filePath).suffix().toLower());
}

QStringList LibraryIndexer::collectAudioFiles(const QString& folder, const std::atomic<bool>* stopFlag)
{
    QStringList files;
    QFileInfo folderInfo(folder);
    if (!folderInfo.exists() || !folderInfo.isDir() || !folderInfo.isReadable()) {
        qDebug() << "[Indexer] Folder not accessible, skipping:" << folder;
        return files;
    }

    QDirIterator it(folderInfo.absoluteFilePath(), QDir::Files | QDir::NoDotAndDotDot,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        if (stopFlag && *stopFlag) break;
        it.next();
        const QFileInfo fi = it.fileInfo();
        if (fi.isSymLink()) continue;
        if (supportedExtensions().contains(fi.suffix().toLower()))
            files.append(fi.absoluteFilePath());
    }
    files.sort();
    return files;
}

// ── Worker: runs on the pool ────────────────────────────────────────
LibraryIndexer::Extracted LibraryIndexer::processFile(const QString& filePath) const
{
    Extracted out;
    out.file.filePath = filePath;
    QFileInfo fi(filePath);
    if (!fi.exists() || !fi.isReadable()) {
        out.error = CurationError::IOError;
        out.message = QStringLiteral("Cannot read %1").arg(filePath);
        return out;
    }

    LibraryFile& f = out.file;
    f.filePath = fi.absoluteFilePath();
    f.filename = fi.fileName();
    f.fileFormat = fi.suffix().toLower();
    f.fileSize = fi.size();
    f.fileMtime = fi.lastModified().toSecsSinceEpoch();

    QString tagError;
    if (!m_extractor || !m_extractor->extract(f.filePath, f, &tagError)) {
        out.error = CurationError::MetadataError;
        out.message = tagError.isEmpty() ? QStringLiteral("No readable tags") : tagError;
    }

    f.metadataHash = HashCalculator::metadataHash(f.artist, f.title);

    CurationError hashError = CurationError::None;
    QString hashMessage;
    f.contentHash = HashCalculator::contentHash(f.filePath, &hashError, &hashMessage);
    if (hashError != CurationError::None) {
        out.error = hashError;
        out.message = hashMessage;
    }

    const QDateTime now = QDateTime::currentDateTimeUtc();
    f.indexedAt = now;
    f.lastVerified = now;
    f.state = LifecycleState::Active;
    return out;
}

// ── index ───────────────────────────────────────────────────────────
IndexResult LibraryIndexer::index(const QString& libraryPath, bool rescan, bool incremental)
{
    IndexResult result;
    QElapsedTimer pipelineTimer; pipelineTimer.start();
    QElapsedTimer stepTimer;

    if (!m_catalog || !m_catalog->isOpen()) {
        result.error = CurationError::CatalogError;
        result.errorMessage = QStringLiteral("Catalog is not open");
        qWarning() << "[Indexer]" << result.errorMessage;
        return result;
    }

    QFileInfo root(libraryPath);
    if (libraryPath.isEmpty() || !root.exists() || !root.isDir()) {
        result.error = CurationError::IOError;
        result.errorMessage = QStringLiteral("Library path is not a directory: %1").arg(libraryPath);
        qWarning() << "[Indexer]" << result.errorMessage;
        return result;
    }

    bool expected = false;
    if (!m_running.compare_exchange_strong(expected, true)) {
        result.error = CurationError::CatalogError;
        result.errorMessage = QStringLiteral("An index pass is already running");
        qWarning() << "[Indexer]" << result.errorMessage;
        return result;
    }
    m_stopRequested = false;

    qDebug() << "[TIMING] === INDEX PIPELINE START ===" << root.absoluteFilePath()
             << "rescan:" << rescan << "incremental:" << incremental;

    // ── Walk ─────────────────────────────────────────────────────────
    stepTimer.start();
    const QStringList allFiles = collectAudioFiles(root.absoluteFilePath(), &m_stopRequested);
    result.found = allFiles.size();
    qDebug() << "[TIMING] Directory walk:" << stepTimer.elapsed() << "ms -"
             << allFiles.size() << "files";
    m_sink->onPhaseComplete(QStringLiteral("walk"), stepTimer.elapsed());

    // ── Phase 1: classify against one in-memory snapshot ─────────────
    stepTimer.restart();
    const auto known = m_catalog->allFileMeta();   // path -> (size, mtime)
    const bool skipUnchanged = incremental && !rescan;
    const bool force = rescan || !incremental;

    QStringList toProcess;
    toProcess.reserve(allFiles.size());
    for (const QString& path : allFiles) {
        if (m_stopRequested) break;
        auto it = known.constFind(path);
        if (skipUnchanged && it != known.constEnd()) {
            QFileInfo fi(path);
            if (it.value().first == fi.size()
                && it.value().second == fi.lastModified().toSecsSinceEpoch()) {
                auto row = m_catalog->fileByPath(path);
                if (row && !row->isActive()) {
                    // Back on disk unchanged: reactivate without re-reading.
                    if (m_catalog->markActive(row->id))
                        ++result.reactivated;
                } else {
                    ++result.skipped;
                }
                continue;
            }
        }
        toProcess.append(path);
    }
    qDebug() << "[TIMING] Phase 1 (classify):" << toProcess.size() << "to process,"
             << result.skipped << "skipped in" << stepTimer.elapsed() << "ms";

    // ── Phase 2: parallel extract + hash, serial batch write ─────────
    stepTimer.restart();
    QThreadPool pool;
    pool.setMaxThreadCount(m_config.effectiveWorkerThreads());
    const int batchSize = qMax(1, m_config.batchSize);
    const int total = toProcess.size();
    int done = result.skipped + result.reactivated;

    auto worker = [this](const QString& path) { return processFile(path); };

    for (int i = 0; i < total; i += batchSize) {
        if (m_stopRequested) break;

        const QStringList chunk = toProcess.mid(i, batchSize);
        const QList<Extracted> batch = QtConcurrent::blockingMapped(&pool, chunk, worker);

        if (!m_catalog->beginTransaction()) {
            result.error = CurationError::CatalogError;
            result.errorMessage = QStringLiteral("Cannot begin index transaction");
            qWarning() << "[Indexer]" << result.errorMessage;
            break;
        }

        bool batchFailed = false;
        for (const Extracted& e : batch) {
            ++done;
            m_sink->onFileProcessed(e.file.filePath, done, result.found);

            if (e.error == CurationError::IOError) {
                ++result.errors;
                result.fileErrors.append({ e.file.filePath, e.error, e.message });
                continue;
            }
            if (e.error == CurationError::MetadataError) {
                ++result.metadataErrors;
                result.fileErrors.append({ e.file.filePath, e.error, e.message });
            }

            UpsertOutcome outcome = UpsertOutcome::Failed;
            m_catalog->upsertFile(e.file, force, &outcome);
            switch (outcome) {
            case UpsertOutcome::Inserted:    ++result.added; break;
            case UpsertOutcome::Updated:     ++result.updated; break;
            case UpsertOutcome::Unchanged:   ++result.skipped; break;
            case UpsertOutcome::Reactivated: ++result.reactivated; break;
            case UpsertOutcome::Failed:
                batchFailed = true;
                break;
            }
            if (batchFailed) break;
        }

        if (batchFailed || !m_catalog->commitTransaction()) {
            m_catalog->rollbackTransaction();
            result.error = CurationError::CatalogError;
            result.errorMessage = QStringLiteral("Catalog write failed, batch rolled back");
            qWarning() << "[Indexer]" << result.errorMessage;
            break;
        }

        qDebug() << "[Indexer]" << qMin(i + batchSize, total) << "/" << total
                 << "files (" << stepTimer.elapsed() << "ms)";
    }

    const int perFile = total > 0 ? int(stepTimer.elapsed() / total) : 0;
    qDebug() << "[TIMING] Phase 2 (parallel index):" << total << "files in"
             << stepTimer.elapsed() << "ms (" << perFile << "ms/file,"
             << pool.maxThreadCount() << "threads)";
    m_sink->onPhaseComplete(QStringLiteral("index"), stepTimer.elapsed());

    result.stopped = m_stopRequested;
    result.durationSeconds = pipelineTimer.elapsed() / 1000.0;

    // ── Statistics snapshot ──────────────────────────────────────────
    if (result.success()) {
        CatalogStatistics stats = m_catalog->statistics();
        stats.lastIndexedAt = QDateTime::currentDateTimeUtc();
        stats.lastIndexDuration = result.durationSeconds;
        if (!m_catalog->saveIndexStatistics(stats))
            qWarning() << "[Indexer] Could not save index statistics";
    }

    qDebug() << "[Indexer] Index complete -"
             << "found:" << result.found
             << "added:" << result.added
             << "updated:" << result.updated
             << "skipped:" << result.skipped
             << "reactivated:" << result.reactivated
             << "errors:" << result.errors
             << "metadata errors:" << result.metadataErrors;
    qDebug() << "[TIMING] === INDEX PIPELINE DONE ===" << pipelineTimer.elapsed() << "ms total";

    m_running = false;
    return result;
}

// ── verify ──────────────────────────────────────────────────────────
VerifyResult LibraryIndexer::verify(const QString& libraryPath)
{
    VerifyResult result;
    QElapsedTimer timer; timer.start();

    if (!m_catalog || !m_catalog->isOpen()) {
        result.error = CurationError::CatalogError;
        result.errorMessage = QStringLiteral("Catalog is not open");
        qWarning() << "[Indexer]" << result.errorMessage;
        return result;
    }

    QString prefix;
    if (!libraryPath.isEmpty()) {
        prefix = QDir::cleanPath(QFileInfo(libraryPath).absoluteFilePath());
        if (!prefix.endsWith(QLatin1Char('/')))
            prefix += QLatin1Char('/');
    }

    const QVector<LibraryFile> rows = m_catalog->allFiles(true);
    for (const LibraryFile& row : rows) {
        if (m_stopRequested) break;
        if (!prefix.isEmpty() && !row.filePath.startsWith(prefix))
            continue;
        ++result.checked;
        if (!QFileInfo::exists(row.filePath)) {
            ++result.missingCount;
            result.missingPaths.append(row.filePath);
        }
    }

    if (!result.missingPaths.isEmpty()) {
        const int marked = m_catalog->markInactiveByPaths(result.missingPaths);
        if (marked < 0) {
            result.error = CurationError::CatalogError;
            result.errorMessage = QStringLiteral("Could not mark missing files inactive");
            qWarning() << "[Indexer]" << result.errorMessage;
        } else {
            result.markedInactive = marked;
        }
    }

    qDebug() << "[Indexer] Verify -" << result.checked << "checked,"
             << result.missingCount << "missing," << result.markedInactive << "marked inactive";
    m_sink->onPhaseComplete(QStringLiteral("verify"), timer.elapsed());
    return result;
}
