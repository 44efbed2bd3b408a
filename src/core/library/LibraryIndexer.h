#pragma once

#include <QString>
#include <QStringList>
#include <QVector>
#include <atomic>

#include "../CatalogData.h"
#include "../CurationConfig.h"

class LibraryCatalog;
class IMetadataExtractor;
class ICurationEventSink;

struct IndexResult {
    int found = 0;
    int added = 0;
    int updated = 0;
    int skipped = 0;          // unchanged since last pass
    int reactivated = 0;
    int metadataErrors = 0;   // indexed without tags
    int errors = 0;           // not indexed
    QVector<FileError> fileErrors;
    double durationSeconds = 0.0;
    bool stopped = false;
    CurationError error = CurationError::None;   // CatalogError or IOError on the root
    QString errorMessage;

    bool success() const { return error == CurationError::None; }
    int processed() const { return added + updated + skipped + reactivated; }
};

struct VerifyResult {
    int checked = 0;
    int missingCount = 0;
    int markedInactive = 0;
    QStringList missingPaths;
    CurationError error = CurationError::None;
    QString errorMessage;

    bool success() const { return error == CurationError::None; }
};

// Walks a library folder, extracts and hashes audio files on a worker pool
// and writes them through the catalog's single write connection, one
// transaction per batch.
class LibraryIndexer {
public:
    LibraryIndexer(LibraryCatalog* catalog, IMetadataExtractor* extractor,
                   const CurationConfig& config = CurationConfig(),
                   ICurationEventSink* sink = nullptr);

    // rescan: re-extract every file. incremental: skip files whose size and
    // mtime match the catalog row.
    IndexResult index(const QString& libraryPath, bool rescan = false, bool incremental = true);

    // Marks rows under libraryPath (all rows if empty) whose files are gone
    // as Inactive.
    VerifyResult verify(const QString& libraryPath = QString());

    void requestStop() { m_stopRequested = true; }
    bool isRunning() const { return m_running; }

    static const QStringList& supportedExtensions();
    static bool isSupportedFile(const QString& filePath);

    // Sorted absolute paths of supported files below folder. Symlinks are
    // not followed.
    static QStringList collectAudioFiles(const QString& folder,
                                         const std::atomic<bool>* stopFlag = nullptr);

private:
    struct Extracted {
        LibraryFile file;
        CurationError error = CurationError::None;
        QString message;
    };

    Extracted processFile(const QString& filePath) const;

    LibraryCatalog* m_catalog;
    IMetadataExtractor* m_extractor;
    CurationConfig m_config;
    ICurationEventSink* m_sink;

    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopRequested{false};
};
