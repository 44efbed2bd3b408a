#pragma once

#include <QString>
#include <QStringList>
#include <QVector>
#include <atomic>
#include <memory>

#include "../CatalogData.h"
#include "../CurationConfig.h"
#include "DuplicateMatcher.h"

class LibraryCatalog;
class IMetadataExtractor;
class ICurationEventSink;

enum class VettingState { Idle, Scanning, Matching, Summarizing, Done, Stopped, Failed };

QString vettingStateName(VettingState state);

struct ExportFlags {
    bool newSongs = true;
    bool duplicates = false;
    bool uncertain = false;
    QString outputDir;      // empty: the vetted folder
    bool previouslyReviewed = false;

    bool any() const { return newSongs || duplicates || uncertain || previouslyReviewed; }
};

struct ClassifiedFile {
    LibraryFile  file;
    MatchVerdict verdict;
    QDateTime    reviewedAt;   // set for previously reviewed files
};

struct VettingReport {
    VettingSession session;
    QVector<ClassifiedFile> newSongs;
    QVector<ClassifiedFile> duplicates;
    QVector<ClassifiedFile> uncertain;
    QVector<ClassifiedFile> previouslyReviewed;   // no library match, filename seen before
    QVector<FileError> errors;
    QStringList exportedFiles;
    int unprocessed = 0;          // files left unchecked by a stop request
    double durationSeconds = 0.0;
    CurationError error = CurationError::None;
    QString errorMessage;

    bool success() const { return error == CurationError::None; }
    bool stopped() const { return session.stopped; }
};

struct ReviewRecordResult {
    int total = 0;
    int added = 0;
    int alreadyRecorded = 0;
    QVector<FileError> errors;
    CurationError error = CurationError::None;
    QString errorMessage;

    bool success() const { return error == CurationError::None; }
};

// Classifies every audio file in an import folder against the catalog as
// New, Duplicate, Uncertain or previously reviewed. Records one history
// row per run; never writes to library_index.
class ImportVetter {
public:
    static const QString kNewSongsFile;
    static const QString kDuplicatesFile;
    static const QString kUncertainFile;
    static const QString kPreviouslyReviewedFile;

    ImportVetter(LibraryCatalog* catalog, IMetadataExtractor* extractor,
                 const CurationConfig& config = CurationConfig(),
                 ICurationEventSink* sink = nullptr);
    ~ImportVetter();

    VettingReport vet(const QString& importFolder, double threshold,
                      const ExportFlags& exportFlags = ExportFlags());

    // Records every audio filename under folder as reviewed, so later
    // vetting runs report it as previously reviewed instead of new.
    ReviewRecordResult recordReviewed(const QString& folder);

    VettingState state() const { return m_state; }
    void requestStop() { m_stopRequested = true; }

    DuplicateMatcher* matcher() { return m_matcher.get(); }

    // Writes the selected export files into flags.outputDir (or the import
    // folder). Appends written paths to report.exportedFiles.
    static bool writeExports(VettingReport& report, const ExportFlags& flags,
                             QString* errorString = nullptr);

private:
    struct Checked {
        LibraryFile  file;
        MatchVerdict verdict;
        QDateTime reviewedAt;
        CurationError error = CurationError::None;
        QString message;
    };

    Checked checkOne(const QString& filePath, double threshold) const;

    LibraryCatalog* m_catalog;
    IMetadataExtractor* m_extractor;
    CurationConfig m_config;
    ICurationEventSink* m_sink;
    std::unique_ptr<DuplicateMatcher> m_matcher;

    std::atomic<VettingState> m_state{VettingState::Idle};
    std::atomic<bool> m_stopRequested{false};
};
