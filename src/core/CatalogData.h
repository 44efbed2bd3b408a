#ifndef CATALOGDATA_H
#define CATALOGDATA_H

#include <QString>
#include <QStringList>
#include <QVector>
#include <QHash>
#include <QDateTime>
#include <optional>

// ── Lifecycle ───────────────────────────────────────────────────────
enum class LifecycleState {
    Active,
    Inactive     // file missing on disk; row kept for verify/restore
};

// ── Error taxonomy ──────────────────────────────────────────────────
enum class CurationError {
    None,
    IOError,            // unreadable/unwritable file, skipped and recorded
    MetadataError,      // tags unparseable, file still hashed and indexed
    ValidationFailure,  // a safety checkpoint excluded one duplicate group
    BackupFailure,      // a copy failed, whole deletion batch aborted
    DeleteFailure,      // one removal failed after backup, skipped
    CatalogError        // store unavailable or corrupt, operation aborted
};

QString curationErrorName(CurationError error);

struct FileError {
    QString       path;
    CurationError error = CurationError::None;
    QString       message;
};

// ── Catalog entry ───────────────────────────────────────────────────
struct LibraryFile {
    qint64  id = 0;
    QString filePath;
    QString filename;
    QString artist;
    QString title;
    QString album;
    int     year = 0;
    double  duration = 0.0;     // seconds
    QString fileFormat;         // lowercase extension, e.g. "flac"
    int     bitrate = 0;        // kbps, 0 = unknown
    bool    variableBitrate = false;
    int     sampleRate = 0;     // Hz, 0 = unknown
    qint64  fileSize = 0;       // bytes
    QString metadataHash;
    QString contentHash;
    QDateTime indexedAt;
    qint64  fileMtime = 0;      // seconds since epoch
    QDateTime lastVerified;
    LifecycleState state = LifecycleState::Active;

    bool isActive() const { return state == LifecycleState::Active; }
    bool hasTags() const { return !artist.trimmed().isEmpty() || !title.trimmed().isEmpty(); }
    QString displayName() const;
};

// ── Vetting ─────────────────────────────────────────────────────────
struct VettingSession {
    qint64  id = 0;
    QString importFolder;
    QDateTime scannedAt;
    int     fileCount = 0;
    int     newCount = 0;
    int     duplicateCount = 0;
    int     uncertainCount = 0;
    int     previouslyReviewedCount = 0;
    int     errorCount = 0;
    double  thresholdUsed = 0.8;
    bool    stopped = false;     // run was cancelled before every file was checked
};

// ── Candidate history ───────────────────────────────────────────────
struct CandidateHistoryStats {
    int       totalFiles = 0;
    QDateTime lastAdded;
};

enum class MatchStatus { New, Duplicate, Uncertain };
enum class MatchType { None, ExactMetadata, ExactContent, Fuzzy };

QString matchStatusName(MatchStatus status);
QString matchTypeName(MatchType type);   // "exact_metadata", "exact_content", "fuzzy", "none"

struct MatchVerdict {
    MatchStatus status = MatchStatus::New;
    std::optional<LibraryFile> match;
    double      confidence = 0.0;
    MatchType   matchType = MatchType::None;
};

// ── Statistics ──────────────────────────────────────────────────────
struct CatalogStatistics {
    int     totalFiles = 0;
    qint64  totalSize = 0;          // bytes
    QHash<QString, int> formatBreakdown;
    int     uniqueArtists = 0;
    int     uniqueAlbums = 0;
    int     inactiveFiles = 0;
    QDateTime lastIndexedAt;
    double  lastIndexDuration = 0.0; // seconds

    double totalSizeGb() const;
    double averageFileSizeMb() const;
    QHash<QString, double> formatPercentages() const;
};

// ── Quality tiers ───────────────────────────────────────────────────
enum class QualityTier { Unknown, Poor, Fair, Good, Excellent };

QualityTier qualityTierForScore(int score);
QString     qualityTierLabel(QualityTier tier);

QString formatBytes(qint64 bytes);

#endif // CATALOGDATA_H
