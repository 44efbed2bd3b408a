#pragma once

#include <QString>
#include <QVector>
#include "../CatalogData.h"

class QualityScorer;

enum class ValidationLevel { Error, Warning, Info };

QString validationLevelName(ValidationLevel level);   // "ERROR", "WARNING", "INFO"

struct ValidationResult {
    ValidationLevel level = ValidationLevel::Info;
    QString checkpoint;
    QString message;

    bool isBlocking() const { return level == ValidationLevel::Error; }
};

// One set of catalog rows that describe the same recording. The keeper is
// members[keeperIndex]; every other member is a delete candidate.
struct DuplicateGroup {
    QString groupId;                 // "dup_0001"
    QVector<LibraryFile> members;
    QVector<int> qualityScores;      // parallel to members
    int  keeperIndex = -1;
    bool excluded = false;           // reviewer chose to keep all
    QVector<ValidationResult> validation;

    const LibraryFile* keeper() const;
    QVector<LibraryFile> deleteCandidates() const;
    qint64 reclaimableBytes() const;

    bool hasErrors() const;
    bool isValid() const { return !excluded && keeperIndex >= 0 && !hasErrors(); }
    QVector<ValidationResult> errors() const;
    QVector<ValidationResult> warnings() const;
};

// Seven checkpoints per group before anything is touched on disk. An Error
// result excludes the group; Warning and Info are reported only.
class SafetyValidator {
public:
    explicit SafetyValidator(const QualityScorer* scorer, qint64 freeSpaceMarginBytes = 0);

    // Directory whose volume receives the backups. Empty: the volume of
    // the first delete candidate.
    void setBackupDirectory(const QString& dir) { m_backupDir = dir; }

    QVector<ValidationResult> validate(const DuplicateGroup& group,
                                       bool checkBackupSpace = true) const;

    // Checkpoint 7 over every delete candidate of a whole batch.
    ValidationResult checkBackupSpace(const QVector<DuplicateGroup>& groups) const;

private:
    ValidationResult checkKeeperExists(const DuplicateGroup& group) const;
    ValidationResult checkHasDeletions(const DuplicateGroup& group) const;
    QVector<ValidationResult> checkQuality(const DuplicateGroup& group) const;
    QVector<ValidationResult> checkCandidatesExist(const DuplicateGroup& group) const;
    ValidationResult checkKeeperPreserved(const DuplicateGroup& group) const;
    QVector<ValidationResult> checkPermissions(const DuplicateGroup& group) const;

    const QualityScorer* m_scorer;
    qint64 m_margin;
    QString m_backupDir;
};
