#include "SafetyValidator.h"
#include "QualityScorer.h"

#include <QDir>
#include <QFileInfo>
#include <QStorageInfo>
#include <QDebug>

QString validationLevelName(ValidationLevel level)
{
    switch (level) {
    case ValidationLevel::Error:   return QStringLiteral("ERROR");
    case ValidationLevel::Warning: return QStringLiteral("WARNING");
    case ValidationLevel::Info:    return QStringLiteral("INFO");
    }
    return QStringLiteral("INFO");
}

// ═════════════════════════════════════════════════════════════════════
//  DuplicateGroup
// ═════════════════════════════════════════════════════════════════════

const LibraryFile* DuplicateGroup::keeper() const
{
    if (keeperIndex < 0 || keeperIndex >= members.size())
        return nullptr;
    return &members[keeperIndex];
}

QVector<LibraryFile> DuplicateGroup::deleteCandidates() const
{
    QVector<LibraryFile> out;
    for (int i = 0; i < members.size(); ++i) {
        if (i != keeperIndex)
            out.append(members[i]);
    }
    return out;
}

qint64 DuplicateGroup::reclaimableBytes() const
{
    qint64 total = 0;
    for (const LibraryFile& f : deleteCandidates())
        total += f.fileSize;
    return total;
}

bool DuplicateGroup::hasErrors() const
{
    for (const ValidationResult& r : validation) {
        if (r.isBlocking()) return true;
    }
    return false;
}

QVector<ValidationResult> DuplicateGroup::errors() const
{
    QVector<ValidationResult> out;
    for (const ValidationResult& r : validation) {
        if (r.level == ValidationLevel::Error) out.append(r);
    }
    return out;
}

QVector<ValidationResult> DuplicateGroup::warnings() const
{
    QVector<ValidationResult> out;
    for (const ValidationResult& r : validation) {
        if (r.level == ValidationLevel::Warning) out.append(r);
    }
    return out;
}

// ═════════════════════════════════════════════════════════════════════
//  SafetyValidator
// ═════════════════════════════════════════════════════════════════════

static ValidationResult result(ValidationLevel level, const char* checkpoint, const QString& message)
{
    ValidationResult r;
    r.level = level;
    r.checkpoint = QLatin1String(checkpoint);
    r.message = message;
    return r;
}

static const char* kKeeperExists    = "1. Keep File Exists";
static const char* kHasDeletions    = "2. Has Files to Delete";
static const char* kQualityCheck    = "3. Quality Check";
static const char* kFilesExist      = "4. Files Exist";
static const char* kKeepAtLeastOne  = "5. Keep At Least One";
static const char* kPermissions     = "6. File Permissions";
static const char* kBackupSpace     = "7. Backup Space";

SafetyValidator::SafetyValidator(const QualityScorer* scorer, qint64 freeSpaceMarginBytes)
    : m_scorer(scorer)
    , m_margin(freeSpaceMarginBytes)
{
}

QVector<ValidationResult> SafetyValidator::validate(const DuplicateGroup& group,
                                                    bool checkBackupSpace) const
{
    QVector<ValidationResult> results;
    results.append(checkKeeperExists(group));
    results.append(checkHasDeletions(group));
    results += checkQuality(group);
    results += checkCandidatesExist(group);
    results.append(checkKeeperPreserved(group));
    results += checkPermissions(group);
    if (checkBackupSpace)
        results.append(this->checkBackupSpace(QVector<DuplicateGroup>{ group }));
    return results;
}

ValidationResult SafetyValidator::checkKeeperExists(const DuplicateGroup& group) const
{
    const LibraryFile* keeper = group.keeper();
    if (!keeper || keeper->filePath.isEmpty())
        return result(ValidationLevel::Error, kKeeperExists, QStringLiteral("Keep file path is empty"));

    QFileInfo fi(keeper->filePath);
    if (!fi.exists())
        return result(ValidationLevel::Error, kKeeperExists,
                      QStringLiteral("Keep file does not exist: %1").arg(keeper->filePath));
    if (!fi.isFile())
        return result(ValidationLevel::Error, kKeeperExists,
                      QStringLiteral("Keep file path is not a file: %1").arg(keeper->filePath));

    return result(ValidationLevel::Info, kKeeperExists,
                  QStringLiteral("Keep file validated: %1").arg(fi.fileName()));
}

ValidationResult SafetyValidator::checkHasDeletions(const DuplicateGroup& group) const
{
    const int count = group.deleteCandidates().size();
    if (count == 0)
        return result(ValidationLevel::Error, kHasDeletions, QStringLiteral("No files marked for deletion"));
    return result(ValidationLevel::Info, kHasDeletions,
                  QStringLiteral("%1 file(s) marked for deletion").arg(count));
}

QVector<ValidationResult> SafetyValidator::checkQuality(const DuplicateGroup& group) const
{
    QVector<ValidationResult> results;
    const LibraryFile* keeper = group.keeper();
    if (keeper && m_scorer) {
        const int keepScore = m_scorer->score(*keeper).total;
        for (const LibraryFile& f : group.deleteCandidates()) {
            const int score = m_scorer->score(f).total;
            if (score > keepScore) {
                results.append(result(ValidationLevel::Warning, kQualityCheck,
                    QStringLiteral("Deleting higher quality file: %1 (%2) while keeping %3 (%4)")
                        .arg(QFileInfo(f.filePath).fileName()).arg(score)
                        .arg(QFileInfo(keeper->filePath).fileName()).arg(keepScore)));
            }
        }
    }
    if (results.isEmpty())
        results.append(result(ValidationLevel::Info, kQualityCheck,
                              QStringLiteral("No higher quality files being deleted")));
    return results;
}

QVector<ValidationResult> SafetyValidator::checkCandidatesExist(const DuplicateGroup& group) const
{
    QVector<ValidationResult> results;
    const QVector<LibraryFile> candidates = group.deleteCandidates();
    for (const LibraryFile& f : candidates) {
        QFileInfo fi(f.filePath);
        if (!fi.exists())
            results.append(result(ValidationLevel::Error, kFilesExist,
                QStringLiteral("File marked for deletion does not exist: %1").arg(f.filePath)));
        else if (!fi.isFile())
            results.append(result(ValidationLevel::Error, kFilesExist,
                QStringLiteral("Path marked for deletion is not a file: %1").arg(f.filePath)));
    }
    if (results.isEmpty())
        results.append(result(ValidationLevel::Info, kFilesExist,
            QStringLiteral("All %1 file(s) to delete verified").arg(candidates.size())));
    return results;
}

ValidationResult SafetyValidator::checkKeeperPreserved(const DuplicateGroup& group) const
{
    const LibraryFile* keeper = group.keeper();
    if (!keeper || !QFileInfo::exists(keeper->filePath))
        return result(ValidationLevel::Error, kKeepAtLeastOne,
                      QStringLiteral("Cannot delete all files - keep file is invalid"));

    const QString keepPath = QFileInfo(keeper->filePath).canonicalFilePath();
    for (const LibraryFile& f : group.deleteCandidates()) {
        const QString canonical = QFileInfo(f.filePath).canonicalFilePath();
        if (f.filePath == keeper->filePath || (!canonical.isEmpty() && canonical == keepPath))
            return result(ValidationLevel::Error, kKeepAtLeastOne,
                          QStringLiteral("Keep file is also marked for deletion: %1").arg(f.filePath));
    }
    return result(ValidationLevel::Info, kKeepAtLeastOne, QStringLiteral("Keep file will be preserved"));
}

QVector<ValidationResult> SafetyValidator::checkPermissions(const DuplicateGroup& group) const
{
    QVector<ValidationResult> results;
    for (const LibraryFile& f : group.deleteCandidates()) {
        QFileInfo fi(f.filePath);
        if (!fi.exists()) continue;   // checkpoint 4

        QFileInfo parent(fi.absolutePath());
        if (!parent.isWritable())
            results.append(result(ValidationLevel::Error, kPermissions,
                QStringLiteral("No write permission on directory: %1").arg(fi.absolutePath())));
        if (!fi.isWritable())
            results.append(result(ValidationLevel::Error, kPermissions,
                QStringLiteral("No write permission on file: %1").arg(f.filePath)));
    }
    if (results.isEmpty())
        results.append(result(ValidationLevel::Info, kPermissions, QStringLiteral("All file permissions verified")));
    return results;
}

ValidationResult SafetyValidator::checkBackupSpace(const QVector<DuplicateGroup>& groups) const
{
    QVector<LibraryFile> candidates;
    for (const DuplicateGroup& g : groups)
        candidates += g.deleteCandidates();
    qint64 totalSize = 0;
    for (const LibraryFile& f : candidates) {
        QFileInfo fi(f.filePath);
        if (fi.exists()) totalSize += fi.size();
    }

    QString existing = m_backupDir;
    while (!existing.isEmpty() && !QFileInfo::exists(existing)) {
        const QString parent = QFileInfo(existing).absolutePath();
        existing = (parent == existing) ? QString() : parent;
    }
    if (existing.isEmpty() && !candidates.isEmpty())
        existing = QFileInfo(candidates.first().filePath).absolutePath();

    QStorageInfo storage(existing);
    if (existing.isEmpty() || !storage.isValid() || !storage.isReady())
        return result(ValidationLevel::Warning, kBackupSpace,
                      QStringLiteral("Could not verify disk space for backup"));

    const qint64 available = storage.bytesAvailable();
    const qint64 required = totalSize * 2 + m_margin;
    if (available < required)
        return result(ValidationLevel::Warning, kBackupSpace,
            QStringLiteral("Limited disk space for backup. Available: %1, Required: %2")
                .arg(formatBytes(available), formatBytes(required)));

    return result(ValidationLevel::Info, kBackupSpace, QStringLiteral("Sufficient disk space for backup"));
}
