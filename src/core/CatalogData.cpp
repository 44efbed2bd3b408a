#include "CatalogData.h"

#include <QFileInfo>
#include <QtMath>

// ═════════════════════════════════════════════════════════════════════
//  Names
// ═════════════════════════════════════════════════════════════════════

QString curationErrorName(CurationError error)
{
    switch (error) {
    case CurationError::None:              return QStringLiteral("None");
    case CurationError::IOError:           return QStringLiteral("IOError");
    case CurationError::MetadataError:     return QStringLiteral("MetadataError");
    case CurationError::ValidationFailure: return QStringLiteral("ValidationFailure");
    case CurationError::BackupFailure:     return QStringLiteral("BackupFailure");
    case CurationError::DeleteFailure:     return QStringLiteral("DeleteFailure");
    case CurationError::CatalogError:      return QStringLiteral("CatalogError");
    }
    return QStringLiteral("Unknown");
}

QString matchStatusName(MatchStatus status)
{
    switch (status) {
    case MatchStatus::New:       return QStringLiteral("new");
    case MatchStatus::Duplicate: return QStringLiteral("duplicate");
    case MatchStatus::Uncertain: return QStringLiteral("uncertain");
    }
    return QStringLiteral("new");
}

QString matchTypeName(MatchType type)
{
    switch (type) {
    case MatchType::None:          return QStringLiteral("none");
    case MatchType::ExactMetadata: return QStringLiteral("exact_metadata");
    case MatchType::ExactContent:  return QStringLiteral("exact_content");
    case MatchType::Fuzzy:         return QStringLiteral("fuzzy");
    }
    return QStringLiteral("none");
}

// ═════════════════════════════════════════════════════════════════════
//  LibraryFile
// ═════════════════════════════════════════════════════════════════════

QString LibraryFile::displayName() const
{
    if (!artist.isEmpty() && !title.isEmpty())
        return artist + QStringLiteral(" - ") + title;
    if (!title.isEmpty())
        return title;
    if (!filename.isEmpty())
        return filename;
    return QFileInfo(filePath).fileName();
}

// ═════════════════════════════════════════════════════════════════════
//  CatalogStatistics
// ═════════════════════════════════════════════════════════════════════

double CatalogStatistics::totalSizeGb() const
{
    return totalSize / (1024.0 * 1024.0 * 1024.0);
}

double CatalogStatistics::averageFileSizeMb() const
{
    if (totalFiles <= 0)
        return 0.0;
    return (double(totalSize) / totalFiles) / (1024.0 * 1024.0);
}

QHash<QString, double> CatalogStatistics::formatPercentages() const
{
    QHash<QString, double> result;
    if (totalFiles <= 0)
        return result;

    for (auto it = formatBreakdown.constBegin(); it != formatBreakdown.constEnd(); ++it) {
        if (it.value() < 0) continue;
        double pct = qRound(it.value() * 10000.0 / totalFiles) / 100.0;
        result.insert(it.key(), qMin(pct, 100.0));
    }
    return result;
}

// ═════════════════════════════════════════════════════════════════════
//  Quality tiers
// ═════════════════════════════════════════════════════════════════════

QualityTier qualityTierForScore(int score)
{
    if (score >= 80) return QualityTier::Excellent;
    if (score >= 60) return QualityTier::Good;
    if (score >= 40) return QualityTier::Fair;
    if (score > 0)   return QualityTier::Poor;
    return QualityTier::Unknown;
}

QString qualityTierLabel(QualityTier tier)
{
    switch (tier) {
    case QualityTier::Excellent: return QStringLiteral("Excellent");
    case QualityTier::Good:      return QStringLiteral("Good");
    case QualityTier::Fair:      return QStringLiteral("Fair");
    case QualityTier::Poor:      return QStringLiteral("Poor");
    case QualityTier::Unknown:   return QStringLiteral("Unknown");
    }
    return QStringLiteral("Unknown");
}

QString formatBytes(qint64 bytes)
{
    double size = double(bytes);
    const char* units[] = { "B", "KB", "MB", "GB", "TB" };
    int unit = 0;
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        ++unit;
    }
    return QStringLiteral("%1 %2").arg(size, 0, 'f', unit == 0 ? 0 : 2)
                                  .arg(QLatin1String(units[unit]));
}
