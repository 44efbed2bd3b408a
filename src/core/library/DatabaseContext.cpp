#include "DatabaseContext.h"

#include <QSqlQuery>
#include <QSqlRecord>
#include <QVariant>

const QString DatabaseContext::kFileColumns = QStringLiteral(
    "id, file_path, filename, artist, title, album, year, duration, file_format, "
    "bitrate, variable_bitrate, sample_rate, file_size, metadata_hash, "
    "file_content_hash, indexed_at, file_mtime, last_verified, is_active");

QString DatabaseContext::toIso(const QDateTime& dt)
{
    if (!dt.isValid()) return QString();
    return dt.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime DatabaseContext::fromIso(const QString& text)
{
    if (text.isEmpty()) return QDateTime();
    QDateTime dt = QDateTime::fromString(text, Qt::ISODateWithMs);
    if (!dt.isValid())
        dt = QDateTime::fromString(text, Qt::ISODate);
    return dt;
}

QString DatabaseContext::nowIso()
{
    return toIso(QDateTime::currentDateTimeUtc());
}

LibraryFile DatabaseContext::fileFromQuery(const QSqlQuery& query) const
{
    LibraryFile f;
    f.id              = query.value(QStringLiteral("id")).toLongLong();
    f.filePath        = query.value(QStringLiteral("file_path")).toString();
    f.filename        = query.value(QStringLiteral("filename")).toString();
    f.artist          = query.value(QStringLiteral("artist")).toString();
    f.title           = query.value(QStringLiteral("title")).toString();
    f.album           = query.value(QStringLiteral("album")).toString();
    f.year            = query.value(QStringLiteral("year")).toInt();
    f.duration        = query.value(QStringLiteral("duration")).toDouble();
    f.fileFormat      = query.value(QStringLiteral("file_format")).toString();
    f.bitrate         = query.value(QStringLiteral("bitrate")).toInt();
    f.variableBitrate = query.value(QStringLiteral("variable_bitrate")).toInt() != 0;
    f.sampleRate      = query.value(QStringLiteral("sample_rate")).toInt();
    f.fileSize        = query.value(QStringLiteral("file_size")).toLongLong();
    f.metadataHash    = query.value(QStringLiteral("metadata_hash")).toString();
    f.contentHash     = query.value(QStringLiteral("file_content_hash")).toString();
    f.indexedAt       = fromIso(query.value(QStringLiteral("indexed_at")).toString());
    f.fileMtime       = query.value(QStringLiteral("file_mtime")).toLongLong();
    f.lastVerified    = fromIso(query.value(QStringLiteral("last_verified")).toString());
    f.state = query.value(QStringLiteral("is_active")).toInt() != 0
        ? LifecycleState::Active : LifecycleState::Inactive;
    return f;
}

VettingSession DatabaseContext::sessionFromQuery(const QSqlQuery& query) const
{
    VettingSession s;
    s.id             = query.value(QStringLiteral("id")).toLongLong();
    s.importFolder   = query.value(QStringLiteral("import_folder")).toString();
    s.scannedAt      = fromIso(query.value(QStringLiteral("vetted_at")).toString());
    s.fileCount      = query.value(QStringLiteral("total_files")).toInt();
    s.duplicateCount = query.value(QStringLiteral("duplicates_found")).toInt();
    s.newCount       = query.value(QStringLiteral("new_songs")).toInt();
    s.uncertainCount = query.value(QStringLiteral("uncertain_matches")).toInt();
    s.thresholdUsed  = query.value(QStringLiteral("threshold_used")).toDouble();

    // error_count (migration column, may be missing in old stores)
    int errIdx = query.record().indexOf(QStringLiteral("error_count"));
    if (errIdx >= 0)
        s.errorCount = query.value(errIdx).toInt();
    int reviewedIdx = query.record().indexOf(QStringLiteral("previously_reviewed"));
    if (reviewedIdx >= 0)
        s.previouslyReviewedCount = query.value(reviewedIdx).toInt();
    int stoppedIdx = query.record().indexOf(QStringLiteral("stopped"));
    if (stoppedIdx >= 0)
        s.stopped = query.value(stoppedIdx).toInt() != 0;
    return s;
}
