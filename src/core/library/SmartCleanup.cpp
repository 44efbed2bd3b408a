#include "SmartCleanup.h"
#include "LibraryCatalog.h"
#include "HashCalculator.h"
#include "BackupManager.h"
#include "ICleanupReviewer.h"
#include "../ICurationEventSink.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>
#include <QTextStream>
#include <QDebug>
#include <QElapsedTimer>
#include <QMap>
#include <algorithm>
#include <climits>

QString cleanupStateName(CleanupState state)
{
    switch (state) {
    case CleanupState::Idle:       return QStringLiteral("Idle");
    case CleanupState::Scanning:   return QStringLiteral("Scanning");
    case CleanupState::Reviewing:  return QStringLiteral("Reviewing");
    case CleanupState::Validating: return QStringLiteral("Validating");
    case CleanupState::BackingUp:  return QStringLiteral("BackingUp");
    case CleanupState::Deleting:   return QStringLiteral("Deleting");
    case CleanupState::Reporting:  return QStringLiteral("Reporting");
    case CleanupState::Done:       return QStringLiteral("Done");
    case CleanupState::Cancelled:  return QStringLiteral("Cancelled");
    case CleanupState::Failed:     return QStringLiteral("Failed");
    }
    return QStringLiteral("Idle");
}

QString cleanupModeName(CleanupMode mode)
{
    return mode == CleanupMode::Thorough ? QStringLiteral("thorough") : QStringLiteral("fast");
}

// ── CleanupPlan ─────────────────────────────────────────────────────

int CleanupPlan::filesToDelete() const
{
    int n = 0;
    for (const DuplicateGroup& g : groups)
        n += g.deleteCandidates().size();
    return n;
}

qint64 CleanupPlan::bytesToRecover() const
{
    qint64 total = 0;
    for (const DuplicateGroup& g : groups)
        total += g.reclaimableBytes();
    return total;
}

// ── Union-find over catalog rows ────────────────────────────────────
class DisjointSet {
public:
    explicit DisjointSet(int n) : m_parent(n)
    {
        for (int i = 0; i < n; ++i) m_parent[i] = i;
    }

    int find(int x)
    {
        while (m_parent[x] != x) {
            m_parent[x] = m_parent[m_parent[x]];
            x = m_parent[x];
        }
        return x;
    }

    void unite(int a, int b)
    {
        a = find(a);
        b = find(b);
        if (a == b) return;
        if (b < a) std::swap(a, b);
        m_parent[b] = a;
    }

private:
    QVector<int> m_parent;
};

static QString bitrateType(const LibraryFile& f)
{
    if (f.variableBitrate) return QStringLiteral("vbr");
    if (f.bitrate > 0) return QStringLiteral("cbr");
    return QStringLiteral("unknown");
}

static QString csvField(const QString& value)
{
    if (value.contains(QLatin1Char(',')) || value.contains(QLatin1Char('"'))
        || value.contains(QLatin1Char('\n'))) {
        QString escaped = value;
        escaped.replace(QLatin1Char('"'), QStringLiteral("\"\""));
        return QLatin1Char('"') + escaped + QLatin1Char('"');
    }
    return value;
}

static QJsonObject fileToJson(const LibraryFile& f, int score)
{
    QJsonObject o;
    o[QStringLiteral("id")] = double(f.id);
    o[QStringLiteral("file_path")] = f.filePath;
    o[QStringLiteral("artist")] = f.artist;
    o[QStringLiteral("title")] = f.title;
    o[QStringLiteral("format")] = f.fileFormat;
    o[QStringLiteral("bitrate")] = f.bitrate;
    o[QStringLiteral("bitrate_type")] = bitrateType(f);
    o[QStringLiteral("sample_rate")] = f.sampleRate;
    o[QStringLiteral("file_size")] = double(f.fileSize);
    o[QStringLiteral("quality_score")] = score;
    o[QStringLiteral("quality_tier")] = qualityTierLabel(qualityTierForScore(score));
    return o;
}

static QJsonObject groupToJson(const DuplicateGroup& g)
{
    QJsonObject o;
    o[QStringLiteral("group_id")] = g.groupId;
    if (const LibraryFile* k = g.keeper())
        o[QStringLiteral("keep")] = fileToJson(*k, g.qualityScores.value(g.keeperIndex));

    QJsonArray del;
    int minScore = INT_MAX, maxScore = INT_MIN;
    for (int i = 0; i < g.members.size(); ++i) {
        const int s = g.qualityScores.value(i);
        minScore = qMin(minScore, s);
        maxScore = qMax(maxScore, s);
        if (i != g.keeperIndex)
            del.append(fileToJson(g.members[i], s));
    }
    o[QStringLiteral("delete")] = del;
    o[QStringLiteral("space_savings_mb")] = g.reclaimableBytes() / (1024.0 * 1024.0);
    if (!g.members.isEmpty())
        o[QStringLiteral("quality_range")] = QJsonArray{ minScore, maxScore };

    QJsonArray checks;
    for (const ValidationResult& r : g.validation) {
        QJsonObject c;
        c[QStringLiteral("level")] = validationLevelName(r.level);
        c[QStringLiteral("checkpoint")] = r.checkpoint;
        c[QStringLiteral("message")] = r.message;
        checks.append(c);
    }
    o[QStringLiteral("validation")] = checks;
    return o;
}


// ═════════════════════════════════════════════════════════════════════
//  SmartCleanup
// ═════════════════════════════════════════════════════════════════════

SmartCleanup::SmartCleanup(LibraryCatalog* catalog, const CurationConfig& config,
                           ICleanupReviewer* reviewer, ICurationEventSink* sink)
    : m_catalog(catalog)
    , m_config(config)
    , m_reviewer(reviewer)
    , m_sink(sink ? sink : NullEventSink::instance())
    , m_scorer(config.weights)
    , m_similarity(std::make_unique<SequenceSimilarity>())
{
}

SmartCleanup::~SmartCleanup() = default;

void SmartCleanup::setSimilarityStrategy(std::unique_ptr<ISimilarityStrategy> strategy)
{
    if (strategy)
        m_similarity = std::move(strategy);
}

void SmartCleanup::setState(CleanupState state)
{
    m_state = state;
    qDebug() << "[Cleanup] State:" << cleanupStateName(state);
}

// ── Scanning ────────────────────────────────────────────────────────
QVector<DuplicateGroup> SmartCleanup::findGroups(CleanupMode mode, int* scanned) const
{
    const QVector<LibraryFile> files = m_catalog->allFiles(true);
    if (scanned) *scanned = files.size();

    DisjointSet sets(files.size());

    QHash<QString, int> byMeta;
    for (int i = 0; i < files.size(); ++i) {
        const QString& h = files[i].metadataHash;
        if (HashCalculator::isSentinel(h)) continue;
        auto it = byMeta.constFind(h);
        if (it == byMeta.constEnd()) byMeta.insert(h, i);
        else sets.unite(it.value(), i);
    }

    if (mode == CleanupMode::Thorough) {
        QHash<QString, int> byContent;
        QHash<QString, QVector<int>> byArtist;
        for (int i = 0; i < files.size(); ++i) {
            const QString& h = files[i].contentHash;
            if (HashCalculator::isUsableContentHash(h)) {
                auto it = byContent.constFind(h);
                if (it == byContent.constEnd()) byContent.insert(h, i);
                else sets.unite(it.value(), i);
            }
            const QString key = HashCalculator::normalizeArtistKey(files[i].artist);
            if (!key.isEmpty())
                byArtist[key].append(i);
        }

        for (auto it = byArtist.constBegin(); it != byArtist.constEnd(); ++it) {
            const QVector<int>& bucket = it.value();
            QVector<QString> names;
            names.reserve(bucket.size());
            for (int idx : bucket)
                names.append(normalizeFilename(files[idx].filename.isEmpty()
                                               ? QFileInfo(files[idx].filePath).fileName()
                                               : files[idx].filename));
            for (int a = 0; a < bucket.size(); ++a) {
                if (names[a].isEmpty()) continue;
                for (int b = a + 1; b < bucket.size(); ++b) {
                    if (names[b].isEmpty()) continue;
                    if (m_similarity->similarity(names[a], names[b]) >= m_config.threshold)
                        sets.unite(bucket[a], bucket[b]);
                }
            }
        }
    }

    // Collect by root; roots are the lowest index so output order follows
    // catalog order.
    QMap<int, QVector<int>> members;
    for (int i = 0; i < files.size(); ++i)
        members[sets.find(i)].append(i);

    QVector<DuplicateGroup> groups;
    for (auto it = members.constBegin(); it != members.constEnd(); ++it) {
        if (it.value().size() < 2) continue;
        DuplicateGroup g;
        g.groupId = QStringLiteral("dup_%1").arg(groups.size() + 1, 4, 10, QLatin1Char('0'));
        for (int idx : it.value())
            g.members.append(files[idx]);
        groups.append(g);
    }
    return groups;
}

// ── Reviewing ───────────────────────────────────────────────────────
void SmartCleanup::rankGroups(QVector<DuplicateGroup>& groups) const
{
    for (DuplicateGroup& g : groups) {
        g.qualityScores.clear();
        for (const LibraryFile& f : g.members)
            g.qualityScores.append(m_scorer.score(f).total);
        const QVector<int> order = m_scorer.rankGroup(g.members);
        g.keeperIndex = order.isEmpty() ? -1 : order.first();
    }
}

void SmartCleanup::review(QVector<DuplicateGroup>& groups)
{
    if (!m_reviewer) return;
    for (DuplicateGroup& g : groups) {
        if (m_cancelRequested) return;
        const ReviewDecision d = m_reviewer->reviewGroup(g);
        switch (d.action) {
        case ReviewDecision::Action::Accept:
            break;
        case ReviewDecision::Action::KeepAll:
            g.excluded = true;
            qDebug() << "[Cleanup]" << g.groupId << "kept in full by reviewer";
            break;
        case ReviewDecision::Action::ChangeKeeper:
            if (d.keeperIndex >= 0 && d.keeperIndex < g.members.size()) {
                g.keeperIndex = d.keeperIndex;
            } else {
                qWarning() << "[Cleanup]" << g.groupId << "reviewer keeper index" << d.keeperIndex
                           << "out of range, keeping recommendation";
            }
            break;
        }
    }
}

CleanupPlan SmartCleanup::buildPlan(const QVector<DuplicateGroup>& groups, const QString& backupDir) const
{
    CleanupPlan plan;
    plan.backupDir = backupDir;
    plan.dryRun = m_config.dryRun;
    for (const DuplicateGroup& g : groups) {
        if (g.isValid())
            plan.groups.append(g);
    }
    return plan;
}

CleanupReport SmartCleanup::finish(CleanupReport& report, CleanupState state)
{
    setState(state);
    report.finalState = state;
    return report;
}

// ── run ─────────────────────────────────────────────────────────────
CleanupReport SmartCleanup::run(CleanupMode mode, const QString& backupDir)
{
    CleanupReport report;
    report.mode = mode;
    report.dryRun = m_config.dryRun;
    report.sessionId = QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd_HHmmss"));
    m_cancelRequested = false;

    auto fail = [&](CurationError error, const QString& msg) {
        report.error = error;
        report.errorMessage = msg;
        qWarning() << "[Cleanup]" << msg;
        return finish(report, CleanupState::Failed);
    };

    if (!m_catalog || !m_catalog->isOpen())
        return fail(CurationError::CatalogError, QStringLiteral("Catalog is not open"));
    if (!m_config.dryRun && backupDir.isEmpty())
        return fail(CurationError::BackupFailure, QStringLiteral("No backup directory configured"));

    // ── Scanning ─────────────────────────────────────────────────────
    QElapsedTimer scanTimer; scanTimer.start();
    setState(CleanupState::Scanning);
    QVector<DuplicateGroup> groups = findGroups(mode, &report.totalFilesScanned);
    report.groupsFound = groups.size();
    qDebug() << "[Cleanup]" << cleanupModeName(mode) << "scan:" << report.totalFilesScanned
             << "files," << groups.size() << "duplicate groups";

    // ── Reviewing ────────────────────────────────────────────────────
    setState(CleanupState::Reviewing);
    rankGroups(groups);
    review(groups);
    report.scanDuration = scanTimer.elapsed() / 1000.0;
    m_sink->onPhaseComplete(QStringLiteral("scan"), scanTimer.elapsed());
    if (m_cancelRequested) {
        report.groups = groups;
        return finish(report, CleanupState::Cancelled);
    }

    // ── Validating ───────────────────────────────────────────────────
    QElapsedTimer cleanupTimer; cleanupTimer.start();
    setState(CleanupState::Validating);
    SafetyValidator validator(&m_scorer, m_config.minFreeSpaceMarginBytes);
    validator.setBackupDirectory(backupDir);
    for (DuplicateGroup& g : groups) {
        if (g.excluded) {
            ++report.groupsExcluded;
            continue;
        }
        g.validation = validator.validate(g, false);
        const bool passed = !g.hasErrors();
        if (passed) {
            ++report.groupsValidated;
        } else {
            ++report.groupsExcluded;
            for (const ValidationResult& r : g.errors()) {
                qWarning() << "[Cleanup]" << g.groupId << r.checkpoint << "-" << r.message;
                report.errors.append({ g.keeper() ? g.keeper()->filePath : QString(),
                                       CurationError::ValidationFailure,
                                       g.groupId + QStringLiteral(": ") + r.message });
            }
        }
        m_sink->onGroupValidated(g.groupId, passed);
    }

    // Backup space is judged once for everything the batch will copy.
    if (!m_config.dryRun) {
        QVector<DuplicateGroup> passing;
        for (const DuplicateGroup& g : groups) {
            if (g.isValid())
                passing.append(g);
        }
        if (!passing.isEmpty()) {
            const ValidationResult space = validator.checkBackupSpace(passing);
            if (space.level == ValidationLevel::Warning)
                qWarning() << "[Cleanup]" << space.checkpoint << "-" << space.message;
            for (DuplicateGroup& g : groups) {
                if (g.isValid())
                    g.validation.append(space);
            }
        }
    }
    report.groups = groups;

    CleanupPlan plan = buildPlan(groups, backupDir);
    plan.sessionId = report.sessionId;

    // Keep rows for every validated group go into the report regardless of
    // what happens to the candidates.
    QHash<QString, QString> candidateAction;   // path -> action
    for (const DuplicateGroup& g : plan.groups) {
        for (const LibraryFile& f : g.deleteCandidates())
            candidateAction.insert(f.filePath, m_config.dryRun ? QStringLiteral("PLANNED_DELETE")
                                                               : QStringLiteral("DELETE"));
    }

    if (plan.groups.isEmpty()) {
        qDebug() << "[Cleanup] Nothing to delete";
    } else if (!m_config.dryRun) {
        // ── Confirmation gate ────────────────────────────────────────
        if (m_cancelRequested || !m_reviewer || !m_reviewer->confirmDeletion(plan)) {
            qDebug() << "[Cleanup] Deletion not confirmed, nothing touched";
            return finish(report, CleanupState::Cancelled);
        }

        // ── BackingUp ────────────────────────────────────────────────
        setState(CleanupState::BackingUp);
        QStringList toBackUp;
        for (const DuplicateGroup& g : plan.groups) {
            for (const LibraryFile& f : g.deleteCandidates())
                toBackUp.append(f.filePath);
        }

        BackupManager backups(backupDir);
        QString backupError;
        auto manifest = backups.backupFiles(toBackUp, &backupError, &m_cancelRequested);
        if (!manifest) {
            if (m_cancelRequested)
                return finish(report, CleanupState::Cancelled);
            return fail(CurationError::BackupFailure,
                        QStringLiteral("Backup failed, no files deleted: %1").arg(backupError));
        }
        report.manifestPath = manifest->manifestPath();
        m_sink->onPhaseComplete(QStringLiteral("backup"), cleanupTimer.elapsed());

        // ── Deleting ─────────────────────────────────────────────────
        setState(CleanupState::Deleting);
        int done = 0;
        const int total = toBackUp.size();
        for (const DuplicateGroup& g : plan.groups) {
            for (const LibraryFile& f : g.deleteCandidates()) {
                ++done;
                m_sink->onFileProcessed(f.filePath, done, total);

                const qint64 size = QFileInfo(f.filePath).size();
                QFile file(f.filePath);
                if (!file.remove()) {
                    ++report.deleteFailures;
                    candidateAction.insert(f.filePath, QStringLiteral("DELETE_FAILED"));
                    report.errors.append({ f.filePath, CurationError::DeleteFailure, file.errorString() });
                    qWarning() << "[Cleanup] Failed to delete" << f.filePath << file.errorString();
                    continue;
                }
                ++report.filesDeleted;
                report.bytesRecovered += size;
                qDebug() << "[Cleanup] Deleted:" << f.filePath;

                if (f.id > 0 && !m_catalog->markInactive(f.id))
                    report.errors.append({ f.filePath, CurationError::CatalogError,
                                           QStringLiteral("Deleted but could not mark inactive") });
            }
        }
        m_sink->onPhaseComplete(QStringLiteral("delete"), cleanupTimer.elapsed());
    }

    report.cleanupDuration = cleanupTimer.elapsed() / 1000.0;

    // ── Reporting ────────────────────────────────────────────────────
    setState(CleanupState::Reporting);
    for (const DuplicateGroup& g : plan.groups) {
        for (int i = 0; i < g.members.size(); ++i) {
            CleanupAction a;
            a.groupId = g.groupId;
            a.file = g.members[i];
            a.qualityScore = g.qualityScores.value(i);
            a.action = i == g.keeperIndex ? QStringLiteral("KEEP")
                                          : candidateAction.value(g.members[i].filePath);
            report.actions.append(a);
        }
    }

    const QString reportsDir = !m_config.reportsDir.isEmpty() ? m_config.reportsDir : backupDir;
    if (!reportsDir.isEmpty() && !writeReports(report, reportsDir))
        report.errors.append({ reportsDir, CurationError::IOError, QStringLiteral("Could not write cleanup reports") });

    qDebug() << "[Cleanup] Complete -" << report.groupsFound << "groups,"
             << report.groupsValidated << "validated," << report.groupsExcluded << "excluded,"
             << report.filesDeleted << "deleted," << report.deleteFailures << "failed,"
             << formatBytes(report.bytesRecovered) << "recovered"
             << (report.dryRun ? "(dry run)" : "");
    return finish(report, CleanupState::Done);
}

// ── Reports ─────────────────────────────────────────────────────────
bool SmartCleanup::writeReports(CleanupReport& report, const QString& dir) const
{
    QDir d(dir);
    if (!d.exists() && !d.mkpath(QStringLiteral("."))) {
        qWarning() << "[Cleanup] Cannot create reports directory" << dir;
        return false;
    }

    // CSV
    const QString csvPath = d.filePath(QStringLiteral("cleanup_report_%1.csv").arg(report.sessionId));
    QSaveFile csv(csvPath);
    if (!csv.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qWarning() << "[Cleanup] Cannot write" << csvPath << csv.errorString();
        return false;
    }
    {
        QTextStream out(&csv);
        out << "Group ID,Action,File Path,Format,Quality Score,File Size MB,Bitrate Type,Sample Rate\n";
        for (const CleanupAction& a : report.actions) {
            out << csvField(a.groupId) << ','
                << a.action << ','
                << csvField(a.file.filePath) << ','
                << csvField(a.file.fileFormat) << ','
                << a.qualityScore << ','
                << QString::number(a.file.fileSize / (1024.0 * 1024.0), 'f', 2) << ','
                << bitrateType(a.file) << ','
                << (a.file.sampleRate > 0 ? QString::number(a.file.sampleRate) : QStringLiteral("N/A"))
                << '\n';
        }
    }
    if (!csv.commit()) {
        qWarning() << "[Cleanup] Cannot commit" << csvPath << csv.errorString();
        return false;
    }
    report.csvReportPath = csvPath;

    // JSON
    QJsonObject stats;
    stats[QStringLiteral("total_files_scanned")] = report.totalFilesScanned;
    stats[QStringLiteral("duplicate_groups_found")] = report.groupsFound;
    stats[QStringLiteral("groups_validated")] = report.groupsValidated;
    stats[QStringLiteral("groups_excluded")] = report.groupsExcluded;
    stats[QStringLiteral("files_deleted")] = report.filesDeleted;
    stats[QStringLiteral("delete_failures")] = report.deleteFailures;
    stats[QStringLiteral("space_freed_mb")] = report.bytesRecovered / (1024.0 * 1024.0);
    stats[QStringLiteral("scan_duration")] = report.scanDuration;
    stats[QStringLiteral("cleanup_duration")] = report.cleanupDuration;

    QJsonArray groups;
    QJsonArray excluded;
    for (const DuplicateGroup& g : report.groups) {
        if (g.isValid()) {
            groups.append(groupToJson(g));
        } else {
            QJsonObject e;
            e[QStringLiteral("group_id")] = g.groupId;
            e[QStringLiteral("reason")] = g.excluded ? QStringLiteral("kept by reviewer")
                                                     : QStringLiteral("validation failed");
            excluded.append(e);
        }
    }

    QJsonObject root;
    root[QStringLiteral("session_id")] = report.sessionId;
    root[QStringLiteral("timestamp")] = QDateTime::currentDateTime().toString(Qt::ISODate);
    root[QStringLiteral("mode")] = cleanupModeName(report.mode);
    root[QStringLiteral("dry_run")] = report.dryRun;
    root[QStringLiteral("manifest")] = report.manifestPath;
    root[QStringLiteral("statistics")] = stats;
    root[QStringLiteral("groups")] = groups;
    root[QStringLiteral("excluded_groups")] = excluded;

    const QString jsonPath = d.filePath(QStringLiteral("cleanup_report_%1.json").arg(report.sessionId));
    QSaveFile json(jsonPath);
    if (!json.open(QIODevice::WriteOnly)) {
        qWarning() << "[Cleanup] Cannot write" << jsonPath << json.errorString();
        return false;
    }
    json.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!json.commit()) {
        qWarning() << "[Cleanup] Cannot commit" << jsonPath << json.errorString();
        return false;
    }
    report.jsonReportPath = jsonPath;

    qDebug() << "[Cleanup] Reports exported:" << csvPath << jsonPath;
    return true;
}

bool SmartCleanup::exportPlan(const CleanupPlan& plan, const QString& filePath, QString* errorString)
{
    QJsonObject meta;
    meta[QStringLiteral("created")] = QDateTime::currentDateTime().toString(Qt::ISODate);
    meta[QStringLiteral("session_id")] = plan.sessionId;
    meta[QStringLiteral("total_groups")] = plan.groups.size();
    meta[QStringLiteral("files_to_delete")] = plan.filesToDelete();
    meta[QStringLiteral("bytes_to_recover")] = double(plan.bytesToRecover());
    meta[QStringLiteral("backup_dir")] = plan.backupDir;
    meta[QStringLiteral("dry_run")] = plan.dryRun;

    QJsonArray groups;
    for (const DuplicateGroup& g : plan.groups)
        groups.append(groupToJson(g));

    QJsonObject root;
    root[QStringLiteral("metadata")] = meta;
    root[QStringLiteral("groups")] = groups;

    QDir().mkpath(QFileInfo(filePath).absolutePath());
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorString) *errorString = QStringLiteral("Cannot write %1: %2").arg(filePath, file.errorString());
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        if (errorString) *errorString = QStringLiteral("Cannot commit %1: %2").arg(filePath, file.errorString());
        return false;
    }
    qDebug() << "[Cleanup] Deletion plan exported to:" << filePath;
    return true;
}
