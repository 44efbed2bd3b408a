#include "ImportVetter.h"
#include "LibraryCatalog.h"
#include "LibraryIndexer.h"
#include "HashCalculator.h"
#include "../audio/IMetadataExtractor.h"
#include "../ICurationEventSink.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>
#include <QDebug>
#include <QElapsedTimer>
#include <QThreadPool>
#include <QtConcurrent>

const QString ImportVetter::kNewSongsFile   = QStringLiteral("new_songs.txt");
const QString ImportVetter::kDuplicatesFile = QStringLiteral("duplicates.txt");
const QString ImportVetter::kUncertainFile  = QStringLiteral("uncertain.txt");
const QString ImportVetter::kPreviouslyReviewedFile = QStringLiteral("previously_reviewed.txt");

QString vettingStateName(VettingState state)
{
    switch (state) {
    case VettingState::Idle:        return QStringLiteral("Idle");
    case VettingState::Scanning:    return QStringLiteral("Scanning");
    case VettingState::Matching:    return QStringLiteral("Matching");
    case VettingState::Summarizing: return QStringLiteral("Summarizing");
    case VettingState::Done:        return QStringLiteral("Done");
    case VettingState::Stopped:     return QStringLiteral("Stopped");
    case VettingState::Failed:      return QStringLiteral("Failed");
    }
    return QStringLiteral("Idle");
}

ImportVetter::ImportVetter(LibraryCatalog* catalog, IMetadataExtractor* extractor,
                           const CurationConfig& config, ICurationEventSink* sink)
    : m_catalog(catalog)
    , m_extractor(extractor)
    , m_config(config)
    , m_sink(sink ? sink : NullEventSink::instance())
    , m_matcher(std::make_unique<DuplicateMatcher>(catalog))
{
    m_matcher->setUncertainFloor(config.uncertainFloor);
    m_matcher->setUseContentHash(config.useContentHash);
    m_matcher->setThreshold(config.threshold);
}

ImportVetter::~ImportVetter() = default;

// ── Worker: extract, hash, match (read-only) ────────────────────────
ImportVetter::Checked ImportVetter::checkOne(const QString& filePath, double threshold) const
{
    Checked out;
    LibraryFile& f = out.file;
    f.filePath = filePath;

    QFileInfo fi(filePath);
    if (!fi.exists() || !fi.isReadable()) {
        out.error = CurationError::IOError;
        out.message = QStringLiteral("Cannot read %1").arg(filePath);
        return out;
    }
    f.filename = fi.fileName();
    f.fileFormat = fi.suffix().toLower();
    f.fileSize = fi.size();
    f.fileMtime = fi.lastModified().toSecsSinceEpoch();

    QString tagError;
    if (!m_extractor || !m_extractor->extract(filePath, f, &tagError))
        qDebug() << "[Vetter] No tags for" << filePath << tagError;

    f.metadataHash = HashCalculator::metadataHash(f.artist, f.title);
    if (m_config.useContentHash) {
        CurationError hashError = CurationError::None;
        f.contentHash = HashCalculator::contentHash(filePath, &hashError, &out.message);
        if (hashError != CurationError::None) {
            out.error = hashError;
            return out;
        }
    }

    out.verdict = m_matcher->match(f, threshold);
    if (out.verdict.status == MatchStatus::New) {
        if (auto seen = m_catalog->reviewedAt(f.filename))
            out.reviewedAt = seen->isValid() ? *seen : QDateTime::fromSecsSinceEpoch(0, Qt::UTC);
    }
    return out;
}

VettingReport ImportVetter::vet(const QString& importFolder, double threshold,
                                const ExportFlags& exportFlags)
{
    VettingReport report;
    QElapsedTimer total; total.start();
    QElapsedTimer step;
    m_stopRequested = false;

    auto fail = [&](CurationError error, const QString& msg) {
        report.error = error;
        report.errorMessage = msg;
        m_state = VettingState::Failed;
        qWarning() << "[Vetter]" << msg;
        return report;
    };

    if (threshold < 0.0 || threshold > 1.0)
        return fail(CurationError::ValidationFailure,
                    QStringLiteral("Threshold must be between 0.0 and 1.0, got %1").arg(threshold));
    if (!m_catalog || !m_catalog->isOpen())
        return fail(CurationError::CatalogError, QStringLiteral("Catalog is not open"));

    QFileInfo root(importFolder);
    if (importFolder.isEmpty() || !root.exists() || !root.isDir())
        return fail(CurationError::IOError,
                    QStringLiteral("Import folder is not a directory: %1").arg(importFolder));

    const QString folder = root.absoluteFilePath();
    report.session.importFolder = folder;
    report.session.thresholdUsed = threshold;

    // ── Scanning ─────────────────────────────────────────────────────
    m_state = VettingState::Scanning;
    step.start();
    const QStringList files = LibraryIndexer::collectAudioFiles(folder, &m_stopRequested);
    report.session.fileCount = files.size();
    qDebug() << "[Vetter] Found" << files.size() << "music files to vet in" << folder;
    m_sink->onPhaseComplete(QStringLiteral("scan"), step.elapsed());

    // ── Matching ─────────────────────────────────────────────────────
    m_state = VettingState::Matching;
    step.restart();
    QThreadPool pool;
    pool.setMaxThreadCount(m_config.effectiveWorkerThreads());
    const int batchSize = qMax(1, m_config.batchSize);
    int done = 0;

    auto worker = [this, threshold](const QString& path) { return checkOne(path, threshold); };

    for (int i = 0; i < files.size(); i += batchSize) {
        if (m_stopRequested) break;
        const QList<Checked> batch =
            QtConcurrent::blockingMapped(&pool, files.mid(i, batchSize), worker);

        for (const Checked& c : batch) {
            ++done;
            m_sink->onFileProcessed(c.file.filePath, done, files.size());

            if (c.error != CurationError::None) {
                report.errors.append({ c.file.filePath, c.error, c.message });
                continue;
            }
            ClassifiedFile cf{ c.file, c.verdict, c.reviewedAt };
            switch (c.verdict.status) {
            case MatchStatus::New:
                if (c.reviewedAt.isValid())
                    report.previouslyReviewed.append(cf);
                else
                    report.newSongs.append(cf);
                break;
            case MatchStatus::Duplicate: report.duplicates.append(cf); break;
            case MatchStatus::Uncertain: report.uncertain.append(cf); break;
            }
        }
    }
    qDebug() << "[TIMING] Vetting match phase:" << done << "files in" << step.elapsed() << "ms";
    m_sink->onPhaseComplete(QStringLiteral("match"), step.elapsed());

    // ── Summarizing ──────────────────────────────────────────────────
    m_state = VettingState::Summarizing;
    VettingSession& s = report.session;
    s.newCount = report.newSongs.size();
    s.duplicateCount = report.duplicates.size();
    s.uncertainCount = report.uncertain.size();
    s.previouslyReviewedCount = report.previouslyReviewed.size();
    s.errorCount = report.errors.size();
    s.scannedAt = QDateTime::currentDateTimeUtc();
    s.stopped = m_stopRequested;
    report.unprocessed = files.size() - done;

    s.id = m_catalog->saveVettingSession(s);
    if (s.id <= 0)
        qWarning() << "[Vetter] Could not save vetting history for" << folder;

    if (s.stopped) {
        report.durationSeconds = total.elapsed() / 1000.0;
        qWarning() << "[Vetter] Stopped -" << done << "of" << s.fileCount << "files checked,"
                   << report.unprocessed << "left unchecked, no exports written";
        m_state = VettingState::Stopped;
        return report;
    }

    if (exportFlags.any()) {
        QString exportError;
        if (!writeExports(report, exportFlags, &exportError)) {
            qWarning() << "[Vetter] Export failed:" << exportError;
            report.errors.append({ exportFlags.outputDir, CurationError::IOError, exportError });
        }
    }

    report.durationSeconds = total.elapsed() / 1000.0;
    qDebug() << "[Vetter] Done -" << s.fileCount << "files:"
             << s.newCount << "new," << s.duplicateCount << "duplicates,"
             << s.uncertainCount << "uncertain," << s.previouslyReviewedCount
             << "previously reviewed," << s.errorCount << "errors in"
             << total.elapsed() << "ms";
    m_state = VettingState::Done;
    return report;
}

// ── Candidate history ───────────────────────────────────────────────
ReviewRecordResult ImportVetter::recordReviewed(const QString& folder)
{
    ReviewRecordResult result;
    if (!m_catalog || !m_catalog->isOpen()) {
        result.error = CurationError::CatalogError;
        result.errorMessage = QStringLiteral("Catalog is not open");
        qWarning() << "[Vetter]" << result.errorMessage;
        return result;
    }
    QFileInfo root(folder);
    if (folder.isEmpty() || !root.isDir()) {
        result.error = CurationError::IOError;
        result.errorMessage = QStringLiteral("Import folder is not a directory: %1").arg(folder);
        qWarning() << "[Vetter]" << result.errorMessage;
        return result;
    }

    m_stopRequested = false;
    const QStringList files = LibraryIndexer::collectAudioFiles(root.absoluteFilePath(), &m_stopRequested);
    result.total = files.size();
    for (const QString& path : files) {
        bool added = false;
        if (!m_catalog->addReviewedFile(QFileInfo(path).fileName(), path, &added)) {
            result.errors.append({ path, CurationError::CatalogError,
                                   QStringLiteral("Cannot record %1 as reviewed").arg(path) });
            continue;
        }
        if (added)
            ++result.added;
        else
            ++result.alreadyRecorded;
    }
    qDebug() << "[Vetter] Recorded" << result.added << "reviewed files,"
             << result.alreadyRecorded << "already known," << result.errors.size() << "errors";
    return result;
}

// ── Exports ─────────────────────────────────────────────────────────
static QString percent(double confidence)
{
    return QString::number(qRound(confidence * 100.0)) + QLatin1Char('%');
}

enum class ExportLayout { PathsOnly, MatchedTo, PossibleMatch, ReviewedOn };

static bool writeList(const QString& path, const QString& heading, const VettingReport& report,
                      const QVector<ClassifiedFile>& entries, ExportLayout layout, QString* errorString)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        if (errorString)
            *errorString = QStringLiteral("Cannot write %1: %2").arg(path, file.errorString());
        return false;
    }

    QTextStream out(&file);
    out << "# " << heading << " from " << report.session.importFolder << '\n';
    out << "# Generated: " << report.session.scannedAt.toString(Qt::ISODate) << '\n';
    out << "# Total: " << entries.size() << "\n\n";

    for (const ClassifiedFile& cf : entries) {
        out << cf.file.filePath << '\n';
        if (layout == ExportLayout::PathsOnly)
            continue;
        if (layout == ExportLayout::ReviewedOn) {
            out << "  -> Reviewed: " << cf.reviewedAt.toString(Qt::ISODate) << "\n\n";
            continue;
        }
        const QString matched = cf.verdict.match ? cf.verdict.match->displayName()
                                                 : QStringLiteral("Unknown");
        out << (layout == ExportLayout::MatchedTo ? "  -> Matches: " : "  -> Possible Match: ")
            << matched << '\n';
        out << "  -> Confidence: " << percent(cf.verdict.confidence) << '\n';
        out << "  -> Type: " << matchTypeName(cf.verdict.matchType) << '\n';
        out << '\n';
    }
    out.flush();

    if (file.error() != QFileDevice::NoError) {
        if (errorString)
            *errorString = QStringLiteral("Write error on %1: %2").arg(path, file.errorString());
        return false;
    }
    return true;
}

bool ImportVetter::writeExports(VettingReport& report, const ExportFlags& flags, QString* errorString)
{
    const QString dirPath = flags.outputDir.isEmpty() ? report.session.importFolder : flags.outputDir;
    QDir dir(dirPath);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        if (errorString) *errorString = QStringLiteral("Cannot create %1").arg(dirPath);
        return false;
    }

    bool ok = true;
    auto write = [&](const QString& name, const QString& heading,
                     const QVector<ClassifiedFile>& entries, ExportLayout layout) {
        const QString path = dir.filePath(name);
        QString err;
        if (writeList(path, heading, report, entries, layout, &err)) {
            report.exportedFiles.append(path);
            qDebug() << "[Vetter] Exported" << entries.size() << "entries to" << path;
        } else {
            ok = false;
            if (errorString) *errorString = err;
        }
    };

    if (flags.newSongs)
        write(kNewSongsFile, QStringLiteral("New Songs"), report.newSongs, ExportLayout::PathsOnly);
    if (flags.duplicates)
        write(kDuplicatesFile, QStringLiteral("Duplicates"), report.duplicates, ExportLayout::MatchedTo);
    if (flags.uncertain)
        write(kUncertainFile, QStringLiteral("Uncertain Matches"), report.uncertain, ExportLayout::PossibleMatch);
    if (flags.previouslyReviewed)
        write(kPreviouslyReviewedFile, QStringLiteral("Previously Reviewed"), report.previouslyReviewed,
              ExportLayout::ReviewedOn);
    return ok;
}
