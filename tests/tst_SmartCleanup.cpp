#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStorageInfo>
#include "library/SmartCleanup.h"
#include "library/ICleanupReviewer.h"
#include "library/BackupManager.h"
#include "library/LibraryIndexer.h"
#include "library/LibraryCatalog.h"
#include "FakeMetadataExtractor.h"
#include "RecordingEventSink.h"
#include "TestFiles.h"

class ScriptedReviewer : public ICleanupReviewer {
public:
    ReviewDecision reviewGroup(const DuplicateGroup& group) override
    {
        ++reviewed;
        if (keepAll)
            return ReviewDecision::keepAll();
        if (!keepSuffix.isEmpty()) {
            for (int i = 0; i < group.members.size(); ++i) {
                if (group.members[i].filePath.endsWith(keepSuffix))
                    return ReviewDecision::changeKeeper(i);
            }
        }
        return ReviewDecision::accept();
    }

    bool confirmDeletion(const CleanupPlan& plan) override
    {
        ++confirmations;
        plannedDeletes = plan.filesToDelete();
        if (removeLastCandidate && !plan.groups.isEmpty()) {
            removedPath = plan.groups.last().deleteCandidates().last().filePath;
            QFile::remove(removedPath);
        }
        return confirm;
    }

    bool confirm = true;
    bool removeLastCandidate = false;   // file vanishes between validation and backup
    QString removedPath;
    bool keepAll = false;
    QString keepSuffix;
    int reviewed = 0;
    int confirmations = 0;
    int plannedDeletes = 0;
};

static QStringList readLines(const QString& path)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text))
        return {};
    return QString::fromUtf8(f.readAll()).split(QLatin1Char('\n'), Qt::SkipEmptyParts);
}

class tst_SmartCleanup : public QObject {
    Q_OBJECT

private:
    QTemporaryDir m_dir;
    QString m_library;
    QString m_backups;
    QString m_flac;
    QString m_mp3;
    LibraryCatalog* m_catalog = nullptr;
    FakeMetadataExtractor m_extractor;

    void reindex()
    {
        LibraryIndexer indexer(m_catalog, &m_extractor);
        QVERIFY(indexer.index(m_library).success());
    }

private slots:
    void initTestCase()
    {
        QVERIFY(m_dir.isValid());
        m_catalog = new LibraryCatalog(m_dir.filePath(QStringLiteral("library.db")));
        QVERIFY(m_catalog->open());

        m_extractor.set(QStringLiteral("A.flac"), QStringLiteral("Artist"), QStringLiteral("Song"));
        m_extractor.set(QStringLiteral("A.mp3"), QStringLiteral("artist"), QStringLiteral("song"), 320);
        m_extractor.set(QStringLiteral("B.flac"), QStringLiteral("Artist"), QStringLiteral("Second"));
        m_extractor.set(QStringLiteral("B.mp3"), QStringLiteral("Artist"), QStringLiteral("Second"), 192);
        m_extractor.set(QStringLiteral("Track One.mp3"), QStringLiteral("Band"), QStringLiteral("Track One"), 256);
        m_extractor.set(QStringLiteral("Track One (Live).flac"), QStringLiteral("Band"),
                        QStringLiteral("Track One Live"));
    }

    void cleanupTestCase()
    {
        delete m_catalog;
        m_catalog = nullptr;
    }

    void init()
    {
        m_catalog->clearAllData();
        const QString name = QString::fromLatin1(QTest::currentTestFunction());
        m_library = QFileInfo(m_dir.filePath(QStringLiteral("lib_") + name)).absoluteFilePath();
        m_backups = m_dir.filePath(QStringLiteral("backups_") + name);
        m_flac = writeAudioFile(m_library, QStringLiteral("A.flac"), 8000, 'a');
        m_mp3 = writeAudioFile(m_library, QStringLiteral("A.mp3"), 3000, 'b');
        reindex();
    }

    // ── findGroups ───────────────────────────────────────────────
    void findGroups_fastUsesMetadataOnly()
    {
        writeAudioFile(m_library, QStringLiteral("Track One.mp3"), 2500, 'c');
        writeAudioFile(m_library, QStringLiteral("Track One (Live).flac"), 9000, 'd');
        writeAudioFile(m_library, QStringLiteral("untagged_1.ogg"), 1200, 'e');
        writeAudioFile(m_library, QStringLiteral("untagged_2.ogg"), 1200, 'e');
        reindex();

        SmartCleanup cleanup(m_catalog, CurationConfig(), nullptr);
        int scanned = 0;
        const QVector<DuplicateGroup> fast = cleanup.findGroups(CleanupMode::Fast, &scanned);
        QCOMPARE(scanned, 6);
        QCOMPARE(fast.size(), 1);
        QCOMPARE(fast.first().groupId, QStringLiteral("dup_0001"));
        QCOMPARE(fast.first().members.size(), 2);

        const QVector<DuplicateGroup> thorough = cleanup.findGroups(CleanupMode::Thorough);
        QCOMPARE(thorough.size(), 3);
        QCOMPARE(thorough.last().groupId, QStringLiteral("dup_0003"));
        for (const DuplicateGroup& g : thorough)
            QCOMPARE(g.members.size(), 2);
    }

    void rankGroups_picksLosslessKeeper()
    {
        SmartCleanup cleanup(m_catalog, CurationConfig(), nullptr);
        QVector<DuplicateGroup> groups = cleanup.findGroups(CleanupMode::Fast);
        cleanup.rankGroups(groups);
        QCOMPARE(groups.size(), 1);
        QVERIFY(groups.first().keeper());
        QCOMPARE(groups.first().keeper()->filePath, m_flac);
        QCOMPARE(groups.first().qualityScores.size(), 2);
        QCOMPARE(groups.first().reclaimableBytes(), qint64(3000));
    }

    // ── run ──────────────────────────────────────────────────────
    void run_deletesLowerQualityCopy()
    {
        ScriptedReviewer reviewer;
        RecordingEventSink sink;
        SmartCleanup cleanup(m_catalog, CurationConfig(), &reviewer, &sink);
        const CleanupReport report = cleanup.run(CleanupMode::Fast, m_backups);

        QVERIFY2(report.success(), qPrintable(report.errorMessage));
        QCOMPARE(cleanup.state(), CleanupState::Done);
        QCOMPARE(reviewer.reviewed, 1);
        QCOMPARE(reviewer.confirmations, 1);
        QCOMPARE(reviewer.plannedDeletes, 1);
        QCOMPARE(report.groupsFound, 1);
        QCOMPARE(report.groupsValidated, 1);
        QCOMPARE(report.filesDeleted, 1);
        QCOMPARE(report.bytesRecovered, qint64(3000));

        QVERIFY(QFileInfo::exists(m_flac));
        QVERIFY(!QFileInfo::exists(m_mp3));
        QVERIFY(!m_catalog->fileByPath(m_mp3)->isActive());
        QVERIFY(m_catalog->fileByPath(m_flac)->isActive());
        QCOMPARE(sink.passedGroups, QStringList{ QStringLiteral("dup_0001") });

        QVERIFY(QFileInfo::exists(report.manifestPath));
        auto manifest = BackupManager::loadManifest(report.manifestPath);
        QVERIFY(manifest.has_value());
        QCOMPARE(manifest->entries.size(), 1);
        QCOMPARE(manifest->entries.first().originalPath, m_mp3);
    }

    void run_writesReports()
    {
        ScriptedReviewer reviewer;
        SmartCleanup cleanup(m_catalog, CurationConfig(), &reviewer);
        const CleanupReport report = cleanup.run(CleanupMode::Fast, m_backups);
        QVERIFY(report.success());

        QVERIFY(report.csvReportPath.startsWith(m_backups));
        const QStringList csv = readLines(report.csvReportPath);
        QCOMPARE(csv.size(), 3);
        QCOMPARE(csv.at(0), QStringLiteral("Group ID,Action,File Path,Format,Quality Score,"
                                           "File Size MB,Bitrate Type,Sample Rate"));
        QVERIFY(csv.at(1).startsWith(QStringLiteral("dup_0001,KEEP,") + m_flac + QStringLiteral(",flac,")));
        QVERIFY(csv.at(2).startsWith(QStringLiteral("dup_0001,DELETE,") + m_mp3 + QStringLiteral(",mp3,")));
        QVERIFY(csv.at(2).endsWith(QStringLiteral(",cbr,44100")));

        QFile json(report.jsonReportPath);
        QVERIFY(json.open(QIODevice::ReadOnly));
        const QJsonObject root = QJsonDocument::fromJson(json.readAll()).object();
        QCOMPARE(root.value(QStringLiteral("session_id")).toString(), report.sessionId);
        QCOMPARE(root.value(QStringLiteral("mode")).toString(), QStringLiteral("fast"));
        QCOMPARE(root.value(QStringLiteral("manifest")).toString(), report.manifestPath);
        QCOMPARE(root.value(QStringLiteral("statistics")).toObject()
                     .value(QStringLiteral("files_deleted")).toInt(), 1);
        const QJsonObject group = root.value(QStringLiteral("groups")).toArray().first().toObject();
        QCOMPARE(group.value(QStringLiteral("keep")).toObject().value(QStringLiteral("file_path")).toString(),
                 m_flac);
        QCOMPARE(group.value(QStringLiteral("validation")).toArray().size(), 7);
    }

    void run_reportsDirOverridesBackupDir()
    {
        ScriptedReviewer reviewer;
        CurationConfig config;
        config.reportsDir = m_dir.filePath(QStringLiteral("reports"));
        SmartCleanup cleanup(m_catalog, config, &reviewer);
        const CleanupReport report = cleanup.run(CleanupMode::Fast, m_backups);
        QVERIFY(report.jsonReportPath.startsWith(config.reportsDir));
    }

    void run_backupFailureDeletesNothing()
    {
        const QString blocker = writeAudioFile(m_dir.path(), QStringLiteral("not_a_dir"), 10);
        ScriptedReviewer reviewer;
        SmartCleanup cleanup(m_catalog, CurationConfig(), &reviewer);
        const CleanupReport report = cleanup.run(CleanupMode::Fast, blocker + QStringLiteral("/backups"));

        QCOMPARE(report.finalState, CleanupState::Failed);
        QCOMPARE(report.error, CurationError::BackupFailure);
        QCOMPARE(report.filesDeleted, 0);
        QVERIFY(QFileInfo::exists(m_flac));
        QVERIFY(QFileInfo::exists(m_mp3));
        QVERIFY(m_catalog->fileByPath(m_mp3)->isActive());
    }

    void run_backupFailureOnLastFileDeletesNothing()
    {
        const QString bFlac = writeAudioFile(m_library, QStringLiteral("B.flac"), 7000, 'f');
        const QString bMp3 = writeAudioFile(m_library, QStringLiteral("B.mp3"), 2000, 'g');
        reindex();

        ScriptedReviewer reviewer;
        reviewer.removeLastCandidate = true;
        SmartCleanup cleanup(m_catalog, CurationConfig(), &reviewer);
        const CleanupReport report = cleanup.run(CleanupMode::Fast, m_backups);

        QCOMPARE(report.groupsValidated, 2);
        QCOMPARE(reviewer.plannedDeletes, 2);
        QCOMPARE(report.finalState, CleanupState::Failed);
        QCOMPARE(report.error, CurationError::BackupFailure);
        QCOMPARE(report.filesDeleted, 0);
        QVERIFY(report.manifestPath.isEmpty());

        const QStringList survivors = { m_flac, m_mp3, bFlac, bMp3 };
        for (const QString& path : survivors) {
            if (path == reviewer.removedPath)
                continue;
            QVERIFY2(QFileInfo::exists(path), qPrintable(path));
            QVERIFY(m_catalog->fileByPath(path)->isActive());
        }
        QVERIFY(reviewer.removedPath == m_mp3 || reviewer.removedPath == bMp3);
        const QStringList leftovers = QDir(m_backups).entryList(QDir::Dirs | QDir::NoDotAndDotDot);
        QVERIFY(leftovers.isEmpty());
    }

    void run_missingBackupDirFails()
    {
        ScriptedReviewer reviewer;
        SmartCleanup cleanup(m_catalog, CurationConfig(), &reviewer);
        const CleanupReport report = cleanup.run(CleanupMode::Fast, QString());
        QCOMPARE(report.error, CurationError::BackupFailure);
        QCOMPARE(reviewer.reviewed, 0);
    }

    void run_unconfirmedIsCancelled()
    {
        ScriptedReviewer reviewer;
        reviewer.confirm = false;
        SmartCleanup cleanup(m_catalog, CurationConfig(), &reviewer);
        const CleanupReport report = cleanup.run(CleanupMode::Fast, m_backups);

        QCOMPARE(report.finalState, CleanupState::Cancelled);
        QCOMPARE(reviewer.confirmations, 1);
        QVERIFY(QFileInfo::exists(m_mp3));
        QVERIFY(!QDir(m_backups).exists());
    }

    void run_withoutReviewerIsCancelled()
    {
        SmartCleanup cleanup(m_catalog, CurationConfig(), nullptr);
        const CleanupReport report = cleanup.run(CleanupMode::Fast, m_backups);
        QCOMPARE(report.finalState, CleanupState::Cancelled);
        QVERIFY(QFileInfo::exists(m_mp3));
    }

    void run_keepAllExcludesGroup()
    {
        ScriptedReviewer reviewer;
        reviewer.keepAll = true;
        SmartCleanup cleanup(m_catalog, CurationConfig(), &reviewer);
        const CleanupReport report = cleanup.run(CleanupMode::Fast, m_backups);

        QVERIFY(report.success());
        QCOMPARE(report.groupsExcluded, 1);
        QCOMPARE(report.filesDeleted, 0);
        QCOMPARE(reviewer.confirmations, 0);
        QVERIFY(report.actions.isEmpty());
        QVERIFY(QFileInfo::exists(m_mp3));
    }

    void run_reviewerCanChangeKeeper()
    {
        ScriptedReviewer reviewer;
        reviewer.keepSuffix = QStringLiteral("A.mp3");
        SmartCleanup cleanup(m_catalog, CurationConfig(), &reviewer);
        const CleanupReport report = cleanup.run(CleanupMode::Fast, m_backups);

        QVERIFY(report.success());
        QCOMPARE(report.filesDeleted, 1);
        QVERIFY(QFileInfo::exists(m_mp3));
        QVERIFY(!QFileInfo::exists(m_flac));
        QCOMPARE(report.groups.first().warnings().size(), 1);
        QCOMPARE(report.groups.first().warnings().first().checkpoint, QStringLiteral("3. Quality Check"));
    }

    void run_dryRunTouchesNothing()
    {
        ScriptedReviewer reviewer;
        CurationConfig config;
        config.dryRun = true;
        config.reportsDir = m_dir.filePath(QStringLiteral("dry_reports"));
        SmartCleanup cleanup(m_catalog, config, &reviewer);
        const CleanupReport report = cleanup.run(CleanupMode::Fast, QString());

        QVERIFY(report.success());
        QVERIFY(report.dryRun);
        QCOMPARE(report.filesDeleted, 0);
        QCOMPARE(reviewer.confirmations, 0);
        QVERIFY(report.manifestPath.isEmpty());
        QVERIFY(QFileInfo::exists(m_mp3));
        QCOMPARE(report.actions.size(), 2);
        QCOMPARE(report.actions.at(1).action, QStringLiteral("PLANNED_DELETE"));
        QVERIFY(QFileInfo::exists(report.csvReportPath));
    }

    void run_missingCandidateFailsValidation()
    {
        QVERIFY(QFile::remove(m_mp3));
        ScriptedReviewer reviewer;
        RecordingEventSink sink;
        SmartCleanup cleanup(m_catalog, CurationConfig(), &reviewer, &sink);
        const CleanupReport report = cleanup.run(CleanupMode::Fast, m_backups);

        QVERIFY(report.success());
        QCOMPARE(report.groupsExcluded, 1);
        QCOMPARE(report.groupsValidated, 0);
        QCOMPARE(report.filesDeleted, 0);
        QCOMPARE(sink.failedGroups, QStringList{ QStringLiteral("dup_0001") });
        QVERIFY(!report.errors.isEmpty());
        QCOMPARE(report.errors.first().error, CurationError::ValidationFailure);
        QVERIFY(QFileInfo::exists(m_flac));
    }

    // ── Restore ──────────────────────────────────────────────────
    void restore_bringsDeletedFileBack()
    {
        const QString before = BackupManager::sha256File(m_mp3);
        ScriptedReviewer reviewer;
        SmartCleanup cleanup(m_catalog, CurationConfig(), &reviewer);
        const CleanupReport report = cleanup.run(CleanupMode::Fast, m_backups);
        QVERIFY(!QFileInfo::exists(m_mp3));

        auto manifest = BackupManager::loadManifest(report.manifestPath);
        QVERIFY(manifest.has_value());
        const RestoreResult restored = BackupManager::restore(*manifest);
        QVERIFY(restored.success());
        QCOMPARE(restored.restored, 1);
        QCOMPARE(BackupManager::sha256File(m_mp3), before);

        const RestoreResult again = BackupManager::restore(*manifest);
        QCOMPARE(again.skipped, 1);
        QCOMPARE(again.restored, 0);
    }

    // ── Plan export ──────────────────────────────────────────────
    void exportPlan_writesJson()
    {
        SmartCleanup cleanup(m_catalog, CurationConfig(), nullptr);
        QVector<DuplicateGroup> groups = cleanup.findGroups(CleanupMode::Fast);
        cleanup.rankGroups(groups);
        const CleanupPlan plan = cleanup.buildPlan(groups, m_backups);
        QCOMPARE(plan.filesToDelete(), 1);

        const QString path = m_dir.filePath(QStringLiteral("plans/plan.json"));
        QString error;
        QVERIFY2(SmartCleanup::exportPlan(plan, path, &error), qPrintable(error));

        QFile f(path);
        QVERIFY(f.open(QIODevice::ReadOnly));
        const QJsonObject root = QJsonDocument::fromJson(f.readAll()).object();
        QCOMPARE(root.value(QStringLiteral("metadata")).toObject()
                     .value(QStringLiteral("files_to_delete")).toInt(), 1);
        QCOMPARE(root.value(QStringLiteral("groups")).toArray().size(), 1);
    }

    // ── SafetyValidator ──────────────────────────────────────────
    void validator_rejectsKeeperAmongCandidates()
    {
        const LibraryFile keeper = *m_catalog->fileByPath(m_flac);
        DuplicateGroup g;
        g.groupId = QStringLiteral("dup_0001");
        g.members = { keeper, keeper };
        g.keeperIndex = 0;

        QualityScorer scorer;
        SafetyValidator validator(&scorer);
        g.validation = validator.validate(g, false);
        QVERIFY(g.hasErrors());
        QCOMPARE(g.errors().first().checkpoint, QStringLiteral("5. Keep At Least One"));
    }

    void validator_rejectsSingleMemberGroup()
    {
        DuplicateGroup g;
        g.members = { *m_catalog->fileByPath(m_flac) };
        g.keeperIndex = 0;

        QualityScorer scorer;
        SafetyValidator validator(&scorer);
        g.validation = validator.validate(g, false);
        QCOMPARE(g.errors().size(), 1);
        QCOMPARE(g.errors().first().checkpoint, QStringLiteral("2. Has Files to Delete"));
    }

    void validator_backupSpaceCoversWholeBatch()
    {
        const int size = 1 << 20;
        DuplicateGroup first;
        first.groupId = QStringLiteral("dup_0001");
        first.members = { LibraryFile(), LibraryFile() };
        first.members[0].filePath = writeAudioFile(m_library, QStringLiteral("k1.flac"), 10);
        first.members[1].filePath = writeAudioFile(m_library, QStringLiteral("c1.mp3"), size);
        first.keeperIndex = 0;
        DuplicateGroup second = first;
        second.groupId = QStringLiteral("dup_0002");
        second.members[0].filePath = writeAudioFile(m_library, QStringLiteral("k2.flac"), 10);
        second.members[1].filePath = writeAudioFile(m_library, QStringLiteral("c2.mp3"), size);

        // Each group alone needs 2 MiB, the pair 4 MiB; leave room for 3.
        const qint64 available = QStorageInfo(m_library).bytesAvailable();
        QualityScorer scorer;
        SafetyValidator validator(&scorer, available - 3 * qint64(size));
        validator.setBackupDirectory(m_backups);

        QCOMPARE(validator.checkBackupSpace({ first }).level, ValidationLevel::Info);
        const ValidationResult batch = validator.checkBackupSpace({ first, second });
        QCOMPARE(batch.level, ValidationLevel::Warning);
        QCOMPARE(batch.checkpoint, QStringLiteral("7. Backup Space"));
        QVERIFY(!batch.isBlocking());
    }

    void validator_rejectsMissingKeeper()
    {
        DuplicateGroup g;
        g.members = { *m_catalog->fileByPath(m_flac), *m_catalog->fileByPath(m_mp3) };
        g.keeperIndex = -1;

        QualityScorer scorer;
        SafetyValidator validator(&scorer);
        g.validation = validator.validate(g);
        QVERIFY(!g.isValid());
        QCOMPARE(g.errors().first().checkpoint, QStringLiteral("1. Keep File Exists"));
        QCOMPARE(validationLevelName(g.errors().first().level), QStringLiteral("ERROR"));
    }
};

QTEST_MAIN(tst_SmartCleanup)
#include "tst_SmartCleanup.moc"
