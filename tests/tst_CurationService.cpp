#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "CurationService.h"
#include "library/ICleanupReviewer.h"
#include "library/LibraryCatalog.h"
#include "FakeMetadataExtractor.h"
#include "TestFiles.h"

class ApprovingReviewer : public ICleanupReviewer {
public:
    ReviewDecision reviewGroup(const DuplicateGroup&) override { return ReviewDecision::accept(); }
    bool confirmDeletion(const CleanupPlan&) override { return true; }
};

// End-to-end: index a library, vet an import folder, clean up and restore.
class tst_CurationService : public QObject {
    Q_OBJECT

private:
    QTemporaryDir m_dir;
    LibraryCatalog* m_catalog = nullptr;
    FakeMetadataExtractor m_extractor;
    ApprovingReviewer m_reviewer;
    QString m_library;
    QString m_imports;

private slots:
    void initTestCase()
    {
        QVERIFY(m_dir.isValid());
        m_catalog = new LibraryCatalog(m_dir.filePath(QStringLiteral("library.db")));
        QVERIFY(m_catalog->open());

        m_extractor.set(QStringLiteral("Song.flac"), QStringLiteral("Artist"), QStringLiteral("Song"));
        m_extractor.set(QStringLiteral("Song.mp3"), QStringLiteral("Artist"), QStringLiteral("Song"), 192);
        m_extractor.set(QStringLiteral("Other.flac"), QStringLiteral("Artist"), QStringLiteral("Other"));
        m_extractor.set(QStringLiteral("Brand New.mp3"), QStringLiteral("Newcomer"), QStringLiteral("Debut"));

        m_library = QFileInfo(m_dir.filePath(QStringLiteral("library"))).absoluteFilePath();
        m_imports = m_dir.filePath(QStringLiteral("imports"));
        writeAudioFile(m_library, QStringLiteral("Song.flac"), 9000, 'a');
        writeAudioFile(m_library, QStringLiteral("dupes/Song.mp3"), 4000, 'b');
        writeAudioFile(m_library, QStringLiteral("Other.flac"), 7000, 'c');
        writeAudioFile(m_imports, QStringLiteral("Brand New.mp3"), 3000, 'd');
        writeAudioFile(m_imports, QStringLiteral("Other.flac"), 7000, 'c');
    }

    void cleanupTestCase()
    {
        delete m_catalog;
        m_catalog = nullptr;
    }

    void workflow()
    {
        CurationConfig config = CurationConfig::forMode(ScanMode::Deep);
        config.backupDir = m_dir.filePath(QStringLiteral("backups"));
        config.exportDuplicates = true;
        config.exportDir = m_dir.filePath(QStringLiteral("exports"));
        CurationService service(m_catalog, config, &m_extractor, &m_reviewer);

        // index
        const IndexResult indexed = service.index(m_library);
        QVERIFY(indexed.success());
        QCOMPARE(indexed.added, 3);
        QCOMPARE(service.stats().totalFiles, 3);
        QCOMPARE(service.stats().formatBreakdown.value(QStringLiteral("flac")), 2);

        // vet
        const VettingReport vetted = service.vet(m_imports);
        QVERIFY(vetted.success());
        QCOMPARE(vetted.newSongs.size(), 1);
        QCOMPARE(vetted.duplicates.size(), 1);
        QCOMPARE(vetted.exportedFiles.size(), 2);
        QCOMPARE(service.history().size(), 1);
        QCOMPARE(service.stats().totalFiles, 3);

        // checkFile
        const MatchVerdict verdict = service.checkFile(m_imports + QStringLiteral("/Brand New.mp3"));
        QCOMPARE(verdict.status, MatchStatus::New);

        // cleanup
        const CleanupReport cleaned = service.cleanup();
        QVERIFY2(cleaned.success(), qPrintable(cleaned.errorMessage));
        QCOMPARE(cleaned.mode, CleanupMode::Thorough);
        QCOMPARE(cleaned.filesDeleted, 1);
        QVERIFY(!QFileInfo::exists(m_library + QStringLiteral("/dupes/Song.mp3")));
        QCOMPARE(service.stats().totalFiles, 2);

        // verify keeps catalog in step with disk
        QVERIFY(QFile::remove(m_library + QStringLiteral("/Other.flac")));
        const VerifyResult verified = service.verify(m_library);
        QCOMPARE(verified.markedInactive, 1);
        QCOMPARE(service.stats().totalFiles, 1);

        // restore
        QString error;
        const RestoreResult restored = service.restoreBackup(cleaned.manifestPath, false, &error);
        QVERIFY(restored.success());
        QCOMPARE(restored.restored, 1);
        QVERIFY(QFileInfo::exists(m_library + QStringLiteral("/dupes/Song.mp3")));
        QCOMPARE(service.stats().totalFiles, 2);
    }

    void restoreBackup_missingManifest()
    {
        CurationService service(m_catalog, CurationConfig(), &m_extractor);
        QString error;
        const RestoreResult r = service.restoreBackup(m_dir.filePath(QStringLiteral("none/manifest.json")),
                                                      false, &error);
        QVERIFY(!r.success());
        QVERIFY(!error.isEmpty());
    }

    void recordReviewed_marksLaterImports()
    {
        LibraryCatalog catalog(m_dir.filePath(QStringLiteral("reviewed.db")));
        QVERIFY(catalog.open());
        CurationConfig config;
        config.exportNew = false;
        config.exportPreviouslyReviewed = true;
        config.exportDir = m_dir.filePath(QStringLiteral("reviewed_exports"));
        CurationService service(&catalog, config, &m_extractor);

        QCOMPARE(service.vet(m_imports).newSongs.size(), 2);

        const ReviewRecordResult recorded = service.recordReviewed(m_imports);
        QVERIFY(recorded.success());
        QCOMPARE(recorded.added, 2);
        QCOMPARE(service.reviewHistoryStats().totalFiles, 2);

        const VettingReport again = service.vet(m_imports);
        QVERIFY(again.newSongs.isEmpty());
        QCOMPARE(again.previouslyReviewed.size(), 2);
        QCOMPARE(again.exportedFiles.size(), 1);
        QVERIFY(again.exportedFiles.first().endsWith(ImportVetter::kPreviouslyReviewedFile));
        QCOMPARE(service.history().first().previouslyReviewedCount, 2);
    }

    void invalidConfigFallsBackToPreset()
    {
        CurationConfig bad = CurationConfig::forMode(ScanMode::Quick);
        bad.batchSize = 0;
        CurationService service(m_catalog, bad, &m_extractor);
        QCOMPARE(service.config().batchSize, 100);
        QCOMPARE(service.config().threshold, 0.9);

        QString error;
        QVERIFY(!service.setConfig(bad, &error));
        QVERIFY(!error.isEmpty());
    }
};

QTEST_MAIN(tst_CurationService)
#include "tst_CurationService.moc"
