#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QDir>
#include <QFile>
#include "library/LibraryCatalog.h"
#include "library/HashCalculator.h"

static LibraryFile makeFile(const QString& name, const QString& artist, const QString& title,
                            const QString& format = QStringLiteral("flac"), qint64 size = 1000)
{
    LibraryFile f;
    f.filePath = QStringLiteral("/fake/") + name;
    f.filename = name;
    f.artist = artist;
    f.title = title;
    f.album = QStringLiteral("Album");
    f.fileFormat = format;
    f.fileSize = size;
    f.fileMtime = 1700000000;
    f.metadataHash = HashCalculator::metadataHash(artist, title);
    f.contentHash = QStringLiteral("%1_%2").arg(size).arg(name);
    return f;
}

class tst_LibraryCatalog : public QObject {
    Q_OBJECT

private:
    QTemporaryDir m_dir;
    LibraryCatalog* m_catalog = nullptr;

private slots:
    void initTestCase()
    {
        QVERIFY(m_dir.isValid());
        m_catalog = new LibraryCatalog(m_dir.filePath(QStringLiteral("catalog/library.db")));
        QString error;
        QVERIFY2(m_catalog->open(&error), qPrintable(error));
    }

    void cleanupTestCase()
    {
        delete m_catalog;
        m_catalog = nullptr;
    }

    void init()
    {
        m_catalog->clearAllData();
    }

    // ── upsertFile ───────────────────────────────────────────────
    void upsert_insertsAndRetrieves()
    {
        UpsertOutcome outcome = UpsertOutcome::Failed;
        const qint64 id = m_catalog->upsertFile(makeFile(QStringLiteral("a.flac"),
                                                         QStringLiteral("Artist"),
                                                         QStringLiteral("Song")),
                                                false, &outcome);
        QVERIFY(id > 0);
        QCOMPARE(outcome, UpsertOutcome::Inserted);

        auto row = m_catalog->fileById(id);
        QVERIFY(row.has_value());
        QCOMPARE(row->title, QStringLiteral("Song"));
        QCOMPARE(row->fileFormat, QStringLiteral("flac"));
        QVERIFY(row->isActive());
        QVERIFY(row->indexedAt.isValid());
    }

    void upsert_unchangedIsNoop()
    {
        LibraryFile f = makeFile(QStringLiteral("a.flac"), QStringLiteral("Artist"), QStringLiteral("Song"));
        const qint64 id = m_catalog->upsertFile(f);

        UpsertOutcome outcome = UpsertOutcome::Failed;
        f.title = QStringLiteral("Changed but same mtime");
        QCOMPARE(m_catalog->upsertFile(f, false, &outcome), id);
        QCOMPARE(outcome, UpsertOutcome::Unchanged);
        QCOMPARE(m_catalog->fileById(id)->title, QStringLiteral("Song"));
        QCOMPARE(m_catalog->fileCount(), 1);
    }

    void upsert_updatesInPlaceWhenMtimeChanges()
    {
        LibraryFile f = makeFile(QStringLiteral("a.flac"), QStringLiteral("Artist"), QStringLiteral("Song"));
        const qint64 id = m_catalog->upsertFile(f);

        f.fileMtime += 60;
        f.title = QStringLiteral("Song (Remix)");
        f.metadataHash.clear();
        UpsertOutcome outcome = UpsertOutcome::Failed;
        QCOMPARE(m_catalog->upsertFile(f, false, &outcome), id);
        QCOMPARE(outcome, UpsertOutcome::Updated);

        auto row = m_catalog->fileById(id);
        QCOMPARE(row->title, QStringLiteral("Song (Remix)"));
        QCOMPARE(row->metadataHash, HashCalculator::metadataHash(QStringLiteral("Artist"),
                                                                 QStringLiteral("Song (Remix)")));
        QCOMPARE(m_catalog->fileCount(), 1);
    }

    void upsert_forceRewrites()
    {
        LibraryFile f = makeFile(QStringLiteral("a.flac"), QStringLiteral("Artist"), QStringLiteral("Song"));
        m_catalog->upsertFile(f);
        UpsertOutcome outcome = UpsertOutcome::Failed;
        m_catalog->upsertFile(f, true, &outcome);
        QCOMPARE(outcome, UpsertOutcome::Updated);
    }

    void upsert_reactivatesInactiveRow()
    {
        LibraryFile f = makeFile(QStringLiteral("a.flac"), QStringLiteral("Artist"), QStringLiteral("Song"));
        const qint64 id = m_catalog->upsertFile(f);
        QVERIFY(m_catalog->markInactive(id));
        QVERIFY(!m_catalog->fileById(id)->isActive());

        UpsertOutcome outcome = UpsertOutcome::Failed;
        QCOMPARE(m_catalog->upsertFile(f, false, &outcome), id);
        QCOMPARE(outcome, UpsertOutcome::Reactivated);
        QVERIFY(m_catalog->fileById(id)->isActive());
    }

    void upsert_emptyPathFails()
    {
        UpsertOutcome outcome = UpsertOutcome::Inserted;
        QCOMPARE(m_catalog->upsertFile(LibraryFile{}, false, &outcome), qint64(0));
        QCOMPARE(outcome, UpsertOutcome::Failed);
    }

    // ── Lookups ──────────────────────────────────────────────────
    void fileByPath_foundAndNotFound()
    {
        m_catalog->upsertFile(makeFile(QStringLiteral("a.flac"), QStringLiteral("A"), QStringLiteral("T")));
        QVERIFY(m_catalog->fileByPath(QStringLiteral("/fake/a.flac")).has_value());
        QVERIFY(!m_catalog->fileByPath(QStringLiteral("/fake/missing.flac")).has_value());
    }

    void findByMetadataHash_filtersInactive()
    {
        const LibraryFile f = makeFile(QStringLiteral("a.flac"), QStringLiteral("A"), QStringLiteral("T"));
        const qint64 id = m_catalog->upsertFile(f);
        QCOMPARE(m_catalog->findByMetadataHash(f.metadataHash).size(), 1);

        m_catalog->markInactive(id);
        QCOMPARE(m_catalog->findByMetadataHash(f.metadataHash).size(), 0);
        QCOMPARE(m_catalog->findByMetadataHash(f.metadataHash, false).size(), 1);
    }

    void findByMetadataHash_sentinelNeverMatches()
    {
        m_catalog->upsertFile(makeFile(QStringLiteral("x.mp3"), QString(), QString()));
        m_catalog->upsertFile(makeFile(QStringLiteral("y.mp3"), QString(), QString()));
        QCOMPARE(m_catalog->findByMetadataHash(HashCalculator::kNoMetadataHash).size(), 0);
    }

    void findByContentHash_skipsTooLarge()
    {
        LibraryFile f = makeFile(QStringLiteral("big.wav"), QStringLiteral("A"), QStringLiteral("T"));
        f.contentHash = QStringLiteral("20000000000") + HashCalculator::kTooLargeSuffix;
        m_catalog->upsertFile(f);
        QCOMPARE(m_catalog->findByContentHash(f.contentHash).size(), 0);

        const LibraryFile g = makeFile(QStringLiteral("g.wav"), QStringLiteral("B"), QStringLiteral("U"));
        m_catalog->upsertFile(g);
        QCOMPARE(m_catalog->findByContentHash(g.contentHash).size(), 1);
    }

    void findCandidatesByArtist_ignoresDiacriticsAndCase()
    {
        m_catalog->upsertFile(makeFile(QStringLiteral("1.flac"), QStringLiteral("Beyoncé"), QStringLiteral("Halo")));
        m_catalog->upsertFile(makeFile(QStringLiteral("2.flac"), QStringLiteral("Other"), QStringLiteral("Halo")));

        const auto rows = m_catalog->findCandidatesByArtist(QStringLiteral("BEYONCE"));
        QCOMPARE(rows.size(), 1);
        QCOMPARE(rows.first().filename, QStringLiteral("1.flac"));
        QVERIFY(m_catalog->findCandidatesByArtist(QString()).isEmpty());
    }

    // ── Lifecycle ────────────────────────────────────────────────
    void markInactiveByPaths_countsAndKeepsRows()
    {
        m_catalog->upsertFile(makeFile(QStringLiteral("1.flac"), QStringLiteral("A"), QStringLiteral("1")));
        m_catalog->upsertFile(makeFile(QStringLiteral("2.flac"), QStringLiteral("A"), QStringLiteral("2")));
        m_catalog->upsertFile(makeFile(QStringLiteral("3.flac"), QStringLiteral("A"), QStringLiteral("3")));

        const int marked = m_catalog->markInactiveByPaths({ QStringLiteral("/fake/1.flac"),
                                                            QStringLiteral("/fake/3.flac"),
                                                            QStringLiteral("/fake/none.flac") });
        QCOMPARE(marked, 2);
        QCOMPARE(m_catalog->fileCount(true), 1);
        QCOMPARE(m_catalog->fileCount(false), 3);
        QCOMPARE(m_catalog->allFiles(false).size(), 3);
    }

    void purgeInactive_removesOnlyInactive()
    {
        const qint64 id = m_catalog->upsertFile(makeFile(QStringLiteral("1.flac"), QStringLiteral("A"), QStringLiteral("1")));
        m_catalog->upsertFile(makeFile(QStringLiteral("2.flac"), QStringLiteral("A"), QStringLiteral("2")));
        m_catalog->markInactive(id);
        QCOMPARE(m_catalog->purgeInactive(), 1);
        QCOMPARE(m_catalog->fileCount(false), 1);
    }

    // ── Statistics ───────────────────────────────────────────────
    void statistics_emptyCatalogIsZero()
    {
        const CatalogStatistics s = m_catalog->statistics();
        QCOMPARE(s.totalFiles, 0);
        QCOMPARE(s.totalSize, qint64(0));
        QCOMPARE(s.averageFileSizeMb(), 0.0);
        QVERIFY(s.formatPercentages().isEmpty());
    }

    void statistics_countsActiveRows()
    {
        m_catalog->upsertFile(makeFile(QStringLiteral("1.flac"), QStringLiteral("A"), QStringLiteral("1"),
                                       QStringLiteral("flac"), 3 * 1024 * 1024));
        m_catalog->upsertFile(makeFile(QStringLiteral("2.mp3"), QStringLiteral("B"), QStringLiteral("2"),
                                       QStringLiteral("mp3"), 1024 * 1024));
        const qint64 gone = m_catalog->upsertFile(makeFile(QStringLiteral("3.mp3"), QStringLiteral("C"),
                                                           QStringLiteral("3"), QStringLiteral("mp3"), 1024));
        m_catalog->markInactive(gone);

        const CatalogStatistics s = m_catalog->statistics();
        QCOMPARE(s.totalFiles, 2);
        QCOMPARE(s.totalSize, qint64(4 * 1024 * 1024));
        QCOMPARE(s.uniqueArtists, 2);
        QCOMPARE(s.uniqueAlbums, 1);
        QCOMPARE(s.inactiveFiles, 1);
        QCOMPARE(s.formatBreakdown.value(QStringLiteral("flac")), 1);
        QCOMPARE(s.averageFileSizeMb(), 2.0);
        QCOMPARE(s.formatPercentages().value(QStringLiteral("mp3")), 50.0);
    }

    void saveIndexStatistics_providesLastIndexedAt()
    {
        CatalogStatistics s = m_catalog->statistics();
        s.lastIndexedAt = QDateTime::currentDateTimeUtc();
        s.lastIndexDuration = 1.5;
        QVERIFY(m_catalog->saveIndexStatistics(s));

        const CatalogStatistics read = m_catalog->statistics();
        QVERIFY(read.lastIndexedAt.isValid());
        QCOMPARE(read.lastIndexDuration, 1.5);
    }

    // ── Vetting history ──────────────────────────────────────────
    void vettingHistory_newestFirstAndClamped()
    {
        for (int i = 0; i < 12; ++i) {
            VettingSession s;
            s.importFolder = QStringLiteral("/imports/%1").arg(i);
            s.scannedAt = QDateTime::currentDateTimeUtc().addSecs(i);
            s.fileCount = i;
            s.errorCount = 1;
            QVERIFY(m_catalog->saveVettingSession(s) > 0);
        }

        const auto defaults = m_catalog->vettingHistory();
        QCOMPARE(defaults.size(), 10);
        QCOMPARE(defaults.first().importFolder, QStringLiteral("/imports/11"));
        QCOMPARE(defaults.first().errorCount, 1);

        QCOMPARE(m_catalog->vettingHistory(0).size(), 1);
        QCOMPARE(m_catalog->vettingHistory(5000).size(), 12);
    }

    // ── Transactions ─────────────────────────────────────────────
    void transaction_rollbackDiscardsWrites()
    {
        QVERIFY(m_catalog->beginTransaction());
        m_catalog->upsertFile(makeFile(QStringLiteral("1.flac"), QStringLiteral("A"), QStringLiteral("1")));
        QVERIFY(m_catalog->rollbackTransaction());
        QCOMPARE(m_catalog->fileCount(), 0);
    }

    void transaction_commitKeepsWrites()
    {
        QVERIFY(m_catalog->beginTransaction());
        m_catalog->upsertFile(makeFile(QStringLiteral("1.flac"), QStringLiteral("A"), QStringLiteral("1")));
        QVERIFY(m_catalog->commitTransaction());
        QCOMPARE(m_catalog->fileCount(), 1);
    }

    // ── Maintenance ──────────────────────────────────────────────
    void checkIntegrity_ok()
    {
        QVERIFY(m_catalog->checkIntegrity());
        QVERIFY(m_catalog->optimize());
    }

    void createBackup_restoreRollsBack()
    {
        m_catalog->upsertFile(makeFile(QStringLiteral("1.flac"), QStringLiteral("A"), QStringLiteral("1")));
        QVERIFY(m_catalog->createBackup());
        QVERIFY(m_catalog->hasBackup());
        QVERIFY(m_catalog->backupTimestamp().isValid());

        m_catalog->upsertFile(makeFile(QStringLiteral("2.flac"), QStringLiteral("A"), QStringLiteral("2")));
        QCOMPARE(m_catalog->fileCount(), 2);

        QVERIFY(m_catalog->restoreFromBackup());
        QVERIFY(m_catalog->isOpen());
        QCOMPARE(m_catalog->fileCount(), 1);
    }

    void catalogChanged_emittedOnClear()
    {
        QSignalSpy spy(m_catalog, &LibraryCatalog::catalogChanged);
        m_catalog->clearAllData();
        QVERIFY(spy.count() >= 1);
    }

    void open_movesCorruptFileAside()
    {
        const QString path = m_dir.filePath(QStringLiteral("corrupt/library.db"));
        QDir().mkpath(QFileInfo(path).absolutePath());
        {
            QFile f(path);
            QVERIFY(f.open(QIODevice::WriteOnly));
            f.write(QByteArray(8192, '\x5a'));
        }

        LibraryCatalog catalog(path);
        QString error;
        QVERIFY2(catalog.open(&error), qPrintable(error));
        QCOMPARE(catalog.fileCount(), 0);

        const QStringList moved = QDir(QFileInfo(path).absolutePath())
            .entryList({ QStringLiteral("library.db.corrupt.*") }, QDir::Files);
        QCOMPARE(moved.size(), 1);
    }
};

QTEST_MAIN(tst_LibraryCatalog)
#include "tst_LibraryCatalog.moc"
