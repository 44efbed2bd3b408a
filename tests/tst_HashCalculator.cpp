#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "library/HashCalculator.h"
#include "TestFiles.h"

class tst_HashCalculator : public QObject {
    Q_OBJECT

private:
    QTemporaryDir m_dir;

    QString writeBytes(const QString& name, const QByteArray& data)
    {
        const QString path = m_dir.filePath(name);
        QFile f(path);
        if (f.open(QIODevice::WriteOnly))
            f.write(data);
        return path;
    }

    static QByteArray payload(int size)
    {
        QByteArray data(size, Qt::Uninitialized);
        for (int i = 0; i < size; ++i)
            data[i] = char('a' + (i * 5) % 19);
        return data;
    }

private slots:
    void initTestCase()
    {
        QVERIFY(m_dir.isValid());
    }

    // ── metadataHash ─────────────────────────────────────────────
    void metadataHash_normalizesCaseAndWhitespace()
    {
        QCOMPARE(HashCalculator::metadataHash(QStringLiteral("  Daft Punk "), QStringLiteral("ONE MORE TIME")),
                 HashCalculator::metadataHash(QStringLiteral("daft punk"), QStringLiteral("one more time")));
    }

    void metadataHash_isMd5Hex()
    {
        const QString h = HashCalculator::metadataHash(QStringLiteral("a"), QStringLiteral("b"));
        QCOMPARE(h.size(), 32);
        QCOMPARE(h, QString::fromLatin1(QCryptographicHash::hash("a|b", QCryptographicHash::Md5).toHex()));
    }

    void metadataHash_sentinelWhenUntagged()
    {
        QCOMPARE(HashCalculator::metadataHash(QString(), QStringLiteral("   ")),
                 HashCalculator::kNoMetadataHash);
        QVERIFY(HashCalculator::isSentinel(HashCalculator::kNoMetadataHash));
        QVERIFY(HashCalculator::isSentinel(QString()));
    }

    void metadataHash_artistOnlyIsNotSentinel()
    {
        const QString h = HashCalculator::metadataHash(QStringLiteral("Artist"), QString());
        QVERIFY(!HashCalculator::isSentinel(h));
    }

    // ── contentHash ──────────────────────────────────────────────
    void contentHash_missingFileReportsIOError()
    {
        CurationError err = CurationError::None;
        QString message;
        const QString h = HashCalculator::contentHash(m_dir.filePath(QStringLiteral("nope.mp3")),
                                                      &err, &message);
        QVERIFY(h.isEmpty());
        QCOMPARE(err, CurationError::IOError);
        QVERIFY(!message.isEmpty());
    }

    void contentHash_prefixesPayloadSize()
    {
        const QString path = writeBytes(QStringLiteral("small.mp3"), payload(1000));
        const QString h = HashCalculator::contentHash(path);
        QVERIFY(h.startsWith(QStringLiteral("1000_")));
        QCOMPARE(h.size(), 5 + 64);
        QVERIFY(HashCalculator::isUsableContentHash(h));
    }

    void contentHash_stableAcrossRuns()
    {
        const QString path = writeBytes(QStringLiteral("stable.flac"), payload(200 * 1024));
        QCOMPARE(HashCalculator::contentHash(path), HashCalculator::contentHash(path));
    }

    void contentHash_ignoresLeadingId3v2Tag()
    {
        const QByteArray audio = payload(50 * 1024);

        QByteArray tag("ID3");
        tag.append(char(4)).append(char(0)).append(char(0));   // v2.4, no flags
        tag.append(char(0)).append(char(0)).append(char(0)).append(char(20));  // syncsafe size 20
        tag.append(QByteArray(20, 'x'));

        const QString plain = writeBytes(QStringLiteral("plain.mp3"), audio);
        const QString tagged = writeBytes(QStringLiteral("tagged.mp3"), tag + audio);
        QCOMPARE(HashCalculator::contentHash(tagged), HashCalculator::contentHash(plain));
    }

    void contentHash_ignoresTrailingId3v1Tag()
    {
        const QByteArray audio = payload(50 * 1024);
        QByteArray v1("TAG");
        v1.append(QByteArray(125, 'y'));

        const QString plain = writeBytes(QStringLiteral("plain1.mp3"), audio);
        const QString tagged = writeBytes(QStringLiteral("tagged1.mp3"), audio + v1);
        QCOMPARE(HashCalculator::contentHash(tagged), HashCalculator::contentHash(plain));
    }

    void contentHash_samplesFirstMiddleAndLastChunks()
    {
        QByteArray audio = payload(300 * 1024);
        const QString original = writeBytes(QStringLiteral("orig.wav"), audio);
        const QString base = HashCalculator::contentHash(original);

        // 100 KiB lies between the first and the middle chunk
        QByteArray unsampled = audio;
        unsampled[100 * 1024] = 'Z';
        QCOMPARE(HashCalculator::contentHash(writeBytes(QStringLiteral("gap.wav"), unsampled)), base);

        // 160 KiB lies inside the middle chunk (150..214 KiB)
        QByteArray sampled = audio;
        sampled[160 * 1024] = 'Z';
        QVERIFY(HashCalculator::contentHash(writeBytes(QStringLiteral("mid.wav"), sampled)) != base);
    }

    void contentHash_differentBytesDiffer()
    {
        const QString a = writeAudioFile(m_dir.path(), QStringLiteral("a.mp3"), 4096, 'a');
        const QString b = writeAudioFile(m_dir.path(), QStringLiteral("b.mp3"), 4096, 'b');
        QVERIFY(HashCalculator::contentHash(a) != HashCalculator::contentHash(b));
    }

    void isUsableContentHash_rejectsTooLargeMarker()
    {
        QVERIFY(!HashCalculator::isUsableContentHash(QString()));
        QVERIFY(!HashCalculator::isUsableContentHash(QStringLiteral("11811160064") + HashCalculator::kTooLargeSuffix));
    }

    // ── normalizeArtistKey ───────────────────────────────────────
    void normalizeArtistKey_stripsDiacritics()
    {
        QCOMPARE(HashCalculator::normalizeArtistKey(QStringLiteral(" Beyoncé ")), QStringLiteral("beyonce"));
        QCOMPARE(HashCalculator::normalizeArtistKey(QStringLiteral("Sigur   Rós")), QStringLiteral("sigur ros"));
    }
};

QTEST_MAIN(tst_HashCalculator)
#include "tst_HashCalculator.moc"
