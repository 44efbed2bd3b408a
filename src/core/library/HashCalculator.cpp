#include "HashCalculator.h"

#include <QCryptographicHash>
#include <QFile>
#include <QFileInfo>
#include <QDebug>

const QString HashCalculator::kNoMetadataHash = QStringLiteral("NO_METADATA_HASH");
const QString HashCalculator::kTooLargeSuffix = QStringLiteral("_FILE_TOO_LARGE");

QString HashCalculator::metadataHash(const QString& artist, const QString& title)
{
    const QString a = artist.trimmed().toLower();
    const QString t = title.trimmed().toLower();
    if (a.isEmpty() && t.isEmpty())
        return kNoMetadataHash;

    const QByteArray key = (a + QLatin1Char('|') + t).toUtf8();
    return QString::fromLatin1(
        QCryptographicHash::hash(key, QCryptographicHash::Md5).toHex());
}

// ── Tag-region detection ────────────────────────────────────────────
// Leading ID3v2 / FLAC metadata blocks and trailing APEv2 / ID3v1 tags are
// excluded so a re-tagged copy of the same audio hashes identically.
static qint64 leadingTagBytes(QFile& file, qint64 size)
{
    qint64 offset = 0;
    for (;;) {
        if (!file.seek(offset)) return offset;
        QByteArray head = file.read(10);
        if (head.size() < 10) return offset;

        if (head.startsWith("ID3")) {
            const auto b = reinterpret_cast<const uchar*>(head.constData());
            qint64 tagSize = (qint64(b[6] & 0x7f) << 21) | (qint64(b[7] & 0x7f) << 14)
                           | (qint64(b[8] & 0x7f) << 7) | qint64(b[9] & 0x7f);
            tagSize += 10;
            if (b[5] & 0x10) tagSize += 10;  // footer present
            if (offset + tagSize >= size) return offset;
            offset += tagSize;
            continue;
        }

        if (head.startsWith("fLaC")) {
            qint64 pos = offset + 4;
            bool last = false;
            while (!last) {
                if (!file.seek(pos)) return offset;
                QByteArray block = file.read(4);
                if (block.size() < 4) return offset;
                const auto b = reinterpret_cast<const uchar*>(block.constData());
                last = (b[0] & 0x80) != 0;
                qint64 len = (qint64(b[1]) << 16) | (qint64(b[2]) << 8) | qint64(b[3]);
                pos += 4 + len;
                if (pos >= size) return offset;
            }
            return pos;
        }
        return offset;
    }
}

static qint64 trailingTagBytes(QFile& file, qint64 begin, qint64 size)
{
    qint64 end = size;

    if (end - begin >= 128 && file.seek(end - 128) && file.read(3) == "TAG")
        end -= 128;

    if (end - begin >= 32 && file.seek(end - 32)) {
        QByteArray footer = file.read(32);
        if (footer.size() == 32 && footer.startsWith("APETAGEX")) {
            const auto b = reinterpret_cast<const uchar*>(footer.constData());
            qint64 tagSize = qint64(b[12]) | (qint64(b[13]) << 8)
                           | (qint64(b[14]) << 16) | (qint64(b[15]) << 24);
            if (b[23] & 0x80) tagSize += 32;  // header present
            if (end - tagSize > begin)
                end -= tagSize;
        }
    }
    return size - end;
}

QString HashCalculator::contentHash(const QString& filePath,
                                    CurationError* error,
                                    QString* errorString)
{
    auto fail = [&](const QString& msg) {
        if (error) *error = CurationError::IOError;
        if (errorString) *errorString = msg;
        qWarning() << "[Hash]" << msg;
        return QString();
    };

    QFileInfo fi(filePath);
    if (!fi.exists() || !fi.isFile())
        return fail(QStringLiteral("File not found: %1").arg(filePath));

    const qint64 fileSize = fi.size();
    if (fileSize > kMaxHashableSize) {
        qWarning() << "[Hash] File too large to hash:" << filePath << fileSize << "bytes";
        if (error) *error = CurationError::None;
        return QString::number(fileSize) + kTooLargeSuffix;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly))
        return fail(QStringLiteral("Cannot open %1: %2").arg(filePath, file.errorString()));

    const qint64 begin = leadingTagBytes(file, fileSize);
    const qint64 end = fileSize - trailingTagBytes(file, begin, fileSize);
    const qint64 size = end - begin;

    auto readAt = [&](qint64 pos, qint64 len) -> QByteArray {
        if (!file.seek(begin + pos)) return QByteArray();
        return file.read(qMin(len, size - pos));
    };

    QCryptographicHash hasher(QCryptographicHash::Sha256);
    hasher.addData(QByteArray::number(size));
    hasher.addData(readAt(0, kChunkSize));

    if (size >= kMiddleChunkThreshold)
        hasher.addData(readAt(size / 2, kChunkSize));

    if (size >= kTwoChunkThreshold)
        hasher.addData(readAt(size - kChunkSize, kChunkSize));

    if (file.error() != QFileDevice::NoError)
        return fail(QStringLiteral("Read error on %1: %2").arg(filePath, file.errorString()));

    if (error) *error = CurationError::None;
    return QString::number(size) + QLatin1Char('_')
         + QString::fromLatin1(hasher.result().toHex());
}

QString HashCalculator::normalizeArtistKey(const QString& artist)
{
    const QString decomposed = artist.trimmed().normalized(QString::NormalizationForm_D);
    QString key;
    key.reserve(decomposed.size());
    for (const QChar c : decomposed) {
        const auto cat = c.category();
        if (cat == QChar::Mark_NonSpacing || cat == QChar::Mark_SpacingCombining
            || cat == QChar::Mark_Enclosing)
            continue;
        key.append(c);
    }
    return key.toLower().simplified();
}

bool HashCalculator::isSentinel(const QString& metadataHash)
{
    return metadataHash.isEmpty() || metadataHash == kNoMetadataHash;
}

bool HashCalculator::isUsableContentHash(const QString& contentHash)
{
    return !contentHash.isEmpty() && !contentHash.endsWith(kTooLargeSuffix);
}
