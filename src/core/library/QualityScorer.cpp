#include "QualityScorer.h"

#include <algorithm>

QualityWeights QualityWeights::defaults()
{
    QualityWeights w;
    w.formatPoints = {
        { QStringLiteral("flac"), 40 }, { QStringLiteral("alac"), 40 },
        { QStringLiteral("wav"), 38 },  { QStringLiteral("aiff"), 38 },
        { QStringLiteral("aif"), 38 },  { QStringLiteral("ape"), 37 },
        { QStringLiteral("wv"), 37 },   { QStringLiteral("tta"), 37 },
        { QStringLiteral("dsd"), 36 },  { QStringLiteral("dsf"), 36 },
        { QStringLiteral("aac"), 22 },  { QStringLiteral("m4a"), 22 },
        { QStringLiteral("mp3"), 20 },  { QStringLiteral("ogg"), 18 },
        { QStringLiteral("opus"), 18 }, { QStringLiteral("wma"), 15 },
    };
    w.losslessFormats = {
        QStringLiteral("flac"), QStringLiteral("alac"), QStringLiteral("wav"),
        QStringLiteral("aiff"), QStringLiteral("aif"), QStringLiteral("ape"),
        QStringLiteral("wv"), QStringLiteral("tta"), QStringLiteral("dsd"),
        QStringLiteral("dsf"),
    };
    return w;
}

QString QualityScore::breakdown() const
{
    return QStringLiteral("format %1 + bitrate %2%3 + sample rate %4 + recency %5 = %6")
        .arg(formatPoints)
        .arg(bitratePoints)
        .arg(vbrBonus > 0 ? QStringLiteral(" (+%1 VBR)").arg(vbrBonus) : QString())
        .arg(sampleRatePoints)
        .arg(recencyPoints)
        .arg(total);
}

QualityScorer::QualityScorer(const QualityWeights& weights)
    : m_weights(weights)
{
}

bool QualityScorer::isLossless(const QString& format) const
{
    return m_weights.losslessFormats.contains(format.toLower());
}

int QualityScorer::formatPoints(const QString& format) const
{
    return m_weights.formatPoints.value(format.toLower(), m_weights.unknownFormatPoints);
}

int QualityScorer::bitratePoints(const LibraryFile& file, int* vbrBonus) const
{
    *vbrBonus = 0;
    if (isLossless(file.fileFormat))
        return m_weights.maxBitratePoints;

    if (file.bitrate <= 0 || m_weights.referenceBitrateKbps <= 0)
        return m_weights.unknownBitratePoints;

    double ratio = qMin(double(file.bitrate) / m_weights.referenceBitrateKbps, 1.0);
    int points = int(m_weights.maxBitratePoints * ratio);
    if (file.variableBitrate)
        *vbrBonus = m_weights.vbrBonus;
    return points;
}

int QualityScorer::sampleRatePoints(int sampleRate) const
{
    if (sampleRate <= 0)
        return m_weights.unknownSampleRatePoints;
    if (sampleRate >= m_weights.highSampleRateHz)
        return m_weights.highSampleRatePoints;
    if (sampleRate >= m_weights.mediumSampleRateHz)
        return m_weights.mediumSampleRatePoints;
    if (sampleRate >= m_weights.standardSampleRateHz)
        return m_weights.standardSampleRatePoints;
    return int(m_weights.standardSampleRatePoints
               * (double(sampleRate) / m_weights.standardSampleRateHz));
}

int QualityScorer::recencyPoints(qint64 mtime) const
{
    if (mtime <= 0)
        return 0;

    const QDateTime now = m_referenceTime.isValid() ? m_referenceTime
                                                    : QDateTime::currentDateTimeUtc();
    const qint64 ageDays = (now.toSecsSinceEpoch() - mtime) / 86400;
    if (ageDays < m_weights.recentDays)
        return m_weights.recentPoints;
    if (ageDays < m_weights.moderateDays)
        return m_weights.moderatePoints;
    return 0;
}

QualityScore QualityScorer::score(const LibraryFile& file) const
{
    QualityScore s;
    s.formatPoints     = formatPoints(file.fileFormat);
    s.bitratePoints    = bitratePoints(file, &s.vbrBonus);
    s.sampleRatePoints = sampleRatePoints(file.sampleRate);
    s.recencyPoints    = recencyPoints(file.fileMtime);
    s.total = s.formatPoints + s.bitratePoints + s.vbrBonus
            + s.sampleRatePoints + s.recencyPoints;
    return s;
}

int QualityScorer::compare(const LibraryFile& a, const LibraryFile& b) const
{
    const int sa = score(a).total;
    const int sb = score(b).total;
    if (sa != sb)
        return sa > sb ? 1 : -1;
    if (a.fileSize != b.fileSize)
        return a.fileSize > b.fileSize ? 1 : -1;
    return 0;
}

QVector<int> QualityScorer::rankGroup(const QVector<LibraryFile>& files) const
{
    QVector<int> totals;
    totals.reserve(files.size());
    for (const LibraryFile& f : files)
        totals.append(score(f).total);

    QVector<int> order(files.size());
    for (int i = 0; i < order.size(); ++i)
        order[i] = i;

    std::stable_sort(order.begin(), order.end(), [&](int a, int b) {
        if (totals[a] != totals[b])
            return totals[a] > totals[b];
        if (files[a].fileSize != files[b].fileSize)
            return files[a].fileSize > files[b].fileSize;
        return files[a].filePath < files[b].filePath;
    });
    return order;
}
