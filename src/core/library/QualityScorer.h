#pragma once

#include <QHash>
#include <QSet>
#include <QString>
#include <QVector>
#include <QDateTime>
#include "../CatalogData.h"

// Point tables for QualityScorer. Defaults reproduce the production
// weighting; every boundary can be overridden through CurationConfig.
struct QualityWeights {
    QHash<QString, int> formatPoints;       // lowercase extension → points
    QSet<QString> losslessFormats;
    int unknownFormatPoints = 10;

    int maxBitratePoints = 30;
    int referenceBitrateKbps = 320;
    int unknownBitratePoints = 5;
    int vbrBonus = 2;                       // added after scaling

    int highSampleRateHz = 96000;
    int highSampleRatePoints = 20;
    int mediumSampleRateHz = 48000;
    int mediumSampleRatePoints = 15;
    int standardSampleRateHz = 44100;
    int standardSampleRatePoints = 10;
    int unknownSampleRatePoints = 10;

    int recentDays = 365;
    int recentPoints = 10;
    int moderateDays = 1825;
    int moderatePoints = 5;

    static QualityWeights defaults();
};

struct QualityScore {
    int total = 0;
    int formatPoints = 0;
    int bitratePoints = 0;
    int vbrBonus = 0;
    int sampleRatePoints = 0;
    int recencyPoints = 0;

    QualityTier tier() const { return qualityTierForScore(total); }
    QString breakdown() const;
};

class QualityScorer {
public:
    explicit QualityScorer(const QualityWeights& weights = QualityWeights::defaults());

    // Recency is measured against this instant; defaults to "now" per call.
    void setReferenceTime(const QDateTime& when) { m_referenceTime = when; }

    QualityScore score(const LibraryFile& file) const;
    bool isLossless(const QString& format) const;

    // >0 if a ranks above b: higher total, then larger file size.
    int compare(const LibraryFile& a, const LibraryFile& b) const;

    // Indices of files ordered best first (stable for equal rank).
    QVector<int> rankGroup(const QVector<LibraryFile>& files) const;

    const QualityWeights& weights() const { return m_weights; }

private:
    int formatPoints(const QString& format) const;
    int bitratePoints(const LibraryFile& file, int* vbrBonus) const;
    int sampleRatePoints(int sampleRate) const;
    int recencyPoints(qint64 mtime) const;

    QualityWeights m_weights;
    QDateTime m_referenceTime;
};
