#include "DuplicateMatcher.h"
#include "LibraryCatalog.h"
#include "HashCalculator.h"
#include "../audio/IMetadataExtractor.h"

#include <QFileInfo>

#include <QDebug>

// Deterministic pick among equally good rows: most recently verified,
// then lowest id.
static bool preferRow(const LibraryFile& a, const LibraryFile& b)
{
    if (a.lastVerified != b.lastVerified) {
        if (!a.lastVerified.isValid()) return false;
        if (!b.lastVerified.isValid()) return true;
        return a.lastVerified > b.lastVerified;
    }
    return a.id < b.id;
}

static std::optional<LibraryFile> pickRow(const QVector<LibraryFile>& rows, const QString& selfPath)
{
    std::optional<LibraryFile> best;
    for (const LibraryFile& row : rows) {
        if (row.filePath == selfPath) continue;
        if (!best || preferRow(row, *best))
            best = row;
    }
    return best;
}

DuplicateMatcher::DuplicateMatcher(const LibraryCatalog* catalog)
    : m_catalog(catalog)
    , m_strategy(std::make_unique<SequenceSimilarity>())
{
}

DuplicateMatcher::~DuplicateMatcher() = default;

void DuplicateMatcher::setThreshold(double threshold)
{
    if (threshold < 0.0 || threshold > 1.0)
        qWarning() << "[Matcher] Threshold" << threshold << "outside [0,1], clamping";
    m_threshold = qBound(0.0, threshold, 1.0);
}

void DuplicateMatcher::setUncertainFloor(double floor)
{
    m_uncertainFloor = qBound(0.0, floor, 1.0);
}

void DuplicateMatcher::setSimilarityStrategy(std::unique_ptr<ISimilarityStrategy> strategy)
{
    if (strategy)
        m_strategy = std::move(strategy);
}

MatchVerdict DuplicateMatcher::match(const LibraryFile& candidate) const
{
    return match(candidate, m_threshold);
}

MatchVerdict DuplicateMatcher::match(const LibraryFile& candidate, double threshold) const
{
    threshold = qBound(0.0, threshold, 1.0);

    // ── Tier 1: exact metadata hash ──────────────────────────────────
    const QString metaHash = candidate.metadataHash.isEmpty()
        ? HashCalculator::metadataHash(candidate.artist, candidate.title)
        : candidate.metadataHash;
    if (!HashCalculator::isSentinel(metaHash)) {
        auto row = pickRow(m_catalog->findByMetadataHash(metaHash), candidate.filePath);
        if (row) {
            MatchVerdict v;
            v.status = MatchStatus::Duplicate;
            v.match = row;
            v.confidence = 1.0;
            v.matchType = MatchType::ExactMetadata;
            return v;
        }
    }

    // ── Tier 2: exact content hash ───────────────────────────────────
    if (m_useContentHash && HashCalculator::isUsableContentHash(candidate.contentHash)) {
        auto row = pickRow(m_catalog->findByContentHash(candidate.contentHash), candidate.filePath);
        if (row) {
            MatchVerdict v;
            v.status = MatchStatus::Duplicate;
            v.match = row;
            v.confidence = 1.0;
            v.matchType = MatchType::ExactContent;
            return v;
        }
    }

    // ── Tier 3: fuzzy ────────────────────────────────────────────────
    if (!candidate.hasTags())
        return MatchVerdict{};
    return matchFuzzy(candidate, threshold);
}

MatchVerdict DuplicateMatcher::matchFuzzy(const LibraryFile& candidate, double threshold) const
{
    MatchVerdict verdict;
    if (candidate.artist.trimmed().isEmpty() || candidate.title.trimmed().isEmpty())
        return verdict;

    // Rows already share the artist key, so only titles are compared.
    const QString needle = normalizeForMatching(candidate.title);

    std::optional<LibraryFile> best;
    double bestScore = 0.0;
    const QVector<LibraryFile> rows = m_catalog->findCandidatesByArtist(candidate.artist);
    for (const LibraryFile& row : rows) {
        if (row.filePath == candidate.filePath)
            continue;
        if (row.title.trimmed().isEmpty())
            continue;
        const double score = m_strategy->similarity(needle, normalizeForMatching(row.title));
        if (!best || score > bestScore || (score == bestScore && preferRow(row, *best))) {
            best = row;
            bestScore = score;
        }
    }

    if (!best || bestScore < m_uncertainFloor)
        return verdict;

    verdict.match = best;
    verdict.confidence = bestScore;
    verdict.matchType = MatchType::Fuzzy;
    verdict.status = bestScore >= threshold ? MatchStatus::Duplicate : MatchStatus::Uncertain;
    return verdict;
}

MatchVerdict DuplicateMatcher::checkFile(const QString& filePath, IMetadataExtractor* extractor,
                                         QString* errorString) const
{
    QFileInfo fi(filePath);
    if (!fi.exists() || !fi.isFile()) {
        if (errorString) *errorString = QStringLiteral("File not found: %1").arg(filePath);
        return MatchVerdict{};
    }

    LibraryFile candidate;
    candidate.filePath = fi.absoluteFilePath();
    candidate.filename = fi.fileName();
    candidate.fileSize = fi.size();
    candidate.fileMtime = fi.lastModified().toSecsSinceEpoch();
    if (extractor && !extractor->extract(candidate.filePath, candidate, errorString))
        qDebug() << "[Matcher] No tags for" << filePath;
    candidate.metadataHash = HashCalculator::metadataHash(candidate.artist, candidate.title);
    if (m_useContentHash)
        candidate.contentHash = HashCalculator::contentHash(candidate.filePath, nullptr, errorString);
    return match(candidate);
}
