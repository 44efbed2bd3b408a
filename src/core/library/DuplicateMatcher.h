#pragma once

#include <QString>
#include <memory>
#include "../CatalogData.h"
#include "SimilarityStrategy.h"

class LibraryCatalog;
class IMetadataExtractor;

// Three-tier duplicate test of a candidate file against the catalog:
// exact metadata hash, exact content hash, then fuzzy title similarity
// among rows of the same artist. First tier to hit decides.
// Read-only; safe to call from several threads at once.
class DuplicateMatcher {
public:
    static constexpr double kDefaultThreshold = 0.8;
    static constexpr double kDefaultUncertainFloor = 0.7;

    explicit DuplicateMatcher(const LibraryCatalog* catalog);
    ~DuplicateMatcher();

    void setThreshold(double threshold);
    double threshold() const { return m_threshold; }

    void setUncertainFloor(double floor);
    double uncertainFloor() const { return m_uncertainFloor; }

    void setUseContentHash(bool enabled) { m_useContentHash = enabled; }
    bool useContentHash() const { return m_useContentHash; }

    void setSimilarityStrategy(std::unique_ptr<ISimilarityStrategy> strategy);
    const ISimilarityStrategy* similarityStrategy() const { return m_strategy.get(); }

    MatchVerdict match(const LibraryFile& candidate) const;
    MatchVerdict match(const LibraryFile& candidate, double threshold) const;

    // Extracts and hashes a file on disk, then matches it.
    MatchVerdict checkFile(const QString& filePath, IMetadataExtractor* extractor,
                           QString* errorString = nullptr) const;

private:
    MatchVerdict matchFuzzy(const LibraryFile& candidate, double threshold) const;

    const LibraryCatalog* m_catalog;
    std::unique_ptr<ISimilarityStrategy> m_strategy;
    double m_threshold = kDefaultThreshold;
    double m_uncertainFloor = kDefaultUncertainFloor;
    bool m_useContentHash = true;
};
