#pragma once

#include "library/SimilarityStrategy.h"

// Returns the same ratio for every pair.
class FixedSimilarity : public ISimilarityStrategy {
public:
    explicit FixedSimilarity(double value) : m_value(value) {}
    double similarity(const QString&, const QString&) const override { return m_value; }
    QString name() const override { return QStringLiteral("fixed"); }

private:
    double m_value;
};
