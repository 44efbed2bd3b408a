#pragma once

#include <QString>

// Pluggable string similarity for the fuzzy matching tier.
// Returns a ratio in [0,1]; 1.0 means identical.
class ISimilarityStrategy {
public:
    virtual ~ISimilarityStrategy() = default;
    virtual double similarity(const QString& a, const QString& b) const = 0;
    virtual QString name() const = 0;
};

// Ratcliff/Obershelp "gestalt pattern matching": 2*M / (|a| + |b|) where M
// is the total length of recursively found longest common blocks.
class SequenceSimilarity : public ISimilarityStrategy {
public:
    double similarity(const QString& a, const QString& b) const override;
    QString name() const override { return QStringLiteral("ratcliff-obershelp"); }

    // Total matched characters between a and b.
    static int matchingCharacters(const QString& a, const QString& b);
};

// ── Text normalization ──────────────────────────────────────────────
// Lowercase, strip release-variant noise ("(radio edit)", "[official]",
// " - remastered", ...) and collapse whitespace.
QString normalizeForMatching(const QString& text);

// Filename stem for thorough cleanup grouping: bracketed text, separators
// and format/bitrate markers removed.
QString normalizeFilename(const QString& fileName);
