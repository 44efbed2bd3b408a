#include "SimilarityStrategy.h"

#include <QFileInfo>
#include <QRegularExpression>
#include <QStringList>
#include <QVector>

#include <algorithm>

namespace {

struct Block {
    int aStart = 0;
    int bStart = 0;
    int size = 0;
};

// Longest common substring of a[alo..ahi) and b[blo..bhi); earliest in a,
// then earliest in b, on ties.
Block longestMatch(const QString& a, int alo, int ahi,
                   const QString& b, int blo, int bhi)
{
    Block best{ alo, blo, 0 };
    QVector<int> prev(bhi - blo + 1, 0);
    QVector<int> curr(bhi - blo + 1, 0);

    for (int i = alo; i < ahi; ++i) {
        for (int j = blo; j < bhi; ++j) {
            const int col = j - blo + 1;
            if (a.at(i) == b.at(j)) {
                curr[col] = prev[col - 1] + 1;
                if (curr[col] > best.size) {
                    best.size = curr[col];
                    best.aStart = i - curr[col] + 1;
                    best.bStart = j - curr[col] + 1;
                }
            } else {
                curr[col] = 0;
            }
        }
        std::swap(prev, curr);
        std::fill(curr.begin(), curr.end(), 0);
    }
    return best;
}

} // namespace

int SequenceSimilarity::matchingCharacters(const QString& a, const QString& b)
{
    int matched = 0;
    struct Range { int alo, ahi, blo, bhi; };
    QVector<Range> queue{ { 0, int(a.size()), 0, int(b.size()) } };

    while (!queue.isEmpty()) {
        const Range r = queue.takeLast();
        const Block m = longestMatch(a, r.alo, r.ahi, b, r.blo, r.bhi);
        if (m.size == 0)
            continue;
        matched += m.size;
        if (r.alo < m.aStart && r.blo < m.bStart)
            queue.append({ r.alo, m.aStart, r.blo, m.bStart });
        if (m.aStart + m.size < r.ahi && m.bStart + m.size < r.bhi)
            queue.append({ m.aStart + m.size, r.ahi, m.bStart + m.size, r.bhi });
    }
    return matched;
}

double SequenceSimilarity::similarity(const QString& a, const QString& b) const
{
    if (a.isEmpty() || b.isEmpty())
        return 0.0;
    if (a == b)
        return 1.0;
    return 2.0 * matchingCharacters(a, b) / double(a.size() + b.size());
}

// ── Text normalization ──────────────────────────────────────────────

QString normalizeForMatching(const QString& text)
{
    static const QStringList kNoise = {
        QStringLiteral(" (original mix)"),
        QStringLiteral(" (radio edit)"),
        QStringLiteral(" (album version)"),
        QStringLiteral(" (extended)"),
        QStringLiteral(" (remastered)"),
        QStringLiteral(" [official]"),
        QStringLiteral(" [hd]"),
        QStringLiteral(" - remastered"),
    };

    QString s = text.toLower().simplified();
    for (const QString& noise : kNoise)
        s.remove(noise);
    return s.simplified();
}

QString normalizeFilename(const QString& fileName)
{
    static const QRegularExpression kBrackets(QStringLiteral("[\\[\\(].*?[\\]\\)]"));
    static const QRegularExpression kSeparators(QStringLiteral("[_-]+"));
    static const QRegularExpression kMarkers(QStringLiteral("(320|v0|vbr|cbr|flac|mp3)"),
                                             QRegularExpression::CaseInsensitiveOption);

    QString s = QFileInfo(fileName).completeBaseName().toLower();
    s.replace(kBrackets, QString());
    s.replace(kSeparators, QStringLiteral(" "));
    s.replace(kMarkers, QString());
    return s.simplified();
}
