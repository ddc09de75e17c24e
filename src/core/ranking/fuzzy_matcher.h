#pragma once

#include <QString>
#include <QStringList>

#include <optional>

namespace gt {

// FuzzyMatcher — case-insensitive subsequence scoring of a query against a
// project name or path.
//
// Raw score: +1 per matched char, +1.5 when it directly follows the previous
// match, +2 at a word boundary (text start, after "-_. /", or a lower→upper
// hump), -0.1 per skipped char between matches and -0.05 per char skipped
// before the first match (capped at -1). The best alignment is used.
class FuzzyMatcher {
public:
    struct Match {
        double score = 0.0;        // 0..100
        bool fromPath = false;
        bool usedSingular = false;
    };

    // Best raw alignment score, or nullopt when pattern is not a subsequence.
    static std::optional<double> rawScore(const QString& pattern, const QString& text);

    // Raw score normalized by the pattern's self-score, 0..100.
    static std::optional<double> score(const QString& pattern, const QString& text);

    // Scores every query term against name and averages them. When a term
    // does not match the name, the singular form is tried, then the full
    // path (scaled by pathOnlyFactor). nullopt means no match at all.
    static std::optional<Match> match(const QString& query, const QString& name,
                                      const QString& path, double pathOnlyFactor);

    // Lower-cased whitespace-separated terms.
    static QStringList terms(const QString& query);

    // Strips a trailing "es" or "s" when at least three chars remain.
    static QString singular(const QString& term);

    // Substring test of the term, or of its singular form, in lowerText.
    static bool containsTerm(const QString& lowerText, const QString& term);
    static bool containsAllTerms(const QString& lowerText, const QStringList& terms);

    // Lower-case with runs of "-", "_" and whitespace collapsed to one space.
    static QString normalizeSeparators(const QString& text);

private:
    static std::optional<double> averageScore(const QStringList& terms, const QString& text);
    static bool isWordBoundary(const QString& text, int index);
};

} // namespace gt
