#include "core/ranking/fuzzy_matcher.h"
#include "core/shared/logging.h"

#include <QRegularExpression>

#include <algorithm>
#include <limits>
#include <vector>

namespace gt {

namespace {

constexpr double kMatchScore = 1.0;
constexpr double kConsecutiveBonus = 1.5;
constexpr double kBoundaryBonus = 2.0;
constexpr double kGapPenalty = 0.1;
constexpr double kLeadingPenalty = 0.05;
constexpr double kMaxLeadingPenalty = 1.0;

constexpr double kNone = -std::numeric_limits<double>::infinity();

} // anonymous namespace

bool FuzzyMatcher::isWordBoundary(const QString& text, int index)
{
    if (index == 0) {
        return true;
    }
    const QChar prev = text.at(index - 1);
    if (prev == QLatin1Char('-') || prev == QLatin1Char('_') || prev == QLatin1Char('.')
        || prev == QLatin1Char(' ') || prev == QLatin1Char('/')) {
        return true;
    }
    return prev.isLower() && text.at(index).isUpper();
}

std::optional<double> FuzzyMatcher::rawScore(const QString& pattern, const QString& text)
{
    const int m = pattern.size();
    const int n = text.size();
    if (m == 0 || m > n) {
        return std::nullopt;
    }

    const QString patternLower = pattern.toLower();
    const QString textLower = text.toLower();

    // prev[t]: best score with the previous pattern char matched at t.
    std::vector<double> prev(static_cast<size_t>(n), kNone);
    std::vector<double> curr(static_cast<size_t>(n), kNone);

    for (int t = 0; t < n; ++t) {
        if (textLower.at(t) != patternLower.at(0)) {
            continue;
        }
        const double leading = std::min(kLeadingPenalty * t, kMaxLeadingPenalty);
        prev[static_cast<size_t>(t)] = kMatchScore
                                       + (isWordBoundary(text, t) ? kBoundaryBonus : 0.0)
                                       - leading;
    }

    for (int i = 1; i < m; ++i) {
        std::fill(curr.begin(), curr.end(), kNone);
        // Running max of prev[p] + kGapPenalty * p over p <= t - 2.
        double bestGapped = kNone;
        const QChar wanted = patternLower.at(i);
        for (int t = i; t < n; ++t) {
            if (t >= 2 && prev[static_cast<size_t>(t - 2)] != kNone) {
                bestGapped = std::max(bestGapped,
                                      prev[static_cast<size_t>(t - 2)] + kGapPenalty * (t - 2));
            }
            if (textLower.at(t) != wanted) {
                continue;
            }

            double best = kNone;
            if (prev[static_cast<size_t>(t - 1)] != kNone) {
                best = prev[static_cast<size_t>(t - 1)] + kConsecutiveBonus;
            }
            if (bestGapped != kNone) {
                best = std::max(best, bestGapped - kGapPenalty * (t - 1));
            }
            if (best == kNone) {
                continue;
            }
            curr[static_cast<size_t>(t)] = best + kMatchScore
                                           + (isWordBoundary(text, t) ? kBoundaryBonus : 0.0);
        }
        std::swap(prev, curr);
    }

    const double best = *std::max_element(prev.begin(), prev.end());
    if (best == kNone) {
        return std::nullopt;
    }
    return best;
}

std::optional<double> FuzzyMatcher::score(const QString& pattern, const QString& text)
{
    const std::optional<double> raw = rawScore(pattern, text);
    if (!raw) {
        return std::nullopt;
    }
    const std::optional<double> self = rawScore(pattern, pattern);
    if (!self || *self <= 0.0) {
        return std::nullopt;
    }
    return std::clamp(*raw / *self * 100.0, 0.0, 100.0);
}

std::optional<double> FuzzyMatcher::averageScore(const QStringList& terms, const QString& text)
{
    if (terms.isEmpty()) {
        return std::nullopt;
    }
    double sum = 0.0;
    for (const QString& term : terms) {
        const std::optional<double> termScore = score(term, text);
        if (!termScore) {
            return std::nullopt;
        }
        sum += *termScore;
    }
    return sum / terms.size();
}

std::optional<FuzzyMatcher::Match> FuzzyMatcher::match(const QString& query, const QString& name,
                                                       const QString& path, double pathOnlyFactor)
{
    const QStringList typed = terms(query);
    if (typed.isEmpty()) {
        return std::nullopt;
    }

    QStringList singulars;
    singulars.reserve(typed.size());
    for (const QString& term : typed) {
        singulars.append(singular(term));
    }
    const bool hasSingular = singulars != typed;

    if (const auto s = averageScore(typed, name)) {
        return Match{*s, false, false};
    }
    if (hasSingular) {
        if (const auto s = averageScore(singulars, name)) {
            return Match{*s, false, true};
        }
    }
    if (const auto s = averageScore(typed, path)) {
        return Match{*s * pathOnlyFactor, true, false};
    }
    if (hasSingular) {
        if (const auto s = averageScore(singulars, path)) {
            return Match{*s * pathOnlyFactor, true, true};
        }
    }
    return std::nullopt;
}

QStringList FuzzyMatcher::terms(const QString& query)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    return query.toLower().split(whitespace, Qt::SkipEmptyParts);
}

QString FuzzyMatcher::singular(const QString& term)
{
    if (term.endsWith(QLatin1String("es")) && term.size() - 2 >= 3) {
        return term.left(term.size() - 2);
    }
    if (term.endsWith(QLatin1Char('s')) && term.size() - 1 >= 3) {
        return term.left(term.size() - 1);
    }
    return term;
}

bool FuzzyMatcher::containsTerm(const QString& lowerText, const QString& term)
{
    if (term.isEmpty()) {
        return false;
    }
    if (lowerText.contains(term)) {
        return true;
    }
    const QString stem = singular(term);
    return stem != term && lowerText.contains(stem);
}

bool FuzzyMatcher::containsAllTerms(const QString& lowerText, const QStringList& terms)
{
    if (terms.isEmpty()) {
        return false;
    }
    return std::all_of(terms.begin(), terms.end(), [&lowerText](const QString& term) {
        return containsTerm(lowerText, term);
    });
}

QString FuzzyMatcher::normalizeSeparators(const QString& text)
{
    static const QRegularExpression separators(QStringLiteral("[-_\\s]+"));
    QString result = text.toLower();
    result.replace(separators, QStringLiteral(" "));
    return result.trimmed();
}

} // namespace gt
