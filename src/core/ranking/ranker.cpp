#include "core/ranking/ranker.h"
#include "core/ranking/fuzzy_matcher.h"
#include "core/shared/logging.h"
#include "core/vector/similarity_index.h"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace gt {

Ranker::Ranker(const RankingWeights& weights)
    : m_weights(weights)
{
}

double Ranker::boostFor(const QString& query, const Project& project) const
{
    const QStringList terms = FuzzyMatcher::terms(query);
    if (terms.isEmpty()) {
        return 0.0;
    }

    if (FuzzyMatcher::normalizeSeparators(query) == FuzzyMatcher::normalizeSeparators(project.name)) {
        return m_weights.exactNameBoost;
    }
    if (FuzzyMatcher::containsAllTerms(project.name.toLower(), terms)) {
        return m_weights.nameBoost;
    }
    if (FuzzyMatcher::containsAllTerms(project.descriptionText.toLower(), terms)) {
        return m_weights.metadataBoost;
    }
    return 0.0;
}

std::optional<ScoreBreakdown> Ranker::score(const QString& query, const Project& project,
                                            std::optional<double> semanticPercent) const
{
    ScoreBreakdown breakdown;

    const std::optional<FuzzyMatcher::Match> fuzzy =
        FuzzyMatcher::match(query, project.name, project.path, m_weights.pathOnlyFactor);
    if (fuzzy) {
        breakdown.fuzzyScore = fuzzy->score;
        breakdown.fuzzyFromPath = fuzzy->fromPath;
    }

    if (semanticPercent && *semanticPercent >= m_weights.semanticFloor) {
        breakdown.semanticScore = *semanticPercent;
    }

    breakdown.boost = boostFor(query, project);

    if (breakdown.fuzzyScore <= 0.0 && breakdown.semanticScore <= 0.0 && breakdown.boost <= 0.0) {
        return std::nullopt;
    }

    breakdown.total = m_weights.fuzzyWeight * breakdown.fuzzyScore
                      + m_weights.semanticWeight * breakdown.semanticScore
                      + breakdown.boost;
    return breakdown;
}

bool Ranker::precedes(const RankedProject& a, const RankedProject& b) const
{
    const double epsilon = m_weights.tieEpsilon > 0.0 ? m_weights.tieEpsilon : 1e-6;
    const long long bucketA = std::llround(a.score.total / epsilon);
    const long long bucketB = std::llround(b.score.total / epsilon);
    if (bucketA != bucketB) {
        return bucketA > bucketB;
    }

    const std::optional<double>& accessedA = a.project.lastAccessed;
    const std::optional<double>& accessedB = b.project.lastAccessed;
    if (accessedA.has_value() != accessedB.has_value()) {
        return accessedA.has_value();
    }
    if (accessedA && *accessedA != *accessedB) {
        return *accessedA > *accessedB;
    }

    return a.project.path < b.project.path;
}

std::vector<RankedProject> Ranker::rank(const QString& query,
                                        std::vector<Project> candidates,
                                        const std::vector<float>& queryEmbedding) const
{
    // Semantic similarity of every candidate whose embedding matches the
    // query's dimension.
    std::unordered_map<uint64_t, double> semantic;
    if (!queryEmbedding.empty()) {
        const int dims = static_cast<int>(queryEmbedding.size());
        size_t withEmbedding = 0;
        for (const Project& project : candidates) {
            if (static_cast<int>(project.embedding.size()) == dims) {
                ++withEmbedding;
            }
        }

        if (withEmbedding > 0) {
            SimilarityIndex index(dims, withEmbedding);
            for (size_t i = 0; i < candidates.size(); ++i) {
                if (static_cast<int>(candidates[i].embedding.size()) == dims
                    && !index.add(static_cast<uint64_t>(i), candidates[i].embedding)) {
                    LOG_WARN(gotoRanking, "Skipping embedding of %s",
                             qPrintable(candidates[i].path));
                }
            }
            for (const SimilarityIndex::Hit& hit : index.scoreAll(queryEmbedding)) {
                semantic[hit.label] = SimilarityIndex::similarityPercent(hit.cosine);
            }
        }
    }

    std::vector<RankedProject> ranked;
    ranked.reserve(candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto it = semantic.find(static_cast<uint64_t>(i));
        const std::optional<double> semanticPercent =
            it == semantic.end() ? std::nullopt : std::optional<double>(it->second);

        std::optional<ScoreBreakdown> breakdown = score(query, candidates[i], semanticPercent);
        if (!breakdown || breakdown->total < m_weights.minScore) {
            continue;
        }
        ranked.push_back({std::move(candidates[i]), *breakdown});
    }

    std::sort(ranked.begin(), ranked.end(),
              [this](const RankedProject& a, const RankedProject& b) { return precedes(a, b); });

    LOG_DEBUG(gotoRanking, "Ranked %zu of %zu candidates for '%s'", ranked.size(),
              candidates.size(), qUtf8Printable(query));
    return ranked;
}

} // namespace gt
