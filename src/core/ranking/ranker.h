#pragma once

#include "core/shared/scoring_types.h"
#include "core/shared/types.h"

#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace gt {

struct RankedProject {
    Project project;
    ScoreBreakdown score;
};

// Ranker — fuses fuzzy score, semantic similarity and name/metadata boosts
// into one deterministic order:
//   total desc (within tieEpsilon), last_accessed desc (unset last), path asc.
class Ranker {
public:
    explicit Ranker(const RankingWeights& weights = {});

    // Scores and orders candidates. queryEmbedding may be empty, in which
    // case ranking is lexical only. Candidates with no match strength, or
    // a total below minScore, are dropped.
    std::vector<RankedProject> rank(const QString& query,
                                    std::vector<Project> candidates,
                                    const std::vector<float>& queryEmbedding) const;

    // Score of one candidate; semanticPercent is nullopt when either side
    // has no embedding. nullopt when the candidate has no match strength.
    std::optional<ScoreBreakdown> score(const QString& query, const Project& project,
                                        std::optional<double> semanticPercent) const;

    // +exactNameBoost, +nameBoost or +metadataBoost, strongest only.
    double boostFor(const QString& query, const Project& project) const;

    // Total order used by rank(); exposed for tests.
    bool precedes(const RankedProject& a, const RankedProject& b) const;

    const RankingWeights& weights() const { return m_weights; }

private:
    RankingWeights m_weights;
};

} // namespace gt
