#pragma once

namespace gt {

// Ranking constants. Scores are on a 0..100 scale before boosts.
struct RankingWeights {
    // Fusion weights
    double fuzzyWeight = 1.0;
    double semanticWeight = 0.9;

    // Fuzzy matcher
    double pathOnlyFactor = 0.5;

    // Semantic similarity (percent) below this contributes nothing
    double semanticFloor = 55.0;

    // Boosts, exclusive, strongest first
    double exactNameBoost = 40.0;
    double nameBoost = 20.0;
    double metadataBoost = 10.0;

    // Minimum total to be returned at all
    double minScore = 20.0;

    double tieEpsilon = 1e-6;
};

// Per-candidate breakdown, kept for --debug output.
struct ScoreBreakdown {
    double fuzzyScore = 0.0;
    bool fuzzyFromPath = false;
    double semanticScore = 0.0;      // percent, 0 when absent or below floor
    double boost = 0.0;
    double total = 0.0;
};

} // namespace gt
