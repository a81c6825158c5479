#pragma once

#include "models.hpp"
#include <vector>

// Weights applied to signal confidence by strength
struct QualityWeights {
    double very_strong = 1.0;
    double strong = 0.8;
    double moderate = 0.6;
    double weak = 0.4;
    double very_weak = 0.2;
    double fallback = 0.5;  // Unrecognized strength
};

class QualityScorer {
public:
    static double weight(SignalStrength strength);

    // Confidence-weighted-by-strength average, 0.0 for an empty list
    static double score(const std::vector<EntrySignal>& signals);

    // Thresholds: >=0.85 excellent, >=0.75 good, >=0.60 average, >=0.40 poor.
    // An empty list is rated poor, not very poor.
    static EntryQuality rate(const std::vector<EntrySignal>& signals);
    static EntryQuality rate_score(double score);

private:
    static const QualityWeights weights_;
};
