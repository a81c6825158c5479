#include "quality_scorer.hpp"

const QualityWeights QualityScorer::weights_{};

double QualityScorer::weight(SignalStrength strength) {
    switch (strength) {
        case SignalStrength::VeryStrong: return weights_.very_strong;
        case SignalStrength::Strong:     return weights_.strong;
        case SignalStrength::Moderate:   return weights_.moderate;
        case SignalStrength::Weak:       return weights_.weak;
        case SignalStrength::VeryWeak:   return weights_.very_weak;
    }
    return weights_.fallback;
}

double QualityScorer::score(const std::vector<EntrySignal>& signals) {
    double total_score = 0.0;
    double total_weight = 0.0;

    for (const auto& signal : signals) {
        double w = weight(signal.strength);
        total_score += signal.confidence * w;
        total_weight += w;
    }

    return total_weight > 0 ? total_score / total_weight : 0.0;
}

EntryQuality QualityScorer::rate(const std::vector<EntrySignal>& signals) {
    if (signals.empty()) {
        return EntryQuality::Poor;
    }
    return rate_score(score(signals));
}

EntryQuality QualityScorer::rate_score(double score) {
    if (score >= 0.85) return EntryQuality::Excellent;
    if (score >= 0.75) return EntryQuality::Good;
    if (score >= 0.60) return EntryQuality::Average;
    if (score >= 0.40) return EntryQuality::Poor;
    return EntryQuality::VeryPoor;
}
