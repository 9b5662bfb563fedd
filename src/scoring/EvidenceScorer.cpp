#include "pvsignal/scoring/EvidenceScorer.hpp"
#include "pvsignal/utils/NumericGuards.hpp"

#include <algorithm>

namespace pvsignal {

double EvidenceScorer::classicalScore(const DisproportionalityResult& result) {
    double score = 0.2;
    switch (result.methodsSignalling()) {
        case 3: score = 0.9; break;
        case 2: score = 0.7; break;
        case 1: score = 0.5; break;
        default: break;
    }

    const double magnitude = (result.prr.value + result.ror.value) / 2.0;
    if (magnitude > 5.0) {
        score += 0.10;
    } else if (magnitude > 3.0) {
        score += 0.05;
    }
    return std::min(score, 1.0);
}

double EvidenceScorer::bayesianScore(const BayesianResult& result) {
    double score = 0.30;
    if (result.eb05 > 4.0) {
        score = 0.95;
    } else if (result.eb05 > 2.0) {
        score = 0.80;
    } else if (result.eb05 > 1.0) {
        score = 0.60;
    }
    if (result.fdr_significant) {
        score += 0.05;
    }
    return std::min(score, 1.0);
}

std::optional<EvidenceScore> EvidenceScorer::score(
    const std::optional<DisproportionalityResult>& disproportionality,
    const std::optional<BayesianResult>& bayesian,
    const std::optional<TemporalResult>& temporal,
    const std::optional<CausalityResult>& causality,
    const EvidenceConfig& config) const {

    EvidenceScore evidence;
    if (disproportionality) evidence.classical = classicalScore(*disproportionality);
    if (bayesian) evidence.bayesian = bayesianScore(*bayesian);
    if (temporal) evidence.temporal = clamp01(temporal->risk_score);
    if (causality) evidence.causality = clamp01(causality->confidence);

    double w_classical = config.weight_classical;
    double w_bayesian = config.weight_bayesian;
    double w_temporal = config.weight_temporal;
    double w_causality = config.weight_causality;

    if (!evidence.temporal) {
        w_bayesian += w_temporal;
        w_temporal = 0.0;
    }
    if (!evidence.causality) {
        w_classical += w_causality;
        w_causality = 0.0;
    }

    double weighted = 0.0;
    double weight_used = 0.0;
    auto add = [&](const std::optional<double>& part, double weight) {
        if (part) {
            weighted += weight * *part;
            weight_used += weight;
        }
    };
    add(evidence.classical, w_classical);
    add(evidence.bayesian, w_bayesian);
    add(evidence.temporal, w_temporal);
    add(evidence.causality, w_causality);

    if (weight_used <= 0.0) {
        return std::nullopt;
    }
    evidence.score = clamp01(weighted / weight_used);
    return evidence;
}

} // namespace pvsignal
