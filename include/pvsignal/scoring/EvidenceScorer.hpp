#ifndef PVSIGNAL_EVIDENCE_SCORER_HPP
#define PVSIGNAL_EVIDENCE_SCORER_HPP

#include "pvsignal/ResultTypes.hpp"
#include "pvsignal/config/SignalConfig.hpp"
#include <optional>

namespace pvsignal {

/**
 * @brief Combines classical, Bayesian, temporal and causality findings into one score in [0,1]
 *
 * Missing temporal weight moves to the Bayesian part and missing causality
 * weight to the classical part. Any weight still unassigned after that is
 * spread over the available parts in proportion to their weights.
 */
class EvidenceScorer {
public:
    EvidenceScorer() = default;

    /**
     * @return Evidence score, or nullopt when none of the four parts is available
     */
    std::optional<EvidenceScore> score(
        const std::optional<DisproportionalityResult>& disproportionality,
        const std::optional<BayesianResult>& bayesian,
        const std::optional<TemporalResult>& temporal,
        const std::optional<CausalityResult>& causality,
        const EvidenceConfig& config
    ) const;

    static double classicalScore(const DisproportionalityResult& result);
    static double bayesianScore(const BayesianResult& result);
};

} // namespace pvsignal

#endif // PVSIGNAL_EVIDENCE_SCORER_HPP
