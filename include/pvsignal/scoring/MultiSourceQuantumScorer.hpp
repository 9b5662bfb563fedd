#ifndef PVSIGNAL_MULTI_SOURCE_QUANTUM_SCORER_HPP
#define PVSIGNAL_MULTI_SOURCE_QUANTUM_SCORER_HPP

#include "pvsignal/ResultTypes.hpp"
#include "pvsignal/config/SignalConfig.hpp"
#include <optional>

namespace pvsignal {

struct MultiSourceInput {
    long long count = 0;
    long long serious_count = 0;
    /** @brief Largest fold increase among detected spikes, if any */
    std::optional<double> max_spike_fold;
    /** @brief Label-aware novelty band from the temporal analysis */
    std::optional<double> novelty_band;
    bool event_labeled = false;
    int sources_corroborating = 0;
    int sources_queried = 0;
    std::optional<double> mechanism_plausibility;
};

/**
 * @brief Layer-2 composite score across independent sources
 *
 * Convex weighted sum of six sub-scores in [0,1], so the score is in [0,1].
 */
class MultiSourceQuantumScorer {
public:
    MultiSourceQuantumScorer() = default;

    /**
     * @throws std::invalid_argument on negative counts or source tallies
     */
    MultiSourceComponents score(const MultiSourceInput& input, const MultiSourceConfig& config) const;

    /**
     * @brief Stepped frequency sub-score at fixed count breakpoints
     */
    static double frequency(long long count);
};

} // namespace pvsignal

#endif // PVSIGNAL_MULTI_SOURCE_QUANTUM_SCORER_HPP
