#ifndef PVSIGNAL_SINGLE_SOURCE_QUANTUM_SCORER_HPP
#define PVSIGNAL_SINGLE_SOURCE_QUANTUM_SCORER_HPP

#include "pvsignal/ResultTypes.hpp"
#include "pvsignal/config/SignalConfig.hpp"
#include <optional>

namespace pvsignal {

/**
 * @brief Case facts from a single reporting source
 */
struct SingleSourceInput {
    long long count = 0;
    long long total = 0;
    bool any_serious = false;
    long long serious_count = 0;
    long long death_count = 0;
    long long hospitalization_count = 0;
    long long disability_count = 0;
    /** @brief Days between the most recent report and the evaluation day */
    std::optional<double> days_since_last_report;
};

/**
 * @brief Layer-1 composite score
 *
 * A convex base over rarity, seriousness, recency and count, plus
 * additive interaction boosts when several sub-scores are high together
 * and a tunneling bonus for sub-scores just below the pair threshold.
 * The result is a ranking signal and is not capped at 1.
 */
class SingleSourceQuantumScorer {
public:
    SingleSourceQuantumScorer() = default;

    /**
     * @throws std::invalid_argument if count or total are negative or count exceeds total
     */
    SingleSourceComponents score(const SingleSourceInput& input, const SingleSourceConfig& config) const;

    /**
     * @brief Combine already normalized sub-scores
     * @param rarity Sub-score in [0,1]
     * @param seriousness Sub-score in [0,1]
     * @param recency Sub-score in [0,1]
     * @param count Sub-score in [0,1]
     * @param config Weights, interaction and tunneling settings
     */
    SingleSourceComponents combine(double rarity, double seriousness, double recency, double count,
                                   const SingleSourceConfig& config) const;

    static double seriousness(const SingleSourceInput& input, const SingleSourceConfig& config);
    static double recency(const std::optional<double>& days_since_last_report, const SingleSourceConfig& config);
};

} // namespace pvsignal

#endif // PVSIGNAL_SINGLE_SOURCE_QUANTUM_SCORER_HPP
