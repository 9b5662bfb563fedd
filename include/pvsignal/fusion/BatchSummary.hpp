#ifndef PVSIGNAL_BATCH_SUMMARY_HPP
#define PVSIGNAL_BATCH_SUMMARY_HPP

#include "pvsignal/ResultTypes.hpp"
#include <sstream>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/extended_p_square_quantile.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <boost/accumulators/statistics/count.hpp>

#include <cstddef>
#include <map>
#include <vector>

namespace pvsignal {

/**
 * @brief Distribution of fusion scores and alert tiers over one scored batch
 */
struct BatchStatistics {
    std::size_t total = 0;
    std::size_t ranked = 0;
    std::size_t error_marked = 0;

    double mean_score = 0.0;
    double std_dev_score = 0.0;
    double q025_score = 0.0;
    double median_score = 0.0;
    double q975_score = 0.0;

    std::map<AlertTier, std::size_t> tier_counts;
    std::map<PairErrorKind, std::size_t> error_counts;

    /** @brief Pairs with a Bayesian signal surviving false discovery rate control */
    std::size_t fdr_significant = 0;
    std::size_t emerging = 0;

    /** @brief Time-to-onset profile of the ranked pairs that report one */
    LatencyDistribution latency;
};

/**
 * @brief Summarizes a scored batch
 *
 * Uses Boost.Accumulators for the score moments and quantiles.
 * Error-marked pairs are counted but excluded from the score statistics.
 */
class BatchSummary {
public:
    BatchSummary() = default;

    BatchStatistics summarize(const std::vector<FusionResult>& results) const;
};

} // namespace pvsignal

#endif // PVSIGNAL_BATCH_SUMMARY_HPP
