#ifndef PVSIGNAL_I_SHRINKAGE_ESTIMATOR_HPP
#define PVSIGNAL_I_SHRINKAGE_ESTIMATOR_HPP

#include "pvsignal/ResultTypes.hpp"
#include "pvsignal/config/SignalConfig.hpp"
#include <vector>

namespace pvsignal {

/**
 * @brief Observed and expected co-occurrence counts of one pair
 */
struct ObservedExpected {
    double observed = 0.0;
    double expected = 0.0;
};

/**
 * @brief Interface for empirical-Bayes shrinkage over a batch
 *
 * Three steps, in order: fitPrior once per batch, computePosterior
 * per pair (any order, any thread), applyFdrControl once over all results.
 */
class IShrinkageEstimator {
public:
    virtual ~IShrinkageEstimator() = default;

    /**
     * @brief Fit the batch prior
     * @param counts Observed/expected counts for every pair of the batch
     * @param config Prior bounds and fallback values
     * @return Immutable prior shared by all posterior computations of the batch
     */
    virtual ShrinkagePrior fitPrior(
        const std::vector<ObservedExpected>& counts,
        const BayesianConfig& config
    ) const = 0;

    /**
     * @brief Posterior summary for one pair
     * @param counts Observed/expected counts of the pair
     * @param prior Batch prior
     * @param config Signal threshold and null relative risk
     * @return Result with raw p-value; adjusted fields are filled by applyFdrControl
     */
    virtual BayesianResult computePosterior(
        const ObservedExpected& counts,
        const ShrinkagePrior& prior,
        const BayesianConfig& config
    ) const = 0;

    /**
     * @brief Benjamini-Hochberg adjustment across a batch
     * @param results Per-pair results of one batch
     * @param config Target false discovery rate
     * @return Copies of the results with adjusted p-values and FDR flags set
     */
    virtual std::vector<BayesianResult> applyFdrControl(
        const std::vector<BayesianResult>& results,
        const BayesianConfig& config
    ) const = 0;
};

} // namespace pvsignal

#endif // PVSIGNAL_I_SHRINKAGE_ESTIMATOR_HPP
