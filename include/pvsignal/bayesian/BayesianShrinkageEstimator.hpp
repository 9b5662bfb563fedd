#ifndef PVSIGNAL_BAYESIAN_SHRINKAGE_ESTIMATOR_HPP
#define PVSIGNAL_BAYESIAN_SHRINKAGE_ESTIMATOR_HPP

#include "pvsignal/interfaces/IShrinkageEstimator.hpp"

namespace pvsignal {

/**
 * @brief Gamma-Poisson shrinker (MGPS with a single Gamma prior)
 *
 * The prior is fitted by method of moments over the observed/expected
 * ratios of the whole batch. Each pair's relative risk then has posterior
 * Gamma(shape + O, rate + E), summarised by its geometric mean (EBGM)
 * and its 5th/95th percentiles (EB05/EB95).
 *
 * The raw p-value of a pair is the posterior probability that its
 * relative risk does not exceed the null value, so EB05 > 1 exactly
 * when that probability is below 0.05. Benjamini-Hochberg adjustment
 * always starts from these raw values, which makes re-adjusting an
 * already adjusted batch a no-op.
 */
class BayesianShrinkageEstimator : public IShrinkageEstimator {
public:
    BayesianShrinkageEstimator() = default;

    ShrinkagePrior fitPrior(
        const std::vector<ObservedExpected>& counts,
        const BayesianConfig& config
    ) const override;

    BayesianResult computePosterior(
        const ObservedExpected& counts,
        const ShrinkagePrior& prior,
        const BayesianConfig& config
    ) const override;

    std::vector<BayesianResult> applyFdrControl(
        const std::vector<BayesianResult>& results,
        const BayesianConfig& config
    ) const override;
};

/**
 * @brief Benjamini-Hochberg step-up adjusted p-values
 *
 * Ties are ordered by input position. Values are capped at 1.
 *
 * @param p_values Raw p-values in [0,1]
 * @return Adjusted p-values in input order
 * @throws std::invalid_argument if a p-value lies outside [0,1]
 */
std::vector<double> benjaminiHochberg(const std::vector<double>& p_values);

} // namespace pvsignal

#endif // PVSIGNAL_BAYESIAN_SHRINKAGE_ESTIMATOR_HPP
