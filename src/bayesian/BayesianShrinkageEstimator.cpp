#include "pvsignal/bayesian/BayesianShrinkageEstimator.hpp"
#include "pvsignal/exceptions/Exceptions.hpp"
#include "pvsignal/utils/Logger.hpp"
#include "pvsignal/utils/NumericGuards.hpp"

#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <boost/math/distributions/gamma.hpp>
#include <boost/math/special_functions/digamma.hpp>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace ba = boost::accumulators;

namespace pvsignal {

namespace {

const std::string LOG_SOURCE = "BayesianShrinkageEstimator";

using RatioAccumulatorType = ba::accumulator_set<double,
    ba::stats<
        ba::tag::mean,
        ba::tag::variance,
        ba::tag::count
    >
>;

} // namespace

ShrinkagePrior BayesianShrinkageEstimator::fitPrior(
    const std::vector<ObservedExpected>& counts,
    const BayesianConfig& config) const {

    static Logger& logger = Logger::getInstance();

    // Sequential reduction in input order keeps the fit reproducible
    RatioAccumulatorType acc;
    for (const auto& pair : counts) {
        if (pair.expected > 0.0 && std::isfinite(pair.expected) && std::isfinite(pair.observed)) {
            acc(pair.observed / pair.expected);
        }
    }
    const auto usable = static_cast<std::size_t>(ba::count(acc));

    if (counts.size() <= 1 || usable < static_cast<std::size_t>(config.min_pairs_for_prior)) {
        logger.warning(LOG_SOURCE, "Batch of " + std::to_string(counts.size()) + " pair(s) with "
                       + std::to_string(usable) + " usable ratio(s); using default prior (shape="
                       + std::to_string(config.default_prior_shape) + ", rate="
                       + std::to_string(config.default_prior_rate) + "). Results are low confidence.");
        return ShrinkagePrior(config.default_prior_shape, config.default_prior_rate, usable, true);
    }

    const double mean = ba::mean(acc);
    const double variance = ba::variance(acc);

    double shape = 0.0;
    double rate = 0.0;
    if (mean <= 0.0) {
        // No co-occurrence anywhere in the batch; the default prior is the only sensible anchor
        logger.warning(LOG_SOURCE, "All observed/expected ratios are zero; using default prior");
        return ShrinkagePrior(config.default_prior_shape, config.default_prior_rate, usable, true);
    }
    if (variance > 0.0) {
        rate = mean / variance;
        shape = mean * rate;
    } else {
        shape = 2.0;
        rate = 2.0 / mean;
    }

    shape = std::clamp(shape, config.min_prior_parameter, config.max_prior_parameter);
    rate = std::clamp(rate, config.min_prior_parameter, config.max_prior_parameter);

    logger.info(LOG_SOURCE, "Fitted prior from " + std::to_string(usable) + " ratio(s): shape="
                + std::to_string(shape) + ", rate=" + std::to_string(rate)
                + " (mean=" + std::to_string(mean) + ", variance=" + std::to_string(variance) + ")");
    return ShrinkagePrior(shape, rate, usable, false);
}

BayesianResult BayesianShrinkageEstimator::computePosterior(
    const ObservedExpected& counts,
    const ShrinkagePrior& prior,
    const BayesianConfig& config) const {

    if (counts.observed < 0.0 || counts.expected < 0.0) {
        throw std::invalid_argument("BayesianShrinkageEstimator: counts must be non-negative");
    }

    BayesianResult result;
    result.observed = counts.observed;
    result.expected = counts.expected;
    result.posterior_shape = prior.shape() + counts.observed;
    result.posterior_rate = prior.rate() + counts.expected;
    result.low_confidence = prior.isDefault();

    try {
        const boost::math::gamma_distribution<double> posterior(result.posterior_shape,
                                                               1.0 / result.posterior_rate);
        result.ebgm = std::exp(boost::math::digamma(result.posterior_shape) - std::log(result.posterior_rate));
        result.eb05 = boost::math::quantile(posterior, 0.05);
        result.eb95 = boost::math::quantile(posterior, 0.95);
        result.raw_p_value = boost::math::cdf(posterior, config.null_relative_risk);
    } catch (const std::overflow_error& e) {
        throw NumericOverflowException(LOG_SOURCE, e.what());
    } catch (const std::domain_error& e) {
        throw NumericOverflowException(LOG_SOURCE, e.what());
    }

    requireFinite(result.ebgm, LOG_SOURCE, "EBGM");
    requireFinite(result.eb05, LOG_SOURCE, "EB05");
    requireFinite(result.eb95, LOG_SOURCE, "EB95");
    result.raw_p_value = std::clamp(requireFinite(result.raw_p_value, LOG_SOURCE, "raw p-value"), 0.0, 1.0);
    result.adjusted_p_value = result.raw_p_value;
    result.signal = result.eb05 > config.eb05_threshold;
    return result;
}

std::vector<BayesianResult> BayesianShrinkageEstimator::applyFdrControl(
    const std::vector<BayesianResult>& results,
    const BayesianConfig& config) const {

    std::vector<double> raw;
    raw.reserve(results.size());
    for (const auto& r : results) {
        raw.push_back(r.raw_p_value);
    }

    const auto adjusted = benjaminiHochberg(raw);

    std::vector<BayesianResult> out = results;
    int flagged = 0;
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i].adjusted_p_value = adjusted[i];
        out[i].fdr_significant = adjusted[i] < config.fdr_level;
        flagged += out[i].fdr_significant ? 1 : 0;
    }

    Logger::getInstance().debug(LOG_SOURCE, "FDR control at " + std::to_string(config.fdr_level) + ": "
                                + std::to_string(flagged) + " of " + std::to_string(out.size())
                                + " pair(s) significant");
    return out;
}

std::vector<double> benjaminiHochberg(const std::vector<double>& p_values) {
    const std::size_t m = p_values.size();
    for (double p : p_values) {
        if (!(p >= 0.0 && p <= 1.0)) {
            throw std::invalid_argument("benjaminiHochberg: p-values must lie in [0, 1]");
        }
    }

    std::vector<std::size_t> order(m);
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(),
                     [&](std::size_t lhs, std::size_t rhs) { return p_values[lhs] < p_values[rhs]; });

    std::vector<double> adjusted(m, 1.0);
    double running_min = 1.0;
    for (std::size_t k = m; k-- > 0;) {
        const std::size_t idx = order[k];
        const double candidate = p_values[idx] * static_cast<double>(m) / static_cast<double>(k + 1);
        running_min = std::min(running_min, candidate);
        adjusted[idx] = running_min;
    }
    return adjusted;
}

} // namespace pvsignal
