#include "pvsignal/statistics/ContingencyStatistics.hpp"
#include "pvsignal/exceptions/Exceptions.hpp"
#include "pvsignal/utils/NumericGuards.hpp"

#include <boost/math/distributions/chi_squared.hpp>
#include <boost/math/distributions/hypergeometric.hpp>
#include <boost/math/distributions/normal.hpp>
#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <limits>
#include <utility>

namespace pvsignal {

namespace {

const std::string LOG_SOURCE = "ContingencyStatistics";

struct CorrectedCells {
    double a;
    double b;
    double c;
    double d;
};

CorrectedCells correctedCells(const ContingencyTable& t, double correction) {
    const double shift = t.hasZeroCell() ? correction : 0.0;
    return {static_cast<double>(t.a()) + shift, static_cast<double>(t.b()) + shift,
            static_cast<double>(t.c()) + shift, static_cast<double>(t.d()) + shift};
}

MetricEstimate logScaleEstimate(double log_value, double standard_error, double z) {
    MetricEstimate estimate;
    estimate.value = std::exp(log_value);
    estimate.ci.lower = std::exp(log_value - z * standard_error);
    estimate.ci.upper = std::exp(log_value + z * standard_error);
    return estimate;
}

} // namespace

double ContingencyStatistics::expectedCount(const ContingencyTable& table) {
    if (table.total() <= 0) {
        throw InsufficientDataException(LOG_SOURCE, "contingency table total is zero");
    }
    return static_cast<double>(table.drugTotal()) * static_cast<double>(table.eventTotal())
           / static_cast<double>(table.total());
}

DisproportionalityResult ContingencyStatistics::analyze(
    const ContingencyTable& table,
    const DisproportionalityConfig& config) const {

    if (table.total() <= 0) {
        throw InsufficientDataException(LOG_SOURCE, "contingency table total is zero");
    }

    DisproportionalityResult result;
    result.observed_count = table.a();
    result.continuity_corrected = table.hasZeroCell();

    const auto cells = correctedCells(table, config.continuity_correction);
    const boost::math::normal_distribution<double> standard_normal(0.0, 1.0);
    const double z = boost::math::quantile(standard_normal, 1.0 - (1.0 - config.confidence_level) / 2.0);
    const bool enough_cases = table.a() >= config.min_count;

    // PRR with Wald interval on the log scale
    const double prr_log = std::log((cells.a / (cells.a + cells.b)) / (cells.c / (cells.c + cells.d)));
    const double prr_se = std::sqrt(1.0 / cells.a - 1.0 / (cells.a + cells.b)
                                    + 1.0 / cells.c - 1.0 / (cells.c + cells.d));
    result.prr = logScaleEstimate(prr_log, prr_se, z);
    result.prr.signal = result.prr.value >= config.prr_threshold
                        && enough_cases
                        && result.prr.ci.lower > 1.0;

    // ROR with interval on the log-odds scale
    const double ror_log = std::log((cells.a * cells.d) / (cells.b * cells.c));
    const double ror_se = std::sqrt(1.0 / cells.a + 1.0 / cells.b + 1.0 / cells.c + 1.0 / cells.d);
    result.ror = logScaleEstimate(ror_log, ror_se, z);
    result.ror.signal = result.ror.value > config.ror_threshold
                        && result.ror.ci.lower > 1.0
                        && enough_cases;

    // IC on the log2 scale, shrunk by +0.5 on observed and expected
    const double observed = static_cast<double>(table.a());
    result.expected_count = expectedCount(table);
    const double ic = std::log2((observed + 0.5) / (result.expected_count + 0.5));
    const double ic_sigma = std::sqrt(1.0 / (observed + 0.5) + 1.0 / (result.expected_count + 0.5))
                            / std::log(2.0);
    result.ic.value = ic;
    result.ic.ci.lower = ic - 2.0 * ic_sigma;
    result.ic.ci.upper = ic + 2.0 * ic_sigma;
    result.ic.signal = result.ic.ci.lower > config.ic025_threshold;

    for (const MetricEstimate* m : {&result.prr, &result.ror, &result.ic}) {
        requireFinite(m->value, LOG_SOURCE, "point estimate");
        requireFinite(m->ci.lower, LOG_SOURCE, "interval lower bound");
        requireFinite(m->ci.upper, LOG_SOURCE, "interval upper bound");
    }

    const auto [chi2, chi2_p] = chiSquareYates(table);
    result.chi_square = chi2;
    result.chi_square_p_value = chi2_p;
    result.fisher_p_value = fisherExact(table);
    result.strength = classifyStrength(result);
    return result;
}

std::pair<double, double> ContingencyStatistics::chiSquareYates(const ContingencyTable& table) {
    const double n = static_cast<double>(table.total());
    const double row1 = static_cast<double>(table.drugTotal());
    const double row2 = static_cast<double>(table.c() + table.d());
    const double col1 = static_cast<double>(table.eventTotal());
    const double col2 = static_cast<double>(table.b() + table.d());

    // Degenerate margins carry no association
    if (n <= 0.0 || row1 == 0.0 || row2 == 0.0 || col1 == 0.0 || col2 == 0.0) {
        return {0.0, 1.0};
    }

    const double cross = static_cast<double>(table.a()) * static_cast<double>(table.d())
                         - static_cast<double>(table.b()) * static_cast<double>(table.c());
    const double corrected = std::max(0.0, std::abs(cross) - n / 2.0);
    const double chi2 = n * corrected * corrected / (row1 * row2 * col1 * col2);
    requireFinite(chi2, LOG_SOURCE, "chi-square statistic");

    const boost::math::chi_squared_distribution<double> dist(1.0);
    const double p_value = boost::math::cdf(boost::math::complement(dist, chi2));
    return {chi2, p_value};
}

std::optional<double> ContingencyStatistics::fisherExact(const ContingencyTable& table) {
    if (table.total() <= 0 || table.total() >= std::numeric_limits<unsigned>::max()) {
        return std::nullopt;
    }

    const auto population = static_cast<unsigned>(table.total());
    const auto drug_reports = static_cast<unsigned>(table.drugTotal());
    const auto event_reports = static_cast<unsigned>(table.eventTotal());
    const auto observed = static_cast<unsigned>(table.a());

    try {
        const boost::math::hypergeometric_distribution<double> dist(event_reports, drug_reports, population);
        const auto support = boost::math::support(dist);
        const unsigned lowest = support.first;
        const unsigned highest = support.second;

        // Unimodal: probabilities rise up to the mode and fall after it
        const double mode_estimate = std::floor((static_cast<double>(drug_reports) + 1.0)
                                                * (static_cast<double>(event_reports) + 1.0)
                                                / (static_cast<double>(population) + 2.0));
        const unsigned mode = std::clamp(static_cast<unsigned>(mode_estimate), lowest, highest);
        const double threshold = boost::math::pdf(dist, observed) * (1.0 + 1e-7);
        const auto as_extreme = [&](unsigned k) { return boost::math::pdf(dist, k) <= threshold; };

        double p_value = 0.0;
        if (observed <= mode) {
            p_value += boost::math::cdf(dist, observed);
            // First k above the observed count, at or past the mode, that is as extreme
            unsigned lo = std::max(mode, observed + 1);
            unsigned hi = highest + 1;
            while (lo < hi) {
                const unsigned mid = lo + (hi - lo) / 2;
                if (as_extreme(mid)) {
                    hi = mid;
                } else {
                    lo = mid + 1;
                }
            }
            if (lo <= highest) {
                p_value += boost::math::cdf(boost::math::complement(dist, lo - 1));
            }
        } else {
            p_value += boost::math::cdf(boost::math::complement(dist, observed - 1));
            // Last k at or below the mode that is as extreme
            long long lo = lowest;
            long long hi = mode;
            long long found = -1;
            while (lo <= hi) {
                const long long mid = lo + (hi - lo) / 2;
                if (as_extreme(static_cast<unsigned>(mid))) {
                    found = mid;
                    lo = mid + 1;
                } else {
                    hi = mid - 1;
                }
            }
            if (found >= 0) {
                p_value += boost::math::cdf(dist, static_cast<unsigned>(found));
            }
        }
        return std::clamp(requireFinite(p_value, LOG_SOURCE, "Fisher p-value"), 0.0, 1.0);
    } catch (const std::overflow_error& e) {
        throw NumericOverflowException(LOG_SOURCE, e.what());
    } catch (const std::domain_error& e) {
        throw NumericOverflowException(LOG_SOURCE, e.what());
    }
}

SignalStrength ContingencyStatistics::classifyStrength(const DisproportionalityResult& result) {
    const int methods = result.methodsSignalling();
    const long long n = result.observed_count;
    const double p = result.chi_square_p_value;

    if (methods == 3 && n >= 10 && p < 0.001) return SignalStrength::VERY_STRONG;
    if (methods >= 2 && n >= 5 && p < 0.01) return SignalStrength::STRONG;
    if (methods >= 1 && n >= 3 && p < 0.05) return SignalStrength::MODERATE;
    if (methods >= 1 || (result.prr.value >= 1.5 && n >= 3)) return SignalStrength::WEAK;
    return SignalStrength::NONE;
}

} // namespace pvsignal
