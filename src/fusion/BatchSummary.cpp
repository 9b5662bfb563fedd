#include "pvsignal/fusion/BatchSummary.hpp"
#include "pvsignal/temporal/TemporalPatternAnalyzer.hpp"
#include "pvsignal/utils/Logger.hpp"

#include <cmath>

namespace ba = boost::accumulators;

namespace pvsignal {

using ScoreAccumulatorType = ba::accumulator_set<double,
    ba::stats<
        ba::tag::extended_p_square_quantile(ba::quadratic),
        ba::tag::mean,
        ba::tag::variance(ba::lazy),
        ba::tag::count
    >
>;

BatchStatistics BatchSummary::summarize(const std::vector<FusionResult>& results) const {
    BatchStatistics stats;
    stats.total = results.size();

    if (results.empty()) {
        Logger::getInstance().warning("BatchSummary", "Empty batch");
        return stats;
    }

    std::vector<double> probs = {0.025, 0.5, 0.975};
    ScoreAccumulatorType acc(ba::extended_p_square_probabilities = probs);
    std::vector<double> onsets;

    for (const auto& result : results) {
        if (!result.ok()) {
            ++stats.error_marked;
            ++stats.error_counts[result.error->kind];
            continue;
        }
        ++stats.ranked;
        ++stats.tier_counts[result.alert_tier];
        acc(result.fusion_score);

        if (result.bayesian && result.bayesian->signal && result.bayesian->fdr_significant) {
            ++stats.fdr_significant;
        }
        if (result.temporal && result.temporal->novelty && result.temporal->novelty->emerging) {
            ++stats.emerging;
        }
        if (result.time_to_onset_days) {
            onsets.push_back(*result.time_to_onset_days);
        }
    }
    stats.latency = TemporalPatternAnalyzer::analyzeLatency(onsets);

    if (ba::count(acc) > 0) {
        stats.mean_score = ba::mean(acc);
        stats.std_dev_score = std::sqrt(ba::variance(acc));
        stats.q025_score = ba::quantile(acc, ba::quantile_probability = 0.025);
        stats.median_score = ba::quantile(acc, ba::quantile_probability = 0.5);
        stats.q975_score = ba::quantile(acc, ba::quantile_probability = 0.975);
    }

    return stats;
}

} // namespace pvsignal
