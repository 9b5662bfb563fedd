#include "pvsignal/temporal/TemporalPatternAnalyzer.hpp"
#include "pvsignal/exceptions/Exceptions.hpp"
#include "pvsignal/utils/Logger.hpp"
#include "pvsignal/utils/NumericGuards.hpp"

#include <boost/math/distributions/poisson.hpp>
#include <boost/math/distributions/students_t.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace pvsignal {

namespace {

const std::string LOG_SOURCE = "TemporalPatternAnalyzer";

double twoSidedTPValue(double t_statistic, double degrees_of_freedom) {
    const boost::math::students_t_distribution<double> dist(degrees_of_freedom);
    return 2.0 * boost::math::cdf(boost::math::complement(dist, std::abs(t_statistic)));
}

double sumSquaredDeviation(const Eigen::Ref<const Eigen::VectorXd>& values) {
    if (values.size() == 0) {
        return 0.0;
    }
    return (values.array() - values.mean()).square().sum();
}

} // namespace

Eigen::VectorXd TemporalPatternAnalyzer::countsOf(const TimeSeriesData& series) {
    Eigen::VectorXd counts(static_cast<Eigen::Index>(series.size()));
    for (std::size_t i = 0; i < series.size(); ++i) {
        counts(static_cast<Eigen::Index>(i)) = static_cast<double>(series.points[i].count);
    }
    return counts;
}

std::vector<SpikeEvent> TemporalPatternAnalyzer::detectSpikes(
    const TimeSeriesData& series,
    const TemporalConfig& config) const {

    std::vector<SpikeEvent> spikes;
    const auto n = static_cast<Eigen::Index>(series.size());
    const auto window = static_cast<Eigen::Index>(config.spike_window);
    if (n <= window) {
        return spikes;
    }

    const Eigen::VectorXd counts = countsOf(series);
    for (Eigen::Index i = window; i < n; ++i) {
        const auto baseline = counts.segment(i - window, window);
        const double mean = baseline.mean();
        double sd = std::sqrt((baseline.array() - mean).square().mean());
        if (sd == 0.0) {
            sd = std::sqrt(mean);
        }
        if (sd == 0.0) {
            continue;
        }

        const double observed = counts(i);
        const double z = (observed - mean) / sd;
        if (z <= config.spike_z_threshold) {
            continue;
        }

        SpikeEvent spike;
        spike.day = series.points[static_cast<std::size_t>(i)].day;
        spike.observed = series.points[static_cast<std::size_t>(i)].count;
        spike.baseline_mean = mean;
        spike.fold_increase = observed / mean;
        spike.z_score = z;
        const boost::math::poisson_distribution<double> baseline_dist(mean);
        spike.p_value = boost::math::cdf(boost::math::complement(baseline_dist, observed - 1.0));
        spikes.push_back(spike);
    }
    return spikes;
}

TrendResult TemporalPatternAnalyzer::fitTrend(
    const TimeSeriesData& series,
    const TemporalConfig& config) const {

    const std::size_t n = series.size();
    if (n < 2) {
        throw InsufficientDataException(LOG_SOURCE, "trend needs at least 2 points, got " + std::to_string(n));
    }

    const std::size_t k = std::min(n, static_cast<std::size_t>(config.trend_periods));
    const std::size_t start = n - k;
    const double origin = series.points[start].day;

    Eigen::MatrixXd design(static_cast<Eigen::Index>(k), 2);
    Eigen::VectorXd response(static_cast<Eigen::Index>(k));
    for (std::size_t j = 0; j < k; ++j) {
        const auto& point = series.points[start + j];
        design(static_cast<Eigen::Index>(j), 0) = 1.0;
        design(static_cast<Eigen::Index>(j), 1) = point.day - origin;
        response(static_cast<Eigen::Index>(j)) = std::log(static_cast<double>(point.count) + 1.0);
    }

    TrendResult trend;
    trend.periods_used = static_cast<int>(k);

    // Constant counts: flat, and the t statistic would be 0/0
    if (response.maxCoeff() == response.minCoeff()) {
        trend.intercept = response(0);
        return trend;
    }

    const Eigen::Vector2d beta = design.colPivHouseholderQr().solve(response);
    const Eigen::VectorXd residuals = response - design * beta;

    trend.intercept = beta(0);
    trend.slope = beta(1);

    const double sse = residuals.squaredNorm();
    const double sst = sumSquaredDeviation(response);
    trend.r_squared = sst > 0.0 ? 1.0 - sse / sst : 0.0;

    if (k >= 3) {
        const double sxx = sumSquaredDeviation(design.col(1));
        const double sigma2 = sse / static_cast<double>(k - 2);
        const double se_slope = std::sqrt(sigma2 / sxx);
        if (se_slope > 0.0) {
            trend.p_value = twoSidedTPValue(trend.slope / se_slope, static_cast<double>(k - 2));
        } else {
            // Exact fit
            trend.p_value = trend.slope != 0.0 ? 0.0 : 1.0;
        }
    }

    requireFinite(trend.slope, LOG_SOURCE, "trend slope");
    requireFinite(trend.p_value, LOG_SOURCE, "trend p-value");

    if (trend.p_value < config.trend_p_threshold && trend.slope != 0.0) {
        trend.direction = trend.slope > 0.0 ? TrendDirection::INCREASING : TrendDirection::DECREASING;
        trend.characteristic_time_days = std::log(2.0) / std::abs(trend.slope);
    }
    return trend;
}

std::vector<ChangePoint> TemporalPatternAnalyzer::detectChangePoints(
    const TimeSeriesData& series,
    const TemporalConfig& config) const {

    struct Candidate {
        Eigen::Index split;
        double reduction;
        ChangePoint point;
    };

    std::vector<ChangePoint> change_points;
    const auto n = static_cast<Eigen::Index>(series.size());
    const auto min_segment = static_cast<Eigen::Index>(config.change_min_segment);
    if (config.max_change_points == 0 || n < 2 * min_segment) {
        return change_points;
    }

    const Eigen::VectorXd counts = countsOf(series);
    const double total_sse = sumSquaredDeviation(counts);

    std::vector<Candidate> candidates;
    for (Eigen::Index split = min_segment; split <= n - min_segment; ++split) {
        const auto before = counts.head(split);
        const auto after = counts.tail(n - split);
        const double mean_before = before.mean();
        const double mean_after = after.mean();
        if (mean_before <= 0.0 || mean_after <= 0.0) {
            continue;
        }

        const double ratio = mean_after / mean_before;
        if (ratio < config.change_ratio && ratio > 1.0 / config.change_ratio) {
            continue;
        }

        const double sse_before = sumSquaredDeviation(before);
        const double sse_after = sumSquaredDeviation(after);
        const double pooled_var = (sse_before + sse_after) / static_cast<double>(n - 2);
        const double se = std::sqrt(pooled_var * (1.0 / static_cast<double>(split)
                                                  + 1.0 / static_cast<double>(n - split)));
        const double p_value = se > 0.0
            ? twoSidedTPValue((mean_after - mean_before) / se, static_cast<double>(n - 2))
            : 0.0;
        if (p_value >= config.change_p_threshold) {
            continue;
        }

        ChangePoint cp;
        cp.day = series.points[static_cast<std::size_t>(split)].day;
        cp.mean_before = mean_before;
        cp.mean_after = mean_after;
        cp.ratio = ratio;
        cp.p_value = p_value;
        candidates.push_back({split, total_sse - (sse_before + sse_after), cp});
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& lhs, const Candidate& rhs) { return lhs.reduction > rhs.reduction; });

    // Greedy selection; splits closer than one segment to a chosen split describe the same shift
    std::vector<Eigen::Index> chosen;
    for (const auto& candidate : candidates) {
        if (static_cast<int>(chosen.size()) >= config.max_change_points) {
            break;
        }
        const bool overlaps = std::any_of(chosen.begin(), chosen.end(), [&](Eigen::Index s) {
            return std::abs(s - candidate.split) < min_segment;
        });
        if (!overlaps) {
            chosen.push_back(candidate.split);
            change_points.push_back(candidate.point);
        }
    }

    std::sort(change_points.begin(), change_points.end(),
              [](const ChangePoint& lhs, const ChangePoint& rhs) { return lhs.day < rhs.day; });
    return change_points;
}

double TemporalPatternAnalyzer::noveltyBand(double days, bool event_labeled, const TemporalConfig& config) {
    if (event_labeled) {
        if (days <= config.novelty_labeled_recent_days) return config.novelty_labeled_recent_score;
        if (days <= config.novelty_labeled_moderate_days) return config.novelty_labeled_moderate_score;
        return config.novelty_band_floor_score;
    }
    if (days <= config.novelty_band_very_recent_days) return config.novelty_band_very_recent_score;
    if (days <= config.novelty_band_recent_days) return config.novelty_band_recent_score;
    if (days <= config.novelty_band_moderate_days) return config.novelty_band_moderate_score;
    if (days <= config.novelty_band_old_days) return config.novelty_band_old_score;
    return config.novelty_band_floor_score;
}

LatencyCategory TemporalPatternAnalyzer::categorizeLatency(double days) {
    if (!std::isfinite(days) || days < 0.0) {
        throw std::invalid_argument("TemporalPatternAnalyzer: time to onset must be a non-negative number");
    }
    if (days <= 1.0) return LatencyCategory::IMMEDIATE;
    if (days <= 7.0) return LatencyCategory::EARLY;
    if (days <= 30.0) return LatencyCategory::DELAYED;
    if (days <= 90.0) return LatencyCategory::LATE;
    return LatencyCategory::VERY_LATE;
}

LatencyDistribution TemporalPatternAnalyzer::analyzeLatency(const std::vector<double>& onset_days) {
    LatencyDistribution distribution;
    if (onset_days.empty()) {
        return distribution;
    }
    for (double days : onset_days) {
        ++distribution.counts[categorizeLatency(days)];
    }

    std::vector<double> sorted = onset_days;
    std::sort(sorted.begin(), sorted.end());
    const std::size_t middle = sorted.size() / 2;
    distribution.median_days = (sorted.size() % 2 == 1) ? sorted[middle]
                                                        : 0.5 * (sorted[middle - 1] + sorted[middle]);
    return distribution;
}

NoveltyResult TemporalPatternAnalyzer::assessNovelty(
    const NoveltyInput& input,
    const TemporalConfig& config) const {

    if (input.total_reports < 0) {
        throw std::invalid_argument("TemporalPatternAnalyzer: total reports must be non-negative");
    }

    NoveltyResult novelty;
    const double days = std::max(0.0, input.as_of_day - input.first_report_day);
    const double total = static_cast<double>(input.total_reports);

    novelty.days_since_first_report = days;
    novelty.recency_term = std::exp(-std::log(2.0) * days / config.novelty_half_life_days);
    novelty.volume_term = 1.0 / (1.0 + std::log1p(total));
    novelty.growth_term = std::min(total / std::max(days, 1.0), config.growth_cap) / config.growth_cap;

    novelty.score = config.novelty_weight_recency * novelty.recency_term
                    + config.novelty_weight_volume * novelty.volume_term
                    + config.novelty_weight_growth * novelty.growth_term;
    novelty.score = clamp01(requireFinite(novelty.score, LOG_SOURCE, "novelty score"));
    novelty.band_score = noveltyBand(days, input.event_labeled, config);

    const double emerging_window = input.event_labeled ? config.emerging_window_labeled_days
                                                       : config.emerging_window_unlabeled_days;
    novelty.emerging = days <= emerging_window && novelty.score > config.emerging_score_threshold;
    return novelty;
}

double TemporalPatternAnalyzer::riskScore(const TemporalResult& result) {
    double risk = 0.0;
    if (result.has_recent_spike) {
        risk += 0.30;
    }
    if (!result.change_points.empty()) {
        risk += 0.25;
    }
    if (result.trend && result.trend->direction == TrendDirection::INCREASING) {
        risk += 0.20;
    }
    if (result.novelty) {
        if (result.novelty->emerging) {
            risk += 0.25;
        } else if (result.novelty->score > 0.6) {
            risk += 0.15;
        }
    }
    return std::min(risk, 1.0);
}

TemporalResult TemporalPatternAnalyzer::analyze(
    const TimeSeriesData& series,
    const std::optional<NoveltyInput>& novelty,
    const TemporalConfig& config) const {

    series.validate();

    TemporalResult result;
    result.spike_detection_run = series.size() > static_cast<std::size_t>(config.spike_window);
    if (result.spike_detection_run) {
        result.spikes = detectSpikes(series, config);
        const double last_day = series.points.back().day;
        result.has_recent_spike = std::any_of(result.spikes.begin(), result.spikes.end(),
            [&](const SpikeEvent& s) { return last_day - s.day <= config.recent_spike_days; });
    } else if (!series.empty()) {
        Logger::getInstance().debug(LOG_SOURCE, "Series of " + std::to_string(series.size())
                                    + " point(s) is within the spike window; spike detection skipped");
    }

    result.change_points = detectChangePoints(series, config);

    try {
        result.trend = fitTrend(series, config);
    } catch (const InsufficientDataException& e) {
        Logger::getInstance().debug(LOG_SOURCE, e.what());
    }

    if (novelty.has_value()) {
        result.novelty = assessNovelty(*novelty, config);
    }

    result.risk_score = riskScore(result);
    return result;
}

} // namespace pvsignal
