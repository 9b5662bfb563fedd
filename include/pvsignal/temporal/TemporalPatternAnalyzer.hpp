#ifndef PVSIGNAL_TEMPORAL_PATTERN_ANALYZER_HPP
#define PVSIGNAL_TEMPORAL_PATTERN_ANALYZER_HPP

#include "pvsignal/interfaces/ITemporalAnalyzer.hpp"
#include <Eigen/Dense>
#include <vector>

namespace pvsignal {

/**
 * @brief Detects reporting spikes, shifts, trends and novelty in report counts
 *
 * All analyses operate on the counts of a single drug-event pair at a
 * fixed reporting granularity. Days are used as the time unit throughout.
 */
class TemporalPatternAnalyzer : public ITemporalAnalyzer {
public:
    TemporalPatternAnalyzer() = default;

    TemporalResult analyze(
        const TimeSeriesData& series,
        const std::optional<NoveltyInput>& novelty,
        const TemporalConfig& config
    ) const override;

    /**
     * @brief Rolling-baseline spike detection
     *
     * Each point after the first `spike_window` periods is compared with the
     * mean and standard deviation of the preceding window. A zero standard
     * deviation falls back to the Poisson value sqrt(mean).
     *
     * @return Detected spikes in time order; empty if the series is not longer than the window
     */
    std::vector<SpikeEvent> detectSpikes(const TimeSeriesData& series, const TemporalConfig& config) const;

    /**
     * @brief Log-linear trend over the most recent `trend_periods` points
     * @throws InsufficientDataException with fewer than 2 points
     */
    TrendResult fitTrend(const TimeSeriesData& series, const TemporalConfig& config) const;

    /**
     * @brief Mean-shift change points, strongest first, at most `max_change_points`
     */
    std::vector<ChangePoint> detectChangePoints(const TimeSeriesData& series, const TemporalConfig& config) const;

    NoveltyResult assessNovelty(const NoveltyInput& input, const TemporalConfig& config) const;

    /**
     * @brief Band score by days since first report, stricter for labeled events
     *
     * Each band includes its upper bound. Bounds and scores come from `config`.
     */
    static double noveltyBand(double days_since_first_report, bool event_labeled, const TemporalConfig& config);

    /**
     * @brief Latency band of one time to onset; each band includes its upper bound
     * @throws std::invalid_argument for a negative or non-finite onset
     */
    static LatencyCategory categorizeLatency(double time_to_onset_days);

    /**
     * @brief Band counts and median of a set of onsets
     * @return Empty counts and no median for an empty set
     */
    static LatencyDistribution analyzeLatency(const std::vector<double>& onset_days);

    /**
     * @brief Aggregate temporal risk in [0,1] from the individual findings
     */
    static double riskScore(const TemporalResult& result);

private:
    static Eigen::VectorXd countsOf(const TimeSeriesData& series);
};

} // namespace pvsignal

#endif // PVSIGNAL_TEMPORAL_PATTERN_ANALYZER_HPP
