#ifndef PVSIGNAL_I_TEMPORAL_ANALYZER_HPP
#define PVSIGNAL_I_TEMPORAL_ANALYZER_HPP

#include "pvsignal/ResultTypes.hpp"
#include "pvsignal/SignalTypes.hpp"
#include "pvsignal/config/SignalConfig.hpp"
#include <optional>

namespace pvsignal {

/**
 * @brief Inputs to the novelty assessment
 */
struct NoveltyInput {
    double first_report_day = 0.0;
    double as_of_day = 0.0;
    long long total_reports = 0;
    bool event_labeled = false;
};

/**
 * @brief Interface for time-series pattern analysis of report counts
 */
class ITemporalAnalyzer {
public:
    virtual ~ITemporalAnalyzer() = default;

    /**
     * @brief Spikes, change points, trend and novelty of one series
     *
     * Sub-analyses lacking data are left empty rather than failing.
     *
     * @param series Report counts per period
     * @param novelty Novelty inputs, if the first report date is known
     * @param config Windows and thresholds
     * @return Temporal result
     * @throws std::invalid_argument if the series is malformed
     */
    virtual TemporalResult analyze(
        const TimeSeriesData& series,
        const std::optional<NoveltyInput>& novelty,
        const TemporalConfig& config
    ) const = 0;
};

} // namespace pvsignal

#endif // PVSIGNAL_I_TEMPORAL_ANALYZER_HPP
