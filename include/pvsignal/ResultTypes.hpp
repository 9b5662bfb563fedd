#ifndef PVSIGNAL_RESULT_TYPES_HPP
#define PVSIGNAL_RESULT_TYPES_HPP

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pvsignal {

// --- Disproportionality ---

struct ConfidenceInterval {
    double lower = 0.0;
    double upper = 0.0;
};

struct MetricEstimate {
    double value = 0.0;
    ConfidenceInterval ci;
    bool signal = false;
};

enum class SignalStrength { NONE, WEAK, MODERATE, STRONG, VERY_STRONG };

struct DisproportionalityResult {
    MetricEstimate prr;
    MetricEstimate ror;
    /** @brief IC on the log2 scale; ci.lower is IC025, ci.upper is IC975 */
    MetricEstimate ic;
    double expected_count = 0.0;
    long long observed_count = 0;
    bool continuity_corrected = false;
    double chi_square = 0.0;
    double chi_square_p_value = 1.0;
    std::optional<double> fisher_p_value;
    SignalStrength strength = SignalStrength::NONE;

    int methodsSignalling() const {
        return static_cast<int>(prr.signal) + static_cast<int>(ror.signal) + static_cast<int>(ic.signal);
    }
};

// --- Bayesian shrinkage ---

/**
 * @brief Gamma prior shared read-only by every pair of one batch
 */
class ShrinkagePrior {
public:
    ShrinkagePrior(double shape, double rate, std::size_t pairs_used, bool is_default);

    double shape() const { return shape_; }
    double rate() const { return rate_; }
    std::size_t pairsUsed() const { return pairs_used_; }
    bool isDefault() const { return is_default_; }

private:
    double shape_;
    double rate_;
    std::size_t pairs_used_;
    bool is_default_;
};

struct BayesianResult {
    double observed = 0.0;
    double expected = 0.0;
    double posterior_shape = 0.0;
    double posterior_rate = 0.0;
    double ebgm = 0.0;
    double eb05 = 0.0;
    double eb95 = 0.0;
    double raw_p_value = 1.0;
    double adjusted_p_value = 1.0;
    bool signal = false;
    bool fdr_significant = false;
    bool low_confidence = false;
};

// --- Causality ---

enum class WhoUmcCategory { CERTAIN, PROBABLE, POSSIBLE, UNLIKELY, CONDITIONAL, UNASSESSABLE };
enum class NaranjoCategory { DEFINITE, PROBABLE, POSSIBLE, DOUBTFUL };

constexpr std::size_t NARANJO_QUESTION_COUNT = 10;

struct NaranjoResult {
    int score = 0;
    NaranjoCategory category = NaranjoCategory::DOUBTFUL;
    std::array<int, NARANJO_QUESTION_COUNT> question_points{};
};

/**
 * @brief WHO-UMC and Naranjo verdicts reported side by side
 *
 * The reasoning, factor lists and recommendation explain the verdict
 * in plain text for the reviewer of an alert.
 */
struct CausalityResult {
    WhoUmcCategory who_umc = WhoUmcCategory::UNASSESSABLE;
    NaranjoResult naranjo;
    double confidence = 0.0;

    std::string who_umc_reasoning;
    std::vector<std::string> primary_factors;
    std::vector<std::string> supporting_factors;
    std::vector<std::string> conflicting_factors;
    std::string recommendation;
    std::string clinical_action;
};

// --- Temporal ---

/** @brief Time-to-onset bands: up to 1, 7, 30 and 90 days, then beyond */
enum class LatencyCategory { IMMEDIATE, EARLY, DELAYED, LATE, VERY_LATE };

struct LatencyDistribution {
    std::map<LatencyCategory, std::size_t> counts;
    std::optional<double> median_days;
};

struct SpikeEvent {
    double day = 0.0;
    long long observed = 0;
    double baseline_mean = 0.0;
    double fold_increase = 0.0;
    double z_score = 0.0;
    double p_value = 1.0;
};

enum class TrendDirection { INCREASING, DECREASING, STABLE };

struct TrendResult {
    TrendDirection direction = TrendDirection::STABLE;
    double slope = 0.0;
    double intercept = 0.0;
    double r_squared = 0.0;
    double p_value = 1.0;
    int periods_used = 0;
    /** @brief Doubling time (increasing) or halving time (decreasing) in days; set only when significant */
    std::optional<double> characteristic_time_days;
};

struct ChangePoint {
    double day = 0.0;
    double mean_before = 0.0;
    double mean_after = 0.0;
    double ratio = 0.0;
    double p_value = 1.0;
};

struct NoveltyResult {
    double recency_term = 0.0;
    double volume_term = 0.0;
    double growth_term = 0.0;
    double score = 0.0;
    double band_score = 0.0;
    double days_since_first_report = 0.0;
    bool emerging = false;
};

struct TemporalResult {
    bool spike_detection_run = false;
    std::vector<SpikeEvent> spikes;
    bool has_recent_spike = false;
    std::vector<ChangePoint> change_points;
    std::optional<TrendResult> trend;
    std::optional<NoveltyResult> novelty;
    double risk_score = 0.0;
};

// --- Composite scoring ---

struct SingleSourceComponents {
    double rarity = 0.0;
    double seriousness = 0.0;
    double recency = 0.0;
    double count = 0.0;
    double base_score = 0.0;
    std::vector<std::pair<std::string, double>> interaction_boosts;
    double tunneling_boost = 0.0;
    /** @brief Unbounded above */
    double score = 0.0;
};

struct MultiSourceComponents {
    double frequency = 0.0;
    double severity = 0.0;
    double burst = 0.0;
    double novelty = 0.0;
    double consensus = 0.0;
    double mechanism = 0.0;
    double score = 0.0;
};

/**
 * @brief Combined classical/Bayesian/temporal/causality evidence term
 */
struct EvidenceScore {
    std::optional<double> classical;
    std::optional<double> bayesian;
    std::optional<double> temporal;
    std::optional<double> causality;
    double score = 0.0;
};

// --- Fusion ---

enum class AlertTier { CRITICAL, HIGH, MODERATE, WATCHLIST, LOW, NONE };

enum class PairErrorKind { INSUFFICIENT_DATA, NUMERIC_OVERFLOW, INVALID_INPUT, INTERNAL_ERROR };

struct PairError {
    PairErrorKind kind = PairErrorKind::INVALID_INPUT;
    std::string component;
    std::string message;
};

struct FusionResult {
    std::string drug;
    std::string event;
    long long case_count = 0;

    std::optional<DisproportionalityResult> disproportionality;
    std::optional<BayesianResult> bayesian;
    std::optional<CausalityResult> causality;
    std::optional<TemporalResult> temporal;
    std::optional<SingleSourceComponents> layer1;
    std::optional<MultiSourceComponents> layer2;
    std::optional<EvidenceScore> evidence;

    double layer1_normalized = 0.0;
    double fusion_score = 0.0;
    AlertTier alert_tier = AlertTier::NONE;

    std::optional<double> time_to_onset_days;
    std::optional<LatencyCategory> latency;

    std::optional<int> rank;
    std::optional<double> percentile;
    /** @brief Position by case count alone, for comparison with the fused ranking */
    std::optional<int> classical_rank;

    /** @brief Sub-results that were not computed, with the reason */
    std::vector<std::string> not_computed;
    std::optional<PairError> error;

    bool ok() const { return !error.has_value(); }
};

std::string toString(SignalStrength strength);
std::string toString(WhoUmcCategory category);
std::string toString(NaranjoCategory category);
std::string toString(TrendDirection direction);
std::string toString(LatencyCategory category);
std::string toString(AlertTier tier);
std::string toString(PairErrorKind kind);

} // namespace pvsignal

#endif // PVSIGNAL_RESULT_TYPES_HPP
