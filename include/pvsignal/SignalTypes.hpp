#ifndef PVSIGNAL_SIGNAL_TYPES_HPP
#define PVSIGNAL_SIGNAL_TYPES_HPP

#include <optional>
#include <string>
#include <vector>

namespace pvsignal {

/**
 * @brief 2x2 drug/event report counts for one pair
 *
 * a: drug and event, b: drug without event, c: event without drug,
 * d: neither. Immutable once constructed.
 */
class ContingencyTable {
public:
    /**
     * @throws std::invalid_argument if any count is negative
     */
    ContingencyTable(long long a, long long b, long long c, long long d);

    long long a() const { return a_; }
    long long b() const { return b_; }
    long long c() const { return c_; }
    long long d() const { return d_; }

    long long total() const { return a_ + b_ + c_ + d_; }
    long long drugTotal() const { return a_ + b_; }
    long long eventTotal() const { return a_ + c_; }

    bool hasZeroCell() const { return a_ == 0 || b_ == 0 || c_ == 0 || d_ == 0; }

private:
    long long a_;
    long long b_;
    long long c_;
    long long d_;
};

enum class DechallengeOutcome { IMPROVED, UNCHANGED, UNKNOWN };
enum class RechallengeOutcome { RECURRED, DID_NOT_RECUR, NOT_ATTEMPTED };

/**
 * @brief Clinical evidence for causality assessment
 */
struct ClinicalFeatures {
    /** @brief Days from first exposure to onset. Negative means onset preceded exposure. */
    std::optional<double> time_to_onset_days;
    DechallengeOutcome dechallenge = DechallengeOutcome::UNKNOWN;
    RechallengeOutcome rechallenge = RechallengeOutcome::NOT_ATTEMPTED;
    /** @brief Plausible alternative causes; nullopt when never assessed, empty when none were found. */
    std::optional<std::vector<std::string>> alternative_causes;

    bool event_known_for_drug = false;
    bool indication_could_cause_event = false;

    // Naranjo evidence, unknown unless supplied
    std::optional<bool> placebo_reaction;
    std::optional<bool> toxic_drug_level;
    std::optional<bool> dose_response;
    std::optional<bool> previous_similar_reaction;
    std::optional<bool> objective_evidence;
};

struct TimeSeriesPoint {
    double day = 0.0;
    long long count = 0;
};

/**
 * @brief Report counts per reporting period, ordered by day
 */
struct TimeSeriesData {
    std::vector<TimeSeriesPoint> points;

    std::size_t size() const { return points.size(); }
    bool empty() const { return points.empty(); }

    /**
     * @throws std::invalid_argument unless days are strictly increasing and counts non-negative
     */
    void validate() const;
};

/**
 * @brief Aggregate case facts used by the composite scorers
 */
struct CaseSummary {
    bool any_serious = false;
    long long serious_count = 0;
    long long death_count = 0;
    long long hospitalization_count = 0;
    long long disability_count = 0;

    std::optional<double> first_report_day;
    std::optional<double> most_recent_report_day;
    /** @brief Evaluation day for recency and novelty */
    std::optional<double> as_of_day;

    bool event_labeled = false;
    int sources_corroborating = 0;
    int sources_queried = 0;
    /** @brief Externally supplied plausibility in [0,1] */
    std::optional<double> mechanism_plausibility;
};

/**
 * @brief One drug-event pair submitted for scoring
 */
struct SignalPair {
    std::string drug;
    std::string event;
    ContingencyTable table{0, 0, 0, 0};
    std::optional<ClinicalFeatures> clinical;
    std::optional<TimeSeriesData> series;
    std::optional<CaseSummary> summary;
};

} // namespace pvsignal

#endif // PVSIGNAL_SIGNAL_TYPES_HPP
