#ifndef PVSIGNAL_SIGNAL_CONFIG_HPP
#define PVSIGNAL_SIGNAL_CONFIG_HPP

#include <map>
#include <string>

namespace pvsignal {

/**
 * @brief Thresholds for the classical disproportionality metrics
 */
struct DisproportionalityConfig {
    /** @brief Minimum co-occurrence count before PRR/ROR may signal */
    int min_count = 3;
    double prr_threshold = 2.0;
    double ror_threshold = 1.0;
    /** @brief IC025 must exceed this value for an IC signal */
    double ic025_threshold = 0.0;
    /** @brief Two-sided confidence level of the PRR/ROR intervals */
    double confidence_level = 0.95;
    /** @brief Added to every cell when any cell is zero */
    double continuity_correction = 0.5;
};

/**
 * @brief Gamma-Poisson shrinkage settings
 */
struct BayesianConfig {
    /** @brief EB05 must exceed this value for a signal */
    double eb05_threshold = 2.0;
    /** @brief Target false discovery rate for Benjamini-Hochberg */
    double fdr_level = 0.05;
    /** @brief Relative risk under the null used for the raw p-value */
    double null_relative_risk = 1.0;
    double default_prior_shape = 2.0;
    double default_prior_rate = 4.0;
    double min_prior_parameter = 0.5;
    double max_prior_parameter = 10.0;
    /** @brief Usable observed/expected ratios required to fit a prior */
    int min_pairs_for_prior = 2;
};

struct CausalityConfig {
    /** @brief Upper bound of the biologically plausible onset window, in days */
    double max_plausible_onset_days = 90.0;
    /** @brief Alternative causes at or above this count make a relationship unlikely */
    int strong_alternative_count = 2;
};

struct TemporalConfig {
    int spike_window = 30;
    double spike_z_threshold = 3.0;
    double recent_spike_days = 90.0;

    int trend_periods = 26;
    double trend_p_threshold = 0.05;

    int change_min_segment = 10;
    double change_ratio = 1.5;
    int max_change_points = 3;
    double change_p_threshold = 0.05;

    double novelty_half_life_days = 90.0;
    double novelty_weight_recency = 0.5;
    double novelty_weight_volume = 0.3;
    double novelty_weight_growth = 0.2;
    /** @brief Reports per day at which the growth term saturates */
    double growth_cap = 1.0;
    double emerging_window_unlabeled_days = 180.0;
    double emerging_window_labeled_days = 90.0;
    double emerging_score_threshold = 0.5;

    // Novelty bands by days since first report; past the last bound the floor applies
    double novelty_band_very_recent_days = 30.0;
    double novelty_band_recent_days = 90.0;
    double novelty_band_moderate_days = 180.0;
    double novelty_band_old_days = 365.0;
    double novelty_band_very_recent_score = 1.0;
    double novelty_band_recent_score = 0.8;
    double novelty_band_moderate_score = 0.6;
    double novelty_band_old_score = 0.4;
    /** @brief Labeled events use two shorter bands with lower scores */
    double novelty_labeled_recent_days = 30.0;
    double novelty_labeled_moderate_days = 90.0;
    double novelty_labeled_recent_score = 0.6;
    double novelty_labeled_moderate_score = 0.4;
    double novelty_band_floor_score = 0.2;
};

/**
 * @brief Layer-1 (single-source) composite scorer settings
 */
struct SingleSourceConfig {
    double weight_rarity = 0.40;
    double weight_seriousness = 0.35;
    double weight_recency = 0.20;
    double weight_count = 0.05;

    /** @brief Count at which the count sub-score saturates */
    double count_cap = 10.0;

    double pair_threshold = 0.7;
    double triple_threshold = 0.6;
    double boost_rare_serious = 0.15;
    double boost_rare_recent = 0.10;
    double boost_serious_recent = 0.10;
    double boost_all_three = 0.20;

    double tunneling_min = 0.5;
    double tunneling_max = 0.7;
    double tunneling_boost = 0.05;

    double seriousness_flag = 0.5;
    double seriousness_death = 0.5;
    double seriousness_hospitalization = 0.3;
    double seriousness_disability = 0.2;
    double seriousness_fraction = 0.3;

    double recency_recent_days = 365.0;
    double recency_moderate_days = 730.0;
    double recency_missing_default = 0.5;
};

/**
 * @brief Layer-2 (multi-source) composite scorer settings
 */
struct MultiSourceConfig {
    double weight_frequency = 0.25;
    double weight_severity = 0.20;
    double weight_burst = 0.15;
    double weight_novelty = 0.15;
    double weight_consensus = 0.15;
    double weight_mechanism = 0.10;

    /** @brief Spike fold increase mapped to a burst score of 1 */
    double burst_fold_cap = 5.0;
    double mechanism_default = 0.5;
    double novelty_default_unlabeled = 0.5;
    double novelty_default_labeled = 0.2;
};

/**
 * @brief Weights of the combined classical/Bayesian/temporal/causality evidence term
 */
struct EvidenceConfig {
    double weight_classical = 0.30;
    double weight_bayesian = 0.40;
    double weight_temporal = 0.20;
    double weight_causality = 0.10;
};

struct FusionConfig {
    double weight_evidence = 0.35;
    double weight_layer1 = 0.40;
    double weight_layer2 = 0.25;
    /** @brief Layer-1 is mapped to [0,1) by tanh(x / scale) */
    double layer1_squash_scale = 1.0;

    double tier_critical = 0.95;
    double tier_high = 0.80;
    double tier_moderate = 0.65;
    double tier_watchlist = 0.45;
    double tier_low = 0.25;
};

/**
 * @brief Complete, validated engine configuration
 *
 * Every weight, threshold, window and band boundary used by the engine.
 * Treated as a read-only value for the duration of a batch.
 */
struct SignalConfig {
    DisproportionalityConfig disproportionality;
    BayesianConfig bayesian;
    CausalityConfig causality;
    TemporalConfig temporal;
    SingleSourceConfig layer1;
    MultiSourceConfig layer2;
    EvidenceConfig evidence;
    FusionConfig fusion;

    /**
     * @brief Check weights, thresholds and windows
     * @throws InvalidConfigurationException on the first violated constraint
     */
    void validate() const;

    /**
     * @brief Build a configuration from flat dotted keys over the defaults
     *
     * Keys such as "layer1.weight.rarity" or "temporal.spike_window".
     * Unknown keys are logged and ignored. The result is validated.
     *
     * @param settings Key/value overrides
     * @return Validated configuration
     * @throws InvalidConfigurationException if the merged values are invalid
     */
    static SignalConfig fromSettings(const std::map<std::string, double>& settings);
};

} // namespace pvsignal

#endif // PVSIGNAL_SIGNAL_CONFIG_HPP
