#include "pvsignal/config/SignalConfig.hpp"
#include "pvsignal/exceptions/Exceptions.hpp"
#include "pvsignal/utils/Logger.hpp"

#include <cmath>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <sstream>

namespace pvsignal {

namespace {

const std::string LOG_SOURCE = "SignalConfig";
constexpr double WEIGHT_SUM_TOLERANCE = 1e-6;

void requireConvex(const std::string& group, std::initializer_list<double> weights) {
    double sum = 0.0;
    for (double w : weights) {
        if (!std::isfinite(w) || w < 0.0) {
            PVSIGNAL_THROW_INVALID_CONFIG(LOG_SOURCE, group + " weights must be non-negative");
        }
        sum += w;
    }
    if (std::abs(sum - 1.0) > WEIGHT_SUM_TOLERANCE) {
        std::ostringstream oss;
        oss << group << " weights must sum to 1 (got " << sum << ")";
        PVSIGNAL_THROW_INVALID_CONFIG(LOG_SOURCE, oss.str());
    }
}

void requireNonNegative(const std::string& name, double value) {
    if (!std::isfinite(value) || value < 0.0) {
        PVSIGNAL_THROW_INVALID_CONFIG(LOG_SOURCE, name + " must be a non-negative number");
    }
}

void requirePositive(const std::string& name, double value) {
    if (!std::isfinite(value) || value <= 0.0) {
        PVSIGNAL_THROW_INVALID_CONFIG(LOG_SOURCE, name + " must be positive");
    }
}

void requireUnitInterval(const std::string& name, double value) {
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        PVSIGNAL_THROW_INVALID_CONFIG(LOG_SOURCE, name + " must lie in [0, 1]");
    }
}

void requireOpenUnitInterval(const std::string& name, double value) {
    if (!std::isfinite(value) || value <= 0.0 || value >= 1.0) {
        PVSIGNAL_THROW_INVALID_CONFIG(LOG_SOURCE, name + " must lie in (0, 1)");
    }
}

void requireAtLeast(const std::string& name, int value, int minimum) {
    if (value < minimum) {
        PVSIGNAL_THROW_INVALID_CONFIG(LOG_SOURCE, name + " must be at least " + std::to_string(minimum));
    }
}

void requireAscendingBands(const std::string& group, std::initializer_list<double> bounds,
                           std::initializer_list<double> scores) {
    double previous_bound = 0.0;
    for (double bound : bounds) {
        if (!std::isfinite(bound) || !(bound > previous_bound)) {
            PVSIGNAL_THROW_INVALID_CONFIG(LOG_SOURCE, group + " day bounds must be positive and strictly ascending");
        }
        previous_bound = bound;
    }
    double previous_score = 1.0;
    for (double score : scores) {
        requireUnitInterval(group + " score", score);
        if (score > previous_score) {
            PVSIGNAL_THROW_INVALID_CONFIG(LOG_SOURCE, group + " scores must not increase with age");
        }
        previous_score = score;
    }
}

} // namespace

void SignalConfig::validate() const {
    // Disproportionality
    requireAtLeast("disproportionality.min_count", disproportionality.min_count, 0);
    requireNonNegative("disproportionality.prr_threshold", disproportionality.prr_threshold);
    requireNonNegative("disproportionality.ror_threshold", disproportionality.ror_threshold);
    requireNonNegative("disproportionality.ic025_threshold", disproportionality.ic025_threshold);
    requireOpenUnitInterval("disproportionality.confidence_level", disproportionality.confidence_level);
    requirePositive("disproportionality.continuity_correction", disproportionality.continuity_correction);

    // Bayesian
    requireNonNegative("bayesian.eb05_threshold", bayesian.eb05_threshold);
    requireOpenUnitInterval("bayesian.fdr_level", bayesian.fdr_level);
    requirePositive("bayesian.null_relative_risk", bayesian.null_relative_risk);
    requirePositive("bayesian.default_prior_shape", bayesian.default_prior_shape);
    requirePositive("bayesian.default_prior_rate", bayesian.default_prior_rate);
    requirePositive("bayesian.min_prior_parameter", bayesian.min_prior_parameter);
    if (!(bayesian.max_prior_parameter >= bayesian.min_prior_parameter)) {
        PVSIGNAL_THROW_INVALID_CONFIG(LOG_SOURCE, "bayesian.max_prior_parameter must not be below min_prior_parameter");
    }
    requireAtLeast("bayesian.min_pairs_for_prior", bayesian.min_pairs_for_prior, 2);

    // Causality
    requireNonNegative("causality.max_plausible_onset_days", causality.max_plausible_onset_days);
    requireAtLeast("causality.strong_alternative_count", causality.strong_alternative_count, 1);

    // Temporal
    requireAtLeast("temporal.spike_window", temporal.spike_window, 1);
    requireNonNegative("temporal.spike_z_threshold", temporal.spike_z_threshold);
    requireNonNegative("temporal.recent_spike_days", temporal.recent_spike_days);
    requireAtLeast("temporal.trend_periods", temporal.trend_periods, 2);
    requireOpenUnitInterval("temporal.trend_p_threshold", temporal.trend_p_threshold);
    requireAtLeast("temporal.change_min_segment", temporal.change_min_segment, 2);
    if (!(temporal.change_ratio >= 1.0)) {
        PVSIGNAL_THROW_INVALID_CONFIG(LOG_SOURCE, "temporal.change_ratio must be at least 1");
    }
    requireAtLeast("temporal.max_change_points", temporal.max_change_points, 0);
    requireOpenUnitInterval("temporal.change_p_threshold", temporal.change_p_threshold);
    requirePositive("temporal.novelty_half_life_days", temporal.novelty_half_life_days);
    requireConvex("temporal.novelty", {temporal.novelty_weight_recency,
                                       temporal.novelty_weight_volume,
                                       temporal.novelty_weight_growth});
    requirePositive("temporal.growth_cap", temporal.growth_cap);
    requireNonNegative("temporal.emerging_window_unlabeled_days", temporal.emerging_window_unlabeled_days);
    requireNonNegative("temporal.emerging_window_labeled_days", temporal.emerging_window_labeled_days);
    requireUnitInterval("temporal.emerging_score_threshold", temporal.emerging_score_threshold);
    requireAscendingBands("temporal.novelty_band",
                          {temporal.novelty_band_very_recent_days, temporal.novelty_band_recent_days,
                           temporal.novelty_band_moderate_days, temporal.novelty_band_old_days},
                          {temporal.novelty_band_very_recent_score, temporal.novelty_band_recent_score,
                           temporal.novelty_band_moderate_score, temporal.novelty_band_old_score,
                           temporal.novelty_band_floor_score});
    requireAscendingBands("temporal.novelty_labeled",
                          {temporal.novelty_labeled_recent_days, temporal.novelty_labeled_moderate_days},
                          {temporal.novelty_labeled_recent_score, temporal.novelty_labeled_moderate_score,
                           temporal.novelty_band_floor_score});

    // Layer 1
    requireConvex("layer1", {layer1.weight_rarity, layer1.weight_seriousness,
                             layer1.weight_recency, layer1.weight_count});
    requirePositive("layer1.count_cap", layer1.count_cap);
    requireUnitInterval("layer1.pair_threshold", layer1.pair_threshold);
    requireUnitInterval("layer1.triple_threshold", layer1.triple_threshold);
    requireNonNegative("layer1.boost_rare_serious", layer1.boost_rare_serious);
    requireNonNegative("layer1.boost_rare_recent", layer1.boost_rare_recent);
    requireNonNegative("layer1.boost_serious_recent", layer1.boost_serious_recent);
    requireNonNegative("layer1.boost_all_three", layer1.boost_all_three);
    requireUnitInterval("layer1.tunneling_min", layer1.tunneling_min);
    requireUnitInterval("layer1.tunneling_max", layer1.tunneling_max);
    if (!(layer1.tunneling_min < layer1.tunneling_max)) {
        PVSIGNAL_THROW_INVALID_CONFIG(LOG_SOURCE, "layer1 tunneling band must satisfy min < max");
    }
    requireNonNegative("layer1.tunneling_boost", layer1.tunneling_boost);
    requireNonNegative("layer1.seriousness_flag", layer1.seriousness_flag);
    requireNonNegative("layer1.seriousness_death", layer1.seriousness_death);
    requireNonNegative("layer1.seriousness_hospitalization", layer1.seriousness_hospitalization);
    requireNonNegative("layer1.seriousness_disability", layer1.seriousness_disability);
    requireNonNegative("layer1.seriousness_fraction", layer1.seriousness_fraction);
    requirePositive("layer1.recency_recent_days", layer1.recency_recent_days);
    if (!(layer1.recency_moderate_days > layer1.recency_recent_days)) {
        PVSIGNAL_THROW_INVALID_CONFIG(LOG_SOURCE, "layer1.recency_moderate_days must exceed recency_recent_days");
    }
    requireUnitInterval("layer1.recency_missing_default", layer1.recency_missing_default);

    // Layer 2
    requireConvex("layer2", {layer2.weight_frequency, layer2.weight_severity, layer2.weight_burst,
                             layer2.weight_novelty, layer2.weight_consensus, layer2.weight_mechanism});
    if (!(layer2.burst_fold_cap > 1.0) || !std::isfinite(layer2.burst_fold_cap)) {
        PVSIGNAL_THROW_INVALID_CONFIG(LOG_SOURCE, "layer2.burst_fold_cap must exceed 1");
    }
    requireUnitInterval("layer2.mechanism_default", layer2.mechanism_default);
    requireUnitInterval("layer2.novelty_default_unlabeled", layer2.novelty_default_unlabeled);
    requireUnitInterval("layer2.novelty_default_labeled", layer2.novelty_default_labeled);

    // Evidence and fusion
    requireConvex("evidence", {evidence.weight_classical, evidence.weight_bayesian,
                               evidence.weight_temporal, evidence.weight_causality});
    requireConvex("fusion", {fusion.weight_evidence, fusion.weight_layer1, fusion.weight_layer2});
    requirePositive("fusion.layer1_squash_scale", fusion.layer1_squash_scale);

    const double ladder[] = {fusion.tier_critical, fusion.tier_high, fusion.tier_moderate,
                             fusion.tier_watchlist, fusion.tier_low};
    for (double threshold : ladder) {
        requireUnitInterval("fusion tier threshold", threshold);
    }
    for (std::size_t i = 1; i < std::size(ladder); ++i) {
        if (!(ladder[i] < ladder[i - 1])) {
            PVSIGNAL_THROW_INVALID_CONFIG(LOG_SOURCE, "fusion alert tiers must be strictly descending");
        }
    }
}

SignalConfig SignalConfig::fromSettings(const std::map<std::string, double>& settings) {
    SignalConfig config;

    auto get = [&](const std::string& key, double def) {
        auto it = settings.find(key);
        return (it != settings.end()) ? it->second : def;
    };

    std::map<std::string, double*> real_keys = {
        {"disproportionality.prr_threshold", &config.disproportionality.prr_threshold},
        {"disproportionality.ror_threshold", &config.disproportionality.ror_threshold},
        {"disproportionality.ic025_threshold", &config.disproportionality.ic025_threshold},
        {"disproportionality.confidence_level", &config.disproportionality.confidence_level},
        {"disproportionality.continuity_correction", &config.disproportionality.continuity_correction},

        {"bayesian.eb05_threshold", &config.bayesian.eb05_threshold},
        {"bayesian.fdr_level", &config.bayesian.fdr_level},
        {"bayesian.null_relative_risk", &config.bayesian.null_relative_risk},
        {"bayesian.default_prior_shape", &config.bayesian.default_prior_shape},
        {"bayesian.default_prior_rate", &config.bayesian.default_prior_rate},
        {"bayesian.min_prior_parameter", &config.bayesian.min_prior_parameter},
        {"bayesian.max_prior_parameter", &config.bayesian.max_prior_parameter},

        {"causality.max_plausible_onset_days", &config.causality.max_plausible_onset_days},

        {"temporal.spike_z_threshold", &config.temporal.spike_z_threshold},
        {"temporal.recent_spike_days", &config.temporal.recent_spike_days},
        {"temporal.trend_p_threshold", &config.temporal.trend_p_threshold},
        {"temporal.change_ratio", &config.temporal.change_ratio},
        {"temporal.change_p_threshold", &config.temporal.change_p_threshold},
        {"temporal.novelty_half_life_days", &config.temporal.novelty_half_life_days},
        {"temporal.novelty.weight.recency", &config.temporal.novelty_weight_recency},
        {"temporal.novelty.weight.volume", &config.temporal.novelty_weight_volume},
        {"temporal.novelty.weight.growth", &config.temporal.novelty_weight_growth},
        {"temporal.growth_cap", &config.temporal.growth_cap},
        {"temporal.emerging_window_unlabeled_days", &config.temporal.emerging_window_unlabeled_days},
        {"temporal.emerging_window_labeled_days", &config.temporal.emerging_window_labeled_days},
        {"temporal.emerging_score_threshold", &config.temporal.emerging_score_threshold},
        {"temporal.novelty_band.very_recent_days", &config.temporal.novelty_band_very_recent_days},
        {"temporal.novelty_band.recent_days", &config.temporal.novelty_band_recent_days},
        {"temporal.novelty_band.moderate_days", &config.temporal.novelty_band_moderate_days},
        {"temporal.novelty_band.old_days", &config.temporal.novelty_band_old_days},
        {"temporal.novelty_band.very_recent_score", &config.temporal.novelty_band_very_recent_score},
        {"temporal.novelty_band.recent_score", &config.temporal.novelty_band_recent_score},
        {"temporal.novelty_band.moderate_score", &config.temporal.novelty_band_moderate_score},
        {"temporal.novelty_band.old_score", &config.temporal.novelty_band_old_score},
        {"temporal.novelty_band.floor_score", &config.temporal.novelty_band_floor_score},
        {"temporal.novelty_labeled.recent_days", &config.temporal.novelty_labeled_recent_days},
        {"temporal.novelty_labeled.moderate_days", &config.temporal.novelty_labeled_moderate_days},
        {"temporal.novelty_labeled.recent_score", &config.temporal.novelty_labeled_recent_score},
        {"temporal.novelty_labeled.moderate_score", &config.temporal.novelty_labeled_moderate_score},

        {"layer1.weight.rarity", &config.layer1.weight_rarity},
        {"layer1.weight.seriousness", &config.layer1.weight_seriousness},
        {"layer1.weight.recency", &config.layer1.weight_recency},
        {"layer1.weight.count", &config.layer1.weight_count},
        {"layer1.count_cap", &config.layer1.count_cap},
        {"layer1.pair_threshold", &config.layer1.pair_threshold},
        {"layer1.triple_threshold", &config.layer1.triple_threshold},
        {"layer1.boost.rare_serious", &config.layer1.boost_rare_serious},
        {"layer1.boost.rare_recent", &config.layer1.boost_rare_recent},
        {"layer1.boost.serious_recent", &config.layer1.boost_serious_recent},
        {"layer1.boost.all_three", &config.layer1.boost_all_three},
        {"layer1.tunneling_min", &config.layer1.tunneling_min},
        {"layer1.tunneling_max", &config.layer1.tunneling_max},
        {"layer1.tunneling_boost", &config.layer1.tunneling_boost},
        {"layer1.seriousness.flag", &config.layer1.seriousness_flag},
        {"layer1.seriousness.death", &config.layer1.seriousness_death},
        {"layer1.seriousness.hospitalization", &config.layer1.seriousness_hospitalization},
        {"layer1.seriousness.disability", &config.layer1.seriousness_disability},
        {"layer1.seriousness.fraction", &config.layer1.seriousness_fraction},
        {"layer1.recency_recent_days", &config.layer1.recency_recent_days},
        {"layer1.recency_moderate_days", &config.layer1.recency_moderate_days},
        {"layer1.recency_missing_default", &config.layer1.recency_missing_default},

        {"layer2.weight.frequency", &config.layer2.weight_frequency},
        {"layer2.weight.severity", &config.layer2.weight_severity},
        {"layer2.weight.burst", &config.layer2.weight_burst},
        {"layer2.weight.novelty", &config.layer2.weight_novelty},
        {"layer2.weight.consensus", &config.layer2.weight_consensus},
        {"layer2.weight.mechanism", &config.layer2.weight_mechanism},
        {"layer2.burst_fold_cap", &config.layer2.burst_fold_cap},
        {"layer2.mechanism_default", &config.layer2.mechanism_default},
        {"layer2.novelty_default_unlabeled", &config.layer2.novelty_default_unlabeled},
        {"layer2.novelty_default_labeled", &config.layer2.novelty_default_labeled},

        {"evidence.weight.classical", &config.evidence.weight_classical},
        {"evidence.weight.bayesian", &config.evidence.weight_bayesian},
        {"evidence.weight.temporal", &config.evidence.weight_temporal},
        {"evidence.weight.causality", &config.evidence.weight_causality},

        {"fusion.weight.evidence", &config.fusion.weight_evidence},
        {"fusion.weight.layer1", &config.fusion.weight_layer1},
        {"fusion.weight.layer2", &config.fusion.weight_layer2},
        {"fusion.layer1_squash_scale", &config.fusion.layer1_squash_scale},
        {"fusion.tier.critical", &config.fusion.tier_critical},
        {"fusion.tier.high", &config.fusion.tier_high},
        {"fusion.tier.moderate", &config.fusion.tier_moderate},
        {"fusion.tier.watchlist", &config.fusion.tier_watchlist},
        {"fusion.tier.low", &config.fusion.tier_low},
    };

    std::map<std::string, int*> integer_keys = {
        {"disproportionality.min_count", &config.disproportionality.min_count},
        {"bayesian.min_pairs_for_prior", &config.bayesian.min_pairs_for_prior},
        {"causality.strong_alternative_count", &config.causality.strong_alternative_count},
        {"temporal.spike_window", &config.temporal.spike_window},
        {"temporal.trend_periods", &config.temporal.trend_periods},
        {"temporal.change_min_segment", &config.temporal.change_min_segment},
        {"temporal.max_change_points", &config.temporal.max_change_points},
    };

    for (auto& [key, target] : real_keys) {
        *target = get(key, *target);
    }
    for (auto& [key, target] : integer_keys) {
        double value = get(key, static_cast<double>(*target));
        if (!std::isfinite(value) || std::abs(value - std::round(value)) > 1e-9) {
            PVSIGNAL_THROW_INVALID_CONFIG(LOG_SOURCE, key + " must be an integer");
        }
        if (value < static_cast<double>(std::numeric_limits<int>::min())
            || value > static_cast<double>(std::numeric_limits<int>::max())) {
            PVSIGNAL_THROW_INVALID_CONFIG(LOG_SOURCE, key + " is out of the integer range");
        }
        *target = static_cast<int>(std::lround(value));
    }

    int applied = 0;
    for (const auto& [key, _] : settings) {
        if (real_keys.count(key) == 0 && integer_keys.count(key) == 0) {
            Logger::getInstance().warning(LOG_SOURCE, "Ignoring unknown setting: " + key);
        } else {
            ++applied;
        }
    }

    config.validate();
    Logger::getInstance().info(LOG_SOURCE, "Configuration built with " + std::to_string(applied) + " override(s)");
    return config;
}

} // namespace pvsignal
