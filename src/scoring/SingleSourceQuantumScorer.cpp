#include "pvsignal/scoring/SingleSourceQuantumScorer.hpp"
#include "pvsignal/utils/NumericGuards.hpp"

#include <algorithm>
#include <initializer_list>
#include <stdexcept>

namespace pvsignal {

double SingleSourceQuantumScorer::seriousness(const SingleSourceInput& input, const SingleSourceConfig& config) {
    double value = 0.0;
    if (input.any_serious) {
        value += config.seriousness_flag;
    }
    if (input.death_count > 0) {
        value += config.seriousness_death;
    }
    if (input.hospitalization_count > 0) {
        value += config.seriousness_hospitalization;
    }
    if (input.disability_count > 0) {
        value += config.seriousness_disability;
    }
    if (input.count > 0) {
        const double fraction = static_cast<double>(std::min(input.serious_count, input.count))
                                / static_cast<double>(input.count);
        value += config.seriousness_fraction * fraction;
    }
    return std::min(value, 1.0);
}

double SingleSourceQuantumScorer::recency(const std::optional<double>& days_since_last_report,
                                          const SingleSourceConfig& config) {
    if (!days_since_last_report.has_value()) {
        return config.recency_missing_default;
    }

    const double days = std::max(0.0, *days_since_last_report);
    const double recent = config.recency_recent_days;
    const double moderate = config.recency_moderate_days;

    double value = 0.0;
    if (days <= recent) {
        value = 1.0 - 0.5 * days / recent;
    } else if (days <= moderate) {
        value = 0.5 - 0.3 * (days - recent) / (moderate - recent);
    } else {
        value = 0.2 - (days - moderate) / 3650.0;
    }
    return clamp01(value);
}

SingleSourceComponents SingleSourceQuantumScorer::combine(
    double rarity, double seriousness, double recency, double count,
    const SingleSourceConfig& config) const {

    SingleSourceComponents c;
    c.rarity = rarity;
    c.seriousness = seriousness;
    c.recency = recency;
    c.count = count;
    c.base_score = config.weight_rarity * rarity
                   + config.weight_seriousness * seriousness
                   + config.weight_recency * recency
                   + config.weight_count * count;

    const double pair = config.pair_threshold;
    const double triple = config.triple_threshold;
    if (rarity > pair && seriousness > pair) {
        c.interaction_boosts.emplace_back("rare_serious", config.boost_rare_serious);
    }
    if (rarity > pair && recency > pair) {
        c.interaction_boosts.emplace_back("rare_recent", config.boost_rare_recent);
    }
    if (seriousness > pair && recency > pair) {
        c.interaction_boosts.emplace_back("serious_recent", config.boost_serious_recent);
    }
    if (rarity > triple && seriousness > triple && recency > triple) {
        c.interaction_boosts.emplace_back("all_three", config.boost_all_three);
    }

    // Near misses: inside (tunneling_min, tunneling_max]
    for (double component : {rarity, seriousness, recency}) {
        if (component > config.tunneling_min && component <= config.tunneling_max) {
            c.tunneling_boost += config.tunneling_boost;
        }
    }

    double total = c.base_score + c.tunneling_boost;
    for (const auto& [name, boost] : c.interaction_boosts) {
        total += boost;
    }
    c.score = std::max(0.0, total);
    return c;
}

SingleSourceComponents SingleSourceQuantumScorer::score(
    const SingleSourceInput& input,
    const SingleSourceConfig& config) const {

    if (input.count < 0 || input.total < 0 || input.count > input.total) {
        throw std::invalid_argument("SingleSourceQuantumScorer: require 0 <= count <= total");
    }

    const double rarity = input.total > 0
        ? 1.0 - static_cast<double>(input.count) / static_cast<double>(input.total)
        : 0.0;
    const double count = std::min(1.0, static_cast<double>(input.count) / config.count_cap);

    return combine(rarity, seriousness(input, config), recency(input.days_since_last_report, config),
                   count, config);
}

} // namespace pvsignal
