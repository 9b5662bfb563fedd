#include "pvsignal/scoring/MultiSourceQuantumScorer.hpp"
#include "pvsignal/utils/NumericGuards.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace pvsignal {

namespace {

constexpr std::pair<long long, double> FREQUENCY_STEPS[] = {
    {100, 1.0}, {50, 0.8}, {20, 0.6}, {10, 0.4}, {5, 0.3}, {3, 0.2}, {1, 0.1}
};

} // namespace

double MultiSourceQuantumScorer::frequency(long long count) {
    for (const auto& [breakpoint, value] : FREQUENCY_STEPS) {
        if (count >= breakpoint) {
            return value;
        }
    }
    return 0.0;
}

MultiSourceComponents MultiSourceQuantumScorer::score(
    const MultiSourceInput& input,
    const MultiSourceConfig& config) const {

    if (input.count < 0 || input.serious_count < 0
        || input.sources_corroborating < 0 || input.sources_queried < 0) {
        throw std::invalid_argument("MultiSourceQuantumScorer: counts must be non-negative");
    }

    MultiSourceComponents c;
    c.frequency = frequency(input.count);
    c.severity = input.count > 0
        ? clamp01(static_cast<double>(input.serious_count) / static_cast<double>(input.count))
        : 0.0;
    c.burst = input.max_spike_fold.has_value()
        ? clamp01((*input.max_spike_fold - 1.0) / (config.burst_fold_cap - 1.0))
        : 0.0;

    if (input.novelty_band.has_value()) {
        c.novelty = clamp01(*input.novelty_band);
    } else {
        c.novelty = input.event_labeled ? config.novelty_default_labeled : config.novelty_default_unlabeled;
    }

    c.consensus = input.sources_queried > 0
        ? clamp01(static_cast<double>(input.sources_corroborating) / static_cast<double>(input.sources_queried))
        : 0.0;
    c.mechanism = clamp01(input.mechanism_plausibility.value_or(config.mechanism_default));

    c.score = config.weight_frequency * c.frequency
              + config.weight_severity * c.severity
              + config.weight_burst * c.burst
              + config.weight_novelty * c.novelty
              + config.weight_consensus * c.consensus
              + config.weight_mechanism * c.mechanism;
    c.score = clamp01(requireFinite(c.score, "MultiSourceQuantumScorer", "layer-2 score"));
    return c;
}

} // namespace pvsignal
