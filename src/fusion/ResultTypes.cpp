#include "pvsignal/ResultTypes.hpp"

#include <stdexcept>

namespace pvsignal {

ShrinkagePrior::ShrinkagePrior(double shape, double rate, std::size_t pairs_used, bool is_default)
    : shape_(shape), rate_(rate), pairs_used_(pairs_used), is_default_(is_default) {
    if (!(shape > 0.0) || !(rate > 0.0)) {
        throw std::invalid_argument("ShrinkagePrior: shape and rate must be positive");
    }
}

std::string toString(SignalStrength strength) {
    switch (strength) {
        case SignalStrength::VERY_STRONG: return "very_strong";
        case SignalStrength::STRONG:      return "strong";
        case SignalStrength::MODERATE:    return "moderate";
        case SignalStrength::WEAK:        return "weak";
        case SignalStrength::NONE:        return "none";
    }
    return "none";
}

std::string toString(WhoUmcCategory category) {
    switch (category) {
        case WhoUmcCategory::CERTAIN:      return "certain";
        case WhoUmcCategory::PROBABLE:     return "probable";
        case WhoUmcCategory::POSSIBLE:     return "possible";
        case WhoUmcCategory::UNLIKELY:     return "unlikely";
        case WhoUmcCategory::CONDITIONAL:  return "conditional";
        case WhoUmcCategory::UNASSESSABLE: return "unassessable";
    }
    return "unassessable";
}

std::string toString(NaranjoCategory category) {
    switch (category) {
        case NaranjoCategory::DEFINITE: return "definite";
        case NaranjoCategory::PROBABLE: return "probable";
        case NaranjoCategory::POSSIBLE: return "possible";
        case NaranjoCategory::DOUBTFUL: return "doubtful";
    }
    return "doubtful";
}

std::string toString(TrendDirection direction) {
    switch (direction) {
        case TrendDirection::INCREASING: return "increasing";
        case TrendDirection::DECREASING: return "decreasing";
        case TrendDirection::STABLE:     return "stable";
    }
    return "stable";
}

std::string toString(LatencyCategory category) {
    switch (category) {
        case LatencyCategory::IMMEDIATE: return "immediate";
        case LatencyCategory::EARLY:     return "early";
        case LatencyCategory::DELAYED:   return "delayed";
        case LatencyCategory::LATE:      return "late";
        case LatencyCategory::VERY_LATE: return "very_late";
    }
    return "very_late";
}

std::string toString(AlertTier tier) {
    switch (tier) {
        case AlertTier::CRITICAL:  return "critical";
        case AlertTier::HIGH:      return "high";
        case AlertTier::MODERATE:  return "moderate";
        case AlertTier::WATCHLIST: return "watchlist";
        case AlertTier::LOW:       return "low";
        case AlertTier::NONE:      return "none";
    }
    return "none";
}

std::string toString(PairErrorKind kind) {
    switch (kind) {
        case PairErrorKind::INSUFFICIENT_DATA: return "insufficient_data";
        case PairErrorKind::NUMERIC_OVERFLOW:  return "numeric_overflow";
        case PairErrorKind::INVALID_INPUT:     return "invalid_input";
        case PairErrorKind::INTERNAL_ERROR:    return "internal_error";
    }
    return "invalid_input";
}

} // namespace pvsignal
