#include "pvsignal/SignalTypes.hpp"

#include <limits>
#include <stdexcept>

namespace pvsignal {

ContingencyTable::ContingencyTable(long long a, long long b, long long c, long long d)
    : a_(a), b_(b), c_(c), d_(d) {
    if (a < 0 || b < 0 || c < 0 || d < 0) {
        throw std::invalid_argument("ContingencyTable: counts must be non-negative");
    }
    // total() and the margins are plain sums
    constexpr long long limit = std::numeric_limits<long long>::max();
    if (a > limit - b || a + b > limit - c || a + b + c > limit - d) {
        throw std::invalid_argument("ContingencyTable: counts overflow the table total");
    }
}

void TimeSeriesData::validate() const {
    for (std::size_t i = 0; i < points.size(); ++i) {
        if (points[i].count < 0) {
            throw std::invalid_argument("TimeSeriesData: negative count at index " + std::to_string(i));
        }
        if (i > 0 && !(points[i].day > points[i - 1].day)) {
            throw std::invalid_argument("TimeSeriesData: days must be strictly increasing (index "
                                        + std::to_string(i) + ")");
        }
    }
}

} // namespace pvsignal
