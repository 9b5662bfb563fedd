#ifndef PVSIGNAL_CONTINGENCY_STATISTICS_HPP
#define PVSIGNAL_CONTINGENCY_STATISTICS_HPP

#include "pvsignal/interfaces/IDisproportionalityCalculator.hpp"
#include <optional>
#include <utility>

namespace pvsignal {

/**
 * @brief PRR, ROR and Information Component from a 2x2 table
 *
 * Stateless. When any cell is zero, every cell is shifted by the
 * configured continuity correction before ratios and logarithms are taken.
 */
class ContingencyStatistics : public IDisproportionalityCalculator {
public:
    ContingencyStatistics() = default;

    DisproportionalityResult analyze(
        const ContingencyTable& table,
        const DisproportionalityConfig& config
    ) const override;

    /**
     * @brief Expected drug-event count under independence, (a+b)(a+c)/N
     * @throws InsufficientDataException if N is zero
     */
    static double expectedCount(const ContingencyTable& table);

    /**
     * @brief Pearson chi-square with Yates correction
     * @return Statistic and its p-value on one degree of freedom
     */
    static std::pair<double, double> chiSquareYates(const ContingencyTable& table);

    /**
     * @brief Two-tailed Fisher exact test on the observed table
     *
     * Sums the hypergeometric probabilities of every table with the same
     * margins that is no more likely than the observed one.
     * @return Empty when the table is empty or too large for the distribution
     */
    static std::optional<double> fisherExact(const ContingencyTable& table);

    static SignalStrength classifyStrength(const DisproportionalityResult& result);
};

} // namespace pvsignal

#endif // PVSIGNAL_CONTINGENCY_STATISTICS_HPP
