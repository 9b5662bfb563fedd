#ifndef PVSIGNAL_I_DISPROPORTIONALITY_CALCULATOR_HPP
#define PVSIGNAL_I_DISPROPORTIONALITY_CALCULATOR_HPP

#include "pvsignal/ResultTypes.hpp"
#include "pvsignal/SignalTypes.hpp"
#include "pvsignal/config/SignalConfig.hpp"

namespace pvsignal {

/**
 * @brief Interface for classical disproportionality statistics
 *
 * Pure, stateless transformation of a 2x2 table into PRR, ROR and IC.
 */
class IDisproportionalityCalculator {
public:
    virtual ~IDisproportionalityCalculator() = default;

    /**
     * @brief Compute PRR, ROR and IC with intervals and signal flags
     * @param table Report counts for one drug-event pair
     * @param config Thresholds and interval settings
     * @return Disproportionality result
     * @throws InsufficientDataException if the table total is zero
     * @throws NumericOverflowException if a statistic is not finite
     */
    virtual DisproportionalityResult analyze(
        const ContingencyTable& table,
        const DisproportionalityConfig& config
    ) const = 0;
};

} // namespace pvsignal

#endif // PVSIGNAL_I_DISPROPORTIONALITY_CALCULATOR_HPP
