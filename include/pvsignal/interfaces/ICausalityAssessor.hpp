#ifndef PVSIGNAL_I_CAUSALITY_ASSESSOR_HPP
#define PVSIGNAL_I_CAUSALITY_ASSESSOR_HPP

#include "pvsignal/ResultTypes.hpp"
#include "pvsignal/SignalTypes.hpp"
#include "pvsignal/config/SignalConfig.hpp"

namespace pvsignal {

/**
 * @brief Interface for deterministic causality assessment of one case
 */
class ICausalityAssessor {
public:
    virtual ~ICausalityAssessor() = default;

    /**
     * @brief Run both causality procedures
     * @param features Clinical evidence
     * @param config Onset window and alternative-cause settings
     * @return Both categories and the Naranjo breakdown, never merged
     */
    virtual CausalityResult assess(
        const ClinicalFeatures& features,
        const CausalityConfig& config
    ) const = 0;
};

} // namespace pvsignal

#endif // PVSIGNAL_I_CAUSALITY_ASSESSOR_HPP
