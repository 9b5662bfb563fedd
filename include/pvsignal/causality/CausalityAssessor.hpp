#ifndef PVSIGNAL_CAUSALITY_ASSESSOR_HPP
#define PVSIGNAL_CAUSALITY_ASSESSOR_HPP

#include "pvsignal/interfaces/ICausalityAssessor.hpp"
#include <string>
#include <utility>
#include <vector>

namespace pvsignal {

enum class TemporalRelationship { PLAUSIBLE, IMPLAUSIBLE, UNKNOWN };

struct CausalityFactors {
    std::vector<std::string> primary;
    std::vector<std::string> supporting;
    std::vector<std::string> conflicting;
};

/**
 * @brief WHO-UMC and Naranjo causality procedures
 *
 * Both procedures are fixed published decision rules. They run
 * independently on the same features and are reported side by side.
 */
class CausalityAssessor : public ICausalityAssessor {
public:
    CausalityAssessor() = default;

    CausalityResult assess(
        const ClinicalFeatures& features,
        const CausalityConfig& config
    ) const override;

    /**
     * @brief WHO-UMC category from an ordered decision table
     *
     * Rules are tried in order and the first match wins:
     * unassessable (no timing, no challenge data), unlikely (implausible
     * timing), conditional (unknown timing), certain, probable,
     * unlikely (negative de/rechallenge or strong alternatives), possible.
     */
    static WhoUmcCategory classifyWhoUmc(const ClinicalFeatures& features, const CausalityConfig& config);

    /**
     * @brief Naranjo adverse drug reaction probability scale
     * @return Total score, bucket and the points of each of the ten questions
     */
    static NaranjoResult scoreNaranjo(const ClinicalFeatures& features);

    static TemporalRelationship temporalRelationship(const ClinicalFeatures& features, const CausalityConfig& config);

    /**
     * @brief Confidence in the assessment, from the WHO-UMC category plus supporting evidence
     * @return Value in [0, 0.98]
     */
    static double assessmentConfidence(WhoUmcCategory category, const NaranjoResult& naranjo,
                                       const ClinicalFeatures& features);

    static NaranjoCategory naranjoCategory(int score);

    /**
     * @brief One-sentence account of the WHO-UMC rule that produced `category`
     */
    static std::string whoUmcReasoning(WhoUmcCategory category, const ClinicalFeatures& features,
                                       const CausalityConfig& config);

    /**
     * @brief Sorts the supplied evidence into primary, supporting and conflicting factors
     *
     * Unknown answers are left out of every list.
     */
    static CausalityFactors identifyFactors(const ClinicalFeatures& features, const CausalityConfig& config);

    /**
     * @return Recommendation and clinical action for a WHO-UMC category
     */
    static std::pair<std::string, std::string> recommendation(WhoUmcCategory category);
};

} // namespace pvsignal

#endif // PVSIGNAL_CAUSALITY_ASSESSOR_HPP
