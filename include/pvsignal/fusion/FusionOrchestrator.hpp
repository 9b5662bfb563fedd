#ifndef PVSIGNAL_FUSION_ORCHESTRATOR_HPP
#define PVSIGNAL_FUSION_ORCHESTRATOR_HPP

#include "pvsignal/ResultTypes.hpp"
#include "pvsignal/SignalTypes.hpp"
#include "pvsignal/config/SignalConfig.hpp"
#include "pvsignal/interfaces/ICausalityAssessor.hpp"
#include "pvsignal/interfaces/IDisproportionalityCalculator.hpp"
#include "pvsignal/interfaces/IShrinkageEstimator.hpp"
#include "pvsignal/interfaces/ITemporalAnalyzer.hpp"
#include "pvsignal/scoring/EvidenceScorer.hpp"
#include "pvsignal/scoring/MultiSourceQuantumScorer.hpp"
#include "pvsignal/scoring/SingleSourceQuantumScorer.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace pvsignal {

/**
 * @brief Batch scoring of drug-event pairs into ranked fusion results
 *
 * This class coordinates the analysis components and owns the batch workflow:
 * 1. Fit the shrinkage prior over every pair of the batch (barrier)
 * 2. Score every pair independently, in parallel when OpenMP is available
 * 3. Apply false-discovery-rate control across the batch (barrier)
 * 4. Fuse the per-pair findings into a score and alert tier
 * 5. Rank the batch (barrier)
 *
 * Components are injected, so any of them may be replaced. A pair whose
 * computation fails is returned with an error marker; the rest of the
 * batch is unaffected. Results do not depend on the number of threads.
 */
class FusionOrchestrator {
public:
    /**
     * @brief Constructor with the default components
     * @param config Engine configuration
     * @throws InvalidConfigurationException if the configuration is invalid
     */
    explicit FusionOrchestrator(SignalConfig config = SignalConfig{});

    /**
     * @brief Constructor with dependency injection
     * @param config Engine configuration
     * @param disproportionality Classical statistics calculator
     * @param shrinkage Empirical-Bayes estimator
     * @param causality Causality assessor
     * @param temporal Time-series analyzer
     * @throws InvalidConfigurationException if the configuration is invalid
     * @throws std::invalid_argument if a component is null
     */
    FusionOrchestrator(
        SignalConfig config,
        std::unique_ptr<IDisproportionalityCalculator> disproportionality,
        std::unique_ptr<IShrinkageEstimator> shrinkage,
        std::unique_ptr<ICausalityAssessor> causality,
        std::unique_ptr<ITemporalAnalyzer> temporal
    );

    /**
     * @brief Score and rank a batch
     * @param pairs Pairs to score; the prior is fitted over all of them
     * @return One result per pair, ranked pairs first in rank order, then error-marked pairs in input order
     */
    std::vector<FusionResult> scoreBatch(const std::vector<SignalPair>& pairs) const;

    /**
     * @brief Score a single pair without ranking
     *
     * The pair forms a batch of one, so the default shrinkage prior is used
     * and the Bayesian result is flagged low confidence.
     */
    FusionResult scoreOne(const SignalPair& pair) const;

    const SignalConfig& config() const { return config_; }

    /**
     * @brief Alert tier for a fusion score under the configured threshold ladder
     */
    AlertTier alertTier(double fusion_score) const;

    /**
     * @brief Assign ranks and percentiles to the successful results and order the batch
     *
     * Sorted by fusion score descending; ties broken by case count
     * descending, then drug, then event, then input position.
     */
    static std::vector<FusionResult> rank(std::vector<FusionResult> results);

private:
    std::vector<FusionResult> scoreUnranked(const std::vector<SignalPair>& pairs) const;

    FusionResult analyzePair(
        const SignalPair& pair,
        const std::optional<ObservedExpected>& counts,
        const ShrinkagePrior& prior
    ) const;

    void fuse(FusionResult& result) const;

    SignalConfig config_;
    std::unique_ptr<IDisproportionalityCalculator> disproportionality_;
    std::unique_ptr<IShrinkageEstimator> shrinkage_;
    std::unique_ptr<ICausalityAssessor> causality_;
    std::unique_ptr<ITemporalAnalyzer> temporal_;
    SingleSourceQuantumScorer layer1_;
    MultiSourceQuantumScorer layer2_;
    EvidenceScorer evidence_;
};

/**
 * @brief Score and rank a batch with the default components
 * @throws InvalidConfigurationException before any scoring if the configuration is invalid
 */
std::vector<FusionResult> scoreBatch(const std::vector<SignalPair>& pairs, const SignalConfig& config);

/**
 * @brief Score one pair with the default components; rank and percentile stay empty
 */
FusionResult scoreOne(const SignalPair& pair, const SignalConfig& config);

} // namespace pvsignal

#endif // PVSIGNAL_FUSION_ORCHESTRATOR_HPP
