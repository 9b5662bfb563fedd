#include "pvsignal/fusion/FusionOrchestrator.hpp"
#include "pvsignal/bayesian/BayesianShrinkageEstimator.hpp"
#include "pvsignal/causality/CausalityAssessor.hpp"
#include "pvsignal/exceptions/Exceptions.hpp"
#include "pvsignal/statistics/ContingencyStatistics.hpp"
#include "pvsignal/temporal/TemporalPatternAnalyzer.hpp"
#include "pvsignal/utils/Logger.hpp"
#include "pvsignal/utils/NumericGuards.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace pvsignal {

namespace {

const std::string LOG_SOURCE = "FusionOrchestrator";

/**
 * @brief Evaluation day: explicit as-of day, else last series point, else most recent report
 */
std::optional<double> evaluationDay(const SignalPair& pair) {
    if (pair.summary && pair.summary->as_of_day) {
        return pair.summary->as_of_day;
    }
    if (pair.series && !pair.series->empty()) {
        return pair.series->points.back().day;
    }
    if (pair.summary && pair.summary->most_recent_report_day) {
        return pair.summary->most_recent_report_day;
    }
    return std::nullopt;
}

std::optional<double> firstReportDay(const SignalPair& pair) {
    if (pair.summary && pair.summary->first_report_day) {
        return pair.summary->first_report_day;
    }
    if (pair.series) {
        for (const auto& point : pair.series->points) {
            if (point.count > 0) {
                return point.day;
            }
        }
    }
    return std::nullopt;
}

std::optional<double> mostRecentReportDay(const SignalPair& pair) {
    if (pair.summary && pair.summary->most_recent_report_day) {
        return pair.summary->most_recent_report_day;
    }
    if (pair.series) {
        for (auto it = pair.series->points.rbegin(); it != pair.series->points.rend(); ++it) {
            if (it->count > 0) {
                return it->day;
            }
        }
    }
    return std::nullopt;
}

FusionResult markError(FusionResult result, PairErrorKind kind,
                       const std::string& component, const std::string& message) {
    FusionResult failed;
    failed.drug = std::move(result.drug);
    failed.event = std::move(result.event);
    failed.case_count = result.case_count;
    failed.error = PairError{kind, component, message};
    return failed;
}

} // namespace

FusionOrchestrator::FusionOrchestrator(SignalConfig config)
    : FusionOrchestrator(std::move(config),
                         std::make_unique<ContingencyStatistics>(),
                         std::make_unique<BayesianShrinkageEstimator>(),
                         std::make_unique<CausalityAssessor>(),
                         std::make_unique<TemporalPatternAnalyzer>()) {}

FusionOrchestrator::FusionOrchestrator(
    SignalConfig config,
    std::unique_ptr<IDisproportionalityCalculator> disproportionality,
    std::unique_ptr<IShrinkageEstimator> shrinkage,
    std::unique_ptr<ICausalityAssessor> causality,
    std::unique_ptr<ITemporalAnalyzer> temporal)
    : config_(std::move(config)),
      disproportionality_(std::move(disproportionality)),
      shrinkage_(std::move(shrinkage)),
      causality_(std::move(causality)),
      temporal_(std::move(temporal)) {

    if (!disproportionality_) throw std::invalid_argument("FusionOrchestrator: Disproportionality calculator cannot be null");
    if (!shrinkage_) throw std::invalid_argument("FusionOrchestrator: Shrinkage estimator cannot be null");
    if (!causality_) throw std::invalid_argument("FusionOrchestrator: Causality assessor cannot be null");
    if (!temporal_) throw std::invalid_argument("FusionOrchestrator: Temporal analyzer cannot be null");

    config_.validate();
}

AlertTier FusionOrchestrator::alertTier(double fusion_score) const {
    const auto& f = config_.fusion;
    if (fusion_score >= f.tier_critical) return AlertTier::CRITICAL;
    if (fusion_score >= f.tier_high) return AlertTier::HIGH;
    if (fusion_score >= f.tier_moderate) return AlertTier::MODERATE;
    if (fusion_score >= f.tier_watchlist) return AlertTier::WATCHLIST;
    if (fusion_score >= f.tier_low) return AlertTier::LOW;
    return AlertTier::NONE;
}

FusionResult FusionOrchestrator::analyzePair(
    const SignalPair& pair,
    const std::optional<ObservedExpected>& counts,
    const ShrinkagePrior& prior) const {

    FusionResult result;
    result.drug = pair.drug;
    result.event = pair.event;
    result.case_count = pair.table.a();

    try {
        // Classical disproportionality
        try {
            result.disproportionality = disproportionality_->analyze(pair.table, config_.disproportionality);
        } catch (const InsufficientDataException& e) {
            result.not_computed.push_back("disproportionality: " + e.detail());
        }

        // Empirical Bayes posterior against the shared batch prior
        if (counts) {
            result.bayesian = shrinkage_->computePosterior(*counts, prior, config_.bayesian);
        } else {
            result.not_computed.push_back("bayesian: expected count undefined for an empty table");
        }

        if (pair.clinical) {
            result.causality = causality_->assess(*pair.clinical, config_.causality);
        } else {
            result.not_computed.push_back("causality: no clinical features supplied");
        }
        if (pair.clinical && pair.clinical->time_to_onset_days && *pair.clinical->time_to_onset_days >= 0.0) {
            result.time_to_onset_days = pair.clinical->time_to_onset_days;
            result.latency = TemporalPatternAnalyzer::categorizeLatency(*result.time_to_onset_days);
        }

        // Temporal patterns and novelty
        const auto as_of = evaluationDay(pair);
        const auto first_report = firstReportDay(pair);
        std::optional<NoveltyInput> novelty_input;
        if (as_of && first_report) {
            NoveltyInput input;
            input.first_report_day = *first_report;
            input.as_of_day = *as_of;
            input.total_reports = pair.table.a();
            input.event_labeled = pair.summary && pair.summary->event_labeled;
            novelty_input = input;
        }
        // An empty series with no report dates has nothing to analyze
        const bool has_series = pair.series && !pair.series->empty();
        if (has_series || novelty_input) {
            result.temporal = temporal_->analyze(pair.series.value_or(TimeSeriesData{}), novelty_input,
                                                 config_.temporal);
            if (!result.temporal->spike_detection_run) {
                result.not_computed.push_back("temporal.spikes: series not longer than the "
                                              + std::to_string(config_.temporal.spike_window) + "-period window");
            }
            if (!result.temporal->trend) {
                result.not_computed.push_back("temporal.trend: fewer than 2 points");
            }
            if (!result.temporal->novelty) {
                result.not_computed.push_back("temporal.novelty: first report or evaluation day unknown");
            }
        } else {
            result.not_computed.push_back("temporal: no time series or report dates supplied");
        }

        // Layer 1: single source
        const CaseSummary summary = pair.summary.value_or(CaseSummary{});
        SingleSourceInput single;
        single.count = pair.table.a();
        single.total = pair.table.total();
        single.any_serious = summary.any_serious;
        single.serious_count = summary.serious_count;
        single.death_count = summary.death_count;
        single.hospitalization_count = summary.hospitalization_count;
        single.disability_count = summary.disability_count;
        const auto last_report = mostRecentReportDay(pair);
        if (as_of && last_report) {
            single.days_since_last_report = *as_of - *last_report;
        }
        result.layer1 = layer1_.score(single, config_.layer1);

        // Layer 2: multi source
        MultiSourceInput multi;
        multi.count = pair.table.a();
        multi.serious_count = summary.serious_count;
        multi.event_labeled = summary.event_labeled;
        multi.sources_corroborating = summary.sources_corroborating;
        multi.sources_queried = summary.sources_queried;
        multi.mechanism_plausibility = summary.mechanism_plausibility;
        if (result.temporal) {
            for (const auto& spike : result.temporal->spikes) {
                multi.max_spike_fold = std::max(multi.max_spike_fold.value_or(0.0), spike.fold_increase);
            }
            if (result.temporal->novelty) {
                multi.novelty_band = result.temporal->novelty->band_score;
            }
        }
        result.layer2 = layer2_.score(multi, config_.layer2);

    } catch (const NumericOverflowException& e) {
        return markError(std::move(result), PairErrorKind::NUMERIC_OVERFLOW, e.source(), e.detail());
    } catch (const InsufficientDataException& e) {
        return markError(std::move(result), PairErrorKind::INSUFFICIENT_DATA, e.source(), e.detail());
    } catch (const std::invalid_argument& e) {
        return markError(std::move(result), PairErrorKind::INVALID_INPUT, "input", e.what());
    }
    return result;
}

void FusionOrchestrator::fuse(FusionResult& result) const {
    const auto& f = config_.fusion;

    result.evidence = evidence_.score(result.disproportionality, result.bayesian,
                                      result.temporal, result.causality, config_.evidence);
    result.layer1_normalized = std::tanh(result.layer1->score / f.layer1_squash_scale);

    double w_evidence = f.weight_evidence;
    double w_layer1 = f.weight_layer1;
    double w_layer2 = f.weight_layer2;
    if (!result.evidence) {
        result.not_computed.push_back("evidence: no classical, Bayesian, temporal or causality findings");
        const double layer_weight = w_layer1 + w_layer2;
        if (layer_weight <= 0.0) {
            result = markError(std::move(result), PairErrorKind::INSUFFICIENT_DATA, LOG_SOURCE,
                               "evidence term unavailable and both layer weights are zero");
            return;
        }
        w_layer1 += w_evidence * w_layer1 / layer_weight;
        w_layer2 += w_evidence * w_layer2 / layer_weight;
        w_evidence = 0.0;
    }

    const double evidence_score = result.evidence ? result.evidence->score : 0.0;
    const double fused = w_evidence * evidence_score
                         + w_layer1 * result.layer1_normalized
                         + w_layer2 * result.layer2->score;
    if (!std::isfinite(fused)) {
        result = markError(std::move(result), PairErrorKind::NUMERIC_OVERFLOW, LOG_SOURCE, "fusion score is not finite");
        return;
    }
    result.fusion_score = clamp01(fused);
    result.alert_tier = alertTier(result.fusion_score);
}

std::vector<FusionResult> FusionOrchestrator::scoreUnranked(const std::vector<SignalPair>& pairs) const {
    static Logger& logger = Logger::getInstance();
    const int n = static_cast<int>(pairs.size());

    // 1. Prior over the whole batch
    std::vector<std::optional<ObservedExpected>> counts(pairs.size());
    std::vector<ObservedExpected> prior_input;
    prior_input.reserve(pairs.size());
    for (std::size_t i = 0; i < pairs.size(); ++i) {
        const auto& table = pairs[i].table;
        if (table.total() > 0) {
            counts[i] = ObservedExpected{static_cast<double>(table.a()),
                                         ContingencyStatistics::expectedCount(table)};
            prior_input.push_back(*counts[i]);
        }
    }
    const ShrinkagePrior prior = shrinkage_->fitPrior(prior_input, config_.bayesian);

    bool use_parallel = n > 1;
#ifdef _OPENMP
    use_parallel = use_parallel && !omp_in_parallel();
#endif

    // 2. Independent per-pair analysis
    std::vector<FusionResult> results(pairs.size());
    #pragma omp parallel for schedule(static) if(use_parallel)
    for (int i = 0; i < n; ++i) {
        try {
            results[i] = analyzePair(pairs[i], counts[i], prior);
        } catch (const std::exception& e) {
            FusionResult failed;
            failed.drug = pairs[i].drug;
            failed.event = pairs[i].event;
            failed.case_count = pairs[i].table.a();
            failed.error = PairError{PairErrorKind::INTERNAL_ERROR, LOG_SOURCE, e.what()};
            results[i] = std::move(failed);
        }
    }

    // 3. False discovery rate across the batch
    std::vector<std::size_t> bayesian_index;
    std::vector<BayesianResult> bayesian_results;
    for (std::size_t i = 0; i < results.size(); ++i) {
        if (results[i].ok() && results[i].bayesian) {
            bayesian_index.push_back(i);
            bayesian_results.push_back(*results[i].bayesian);
        }
    }
    const auto adjusted = shrinkage_->applyFdrControl(bayesian_results, config_.bayesian);
    for (std::size_t k = 0; k < bayesian_index.size(); ++k) {
        results[bayesian_index[k]].bayesian = adjusted[k];
    }

    // 4. Fusion
    #pragma omp parallel for schedule(static) if(use_parallel)
    for (int i = 0; i < n; ++i) {
        if (results[i].ok()) {
            fuse(results[i]);
        }
    }

    for (const auto& r : results) {
        if (!r.ok()) {
            logger.warning(LOG_SOURCE, "Pair " + r.drug + " / " + r.event + " failed in "
                           + r.error->component + " (" + toString(r.error->kind) + "): " + r.error->message);
        }
    }
    return results;
}

std::vector<FusionResult> FusionOrchestrator::rank(std::vector<FusionResult> results) {
    std::vector<std::size_t> scored;
    std::vector<std::size_t> failed;
    for (std::size_t i = 0; i < results.size(); ++i) {
        (results[i].ok() ? scored : failed).push_back(i);
    }

    // Case-count order, ties kept in input order
    std::vector<std::size_t> by_cases = scored;
    std::stable_sort(by_cases.begin(), by_cases.end(), [&](std::size_t lhs, std::size_t rhs) {
        return results[lhs].case_count > results[rhs].case_count;
    });
    for (std::size_t position = 0; position < by_cases.size(); ++position) {
        results[by_cases[position]].classical_rank = static_cast<int>(position) + 1;
    }

    std::sort(scored.begin(), scored.end(), [&](std::size_t lhs, std::size_t rhs) {
        const auto& l = results[lhs];
        const auto& r = results[rhs];
        if (l.fusion_score != r.fusion_score) return l.fusion_score > r.fusion_score;
        if (l.case_count != r.case_count) return l.case_count > r.case_count;
        if (l.drug != r.drug) return l.drug < r.drug;
        if (l.event != r.event) return l.event < r.event;
        return lhs < rhs;
    });

    const double size = static_cast<double>(scored.size());
    std::vector<FusionResult> ranked;
    ranked.reserve(results.size());
    for (std::size_t position = 0; position < scored.size(); ++position) {
        FusionResult& r = results[scored[position]];
        const int rank = static_cast<int>(position) + 1;
        r.rank = rank;
        r.percentile = 100.0 * (1.0 - static_cast<double>(rank) / size);
        ranked.push_back(std::move(r));
    }
    for (std::size_t index : failed) {
        ranked.push_back(std::move(results[index]));
    }
    return ranked;
}

std::vector<FusionResult> FusionOrchestrator::scoreBatch(const std::vector<SignalPair>& pairs) const {
    static Logger& logger = Logger::getInstance();
    const auto start = std::chrono::steady_clock::now();
    logger.info(LOG_SOURCE, "Scoring batch of " + std::to_string(pairs.size()) + " pair(s)");

    auto ranked = rank(scoreUnranked(pairs));

    const auto failures = std::count_if(ranked.begin(), ranked.end(),
                                        [](const FusionResult& r) { return !r.ok(); });
    const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    logger.info(LOG_SOURCE, "Batch complete: " + std::to_string(ranked.size() - static_cast<std::size_t>(failures))
                + " ranked, " + std::to_string(failures) + " error-marked, "
                + std::to_string(elapsed_ms) + " ms");
    return ranked;
}

FusionResult FusionOrchestrator::scoreOne(const SignalPair& pair) const {
    auto results = scoreUnranked({pair});
    return std::move(results.front());
}

std::vector<FusionResult> scoreBatch(const std::vector<SignalPair>& pairs, const SignalConfig& config) {
    return FusionOrchestrator(config).scoreBatch(pairs);
}

FusionResult scoreOne(const SignalPair& pair, const SignalConfig& config) {
    return FusionOrchestrator(config).scoreOne(pair);
}

} // namespace pvsignal
