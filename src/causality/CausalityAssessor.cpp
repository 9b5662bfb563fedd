#include "pvsignal/causality/CausalityAssessor.hpp"

#include <algorithm>
#include <numeric>
#include <sstream>
#include <tuple>

namespace pvsignal {

namespace {

// Points for (yes, no) answers; unknown always scores 0
struct QuestionWeights {
    int yes;
    int no;
};

constexpr QuestionWeights NARANJO_WEIGHTS[NARANJO_QUESTION_COUNT] = {
    {1, 0},   // Previous conclusive reports on this reaction
    {2, -1},  // Event appeared after the suspected drug was given
    {1, 0},   // Improved when the drug was discontinued
    {2, -1},  // Reappeared when the drug was re-administered
    {-1, 2},  // Alternative causes could on their own have caused the reaction
    {-1, 1},  // Reaction appeared with a placebo
    {1, 0},   // Drug detected in toxic concentrations
    {1, 0},   // Dose-response relationship
    {1, 0},   // Similar reaction to the same or similar drug before
    {1, 0},   // Confirmed by objective evidence
};

int answerPoints(std::size_t question, const std::optional<bool>& answer) {
    if (!answer.has_value()) {
        return 0;
    }
    return *answer ? NARANJO_WEIGHTS[question].yes : NARANJO_WEIGHTS[question].no;
}

bool alternativesAbsent(const ClinicalFeatures& f) {
    return f.alternative_causes.has_value() && f.alternative_causes->empty();
}

std::size_t alternativeCount(const ClinicalFeatures& f) {
    return f.alternative_causes.has_value() ? f.alternative_causes->size() : 0;
}

std::string formatDays(double days) {
    std::ostringstream oss;
    oss << days << (days == 1.0 ? " day" : " days");
    return oss.str();
}

std::string joinList(const std::vector<std::string>& items, std::size_t limit) {
    std::string joined;
    for (std::size_t i = 0; i < items.size() && i < limit; ++i) {
        if (i > 0) joined += ", ";
        joined += items[i];
    }
    if (items.size() > limit) {
        joined += " and " + std::to_string(items.size() - limit) + " more";
    }
    return joined;
}

} // namespace

TemporalRelationship CausalityAssessor::temporalRelationship(
    const ClinicalFeatures& features,
    const CausalityConfig& config) {

    if (!features.time_to_onset_days.has_value()) {
        return TemporalRelationship::UNKNOWN;
    }
    const double onset = *features.time_to_onset_days;
    if (onset >= 0.0 && onset <= config.max_plausible_onset_days) {
        return TemporalRelationship::PLAUSIBLE;
    }
    return TemporalRelationship::IMPLAUSIBLE;
}

WhoUmcCategory CausalityAssessor::classifyWhoUmc(
    const ClinicalFeatures& f,
    const CausalityConfig& config) {

    const auto timing = temporalRelationship(f, config);
    const bool no_alternatives = alternativesAbsent(f);

    // 1. Nothing to judge from
    if (timing == TemporalRelationship::UNKNOWN
        && f.dechallenge == DechallengeOutcome::UNKNOWN
        && f.rechallenge == RechallengeOutcome::NOT_ATTEMPTED) {
        return WhoUmcCategory::UNASSESSABLE;
    }

    // 2-3. Timing gates every positive category
    if (timing == TemporalRelationship::IMPLAUSIBLE) {
        return WhoUmcCategory::UNLIKELY;
    }
    if (timing == TemporalRelationship::UNKNOWN) {
        return WhoUmcCategory::CONDITIONAL;
    }

    // 4. Positive rechallenge with nothing else to explain the event
    if (no_alternatives
        && f.rechallenge == RechallengeOutcome::RECURRED
        && f.dechallenge != DechallengeOutcome::UNCHANGED) {
        return WhoUmcCategory::CERTAIN;
    }

    // 5.
    if (no_alternatives
        && (f.dechallenge == DechallengeOutcome::IMPROVED || f.event_known_for_drug)) {
        return WhoUmcCategory::PROBABLE;
    }

    // 6. Both challenges negative
    if (f.dechallenge == DechallengeOutcome::UNCHANGED
        && f.rechallenge == RechallengeOutcome::DID_NOT_RECUR) {
        return WhoUmcCategory::UNLIKELY;
    }

    // 7. Stronger explanations than the drug, without challenge support
    const bool strong_alternatives =
        alternativeCount(f) >= static_cast<std::size_t>(config.strong_alternative_count)
        || f.indication_could_cause_event;
    if (strong_alternatives
        && f.dechallenge != DechallengeOutcome::IMPROVED
        && f.rechallenge != RechallengeOutcome::RECURRED) {
        return WhoUmcCategory::UNLIKELY;
    }

    return WhoUmcCategory::POSSIBLE;
}

NaranjoResult CausalityAssessor::scoreNaranjo(const ClinicalFeatures& f) {
    std::array<std::optional<bool>, NARANJO_QUESTION_COUNT> answers;

    answers[0] = f.event_known_for_drug;
    if (f.time_to_onset_days.has_value()) {
        answers[1] = *f.time_to_onset_days >= 0.0;
    }
    if (f.dechallenge == DechallengeOutcome::IMPROVED) {
        answers[2] = true;
    } else if (f.dechallenge == DechallengeOutcome::UNCHANGED) {
        answers[2] = false;
    }
    if (f.rechallenge == RechallengeOutcome::RECURRED) {
        answers[3] = true;
    } else if (f.rechallenge == RechallengeOutcome::DID_NOT_RECUR) {
        answers[3] = false;
    }
    if (f.alternative_causes.has_value()) {
        answers[4] = !f.alternative_causes->empty();
    }
    answers[5] = f.placebo_reaction;
    answers[6] = f.toxic_drug_level;
    answers[7] = f.dose_response;
    answers[8] = f.previous_similar_reaction;
    answers[9] = f.objective_evidence;

    NaranjoResult result;
    for (std::size_t q = 0; q < NARANJO_QUESTION_COUNT; ++q) {
        result.question_points[q] = answerPoints(q, answers[q]);
    }
    result.score = std::accumulate(result.question_points.begin(), result.question_points.end(), 0);
    result.category = naranjoCategory(result.score);
    return result;
}

NaranjoCategory CausalityAssessor::naranjoCategory(int score) {
    if (score >= 9) return NaranjoCategory::DEFINITE;
    if (score >= 5) return NaranjoCategory::PROBABLE;
    if (score >= 1) return NaranjoCategory::POSSIBLE;
    return NaranjoCategory::DOUBTFUL;
}

double CausalityAssessor::assessmentConfidence(
    WhoUmcCategory category,
    const NaranjoResult& naranjo,
    const ClinicalFeatures& f) {

    double confidence = 0.0;
    switch (category) {
        case WhoUmcCategory::CERTAIN:      confidence = 0.95; break;
        case WhoUmcCategory::PROBABLE:     confidence = 0.75; break;
        case WhoUmcCategory::POSSIBLE:     confidence = 0.50; break;
        case WhoUmcCategory::UNLIKELY:     confidence = 0.25; break;
        case WhoUmcCategory::CONDITIONAL:  confidence = 0.40; break;
        case WhoUmcCategory::UNASSESSABLE: confidence = 0.20; break;
    }

    if (naranjo.score >= 9) {
        confidence += 0.10;
    } else if (naranjo.score >= 5) {
        confidence += 0.05;
    }

    if (f.rechallenge == RechallengeOutcome::RECURRED) {
        confidence += 0.15;
    } else if (f.dechallenge == DechallengeOutcome::IMPROVED) {
        confidence += 0.08;
    }
    if (alternativesAbsent(f)) {
        confidence += 0.05;
    }

    return std::min(confidence, 0.98);
}

std::string CausalityAssessor::whoUmcReasoning(
    WhoUmcCategory category,
    const ClinicalFeatures& f,
    const CausalityConfig& config) {

    switch (category) {
        case WhoUmcCategory::UNASSESSABLE:
            return "No time to onset and no dechallenge or rechallenge information";
        case WhoUmcCategory::CONDITIONAL:
            return "Time to onset unknown; more data needed before a judgement";
        case WhoUmcCategory::CERTAIN:
            return "Plausible time to onset with positive rechallenge and no alternative causes";
        case WhoUmcCategory::PROBABLE: {
            std::string reasoning = "Plausible time to onset with no alternative causes";
            if (f.dechallenge == DechallengeOutcome::IMPROVED) {
                reasoning += "; improved on dechallenge";
            }
            if (f.event_known_for_drug) {
                reasoning += "; known reaction for this drug";
            }
            return reasoning;
        }
        case WhoUmcCategory::POSSIBLE: {
            std::string reasoning = "Plausible time to onset";
            if (!f.alternative_causes.has_value()) {
                reasoning += "; alternative causes not assessed";
            } else if (!f.alternative_causes->empty()) {
                reasoning += "; alternative causes present: " + joinList(*f.alternative_causes, 2);
            }
            if (f.indication_could_cause_event) {
                reasoning += "; the indication could explain the event";
            }
            return reasoning;
        }
        case WhoUmcCategory::UNLIKELY:
            break;
    }

    if (temporalRelationship(f, config) == TemporalRelationship::IMPLAUSIBLE) {
        const double onset = *f.time_to_onset_days;
        if (onset < 0.0) {
            return "Onset preceded exposure by " + formatDays(-onset);
        }
        return "Onset after " + formatDays(onset) + " lies outside the plausible window";
    }
    if (f.dechallenge == DechallengeOutcome::UNCHANGED && f.rechallenge == RechallengeOutcome::DID_NOT_RECUR) {
        return "Negative dechallenge and negative rechallenge";
    }
    if (alternativeCount(f) > 0) {
        return "Alternative causes explain the event better than the drug: " + joinList(*f.alternative_causes, 2);
    }
    if (f.indication_could_cause_event) {
        return "The indication explains the event better than the drug";
    }
    return "Stronger explanations than the drug without challenge support";
}

CausalityFactors CausalityAssessor::identifyFactors(
    const ClinicalFeatures& f,
    const CausalityConfig& config) {

    CausalityFactors factors;

    if (f.time_to_onset_days.has_value()) {
        const double onset = *f.time_to_onset_days;
        if (onset < 0.0) {
            factors.conflicting.push_back("Onset preceded exposure");
        } else if (onset <= 7.0) {
            factors.primary.push_back("Strong temporal relationship (onset within " + formatDays(onset) + ")");
        } else if (onset <= config.max_plausible_onset_days) {
            factors.supporting.push_back("Plausible temporal relationship (onset within " + formatDays(onset) + ")");
        } else {
            factors.conflicting.push_back("Delayed onset (" + formatDays(onset) + ")");
        }
    }

    if (f.dechallenge == DechallengeOutcome::IMPROVED) {
        factors.primary.push_back("Positive dechallenge");
    } else if (f.dechallenge == DechallengeOutcome::UNCHANGED) {
        factors.conflicting.push_back("Negative dechallenge");
    }

    if (f.rechallenge == RechallengeOutcome::RECURRED) {
        factors.primary.push_back("Positive rechallenge");
    } else if (f.rechallenge == RechallengeOutcome::DID_NOT_RECUR) {
        factors.conflicting.push_back("Negative rechallenge");
    }

    if (f.alternative_causes.has_value()) {
        if (f.alternative_causes->empty()) {
            factors.supporting.push_back("No alternative causes identified");
        } else {
            factors.conflicting.push_back("Alternative causes present: " + joinList(*f.alternative_causes, 3));
        }
    }
    if (f.indication_could_cause_event) {
        factors.conflicting.push_back("Indication could cause the event");
    }
    if (f.event_known_for_drug) {
        factors.supporting.push_back("Known reaction for this drug");
    }

    if (f.dose_response.value_or(false)) {
        factors.primary.push_back("Dose-response relationship");
    }
    if (f.toxic_drug_level.value_or(false)) {
        factors.supporting.push_back("Drug detected at toxic concentration");
    }
    if (f.objective_evidence.value_or(false)) {
        factors.supporting.push_back("Confirmed by objective evidence");
    }
    if (f.previous_similar_reaction.value_or(false)) {
        factors.supporting.push_back("Similar reaction on previous exposure");
    }
    if (f.placebo_reaction.value_or(false)) {
        factors.conflicting.push_back("Reaction also seen with placebo");
    }
    return factors;
}

std::pair<std::string, std::string> CausalityAssessor::recommendation(WhoUmcCategory category) {
    switch (category) {
        case WhoUmcCategory::CERTAIN:
            return {"Causal relationship established; update product labeling",
                    "Avoid re-exposure; report to regulators"};
        case WhoUmcCategory::PROBABLE:
            return {"Likely causal; enhanced monitoring recommended",
                    "Consider an alternative therapy; monitor closely"};
        case WhoUmcCategory::POSSIBLE:
            return {"Cannot rule out a causal link; continue surveillance",
                    "Weigh benefit against risk; document the event"};
        case WhoUmcCategory::UNLIKELY:
            return {"Causal relationship unlikely; routine monitoring",
                    "Continue therapy if clinically indicated"};
        case WhoUmcCategory::CONDITIONAL:
            return {"Insufficient data; obtain the time to onset",
                    "Gather more clinical information"};
        case WhoUmcCategory::UNASSESSABLE:
            return {"Cannot be assessed with the information supplied",
                    "Request a complete case report"};
    }
    return {"", ""};
}

CausalityResult CausalityAssessor::assess(
    const ClinicalFeatures& features,
    const CausalityConfig& config) const {

    CausalityResult result;
    result.who_umc = classifyWhoUmc(features, config);
    result.naranjo = scoreNaranjo(features);
    result.confidence = assessmentConfidence(result.who_umc, result.naranjo, features);

    result.who_umc_reasoning = whoUmcReasoning(result.who_umc, features, config);
    auto factors = identifyFactors(features, config);
    result.primary_factors = std::move(factors.primary);
    result.supporting_factors = std::move(factors.supporting);
    result.conflicting_factors = std::move(factors.conflicting);
    std::tie(result.recommendation, result.clinical_action) = recommendation(result.who_umc);
    return result;
}

} // namespace pvsignal
