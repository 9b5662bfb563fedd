#include "pvsignal/causality/CausalityAssessor.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace pvsignal;

namespace {

ClinicalFeatures plausibleOnset() {
    ClinicalFeatures f;
    f.time_to_onset_days = 5.0;
    return f;
}

} // namespace

class CausalityAssessorTest : public ::testing::Test {
protected:
    CausalityAssessor assessor;
    CausalityConfig config;
};

TEST_F(CausalityAssessorTest, NoEvidenceIsUnassessable) {
    const auto result = assessor.assess(ClinicalFeatures{}, config);
    EXPECT_EQ(result.who_umc, WhoUmcCategory::UNASSESSABLE);
    EXPECT_EQ(result.naranjo.score, 0);
    EXPECT_EQ(result.naranjo.category, NaranjoCategory::DOUBTFUL);
    EXPECT_NEAR(result.confidence, 0.20, 1e-12);
}

TEST_F(CausalityAssessorTest, OnsetBeforeExposureIsUnlikely) {
    ClinicalFeatures f;
    f.time_to_onset_days = -3.0;
    f.dechallenge = DechallengeOutcome::IMPROVED;
    f.alternative_causes = std::vector<std::string>{};
    EXPECT_EQ(CausalityAssessor::classifyWhoUmc(f, config), WhoUmcCategory::UNLIKELY);
}

TEST_F(CausalityAssessorTest, OnsetBeyondWindowIsUnlikely) {
    ClinicalFeatures f;
    f.time_to_onset_days = config.max_plausible_onset_days + 1.0;
    EXPECT_EQ(CausalityAssessor::temporalRelationship(f, config), TemporalRelationship::IMPLAUSIBLE);
    EXPECT_EQ(CausalityAssessor::classifyWhoUmc(f, config), WhoUmcCategory::UNLIKELY);
}

TEST_F(CausalityAssessorTest, UnknownTimingWithChallengeDataIsConditional) {
    ClinicalFeatures f;
    f.dechallenge = DechallengeOutcome::IMPROVED;
    EXPECT_EQ(CausalityAssessor::classifyWhoUmc(f, config), WhoUmcCategory::CONDITIONAL);
}

TEST_F(CausalityAssessorTest, PositiveRechallengeWithoutAlternativesIsCertain) {
    ClinicalFeatures f = plausibleOnset();
    f.alternative_causes = std::vector<std::string>{};
    f.dechallenge = DechallengeOutcome::IMPROVED;
    f.rechallenge = RechallengeOutcome::RECURRED;
    EXPECT_EQ(CausalityAssessor::classifyWhoUmc(f, config), WhoUmcCategory::CERTAIN);

    // An unchanged dechallenge contradicts the rechallenge
    f.dechallenge = DechallengeOutcome::UNCHANGED;
    EXPECT_NE(CausalityAssessor::classifyWhoUmc(f, config), WhoUmcCategory::CERTAIN);
}

TEST_F(CausalityAssessorTest, ImprovedDechallengeWithoutAlternativesIsProbable) {
    ClinicalFeatures f = plausibleOnset();
    f.alternative_causes = std::vector<std::string>{};
    f.dechallenge = DechallengeOutcome::IMPROVED;
    EXPECT_EQ(CausalityAssessor::classifyWhoUmc(f, config), WhoUmcCategory::PROBABLE);

    ClinicalFeatures known = plausibleOnset();
    known.alternative_causes = std::vector<std::string>{};
    known.event_known_for_drug = true;
    EXPECT_EQ(CausalityAssessor::classifyWhoUmc(known, config), WhoUmcCategory::PROBABLE);
}

TEST_F(CausalityAssessorTest, UnassessedAlternativesBlockProbable) {
    ClinicalFeatures f = plausibleOnset();
    f.dechallenge = DechallengeOutcome::IMPROVED;
    EXPECT_EQ(CausalityAssessor::classifyWhoUmc(f, config), WhoUmcCategory::POSSIBLE);
}

TEST_F(CausalityAssessorTest, NegativeChallengesAreUnlikely) {
    ClinicalFeatures f = plausibleOnset();
    f.dechallenge = DechallengeOutcome::UNCHANGED;
    f.rechallenge = RechallengeOutcome::DID_NOT_RECUR;
    EXPECT_EQ(CausalityAssessor::classifyWhoUmc(f, config), WhoUmcCategory::UNLIKELY);
}

TEST_F(CausalityAssessorTest, StrongAlternativesAreUnlikely) {
    ClinicalFeatures f = plausibleOnset();
    f.alternative_causes = std::vector<std::string>{"sepsis", "renal failure"};
    EXPECT_EQ(CausalityAssessor::classifyWhoUmc(f, config), WhoUmcCategory::UNLIKELY);

    ClinicalFeatures indication = plausibleOnset();
    indication.indication_could_cause_event = true;
    EXPECT_EQ(CausalityAssessor::classifyWhoUmc(indication, config), WhoUmcCategory::UNLIKELY);

    // Challenge support outweighs the alternatives
    f.dechallenge = DechallengeOutcome::IMPROVED;
    EXPECT_EQ(CausalityAssessor::classifyWhoUmc(f, config), WhoUmcCategory::POSSIBLE);
}

TEST_F(CausalityAssessorTest, SingleAlternativeIsPossible) {
    ClinicalFeatures f = plausibleOnset();
    f.alternative_causes = std::vector<std::string>{"concomitant medication"};
    EXPECT_EQ(CausalityAssessor::classifyWhoUmc(f, config), WhoUmcCategory::POSSIBLE);
}

TEST_F(CausalityAssessorTest, NaranjoPointsPerQuestion) {
    ClinicalFeatures f = plausibleOnset();
    f.alternative_causes = std::vector<std::string>{};
    f.dechallenge = DechallengeOutcome::IMPROVED;
    f.rechallenge = RechallengeOutcome::RECURRED;

    const auto partial = CausalityAssessor::scoreNaranjo(f);
    EXPECT_EQ(partial.question_points[0], 0);
    EXPECT_EQ(partial.question_points[1], 2);
    EXPECT_EQ(partial.question_points[2], 1);
    EXPECT_EQ(partial.question_points[3], 2);
    EXPECT_EQ(partial.question_points[4], 2);
    EXPECT_EQ(partial.score, 7);
    EXPECT_EQ(partial.category, NaranjoCategory::PROBABLE);

    f.event_known_for_drug = true;
    f.objective_evidence = true;
    f.dose_response = true;
    const auto full = CausalityAssessor::scoreNaranjo(f);
    EXPECT_EQ(full.score, 10);
    EXPECT_EQ(full.category, NaranjoCategory::DEFINITE);

    const auto result = assessor.assess(f, config);
    EXPECT_EQ(result.who_umc, WhoUmcCategory::CERTAIN);
    EXPECT_NEAR(result.confidence, 0.98, 1e-12);
}

TEST_F(CausalityAssessorTest, NaranjoNegativeAnswers) {
    ClinicalFeatures f;
    f.time_to_onset_days = -1.0;
    f.rechallenge = RechallengeOutcome::DID_NOT_RECUR;
    f.alternative_causes = std::vector<std::string>{"infection"};
    f.placebo_reaction = true;

    const auto result = CausalityAssessor::scoreNaranjo(f);
    EXPECT_EQ(result.score, -4);
    EXPECT_EQ(result.category, NaranjoCategory::DOUBTFUL);
}

TEST_F(CausalityAssessorTest, NaranjoBucketBoundaries) {
    EXPECT_EQ(CausalityAssessor::naranjoCategory(9), NaranjoCategory::DEFINITE);
    EXPECT_EQ(CausalityAssessor::naranjoCategory(13), NaranjoCategory::DEFINITE);
    EXPECT_EQ(CausalityAssessor::naranjoCategory(8), NaranjoCategory::PROBABLE);
    EXPECT_EQ(CausalityAssessor::naranjoCategory(5), NaranjoCategory::PROBABLE);
    EXPECT_EQ(CausalityAssessor::naranjoCategory(4), NaranjoCategory::POSSIBLE);
    EXPECT_EQ(CausalityAssessor::naranjoCategory(1), NaranjoCategory::POSSIBLE);
    EXPECT_EQ(CausalityAssessor::naranjoCategory(0), NaranjoCategory::DOUBTFUL);
    EXPECT_EQ(CausalityAssessor::naranjoCategory(-4), NaranjoCategory::DOUBTFUL);
}

TEST_F(CausalityAssessorTest, ConfidenceAddsSupportingEvidence) {
    ClinicalFeatures f = plausibleOnset();
    f.alternative_causes = std::vector<std::string>{};
    f.dechallenge = DechallengeOutcome::IMPROVED;

    // Probable .75 + Naranjo 5 (.05) + dechallenge (.08) + no alternatives (.05)
    const auto result = assessor.assess(f, config);
    EXPECT_EQ(result.who_umc, WhoUmcCategory::PROBABLE);
    EXPECT_EQ(result.naranjo.score, 5);
    EXPECT_NEAR(result.confidence, 0.93, 1e-12);
}

TEST_F(CausalityAssessorTest, CertainVerdictCarriesItsExplanation) {
    ClinicalFeatures f = plausibleOnset();
    f.dechallenge = DechallengeOutcome::IMPROVED;
    f.rechallenge = RechallengeOutcome::RECURRED;
    f.alternative_causes = std::vector<std::string>{};
    f.event_known_for_drug = true;

    const auto result = assessor.assess(f, config);
    ASSERT_EQ(result.who_umc, WhoUmcCategory::CERTAIN);
    EXPECT_NE(result.who_umc_reasoning.find("positive rechallenge"), std::string::npos);

    const std::vector<std::string> primary = {"Strong temporal relationship (onset within 5 days)",
                                              "Positive dechallenge", "Positive rechallenge"};
    EXPECT_EQ(result.primary_factors, primary);
    const std::vector<std::string> supporting = {"No alternative causes identified",
                                                 "Known reaction for this drug"};
    EXPECT_EQ(result.supporting_factors, supporting);
    EXPECT_TRUE(result.conflicting_factors.empty());

    EXPECT_EQ(result.recommendation, "Causal relationship established; update product labeling");
    EXPECT_EQ(result.clinical_action, "Avoid re-exposure; report to regulators");
}

TEST_F(CausalityAssessorTest, ConflictingEvidenceIsListedSeparately) {
    ClinicalFeatures f;
    f.time_to_onset_days = 120.0;
    f.dechallenge = DechallengeOutcome::UNCHANGED;
    f.rechallenge = RechallengeOutcome::DID_NOT_RECUR;
    f.alternative_causes = std::vector<std::string>{"viral infection", "concomitant NSAID"};
    f.indication_could_cause_event = true;

    const auto result = assessor.assess(f, config);
    ASSERT_EQ(result.who_umc, WhoUmcCategory::UNLIKELY);
    EXPECT_EQ(result.who_umc_reasoning, "Onset after 120 days lies outside the plausible window");
    EXPECT_TRUE(result.primary_factors.empty());
    EXPECT_TRUE(result.supporting_factors.empty());

    const std::vector<std::string> conflicting = {
        "Delayed onset (120 days)", "Negative dechallenge", "Negative rechallenge",
        "Alternative causes present: viral infection, concomitant NSAID",
        "Indication could cause the event"};
    EXPECT_EQ(result.conflicting_factors, conflicting);
    EXPECT_EQ(result.clinical_action, "Continue therapy if clinically indicated");
}

TEST_F(CausalityAssessorTest, ReasoningFollowsTheMatchingRule) {
    EXPECT_EQ(assessor.assess(ClinicalFeatures{}, config).who_umc_reasoning,
              "No time to onset and no dechallenge or rechallenge information");

    ClinicalFeatures conditional;
    conditional.dechallenge = DechallengeOutcome::IMPROVED;
    const auto pending = assessor.assess(conditional, config);
    EXPECT_EQ(pending.who_umc, WhoUmcCategory::CONDITIONAL);
    EXPECT_EQ(pending.recommendation, "Insufficient data; obtain the time to onset");

    ClinicalFeatures negative = plausibleOnset();
    negative.dechallenge = DechallengeOutcome::UNCHANGED;
    negative.rechallenge = RechallengeOutcome::DID_NOT_RECUR;
    EXPECT_EQ(CausalityAssessor::whoUmcReasoning(WhoUmcCategory::UNLIKELY, negative, config),
              "Negative dechallenge and negative rechallenge");

    ClinicalFeatures possible = plausibleOnset();
    possible.alternative_causes = std::vector<std::string>{"sepsis"};
    const auto verdict = assessor.assess(possible, config);
    EXPECT_EQ(verdict.who_umc, WhoUmcCategory::POSSIBLE);
    EXPECT_EQ(verdict.who_umc_reasoning, "Plausible time to onset; alternative causes present: sepsis");

    ClinicalFeatures early;
    early.time_to_onset_days = -2.0;
    EXPECT_EQ(assessor.assess(early, config).who_umc_reasoning, "Onset preceded exposure by 2 days");
}
