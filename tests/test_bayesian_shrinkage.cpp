#include "pvsignal/bayesian/BayesianShrinkageEstimator.hpp"
#include "pvsignal/statistics/ContingencyStatistics.hpp"

#include <boost/math/distributions/gamma.hpp>
#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using namespace pvsignal;

class BayesianShrinkageTest : public ::testing::Test {
protected:
    BayesianShrinkageEstimator estimator;
    BayesianConfig config;
};

TEST_F(BayesianShrinkageTest, MethodOfMomentsPrior) {
    // Ratios 1, 2, 3, 4: mean 2.5, population variance 1.25
    const std::vector<ObservedExpected> counts = {{1.0, 1.0}, {4.0, 2.0}, {9.0, 3.0}, {8.0, 2.0}};
    const auto prior = estimator.fitPrior(counts, config);

    EXPECT_FALSE(prior.isDefault());
    EXPECT_EQ(prior.pairsUsed(), 4u);
    EXPECT_NEAR(prior.rate(), 2.0, 1e-9);
    EXPECT_NEAR(prior.shape(), 5.0, 1e-9);
}

TEST_F(BayesianShrinkageTest, ZeroExpectedPairIsLeftOutOfThePrior) {
    // No drug reports at all: E = (a+b)(a+c)/N = 0
    const ContingencyTable unexposed(0, 0, 5, 10);
    const ObservedExpected zero_expected{static_cast<double>(unexposed.a()),
                                         ContingencyStatistics::expectedCount(unexposed)};
    ASSERT_DOUBLE_EQ(zero_expected.expected, 0.0);

    const std::vector<ObservedExpected> counts = {{1.0, 1.0}, {4.0, 2.0}, zero_expected, {9.0, 3.0}, {8.0, 2.0}};
    const auto prior = estimator.fitPrior(counts, config);

    EXPECT_EQ(prior.pairsUsed(), 4u);
    EXPECT_NEAR(prior.rate(), 2.0, 1e-9);
    EXPECT_NEAR(prior.shape(), 5.0, 1e-9);

    // Nothing observed and nothing expected: the posterior is the prior
    const auto posterior = estimator.computePosterior(zero_expected, prior, config);
    EXPECT_DOUBLE_EQ(posterior.posterior_shape, prior.shape());
    EXPECT_DOUBLE_EQ(posterior.posterior_rate, prior.rate());
    EXPECT_NEAR(posterior.eb05, boost::math::quantile(
                    boost::math::gamma_distribution<double>(prior.shape(), 1.0 / prior.rate()), 0.05), 1e-12);
}

TEST_F(BayesianShrinkageTest, PriorParametersAreClipped) {
    // Nearly identical ratios give a huge rate before clipping
    const std::vector<ObservedExpected> counts = {{10.0, 10.0}, {10.1, 10.0}, {9.9, 10.0}};
    const auto prior = estimator.fitPrior(counts, config);

    EXPECT_LE(prior.shape(), config.max_prior_parameter);
    EXPECT_LE(prior.rate(), config.max_prior_parameter);
    EXPECT_GE(prior.shape(), config.min_prior_parameter);
    EXPECT_GE(prior.rate(), config.min_prior_parameter);
}

TEST_F(BayesianShrinkageTest, SinglePairUsesDefaultPrior) {
    const auto prior = estimator.fitPrior({{45.0, 15.0}}, config);
    EXPECT_TRUE(prior.isDefault());
    EXPECT_DOUBLE_EQ(prior.shape(), config.default_prior_shape);
    EXPECT_DOUBLE_EQ(prior.rate(), config.default_prior_rate);

    const auto result = estimator.computePosterior({45.0, 15.0}, prior, config);
    EXPECT_TRUE(result.low_confidence);
}

TEST_F(BayesianShrinkageTest, AllZeroObservationsUseDefaultPrior) {
    const auto prior = estimator.fitPrior({{0.0, 2.0}, {0.0, 3.0}, {0.0, 1.5}}, config);
    EXPECT_TRUE(prior.isDefault());
}

TEST_F(BayesianShrinkageTest, PosteriorBoundsAreOrdered) {
    const ShrinkagePrior prior(2.0, 4.0, 10, false);
    for (const ObservedExpected& counts : {ObservedExpected{0.0, 0.5}, ObservedExpected{3.0, 1.0},
                                           ObservedExpected{45.0, 15.0}, ObservedExpected{500.0, 20.0}}) {
        const auto result = estimator.computePosterior(counts, prior, config);
        EXPECT_LE(result.eb05, result.ebgm);
        EXPECT_LE(result.ebgm, result.eb95);
        EXPECT_GE(result.raw_p_value, 0.0);
        EXPECT_LE(result.raw_p_value, 1.0);
        EXPECT_DOUBLE_EQ(result.posterior_shape, 2.0 + counts.observed);
        EXPECT_DOUBLE_EQ(result.posterior_rate, 4.0 + counts.expected);
        EXPECT_FALSE(result.low_confidence);
    }
}

TEST_F(BayesianShrinkageTest, StrongExcessSignals) {
    const ShrinkagePrior prior(2.0, 4.0, 10, false);
    const auto strong = estimator.computePosterior({200.0, 20.0}, prior, config);
    EXPECT_GT(strong.eb05, config.eb05_threshold);
    EXPECT_TRUE(strong.signal);
    EXPECT_LT(strong.raw_p_value, 1e-6);

    const auto weak = estimator.computePosterior({2.0, 2.0}, prior, config);
    EXPECT_FALSE(weak.signal);
    EXPECT_GT(weak.raw_p_value, 0.05);
}

TEST_F(BayesianShrinkageTest, ShrinksSparseEstimatesTowardPrior) {
    const ShrinkagePrior prior(2.0, 4.0, 10, false);
    // Raw ratio 10, prior mean 0.5
    const auto sparse = estimator.computePosterior({1.0, 0.1}, prior, config);
    EXPECT_LT(sparse.ebgm, 10.0);
}

TEST_F(BayesianShrinkageTest, NegativeCountsAreRejected) {
    const ShrinkagePrior prior(2.0, 4.0, 10, false);
    EXPECT_THROW(estimator.computePosterior({-1.0, 2.0}, prior, config), std::invalid_argument);
}

TEST_F(BayesianShrinkageTest, PriorRequiresPositiveParameters) {
    EXPECT_THROW(ShrinkagePrior(0.0, 1.0, 0, true), std::invalid_argument);
    EXPECT_THROW(ShrinkagePrior(1.0, -2.0, 0, true), std::invalid_argument);
}

TEST(BenjaminiHochbergTest, KnownAdjustedValues) {
    const auto adjusted = benjaminiHochberg({0.01, 0.04, 0.03, 0.005});
    ASSERT_EQ(adjusted.size(), 4u);
    EXPECT_NEAR(adjusted[0], 0.02, 1e-12);
    EXPECT_NEAR(adjusted[1], 0.04, 1e-12);
    EXPECT_NEAR(adjusted[2], 0.04, 1e-12);
    EXPECT_NEAR(adjusted[3], 0.02, 1e-12);
}

TEST(BenjaminiHochbergTest, CappedAtOneAndNeverBelowRaw) {
    const std::vector<double> raw = {0.9, 0.5, 0.95, 1.0, 0.2};
    const auto adjusted = benjaminiHochberg(raw);
    for (std::size_t i = 0; i < raw.size(); ++i) {
        EXPECT_LE(adjusted[i], 1.0);
        EXPECT_GE(adjusted[i], raw[i]);
    }
}

TEST(BenjaminiHochbergTest, EmptyInput) {
    EXPECT_TRUE(benjaminiHochberg({}).empty());
}

TEST(BenjaminiHochbergTest, RejectsOutOfRangeValues) {
    EXPECT_THROW(benjaminiHochberg({0.1, 1.5}), std::invalid_argument);
}

TEST_F(BayesianShrinkageTest, FdrControlIsIdempotent) {
    const ShrinkagePrior prior(2.0, 4.0, 5, false);
    std::vector<BayesianResult> results;
    for (const ObservedExpected& counts : {ObservedExpected{200.0, 20.0}, ObservedExpected{3.0, 2.5},
                                           ObservedExpected{30.0, 5.0}, ObservedExpected{1.0, 4.0},
                                           ObservedExpected{12.0, 6.0}}) {
        results.push_back(estimator.computePosterior(counts, prior, config));
    }

    const auto once = estimator.applyFdrControl(results, config);
    const auto twice = estimator.applyFdrControl(once, config);
    ASSERT_EQ(once.size(), twice.size());
    for (std::size_t i = 0; i < once.size(); ++i) {
        EXPECT_DOUBLE_EQ(once[i].adjusted_p_value, twice[i].adjusted_p_value);
        EXPECT_EQ(once[i].fdr_significant, twice[i].fdr_significant);
        EXPECT_DOUBLE_EQ(once[i].raw_p_value, results[i].raw_p_value);
        EXPECT_GE(once[i].adjusted_p_value, once[i].raw_p_value);
    }
    EXPECT_TRUE(once[0].fdr_significant);
    EXPECT_FALSE(once[3].fdr_significant);
}
