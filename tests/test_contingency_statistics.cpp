#include "pvsignal/statistics/ContingencyStatistics.hpp"
#include "pvsignal/exceptions/Exceptions.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>

using namespace pvsignal;

class ContingencyStatisticsTest : public ::testing::Test {
protected:
    ContingencyStatistics stats;
    DisproportionalityConfig config;
};

TEST_F(ContingencyStatisticsTest, ReferenceTableSignalsOnAllThreeMethods) {
    const ContingencyTable table(45, 955, 120, 9880);
    const auto result = stats.analyze(table, config);

    EXPECT_NEAR(result.prr.value, 3.75, 1e-9);
    EXPECT_NEAR(result.prr.ci.lower, 2.679, 2e-3);
    EXPECT_NEAR(result.prr.ci.upper, 5.250, 2e-3);
    EXPECT_TRUE(result.prr.signal);

    EXPECT_NEAR(result.ror.value, 444600.0 / 114600.0, 1e-9);
    EXPECT_NEAR(result.ror.ci.lower, 2.737, 2e-3);
    EXPECT_NEAR(result.ror.ci.upper, 5.500, 2e-3);
    EXPECT_TRUE(result.ror.signal);

    EXPECT_DOUBLE_EQ(result.expected_count, 15.0);
    EXPECT_NEAR(result.ic.value, std::log2(45.5 / 15.5), 1e-12);
    EXPECT_NEAR(result.ic.ci.lower, 0.705, 2e-3);
    EXPECT_TRUE(result.ic.signal);

    EXPECT_FALSE(result.continuity_corrected);
    EXPECT_EQ(result.methodsSignalling(), 3);
    EXPECT_EQ(result.observed_count, 45);
    EXPECT_LT(result.chi_square_p_value, 0.001);
    EXPECT_EQ(result.strength, SignalStrength::VERY_STRONG);
}

TEST_F(ContingencyStatisticsTest, BelowMinimumCountNeverSignalsOnPrr) {
    const ContingencyTable table(2, 955, 120, 9880);
    const auto result = stats.analyze(table, config);

    EXPECT_GT(result.prr.value, 0.0);
    EXPECT_FALSE(result.prr.signal);
    EXPECT_FALSE(result.ror.signal);
}

TEST_F(ContingencyStatisticsTest, ZeroCellAppliesContinuityCorrection) {
    const ContingencyTable table(0, 500, 40, 9460);
    const auto result = stats.analyze(table, config);

    EXPECT_TRUE(result.continuity_corrected);
    EXPECT_TRUE(std::isfinite(result.prr.value));
    EXPECT_TRUE(std::isfinite(result.ror.ci.upper));
    EXPECT_NEAR(result.prr.value, (0.5 / 501.0) / (40.5 / 9501.0), 1e-12);
    EXPECT_FALSE(result.prr.signal);
    EXPECT_FALSE(result.ror.signal);
    EXPECT_FALSE(result.ic.signal);
    EXPECT_EQ(result.strength, SignalStrength::NONE);
}

TEST_F(ContingencyStatisticsTest, IntervalsBracketPointEstimates) {
    for (long long a : {1LL, 3LL, 10LL, 60LL, 400LL}) {
        const ContingencyTable table(a, 1000, 250, 50000);
        const auto result = stats.analyze(table, config);
        for (const MetricEstimate* m : {&result.prr, &result.ror, &result.ic}) {
            EXPECT_LE(m->ci.lower, m->value) << "a=" << a;
            EXPECT_LE(m->value, m->ci.upper) << "a=" << a;
        }
    }
}

TEST_F(ContingencyStatisticsTest, RatiosIncreaseWithCoReports) {
    double previous_prr = 0.0;
    double previous_ror = 0.0;
    double previous_ic = -1e9;
    for (long long a = 0; a <= 50; ++a) {
        const auto result = stats.analyze(ContingencyTable(a, 900, 120, 9880), config);
        EXPECT_GT(result.prr.value, previous_prr);
        EXPECT_GT(result.ror.value, previous_ror);
        EXPECT_GT(result.ic.value, previous_ic);
        previous_prr = result.prr.value;
        previous_ror = result.ror.value;
        previous_ic = result.ic.value;
    }
}

TEST_F(ContingencyStatisticsTest, EmptyTableIsInsufficientData) {
    EXPECT_THROW(stats.analyze(ContingencyTable(0, 0, 0, 0), config), InsufficientDataException);
    EXPECT_THROW(ContingencyStatistics::expectedCount(ContingencyTable(0, 0, 0, 0)), InsufficientDataException);
}

TEST_F(ContingencyStatisticsTest, NegativeCountsAreRejected) {
    EXPECT_THROW(ContingencyTable(-1, 10, 10, 10), std::invalid_argument);
}

TEST_F(ContingencyStatisticsTest, CountsWhoseTotalOverflowsAreRejected) {
    constexpr long long half = std::numeric_limits<long long>::max() / 2;
    EXPECT_THROW(ContingencyTable(half, half, 5, 5), std::invalid_argument);
    EXPECT_THROW(ContingencyTable(5, 5, 5, std::numeric_limits<long long>::max()), std::invalid_argument);
    EXPECT_NO_THROW(ContingencyTable(half, half, 1, 0));
}

TEST_F(ContingencyStatisticsTest, ChiSquareOfIndependentTableIsNotSignificant) {
    const auto [chi2, p] = ContingencyStatistics::chiSquareYates(ContingencyTable(10, 90, 100, 900));
    EXPECT_DOUBLE_EQ(chi2, 0.0);
    EXPECT_DOUBLE_EQ(p, 1.0);
}

TEST_F(ContingencyStatisticsTest, WiderConfidenceLevelWidensInterval) {
    const ContingencyTable table(45, 955, 120, 9880);
    DisproportionalityConfig wide = config;
    wide.confidence_level = 0.99;

    const auto narrow_result = stats.analyze(table, config);
    const auto wide_result = stats.analyze(table, wide);
    EXPECT_LT(wide_result.prr.ci.lower, narrow_result.prr.ci.lower);
    EXPECT_GT(wide_result.prr.ci.upper, narrow_result.prr.ci.upper);
    EXPECT_DOUBLE_EQ(wide_result.prr.value, narrow_result.prr.value);
}

TEST_F(ContingencyStatisticsTest, FisherExactTwoTailedReferenceValues) {
    // Margins 4/4 over 8: probabilities 1, 16, 36, 16, 1 over 70
    EXPECT_NEAR(*ContingencyStatistics::fisherExact(ContingencyTable(3, 1, 1, 3)), 34.0 / 70.0, 1e-9);
    EXPECT_NEAR(*ContingencyStatistics::fisherExact(ContingencyTable(2, 2, 2, 2)), 1.0, 1e-9);

    // Only the two perfectly separated tables are as extreme: 2 / C(20, 10)
    EXPECT_NEAR(*ContingencyStatistics::fisherExact(ContingencyTable(10, 0, 0, 10)), 2.0 / 184756.0, 1e-12);
    EXPECT_NEAR(*ContingencyStatistics::fisherExact(ContingencyTable(0, 10, 10, 0)), 2.0 / 184756.0, 1e-12);
}

TEST_F(ContingencyStatisticsTest, FisherExactIsReportedWithTheRatios) {
    const auto result = stats.analyze(ContingencyTable(45, 955, 120, 9880), config);
    ASSERT_TRUE(result.fisher_p_value.has_value());
    EXPECT_LT(*result.fisher_p_value, 0.001);
    EXPECT_GT(*result.fisher_p_value, 0.0);

    const auto independent = stats.analyze(ContingencyTable(10, 90, 100, 900), config);
    ASSERT_TRUE(independent.fisher_p_value.has_value());
    EXPECT_GT(*independent.fisher_p_value, 0.5);
    EXPECT_LE(*independent.fisher_p_value, 1.0);
}

TEST_F(ContingencyStatisticsTest, FisherExactSkipsEmptyTables) {
    EXPECT_FALSE(ContingencyStatistics::fisherExact(ContingencyTable(0, 0, 0, 0)).has_value());
}
