#include "pvsignal/fusion/BatchSummary.hpp"
#include "pvsignal/fusion/FusionResultWriter.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>
#include <vector>

using namespace pvsignal;

namespace {

FusionResult scoredResult(const std::string& drug, double score, AlertTier tier) {
    FusionResult r;
    r.drug = drug;
    r.event = "RASH";
    r.case_count = 4;
    r.fusion_score = score;
    r.alert_tier = tier;
    return r;
}

std::vector<FusionResult> sampleBatch() {
    std::vector<FusionResult> results;

    FusionResult top = scoredResult("ALPHA", 0.9, AlertTier::HIGH);
    top.rank = 1;
    top.percentile = 200.0 / 3.0;
    BayesianResult bayesian;
    bayesian.eb05 = 2.5;
    bayesian.signal = true;
    bayesian.fdr_significant = true;
    top.bayesian = bayesian;
    TemporalResult temporal;
    NoveltyResult novelty;
    novelty.emerging = true;
    temporal.novelty = novelty;
    temporal.spike_detection_run = true;
    temporal.spikes.push_back(SpikeEvent{280.0, 45, 5.0, 9.0, 8.0, 1e-6});
    TrendResult trend;
    trend.direction = TrendDirection::INCREASING;
    trend.slope = 0.05;
    trend.characteristic_time_days = 14.0;
    temporal.trend = trend;
    top.temporal = temporal;
    SingleSourceComponents layer1;
    layer1.rarity = 0.9;
    layer1.seriousness = 0.8;
    layer1.recency = 1.0;
    layer1.count = 0.4;
    layer1.base_score = 0.5;
    layer1.interaction_boosts = {{"rare_serious", 0.15}, {"all_three", 0.2}};
    layer1.tunneling_boost = 0.1;
    layer1.score = 0.95;
    top.layer1 = layer1;
    MultiSourceComponents layer2;
    layer2.burst = 0.7;
    layer2.mechanism = 0.5;
    layer2.score = 0.6;
    top.layer2 = layer2;
    DisproportionalityResult disproportionality;
    disproportionality.prr.signal = true;
    disproportionality.ic.ci.upper = 3.5;
    disproportionality.fisher_p_value = 0.002;
    top.disproportionality = disproportionality;
    top.classical_rank = 2;
    top.time_to_onset_days = 12.0;
    top.latency = LatencyCategory::DELAYED;
    results.push_back(top);

    FusionResult middle = scoredResult("BETA", 0.5, AlertTier::WATCHLIST);
    middle.rank = 2;
    middle.percentile = 100.0 / 3.0;
    BayesianResult weak;
    weak.fdr_significant = true;
    middle.bayesian = weak;
    middle.not_computed = {"causality: no clinical features supplied", "temporal: none"};
    CausalityResult causality;
    causality.who_umc = WhoUmcCategory::POSSIBLE;
    causality.who_umc_reasoning = "Plausible time to onset; alternative causes present: sepsis, NSAID";
    causality.recommendation = "Cannot rule out a causal link; continue surveillance";
    middle.causality = causality;
    middle.time_to_onset_days = 3.0;
    middle.latency = LatencyCategory::EARLY;
    results.push_back(middle);

    FusionResult low = scoredResult("GAMMA", 0.1, AlertTier::NONE);
    low.rank = 3;
    low.percentile = 0.0;
    results.push_back(low);

    FusionResult failed;
    failed.drug = "DELTA";
    failed.event = "RASH, SEVERE";
    failed.error = PairError{PairErrorKind::INVALID_INPUT, "input", "series days must increase"};
    results.push_back(failed);

    return results;
}

std::vector<std::string> split(const std::string& row) {
    std::vector<std::string> fields;
    std::istringstream in(row);
    std::string field;
    while (std::getline(in, field, ',')) {
        fields.push_back(field);
    }
    if (!row.empty() && row.back() == ',') {
        fields.push_back("");
    }
    return fields;
}

std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        out.push_back(line);
    }
    return out;
}

} // namespace

class BatchSummaryTest : public ::testing::Test {
protected:
    BatchSummary summary;
};

TEST_F(BatchSummaryTest, CountsTiersAndErrors) {
    const auto stats = summary.summarize(sampleBatch());

    EXPECT_EQ(stats.total, 4u);
    EXPECT_EQ(stats.ranked, 3u);
    EXPECT_EQ(stats.error_marked, 1u);
    EXPECT_EQ(stats.tier_counts.at(AlertTier::HIGH), 1u);
    EXPECT_EQ(stats.tier_counts.at(AlertTier::WATCHLIST), 1u);
    EXPECT_EQ(stats.tier_counts.at(AlertTier::NONE), 1u);
    EXPECT_EQ(stats.tier_counts.count(AlertTier::CRITICAL), 0u);
    EXPECT_EQ(stats.error_counts.at(PairErrorKind::INVALID_INPUT), 1u);

    // BETA is FDR significant but has no Bayesian signal
    EXPECT_EQ(stats.fdr_significant, 1u);
    EXPECT_EQ(stats.emerging, 1u);

    EXPECT_EQ(stats.latency.counts.at(LatencyCategory::DELAYED), 1u);
    EXPECT_EQ(stats.latency.counts.at(LatencyCategory::EARLY), 1u);
    ASSERT_TRUE(stats.latency.median_days.has_value());
    EXPECT_DOUBLE_EQ(*stats.latency.median_days, 7.5);
}

TEST_F(BatchSummaryTest, ScoreMomentsExcludeErrorMarkedPairs) {
    const auto stats = summary.summarize(sampleBatch());

    EXPECT_NEAR(stats.mean_score, 0.5, 1e-12);
    const double variance = (0.16 + 0.0 + 0.16) / 3.0;
    EXPECT_NEAR(stats.std_dev_score, std::sqrt(variance), 1e-12);
}

TEST_F(BatchSummaryTest, EmptyBatch) {
    const auto stats = summary.summarize({});
    EXPECT_EQ(stats.total, 0u);
    EXPECT_EQ(stats.ranked, 0u);
    EXPECT_DOUBLE_EQ(stats.mean_score, 0.0);
    EXPECT_TRUE(stats.tier_counts.empty());
}

class FusionResultWriterTest : public ::testing::Test {
protected:
    FusionResultWriter writer;
};

TEST_F(FusionResultWriterTest, EscapesOnlyWhenNeeded) {
    EXPECT_EQ(FusionResultWriter::escapeField("HEPATOTOXICITY"), "HEPATOTOXICITY");
    EXPECT_EQ(FusionResultWriter::escapeField("RASH, SEVERE"), "\"RASH, SEVERE\"");
    EXPECT_EQ(FusionResultWriter::escapeField("so-called \"drug\""), "\"so-called \"\"drug\"\"\"");
    EXPECT_EQ(FusionResultWriter::escapeField("two\nlines"), "\"two\nlines\"");
}

TEST_F(FusionResultWriterTest, OneRowPerResult) {
    std::ostringstream out;
    writer.writeCsv(out, sampleBatch());
    const auto rows = lines(out.str());

    ASSERT_EQ(rows.size(), 5u);
    EXPECT_EQ(rows[0].rfind("rank,classical_rank,percentile,drug,event,case_count,fusion_score,alert_tier,", 0), 0u);

    const auto columns = std::count(rows[0].begin(), rows[0].end(), ',');
    // Rows without quoted fields have exactly the header's column count
    EXPECT_EQ(std::count(rows[1].begin(), rows[1].end(), ','), columns);
    EXPECT_EQ(std::count(rows[3].begin(), rows[3].end(), ','), columns);

    EXPECT_EQ(rows[1].rfind("1,", 0), 0u);
    EXPECT_NE(rows[1].find(",ALPHA,RASH,4,0.9,high,"), std::string::npos);
    EXPECT_NE(rows[2].find("causality: no clinical features supplied; temporal: none"), std::string::npos);
    EXPECT_NE(rows[2].find(",possible,\"Plausible time to onset; alternative causes present: sepsis, NSAID\","),
              std::string::npos);
}

TEST_F(FusionResultWriterTest, RowCarriesSubScoresAndFlags) {
    std::ostringstream out;
    writer.writeCsv(out, sampleBatch());
    const auto rows = lines(out.str());

    const auto header = split(rows[0]);
    const auto top = split(rows[1]);
    ASSERT_EQ(top.size(), header.size());
    auto column = [&](const std::string& name) {
        const auto it = std::find(header.begin(), header.end(), name);
        return it == header.end() ? std::string("<missing>") : top[static_cast<std::size_t>(it - header.begin())];
    };

    EXPECT_EQ(column("classical_rank"), "2");
    EXPECT_EQ(column("layer1_rarity"), "0.9");
    EXPECT_EQ(column("layer1_seriousness"), "0.8");
    EXPECT_EQ(column("layer1_recency"), "1");
    EXPECT_EQ(column("layer1_count"), "0.4");
    EXPECT_EQ(column("layer1_boosts"), "rare_serious=0.15;all_three=0.2");
    EXPECT_EQ(column("layer1_tunneling"), "0.1");
    EXPECT_EQ(column("layer2_burst"), "0.7");
    EXPECT_EQ(column("layer2_mechanism"), "0.5");
    EXPECT_EQ(column("prr_signal"), "1");
    EXPECT_EQ(column("ror_signal"), "0");
    EXPECT_EQ(column("ic975"), "3.5");
    EXPECT_EQ(column("fisher_p_value"), "0.002");
    EXPECT_EQ(column("bayesian_signal"), "1");
    EXPECT_EQ(column("low_confidence"), "0");
    EXPECT_EQ(column("spike_count"), "1");
    EXPECT_EQ(column("spikes"), "280:45:9:1e-06");
    EXPECT_EQ(column("trend"), "increasing");
    EXPECT_EQ(column("characteristic_time_days"), "14");
    EXPECT_EQ(column("time_to_onset_days"), "12");
    EXPECT_EQ(column("latency"), "delayed");
}

TEST_F(FusionResultWriterTest, ErrorRowCarriesTheError) {
    std::ostringstream out;
    writer.writeCsv(out, sampleBatch());
    const auto rows = lines(out.str());

    const auto& error_row = rows[4];
    EXPECT_EQ(error_row.rfind(",,,DELTA,\"RASH, SEVERE\",0,,,", 0), 0u);
    EXPECT_NE(error_row.find("invalid_input,input,series days must increase"), std::string::npos);
}

TEST_F(FusionResultWriterTest, SummaryListsMetrics) {
    BatchSummary summary;
    std::ostringstream out;
    writer.writeSummary(out, summary.summarize(sampleBatch()));
    const std::string text = out.str();

    EXPECT_EQ(text.rfind("metric,value\n", 0), 0u);
    EXPECT_NE(text.find("total,4\n"), std::string::npos);
    EXPECT_NE(text.find("error_marked,1\n"), std::string::npos);
    EXPECT_NE(text.find("mean_score,0.50000000\n"), std::string::npos);
    EXPECT_NE(text.find("tier_high,1\n"), std::string::npos);
    EXPECT_NE(text.find("error_invalid_input,1\n"), std::string::npos);
    EXPECT_NE(text.find("fdr_significant,1\n"), std::string::npos);
    EXPECT_NE(text.find("latency_early,1\n"), std::string::npos);
    EXPECT_NE(text.find("latency_delayed,1\n"), std::string::npos);
    EXPECT_NE(text.find("median_onset_days,7.50000000\n"), std::string::npos);
}

TEST_F(FusionResultWriterTest, UnwritablePathReportsFailure) {
    EXPECT_FALSE(writer.saveCsv("/nonexistent/pvsignal/results.csv", sampleBatch()));
    EXPECT_FALSE(writer.saveSummary("/nonexistent/pvsignal/summary.csv", BatchStatistics{}));
}
