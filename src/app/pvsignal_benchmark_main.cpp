#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <map>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "pvsignal/SignalTypes.hpp"
#include "pvsignal/config/SettingsReader.hpp"
#include "pvsignal/config/SignalConfig.hpp"
#include "pvsignal/fusion/BatchSummary.hpp"
#include "pvsignal/fusion/FusionOrchestrator.hpp"
#include "pvsignal/fusion/FusionResultWriter.hpp"
#include "pvsignal/utils/Logger.hpp"

using pvsignal::BatchStatistics;
using pvsignal::BatchSummary;
using pvsignal::CaseSummary;
using pvsignal::ClinicalFeatures;
using pvsignal::ContingencyTable;
using pvsignal::DechallengeOutcome;
using pvsignal::FusionOrchestrator;
using pvsignal::FusionResult;
using pvsignal::FusionResultWriter;
using pvsignal::Logger;
using pvsignal::LogLevel;
using pvsignal::RechallengeOutcome;
using pvsignal::SignalConfig;
using pvsignal::SignalPair;
using pvsignal::TimeSeriesData;

namespace {

struct Args {
    int pairs = 1000;
    int seed = 1;
    int threads = 0; // 0 => leave OpenMP default
    int repeats = 1;
    int top = 10;
    int periods = 52;
    // Fraction of pairs generated with an elevated reporting rate
    double signalFraction = 0.05;

    std::string settingsPath;
    std::string outputPath;
    std::string summaryPath;
    std::string logLevel = "info"; // debug|info|warning|error|none
};

void printUsage(const char* programName) {
    std::cout
        << "Usage: " << programName
        << " [--pairs N] [--seed N] [--threads N] [--repeats N] [--periods N] [--signal-fraction X]\n";
    std::cout
        << "       " << programName
        << " [--settings PATH] [--output PATH] [--summary PATH] [--top N]"
        << " [--log-level debug|info|warning|error|none]\n";
}

LogLevel parseLogLevel(const std::string& name) {
    static const std::map<std::string, LogLevel> levels = {
        {"debug", LogLevel::DEBUG},
        {"info", LogLevel::INFO},
        {"warning", LogLevel::WARNING},
        {"error", LogLevel::ERROR},
        {"none", LogLevel::NONE}
    };
    auto it = levels.find(name);
    if (it == levels.end()) {
        throw std::runtime_error("--log-level must be one of: debug, info, warning, error, none");
    }
    return it->second;
}

Args parseArgs(int argc, char** argv) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto requireValue = [&](const char* flag) -> std::string {
            if (i + 1 >= argc) {
                throw std::runtime_error(std::string("Missing value after ") + flag);
            }
            return std::string(argv[++i]);
        };

        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            std::exit(0);
        }
        if (a == "--pairs") {
            args.pairs = std::stoi(requireValue("--pairs"));
            continue;
        }
        if (a == "--seed") {
            args.seed = std::stoi(requireValue("--seed"));
            continue;
        }
        if (a == "--threads") {
            args.threads = std::stoi(requireValue("--threads"));
            continue;
        }
        if (a == "--repeats") {
            args.repeats = std::stoi(requireValue("--repeats"));
            continue;
        }
        if (a == "--periods") {
            args.periods = std::stoi(requireValue("--periods"));
            continue;
        }
        if (a == "--signal-fraction") {
            args.signalFraction = std::stod(requireValue("--signal-fraction"));
            continue;
        }
        if (a == "--top") {
            args.top = std::stoi(requireValue("--top"));
            continue;
        }
        if (a == "--settings") {
            args.settingsPath = requireValue("--settings");
            continue;
        }
        if (a == "--output") {
            args.outputPath = requireValue("--output");
            continue;
        }
        if (a == "--summary") {
            args.summaryPath = requireValue("--summary");
            continue;
        }
        if (a == "--log-level") {
            args.logLevel = requireValue("--log-level");
            continue;
        }

        throw std::runtime_error("Unknown argument: " + a);
    }

    if (args.pairs < 1 || args.repeats < 1) {
        throw std::runtime_error("pairs/repeats must be positive");
    }
    if (args.periods < 0 || args.top < 0) {
        throw std::runtime_error("periods/top must be non-negative");
    }
    if (args.signalFraction < 0.0 || args.signalFraction > 1.0) {
        throw std::runtime_error("--signal-fraction must be in [0, 1]");
    }
    parseLogLevel(args.logLevel);
    return args;
}

/**
 * @brief Seeded synthetic batch resembling a spontaneous-report database extract
 */
std::vector<SignalPair> generateBatch(const Args& args) {
    std::mt19937 rng(static_cast<uint32_t>(args.seed));
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::uniform_int_distribution<long long> drug_reports(200, 20000);
    std::uniform_int_distribution<long long> event_reports(200, 20000);
    std::uniform_int_distribution<int> onset_days(-5, 120);

    const long long database_size = 5000000;
    const double period_days = 7.0;
    const double as_of_day = period_days * std::max(args.periods - 1, 0);

    std::vector<SignalPair> batch;
    batch.reserve(static_cast<size_t>(args.pairs));

    for (int p = 0; p < args.pairs; ++p) {
        const bool elevated = unit(rng) < args.signalFraction;
        const long long drug_total = drug_reports(rng);
        const long long event_total = event_reports(rng);
        const double expected = static_cast<double>(drug_total) * static_cast<double>(event_total)
                                / static_cast<double>(database_size);
        const double relative_risk = elevated ? 2.0 + 6.0 * unit(rng) : 0.5 + unit(rng);
        std::poisson_distribution<long long> co_reports(std::max(expected * relative_risk, 0.05));
        const long long a = std::min(co_reports(rng), std::min(drug_total, event_total));

        SignalPair pair;
        pair.drug = "DRUG_" + std::to_string(p / 20);
        pair.event = "EVENT_" + std::to_string(p % 20 + 20 * (p / 400));
        pair.table = ContingencyTable(a, drug_total - a, event_total - a,
                                      database_size - drug_total - event_total + a);

        // Weekly report counts; elevated pairs ramp up over the final quarter
        if (args.periods > 0) {
            TimeSeriesData series;
            const double base_rate = static_cast<double>(a) / static_cast<double>(args.periods);
            for (int t = 0; t < args.periods; ++t) {
                double rate = base_rate;
                if (elevated && t >= (3 * args.periods) / 4) {
                    rate *= 1.0 + 0.25 * static_cast<double>(t - (3 * args.periods) / 4);
                }
                std::poisson_distribution<long long> weekly(std::max(rate, 0.01));
                series.points.push_back({period_days * t, weekly(rng)});
            }
            pair.series = series;
        }

        if (unit(rng) < 0.3) {
            ClinicalFeatures clinical;
            clinical.time_to_onset_days = static_cast<double>(onset_days(rng));
            const double dechallenge = unit(rng);
            clinical.dechallenge = dechallenge < 0.5 ? DechallengeOutcome::IMPROVED
                                 : dechallenge < 0.7 ? DechallengeOutcome::UNCHANGED
                                                     : DechallengeOutcome::UNKNOWN;
            const double rechallenge = unit(rng);
            clinical.rechallenge = rechallenge < 0.1 ? RechallengeOutcome::RECURRED
                                 : rechallenge < 0.15 ? RechallengeOutcome::DID_NOT_RECUR
                                                      : RechallengeOutcome::NOT_ATTEMPTED;
            if (unit(rng) < 0.8) {
                std::vector<std::string> causes;
                if (unit(rng) < 0.3) causes.push_back("concomitant medication");
                if (unit(rng) < 0.2) causes.push_back("underlying disease");
                clinical.alternative_causes = causes;
            }
            clinical.event_known_for_drug = unit(rng) < 0.4;
            clinical.indication_could_cause_event = unit(rng) < 0.2;
            if (unit(rng) < 0.3) clinical.dose_response = unit(rng) < 0.5;
            if (unit(rng) < 0.3) clinical.objective_evidence = unit(rng) < 0.7;
            pair.clinical = clinical;
        }

        CaseSummary summary;
        summary.serious_count = static_cast<long long>(std::floor(static_cast<double>(a) * unit(rng) * 0.6));
        summary.any_serious = summary.serious_count > 0;
        summary.death_count = unit(rng) < 0.05 ? std::min<long long>(summary.serious_count, 1) : 0;
        summary.hospitalization_count = summary.serious_count / 2;
        summary.as_of_day = as_of_day;
        summary.event_labeled = unit(rng) < 0.5;
        summary.sources_queried = 4;
        summary.sources_corroborating = static_cast<int>(std::floor(unit(rng) * (elevated ? 5.0 : 2.0)));
        if (summary.sources_corroborating > summary.sources_queried) {
            summary.sources_corroborating = summary.sources_queried;
        }
        if (unit(rng) < 0.5) {
            summary.mechanism_plausibility = unit(rng);
        }
        pair.summary = summary;

        batch.push_back(std::move(pair));
    }
    return batch;
}

void printStatistics(const BatchStatistics& stats) {
    std::cout << "\n--- Batch Summary ---\n";
    std::cout << "Pairs: " << stats.total << " (ranked " << stats.ranked
              << ", error-marked " << stats.error_marked << ")\n";
    std::cout << "Fusion score: mean " << stats.mean_score << ", sd " << stats.std_dev_score
              << ", median " << stats.median_score
              << ", 95% range [" << stats.q025_score << ", " << stats.q975_score << "]\n";
    for (const auto& [tier, count] : stats.tier_counts) {
        std::cout << "Tier " << pvsignal::toString(tier) << ": " << count << "\n";
    }
    for (const auto& [kind, count] : stats.error_counts) {
        std::cout << "Error " << pvsignal::toString(kind) << ": " << count << "\n";
    }
    std::cout << "FDR-significant Bayesian signals: " << stats.fdr_significant << "\n";
    std::cout << "Emerging pairs: " << stats.emerging << "\n";
}

void printTop(const std::vector<FusionResult>& ranked, int top) {
    std::cout << "\n--- Top " << top << " ---\n";
    int shown = 0;
    for (const auto& r : ranked) {
        if (shown >= top || !r.ok()) {
            break;
        }
        std::cout << std::setw(4) << *r.rank << "  " << std::setw(10) << r.drug << "  "
                  << std::setw(10) << r.event << "  n=" << std::setw(5) << r.case_count
                  << "  score=" << r.fusion_score << "  tier=" << pvsignal::toString(r.alert_tier) << "\n";
        ++shown;
    }
}

} // namespace

int main(int argc, char** argv) {
    Logger::getInstance().setLogLevel(LogLevel::INFO);

    try {
        const Args args = parseArgs(argc, argv);
        Logger::getInstance().setLogLevel(parseLogLevel(args.logLevel));

#ifdef _OPENMP
        if (args.threads > 0) {
            omp_set_num_threads(args.threads);
        }
#endif

        SignalConfig config;
        if (!args.settingsPath.empty()) {
            config = SignalConfig::fromSettings(pvsignal::readSettingsFile(args.settingsPath));
        }
        FusionOrchestrator orchestrator(config);

        auto now = []() { return std::chrono::steady_clock::now(); };
        auto ms = [](auto dt) {
            return std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(dt).count();
        };

        std::cout << std::fixed << std::setprecision(3);
        std::cout << "\n=== PV Signal Fusion Benchmark ===\n";
#ifdef _OPENMP
        std::cout << "OpenMP max threads: " << omp_get_max_threads() << "\n";
#endif
        std::cout << "Pairs: " << args.pairs << ", periods: " << args.periods
                  << ", seed: " << args.seed << "\n";

        const auto t0 = now();
        const std::vector<SignalPair> batch = generateBatch(args);
        const auto t1 = now();
        std::cout << "Generation: " << ms(t1 - t0) << " ms\n";

        std::vector<FusionResult> ranked;
        double total_ms = 0.0;
        for (int r = 0; r < args.repeats; ++r) {
            const auto t2 = now();
            ranked = orchestrator.scoreBatch(batch);
            const auto t3 = now();
            total_ms += ms(t3 - t2);
        }
        std::cout << "Scoring: " << args.repeats << " run(s) => avg " << (total_ms / args.repeats)
                  << " ms (" << (total_ms * 1000.0 / args.repeats / args.pairs) << " us/pair)\n";

        const BatchStatistics stats = BatchSummary().summarize(ranked);
        printStatistics(stats);
        printTop(ranked, args.top);

        FusionResultWriter writer;
        if (!args.outputPath.empty() && !writer.saveCsv(args.outputPath, ranked)) {
            return 1;
        }
        if (!args.summaryPath.empty() && !writer.saveSummary(args.summaryPath, stats)) {
            return 1;
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        printUsage(argv[0]);
        return 1;
    }
}
