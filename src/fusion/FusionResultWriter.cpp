#include "pvsignal/fusion/FusionResultWriter.hpp"
#include "pvsignal/utils/Logger.hpp"

#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <utility>

namespace pvsignal {

namespace {

const std::string LOG_SOURCE = "FusionResultWriter";

template <typename T>
void writeOptional(std::ostream& out, const std::optional<T>& value) {
    out << ",";
    if (value) {
        out << *value;
    }
}

std::string joinNotes(const std::vector<std::string>& notes) {
    std::string joined;
    for (const auto& note : notes) {
        if (!joined.empty()) {
            joined += "; ";
        }
        joined += note;
    }
    return joined;
}

int flag(bool value) {
    return value ? 1 : 0;
}

// name=value pairs separated by ';'
std::string joinBoosts(const std::vector<std::pair<std::string, double>>& boosts) {
    std::ostringstream oss;
    oss << std::setprecision(6);
    for (std::size_t i = 0; i < boosts.size(); ++i) {
        if (i > 0) oss << ";";
        oss << boosts[i].first << "=" << boosts[i].second;
    }
    return oss.str();
}

// day:observed:fold:p per spike, separated by ';'
std::string joinSpikes(const std::vector<SpikeEvent>& spikes) {
    std::ostringstream oss;
    oss << std::setprecision(6);
    for (std::size_t i = 0; i < spikes.size(); ++i) {
        const auto& spike = spikes[i];
        if (i > 0) oss << ";";
        oss << spike.day << ":" << spike.observed << ":" << spike.fold_increase << ":" << spike.p_value;
    }
    return oss.str();
}

} // namespace

std::string FusionResultWriter::escapeField(const std::string& field) {
    if (field.find_first_of(",\"\n\r") == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

void FusionResultWriter::writeCsv(std::ostream& out, const std::vector<FusionResult>& results) const {
    out << "rank,classical_rank,percentile,drug,event,case_count,fusion_score,alert_tier,"
        << "layer1_score,layer1_normalized,layer1_rarity,layer1_seriousness,layer1_recency,layer1_count,"
        << "layer1_base_score,layer1_boosts,layer1_tunneling,"
        << "layer2_score,layer2_frequency,layer2_severity,layer2_burst,layer2_novelty,layer2_consensus,"
        << "layer2_mechanism,evidence_score,"
        << "prr,prr_lower,prr_upper,prr_signal,ror,ror_lower,ror_upper,ror_signal,"
        << "ic,ic025,ic975,ic_signal,chi_square_p_value,fisher_p_value,disproportionality_strength,"
        << "ebgm,eb05,eb95,raw_p_value,adjusted_p_value,bayesian_signal,fdr_significant,low_confidence,"
        << "who_umc,who_umc_reasoning,naranjo_score,naranjo_category,causality_confidence,recommendation,"
        << "time_to_onset_days,latency,"
        << "spike_count,spikes,trend,trend_slope,characteristic_time_days,change_points,"
        << "novelty_score,emerging,temporal_risk,"
        << "error_kind,error_component,error_message,not_computed\n";

    const auto flags = out.flags();
    const auto precision = out.precision();
    out << std::setprecision(6);

    for (const auto& r : results) {
        if (r.rank) out << *r.rank;
        writeOptional(out, r.classical_rank);
        writeOptional(out, r.percentile);
        out << "," << escapeField(r.drug) << "," << escapeField(r.event) << "," << r.case_count;

        if (r.ok()) {
            out << "," << r.fusion_score << "," << toString(r.alert_tier);
        } else {
            out << ",,";
        }

        if (r.layer1) {
            const auto& l1 = *r.layer1;
            out << "," << l1.score << "," << r.layer1_normalized
                << "," << l1.rarity << "," << l1.seriousness << "," << l1.recency << "," << l1.count
                << "," << l1.base_score << "," << escapeField(joinBoosts(l1.interaction_boosts))
                << "," << l1.tunneling_boost;
        } else {
            out << ",,,,,,,,,";
        }
        if (r.layer2) {
            const auto& l2 = *r.layer2;
            out << "," << l2.score << "," << l2.frequency << "," << l2.severity << "," << l2.burst
                << "," << l2.novelty << "," << l2.consensus << "," << l2.mechanism;
        } else {
            out << ",,,,,,,";
        }
        if (r.evidence) out << "," << r.evidence->score; else out << ",";

        if (r.disproportionality) {
            const auto& d = *r.disproportionality;
            out << "," << d.prr.value << "," << d.prr.ci.lower << "," << d.prr.ci.upper << "," << flag(d.prr.signal)
                << "," << d.ror.value << "," << d.ror.ci.lower << "," << d.ror.ci.upper << "," << flag(d.ror.signal)
                << "," << d.ic.value << "," << d.ic.ci.lower << "," << d.ic.ci.upper << "," << flag(d.ic.signal)
                << "," << d.chi_square_p_value;
            writeOptional(out, d.fisher_p_value);
            out << "," << toString(d.strength);
        } else {
            out << ",,,,,,,,,,,,,,,";
        }

        if (r.bayesian) {
            const auto& b = *r.bayesian;
            out << "," << b.ebgm << "," << b.eb05 << "," << b.eb95
                << "," << b.raw_p_value << "," << b.adjusted_p_value
                << "," << flag(b.signal) << "," << flag(b.fdr_significant) << "," << flag(b.low_confidence);
        } else {
            out << ",,,,,,,,";
        }

        if (r.causality) {
            const auto& c = *r.causality;
            out << "," << toString(c.who_umc) << "," << escapeField(c.who_umc_reasoning)
                << "," << c.naranjo.score << "," << toString(c.naranjo.category) << "," << c.confidence
                << "," << escapeField(c.recommendation);
        } else {
            out << ",,,,,,";
        }
        writeOptional(out, r.time_to_onset_days);
        out << "," << (r.latency ? toString(*r.latency) : std::string());

        if (r.temporal) {
            const auto& t = *r.temporal;
            out << ",";
            if (t.spike_detection_run) out << t.spikes.size();
            out << "," << escapeField(joinSpikes(t.spikes));
            if (t.trend) {
                out << "," << toString(t.trend->direction) << "," << t.trend->slope;
                writeOptional(out, t.trend->characteristic_time_days);
            } else {
                out << ",,,";
            }
            out << "," << t.change_points.size();
            if (t.novelty) {
                out << "," << t.novelty->score << "," << flag(t.novelty->emerging);
            } else {
                out << ",,";
            }
            out << "," << t.risk_score;
        } else {
            out << ",,,,,,,,,";
        }

        if (r.error) {
            out << "," << toString(r.error->kind) << "," << escapeField(r.error->component)
                << "," << escapeField(r.error->message);
        } else {
            out << ",,,";
        }
        out << "," << escapeField(joinNotes(r.not_computed)) << "\n";
    }

    out.flags(flags);
    out.precision(precision);
}

bool FusionResultWriter::saveCsv(const std::string& filepath, const std::vector<FusionResult>& results) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        Logger::getInstance().error(LOG_SOURCE, "Failed to open: " + filepath);
        return false;
    }

    writeCsv(file, results);
    file.close();
    Logger::getInstance().info(LOG_SOURCE, "Fusion results saved to: " + filepath
                               + " (" + std::to_string(results.size()) + " rows)");
    return true;
}

void FusionResultWriter::writeSummary(std::ostream& out, const BatchStatistics& stats) const {
    const auto flags = out.flags();
    const auto precision = out.precision();

    out << "metric,value\n";
    out << "total," << stats.total << "\n";
    out << "ranked," << stats.ranked << "\n";
    out << "error_marked," << stats.error_marked << "\n";
    out << std::fixed << std::setprecision(8);
    out << "mean_score," << stats.mean_score << "\n";
    out << "std_dev_score," << stats.std_dev_score << "\n";
    out << "q025_score," << stats.q025_score << "\n";
    out << "median_score," << stats.median_score << "\n";
    out << "q975_score," << stats.q975_score << "\n";
    for (const auto& [tier, count] : stats.tier_counts) {
        out << "tier_" << toString(tier) << "," << count << "\n";
    }
    for (const auto& [kind, count] : stats.error_counts) {
        out << "error_" << toString(kind) << "," << count << "\n";
    }
    out << "fdr_significant," << stats.fdr_significant << "\n";
    out << "emerging," << stats.emerging << "\n";
    for (const auto& [category, count] : stats.latency.counts) {
        out << "latency_" << toString(category) << "," << count << "\n";
    }
    if (stats.latency.median_days) {
        out << "median_onset_days," << *stats.latency.median_days << "\n";
    }

    out.flags(flags);
    out.precision(precision);
}

bool FusionResultWriter::saveSummary(const std::string& filepath, const BatchStatistics& stats) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        Logger::getInstance().error(LOG_SOURCE, "Failed to open: " + filepath);
        return false;
    }

    writeSummary(file, stats);
    file.close();
    Logger::getInstance().info(LOG_SOURCE, "Batch summary saved to: " + filepath);
    return true;
}

} // namespace pvsignal
