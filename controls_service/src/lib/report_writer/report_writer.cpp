#include "report_writer.hpp"

#include <array>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <userver/logging/log.hpp>

#include "control_model/control.hpp"
#include "rule_utils/csv.hpp"
#include "rule_utils/field_value.hpp"

namespace payment_controls {

namespace {

namespace fs = std::filesystem;

const rule_utils::CsvRow kDecisionColumns = {
    "tx_id", "rail", "timestamp", "user_id", "amount", "is_fraud_pattern",
    "final_action", "triggered_controls", "triggered_actions"};

const rule_utils::CsvRow kHitColumns = {
    "tx_id", "rail", "control_id", "severity", "action", "description"};

const rule_utils::CsvRow kMetricColumns = {
    "control_id", "hits", "hit_rate", "precision_proxy"};

std::string FormatNumber(double value) {
    return rule_utils::FormatDouble(value);
}

std::string FormatFlag(bool value) {
    return value ? "True" : "False";
}

void WriteFile(const fs::path& path, const std::string& contents) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << contents;
    output.close();
    if (!output) {
        throw std::runtime_error("cannot write " + path.string());
    }
}

void RemoveQuietly(const fs::path& path) {
    std::error_code ignored;
    fs::remove(path, ignored);
}

}  // namespace

std::string RenderDecisionsCsv(const std::vector<Decision>& decisions) {
    std::string out;
    rule_utils::AppendCsvRow(out, kDecisionColumns);
    for (const auto& d : decisions) {
        rule_utils::AppendCsvRow(out, {
            d.tx_id, d.rail, d.timestamp, d.user_id, FormatNumber(d.amount),
            FormatFlag(d.is_fraud_pattern), ActionName(d.final_action),
            JoinTriggered(d.triggered_controls), JoinTriggered(d.triggered_actions)});
    }
    return out;
}

std::string RenderHitsCsv(const std::vector<Hit>& hits) {
    std::string out;
    rule_utils::AppendCsvRow(out, kHitColumns);
    for (const auto& h : hits) {
        rule_utils::AppendCsvRow(out, {
            h.tx_id, h.rail, h.control_id, h.severity, h.action, h.description});
    }
    return out;
}

std::string RenderMetricsCsv(const std::vector<ControlMetric>& metrics) {
    std::string out;
    rule_utils::AppendCsvRow(out, kMetricColumns);
    for (const auto& m : metrics) {
        rule_utils::AppendCsvRow(out, {
            m.control_id, std::to_string(m.hits),
            FormatNumber(m.hit_rate), FormatNumber(m.precision_proxy)});
    }
    return out;
}

void WriteReports(const ReportPaths& paths,
                  const std::vector<Decision>& decisions,
                  const std::vector<Hit>& hits,
                  const std::vector<ControlMetric>& metrics) {
    const std::array<std::pair<fs::path, std::string>, 3> reports = {{
        {paths.decisions, RenderDecisionsCsv(decisions)},
        {paths.hits, RenderHitsCsv(hits)},
        {paths.metrics, RenderMetricsCsv(metrics)},
    }};

    for (const auto& report : reports) {
        const auto status = fs::status(report.first);
        if (fs::exists(status) && !fs::is_regular_file(status)) {
            throw std::runtime_error(fmt::format(
                "cannot write {}: target exists and is not a regular file", report.first.string()));
        }
    }

    std::vector<fs::path> temporaries;
    std::vector<std::pair<fs::path, fs::path>> backups;  // target -> backup
    std::vector<fs::path> installed;
    try {
        for (const auto& [target, contents] : reports) {
            if (target.has_parent_path()) {
                fs::create_directories(target.parent_path());
            }
            auto temporary = target;
            temporary += ".tmp";
            temporaries.push_back(temporary);
            WriteFile(temporary, contents);
        }
        for (const auto& report : reports) {
            if (fs::exists(report.first)) {
                auto backup = report.first;
                backup += ".bak";
                fs::rename(report.first, backup);
                backups.emplace_back(report.first, backup);
            }
        }
        for (std::size_t i = 0; i < reports.size(); ++i) {
            fs::rename(temporaries[i], reports[i].first);
            installed.push_back(reports[i].first);
        }
    } catch (const std::exception& e) {
        LOG_ERROR() << "Failed to write control reports: " << e.what();
        for (const auto& target : installed) {
            RemoveQuietly(target);
        }
        for (const auto& [target, backup] : backups) {
            std::error_code error;
            fs::rename(backup, target, error);
            if (error) {
                LOG_ERROR() << "Cannot restore " << target.string() << " from "
                            << backup.string() << ": " << error.message();
            }
        }
        for (const auto& temporary : temporaries) {
            RemoveQuietly(temporary);
        }
        throw;
    }

    for (const auto& entry : backups) {
        RemoveQuietly(entry.second);
    }
    for (const auto& report : reports) {
        LOG_INFO() << "Wrote " << report.first.string();
    }
}

}  // namespace payment_controls
