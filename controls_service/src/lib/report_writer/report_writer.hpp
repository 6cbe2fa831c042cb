#pragma once

#include <string>
#include <vector>

#include "decision_resolver/decision_resolver.hpp"
#include "monitoring/monitoring_aggregator.hpp"
#include "rule_evaluator/rule_evaluator.hpp"

namespace payment_controls {

struct ReportPaths {
    std::string decisions;
    std::string hits;
    std::string metrics;
};

// CSV text with a header row; an empty table is just the header.
std::string RenderDecisionsCsv(const std::vector<Decision>& decisions);
std::string RenderHitsCsv(const std::vector<Hit>& hits);
std::string RenderMetricsCsv(const std::vector<ControlMetric>& metrics);

// Renders all three tables, writes each next to its target as a temporary
// file and renames them into place only after every write succeeded.
// Existing targets are moved aside first and restored if any step fails.
// Throws on I/O failure, or when a target exists and is not a regular file,
// leaving every target as it was.
void WriteReports(const ReportPaths& paths,
                  const std::vector<Decision>& decisions,
                  const std::vector<Hit>& hits,
                  const std::vector<ControlMetric>& metrics);

}  // namespace payment_controls
