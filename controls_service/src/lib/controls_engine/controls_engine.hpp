#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "control_model/control.hpp"
#include "decision_resolver/decision_resolver.hpp"
#include "monitoring/monitoring_aggregator.hpp"
#include "report_writer/report_writer.hpp"
#include "rule_evaluator/rule_evaluator.hpp"
#include "transaction_batch/transaction_batch.hpp"

namespace payment_controls {

struct EngineResult {
    std::vector<Decision> decisions;
    std::vector<Hit> hits;
    std::vector<ControlMetric> metrics;
};

struct RunSummary {
    std::size_t transactions = 0;
    std::size_t hit_rows = 0;
    std::map<std::string, std::size_t> final_actions;
    // rail -> final action -> count
    std::map<std::string, std::map<std::string, std::size_t>> final_actions_by_rail;
    double action_rate = 0.0;  // share of decisions other than ALLOW
};

struct EngineSettings {
    std::string transactions_path = "data/combined_transactions.csv";
    std::string controls_path = "controls/controls.yaml";
    std::string output_dir = "data";
    std::string decisions_file = "control_decisions.csv";
    std::string hits_file = "control_hits.csv";
    std::string metrics_file = "control_metrics.csv";
    bool parallel_evaluation = false;

    ReportPaths OutputPaths() const;
};

// Pure batch transform. Throws before evaluating any control when the batch
// lacks a required column. `parallel` evaluates each control in its own
// task and needs a coroutine context; the hits come out in the same order
// as the sequential pass.
EngineResult EvaluateControls(const TransactionBatch& batch,
                              const std::vector<Control>& controls,
                              bool parallel = false);

RunSummary SummarizeRun(const EngineResult& result);

// Load, evaluate, write all three tables. Either every table is written or
// an exception is thrown and no output file is replaced.
EngineResult RunControls(const EngineSettings& settings);

}  // namespace payment_controls
