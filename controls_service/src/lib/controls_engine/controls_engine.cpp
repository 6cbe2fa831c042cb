#include "controls_engine.hpp"

#include <filesystem>
#include <iterator>

#include <fmt/format.h>
#include <userver/engine/task/task_with_result.hpp>
#include <userver/logging/log.hpp>
#include <userver/utils/async.hpp>

#include "control_loader/control_loader.hpp"
#include "transaction_loader/transaction_loader.hpp"

namespace payment_controls {

namespace {

std::vector<Hit> EvaluateInParallel(const TransactionBatch& batch,
                                    const std::vector<Control>& controls) {
    RuleEvaluator::ValidateBatch(batch);

    std::vector<userver::engine::TaskWithResult<std::vector<Hit>>> tasks;
    tasks.reserve(controls.size());
    for (const auto& control : controls) {
        tasks.push_back(userver::utils::Async("evaluate-control", [&batch, &control] {
            return RuleEvaluator::EvaluateControl(batch, control);
        }));
    }

    std::vector<Hit> hits;
    for (auto& task : tasks) {
        auto control_hits = task.Get();
        hits.insert(hits.end(), std::make_move_iterator(control_hits.begin()),
                    std::make_move_iterator(control_hits.end()));
    }
    return hits;
}

void LogSummary(const RunSummary& summary) {
    LOG_INFO() << fmt::format("Controls evaluated: {} transactions, {} hit rows, action rate {:.2f}%",
                              summary.transactions, summary.hit_rows, summary.action_rate * 100.0);
    for (const auto& [action, count] : summary.final_actions) {
        LOG_INFO() << "  " << action << ": " << count;
    }
    for (const auto& [rail, actions] : summary.final_actions_by_rail) {
        std::string breakdown;
        for (const auto& [action, count] : actions) {
            breakdown += fmt::format(" {}={}", action, count);
        }
        LOG_INFO() << "  " << rail << ":" << breakdown;
    }
}

}  // namespace

ReportPaths EngineSettings::OutputPaths() const {
    const std::filesystem::path dir(output_dir);
    return ReportPaths{
        (dir / decisions_file).string(),
        (dir / hits_file).string(),
        (dir / metrics_file).string(),
    };
}

EngineResult EvaluateControls(const TransactionBatch& batch,
                              const std::vector<Control>& controls,
                              bool parallel) {
    EngineResult result;
    result.hits = parallel ? EvaluateInParallel(batch, controls)
                           : RuleEvaluator::Evaluate(batch, controls);
    result.decisions = DecisionResolver::Resolve(batch, result.hits);
    result.metrics = MonitoringAggregator::Aggregate(batch, result.hits);
    return result;
}

RunSummary SummarizeRun(const EngineResult& result) {
    RunSummary summary;
    summary.transactions = result.decisions.size();
    summary.hit_rows = result.hits.size();

    for (const auto action : {controls::ALLOW, controls::REVIEW, controls::BLOCK}) {
        summary.final_actions[ActionName(action)] = 0;
    }

    std::size_t actioned = 0;
    for (const auto& decision : result.decisions) {
        const auto action = ActionName(decision.final_action);
        ++summary.final_actions[action];
        ++summary.final_actions_by_rail[decision.rail][action];
        if (decision.final_action != controls::ALLOW) {
            ++actioned;
        }
    }
    if (summary.transactions > 0) {
        summary.action_rate = static_cast<double>(actioned) / summary.transactions;
    }
    return summary;
}

EngineResult RunControls(const EngineSettings& settings) {
    const auto controls = LoadControls(settings.controls_path);
    const auto batch = LoadTransactions(settings.transactions_path);

    auto result = EvaluateControls(batch, controls, settings.parallel_evaluation);
    WriteReports(settings.OutputPaths(), result.decisions, result.hits, result.metrics);
    LogSummary(SummarizeRun(result));
    return result;
}

}  // namespace payment_controls
