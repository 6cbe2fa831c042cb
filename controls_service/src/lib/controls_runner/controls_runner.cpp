#include "controls_runner.hpp"

#include <userver/logging/log.hpp>
#include <userver/yaml_config/merge_schemas.hpp>

namespace payment_controls {

ControlsRunner::ControlsRunner(
    const userver::components::ComponentConfig& config,
    const userver::components::ComponentContext& context)
    : LoggableComponentBase(config, context),
      settings_(ReadSettings(config)) {
    LOG_INFO() << "ControlsRunner starting. Transactions: " << settings_.transactions_path
               << ", controls: " << settings_.controls_path
               << ", output: " << settings_.output_dir
               << (settings_.parallel_evaluation ? " (parallel evaluation)" : "");

    try {
        RunControls(settings_);
    } catch (const std::exception& e) {
        LOG_ERROR() << "Controls run failed: " << e.what();
        throw;
    }
    LOG_INFO() << "ControlsRunner finished";
}

ControlsRunner::~ControlsRunner() {
    LOG_INFO() << "ControlsRunner shutting down";
}

EngineSettings ControlsRunner::ReadSettings(const userver::components::ComponentConfig& config) {
    EngineSettings defaults;
    EngineSettings settings;
    settings.transactions_path =
        config["transactions_path"].As<std::string>(defaults.transactions_path);
    settings.controls_path = config["controls_path"].As<std::string>(defaults.controls_path);
    settings.output_dir = config["output_dir"].As<std::string>(defaults.output_dir);
    settings.decisions_file = config["decisions_file"].As<std::string>(defaults.decisions_file);
    settings.hits_file = config["hits_file"].As<std::string>(defaults.hits_file);
    settings.metrics_file = config["metrics_file"].As<std::string>(defaults.metrics_file);
    settings.parallel_evaluation =
        config["parallel_evaluation"].As<bool>(defaults.parallel_evaluation);
    return settings;
}

userver::yaml_config::Schema ControlsRunner::GetStaticConfigSchema() {
    return userver::yaml_config::MergeSchemas<userver::components::LoggableComponentBase>(R"(
type: object
description: Evaluates a control set against one transaction batch and writes the reports
additionalProperties: false
properties:
    transactions_path:
        type: string
        description: Unified transaction CSV
        defaultDescription: data/combined_transactions.csv
    controls_path:
        type: string
        description: YAML control set
        defaultDescription: controls/controls.yaml
    output_dir:
        type: string
        description: Directory receiving the decisions, hits and metrics tables
        defaultDescription: data
    decisions_file:
        type: string
        description: File name of the per-transaction decisions table
        defaultDescription: control_decisions.csv
    hits_file:
        type: string
        description: File name of the long-form hits table
        defaultDescription: control_hits.csv
    metrics_file:
        type: string
        description: File name of the per-control metrics table
        defaultDescription: control_metrics.csv
    parallel_evaluation:
        type: boolean
        description: Evaluate each control in its own task
        defaultDescription: false
)");
}

}  // namespace payment_controls
