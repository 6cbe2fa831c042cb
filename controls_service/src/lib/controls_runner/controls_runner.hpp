#pragma once

#include <string_view>

#include <userver/components/component_config.hpp>
#include <userver/components/component_context.hpp>
#include <userver/components/loggable_component_base.hpp>
#include <userver/yaml_config/schema.hpp>

#include "controls_engine/controls_engine.hpp"

namespace payment_controls {

// Runs one controls batch while the component system starts. Any load,
// evaluation or write failure propagates and aborts startup.
class ControlsRunner final : public userver::components::LoggableComponentBase {
public:
    static constexpr std::string_view kName = "controls-runner";

    ControlsRunner(const userver::components::ComponentConfig& config,
                   const userver::components::ComponentContext& context);

    ~ControlsRunner() override;

    ControlsRunner(const ControlsRunner&) = delete;
    ControlsRunner& operator=(const ControlsRunner&) = delete;

    static userver::yaml_config::Schema GetStaticConfigSchema();

    const EngineSettings& GetSettings() const { return settings_; }

private:
    static EngineSettings ReadSettings(const userver::components::ComponentConfig& config);

    const EngineSettings settings_;
};

}  // namespace payment_controls
