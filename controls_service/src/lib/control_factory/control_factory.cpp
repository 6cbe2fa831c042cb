#include "control_factory.hpp"

#include <string>
#include <unordered_set>

#include <fmt/format.h>
#include <userver/logging/log.hpp>

#include "rule_utils/errors.hpp"

namespace payment_controls {

Control ControlFactory::CreateControl(const controls::ControlConfig& config) {
    if (config.control_id().empty()) {
        throw ConfigError("control with an empty control_id");
    }
    if (config.rail() == controls::RAIL_UNSPECIFIED) {
        throw ConfigError(fmt::format("control '{}' has no rail", config.control_id()));
    }

    Control control;
    control.control_id = config.control_id();
    control.rail = config.rail();
    control.severity = config.severity();
    control.action = config.action();
    control.description = config.description();

    if (!IsKnownAction(control.action)) {
        LOG_WARNING() << "Control " << control.control_id << " has unrecognized action '"
                      << control.action << "'; it ranks as ALLOW when resolving decisions";
    }

    control.conditions.reserve(config.conditions_size());
    for (const auto& raw : config.conditions()) {
        try {
            control.conditions.push_back(CompileCondition(raw));
        } catch (const ConfigError& e) {
            throw ConfigError(fmt::format("control '{}': {}", control.control_id, e.what()));
        }
    }
    return control;
}

std::vector<Control> ControlFactory::CreateControls(const controls::ControlSet& control_set) {
    std::vector<Control> result;
    result.reserve(control_set.controls_size());
    std::unordered_set<std::string> ids;

    for (const auto& config : control_set.controls()) {
        if (!ids.insert(config.control_id()).second) {
            throw ConfigError(fmt::format("duplicate control_id '{}'", config.control_id()));
        }
        result.push_back(CreateControl(config));
    }
    return result;
}

}  // namespace payment_controls
