#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <controls/control_config.pb.h>

#include "condition/condition.hpp"

namespace payment_controls {

inline constexpr std::string_view kDefaultSeverity = "MEDIUM";
inline constexpr std::string_view kDefaultAction = "REVIEW";

// A loaded rule: conditions are compiled and ANDed. Immutable after load.
struct Control {
    std::string control_id;
    controls::Rail rail = controls::RAIL_UNSPECIFIED;
    std::string severity{kDefaultSeverity};
    std::string action{kDefaultAction};
    std::string description;
    std::vector<Condition> conditions;
};

std::string RailName(controls::Rail rail);

std::string ActionName(controls::Action action);

// ALLOW < REVIEW < BLOCK. Unrecognized action strings rank as ALLOW.
controls::Action ParseAction(std::string_view action);

bool IsKnownAction(std::string_view action);

}  // namespace payment_controls
