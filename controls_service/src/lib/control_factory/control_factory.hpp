#pragma once

#include <vector>

#include <controls/control_config.pb.h>

#include "control_model/control.hpp"

namespace payment_controls {

class ControlFactory {
public:
    // Validates the declarative record and compiles its conditions once.
    static Control CreateControl(const controls::ControlConfig& config);

    // Keeps declaration order. A control_id that appears twice is rejected.
    static std::vector<Control> CreateControls(const controls::ControlSet& control_set);
};

}  // namespace payment_controls
