#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <userver/formats/yaml/value.hpp>

#include <controls/control_config.pb.h>

#include "control_model/control.hpp"

namespace payment_controls {

// The document is a sequence of control records:
//
//   - control_id: ACH_INSTANT_NEW_ACCOUNT
//     rail: ACH
//     severity: HIGH          # default MEDIUM
//     action: REVIEW          # default REVIEW
//     description: ...        # default ""
//     conditions:             # default {}, keys keep their order
//       funding_speed: instant
//       amount_gt: 5000
//
// Throws ConfigError naming the offending YAML path.
controls::ControlSet ParseControlSet(const userver::formats::yaml::Value& document);

// Throws MissingInputError when the file does not exist.
controls::ControlSet LoadControlSet(const std::string& path);

// LoadControlSet followed by ControlFactory::CreateControls.
std::vector<Control> LoadControls(const std::string& path);

}  // namespace payment_controls
