#pragma once

#include <string_view>
#include <variant>
#include <vector>

#include <controls/control_config.pb.h>

#include "rule_utils/field_value.hpp"

namespace payment_controls {

enum class CompareOp { kGreater, kGreaterOrEqual, kLess, kLessOrEqual };

std::string_view ToString(CompareOp op);

// `field: value` with a string, number or null value. String values are
// stored lower-cased and compared case-insensitively; numbers compare
// exactly; null never matches.
struct Equals {
    rule_utils::FieldRef field;
    rule_utils::FieldValue expected;
};

// `field_in: [a, b, ...]`, element-wise equality without coercion.
struct MembershipIn {
    rule_utils::FieldRef field;
    std::vector<rule_utils::FieldValue> values;
};

// `field_gt: x`, `field_lte_days: x`, ...
struct NumericCompare {
    rule_utils::FieldRef field;
    CompareOp op = CompareOp::kGreater;
    double threshold = 0.0;
};

// `field: true|false`
struct BooleanEquals {
    rule_utils::FieldRef field;
    bool expected = false;
};

using Condition = std::variant<Equals, MembershipIn, NumericCompare, BooleanEquals>;

// Classifies a raw key/value pair by key suffix and resolves its field.
// Throws ConfigError when the value shape does not fit the key.
Condition CompileCondition(const controls::Condition& raw);

const rule_utils::FieldRef& ConditionField(const Condition& condition);

}  // namespace payment_controls
