#include "condition.hpp"

#include <array>
#include <optional>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "rule_utils/errors.hpp"

namespace payment_controls {

namespace {

using rule_utils::FieldRef;
using rule_utils::FieldValue;

constexpr std::string_view kMembershipSuffix = "_in";

constexpr std::array<std::pair<std::string_view, CompareOp>, 4> kDaySuffixes = {{
    {"_gt_days", CompareOp::kGreater},
    {"_gte_days", CompareOp::kGreaterOrEqual},
    {"_lt_days", CompareOp::kLess},
    {"_lte_days", CompareOp::kLessOrEqual},
}};

constexpr std::array<std::pair<std::string_view, CompareOp>, 4> kCompareSuffixes = {{
    {"_gt", CompareOp::kGreater},
    {"_gte", CompareOp::kGreaterOrEqual},
    {"_lt", CompareOp::kLess},
    {"_lte", CompareOp::kLessOrEqual},
}};

// Short names used in control files for the age columns.
constexpr std::array<std::pair<std::string_view, std::string_view>, 2> kFieldAliases = {{
    {"account_age", "account_age_days"},
    {"wallet_age", "wallet_age_days"},
}};

bool EndsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

std::string NormalizeField(std::string_view field) {
    for (const auto& [alias, column] : kFieldAliases) {
        if (field == alias) {
            return std::string(column);
        }
    }
    return std::string(field);
}

std::string StripSuffix(const std::string& key, std::string_view suffix) {
    auto field = key.substr(0, key.size() - suffix.size());
    if (field.empty()) {
        throw ConfigError(fmt::format("condition '{}' has no field name", key));
    }
    return field;
}

double NumericThreshold(const controls::Condition& raw) {
    if (raw.expected_case() == controls::Condition::kLiteral) {
        const auto& literal = raw.literal();
        switch (literal.value_case()) {
            case controls::LiteralValue::kIntValue:
                return static_cast<double>(literal.int_value());
            case controls::LiteralValue::kFloatValue:
                return literal.float_value();
            case controls::LiteralValue::kStringValue:
                if (auto number = rule_utils::ParseNumber(literal.string_value())) {
                    return *number;
                }
                break;
            default:
                break;
        }
    }
    throw ConfigError(fmt::format("condition '{}' expects a numeric threshold", raw.key()));
}

std::optional<NumericCompare> TryCompileComparison(const controls::Condition& raw) {
    const auto& key = raw.key();
    for (const auto* suffixes : {&kDaySuffixes, &kCompareSuffixes}) {
        for (const auto& [suffix, op] : *suffixes) {
            if (EndsWith(key, suffix)) {
                NumericCompare compare;
                compare.field = FieldRef::Resolve(NormalizeField(StripSuffix(key, suffix)));
                compare.op = op;
                compare.threshold = NumericThreshold(raw);
                return compare;
            }
        }
    }
    return std::nullopt;
}

}  // namespace

std::string_view ToString(CompareOp op) {
    switch (op) {
        case CompareOp::kGreater:
            return ">";
        case CompareOp::kGreaterOrEqual:
            return ">=";
        case CompareOp::kLess:
            return "<";
        case CompareOp::kLessOrEqual:
            return "<=";
    }
    return "?";
}

Condition CompileCondition(const controls::Condition& raw) {
    const auto& key = raw.key();
    if (key.empty()) {
        throw ConfigError("condition with an empty key");
    }

    if (EndsWith(key, kMembershipSuffix)) {
        if (raw.expected_case() != controls::Condition::kList) {
            throw ConfigError(fmt::format("condition '{}' expects a list of values", key));
        }
        MembershipIn membership;
        membership.field = FieldRef::Resolve(StripSuffix(key, kMembershipSuffix));
        for (const auto& literal : raw.list().values()) {
            membership.values.push_back(rule_utils::LiteralExtractor::GetLiteralValue(literal));
        }
        return membership;
    }

    if (auto compare = TryCompileComparison(raw)) {
        return *std::move(compare);
    }

    if (raw.expected_case() == controls::Condition::kList) {
        throw ConfigError(fmt::format(
            "condition '{}' has a list value; only '<field>_in' keys take lists", key));
    }

    auto expected = rule_utils::LiteralExtractor::GetLiteralValue(raw.literal());
    if (const auto* flag = std::get_if<bool>(&expected)) {
        return BooleanEquals{FieldRef::Resolve(key), *flag};
    }
    if (const auto* text = std::get_if<std::string>(&expected)) {
        expected = rule_utils::ToLower(*text);
    }
    return Equals{FieldRef::Resolve(key), std::move(expected)};
}

const rule_utils::FieldRef& ConditionField(const Condition& condition) {
    return std::visit([](const auto& c) -> const rule_utils::FieldRef& { return c.field; },
                      condition);
}

}  // namespace payment_controls
