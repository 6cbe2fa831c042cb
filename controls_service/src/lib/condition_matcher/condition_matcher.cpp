#include "condition_matcher.hpp"

#include <algorithm>
#include <type_traits>

namespace payment_controls {

using rule_utils::FieldExtractor;

bool ConditionMatcher::Matches(const transaction::Transaction& transaction,
                               const Condition& condition) {
    return std::visit([&transaction](const auto& c) -> bool {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, Equals>) {
            return EvaluateEquals(transaction, c);
        } else if constexpr (std::is_same_v<T, MembershipIn>) {
            return EvaluateMembership(transaction, c);
        } else if constexpr (std::is_same_v<T, NumericCompare>) {
            return EvaluateNumeric(transaction, c);
        } else {
            return EvaluateBoolean(transaction, c);
        }
    }, condition);
}

bool ConditionMatcher::MatchesAll(const transaction::Transaction& transaction,
                                  const std::vector<Condition>& conditions) {
    for (const auto& condition : conditions) {
        if (!Matches(transaction, condition)) {
            return false;
        }
    }
    return true;
}

std::vector<bool> ConditionMatcher::MatchRows(const TransactionBatch& batch,
                                              const std::vector<std::size_t>& rows,
                                              const std::vector<Condition>& conditions) {
    const auto& transactions = batch.Transactions();
    std::vector<bool> mask;
    mask.reserve(rows.size());
    for (const auto row : rows) {
        mask.push_back(MatchesAll(transactions.at(row), conditions));
    }
    return mask;
}

bool ConditionMatcher::EvaluateEquals(const transaction::Transaction& transaction,
                                      const Equals& condition) {
    if (rule_utils::IsMissing(condition.expected)) {
        return false;
    }
    const auto value = FieldExtractor::GetFieldValue(transaction, condition.field);
    if (const auto* expected = std::get_if<std::string>(&condition.expected)) {
        const auto actual = rule_utils::CoerceLowerString(value);
        return actual && *actual == *expected;
    }
    return rule_utils::StrictEquals(value, condition.expected);
}

bool ConditionMatcher::EvaluateMembership(const transaction::Transaction& transaction,
                                          const MembershipIn& condition) {
    const auto value = FieldExtractor::GetFieldValue(transaction, condition.field);
    if (rule_utils::IsMissing(value)) {
        return false;
    }
    return std::any_of(condition.values.begin(), condition.values.end(),
                       [&value](const auto& candidate) {
                           return rule_utils::StrictEquals(value, candidate);
                       });
}

bool ConditionMatcher::EvaluateNumeric(const transaction::Transaction& transaction,
                                       const NumericCompare& condition) {
    const auto value = rule_utils::CoerceNumeric(
        FieldExtractor::GetFieldValue(transaction, condition.field));
    if (!value) {
        return false;
    }
    // NaN fails every ordered comparison below.
    switch (condition.op) {
        case CompareOp::kGreater:
            return *value > condition.threshold;
        case CompareOp::kGreaterOrEqual:
            return *value >= condition.threshold;
        case CompareOp::kLess:
            return *value < condition.threshold;
        case CompareOp::kLessOrEqual:
            return *value <= condition.threshold;
    }
    return false;
}

bool ConditionMatcher::EvaluateBoolean(const transaction::Transaction& transaction,
                                       const BooleanEquals& condition) {
    const auto value = rule_utils::CoerceBoolean(
        FieldExtractor::GetFieldValue(transaction, condition.field));
    return value && *value == condition.expected;
}

}  // namespace payment_controls
