#pragma once

#include <cstddef>
#include <vector>

#include <transaction/transaction.pb.h>

#include "condition/condition.hpp"
#include "transaction_batch/transaction_batch.hpp"

namespace payment_controls {

/**
 * ConditionMatcher
 *
 * Evaluates compiled conditions against transaction rows. Fail-closed: a
 * missing field or a value that cannot be coerced for the comparison makes
 * that condition false, never an error.
 */
class ConditionMatcher {
public:
    static bool Matches(const transaction::Transaction& transaction, const Condition& condition);

    // Logical AND; an empty condition list matches every row.
    static bool MatchesAll(const transaction::Transaction& transaction,
                           const std::vector<Condition>& conditions);

    // One flag per entry of `rows` (positions into `batch`), in that order.
    static std::vector<bool> MatchRows(const TransactionBatch& batch,
                                       const std::vector<std::size_t>& rows,
                                       const std::vector<Condition>& conditions);

private:
    static bool EvaluateEquals(const transaction::Transaction& transaction, const Equals& condition);
    static bool EvaluateMembership(const transaction::Transaction& transaction,
                                   const MembershipIn& condition);
    static bool EvaluateNumeric(const transaction::Transaction& transaction,
                                const NumericCompare& condition);
    static bool EvaluateBoolean(const transaction::Transaction& transaction,
                                const BooleanEquals& condition);
};

}  // namespace payment_controls
