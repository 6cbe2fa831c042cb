#pragma once

#include <string>
#include <vector>

#include "control_model/control.hpp"
#include "transaction_batch/transaction_batch.hpp"

namespace payment_controls {

// One (transaction, control) match. Never deduplicated here.
struct Hit {
    std::string tx_id;
    std::string rail;
    std::string control_id;
    std::string severity;
    std::string action;
    std::string description;
};

bool operator==(const Hit& lhs, const Hit& rhs);

class RuleEvaluator {
public:
    // Throws MissingInputError naming the first absent required column.
    static void ValidateBatch(const TransactionBatch& batch);

    // Runs one control over the rows of its own rail only.
    static std::vector<Hit> EvaluateControl(const TransactionBatch& batch, const Control& control);

    // Validates first, then evaluates every control; hits come out grouped
    // by control in declaration order.
    static std::vector<Hit> Evaluate(const TransactionBatch& batch,
                                     const std::vector<Control>& controls);
};

}  // namespace payment_controls
