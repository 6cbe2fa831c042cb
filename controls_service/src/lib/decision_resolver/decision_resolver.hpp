#pragma once

#include <string>
#include <vector>

#include <controls/control_config.pb.h>

#include "rule_evaluator/rule_evaluator.hpp"
#include "transaction_batch/transaction_batch.hpp"

namespace payment_controls {

struct Decision {
    std::string tx_id;
    std::string rail;
    std::string timestamp;
    std::string user_id;
    double amount = 0.0;
    bool is_fraud_pattern = false;
    controls::Action final_action = controls::ALLOW;
    std::vector<std::string> triggered_controls;  // unique, sorted
    std::vector<std::string> triggered_actions;   // unique, sorted
};

// "a, b, c"
std::string JoinTriggered(const std::vector<std::string>& values);

/**
 * DecisionResolver
 *
 * Strict priority override: the final action is the highest-priority action
 * among a transaction's hits (ALLOW < REVIEW < BLOCK). Hits never add up, so
 * any number of REVIEW hits stays REVIEW and a single BLOCK hit wins.
 */
class DecisionResolver {
public:
    // ALLOW for an empty list; unrecognized actions rank as ALLOW.
    static controls::Action ResolveFinalAction(const std::vector<std::string>& actions);

    // One decision per batch row, in batch order. Rows without hits resolve
    // to ALLOW with empty triggered lists.
    static std::vector<Decision> Resolve(const TransactionBatch& batch,
                                         const std::vector<Hit>& hits);
};

}  // namespace payment_controls
