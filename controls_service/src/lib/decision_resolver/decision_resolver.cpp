#include "decision_resolver.hpp"

#include <set>
#include <unordered_map>

#include "control_model/control.hpp"

namespace payment_controls {

namespace {

struct TriggeredSets {
    std::set<std::string> controls;
    std::set<std::string> actions;
};

}  // namespace

std::string JoinTriggered(const std::vector<std::string>& values) {
    std::string result;
    for (const auto& value : values) {
        if (!result.empty()) {
            result += ", ";
        }
        result += value;
    }
    return result;
}

controls::Action DecisionResolver::ResolveFinalAction(const std::vector<std::string>& actions) {
    auto final_action = controls::ALLOW;
    for (const auto& action : actions) {
        const auto parsed = ParseAction(action);
        if (parsed > final_action) {
            final_action = parsed;
        }
    }
    return final_action;
}

std::vector<Decision> DecisionResolver::Resolve(const TransactionBatch& batch,
                                                const std::vector<Hit>& hits) {
    std::unordered_map<std::string, TriggeredSets> triggered;
    for (const auto& hit : hits) {
        auto& sets = triggered[hit.tx_id];
        sets.controls.insert(hit.control_id);
        sets.actions.insert(hit.action);
    }

    std::vector<Decision> decisions;
    decisions.reserve(batch.Size());
    for (const auto& tx : batch.Transactions()) {
        Decision decision;
        decision.tx_id = tx.tx_id();
        decision.rail = tx.rail();
        decision.timestamp = tx.timestamp();
        decision.user_id = tx.user_id();
        decision.amount = tx.amount();
        decision.is_fraud_pattern = tx.is_fraud_pattern();

        auto it = triggered.find(tx.tx_id());
        if (it != triggered.end()) {
            decision.triggered_controls.assign(it->second.controls.begin(), it->second.controls.end());
            decision.triggered_actions.assign(it->second.actions.begin(), it->second.actions.end());
            decision.final_action = ResolveFinalAction(decision.triggered_actions);
        }
        decisions.push_back(std::move(decision));
    }
    return decisions;
}

}  // namespace payment_controls
