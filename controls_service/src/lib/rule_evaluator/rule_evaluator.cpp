#include "rule_evaluator.hpp"

#include <iterator>

#include <fmt/format.h>
#include <userver/logging/log.hpp>

#include "condition_matcher/condition_matcher.hpp"
#include "rule_utils/errors.hpp"

namespace payment_controls {

bool operator==(const Hit& lhs, const Hit& rhs) {
    return lhs.tx_id == rhs.tx_id && lhs.rail == rhs.rail &&
           lhs.control_id == rhs.control_id && lhs.severity == rhs.severity &&
           lhs.action == rhs.action && lhs.description == rhs.description;
}

void RuleEvaluator::ValidateBatch(const TransactionBatch& batch) {
    for (const auto column : kRequiredColumns) {
        if (!batch.HasColumn(column)) {
            throw MissingInputError(fmt::format("missing required column '{}' in transaction batch", column));
        }
    }
}

std::vector<Hit> RuleEvaluator::EvaluateControl(const TransactionBatch& batch,
                                                const Control& control) {
    const auto rail = RailName(control.rail);
    const auto& rows = batch.RowsForRail(rail);
    if (rows.empty()) {
        LOG_INFO() << "Control " << control.control_id << " skipped: no " << rail << " transactions";
        return {};
    }

    const auto mask = ConditionMatcher::MatchRows(batch, rows, control.conditions);
    const auto& transactions = batch.Transactions();

    std::vector<Hit> hits;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (!mask[i]) {
            continue;
        }
        const auto& tx = transactions[rows[i]];
        hits.push_back(Hit{tx.tx_id(), tx.rail(), control.control_id, control.severity,
                           control.action, control.description});
    }

    LOG_DEBUG() << "Control " << control.control_id << " hit " << hits.size()
                << " of " << rows.size() << " " << rail << " transactions";
    return hits;
}

std::vector<Hit> RuleEvaluator::Evaluate(const TransactionBatch& batch,
                                         const std::vector<Control>& controls) {
    ValidateBatch(batch);

    std::vector<Hit> hits;
    for (const auto& control : controls) {
        auto control_hits = EvaluateControl(batch, control);
        hits.insert(hits.end(), std::make_move_iterator(control_hits.begin()),
                    std::make_move_iterator(control_hits.end()));
    }
    return hits;
}

}  // namespace payment_controls
