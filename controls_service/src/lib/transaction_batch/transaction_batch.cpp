#include "transaction_batch.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "rule_utils/errors.hpp"

namespace payment_controls {

TransactionBatch::TransactionBatch()
    : TransactionBatch(std::vector<transaction::Transaction>{}) {}

TransactionBatch::TransactionBatch(std::vector<transaction::Transaction> transactions)
    : TransactionBatch(std::move(transactions), SchemaColumns()) {}

TransactionBatch::TransactionBatch(
    std::vector<transaction::Transaction> transactions,
    std::vector<std::string> columns)
    : transactions_(std::move(transactions))
    , columns_(std::move(columns)) {
    row_by_tx_id_.reserve(transactions_.size());
    for (std::size_t row = 0; row < transactions_.size(); ++row) {
        const auto& tx = transactions_[row];
        auto [it, inserted] = row_by_tx_id_.emplace(tx.tx_id(), row);
        if (!inserted) {
            throw InvalidInputError(fmt::format(
                "duplicate tx_id '{}' (records {} and {})", tx.tx_id(), it->second + 1, row + 1));
        }
        rows_by_rail_[tx.rail()].push_back(row);
    }
}

bool TransactionBatch::HasColumn(std::string_view column) const {
    return std::find(columns_.begin(), columns_.end(), column) != columns_.end();
}

const std::vector<std::size_t>& TransactionBatch::RowsForRail(std::string_view rail) const {
    static const std::vector<std::size_t> kNoRows;
    auto it = rows_by_rail_.find(std::string(rail));
    return it == rows_by_rail_.end() ? kNoRows : it->second;
}

const transaction::Transaction* TransactionBatch::Find(
    std::string_view tx_id, std::string_view rail) const {
    auto it = row_by_tx_id_.find(std::string(tx_id));
    if (it == row_by_tx_id_.end()) {
        return nullptr;
    }
    const auto& tx = transactions_[it->second];
    return tx.rail() == rail ? &tx : nullptr;
}

const std::vector<std::string>& TransactionBatch::SchemaColumns() {
    static const std::vector<std::string> kColumns = [] {
        std::vector<std::string> columns;
        const auto* descriptor = transaction::Transaction::descriptor();
        for (int i = 0; i < descriptor->field_count(); ++i) {
            const auto* field = descriptor->field(i);
            if (!field->is_map()) {
                columns.push_back(std::string(field->name()));
            }
        }
        return columns;
    }();
    return kColumns;
}

}  // namespace payment_controls
