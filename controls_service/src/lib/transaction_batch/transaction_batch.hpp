#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <transaction/transaction.pb.h>

namespace payment_controls {

// Columns every batch must carry, whatever the rail.
inline constexpr std::array<std::string_view, 6> kRequiredColumns = {
    "tx_id", "rail", "timestamp", "user_id", "amount", "is_fraud_pattern"};

/**
 * TransactionBatch
 *
 * Immutable set of transaction rows with the column names they were loaded
 * from. Rows are indexed by rail (for rail-scoped evaluation) and by tx_id
 * (for joining hits back to their records). Transaction ids are unique.
 */
class TransactionBatch {
public:
    // Batches built in code carry the full typed schema as their columns.
    TransactionBatch();
    explicit TransactionBatch(std::vector<transaction::Transaction> transactions);
    TransactionBatch(std::vector<transaction::Transaction> transactions,
                     std::vector<std::string> columns);

    const std::vector<transaction::Transaction>& Transactions() const { return transactions_; }
    const std::vector<std::string>& Columns() const { return columns_; }

    std::size_t Size() const { return transactions_.size(); }
    bool Empty() const { return transactions_.empty(); }

    bool HasColumn(std::string_view column) const;

    // Row positions whose rail equals `rail`, in batch order.
    const std::vector<std::size_t>& RowsForRail(std::string_view rail) const;

    // nullptr when no row has this id on this rail.
    const transaction::Transaction* Find(std::string_view tx_id, std::string_view rail) const;

    // Names of the typed Transaction fields, attributes map excluded.
    static const std::vector<std::string>& SchemaColumns();

private:
    std::vector<transaction::Transaction> transactions_;
    std::vector<std::string> columns_;
    std::unordered_map<std::string, std::vector<std::size_t>> rows_by_rail_;
    std::unordered_map<std::string, std::size_t> row_by_tx_id_;
};

}  // namespace payment_controls
