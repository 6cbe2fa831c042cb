#pragma once

#include <istream>
#include <string>
#include <string_view>

#include "transaction_batch/transaction_batch.hpp"

namespace payment_controls {

// Reads the unified transaction CSV. Throws MissingInputError when the file
// or a required column is absent and InvalidInputError when a required cell
// is empty or malformed, a record is ragged, or a tx_id repeats.
TransactionBatch LoadTransactions(const std::string& path);

// `source_name` only labels error messages and logs.
TransactionBatch ParseTransactions(std::istream& input, std::string_view source_name);

}  // namespace payment_controls
