#include "transaction_loader.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <unordered_set>
#include <vector>

#include <fmt/format.h>
#include <userver/logging/log.hpp>

#include <controls/control_config.pb.h>

#include "rule_utils/csv.hpp"
#include "rule_utils/errors.hpp"
#include "rule_utils/field_value.hpp"

namespace payment_controls {

namespace {

using google::protobuf::FieldDescriptor;

std::optional<bool> ParseBooleanCell(std::string_view cell) {
    const auto normalized = rule_utils::ToLower(rule_utils::Trim(cell));
    if (normalized == "true" || normalized == "1") {
        return true;
    }
    if (normalized == "false" || normalized == "0") {
        return false;
    }
    return std::nullopt;
}

// Integer columns written by a dataframe that held nulls come out as "5967.0".
std::optional<int64_t> ParseIntegerCell(std::string_view cell) {
    if (auto integer = rule_utils::ParseInteger(cell)) {
        return integer;
    }
    auto number = rule_utils::ParseNumber(cell);
    if (!number || std::trunc(*number) != *number ||
        std::abs(*number) > static_cast<double>(std::numeric_limits<int64_t>::max() / 2)) {
        return std::nullopt;
    }
    return static_cast<int64_t>(*number);
}

// Returns false when the cell does not fit the field type.
bool SetTypedField(transaction::Transaction& tx, const FieldDescriptor* field,
                   const std::string& cell) {
    const auto* reflection = tx.GetReflection();
    switch (field->cpp_type()) {
        case FieldDescriptor::CPPTYPE_STRING:
            reflection->SetString(&tx, field, cell);
            return true;
        case FieldDescriptor::CPPTYPE_DOUBLE:
            if (auto number = rule_utils::ParseNumber(cell)) {
                reflection->SetDouble(&tx, field, *number);
                return true;
            }
            return false;
        case FieldDescriptor::CPPTYPE_INT64:
            if (auto integer = ParseIntegerCell(cell)) {
                reflection->SetInt64(&tx, field, *integer);
                return true;
            }
            return false;
        case FieldDescriptor::CPPTYPE_BOOL:
            if (auto flag = ParseBooleanCell(cell)) {
                reflection->SetBool(&tx, field, *flag);
                return true;
            }
            return false;
        default:
            return false;
    }
}

bool IsKnownRail(const std::string& rail) {
    controls::Rail parsed{};
    return controls::Rail_Parse(rail, &parsed) && parsed != controls::RAIL_UNSPECIFIED;
}

}  // namespace

TransactionBatch ParseTransactions(std::istream& input, std::string_view source_name) {
    auto table = rule_utils::ParseCsv(input);

    for (const auto required : kRequiredColumns) {
        if (std::find(table.header.begin(), table.header.end(), required) == table.header.end()) {
            throw MissingInputError(fmt::format(
                "missing required column '{}' in {}", required, source_name));
        }
    }

    std::unordered_set<std::string> seen_columns;
    std::vector<const FieldDescriptor*> fields;
    fields.reserve(table.header.size());
    for (const auto& column : table.header) {
        if (!seen_columns.insert(column).second) {
            throw InvalidInputError(fmt::format(
                "duplicate column '{}' in {}", column, source_name));
        }
        fields.push_back(rule_utils::FieldRef::Resolve(column).descriptor);
    }

    std::vector<transaction::Transaction> transactions;
    transactions.reserve(table.rows.size());
    std::size_t unknown_rail_rows = 0;

    for (std::size_t record = 0; record < table.rows.size(); ++record) {
        const auto& row = table.rows[record];
        if (row.size() != table.header.size()) {
            throw InvalidInputError(fmt::format(
                "{}: record {} has {} fields, header has {}",
                source_name, record + 1, row.size(), table.header.size()));
        }

        transaction::Transaction tx;
        for (std::size_t col = 0; col < row.size(); ++col) {
            const auto& column = table.header[col];
            const auto& cell = row[col];
            const auto* field = fields[col];
            const bool blank = rule_utils::Trim(cell).empty();

            if (field && !field->has_presence()) {
                // Required scalar: must be present and well formed.
                if (blank || !SetTypedField(tx, field, cell)) {
                    throw InvalidInputError(fmt::format(
                        "{}: record {} has {} value '{}' for required column '{}'",
                        source_name, record + 1, blank ? "an empty" : "an invalid", cell, column));
                }
                continue;
            }
            if (blank) {
                continue;
            }
            if (!field || !SetTypedField(tx, field, cell)) {
                (*tx.mutable_attributes())[column] = cell;
            }
        }

        if (!IsKnownRail(tx.rail())) {
            ++unknown_rail_rows;
        }
        transactions.push_back(std::move(tx));
    }

    if (unknown_rail_rows > 0) {
        LOG_WARNING() << unknown_rail_rows << " transaction(s) in " << source_name
                      << " carry a rail outside ACH/CARD/CRYPTO; no control applies to them";
    }

    return TransactionBatch(std::move(transactions), std::move(table.header));
}

TransactionBatch LoadTransactions(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw MissingInputError("transactions file not found: " + path);
    }
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw MissingInputError("cannot open transactions file: " + path);
    }

    auto batch = ParseTransactions(input, path);
    LOG_INFO() << "Loaded " << batch.Size() << " transactions from " << path;
    return batch;
}

}  // namespace payment_controls
