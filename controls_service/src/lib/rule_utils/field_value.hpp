#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <google/protobuf/descriptor.h>

#include <controls/control_config.pb.h>
#include <transaction/transaction.pb.h>

namespace payment_controls::rule_utils {

// std::monostate is the "missing" sentinel: an unset optional field or a
// column the batch does not carry. It never compares equal to anything.
using FieldValue = std::variant<std::monostate, std::string, double, int64_t, bool>;

inline bool IsMissing(const FieldValue& value) {
    return std::holds_alternative<std::monostate>(value);
}

// A field name resolved once against the Transaction descriptor. Names the
// typed schema does not declare are looked up in the attributes map.
struct FieldRef {
    std::string name;
    const google::protobuf::FieldDescriptor* descriptor = nullptr;

    static FieldRef Resolve(std::string name);
};

class FieldExtractor {
public:
    static FieldValue GetFieldValue(
        const transaction::Transaction& transaction,
        const FieldRef& field);
};

class LiteralExtractor {
public:
    static FieldValue GetLiteralValue(const controls::LiteralValue& literal);
};

std::string_view Trim(std::string_view s);
std::string ToLower(std::string_view s);

// Whole-string parses; surrounding whitespace is ignored.
std::optional<int64_t> ParseInteger(std::string_view text);
std::optional<double> ParseNumber(std::string_view text);

// Reads untyped text the way a CSV reader infers a scalar: integer, then
// floating point, otherwise the text itself.
FieldValue InferScalar(std::string_view text);

// Coercions used by the condition matcher. std::nullopt means the value
// cannot take part in the comparison, which is always a non-match.
std::optional<double> CoerceNumeric(const FieldValue& value);
std::optional<bool> CoerceBoolean(const FieldValue& value);
std::optional<std::string> CoerceLowerString(const FieldValue& value);

// Equality without coercion. Integer and floating point values compare
// numerically; any other mix of kinds, or a missing side, is unequal.
bool StrictEquals(const FieldValue& left, const FieldValue& right);

std::string ToString(const FieldValue& value);

// Shortest round-trip text that always reads back as floating point:
// 6000.0 -> "6000.0", 0.25 -> "0.25", 1e16 -> "1e+16".
std::string FormatDouble(double value);

}  // namespace payment_controls::rule_utils
