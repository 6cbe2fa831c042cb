#include "field_value.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

namespace payment_controls::rule_utils {

FieldRef FieldRef::Resolve(std::string name) {
    FieldRef ref;
    const auto* descriptor =
        transaction::Transaction::descriptor()->FindFieldByName(name);
    if (descriptor && !descriptor->is_repeated() &&
        descriptor->cpp_type() != google::protobuf::FieldDescriptor::CPPTYPE_MESSAGE) {
        ref.descriptor = descriptor;
    }
    ref.name = std::move(name);
    return ref;
}

FieldValue FieldExtractor::GetFieldValue(
    const transaction::Transaction& transaction,
    const FieldRef& field) {
    using google::protobuf::FieldDescriptor;

    const auto* descriptor = field.descriptor;
    if (descriptor) {
        const auto* reflection = transaction.GetReflection();
        if (!descriptor->has_presence() || reflection->HasField(transaction, descriptor)) {
            switch (descriptor->cpp_type()) {
                case FieldDescriptor::CPPTYPE_STRING:
                    return reflection->GetString(transaction, descriptor);
                case FieldDescriptor::CPPTYPE_DOUBLE:
                    return reflection->GetDouble(transaction, descriptor);
                case FieldDescriptor::CPPTYPE_FLOAT:
                    return static_cast<double>(reflection->GetFloat(transaction, descriptor));
                case FieldDescriptor::CPPTYPE_INT64:
                    return static_cast<int64_t>(reflection->GetInt64(transaction, descriptor));
                case FieldDescriptor::CPPTYPE_INT32:
                    return static_cast<int64_t>(reflection->GetInt32(transaction, descriptor));
                case FieldDescriptor::CPPTYPE_UINT32:
                    return static_cast<int64_t>(reflection->GetUInt32(transaction, descriptor));
                case FieldDescriptor::CPPTYPE_BOOL:
                    return reflection->GetBool(transaction, descriptor);
                default:
                    return std::monostate{};
            }
        }
    }

    // Untyped column, or a typed cell the loader could not parse.
    const auto& attributes = transaction.attributes();
    auto it = attributes.find(field.name);
    if (it == attributes.end()) {
        return std::monostate{};
    }
    return InferScalar(it->second);
}

FieldValue LiteralExtractor::GetLiteralValue(const controls::LiteralValue& literal) {
    switch (literal.value_case()) {
        case controls::LiteralValue::kStringValue:
            return literal.string_value();
        case controls::LiteralValue::kFloatValue:
            return literal.float_value();
        case controls::LiteralValue::kIntValue:
            return static_cast<int64_t>(literal.int_value());
        case controls::LiteralValue::kBoolValue:
            return literal.bool_value();
        default:
            return std::monostate{};
    }
}

std::string_view Trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string ToLower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::optional<int64_t> ParseInteger(std::string_view text) {
    const std::string trimmed(Trim(text));
    if (trimmed.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    const long long value = std::strtoll(trimmed.c_str(), &end, 10);
    if (errno == ERANGE || end != trimmed.c_str() + trimmed.size()) {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

std::optional<double> ParseNumber(std::string_view text) {
    const std::string trimmed(Trim(text));
    if (trimmed.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    const double value = std::strtod(trimmed.c_str(), &end);
    if (end != trimmed.c_str() + trimmed.size()) {
        return std::nullopt;
    }
    return value;
}

FieldValue InferScalar(std::string_view text) {
    if (auto integer = ParseInteger(text)) {
        return *integer;
    }
    if (auto number = ParseNumber(text)) {
        return *number;
    }
    return std::string(text);
}

std::optional<double> CoerceNumeric(const FieldValue& value) {
    return std::visit([](const auto& v) -> std::optional<double> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, double>) {
            return v;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return static_cast<double>(v);
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? 1.0 : 0.0;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return ParseNumber(v);
        } else {
            return std::nullopt;
        }
    }, value);
}

std::optional<bool> CoerceBoolean(const FieldValue& value) {
    if (const auto* flag = std::get_if<bool>(&value)) {
        return *flag;
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        const auto normalized = ToLower(Trim(*text));
        if (normalized == "true") {
            return true;
        }
        if (normalized == "false") {
            return false;
        }
    }
    return std::nullopt;
}

std::optional<std::string> CoerceLowerString(const FieldValue& value) {
    if (IsMissing(value)) {
        return std::nullopt;
    }
    return ToLower(ToString(value));
}

bool StrictEquals(const FieldValue& left, const FieldValue& right) {
    return std::visit([](const auto& l, const auto& r) -> bool {
        using L = std::decay_t<decltype(l)>;
        using R = std::decay_t<decltype(r)>;
        constexpr bool kLeftNumeric = std::is_same_v<L, double> || std::is_same_v<L, int64_t>;
        constexpr bool kRightNumeric = std::is_same_v<R, double> || std::is_same_v<R, int64_t>;
        if constexpr (std::is_same_v<L, int64_t> && std::is_same_v<R, int64_t>) {
            return l == r;
        } else if constexpr (kLeftNumeric && kRightNumeric) {
            return static_cast<double>(l) == static_cast<double>(r);
        } else if constexpr (std::is_same_v<L, std::string> && std::is_same_v<R, std::string>) {
            return l == r;
        } else if constexpr (std::is_same_v<L, bool> && std::is_same_v<R, bool>) {
            return l == r;
        } else {
            return false;
        }
    }, left, right);
}

std::string ToString(const FieldValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::monostate>) {
            return "";
        } else if constexpr (std::is_same_v<T, double>) {
            return FormatDouble(v);
        } else {
            return fmt::format("{}", v);
        }
    }, value);
}

std::string FormatDouble(double value) {
    auto text = fmt::format("{}", value);
    if (std::isfinite(value) && text.find_first_of(".e") == std::string::npos) {
        text += ".0";
    }
    return text;
}

}  // namespace payment_controls::rule_utils
