#include "csv.hpp"

#include <iterator>

#include "rule_utils/errors.hpp"

namespace payment_controls::rule_utils {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

bool IsBlank(const CsvRow& row) {
    return row.size() == 1 && row.front().empty();
}

}  // namespace

CsvTable ParseCsv(std::istream& input) {
    const std::string data{std::istreambuf_iterator<char>(input),
                           std::istreambuf_iterator<char>()};
    std::string_view text(data);
    if (text.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
        text.remove_prefix(kUtf8Bom.size());
    }

    std::vector<CsvRow> records;
    CsvRow row;
    std::string field;
    bool in_quotes = false;
    bool row_started = false;

    auto finish_row = [&] {
        row.push_back(std::move(field));
        field.clear();
        if (!IsBlank(row)) {
            records.push_back(std::move(row));
        }
        row.clear();
        row_started = false;
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        switch (c) {
            case '"':
                in_quotes = true;
                row_started = true;
                break;
            case ',':
                row.push_back(std::move(field));
                field.clear();
                row_started = true;
                break;
            case '\r':
                if (i + 1 < text.size() && text[i + 1] == '\n') {
                    ++i;
                }
                finish_row();
                break;
            case '\n':
                finish_row();
                break;
            default:
                field += c;
                row_started = true;
                break;
        }
    }

    if (in_quotes) {
        throw InvalidInputError("CSV ends inside a quoted field");
    }
    if (row_started) {
        finish_row();
    }

    CsvTable table;
    if (records.empty()) {
        return table;
    }
    table.header = std::move(records.front());
    table.rows.assign(std::make_move_iterator(records.begin() + 1),
                      std::make_move_iterator(records.end()));
    return table;
}

std::string EscapeCsvField(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }
    std::string result;
    result.reserve(field.size() + 2);
    result += '"';
    for (char c : field) {
        if (c == '"') {
            result += '"';
        }
        result += c;
    }
    result += '"';
    return result;
}

void AppendCsvRow(std::string& out, const CsvRow& fields) {
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        out += EscapeCsvField(fields[i]);
    }
    out += '\n';
}

}  // namespace payment_controls::rule_utils
