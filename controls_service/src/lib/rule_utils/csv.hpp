#pragma once

#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace payment_controls::rule_utils {

using CsvRow = std::vector<std::string>;

struct CsvTable {
    CsvRow header;
    std::vector<CsvRow> rows;
};

// RFC 4180: comma separated, double-quoted fields may hold commas, quotes
// ("") and line breaks. Blank lines are skipped. Throws InvalidInputError on
// an unterminated quoted field.
CsvTable ParseCsv(std::istream& input);

std::string EscapeCsvField(std::string_view field);

// Appends one escaped, comma-joined line terminated by '\n'.
void AppendCsvRow(std::string& out, const CsvRow& fields);

}  // namespace payment_controls::rule_utils
