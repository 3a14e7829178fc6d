#include "tab2fig/core/Table.hpp"
#include "tab2fig/core/Exception.hpp"

#include <fast_float/fast_float.h>
#include <fmt/format.h>

namespace tab2fig {
namespace core {

namespace {
std::string_view trimView(std::string_view s) {
    const size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string_view::npos) return {};
    const size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}
} // namespace

Table::Table(std::string name, std::vector<std::string> column_names)
    : name_(std::move(name))
    , column_names_(std::move(column_names))
    , numeric_(column_names_.size(), false) {
}

Table Table::fromRows(std::string name,
                      std::vector<std::string> column_names,
                      std::vector<std::vector<std::string>> rows) {
    Table table(std::move(name), std::move(column_names));
    table.rows_.reserve(rows.size());
    for (auto& row : rows) {
        table.addRow(std::move(row));
    }
    table.inferNumericColumns();
    return table;
}

void Table::addRow(std::vector<std::string> row) {
    if (row.size() != column_names_.size()) {
        TAB2FIG_THROW(InputValidationException, ErrorCode::RaggedRows,
                      fmt::format("row {} has {} cells but the table has {} columns",
                                  rows_.size() + 1, row.size(), column_names_.size()));
    }
    rows_.push_back(std::move(row));
}

bool Table::isNumericColumn(size_t col) const {
    return col < numeric_.size() && numeric_[col];
}

void Table::setNumericColumn(size_t col, bool numeric) {
    if (col >= column_names_.size()) {
        TAB2FIG_THROW(ConfigurationException, ErrorCode::InvalidArgument,
                      fmt::format("column index {} out of range ({} columns)", col, column_names_.size()));
    }
    numeric_.resize(column_names_.size(), false);
    numeric_[col] = numeric;
}

void Table::inferNumericColumns() {
    numeric_.assign(column_names_.size(), false);
    for (size_t col = 0; col < column_names_.size(); ++col) {
        bool seen_value = false;
        bool all_numeric = true;
        for (const auto& row : rows_) {
            const std::string& value = row[col];
            if (isMissing(value)) continue;
            seen_value = true;
            if (!isNumericText(value)) {
                all_numeric = false;
                break;
            }
        }
        numeric_[col] = seen_value && all_numeric;
    }
}

void Table::validate() const {
    if (column_names_.empty()) {
        TAB2FIG_THROW(InputValidationException, ErrorCode::NotTabular,
                      "input is not tabular: it has no columns");
    }
    if (rows_.empty()) {
        TAB2FIG_THROW(InputValidationException, ErrorCode::EmptyTable,
                      "input table must not be empty");
    }
}

bool Table::isMissing(std::string_view text) {
    const std::string_view t = trimView(text);
    return t.empty() || t == "NA";
}

bool Table::isNumericText(std::string_view text) {
    return parseNumber(text).has_value();
}

std::optional<double> Table::parseNumber(std::string_view text) {
    std::string_view t = trimView(text);
    if (t.empty()) return std::nullopt;
    if (t.front() == '+') t.remove_prefix(1);
    double value = 0.0;
    const auto result = fast_float::from_chars(t.data(), t.data() + t.size(), value);
    if (result.ec != std::errc() || result.ptr != t.data() + t.size()) return std::nullopt;
    return value;
}

}} // namespace tab2fig::core
