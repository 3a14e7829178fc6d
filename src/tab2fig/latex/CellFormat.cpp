#include "tab2fig/latex/CellFormat.hpp"
#include "tab2fig/core/Exception.hpp"
#include "tab2fig/core/Table.hpp"
#include "tab2fig/utils/ModuleLoggers.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace tab2fig {
namespace latex {

using core::ConfigurationException;
using core::ErrorCode;

namespace {

std::vector<size_t> resolveColumns(const CellFormat& format, const core::SanitizedTable& table) {
    std::vector<size_t> columns;
    for (size_t column : format.columns) {
        if (column == 0 || column > table.columnCount()) {
            LATEX_WARN("Column index {} is out of range (1..{}) and will be ignored", column,
                       table.columnCount());
            continue;
        }
        columns.push_back(column);
    }
    for (const auto& name : format.column_names) {
        auto it = std::find_if(table.column_map.begin(), table.column_map.end(),
                               [&name](const auto& entry) { return entry.first == name || entry.second == name; });
        if (it == table.column_map.end()) {
            LATEX_WARN("Column name '{}' not found and will be ignored", name);
            continue;
        }
        columns.push_back(static_cast<size_t>(it - table.column_map.begin()) + 1);
    }
    if (format.columns.empty() && format.column_names.empty()) {
        for (size_t i = 1; i <= table.columnCount(); ++i) columns.push_back(i);
    }
    std::sort(columns.begin(), columns.end());
    columns.erase(std::unique(columns.begin(), columns.end()), columns.end());
    return columns;
}

std::vector<size_t> resolveRows(const CellFormat& format, const core::SanitizedTable& table) {
    std::vector<size_t> rows;
    if (format.rows.empty()) {
        for (size_t i = 1; i <= table.rowCount(); ++i) rows.push_back(i);
        return rows;
    }
    for (size_t row : format.rows) {
        if (row == 0 || row > table.rowCount()) {
            LATEX_WARN("Row index {} is out of range (1..{}) and will be ignored", row, table.rowCount());
            continue;
        }
        rows.push_back(row);
    }
    std::sort(rows.begin(), rows.end());
    rows.erase(std::unique(rows.begin(), rows.end()), rows.end());
    return rows;
}

bool matches(const CellFormat& format, const core::SanitizedTable& table, size_t row, size_t column) {
    if (!format.condition) return true;
    const bool has_raw = row <= table.raw_cells.size() && column <= table.raw_cells[row - 1].size();
    const std::string& value = has_raw ? table.raw_cells[row - 1][column - 1]
                                       : table.cells[row - 1][column - 1];
    try {
        return format.condition(value);
    } catch (const std::exception& e) {
        LATEX_DEBUG("Cell condition failed at row {}, column {}: {}", row, column, e.what());
        return false;
    }
}

} // namespace

std::string CellFormat::describe() const {
    std::vector<std::string> styles;
    if (bold) styles.emplace_back("bold");
    if (italic) styles.emplace_back("italic");
    if (color) styles.push_back("color=" + *color);
    if (background) styles.push_back("background=" + *background);

    std::vector<std::string> targets;
    if (!rows.empty()) targets.push_back(fmt::format("rows {}", fmt::join(rows, ",")));
    if (!columns.empty()) targets.push_back(fmt::format("cols {}", fmt::join(columns, ",")));
    if (!column_names.empty()) targets.push_back(fmt::format("cols {}", fmt::join(column_names, ",")));
    if (targets.empty()) targets.emplace_back("all cells");

    return fmt::format("{} [{}]{}", fmt::join(targets, "; "), fmt::join(styles, ", "),
                       condition ? " (conditional)" : "");
}

CellFormat CellFormat::highlight(CellCondition condition, std::string background, bool bold,
                                 std::optional<std::string> color) {
    TAB2FIG_THROW_IF(!condition, ConfigurationException, ErrorCode::InvalidArgument,
                     "highlight requires a condition");
    CellFormat format;
    format.condition = std::move(condition);
    format.background = std::move(background);
    format.bold = bold;
    format.color = std::move(color);
    return format;
}

CellFormat CellFormat::boldColumns(std::vector<size_t> columns) {
    TAB2FIG_THROW_IF(columns.empty(), ConfigurationException, ErrorCode::InvalidArgument,
                     "boldColumns requires at least one column");
    CellFormat format;
    format.columns = std::move(columns);
    format.bold = true;
    return format;
}

CellFormat CellFormat::boldNamedColumns(std::vector<std::string> names) {
    TAB2FIG_THROW_IF(names.empty(), ConfigurationException, ErrorCode::InvalidArgument,
                     "boldNamedColumns requires at least one column");
    CellFormat format;
    format.column_names = std::move(names);
    format.bold = true;
    return format;
}

CellFormat CellFormat::italicColumns(std::vector<size_t> columns) {
    TAB2FIG_THROW_IF(columns.empty(), ConfigurationException, ErrorCode::InvalidArgument,
                     "italicColumns requires at least one column");
    CellFormat format;
    format.columns = std::move(columns);
    format.italic = true;
    return format;
}

CellFormat CellFormat::italicNamedColumns(std::vector<std::string> names) {
    TAB2FIG_THROW_IF(names.empty(), ConfigurationException, ErrorCode::InvalidArgument,
                     "italicNamedColumns requires at least one column");
    CellFormat format;
    format.column_names = std::move(names);
    format.italic = true;
    return format;
}

CellFormat CellFormat::colorRows(std::vector<size_t> rows, std::string background) {
    TAB2FIG_THROW_IF(rows.empty(), ConfigurationException, ErrorCode::InvalidArgument,
                     "colorRows requires at least one row");
    TAB2FIG_THROW_IF(background.empty(), ConfigurationException, ErrorCode::InvalidArgument,
                     "colorRows requires a background color");
    CellFormat format;
    format.rows = std::move(rows);
    format.background = std::move(background);
    return format;
}

CellCondition CellFormat::lessThan(double threshold) {
    return [threshold](const std::string& text) {
        const auto value = core::Table::parseNumber(text);
        return value && *value < threshold;
    };
}

CellCondition CellFormat::greaterThan(double threshold) {
    return [threshold](const std::string& text) {
        const auto value = core::Table::parseNumber(text);
        return value && *value > threshold;
    };
}

void validateCellFormat(const CellFormat& format) {
    TAB2FIG_THROW_IF(format.color && format.color->empty(), ConfigurationException,
                     ErrorCode::InvalidArgument, "cell format color must not be empty");
    TAB2FIG_THROW_IF(format.background && format.background->empty(), ConfigurationException,
                     ErrorCode::InvalidArgument, "cell format background must not be empty");
    if (!format.hasStyle()) {
        LATEX_WARN("Cell format {} sets no style and has no effect", format.describe());
    }
}

std::string formatCellText(const std::string& text, const CellFormat& format) {
    std::string inner = text;
    if (format.italic) inner = fmt::format("\\textit{{{}}}", inner);
    if (format.bold) inner = fmt::format("\\textbf{{{}}}", inner);
    if (format.color) inner = fmt::format("\\textcolor{{{}}}{{{}}}", *format.color, inner);

    std::string out = "{" + inner + "}";
    if (format.background) out = fmt::format("\\cellcolor{{{}}}{}", *format.background, out);
    return out;
}

size_t applyCellFormats(core::SanitizedTable& table, const std::vector<CellFormat>& formats) {
    size_t formatted = 0;
    for (const CellFormat& format : formats) {
        if (!format.hasStyle()) continue;
        const auto rows = resolveRows(format, table);
        const auto columns = resolveColumns(format, table);
        size_t count = 0;
        for (size_t row : rows) {
            for (size_t column : columns) {
                if (!matches(format, table, row, column)) continue;
                std::string& cell = table.cells[row - 1][column - 1];
                cell = formatCellText(cell, format);
                ++count;
            }
        }
        LATEX_DEBUG("Cell format {} applied to {} cell(s)", format.describe(), count);
        formatted += count;
    }
    return formatted;
}

}} // namespace tab2fig::latex
