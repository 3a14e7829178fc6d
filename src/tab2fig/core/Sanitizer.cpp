#include "tab2fig/core/Sanitizer.hpp"
#include "tab2fig/utils/ModuleLoggers.hpp"

#include <utf8.h>
#include <cstdint>
#include <cstring>
#include <iterator>

namespace tab2fig {
namespace core {

namespace {

bool isSafeAscii(uint32_t cp) {
    return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z') ||
           (cp >= '0' && cp <= '9') || cp == '_';
}

} // namespace

bool Sanitizer::isReserved(char c) {
    return c != '\0' && std::strchr(kReservedChars, c) != nullptr;
}

std::string Sanitizer::sanitizeColumnName(const std::string& name) {
    // 非法 UTF-8 序列先整体替换为 '_'，之后逐码点处理
    std::string valid;
    valid.reserve(name.size());
    utf8::replace_invalid(name.begin(), name.end(), std::back_inserter(valid), '_');

    std::string result;
    result.reserve(valid.size());
    auto it = valid.begin();
    while (it != valid.end()) {
        const uint32_t cp = utf8::next(it, valid.end());
        result += isSafeAscii(cp) ? static_cast<char>(cp) : '_';
    }
    return result;
}

std::vector<std::string> Sanitizer::sanitizeColumnNames(const std::vector<std::string>& names) {
    std::vector<std::string> result;
    result.reserve(names.size());
    for (const auto& name : names) {
        result.push_back(sanitizeColumnName(name));
    }
    return result;
}

std::string Sanitizer::escapeCell(const std::string& cell) {
    std::string result;
    result.reserve(cell.size() + 8);
    for (char c : cell) {
        if (isReserved(c)) {
            result += '\\';
        }
        result += c;
    }
    return result;
}

std::vector<std::vector<std::string>> Sanitizer::sanitizeTableCells(
    const std::vector<std::vector<std::string>>& cells) {
    std::vector<std::vector<std::string>> result;
    result.reserve(cells.size());
    for (const auto& row : cells) {
        std::vector<std::string> escaped;
        escaped.reserve(row.size());
        for (const auto& cell : row) {
            escaped.push_back(escapeCell(cell));
        }
        result.push_back(std::move(escaped));
    }
    return result;
}

std::string Sanitizer::sanitizeFilename(const std::string& name) {
    if (name.empty()) {
        return "table";
    }
    std::string result = name;
    for (char& c : result) {
        if (!isSafeAscii(static_cast<unsigned char>(c))) {
            c = '_';
        }
    }
    return result;
}

SanitizedTable Sanitizer::sanitizeTable(const Table& table) {
    SanitizedTable out;
    out.name = table.name();

    const auto safe_names = sanitizeColumnNames(table.columnNames());
    out.column_map.reserve(safe_names.size());
    out.header_labels.reserve(safe_names.size());
    for (size_t i = 0; i < safe_names.size(); ++i) {
        out.column_map.emplace_back(table.columnNames()[i], safe_names[i]);
        out.header_labels.push_back(escapeCell(safe_names[i]));
    }

    out.cells = sanitizeTableCells(table.rows());
    out.raw_cells = table.rows();
    out.numeric.resize(table.columnCount());
    for (size_t i = 0; i < table.columnCount(); ++i) {
        out.numeric[i] = table.isNumericColumn(i);
    }

    CORE_DEBUG("Sanitized table '{}' ({} x {})", out.name, out.rowCount(), out.columnCount());
    return out;
}

}} // namespace tab2fig::core
