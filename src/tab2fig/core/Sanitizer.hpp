#pragma once

#include "tab2fig/core/Table.hpp"

#include <string>
#include <utility>
#include <vector>

namespace tab2fig {
namespace core {

/**
 * @brief 经过转义、可以直接交给渲染器的表格
 */
struct SanitizedTable {
    std::string name;
    std::vector<std::pair<std::string, std::string>> column_map;  // 原始列名 -> 安全列名，保持顺序
    std::vector<std::string> header_labels;                       // 已转义的表头文本
    std::vector<std::vector<std::string>> cells;                  // 已转义的单元格
    std::vector<std::vector<std::string>> raw_cells;              // 转义前的单元格，供条件格式判断
    std::vector<bool> numeric;

    size_t columnCount() const { return column_map.size(); }
    size_t rowCount() const { return cells.size(); }
};

/**
 * @brief LaTeX 输入清理工具
 *
 * 所有函数都是纯函数：相同输入总是得到相同输出。
 */
class Sanitizer {
public:
    /// LaTeX 保留字符集合
    static constexpr const char* kReservedChars = "#%&$_{}~^\\";

    /**
     * @brief 清理列名：[A-Za-z0-9_] 以外的每个码点替换为 '_'
     *
     * 按 UTF-8 码点处理，因此 "é" 只产生一个 '_'。
     * 数量与顺序不变，重复结果不去重。
     */
    static std::vector<std::string> sanitizeColumnNames(const std::vector<std::string>& names);
    static std::string sanitizeColumnName(const std::string& name);

    /**
     * @brief 转义单元格文本：保留字符前加反斜杠，其余字符不变
     */
    static std::string escapeCell(const std::string& cell);
    static std::vector<std::vector<std::string>> sanitizeTableCells(
        const std::vector<std::vector<std::string>>& cells);

    /**
     * @brief 清理文件名：[A-Za-z0-9_] 以外的字符替换为 '_'，空输入返回 "table"
     */
    static std::string sanitizeFilename(const std::string& name);

    /**
     * @brief 一次完成列名与单元格的清理
     */
    static SanitizedTable sanitizeTable(const Table& table);

    static bool isReserved(char c);
};

}} // namespace tab2fig::core
