#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace tab2fig {
namespace latex {

// ========== 脚注 ==========

enum class NoteType : uint8_t {
    Number,     // 1 2 3
    Alphabet,   // a b c
    Symbol      // * \dag \ddag \S \P
};

/**
 * @brief 给单元格标记脚注
 *
 * row 为 0 表示表头，1 起为数据行；column 从 1 开始；index 为该类脚注中的序号（从 1 开始）。
 */
struct CellMark {
    size_t row = 0;
    size_t column = 1;
    NoteType type = NoteType::Number;
    size_t index = 1;
};

/**
 * @brief 表格脚注
 */
struct Footnote {
    std::vector<std::string> general;
    std::vector<std::string> number;
    std::vector<std::string> alphabet;
    std::vector<std::string> symbol;

    std::string general_title = "Note: ";
    std::string number_title;
    std::string alphabet_title;
    std::string symbol_title;

    bool as_chunk = false;          // 同类脚注合并为一段
    bool threeparttable = true;     // 使用 threeparttable/tablenotes 包裹

    std::vector<CellMark> marks;

    bool empty() const {
        return general.empty() && number.empty() && alphabet.empty() && symbol.empty();
    }
};

/**
 * @brief 返回第 index 个（从 1 开始）脚注标记
 *
 * 字母与符号用尽后按轮次重复：aa bb ...，** \dag\dag ...
 */
std::string footnoteMarker(NoteType type, size_t index);

/**
 * @brief 在文本后追加上标脚注标记
 */
std::string markCell(const std::string& text, size_t index, NoteType type);

// ========== 表头分组 ==========

/**
 * @brief 表头上方的分组行，span 之和必须等于列数
 */
struct HeaderGroup {
    std::vector<std::pair<std::string, size_t>> spans;
    bool bold = true;
    bool italic = false;
    std::string align = "c";
    bool rule = true;               // 非空标签下方画 \cmidrule

    HeaderGroup() = default;
    HeaderGroup(std::initializer_list<std::pair<std::string, size_t>> groups) : spans(groups) {}

    size_t totalSpan() const;
};

/**
 * @brief 校验每个分组行的跨度之和
 * @throws ConfigurationException 跨度之和与列数不同
 */
void validateHeaderGroups(const std::vector<HeaderGroup>& groups, size_t column_count);

// ========== 行合并 ==========

enum class VerticalAlign : uint8_t {
    Top,
    Middle,
    Bottom
};

enum class CollapseRule : uint8_t {
    Full,       // 每个分组边界画 \cmidrule
    Major,      // 仅第一合并列的分组边界画 \midrule
    None
};

struct CollapseRows {
    std::vector<size_t> columns;    // 从 1 开始
    VerticalAlign valign = VerticalAlign::Top;
    CollapseRule rule = CollapseRule::Full;
};

void validateCollapseRows(const CollapseRows& collapse, size_t column_count);

// ========== 标记后处理 ==========

/**
 * @brief 按未转义的 & 拆分一行表格内容（保留各单元格两侧空白）
 */
std::vector<std::string> splitRowCells(const std::string& row);

/**
 * @brief 给指定列（从 1 开始）的表头单元格加一层花括号
 *
 * 其它单元格与其余所有行保持逐字节不变。
 */
std::string protectHeader(const std::string& markup, const std::vector<size_t>& columns);

/**
 * @brief 注入脚注：threeparttable + tablenotes，或 \multicolumn 注释行
 */
std::string injectFootnote(const std::string& markup, const Footnote& footnote, size_t column_count);

/**
 * @brief 在表头上方插入分组行；后插入的分组位于更上方
 */
std::string insertHeaderGroups(const std::string& markup, const std::vector<HeaderGroup>& groups,
                               size_t column_count);

/**
 * @brief 合并指定列中相邻的相同单元格（\multirow）
 */
std::string collapseRows(const std::string& markup, const CollapseRows& collapse, size_t column_count);

}} // namespace tab2fig::latex
