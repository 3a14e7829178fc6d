#pragma once

#include "tab2fig/core/Sanitizer.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tab2fig {
namespace latex {

/// 单元格条件：参数为转义前的单元格文本
using CellCondition = std::function<bool(const std::string&)>;

/**
 * @brief 单元格格式规则
 *
 * rows 与 columns 从 1 开始（rows 不含表头），留空表示全部。
 * 列既可以按序号也可以按原始列名指定，两者取并集。
 * 设置了 condition 时只格式化条件为真的单元格。
 *
 * @code
 * auto rule = CellFormat::highlight(CellFormat::lessThan(0.05));
 * rule.column_names = {"p.value"};
 * rule.bold = true;
 * @endcode
 */
struct CellFormat {
    std::vector<size_t> rows;
    std::vector<size_t> columns;
    std::vector<std::string> column_names;

    bool bold = false;
    bool italic = false;
    std::optional<std::string> color;        // 文字颜色，\textcolor
    std::optional<std::string> background;   // 单元格底色，\cellcolor

    CellCondition condition;

    bool hasStyle() const { return bold || italic || color || background; }

    /**
     * @brief 可读的规则描述，用于日志
     */
    std::string describe() const;

    static CellFormat highlight(CellCondition condition,
                                std::string background = "yellow!30",
                                bool bold = false,
                                std::optional<std::string> color = std::nullopt);

    /**
     * @throws ConfigurationException 列为空
     */
    static CellFormat boldColumns(std::vector<size_t> columns);
    static CellFormat boldNamedColumns(std::vector<std::string> names);
    static CellFormat italicColumns(std::vector<size_t> columns);
    static CellFormat italicNamedColumns(std::vector<std::string> names);

    /**
     * @throws ConfigurationException 行为空或底色为空
     */
    static CellFormat colorRows(std::vector<size_t> rows, std::string background);

    /// 数值严格小于 threshold 的单元格；非数字不匹配
    static CellCondition lessThan(double threshold);
    /// 数值严格大于 threshold 的单元格；非数字不匹配
    static CellCondition greaterThan(double threshold);
};

/**
 * @brief 校验格式规则本身（颜色非空、序号从 1 开始）
 * @throws ConfigurationException
 */
void validateCellFormat(const CellFormat& format);

/**
 * @brief 给单元格文本套上格式命令
 *
 * 顺序为 \cellcolor、\textcolor、\textbf、\textit；文本部分总是放在花括号中，
 * siunitx 的 S 列因此按文本处理。
 */
std::string formatCellText(const std::string& text, const CellFormat& format);

/**
 * @brief 按顺序把所有规则应用到已清理表格的单元格上
 *
 * 超出范围的行列以及找不到的列名被忽略并记录警告；
 * condition 抛出 std::exception 时该单元格视为不匹配。
 *
 * @return 实际被格式化的单元格数量
 */
size_t applyCellFormats(core::SanitizedTable& table, const std::vector<CellFormat>& formats);

}} // namespace tab2fig::latex
