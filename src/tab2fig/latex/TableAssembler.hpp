#pragma once

#include "tab2fig/core/Sanitizer.hpp"
#include "tab2fig/latex/CellFormat.hpp"
#include "tab2fig/latex/ColumnSpec.hpp"
#include "tab2fig/latex/TableFeatures.hpp"
#include "tab2fig/latex/TableRenderer.hpp"
#include "tab2fig/theme/StyleResolver.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tab2fig {
namespace latex {

/**
 * @brief 可选的表格增强：单元格格式、脚注、表头分组、行合并
 */
struct TableExtras {
    std::vector<CellFormat> cell_formats;   // 按顺序应用，同一单元格可叠加
    std::optional<Footnote> footnote;
    std::vector<HeaderGroup> header_groups;
    std::optional<CollapseRows> collapse_rows;
};

/**
 * @brief 组装结果
 */
struct AssembledTable {
    std::string markup;
    ColumnLayout layout;
    std::vector<std::string> feature_packages;   // threeparttable / multirow / longtable
    std::vector<std::string> decimal_packages;   // siunitx
};

/**
 * @brief 表格组装器
 *
 * 严格按顺序执行：单元格格式与脚注标记 -> 渲染 -> 表头保护 -> 脚注 -> 表头分组 -> 行合并。
 * 所有配置校验在渲染之前完成。
 */
class TableAssembler {
public:
    explicit TableAssembler(std::shared_ptr<const ITableRenderer> renderer = nullptr);

    /**
     * @brief 渲染前校验配置
     * @throws ConfigurationException 表头分组跨度、合并列或脚注标记越界
     */
    void validate(const core::SanitizedTable& table, const TableExtras& extras) const;

    /**
     * @brief 组装表格
     * @throws ConfigurationException 列规格或附加配置无效
     */
    AssembledTable assemble(const core::SanitizedTable& table,
                            const theme::EffectiveStyle& style,
                            const ColumnSpec& alignment,
                            const RenderOptions& options,
                            const TableExtras& extras = TableExtras{}) const;

    const ITableRenderer& renderer() const { return *renderer_; }

private:
    static void applyCellMarks(core::SanitizedTable& table, const std::vector<CellMark>& marks);

    std::shared_ptr<const ITableRenderer> renderer_;
};

}} // namespace tab2fig::latex
