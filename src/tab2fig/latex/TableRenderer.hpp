#pragma once

#include "tab2fig/core/Sanitizer.hpp"
#include "tab2fig/latex/ColumnSpec.hpp"
#include "tab2fig/theme/StyleResolver.hpp"

#include <string>
#include <vector>

namespace tab2fig {
namespace latex {

/**
 * @brief 渲染器选项：标题、标签与跨页布局
 */
struct RenderOptions {
    std::string caption;
    std::string caption_short;   // 目录中使用的短标题
    std::string label;
    bool longtable = false;
};

/**
 * @brief 表格渲染接口
 *
 * 输入已清理的数据、最终样式与列布局，输出 LaTeX 表格代码。
 * 后续的表头保护、脚注、表头分组、行合并都基于此输出的行结构：
 * \toprule 之后第一行为表头，\midrule 与 \bottomrule 之间为数据行，
 * 每行以 \\ 结尾并独占一行。
 */
class ITableRenderer {
public:
    virtual ~ITableRenderer() = default;

    virtual std::string render(const core::SanitizedTable& table,
                               const theme::EffectiveStyle& style,
                               const ColumnLayout& layout,
                               const RenderOptions& options) const = 0;

    /**
     * @brief 渲染结果所需的导言区命令
     */
    virtual std::vector<std::string> requiredPackages(const RenderOptions& options) const = 0;
};

/**
 * @brief 默认渲染器：booktabs 线条 + \rowcolors 隔行着色
 */
class BooktabsRenderer : public ITableRenderer {
public:
    std::string render(const core::SanitizedTable& table,
                       const theme::EffectiveStyle& style,
                       const ColumnLayout& layout,
                       const RenderOptions& options) const override;

    std::vector<std::string> requiredPackages(const RenderOptions& options) const override;

private:
    static std::string formatHeaderCell(const std::string& label, bool bold);
    static std::string captionLine(const RenderOptions& options);
};

}} // namespace tab2fig::latex
