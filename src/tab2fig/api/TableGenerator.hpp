#pragma once

#include "tab2fig/adapters/AdapterRegistry.hpp"
#include "tab2fig/core/ErrorCode.hpp"
#include "tab2fig/core/Table.hpp"
#include "tab2fig/latex/ColumnSpec.hpp"
#include "tab2fig/latex/DocumentAssembler.hpp"
#include "tab2fig/latex/PackageSpec.hpp"
#include "tab2fig/latex/TableAssembler.hpp"
#include "tab2fig/latex/TableFeatures.hpp"
#include "tab2fig/process/ArtifactCache.hpp"
#include "tab2fig/process/CompileOrchestrator.hpp"
#include "tab2fig/process/FormatConverter.hpp"
#include "tab2fig/theme/StyleResolver.hpp"
#include "tab2fig/theme/ThemeRegistry.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tab2fig {
namespace api {

/**
 * @brief 生成选项
 *
 * 未设置的样式字段由主题决定（主题默认底纹 blue!10）。
 */
struct GenerationOptions {
    // 输出
    std::optional<std::string> filename;            // 缺省时使用表名
    std::string output_directory = "output";
    process::OutputFormat output_format = process::OutputFormat::Pdf;

    // 样式
    theme::ThemeRef theme;                          // 主题名或主题对象
    std::optional<std::string> shading_color;
    std::optional<bool> header_bold;
    std::optional<std::string> font_size;
    std::optional<bool> striped;

    // 表格
    latex::ColumnSpec alignment;
    bool longtable = false;
    std::string caption;
    std::string caption_short;
    std::string label;
    std::vector<latex::CellFormat> cell_formats;
    std::optional<latex::Footnote> footnote;
    std::vector<latex::HeaderGroup> header_groups;
    std::optional<latex::CollapseRows> collapse_rows;

    // 文档
    std::string document_class = "article";
    std::vector<latex::PackageSpec> extra_packages;

    // 编译
    bool crop = true;
    int crop_margin = 10;
    process::ToolchainOptions toolchain;
    process::ConvertOptions convert;
    bool cache = false;                             // 复用 ArtifactCache::global() 中的 PDF

    bool verbose = false;
};

/**
 * @brief 单个表格的生成结果
 */
struct GenerationResult {
    std::string name;
    std::string output;             // 主输出文件
    std::string source_path;
    std::string full_artifact;
    std::string cropped_artifact;
    process::CompileState state = process::CompileState::Prepared;
    bool cropped_missing = false;   // 裁剪失败，output 指向完整 PDF
    bool from_cache = false;        // PDF 取自缓存，未调用编译器
    std::string warning;
};

/**
 * @brief 批量生成中的一项
 */
struct BatchItem {
    std::string name;
    std::optional<GenerationResult> result;
    std::string error;
    core::ErrorCode error_code = core::ErrorCode::Ok;

    bool ok() const { return result.has_value(); }
};

/**
 * @brief 渲染完成、尚未写盘的文档
 */
struct PreparedDocument {
    std::string name;
    theme::EffectiveStyle style;
    latex::AssembledTable table;
    std::string source;
};

/**
 * @brief 表格生成管线
 *
 * 校验 -> 样式解析 -> 清理 -> 表格组装 -> 文档组装 -> 编译/裁剪 -> 格式转换。
 * 所有校验与配置错误都在写入任何文件之前抛出。
 */
class TableGenerator {
public:
    explicit TableGenerator(const theme::ThemeRegistry& registry = theme::ThemeRegistry::global(),
                            std::shared_ptr<const latex::ITableRenderer> renderer = nullptr);

    /**
     * @brief 解析输出文件名（已清理）
     */
    static std::string resolveName(const core::Table& table, const GenerationOptions& options);

    /**
     * @brief 只生成 LaTeX 文档，不写文件
     * @throws InputValidationException 表格为空或不是表格
     * @throws ConfigurationException 主题、列规格、表头分组等配置错误
     */
    PreparedDocument prepare(const core::Table& table, const GenerationOptions& options) const;

    /**
     * @brief 生成 .tex / .pdf / _cropped.pdf
     *
     * 裁剪失败不抛异常：返回完整 PDF 并设置 cropped_missing。
     *
     * @throws FilesystemException 输出目录不可创建或不可写
     * @throws ExternalToolException 工具缺失、编译失败（附带日志中的错误块）、格式转换失败
     */
    GenerationResult generate(const core::Table& table, const GenerationOptions& options) const;

    /**
     * @brief 通过适配器把统计结果转成表格再生成
     */
    GenerationResult generate(const adapters::ModelSummary& summary,
                              const GenerationOptions& options,
                              const adapters::AdapterOptions& adapter_options = adapters::AdapterOptions{},
                              const adapters::AdapterRegistry& registry = adapters::AdapterRegistry::global()) const;

    /**
     * @brief 批量生成，每个表格以其名称作为文件名
     *
     * 单个表格失败时记录错误并继续处理其余表格。
     *
     * @throws InputValidationException 列表为空
     */
    std::vector<BatchItem> generateBatch(const std::vector<std::pair<std::string, core::Table>>& tables,
                                         const GenerationOptions& options) const;

private:
    /**
     * @brief 缓存命中时写出源文件并复制缓存中的 PDF
     * @return 未命中或复制失败时返回 std::nullopt
     */
    std::optional<process::CompileResult> restoreFromCache(const process::CompileRequest& request,
                                                           const std::string& key,
                                                           const process::ToolchainOptions& toolchain) const;
    static void storeInCache(const process::CompileResult& compiled, const std::string& key);
    static std::string cacheKey(const PreparedDocument& prepared, const GenerationOptions& options);

    const theme::ThemeRegistry& registry_;
    latex::TableAssembler assembler_;
    latex::DocumentAssembler document_;
};

}} // namespace tab2fig::api
