#pragma once

#include "tab2fig/process/ProcessRunner.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tab2fig {
namespace process {

enum class OutputFormat {
    Pdf,
    Png,
    Svg,
    Tex
};

const char* toString(OutputFormat format);

/**
 * @brief 解析格式名（不区分大小写）
 * @throws ConfigurationException 未知格式
 */
OutputFormat parseOutputFormat(const std::string& text);

struct ConvertOptions {
    int dpi = 300;
    std::string raster_tool = "convert";        // ImageMagick
    std::string svg_tool = "pdf2svg";
    std::string svg_fallback_tool = "inkscape";
    std::optional<std::chrono::milliseconds> timeout;
};

/**
 * @brief 把 PDF 转换为其他格式
 *
 * png 使用 ImageMagick，svg 优先 pdf2svg，不可用时退回 inkscape。
 */
class FormatConverter {
public:
    explicit FormatConverter(ConvertOptions options = ConvertOptions{})
        : options_(std::move(options)) {}

    /**
     * @brief 转换文件
     * @param pdf_path 输入 PDF
     * @param format 目标格式；Pdf 原样返回，Tex 返回 tex_path
     * @param tex_path 对应的 LaTeX 源文件
     * @return 输出文件路径
     * @throws ExternalToolException 工具缺失、失败或未生成输出
     */
    std::string convert(const std::string& pdf_path, OutputFormat format,
                        const std::string& tex_path = "") const;

    /**
     * @brief 目标文件路径：与输入同名，扩展名替换
     */
    static std::string outputPath(const std::string& pdf_path, OutputFormat format);

private:
    std::string toPng(const std::string& input) const;
    std::string toSvg(const std::string& input) const;
    void runTool(const std::string& tool, const std::vector<std::string>& args,
                 const std::string& output) const;

    ConvertOptions options_;
    ProcessRunner runner_;
};

}} // namespace tab2fig::process
