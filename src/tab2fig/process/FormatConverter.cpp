#include "tab2fig/process/FormatConverter.hpp"
#include "tab2fig/core/Exception.hpp"
#include "tab2fig/core/Path.hpp"
#include "tab2fig/utils/ModuleLoggers.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace tab2fig {
namespace process {

const char* toString(OutputFormat format) {
    switch (format) {
        case OutputFormat::Pdf: return "pdf";
        case OutputFormat::Png: return "png";
        case OutputFormat::Svg: return "svg";
        case OutputFormat::Tex: return "tex";
    }
    return "pdf";
}

OutputFormat parseOutputFormat(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "pdf") return OutputFormat::Pdf;
    if (lower == "png") return OutputFormat::Png;
    if (lower == "svg") return OutputFormat::Svg;
    if (lower == "tex") return OutputFormat::Tex;
    TAB2FIG_THROW(core::ConfigurationException, core::ErrorCode::InvalidArgument,
                  fmt::format("Unknown output format '{}'. Expected pdf, png, svg or tex", text));
}

std::string FormatConverter::outputPath(const std::string& pdf_path, OutputFormat format) {
    return core::Path(pdf_path).withExtension(std::string(".") + toString(format)).string();
}

std::string FormatConverter::convert(const std::string& pdf_path, OutputFormat format,
                                     const std::string& tex_path) const {
    switch (format) {
        case OutputFormat::Pdf:
            return pdf_path;
        case OutputFormat::Tex:
            return tex_path;
        case OutputFormat::Png:
            return toPng(pdf_path);
        case OutputFormat::Svg:
            return toSvg(pdf_path);
    }
    return pdf_path;
}

std::string FormatConverter::toPng(const std::string& input) const {
    const std::string output = outputPath(input, OutputFormat::Png);
    runTool(options_.raster_tool,
            {"-density", std::to_string(options_.dpi), "-background", "white", "-flatten", input, output},
            output);
    return output;
}

std::string FormatConverter::toSvg(const std::string& input) const {
    const std::string output = outputPath(input, OutputFormat::Svg);
    if (ProcessRunner::isAvailable(options_.svg_tool)) {
        runTool(options_.svg_tool, {input, output}, output);
    } else if (ProcessRunner::isAvailable(options_.svg_fallback_tool)) {
        PROC_DEBUG("{} not found, falling back to {}", options_.svg_tool, options_.svg_fallback_tool);
        runTool(options_.svg_fallback_tool, {"--export-filename", output, input}, output);
    } else {
        throw core::ExternalToolException(
            fmt::format("No SVG converter found (tried {} and {})", options_.svg_tool,
                        options_.svg_fallback_tool),
            options_.svg_tool, -1, "", core::ErrorCode::ToolNotFound, __FILE__, __LINE__);
    }
    return output;
}

void FormatConverter::runTool(const std::string& tool, const std::vector<std::string>& args,
                              const std::string& output) const {
    if (!ProcessRunner::isAvailable(tool)) {
        throw core::ExternalToolException(fmt::format("Conversion tool '{}' not found on PATH", tool),
                                          tool, -1, "", core::ErrorCode::ToolNotFound, __FILE__, __LINE__);
    }

    PROC_DEBUG("Converting: {}", formatCommandLine(tool, args));
    const ProcessResult result = runner_.run(tool, args, options_.timeout);
    if (result.timed_out) {
        throw core::ExternalToolException(fmt::format("'{}' timed out", tool), tool, -1, result.output,
                                          core::ErrorCode::ToolTimeout, __FILE__, __LINE__);
    }
    if (!result.succeeded()) {
        throw core::ExternalToolException(
            fmt::format("'{}' failed with exit code {}", tool, result.exit_code), tool, result.exit_code,
            result.spawned ? result.output : result.spawn_error, core::ErrorCode::ToolFailed,
            __FILE__, __LINE__);
    }
    if (!core::Path(output).isFile()) {
        throw core::ExternalToolException(fmt::format("'{}' did not produce {}", tool, output), tool, 0,
                                          result.output, core::ErrorCode::ArtifactMissing,
                                          __FILE__, __LINE__);
    }
}

}} // namespace tab2fig::process
