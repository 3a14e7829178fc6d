#include "tab2fig/latex/TableRenderer.hpp"
#include "tab2fig/utils/ModuleLoggers.hpp"

#include <fmt/format.h>
#include <iterator>

namespace tab2fig {
namespace latex {

std::string BooktabsRenderer::formatHeaderCell(const std::string& label, bool bold) {
    return bold ? fmt::format("\\textbf{{{}}}", label) : label;
}

std::string BooktabsRenderer::captionLine(const RenderOptions& options) {
    if (options.caption.empty()) {
        return {};
    }
    if (!options.caption_short.empty()) {
        return fmt::format("\\caption[{}]{{{}}}", options.caption_short, options.caption);
    }
    return fmt::format("\\caption{{{}}}", options.caption);
}

std::string BooktabsRenderer::render(const core::SanitizedTable& table,
                                     const theme::EffectiveStyle& style,
                                     const ColumnLayout& layout,
                                     const RenderOptions& options) const {
    fmt::memory_buffer out;
    auto it = std::back_inserter(out);

    const std::string caption = captionLine(options);

    if (options.longtable) {
        if (!style.font_size.empty()) {
            fmt::format_to(it, "\\begingroup\\{}\n", style.font_size);
        }
        if (style.striped) {
            fmt::format_to(it, "\\rowcolors{{2}}{{white}}{{{}}}\n", style.shading_color);
        }
        fmt::format_to(it, "\\begin{{longtable}}{{{}}}\n", layout.preamble);
        if (!caption.empty() || !options.label.empty()) {
            fmt::format_to(it, "{}", caption);
            if (!options.label.empty()) {
                fmt::format_to(it, "\\label{{{}}}", options.label);
            }
            fmt::format_to(it, "\\\\\n");
        }
    } else {
        fmt::format_to(it, "\\begin{{table}}[!h]\n\\centering\n");
        if (!caption.empty()) {
            fmt::format_to(it, "{}\n", caption);
        }
        if (!options.label.empty()) {
            fmt::format_to(it, "\\label{{{}}}\n", options.label);
        }
        if (!style.font_size.empty()) {
            fmt::format_to(it, "\\{}\n", style.font_size);
        }
        if (style.striped) {
            fmt::format_to(it, "\\rowcolors{{2}}{{white}}{{{}}}\n", style.shading_color);
        }
        fmt::format_to(it, "\\begin{{tabular}}{{{}}}\n", layout.preamble);
    }

    // 表头
    fmt::format_to(it, "\\toprule\n");
    for (size_t col = 0; col < table.header_labels.size(); ++col) {
        if (col > 0) fmt::format_to(it, " & ");
        fmt::format_to(it, "{}", formatHeaderCell(table.header_labels[col], style.header_bold));
    }
    fmt::format_to(it, "\\\\\n\\midrule\n");
    if (options.longtable) {
        fmt::format_to(it, "\\endhead\n");
    }

    // 数据行
    for (const auto& row : table.cells) {
        for (size_t col = 0; col < row.size(); ++col) {
            if (col > 0) fmt::format_to(it, " & ");
            fmt::format_to(it, "{}", row[col]);
        }
        fmt::format_to(it, "\\\\\n");
    }
    fmt::format_to(it, "\\bottomrule\n");

    if (options.longtable) {
        fmt::format_to(it, "\\end{{longtable}}\n");
        if (!style.font_size.empty()) {
            fmt::format_to(it, "\\endgroup\n");
        }
    } else {
        fmt::format_to(it, "\\end{{tabular}}\n\\end{{table}}\n");
    }

    LATEX_DEBUG("Rendered {} rows x {} columns ({} layout)", table.rowCount(), table.columnCount(),
                options.longtable ? "longtable" : "tabular");
    return fmt::to_string(out);
}

std::vector<std::string> BooktabsRenderer::requiredPackages(const RenderOptions& options) const {
    std::vector<std::string> packages;
    if (options.longtable) {
        packages.push_back("\\usepackage{longtable}");
    }
    return packages;
}

}} // namespace tab2fig::latex
