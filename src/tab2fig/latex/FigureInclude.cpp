#include "tab2fig/latex/FigureInclude.hpp"
#include "tab2fig/core/Exception.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <vector>

namespace tab2fig {
namespace latex {

namespace {

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string joinLines(const std::vector<std::string>& lines) {
    return fmt::format("{}", fmt::join(lines, "\n"));
}

void appendPanel(std::vector<std::string>& lines, const FigurePanel& panel) {
    lines.push_back(fmt::format("  \\begin{{minipage}}{{{}}}", panel.width));
    lines.push_back("    \\centering");
    lines.push_back(fmt::format("    \\includegraphics[width=\\textwidth]{{{}}}",
                                FigureInclude::resolvePdfPath(panel.path)));
    if (!panel.caption.empty()) {
        lines.push_back(fmt::format("    \\caption{{{}}}", panel.caption));
    }
    if (!panel.label.empty()) {
        lines.push_back(fmt::format("    \\label{{{}}}", panel.label));
    }
    lines.push_back("  \\end{minipage}");
}

} // namespace

std::string FigureInclude::resolvePdfPath(const std::string& path) {
    std::string base = path;
    if (endsWith(base, ".pdf")) {
        base.resize(base.size() - 4);
    }
    if (!endsWith(base, "_cropped")) {
        base += "_cropped";
    }
    return base + ".pdf";
}

std::string FigureInclude::figure(const std::string& path, const FigureOptions& options) {
    std::vector<std::string> lines;
    lines.push_back(fmt::format("\\begin{{figure}}[{}]", options.position));
    if (options.center) {
        lines.push_back("  \\centering");
    }
    lines.push_back(fmt::format("  \\includegraphics[width={}]{{{}}}", options.width, resolvePdfPath(path)));
    if (!options.caption.empty()) {
        if (!options.short_caption.empty()) {
            lines.push_back(fmt::format("  \\caption[{}]{{{}}}", options.short_caption, options.caption));
        } else {
            lines.push_back(fmt::format("  \\caption{{{}}}", options.caption));
        }
    }
    if (!options.label.empty()) {
        lines.push_back(fmt::format("  \\label{{{}}}", options.label));
    }
    lines.push_back("\\end{figure}");
    return joinLines(lines);
}

std::string FigureInclude::inlineGraphic(const std::string& path, const InlineOptions& options) {
    std::vector<std::string> lines;
    if (!options.vspace.empty()) {
        lines.push_back(fmt::format("\\vspace{{{}}}", options.vspace));
    }
    if (options.center) {
        lines.push_back("\\begin{center}");
    }
    lines.push_back(fmt::format("\\includegraphics[width={}]{{{}}}", options.width, resolvePdfPath(path)));
    if (options.center) {
        lines.push_back("\\end{center}");
    }
    if (!options.vspace.empty()) {
        lines.push_back(fmt::format("\\vspace{{{}}}", options.vspace));
    }
    return joinLines(lines);
}

std::string FigureInclude::wrapFigure(const std::string& path, const WrapOptions& options) {
    static const std::string kPlacements = "rlioRLIO";
    if (options.placement.size() != 1 || kPlacements.find(options.placement[0]) == std::string::npos) {
        TAB2FIG_THROW(core::ConfigurationException, core::ErrorCode::InvalidArgument,
                      fmt::format("invalid wrapfigure placement '{}'", options.placement));
    }
    const std::string& width = options.width.empty() ? options.wrap_width : options.width;

    std::vector<std::string> lines;
    lines.push_back(fmt::format("\\begin{{wrapfigure}}{{{}}}{{{}}}", options.placement, options.wrap_width));
    lines.push_back("  \\centering");
    lines.push_back(fmt::format("  \\includegraphics[width={}]{{{}}}", width, resolvePdfPath(path)));
    if (!options.caption.empty()) {
        lines.push_back(fmt::format("  \\caption{{{}}}", options.caption));
    }
    if (!options.label.empty()) {
        lines.push_back(fmt::format("  \\label{{{}}}", options.label));
    }
    lines.push_back("\\end{wrapfigure}");
    return joinLines(lines);
}

std::string FigureInclude::sideBySide(const FigurePanel& left, const FigurePanel& right,
                                      const std::string& position,
                                      const std::string& caption,
                                      const std::string& label) {
    std::vector<std::string> lines;
    lines.push_back(fmt::format("\\begin{{figure}}[{}]", position));
    lines.push_back("  \\centering");
    appendPanel(lines, left);
    lines.push_back("  \\hfill");
    appendPanel(lines, right);
    if (!caption.empty()) {
        lines.push_back(fmt::format("  \\caption{{{}}}", caption));
    }
    if (!label.empty()) {
        lines.push_back(fmt::format("  \\label{{{}}}", label));
    }
    lines.push_back("\\end{figure}");
    return joinLines(lines);
}

std::string FigureInclude::reference(const std::string& label, const std::string& type) {
    if (type != "ref" && type != "autoref" && type != "pageref" && type != "nameref") {
        TAB2FIG_THROW(core::ConfigurationException, core::ErrorCode::InvalidArgument,
                      fmt::format("unknown reference type '{}'", type));
    }
    return fmt::format("\\{}{{{}}}", type, label);
}

}} // namespace tab2fig::latex
