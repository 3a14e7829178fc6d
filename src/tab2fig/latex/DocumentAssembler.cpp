#include "tab2fig/latex/DocumentAssembler.hpp"
#include "tab2fig/core/Exception.hpp"
#include "tab2fig/utils/ModuleLoggers.hpp"

#include <fmt/format.h>
#include <regex>
#include <unordered_set>

namespace tab2fig {
namespace latex {

const std::vector<std::string>& DocumentAssembler::basePackages() {
    static const std::vector<std::string> packages = {
        "\\usepackage[table]{xcolor}",
        "\\usepackage{booktabs}"
    };
    return packages;
}

std::vector<std::string> DocumentAssembler::mergePreamble(const AssembledTable& table,
                                                          const std::vector<PackageSpec>& extra_packages) {
    std::vector<std::string> merged;
    std::unordered_set<std::string> seen;
    auto add = [&](const std::string& line) {
        if (line.empty()) return;
        if (seen.insert(line).second) {
            merged.push_back(line);
        }
    };

    for (const auto& line : basePackages()) add(line);
    for (const auto& line : table.feature_packages) add(line);
    for (const auto& line : table.decimal_packages) add(line);
    for (const auto& spec : extra_packages) {
        for (const auto& line : spec.lines()) add(line);
    }
    return merged;
}

std::string DocumentAssembler::assemble(const AssembledTable& table, const DocumentOptions& options) const {
    static const std::regex class_pattern(R"(^[A-Za-z][A-Za-z0-9\-]*$)");
    if (!std::regex_match(options.document_class, class_pattern)) {
        TAB2FIG_THROW(core::ConfigurationException, core::ErrorCode::InvalidArgument,
                      fmt::format("invalid document class '{}'", options.document_class));
    }

    std::string doc = fmt::format("\\documentclass{{{}}}\n", options.document_class);
    for (const auto& line : mergePreamble(table, options.extra_packages)) {
        doc += line;
        doc += '\n';
    }
    doc += "\\begin{document}\n";
    doc += "\\thispagestyle{empty}\n";
    doc += '\n';
    doc += table.markup;
    if (!table.markup.empty() && table.markup.back() != '\n') {
        doc += '\n';
    }
    doc += "\\end{document}\n";

    LATEX_DEBUG("Assembled document ({} class, {} bytes)", options.document_class, doc.size());
    return doc;
}

}} // namespace tab2fig::latex
