#include "tab2fig/latex/TableAssembler.hpp"
#include "tab2fig/core/Exception.hpp"
#include "tab2fig/utils/ModuleLoggers.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace tab2fig {
namespace latex {

using core::ConfigurationException;
using core::ErrorCode;

namespace {
void appendUnique(std::vector<std::string>& out, const std::string& item) {
    if (std::find(out.begin(), out.end(), item) == out.end()) {
        out.push_back(item);
    }
}
} // namespace

TableAssembler::TableAssembler(std::shared_ptr<const ITableRenderer> renderer)
    : renderer_(renderer ? std::move(renderer) : std::make_shared<BooktabsRenderer>()) {
}

void TableAssembler::validate(const core::SanitizedTable& table, const TableExtras& extras) const {
    for (const CellFormat& format : extras.cell_formats) {
        validateCellFormat(format);
    }
    validateHeaderGroups(extras.header_groups, table.columnCount());
    if (extras.collapse_rows) {
        validateCollapseRows(*extras.collapse_rows, table.columnCount());
    }
    if (extras.footnote) {
        for (const CellMark& mark : extras.footnote->marks) {
            if (mark.column == 0 || mark.column > table.columnCount() || mark.row > table.rowCount()) {
                TAB2FIG_THROW(ConfigurationException, ErrorCode::InvalidArgument,
                              fmt::format("footnote mark at row {}, column {} is outside the table ({} x {})",
                                          mark.row, mark.column, table.rowCount(), table.columnCount()));
            }
            TAB2FIG_THROW_IF(mark.index == 0, ConfigurationException, ErrorCode::InvalidArgument,
                             "footnote mark index starts at 1");
        }
    }
}

void TableAssembler::applyCellMarks(core::SanitizedTable& table, const std::vector<CellMark>& marks) {
    for (const CellMark& mark : marks) {
        std::string& target = mark.row == 0 ? table.header_labels[mark.column - 1]
                                            : table.cells[mark.row - 1][mark.column - 1];
        target = markCell(target, mark.index, mark.type);
    }
}

AssembledTable TableAssembler::assemble(const core::SanitizedTable& table,
                                        const theme::EffectiveStyle& style,
                                        const ColumnSpec& alignment,
                                        const RenderOptions& options,
                                        const TableExtras& extras) const {
    AssembledTable result;
    result.layout = buildLayout(alignment, table.columnCount(), table.numeric);
    validate(table, extras);

    const core::SanitizedTable* source = &table;
    core::SanitizedTable marked;
    const bool has_marks = extras.footnote && !extras.footnote->marks.empty();
    if (!extras.cell_formats.empty() || has_marks) {
        marked = table;
        applyCellFormats(marked, extras.cell_formats);
        if (has_marks) applyCellMarks(marked, extras.footnote->marks);
        source = &marked;
    }

    // 1. 渲染
    std::string markup = renderer_->render(*source, style, result.layout, options);

    // 2. 表头保护
    markup = protectHeader(markup, result.layout.protected_columns);

    // 3. 脚注
    if (extras.footnote && !extras.footnote->empty()) {
        markup = injectFootnote(markup, *extras.footnote, table.columnCount());
        if (extras.footnote->threeparttable && !options.longtable) {
            appendUnique(result.feature_packages, "\\usepackage{threeparttable}");
        }
    }

    // 4. 表头分组
    markup = insertHeaderGroups(markup, extras.header_groups, table.columnCount());

    // 5. 行合并
    if (extras.collapse_rows && !extras.collapse_rows->columns.empty()) {
        markup = collapseRows(markup, *extras.collapse_rows, table.columnCount());
        appendUnique(result.feature_packages, "\\usepackage{multirow}");
    }

    for (const auto& pkg : renderer_->requiredPackages(options)) {
        appendUnique(result.feature_packages, pkg);
    }
    result.decimal_packages = result.layout.packages;
    result.markup = std::move(markup);

    LATEX_DEBUG("Assembled table '{}' ({} bytes, {} feature package(s))",
                table.name, result.markup.size(), result.feature_packages.size());
    return result;
}

}} // namespace tab2fig::latex
