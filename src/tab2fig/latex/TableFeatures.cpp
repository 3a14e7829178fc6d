#include "tab2fig/latex/TableFeatures.hpp"
#include "tab2fig/core/Exception.hpp"
#include "tab2fig/core/Sanitizer.hpp"
#include "tab2fig/utils/ModuleLoggers.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace tab2fig {
namespace latex {

using core::ConfigurationException;
using core::ErrorCode;

namespace {

const char* const kRowEnd = "\\\\";

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

std::string joinLines(const std::vector<std::string>& lines) {
    std::string out;
    for (const auto& line : lines) {
        out += line;
        out += '\n';
    }
    return out;
}

std::string trim(const std::string& s) {
    const size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return {};
    const size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

bool endsWithRowEnd(const std::string& line) {
    const std::string t = trim(line);
    return t.size() >= 2 && t.compare(t.size() - 2, 2, kRowEnd) == 0;
}

// 返回去掉行尾 \\ 的内容
std::string stripRowEnd(const std::string& line) {
    const size_t end = line.find_last_not_of(" \t\r");
    if (end == std::string::npos || end < 1) return line;
    return line.substr(0, end - 1);
}

size_t findLine(const std::vector<std::string>& lines, const std::string& needle, size_t from = 0) {
    for (size_t i = from; i < lines.size(); ++i) {
        if (trim(lines[i]) == needle) return i;
    }
    return std::string::npos;
}

size_t findLinePrefix(const std::vector<std::string>& lines, const std::string& prefix, size_t from = 0) {
    for (size_t i = from; i < lines.size(); ++i) {
        if (trim(lines[i]).compare(0, prefix.size(), prefix) == 0) return i;
    }
    return std::string::npos;
}

// 单元格内容是否已经是一个完整的花括号组
bool isSingleBraceGroup(const std::string& core) {
    if (core.size() < 2 || core.front() != '{' || core.back() != '}') return false;
    int depth = 0;
    for (size_t i = 0; i < core.size(); ++i) {
        if (core[i] == '\\') { ++i; continue; }
        if (core[i] == '{') ++depth;
        else if (core[i] == '}') {
            --depth;
            if (depth == 0 && i + 1 != core.size()) return false;
        }
    }
    return depth == 0;
}

struct NoteSection {
    std::string title;
    std::vector<std::pair<std::string, std::string>> notes;  // marker(tex), text
};

std::vector<NoteSection> collectSections(const Footnote& footnote) {
    std::vector<NoteSection> sections;

    auto add = [&sections](const std::string& title, const std::vector<std::string>& notes,
                           bool with_marker, NoteType type) {
        if (notes.empty()) return;
        NoteSection section;
        section.title = title;
        for (size_t i = 0; i < notes.size(); ++i) {
            std::string marker;
            if (with_marker) {
                marker = fmt::format("\\textsuperscript{{{}}}", footnoteMarker(type, i + 1));
            }
            section.notes.emplace_back(marker, notes[i]);
        }
        sections.push_back(std::move(section));
    };

    add(footnote.general_title, footnote.general, false, NoteType::Number);
    add(footnote.number_title, footnote.number, true, NoteType::Number);
    add(footnote.alphabet_title, footnote.alphabet, true, NoteType::Alphabet);
    add(footnote.symbol_title, footnote.symbol, true, NoteType::Symbol);
    return sections;
}

std::string chunkText(const NoteSection& section) {
    std::vector<std::string> parts;
    if (!section.title.empty()) {
        parts.push_back(fmt::format("\\textit{{{}}}", section.title));
    }
    for (const auto& [marker, text] : section.notes) {
        parts.push_back(marker.empty() ? text : marker + " " + text);
    }
    return fmt::format("{}", fmt::join(parts, " "));
}

std::vector<std::string> tablenotesLines(const std::vector<NoteSection>& sections, bool as_chunk) {
    std::vector<std::string> lines;
    lines.push_back("\\begin{tablenotes}");
    lines.push_back("\\small");
    for (const auto& section : sections) {
        if (as_chunk) {
            lines.push_back("\\item " + chunkText(section));
            continue;
        }
        if (!section.title.empty()) {
            lines.push_back(fmt::format("\\item \\textit{{{}}}", section.title));
        }
        for (const auto& [marker, text] : section.notes) {
            lines.push_back(marker.empty() ? "\\item " + text
                                           : fmt::format("\\item[{}] {}", marker, text));
        }
    }
    lines.push_back("\\end{tablenotes}");
    return lines;
}

std::vector<std::string> multicolumnLines(const std::vector<NoteSection>& sections, bool as_chunk,
                                          size_t column_count) {
    std::vector<std::string> lines;
    auto row = [column_count](const std::string& content) {
        return fmt::format("\\multicolumn{{{}}}{{l}}{{{}}}\\\\", column_count, content);
    };
    for (const auto& section : sections) {
        if (as_chunk) {
            lines.push_back(row("\\rule{0pt}{1em}" + chunkText(section)));
            continue;
        }
        if (!section.title.empty()) {
            lines.push_back(row(fmt::format("\\rule{{0pt}}{{1em}}\\textit{{{}}}", section.title)));
        }
        for (const auto& [marker, text] : section.notes) {
            lines.push_back(row(marker.empty() ? text : marker + " " + text));
        }
    }
    return lines;
}

struct BodyRange {
    size_t begin = std::string::npos;   // 第一条数据行
    size_t end = std::string::npos;     // \bottomrule 所在行
};

BodyRange locateBody(const std::vector<std::string>& lines) {
    BodyRange range;
    const size_t top = findLine(lines, "\\toprule");
    if (top == std::string::npos) return range;
    const size_t mid = findLine(lines, "\\midrule", top + 1);
    if (mid == std::string::npos) return range;
    size_t begin = mid + 1;
    if (begin < lines.size() && trim(lines[begin]) == "\\endhead") ++begin;
    const size_t bottom = findLine(lines, "\\bottomrule", begin);
    if (bottom == std::string::npos) return range;
    range.begin = begin;
    range.end = bottom;
    return range;
}

const char* valignToken(VerticalAlign valign) {
    switch (valign) {
    case VerticalAlign::Top: return "t";
    case VerticalAlign::Middle: return "c";
    case VerticalAlign::Bottom: return "b";
    }
    return "t";
}

} // namespace

// ========== 脚注 ==========

std::string footnoteMarker(NoteType type, size_t index) {
    if (index == 0) {
        TAB2FIG_THROW(ConfigurationException, ErrorCode::InvalidArgument,
                      "footnote index starts at 1");
    }
    static const char* const kSymbols[] = {"*", "\\dag", "\\ddag", "\\S", "\\P"};
    const size_t i = index - 1;

    switch (type) {
    case NoteType::Number:
        return std::to_string(index);
    case NoteType::Alphabet: {
        const std::string letter(1, static_cast<char>('a' + i % 26));
        std::string out;
        for (size_t n = 0; n <= i / 26; ++n) out += letter;
        return out;
    }
    case NoteType::Symbol: {
        const size_t count = sizeof(kSymbols) / sizeof(kSymbols[0]);
        std::string out;
        for (size_t n = 0; n <= i / count; ++n) out += kSymbols[i % count];
        return out;
    }
    }
    return std::to_string(index);
}

std::string markCell(const std::string& text, size_t index, NoteType type) {
    return fmt::format("{}\\textsuperscript{{{}}}", text, footnoteMarker(type, index));
}

// ========== 表头分组 ==========

size_t HeaderGroup::totalSpan() const {
    size_t total = 0;
    for (const auto& group : spans) {
        total += group.second;
    }
    return total;
}

void validateHeaderGroups(const std::vector<HeaderGroup>& groups, size_t column_count) {
    for (size_t g = 0; g < groups.size(); ++g) {
        const HeaderGroup& group = groups[g];
        for (const auto& span : group.spans) {
            TAB2FIG_THROW_IF(span.second == 0, ConfigurationException, ErrorCode::HeaderSpanMismatch,
                             fmt::format("header group '{}' has a zero span", span.first));
        }
        if (group.totalSpan() != column_count) {
            TAB2FIG_THROW(ConfigurationException, ErrorCode::HeaderSpanMismatch,
                          fmt::format("header group {} spans {} columns but the table has {}",
                                      g + 1, group.totalSpan(), column_count));
        }
        if (group.align != "l" && group.align != "c" && group.align != "r") {
            TAB2FIG_THROW(ConfigurationException, ErrorCode::InvalidColumnToken,
                          fmt::format("header group alignment must be l, c or r (got '{}')", group.align));
        }
    }
}

void validateCollapseRows(const CollapseRows& collapse, size_t column_count) {
    for (size_t col : collapse.columns) {
        if (col == 0 || col > column_count) {
            TAB2FIG_THROW(ConfigurationException, ErrorCode::InvalidArgument,
                          fmt::format("collapse column {} out of range (1..{})", col, column_count));
        }
    }
}

// ========== 标记后处理 ==========

std::vector<std::string> splitRowCells(const std::string& row) {
    std::vector<std::string> cells;
    std::string current;
    size_t backslashes = 0;
    for (char c : row) {
        if (c == '&' && backslashes % 2 == 0) {
            cells.push_back(current);
            current.clear();
            backslashes = 0;
            continue;
        }
        backslashes = (c == '\\') ? backslashes + 1 : 0;
        current += c;
    }
    cells.push_back(current);
    return cells;
}

std::string protectHeader(const std::string& markup, const std::vector<size_t>& columns) {
    if (columns.empty()) {
        return markup;
    }
    std::vector<std::string> lines = splitLines(markup);
    const size_t top = findLine(lines, "\\toprule");
    const size_t mid = top == std::string::npos ? std::string::npos : findLine(lines, "\\midrule", top + 1);
    if (mid == std::string::npos || mid == top + 1) {
        LATEX_WARN("No header row found; header protection skipped");
        return markup;
    }

    std::string& header = lines[mid - 1];
    const size_t end = header.rfind(kRowEnd);
    const std::string suffix = end == std::string::npos ? std::string() : header.substr(end);
    std::vector<std::string> cells = splitRowCells(header.substr(0, end));

    for (size_t col : columns) {
        if (col == 0 || col > cells.size()) {
            TAB2FIG_THROW(ConfigurationException, ErrorCode::ColumnSpecMismatch,
                          fmt::format("protected column {} out of range (1..{})", col, cells.size()));
        }
        std::string& cell = cells[col - 1];
        const size_t b = cell.find_first_not_of(" \t");
        if (b == std::string::npos) continue;
        const size_t e = cell.find_last_not_of(" \t");
        const std::string core = cell.substr(b, e - b + 1);
        if (isSingleBraceGroup(core)) continue;
        cell = cell.substr(0, b) + "{" + core + "}" + cell.substr(e + 1);
    }

    std::string rebuilt;
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) rebuilt += '&';
        rebuilt += cells[i];
    }
    header = rebuilt + suffix;

    LATEX_DEBUG("Protected header columns: {}", fmt::join(columns, ","));
    return joinLines(lines);
}

std::string injectFootnote(const std::string& markup, const Footnote& footnote, size_t column_count) {
    if (footnote.empty()) {
        return markup;
    }
    std::vector<std::string> lines = splitLines(markup);
    const auto sections = collectSections(footnote);

    const bool is_longtable = findLinePrefix(lines, "\\begin{longtable}") != std::string::npos;
    const bool use_wrapper = footnote.threeparttable && !is_longtable;
    if (footnote.threeparttable && is_longtable) {
        LATEX_WARN("threeparttable cannot wrap a longtable; notes are emitted as table rows");
    }

    if (use_wrapper) {
        const size_t begin = findLinePrefix(lines, "\\begin{tabular}");
        const size_t end = findLine(lines, "\\end{tabular}");
        if (begin == std::string::npos || end == std::string::npos) {
            TAB2FIG_THROW(core::Tab2FigException, ErrorCode::InternalError,
                          "table markup has no tabular environment to wrap");
        }
        std::vector<std::string> tail = tablenotesLines(sections, footnote.as_chunk);
        tail.push_back("\\end{threeparttable}");
        lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(end) + 1, tail.begin(), tail.end());
        lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(begin), "\\begin{threeparttable}");
    } else {
        const size_t bottom = findLine(lines, "\\bottomrule");
        if (bottom == std::string::npos) {
            TAB2FIG_THROW(core::Tab2FigException, ErrorCode::InternalError,
                          "table markup has no \\bottomrule");
        }
        const auto rows = multicolumnLines(sections, footnote.as_chunk, column_count);
        lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(bottom) + 1, rows.begin(), rows.end());
    }

    LATEX_DEBUG("Injected {} footnote section(s) ({})", sections.size(),
                use_wrapper ? "threeparttable" : "multicolumn rows");
    return joinLines(lines);
}

std::string insertHeaderGroups(const std::string& markup, const std::vector<HeaderGroup>& groups,
                               size_t column_count) {
    if (groups.empty()) {
        return markup;
    }
    validateHeaderGroups(groups, column_count);

    std::vector<std::string> lines = splitLines(markup);
    const size_t top = findLine(lines, "\\toprule");
    if (top == std::string::npos) {
        TAB2FIG_THROW(core::Tab2FigException, ErrorCode::InternalError,
                      "table markup has no \\toprule");
    }

    for (const HeaderGroup& group : groups) {
        std::vector<std::string> cells;
        std::vector<std::string> rules;
        size_t first = 1;
        for (const auto& [label, span] : group.spans) {
            const std::string trimmed = trim(label);
            std::string text = core::Sanitizer::escapeCell(trimmed);
            if (!trimmed.empty()) {
                if (group.italic) text = fmt::format("\\textit{{{}}}", text);
                if (group.bold) text = fmt::format("\\textbf{{{}}}", text);
                if (group.rule) {
                    rules.push_back(fmt::format("\\cmidrule(l{{3pt}}r{{3pt}}){{{}-{}}}", first, first + span - 1));
                }
            }
            cells.push_back(fmt::format("\\multicolumn{{{}}}{{{}}}{{{}}}", span, group.align, text));
            first += span;
        }

        std::vector<std::string> block;
        block.push_back(fmt::format("{}\\\\", fmt::join(cells, " & ")));
        if (!rules.empty()) {
            block.push_back(fmt::format("{}", fmt::join(rules, " ")));
        }
        lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(top) + 1, block.begin(), block.end());
    }

    LATEX_DEBUG("Inserted {} header group row(s)", groups.size());
    return joinLines(lines);
}

std::string collapseRows(const std::string& markup, const CollapseRows& collapse, size_t column_count) {
    if (collapse.columns.empty()) {
        return markup;
    }
    validateCollapseRows(collapse, column_count);

    std::vector<size_t> columns = collapse.columns;
    std::sort(columns.begin(), columns.end());
    columns.erase(std::unique(columns.begin(), columns.end()), columns.end());

    std::vector<std::string> lines = splitLines(markup);
    const BodyRange body = locateBody(lines);
    if (body.begin == std::string::npos) {
        TAB2FIG_THROW(core::Tab2FigException, ErrorCode::InternalError,
                      "table markup has no recognizable body");
    }

    // 解析数据行
    std::vector<std::vector<std::string>> rows;
    for (size_t i = body.begin; i < body.end; ++i) {
        if (!endsWithRowEnd(lines[i])) {
            TAB2FIG_THROW(core::Tab2FigException, ErrorCode::InternalError,
                          fmt::format("unexpected line in table body: '{}'", lines[i]));
        }
        std::vector<std::string> cells = splitRowCells(stripRowEnd(lines[i]));
        if (cells.size() != column_count) {
            TAB2FIG_THROW(core::Tab2FigException, ErrorCode::InternalError,
                          fmt::format("table row has {} cells, expected {}", cells.size(), column_count));
        }
        for (auto& cell : cells) cell = trim(cell);
        rows.push_back(std::move(cells));
    }
    if (rows.empty()) {
        return markup;
    }

    // group_start[k][r]: 第 k 个合并列在第 r 行开始新分组（受上一合并列的分组边界约束）
    std::vector<std::vector<bool>> group_start(columns.size(), std::vector<bool>(rows.size(), false));
    for (size_t k = 0; k < columns.size(); ++k) {
        const size_t col = columns[k] - 1;
        for (size_t r = 0; r < rows.size(); ++r) {
            group_start[k][r] = r == 0 ||
                                rows[r][col] != rows[r - 1][col] ||
                                (k > 0 && group_start[k - 1][r]);
        }
    }

    std::vector<std::vector<std::string>> output = rows;
    for (size_t k = 0; k < columns.size(); ++k) {
        const size_t col = columns[k] - 1;
        size_t run_start = 0;
        for (size_t r = 1; r <= rows.size(); ++r) {
            if (r < rows.size() && !group_start[k][r]) continue;
            const size_t length = r - run_start;
            if (length > 1) {
                for (size_t i = run_start; i + 1 < r; ++i) {
                    output[i][col].clear();
                }
                output[r - 1][col] = fmt::format("\\multirow[{}]{{-{}}}{{*}}{{{}}}",
                                                 valignToken(collapse.valign), length, rows[run_start][col]);
            }
            run_start = r;
        }
    }

    std::vector<std::string> body_lines;
    for (size_t r = 0; r < output.size(); ++r) {
        if (r > 0 && collapse.rule != CollapseRule::None) {
            for (size_t k = 0; k < columns.size(); ++k) {
                if (!group_start[k][r]) continue;
                if (collapse.rule == CollapseRule::Full) {
                    body_lines.push_back(fmt::format("\\cmidrule{{{}-{}}}", columns[k], column_count));
                } else if (k == 0) {
                    body_lines.push_back("\\midrule");
                }
                break;
            }
        }
        body_lines.push_back(fmt::format("{}\\\\", fmt::join(output[r], " & ")));
    }

    lines.erase(lines.begin() + static_cast<std::ptrdiff_t>(body.begin),
                lines.begin() + static_cast<std::ptrdiff_t>(body.end));
    lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(body.begin), body_lines.begin(), body_lines.end());

    LATEX_DEBUG("Collapsed rows in column(s) {}", fmt::join(columns, ","));
    return joinLines(lines);
}

}} // namespace tab2fig::latex
