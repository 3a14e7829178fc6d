#include <gtest/gtest.h>
#include "tab2fig/core/Exception.hpp"
#include "tab2fig/core/Sanitizer.hpp"
#include "tab2fig/core/Table.hpp"
#include "tab2fig/latex/CellFormat.hpp"
#include "tab2fig/latex/TableAssembler.hpp"

#include <stdexcept>
#include <string>

using namespace tab2fig::latex;
using tab2fig::core::ConfigurationException;
using tab2fig::core::ErrorCode;
using tab2fig::core::SanitizedTable;
using tab2fig::core::Sanitizer;
using tab2fig::core::Table;

class CellFormatTest : public ::testing::Test {
protected:
    static SanitizedTable pvalues() {
        return Sanitizer::sanitizeTable(Table::fromRows(
            "model", {"term", "estimate", "p.value"},
            {{"(Intercept)", "1.50", "0.001"}, {"dose_mg", "0.25", "0.20"}, {"age", "-0.10", "0.04"}}));
    }
};

TEST_F(CellFormatTest, FormatCellTextOrder) {
    CellFormat format;
    format.bold = true;
    format.italic = true;
    format.color = "red";
    format.background = "gray!20";
    EXPECT_EQ(formatCellText("x", format), "\\cellcolor{gray!20}{\\textcolor{red}{\\textbf{\\textit{x}}}}");

    CellFormat bold_only;
    bold_only.bold = true;
    EXPECT_EQ(formatCellText("1.5", bold_only), "{\\textbf{1.5}}");
}

// 测试按列名加粗，列名可以是原始名或清理后的名字
TEST_F(CellFormatTest, BoldNamedColumn) {
    SanitizedTable table = pvalues();
    const size_t count = applyCellFormats(table, {CellFormat::boldNamedColumns({"p.value"})});
    EXPECT_EQ(count, 3u);
    EXPECT_EQ(table.cells[0][2], "{\\textbf{0.001}}");
    EXPECT_EQ(table.cells[0][1], "1.50");

    SanitizedTable by_safe_name = pvalues();
    EXPECT_EQ(applyCellFormats(by_safe_name, {CellFormat::italicNamedColumns({"p_value"})}), 3u);
    EXPECT_EQ(by_safe_name.cells[2][2], "{\\textit{0.04}}");
}

// 测试条件高亮只作用于满足条件的单元格，判断使用转义前的文本
TEST_F(CellFormatTest, ConditionalHighlightUsesRawValues) {
    SanitizedTable table = pvalues();
    CellFormat significant = CellFormat::highlight(CellFormat::lessThan(0.05), "yellow!30", true);
    significant.column_names = {"p.value"};
    EXPECT_EQ(applyCellFormats(table, {significant}), 2u);
    EXPECT_EQ(table.cells[0][2], "\\cellcolor{yellow!30}{\\textbf{0.001}}");
    EXPECT_EQ(table.cells[1][2], "0.20");
    EXPECT_EQ(table.cells[2][2], "\\cellcolor{yellow!30}{\\textbf{0.04}}");

    SanitizedTable names = pvalues();
    CellFormat underscored = CellFormat::highlight(
        [](const std::string& value) { return value == "dose_mg"; });
    EXPECT_EQ(applyCellFormats(names, {underscored}), 1u);
    EXPECT_EQ(names.cells[1][0], "\\cellcolor{yellow!30}{dose\\_mg}");
}

TEST_F(CellFormatTest, ThrowingConditionDoesNotMatch) {
    SanitizedTable table = pvalues();
    CellFormat format = CellFormat::highlight([](const std::string& value) -> bool {
        if (value == "age") throw std::runtime_error("bad value");
        return false;
    });
    EXPECT_EQ(applyCellFormats(table, {format}), 0u);
    EXPECT_EQ(table.cells[2][0], "age");
}

// 测试行底色与越界行列被忽略
TEST_F(CellFormatTest, ColorRowsIgnoresOutOfRange) {
    SanitizedTable table = pvalues();
    EXPECT_EQ(applyCellFormats(table, {CellFormat::colorRows({2, 9}, "blue!10")}), 3u);
    EXPECT_EQ(table.cells[1][0], "\\cellcolor{blue!10}{dose\\_mg}");
    EXPECT_EQ(table.cells[0][0], "(Intercept)");

    SanitizedTable columns = pvalues();
    EXPECT_EQ(applyCellFormats(columns, {CellFormat::boldColumns({0, 4})}), 0u);
    EXPECT_EQ(applyCellFormats(columns, {CellFormat::boldNamedColumns({"missing"})}), 0u);
}

TEST_F(CellFormatTest, FactoriesRejectEmptyTargets) {
    EXPECT_THROW(CellFormat::boldColumns(std::vector<size_t>{}), ConfigurationException);
    EXPECT_THROW(CellFormat::italicNamedColumns({}), ConfigurationException);
    EXPECT_THROW(CellFormat::colorRows({}, "red"), ConfigurationException);
    EXPECT_THROW(CellFormat::colorRows({1}, ""), ConfigurationException);
    EXPECT_THROW(CellFormat::highlight(CellCondition()), ConfigurationException);

    CellFormat empty_color;
    empty_color.color = "";
    try {
        validateCellFormat(empty_color);
        FAIL() << "expected ConfigurationException";
    } catch (const ConfigurationException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::InvalidArgument);
    }
}

TEST_F(CellFormatTest, NumericConditions) {
    EXPECT_TRUE(CellFormat::lessThan(0.05)("0.01"));
    EXPECT_FALSE(CellFormat::lessThan(0.05)("0.05"));
    EXPECT_FALSE(CellFormat::lessThan(0.05)("<0.001"));
    EXPECT_TRUE(CellFormat::greaterThan(100)(" 250 "));
    EXPECT_FALSE(CellFormat::greaterThan(100)("NA"));
}

TEST_F(CellFormatTest, Describe) {
    CellFormat format = CellFormat::colorRows({1, 3}, "gray!20");
    format.bold = true;
    EXPECT_EQ(format.describe(), "rows 1,3 [bold, background=gray!20]");
    EXPECT_EQ(CellFormat::highlight(CellFormat::lessThan(1)).describe(),
              "all cells [background=yellow!30] (conditional)");
}

// 测试组装器先应用格式再标记脚注
TEST_F(CellFormatTest, AssemblerAppliesFormatsBeforeFootnoteMarks) {
    const SanitizedTable table = pvalues();
    tab2fig::theme::EffectiveStyle style;
    style.theme_name = "apa";
    style.shading_color = "white";
    style.header_bold = false;
    style.font_size = "normalsize";
    style.striped = false;

    TableExtras extras;
    extras.cell_formats.push_back(CellFormat::boldNamedColumns({"term"}));
    Footnote footnote;
    footnote.number = {"Reference level."};
    footnote.marks.push_back(CellMark{1, 1, NoteType::Number, 1});
    extras.footnote = footnote;

    const AssembledTable assembled = TableAssembler().assemble(table, style, ColumnSpec(), RenderOptions(), extras);
    EXPECT_NE(assembled.markup.find("{\\textbf{(Intercept)}}\\textsuperscript{1}"), std::string::npos)
        << assembled.markup;
    EXPECT_NE(assembled.markup.find("{\\textbf{age}} & -0.10 & 0.04\\\\"), std::string::npos);
}
