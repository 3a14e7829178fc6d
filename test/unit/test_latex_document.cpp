#include <gtest/gtest.h>
#include "tab2fig/core/Exception.hpp"
#include "tab2fig/core/Sanitizer.hpp"
#include "tab2fig/core/Table.hpp"
#include "tab2fig/latex/DocumentAssembler.hpp"
#include "tab2fig/latex/FigureInclude.hpp"
#include "tab2fig/latex/PackageSpec.hpp"
#include "tab2fig/latex/TableAssembler.hpp"
#include "tab2fig/latex/TableRenderer.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace tab2fig::latex;
using tab2fig::core::ConfigurationException;
using tab2fig::core::ErrorCode;
using tab2fig::core::Sanitizer;
using tab2fig::core::SanitizedTable;
using tab2fig::core::Table;
using tab2fig::theme::EffectiveStyle;

class LatexTestBase : public ::testing::Test {
protected:
    static SanitizedTable sampleTable() {
        return Sanitizer::sanitizeTable(
            Table::fromRows("results", {"name", "value"}, {{"a_1", "1.5"}, {"b", "2"}}));
    }

    static EffectiveStyle sampleStyle() {
        EffectiveStyle style;
        style.theme_name = "minimal";
        style.shading_color = "blue!10";
        style.header_bold = true;
        style.font_size = "small";
        style.striped = true;
        return style;
    }

    static bool contains(const std::string& text, const std::string& needle) {
        return text.find(needle) != std::string::npos;
    }
};

class TableRendererTest : public LatexTestBase {};

// 测试 tabular 布局的完整输出
TEST_F(TableRendererTest, RendersBooktabsTabular) {
    const SanitizedTable table = sampleTable();
    const ColumnLayout layout = buildLayout(ColumnSpec(), table.columnCount(), table.numeric);
    RenderOptions options;
    options.caption = "Results";
    options.label = "tab:r";

    const std::string markup = BooktabsRenderer().render(table, sampleStyle(), layout, options);
    const std::string expected =
        "\\begin{table}[!h]\n"
        "\\centering\n"
        "\\caption{Results}\n"
        "\\label{tab:r}\n"
        "\\small\n"
        "\\rowcolors{2}{white}{blue!10}\n"
        "\\begin{tabular}{lr}\n"
        "\\toprule\n"
        "\\textbf{name} & \\textbf{value}\\\\\n"
        "\\midrule\n"
        "a\\_1 & 1.5\\\\\n"
        "b & 2\\\\\n"
        "\\bottomrule\n"
        "\\end{tabular}\n"
        "\\end{table}\n";
    EXPECT_EQ(markup, expected);
}

TEST_F(TableRendererTest, PlainStyleOmitsOptionalLines) {
    EffectiveStyle style = sampleStyle();
    style.striped = false;
    style.header_bold = false;
    style.font_size.clear();

    const SanitizedTable table = sampleTable();
    const ColumnLayout layout = buildLayout(ColumnSpec(), table.columnCount(), table.numeric);
    const std::string markup = BooktabsRenderer().render(table, style, layout, RenderOptions());
    EXPECT_FALSE(contains(markup, "\\rowcolors"));
    EXPECT_FALSE(contains(markup, "\\textbf"));
    EXPECT_FALSE(contains(markup, "\\caption"));
    EXPECT_TRUE(contains(markup, "name & value\\\\\n"));
}

// 测试跨页表格
TEST_F(TableRendererTest, RendersLongtable) {
    const SanitizedTable table = sampleTable();
    const ColumnLayout layout = buildLayout(ColumnSpec(), table.columnCount(), table.numeric);
    RenderOptions options;
    options.longtable = true;
    options.caption = "Long";
    options.caption_short = "L";

    BooktabsRenderer renderer;
    const std::string markup = renderer.render(table, sampleStyle(), layout, options);
    EXPECT_TRUE(contains(markup, "\\begingroup\\small\n"));
    EXPECT_TRUE(contains(markup, "\\begin{longtable}{lr}\n\\caption[L]{Long}\\\\\n"));
    EXPECT_TRUE(contains(markup, "\\midrule\n\\endhead\n"));
    EXPECT_TRUE(contains(markup, "\\end{longtable}\n\\endgroup\n"));
    EXPECT_FALSE(contains(markup, "\\begin{table}"));
    EXPECT_EQ(renderer.requiredPackages(options), (std::vector<std::string>{"\\usepackage{longtable}"}));
    EXPECT_TRUE(renderer.requiredPackages(RenderOptions()).empty());
}

class TableAssemblerTest : public LatexTestBase {};

// 测试组装：小数列表头被保护并带出 siunitx
TEST_F(TableAssemblerTest, DecimalColumnsProtectHeaderAndAddPackages) {
    const ColumnSpec spec{"l", DecimalColumn::decimal(1, 1)};
    const AssembledTable result =
        TableAssembler().assemble(sampleTable(), sampleStyle(), spec, RenderOptions());

    EXPECT_TRUE(contains(result.markup, "\\textbf{name} & {\\textbf{value}}\\\\"));
    EXPECT_EQ(result.decimal_packages, (std::vector<std::string>{"\\usepackage{siunitx}", "\\sisetup{detect-all}"}));
    EXPECT_TRUE(result.feature_packages.empty());
}

TEST_F(TableAssemblerTest, FeaturesAddTheirPackages) {
    TableExtras extras;
    Footnote footnote;
    footnote.general = {"Simulated."};
    extras.footnote = footnote;
    CollapseRows collapse;
    collapse.columns = {1};
    extras.collapse_rows = collapse;

    const AssembledTable result =
        TableAssembler().assemble(sampleTable(), sampleStyle(), ColumnSpec(), RenderOptions(), extras);
    EXPECT_EQ(result.feature_packages,
              (std::vector<std::string>{"\\usepackage{threeparttable}", "\\usepackage{multirow}"}));
    EXPECT_TRUE(contains(result.markup, "\\begin{threeparttable}"));
}

// 测试单元格脚注标记
TEST_F(TableAssemblerTest, CellMarksAreApplied) {
    TableExtras extras;
    Footnote footnote;
    footnote.number = {"Estimated."};
    footnote.marks.push_back(CellMark{2, 2, NoteType::Number, 1});
    footnote.marks.push_back(CellMark{0, 1, NoteType::Symbol, 1});
    extras.footnote = footnote;

    const AssembledTable result =
        TableAssembler().assemble(sampleTable(), sampleStyle(), ColumnSpec(), RenderOptions(), extras);
    EXPECT_TRUE(contains(result.markup, "b & 2\\textsuperscript{1}\\\\"));
    EXPECT_TRUE(contains(result.markup, "\\textbf{name\\textsuperscript{*}}"));
}

// 测试配置在渲染之前校验
TEST_F(TableAssemblerTest, InvalidExtrasAreRejected) {
    TableAssembler assembler;
    TableExtras groups;
    groups.header_groups.push_back(HeaderGroup{{"All", 3}});
    EXPECT_THROW(assembler.assemble(sampleTable(), sampleStyle(), ColumnSpec(), RenderOptions(), groups),
                 ConfigurationException);

    TableExtras marks;
    Footnote footnote;
    footnote.general = {"x"};
    footnote.marks.push_back(CellMark{5, 1, NoteType::Number, 1});
    marks.footnote = footnote;
    EXPECT_THROW(assembler.validate(sampleTable(), marks), ConfigurationException);
}

class PackageSpecTest : public ::testing::Test {};

TEST_F(PackageSpecTest, StructuredBuilders) {
    EXPECT_EQ(PackageSpec::geometry("5mm", "a4paper").toLatex(), "\\usepackage[margin=5mm,paper=a4paper]{geometry}");
    EXPECT_EQ(PackageSpec::geometry("1in", "", true).toLatex(), "\\usepackage[margin=1in,landscape]{geometry}");
    EXPECT_EQ(PackageSpec::babel("spanish").toLatex(), "\\usepackage[spanish]{babel}");
    EXPECT_EQ(PackageSpec::fontspec("Arial").lines(),
              (std::vector<std::string>{"\\usepackage{fontspec}", "\\setmainfont{Arial}"}));
    EXPECT_EQ(PackageSpec::usePackage("caption").option("font", "small").toLatex(),
              "\\usepackage[font=small]{caption}");
}

// 测试结构化参数校验
TEST_F(PackageSpecTest, InvalidArgumentsAreRejected) {
    try {
        PackageSpec::geometry("5 apples");
        FAIL() << "expected ConfigurationException";
    } catch (const ConfigurationException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::InvalidPackageOption);
    }
    EXPECT_THROW(PackageSpec::geometry("", "letter"), ConfigurationException);
    EXPECT_THROW(PackageSpec::babel("en-US"), ConfigurationException);
    EXPECT_THROW(PackageSpec::usePackage("bad name"), ConfigurationException);
    EXPECT_THROW(PackageSpec::raw("\\usepackage{x}").option("a"), ConfigurationException);
}

TEST_F(PackageSpecTest, RawIsPassedThrough) {
    const PackageSpec spec = PackageSpec::raw("\\usepackage{microtype}");
    EXPECT_EQ(spec.kind(), PackageSpec::Kind::Raw);
    EXPECT_EQ(spec.toLatex(), "\\usepackage{microtype}");
}

class DocumentAssemblerTest : public LatexTestBase {};

// 测试文档结构与导言区顺序
TEST_F(DocumentAssemblerTest, AssemblesStandaloneDocument) {
    AssembledTable table;
    table.markup = "TABLE";
    table.feature_packages = {"\\usepackage{multirow}"};
    table.decimal_packages = {"\\usepackage{siunitx}"};

    DocumentOptions options;
    options.extra_packages.push_back(PackageSpec::geometry("5mm"));
    const std::string doc = DocumentAssembler().assemble(table, options);

    const std::string expected =
        "\\documentclass{article}\n"
        "\\usepackage[table]{xcolor}\n"
        "\\usepackage{booktabs}\n"
        "\\usepackage{multirow}\n"
        "\\usepackage{siunitx}\n"
        "\\usepackage[margin=5mm]{geometry}\n"
        "\\begin{document}\n"
        "\\thispagestyle{empty}\n"
        "\n"
        "TABLE\n"
        "\\end{document}\n";
    EXPECT_EQ(doc, expected);
}

// 测试导言区去重保留首次出现
TEST_F(DocumentAssemblerTest, PreambleIsDeduplicated) {
    AssembledTable table;
    table.feature_packages = {"\\usepackage{booktabs}", "\\usepackage{multirow}"};
    const std::vector<PackageSpec> extra = {PackageSpec::raw("\\usepackage{multirow}"),
                                            PackageSpec::raw("\\usepackage{microtype}")};

    const auto merged = DocumentAssembler::mergePreamble(table, extra);
    EXPECT_EQ(merged, (std::vector<std::string>{"\\usepackage[table]{xcolor}", "\\usepackage{booktabs}",
                                                "\\usepackage{multirow}", "\\usepackage{microtype}"}));
}

TEST_F(DocumentAssemblerTest, InvalidDocumentClass) {
    DocumentOptions options;
    options.document_class = "article}\\evil{";
    EXPECT_THROW(DocumentAssembler().assemble(AssembledTable(), options), ConfigurationException);

    options.document_class = "scrartcl";
    EXPECT_NO_THROW(DocumentAssembler().assemble(AssembledTable(), options));
}

class FigureIncludeTest : public ::testing::Test {};

// 测试裁剪后 PDF 路径补全
TEST_F(FigureIncludeTest, ResolvePdfPath) {
    EXPECT_EQ(FigureInclude::resolvePdfPath("output/x"), "output/x_cropped.pdf");
    EXPECT_EQ(FigureInclude::resolvePdfPath("x.pdf"), "x_cropped.pdf");
    EXPECT_EQ(FigureInclude::resolvePdfPath("x_cropped.pdf"), "x_cropped.pdf");
    EXPECT_EQ(FigureInclude::resolvePdfPath("x_cropped"), "x_cropped.pdf");
}

TEST_F(FigureIncludeTest, FigureEnvironment) {
    FigureOptions options;
    options.caption = "Model results";
    options.label = "fig:res";
    options.width = "0.8\\textwidth";
    const std::string out = FigureInclude::figure("output/res", options);
    EXPECT_EQ(out,
              "\\begin{figure}[htbp]\n"
              "  \\centering\n"
              "  \\includegraphics[width=0.8\\textwidth]{output/res_cropped.pdf}\n"
              "  \\caption{Model results}\n"
              "  \\label{fig:res}\n"
              "\\end{figure}");
}

TEST_F(FigureIncludeTest, InlineWrapAndSideBySide) {
    InlineOptions inline_options;
    inline_options.vspace = "1em";
    const std::string inline_out = FigureInclude::inlineGraphic("t", inline_options);
    EXPECT_EQ(inline_out.find("\\vspace{1em}\n\\begin{center}"), 0u);

    WrapOptions wrap;
    wrap.caption = "W";
    const std::string wrapped = FigureInclude::wrapFigure("t", wrap);
    EXPECT_NE(wrapped.find("\\begin{wrapfigure}{r}{0.5\\textwidth}"), std::string::npos);
    EXPECT_NE(wrapped.find("\\includegraphics[width=0.5\\textwidth]{t_cropped.pdf}"), std::string::npos);
    wrap.placement = "x";
    EXPECT_THROW(FigureInclude::wrapFigure("t", wrap), ConfigurationException);

    FigurePanel left;
    left.path = "a";
    FigurePanel right;
    right.path = "b.pdf";
    const std::string both = FigureInclude::sideBySide(left, right, "htbp", "Both");
    EXPECT_NE(both.find("{a_cropped.pdf}"), std::string::npos);
    EXPECT_NE(both.find("{b_cropped.pdf}"), std::string::npos);
    EXPECT_NE(both.find("\\hfill"), std::string::npos);
}

TEST_F(FigureIncludeTest, Reference) {
    EXPECT_EQ(FigureInclude::reference("fig:a"), "\\ref{fig:a}");
    EXPECT_EQ(FigureInclude::reference("fig:a", "autoref"), "\\autoref{fig:a}");
    EXPECT_THROW(FigureInclude::reference("fig:a", "cite"), ConfigurationException);
}
