#include <gtest/gtest.h>
#include "tab2fig/core/Exception.hpp"
#include "tab2fig/latex/ColumnSpec.hpp"

using namespace tab2fig::latex;
using tab2fig::core::ConfigurationException;
using tab2fig::core::ErrorCode;

class ColumnSpecTest : public ::testing::Test {};

// 测试小数列位置检测（从 1 开始）
TEST_F(ColumnSpecTest, DetectDecimalColumns) {
    const ColumnSpec spec{"l", DecimalColumn::decimal(3, 2), "r", DecimalColumn::decimal(2, 3)};
    EXPECT_EQ(detectDecimalColumns(spec), (std::vector<size_t>{2, 4}));

    const ColumnSpec plain{"l", "c", "r"};
    EXPECT_TRUE(detectDecimalColumns(plain).empty());

    const ColumnSpec raw{"S", "l", "S[table-format=1.3]"};
    EXPECT_EQ(detectDecimalColumns(raw), (std::vector<size_t>{1, 3}));

    EXPECT_TRUE(detectDecimalColumns(ColumnSpec()).empty());
}

TEST_F(ColumnSpecTest, DecimalColumnDirective) {
    EXPECT_EQ(DecimalColumn::decimal(3, 2).toDirective(), "S[table-format=3.2,detect-weight=true,mode=text]");

    DecimalColumn rounded("2.1");
    rounded.setRounding(DecimalColumn::RoundMode::Places, 1).setDetectWeight(false);
    EXPECT_EQ(rounded.toDirective(), "S[table-format=2.1,round-mode=places,round-precision=1]");

    DecimalColumn grouped("6.0");
    grouped.setDetectWeight(false).setGroupSeparator("\\,");
    EXPECT_EQ(grouped.toDirective(), "S[table-format=6.0,group-separator={\\,}]");

    EXPECT_THROW(DecimalColumn("3.x"), ConfigurationException);
    EXPECT_THROW(DecimalColumn::decimal(-1, 2), ConfigurationException);
}

// 测试默认布局：数值列右对齐，文本列左对齐
TEST_F(ColumnSpecTest, DefaultLayoutFollowsNumericFlags) {
    const ColumnLayout layout = buildLayout(ColumnSpec(), 3, {false, true, true});
    EXPECT_EQ(layout.preamble, "lrr");
    EXPECT_TRUE(layout.protected_columns.empty());
    EXPECT_TRUE(layout.packages.empty());
}

TEST_F(ColumnSpecTest, UniformTokenIsRepeated) {
    EXPECT_EQ(buildLayout(ColumnSpec::uniform("c"), 3, {}).preamble, "ccc");
    EXPECT_EQ(buildLayout(ColumnSpec::uniform("p{2cm}"), 2, {}).preamble, "p{2cm}p{2cm}");
}

// 测试多字母 lcr 串逐列拆分，长度不符时报错
TEST_F(ColumnSpecTest, UniformLcrStringIsSplit) {
    const ColumnLayout layout = buildLayout(ColumnSpec::uniform("lcr"), 3, {});
    EXPECT_EQ(layout.directives, (std::vector<std::string>{"l", "c", "r"}));

    try {
        buildLayout(ColumnSpec::uniform("lr"), 3, {});
        FAIL() << "expected ConfigurationException";
    } catch (const ConfigurationException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::ColumnSpecMismatch);
    }
}

TEST_F(ColumnSpecTest, UniformDecimalTokenProtectsEveryColumn) {
    const ColumnLayout layout = buildLayout(ColumnSpec::uniform("S"), 2, {});
    EXPECT_EQ(layout.protected_columns, (std::vector<size_t>{1, 2}));
    EXPECT_EQ(layout.packages.size(), 2u);
}

// 测试逐列规格：小数列需要表头保护与 siunitx
TEST_F(ColumnSpecTest, PerColumnLayout) {
    const ColumnSpec spec{"l", DecimalColumn::decimal(3, 2), "r", DecimalColumn::decimal(2, 3)};
    const ColumnLayout layout = buildLayout(spec, 4, {});

    ASSERT_EQ(layout.directives.size(), 4u);
    EXPECT_EQ(layout.directives[0], "l");
    EXPECT_EQ(layout.directives[1], "S[table-format=3.2,detect-weight=true,mode=text]");
    EXPECT_EQ(layout.directives[3], "S[table-format=2.3,detect-weight=true,mode=text]");
    EXPECT_EQ(layout.protected_columns, (std::vector<size_t>{2, 4}));
    EXPECT_EQ(layout.packages, (std::vector<std::string>{"\\usepackage{siunitx}", "\\sisetup{detect-all}"}));
}

TEST_F(ColumnSpecTest, PerColumnLengthMismatch) {
    const ColumnSpec spec{"l", "r"};
    try {
        buildLayout(spec, 3, {});
        FAIL() << "expected ConfigurationException";
    } catch (const ConfigurationException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::ColumnSpecMismatch);
    }
}

TEST_F(ColumnSpecTest, MalformedTokenRejected) {
    const ColumnSpec spec{"l", "z"};
    try {
        buildLayout(spec, 2, {});
        FAIL() << "expected ConfigurationException";
    } catch (const ConfigurationException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::InvalidColumnToken);
    }
    EXPECT_THROW(buildLayout(ColumnSpec::uniform("q"), 2, {}), ConfigurationException);
}

TEST_F(ColumnSpecTest, IsDecimalToken) {
    EXPECT_TRUE(isDecimalToken("S"));
    EXPECT_TRUE(isDecimalToken("S[table-format=3.2]"));
    EXPECT_FALSE(isDecimalToken("s"));
    EXPECT_FALSE(isDecimalToken("S[unterminated"));
    EXPECT_FALSE(isDecimalToken("l"));
}
