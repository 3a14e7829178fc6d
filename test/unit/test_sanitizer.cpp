#include <gtest/gtest.h>
#include "tab2fig/core/Sanitizer.hpp"
#include "tab2fig/core/Table.hpp"

#include <string>
#include <vector>

using namespace tab2fig::core;

class SanitizerTest : public ::testing::Test {
protected:
    static bool onlySafeChars(const std::string& s) {
        for (unsigned char c : s) {
            const bool safe = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                              (c >= '0' && c <= '9') || c == '_';
            if (!safe) return false;
        }
        return true;
    }
};

// 测试列名清理只保留安全字符，数量与顺序不变
TEST_F(SanitizerTest, ColumnNamesUseSafeIdentifierSet) {
    const std::vector<std::string> names = {"Std. Error", "p value", "ok_1", "50%", "a&b{c}", ""};
    const auto sanitized = Sanitizer::sanitizeColumnNames(names);

    ASSERT_EQ(sanitized.size(), names.size());
    EXPECT_EQ(sanitized[0], "Std__Error");
    EXPECT_EQ(sanitized[1], "p_value");
    EXPECT_EQ(sanitized[2], "ok_1");
    EXPECT_EQ(sanitized[3], "50_");
    EXPECT_EQ(sanitized[4], "a_b_c_");
    for (const auto& name : sanitized) {
        EXPECT_TRUE(onlySafeChars(name)) << name;
    }
}

// 测试多字节字符按码点替换
TEST_F(SanitizerTest, ColumnNamesAreCodePointAware) {
    EXPECT_EQ(Sanitizer::sanitizeColumnName("\xC3\xA9t\xC3\xA9"), "_t_");   // "été"
    EXPECT_EQ(Sanitizer::sanitizeColumnName("\xE5\x90\x8D\xE7\xA7\xB0"), "__");  // "名称"
}

// 测试清理是确定性的
TEST_F(SanitizerTest, ColumnNamesAreDeterministic) {
    const std::vector<std::string> names = {"x y", "x-y", "x.y"};
    EXPECT_EQ(Sanitizer::sanitizeColumnNames(names), Sanitizer::sanitizeColumnNames(names));
}

// 测试每个保留字符前都加了反斜杠，其余字符不变
TEST_F(SanitizerTest, EveryReservedCharacterIsEscaped) {
    const std::string reserved = Sanitizer::kReservedChars;
    for (char c : reserved) {
        const std::string input = std::string("x") + c + "y";
        const std::string expected = std::string("x\\") + c + "y";
        EXPECT_EQ(Sanitizer::escapeCell(input), expected) << "character: " << c;
    }
}

TEST_F(SanitizerTest, EscapeCellLeavesOtherTextUntouched) {
    EXPECT_EQ(Sanitizer::escapeCell("plain text 1.5 (a) [b] <c>"), "plain text 1.5 (a) [b] <c>");
    EXPECT_EQ(Sanitizer::escapeCell("50% & $5_x"), "50\\% \\& \\$5\\_x");
    EXPECT_EQ(Sanitizer::escapeCell("a\\b"), "a\\\\b");
    EXPECT_EQ(Sanitizer::escapeCell(""), "");
}

TEST_F(SanitizerTest, SanitizeTableCellsKeepsShape) {
    const std::vector<std::vector<std::string>> cells = {{"a#", "b"}, {"c", "d~"}};
    const auto out = Sanitizer::sanitizeTableCells(cells);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0][0], "a\\#");
    EXPECT_EQ(out[0][1], "b");
    EXPECT_EQ(out[1][1], "d\\~");
}

// 测试文件名清理
TEST_F(SanitizerTest, FilenameReplacesUnsafeCharacters) {
    EXPECT_EQ(Sanitizer::sanitizeFilename("my table: v1.0"), "my_table__v1_0");
    EXPECT_EQ(Sanitizer::sanitizeFilename("a|b<c>d*e/f\\g?h\"i"), "a_b_c_d_e_f_g_h_i");
    EXPECT_EQ(Sanitizer::sanitizeFilename("results_2024"), "results_2024");
    EXPECT_EQ(Sanitizer::sanitizeFilename(""), "table");
}

// 测试整表清理：列名映射、表头转义、单元格只转义一次
TEST_F(SanitizerTest, SanitizeTableBuildsMappingAndEscapesOnce) {
    const Table table = Table::fromRows("t", {"Group A", "Value"}, {{"x_1", "1.5"}, {"50%", "2"}});
    const SanitizedTable out = Sanitizer::sanitizeTable(table);

    ASSERT_EQ(out.columnCount(), 2u);
    ASSERT_EQ(out.rowCount(), 2u);
    EXPECT_EQ(out.column_map[0].first, "Group A");
    EXPECT_EQ(out.column_map[0].second, "Group_A");
    EXPECT_EQ(out.header_labels[0], "Group\\_A");
    EXPECT_EQ(out.header_labels[1], "Value");
    EXPECT_EQ(out.cells[0][0], "x\\_1");
    EXPECT_EQ(out.cells[1][0], "50\\%");
    EXPECT_FALSE(out.numeric[0]);
    EXPECT_TRUE(out.numeric[1]);
}

TEST_F(SanitizerTest, IsReserved) {
    EXPECT_TRUE(Sanitizer::isReserved('#'));
    EXPECT_TRUE(Sanitizer::isReserved('\\'));
    EXPECT_FALSE(Sanitizer::isReserved('a'));
    EXPECT_FALSE(Sanitizer::isReserved('.'));
}
