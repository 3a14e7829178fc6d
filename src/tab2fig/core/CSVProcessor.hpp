#pragma once

#include "tab2fig/core/Table.hpp"

#include <string>
#include <vector>

namespace tab2fig {
namespace core {

struct CSVOptions {
    char delimiter = ',';
    char quote_char = '"';
    char escape_char = '"';
    bool has_header = true;
    bool skip_empty_lines = true;
    bool trim_whitespace = true;
    bool auto_detect_delimiter = false;  // 根据前几行内容选择 , ; \t |

    static CSVOptions standard() {
        return CSVOptions{};
    }

    static CSVOptions tsv() {
        CSVOptions options;
        options.delimiter = '\t';
        return options;
    }

    CSVOptions() = default;
};

// CSV解析结果信息
struct CSVParseInfo {
    bool success = true;
    std::string error_message;
    int rows_parsed = 0;
    int columns_detected = 0;
    bool has_header_row = false;
    std::vector<std::string> column_names;

    CSVParseInfo() = default;
    explicit CSVParseInfo(bool success) : success(success) {}
};

/**
 * @brief CSV 读取器
 *
 * 支持引号字段（包括字段内换行与 "" 转义），生成 Table 时推断数值列。
 */
class CSVProcessor {
public:
    CSVProcessor() = default;
    explicit CSVProcessor(const CSVOptions& options) : options_(options) {}

    void setOptions(const CSVOptions& options) { options_ = options; }
    const CSVOptions& getOptions() const { return options_; }

    /**
     * @brief 解析 CSV 文本为记录列表
     * @throws InputValidationException 引号未闭合
     */
    std::vector<std::vector<std::string>> parseString(const std::string& content,
                                                      CSVParseInfo* info = nullptr) const;

    /**
     * @brief 解析 CSV 文本为 Table
     * @param content CSV 文本
     * @param table_name 表名（决定默认输出文件名）
     * @throws InputValidationException 内容为空、没有列或行长度不一致
     */
    Table parseTable(const std::string& content, const std::string& table_name) const;

    std::string formatRow(const std::vector<std::string>& row) const;

private:
    CSVOptions options_;
};

/**
 * @brief 读取 CSV 文件为 Table，表名取文件名（不含扩展名）
 * @throws FilesystemException 文件不可读
 * @throws InputValidationException 内容不是有效表格
 */
Table readTableFromFile(const std::string& filepath, const CSVOptions& options = CSVOptions{});

char detectDelimiter(const std::string& sample);
bool isCSVFile(const std::string& filepath);

}} // namespace tab2fig::core
