#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tab2fig {
namespace core {

/**
 * @brief 表格数据（行 x 命名列）
 *
 * 所有单元格以字符串保存，数值列通过 inferNumericColumns() 推断或手动标记。
 * 数值列决定默认对齐方式（右对齐）。
 */
class Table {
public:
    Table() = default;
    Table(std::string name, std::vector<std::string> column_names);

    /**
     * @brief 从表头和行数据构建表格
     * @throws InputValidationException 行长度与列数不一致
     */
    static Table fromRows(std::string name,
                          std::vector<std::string> column_names,
                          std::vector<std::vector<std::string>> rows);

    const std::string& name() const { return name_; }
    void setName(const std::string& name) { name_ = name; }

    size_t rowCount() const { return rows_.size(); }
    size_t columnCount() const { return column_names_.size(); }

    const std::vector<std::string>& columnNames() const { return column_names_; }
    const std::vector<std::vector<std::string>>& rows() const { return rows_; }
    const std::string& cell(size_t row, size_t col) const { return rows_.at(row).at(col); }

    /**
     * @brief 追加一行
     * @throws InputValidationException 行长度与列数不一致
     */
    void addRow(std::vector<std::string> row);

    bool isNumericColumn(size_t col) const;
    void setNumericColumn(size_t col, bool numeric);
    const std::vector<bool>& numericColumns() const { return numeric_; }

    /**
     * @brief 按内容推断数值列：非空单元格全部可完整解析为数字
     */
    void inferNumericColumns();

    /**
     * @brief 校验表格可以进入生成流程
     * @throws InputValidationException 无列（非表格）或零行
     */
    void validate() const;

    /**
     * @brief 判断文本是否为完整的数字（忽略首尾空白），"NA" 与空串视为缺失值
     */
    static bool isNumericText(std::string_view text);
    static bool isMissing(std::string_view text);

    /**
     * @brief 解析完整的数字文本，失败时返回 std::nullopt
     */
    static std::optional<double> parseNumber(std::string_view text);

private:
    std::string name_;
    std::vector<std::string> column_names_;
    std::vector<std::vector<std::string>> rows_;
    std::vector<bool> numeric_;
};

}} // namespace tab2fig::core
