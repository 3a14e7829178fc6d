#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tab2fig {
namespace latex {

/**
 * @brief siunitx 小数点对齐列（S 列）
 *
 * 生成形如 S[table-format=3.2,detect-weight=true,mode=text] 的列指令，
 * 并携带所需的导言区命令。
 */
class DecimalColumn {
public:
    enum class RoundMode : uint8_t {
        None,
        Places,
        Figures
    };

    /**
     * @param table_format 整数位.小数位，例如 "3.2"
     * @throws ConfigurationException 格式不是 "数字.数字"
     */
    explicit DecimalColumn(const std::string& table_format = "3.2");

    static DecimalColumn decimal(int integers = 3, int decimals = 2);

    DecimalColumn& setRounding(RoundMode mode, int precision);
    DecimalColumn& setDetectWeight(bool detect) { detect_weight_ = detect; return *this; }
    DecimalColumn& setGroupSeparator(const std::string& separator) { group_separator_ = separator; return *this; }

    const std::string& getTableFormat() const { return table_format_; }
    RoundMode getRoundMode() const { return round_mode_; }
    bool getDetectWeight() const { return detect_weight_; }

    std::string toDirective() const;

    static const std::vector<std::string>& requiredPackages();

    bool operator==(const DecimalColumn& other) const;

private:
    std::string table_format_;
    RoundMode round_mode_ = RoundMode::None;
    int round_precision_ = 0;
    bool detect_weight_ = true;
    std::optional<std::string> group_separator_;
};

using ColumnDirective = std::variant<std::string, DecimalColumn>;

/**
 * @brief 列对齐规格：缺省 / 统一记号 / 逐列列表
 */
class ColumnSpec {
public:
    enum class Kind : uint8_t {
        Default,
        Uniform,
        PerColumn
    };

    ColumnSpec() = default;
    ColumnSpec(std::initializer_list<ColumnDirective> directives);

    static ColumnSpec uniform(const std::string& token);
    static ColumnSpec perColumn(std::vector<ColumnDirective> directives);

    Kind kind() const { return kind_; }
    bool isDefault() const { return kind_ == Kind::Default; }
    const std::string& uniformToken() const { return uniform_; }
    const std::vector<ColumnDirective>& directives() const { return directives_; }

private:
    Kind kind_ = Kind::Default;
    std::string uniform_;
    std::vector<ColumnDirective> directives_;
};

/**
 * @brief 交给渲染器的列布局
 */
struct ColumnLayout {
    std::vector<std::string> directives;        // 每列一条
    std::string preamble;                       // tabular 列格式串
    std::vector<size_t> protected_columns;      // 需要保护表头的列（从 1 开始）
    std::vector<std::string> packages;          // 去重后的导言区命令
};

/**
 * @brief 判断原始字符串是否为 S 或 S[...] 列
 */
bool isDecimalToken(const std::string& token);

/**
 * @brief 返回小数对齐列的位置（从 1 开始）
 *
 * 识别 DecimalColumn 对象与 S / S[...] 原始字符串。
 */
std::vector<size_t> detectDecimalColumns(const ColumnSpec& spec);

/**
 * @brief 构建列布局
 * @param spec 对齐规格
 * @param column_count 表格列数
 * @param numeric 每列是否为数值列（缺省规格下决定左右对齐）
 * @throws ConfigurationException 长度不匹配或记号无效
 */
ColumnLayout buildLayout(const ColumnSpec& spec, size_t column_count,
                         const std::vector<bool>& numeric = {});

}} // namespace tab2fig::latex
