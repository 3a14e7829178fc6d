#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace tab2fig {
namespace latex {

/**
 * @brief 导言区包描述
 *
 * 结构化形式（usePackage/geometry/babel/fontspec）在构造时校验参数；
 * raw() 原样透传，用于不支持的包或任意导言区命令。
 *
 * @code
 * auto geo = PackageSpec::geometry("5mm", "a4paper");
 * auto pkg = PackageSpec::usePackage("caption").option("font", "small");
 * auto any = PackageSpec::raw("\\usepackage{microtype}");
 * @endcode
 */
class PackageSpec {
public:
    enum class Kind : uint8_t {
        Package,
        Raw
    };

    /**
     * @throws ConfigurationException 包名或选项无效
     */
    static PackageSpec usePackage(const std::string& name,
                                  const std::vector<std::string>& options = {});
    static PackageSpec raw(const std::string& text);

    /**
     * @brief geometry 宏包
     * @param margin 页边距，如 "5mm"；空表示不设置
     * @param paper 纸张，如 "a4paper"；空表示不设置
     * @param landscape 横向
     * @param extra 其它 key=value 选项（value 为空时只写 key）
     */
    static PackageSpec geometry(const std::string& margin = "",
                                const std::string& paper = "",
                                bool landscape = false,
                                const std::vector<std::pair<std::string, std::string>>& extra = {});

    static PackageSpec babel(const std::string& language);

    /**
     * @brief fontspec 宏包及 \setmainfont / \setsansfont / \setmonofont
     */
    static PackageSpec fontspec(const std::string& main_font = "",
                                const std::string& sans_font = "",
                                const std::string& mono_font = "");

    /**
     * @brief 追加包选项（仅结构化形式）
     * @throws ConfigurationException raw 形式或选项无效
     */
    PackageSpec& option(const std::string& key, const std::string& value = "");

    Kind kind() const { return kind_; }
    const std::string& name() const { return name_; }
    const std::vector<std::string>& options() const { return options_; }

    /**
     * @brief 导言区文本行
     */
    std::vector<std::string> lines() const;

    std::string toLatex() const;

private:
    PackageSpec() = default;

    Kind kind_ = Kind::Package;
    std::string name_;
    std::vector<std::string> options_;
    std::vector<std::string> trailing_;   // 包声明之后的附加命令
    std::string raw_;
};

}} // namespace tab2fig::latex
