#pragma once

#include "tab2fig/theme/Theme.hpp"
#include "tab2fig/theme/ThemeRegistry.hpp"

#include <map>
#include <optional>
#include <string>
#include <variant>

namespace tab2fig {
namespace theme {

/**
 * @brief 调用时指定的主题：未指定 / 名称 / 主题对象
 */
using ThemeRef = std::variant<std::monostate, std::string, Theme>;

/**
 * @brief 单次调用的显式样式字段，设置了的字段优先级最高
 */
struct StyleOverrides {
    std::optional<std::string> shading_color;
    std::optional<bool> header_bold;
    std::optional<std::string> font_size;
    std::optional<bool> striped;

    bool empty() const {
        return !shading_color && !header_bold && !font_size && !striped;
    }
};

/**
 * @brief 解析后的最终样式
 */
struct EffectiveStyle {
    std::string theme_name;
    std::string shading_color;
    bool header_bold = true;
    std::string font_size;
    bool striped = true;
    std::map<std::string, std::string> extensions;
};

/**
 * @brief 样式解析器
 *
 * 优先级（高到低）：显式字段 > 调用时主题 > 注册表当前主题 > 内置 minimal。
 * 调用时主题整体替换当前主题，两者之间不做字段级合并；
 * 显式字段再逐项覆盖被选中的主题。
 */
class StyleResolver {
public:
    explicit StyleResolver(const ThemeRegistry& registry = ThemeRegistry::global())
        : registry_(registry) {}

    /**
     * @brief 选出基础主题（不含显式字段）
     * @throws ConfigurationException 主题名未知
     */
    Theme selectTheme(const ThemeRef& call_theme) const;

    /**
     * @brief 解析最终样式
     * @throws ConfigurationException 主题名未知或覆盖字段无效
     */
    EffectiveStyle resolve(const ThemeRef& call_theme,
                           const StyleOverrides& overrides = StyleOverrides{}) const;

private:
    const ThemeRegistry& registry_;
};

}} // namespace tab2fig::theme
