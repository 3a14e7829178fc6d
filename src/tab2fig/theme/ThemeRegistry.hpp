#pragma once

#include "tab2fig/theme/Theme.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace tab2fig {
namespace theme {

/**
 * @brief 主题注册表
 *
 * 内置主题（minimal/apa/nature/nejm）不可修改；自定义主题可注册、注销、清空。
 * 同一时刻最多一个"当前主题"。所有操作由一把读写锁保护。
 *
 * 进程级实例通过 global() 获取；测试可以直接构造独立实例。
 */
class ThemeRegistry {
public:
    ThemeRegistry();
    ~ThemeRegistry() = default;

    ThemeRegistry(const ThemeRegistry&) = delete;
    ThemeRegistry& operator=(const ThemeRegistry&) = delete;

    static ThemeRegistry& global();

    /**
     * @brief 注册自定义主题
     * @param theme 主题
     * @param name 注册名，缺省时使用 theme.getName()
     * @param overwrite 是否允许覆盖已注册的同名自定义主题
     * @throws ConfigurationException 与内置主题同名，或重名且未设置 overwrite
     */
    void registerTheme(const Theme& theme,
                       const std::optional<std::string>& name = std::nullopt,
                       bool overwrite = false);

    /**
     * @brief 注销自定义主题
     * @return 是否实际删除了主题；名称不存在不是错误
     */
    bool unregisterTheme(const std::string& name);

    /**
     * @brief 删除全部自定义主题
     * @return 删除的数量
     */
    size_t clear();

    /**
     * @brief 查找主题：先自定义，再内置
     * @throws ConfigurationException 两处都不存在
     */
    Theme lookup(const std::string& name) const;
    bool contains(const std::string& name) const;

    /**
     * @brief 设置当前主题（传 std::nullopt 清除）
     * @return 之前的当前主题
     */
    std::optional<Theme> setCurrent(const std::optional<Theme>& theme);

    /**
     * @brief 按名称设置当前主题
     * @throws ConfigurationException 名称未知
     */
    std::optional<Theme> setCurrent(const std::string& name);
    std::optional<Theme> setCurrent(const char* name) {
        return name ? setCurrent(std::string(name)) : setCurrent(std::optional<Theme>());
    }
    std::optional<Theme> setCurrent(std::nullptr_t) { return setCurrent(std::optional<Theme>()); }

    std::optional<Theme> getCurrent() const;

    std::vector<std::string> listThemes(bool builtin_only = false) const;

    static bool isBuiltin(const std::string& name);
    static const std::vector<std::string>& builtinNames();

private:
    Theme lookupUnlocked(const std::string& name) const;

    mutable std::shared_mutex mutex_;
    std::map<std::string, Theme> builtin_;
    std::map<std::string, Theme> custom_;
    std::optional<Theme> current_;
};

}} // namespace tab2fig::theme
