#include "tab2fig/theme/ThemeRegistry.hpp"
#include "tab2fig/core/Exception.hpp"
#include "tab2fig/utils/ModuleLoggers.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <mutex>

namespace tab2fig {
namespace theme {

using core::ConfigurationException;
using core::ErrorCode;

ThemeRegistry::ThemeRegistry() {
    for (const Theme& t : {Theme::minimal(), Theme::apa(), Theme::nature(), Theme::nejm()}) {
        builtin_.emplace(t.getName(), t);
    }
}

ThemeRegistry& ThemeRegistry::global() {
    static ThemeRegistry instance;
    return instance;
}

const std::vector<std::string>& ThemeRegistry::builtinNames() {
    static const std::vector<std::string> names = {"minimal", "apa", "nature", "nejm"};
    return names;
}

bool ThemeRegistry::isBuiltin(const std::string& name) {
    const auto& names = builtinNames();
    return std::find(names.begin(), names.end(), name) != names.end();
}

void ThemeRegistry::registerTheme(const Theme& theme,
                                  const std::optional<std::string>& name,
                                  bool overwrite) {
    const std::string key = name.value_or(theme.getName());
    if (isBuiltin(key)) {
        TAB2FIG_THROW(ConfigurationException, ErrorCode::BuiltinThemeName,
                      fmt::format("Cannot register theme with built-in name '{}'", key));
    }

    Theme stored = theme;
    stored.setName(key);
    stored.validate();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = custom_.find(key);
    if (it != custom_.end()) {
        if (!overwrite) {
            TAB2FIG_THROW(ConfigurationException, ErrorCode::DuplicateTheme,
                          fmt::format("Theme '{}' is already registered (use overwrite to replace it)", key));
        }
        it->second = std::move(stored);
    } else {
        custom_.emplace(key, std::move(stored));
    }
    THEME_INFO("Theme '{}' registered successfully", key);
}

bool ThemeRegistry::unregisterTheme(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (custom_.erase(name) == 0) {
        THEME_INFO("Theme '{}' not found in custom registry", name);
        return false;
    }
    THEME_INFO("Theme '{}' unregistered", name);
    return true;
}

size_t ThemeRegistry::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const size_t count = custom_.size();
    custom_.clear();
    THEME_INFO("Cleared {} custom theme(s)", count);
    return count;
}

Theme ThemeRegistry::lookupUnlocked(const std::string& name) const {
    auto it = custom_.find(name);
    if (it != custom_.end()) {
        return it->second;
    }
    auto bit = builtin_.find(name);
    if (bit != builtin_.end()) {
        return bit->second;
    }
    std::vector<std::string> available;
    for (const auto& entry : builtin_) available.push_back(entry.first);
    for (const auto& entry : custom_) available.push_back(entry.first);
    TAB2FIG_THROW(ConfigurationException, ErrorCode::UnknownTheme,
                  fmt::format("Unknown theme '{}'. Available: {}", name, fmt::join(available, ", ")));
}

Theme ThemeRegistry::lookup(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return lookupUnlocked(name);
}

bool ThemeRegistry::contains(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return custom_.count(name) > 0 || builtin_.count(name) > 0;
}

std::optional<Theme> ThemeRegistry::setCurrent(const std::optional<Theme>& theme) {
    if (theme) {
        theme->validate();
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::optional<Theme> previous = current_;
    current_ = theme;
    THEME_DEBUG("Current theme set to '{}'", current_ ? current_->getName() : std::string("<none>"));
    return previous;
}

std::optional<Theme> ThemeRegistry::setCurrent(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    Theme resolved = lookupUnlocked(name);
    std::optional<Theme> previous = current_;
    current_ = std::move(resolved);
    THEME_DEBUG("Current theme set to '{}'", name);
    return previous;
}

std::optional<Theme> ThemeRegistry::getCurrent() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return current_;
}

std::vector<std::string> ThemeRegistry::listThemes(bool builtin_only) const {
    std::vector<std::string> names = builtinNames();
    if (builtin_only) {
        return names;
    }
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& entry : custom_) {
        names.push_back(entry.first);
    }
    return names;
}

}} // namespace tab2fig::theme
