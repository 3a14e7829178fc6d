#include "tab2fig/theme/StyleResolver.hpp"
#include "tab2fig/core/Exception.hpp"
#include "tab2fig/utils/ModuleLoggers.hpp"

#include <fmt/format.h>

namespace tab2fig {
namespace theme {

Theme StyleResolver::selectTheme(const ThemeRef& call_theme) const {
    if (const auto* name = std::get_if<std::string>(&call_theme)) {
        return registry_.lookup(*name);
    }
    if (const auto* theme = std::get_if<Theme>(&call_theme)) {
        theme->validate();
        return *theme;
    }
    if (auto current = registry_.getCurrent()) {
        return *current;
    }
    return Theme::minimal();
}

EffectiveStyle StyleResolver::resolve(const ThemeRef& call_theme,
                                      const StyleOverrides& overrides) const {
    const Theme base = selectTheme(call_theme);

    EffectiveStyle style;
    style.theme_name = base.getName();
    style.shading_color = overrides.shading_color.value_or(base.getShadingColor());
    style.header_bold = overrides.header_bold.value_or(base.isHeaderBold());
    style.font_size = overrides.font_size.value_or(base.getFontSize());
    style.striped = overrides.striped.value_or(base.isStriped());
    style.extensions = base.getExtensions();

    TAB2FIG_THROW_IF(style.shading_color.empty(), core::ConfigurationException,
                     core::ErrorCode::InvalidArgument, "shading color must not be empty");
    TAB2FIG_THROW_IF(!Theme::isValidFontSize(style.font_size), core::ConfigurationException,
                     core::ErrorCode::InvalidArgument,
                     fmt::format("invalid font size '{}'", style.font_size));

    THEME_DEBUG("Resolved style: theme={}, shading={}, bold={}, font={}, striped={}",
                style.theme_name, style.shading_color, style.header_bold,
                style.font_size.empty() ? "default" : style.font_size, style.striped);
    return style;
}

}} // namespace tab2fig::theme
