#include "tab2fig/theme/Theme.hpp"
#include "tab2fig/core/Exception.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace tab2fig {
namespace theme {

Theme Theme::minimal() {
    Theme t("minimal");
    t.setShadingColor("blue!10").setHeaderBold(true).setFontSize("").setStriped(true);
    return t;
}

// APA 风格：无底纹，表头不加粗
Theme Theme::apa() {
    Theme t("apa");
    t.setShadingColor("white").setHeaderBold(false).setFontSize("normalsize").setStriped(false);
    return t;
}

Theme Theme::nature() {
    Theme t("nature");
    t.setShadingColor("gray!10").setHeaderBold(true).setFontSize("small").setStriped(true);
    return t;
}

Theme Theme::nejm() {
    Theme t("nejm");
    t.setShadingColor("yellow!10").setHeaderBold(true).setFontSize("small").setStriped(true);
    return t;
}

std::optional<std::string> Theme::getExtension(const std::string& key) const {
    auto it = extensions_.find(key);
    if (it == extensions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::vector<std::string>& Theme::fontSizes() {
    static const std::vector<std::string> sizes = {
        "tiny", "scriptsize", "footnotesize", "small", "normalsize",
        "large", "Large", "LARGE", "huge", "Huge"
    };
    return sizes;
}

bool Theme::isValidFontSize(const std::string& size) {
    if (size.empty()) return true;
    const auto& sizes = fontSizes();
    return std::find(sizes.begin(), sizes.end(), size) != sizes.end();
}

void Theme::validate() const {
    using core::ConfigurationException;
    using core::ErrorCode;
    TAB2FIG_THROW_IF(name_.empty(), ConfigurationException, ErrorCode::InvalidArgument,
                     "theme name must not be empty");
    TAB2FIG_THROW_IF(shading_color_.empty(), ConfigurationException, ErrorCode::InvalidArgument,
                     fmt::format("theme '{}' has an empty shading color", name_));
    TAB2FIG_THROW_IF(!isValidFontSize(font_size_), ConfigurationException, ErrorCode::InvalidArgument,
                     fmt::format("theme '{}' has an invalid font size '{}'", name_, font_size_));
}

std::string Theme::describe() const {
    std::string out = fmt::format("tab2fig theme: {}\n", name_);
    out += fmt::format("  Row shading: {}\n", shading_color_);
    out += fmt::format("  Header bold: {}\n", header_bold_ ? "yes" : "no");
    out += fmt::format("  Font size:   {}\n", font_size_.empty() ? "default" : font_size_);
    out += fmt::format("  Striped:     {}\n", striped_ ? "yes" : "no");
    for (const auto& [key, value] : extensions_) {
        out += fmt::format("  {}: {}\n", key, value);
    }
    return out;
}

bool Theme::operator==(const Theme& other) const {
    return name_ == other.name_ &&
           shading_color_ == other.shading_color_ &&
           header_bold_ == other.header_bold_ &&
           font_size_ == other.font_size_ &&
           striped_ == other.striped_ &&
           extensions_ == other.extensions_;
}

}} // namespace tab2fig::theme
