#include "tab2fig/latex/PackageSpec.hpp"
#include "tab2fig/core/Exception.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <regex>

namespace tab2fig {
namespace latex {

using core::ConfigurationException;
using core::ErrorCode;

namespace {

void requireMatch(const std::string& value, const std::regex& pattern, const char* what) {
    if (!std::regex_match(value, pattern)) {
        TAB2FIG_THROW(ConfigurationException, ErrorCode::InvalidPackageOption,
                      fmt::format("invalid {} '{}'", what, value));
    }
}

const std::regex kPackageName(R"(^[A-Za-z][A-Za-z0-9\-]*$)");
const std::regex kOptionKey(R"(^[A-Za-z][A-Za-z0-9\-]*$)");
const std::regex kOptionValue(R"(^[^\[\]{},]*$)");
const std::regex kDimension(R"(^\d+(\.\d+)?(mm|cm|in|pt|bp|pc|em|ex)$)");
const std::regex kPaper(R"(^[a-z0-9]+paper$)");
const std::regex kLanguage(R"(^[A-Za-z]+$)");
const std::regex kFontName(R"(^[^{}\\]+$)");

} // namespace

PackageSpec PackageSpec::usePackage(const std::string& name, const std::vector<std::string>& options) {
    requireMatch(name, kPackageName, "package name");
    PackageSpec spec;
    spec.kind_ = Kind::Package;
    spec.name_ = name;
    for (const auto& opt : options) {
        requireMatch(opt, kOptionValue, "package option");
        spec.options_.push_back(opt);
    }
    return spec;
}

PackageSpec PackageSpec::raw(const std::string& text) {
    PackageSpec spec;
    spec.kind_ = Kind::Raw;
    spec.raw_ = text;
    return spec;
}

PackageSpec PackageSpec::geometry(const std::string& margin, const std::string& paper, bool landscape,
                                  const std::vector<std::pair<std::string, std::string>>& extra) {
    PackageSpec spec = usePackage("geometry");
    if (!margin.empty()) {
        requireMatch(margin, kDimension, "geometry margin");
        spec.option("margin", margin);
    }
    if (!paper.empty()) {
        requireMatch(paper, kPaper, "paper size");
        spec.option("paper", paper);
    }
    for (const auto& [key, value] : extra) {
        spec.option(key, value);
    }
    if (landscape) {
        spec.option("landscape");
    }
    return spec;
}

PackageSpec PackageSpec::babel(const std::string& language) {
    requireMatch(language, kLanguage, "babel language");
    return usePackage("babel", {language});
}

PackageSpec PackageSpec::fontspec(const std::string& main_font, const std::string& sans_font,
                                  const std::string& mono_font) {
    PackageSpec spec = usePackage("fontspec");
    if (!main_font.empty()) {
        requireMatch(main_font, kFontName, "main font");
        spec.trailing_.push_back(fmt::format("\\setmainfont{{{}}}", main_font));
    }
    if (!sans_font.empty()) {
        requireMatch(sans_font, kFontName, "sans font");
        spec.trailing_.push_back(fmt::format("\\setsansfont{{{}}}", sans_font));
    }
    if (!mono_font.empty()) {
        requireMatch(mono_font, kFontName, "mono font");
        spec.trailing_.push_back(fmt::format("\\setmonofont{{{}}}", mono_font));
    }
    return spec;
}

PackageSpec& PackageSpec::option(const std::string& key, const std::string& value) {
    if (kind_ == Kind::Raw) {
        TAB2FIG_THROW(ConfigurationException, ErrorCode::InvalidPackageOption,
                      "cannot add options to a raw package specification");
    }
    requireMatch(key, kOptionKey, "package option key");
    if (value.empty()) {
        options_.push_back(key);
    } else {
        requireMatch(value, kOptionValue, "package option value");
        options_.push_back(key + "=" + value);
    }
    return *this;
}

std::vector<std::string> PackageSpec::lines() const {
    if (kind_ == Kind::Raw) {
        return {raw_};
    }
    std::vector<std::string> out;
    if (options_.empty()) {
        out.push_back(fmt::format("\\usepackage{{{}}}", name_));
    } else {
        out.push_back(fmt::format("\\usepackage[{}]{{{}}}", fmt::join(options_, ","), name_));
    }
    out.insert(out.end(), trailing_.begin(), trailing_.end());
    return out;
}

std::string PackageSpec::toLatex() const {
    return fmt::format("{}", fmt::join(lines(), "\n"));
}

}} // namespace tab2fig::latex
