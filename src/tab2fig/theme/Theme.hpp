#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tab2fig {
namespace theme {

/**
 * @brief 表格主题：底纹颜色、表头加粗、字号、隔行着色及扩展字段
 *
 * 字号为 LaTeX 字号命令名（不带反斜杠），空字符串表示不切换字号。
 */
class Theme {
private:
    std::string name_ {"custom"};
    std::string shading_color_ {"blue!10"};
    bool header_bold_ = true;
    std::string font_size_;
    bool striped_ = true;
    std::map<std::string, std::string> extensions_;

public:
    Theme() = default;
    explicit Theme(const std::string& name) : name_(name) {}

    // 内置主题
    static Theme minimal();
    static Theme apa();
    static Theme nature();
    static Theme nejm();

    const std::string& getName() const { return name_; }
    const std::string& getShadingColor() const { return shading_color_; }
    bool isHeaderBold() const { return header_bold_; }
    const std::string& getFontSize() const { return font_size_; }
    bool isStriped() const { return striped_; }
    const std::map<std::string, std::string>& getExtensions() const { return extensions_; }
    std::optional<std::string> getExtension(const std::string& key) const;

    Theme& setName(const std::string& name) { name_ = name; return *this; }
    Theme& setShadingColor(const std::string& color) { shading_color_ = color; return *this; }
    Theme& setHeaderBold(bool bold) { header_bold_ = bold; return *this; }
    Theme& setFontSize(const std::string& size) { font_size_ = size; return *this; }
    Theme& setStriped(bool striped) { striped_ = striped; return *this; }
    Theme& setExtension(const std::string& key, const std::string& value) {
        extensions_[key] = value;
        return *this;
    }

    /**
     * @brief 校验字段
     * @throws ConfigurationException 名称为空、颜色为空或字号无效
     */
    void validate() const;

    /**
     * @brief 多行可读描述
     */
    std::string describe() const;

    static bool isValidFontSize(const std::string& size);
    static const std::vector<std::string>& fontSizes();

    bool operator==(const Theme& other) const;
    bool operator!=(const Theme& other) const { return !(*this == other); }
};

}} // namespace tab2fig::theme
