#pragma once

#include <string>

namespace tab2fig {
namespace latex {

struct FigureOptions {
    std::string caption;
    std::string short_caption;
    std::string label;
    std::string position = "htbp";
    std::string width = "\\textwidth";
    bool center = true;
};

struct InlineOptions {
    std::string width = "\\textwidth";
    bool center = true;
    std::string vspace;         // 前后垂直间距，空表示不加
};

struct WrapOptions {
    std::string placement = "r";
    std::string wrap_width = "0.5\\textwidth";
    std::string width;          // 空时与 wrap_width 相同
    std::string caption;
    std::string label;
};

struct FigurePanel {
    std::string path;
    std::string caption;
    std::string label;
    std::string width = "0.48\\textwidth";
};

/**
 * @brief 生成在其它 LaTeX 文档中引用裁剪后 PDF 的代码
 *
 * 路径可以带或不带 _cropped 后缀与 .pdf 扩展名，统一补全为 <path>_cropped.pdf。
 */
class FigureInclude {
public:
    static std::string resolvePdfPath(const std::string& path);

    static std::string figure(const std::string& path, const FigureOptions& options = FigureOptions{});
    static std::string inlineGraphic(const std::string& path, const InlineOptions& options = InlineOptions{});

    /**
     * @brief wrapfigure 环境（需要文档加载 wrapfig）
     * @throws ConfigurationException placement 不是 r/l/i/o（大小写均可）
     */
    static std::string wrapFigure(const std::string& path, const WrapOptions& options = WrapOptions{});

    static std::string sideBySide(const FigurePanel& left, const FigurePanel& right,
                                  const std::string& position = "htbp",
                                  const std::string& caption = "",
                                  const std::string& label = "");

    /**
     * @brief 交叉引用命令：ref / autoref / pageref / nameref
     * @throws ConfigurationException 类型未知
     */
    static std::string reference(const std::string& label, const std::string& type = "ref");
};

}} // namespace tab2fig::latex
