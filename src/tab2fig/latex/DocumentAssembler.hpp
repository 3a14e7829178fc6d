#pragma once

#include "tab2fig/latex/PackageSpec.hpp"
#include "tab2fig/latex/TableAssembler.hpp"

#include <string>
#include <vector>

namespace tab2fig {
namespace latex {

struct DocumentOptions {
    std::string document_class = "article";     // 文档类
    std::vector<PackageSpec> extra_packages;    // 附加导言区内容
};

/**
 * @brief 文档组装器
 *
 * 导言区顺序：\documentclass、基础包、表格特性包、小数列包、附加包，
 * 全部按首次出现去重；正文为 \thispagestyle{empty} 加表格。
 */
class DocumentAssembler {
public:
    static const std::vector<std::string>& basePackages();

    /**
     * @brief 合并导言区行并去重（保留第一次出现的位置）
     */
    static std::vector<std::string> mergePreamble(const AssembledTable& table,
                                                  const std::vector<PackageSpec>& extra_packages);

    /**
     * @brief 生成完整文档
     * @throws ConfigurationException 文档类名称无效
     */
    std::string assemble(const AssembledTable& table, const DocumentOptions& options) const;
};

}} // namespace tab2fig::latex
