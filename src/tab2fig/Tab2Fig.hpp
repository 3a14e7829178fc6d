#pragma once

// tab2fig - 把表格数据排版成可直接插入论文的 PDF 图片

// === 公共接口 ===

#include <string>
#include <utility>
#include <vector>

#include "tab2fig/core/Exception.hpp"
#include "tab2fig/core/Table.hpp"
#include "tab2fig/core/CSVProcessor.hpp"
#include "tab2fig/theme/Theme.hpp"
#include "tab2fig/theme/ThemeRegistry.hpp"
#include "tab2fig/latex/CellFormat.hpp"
#include "tab2fig/latex/ColumnSpec.hpp"
#include "tab2fig/latex/PackageSpec.hpp"
#include "tab2fig/latex/TableFeatures.hpp"
#include "tab2fig/latex/FigureInclude.hpp"
#include "tab2fig/process/ArtifactCache.hpp"
#include "tab2fig/adapters/AdapterRegistry.hpp"
#include "tab2fig/api/TableGenerator.hpp"

// 版本信息
#define TAB2FIG_VERSION_MAJOR 1
#define TAB2FIG_VERSION_MINOR 0
#define TAB2FIG_VERSION_PATCH 0
#define TAB2FIG_VERSION_STRING "1.0.0"

namespace tab2fig {

inline std::string getVersion() {
    return TAB2FIG_VERSION_STRING;
}

/**
 * @brief 初始化 tab2fig 库
 * @param log_file_path 日志文件路径，为空时只输出到控制台
 * @param enable_console 是否启用控制台日志
 * @param verbose 为 true 时日志级别为 DEBUG
 * @return 初始化是否成功
 */
bool initialize(const std::string& log_file_path = "",
                bool enable_console = true,
                bool verbose = false);

/**
 * @brief 清理库资源（刷新日志）
 */
void cleanup();

// 类型别名
using Table = core::Table;
using Theme = theme::Theme;
using GenerationOptions = api::GenerationOptions;
using GenerationResult = api::GenerationResult;
using BatchItem = api::BatchItem;

/**
 * @brief 使用全局主题注册表生成表格图片
 */
GenerationResult generate(const Table& table, const GenerationOptions& options = GenerationOptions{});

std::vector<BatchItem> generateBatch(const std::vector<std::pair<std::string, Table>>& tables,
                                     const GenerationOptions& options = GenerationOptions{});

} // namespace tab2fig
