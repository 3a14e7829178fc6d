#pragma once

#include "tab2fig/core/Table.hpp"

#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace tab2fig {
namespace adapters {

/**
 * @brief 统计结果的通用中间表示
 *
 * 由调用方从具体的统计对象中提取：
 * - terms: 系数表的行名（lm/glm 的项，anova 的来源）
 * - columns: 按顺序排列的数值列，如 "estimate"、"std.error"、"statistic"、"p.value"
 * - scalars: 单值统计量，如 htest 的 "statistic"、"parameter"、"p.value"
 * - labels: 显示名，如 "statistic" -> "t"
 */
struct ModelSummary {
    std::string type_tag;
    std::vector<std::string> terms;
    std::vector<std::pair<std::string, std::vector<double>>> columns;
    std::map<std::string, double> scalars;
    std::map<std::string, std::string> labels;

    const std::vector<double>* column(const std::string& name) const;
    std::optional<double> scalar(const std::string& name) const;
    std::string label(const std::string& key, const std::string& fallback) const;
};

struct AdapterOptions {
    int digits = 3;
    bool exponentiate = false;      // glm：系数取指数（OR）
    bool conf_int = true;           // 存在 conf.low / conf.high 时输出置信区间列
};

using Adapter = std::function<core::Table(const ModelSummary&, const AdapterOptions&)>;

/**
 * @brief 类型标签到转换函数的注册表
 *
 * 内置 lm、glm、htest、anova，新类型通过 registerAdapter() 添加。
 */
class AdapterRegistry {
public:
    AdapterRegistry();

    AdapterRegistry(const AdapterRegistry&) = delete;
    AdapterRegistry& operator=(const AdapterRegistry&) = delete;

    static AdapterRegistry& global();

    /**
     * @throws ConfigurationException 标签为空，或已存在且未设置 overwrite
     */
    void registerAdapter(const std::string& tag, Adapter adapter, bool overwrite = false);
    bool unregisterAdapter(const std::string& tag);
    bool contains(const std::string& tag) const;
    std::vector<std::string> tags() const;

    /**
     * @brief 按 summary.type_tag 分派
     * @throws ConfigurationException 未注册的标签
     * @throws InputValidationException 结果缺少必需字段或列长度不一致
     */
    core::Table toTable(const ModelSummary& summary,
                        const AdapterOptions& options = AdapterOptions{}) const;

    // 内置转换
    static core::Table fromLinearModel(const ModelSummary& summary, const AdapterOptions& options);
    static core::Table fromGeneralizedLinearModel(const ModelSummary& summary, const AdapterOptions& options);
    static core::Table fromHypothesisTest(const ModelSummary& summary, const AdapterOptions& options);
    static core::Table fromAnova(const ModelSummary& summary, const AdapterOptions& options);

    /**
     * @brief 数值格式化：按位数四舍五入，去掉多余的尾随零，NaN 为空串
     */
    static std::string formatNumber(double value, int digits);

    /**
     * @brief p 值格式化：小于 0.001 为 "<0.001"，否则保留固定位数
     */
    static std::string formatPValue(double p, int digits);

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, Adapter> adapters_;
};

}} // namespace tab2fig::adapters
