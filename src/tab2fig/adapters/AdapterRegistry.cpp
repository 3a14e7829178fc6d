#include "tab2fig/adapters/AdapterRegistry.hpp"
#include "tab2fig/core/Exception.hpp"
#include "tab2fig/utils/ModuleLoggers.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <mutex>

namespace tab2fig {
namespace adapters {

using core::ConfigurationException;
using core::ErrorCode;
using core::InputValidationException;

const std::vector<double>* ModelSummary::column(const std::string& name) const {
    for (const auto& entry : columns) {
        if (entry.first == name) return &entry.second;
    }
    return nullptr;
}

std::optional<double> ModelSummary::scalar(const std::string& name) const {
    auto it = scalars.find(name);
    if (it == scalars.end()) return std::nullopt;
    return it->second;
}

std::string ModelSummary::label(const std::string& key, const std::string& fallback) const {
    auto it = labels.find(key);
    return it == labels.end() ? fallback : it->second;
}

namespace {

void checkColumnLengths(const ModelSummary& summary) {
    for (const auto& entry : summary.columns) {
        if (entry.second.size() != summary.terms.size()) {
            TAB2FIG_THROW(InputValidationException, ErrorCode::RaggedRows,
                          fmt::format("Column '{}' has {} values but there are {} terms",
                                      entry.first, entry.second.size(), summary.terms.size()));
        }
    }
}

const std::vector<double>& requireColumn(const ModelSummary& summary, const std::string& name) {
    const auto* values = summary.column(name);
    if (!values) {
        TAB2FIG_THROW(InputValidationException, ErrorCode::MalformedInput,
                      fmt::format("'{}' result has no '{}' column", summary.type_tag, name));
    }
    return *values;
}

bool isPValueColumn(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name.find("Pr") != std::string::npos || lower.find("p.value") != std::string::npos ||
           lower.find("p-value") != std::string::npos;
}

// lm 与 glm 共用的系数表
core::Table coefficientTable(const ModelSummary& summary, const AdapterOptions& options,
                             const std::string& statistic_label, bool exponentiate) {
    checkColumnLengths(summary);
    const auto& estimate = requireColumn(summary, "estimate");
    const auto* std_error = summary.column("std.error");
    const auto* statistic = summary.column("statistic");
    const auto* p_value = summary.column("p.value");
    const auto* conf_low = summary.column("conf.low");
    const auto* conf_high = summary.column("conf.high");
    const bool with_ci = options.conf_int && conf_low && conf_high;

    std::vector<std::string> names = {"Term", exponentiate ? "OR" : "Estimate"};
    if (std_error) names.push_back("Std. Error");
    if (statistic) names.push_back(statistic_label);
    if (p_value) names.push_back("p value");
    if (with_ci) {
        names.push_back("CI Lower");
        names.push_back("CI Upper");
    }

    core::Table table(summary.type_tag, names);
    for (size_t i = 0; i < summary.terms.size(); ++i) {
        const double est = exponentiate ? std::exp(estimate[i]) : estimate[i];
        std::vector<std::string> row = {summary.terms[i], AdapterRegistry::formatNumber(est, options.digits)};
        if (std_error) {
            // 指数化后的标准误按 delta 方法近似
            const double se = exponentiate ? est * (*std_error)[i] : (*std_error)[i];
            row.push_back(AdapterRegistry::formatNumber(se, options.digits));
        }
        if (statistic) row.push_back(AdapterRegistry::formatNumber((*statistic)[i], options.digits));
        if (p_value) row.push_back(AdapterRegistry::formatPValue((*p_value)[i], options.digits));
        if (with_ci) {
            const double lo = exponentiate ? std::exp((*conf_low)[i]) : (*conf_low)[i];
            const double hi = exponentiate ? std::exp((*conf_high)[i]) : (*conf_high)[i];
            row.push_back(AdapterRegistry::formatNumber(lo, options.digits));
            row.push_back(AdapterRegistry::formatNumber(hi, options.digits));
        }
        table.addRow(std::move(row));
    }
    table.inferNumericColumns();
    return table;
}

} // namespace

AdapterRegistry::AdapterRegistry() {
    adapters_.emplace("lm", &AdapterRegistry::fromLinearModel);
    adapters_.emplace("glm", &AdapterRegistry::fromGeneralizedLinearModel);
    adapters_.emplace("htest", &AdapterRegistry::fromHypothesisTest);
    adapters_.emplace("anova", &AdapterRegistry::fromAnova);
}

AdapterRegistry& AdapterRegistry::global() {
    static AdapterRegistry instance;
    return instance;
}

void AdapterRegistry::registerAdapter(const std::string& tag, Adapter adapter, bool overwrite) {
    if (tag.empty() || !adapter) {
        TAB2FIG_THROW(ConfigurationException, ErrorCode::InvalidArgument,
                      "Adapter registration requires a non-empty tag and a callable");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = adapters_.find(tag);
    if (it != adapters_.end() && !overwrite) {
        TAB2FIG_THROW(ConfigurationException, ErrorCode::InvalidArgument,
                      fmt::format("Adapter for '{}' is already registered", tag));
    }
    adapters_[tag] = std::move(adapter);
    ADAPT_DEBUG("Adapter '{}' registered", tag);
}

bool AdapterRegistry::unregisterAdapter(const std::string& tag) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return adapters_.erase(tag) > 0;
}

bool AdapterRegistry::contains(const std::string& tag) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return adapters_.count(tag) > 0;
}

std::vector<std::string> AdapterRegistry::tags() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(adapters_.size());
    for (const auto& entry : adapters_) result.push_back(entry.first);
    return result;
}

core::Table AdapterRegistry::toTable(const ModelSummary& summary, const AdapterOptions& options) const {
    Adapter adapter;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = adapters_.find(summary.type_tag);
        if (it == adapters_.end()) {
            std::vector<std::string> known;
            for (const auto& entry : adapters_) known.push_back(entry.first);
            TAB2FIG_THROW(ConfigurationException, ErrorCode::UnknownAdapter,
                          fmt::format("No adapter registered for '{}'. Available: {}",
                                      summary.type_tag, fmt::join(known, ", ")));
        }
        adapter = it->second;
    }
    // 转换函数可能回调注册表，在锁外执行
    core::Table table = adapter(summary, options);
    ADAPT_DEBUG("Adapter '{}' produced {} x {} table", summary.type_tag, table.rowCount(),
                table.columnCount());
    return table;
}

core::Table AdapterRegistry::fromLinearModel(const ModelSummary& summary, const AdapterOptions& options) {
    return coefficientTable(summary, options, summary.label("statistic", "t value"), false);
}

core::Table AdapterRegistry::fromGeneralizedLinearModel(const ModelSummary& summary,
                                                        const AdapterOptions& options) {
    return coefficientTable(summary, options, summary.label("statistic", "z value"), options.exponentiate);
}

core::Table AdapterRegistry::fromHypothesisTest(const ModelSummary& summary, const AdapterOptions& options) {
    const auto statistic = summary.scalar("statistic");
    const auto p_value = summary.scalar("p.value");
    if (!statistic || !p_value) {
        TAB2FIG_THROW(InputValidationException, ErrorCode::MalformedInput,
                      "Hypothesis test result requires 'statistic' and 'p.value'");
    }

    std::vector<std::string> names = {"Statistic", "Value"};
    std::vector<std::string> row = {summary.label("statistic", "statistic"),
                                    formatNumber(*statistic, options.digits)};

    if (const auto df = summary.scalar("parameter")) {
        names.push_back("df");
        row.push_back(formatNumber(*df, options.digits));
    }
    names.push_back("p value");
    row.push_back(formatPValue(*p_value, options.digits));

    const auto conf_low = summary.scalar("conf.low");
    const auto conf_high = summary.scalar("conf.high");
    if (options.conf_int && conf_low && conf_high) {
        names.push_back("CI Lower");
        names.push_back("CI Upper");
        row.push_back(formatNumber(*conf_low, options.digits));
        row.push_back(formatNumber(*conf_high, options.digits));
    }

    // 估计量以单元素列的形式给出，列名即估计量名称
    for (const auto& entry : summary.columns) {
        if (entry.second.empty()) continue;
        names.push_back(entry.first);
        row.push_back(formatNumber(entry.second.front(), options.digits));
    }

    core::Table table(summary.label("method", summary.type_tag), names);
    table.addRow(std::move(row));
    table.inferNumericColumns();
    return table;
}

core::Table AdapterRegistry::fromAnova(const ModelSummary& summary, const AdapterOptions& options) {
    checkColumnLengths(summary);
    if (summary.terms.empty()) {
        TAB2FIG_THROW(InputValidationException, ErrorCode::EmptyTable, "ANOVA result has no rows");
    }

    std::vector<std::string> names = {"Source"};
    for (const auto& entry : summary.columns) names.push_back(entry.first);

    core::Table table(summary.type_tag, names);
    for (size_t i = 0; i < summary.terms.size(); ++i) {
        std::vector<std::string> row = {summary.terms[i]};
        for (const auto& entry : summary.columns) {
            const double value = entry.second[i];
            row.push_back(isPValueColumn(entry.first) ? formatPValue(value, options.digits)
                                                      : formatNumber(value, options.digits));
        }
        table.addRow(std::move(row));
    }
    table.inferNumericColumns();
    return table;
}

std::string AdapterRegistry::formatNumber(double value, int digits) {
    if (std::isnan(value)) return "";
    std::string text = fmt::format("{:.{}f}", value, std::max(digits, 0));
    if (text.find('.') != std::string::npos) {
        while (!text.empty() && text.back() == '0') text.pop_back();
        if (!text.empty() && text.back() == '.') text.pop_back();
    }
    if (text == "-0") text = "0";
    return text;
}

std::string AdapterRegistry::formatPValue(double p, int digits) {
    if (std::isnan(p)) return "";
    if (p < 0.001) return "<0.001";
    return fmt::format("{:.{}f}", p, std::max(digits, 0));
}

}} // namespace tab2fig::adapters
