#include <gtest/gtest.h>
#include "tab2fig/adapters/AdapterRegistry.hpp"
#include "tab2fig/core/Exception.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

using namespace tab2fig::adapters;
using tab2fig::core::ConfigurationException;
using tab2fig::core::ErrorCode;
using tab2fig::core::InputValidationException;
using tab2fig::core::Table;

class AdapterRegistryTest : public ::testing::Test {
protected:
    static ModelSummary linearModel() {
        ModelSummary summary;
        summary.type_tag = "lm";
        summary.terms = {"(Intercept)", "x"};
        summary.columns = {{"estimate", {1.23456, -0.5}},
                           {"std.error", {0.1, 0.05}},
                           {"statistic", {12.3456, -10.0}},
                           {"p.value", {1e-5, 0.0456}}};
        return summary;
    }

    AdapterRegistry registry;
};

// 测试线性模型系数表
TEST_F(AdapterRegistryTest, LinearModel) {
    const Table table = registry.toTable(linearModel());
    EXPECT_EQ(table.name(), "lm");
    EXPECT_EQ(table.columnNames(),
              (std::vector<std::string>{"Term", "Estimate", "Std. Error", "t value", "p value"}));
    ASSERT_EQ(table.rowCount(), 2u);
    EXPECT_EQ(table.rows()[0], (std::vector<std::string>{"(Intercept)", "1.235", "0.1", "12.346", "<0.001"}));
    EXPECT_EQ(table.rows()[1], (std::vector<std::string>{"x", "-0.5", "0.05", "-10", "0.046"}));
    EXPECT_FALSE(table.isNumericColumn(0));
    EXPECT_TRUE(table.isNumericColumn(1));
}

TEST_F(AdapterRegistryTest, StatisticLabelOverride) {
    ModelSummary summary = linearModel();
    summary.labels["statistic"] = "t";
    EXPECT_EQ(registry.toTable(summary).columnNames()[3], "t");
}

// 测试 glm 取指数：OR、标准误与置信区间
TEST_F(AdapterRegistryTest, GeneralizedLinearModelExponentiated) {
    ModelSummary summary;
    summary.type_tag = "glm";
    summary.terms = {"(Intercept)", "dose"};
    summary.columns = {{"estimate", {0.0, std::log(2.0)}},
                       {"std.error", {0.1, 0.2}},
                       {"conf.low", {-0.1, 0.0}},
                       {"conf.high", {0.1, std::log(4.0)}}};

    AdapterOptions options;
    options.exponentiate = true;
    const Table table = registry.toTable(summary, options);
    EXPECT_EQ(table.columnNames(),
              (std::vector<std::string>{"Term", "OR", "Std. Error", "CI Lower", "CI Upper"}));
    EXPECT_EQ(table.rows()[1], (std::vector<std::string>{"dose", "2", "0.4", "1", "4"}));

    options.exponentiate = false;
    options.conf_int = false;
    const Table raw = registry.toTable(summary, options);
    EXPECT_EQ(raw.columnNames(), (std::vector<std::string>{"Term", "Estimate", "Std. Error"}));
    EXPECT_EQ(raw.rows()[1][1], "0.693");
}

TEST_F(AdapterRegistryTest, CoefficientTableValidation) {
    ModelSummary missing = linearModel();
    missing.columns.erase(missing.columns.begin());
    try {
        registry.toTable(missing);
        FAIL() << "expected InputValidationException";
    } catch (const InputValidationException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::MalformedInput);
    }

    ModelSummary ragged = linearModel();
    ragged.columns[1].second.pop_back();
    try {
        registry.toTable(ragged);
        FAIL() << "expected InputValidationException";
    } catch (const InputValidationException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::RaggedRows);
    }
}

// 测试假设检验结果为单行表
TEST_F(AdapterRegistryTest, HypothesisTest) {
    ModelSummary summary;
    summary.type_tag = "htest";
    summary.scalars = {{"statistic", 2.5}, {"parameter", 18.0}, {"p.value", 0.021},
                       {"conf.low", 0.1}, {"conf.high", 1.9}};
    summary.labels = {{"statistic", "t"}, {"method", "Welch Two Sample t-test"}};
    summary.columns = {{"mean of x", {5.2}}};

    const Table table = registry.toTable(summary);
    EXPECT_EQ(table.name(), "Welch Two Sample t-test");
    EXPECT_EQ(table.columnNames(),
              (std::vector<std::string>{"Statistic", "Value", "df", "p value", "CI Lower", "CI Upper", "mean of x"}));
    ASSERT_EQ(table.rowCount(), 1u);
    EXPECT_EQ(table.rows()[0], (std::vector<std::string>{"t", "2.5", "18", "0.021", "0.1", "1.9", "5.2"}));

    summary.scalars.erase("p.value");
    EXPECT_THROW(registry.toTable(summary), InputValidationException);
}

// 测试方差分析表：p 值列按 p 值格式化，NaN 为空
TEST_F(AdapterRegistryTest, Anova) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    ModelSummary summary;
    summary.type_tag = "anova";
    summary.terms = {"group", "Residuals"};
    summary.columns = {{"Df", {2.0, 27.0}},
                       {"Sum Sq", {10.5, 30.0}},
                       {"F value", {4.725, nan}},
                       {"Pr(>F)", {0.0175, nan}}};

    const Table table = registry.toTable(summary);
    EXPECT_EQ(table.columnNames(), (std::vector<std::string>{"Source", "Df", "Sum Sq", "F value", "Pr(>F)"}));
    EXPECT_EQ(table.rows()[0], (std::vector<std::string>{"group", "2", "10.5", "4.725", "0.018"}));
    EXPECT_EQ(table.rows()[1], (std::vector<std::string>{"Residuals", "27", "30", "", ""}));
    EXPECT_TRUE(table.isNumericColumn(3));

    summary.terms.clear();
    for (auto& column : summary.columns) column.second.clear();
    try {
        registry.toTable(summary);
        FAIL() << "expected InputValidationException";
    } catch (const InputValidationException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::EmptyTable);
    }
}

// 测试未注册类型的错误信息列出可用标签
TEST_F(AdapterRegistryTest, UnknownTag) {
    ModelSummary summary;
    summary.type_tag = "coxph";
    try {
        registry.toTable(summary);
        FAIL() << "expected ConfigurationException";
    } catch (const ConfigurationException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::UnknownAdapter);
        const std::string message = e.what();
        EXPECT_NE(message.find("coxph"), std::string::npos);
        EXPECT_NE(message.find("anova, glm, htest, lm"), std::string::npos);
    }
}

// 测试注册自定义转换
TEST_F(AdapterRegistryTest, CustomAdapterRegistration) {
    registry.registerAdapter("coxph", [](const ModelSummary& summary, const AdapterOptions&) {
        Table table(summary.type_tag, {"Term", "HR"});
        for (const auto& term : summary.terms) table.addRow({term, "1"});
        return table;
    });
    EXPECT_TRUE(registry.contains("coxph"));

    ModelSummary summary;
    summary.type_tag = "coxph";
    summary.terms = {"age"};
    EXPECT_EQ(registry.toTable(summary).rows()[0][0], "age");

    EXPECT_THROW(registry.registerAdapter("coxph", &AdapterRegistry::fromAnova), ConfigurationException);
    EXPECT_NO_THROW(registry.registerAdapter("coxph", &AdapterRegistry::fromAnova, true));
    EXPECT_THROW(registry.registerAdapter("", &AdapterRegistry::fromAnova), ConfigurationException);
    EXPECT_THROW(registry.registerAdapter("empty", Adapter()), ConfigurationException);

    EXPECT_TRUE(registry.unregisterAdapter("coxph"));
    EXPECT_FALSE(registry.unregisterAdapter("coxph"));
    EXPECT_EQ(registry.tags(), (std::vector<std::string>{"anova", "glm", "htest", "lm"}));
}

TEST_F(AdapterRegistryTest, NumberFormatting) {
    EXPECT_EQ(AdapterRegistry::formatNumber(1.5, 3), "1.5");
    EXPECT_EQ(AdapterRegistry::formatNumber(2.0, 3), "2");
    EXPECT_EQ(AdapterRegistry::formatNumber(-0.0001, 3), "0");
    EXPECT_EQ(AdapterRegistry::formatNumber(1234.5678, 2), "1234.57");
    EXPECT_EQ(AdapterRegistry::formatNumber(std::nan(""), 3), "");

    EXPECT_EQ(AdapterRegistry::formatPValue(0.0004, 3), "<0.001");
    EXPECT_EQ(AdapterRegistry::formatPValue(0.05, 3), "0.050");
    EXPECT_EQ(AdapterRegistry::formatPValue(0.5, 2), "0.50");
}
