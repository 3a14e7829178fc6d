#include <gtest/gtest.h>
#include "tab2fig/core/Exception.hpp"
#include "tab2fig/theme/StyleResolver.hpp"
#include "tab2fig/theme/Theme.hpp"
#include "tab2fig/theme/ThemeRegistry.hpp"

#include <algorithm>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace tab2fig::theme;
using tab2fig::core::ConfigurationException;
using tab2fig::core::ErrorCode;

class ThemeRegistryTest : public ::testing::Test {
protected:
    static Theme journalTheme() {
        Theme theme("journal");
        theme.setShadingColor("gray!15").setHeaderBold(false).setFontSize("footnotesize");
        return theme;
    }

    ThemeRegistry registry;
};

// 测试内置主题的默认值
TEST_F(ThemeRegistryTest, BuiltinThemes) {
    EXPECT_EQ(registry.lookup("minimal").getShadingColor(), "blue!10");
    EXPECT_TRUE(registry.lookup("minimal").isHeaderBold());
    EXPECT_FALSE(registry.lookup("apa").isStriped());
    EXPECT_EQ(registry.lookup("nature").getFontSize(), "small");
    EXPECT_EQ(registry.lookup("nejm").getShadingColor(), "yellow!10");

    const auto builtins = registry.listThemes(true);
    EXPECT_EQ(builtins.size(), 4u);
    EXPECT_TRUE(ThemeRegistry::isBuiltin("apa"));
    EXPECT_FALSE(ThemeRegistry::isBuiltin("journal"));
}

// 测试与内置主题同名的注册总是失败（包括 overwrite）
TEST_F(ThemeRegistryTest, RegisteringBuiltinNameAlwaysFails) {
    for (const auto& name : ThemeRegistry::builtinNames()) {
        try {
            registry.registerTheme(journalTheme(), name, true);
            FAIL() << "expected ConfigurationException for " << name;
        } catch (const ConfigurationException& e) {
            EXPECT_EQ(e.getErrorCode(), ErrorCode::BuiltinThemeName);
        }
    }
    // 内置主题未被改动
    EXPECT_EQ(registry.lookup("minimal"), Theme::minimal());
}

// 测试重名注册：无 overwrite 失败，有 overwrite 替换
TEST_F(ThemeRegistryTest, DuplicateRegistration) {
    registry.registerTheme(journalTheme());
    EXPECT_TRUE(registry.contains("journal"));

    Theme replacement = journalTheme();
    replacement.setShadingColor("red!5");
    try {
        registry.registerTheme(replacement);
        FAIL() << "expected ConfigurationException";
    } catch (const ConfigurationException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::DuplicateTheme);
    }
    EXPECT_EQ(registry.lookup("journal").getShadingColor(), "gray!15");

    EXPECT_NO_THROW(registry.registerTheme(replacement, std::nullopt, true));
    EXPECT_EQ(registry.lookup("journal").getShadingColor(), "red!5");
}

// 测试以自定义名称注册时保存的主题使用该名称
TEST_F(ThemeRegistryTest, RegisterUnderCustomName) {
    registry.registerTheme(journalTheme(), std::string("lab"));
    EXPECT_EQ(registry.lookup("lab").getName(), "lab");
    EXPECT_FALSE(registry.contains("journal"));
}

// 测试注销不存在的主题返回 false 且不抛异常
TEST_F(ThemeRegistryTest, UnregisterAbsentReturnsFalse) {
    EXPECT_FALSE(registry.unregisterTheme("missing"));
    registry.registerTheme(journalTheme());
    EXPECT_TRUE(registry.unregisterTheme("journal"));
    EXPECT_FALSE(registry.unregisterTheme("journal"));
    EXPECT_FALSE(registry.unregisterTheme("minimal"));
    EXPECT_TRUE(registry.contains("minimal"));
}

TEST_F(ThemeRegistryTest, ClearRemovesOnlyCustomThemes) {
    registry.registerTheme(journalTheme());
    registry.registerTheme(journalTheme(), std::string("other"));
    EXPECT_EQ(registry.clear(), 2u);
    EXPECT_EQ(registry.clear(), 0u);
    EXPECT_EQ(registry.listThemes().size(), 4u);
}

TEST_F(ThemeRegistryTest, UnknownThemeLookup) {
    try {
        registry.lookup("nope");
        FAIL() << "expected ConfigurationException";
    } catch (const ConfigurationException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::UnknownTheme);
        EXPECT_NE(std::string(e.what()).find("Unknown theme"), std::string::npos);
    }
}

// 测试当前主题的设置与清除
TEST_F(ThemeRegistryTest, CurrentTheme) {
    EXPECT_FALSE(registry.getCurrent().has_value());

    auto previous = registry.setCurrent("nejm");
    EXPECT_FALSE(previous.has_value());
    ASSERT_TRUE(registry.getCurrent().has_value());
    EXPECT_EQ(registry.getCurrent()->getName(), "nejm");

    previous = registry.setCurrent(std::optional<Theme>(journalTheme()));
    ASSERT_TRUE(previous.has_value());
    EXPECT_EQ(previous->getName(), "nejm");

    registry.setCurrent(std::optional<Theme>());
    EXPECT_FALSE(registry.getCurrent().has_value());

    EXPECT_THROW(registry.setCurrent("missing"), ConfigurationException);
}

TEST_F(ThemeRegistryTest, NullNameClearsCurrentTheme) {
    registry.setCurrent("apa");
    const auto previous = registry.setCurrent(nullptr);
    ASSERT_TRUE(previous.has_value());
    EXPECT_EQ(previous->getName(), "apa");
    EXPECT_FALSE(registry.getCurrent().has_value());

    registry.setCurrent("nature");
    const char* no_name = nullptr;
    registry.setCurrent(no_name);
    EXPECT_FALSE(registry.getCurrent().has_value());
}

// 测试多线程同时注册、查找与切换当前主题
TEST_F(ThemeRegistryTest, ConcurrentRegistrationAndLookup) {
    constexpr int kThreads = 4;
    constexpr int kThemesPerThread = 50;
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t, &failures]() {
            for (int i = 0; i < kThemesPerThread; ++i) {
                const std::string name = "t" + std::to_string(t) + "_" + std::to_string(i);
                Theme theme(name);
                theme.setShadingColor("gray!" + std::to_string(i % 90 + 1));
                try {
                    registry.registerTheme(theme);
                    if (registry.lookup(name).getName() != name) ++failures;
                    if (registry.lookup("minimal").getShadingColor() != "blue!10") ++failures;
                    registry.setCurrent(name);
                    const auto current = registry.getCurrent();
                    if (!current || current->getName().empty()) ++failures;
                    if (i % 2 == 0) registry.setCurrent(std::nullopt);
                } catch (const tab2fig::core::Tab2FigException&) {
                    ++failures;
                }
            }
        });
    }
    for (auto& thread : threads) thread.join();

    EXPECT_EQ(failures.load(), 0);
    const auto custom = registry.listThemes();
    EXPECT_EQ(custom.size(), static_cast<size_t>(kThreads * kThemesPerThread) + ThemeRegistry::builtinNames().size());
    EXPECT_EQ(registry.clear(), static_cast<size_t>(kThreads * kThemesPerThread));
}

TEST_F(ThemeRegistryTest, InvalidThemeIsRejected) {
    Theme bad("bad");
    bad.setFontSize("gigantic");
    EXPECT_THROW(registry.registerTheme(bad), ConfigurationException);
    EXPECT_FALSE(registry.contains("bad"));
}

TEST(ThemeTest, DescribeListsFields) {
    Theme theme = Theme::nature();
    theme.setExtension("rule_width", "0.5pt");
    const std::string text = theme.describe();
    EXPECT_NE(text.find("nature"), std::string::npos);
    EXPECT_NE(text.find("Row shading"), std::string::npos);
    EXPECT_NE(text.find("gray!10"), std::string::npos);
    EXPECT_NE(text.find("rule_width"), std::string::npos);
    ASSERT_TRUE(theme.getExtension("rule_width").has_value());
    EXPECT_EQ(*theme.getExtension("rule_width"), "0.5pt");
    EXPECT_FALSE(theme.getExtension("missing").has_value());
}

class StyleResolverTest : public ::testing::Test {
protected:
    ThemeRegistry registry;
    StyleResolver resolver{registry};
};

// 测试没有任何主题时回退到 minimal
TEST_F(StyleResolverTest, FallsBackToMinimal) {
    const EffectiveStyle style = resolver.resolve(std::monostate{});
    EXPECT_EQ(style.theme_name, "minimal");
    EXPECT_EQ(style.shading_color, "blue!10");
    EXPECT_TRUE(style.header_bold);
    EXPECT_TRUE(style.striped);
}

TEST_F(StyleResolverTest, CurrentThemeUsedWhenNoCallTheme) {
    registry.setCurrent("nature");
    EXPECT_EQ(resolver.resolve(std::monostate{}).theme_name, "nature");
}

// 测试调用时主题整体替换当前主题
TEST_F(StyleResolverTest, CallThemeReplacesCurrentTheme) {
    registry.setCurrent("nejm");
    const EffectiveStyle style = resolver.resolve(std::string("apa"));
    EXPECT_EQ(style.theme_name, "apa");
    EXPECT_EQ(style.shading_color, "white");
    EXPECT_FALSE(style.header_bold);
    EXPECT_EQ(style.font_size, "normalsize");
}

TEST_F(StyleResolverTest, ThemeObjectAtCallTime) {
    Theme custom("inline");
    custom.setShadingColor("green!5").setStriped(false);
    const EffectiveStyle style = resolver.resolve(custom);
    EXPECT_EQ(style.theme_name, "inline");
    EXPECT_EQ(style.shading_color, "green!5");
    EXPECT_FALSE(style.striped);
}

// 测试显式字段优先级最高
TEST_F(StyleResolverTest, ExplicitFieldsWin) {
    registry.setCurrent("nejm");
    StyleOverrides overrides;
    overrides.shading_color = "red!20";
    overrides.header_bold = false;

    const EffectiveStyle from_current = resolver.resolve(std::monostate{}, overrides);
    EXPECT_EQ(from_current.theme_name, "nejm");
    EXPECT_EQ(from_current.shading_color, "red!20");
    EXPECT_FALSE(from_current.header_bold);
    EXPECT_EQ(from_current.font_size, "small");

    const EffectiveStyle from_call = resolver.resolve(std::string("nature"), overrides);
    EXPECT_EQ(from_call.theme_name, "nature");
    EXPECT_EQ(from_call.shading_color, "red!20");
}

TEST_F(StyleResolverTest, RegisteredThemeByName) {
    Theme lab("lab");
    lab.setShadingColor("cyan!10");
    registry.registerTheme(lab);
    EXPECT_EQ(resolver.resolve(std::string("lab")).shading_color, "cyan!10");
    EXPECT_THROW(resolver.resolve(std::string("unknown")), ConfigurationException);
}

TEST_F(StyleResolverTest, InvalidOverrideRejected) {
    StyleOverrides overrides;
    overrides.font_size = "enormous";
    EXPECT_THROW(resolver.resolve(std::monostate{}, overrides), ConfigurationException);
}
