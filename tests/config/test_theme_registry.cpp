#include <gtest/gtest.h>
#include "config/themes/ThemeRegistry.hpp"
#include "config/themes/DarkTheme.hpp"

namespace {

class FlatTheme : public ITheme {
public:
    explicit FlatTheme(std::string color) : m_color(std::move(color)) {}
    std::string name() const override { return "Flat"; }
    std::string id() const override { return "flat"; }
    nlohmann::json styles() const override {
        return {{"grid", {{"show", false}}}, {"candle", {{"bar", {{"upColor", m_color}}}}}};
    }

private:
    std::string m_color;
};

}

TEST(ThemeRegistryTest, DefaultsAreLightAndDark) {
    ThemeRegistry registry;
    registry.initializeDefaults();

    const auto themes = registry.availableThemes();
    EXPECT_EQ(themes, (std::vector<std::string>{"dark", "light"}));
    EXPECT_EQ(registry.themeName("dark"), "Dark");
    EXPECT_EQ(registry.styles("dark"), DarkTheme().styles());
}

TEST(ThemeRegistryTest, UnknownThemeHasNoStyles) {
    ThemeRegistry registry;
    registry.initializeDefaults();

    EXPECT_FALSE(registry.styles("solarized").has_value());
    EXPECT_EQ(registry.themeName("solarized"), "");
}

TEST(ThemeRegistryTest, SameIdReplacesTheme) {
    ThemeRegistry registry;
    registry.registerTheme(std::make_unique<FlatTheme>("#000000"));
    registry.registerTheme(std::make_unique<FlatTheme>("#FFFFFF"));
    registry.registerTheme(nullptr);

    ASSERT_EQ(registry.availableThemes().size(), 1u);
    EXPECT_EQ((*registry.styles("flat"))["candle"]["bar"]["upColor"], "#FFFFFF");
}
