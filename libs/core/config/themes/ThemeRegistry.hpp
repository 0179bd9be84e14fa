#pragma once

#include "ITheme.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * Holds the named style presets one chart can switch between.
 * Each chart owns its own registry.
 */
class ThemeRegistry {
public:
    ThemeRegistry() = default;
    ThemeRegistry(const ThemeRegistry&) = delete;
    ThemeRegistry& operator=(const ThemeRegistry&) = delete;

    /**
     * Register a theme. A theme with the same id is replaced.
     */
    void registerTheme(std::unique_ptr<ITheme> theme);

    /**
     * Partial style tree of the theme with this id, if registered.
     */
    std::optional<nlohmann::json> styles(const std::string& themeId) const;

    std::vector<std::string> availableThemes() const;
    std::string themeName(const std::string& themeId) const;

    /**
     * Register the built-in light and dark themes.
     */
    void initializeDefaults();

private:
    std::map<std::string, std::unique_ptr<ITheme>> m_themes;
};
