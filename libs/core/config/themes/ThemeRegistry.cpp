#include "ThemeRegistry.hpp"
#include "DarkTheme.hpp"
#include "LightTheme.hpp"
#include "../../KlineLogging.hpp"

void ThemeRegistry::registerTheme(std::unique_ptr<ITheme> theme) {
    if (!theme) {
        kLog_Warning("ThemeRegistry: Attempted to register null theme");
        return;
    }

    const std::string id = theme->id();
    if (m_themes.find(id) != m_themes.end()) {
        kLog_Warning("ThemeRegistry: Theme" << QString::fromStdString(id) << "already registered, replacing");
    }

    m_themes[id] = std::move(theme);
    kLog_App("ThemeRegistry: Registered theme" << QString::fromStdString(id)
             << "-" << QString::fromStdString(m_themes[id]->name()));
}

std::optional<nlohmann::json> ThemeRegistry::styles(const std::string& themeId) const {
    auto it = m_themes.find(themeId);
    if (it == m_themes.end()) {
        return std::nullopt;
    }
    return it->second->styles();
}

std::vector<std::string> ThemeRegistry::availableThemes() const {
    std::vector<std::string> themes;
    themes.reserve(m_themes.size());
    for (const auto& pair : m_themes) {
        themes.push_back(pair.first);
    }
    return themes;
}

std::string ThemeRegistry::themeName(const std::string& themeId) const {
    auto it = m_themes.find(themeId);
    if (it == m_themes.end()) {
        return {};
    }
    return it->second->name();
}

void ThemeRegistry::initializeDefaults() {
    registerTheme(std::make_unique<LightTheme>());
    registerTheme(std::make_unique<DarkTheme>());
}
