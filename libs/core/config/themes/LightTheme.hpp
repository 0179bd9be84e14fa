#pragma once

#include "ITheme.hpp"

/**
 * Light chart theme. Restores the colors of the default style tree.
 */
class LightTheme : public ITheme {
public:
    std::string name() const override { return "Light"; }
    std::string id() const override { return "light"; }
    nlohmann::json styles() const override;
};
