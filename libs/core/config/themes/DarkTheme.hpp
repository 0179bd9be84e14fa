#pragma once

#include "ITheme.hpp"

/**
 * Dark chart theme: light text and grid on a dark canvas.
 */
class DarkTheme : public ITheme {
public:
    std::string name() const override { return "Dark"; }
    std::string id() const override { return "dark"; }
    nlohmann::json styles() const override;
};
