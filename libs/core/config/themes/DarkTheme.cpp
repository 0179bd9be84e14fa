#include "DarkTheme.hpp"

nlohmann::json DarkTheme::styles() const {
    return nlohmann::json::parse(R"json(
    {
        "grid": {
            "horizontal": { "color": "#292929" },
            "vertical": { "color": "#292929" }
        },
        "candle": {
            "priceMark": {
                "high": { "color": "#929AA5" },
                "low": { "color": "#929AA5" }
            },
            "tooltip": {
                "text": { "color": "#929AA5" }
            }
        },
        "xAxis": {
            "axisLine": { "color": "#333333" },
            "tickText": { "color": "#929AA5" },
            "tickLine": { "color": "#333333" }
        },
        "yAxis": {
            "axisLine": { "color": "#333333" },
            "tickText": { "color": "#929AA5" },
            "tickLine": { "color": "#333333" }
        },
        "crosshair": {
            "horizontal": {
                "line": { "color": "#929AA5" },
                "text": { "borderColor": "#373a40", "backgroundColor": "#373a40" }
            },
            "vertical": {
                "line": { "color": "#929AA5" },
                "text": { "borderColor": "#373a40", "backgroundColor": "#373a40" }
            }
        }
    }
    )json");
}
