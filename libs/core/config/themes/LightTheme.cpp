#include "LightTheme.hpp"

nlohmann::json LightTheme::styles() const {
    return nlohmann::json::parse(R"json(
    {
        "grid": {
            "horizontal": { "color": "#EDEDED" },
            "vertical": { "color": "#EDEDED" }
        },
        "candle": {
            "priceMark": {
                "high": { "color": "#76808F" },
                "low": { "color": "#76808F" }
            },
            "tooltip": {
                "text": { "color": "#76808F" }
            }
        },
        "xAxis": {
            "axisLine": { "color": "#DDDDDD" },
            "tickText": { "color": "#76808F" },
            "tickLine": { "color": "#DDDDDD" }
        },
        "yAxis": {
            "axisLine": { "color": "#DDDDDD" },
            "tickText": { "color": "#76808F" },
            "tickLine": { "color": "#DDDDDD" }
        },
        "crosshair": {
            "horizontal": {
                "line": { "color": "#76808F" },
                "text": { "borderColor": "#686D76", "backgroundColor": "#686D76" }
            },
            "vertical": {
                "line": { "color": "#76808F" },
                "text": { "borderColor": "#686D76", "backgroundColor": "#686D76" }
            }
        }
    }
    )json");
}
