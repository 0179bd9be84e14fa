#include "StyleTree.hpp"
#include <type_traits>

namespace {

template <typename T>
T valueOr(const nlohmann::json& node, const char* key, T fallback) {
    if (!node.is_object()) return fallback;
    auto it = node.find(key);
    if (it == node.end()) return fallback;
    if constexpr (std::is_same_v<T, bool>) {
        return it->is_boolean() ? it->template get<bool>() : fallback;
    } else if constexpr (std::is_arithmetic_v<T>) {
        return it->is_number() ? it->template get<T>() : fallback;
    } else {
        return it->is_string() ? it->template get<T>() : fallback;
    }
}

const nlohmann::json& childOrNull(const nlohmann::json& node, const char* key) {
    static const nlohmann::json kNull;
    if (!node.is_object()) return kNull;
    auto it = node.find(key);
    return it == node.end() ? kNull : *it;
}

void mergeInto(nlohmann::json& target, const nlohmann::json& source) {
    if (source.is_object()) {
        for (auto it = source.begin(); it != source.end(); ++it) {
            const auto& value = it.value();
            if (value.is_null()) continue;
            auto& slot = target[it.key()];
            if (value.is_structured() && slot.type() == value.type()) {
                mergeInto(slot, value);
            } else {
                slot = value;
            }
        }
    } else if (source.is_array()) {
        for (std::size_t i = 0; i < source.size(); ++i) {
            const auto& value = source[i];
            if (value.is_null()) continue;
            if (i < target.size() && value.is_structured() && target[i].type() == value.type()) {
                mergeInto(target[i], value);
            } else if (i < target.size()) {
                target[i] = value;
            } else {
                while (target.size() < i) target.push_back(nullptr);
                target.push_back(value);
            }
        }
    }
}

PriceMarkStyle readPriceMark(const nlohmann::json& node) {
    PriceMarkStyle style;
    style.show = valueOr(node, "show", style.show);
    style.color = valueOr(node, "color", style.color);
    style.textOffset = valueOr(node, "textOffset", style.textOffset);
    style.textSize = valueOr(node, "textSize", style.textSize);
    style.textFamily = valueOr(node, "textFamily", style.textFamily);
    style.textWeight = valueOr(node, "textWeight", style.textWeight);
    return style;
}

} // namespace

namespace StyleTree {

nlohmann::json defaultStyles() {
    return nlohmann::json::parse(R"json(
    {
        "grid": {
            "show": true,
            "horizontal": { "show": true, "size": 1, "color": "#EDEDED", "style": "dashed", "dashedValue": [2, 2] },
            "vertical": { "show": true, "size": 1, "color": "#EDEDED", "style": "dashed", "dashedValue": [2, 2] }
        },
        "candle": {
            "type": "candle_solid",
            "bar": { "upColor": "#2DC08E", "downColor": "#F92855", "noChangeColor": "#888888" },
            "priceMark": {
                "show": true,
                "high": { "show": true, "color": "#76808F", "textOffset": 5, "textSize": 10, "textFamily": "Helvetica Neue", "textWeight": "normal" },
                "low": { "show": true, "color": "#76808F", "textOffset": 5, "textSize": 10, "textFamily": "Helvetica Neue", "textWeight": "normal" },
                "last": {
                    "show": true, "upColor": "#2DC08E", "downColor": "#F92855", "noChangeColor": "#888888",
                    "line": { "show": true, "style": "dashed", "dashedValue": [4, 4], "size": 1 }
                }
            },
            "tooltip": {
                "showRule": "always",
                "showType": "standard",
                "custom": [
                    { "title": "time", "value": "{time}" },
                    { "title": "open", "value": "{open}" },
                    { "title": "high", "value": "{high}" },
                    { "title": "low", "value": "{low}" },
                    { "title": "close", "value": "{close}" },
                    { "title": "volume", "value": "{volume}" }
                ],
                "defaultValue": "n/a",
                "text": {
                    "size": 12, "family": "Helvetica Neue", "weight": "normal", "color": "#76808F",
                    "marginLeft": 8, "marginTop": 4, "marginRight": 8, "marginBottom": 4
                }
            }
        },
        "indicator": {
            "lastValueMark": { "show": false },
            "tooltip": { "showRule": "always", "showType": "standard", "showName": true, "showParams": true }
        },
        "xAxis": {
            "show": true,
            "size": "auto",
            "axisLine": { "show": true, "color": "#DDDDDD", "size": 1 },
            "tickText": { "show": true, "color": "#76808F", "size": 12, "family": "Helvetica Neue", "weight": "normal", "marginStart": 4, "marginEnd": 4 },
            "tickLine": { "show": true, "size": 1, "length": 3, "color": "#DDDDDD" }
        },
        "yAxis": {
            "show": true,
            "size": "auto",
            "position": "right",
            "type": "normal",
            "inside": false,
            "reverse": false,
            "axisLine": { "show": true, "color": "#DDDDDD", "size": 1 },
            "tickText": { "show": true, "color": "#76808F", "size": 12, "family": "Helvetica Neue", "weight": "normal", "marginStart": 4, "marginEnd": 4 },
            "tickLine": { "show": true, "size": 1, "length": 3, "color": "#DDDDDD" }
        },
        "crosshair": {
            "show": true,
            "horizontal": {
                "show": true,
                "line": { "show": true, "style": "dashed", "dashedValue": [4, 2], "size": 1, "color": "#76808F" },
                "text": { "show": true, "size": 12, "color": "#FFFFFF", "borderColor": "#686D76", "backgroundColor": "#686D76" }
            },
            "vertical": {
                "show": true,
                "line": { "show": true, "style": "dashed", "dashedValue": [4, 2], "size": 1, "color": "#76808F" },
                "text": { "show": true, "size": 12, "color": "#FFFFFF", "borderColor": "#686D76", "backgroundColor": "#686D76" }
            }
        }
    }
    )json");
}

void merge(nlohmann::json& target, const nlohmann::json& source) {
    if (!source.is_structured() || target.type() != source.type()) return;
    mergeInto(target, source);

    // Legend entries are a list, not a patch: replace instead of merging by index
    const auto& custom = childOrNull(childOrNull(childOrNull(source, "candle"), "tooltip"), "custom");
    if (custom.is_array()) {
        target["candle"]["tooltip"]["custom"] = custom;
    }
}

} // namespace StyleTree

PriceMarkStyles PriceMarkStyles::fromStyles(const nlohmann::json& styles) {
    const auto& priceMark = childOrNull(childOrNull(styles, "candle"), "priceMark");
    PriceMarkStyles out;
    out.show = valueOr(priceMark, "show", out.show);
    out.high = readPriceMark(childOrNull(priceMark, "high"));
    out.low = readPriceMark(childOrNull(priceMark, "low"));
    return out;
}
