/*
KlineCore — StyleTree
Role: Chart style tree (JSON) with built-in defaults and the merge used for partial overrides.
Inputs/Outputs: Takes partial style trees from options or themes; produces the merged tree and typed views of it.
Threading: Main thread only.
Integration: Owned by ChartStore; read by render-facing models such as HighLowPriceMarkModel.
Related: StyleTree.cpp, ChartOptions.hpp, themes/ThemeRegistry.hpp.
Assumptions: Unknown keys in overrides are kept; typed views fall back to defaults on wrong types.
*/
#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace StyleTree {

// Full default style tree.
nlohmann::json defaultStyles();

// Deep-merge source into target:
//  - objects merge key by key, arrays merge index by index
//  - null values in source are skipped
//  - anything else replaces the target value
//  - candle.tooltip.custom, when an array, replaces the target array outright
void merge(nlohmann::json& target, const nlohmann::json& source);

}

struct PriceMarkStyle {
    bool show = true;
    std::string color = "#76808F";
    double textOffset = 5.0;
    int textSize = 10;
    std::string textFamily = "Helvetica Neue";
    std::string textWeight = "normal";
};

// View of candle.priceMark.{show,high,low}
struct PriceMarkStyles {
    bool show = true;
    PriceMarkStyle high;
    PriceMarkStyle low;

    static PriceMarkStyles fromStyles(const nlohmann::json& styles);
};
