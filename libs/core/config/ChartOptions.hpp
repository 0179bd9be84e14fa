/*
KlineCore — ChartOptions
Role: Partial chart configuration; every field is optional and only set fields are applied.
Inputs/Outputs: Built in code or read from a JSON object/file; consumed by ChartStore::applyOptions.
Threading: Plain value type.
Integration: Chart constructor, ChartStore::applyOptions, apps/kline_replay.
Related: ChartOptions.cpp, StyleTree.hpp, CustomApi.hpp.
Assumptions: Wrongly typed JSON fields are skipped, never rejected.
*/
#pragma once
#include "CustomApi.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

struct ChartOptions {
    // A registered theme id, or a partial style tree
    using Styles = std::variant<std::string, nlohmann::json>;

    std::optional<std::string> locale;
    std::optional<std::string> timezone;
    std::optional<Styles> styles;
    std::optional<CustomApi> customApi;
    std::optional<std::string> thousandsSeparator;
    std::optional<double> decimalFoldThreshold;

    // Releases a load-more request that has been pending this long (0 = never)
    std::optional<int64_t> loadMoreTimeoutMs;

    static ChartOptions fromJson(const nlohmann::json& j);

    // nullopt when the file is missing or is not a JSON object
    static std::optional<ChartOptions> loadFromFile(const std::string& path);
};
