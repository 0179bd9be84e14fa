#include "ChartOptions.hpp"
#include "../KlineLogging.hpp"
#include <fstream>

ChartOptions ChartOptions::fromJson(const nlohmann::json& j) {
    ChartOptions options;
    if (!j.is_object()) return options;

    if (auto it = j.find("locale"); it != j.end() && it->is_string()) {
        options.locale = it->get<std::string>();
    }
    if (auto it = j.find("timezone"); it != j.end() && it->is_string()) {
        options.timezone = it->get<std::string>();
    }
    if (auto it = j.find("styles"); it != j.end()) {
        if (it->is_string()) {
            options.styles = Styles{it->get<std::string>()};
        } else if (it->is_object()) {
            options.styles = Styles{*it};
        }
    }
    if (auto it = j.find("thousandsSeparator"); it != j.end() && it->is_string()) {
        options.thousandsSeparator = it->get<std::string>();
    }
    if (auto it = j.find("decimalFoldThreshold"); it != j.end() && it->is_number()) {
        options.decimalFoldThreshold = it->get<double>();
    }
    if (auto it = j.find("loadMoreTimeoutMs"); it != j.end() && it->is_number_integer()) {
        options.loadMoreTimeoutMs = it->get<int64_t>();
    }
    return options;
}

std::optional<ChartOptions> ChartOptions::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        kLog_Warning("ChartOptions: cannot open" << QString::fromStdString(path));
        return std::nullopt;
    }
    const auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        kLog_Warning("ChartOptions:" << QString::fromStdString(path) << "is not a JSON object");
        return std::nullopt;
    }
    return fromJson(j);
}
