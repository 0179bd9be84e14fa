#pragma once

#include <nlohmann/json.hpp>
#include <string>

/**
 * Interface for named chart style presets.
 * A theme is a partial style tree merged over the chart's current styles.
 */
class ITheme {
public:
    virtual ~ITheme() = default;

    /**
     * Get the display name of this theme.
     */
    virtual std::string name() const = 0;

    /**
     * Get the identifier passed as the `styles` option.
     */
    virtual std::string id() const = 0;

    /**
     * Get the partial style tree this theme applies.
     */
    virtual nlohmann::json styles() const = 0;
};
