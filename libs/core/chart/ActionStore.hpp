#pragma once
#include "KLineData.h"
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class ActionType {
    OnZoom,
    OnScroll,
    OnVisibleRangeChange,
    OnCrosshairChange
};

struct ZoomAction { double scale = 1.0; };
struct ScrollAction { double distance = 0.0; };

// Crosshair resolved against the data sequence
struct Crosshair {
    std::optional<double> x;
    std::optional<double> y;
    std::string paneId;
    double realX = 0.0;
    int dataIndex = -1;
    int realDataIndex = -1;
    std::optional<KLineData> kLineData;

    bool operator==(const Crosshair&) const = default;
};

using ActionPayload = std::variant<ZoomAction, ScrollAction, VisibleRange, Crosshair>;
using ActionCallback = std::function<void(const ActionPayload&)>;

class ActionStore {
public:
    using SubscriptionId = uint64_t;

    SubscriptionId subscribe(ActionType type, ActionCallback callback);
    void unsubscribe(ActionType type, SubscriptionId id);
    void unsubscribe(ActionType type);

    bool has(ActionType type) const;
    void execute(ActionType type, const ActionPayload& payload) const;

private:
    std::map<ActionType, std::vector<std::pair<SubscriptionId, ActionCallback>>> m_actions;
    SubscriptionId m_nextId = 1;
};
