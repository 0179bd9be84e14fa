/*
KlineCore — TooltipStore
Role: Holds the crosshair and resolves it against the bar sequence (snapped x, bar under the cursor).
Inputs/Outputs: Pointer positions in; OnCrosshairChange actions out.
Threading: Main thread only.
Integration: Owned by Chart; ChartStore forces a recalculation after data or range changes.
Related: TooltipStore.cpp, ActionStore.hpp.
*/
#pragma once
#include "ChartCollaborators.hpp"
#include "ActionStore.hpp"
#include <optional>

class ChartStore;

class TooltipStore : public ITooltipStore {
public:
    TooltipStore(const ChartStore& store, const ITimeScale& timeScale, ActionStore* actions = nullptr);

    // Resolves and stores the crosshair; notifies when the bar or pane changed, or when forced
    void setCrosshair(Crosshair crosshair, bool notify = true, bool force = false);
    const std::optional<Crosshair>& crosshair() const { return m_crosshair; }

    void recalculateCrosshair(bool force) override;
    void clear() override;

private:
    void resolve(Crosshair& crosshair) const;

    const ChartStore& m_store;
    const ITimeScale& m_timeScale;
    ActionStore* m_actions = nullptr;
    std::optional<Crosshair> m_crosshair;
};
