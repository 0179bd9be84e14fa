/*
KlineCore — IndicatorStore
Role: Registry of indicator templates and the per-pane indicator instances computed from the bar sequence.
Inputs/Outputs: ChartStore calls calcInstance after data mutations; results are read by the render layer per pane.
Threading: Main thread only.
Performance: Each calculation is one pass over the full sequence per instance.
Integration: Owned by Chart; reads bars and precision from a const ChartStore.
Observability: Calculations via kLog_Data; unknown templates via kLog_Warning.
Related: IndicatorStore.cpp, ChartCollaborators.hpp.
Assumptions: A result row with a missing key means the value is undefined for that bar (warm-up).
*/
#pragma once
#include "ChartCollaborators.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

class ChartStore;

// Which precision an indicator follows
enum class SeriesKind {
    Normal,
    Price,
    Volume
};

using IndicatorRow = std::map<std::string, double>;

using IndicatorCalc = std::function<std::vector<IndicatorRow>(const std::vector<KLineData>& bars,
                                                              const std::vector<double>& calcParams)>;

struct IndicatorTemplate {
    std::string name;
    std::vector<double> calcParams;
    SeriesKind series = SeriesKind::Normal;
    int precision = 4;
    IndicatorCalc calc;
};

struct Indicator {
    std::string paneId;
    std::string name;
    std::vector<double> calcParams;
    SeriesKind series = SeriesKind::Normal;
    int precision = 4;
    std::vector<IndicatorRow> result;
};

class IndicatorStore : public IIndicatorStore {
public:
    explicit IndicatorStore(const ChartStore& store);

    // Replaces an existing template of the same name
    bool registerTemplate(IndicatorTemplate tpl);
    bool hasTemplate(const std::string& name) const { return m_templates.count(name) > 0; }

    // Creates and calculates an instance; false for unknown templates or duplicates in the pane
    bool createInstance(const std::string& name, const std::string& paneId,
                        std::optional<std::vector<double>> calcParams = std::nullopt);
    // Without a name every instance in the pane goes
    bool removeInstance(const std::string& paneId, std::optional<std::string> name = std::nullopt);

    const Indicator* instance(const std::string& paneId, const std::string& name) const;
    std::vector<const Indicator*> instances(const std::string& paneId) const;

    void calcInstance(LoadDataType type, const IndicatorCalcFilter& filter = {}) override;
    void synchronizeSeriesPrecision() override;

    // Built-ins
    static IndicatorTemplate movingAverage();
    static IndicatorTemplate volume();

private:
    void calculate(Indicator& indicator) const;
    int seriesPrecision(SeriesKind series, int fallback) const;

    const ChartStore& m_store;
    std::map<std::string, IndicatorTemplate> m_templates;
    std::vector<Indicator> m_instances;
};
