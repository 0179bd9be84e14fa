/*
KlineCore — IndicatorStore
Role: Implements template registration, instance lifecycle and the built-in MA / VOL calculations.
Related: IndicatorStore.hpp.
*/
#include "IndicatorStore.hpp"
#include "ChartStore.hpp"
#include "../KlineLogging.hpp"
#include <algorithm>
#include <utility>

namespace {

std::string maKey(double period) {
    return "ma" + std::to_string(static_cast<int>(period));
}

// Simple moving average of value(bar) for each period; rows before warm-up lack the key
template <typename ValueFn>
void appendMovingAverages(const std::vector<KLineData>& bars, const std::vector<double>& periods,
                          ValueFn value, std::vector<IndicatorRow>& rows) {
    for (double p : periods) {
        const int period = static_cast<int>(p);
        if (period <= 0) continue;
        const std::string key = maKey(p);
        double sum = 0.0;
        for (std::size_t i = 0; i < bars.size(); ++i) {
            sum += value(bars[i]);
            if (i >= static_cast<std::size_t>(period)) {
                sum -= value(bars[i - static_cast<std::size_t>(period)]);
            }
            if (i + 1 >= static_cast<std::size_t>(period)) {
                rows[i][key] = sum / period;
            }
        }
    }
}

} // namespace

IndicatorStore::IndicatorStore(const ChartStore& store)
    : m_store(store) {
    registerTemplate(movingAverage());
    registerTemplate(volume());
}

// =============================================================================
// Built-ins
// =============================================================================

IndicatorTemplate IndicatorStore::movingAverage() {
    IndicatorTemplate tpl;
    tpl.name = "MA";
    tpl.calcParams = {5, 10, 30, 60};
    tpl.series = SeriesKind::Price;
    tpl.calc = [](const std::vector<KLineData>& bars, const std::vector<double>& params) {
        std::vector<IndicatorRow> rows(bars.size());
        appendMovingAverages(bars, params, [](const KLineData& bar) { return bar.close; }, rows);
        return rows;
    };
    return tpl;
}

IndicatorTemplate IndicatorStore::volume() {
    IndicatorTemplate tpl;
    tpl.name = "VOL";
    tpl.calcParams = {5, 10};
    tpl.series = SeriesKind::Volume;
    tpl.precision = 0;
    tpl.calc = [](const std::vector<KLineData>& bars, const std::vector<double>& params) {
        std::vector<IndicatorRow> rows(bars.size());
        for (std::size_t i = 0; i < bars.size(); ++i) {
            rows[i]["volume"] = bars[i].volume;
        }
        appendMovingAverages(bars, params, [](const KLineData& bar) { return bar.volume; }, rows);
        return rows;
    };
    return tpl;
}

// =============================================================================
// Templates & instances
// =============================================================================

bool IndicatorStore::registerTemplate(IndicatorTemplate tpl) {
    if (tpl.name.empty() || !tpl.calc) {
        kLog_Warning("IndicatorStore: template without name or calc rejected");
        return false;
    }
    const std::string name = tpl.name;
    m_templates[name] = std::move(tpl);
    return true;
}

bool IndicatorStore::createInstance(const std::string& name, const std::string& paneId,
                                    std::optional<std::vector<double>> calcParams) {
    auto it = m_templates.find(name);
    if (it == m_templates.end()) {
        kLog_Warning("IndicatorStore: unknown indicator" << QString::fromStdString(name));
        return false;
    }
    if (instance(paneId, name)) {
        kLog_Warning("IndicatorStore:" << QString::fromStdString(name) << "already on pane"
                     << QString::fromStdString(paneId));
        return false;
    }

    const IndicatorTemplate& tpl = it->second;
    Indicator indicator;
    indicator.paneId = paneId;
    indicator.name = name;
    indicator.calcParams = calcParams ? std::move(*calcParams) : tpl.calcParams;
    indicator.series = tpl.series;
    indicator.precision = seriesPrecision(tpl.series, tpl.precision);
    calculate(indicator);
    m_instances.push_back(std::move(indicator));
    return true;
}

bool IndicatorStore::removeInstance(const std::string& paneId, std::optional<std::string> name) {
    const auto before = m_instances.size();
    m_instances.erase(std::remove_if(m_instances.begin(), m_instances.end(),
                                     [&](const Indicator& ind) {
                                         return ind.paneId == paneId && (!name || ind.name == *name);
                                     }),
                      m_instances.end());
    return m_instances.size() != before;
}

const Indicator* IndicatorStore::instance(const std::string& paneId, const std::string& name) const {
    for (const auto& ind : m_instances) {
        if (ind.paneId == paneId && ind.name == name) return &ind;
    }
    return nullptr;
}

std::vector<const Indicator*> IndicatorStore::instances(const std::string& paneId) const {
    std::vector<const Indicator*> found;
    for (const auto& ind : m_instances) {
        if (ind.paneId == paneId) found.push_back(&ind);
    }
    return found;
}

// =============================================================================
// Calculation
// =============================================================================

void IndicatorStore::calculate(Indicator& indicator) const {
    auto it = m_templates.find(indicator.name);
    if (it == m_templates.end()) {
        indicator.result.clear();
        return;
    }
    indicator.result = it->second.calc(m_store.dataList(), indicator.calcParams);
}

void IndicatorStore::calcInstance(LoadDataType type, const IndicatorCalcFilter& filter) {
    int calculated = 0;
    for (auto& ind : m_instances) {
        if (filter.paneId && ind.paneId != *filter.paneId) continue;
        if (filter.name && ind.name != *filter.name) continue;
        // Every mode recomputes the full series
        calculate(ind);
        ++calculated;
    }
    kLog_Data("IndicatorStore:" << loadDataTypeName(type) << "recalculated" << calculated << "instances");
}

int IndicatorStore::seriesPrecision(SeriesKind series, int fallback) const {
    switch (series) {
        case SeriesKind::Price:  return m_store.precision().price;
        case SeriesKind::Volume: return m_store.precision().volume;
        case SeriesKind::Normal: return fallback;
    }
    return fallback;
}

void IndicatorStore::synchronizeSeriesPrecision() {
    for (auto& ind : m_instances) {
        ind.precision = seriesPrecision(ind.series, ind.precision);
    }
}
