#include "ActionStore.hpp"
#include <algorithm>

ActionStore::SubscriptionId ActionStore::subscribe(ActionType type, ActionCallback callback) {
    if (!callback) return 0;
    const SubscriptionId id = m_nextId++;
    m_actions[type].emplace_back(id, std::move(callback));
    return id;
}

void ActionStore::unsubscribe(ActionType type, SubscriptionId id) {
    auto it = m_actions.find(type);
    if (it == m_actions.end()) return;
    auto& callbacks = it->second;
    callbacks.erase(std::remove_if(callbacks.begin(), callbacks.end(),
                                   [id](const auto& entry) { return entry.first == id; }),
                    callbacks.end());
    if (callbacks.empty()) {
        m_actions.erase(it);
    }
}

void ActionStore::unsubscribe(ActionType type) {
    m_actions.erase(type);
}

bool ActionStore::has(ActionType type) const {
    auto it = m_actions.find(type);
    return it != m_actions.end() && !it->second.empty();
}

void ActionStore::execute(ActionType type, const ActionPayload& payload) const {
    auto it = m_actions.find(type);
    if (it == m_actions.end()) return;
    // Copy: a callback may unsubscribe while we iterate
    const auto callbacks = it->second;
    for (const auto& [id, callback] : callbacks) {
        callback(payload);
    }
}
