/**
 * @file EventBus.cpp
 * @brief Named-event fan-out from the presence engine to any number of subscribers
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#include "lanmonitor/EventBus.h"
#include "lanmonitor/Debug.h"
#include "lanmonitor/TimeUtils.h"

#include <vector>

namespace LanMonitor {

EventBus::SubscriptionId EventBus::subscribe(std::shared_ptr<EventSubscriber> subscriber) {
    if (!subscriber) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    const SubscriptionId id = m_nextId++;
    m_subscribers[id] = std::move(subscriber);
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_subscribers.erase(id) > 0;
}

size_t EventBus::publish(const std::string& eventType, const nlohmann::json& payload) {
    std::vector<std::shared_ptr<EventSubscriber>> targets;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        targets.reserve(m_subscribers.size());
        for (const auto& pair : m_subscribers) {
            targets.push_back(pair.second);
        }
    }

    size_t delivered = 0;
    for (const auto& subscriber : targets) {
        try {
            subscriber->onEvent(eventType, payload);
            ++delivered;
        } catch (const std::exception& e) {
            LOG_ERROR("[EventBus] Subscriber failed on " << eventType << ": " << e.what());
        }
    }
    return delivered;
}

size_t EventBus::subscriberCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_subscribers.size();
}

void JsonLinesSubscriber::onEvent(const std::string& eventType, const nlohmann::json& payload) {
    nlohmann::json line;
    line["type"] = eventType;
    line["data"] = payload;
    line["timestamp"] = nowIso8601();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_out << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    m_out.flush();
}

}  // namespace LanMonitor
