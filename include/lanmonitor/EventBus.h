/**
 * @file EventBus.h
 * @brief Named-event fan-out from the presence engine to any number of subscribers
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>

namespace LanMonitor {

namespace EventType {
inline constexpr const char* SCAN_STARTED = "scan_started";
inline constexpr const char* SCAN_COMPLETED = "scan_completed";
inline constexpr const char* SCAN_FAILED = "scan_failed";
inline constexpr const char* DEVICE_CONNECTED = "device_connected";
inline constexpr const char* DEVICE_DISCONNECTED = "device_disconnected";
inline constexpr const char* DEVICE_IP_CHANGED = "device_ip_changed";
inline constexpr const char* DEVICE_NEW = "device_new";
}  // namespace EventType

/**
 * @brief Receiver of published events.
 */
class EventSubscriber {
public:
    virtual ~EventSubscriber() = default;
    virtual void onEvent(const std::string& eventType, const nlohmann::json& payload) = 0;
};

/**
 * @class EventBus
 * @brief Synchronous publish to every subscriber in subscription order
 *
 * A subscriber that throws is logged and skipped; the others still receive
 * the event. Subscribers are invoked without the bus lock held, so they may
 * subscribe or unsubscribe from inside onEvent().
 */
class EventBus {
public:
    using SubscriptionId = uint64_t;

    EventBus() = default;

    // Prevent copying
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriptionId subscribe(std::shared_ptr<EventSubscriber> subscriber);

    /// @return false if id is not subscribed
    bool unsubscribe(SubscriptionId id);

    /// @return Number of subscribers that received the event without throwing
    size_t publish(const std::string& eventType, const nlohmann::json& payload);

    size_t subscriberCount() const;

private:
    mutable std::mutex m_mutex;
    std::map<SubscriptionId, std::shared_ptr<EventSubscriber>> m_subscribers;
    SubscriptionId m_nextId = 1;
};

/**
 * @class JsonLinesSubscriber
 * @brief Writes {"type","data","timestamp"} objects, one per line
 */
class JsonLinesSubscriber final : public EventSubscriber {
public:
    explicit JsonLinesSubscriber(std::ostream& out) : m_out(out) {}

    void onEvent(const std::string& eventType, const nlohmann::json& payload) override;

private:
    std::mutex m_mutex;
    std::ostream& m_out;
};

}  // namespace LanMonitor
