#include <gtest/gtest.h>

#include "lanmonitor/EventBus.h"

#include <sstream>
#include <vector>

using namespace LanMonitor;

namespace {

class Recorder : public EventSubscriber {
public:
    std::vector<std::pair<std::string, nlohmann::json>> events;

    void onEvent(const std::string& eventType, const nlohmann::json& payload) override {
        events.emplace_back(eventType, payload);
    }
};

class Thrower : public EventSubscriber {
public:
    void onEvent(const std::string&, const nlohmann::json&) override {
        throw std::runtime_error("subscriber exploded");
    }
};

}  // namespace

TEST(EventBusTest, DeliversToEverySubscriber) {
    EventBus bus;
    auto a = std::make_shared<Recorder>();
    auto b = std::make_shared<Recorder>();
    bus.subscribe(a);
    bus.subscribe(b);

    const nlohmann::json payload = {{"mac_address", "aa:bb:cc:dd:ee:01"}};
    EXPECT_EQ(bus.publish(EventType::DEVICE_NEW, payload), 2u);

    ASSERT_EQ(a->events.size(), 1u);
    EXPECT_EQ(a->events[0].first, "device_new");
    EXPECT_EQ(a->events[0].second["mac_address"], "aa:bb:cc:dd:ee:01");
    EXPECT_EQ(b->events.size(), 1u);
}

TEST(EventBusTest, ThrowingSubscriberDoesNotStopOthers) {
    EventBus bus;
    auto first = std::make_shared<Recorder>();
    auto last = std::make_shared<Recorder>();
    bus.subscribe(first);
    bus.subscribe(std::make_shared<Thrower>());
    bus.subscribe(last);

    EXPECT_EQ(bus.publish(EventType::SCAN_STARTED, nlohmann::json::object()), 2u);
    EXPECT_EQ(first->events.size(), 1u);
    EXPECT_EQ(last->events.size(), 1u);
}

TEST(EventBusTest, UnsubscribeStopsDelivery) {
    EventBus bus;
    auto r = std::make_shared<Recorder>();
    const auto id = bus.subscribe(r);
    EXPECT_EQ(bus.subscriberCount(), 1u);
    EXPECT_EQ(bus.subscribe(nullptr), 0u);

    EXPECT_TRUE(bus.unsubscribe(id));
    EXPECT_FALSE(bus.unsubscribe(id));
    EXPECT_EQ(bus.publish(EventType::SCAN_COMPLETED, {}), 0u);
    EXPECT_TRUE(r->events.empty());
}

TEST(EventBusTest, JsonLinesSubscriberWritesOneObjectPerLine) {
    std::ostringstream out;
    JsonLinesSubscriber sink(out);

    sink.onEvent(EventType::DEVICE_IP_CHANGED, {{"old_ip", "10.0.0.2"}, {"new_ip", "10.0.0.3"}});
    sink.onEvent(EventType::SCAN_COMPLETED, {{"devices_found", 4}});

    std::istringstream in(out.str());
    std::string line;
    std::vector<nlohmann::json> lines;
    while (std::getline(in, line)) {
        lines.push_back(nlohmann::json::parse(line));
    }

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0]["type"], "device_ip_changed");
    EXPECT_EQ(lines[0]["data"]["new_ip"], "10.0.0.3");
    EXPECT_TRUE(lines[0]["timestamp"].is_string());
    EXPECT_EQ(lines[1]["data"]["devices_found"], 4);
}
