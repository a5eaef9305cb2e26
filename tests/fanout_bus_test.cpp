#include <scenesync/error.hpp>
#include <scenesync/fanout_bus.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

using namespace scenesync;
using namespace std::chrono_literals;
using json = nlohmann::json;

// -- Envelope -----------------------------------------------------------------

TEST(BusMessage, json_envelope) {
    auto m = BusMessage{.type = BusMessageType::presence_leave, .instance = "node-1",
                        .room = "site:1", .payload = json{{"session", "ab"}}};
    auto j = json(m);
    EXPECT_EQ(j["type"], "presence_leave");
    EXPECT_EQ(j["room"], "site:1");
    EXPECT_EQ(j.get<BusMessage>(), m);
}

TEST(BusMessage, malformed_envelopes_are_rejected) {
    EXPECT_THROW(json::array().get<BusMessage>(), Exception);
    EXPECT_THROW((json{{"type", "gossip"}, {"instance", "a"}, {"room", "r"}, {"payload", {}}})
                     .get<BusMessage>(),
                 Exception);
    EXPECT_THROW((json{{"type", "operation"}, {"instance", 1}, {"room", "r"}, {"payload", {}}})
                     .get<BusMessage>(),
                 Exception);
    EXPECT_THROW((json{{"type", "operation"}, {"instance", "a"}, {"room", "r"}}).get<BusMessage>(),
                 Exception);
}

TEST(BusMessage, channel_name) {
    EXPECT_EQ(bus_channel("site_42:3"), "collab:site_42:3:broadcast");
}

// -- LocalBus -----------------------------------------------------------------

TEST(LocalBus, delivers_to_subscribers_of_the_room) {
    auto bus = LocalBus{};
    auto got = std::vector<BusMessage>{};
    auto other = 0;
    auto sub = bus.subscribe("site:1", [&](const BusMessage& m) { got.push_back(m); });
    auto sub2 = bus.subscribe("site:2", [&](const BusMessage&) { ++other; });

    bus.publish(BusMessage{.instance = "a", .room = "site:1", .payload = json{{"ops", json::array()}}});
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].instance, "a");
    EXPECT_EQ(other, 0);
    EXPECT_EQ(bus.published(), 1u);
}

TEST(LocalBus, releasing_the_subscription_stops_delivery) {
    auto bus = LocalBus{};
    auto count = 0;
    auto sub = bus.subscribe("r", [&](const BusMessage&) { ++count; });
    bus.publish(BusMessage{.room = "r"});
    sub.reset();
    bus.publish(BusMessage{.room = "r"});
    EXPECT_EQ(count, 1);
}

TEST(LocalBus, subscription_may_outlive_the_bus) {
    auto sub = Subscription{};
    {
        auto bus = LocalBus{};
        sub = bus.subscribe("r", [](const BusMessage&) {});
    }
    EXPECT_NO_THROW(sub.reset());
}

TEST(LocalBus, outage_raises_fanout_unavailable) {
    auto bus = LocalBus{};
    bus.set_available(false);
    EXPECT_FALSE(bus.available());
    try {
        bus.publish(BusMessage{.room = "r"});
        FAIL() << "publish should fail";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::fanout_unavailable);
    }
    EXPECT_EQ(bus.published(), 0u);
    bus.set_available(true);
    EXPECT_NO_THROW(bus.publish(BusMessage{.room = "r"}));
}

TEST(LocalBus, partition_drops_deliveries_and_healing_bumps_the_epoch) {
    auto bus = LocalBus{};
    auto count = 0;
    auto sub = bus.subscribe("r", [&](const BusMessage&) { ++count; });
    EXPECT_EQ(bus.epoch(), 0u);

    bus.set_partitioned(true);
    EXPECT_NO_THROW(bus.publish(BusMessage{.room = "r"}));
    EXPECT_EQ(count, 0);
    EXPECT_EQ(bus.epoch(), 0u);

    bus.set_partitioned(false);
    EXPECT_EQ(bus.epoch(), 1u);
    bus.publish(BusMessage{.room = "r"});
    EXPECT_EQ(count, 1);
}

TEST(LocalBus, locks_have_one_owner_until_released_or_expired) {
    auto bus = LocalBus{};
    const auto key = lock_key("site:1", "snapshot");
    EXPECT_EQ(key, "collab:site:1:lock:snapshot");

    EXPECT_TRUE(bus.try_lock(key, "node-a", 30s));
    EXPECT_FALSE(bus.try_lock(key, "node-b", 30s));
    bus.unlock(key, "node-b");
    EXPECT_FALSE(bus.try_lock(key, "node-b", 30s));
    bus.unlock(key, "node-a");
    EXPECT_TRUE(bus.try_lock(key, "node-b", 1ms));

    std::this_thread::sleep_for(5ms);
    EXPECT_TRUE(bus.try_lock(key, "node-a", 30s));
}

TEST(LocalBus, locking_during_an_outage_raises) {
    auto bus = LocalBus{};
    bus.set_available(false);
    EXPECT_THROW(bus.try_lock(lock_key("r", "snapshot"), "node-a", 30s), Exception);
}
