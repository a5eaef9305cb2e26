#include <scenesync/error.hpp>
#include <scenesync/presence.hpp>

#include <gtest/gtest.h>

#include <set>
#include <vector>

using namespace scenesync;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

auto session(std::uint8_t n) -> SessionId {
    std::uint8_t raw[16] = {};
    raw[0] = 0x70;
    raw[15] = n;
    return SessionId{raw};
}

auto options() -> PresenceTracker::Options {
    return PresenceTracker::Options{.idle_after = 30s, .idle_timeout = 5min,
                                    .broadcast_interval = 100ms};
}

const auto t0 = PresenceTracker::Clock::time_point{} + 1h;

}  // namespace

// -- Defaults -----------------------------------------------------------------

TEST(Presence, default_user_name_uses_six_characters) {
    EXPECT_EQ(default_user_name("abcdefghij"), "User abcdef");
    EXPECT_EQ(default_user_name("ab"), "User ab");
}

TEST(Presence, default_user_color_is_stable_and_from_the_palette) {
    const auto palette = std::set<std::string>{
        "#FF6B6B", "#4ECDC4", "#45B7D1", "#96CEB4", "#FFEAA7",
        "#DDA0DD", "#98D8C8", "#F7DC6F", "#BB8FCE", "#85C1E2",
    };
    auto seen = std::set<std::string>{};
    for (const auto* id : {"alice", "bob", "carol", "dave", "erin", "frank", "a-very-long-user-id-0123456789"}) {
        auto color = default_user_color(id);
        EXPECT_TRUE(palette.contains(color)) << id << " -> " << color;
        EXPECT_EQ(color, default_user_color(id));
        seen.insert(color);
    }
    EXPECT_GT(seen.size(), 1u);
    EXPECT_EQ(default_user_color(""), "#FF6B6B");
}

TEST(Presence, set_local_completes_the_user) {
    auto tracker = PresenceTracker{options()};
    tracker.set_local("r", session(1), "user-123456", json{{"cursor", {{"x", 1}, {"y", 2}}}}, t0);

    auto entry = tracker.snapshot("r").at(session(1));
    EXPECT_EQ(entry["cursor"]["x"], 1);
    EXPECT_EQ(entry["user"]["id"], "user-123456");
    EXPECT_EQ(entry["user"]["name"], "User user-1");
    EXPECT_EQ(entry["user"]["color"], default_user_color("user-123456"));
    EXPECT_EQ(entry["status"], "active");
}

TEST(Presence, client_supplied_user_fields_win) {
    auto tracker = PresenceTracker{options()};
    tracker.set_local("r", session(1), "u", json{{"user", {{"name", "Ada"}, {"color", "#000"}}}}, t0);
    auto entry = tracker.snapshot("r").at(session(1));
    EXPECT_EQ(entry["user"]["name"], "Ada");
    EXPECT_EQ(entry["user"]["color"], "#000");
}

TEST(Presence, non_object_state_is_rejected) {
    auto tracker = PresenceTracker{options()};
    EXPECT_THROW(tracker.set_local("r", session(1), "u", json::array(), t0), Exception);
    EXPECT_NO_THROW(tracker.set_local("r", session(1), "u", json{}, t0));
}

// -- Lifecycle ----------------------------------------------------------------

TEST(Presence, goes_idle_then_expires) {
    auto tracker = PresenceTracker{options()};
    auto updates = std::vector<PresenceUpdate>{};
    auto sub = tracker.on_change("r", [&](const PresenceUpdate& u) { updates.push_back(u); });
    tracker.set_local("r", session(1), "u", json::object(), t0);
    tracker.tick(t0);
    ASSERT_EQ(updates.size(), 1u);

    tracker.tick(t0 + 31s);
    EXPECT_EQ(tracker.status("r", session(1)), PresenceStatus::idle);
    ASSERT_EQ(updates.size(), 2u);
    EXPECT_EQ(updates[1].sessions.at(session(1))["status"], "idle");

    tracker.tick(t0 + 5min);
    EXPECT_FALSE(tracker.status("r", session(1)).has_value());
    ASSERT_EQ(updates.size(), 3u);
    EXPECT_EQ(updates[2].removed, std::vector<SessionId>{session(1)});
    EXPECT_TRUE(tracker.snapshot("r").empty());
}

TEST(Presence, update_reactivates_an_idle_session) {
    auto tracker = PresenceTracker{options()};
    tracker.set_local("r", session(1), "u", json::object(), t0);
    tracker.tick(t0 + 40s);
    ASSERT_EQ(tracker.status("r", session(1)), PresenceStatus::idle);

    tracker.set_local("r", session(1), "u", json::object(), t0 + 41s);
    EXPECT_EQ(tracker.status("r", session(1)), PresenceStatus::active);
    tracker.tick(t0 + 5min);
    EXPECT_TRUE(tracker.status("r", session(1)).has_value());
}

TEST(Presence, updates_are_coalesced_per_interval) {
    auto tracker = PresenceTracker{options()};
    auto updates = std::vector<PresenceUpdate>{};
    auto sub = tracker.on_change("r", [&](const PresenceUpdate& u) { updates.push_back(u); });

    tracker.set_local("r", session(1), "u", json{{"cursor", 1}}, t0);
    tracker.tick(t0);  // first flush is immediate
    ASSERT_EQ(updates.size(), 1u);

    tracker.set_local("r", session(1), "u", json{{"cursor", 2}}, t0 + 10ms);
    tracker.set_local("r", session(2), "v", json{{"cursor", 9}}, t0 + 20ms);
    tracker.set_local("r", session(1), "u", json{{"cursor", 3}}, t0 + 30ms);
    tracker.tick(t0 + 50ms);
    EXPECT_EQ(updates.size(), 1u);

    tracker.tick(t0 + 100ms);
    ASSERT_EQ(updates.size(), 2u);
    EXPECT_EQ(updates[1].sessions.size(), 2u);
    EXPECT_EQ(updates[1].sessions.at(session(1))["cursor"], 3);

    tracker.tick(t0 + 300ms);
    EXPECT_EQ(updates.size(), 2u);
}

TEST(Presence, remove_notifies_immediately) {
    auto tracker = PresenceTracker{options()};
    auto updates = std::vector<PresenceUpdate>{};
    auto sub = tracker.on_change("r", [&](const PresenceUpdate& u) { updates.push_back(u); });
    tracker.set_local("r", session(1), "u", json::object(), t0);

    tracker.remove("r", session(1));
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].removed, std::vector<SessionId>{session(1)});
    EXPECT_TRUE(updates[0].sessions.empty());

    tracker.remove("r", session(1));
    EXPECT_EQ(updates.size(), 1u);

    tracker.tick(t0 + 1s);
    EXPECT_EQ(updates.size(), 1u);
}

TEST(Presence, remote_entries_are_kept_as_received_and_expire) {
    auto tracker = PresenceTracker{options()};
    auto updates = std::vector<PresenceUpdate>{};
    auto sub = tracker.on_change("r", [&](const PresenceUpdate& u) { updates.push_back(u); });
    const auto entry = json{{"user", {{"id", "u"}}}, {"cursor", 4}, {"status", "idle"}};

    tracker.apply_remote("r", session(3), entry, t0);
    EXPECT_EQ(tracker.status("r", session(3)), PresenceStatus::idle);
    EXPECT_EQ(tracker.snapshot("r").at(session(3)), entry);
    tracker.tick(t0 + 1min);
    EXPECT_TRUE(updates.empty());

    tracker.tick(t0 + 5min);
    EXPECT_FALSE(tracker.status("r", session(3)).has_value());
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].removed, std::vector<SessionId>{session(3)});
    EXPECT_TRUE(updates[0].remote.contains(session(3)));
}

TEST(Presence, removing_a_remote_entry_is_flagged) {
    auto tracker = PresenceTracker{options()};
    auto updates = std::vector<PresenceUpdate>{};
    auto sub = tracker.on_change("r", [&](const PresenceUpdate& u) { updates.push_back(u); });
    tracker.apply_remote("r", session(3), json::object(), t0);
    tracker.set_local("r", session(1), "u", json::object(), t0);

    tracker.remove("r", session(3));
    tracker.remove("r", session(1));
    ASSERT_EQ(updates.size(), 2u);
    EXPECT_TRUE(updates[0].remote.contains(session(3)));
    EXPECT_TRUE(updates[1].remote.empty());
}

TEST(Presence, rooms_are_isolated_and_clear_is_silent) {
    auto tracker = PresenceTracker{options()};
    auto count = 0;
    auto sub = tracker.on_change("a", [&](const PresenceUpdate&) { ++count; });
    tracker.set_local("a", session(1), "u", json::object(), t0);
    tracker.set_local("b", session(2), "v", json::object(), t0);
    tracker.tick(t0);
    EXPECT_EQ(count, 1);
    EXPECT_EQ(tracker.snapshot("b").size(), 1u);

    tracker.clear("a");
    EXPECT_TRUE(tracker.snapshot("a").empty());
    EXPECT_EQ(count, 1);
}

TEST(Presence, released_subscription_gets_nothing) {
    auto tracker = PresenceTracker{options()};
    auto count = 0;
    auto sub = tracker.on_change("r", [&](const PresenceUpdate&) { ++count; });
    sub.reset();
    tracker.set_local("r", session(1), "u", json::object(), t0);
    tracker.tick(t0);
    EXPECT_EQ(count, 0);
}
