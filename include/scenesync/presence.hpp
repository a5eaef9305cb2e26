/// @file presence.hpp
/// @brief Ephemeral per-room presence (cursor, selection, viewport, user).

#pragma once

#include <scenesync/subscription.hpp>
#include <scenesync/types.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace scenesync {

/// Liveness of a presence entry. A session with no entry is absent.
enum class PresenceStatus : std::uint8_t {
    active,  ///< Updated within the idle threshold.
    idle,    ///< Still connected but quiet.
};

constexpr auto to_string_view(PresenceStatus status) noexcept -> std::string_view {
    switch (status) {
        case PresenceStatus::active: return "active";
        case PresenceStatus::idle:   return "idle";
    }
    return "unknown";
}

/// A coalesced batch of presence changes for one room.
struct PresenceUpdate {
    RoomId room;
    std::map<SessionId, nlohmann::json> sessions;  ///< Latest entry per changed session.
    std::vector<SessionId> removed;                ///< Sessions that became absent.
    std::set<SessionId> remote;                    ///< Of those, sessions owned by another process.
};

/// Default display colour for a user: one of ten fixed colours, chosen by a
/// hash of the user id so it is stable across sessions and processes.
auto default_user_color(std::string_view user_id) -> std::string;

/// Default display name for a user: `User <first six characters of id>`.
auto default_user_name(std::string_view user_id) -> std::string;

/// Tracks presence per room and broadcasts coalesced changes.
///
/// Presence is last-writer-wins per session and never persisted. Entries go
/// `active -> idle` after `idle_after` without an update and disappear after
/// `idle_timeout` or an explicit remove(). Updates mark the room dirty;
/// tick() delivers them at most once per `broadcast_interval`. Removals are
/// delivered immediately.
///
/// Entries announced by other processes are kept with apply_remote(). They
/// are never flushed by tick() (their owner broadcasts them) but do expire,
/// so a process that dies without a leave does not leave ghosts behind.
///
/// Time is passed in by the caller so that expiry is deterministic in tests.
/// All methods are thread-safe; callbacks run without internal locks held.
class PresenceTracker {
public:
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<void(const PresenceUpdate&)>;

    struct Options {
        Clock::duration idle_after = std::chrono::seconds{30};
        Clock::duration idle_timeout = std::chrono::minutes{5};
        Clock::duration broadcast_interval = std::chrono::milliseconds{100};
    };

    PresenceTracker();
    explicit PresenceTracker(Options options);
    ~PresenceTracker();

    PresenceTracker(const PresenceTracker&) = delete;
    auto operator=(const PresenceTracker&) -> PresenceTracker& = delete;

    /// Record the latest state of a session.
    ///
    /// `state` must be a JSON object. Its `user` object is completed with the
    /// user id and a default name and colour where the client gave none.
    void set_local(const RoomId& room, const SessionId& session, std::string_view user_id,
                   nlohmann::json state, Clock::time_point now);

    /// Record an entry rendered by another process, as received. Refreshes
    /// its expiry; does not mark the room dirty.
    void apply_remote(const RoomId& room, const SessionId& session, nlohmann::json state,
                      Clock::time_point now);

    /// Make a session absent and notify subscribers immediately.
    void remove(const RoomId& room, const SessionId& session);

    /// Drop all presence for a room without notifying.
    void clear(const RoomId& room);

    /// Receive coalesced updates for a room until the handle is released.
    [[nodiscard]] auto on_change(const RoomId& room, Callback callback) -> Subscription;

    /// Every present session of a room with its latest entry.
    auto snapshot(const RoomId& room) const -> std::map<SessionId, nlohmann::json>;

    /// Status of a session, or nullopt if absent.
    auto status(const RoomId& room, const SessionId& session) const
        -> std::optional<PresenceStatus>;

    /// Apply idle transitions and expiry, then flush dirty rooms whose
    /// broadcast interval has elapsed.
    void tick(Clock::time_point now);

private:
    struct Shared;
    std::shared_ptr<Shared> shared_;
};

}  // namespace scenesync
