/// @file session_manager.hpp
/// @brief Connection lifecycle, rooms, fan-out and persistence scheduling.

#pragma once

#include <scenesync/auth.hpp>
#include <scenesync/config.hpp>
#include <scenesync/fanout_bus.hpp>
#include <scenesync/persistence.hpp>
#include <scenesync/presence.hpp>
#include <scenesync/protocol.hpp>
#include <scenesync/rate_limiter.hpp>
#include <scenesync/room.hpp>
#include <scenesync/room_registry.hpp>
#include <scenesync/session.hpp>
#include <scenesync/types.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scenesync {

/// Tuning for SessionManager.
struct SessionManagerOptions {
    std::string instance_id;  ///< Names this process on the bus. Empty: random.
    std::chrono::milliseconds heartbeat_timeout{60'000};
    std::chrono::milliseconds room_grace{300'000};
    std::size_t rate_limit_per_room{100};
    std::chrono::milliseconds rate_limit_window{60'000};
    std::size_t outbox_limit{10'000};
    std::chrono::milliseconds snapshot_lock_ttl{30'000};  ///< Hold on a room's snapshot lock.
    PresenceTracker::Options presence{};

    /// The manager-relevant part of a Config.
    static auto from_config(const Config& config) -> SessionManagerOptions;
};

/// Totals across every room.
struct ManagerStats {
    std::string instance;
    std::size_t rooms{0};
    std::size_t sessions{0};
    std::vector<RoomStats> room_stats;
};

void to_json(nlohmann::json& j, const ManagerStats& s);

/// Runs the server side of the editing protocol for one process.
///
/// The transport calls connect() with the first frame of a connection,
/// handle_frame() for every later frame and disconnect() when the transport
/// closes. A maintenance thread calls tick() periodically. Every method is
/// thread-safe; frames of one connection must be delivered in order.
///
/// Ops from a session are merged into the room's Document, appended to the
/// durable log, sent to the room's other sessions and published on the bus
/// for other processes. Ops arriving from the bus are merged and sent to the
/// local sessions only.
///
/// A session is acked only once its ops are in the log. Failed appends are
/// retried from tick() with the persistence backoff; while they keep failing
/// the room is read-only. After the bus reports lost deliveries, tick()
/// merges whatever the log holds that the room has not seen.
class SessionManager {
public:
    using Clock = std::chrono::steady_clock;

    SessionManager(SessionManagerOptions options,
                   std::shared_ptr<Authorizer> authorizer,
                   std::shared_ptr<PersistenceService> persistence,
                   std::shared_ptr<FanoutBus> bus,
                   std::shared_ptr<RoomRegistry> registry = std::make_shared<RoomRegistry>());

    /// Detaches from the bus. Does not snapshot; call shutdown() first.
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    auto operator=(const SessionManager&) -> SessionManager& = delete;

    // -- Connection lifecycle -------------------------------------------------

    /// Handle the connect frame of a new connection.
    ///
    /// On success the session is attached to its room and has been sent an
    /// accept frame (full state, or a delta when the resume watermark is
    /// still covered by the room's log). On failure a reject or error frame
    /// is sent, the connection is closed, and nullptr is returned.
    /// @param peer  Remote address, used for rate limiting.
    auto connect(std::shared_ptr<Connection> connection, const ConnectFrame& frame,
                 std::string_view peer, Clock::time_point now) -> std::shared_ptr<Session>;

    /// Handle a frame from an attached session. Protocol violations are
    /// answered with an error frame; the session stays connected.
    void handle_frame(const std::shared_ptr<Session>& session, const Frame& frame,
                      Clock::time_point now);

    /// Parse and handle a text frame. Unparseable text gets an error frame.
    void handle_text(const std::shared_ptr<Session>& session, std::string_view text,
                     Clock::time_point now);

    /// Detach a session whose transport closed (or that is being evicted).
    void disconnect(const std::shared_ptr<Session>& session, Clock::time_point now);

    // -- Maintenance ----------------------------------------------------------

    /// Heartbeat eviction, presence expiry and flush, catch-up after a bus
    /// break, outbox and log retries, snapshot scheduling and eviction of
    /// rooms empty for longer than the grace period.
    void tick(Clock::time_point now);

    /// Tell a room's sessions it is closing, disconnect them, snapshot and
    /// evict the room. Returns false if the room is not live.
    auto close_room(const RoomId& room, std::string_view reason, Clock::time_point now) -> bool;

    /// Close every room, waiting for their final snapshots.
    void shutdown(Clock::time_point now);

    // -- Introspection --------------------------------------------------------

    auto stats(Clock::time_point now) const -> ManagerStats;
    auto room_stats(const RoomId& room, Clock::time_point now) const -> std::optional<RoomStats>;

    auto instance_id() const -> const std::string& { return options_.instance_id; }
    auto registry() -> RoomRegistry& { return *registry_; }
    auto presence() -> PresenceTracker& { return presence_; }

private:
    void reject(Connection& connection, RejectCode code, std::string message,
                std::optional<std::chrono::milliseconds> retry_after = std::nullopt);

    auto open_room(const RoomId& id, Clock::time_point now) -> std::shared_ptr<Room>;
    auto build_room(const RoomId& id, Clock::time_point now) -> std::shared_ptr<Room>;
    void wire_room(const std::shared_ptr<Room>& room);

    void drop(const std::shared_ptr<Session>& session, std::uint16_t code, std::string_view reason,
              Clock::time_point now);

    void on_operation(const std::shared_ptr<Session>& session, const std::shared_ptr<Room>& room,
                      const OperationFrame& frame, Clock::time_point now);
    void on_presence(const std::shared_ptr<Session>& session, const PresenceFrame& frame,
                     Clock::time_point now);
    void on_bus_message(const std::weak_ptr<Room>& room, const BusMessage& message);
    void on_presence_update(const std::weak_ptr<Room>& room, const PresenceUpdate& update);

    void publish(Room& room, BusMessage message);
    void flush_outbox(Room& room);

    /// Append to the log, or defer behind a backlog. Returns whether logged.
    auto log_ops(Room& room, const SessionId& author, std::vector<Op> ops, Clock::time_point now)
        -> bool;
    void retry_log(Room& room, Clock::time_point now, bool force);
    void set_fault(Room& room, Room::Fault fault, bool failing);
    void catch_up(const std::shared_ptr<Room>& room, Clock::time_point now);

    void maybe_snapshot(const std::shared_ptr<Room>& room, Clock::time_point now, bool force);
    void snapshot_done(const std::weak_ptr<Room>& room, const SnapshotOutcome& outcome);
    void release_snapshot_lock(const RoomId& room);
    void final_snapshot(Room& room);
    void evict(const std::shared_ptr<Room>& room, std::string_view reason);

    SessionManagerOptions options_;
    std::shared_ptr<Authorizer> authorizer_;
    std::shared_ptr<PersistenceService> persistence_;
    std::shared_ptr<FanoutBus> bus_;
    std::shared_ptr<RoomRegistry> registry_;
    RateLimiter rate_limiter_;
    PresenceTracker presence_;
    std::atomic<bool> stopping_{false};
    std::atomic<std::uint64_t> bus_epoch_;
};

/// Ops that build the scene a brand new document starts from.
///
/// They are stamped with a fixed seed session, so every process seeds a new
/// document identically and seeding twice is a no-op.
auto seed_ops() -> const std::vector<Op>&;

}  // namespace scenesync
