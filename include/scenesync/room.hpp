/// @file room.hpp
/// @brief A live room: one document, its attached sessions and bookkeeping.

#pragma once

#include <scenesync/document.hpp>
#include <scenesync/fanout_bus.hpp>
#include <scenesync/session.hpp>
#include <scenesync/subscription.hpp>
#include <scenesync/types.hpp>
#include <scenesync/watermark.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace scenesync {

/// Counters reported for a room.
struct RoomStats {
    RoomId room;
    std::size_t sessions{0};
    std::uint64_t ops_applied{0};      ///< Ops merged since the room was created.
    std::uint64_t watermark_total{0};
    std::size_t log_size{0};
    std::size_t pending_ops{0};        ///< Ops not yet covered by a snapshot.
    std::size_t outbox{0};             ///< Bus messages waiting for a retry.
    std::size_t unlogged_ops{0};       ///< Ops whose log append is being retried.
    std::size_t snapshots{0};          ///< Snapshots written since creation.
    bool read_only{false};
    std::chrono::milliseconds age{0};
    std::chrono::milliseconds idle{0};  ///< Time since the last operation.

    auto operator==(const RoomStats&) const -> bool = default;
};

void to_json(nlohmann::json& j, const RoomStats& s);

/// One document being edited, with everything the manager tracks for it.
///
/// The Document has its own lock; the Room's mutex guards membership,
/// the outbox and the persistence bookkeeping. Broadcasts are sent while
/// the room mutex is held so that a joining session never misses an op
/// merged after its initial state was taken.
class Room {
public:
    using Clock = std::chrono::steady_clock;

    Room(RoomId id, Document document, Clock::time_point now);

    Room(const Room&) = delete;
    auto operator=(const Room&) -> Room& = delete;

    auto id() const -> const RoomId& { return id_; }
    auto document() -> Document& { return document_; }
    auto document() const -> const Document& { return document_; }

    // -- Membership -----------------------------------------------------------

    /// Attach a session. Returns the session it replaces (same id), if any.
    /// The first attach of an id binds it to the session's user.
    auto attach(std::shared_ptr<Session> session) -> std::shared_ptr<Session>;

    /// User a session id was first attached for, kept after the session leaves.
    auto owner(const SessionId& id) const -> std::optional<std::string>;

    /// Detach a session. Returns false if it was not attached (or was replaced).
    auto detach(const Session& session, Clock::time_point now) -> bool;

    auto find(const SessionId& id) const -> std::shared_ptr<Session>;
    auto sessions() const -> std::vector<std::shared_ptr<Session>>;
    auto size() const -> std::size_t;

    /// When the last session left, or nullopt while sessions are attached.
    auto empty_since() const -> std::optional<Clock::time_point>;

    /// Run `fn` with the room mutex held (attach-and-sync, broadcast).
    void locked(const std::function<void()>& fn);

    /// Send a frame to every active session except `except`.
    void broadcast(const Frame& frame, const SessionId* except = nullptr) const;

    // -- Bus ------------------------------------------------------------------

    /// Keep a bus or presence subscription alive with the room.
    void hold(Subscription subscription);

    /// Drop every held subscription.
    void release();

    /// Queue a message the bus refused. Drops the oldest beyond `limit`.
    /// @return false if a message had to be dropped.
    auto enqueue(BusMessage message, std::size_t limit) -> bool;

    auto outbox_size() const -> std::size_t;

    /// Take every queued message, oldest first.
    auto take_outbox() -> std::deque<BusMessage>;

    /// Put back messages that still could not be sent, ahead of newer ones.
    void restore_outbox(std::deque<BusMessage> messages);

    // -- Log backlog ----------------------------------------------------------

    /// Ops merged and broadcast whose log append failed, with the sessions
    /// still owed an ack for them.
    struct LogBacklog {
        std::vector<Op> ops;
        std::set<SessionId> waiting;
        std::size_t attempts{0};
        Clock::time_point retry_at;
    };

    /// Add to the backlog. `retry_at` applies only when the backlog was empty,
    /// which counts as the first failed attempt.
    void defer_log(std::vector<Op> ops, const SessionId& waiting, Clock::time_point retry_at);

    auto has_log_backlog() const -> bool;

    /// Take the backlog if its retry is due at `now` (or `force`).
    auto take_log_backlog(Clock::time_point now, bool force = false) -> std::optional<LogBacklog>;

    /// Put back a backlog that failed again, ahead of anything deferred since.
    void restore_log_backlog(LogBacklog backlog);

    // -- Persistence bookkeeping ----------------------------------------------

    /// Count merged ops toward the next snapshot.
    void record_ops(std::size_t count, Clock::time_point now);

    /// Whether a snapshot is due: `every_ops` pending ops, or pending ops
    /// older than `interval`.
    auto snapshot_due(std::size_t every_ops, Clock::duration interval, Clock::time_point now) const
        -> bool;

    /// A snapshot of `watermark` was handed to persistence.
    void snapshot_started(const Watermark& watermark);

    /// The snapshot job finished. On success the in-memory log is trimmed to
    /// the snapshot before last, so reconnecting sessions can still get deltas.
    void snapshot_finished(bool ok, Clock::time_point now);

    auto snapshot_in_flight() const -> bool;

    /// Ops merged but not yet covered by a successful snapshot.
    auto pending_ops() const -> std::size_t;

    // -- Flags ----------------------------------------------------------------

    /// What keeps the room read-only. Each clears independently.
    enum class Fault { snapshot, log };

    auto read_only() const -> bool;

    /// Raise or clear one fault. Returns true if read_only() changed.
    auto set_fault(Fault fault, bool failing) -> bool;

    auto closing() const -> bool;
    void set_closing();

    auto stats(Clock::time_point now) const -> RoomStats;

private:
    RoomId id_;
    Document document_;
    Clock::time_point created_;

    mutable std::recursive_mutex mutex_;
    std::map<SessionId, std::shared_ptr<Session>> sessions_;
    std::optional<Clock::time_point> empty_since_;
    std::vector<Subscription> subscriptions_;
    std::deque<BusMessage> outbox_;
    std::map<SessionId, std::string> owners_;
    LogBacklog log_backlog_;

    std::uint64_t ops_applied_{0};
    std::size_t pending_ops_{0};
    std::size_t in_flight_ops_{0};
    std::optional<Clock::time_point> first_pending_;
    Clock::time_point last_activity_;
    std::optional<Watermark> in_flight_;
    std::optional<Watermark> last_snapshot_;
    std::size_t snapshots_{0};
    std::set<Fault> faults_;
    bool closing_{false};
};

}  // namespace scenesync
