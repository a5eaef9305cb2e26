/// @file session.hpp
/// @brief A connected editor session and its transport endpoint.

#pragma once

#include <scenesync/auth.hpp>
#include <scenesync/protocol.hpp>
#include <scenesync/types.hpp>
#include <scenesync/watermark.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace scenesync {

/// Lifecycle of a session.
///
/// `connecting -> authenticating -> joined -> active -> disconnecting -> closed`.
/// A rejected session goes straight from `authenticating` to `closed`.
enum class SessionState : std::uint8_t {
    connecting,      ///< Transport established, no connect frame yet.
    authenticating,  ///< Waiting on the Authorizer.
    joined,          ///< Attached to a room, initial sync not yet sent.
    active,          ///< Initial sync sent; takes part in broadcasts.
    disconnecting,   ///< Detached from its room, transport closing.
    closed,          ///< Done.
};

constexpr auto to_string_view(SessionState state) noexcept -> std::string_view {
    switch (state) {
        case SessionState::connecting:     return "connecting";
        case SessionState::authenticating: return "authenticating";
        case SessionState::joined:         return "joined";
        case SessionState::active:         return "active";
        case SessionState::disconnecting:  return "disconnecting";
        case SessionState::closed:         return "closed";
    }
    return "unknown";
}

/// WebSocket close codes used by the manager.
namespace close_code {
inline constexpr std::uint16_t normal = 1000;
inline constexpr std::uint16_t going_away = 1001;
inline constexpr std::uint16_t policy_violation = 1008;
inline constexpr std::uint16_t internal_error = 1011;
}  // namespace close_code

/// One end of a transport connection.
///
/// send() and close() are called with room locks held, so implementations
/// must not block: they queue the frame and write it asynchronously.
class Connection {
public:
    virtual ~Connection() = default;

    virtual void send(const Frame& frame) = 0;
    virtual void close(std::uint16_t code, std::string_view reason) = 0;
};

/// An authenticated editor attached (or attaching) to a room.
class Session {
public:
    using Clock = std::chrono::steady_clock;

    Session(SessionId id, Identity identity, RoomId room, std::shared_ptr<Connection> connection,
            Clock::time_point now)
        : id_{id},
          identity_{std::move(identity)},
          room_{std::move(room)},
          connection_{std::move(connection)},
          last_seen_{now} {}

    auto id() const -> const SessionId& { return id_; }
    auto identity() const -> const Identity& { return identity_; }
    auto room() const -> const RoomId& { return room_; }
    auto connection() const -> const std::shared_ptr<Connection>& { return connection_; }

    auto state() const -> SessionState { return state_.load(); }
    void set_state(SessionState state) { state_.store(state); }

    /// Whether the session should receive room broadcasts.
    auto is_active() const -> bool { return state() == SessionState::active; }

    /// Record inbound traffic for the heartbeat.
    void touch(Clock::time_point now) {
        auto lock = std::lock_guard{mutex_};
        if (now > last_seen_) last_seen_ = now;
    }

    auto last_seen() const -> Clock::time_point {
        auto lock = std::lock_guard{mutex_};
        return last_seen_;
    }

    /// Record the watermark the client acknowledged.
    void ack(const Watermark& watermark) {
        auto lock = std::lock_guard{mutex_};
        for (const auto& [session, seq] : watermark.entries()) acked_.advance(session, seq);
    }

    auto acked() const -> Watermark {
        auto lock = std::lock_guard{mutex_};
        return acked_;
    }

    void send(const Frame& frame) const { connection_->send(frame); }

private:
    SessionId id_;
    Identity identity_;
    RoomId room_;
    std::shared_ptr<Connection> connection_;
    std::atomic<SessionState> state_{SessionState::connecting};

    mutable std::mutex mutex_;
    Clock::time_point last_seen_;
    Watermark acked_;
};

}  // namespace scenesync
