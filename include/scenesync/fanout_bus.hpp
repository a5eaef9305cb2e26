/// @file fanout_bus.hpp
/// @brief Cross-process fan-out of room traffic.

#pragma once

#include <scenesync/subscription.hpp>
#include <scenesync/types.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace scenesync {

/// What a bus message carries.
enum class BusMessageType : std::uint8_t {
    operation,       ///< payload: `{"ops": [...]}`
    presence,        ///< payload: `{"sessions": {id: entry}}`
    presence_leave,  ///< payload: `{"session": id}`
};

constexpr auto to_string_view(BusMessageType type) noexcept -> std::string_view {
    switch (type) {
        case BusMessageType::operation:      return "operation";
        case BusMessageType::presence:       return "presence";
        case BusMessageType::presence_leave: return "presence_leave";
    }
    return "unknown";
}

constexpr auto parse_bus_message_type(std::string_view s) noexcept
    -> std::optional<BusMessageType> {
    if (s == "operation")      return BusMessageType::operation;
    if (s == "presence")       return BusMessageType::presence;
    if (s == "presence_leave") return BusMessageType::presence_leave;
    return std::nullopt;
}

/// The envelope published for a room.
///
/// `instance` names the publishing process; receivers ignore their own
/// messages. Delivery is at least once.
struct BusMessage {
    BusMessageType type{BusMessageType::operation};
    std::string instance;
    RoomId room;
    nlohmann::json payload;

    auto operator==(const BusMessage&) const -> bool = default;
};

void to_json(nlohmann::json& j, const BusMessage& m);
/// @throws scenesync::Exception (decoding_error) on a malformed envelope.
void from_json(const nlohmann::json& j, BusMessage& m);

/// The bus channel for a room: `collab:<room>:broadcast`.
auto bus_channel(const RoomId& room) -> std::string;

/// Key of a named cross-process lock on a room: `collab:<room>:lock:<name>`.
auto lock_key(const RoomId& room, std::string_view name) -> std::string;

/// A publish/subscribe medium shared by every process serving rooms.
class FanoutBus {
public:
    using Handler = std::function<void(const BusMessage&)>;

    virtual ~FanoutBus() = default;

    /// Publish to every subscriber of `message.room`, in any process.
    /// @throws scenesync::Exception (fanout_unavailable) if the medium is down.
    virtual void publish(const BusMessage& message) = 0;

    /// Receive messages for a room until the handle is released.
    [[nodiscard]] virtual auto subscribe(const RoomId& room, Handler handler) -> Subscription = 0;

    /// Whether the medium is currently reachable.
    virtual auto available() const -> bool = 0;

    /// Bumped whenever delivery resumes after a break during which messages
    /// from other processes may have been lost.
    virtual auto epoch() const -> std::uint64_t { return 0; }

    /// Take the lock `key` for `owner` until `ttl` elapses or unlock().
    /// A bus without shared state grants every request.
    /// @return false if another owner holds it.
    /// @throws scenesync::Exception (fanout_unavailable) if the medium is down.
    virtual auto try_lock(const std::string& /*key*/, const std::string& /*owner*/,
                          std::chrono::milliseconds /*ttl*/) -> bool {
        return true;
    }

    /// Release `key` if `owner` still holds it.
    virtual void unlock(const std::string& /*key*/, const std::string& /*owner*/) {}
};

/// An in-process bus. Several SessionManagers sharing one LocalBus behave
/// like several processes sharing a broker. Delivery is synchronous.
class LocalBus : public FanoutBus {
public:
    void publish(const BusMessage& message) override;
    [[nodiscard]] auto subscribe(const RoomId& room, Handler handler) -> Subscription override;
    auto available() const -> bool override;
    auto epoch() const -> std::uint64_t override;
    auto try_lock(const std::string& key, const std::string& owner,
                  std::chrono::milliseconds ttl) -> bool override;
    void unlock(const std::string& key, const std::string& owner) override;

    /// Simulate an outage (false) or recovery (true).
    void set_available(bool available);

    /// Simulate lost subscriptions: publishes still succeed but reach no
    /// one. Healing bumps epoch().
    void set_partitioned(bool partitioned);

    /// Number of messages published successfully.
    auto published() const -> std::uint64_t;

private:
    mutable std::mutex mutex_;
    std::map<RoomId, std::map<std::uint64_t, Handler>> handlers_;
    std::uint64_t next_id_{1};
    std::uint64_t published_{0};
    std::uint64_t epoch_{0};
    std::map<std::string, std::pair<std::string, std::chrono::steady_clock::time_point>> locks_;
    bool available_{true};
    bool partitioned_{false};
    std::shared_ptr<bool> alive_{std::make_shared<bool>(true)};
};

}  // namespace scenesync
