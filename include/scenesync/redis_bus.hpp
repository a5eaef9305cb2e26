/// @file redis_bus.hpp
/// @brief FanoutBus over Redis pub/sub (redis++). Built as `scenesync_redis`.

#pragma once

#include <scenesync/fanout_bus.hpp>

#include <memory>
#include <string>

namespace scenesync {

/// Publishes each room on `collab:<room>:broadcast`.
///
/// Uses one connection for publishing and one for a background subscriber
/// thread. If the subscriber connection drops it is re-established and
/// every channel resubscribed; available() reports false meanwhile and
/// epoch() is bumped once delivery resumes. Locks are plain keys taken with
/// `SET NX PX` and released only by their owner.
class RedisBus : public FanoutBus {
public:
    /// @param url  A redis URI, e.g. `tcp://127.0.0.1:6379`.
    explicit RedisBus(const std::string& url);
    ~RedisBus() override;

    RedisBus(const RedisBus&) = delete;
    auto operator=(const RedisBus&) -> RedisBus& = delete;

    void publish(const BusMessage& message) override;
    [[nodiscard]] auto subscribe(const RoomId& room, Handler handler) -> Subscription override;
    auto available() const -> bool override;
    auto epoch() const -> std::uint64_t override;
    auto try_lock(const std::string& key, const std::string& owner,
                  std::chrono::milliseconds ttl) -> bool override;
    void unlock(const std::string& key, const std::string& owner) override;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

}  // namespace scenesync
