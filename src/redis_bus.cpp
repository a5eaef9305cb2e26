#include <scenesync/redis_bus.hpp>

#include <scenesync/error.hpp>
#include <scenesync/log.hpp>

#include <sw/redis++/redis++.h>

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

namespace scenesync {

namespace {

constexpr auto channel_prefix = std::string_view{"collab:"};
constexpr auto channel_suffix = std::string_view{":broadcast"};
constexpr auto consume_timeout = std::chrono::milliseconds{200};
constexpr auto reconnect_delay = std::chrono::seconds{1};

// Delete the key only while it still holds the caller's token.
constexpr auto unlock_script =
    "if redis.call('get', KEYS[1]) == ARGV[1] then return redis.call('del', KEYS[1]) end return 0";

auto room_of(const std::string& channel) -> std::optional<RoomId> {
    if (!channel.starts_with(channel_prefix) || !channel.ends_with(channel_suffix)) {
        return std::nullopt;
    }
    return channel.substr(channel_prefix.size(),
                          channel.size() - channel_prefix.size() - channel_suffix.size());
}

}  // namespace

struct RedisBus::Impl {
    sw::redis::ConnectionOptions options;
    std::unique_ptr<sw::redis::Redis> publisher;
    std::atomic<bool> healthy{true};
    std::atomic<std::uint64_t> epoch{0};

    std::mutex mutex;
    std::map<RoomId, std::map<std::uint64_t, Handler>> handlers;
    std::uint64_t next_id{1};
    std::set<std::string> wanted;  // channels the consumer should be subscribed to

    std::jthread consumer;

    explicit Impl(const std::string& url)
        : options{url} {
        options.socket_timeout = consume_timeout;
        auto pub_options = sw::redis::ConnectionOptions{url};
        publisher = std::make_unique<sw::redis::Redis>(pub_options);
    }

    void dispatch(const std::string& channel, const std::string& text) {
        auto room = room_of(channel);
        if (!room) return;
        auto message = BusMessage{};
        try {
            nlohmann::json::parse(text).get_to(message);
        } catch (const nlohmann::json::exception& e) {
            log::get()->warn("redis bus: dropping unparsable message on {}: {}", channel, e.what());
            return;
        } catch (const Exception& e) {
            log::get()->warn("redis bus: dropping malformed message on {}: {}", channel, e.what());
            return;
        }

        auto targets = std::vector<Handler>{};
        {
            auto lock = std::lock_guard{mutex};
            if (auto it = handlers.find(*room); it != handlers.end()) {
                for (const auto& [id, h] : it->second) targets.push_back(h);
            }
        }
        for (const auto& h : targets) h(message);
    }

    // The subscriber is only touched from this thread.
    void run(std::stop_token stop) {
        auto lost = false;
        while (!stop.stop_requested()) {
            try {
                auto connection = sw::redis::Redis{options};
                auto subscriber = connection.subscriber();
                subscriber.on_message([this](std::string channel, std::string text) {
                    dispatch(channel, text);
                });

                auto subscribed = std::set<std::string>{};
                healthy = true;
                while (!stop.stop_requested()) {
                    auto wanted_now = [&] {
                        auto lock = std::lock_guard{mutex};
                        return wanted;
                    }();
                    for (const auto& ch : wanted_now) {
                        if (subscribed.insert(ch).second) subscriber.subscribe(ch);
                    }
                    for (auto it = subscribed.begin(); it != subscribed.end();) {
                        if (wanted_now.contains(*it)) { ++it; continue; }
                        subscriber.unsubscribe(*it);
                        it = subscribed.erase(it);
                    }
                    if (std::exchange(lost, false)) ++epoch;
                    try {
                        subscriber.consume();
                    } catch (const sw::redis::TimeoutError&) {
                        // idle; loop to pick up subscription changes
                    }
                }
            } catch (const sw::redis::Error& e) {
                healthy = false;
                lost = true;
                log::get()->error("redis bus: subscriber connection lost: {}", e.what());
                auto deadline = std::chrono::steady_clock::now() + reconnect_delay;
                while (!stop.stop_requested() && std::chrono::steady_clock::now() < deadline) {
                    std::this_thread::sleep_for(std::chrono::milliseconds{50});
                }
            }
        }
    }
};

RedisBus::RedisBus(const std::string& url)
    : impl_{std::make_shared<Impl>(url)} {
    impl_->consumer = std::jthread{[impl = impl_.get()](std::stop_token stop) {
        impl->run(stop);
    }};
    log::get()->info("redis bus: connected to {}", url);
}

RedisBus::~RedisBus() {
    impl_->consumer.request_stop();
    if (impl_->consumer.joinable()) impl_->consumer.join();
}

void RedisBus::publish(const BusMessage& message) {
    try {
        impl_->publisher->publish(bus_channel(message.room), nlohmann::json(message).dump());
        impl_->healthy = true;
    } catch (const sw::redis::Error& e) {
        impl_->healthy = false;
        throw Exception{ErrorKind::fanout_unavailable, std::string{"redis publish failed: "} + e.what()};
    }
}

auto RedisBus::subscribe(const RoomId& room, Handler handler) -> Subscription {
    auto lock = std::lock_guard{impl_->mutex};
    auto id = impl_->next_id++;
    impl_->handlers[room].emplace(id, std::move(handler));
    impl_->wanted.insert(bus_channel(room));

    auto weak = std::weak_ptr<Impl>{impl_};
    return Subscription{[weak, room, id] {
        auto impl = weak.lock();
        if (!impl) return;
        auto lock = std::lock_guard{impl->mutex};
        auto it = impl->handlers.find(room);
        if (it == impl->handlers.end()) return;
        it->second.erase(id);
        if (it->second.empty()) {
            impl->handlers.erase(it);
            impl->wanted.erase(bus_channel(room));
        }
    }};
}

auto RedisBus::available() const -> bool {
    return impl_->healthy;
}

auto RedisBus::epoch() const -> std::uint64_t {
    return impl_->epoch;
}

auto RedisBus::try_lock(const std::string& key, const std::string& owner,
                        std::chrono::milliseconds ttl) -> bool {
    try {
        return impl_->publisher->set(key, owner, ttl, sw::redis::UpdateType::NOT_EXIST);
    } catch (const sw::redis::Error& e) {
        throw Exception{ErrorKind::fanout_unavailable, std::string{"redis lock failed: "} + e.what()};
    }
}

void RedisBus::unlock(const std::string& key, const std::string& owner) {
    try {
        impl_->publisher->eval<long long>(unlock_script, {key}, {owner});
    } catch (const sw::redis::Error& e) {
        throw Exception{ErrorKind::fanout_unavailable, std::string{"redis unlock failed: "} + e.what()};
    }
}

}  // namespace scenesync
