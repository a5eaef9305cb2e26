#include <scenesync/fanout_bus.hpp>

#include <scenesync/error.hpp>

#include <vector>

namespace scenesync {

void to_json(nlohmann::json& j, const BusMessage& m) {
    j = nlohmann::json{
        {"type", std::string{to_string_view(m.type)}},
        {"instance", m.instance},
        {"room", m.room},
        {"payload", m.payload},
    };
}

void from_json(const nlohmann::json& j, BusMessage& m) {
    if (!j.is_object()) throw Exception{ErrorKind::decoding_error, "bus message must be an object"};
    auto field = [&](const char* key) -> const nlohmann::json& {
        auto it = j.find(key);
        if (it == j.end()) {
            throw Exception{ErrorKind::decoding_error, std::string{"bus message missing "} + key};
        }
        return *it;
    };
    const auto& type = field("type");
    auto parsed = type.is_string() ? parse_bus_message_type(type.get<std::string>()) : std::nullopt;
    if (!parsed) throw Exception{ErrorKind::decoding_error, "unknown bus message type"};
    const auto& instance = field("instance");
    const auto& room = field("room");
    if (!instance.is_string() || !room.is_string()) {
        throw Exception{ErrorKind::decoding_error, "bus message instance and room must be strings"};
    }
    m.type = *parsed;
    m.instance = instance.get<std::string>();
    m.room = room.get<std::string>();
    m.payload = field("payload");
}

auto bus_channel(const RoomId& room) -> std::string {
    return "collab:" + room + ":broadcast";
}

auto lock_key(const RoomId& room, std::string_view name) -> std::string {
    return "collab:" + room + ":lock:" + std::string{name};
}

// -- LocalBus -----------------------------------------------------------------

void LocalBus::publish(const BusMessage& message) {
    auto targets = std::vector<Handler>{};
    {
        auto lock = std::lock_guard{mutex_};
        if (!available_) {
            throw Exception{ErrorKind::fanout_unavailable, "local bus is unavailable"};
        }
        ++published_;
        if (partitioned_) return;
        if (auto it = handlers_.find(message.room); it != handlers_.end()) {
            for (const auto& [id, handler] : it->second) targets.push_back(handler);
        }
    }
    for (const auto& handler : targets) handler(message);
}

auto LocalBus::subscribe(const RoomId& room, Handler handler) -> Subscription {
    auto lock = std::lock_guard{mutex_};
    auto id = next_id_++;
    handlers_[room].emplace(id, std::move(handler));
    auto alive = std::weak_ptr<bool>{alive_};
    return Subscription{[this, alive, room, id] {
        if (alive.expired()) return;
        auto lock = std::lock_guard{mutex_};
        auto it = handlers_.find(room);
        if (it == handlers_.end()) return;
        it->second.erase(id);
        if (it->second.empty()) handlers_.erase(it);
    }};
}

auto LocalBus::available() const -> bool {
    auto lock = std::lock_guard{mutex_};
    return available_;
}

auto LocalBus::epoch() const -> std::uint64_t {
    auto lock = std::lock_guard{mutex_};
    return epoch_;
}

auto LocalBus::try_lock(const std::string& key, const std::string& owner,
                        std::chrono::milliseconds ttl) -> bool {
    auto lock = std::lock_guard{mutex_};
    if (!available_) throw Exception{ErrorKind::fanout_unavailable, "local bus is unavailable"};
    auto now = std::chrono::steady_clock::now();
    auto it = locks_.find(key);
    if (it != locks_.end() && it->second.second > now && it->second.first != owner) return false;
    locks_[key] = {owner, now + ttl};
    return true;
}

void LocalBus::unlock(const std::string& key, const std::string& owner) {
    auto lock = std::lock_guard{mutex_};
    if (auto it = locks_.find(key); it != locks_.end() && it->second.first == owner) locks_.erase(it);
}

void LocalBus::set_partitioned(bool partitioned) {
    auto lock = std::lock_guard{mutex_};
    if (partitioned_ && !partitioned) ++epoch_;
    partitioned_ = partitioned;
}

void LocalBus::set_available(bool available) {
    auto lock = std::lock_guard{mutex_};
    available_ = available;
}

auto LocalBus::published() const -> std::uint64_t {
    auto lock = std::lock_guard{mutex_};
    return published_;
}

}  // namespace scenesync
