#include <scenesync/presence.hpp>

#include <scenesync/error.hpp>

#include <array>
#include <cstdlib>
#include <mutex>
#include <set>
#include <utility>

namespace scenesync {

namespace {

constexpr auto user_palette = std::array<std::string_view, 10>{
    "#FF6B6B", "#4ECDC4", "#45B7D1", "#96CEB4", "#FFEAA7",
    "#DDA0DD", "#98D8C8", "#F7DC6F", "#BB8FCE", "#85C1E2",
};

// Two's-complement truncation to 32 bits.
auto to_int32(std::int64_t v) -> std::int64_t {
    return static_cast<std::int32_t>(static_cast<std::uint32_t>(v & 0xFFFFFFFF));
}

struct Entry {
    nlohmann::json state;
    PresenceStatus status{PresenceStatus::active};
    PresenceTracker::Clock::time_point last_update;
    bool remote{false};
};

struct RoomPresence {
    std::map<SessionId, Entry> entries;
    std::set<SessionId> changed;
    PresenceTracker::Clock::time_point last_flush{};
    bool flushed_once{false};
};

auto render(const Entry& e) -> nlohmann::json {
    if (e.remote) return e.state;
    auto out = e.state;
    out["status"] = std::string{to_string_view(e.status)};
    return out;
}

}  // namespace

auto default_user_color(std::string_view user_id) -> std::string {
    // hash = c + ((hash << 5) - hash), with the shift done on 32 bits
    auto hash = std::int64_t{0};
    for (auto c : user_id) {
        auto shifted = to_int32(to_int32(hash) << 5);
        hash = static_cast<unsigned char>(c) + (shifted - hash);
    }
    auto index = static_cast<std::size_t>(std::llabs(hash) % user_palette.size());
    return std::string{user_palette[index]};
}

auto default_user_name(std::string_view user_id) -> std::string {
    return "User " + std::string{user_id.substr(0, 6)};
}

struct PresenceTracker::Shared {
    Options options;
    mutable std::mutex mutex;
    std::map<RoomId, RoomPresence> rooms;
    std::map<RoomId, std::map<std::uint64_t, Callback>> listeners;
    std::uint64_t next_listener{1};

    auto callbacks_for(const RoomId& room) const -> std::vector<Callback> {
        auto out = std::vector<Callback>{};
        if (auto it = listeners.find(room); it != listeners.end()) {
            for (const auto& [id, cb] : it->second) out.push_back(cb);
        }
        return out;
    }
};

PresenceTracker::PresenceTracker()
    : PresenceTracker{Options{}} {}

PresenceTracker::PresenceTracker(Options options)
    : shared_{std::make_shared<Shared>()} {
    shared_->options = options;
}

PresenceTracker::~PresenceTracker() = default;

void PresenceTracker::set_local(const RoomId& room, const SessionId& session,
                                std::string_view user_id, nlohmann::json state,
                                Clock::time_point now) {
    if (state.is_null()) state = nlohmann::json::object();
    if (!state.is_object()) {
        throw Exception{ErrorKind::invalid_frame, "presence state must be an object"};
    }
    state.erase("status");
    auto& user = state["user"];
    if (!user.is_object()) user = nlohmann::json::object();
    if (!user.contains("id")) user["id"] = std::string{user_id};
    if (!user.contains("name")) user["name"] = default_user_name(user_id);
    if (!user.contains("color")) user["color"] = default_user_color(user_id);

    auto lock = std::lock_guard{shared_->mutex};
    auto& r = shared_->rooms[room];
    r.entries[session] = Entry{
        .state = std::move(state), .status = PresenceStatus::active, .last_update = now};
    r.changed.insert(session);
}

void PresenceTracker::apply_remote(const RoomId& room, const SessionId& session,
                                   nlohmann::json state, Clock::time_point now) {
    if (!state.is_object()) {
        throw Exception{ErrorKind::invalid_frame, "presence state must be an object"};
    }
    auto status = state.value("status", "") == "idle" ? PresenceStatus::idle : PresenceStatus::active;
    auto lock = std::lock_guard{shared_->mutex};
    auto& r = shared_->rooms[room];
    r.entries[session] = Entry{
        .state = std::move(state), .status = status, .last_update = now, .remote = true};
    r.changed.erase(session);
}

void PresenceTracker::remove(const RoomId& room, const SessionId& session) {
    auto callbacks = std::vector<Callback>{};
    auto update = PresenceUpdate{.room = room, .sessions = {}, .removed = {session}};
    {
        auto lock = std::lock_guard{shared_->mutex};
        auto it = shared_->rooms.find(room);
        if (it == shared_->rooms.end()) return;
        auto entry = it->second.entries.find(session);
        if (entry == it->second.entries.end()) return;
        if (entry->second.remote) update.remote.insert(session);
        it->second.entries.erase(entry);
        it->second.changed.erase(session);
        callbacks = shared_->callbacks_for(room);
    }
    for (const auto& cb : callbacks) cb(update);
}

void PresenceTracker::clear(const RoomId& room) {
    auto lock = std::lock_guard{shared_->mutex};
    shared_->rooms.erase(room);
}

auto PresenceTracker::on_change(const RoomId& room, Callback callback) -> Subscription {
    auto lock = std::lock_guard{shared_->mutex};
    auto id = shared_->next_listener++;
    shared_->listeners[room].emplace(id, std::move(callback));
    auto weak = std::weak_ptr<Shared>{shared_};
    return Subscription{[weak, room, id] {
        if (auto shared = weak.lock()) {
            auto lock = std::lock_guard{shared->mutex};
            auto it = shared->listeners.find(room);
            if (it == shared->listeners.end()) return;
            it->second.erase(id);
            if (it->second.empty()) shared->listeners.erase(it);
        }
    }};
}

auto PresenceTracker::snapshot(const RoomId& room) const
    -> std::map<SessionId, nlohmann::json> {
    auto lock = std::lock_guard{shared_->mutex};
    auto out = std::map<SessionId, nlohmann::json>{};
    if (auto it = shared_->rooms.find(room); it != shared_->rooms.end()) {
        for (const auto& [session, entry] : it->second.entries) {
            out.emplace(session, render(entry));
        }
    }
    return out;
}

auto PresenceTracker::status(const RoomId& room, const SessionId& session) const
    -> std::optional<PresenceStatus> {
    auto lock = std::lock_guard{shared_->mutex};
    auto r = shared_->rooms.find(room);
    if (r == shared_->rooms.end()) return std::nullopt;
    auto e = r->second.entries.find(session);
    if (e == r->second.entries.end()) return std::nullopt;
    return e->second.status;
}

void PresenceTracker::tick(Clock::time_point now) {
    auto deliveries = std::vector<std::pair<PresenceUpdate, std::vector<Callback>>>{};
    {
        auto lock = std::lock_guard{shared_->mutex};
        const auto& opts = shared_->options;
        for (auto room_it = shared_->rooms.begin(); room_it != shared_->rooms.end();) {
            auto& [room, r] = *room_it;
            auto update = PresenceUpdate{.room = room, .sessions = {}, .removed = {}};

            for (auto it = r.entries.begin(); it != r.entries.end();) {
                auto quiet = now - it->second.last_update;
                if (quiet >= opts.idle_timeout) {
                    update.removed.push_back(it->first);
                    if (it->second.remote) update.remote.insert(it->first);
                    r.changed.erase(it->first);
                    it = r.entries.erase(it);
                    continue;
                }
                if (!it->second.remote && it->second.status == PresenceStatus::active &&
                    quiet >= opts.idle_after) {
                    it->second.status = PresenceStatus::idle;
                    r.changed.insert(it->first);
                }
                ++it;
            }

            const bool due = !r.flushed_once || now - r.last_flush >= opts.broadcast_interval;
            if (due && !r.changed.empty()) {
                for (const auto& session : r.changed) {
                    update.sessions.emplace(session, render(r.entries.at(session)));
                }
                r.changed.clear();
                r.last_flush = now;
                r.flushed_once = true;
            }

            if (!update.sessions.empty() || !update.removed.empty()) {
                deliveries.emplace_back(std::move(update), shared_->callbacks_for(room));
            }

            if (r.entries.empty()) {
                room_it = shared_->rooms.erase(room_it);
            } else {
                ++room_it;
            }
        }
    }
    for (const auto& [update, callbacks] : deliveries) {
        for (const auto& cb : callbacks) cb(update);
    }
}

}  // namespace scenesync
