/// @file room_registry.hpp
/// @brief The set of live rooms of one process.

#pragma once

#include <scenesync/room.hpp>
#include <scenesync/types.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace scenesync {

/// Owns the live rooms. Rooms are created on first join and removed by the
/// manager once they have been empty for the grace period.
///
/// The registry is an ordinary object handed to SessionManager, so tests and
/// embedders can run several independent managers in one process.
class RoomRegistry {
public:
    using Clock = Room::Clock;
    /// Builds a room. May block on storage; called without the registry lock.
    using Factory = std::function<std::shared_ptr<Room>(const RoomId&)>;

    /// The live room with this id, or nullptr.
    auto find(const RoomId& id) const -> std::shared_ptr<Room> {
        auto lock = std::lock_guard{mutex_};
        auto it = rooms_.find(id);
        return it != rooms_.end() ? it->second : nullptr;
    }

    /// The live room with this id, building it with `factory` if needed.
    ///
    /// Two callers racing to create the same room may both run the factory;
    /// only the first room registered is kept and returned to both.
    /// @return The room and whether this call registered it.
    auto get_or_create(const RoomId& id, const Factory& factory)
        -> std::pair<std::shared_ptr<Room>, bool> {
        if (auto existing = find(id)) return {existing, false};
        auto built = factory(id);
        auto lock = std::lock_guard{mutex_};
        auto [it, inserted] = rooms_.emplace(id, std::move(built));
        return {it->second, inserted};
    }

    /// Remove a room if it is still the registered instance.
    auto remove(const std::shared_ptr<Room>& room) -> bool {
        auto lock = std::lock_guard{mutex_};
        auto it = rooms_.find(room->id());
        if (it == rooms_.end() || it->second != room) return false;
        rooms_.erase(it);
        return true;
    }

    auto rooms() const -> std::vector<std::shared_ptr<Room>> {
        auto lock = std::lock_guard{mutex_};
        auto result = std::vector<std::shared_ptr<Room>>{};
        result.reserve(rooms_.size());
        for (const auto& [id, room] : rooms_) result.push_back(room);
        return result;
    }

    /// Rooms that have had no sessions for at least `grace`.
    auto idle_rooms(Clock::time_point now, Clock::duration grace) const
        -> std::vector<std::shared_ptr<Room>> {
        auto result = std::vector<std::shared_ptr<Room>>{};
        for (auto& room : rooms()) {
            auto since = room->empty_since();
            if (since && now - *since >= grace) result.push_back(std::move(room));
        }
        return result;
    }

    auto size() const -> std::size_t {
        auto lock = std::lock_guard{mutex_};
        return rooms_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<RoomId, std::shared_ptr<Room>> rooms_;
};

}  // namespace scenesync
