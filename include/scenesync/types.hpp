/// @file types.hpp
/// @brief Core identity types: SessionId, Stamp, NodeId, RoomId.

#pragma once

#include <algorithm>
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace scenesync {

/// A 16-byte unique identifier for an editing session (replica).
///
/// The id is chosen when an editor first connects and is presented again on
/// reconnect, so it identifies the origin of operations across connections.
/// Session ordering is used for deterministic tie-breaking during merge.
/// Lexicographic ordering on raw bytes.
struct SessionId {
    static constexpr std::size_t size = 16;  ///< Fixed size in bytes.
    std::array<std::byte, size> bytes{};     ///< Raw identifier bytes.

    constexpr SessionId() = default;

    /// Construct from a byte array.
    explicit constexpr SessionId(std::array<std::byte, size> b) : bytes{b} {}

    /// Construct from a raw uint8_t array (convenience for tests).
    explicit SessionId(const std::uint8_t (&raw)[size]) {
        std::ranges::transform(raw, bytes.begin(),
            [](std::uint8_t b) { return std::byte{b}; });
    }

    auto operator<=>(const SessionId&) const = default;
    auto operator==(const SessionId&) const -> bool = default;

    /// Check if all bytes are zero.
    auto is_zero() const -> bool {
        return std::ranges::all_of(bytes, [](std::byte b) {
            return b == std::byte{0};
        });
    }

    /// Lowercase hex representation (32 characters).
    auto to_hex() const -> std::string;

    /// Parse a 32-character hex string.
    static auto from_hex(std::string_view hex) -> std::optional<SessionId>;

    /// Generate a random session id.
    static auto random() -> SessionId;
};

/// A logical timestamp: (Lamport counter, session).
///
/// Stamps are globally unique and totally ordered. The counter is bumped
/// past every stamp a replica observes; ties are broken by session identity.
/// The same order decides field writes and sibling placement.
struct Stamp {
    std::uint64_t counter{0};  ///< Lamport counter.
    SessionId session{};       ///< The session that created the operation.

    constexpr Stamp() = default;

    /// Construct with a counter and session.
    constexpr Stamp(std::uint64_t c, SessionId s) : counter{c}, session{s} {}

    auto operator<=>(const Stamp&) const = default;
    auto operator==(const Stamp&) const -> bool = default;
};

/// Stable identifier of a scene node. Immutable for the node's lifetime.
using NodeId = std::string;

/// Identifier of a room: `<siteId>:<version>`.
using RoomId = std::string;

/// The canvas root node. Always exists, never deleted or moved.
inline const auto root_node = NodeId{"root"};

/// Build a room id from a site id and a version.
inline auto make_room_id(std::string_view site, std::string_view version) -> RoomId {
    auto id = RoomId{site};
    id += ':';
    id += version;
    return id;
}

}  // namespace scenesync

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<scenesync::SessionId> {
    auto operator()(const scenesync::SessionId& id) const noexcept -> std::size_t {
        // FNV-1a over the 16 bytes
        auto h = std::size_t{14695981039346656037ULL};
        for (auto b : id.bytes) {
            h ^= static_cast<std::size_t>(b);
            h *= std::size_t{1099511628211ULL};
        }
        return h;
    }
};

template <>
struct std::hash<scenesync::Stamp> {
    auto operator()(const scenesync::Stamp& s) const noexcept -> std::size_t {
        auto h1 = std::hash<std::uint64_t>{}(s.counter);
        auto h2 = std::hash<scenesync::SessionId>{}(s.session);
        return h1 ^ (h2 << 1);
    }
};

/// @endcond
