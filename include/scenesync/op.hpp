/// @file op.hpp
/// @brief Replicated primitive operations.

#pragma once

#include <scenesync/types.hpp>
#include <scenesync/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace scenesync {

/// The kind of mutation an operation represents.
enum class OpType : std::uint8_t {
    insert_node,  ///< Create a node under a parent at an order key.
    delete_node,  ///< Tombstone a node (and, visibly, its subtree).
    set_field,    ///< Set one field of a node.
    move_node,    ///< Rewrite a node's placement (parent and/or order key).
    set_meta,     ///< Set one key of a document-level map.
};

/// Convert an OpType to its string representation.
constexpr auto to_string_view(OpType type) noexcept -> std::string_view {
    switch (type) {
        case OpType::insert_node: return "insert_node";
        case OpType::delete_node: return "delete_node";
        case OpType::set_field:   return "set_field";
        case OpType::move_node:   return "move_node";
        case OpType::set_meta:    return "set_meta";
    }
    return "unknown";
}

/// Parse an OpType from its string representation.
constexpr auto parse_op_type(std::string_view s) noexcept -> std::optional<OpType> {
    if (s == "insert_node") return OpType::insert_node;
    if (s == "delete_node") return OpType::delete_node;
    if (s == "set_field")   return OpType::set_field;
    if (s == "move_node")   return OpType::move_node;
    if (s == "set_meta")    return OpType::set_meta;
    return std::nullopt;
}

/// A single replicated operation.
///
/// Operations are the unit of replication. Each carries a globally unique
/// Stamp that orders its effect, and a per-origin contiguous sequence
/// number used for watermarks. Which of the remaining fields are meaningful
/// depends on the type:
///
/// | type        | node | parent | order_key | kind | field | value | scope |
/// |-------------|------|--------|-----------|------|-------|-------|-------|
/// | insert_node |  x   |   x    |     x     |  x   |       |       |       |
/// | delete_node |  x   |        |           |      |       |       |       |
/// | set_field   |  x   |        |           |      |   x   |   x   |       |
/// | move_node   |  x   |   x    |     x     |      |       |       |       |
/// | set_meta    |      |        |           |      |   x   |   x   |   x   |
struct Op {
    Stamp stamp;                 ///< Orders the effect of this op.
    std::uint64_t seq{0};        ///< Per-origin sequence number (1-based).
    OpType type{OpType::set_field};
    NodeId node;                 ///< Target node.
    NodeId parent;               ///< New parent (insert/move).
    std::string order_key;       ///< Position among siblings (insert/move).
    NodeKind kind{NodeKind::group};
    std::string field;           ///< Field name or meta key.
    ScalarValue value;           ///< Value for set_field/set_meta.
    MetaScope scope{MetaScope::settings};

    /// The session that produced this op.
    auto origin() const -> const SessionId& { return stamp.session; }

    auto operator==(const Op&) const -> bool = default;
};

}  // namespace scenesync
