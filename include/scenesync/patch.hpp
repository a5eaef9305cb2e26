/// @file patch.hpp
/// @brief Patch types describing the visible effect of a merged operation.

#pragma once

#include <scenesync/types.hpp>
#include <scenesync/value.hpp>

#include <string>
#include <variant>

namespace scenesync {

/// A node became part of the document.
struct PatchInsert {
    NodeId parent;  ///< The parent it was placed under.
    NodeKind kind;  ///< The kind of node.
    auto operator==(const PatchInsert&) const -> bool = default;
};

/// A node was tombstoned.
struct PatchDelete {
    auto operator==(const PatchDelete&) const -> bool = default;
};

/// A node's placement changed (reparent or reorder).
struct PatchMove {
    NodeId parent;          ///< The new parent.
    std::string order_key;  ///< The new position among siblings.
    auto operator==(const PatchMove&) const -> bool = default;
};

/// A node field took a new winning value.
struct PatchField {
    std::string field;  ///< The field name.
    ScalarValue value;  ///< The winning value.
    auto operator==(const PatchField&) const -> bool = default;
};

/// A document-level map key took a new winning value.
struct PatchMeta {
    MetaScope scope;    ///< Which map.
    std::string key;    ///< The key.
    ScalarValue value;  ///< The winning value.
    auto operator==(const PatchMeta&) const -> bool = default;
};

/// The set of possible patch actions.
using PatchAction = std::variant<
    PatchInsert,
    PatchDelete,
    PatchMove,
    PatchField,
    PatchMeta
>;

/// A single patch describing one visible change to the document.
///
/// Patches are produced by Document::commit() and Document::apply_local().
/// An op that lost a last-writer-wins race produces no patch.
struct Patch {
    NodeId node;         ///< The node that changed (empty for meta patches).
    PatchAction action;  ///< What happened.

    auto operator==(const Patch&) const -> bool = default;
};

}  // namespace scenesync
