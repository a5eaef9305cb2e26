/// @file scene_graph.hpp
/// @brief Scene-graph edits and their translation to replicated ops.

#pragma once

#include <scenesync/document.hpp>
#include <scenesync/op.hpp>
#include <scenesync/types.hpp>
#include <scenesync/value.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace scenesync {

// -- Domain edits -------------------------------------------------------------

/// Create a node. `index` is its position among the parent's visible
/// children; nullopt appends.
struct InsertNode {
    NodeId id;
    NodeKind kind{NodeKind::group};
    NodeId parent{root_node};
    std::optional<std::size_t> index;
    std::map<std::string, ScalarValue> fields;  ///< Initial field values.
};

/// Delete a node and, visibly, its subtree.
struct DeleteNode {
    NodeId id;
};

/// Reparent a node. nullopt `index` appends to the new parent.
struct MoveNode {
    NodeId id;
    NodeId new_parent;
    std::optional<std::size_t> index;
};

/// Move a node to a new position under its current parent.
struct ReorderNode {
    NodeId id;
    std::size_t index{0};  ///< Position in the resulting sibling list.
};

/// Set one field, e.g. `text`, `style.color`, `size.w`.
struct SetProperty {
    NodeId id;
    std::string field;
    ScalarValue value;
};

/// Set one key of a document-level map.
struct SetMeta {
    MetaScope scope{MetaScope::settings};
    std::string key;
    ScalarValue value;
};

using DomainEdit = std::variant<
    InsertNode,
    DeleteNode,
    MoveNode,
    ReorderNode,
    SetProperty,
    SetMeta
>;

/// What a batch of ops does, in scene terms.
struct EditSummary {
    std::vector<NodeId> inserted;
    std::vector<NodeId> deleted;
    std::vector<NodeId> moved;                                 ///< Reparented or reordered.
    std::vector<std::pair<NodeId, std::string>> fields;        ///< (node, field) pairs set.
    std::vector<std::pair<MetaScope, std::string>> meta_keys;  ///< (scope, key) pairs set.

    auto operator==(const EditSummary&) const -> bool = default;
};

// -- SceneGraph ---------------------------------------------------------------

/// Validates domain edits against a replica and translates them into ops.
///
/// Structural invariants are enforced here, before anything is replicated:
/// node ids are unique, the canvas root is never edited, and a node is never
/// placed under itself or one of its descendants. Positions are expressed as
/// fractional order keys, so a reorder rewrites the moved node's key only.
///
/// @code
/// auto scene = SceneGraph{doc};
/// auto ops = scene.apply(InsertNode{.id = "title", .kind = NodeKind::text,
///                                   .fields = {{"text", "Hello"}}});
/// send(ops);
/// @endcode
class SceneGraph {
public:
    explicit SceneGraph(Document& doc) : doc_{doc} {}

    /// Validate an edit and produce the unstamped ops that implement it.
    /// @throws scenesync::Exception (validation_rejected) if the edit is invalid.
    auto to_ops(const DomainEdit& edit) const -> std::vector<Op>;

    /// Translate an edit and commit it to the bound document.
    /// @return The stamped ops to transmit.
    /// @throws scenesync::Exception (validation_rejected) if the edit is invalid.
    auto apply(const DomainEdit& edit) -> std::vector<Op>;

    /// Summarize a batch of ops.
    static auto from_ops(std::span<const Op> ops) -> EditSummary;

private:
    Document& doc_;
};

}  // namespace scenesync
