/// @file document.hpp
/// @brief The Document class -- the replicated scene document store.

#pragma once

#include <scenesync/op.hpp>
#include <scenesync/patch.hpp>
#include <scenesync/types.hpp>
#include <scenesync/value.hpp>
#include <scenesync/watermark.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace scenesync {

namespace detail {
struct DocState;
}  // namespace detail

/// A visible node of the materialized scene tree.
struct NodeView {
    NodeId id;
    NodeKind kind{NodeKind::group};
    NodeId parent;                                 ///< Empty for the canvas root.
    std::string order_key;
    std::map<std::string, ScalarValue> fields;     ///< Winning value per field.
    std::vector<NodeId> children;                  ///< Visible children in sibling order.

    auto operator==(const NodeView&) const -> bool = default;
};

/// The merged state of a document: the visible tree plus document-level maps.
///
/// Two replicas that have applied the same set of operations produce equal
/// SceneStates regardless of arrival order.
struct SceneState {
    std::map<NodeId, NodeView> nodes;  ///< Every visible node, root included.
    std::map<MetaScope, std::map<std::string, ScalarValue>> meta;

    /// The node with the given id, or nullptr if it is not visible.
    auto find(const NodeId& id) const -> const NodeView* {
        auto it = nodes.find(id);
        return it != nodes.end() ? &it->second : nullptr;
    }

    /// Visible children of a node in sibling order (empty if not visible).
    auto children(const NodeId& id) const -> std::vector<NodeId> {
        const auto* n = find(id);
        return n ? n->children : std::vector<NodeId>{};
    }

    auto operator==(const SceneState&) const -> bool = default;
};

/// What a deleted node still carries.
struct TombstoneView {
    Stamp deleted_by;                           ///< The winning delete.
    NodeKind kind{NodeKind::group};
    NodeId parent;                              ///< Last placement before/after deletion.
    std::map<std::string, ScalarValue> fields;  ///< Field values, including edits made
                                                ///< concurrently with or after the delete.

    auto operator==(const TombstoneView&) const -> bool = default;
};

/// Result of Document::apply_local().
struct ApplyResult {
    bool accepted{false};        ///< False if the op was malformed.
    bool duplicate{false};       ///< The op had already been applied.
    std::vector<Patch> patches;  ///< Visible effect (empty for duplicates and lost races).
};

/// Result of Document::commit().
struct CommitResult {
    std::vector<Op> ops;         ///< The stamped ops, ready to transmit.
    std::vector<Patch> patches;  ///< Their visible effect on this replica.
};

/// A conflict-free replicated scene document.
///
/// Document owns the CRDT state of one scene: a table of nodes with
/// last-writer-wins field registers, placement registers ordered by
/// fractional order keys, tombstones, and document-level maps. Every
/// mutation goes through the merge function, which is commutative and
/// idempotent: applying the same set of operations in any order, or twice,
/// yields the same SceneState.
///
/// Document is safe for concurrent use: merges take an exclusive lock, reads
/// take a shared lock. One Document is held per room, so merges within a
/// room are serialized while different rooms proceed independently.
///
/// @code
/// auto doc = Document{};
/// doc.set_session_id(SessionId::random());
/// auto op = Op{.type = OpType::insert_node, .node = "text_1",
///              .parent = root_node, .order_key = "V", .kind = NodeKind::text};
/// auto result = doc.commit({op});
/// send(result.ops);
/// @endcode
class Document {
public:
    /// Construct an empty document containing only the canvas root.
    Document();

    ~Document();

    Document(Document&&) noexcept;
    auto operator=(Document&&) noexcept -> Document&;

    /// Deep-copy a document. The copy is independent and shares no state.
    Document(const Document&);
    /// Deep-copy assignment.
    auto operator=(const Document&) -> Document&;

    // -- Identity -------------------------------------------------------------

    /// The session this replica stamps local ops with.
    auto session_id() const -> SessionId;

    /// Set the local session. The per-session sequence continues from the
    /// highest sequence already applied for that session.
    void set_session_id(SessionId id);

    // -- Mutation -------------------------------------------------------------

    /// Stamp a batch of locally produced ops and apply them.
    ///
    /// Each op receives the next Lamport counter and the next sequence number
    /// of the local session; the incoming stamp and seq are ignored.
    /// @throws scenesync::Exception (validation_rejected) if an op is malformed;
    ///   nothing is applied in that case.
    auto commit(std::vector<Op> ops) -> CommitResult;

    /// Apply an op produced by a directly attached session.
    ///
    /// The op must already be stamped. Malformed ops are not applied and
    /// yield `accepted == false`. Duplicates are accepted with no patches.
    auto apply_local(const Op& op) -> ApplyResult;

    /// Merge an op received from another replica or process.
    /// @return true if the op was applied, false if it was a duplicate or malformed.
    auto merge(const Op& op) -> bool;

    /// Merge a batch of ops. Returns the number applied.
    auto merge(std::span<const Op> ops) -> std::size_t;

    // -- Reading --------------------------------------------------------------

    /// The materialized scene: visible nodes in tree order plus meta maps.
    auto state() const -> SceneState;

    /// A single visible node, or nullopt.
    auto node(const NodeId& id) const -> std::optional<NodeView>;

    /// Whether a node exists in any form (visible, orphaned or tombstoned).
    auto contains(const NodeId& id) const -> bool;

    /// Whether a node is part of the visible tree.
    auto is_visible(const NodeId& id) const -> bool;

    /// Visible children of a node in sibling order.
    auto children(const NodeId& id) const -> std::vector<NodeId>;

    /// Whether `ancestor` is `node` or one of its ancestors in the visible tree.
    auto is_ancestor(const NodeId& ancestor, const NodeId& node) const -> bool;

    /// The winning value of a node field.
    auto field(const NodeId& id, std::string_view name) const -> std::optional<ScalarValue>;

    /// The winning value of a document-level map key.
    auto meta(MetaScope scope, std::string_view key) const -> std::optional<ScalarValue>;

    /// The retained state of a deleted node, or nullopt if it is not deleted.
    auto tombstone(const NodeId& id) const -> std::optional<TombstoneView>;

    // -- Watermark and log ----------------------------------------------------

    /// Contiguous per-session sequence numbers applied so far.
    auto watermark() const -> Watermark;

    /// Ops the holder of `since` is missing, in application order.
    /// @return nullopt if the in-memory log was truncated past `since`.
    auto ops_since(const Watermark& since) const -> std::optional<std::vector<Op>>;

    /// Drop logged ops covered by `upto`.
    void truncate_log(const Watermark& upto);

    /// Number of ops currently held in the in-memory log.
    auto log_size() const -> std::size_t;

    // -- Binary serialization -------------------------------------------------

    /// Serialize the full replica state (checksummed, compressed chunk).
    auto save() const -> std::vector<std::byte>;

    /// Load a document saved with save().
    /// @return The loaded document, or nullopt if the data is invalid or corrupt.
    static auto load(std::span<const std::byte> data) -> std::optional<Document>;

private:
    explicit Document(std::unique_ptr<detail::DocState> state);

    std::unique_ptr<detail::DocState> state_;
    mutable std::shared_mutex mutex_;
};

}  // namespace scenesync
