#pragma once

// Internal header, not installed. Implementation detail of Document.

#include <scenesync/op.hpp>
#include <scenesync/patch.hpp>
#include <scenesync/types.hpp>
#include <scenesync/value.hpp>
#include <scenesync/watermark.hpp>

#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

namespace scenesync::detail {

// A last-writer-wins register.
struct Register {
    Stamp stamp;
    ScalarValue value;
};

// Where a node sits: its parent and its position among siblings.
struct Placement {
    NodeId parent;
    std::string order_key;
    Stamp stamp;
};

// The CRDT state of a single node. Tombstoned nodes keep merging.
struct NodeState {
    NodeKind kind{NodeKind::group};
    Stamp created;
    Placement placement;
    std::map<std::string, Register> fields;
    std::optional<Stamp> tombstone;
};

// Effective parent links and visibility after cycle breaking.
struct Materialized {
    std::map<NodeId, NodeId> parent;  // every non-root node whose parent exists
    std::unordered_set<NodeId> visible;
    std::map<NodeId, std::vector<NodeId>> children;  // visible only, sorted
};

// The complete internal state of a Document.
struct DocState {
    SessionId session;
    std::uint64_t next_counter = 1;
    std::map<NodeId, NodeState> nodes;
    std::map<MetaScope, std::map<std::string, Register>> meta;

    // Duplicate detection and watermarks
    Watermark applied;
    std::map<SessionId, std::set<std::uint64_t>> ahead;  // applied seqs above `applied`

    // Ops whose target node has not arrived yet
    std::map<NodeId, std::vector<Op>> parked;

    // Replayable log since the last truncation
    std::vector<Op> log;
    Watermark log_base;

    DocState() {
        nodes[root_node] = NodeState{
            .kind = NodeKind::canvas, .created = {}, .placement = {},
            .fields = {}, .tombstone = std::nullopt};
    }

    auto get_node(const NodeId& id) -> NodeState* {
        auto it = nodes.find(id);
        return it != nodes.end() ? &it->second : nullptr;
    }

    auto get_node(const NodeId& id) const -> const NodeState* {
        auto it = nodes.find(id);
        return it != nodes.end() ? &it->second : nullptr;
    }

    // -- Validation -----------------------------------------------------------

    // Returns a description of what is wrong with the op, or nullopt.
    static auto shape_error(const Op& op) -> std::optional<std::string> {
        if (op.stamp.counter == 0 || op.seq == 0) return "op is not stamped";
        if (op.stamp.session.is_zero()) return "op has no origin session";

        switch (op.type) {
            case OpType::insert_node:
                if (op.node.empty()) return "insert_node without node id";
                if (op.node == root_node) return "cannot insert the canvas root";
                if (op.parent.empty()) return "insert_node without parent";
                if (op.parent == op.node) return "node cannot be its own parent";
                if (op.order_key.empty()) return "insert_node without order key";
                if (op.kind == NodeKind::canvas) return "cannot insert a second canvas";
                return std::nullopt;
            case OpType::delete_node:
                if (op.node.empty()) return "delete_node without node id";
                if (op.node == root_node) return "cannot delete the canvas root";
                return std::nullopt;
            case OpType::set_field:
                if (op.node.empty()) return "set_field without node id";
                if (op.field.empty()) return "set_field without field name";
                return std::nullopt;
            case OpType::move_node:
                if (op.node.empty()) return "move_node without node id";
                if (op.node == root_node) return "cannot move the canvas root";
                if (op.parent.empty()) return "move_node without parent";
                if (op.parent == op.node) return "node cannot be its own parent";
                if (op.order_key.empty()) return "move_node without order key";
                return std::nullopt;
            case OpType::set_meta:
                if (op.field.empty()) return "set_meta without key";
                return std::nullopt;
        }
        return "unknown op type";
    }

    // -- Sequence tracking ----------------------------------------------------

    auto is_duplicate(const Op& op) const -> bool {
        if (applied.covers(op.origin(), op.seq)) return true;
        auto it = ahead.find(op.origin());
        return it != ahead.end() && it->second.contains(op.seq);
    }

    void record_seq(const SessionId& origin, std::uint64_t seq) {
        auto next = applied.get(origin) + 1;
        if (seq != next) {
            ahead[origin].insert(seq);
            return;
        }
        applied.advance(origin, seq);
        auto it = ahead.find(origin);
        if (it == ahead.end()) return;
        auto& pending = it->second;
        while (!pending.empty() && *pending.begin() == applied.get(origin) + 1) {
            applied.advance(origin, *pending.begin());
            pending.erase(pending.begin());
        }
        if (pending.empty()) ahead.erase(it);
    }

    // -- Merge ----------------------------------------------------------------

    // Apply an op. Returns false for malformed ops and duplicates.
    auto apply(const Op& op, std::vector<Patch>* patches) -> bool {
        if (shape_error(op)) return false;
        if (is_duplicate(op)) return false;

        record_seq(op.origin(), op.seq);
        next_counter = std::max(next_counter, op.stamp.counter + 1);
        log.push_back(op);
        effect(op, patches);
        return true;
    }

    void effect(const Op& op, std::vector<Patch>* patches) {
        switch (op.type) {
            case OpType::set_meta: {
                auto& reg = meta[op.scope][op.field];
                if (reg.stamp < op.stamp) {
                    reg = Register{.stamp = op.stamp, .value = op.value};
                    if (patches) {
                        patches->push_back(Patch{
                            .node = {},
                            .action = PatchMeta{.scope = op.scope, .key = op.field,
                                                .value = op.value}});
                    }
                }
                break;
            }
            case OpType::insert_node:
                insert_node(op, patches);
                break;
            case OpType::delete_node: {
                auto* node = get_node(op.node);
                if (!node) { park(op); break; }
                const bool was_visible = is_visible(op.node);
                if (!node->tombstone || *node->tombstone < op.stamp) {
                    node->tombstone = op.stamp;
                }
                if (patches && was_visible) {
                    patches->push_back(Patch{.node = op.node, .action = PatchDelete{}});
                }
                break;
            }
            case OpType::set_field: {
                auto* node = get_node(op.node);
                if (!node) { park(op); break; }
                auto& reg = node->fields[op.field];
                if (reg.stamp < op.stamp) {
                    reg = Register{.stamp = op.stamp, .value = op.value};
                    if (patches && is_visible(op.node)) {
                        patches->push_back(Patch{
                            .node = op.node,
                            .action = PatchField{.field = op.field, .value = op.value}});
                    }
                }
                break;
            }
            case OpType::move_node: {
                auto* node = get_node(op.node);
                if (!node) { park(op); break; }
                if (write_placement(*node, op) && patches && is_visible(op.node)) {
                    patches->push_back(Patch{
                        .node = op.node,
                        .action = PatchMove{.parent = op.parent, .order_key = op.order_key}});
                }
                break;
            }
        }
    }

    static auto write_placement(NodeState& node, const Op& op) -> bool {
        if (!(node.placement.stamp < op.stamp)) return false;
        node.placement = Placement{
            .parent = op.parent, .order_key = op.order_key, .stamp = op.stamp};
        return true;
    }

    void insert_node(const Op& op, std::vector<Patch>* patches) {
        auto* existing = get_node(op.node);
        if (existing) {
            // Concurrent inserts of the same id: the earliest creation decides
            // the kind, the latest placement decides the position.
            if (op.stamp < existing->created) {
                existing->created = op.stamp;
                existing->kind = op.kind;
            }
            if (write_placement(*existing, op) && patches && is_visible(op.node)) {
                patches->push_back(Patch{
                    .node = op.node,
                    .action = PatchMove{.parent = op.parent, .order_key = op.order_key}});
            }
            return;
        }

        nodes[op.node] = NodeState{
            .kind = op.kind,
            .created = op.stamp,
            .placement = Placement{.parent = op.parent, .order_key = op.order_key,
                                   .stamp = op.stamp},
            .fields = {},
            .tombstone = std::nullopt};

        if (patches && is_visible(op.node)) {
            patches->push_back(Patch{
                .node = op.node,
                .action = PatchInsert{.parent = op.parent, .kind = op.kind}});
        }

        auto it = parked.find(op.node);
        if (it == parked.end()) return;
        auto waiting = std::move(it->second);
        parked.erase(it);
        for (const auto& w : waiting) effect(w, patches);
    }

    void park(const Op& op) {
        parked[op.node].push_back(op);
    }

    // -- Log ------------------------------------------------------------------

    auto ops_since(const Watermark& since) const -> std::optional<std::vector<Op>> {
        if (!since.dominates(log_base)) return std::nullopt;
        auto result = std::vector<Op>{};
        for (const auto& op : log) {
            if (!since.covers(op.origin(), op.seq)) result.push_back(op);
        }
        return result;
    }

    void truncate_log(const Watermark& upto) {
        std::erase_if(log, [&](const Op& op) {
            return upto.covers(op.origin(), op.seq);
        });
        for (const auto& [session, seq] : upto.entries()) {
            log_base.advance(session, seq);
        }
    }

    // -- Materialization ------------------------------------------------------

    // Cheap visibility check: walk placement parents up to the root. Falls
    // back to full materialization when the walk runs into a cycle.
    auto is_visible(const NodeId& id) const -> bool {
        auto seen = std::unordered_set<NodeId>{};
        auto current = id;
        while (true) {
            if (current == root_node) return true;
            const auto* node = get_node(current);
            if (!node || node->tombstone) return false;
            if (!seen.insert(current).second) {
                return materialize().visible.contains(id);
            }
            current = node->placement.parent;
        }
    }

    auto materialize() const -> Materialized {
        auto result = Materialized{};

        for (const auto& [id, node] : nodes) {
            if (id == root_node) continue;
            if (nodes.contains(node.placement.parent)) {
                result.parent[id] = node.placement.parent;
            }
        }

        break_cycles(result.parent);

        // Visibility: the chain of effective parents reaches the root and
        // no node on it is tombstoned.
        auto memo = std::map<NodeId, bool>{};
        memo[root_node] = true;
        for (const auto& [id, node] : nodes) {
            resolve_visible(id, result.parent, memo);
        }
        for (const auto& [id, vis] : memo) {
            if (vis) result.visible.insert(id);
        }

        for (const auto& id : result.visible) {
            if (id == root_node) continue;
            result.children[result.parent.at(id)].push_back(id);
        }
        for (auto& [parent, kids] : result.children) {
            std::ranges::sort(kids, [&](const NodeId& a, const NodeId& b) {
                const auto& pa = nodes.at(a).placement;
                const auto& pb = nodes.at(b).placement;
                if (pa.order_key != pb.order_key) return pa.order_key < pb.order_key;
                return pa.stamp < pb.stamp;
            });
        }
        return result;
    }

    // In a graph where every node has at most one parent, cycles are
    // disjoint. Each one is broken by re-rooting the member whose placement
    // was written last.
    void break_cycles(std::map<NodeId, NodeId>& parent) const {
        auto done = std::unordered_set<NodeId>{};
        for (const auto& [start, unused] : parent) {
            if (done.contains(start)) continue;
            auto path = std::vector<NodeId>{};
            auto on_path = std::map<NodeId, std::size_t>{};
            auto current = start;
            while (true) {
                if (done.contains(current)) break;
                if (auto it = on_path.find(current); it != on_path.end()) {
                    auto winner = path[it->second];
                    for (auto i = it->second; i < path.size(); ++i) {
                        if (nodes.at(winner).placement.stamp < nodes.at(path[i]).placement.stamp) {
                            winner = path[i];
                        }
                    }
                    parent[winner] = root_node;
                    break;
                }
                on_path[current] = path.size();
                path.push_back(current);
                auto next = parent.find(current);
                if (next == parent.end()) break;
                current = next->second;
            }
            done.insert(path.begin(), path.end());
        }
    }

    auto resolve_visible(const NodeId& id, const std::map<NodeId, NodeId>& parent,
                         std::map<NodeId, bool>& memo) const -> bool {
        auto chain = std::vector<NodeId>{};
        auto current = id;
        auto result = false;
        while (true) {
            if (auto it = memo.find(current); it != memo.end()) {
                result = it->second;
                break;
            }
            const auto* node = get_node(current);
            if (!node || node->tombstone) { result = false; chain.push_back(current); break; }
            chain.push_back(current);
            auto next = parent.find(current);
            if (next == parent.end()) { result = false; break; }
            current = next->second;
        }
        for (const auto& c : chain) memo[c] = result;
        return result;
    }

    auto view_of(const NodeId& id, const Materialized& m) const -> NodeView {
        const auto& node = nodes.at(id);
        auto view = NodeView{
            .id = id,
            .kind = node.kind,
            .parent = id == root_node ? NodeId{} : m.parent.at(id),
            .order_key = node.placement.order_key,
            .fields = {},
            .children = {}};
        for (const auto& [name, reg] : node.fields) view.fields[name] = reg.value;
        if (auto it = m.children.find(id); it != m.children.end()) view.children = it->second;
        return view;
    }
};

}  // namespace scenesync::detail
