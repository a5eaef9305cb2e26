#include <scenesync/scene_graph.hpp>

#include <scenesync/error.hpp>
#include <scenesync/order_key.hpp>

#include <algorithm>

namespace scenesync {

namespace {

[[noreturn]] void reject(std::string message) {
    throw Exception{ErrorKind::validation_rejected, std::move(message)};
}

auto require_visible(const SceneState& state, const NodeId& id) -> const NodeView& {
    if (id.empty()) reject("node id is empty");
    const auto* view = state.find(id);
    if (!view) reject("unknown node: " + id);
    return *view;
}

void require_editable(const SceneState& state, const NodeId& id) {
    if (id == root_node) reject("the canvas root cannot be edited");
    require_visible(state, id);
}

// Produce an order key for a new slot at `index` among `siblings`.
//
// Normally only the new key is chosen. When the neighbouring keys are equal
// (concurrent inserts at the same spot) or malformed, there is no key between
// them; the smallest run of siblings around the slot is given fresh keys and
// their move ops are appended to `ops`.
auto place(const SceneState& state, const NodeId& parent, std::vector<NodeId> siblings,
           std::size_t index, std::vector<Op>& ops) -> std::string {
    auto keys = std::vector<std::string>{};
    keys.reserve(siblings.size());
    for (const auto& id : siblings) keys.push_back(state.find(id)->order_key);

    const auto n = siblings.size();
    auto s = index;
    auto e = index;
    auto lo = std::optional<std::string>{};
    auto hi = std::optional<std::string>{};
    while (true) {
        lo = s > 0 ? std::optional{keys[s - 1]} : std::nullopt;
        hi = e < n ? std::optional{keys[e]} : std::nullopt;
        if (lo && !is_valid_order_key(*lo)) { --s; continue; }
        if (hi && !is_valid_order_key(*hi)) { ++e; continue; }
        if (lo && hi && *lo >= *hi) {
            if (s > 0) --s; else ++e;
            continue;
        }
        break;
    }

    if (s == e) return key_between(lo, hi);

    auto fresh = keys_between(lo, hi, e - s + 1);
    auto result = std::move(fresh[index - s]);
    fresh.erase(fresh.begin() + static_cast<std::ptrdiff_t>(index - s));
    for (auto i = s; i < e; ++i) {
        ops.push_back(Op{.type = OpType::move_node, .node = siblings[i], .parent = parent,
                         .order_key = std::move(fresh[i - s])});
    }
    return result;
}

auto without(std::vector<NodeId> ids, const NodeId& id) -> std::vector<NodeId> {
    std::erase(ids, id);
    return ids;
}

}  // namespace

auto SceneGraph::to_ops(const DomainEdit& edit) const -> std::vector<Op> {
    const auto state = doc_.state();
    auto ops = std::vector<Op>{};

    std::visit(overload{
        [&](const InsertNode& e) {
            if (e.id.empty()) reject("node id is empty");
            if (e.id == root_node) reject("node id \"root\" is reserved");
            if (doc_.contains(e.id)) reject("duplicate node id: " + e.id);
            if (e.kind == NodeKind::canvas) reject("a scene has exactly one canvas");
            require_visible(state, e.parent);

            auto siblings = state.children(e.parent);
            auto index = e.index.value_or(siblings.size());
            if (index > siblings.size()) reject("index out of range");

            auto key = place(state, e.parent, std::move(siblings), index, ops);
            ops.push_back(Op{.type = OpType::insert_node, .node = e.id, .parent = e.parent,
                             .order_key = std::move(key), .kind = e.kind});
            for (const auto& [field, value] : e.fields) {
                if (field.empty()) reject("field name is empty");
                ops.push_back(Op{.type = OpType::set_field, .node = e.id,
                                 .field = field, .value = value});
            }
        },
        [&](const DeleteNode& e) {
            require_editable(state, e.id);
            ops.push_back(Op{.type = OpType::delete_node, .node = e.id});
        },
        [&](const MoveNode& e) {
            require_editable(state, e.id);
            require_visible(state, e.new_parent);
            if (doc_.is_ancestor(e.id, e.new_parent)) {
                reject("cannot move " + e.id + " under itself or a descendant");
            }
            auto siblings = without(state.children(e.new_parent), e.id);
            auto index = e.index.value_or(siblings.size());
            if (index > siblings.size()) reject("index out of range");

            auto key = place(state, e.new_parent, std::move(siblings), index, ops);
            ops.push_back(Op{.type = OpType::move_node, .node = e.id, .parent = e.new_parent,
                             .order_key = std::move(key)});
        },
        [&](const ReorderNode& e) {
            require_editable(state, e.id);
            const auto& parent = state.find(e.id)->parent;
            auto siblings = without(state.children(parent), e.id);
            if (e.index > siblings.size()) reject("index out of range");

            auto key = place(state, parent, std::move(siblings), e.index, ops);
            ops.push_back(Op{.type = OpType::move_node, .node = e.id, .parent = parent,
                             .order_key = std::move(key)});
        },
        [&](const SetProperty& e) {
            require_editable(state, e.id);
            if (e.field.empty()) reject("field name is empty");
            ops.push_back(Op{.type = OpType::set_field, .node = e.id,
                             .field = e.field, .value = e.value});
        },
        [&](const SetMeta& e) {
            if (e.key.empty()) reject("meta key is empty");
            ops.push_back(Op{.type = OpType::set_meta, .field = e.key,
                             .value = e.value, .scope = e.scope});
        },
    }, edit);

    return ops;
}

auto SceneGraph::apply(const DomainEdit& edit) -> std::vector<Op> {
    return doc_.commit(to_ops(edit)).ops;
}

auto SceneGraph::from_ops(std::span<const Op> ops) -> EditSummary {
    auto summary = EditSummary{};
    for (const auto& op : ops) {
        switch (op.type) {
            case OpType::insert_node: summary.inserted.push_back(op.node); break;
            case OpType::delete_node: summary.deleted.push_back(op.node); break;
            case OpType::move_node:   summary.moved.push_back(op.node); break;
            case OpType::set_field:   summary.fields.emplace_back(op.node, op.field); break;
            case OpType::set_meta:    summary.meta_keys.emplace_back(op.scope, op.field); break;
        }
    }
    return summary;
}

}  // namespace scenesync
