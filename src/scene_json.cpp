#include <scenesync/scene_json.hpp>

#include <scenesync/error.hpp>
#include <scenesync/order_key.hpp>

#include <limits>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace scenesync {

namespace {

[[noreturn]] void decoding_failure(std::string message) {
    throw Exception{ErrorKind::decoding_error, std::move(message)};
}

[[noreturn]] void invalid_graph(std::string message) {
    throw Exception{ErrorKind::validation_rejected, "scene graph: " + std::move(message)};
}

auto member(const nlohmann::json& j, const char* key) -> const nlohmann::json& {
    if (!j.is_object()) decoding_failure("expected an object");
    auto it = j.find(key);
    if (it == j.end()) decoding_failure(std::string{"missing \""} + key + "\"");
    return *it;
}

auto string_member(const nlohmann::json& j, const char* key) -> std::string {
    const auto& v = member(j, key);
    if (!v.is_string()) decoding_failure(std::string{"\""} + key + "\" must be a string");
    return v.get<std::string>();
}

auto uint_member(const nlohmann::json& j, const char* key) -> std::uint64_t {
    const auto& v = member(j, key);
    if (!v.is_number_unsigned() && !(v.is_number_integer() && v.get<std::int64_t>() >= 0)) {
        decoding_failure(std::string{"\""} + key + "\" must be a non-negative integer");
    }
    return v.get<std::uint64_t>();
}

}  // anonymous namespace

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, Null) {
    j = nullptr;
}

void to_json(nlohmann::json& j, const ScalarValue& sv) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int64_t i) { j = i; },
        [&](double d) { j = d; },
        [&](const std::string& s) { j = s; },
    }, sv);
}

void from_json(const nlohmann::json& j, ScalarValue& sv) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
            sv = Null{};
            return;
        case nlohmann::json::value_t::boolean:
            sv = j.get<bool>();
            return;
        case nlohmann::json::value_t::number_integer:
            sv = j.get<std::int64_t>();
            return;
        case nlohmann::json::value_t::number_unsigned: {
            auto u = j.get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                decoding_failure("integer out of range");
            }
            sv = static_cast<std::int64_t>(u);
            return;
        }
        case nlohmann::json::value_t::number_float:
            sv = j.get<double>();
            return;
        case nlohmann::json::value_t::string:
            sv = j.get<std::string>();
            return;
        default:
            decoding_failure("field values must be scalars");
    }
}

void to_json(nlohmann::json& j, const SessionId& id) {
    j = id.to_hex();
}

void from_json(const nlohmann::json& j, SessionId& id) {
    if (!j.is_string()) decoding_failure("session id must be a hex string");
    auto parsed = SessionId::from_hex(j.get<std::string>());
    if (!parsed) decoding_failure("invalid session id");
    id = *parsed;
}

void to_json(nlohmann::json& j, const Stamp& s) {
    j = nlohmann::json{{"counter", s.counter}, {"session", s.session}};
}

void from_json(const nlohmann::json& j, Stamp& s) {
    s.counter = uint_member(j, "counter");
    from_json(member(j, "session"), s.session);
}

// -- Op -----------------------------------------------------------------------

void to_json(nlohmann::json& j, const Op& op) {
    j = nlohmann::json{
        {"stamp", op.stamp},
        {"seq", op.seq},
        {"type", std::string{to_string_view(op.type)}},
    };
    switch (op.type) {
        case OpType::insert_node:
            j["node"] = op.node;
            j["parent"] = op.parent;
            j["order_key"] = op.order_key;
            j["kind"] = std::string{to_string_view(op.kind)};
            break;
        case OpType::move_node:
            j["node"] = op.node;
            j["parent"] = op.parent;
            j["order_key"] = op.order_key;
            break;
        case OpType::delete_node:
            j["node"] = op.node;
            break;
        case OpType::set_field:
            j["node"] = op.node;
            j["field"] = op.field;
            j["value"] = op.value;
            break;
        case OpType::set_meta:
            j["scope"] = std::string{to_string_view(op.scope)};
            j["key"] = op.field;
            j["value"] = op.value;
            break;
    }
}

void from_json(const nlohmann::json& j, Op& op) {
    op = Op{};
    from_json(member(j, "stamp"), op.stamp);
    op.seq = uint_member(j, "seq");

    auto type = parse_op_type(string_member(j, "type"));
    if (!type) decoding_failure("unknown op type");
    op.type = *type;

    switch (op.type) {
        case OpType::insert_node: {
            op.node = string_member(j, "node");
            op.parent = string_member(j, "parent");
            op.order_key = string_member(j, "order_key");
            auto kind = parse_node_kind(string_member(j, "kind"));
            if (!kind) decoding_failure("unknown node kind");
            op.kind = *kind;
            break;
        }
        case OpType::move_node:
            op.node = string_member(j, "node");
            op.parent = string_member(j, "parent");
            op.order_key = string_member(j, "order_key");
            break;
        case OpType::delete_node:
            op.node = string_member(j, "node");
            break;
        case OpType::set_field:
            op.node = string_member(j, "node");
            op.field = string_member(j, "field");
            from_json(member(j, "value"), op.value);
            break;
        case OpType::set_meta: {
            auto scope = parse_meta_scope(string_member(j, "scope"));
            if (!scope) decoding_failure("unknown meta scope");
            op.scope = *scope;
            op.field = string_member(j, "key");
            from_json(member(j, "value"), op.value);
            break;
        }
    }
}

// -- Watermark ----------------------------------------------------------------

void to_json(nlohmann::json& j, const Watermark& w) {
    j = nlohmann::json::object();
    for (const auto& [session, seq] : w.entries()) {
        j[session.to_hex()] = seq;
    }
}

void from_json(const nlohmann::json& j, Watermark& w) {
    if (!j.is_object()) decoding_failure("watermark must be an object");
    w = Watermark{};
    for (const auto& [key, value] : j.items()) {
        auto session = SessionId::from_hex(key);
        if (!session) decoding_failure("invalid session id in watermark");
        if (!value.is_number_integer() || value.get<std::int64_t>() < 0) {
            decoding_failure("watermark entries must be non-negative integers");
        }
        w.advance(*session, value.get<std::uint64_t>());
    }
}

// -- Materialized state -------------------------------------------------------

void to_json(nlohmann::json& j, const NodeView& n) {
    auto fields = nlohmann::json::object();
    for (const auto& [name, value] : n.fields) fields[name] = value;
    j = nlohmann::json{
        {"id", n.id},
        {"kind", std::string{to_string_view(n.kind)}},
        {"parent", n.parent},
        {"order_key", n.order_key},
        {"fields", std::move(fields)},
        {"children", n.children},
    };
}

void from_json(const nlohmann::json& j, NodeView& n) {
    n = NodeView{};
    n.id = string_member(j, "id");
    auto kind = parse_node_kind(string_member(j, "kind"));
    if (!kind) decoding_failure("unknown node kind");
    n.kind = *kind;
    n.parent = string_member(j, "parent");
    n.order_key = string_member(j, "order_key");

    const auto& fields = member(j, "fields");
    if (!fields.is_object()) decoding_failure("\"fields\" must be an object");
    for (const auto& [name, value] : fields.items()) {
        from_json(value, n.fields[name]);
    }
    const auto& children = member(j, "children");
    if (!children.is_array()) decoding_failure("\"children\" must be an array");
    for (const auto& c : children) {
        if (!c.is_string()) decoding_failure("child ids must be strings");
        n.children.push_back(c.get<std::string>());
    }
}

void to_json(nlohmann::json& j, const SceneState& s) {
    auto nodes = nlohmann::json::object();
    for (const auto& [id, view] : s.nodes) nodes[id] = view;

    auto meta = nlohmann::json::object();
    for (const auto& [scope, entries] : s.meta) {
        auto& out = meta[std::string{to_string_view(scope)}];
        out = nlohmann::json::object();
        for (const auto& [key, value] : entries) out[key] = value;
    }
    j = nlohmann::json{{"nodes", std::move(nodes)}, {"meta", std::move(meta)}};
}

void from_json(const nlohmann::json& j, SceneState& s) {
    s = SceneState{};
    const auto& nodes = member(j, "nodes");
    if (!nodes.is_object()) decoding_failure("\"nodes\" must be an object");
    for (const auto& [id, view] : nodes.items()) {
        from_json(view, s.nodes[id]);
    }
    const auto& meta = member(j, "meta");
    if (!meta.is_object()) decoding_failure("\"meta\" must be an object");
    for (const auto& [name, entries] : meta.items()) {
        auto scope = parse_meta_scope(name);
        if (!scope || !entries.is_object()) decoding_failure("invalid meta scope");
        auto& out = s.meta[*scope];
        for (const auto& [key, value] : entries.items()) {
            from_json(value, out[key]);
        }
    }
}

void to_json(nlohmann::json& j, const Patch& p) {
    j = nlohmann::json{{"node", p.node}};
    std::visit(overload{
        [&](const PatchInsert& a) {
            j["action"] = "insert";
            j["parent"] = a.parent;
            j["kind"] = std::string{to_string_view(a.kind)};
        },
        [&](const PatchDelete&) { j["action"] = "delete"; },
        [&](const PatchMove& a) {
            j["action"] = "move";
            j["parent"] = a.parent;
            j["order_key"] = a.order_key;
        },
        [&](const PatchField& a) {
            j["action"] = "field";
            j["field"] = a.field;
            j["value"] = a.value;
        },
        [&](const PatchMeta& a) {
            j["action"] = "meta";
            j["scope"] = std::string{to_string_view(a.scope)};
            j["key"] = a.key;
            j["value"] = a.value;
        },
    }, p.action);
}

// =============================================================================
// Legacy scene graph
// =============================================================================

namespace {

// Arrays are not scalars; they are stored as JSON text under `<path>[]`.
constexpr auto array_suffix = std::string_view{"[]"};

void flatten_into(const std::string& prefix, const nlohmann::json& j,
                  std::vector<std::pair<std::string, ScalarValue>>& out) {
    if (j.is_object()) {
        for (const auto& [key, value] : j.items()) {
            flatten_into(prefix.empty() ? key : prefix + "." + key, value, out);
        }
        return;
    }
    if (prefix.empty()) invalid_graph("expected an object");
    if (j.is_array()) {
        out.emplace_back(prefix + std::string{array_suffix}, ScalarValue{j.dump()});
        return;
    }
    auto value = ScalarValue{};
    from_json(j, value);
    out.emplace_back(prefix, std::move(value));
}

auto flatten(const nlohmann::json& j) -> std::vector<std::pair<std::string, ScalarValue>> {
    auto out = std::vector<std::pair<std::string, ScalarValue>>{};
    flatten_into({}, j, out);
    return out;
}

void unflatten_into(nlohmann::json& out, std::string_view path, const ScalarValue& value) {
    auto leaf = nlohmann::json{};
    if (path.ends_with(array_suffix)) {
        path.remove_suffix(array_suffix.size());
        const auto* text = std::get_if<std::string>(&value);
        leaf = text ? nlohmann::json::parse(*text, nullptr, false) : nlohmann::json{};
        if (leaf.is_discarded()) leaf = nlohmann::json::array();
    } else {
        leaf = value;
    }

    auto* cur = &out;
    while (true) {
        if (!cur->is_object()) *cur = nlohmann::json::object();
        auto dot = path.find('.');
        if (dot == std::string_view::npos) {
            (*cur)[std::string{path}] = std::move(leaf);
            return;
        }
        cur = &(*cur)[std::string{path.substr(0, dot)}];
        path.remove_prefix(dot + 1);
    }
}

auto default_canvas() -> nlohmann::json {
    return nlohmann::json{{"width", 1440}, {"height", 900}, {"background", "#ffffff"}};
}

auto kind_for_node_type(std::string_view type) -> NodeKind {
    if (type == "text") return NodeKind::text;
    if (type == "image") return NodeKind::image;
    return NodeKind::group;
}

struct LegacyNode {
    NodeId id;
    NodeKind kind;
    NodeId parent;
    const nlohmann::json* source;
};

void check_canvas(const nlohmann::json& canvas) {
    if (!canvas.is_object()) invalid_graph("canvas must be an object");
    for (const auto* dim : {"width", "height"}) {
        auto it = canvas.find(dim);
        if (it == canvas.end() || !it->is_number() || it->get<double>() <= 0) {
            invalid_graph(std::string{"canvas."} + dim + " must be a positive number");
        }
    }
    if (auto it = canvas.find("background"); it != canvas.end() && !it->is_string()) {
        invalid_graph("canvas.background must be a string");
    }
}

void collect_nodes(const nlohmann::json& graph, const char* section, bool components,
                   std::vector<LegacyNode>& out, std::set<NodeId>& ids) {
    auto it = graph.find(section);
    if (it == graph.end()) return;
    if (!it->is_array()) invalid_graph(std::string{section} + " must be an array");

    for (const auto& entry : *it) {
        if (!entry.is_object()) invalid_graph(std::string{section} + " entries must be objects");
        auto id = entry.find("id");
        if (id == entry.end() || !id->is_string() || id->get<std::string>().empty()) {
            invalid_graph("each node must have a string id");
        }
        auto node_id = id->get<std::string>();
        if (node_id == root_node) invalid_graph("node id \"root\" is reserved");
        if (!ids.insert(node_id).second) invalid_graph("duplicate node id: " + node_id);

        auto type = entry.find("type");
        if (type == entry.end() || !type->is_string()) {
            invalid_graph("node " + node_id + " has no type");
        }
        auto parent = NodeId{};
        if (auto p = entry.find("parent"); p != entry.end() && !p->is_null()) {
            if (!p->is_string()) invalid_graph("node " + node_id + ": parent must be a string");
            parent = p->get<std::string>();
        }
        out.push_back(LegacyNode{
            .id = std::move(node_id),
            .kind = components ? NodeKind::component
                               : kind_for_node_type(type->get<std::string>()),
            .parent = std::move(parent),
            .source = &entry});
    }
}

}  // anonymous namespace

auto default_scene_graph() -> nlohmann::json {
    return nlohmann::json{
        {"version", scene_graph_version},
        {"canvas", default_canvas()},
        {"assets", nlohmann::json{{"images", nlohmann::json::object()},
                                  {"fonts", nlohmann::json::object()}}},
        {"nodes", nlohmann::json::array()},
        {"components", nlohmann::json::array()},
    };
}

auto import_scene_graph(const nlohmann::json& graph) -> std::vector<Op> {
    if (!graph.is_object()) invalid_graph("must be an object");
    if (auto v = graph.find("version");
        v != graph.end() && (!v->is_number_integer() || v->get<std::int64_t>() != scene_graph_version)) {
        invalid_graph("version must be " + std::to_string(scene_graph_version));
    }

    auto ops = std::vector<Op>{};
    auto add_meta = [&](MetaScope scope, const nlohmann::json& section) {
        if (!section.is_object()) {
            invalid_graph(std::string{to_string_view(scope)} + " must be an object");
        }
        for (auto& [key, value] : flatten(section)) {
            ops.push_back(Op{.type = OpType::set_meta, .field = std::move(key),
                             .value = std::move(value), .scope = scope});
        }
    };

    auto canvas = graph.value("canvas", default_canvas());
    check_canvas(canvas);
    add_meta(MetaScope::canvas, canvas);
    if (auto it = graph.find("assets"); it != graph.end()) add_meta(MetaScope::assets, *it);
    if (auto it = graph.find("theme"); it != graph.end()) add_meta(MetaScope::theme, *it);
    if (auto it = graph.find("metadata"); it != graph.end()) add_meta(MetaScope::settings, *it);

    auto nodes = std::vector<LegacyNode>{};
    auto ids = std::set<NodeId>{};
    collect_nodes(graph, "nodes", false, nodes, ids);
    collect_nodes(graph, "components", true, nodes, ids);

    // A node without an explicit parent belongs to whichever node lists it
    // as a child, or else to the canvas root.
    auto listed_parent = std::map<NodeId, NodeId>{};
    for (const auto& n : nodes) {
        auto children = n.source->find("children");
        if (children == n.source->end()) continue;
        if (!children->is_array()) invalid_graph("node " + n.id + ": children must be an array");
        for (const auto& c : *children) {
            if (!c.is_string()) invalid_graph("node " + n.id + ": children must be string ids");
            listed_parent.emplace(c.get<std::string>(), n.id);
        }
    }
    for (auto& n : nodes) {
        if (n.parent.empty()) {
            auto it = listed_parent.find(n.id);
            n.parent = it != listed_parent.end() ? it->second : root_node;
        }
        if (n.parent != root_node && !ids.contains(n.parent)) {
            invalid_graph("node " + n.id + " references unknown parent " + n.parent);
        }
    }

    auto by_parent = std::map<NodeId, std::vector<const LegacyNode*>>{};
    for (const auto& n : nodes) by_parent[n.parent].push_back(&n);

    // Emit parents before children, walking from the root. Nodes not reached
    // sit on a parent cycle.
    auto emitted = std::size_t{0};
    auto pending = std::vector<NodeId>{root_node};
    while (!pending.empty()) {
        auto parent = std::move(pending.back());
        pending.pop_back();
        auto it = by_parent.find(parent);
        if (it == by_parent.end()) continue;

        auto keys = keys_between(std::nullopt, std::nullopt, it->second.size());
        for (std::size_t i = 0; i < it->second.size(); ++i) {
            const auto& n = *it->second[i];
            ops.push_back(Op{.type = OpType::insert_node, .node = n.id, .parent = n.parent,
                             .order_key = keys[i], .kind = n.kind});
            for (const auto& [key, value] : n.source->items()) {
                if (key == "id" || key == "parent" || key == "children") continue;
                auto scalar_or_nested = nlohmann::json{{key, value}};
                for (auto& [field, v] : flatten(scalar_or_nested)) {
                    ops.push_back(Op{.type = OpType::set_field, .node = n.id,
                                     .field = std::move(field), .value = std::move(v)});
                }
            }
            pending.push_back(n.id);
            ++emitted;
        }
    }
    if (emitted != nodes.size()) invalid_graph("parent links form a cycle");
    return ops;
}

auto export_scene_graph(const SceneState& state) -> nlohmann::json {
    auto graph = default_scene_graph();

    auto meta_section = [&](MetaScope scope) -> std::optional<nlohmann::json> {
        auto it = state.meta.find(scope);
        if (it == state.meta.end() || it->second.empty()) return std::nullopt;
        auto out = nlohmann::json::object();
        for (const auto& [key, value] : it->second) unflatten_into(out, key, value);
        return out;
    };
    if (auto canvas = meta_section(MetaScope::canvas)) graph["canvas"].update(*canvas);
    if (auto assets = meta_section(MetaScope::assets)) graph["assets"].update(*assets);
    if (auto theme = meta_section(MetaScope::theme)) graph["theme"] = std::move(*theme);
    if (auto settings = meta_section(MetaScope::settings)) graph["metadata"] = std::move(*settings);

    auto pending = std::vector<NodeId>{};
    auto root_children = state.children(root_node);
    pending.assign(root_children.rbegin(), root_children.rend());
    while (!pending.empty()) {
        auto id = std::move(pending.back());
        pending.pop_back();
        const auto* view = state.find(id);
        if (!view) continue;

        auto node = nlohmann::json::object();
        for (const auto& [name, value] : view->fields) unflatten_into(node, name, value);
        node["id"] = view->id;
        if (!node.contains("type")) node["type"] = std::string{to_string_view(view->kind)};
        if (view->parent != root_node) node["parent"] = view->parent;
        if (!view->children.empty()) node["children"] = view->children;

        auto& section = view->kind == NodeKind::component ? graph["components"] : graph["nodes"];
        section.push_back(std::move(node));
        pending.insert(pending.end(), view->children.rbegin(), view->children.rend());
    }
    return graph;
}

}  // namespace scenesync
