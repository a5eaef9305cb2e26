#include <scenesync/document.hpp>
#include <scenesync/error.hpp>

#include "doc_state.hpp"
#include "storage/byte_reader.hpp"
#include "storage/byte_writer.hpp"
#include "storage/chunk.hpp"

#include <mutex>
#include <shared_mutex>

namespace scenesync {

Document::Document()
    : state_{std::make_unique<detail::DocState>()} {}

Document::Document(std::unique_ptr<detail::DocState> state)
    : state_{std::move(state)} {}

Document::~Document() = default;

Document::Document(Document&& other) noexcept
    : state_{[&] {
          auto lock = std::unique_lock{other.mutex_};
          return std::move(other.state_);
      }()} {}

auto Document::operator=(Document&& other) noexcept -> Document& {
    if (this != &other) {
        auto lock = std::scoped_lock{mutex_, other.mutex_};
        state_ = std::move(other.state_);
    }
    return *this;
}

Document::Document(const Document& other)
    : state_{[&] {
          auto lock = std::shared_lock{other.mutex_};
          return std::make_unique<detail::DocState>(*other.state_);
      }()} {}

auto Document::operator=(const Document& other) -> Document& {
    if (this != &other) {
        auto copy = [&] {
            auto lock = std::shared_lock{other.mutex_};
            return std::make_unique<detail::DocState>(*other.state_);
        }();
        auto lock = std::unique_lock{mutex_};
        state_ = std::move(copy);
    }
    return *this;
}

// -- Identity -----------------------------------------------------------------

auto Document::session_id() const -> SessionId {
    auto lock = std::shared_lock{mutex_};
    return state_->session;
}

void Document::set_session_id(SessionId id) {
    auto lock = std::unique_lock{mutex_};
    state_->session = id;
}

// -- Mutation -----------------------------------------------------------------

auto Document::commit(std::vector<Op> ops) -> CommitResult {
    auto lock = std::unique_lock{mutex_};
    auto& st = *state_;
    if (st.session.is_zero()) {
        throw Exception{ErrorKind::validation_rejected, "document has no local session"};
    }

    auto seq = st.applied.get(st.session);
    if (auto it = st.ahead.find(st.session); it != st.ahead.end() && !it->second.empty()) {
        seq = std::max(seq, *it->second.rbegin());
    }
    auto counter = st.next_counter;
    for (auto& op : ops) {
        op.stamp = Stamp{counter++, st.session};
        op.seq = ++seq;
        if (auto err = detail::DocState::shape_error(op)) {
            throw Exception{ErrorKind::validation_rejected, *err};
        }
    }

    auto result = CommitResult{};
    for (const auto& op : ops) st.apply(op, &result.patches);
    result.ops = std::move(ops);
    return result;
}

auto Document::apply_local(const Op& op) -> ApplyResult {
    auto lock = std::unique_lock{mutex_};
    if (detail::DocState::shape_error(op)) return {};
    if (!state_->session.is_zero() && op.origin() != state_->session) return {};
    auto result = ApplyResult{.accepted = true, .duplicate = false, .patches = {}};
    result.duplicate = !state_->apply(op, &result.patches);
    return result;
}

auto Document::merge(const Op& op) -> bool {
    auto lock = std::unique_lock{mutex_};
    return state_->apply(op, nullptr);
}

auto Document::merge(std::span<const Op> ops) -> std::size_t {
    auto lock = std::unique_lock{mutex_};
    auto applied = std::size_t{0};
    for (const auto& op : ops) {
        if (state_->apply(op, nullptr)) ++applied;
    }
    return applied;
}

// -- Reading ------------------------------------------------------------------

auto Document::state() const -> SceneState {
    auto lock = std::shared_lock{mutex_};
    const auto& st = *state_;
    auto m = st.materialize();

    auto result = SceneState{};
    for (const auto& id : m.visible) {
        result.nodes.emplace(id, st.view_of(id, m));
    }
    for (const auto& [scope, entries] : st.meta) {
        auto& out = result.meta[scope];
        for (const auto& [key, reg] : entries) out[key] = reg.value;
    }
    return result;
}

auto Document::node(const NodeId& id) const -> std::optional<NodeView> {
    auto lock = std::shared_lock{mutex_};
    if (!state_->is_visible(id)) return std::nullopt;
    return state_->view_of(id, state_->materialize());
}

auto Document::contains(const NodeId& id) const -> bool {
    auto lock = std::shared_lock{mutex_};
    return state_->nodes.contains(id);
}

auto Document::is_visible(const NodeId& id) const -> bool {
    auto lock = std::shared_lock{mutex_};
    return state_->is_visible(id);
}

auto Document::children(const NodeId& id) const -> std::vector<NodeId> {
    auto lock = std::shared_lock{mutex_};
    auto m = state_->materialize();
    auto it = m.children.find(id);
    return it != m.children.end() ? it->second : std::vector<NodeId>{};
}

auto Document::is_ancestor(const NodeId& ancestor, const NodeId& node) const -> bool {
    auto lock = std::shared_lock{mutex_};
    auto m = state_->materialize();
    auto current = node;
    while (true) {
        if (current == ancestor) return true;
        auto it = m.parent.find(current);
        if (it == m.parent.end()) return false;
        current = it->second;
    }
}

auto Document::field(const NodeId& id, std::string_view name) const
    -> std::optional<ScalarValue> {
    auto lock = std::shared_lock{mutex_};
    const auto* node = state_->get_node(id);
    if (!node) return std::nullopt;
    auto it = node->fields.find(std::string{name});
    if (it == node->fields.end()) return std::nullopt;
    return it->second.value;
}

auto Document::meta(MetaScope scope, std::string_view key) const
    -> std::optional<ScalarValue> {
    auto lock = std::shared_lock{mutex_};
    auto s = state_->meta.find(scope);
    if (s == state_->meta.end()) return std::nullopt;
    auto it = s->second.find(std::string{key});
    if (it == s->second.end()) return std::nullopt;
    return it->second.value;
}

auto Document::tombstone(const NodeId& id) const -> std::optional<TombstoneView> {
    auto lock = std::shared_lock{mutex_};
    const auto* node = state_->get_node(id);
    if (!node || !node->tombstone) return std::nullopt;
    auto view = TombstoneView{
        .deleted_by = *node->tombstone,
        .kind = node->kind,
        .parent = node->placement.parent,
        .fields = {}};
    for (const auto& [name, reg] : node->fields) view.fields[name] = reg.value;
    return view;
}

// -- Watermark and log --------------------------------------------------------

auto Document::watermark() const -> Watermark {
    auto lock = std::shared_lock{mutex_};
    return state_->applied;
}

auto Document::ops_since(const Watermark& since) const -> std::optional<std::vector<Op>> {
    auto lock = std::shared_lock{mutex_};
    return state_->ops_since(since);
}

void Document::truncate_log(const Watermark& upto) {
    auto lock = std::unique_lock{mutex_};
    state_->truncate_log(upto);
}

auto Document::log_size() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return state_->log.size();
}

// -- Binary serialization -----------------------------------------------------

namespace {

void write_register(storage::ByteWriter& w, const detail::Register& reg) {
    w.write_stamp(reg.stamp);
    w.write_scalar(reg.value);
}

auto read_register(storage::ByteReader& r) -> std::optional<detail::Register> {
    auto stamp = r.read_stamp();
    auto value = stamp ? r.read_scalar() : std::nullopt;
    if (!value) return std::nullopt;
    return detail::Register{.stamp = *stamp, .value = std::move(*value)};
}

void write_ops(storage::ByteWriter& w, const std::vector<Op>& ops) {
    w.write_uleb128(ops.size());
    for (const auto& op : ops) w.write_op(op);
}

auto read_ops(storage::ByteReader& r) -> std::optional<std::vector<Op>> {
    auto count = r.read_uleb128();
    if (!count || *count > r.remaining()) return std::nullopt;
    auto ops = std::vector<Op>{};
    ops.reserve(static_cast<std::size_t>(*count));
    for (std::uint64_t i = 0; i < *count; ++i) {
        auto op = r.read_op();
        if (!op) return std::nullopt;
        ops.push_back(std::move(*op));
    }
    return ops;
}

auto encode_state(const detail::DocState& st) -> std::vector<std::byte> {
    auto w = storage::ByteWriter{};
    w.write_session(st.session);
    w.write_uleb128(st.next_counter);

    w.write_watermark(st.applied);
    w.write_uleb128(st.ahead.size());
    for (const auto& [session, seqs] : st.ahead) {
        w.write_session(session);
        w.write_uleb128(seqs.size());
        for (auto s : seqs) w.write_uleb128(s);
    }
    w.write_watermark(st.log_base);

    w.write_uleb128(st.nodes.size());
    for (const auto& [id, node] : st.nodes) {
        w.write_string(id);
        w.write_u8(static_cast<std::uint8_t>(node.kind));
        w.write_stamp(node.created);
        w.write_string(node.placement.parent);
        w.write_string(node.placement.order_key);
        w.write_stamp(node.placement.stamp);
        w.write_u8(node.tombstone ? 1 : 0);
        if (node.tombstone) w.write_stamp(*node.tombstone);
        w.write_uleb128(node.fields.size());
        for (const auto& [name, reg] : node.fields) {
            w.write_string(name);
            write_register(w, reg);
        }
    }

    w.write_uleb128(st.meta.size());
    for (const auto& [scope, entries] : st.meta) {
        w.write_u8(static_cast<std::uint8_t>(scope));
        w.write_uleb128(entries.size());
        for (const auto& [key, reg] : entries) {
            w.write_string(key);
            write_register(w, reg);
        }
    }

    w.write_uleb128(st.parked.size());
    for (const auto& [id, ops] : st.parked) {
        w.write_string(id);
        write_ops(w, ops);
    }

    write_ops(w, st.log);
    return w.take();
}

auto decode_state(std::span<const std::byte> body) -> std::unique_ptr<detail::DocState> {
    auto r = storage::ByteReader{body};
    auto st = std::make_unique<detail::DocState>();
    st->nodes.clear();

    auto session = r.read_session();
    auto next_counter = session ? r.read_uleb128() : std::nullopt;
    auto applied = next_counter ? r.read_watermark() : std::nullopt;
    if (!applied) return nullptr;
    st->session = *session;
    st->next_counter = *next_counter;
    st->applied = std::move(*applied);

    auto ahead_count = r.read_uleb128();
    if (!ahead_count) return nullptr;
    for (std::uint64_t i = 0; i < *ahead_count; ++i) {
        auto origin = r.read_session();
        auto n = origin ? r.read_uleb128() : std::nullopt;
        if (!n) return nullptr;
        auto& seqs = st->ahead[*origin];
        for (std::uint64_t j = 0; j < *n; ++j) {
            auto s = r.read_uleb128();
            if (!s) return nullptr;
            seqs.insert(*s);
        }
    }
    auto log_base = r.read_watermark();
    if (!log_base) return nullptr;
    st->log_base = std::move(*log_base);

    auto node_count = r.read_uleb128();
    if (!node_count) return nullptr;
    for (std::uint64_t i = 0; i < *node_count; ++i) {
        auto id = r.read_string();
        auto kind = id ? r.read_u8() : std::nullopt;
        if (!kind || *kind > static_cast<std::uint8_t>(NodeKind::component)) return nullptr;
        auto created = r.read_stamp();
        auto parent = created ? r.read_string() : std::nullopt;
        auto key = parent ? r.read_string() : std::nullopt;
        auto placed = key ? r.read_stamp() : std::nullopt;
        auto has_tomb = placed ? r.read_u8() : std::nullopt;
        if (!has_tomb) return nullptr;

        auto node = detail::NodeState{
            .kind = static_cast<NodeKind>(*kind),
            .created = *created,
            .placement = detail::Placement{.parent = std::move(*parent),
                                           .order_key = std::move(*key),
                                           .stamp = *placed},
            .fields = {},
            .tombstone = std::nullopt};
        if (*has_tomb != 0) {
            auto tomb = r.read_stamp();
            if (!tomb) return nullptr;
            node.tombstone = *tomb;
        }
        auto field_count = r.read_uleb128();
        if (!field_count) return nullptr;
        for (std::uint64_t f = 0; f < *field_count; ++f) {
            auto name = r.read_string();
            auto reg = name ? read_register(r) : std::nullopt;
            if (!reg) return nullptr;
            node.fields.emplace(std::move(*name), std::move(*reg));
        }
        st->nodes.emplace(std::move(*id), std::move(node));
    }
    if (!st->nodes.contains(root_node)) return nullptr;

    auto scope_count = r.read_uleb128();
    if (!scope_count) return nullptr;
    for (std::uint64_t i = 0; i < *scope_count; ++i) {
        auto scope = r.read_u8();
        if (!scope || *scope > static_cast<std::uint8_t>(MetaScope::assets)) return nullptr;
        auto n = r.read_uleb128();
        if (!n) return nullptr;
        auto& entries = st->meta[static_cast<MetaScope>(*scope)];
        for (std::uint64_t j = 0; j < *n; ++j) {
            auto key = r.read_string();
            auto reg = key ? read_register(r) : std::nullopt;
            if (!reg) return nullptr;
            entries.emplace(std::move(*key), std::move(*reg));
        }
    }

    auto parked_count = r.read_uleb128();
    if (!parked_count) return nullptr;
    for (std::uint64_t i = 0; i < *parked_count; ++i) {
        auto id = r.read_string();
        auto ops = id ? read_ops(r) : std::nullopt;
        if (!ops) return nullptr;
        st->parked.emplace(std::move(*id), std::move(*ops));
    }

    auto log = read_ops(r);
    if (!log || !r.at_end()) return nullptr;
    st->log = std::move(*log);
    return st;
}

}  // namespace

auto Document::save() const -> std::vector<std::byte> {
    auto lock = std::shared_lock{mutex_};
    auto body = encode_state(*state_);
    return storage::write_chunk(storage::ChunkType::snapshot, body);
}

auto Document::load(std::span<const std::byte> data) -> std::optional<Document> {
    auto body = storage::read_chunk(storage::ChunkType::snapshot, data);
    if (!body) return std::nullopt;
    auto st = decode_state(*body);
    if (!st) return std::nullopt;
    return Document{std::move(st)};
}

}  // namespace scenesync
