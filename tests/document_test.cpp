#include <scenesync/document.hpp>
#include <scenesync/error.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace scenesync;

namespace {

auto session(std::uint8_t n) -> SessionId {
    std::uint8_t raw[16] = {};
    raw[0] = 0x10;
    raw[15] = n;
    return SessionId{raw};
}

auto replica(std::uint8_t n) -> Document {
    auto doc = Document{};
    doc.set_session_id(session(n));
    return doc;
}

auto insert(NodeId id, NodeId parent = root_node, std::string key = "V",
            NodeKind kind = NodeKind::text) -> Op {
    return Op{.type = OpType::insert_node, .node = std::move(id), .parent = std::move(parent),
              .order_key = std::move(key), .kind = kind};
}

auto set_field(NodeId id, std::string field, ScalarValue value) -> Op {
    return Op{.type = OpType::set_field, .node = std::move(id), .field = std::move(field),
              .value = std::move(value)};
}

auto move(NodeId id, NodeId parent, std::string key) -> Op {
    return Op{.type = OpType::move_node, .node = std::move(id), .parent = std::move(parent),
              .order_key = std::move(key)};
}

auto remove_node(NodeId id) -> Op {
    return Op{.type = OpType::delete_node, .node = std::move(id)};
}

void sync(Document& from, Document& to) {
    auto ops = from.ops_since(to.watermark());
    ASSERT_TRUE(ops.has_value());
    to.merge(*ops);
}

}  // namespace

// -- Construction -------------------------------------------------------------

TEST(Document, starts_with_only_the_canvas_root) {
    const auto doc = Document{};
    auto state = doc.state();
    ASSERT_EQ(state.nodes.size(), 1u);
    EXPECT_EQ(state.find(root_node)->kind, NodeKind::canvas);
    EXPECT_TRUE(doc.is_visible(root_node));
    EXPECT_TRUE(doc.watermark().empty());
}

TEST(Document, default_constructed_has_zero_session) {
    const auto doc = Document{};
    EXPECT_TRUE(doc.session_id().is_zero());
}

TEST(Document, commit_without_session_throws) {
    auto doc = Document{};
    EXPECT_THROW(doc.commit({insert("a")}), Exception);
}

// -- Commit -------------------------------------------------------------------

TEST(Document, commit_stamps_ops_with_counter_and_seq) {
    auto doc = replica(1);
    auto result = doc.commit({insert("a"), set_field("a", "text", std::string{"hi"})});

    ASSERT_EQ(result.ops.size(), 2u);
    EXPECT_EQ(result.ops[0].stamp.session, session(1));
    EXPECT_EQ(result.ops[0].seq, 1u);
    EXPECT_EQ(result.ops[1].seq, 2u);
    EXPECT_LT(result.ops[0].stamp, result.ops[1].stamp);
    EXPECT_EQ(doc.watermark().get(session(1)), 2u);
}

TEST(Document, commit_reports_patches) {
    auto doc = replica(1);
    auto result = doc.commit({insert("a"), set_field("a", "text", std::string{"hi"})});

    ASSERT_EQ(result.patches.size(), 2u);
    EXPECT_EQ(result.patches[0].node, "a");
    EXPECT_TRUE(std::holds_alternative<PatchInsert>(result.patches[0].action));
    const auto* field = std::get_if<PatchField>(&result.patches[1].action);
    ASSERT_NE(field, nullptr);
    EXPECT_EQ(field->field, "text");
}

TEST(Document, malformed_commit_applies_nothing) {
    auto doc = replica(1);
    EXPECT_THROW(doc.commit({insert("a"), remove_node(root_node)}), Exception);
    EXPECT_FALSE(doc.contains("a"));
    EXPECT_TRUE(doc.watermark().empty());
}

TEST(Document, field_and_meta_reads) {
    auto doc = replica(1);
    doc.commit({insert("a"), set_field("a", "style.color", std::string{"#f00"}),
                Op{.type = OpType::set_meta, .field = "width", .value = std::int64_t{1440},
                   .scope = MetaScope::canvas}});

    EXPECT_EQ(get_scalar<std::string>(doc.field("a", "style.color")), "#f00");
    EXPECT_EQ(get_scalar<std::int64_t>(doc.meta(MetaScope::canvas, "width")), 1440);
    EXPECT_FALSE(doc.field("a", "missing").has_value());
    EXPECT_FALSE(doc.meta(MetaScope::theme, "width").has_value());
}

// -- Merge semantics ----------------------------------------------------------

TEST(Document, merge_is_idempotent) {
    auto a = replica(1);
    auto ops = a.commit({insert("x"), set_field("x", "text", std::string{"one"})}).ops;

    auto b = replica(2);
    EXPECT_EQ(b.merge(ops), 2u);
    EXPECT_EQ(b.merge(ops), 0u);
    EXPECT_EQ(b.state(), a.state());
    EXPECT_EQ(b.watermark(), a.watermark());
}

TEST(Document, concurrent_field_writes_resolve_by_stamp) {
    auto a = replica(1);
    auto b = replica(2);
    b.merge(a.commit({insert("x")}).ops);

    auto from_a = a.commit({set_field("x", "text", std::string{"from a"})}).ops;
    auto from_b = b.commit({set_field("x", "text", std::string{"from b"})}).ops;
    ASSERT_EQ(from_a[0].stamp.counter, from_b[0].stamp.counter);

    a.merge(from_b);
    b.merge(from_a);

    // Equal counters: the higher session wins on both replicas.
    EXPECT_EQ(get_scalar<std::string>(a.field("x", "text")), "from b");
    EXPECT_EQ(a.state(), b.state());
}

TEST(Document, later_counter_wins_regardless_of_session) {
    auto a = replica(1);
    auto b = replica(2);
    b.merge(a.commit({insert("x")}).ops);

    auto early = b.commit({set_field("x", "text", std::string{"early"})}).ops;
    a.merge(early);
    auto late = a.commit({set_field("x", "text", std::string{"late"})}).ops;
    b.merge(late);

    EXPECT_EQ(get_scalar<std::string>(a.field("x", "text")), "late");
    EXPECT_EQ(get_scalar<std::string>(b.field("x", "text")), "late");
}

TEST(Document, losing_write_produces_no_patch) {
    auto a = replica(1);
    auto b = replica(2);
    auto created = a.commit({insert("x")}).ops;
    b.merge(created);
    auto from_a = a.commit({set_field("x", "text", std::string{"a"})}).ops;
    auto from_b = b.commit({set_field("x", "text", std::string{"b"})}).ops;

    auto server = Document{};
    server.merge(created);
    server.merge(from_b);
    auto result = server.apply_local(from_a[0]);
    EXPECT_TRUE(result.accepted);
    EXPECT_FALSE(result.duplicate);
    EXPECT_TRUE(result.patches.empty());
}

TEST(Document, disjoint_field_edits_are_both_kept) {
    auto a = replica(1);
    auto b = replica(2);
    b.merge(a.commit({insert("x")}).ops);

    auto from_a = a.commit({set_field("x", "text", std::string{"Hello"})}).ops;
    auto from_b = b.commit({set_field("x", "style.color", std::string{"#00f"})}).ops;
    a.merge(from_b);
    b.merge(from_a);

    for (const auto* doc : {&a, &b}) {
        EXPECT_EQ(get_scalar<std::string>(doc->field("x", "text")), "Hello");
        EXPECT_EQ(get_scalar<std::string>(doc->field("x", "style.color")), "#00f");
    }
}

TEST(Document, delete_wins_over_concurrent_edit) {
    auto a = replica(1);
    auto b = replica(2);
    b.merge(a.commit({insert("x")}).ops);

    auto del = a.commit({remove_node("x")}).ops;
    auto edit = b.commit({set_field("x", "text", std::string{"still here?"})}).ops;
    a.merge(edit);
    b.merge(del);

    EXPECT_FALSE(a.is_visible("x"));
    EXPECT_FALSE(b.is_visible("x"));
    auto tomb = b.tombstone("x");
    ASSERT_TRUE(tomb.has_value());
    EXPECT_EQ(get_scalar<std::string>(tomb->fields.at("text")), "still here?");
    EXPECT_EQ(a.state(), b.state());
}

TEST(Document, deleting_a_parent_hides_the_subtree) {
    auto doc = replica(1);
    doc.commit({insert("group", root_node, "V", NodeKind::group), insert("child", "group")});
    doc.commit({remove_node("group")});

    EXPECT_FALSE(doc.is_visible("group"));
    EXPECT_FALSE(doc.is_visible("child"));
    EXPECT_TRUE(doc.contains("child"));
    EXPECT_FALSE(doc.tombstone("child").has_value());
    EXPECT_EQ(doc.state().nodes.size(), 1u);
}

TEST(Document, siblings_sort_by_order_key_then_stamp) {
    auto a = replica(1);
    auto b = replica(2);
    auto from_a = a.commit({insert("from_a", root_node, "V")}).ops;
    auto from_b = b.commit({insert("from_b", root_node, "V")}).ops;
    auto first = a.commit({insert("first", root_node, "1")}).ops;
    a.merge(from_b);
    b.merge(from_a);
    b.merge(first);

    auto expected = std::vector<NodeId>{"first", "from_a", "from_b"};
    EXPECT_EQ(a.children(root_node), expected);
    EXPECT_EQ(b.children(root_node), expected);
}

TEST(Document, concurrent_moves_into_each_other_never_form_a_cycle) {
    auto a = replica(1);
    auto b = replica(2);
    b.merge(a.commit({insert("x", root_node, "1", NodeKind::group),
                      insert("y", root_node, "2", NodeKind::group)}).ops);

    auto from_a = a.commit({move("x", "y", "V")}).ops;
    auto from_b = b.commit({move("y", "x", "V")}).ops;
    a.merge(from_b);
    b.merge(from_a);

    EXPECT_EQ(a.state(), b.state());
    EXPECT_TRUE(a.is_visible("x"));
    EXPECT_TRUE(a.is_visible("y"));
    // The later placement (session 2 breaks the tie) is re-rooted.
    EXPECT_EQ(a.children(root_node), std::vector<NodeId>{"y"});
    EXPECT_EQ(a.children("y"), std::vector<NodeId>{"x"});
    EXPECT_TRUE(a.is_ancestor("y", "x"));
    EXPECT_FALSE(a.is_ancestor("x", "y"));
}

TEST(Document, ops_for_unknown_nodes_wait_for_the_insert) {
    auto a = replica(1);
    auto ops = a.commit({insert("x"), set_field("x", "text", std::string{"late"})}).ops;

    auto b = replica(2);
    EXPECT_TRUE(b.merge(ops[1]));
    EXPECT_FALSE(b.is_visible("x"));
    EXPECT_TRUE(b.merge(ops[0]));
    EXPECT_EQ(get_scalar<std::string>(b.field("x", "text")), "late");
    EXPECT_EQ(b.state(), a.state());
}

TEST(Document, watermark_only_covers_contiguous_sequences) {
    auto a = replica(1);
    auto ops = a.commit({insert("x"), insert("y", root_node, "W"), insert("z", root_node, "X")}).ops;

    auto b = replica(2);
    b.merge(ops[2]);
    EXPECT_EQ(b.watermark().get(session(1)), 0u);
    b.merge(ops[0]);
    EXPECT_EQ(b.watermark().get(session(1)), 1u);
    b.merge(ops[1]);
    EXPECT_EQ(b.watermark().get(session(1)), 3u);
    EXPECT_FALSE(b.merge(ops[2]));
}

// -- apply_local --------------------------------------------------------------

TEST(Document, apply_local_rejects_unstamped_ops) {
    auto doc = Document{};
    auto result = doc.apply_local(insert("x"));
    EXPECT_FALSE(result.accepted);
    EXPECT_FALSE(doc.contains("x"));
}

TEST(Document, apply_local_flags_duplicates) {
    auto a = replica(1);
    auto op = a.commit({insert("x")}).ops[0];

    auto server = Document{};
    auto first = server.apply_local(op);
    EXPECT_TRUE(first.accepted);
    EXPECT_FALSE(first.duplicate);
    EXPECT_EQ(first.patches.size(), 1u);

    auto again = server.apply_local(op);
    EXPECT_TRUE(again.accepted);
    EXPECT_TRUE(again.duplicate);
    EXPECT_TRUE(again.patches.empty());
}

TEST(Document, apply_local_requires_own_origin_when_session_is_set) {
    auto other = replica(2);
    auto op = other.commit({insert("x")}).ops[0];

    auto doc = replica(1);
    EXPECT_FALSE(doc.apply_local(op).accepted);
}

// -- Log ----------------------------------------------------------------------

TEST(Document, ops_since_returns_what_is_missing) {
    auto a = replica(1);
    a.commit({insert("x")});
    auto mark = a.watermark();
    a.commit({set_field("x", "text", std::string{"new"})});

    auto missing = a.ops_since(mark);
    ASSERT_TRUE(missing.has_value());
    ASSERT_EQ(missing->size(), 1u);
    EXPECT_EQ((*missing)[0].type, OpType::set_field);

    auto all = a.ops_since(Watermark{});
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ(all->size(), 2u);
}

TEST(Document, truncated_log_cannot_serve_older_watermarks) {
    auto a = replica(1);
    a.commit({insert("x")});
    auto mark = a.watermark();
    a.commit({set_field("x", "text", std::string{"new"})});

    a.truncate_log(mark);
    EXPECT_EQ(a.log_size(), 1u);
    EXPECT_FALSE(a.ops_since(Watermark{}).has_value());
    auto delta = a.ops_since(mark);
    ASSERT_TRUE(delta.has_value());
    EXPECT_EQ(delta->size(), 1u);
}

TEST(Document, continues_sequence_after_reload_of_own_session) {
    auto a = replica(1);
    a.commit({insert("x")});

    auto b = Document{};
    b.merge(*a.ops_since(Watermark{}));
    b.set_session_id(session(1));
    auto ops = b.commit({set_field("x", "text", std::string{"more"})}).ops;
    EXPECT_EQ(ops[0].seq, 2u);
}

// -- Save / load --------------------------------------------------------------

TEST(Document, save_and_load_preserves_state_and_log) {
    auto a = replica(1);
    auto b = replica(2);
    b.merge(a.commit({insert("x"), insert("y", root_node, "W", NodeKind::image)}).ops);
    a.merge(b.commit({set_field("y", "src", std::string{"img.png"}), remove_node("x")}).ops);
    a.commit({Op{.type = OpType::set_meta, .field = "primary", .value = std::string{"#123"},
                 .scope = MetaScope::theme}});

    auto loaded = Document::load(a.save());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->state(), a.state());
    EXPECT_EQ(loaded->watermark(), a.watermark());
    EXPECT_EQ(loaded->log_size(), a.log_size());
    EXPECT_EQ(loaded->session_id(), a.session_id());
    EXPECT_TRUE(loaded->tombstone("x").has_value());
}

TEST(Document, loaded_document_keeps_merging) {
    auto a = replica(1);
    auto b = replica(2);
    a.commit({insert("x")});
    sync(a, b);

    auto restored = Document::load(a.save());
    ASSERT_TRUE(restored.has_value());
    auto ops = b.commit({set_field("x", "text", std::string{"after reload"})}).ops;
    EXPECT_EQ(restored->merge(ops), 1u);
    EXPECT_EQ(get_scalar<std::string>(restored->field("x", "text")), "after reload");
}

TEST(Document, load_rejects_corruption) {
    auto doc = replica(1);
    doc.commit({insert("x"), set_field("x", "text", std::string(2000, 'a'))});
    auto bytes = doc.save();

    auto flipped = bytes;
    flipped[flipped.size() / 2] ^= std::byte{0x01};
    EXPECT_FALSE(Document::load(flipped).has_value());

    auto truncated = std::vector<std::byte>(bytes.begin(), bytes.begin() + bytes.size() / 2);
    EXPECT_FALSE(Document::load(truncated).has_value());
    EXPECT_FALSE(Document::load({}).has_value());
}

// -- Copy and concurrency -----------------------------------------------------

TEST(Document, copies_are_independent) {
    auto a = replica(1);
    a.commit({insert("x")});
    auto copy = a;
    a.commit({remove_node("x")});

    EXPECT_TRUE(copy.is_visible("x"));
    EXPECT_FALSE(a.is_visible("x"));
}

TEST(Document, move_assignment_locks_both_sides) {
    auto a = replica(1);
    a.commit({insert("x")});
    auto b = replica(2);

    // Opposite-direction moves on two threads serialize instead of
    // deadlocking or racing on the source's state.
    auto left = std::thread{[&] {
        for (int i = 0; i < 1000; ++i) a = std::move(b);
    }};
    auto right = std::thread{[&] {
        for (int i = 0; i < 1000; ++i) b = std::move(a);
    }};
    left.join();
    right.join();

    a = replica(3);
    a.commit({insert("y")});
    EXPECT_TRUE(a.is_visible("y"));
}

TEST(Document, concurrent_merges_and_reads_are_safe) {
    auto writers = std::vector<Document>{};
    auto batches = std::vector<std::vector<Op>>{};
    for (std::uint8_t w = 1; w <= 4; ++w) {
        auto doc = replica(w);
        auto ops = std::vector<Op>{};
        for (int i = 0; i < 50; ++i) {
            auto id = "n" + std::to_string(w) + "_" + std::to_string(i);
            auto committed = doc.commit({insert(id), set_field(id, "text", std::int64_t{i})}).ops;
            ops.insert(ops.end(), committed.begin(), committed.end());
        }
        batches.push_back(std::move(ops));
        writers.push_back(std::move(doc));
    }

    auto shared = Document{};
    auto done = std::atomic<bool>{false};
    auto reader = std::thread{[&] {
        while (!done) (void)shared.state();
    }};
    auto threads = std::vector<std::thread>{};
    for (const auto& batch : batches) {
        threads.emplace_back([&shared, &batch] {
            for (const auto& op : batch) shared.merge(op);
        });
    }
    for (auto& t : threads) t.join();
    done = true;
    reader.join();

    EXPECT_EQ(shared.state().nodes.size(), 1u + 4u * 50u);
    EXPECT_EQ(shared.watermark().total(), 4u * 100u);
}
