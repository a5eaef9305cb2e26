#include <scenesync/error.hpp>
#include <scenesync/order_key.hpp>
#include <scenesync/scene_graph.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace scenesync;

namespace {

auto editor() -> Document {
    std::uint8_t raw[16] = {0x30, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1};
    auto doc = Document{};
    doc.set_session_id(SessionId{raw});
    return doc;
}

auto rejection(const std::function<void()>& fn) -> ErrorKind {
    try {
        fn();
    } catch (const Exception& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected an exception";
    return ErrorKind::decoding_error;
}

}  // namespace

// -- Insert -------------------------------------------------------------------

TEST(SceneGraph, insert_appends_with_fields) {
    auto doc = editor();
    auto scene = SceneGraph{doc};
    auto ops = scene.apply(InsertNode{.id = "title", .kind = NodeKind::text,
                                      .fields = {{"text", std::string{"Hello"}},
                                                 {"style.fontSize", std::int64_t{24}}}});

    ASSERT_EQ(ops.size(), 3u);
    EXPECT_EQ(ops[0].type, OpType::insert_node);
    EXPECT_TRUE(is_valid_order_key(ops[0].order_key));
    EXPECT_EQ(doc.children(root_node), std::vector<NodeId>{"title"});
    EXPECT_EQ(get_scalar<std::int64_t>(doc.field("title", "style.fontSize")), 24);
}

TEST(SceneGraph, insert_at_index_places_between_siblings) {
    auto doc = editor();
    auto scene = SceneGraph{doc};
    scene.apply(InsertNode{.id = "a"});
    scene.apply(InsertNode{.id = "c"});
    scene.apply(InsertNode{.id = "b", .index = 1});
    scene.apply(InsertNode{.id = "first", .index = 0});

    auto expected = std::vector<NodeId>{"first", "a", "b", "c"};
    EXPECT_EQ(doc.children(root_node), expected);
}

TEST(SceneGraph, insert_only_writes_the_new_key) {
    auto doc = editor();
    auto scene = SceneGraph{doc};
    scene.apply(InsertNode{.id = "a"});
    scene.apply(InsertNode{.id = "b"});
    auto ops = scene.to_ops(InsertNode{.id = "mid", .index = 1});

    ASSERT_EQ(ops.size(), 1u);
    EXPECT_EQ(ops[0].node, "mid");
}

TEST(SceneGraph, insert_validation) {
    auto doc = editor();
    auto scene = SceneGraph{doc};
    scene.apply(InsertNode{.id = "a"});

    EXPECT_EQ(rejection([&] { scene.to_ops(InsertNode{.id = "a"}); }), ErrorKind::validation_rejected);
    EXPECT_EQ(rejection([&] { scene.to_ops(InsertNode{.id = ""}); }), ErrorKind::validation_rejected);
    EXPECT_EQ(rejection([&] { scene.to_ops(InsertNode{.id = root_node}); }),
              ErrorKind::validation_rejected);
    EXPECT_EQ(rejection([&] { scene.to_ops(InsertNode{.id = "x", .kind = NodeKind::canvas}); }),
              ErrorKind::validation_rejected);
    EXPECT_EQ(rejection([&] { scene.to_ops(InsertNode{.id = "x", .parent = "ghost"}); }),
              ErrorKind::validation_rejected);
    EXPECT_EQ(rejection([&] { scene.to_ops(InsertNode{.id = "x", .index = 5}); }),
              ErrorKind::validation_rejected);
}

TEST(SceneGraph, deleted_ids_are_not_reused) {
    auto doc = editor();
    auto scene = SceneGraph{doc};
    scene.apply(InsertNode{.id = "a"});
    scene.apply(DeleteNode{.id = "a"});
    EXPECT_THROW(scene.to_ops(InsertNode{.id = "a"}), Exception);
}

// -- Move / reorder -----------------------------------------------------------

TEST(SceneGraph, move_reparents) {
    auto doc = editor();
    auto scene = SceneGraph{doc};
    scene.apply(InsertNode{.id = "group"});
    scene.apply(InsertNode{.id = "item"});
    scene.apply(MoveNode{.id = "item", .new_parent = "group"});

    EXPECT_EQ(doc.children("group"), std::vector<NodeId>{"item"});
    EXPECT_EQ(doc.children(root_node), std::vector<NodeId>{"group"});
}

TEST(SceneGraph, move_under_own_descendant_is_rejected) {
    auto doc = editor();
    auto scene = SceneGraph{doc};
    scene.apply(InsertNode{.id = "a"});
    scene.apply(InsertNode{.id = "b", .parent = "a"});
    scene.apply(InsertNode{.id = "c", .parent = "b"});

    EXPECT_THROW(scene.to_ops(MoveNode{.id = "a", .new_parent = "c"}), Exception);
    EXPECT_THROW(scene.to_ops(MoveNode{.id = "a", .new_parent = "a"}), Exception);
    EXPECT_NO_THROW(scene.to_ops(MoveNode{.id = "c", .new_parent = "a"}));
}

TEST(SceneGraph, canvas_root_cannot_be_edited) {
    auto doc = editor();
    auto scene = SceneGraph{doc};
    EXPECT_THROW(scene.to_ops(DeleteNode{.id = root_node}), Exception);
    EXPECT_THROW(scene.to_ops(MoveNode{.id = root_node, .new_parent = root_node}), Exception);
    EXPECT_THROW(scene.to_ops(SetProperty{.id = root_node, .field = "x", .value = Null{}}), Exception);
}

TEST(SceneGraph, reorder_moves_within_parent) {
    auto doc = editor();
    auto scene = SceneGraph{doc};
    for (const auto* id : {"a", "b", "c"}) scene.apply(InsertNode{.id = id});

    scene.apply(ReorderNode{.id = "c", .index = 0});
    EXPECT_EQ(doc.children(root_node), (std::vector<NodeId>{"c", "a", "b"}));

    scene.apply(ReorderNode{.id = "c", .index = 2});
    EXPECT_EQ(doc.children(root_node), (std::vector<NodeId>{"a", "b", "c"}));

    EXPECT_THROW(scene.to_ops(ReorderNode{.id = "a", .index = 3}), Exception);
}

TEST(SceneGraph, equal_sibling_keys_are_respread_when_inserting_between) {
    // Two replicas append concurrently and end up with equal keys.
    std::uint8_t raw[16] = {0x30, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 2};
    auto doc = editor();
    auto other = Document{};
    other.set_session_id(SessionId{raw});
    auto mine = SceneGraph{doc}.apply(InsertNode{.id = "a"});
    auto theirs = SceneGraph{other}.apply(InsertNode{.id = "b"});
    doc.merge(theirs);
    ASSERT_EQ(doc.node("a")->order_key, doc.node("b")->order_key);

    auto scene = SceneGraph{doc};
    scene.apply(InsertNode{.id = "between", .index = 1});
    EXPECT_EQ(doc.children(root_node), (std::vector<NodeId>{"a", "between", "b"}));
}

// -- Properties and meta ------------------------------------------------------

TEST(SceneGraph, set_property_requires_a_visible_node) {
    auto doc = editor();
    auto scene = SceneGraph{doc};
    EXPECT_THROW(scene.to_ops(SetProperty{.id = "ghost", .field = "text", .value = Null{}}), Exception);

    scene.apply(InsertNode{.id = "a"});
    EXPECT_THROW(scene.to_ops(SetProperty{.id = "a", .field = "", .value = Null{}}), Exception);
    scene.apply(SetProperty{.id = "a", .field = "style.color", .value = std::string{"#fff"}});
    EXPECT_EQ(get_scalar<std::string>(doc.field("a", "style.color")), "#fff");
}

TEST(SceneGraph, set_meta) {
    auto doc = editor();
    auto scene = SceneGraph{doc};
    scene.apply(SetMeta{.scope = MetaScope::settings, .key = "seo.title", .value = std::string{"Home"}});
    EXPECT_EQ(get_scalar<std::string>(doc.meta(MetaScope::settings, "seo.title")), "Home");
    EXPECT_THROW(scene.to_ops(SetMeta{.scope = MetaScope::theme, .key = "", .value = Null{}}), Exception);
}

// -- from_ops -----------------------------------------------------------------

TEST(SceneGraph, from_ops_summarizes_a_batch) {
    auto doc = editor();
    auto scene = SceneGraph{doc};
    auto ops = scene.apply(InsertNode{.id = "a", .fields = {{"text", std::string{"x"}}}});
    auto more = scene.apply(InsertNode{.id = "b"});
    ops.insert(ops.end(), more.begin(), more.end());
    auto moved = scene.apply(MoveNode{.id = "b", .new_parent = "a"});
    ops.insert(ops.end(), moved.begin(), moved.end());
    auto deleted = scene.apply(DeleteNode{.id = "b"});
    ops.insert(ops.end(), deleted.begin(), deleted.end());

    auto summary = SceneGraph::from_ops(ops);
    EXPECT_EQ(summary.inserted, (std::vector<NodeId>{"a", "b"}));
    EXPECT_EQ(summary.deleted, std::vector<NodeId>{"b"});
    EXPECT_EQ(summary.moved, std::vector<NodeId>{"b"});
    ASSERT_EQ(summary.fields.size(), 1u);
    EXPECT_EQ(summary.fields[0], (std::pair<NodeId, std::string>{"a", "text"}));
    EXPECT_TRUE(summary.meta_keys.empty());
}
