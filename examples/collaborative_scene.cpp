// collaborative_scene: two editors concurrently edit the same site layout
//
// Demonstrates: SceneGraph edits, exchanging ops, concurrent inserts at the
//               same position, same-field conflicts, delete-wins tombstones,
//               rejected cycle-introducing moves, snapshot save/load.

#include <scenesync/document.hpp>
#include <scenesync/error.hpp>
#include <scenesync/scene_graph.hpp>
#include <scenesync/scene_json.hpp>

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace ss = scenesync;

static void print_scene(const ss::Document& doc, const char* label) {
    auto state = doc.state();
    std::printf("\n=== %s ===\n", label);
    for (const auto& id : state.children(ss::root_node)) {
        const auto* node = state.find(id);
        auto text = node->fields.contains("text")
                        ? ss::get_scalar<std::string>(node->fields.at("text"))
                        : std::nullopt;
        std::printf("  %-8s %-6s %s\n", id.c_str(),
                    std::string{ss::to_string_view(node->kind)}.c_str(),
                    text ? text->c_str() : "");
    }
}

int main() {
    const std::uint8_t alice_id[16] = {1};
    const std::uint8_t bob_id[16] = {2};

    auto alice = ss::Document{};
    alice.set_session_id(ss::SessionId{alice_id});
    auto bob = ss::Document{};
    bob.set_session_id(ss::SessionId{bob_id});

    auto alice_scene = ss::SceneGraph{alice};
    auto bob_scene = ss::SceneGraph{bob};

    // Alice lays out a header group; Bob receives it
    auto ops = alice_scene.apply(ss::InsertNode{.id = "header", .kind = ss::NodeKind::group});
    bob.merge(ops);

    // Both insert at position 0 of the root at the same time
    auto from_alice = alice_scene.apply(ss::InsertNode{
        .id = "text_1", .kind = ss::NodeKind::text, .parent = ss::root_node, .index = 0,
        .fields = {{"text", std::string{"We're getting married"}}}});
    auto from_bob = bob_scene.apply(ss::InsertNode{
        .id = "img_1", .kind = ss::NodeKind::image, .parent = ss::root_node, .index = 0,
        .fields = {{"src", std::string{"assets/couple.jpg"}}}});

    // Exchange in opposite orders
    alice.merge(from_bob);
    bob.merge(from_alice);
    print_scene(alice, "Alice");
    print_scene(bob, "Bob");
    std::printf("converged: %s\n", alice.state() == bob.state() ? "yes" : "no");

    // Same field, concurrently: the higher (counter, session) wins everywhere
    auto a_color = alice_scene.apply(ss::SetProperty{.id = "text_1", .field = "style.color",
                                                     .value = std::string{"#aa0000"}});
    auto b_color = bob_scene.apply(ss::SetProperty{.id = "text_1", .field = "style.color",
                                                   .value = std::string{"#0000aa"}});
    alice.merge(b_color);
    bob.merge(a_color);
    if (auto color = ss::get_scalar<std::string>(alice.field("text_1", "style.color"))) {
        std::printf("\nstyle.color on both replicas: %s\n", color->c_str());
    }

    // Bob deletes the image while Alice captions it: delete wins, caption kept
    auto b_delete = bob_scene.apply(ss::DeleteNode{.id = "img_1"});
    auto a_caption = alice_scene.apply(ss::SetProperty{.id = "img_1", .field = "alt",
                                                       .value = std::string{"The couple"}});
    alice.merge(b_delete);
    bob.merge(a_caption);
    if (auto tomb = bob.tombstone("img_1")) {
        auto alt = tomb->fields.contains("alt") ? ss::get_scalar<std::string>(tomb->fields.at("alt"))
                                                : std::nullopt;
        std::printf("img_1 deleted; tombstone keeps alt = %s\n", alt ? alt->c_str() : "(none)");
    }

    // Moving a group under its own child is rejected before any op exists
    alice_scene.apply(ss::MoveNode{.id = "text_1", .new_parent = "header", .index = std::nullopt});
    try {
        alice_scene.apply(ss::MoveNode{.id = "header", .new_parent = "text_1", .index = std::nullopt});
    } catch (const ss::Exception& e) {
        std::printf("\nrejected: %s\n", e.what());
    }

    // Snapshot round-trip
    auto bytes = alice.save();
    auto restored = ss::Document::load(bytes);
    std::printf("snapshot: %zu bytes, restored equal: %s\n", bytes.size(),
                restored && restored->state() == alice.state() ? "yes" : "no");

    std::printf("\n%s\n", ss::export_scene_graph(alice.state()).dump(2).c_str());
    return 0;
}
