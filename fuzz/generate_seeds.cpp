// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, just a corpus generator.

#include <scenesync/codec.hpp>
#include <scenesync/document.hpp>
#include <scenesync/protocol.hpp>
#include <scenesync/scene_graph.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

static void write_seed(const std::string& path, const std::vector<std::byte>& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
}

static void write_text_seed(const std::string& path, const std::string& text) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs << text;
}

static auto editor(std::uint8_t n) -> scenesync::Document {
    const std::uint8_t raw[16] = {n};
    auto doc = scenesync::Document{};
    doc.set_session_id(scenesync::SessionId{raw});
    return doc;
}

int main() {
    namespace fs = std::filesystem;
    namespace ss = scenesync;
    const auto dir = std::string{"fuzz/corpus"};
    fs::create_directories(dir + "/load");
    fs::create_directories(dir + "/log_segment");
    fs::create_directories(dir + "/frame");

    // Seed 1: empty document
    {
        auto doc = ss::Document{};
        write_seed(dir + "/load/seed_empty.bin", doc.save());
    }

    // Seed 2: small scene, plus its ops as a log segment
    {
        auto doc = editor(1);
        auto scene = ss::SceneGraph{doc};
        auto ops = scene.apply(ss::InsertNode{.id = "header", .kind = ss::NodeKind::group});
        auto more = scene.apply(ss::InsertNode{
            .id = "title", .kind = ss::NodeKind::text, .parent = "header", .index = std::nullopt,
            .fields = {{"text", std::string{"Save the date"}}, {"size.width", std::int64_t{320}}}});
        ops.insert(ops.end(), more.begin(), more.end());
        write_seed(dir + "/load/seed_scene.bin", doc.save());
        write_seed(dir + "/log_segment/seed_scene.bin", ss::encode_ops(ops));
        write_text_seed(dir + "/frame/seed_operation.json",
                        ss::serialize_frame(ss::OperationFrame{.ops = ops}));
    }

    // Seed 3: concurrent edits with a tombstone and parked ops
    {
        auto a = editor(1);
        auto b = editor(2);
        auto ops = ss::SceneGraph{a}.apply(ss::InsertNode{.id = "img", .kind = ss::NodeKind::image});
        b.merge(ops);
        auto del = ss::SceneGraph{b}.apply(ss::DeleteNode{.id = "img"});
        auto set = ss::SceneGraph{a}.apply(ss::SetProperty{.id = "img", .field = "alt",
                                                           .value = std::string{"x"}});
        a.merge(del);
        b.merge(set);
        write_seed(dir + "/load/seed_tombstone.bin", a.save());
        write_seed(dir + "/load/seed_large.bin", [] {
            auto doc = editor(3);
            auto scene = ss::SceneGraph{doc};
            for (int i = 0; i < 200; ++i) {
                scene.apply(ss::InsertNode{.id = "n" + std::to_string(i), .kind = ss::NodeKind::text});
            }
            return doc.save();
        }());
    }

    // Seed 4: frames
    {
        write_text_seed(dir + "/frame/seed_connect.json",
                        R"({"type":"connect","token":"t","document":"site_42:1"})");
        write_text_seed(dir + "/frame/seed_presence.json",
                        R"({"type":"presence","state":{"cursor":{"x":1,"y":2}}})");
        write_text_seed(dir + "/frame/seed_ping.json", R"({"type":"ping"})");
    }

    return 0;
}
