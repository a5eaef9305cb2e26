// scenesync benchmarks: measures throughput of merge, materialization and persistence.

#include <scenesync/codec.hpp>
#include <scenesync/document.hpp>
#include <scenesync/order_key.hpp>
#include <scenesync/scene_graph.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace scenesync;

namespace {

auto session(std::uint8_t n) -> SessionId {
    const std::uint8_t raw[SessionId::size] = {n};
    return SessionId{raw};
}

auto make_doc(std::uint8_t n = 1) -> Document {
    auto doc = Document{};
    doc.set_session_id(session(n));
    return doc;
}

// A flat scene with `count` text nodes under the root.
auto populate(Document& doc, int count) -> std::vector<Op> {
    auto scene = SceneGraph{doc};
    auto ops = std::vector<Op>{};
    for (int i = 0; i < count; ++i) {
        auto batch = scene.apply(InsertNode{
            .id = "n" + std::to_string(i),
            .kind = NodeKind::text,
            .parent = root_node,
            .index = std::nullopt,
            .fields = {{"text", std::string{"node"}}, {"style.color", std::string{"#000000"}}}});
        ops.insert(ops.end(), batch.begin(), batch.end());
    }
    return ops;
}

}  // namespace

// =============================================================================
// Local edits
// =============================================================================

static void bm_commit_set_field(benchmark::State& state) {
    auto doc = make_doc();
    populate(doc, 1);
    std::int64_t i = 0;
    for (auto _ : state) {
        auto result = doc.commit({Op{.type = OpType::set_field, .node = "n0",
                                     .field = "size.width", .value = i++}});
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_commit_set_field);

static void bm_scene_insert_append(benchmark::State& state) {
    auto doc = make_doc();
    auto scene = SceneGraph{doc};
    int i = 0;
    for (auto _ : state) {
        auto ops = scene.apply(InsertNode{.id = "n" + std::to_string(i++), .kind = NodeKind::text});
        benchmark::DoNotOptimize(ops);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_scene_insert_append);

static void bm_order_key_between(benchmark::State& state) {
    auto lo = std::optional<std::string>{"V"};
    const auto hi = std::optional<std::string>{"W"};
    for (auto _ : state) {
        // Repeatedly bisect toward `hi`; keys grow, which is the worst case.
        auto key = key_between(lo, hi);
        benchmark::DoNotOptimize(key);
        lo = std::move(key);
        if (lo->size() > 64) lo = "V";
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_order_key_between);

// =============================================================================
// Merge
// =============================================================================

static void bm_merge_remote(benchmark::State& state) {
    const auto n = static_cast<int>(state.range(0));
    auto source = make_doc(1);
    const auto ops = populate(source, n);

    for (auto _ : state) {
        state.PauseTiming();
        auto replica = make_doc(2);
        state.ResumeTiming();

        auto applied = replica.merge(ops);
        benchmark::DoNotOptimize(applied);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) *
                            static_cast<std::int64_t>(ops.size()));
}
BENCHMARK(bm_merge_remote)->Range(10, 1000);

static void bm_merge_duplicates(benchmark::State& state) {
    auto source = make_doc(1);
    const auto ops = populate(source, 100);
    auto replica = make_doc(2);
    replica.merge(ops);

    for (auto _ : state) {
        auto applied = replica.merge(ops);
        benchmark::DoNotOptimize(applied);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) *
                            static_cast<std::int64_t>(ops.size()));
}
BENCHMARK(bm_merge_duplicates);

// =============================================================================
// Reading
// =============================================================================

static void bm_state(benchmark::State& state) {
    auto doc = make_doc();
    populate(doc, static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto scene = doc.state();
        benchmark::DoNotOptimize(scene);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_state)->Range(10, 1000);

static void bm_ops_since(benchmark::State& state) {
    auto doc = make_doc();
    populate(doc, 500);
    auto half = Watermark{};
    half.advance(session(1), doc.watermark().get(session(1)) / 2);

    for (auto _ : state) {
        auto delta = doc.ops_since(half);
        benchmark::DoNotOptimize(delta);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_ops_since);

// =============================================================================
// Save / Load
// =============================================================================

static void bm_save(benchmark::State& state) {
    auto doc = make_doc();
    populate(doc, static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto bytes = doc.save();
        benchmark::DoNotOptimize(bytes);
        state.SetBytesProcessed(static_cast<std::int64_t>(bytes.size()));
    }
}
BENCHMARK(bm_save)->Range(10, 1000);

static void bm_load(benchmark::State& state) {
    auto doc = make_doc();
    populate(doc, static_cast<int>(state.range(0)));
    const auto bytes = doc.save();
    for (auto _ : state) {
        auto loaded = Document::load(bytes);
        benchmark::DoNotOptimize(loaded);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_load)->Range(10, 1000);

static void bm_encode_log_segment(benchmark::State& state) {
    auto doc = make_doc();
    const auto ops = populate(doc, 100);
    for (auto _ : state) {
        auto segment = encode_ops(ops);
        benchmark::DoNotOptimize(segment);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) *
                            static_cast<std::int64_t>(ops.size()));
}
BENCHMARK(bm_encode_log_segment);

static void bm_decode_log_segment(benchmark::State& state) {
    auto doc = make_doc();
    const auto segment = encode_ops(populate(doc, 100));
    for (auto _ : state) {
        auto ops = decode_ops(segment);
        benchmark::DoNotOptimize(ops);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_decode_log_segment);
