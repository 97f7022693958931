// canvas-merge benchmarks: throughput of diffing, patching and merging.

#include <canvas-merge/canvas_merge.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

using namespace canvas_merge;

// Fixed ULIDs so that every run sees the same document.
static auto bench_id(std::size_t n) -> std::string {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "01J%023zu", n);
    return buffer;
}

// One artboard of `cards` frames, each holding a title and a body.
static auto make_doc(std::size_t cards) -> CanvasDocument {
    auto doc = CanvasDocument{};
    doc.id = bench_id(0);
    doc.name = "Benchmark";
    auto board = Artboard{bench_id(1), "Desktop", Rect{0, 0, 1440, 1024}, {}};
    auto next = std::size_t{2};
    for (std::size_t c = 0; c < cards; ++c) {
        auto card = make_node(NodeType::frame, bench_id(next++), "Card " + std::to_string(c),
                              Rect{0, static_cast<double>(c) * 320, 400, 300});
        card.semantic_key = "cards[" + std::to_string(c) + "]";
        card.children.push_back(make_text_node(bench_id(next++), "Title", "Title", Rect{16, 16, 368, 40}));
        card.children.push_back(make_text_node(bench_id(next++), "Body", "Body", Rect{16, 64, 368, 200}));
        board.children.push_back(std::move(card));
    }
    doc.artboards.push_back(std::move(board));
    return doc;
}

// Every tenth card renamed, every fifth shifted, the last moved to the front.
static auto edit(CanvasDocument doc, std::size_t stride) -> CanvasDocument {
    auto& cards = doc.artboards[0].children;
    for (std::size_t i = 0; i < cards.size(); i += stride) cards[i].name += " (edited)";
    for (std::size_t i = 0; i < cards.size(); i += 5) cards[i].children[1].frame.y += 8;
    if (cards.size() > 1) {
        auto last = cards.back();
        cards.pop_back();
        cards.insert(cards.begin(), std::move(last));
    }
    return doc;
}

// =============================================================================
// Diff
// =============================================================================

static void bm_diff_documents(benchmark::State& state) {
    const auto cards = static_cast<std::size_t>(state.range(0));
    const auto base = make_doc(cards);
    const auto other = edit(base, 10);
    for (auto _ : state) {
        auto diff = diff_documents(base, other);
        benchmark::DoNotOptimize(diff);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * cards * 3));
}
BENCHMARK(bm_diff_documents)->Range(10, 1000);

static void bm_diff_to_patches(benchmark::State& state) {
    const auto base = make_doc(static_cast<std::size_t>(state.range(0)));
    const auto other = edit(base, 10);
    for (auto _ : state) {
        auto patches = diff_to_patches(base, other);
        benchmark::DoNotOptimize(patches);
    }
}
BENCHMARK(bm_diff_to_patches)->Range(10, 1000);

// =============================================================================
// Patch
// =============================================================================

static void bm_apply_patch_replace(benchmark::State& state) {
    const auto doc = make_doc(static_cast<std::size_t>(state.range(0)));
    const auto patch = replace_patch("/artboards/0/children/0/children/0/name", "Headline");
    auto options = PatchOptions{};
    options.validate = false;
    for (auto _ : state) {
        auto result = apply_patch(doc, patch, options);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(bm_apply_patch_replace)->Range(10, 1000);

static void bm_apply_patches_validated(benchmark::State& state) {
    const auto doc = make_doc(static_cast<std::size_t>(state.range(0)));
    const auto patches = std::vector<Patch>{
        replace_patch("/artboards/0/children/0/name", "First"),
        move_patch("/artboards/0/children/0", "/artboards/0/children/1"),
        add_patch("/artboards/0/children/0/style", nlohmann::json{{"opacity", 0.5}}),
    };
    for (auto _ : state) {
        auto result = apply_patches(doc, patches);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * patches.size()));
}
BENCHMARK(bm_apply_patches_validated)->Range(10, 1000);

// =============================================================================
// Merge
// =============================================================================

static void bm_merge_documents(benchmark::State& state) {
    const auto cards = static_cast<std::size_t>(state.range(0));
    const auto base = make_doc(cards);
    const auto local = edit(base, 10);
    auto remote = base;
    for (std::size_t i = 0; i < cards; i += 7) remote.artboards[0].children[i].visible = false;
    for (auto _ : state) {
        auto result = merge_documents(base, local, remote);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * cards * 3));
}
BENCHMARK(bm_merge_documents)->Range(10, 1000);

// =============================================================================
// Serialization
// =============================================================================

static void bm_serialize_canonical(benchmark::State& state) {
    const auto doc = make_doc(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto text = serialize_canonical(doc);
        benchmark::DoNotOptimize(text);
    }
}
BENCHMARK(bm_serialize_canonical)->Range(10, 1000);

static void bm_load_document(benchmark::State& state) {
    const auto text = serialize_canonical(make_doc(static_cast<std::size_t>(state.range(0))));
    for (auto _ : state) {
        auto doc = load_document(text);
        benchmark::DoNotOptimize(doc);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_load_document)->Range(10, 1000);

BENCHMARK_MAIN();
