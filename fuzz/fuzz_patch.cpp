// Fuzz target for apply_json_patch(): arbitrary patch arrays against a fixed
// document. A failed batch must return the input unchanged, a successful one
// a valid document.

#include <canvas-merge/canvas_merge.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace cm = canvas_merge;

static auto fixture() -> const cm::CanvasDocument& {
    static const auto doc = [] {
        auto d = cm::CanvasDocument{};
        d.id = "01J00000000000000000000001";
        d.name = "Fuzz";
        auto board = cm::Artboard{"01J00000000000000000000002", "Desktop", cm::Rect{0, 0, 1440, 1024}, {}};
        auto card = cm::make_node(cm::NodeType::frame, "01J00000000000000000000003", "Card",
                                  cm::Rect{0, 0, 400, 300});
        card.semantic_key = "card";
        card.children.push_back(cm::make_text_node("01J00000000000000000000004", "Title", "Title"));
        board.children.push_back(std::move(card));
        board.children.push_back(cm::make_text_node("01J00000000000000000000005", "Hero", "Hero"));
        d.artboards.push_back(std::move(board));
        return d;
    }();
    return doc;
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    cm::logger()->set_level(spdlog::level::off);
    auto patches = nlohmann::json::parse(data, data + size, nullptr, false);
    if (patches.is_discarded()) return 0;

    auto options = cm::PatchOptions{};
    options.id_generator = [n = 100]() mutable {
        return "01J000000000000000000" + std::to_string(10000 + n++);
    };
    auto result = cm::apply_json_patch(fixture(), patches, options);
    if (!result) {
        if (result.document != fixture()) __builtin_trap();
        return 0;
    }
    if (!cm::validate(result.document)) __builtin_trap();
    return 0;
}
