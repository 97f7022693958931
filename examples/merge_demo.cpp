// merge_demo: two designers edit the same page, then merge.
//
// Shows: merge_documents(), conflict reports, resolutions and the
// review queue, and a custom MergeConfig loaded from JSON.
//
// Build: cmake --build build
// Run:   ./build/examples/merge_demo

#include <canvas-merge/canvas_merge.hpp>

#include <cstdio>
#include <string>
#include <utility>
#include <variant>

namespace cm = canvas_merge;

static auto base_document() -> cm::CanvasDocument {
    auto doc = cm::CanvasDocument{};
    doc.id = "01J00000000000000000000001";
    doc.name = "Pricing";
    auto board = cm::Artboard{"01J00000000000000000000002", "Desktop", cm::Rect{0, 0, 1440, 1024}, {}};

    auto title = cm::make_text_node("01J00000000000000000000010", "Title", "Simple pricing",
                                    cm::Rect{120, 80, 600, 56});
    title.semantic_key = "pricing.title";
    board.children.push_back(title);

    for (int i = 0; i < 3; ++i) {
        auto tier = cm::make_node(cm::NodeType::frame, "01J0000000000000000000002" + std::to_string(i),
                                  "Tier " + std::to_string(i + 1),
                                  cm::Rect{120.0 + i * 420, 200, 380, 480});
        tier.semantic_key = "pricing.tiers[" + std::to_string(i) + "]";
        board.children.push_back(std::move(tier));
    }
    doc.artboards.push_back(std::move(board));
    return doc;
}

static void report(const char* label, const cm::MergeResult& result) {
    std::printf("== %s ==\n", label);
    std::printf("success: %s, confidence: %.2f, needs review: %s\n", result.success ? "yes" : "no",
                result.confidence, result.needs_manual_review ? "yes" : "no");
    for (const auto& resolution : result.resolutions) {
        const auto& conflict = resolution.conflict;
        std::printf("  [%s] %s\n    -> %s\n", std::string{cm::to_string_view(conflict.severity)}.c_str(),
                    conflict.message.c_str(), resolution.explanation.c_str());
    }
    if (result.error) std::printf("error: %s\n", result.error->message.c_str());
    std::printf("\n");
}

int main() {
    const auto base = base_document();

    // Alice retitles the page and tightens the first tier.
    auto alice = base;
    alice.artboards[0].children[0].name = "Headline";
    alice.artboards[0].children[1].frame.width = 360;
    std::get<cm::TextContent>(alice.artboards[0].children[0].content).text = "Plans for every team";

    // Bob retitles too, removes the third tier and moves the second first.
    auto bob = base;
    bob.artboards[0].children[0].name = "Page title";
    std::get<cm::TextContent>(bob.artboards[0].children[0].content).text = "Pricing that scales";
    bob.artboards[0].children.pop_back();
    std::swap(bob.artboards[0].children[1], bob.artboards[0].children[2]);

    auto result = cm::merge_documents(base, alice, bob);
    report("Default policy", result);
    std::printf("%s\n", cm::serialize_canonical(result.document).c_str());

    // Text conflicts are manual by default; prefer the local copy instead.
    auto wire = nlohmann::json::object();
    wire["policy"]["text"] = nlohmann::json::array({"prefer_local"});
    wire["failOnUnresolved"] = true;
    auto config = wire.get<cm::MergeConfig>();
    report("Local text wins", cm::merge_documents(base, alice, bob, config));
    return 0;
}
