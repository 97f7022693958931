// basic_usage: build a design document, edit it, undo, and diff.
//
// Shows: document construction, node operations with reverse patches,
// diff_documents() and diff_to_patches().
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <canvas-merge/canvas_merge.hpp>

#include <cstdio>
#include <string>
#include <vector>

namespace cm = canvas_merge;

static void print_tree(const std::vector<cm::Node>& nodes, int depth) {
    for (const auto& node : nodes) {
        std::printf("%*s- %s \"%s\"", depth * 2, "", std::string{cm::to_string_view(node.type())}.c_str(),
                    node.name.c_str());
        if (node.semantic_key) std::printf(" [%s]", node.semantic_key->c_str());
        std::printf("\n");
        print_tree(node.children, depth + 1);
    }
}

static void print_document(const cm::CanvasDocument& doc) {
    std::printf("%s\n", doc.name.c_str());
    for (const auto& artboard : doc.artboards) {
        std::printf("  artboard \"%s\"\n", artboard.name.c_str());
        print_tree(artboard.children, 2);
    }
}

int main() {
    // -- Build a document ------------------------------------------------------
    auto doc = cm::CanvasDocument{};
    doc.id = cm::generate_ulid();
    doc.name = "Landing page";

    auto board = cm::Artboard{cm::generate_ulid(), "Desktop", cm::Rect{0, 0, 1440, 1024}, {}};
    auto hero = cm::make_text_node(cm::generate_ulid(), "Hero", "Design at the speed of thought",
                                   cm::Rect{120, 96, 800, 72});
    hero.semantic_key = "hero.title";
    board.children.push_back(hero);
    doc.artboards.push_back(board);

    if (auto validation = cm::validate(doc); !validation) {
        std::printf("invalid document: %s\n", validation.errors.front().message.c_str());
        return 1;
    }
    std::printf("== Initial ==\n");
    print_document(doc);

    // -- Node operations -------------------------------------------------------
    auto card = cm::make_node(cm::NodeType::frame, "", "Feature card", cm::Rect{120, 240, 400, 300});
    card.semantic_key = "features[0]";
    auto created = cm::create_node(doc, board.id, card);
    if (!created) {
        std::printf("create failed: %s\n", created.error->message.c_str());
        return 1;
    }
    const auto card_id = created.document.artboards[0].children[1].id;

    auto caption = cm::make_text_node("", "Caption", "Ship faster", cm::Rect{16, 16, 368, 24});
    auto nested = cm::create_node(created.document, card_id, caption);
    auto renamed = cm::update_node(nested.document, hero.id,
                                   nlohmann::json{{"name", "Headline"}, {"visible", true}});
    auto duplicated = cm::duplicate_node(renamed.document, card_id);

    std::printf("\n== After edits ==\n");
    print_document(duplicated.document);

    // -- Undo the duplicate with its reverse patches ---------------------------
    auto undone = cm::apply_patches(duplicated.document, duplicated.reverse_patches);
    std::printf("\nundo restored the previous state: %s\n",
                undone && undone.document == renamed.document ? "yes" : "no");

    // -- Diff ------------------------------------------------------------------
    auto diff = cm::diff_documents(doc, renamed.document);
    std::printf("\n== Diff (%zu operations) ==\n", diff.summary.total);
    for (const auto& op : diff.operations) {
        std::printf("  %-8s %s\n", std::string{cm::to_string_view(op.type)}.c_str(),
                    op.description.c_str());
    }

    auto patches = cm::diff_to_patches(doc, renamed.document);
    std::printf("\n== Patches ==\n%s\n", cm::to_json_patch(patches).dump(2).c_str());
    return 0;
}
