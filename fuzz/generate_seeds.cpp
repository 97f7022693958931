// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, just a corpus generator.

#include <canvas-merge/canvas_merge.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <utility>

namespace cm = canvas_merge;

static void write_seed(const std::string& path, const std::string& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

static auto sample_document() -> cm::CanvasDocument {
    auto doc = cm::CanvasDocument{};
    doc.id = "01J00000000000000000000001";
    doc.name = "Seed";
    auto board = cm::Artboard{"01J00000000000000000000002", "Desktop", cm::Rect{0, 0, 1440, 1024}, {}};
    auto card = cm::make_node(cm::NodeType::frame, "01J00000000000000000000003", "Card",
                              cm::Rect{0, 0, 400, 300});
    card.semantic_key = "card";
    card.style = cm::Style{};
    card.style->radius = 8;
    card.style->fills = cm::PaintList{cm::ColorTokenRef{"color.surface"}};
    card.children.push_back(cm::make_text_node("01J00000000000000000000004", "Title", "Title"));
    board.children.push_back(std::move(card));
    board.children.push_back(cm::make_text_node("01J00000000000000000000005", "Hero", "Hero"));
    doc.artboards.push_back(std::move(board));
    return doc;
}

int main() {
    namespace fs = std::filesystem;
    const auto documents = std::string{"fuzz/corpus/load"};
    const auto patches = std::string{"fuzz/corpus/patch"};
    const auto pointers = std::string{"fuzz/corpus/pointer"};
    for (const auto& dir : {documents, patches, pointers}) fs::create_directories(dir);

    // Documents
    const auto doc = sample_document();
    write_seed(documents + "/seed_document.json", cm::serialize_canonical(doc));
    {
        auto minimal = doc;
        minimal.artboards[0].children.clear();
        write_seed(documents + "/seed_empty_artboard.json", cm::serialize_canonical(minimal));
    }

    // Patch arrays, one per operation kind
    auto edited = doc;
    edited.artboards[0].children[1].name = "Headline";
    std::swap(edited.artboards[0].children[0], edited.artboards[0].children[1]);
    write_seed(patches + "/seed_diff.json",
               cm::to_json_patch(cm::diff_to_patches(doc, edited)).dump());
    write_seed(patches + "/seed_copy.json",
               cm::to_json_patch({cm::copy_patch("/artboards/0/children/0",
                                                 "/artboards/0/children/-")}).dump());
    write_seed(patches + "/seed_test_remove.json",
               cm::to_json_patch({cm::test_patch("/artboards/0/children/1/name", "Hero"),
                                  cm::remove_patch("/artboards/0/children/1")}).dump());
    write_seed(patches + "/seed_style.json",
               cm::to_json_patch({cm::add_patch("/artboards/0/children/1/style",
                                                nlohmann::json{{"opacity", 0.5}})}).dump());

    // Pointers
    write_seed(pointers + "/seed_node.txt", "/artboards/0/children/1/frame/x");
    write_seed(pointers + "/seed_escaped.txt", "/data/a~1b/c~0d");
    write_seed(pointers + "/seed_append.txt", "/artboards/0/children/-");

    return 0;
}
