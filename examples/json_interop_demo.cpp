// json_interop_demo: documents and patches as JSON.
//
// Shows: parse_document(), apply_json_patch() with RFC 6902 arrays, undo via
// invert_patches(), and JSON reports for diffs.
//
// Build: cmake --build build
// Run:   ./build/examples/json_interop_demo

#include <canvas-merge/canvas_merge.hpp>

#include <cstdio>
#include <string>

namespace cm = canvas_merge;

int main() {
    const auto* text = R"({
        "schemaVersion": "1.0.0",
        "id": "01J00000000000000000000001",
        "name": "Onboarding",
        "artboards": [{
            "id": "01J00000000000000000000002",
            "name": "Mobile",
            "frame": {"x": 0, "y": 0, "width": 390, "height": 844},
            "children": [
                {"id": "01J00000000000000000000010", "type": "text", "name": "Welcome",
                 "visible": true, "frame": {"x": 24, "y": 120, "width": 342, "height": 40},
                 "text": "Welcome aboard", "semanticKey": "onboarding.title"},
                {"id": "01J00000000000000000000011", "type": "image", "name": "Illustration",
                 "visible": true, "frame": {"x": 24, "y": 200, "width": 342, "height": 240},
                 "src": "assets/welcome.png", "mode": "contain"}
            ]
        }]
    })";

    auto loaded = cm::parse_document(text);
    if (!loaded) {
        std::printf("document failed to load: %s\n", loaded.error->message.c_str());
        return 1;
    }
    auto& doc = loaded.document;

    // -- RFC 6902 patch array --------------------------------------------------
    auto patch = nlohmann::json::parse(R"([
        {"op": "test", "path": "/artboards/0/children/0/name", "value": "Welcome"},
        {"op": "replace", "path": "/artboards/0/children/0/text", "value": "Hello there"},
        {"op": "add", "path": "/artboards/0/children/1/style", "value": {"radius": 12}},
        {"op": "move", "from": "/artboards/0/children/1", "path": "/artboards/0/children/0"}
    ])");
    auto result = cm::apply_json_patch(*doc, patch);
    if (!result) {
        std::printf("patch failed at %zu: %s\n", result.failed_index.value_or(0),
                    result.error->message.c_str());
        return 1;
    }
    std::printf("== Patched ==\n%s\n", cm::serialize_canonical(result.document).c_str());

    // -- Undo ------------------------------------------------------------------
    auto reverse = cm::invert_patches(result.applied);
    std::printf("== Reverse patch ==\n%s\n\n", cm::to_json_patch(reverse).dump(2).c_str());
    auto undone = cm::apply_patches(result.document, reverse);
    std::printf("undo restored the original: %s\n\n", undone && undone.document == *doc ? "yes" : "no");

    // -- Unknown operations are rejected -----------------------------------------
    auto bad = cm::apply_json_patch(*doc, nlohmann::json::parse(R"([{"op": "merge", "path": "/name"}])"));
    std::printf("unknown op: %s (%s)\n\n", std::string{cm::to_string_view(bad.error->kind)}.c_str(),
                bad.error->message.c_str());

    // -- Diff report -----------------------------------------------------------
    std::printf("== Diff ==\n%s\n", nlohmann::json(cm::diff_documents(*doc, result.document)).dump(2).c_str());
    return 0;
}
