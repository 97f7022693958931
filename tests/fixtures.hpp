// fixtures.hpp - Documents shared by the test suites.

#pragma once

#include <canvas-merge/canvas_merge.hpp>

#include <cstdio>
#include <string>
#include <utility>

namespace fixtures {

namespace cm = canvas_merge;

/// A fixed, valid ULID: "01J0000000000000000000" followed by four digits.
inline auto id(int n) -> std::string {
    char suffix[8];
    std::snprintf(suffix, sizeof(suffix), "%04d", n);
    return std::string{"01J0000000000000000000"} + suffix;
}

/// Deterministic id source for copies: 9001, 9002, ...
inline auto counting_ids(int start = 9001) {
    return [n = start]() mutable { return id(n++); };
}

inline auto text(int n, std::string name, std::string key = {}) -> cm::Node {
    auto node = cm::make_text_node(id(n), name, name, cm::Rect{0, 0, 200, 40});
    if (!key.empty()) node.semantic_key = std::move(key);
    return node;
}

inline auto frame(int n, std::string name, std::string key = {}) -> cm::Node {
    auto node = cm::make_node(cm::NodeType::frame, id(n), std::move(name),
                              cm::Rect{0, 0, 400, 300});
    if (!key.empty()) node.semantic_key = std::move(key);
    return node;
}

inline auto artboard(int n, std::string name) -> cm::Artboard {
    return cm::Artboard{id(n), std::move(name), cm::Rect{0, 0, 1440, 1024}, {}};
}

/// One artboard (2) holding [Hero (10), Subtitle (11)].
inline auto hero_document() -> cm::CanvasDocument {
    auto doc = cm::CanvasDocument{};
    doc.id = id(1);
    doc.name = "Landing";
    auto board = artboard(2, "Desktop");
    board.children.push_back(text(10, "Hero", "hero.title"));
    board.children.push_back(text(11, "Subtitle", "hero.subtitle"));
    doc.artboards.push_back(std::move(board));
    return doc;
}

/// hero_document() plus a card frame (20) holding [Title (21), Body (22)],
/// and a second, empty artboard (3).
inline auto card_document() -> cm::CanvasDocument {
    auto doc = hero_document();
    auto card = frame(20, "Card", "card");
    card.children.push_back(text(21, "Title", "card.title"));
    card.children.push_back(text(22, "Body", "card.body"));
    doc.artboards[0].children.push_back(std::move(card));
    doc.artboards.push_back(artboard(3, "Mobile"));
    return doc;
}

/// card_document() with the hero recreated under id 40, the card moved to
/// the front, the body renamed and a caption added to the second artboard.
inline auto reworked_card_document() -> cm::CanvasDocument {
    auto doc = card_document();
    auto& children = doc.artboards[0].children;
    children[0].id = id(40);
    children[0].name = "Hero v2";
    std::swap(children[0], children[2]);
    std::swap(children[1], children[2]);
    children[0].children[1].name = "Copy";
    std::swap(children[0].children[0], children[0].children[1]);
    doc.artboards[1].children.push_back(text(41, "Caption", "mobile.caption"));
    return doc;
}

}  // namespace fixtures
