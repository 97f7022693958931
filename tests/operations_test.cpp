#include <canvas-merge/operations.hpp>

#include "fixtures.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace cm = canvas_merge;
using fixtures::id;
using json = nlohmann::json;

namespace {

auto child_ids(const std::vector<cm::Node>& nodes) -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    for (const auto& node : nodes) result.push_back(node.id);
    return result;
}

// Applying the reverse patches must restore the input document.
void expect_undoable(const cm::CanvasDocument& before, const cm::EditResult& edit) {
    auto undo = cm::apply_patches(edit.document, edit.reverse_patches);
    ASSERT_TRUE(undo.ok()) << undo.error->message;
    EXPECT_EQ(undo.document, before);
}

}  // namespace

// =============================================================================
// create_node
// =============================================================================

TEST(CreateNode, appends_by_default) {
    const auto doc = fixtures::hero_document();
    auto edit = cm::create_node(doc, id(2), fixtures::text(30, "Caption"));
    ASSERT_TRUE(edit.ok()) << edit.error->message;
    EXPECT_EQ(child_ids(edit.document.artboards[0].children),
              (std::vector<std::string>{id(10), id(11), id(30)}));
    ASSERT_EQ(edit.patches.size(), 1u);
    EXPECT_EQ(edit.patches[0].op, cm::PatchOp::add);
    expect_undoable(doc, edit);
}

TEST(CreateNode, inserts_at_index_inside_a_frame) {
    const auto doc = fixtures::card_document();
    auto edit = cm::create_node(doc, id(20), fixtures::text(30, "Badge"), 0);
    ASSERT_TRUE(edit.ok()) << edit.error->message;
    const auto& card = edit.document.artboards[0].children[2];
    EXPECT_EQ(child_ids(card.children), (std::vector<std::string>{id(30), id(21), id(22)}));
    expect_undoable(doc, edit);
}

TEST(CreateNode, assigns_an_id_when_missing) {
    const auto doc = fixtures::hero_document();
    auto node = fixtures::text(30, "Caption");
    node.id.clear();

    auto options = cm::PatchOptions{};
    options.id_generator = fixtures::counting_ids();
    auto edit = cm::create_node(doc, id(2), node, std::nullopt, options);
    ASSERT_TRUE(edit.ok()) << edit.error->message;
    EXPECT_EQ(edit.document.artboards[0].children.back().id, id(9001));

    auto generated = cm::create_node(doc, id(2), node);
    ASSERT_TRUE(generated.ok()) << generated.error->message;
    EXPECT_TRUE(cm::is_valid_ulid(generated.document.artboards[0].children.back().id));
}

TEST(CreateNode, rejects_unknown_parent_and_leaf_parent) {
    const auto doc = fixtures::hero_document();

    auto missing = cm::create_node(doc, id(99), fixtures::text(30, "Caption"));
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error->kind, cm::ErrorKind::node_not_found);
    EXPECT_EQ(missing.document, doc);

    auto leaf = cm::create_node(doc, id(10), fixtures::text(30, "Caption"));
    ASSERT_FALSE(leaf.ok());
    EXPECT_EQ(leaf.error->kind, cm::ErrorKind::validation_failure);
    EXPECT_TRUE(leaf.patches.empty());
}

TEST(CreateNode, rejects_duplicate_ids) {
    const auto doc = fixtures::hero_document();
    auto edit = cm::create_node(doc, id(2), fixtures::text(10, "Clone"));
    ASSERT_FALSE(edit.ok());
    EXPECT_EQ(edit.error->kind, cm::ErrorKind::validation_failure);
}

// =============================================================================
// update_node
// =============================================================================

TEST(UpdateNode, replaces_adds_and_removes_fields) {
    const auto doc = fixtures::hero_document();
    auto edit = cm::update_node(doc, id(10), json{
        {"name", "Headline"},
        {"style", {{"opacity", 0.5}}},
        {"semanticKey", nullptr},
    });
    ASSERT_TRUE(edit.ok()) << edit.error->message;

    const auto& hero = edit.document.artboards[0].children[0];
    EXPECT_EQ(hero.name, "Headline");
    ASSERT_TRUE(hero.style.has_value());
    EXPECT_EQ(hero.style->opacity, 0.5);
    EXPECT_FALSE(hero.semantic_key.has_value());
    EXPECT_EQ(edit.patches.size(), 3u);
    expect_undoable(doc, edit);
}

TEST(UpdateNode, null_for_an_absent_field_is_a_no_op) {
    const auto doc = fixtures::hero_document();
    auto edit = cm::update_node(doc, id(10), json{{"data", nullptr}});
    ASSERT_TRUE(edit.ok());
    EXPECT_TRUE(edit.patches.empty());
    EXPECT_EQ(edit.document, doc);
}

TEST(UpdateNode, structural_fields_are_read_only) {
    const auto doc = fixtures::hero_document();
    for (const auto* key : {"id", "type", "children"}) {
        auto edit = cm::update_node(doc, id(10), json{{key, "x"}});
        ASSERT_FALSE(edit.ok()) << key;
        EXPECT_EQ(edit.error->kind, cm::ErrorKind::invalid_patch) << key;
        EXPECT_EQ(edit.document, doc);
    }
    auto not_object = cm::update_node(doc, id(10), json::array());
    EXPECT_EQ(not_object.error->kind, cm::ErrorKind::invalid_patch);
}

TEST(UpdateNode, unknown_node) {
    auto edit = cm::update_node(fixtures::hero_document(), id(99), json{{"name", "x"}});
    ASSERT_FALSE(edit.ok());
    EXPECT_EQ(edit.error->kind, cm::ErrorKind::node_not_found);
}

// =============================================================================
// delete_node
// =============================================================================

TEST(DeleteNode, removes_the_subtree) {
    const auto doc = fixtures::card_document();
    auto edit = cm::delete_node(doc, id(20));
    ASSERT_TRUE(edit.ok()) << edit.error->message;
    EXPECT_EQ(cm::count_nodes(edit.document), 2u);
    ASSERT_EQ(edit.reverse_patches.size(), 1u);
    EXPECT_EQ(edit.reverse_patches[0].op, cm::PatchOp::add);
    expect_undoable(doc, edit);
}

TEST(DeleteNode, unknown_node) {
    auto edit = cm::delete_node(fixtures::hero_document(), id(99));
    ASSERT_FALSE(edit.ok());
    EXPECT_EQ(edit.error->kind, cm::ErrorKind::node_not_found);
}

// =============================================================================
// move_node
// =============================================================================

TEST(MoveNode, reorders_within_parent) {
    const auto doc = fixtures::hero_document();
    auto edit = cm::move_node(doc, id(10), id(2));
    ASSERT_TRUE(edit.ok()) << edit.error->message;
    EXPECT_EQ(child_ids(edit.document.artboards[0].children),
              (std::vector<std::string>{id(11), id(10)}));
    expect_undoable(doc, edit);
}

TEST(MoveNode, reparents_into_a_frame) {
    const auto doc = fixtures::card_document();
    auto edit = cm::move_node(doc, id(11), id(20), 1);
    ASSERT_TRUE(edit.ok()) << edit.error->message;
    const auto& card = edit.document.artboards[0].children[1];
    EXPECT_EQ(child_ids(card.children), (std::vector<std::string>{id(21), id(11), id(22)}));
    expect_undoable(doc, edit);
}

TEST(MoveNode, moves_across_artboards) {
    const auto doc = fixtures::card_document();
    auto edit = cm::move_node(doc, id(20), id(3));
    ASSERT_TRUE(edit.ok()) << edit.error->message;
    ASSERT_EQ(edit.document.artboards[1].children.size(), 1u);
    EXPECT_EQ(edit.document.artboards[1].children[0].id, id(20));
    expect_undoable(doc, edit);
}

TEST(MoveNode, same_position_produces_no_patches) {
    const auto doc = fixtures::hero_document();
    auto edit = cm::move_node(doc, id(11), id(2));
    ASSERT_TRUE(edit.ok());
    EXPECT_TRUE(edit.patches.empty());
    EXPECT_EQ(edit.document, doc);
}

TEST(MoveNode, rejects_cycles_and_unknown_ids) {
    const auto doc = fixtures::card_document();

    auto cycle = cm::move_node(doc, id(20), id(20));
    ASSERT_FALSE(cycle.ok());
    EXPECT_EQ(cycle.error->kind, cm::ErrorKind::invalid_patch);

    EXPECT_EQ(cm::move_node(doc, id(99), id(2)).error->kind, cm::ErrorKind::node_not_found);
    EXPECT_EQ(cm::move_node(doc, id(10), id(99)).error->kind, cm::ErrorKind::node_not_found);
}

// =============================================================================
// duplicate_node
// =============================================================================

TEST(DuplicateNode, inserts_a_copy_after_the_original) {
    const auto doc = fixtures::card_document();
    auto options = cm::PatchOptions{};
    options.id_generator = fixtures::counting_ids();
    auto edit = cm::duplicate_node(doc, id(20), options);
    ASSERT_TRUE(edit.ok()) << edit.error->message;

    const auto& children = edit.document.artboards[0].children;
    ASSERT_EQ(children.size(), 4u);
    EXPECT_EQ(children[2].id, id(20));
    EXPECT_EQ(children[3].id, id(9001));
    EXPECT_EQ(child_ids(children[3].children), (std::vector<std::string>{id(9002), id(9003)}));
    EXPECT_FALSE(children[3].semantic_key.has_value());
    EXPECT_TRUE(cm::validate(edit.document).success);
    expect_undoable(doc, edit);
}

TEST(DuplicateNode, unknown_node) {
    auto edit = cm::duplicate_node(fixtures::hero_document(), id(99));
    ASSERT_FALSE(edit.ok());
    EXPECT_EQ(edit.error->kind, cm::ErrorKind::node_not_found);
}
