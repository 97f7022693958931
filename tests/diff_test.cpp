#include <canvas-merge/diff.hpp>
#include <canvas-merge/json.hpp>
#include <canvas-merge/pointer.hpp>

#include "fixtures.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace cm = canvas_merge;
using fixtures::id;
using json = nlohmann::json;

namespace {

auto count(const cm::DiffResult& diff, cm::DiffType type) -> std::size_t {
    return static_cast<std::size_t>(std::count_if(
        diff.operations.begin(), diff.operations.end(),
        [&](const cm::DiffOperation& op) { return op.type == type; }));
}

auto find_op(const cm::DiffResult& diff, cm::DiffType type, const std::string& node_id,
             const std::string& field = {}) -> const cm::DiffOperation* {
    for (const auto& op : diff.operations) {
        if (op.type == type && op.node_id == node_id && op.field == field) return &op;
    }
    return nullptr;
}

// diff_to_patches must turn `base` into exactly `target`.
void expect_reproduces(const cm::CanvasDocument& base, const cm::CanvasDocument& target) {
    auto patches = cm::diff_to_patches(base, target);
    auto result = cm::apply_patches(base, patches);
    ASSERT_TRUE(result.ok()) << result.error->message;
    EXPECT_EQ(result.document, target);
}

}  // namespace

// =============================================================================
// diff_documents
// =============================================================================

TEST(DiffDocuments, identical_documents_have_no_operations) {
    const auto doc = fixtures::card_document();
    auto diff = cm::diff_documents(doc, doc);
    EXPECT_TRUE(diff.empty());
    EXPECT_EQ(diff.summary, cm::DiffSummary{});
    EXPECT_EQ(diff.from_document_id, id(1));
    EXPECT_EQ(diff.to_document_id, id(1));
}

TEST(DiffDocuments, rename_is_a_single_field_change) {
    const auto base = fixtures::hero_document();
    auto other = base;
    other.artboards[0].children[0].name = "Updated Hero";

    auto diff = cm::diff_documents(base, other);
    ASSERT_EQ(diff.operations.size(), 1u);
    const auto& op = diff.operations[0];
    EXPECT_EQ(op.type, cm::DiffType::modified);
    EXPECT_EQ(op.node_id, id(10));
    EXPECT_EQ(op.semantic_key, "hero.title");
    EXPECT_EQ(op.path, "/artboards/0/children/0");
    EXPECT_EQ(op.field, "name");
    EXPECT_EQ(op.old_value, json("Hero"));
    EXPECT_EQ(op.new_value, json("Updated Hero"));
    EXPECT_EQ(op.description, "Renamed from \"Hero\" to \"Updated Hero\"");
    EXPECT_EQ(diff.summary.modified, 1u);
    EXPECT_EQ(diff.summary.total, 1u);
}

TEST(DiffDocuments, frame_changes_are_reported_per_coordinate) {
    const auto base = fixtures::hero_document();
    auto other = base;
    other.artboards[0].children[1].frame.x = 10;
    other.artboards[0].children[1].frame.height = 64;

    auto diff = cm::diff_documents(base, other);
    ASSERT_EQ(diff.operations.size(), 2u);
    const auto* x = find_op(diff, cm::DiffType::modified, id(11), "frame.x");
    ASSERT_NE(x, nullptr);
    EXPECT_EQ(x->description, "Changed frame x from 0 to 10");
    EXPECT_NE(find_op(diff, cm::DiffType::modified, id(11), "frame.height"), nullptr);
}

TEST(DiffDocuments, style_and_content_fields) {
    const auto base = fixtures::hero_document();
    auto other = base;
    auto style = cm::Style{};
    style.opacity = 0.5;
    other.artboards[0].children[0].style = style;
    std::get<cm::TextContent>(other.artboards[0].children[0].content).text = "Welcome";

    auto diff = cm::diff_documents(base, other);
    const auto* opacity = find_op(diff, cm::DiffType::modified, id(10), "style.opacity");
    ASSERT_NE(opacity, nullptr);
    EXPECT_FALSE(opacity->old_value.has_value());
    EXPECT_EQ(opacity->new_value, json(0.5));

    const auto* text = find_op(diff, cm::DiffType::modified, id(10), "text");
    ASSERT_NE(text, nullptr);
    EXPECT_EQ(text->new_value, json("Welcome"));
    EXPECT_EQ(diff.operations.size(), 2u);
}

TEST(DiffDocuments, document_name_is_metadata) {
    const auto base = fixtures::hero_document();
    auto other = base;
    other.name = "Pricing";

    auto diff = cm::diff_documents(base, other);
    ASSERT_EQ(diff.operations.size(), 1u);
    EXPECT_EQ(diff.operations[0].path, "");
    EXPECT_EQ(diff.operations[0].node_id, id(1));
    EXPECT_EQ(diff.operations[0].field, "name");

    auto options = cm::DiffOptions{};
    options.include_metadata = false;
    EXPECT_TRUE(cm::diff_documents(base, other, options).empty());
}

TEST(DiffDocuments, reorder_reports_only_the_displaced_sibling) {
    const auto base = fixtures::hero_document();
    auto other = base;
    std::swap(other.artboards[0].children[0], other.artboards[0].children[1]);

    auto diff = cm::diff_documents(base, other);
    ASSERT_EQ(diff.operations.size(), 1u);
    const auto& op = diff.operations[0];
    EXPECT_EQ(op.type, cm::DiffType::moved);
    EXPECT_EQ(op.node_id, id(11));
    EXPECT_EQ(op.old_value, (json{{"parentId", id(2)}, {"index", 1}}));
    EXPECT_EQ(op.new_value, (json{{"parentId", id(2)}, {"index", 0}}));
    EXPECT_EQ(op.parent_id, id(2));
    EXPECT_EQ(op.index, 0u);
    EXPECT_EQ(op.description, "Moved node from artboards[0].children[1] to artboards[0].children[0]");
}

TEST(DiffDocuments, repeated_runs_are_byte_identical) {
    const auto base = fixtures::card_document();
    const auto other = fixtures::reworked_card_document();

    auto first = cm::diff_documents(base, other);
    ASSERT_NE(find_op(first, cm::DiffType::modified, id(40), "id"), nullptr);
    ASSERT_GT(count(first, cm::DiffType::moved), 0u);
    for (int run = 0; run < 5; ++run) {
        EXPECT_EQ(json(cm::diff_documents(base, other)).dump(), json(first).dump());
    }
}

TEST(DiffDocuments, reparent_with_edit) {
    const auto base = fixtures::card_document();
    auto other = base;
    auto subtitle = other.artboards[0].children[1];
    subtitle.name = "Tagline";
    other.artboards[0].children.erase(other.artboards[0].children.begin() + 1);
    other.artboards[0].children[1].children.push_back(subtitle);

    auto diff = cm::diff_documents(base, other);
    EXPECT_EQ(diff.operations.size(), 2u);
    const auto* moved = find_op(diff, cm::DiffType::moved, id(11));
    ASSERT_NE(moved, nullptr);
    EXPECT_EQ(moved->parent_id, id(20));
    EXPECT_EQ(moved->index, 2u);
    EXPECT_EQ(moved->path, "/artboards/0/children/1/children/2");
    EXPECT_NE(find_op(diff, cm::DiffType::modified, id(11), "name"), nullptr);
}

TEST(DiffDocuments, additions_and_removals_carry_shallow_nodes) {
    const auto base = fixtures::card_document();
    auto other = base;
    other.artboards[0].children.erase(other.artboards[0].children.begin() + 2);
    other.artboards[0].children.push_back(fixtures::text(30, "Caption"));

    auto diff = cm::diff_documents(base, other);
    EXPECT_EQ(diff.summary.added, 1u);
    EXPECT_EQ(diff.summary.removed, 3u);

    const auto* added = find_op(diff, cm::DiffType::added, id(30));
    ASSERT_NE(added, nullptr);
    EXPECT_EQ(added->parent_id, id(2));
    EXPECT_EQ(added->index, 2u);
    EXPECT_EQ(added->description, "Added text node \"Caption\"");
    EXPECT_FALSE(added->new_value->contains("children"));

    const auto* removed = find_op(diff, cm::DiffType::removed, id(20));
    ASSERT_NE(removed, nullptr);
    EXPECT_EQ(removed->path, "/artboards/0/children/2");
    EXPECT_EQ(removed->old_value->at("name"), "Card");
    EXPECT_FALSE(removed->old_value->contains("children"));
    EXPECT_EQ(removed->description, "Removed frame node \"Card\"");
}

TEST(DiffDocuments, recreated_node_pairs_by_semantic_key) {
    const auto base = fixtures::hero_document();
    auto other = base;
    other.artboards[0].children[0] = fixtures::text(40, "Hero", "hero.title");

    auto diff = cm::diff_documents(base, other);
    EXPECT_EQ(diff.summary.added, 0u);
    EXPECT_EQ(diff.summary.removed, 0u);
    const auto* op = find_op(diff, cm::DiffType::modified, id(40), "id");
    ASSERT_NE(op, nullptr);
    EXPECT_EQ(op->previous_id, id(10));
    EXPECT_EQ(op->old_value, json(id(10)));
}

TEST(DiffDocuments, artboard_changes) {
    const auto base = fixtures::card_document();
    auto other = base;
    std::swap(other.artboards[0], other.artboards[1]);
    other.artboards[0].name = "Phone";
    other.artboards.push_back(fixtures::artboard(4, "Tablet"));

    auto diff = cm::diff_documents(base, other);
    const auto* added = find_op(diff, cm::DiffType::added, id(4));
    ASSERT_NE(added, nullptr);
    EXPECT_EQ(added->description, "Added artboard \"Tablet\"");
    EXPECT_EQ(added->parent_id, "");

    EXPECT_NE(find_op(diff, cm::DiffType::modified, id(3), "name"), nullptr);
    EXPECT_EQ(count(diff, cm::DiffType::moved), 1u);
}

TEST(DiffDocuments, options_filter_families) {
    const auto base = fixtures::hero_document();
    auto other = base;
    std::swap(other.artboards[0].children[0], other.artboards[0].children[1]);
    other.artboards[0].children[0].name = "Tagline";
    std::get<cm::TextContent>(other.artboards[0].children[0].content).text = "Tagline";

    auto structure_only = cm::DiffOptions{};
    structure_only.include_property = false;
    structure_only.include_content = false;
    auto diff = cm::diff_documents(base, other, structure_only);
    ASSERT_EQ(diff.operations.size(), 1u);
    EXPECT_EQ(diff.operations[0].type, cm::DiffType::moved);

    auto fields_only = cm::DiffOptions{};
    fields_only.include_structure = false;
    diff = cm::diff_documents(base, other, fields_only);
    EXPECT_EQ(diff.summary.moved, 0u);
    EXPECT_EQ(diff.summary.modified, 2u);
}

TEST(DiffDocuments, operations_are_sorted_by_path) {
    const auto base = fixtures::card_document();
    auto other = base;
    other.name = "Pricing";
    other.artboards[0].children[2].children[1].name = "Copy";
    other.artboards[0].children[0].visible = false;
    other.artboards[1].name = "Phone";

    auto diff = cm::diff_documents(base, other);
    ASSERT_EQ(diff.operations.size(), 4u);
    EXPECT_TRUE(std::is_sorted(diff.operations.begin(), diff.operations.end(),
                               [](const cm::DiffOperation& a, const cm::DiffOperation& b) {
                                   return cm::pointer_less(a.path, b.path);
                               }));
    EXPECT_EQ(diff.operations.front().path, "");
    EXPECT_EQ(diff.operations.back().path, "/artboards/1");
}

TEST(DiffDocuments, max_operations_truncates_after_sorting) {
    const auto base = fixtures::hero_document();
    auto other = base;
    other.name = "Pricing";
    other.artboards[0].children[0].name = "A";
    other.artboards[0].children[1].name = "B";

    auto options = cm::DiffOptions{};
    options.max_operations = 2;
    auto diff = cm::diff_documents(base, other, options);
    ASSERT_EQ(diff.operations.size(), 2u);
    EXPECT_EQ(diff.operations[0].path, "");
    EXPECT_EQ(diff.operations[1].node_id, id(10));
    EXPECT_EQ(diff.summary.total, 2u);
}

TEST(DiffDocuments, refuses_documents_above_the_node_ceiling) {
    const auto doc = fixtures::card_document();
    auto options = cm::DiffOptions{};
    options.max_nodes = 4;
    EXPECT_THROW(cm::diff_documents(doc, doc, options), std::length_error);
    options.max_nodes = 5;
    EXPECT_NO_THROW(cm::diff_documents(doc, doc, options));
}

// =============================================================================
// diff_to_patches
// =============================================================================

TEST(DiffToPatches, identical_documents_need_no_patches) {
    const auto doc = fixtures::card_document();
    EXPECT_TRUE(cm::diff_to_patches(doc, doc).empty());
}

TEST(DiffToPatches, reorder) {
    const auto base = fixtures::hero_document();
    auto target = base;
    std::swap(target.artboards[0].children[0], target.artboards[0].children[1]);
    auto patches = cm::diff_to_patches(base, target);
    ASSERT_EQ(patches.size(), 1u);
    EXPECT_EQ(patches[0].op, cm::PatchOp::move);
    expect_reproduces(base, target);
}

TEST(DiffToPatches, reparent_edit_and_remove) {
    const auto base = fixtures::card_document();
    auto target = base;
    auto subtitle = target.artboards[0].children[1];
    subtitle.frame.y = 48;
    target.artboards[0].children.erase(target.artboards[0].children.begin() + 1);
    auto& card = target.artboards[0].children[1];
    card.children.erase(card.children.begin());
    card.children.insert(card.children.begin(), subtitle);
    target.name = "Pricing";
    expect_reproduces(base, target);
}

TEST(DiffToPatches, artboards_added_removed_and_reordered) {
    const auto base = fixtures::card_document();
    auto target = base;
    std::swap(target.artboards[0], target.artboards[1]);
    auto tablet = fixtures::artboard(4, "Tablet");
    tablet.children.push_back(fixtures::text(30, "Caption"));
    target.artboards.push_back(tablet);
    expect_reproduces(base, target);

    auto smaller = base;
    smaller.artboards.erase(smaller.artboards.begin());
    expect_reproduces(base, smaller);
}

TEST(DiffToPatches, nested_additions_and_type_changes) {
    const auto base = fixtures::card_document();
    auto target = base;
    auto group = cm::make_node(cm::NodeType::group, id(50), "Group");
    group.children.push_back(fixtures::text(51, "Inner"));
    target.artboards[1].children.push_back(group);

    // Subtitle becomes a frame that takes over the card's title.
    auto& subtitle = target.artboards[0].children[1];
    subtitle = fixtures::frame(11, "Subtitle", "hero.subtitle");
    subtitle.children.push_back(target.artboards[0].children[2].children[0]);
    target.artboards[0].children[2].children.erase(target.artboards[0].children[2].children.begin());
    expect_reproduces(base, target);
}

TEST(DiffToPatches, emitted_patches_invert_cleanly) {
    const auto base = fixtures::card_document();
    auto target = base;
    target.artboards[0].children.erase(target.artboards[0].children.begin());
    target.artboards[1].children.push_back(fixtures::text(30, "Caption"));

    auto forward = cm::apply_patches(base, cm::diff_to_patches(base, target));
    ASSERT_TRUE(forward.ok()) << forward.error->message;
    auto undo = cm::apply_patches(forward.document, cm::invert_patches(forward.applied));
    ASSERT_TRUE(undo.ok()) << undo.error->message;
    EXPECT_EQ(undo.document, base);
}
