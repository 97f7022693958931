#include <canvas-merge/resolution.hpp>

#include "fixtures.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace cm = canvas_merge;
using fixtures::id;
using json = nlohmann::json;

namespace {

auto make_conflict(cm::ConflictType type, std::string field, std::optional<json> base,
                   std::optional<json> local, std::optional<json> remote) -> cm::Conflict {
    auto conflict = cm::Conflict{};
    conflict.id = id(10);
    conflict.type = type;
    conflict.category = cm::category_of(type);
    conflict.severity = cm::severity_of(type);
    conflict.path = "/artboards/0/children/0";
    conflict.field = std::move(field);
    conflict.base_value = std::move(base);
    conflict.local_value = std::move(local);
    conflict.remote_value = std::move(remote);
    return conflict;
}

auto name_conflict() -> cm::Conflict {
    return make_conflict(cm::ConflictType::name, "name", json("Hero"), json("Local"), json("Remote"));
}

auto layout_conflict(json local, json remote) -> cm::Conflict {
    return make_conflict(cm::ConflictType::layout, "layout", json{{"gap", 8}, {"padding", 16}},
                         std::move(local), std::move(remote));
}

}  // namespace

// =============================================================================
// Policy
// =============================================================================

TEST(ResolutionStrategy, names_round_trip) {
    EXPECT_EQ(cm::parse_resolution_strategy("merge_both"), cm::ResolutionStrategy::merge_both);
    EXPECT_EQ(cm::parse_resolution_strategy("prefer_remote"), cm::ResolutionStrategy::prefer_remote);
    EXPECT_FALSE(cm::parse_resolution_strategy("theirs").has_value());
}

TEST(MergeConfig, default_policy_and_confidence) {
    auto config = cm::MergeConfig{};
    using S = cm::ResolutionStrategy;
    EXPECT_EQ(config.strategies_for(cm::ConflictType::geometry), (std::vector<S>{S::prefer_remote}));
    EXPECT_EQ(config.strategies_for(cm::ConflictType::order), (std::vector<S>{S::prefer_local}));
    EXPECT_EQ(config.strategies_for(cm::ConflictType::delete_vs_modify), (std::vector<S>{S::manual}));
    EXPECT_EQ(config.strategies_for(cm::ConflictType::layout),
              (std::vector<S>{S::merge_both, S::manual}));

    EXPECT_DOUBLE_EQ(config.confidence_of(S::prefer_local), 0.7);
    EXPECT_DOUBLE_EQ(config.confidence_of(S::prefer_remote), 0.8);
    EXPECT_DOUBLE_EQ(config.confidence_of(S::merge_both), 0.5);
    EXPECT_DOUBLE_EQ(config.confidence_of(S::manual), 0.0);
    EXPECT_DOUBLE_EQ(config.auto_apply_threshold, 0.7);
}

TEST(MergeConfig, missing_policy_falls_back_to_manual) {
    auto config = cm::MergeConfig{};
    config.policy.erase(cm::ConflictType::text);
    config.policy[cm::ConflictType::style] = {};
    using S = cm::ResolutionStrategy;
    EXPECT_EQ(config.strategies_for(cm::ConflictType::text), (std::vector<S>{S::manual}));
    EXPECT_EQ(config.strategies_for(cm::ConflictType::style), (std::vector<S>{S::manual}));
}

// =============================================================================
// Applicability
// =============================================================================

TEST(IsApplicable, average_needs_two_numbers) {
    using S = cm::ResolutionStrategy;
    auto numeric = make_conflict(cm::ConflictType::geometry, "frame.x", json(0), json(10), json(20));
    EXPECT_TRUE(cm::is_applicable(S::average, numeric));
    EXPECT_FALSE(cm::is_applicable(S::average, name_conflict()));
}

TEST(IsApplicable, prefer_base_needs_a_field) {
    using S = cm::ResolutionStrategy;
    EXPECT_TRUE(cm::is_applicable(S::prefer_base, name_conflict()));
    auto structural = make_conflict(cm::ConflictType::move_vs_move, "", json::object(),
                                    json::object(), json::object());
    EXPECT_FALSE(cm::is_applicable(S::prefer_base, structural));
}

TEST(IsApplicable, merge_both_needs_disjoint_objects) {
    using S = cm::ResolutionStrategy;
    auto disjoint = layout_conflict(json{{"gap", 12}, {"padding", 16}},
                                    json{{"gap", 8}, {"padding", 24}});
    EXPECT_TRUE(cm::is_applicable(S::merge_both, disjoint));

    auto overlapping = layout_conflict(json{{"gap", 12}, {"padding", 16}},
                                       json{{"gap", 4}, {"padding", 16}});
    EXPECT_FALSE(cm::is_applicable(S::merge_both, overlapping));
    EXPECT_FALSE(cm::is_applicable(S::merge_both, name_conflict()));
}

TEST(CanAutoResolve, follows_the_threshold) {
    EXPECT_TRUE(cm::can_auto_resolve(name_conflict()));
    auto style = make_conflict(cm::ConflictType::style, "style.opacity", json(1), json(0.5), json(0.8));
    EXPECT_FALSE(cm::can_auto_resolve(style));

    auto strict = cm::MergeConfig{};
    strict.auto_apply_threshold = 0.9;
    EXPECT_FALSE(cm::can_auto_resolve(name_conflict(), strict));
}

// =============================================================================
// resolve_conflict
// =============================================================================

TEST(ResolveConflict, applies_a_confident_strategy) {
    auto resolution = cm::resolve_conflict(name_conflict());
    EXPECT_EQ(resolution.strategy, cm::ResolutionStrategy::prefer_remote);
    EXPECT_EQ(resolution.resolved_value, json("Remote"));
    EXPECT_DOUBLE_EQ(resolution.confidence, 0.8);
    EXPECT_TRUE(resolution.applied);
    EXPECT_FALSE(resolution.requires_review);
    EXPECT_EQ(resolution.explanation, "Resolved name conflict with prefer_remote (confidence 0.80)");
    EXPECT_EQ(resolution.conflict, name_conflict());
}

TEST(ResolveConflict, order_prefers_local_at_the_threshold) {
    auto order = make_conflict(cm::ConflictType::order, "", json{{"parentId", id(2)}, {"index", 2}},
                               json{{"parentId", id(2)}, {"index", 0}},
                               json{{"parentId", id(2)}, {"index", 1}});
    auto resolution = cm::resolve_conflict(order);
    EXPECT_EQ(resolution.strategy, cm::ResolutionStrategy::prefer_local);
    EXPECT_TRUE(resolution.applied);
    EXPECT_EQ(resolution.resolved_value->at("index"), 0);
}

TEST(ResolveConflict, manual_types_queue_for_review) {
    auto style = make_conflict(cm::ConflictType::style, "style.opacity", json(1), json(0.5), json(0.8));
    auto resolution = cm::resolve_conflict(style);
    EXPECT_EQ(resolution.strategy, cm::ResolutionStrategy::manual);
    EXPECT_EQ(resolution.resolved_value, json(1));
    EXPECT_DOUBLE_EQ(resolution.confidence, 0.0);
    EXPECT_FALSE(resolution.applied);
    EXPECT_TRUE(resolution.requires_review);
    EXPECT_EQ(resolution.explanation, "style conflict requires manual review");
}

TEST(ResolveConflict, low_confidence_becomes_a_suggestion) {
    auto conflict = layout_conflict(json{{"gap", 12}, {"padding", 16}},
                                    json{{"gap", 8}, {"padding", 24}});
    auto resolution = cm::resolve_conflict(conflict);
    EXPECT_EQ(resolution.strategy, cm::ResolutionStrategy::merge_both);
    EXPECT_EQ(resolution.resolved_value, (json{{"gap", 12}, {"padding", 24}}));
    EXPECT_TRUE(resolution.requires_review);
    EXPECT_FALSE(resolution.applied);
    EXPECT_EQ(resolution.explanation,
              "Suggested merge_both for layout conflict; confidence 0.50 is below 0.70");

    auto lenient = cm::MergeConfig{};
    lenient.auto_apply_threshold = 0.5;
    auto applied = cm::resolve_conflict(conflict, lenient);
    EXPECT_TRUE(applied.applied);
    EXPECT_EQ(applied.resolved_value, (json{{"gap", 12}, {"padding", 24}}));
}

TEST(ResolveConflict, inapplicable_strategies_are_skipped) {
    auto conflict = layout_conflict(json{{"gap", 12}}, json{{"gap", 4}});
    auto resolution = cm::resolve_conflict(conflict);
    EXPECT_EQ(resolution.strategy, cm::ResolutionStrategy::manual);
    EXPECT_EQ(resolution.resolved_value, conflict.base_value);
}

TEST(ResolveConflict, disabled_auto_resolve_only_suggests) {
    auto config = cm::MergeConfig{};
    config.auto_resolve = false;
    auto resolution = cm::resolve_conflict(name_conflict(), config);
    EXPECT_EQ(resolution.strategy, cm::ResolutionStrategy::prefer_remote);
    EXPECT_EQ(resolution.resolved_value, json("Remote"));
    EXPECT_FALSE(resolution.applied);
    EXPECT_TRUE(resolution.requires_review);
    EXPECT_EQ(resolution.explanation,
              "Suggested prefer_remote for name conflict; automatic resolution is disabled");
}

TEST(ResolveConflict, custom_policy_and_confidence) {
    auto config = cm::MergeConfig{};
    config.policy[cm::ConflictType::geometry] = {cm::ResolutionStrategy::average};
    config.confidence[cm::ResolutionStrategy::average] = 0.9;
    auto conflict = make_conflict(cm::ConflictType::geometry, "frame.x", json(0), json(10), json(20));

    auto resolution = cm::resolve_conflict(conflict, config);
    EXPECT_EQ(resolution.strategy, cm::ResolutionStrategy::average);
    EXPECT_EQ(resolution.resolved_value, json(15.0));
    EXPECT_TRUE(resolution.applied);
}

TEST(ResolveConflict, prefer_remote_can_resolve_to_absent) {
    auto config = cm::MergeConfig{};
    config.policy[cm::ConflictType::delete_vs_modify] = {cm::ResolutionStrategy::prefer_remote};
    auto conflict = make_conflict(cm::ConflictType::delete_vs_modify, "", json{{"name", "Hero"}},
                                  json{{"name", "Local"}}, std::nullopt);
    auto resolution = cm::resolve_conflict(conflict, config);
    EXPECT_TRUE(resolution.applied);
    EXPECT_FALSE(resolution.resolved_value.has_value());
}

TEST(ResolveMergeConflicts, one_resolution_per_conflict_in_order) {
    auto style = make_conflict(cm::ConflictType::style, "style.opacity", json(1), json(0.5), json(0.8));
    auto resolutions = cm::resolve_merge_conflicts({name_conflict(), style});
    ASSERT_EQ(resolutions.size(), 2u);
    EXPECT_EQ(resolutions[0].conflict.type, cm::ConflictType::name);
    EXPECT_EQ(resolutions[1].conflict.type, cm::ConflictType::style);
    EXPECT_TRUE(cm::resolve_merge_conflicts({}).empty());
}

// =============================================================================
// resolution_patches
// =============================================================================

TEST(ResolutionPatches, replaces_a_field) {
    const auto doc = fixtures::hero_document();
    auto resolution = cm::resolve_conflict(name_conflict());
    auto patches = cm::resolution_patches(doc, resolution);
    ASSERT_TRUE(patches.has_value());
    ASSERT_EQ(patches->size(), 1u);
    EXPECT_EQ((*patches)[0], cm::replace_patch("/artboards/0/children/0/name", "Remote"));
}

TEST(ResolutionPatches, creates_missing_parent_objects) {
    const auto doc = fixtures::hero_document();
    auto resolution = cm::MergeResolution{};
    resolution.conflict = make_conflict(cm::ConflictType::style, "style.opacity", std::nullopt,
                                        json(0.5), json(0.8));
    resolution.resolved_value = json(0.5);
    auto patches = cm::resolution_patches(doc, resolution);
    ASSERT_TRUE(patches.has_value());
    ASSERT_EQ(patches->size(), 1u);
    EXPECT_EQ((*patches)[0], cm::add_patch("/artboards/0/children/0/style", json{{"opacity", 0.5}}));

    auto applied = cm::apply_patches(doc, *patches);
    ASSERT_TRUE(applied.ok()) << applied.error->message;
    EXPECT_EQ(applied.document.artboards[0].children[0].style->opacity, 0.5);
}

TEST(ResolutionPatches, absent_value_removes_the_field) {
    auto doc = fixtures::hero_document();
    auto resolution = cm::MergeResolution{};
    resolution.conflict = make_conflict(cm::ConflictType::metadata, "semanticKey",
                                        json("hero.title"), std::nullopt, json("hero.heading"));
    auto patches = cm::resolution_patches(doc, resolution);
    ASSERT_TRUE(patches.has_value());
    EXPECT_EQ(*patches, (std::vector<cm::Patch>{
                            cm::remove_patch("/artboards/0/children/0/semanticKey")}));
}

TEST(ResolutionPatches, falls_back_to_semantic_key) {
    const auto doc = fixtures::hero_document();
    auto resolution = cm::resolve_conflict(name_conflict());
    resolution.conflict.id = id(99);
    resolution.conflict.semantic_key = "hero.subtitle";
    auto patches = cm::resolution_patches(doc, resolution);
    ASSERT_TRUE(patches.has_value());
    EXPECT_EQ((*patches)[0].path, "/artboards/0/children/1/name");

    resolution.conflict.semantic_key = "missing";
    EXPECT_FALSE(cm::resolution_patches(doc, resolution).has_value());
}

TEST(ResolutionPatches, delete_wins_removes_the_node) {
    const auto doc = fixtures::hero_document();
    auto resolution = cm::MergeResolution{};
    resolution.conflict = make_conflict(cm::ConflictType::delete_vs_modify, "", json::object(),
                                        std::nullopt, json{{"name", "Remote"}});
    auto patches = cm::resolution_patches(doc, resolution);
    ASSERT_TRUE(patches.has_value());
    EXPECT_EQ(*patches, (std::vector<cm::Patch>{cm::remove_patch("/artboards/0/children/0")}));
}

TEST(ResolutionPatches, modification_wins_applies_fields_and_placement) {
    const auto doc = fixtures::card_document();
    auto resolution = cm::MergeResolution{};
    resolution.conflict = make_conflict(cm::ConflictType::delete_vs_modify, "", json::object(),
                                        json{{"name", "Local"}, {"parentId", id(20)}, {"index", 0}},
                                        std::nullopt);
    resolution.resolved_value = resolution.conflict.local_value;
    auto patches = cm::resolution_patches(doc, resolution);
    ASSERT_TRUE(patches.has_value());

    auto applied = cm::apply_patches(doc, *patches);
    ASSERT_TRUE(applied.ok()) << applied.error->message;
    const auto& card = applied.document.artboards[0].children[1];
    ASSERT_EQ(card.children.size(), 3u);
    EXPECT_EQ(card.children[0].id, id(10));
    EXPECT_EQ(card.children[0].name, "Local");
}

TEST(ResolutionPatches, placement_is_computed_after_detaching) {
    const auto doc = fixtures::card_document();
    auto resolution = cm::MergeResolution{};
    resolution.conflict = make_conflict(cm::ConflictType::move_vs_move, "", std::nullopt,
                                        json{{"parentId", id(20)}, {"index", 5}}, std::nullopt);
    resolution.conflict.id = id(11);
    resolution.resolved_value = resolution.conflict.local_value;
    auto patches = cm::resolution_patches(doc, resolution);
    ASSERT_TRUE(patches.has_value());
    EXPECT_EQ(*patches, (std::vector<cm::Patch>{
                            cm::move_patch("/artboards/0/children/1",
                                           "/artboards/0/children/1/children/2")}));
}

TEST(ResolutionPatches, artboard_order) {
    const auto doc = fixtures::card_document();
    auto resolution = cm::MergeResolution{};
    resolution.conflict = make_conflict(cm::ConflictType::order, "", std::nullopt,
                                        json{{"parentId", ""}, {"index", 0}}, std::nullopt);
    resolution.conflict.id = id(3);
    resolution.resolved_value = resolution.conflict.local_value;
    auto patches = cm::resolution_patches(doc, resolution);
    ASSERT_TRUE(patches.has_value());
    EXPECT_EQ(*patches, (std::vector<cm::Patch>{cm::move_patch("/artboards/1", "/artboards/0")}));
}

TEST(ResolutionPatches, placement_into_a_leaf_is_rejected) {
    const auto doc = fixtures::hero_document();
    auto resolution = cm::MergeResolution{};
    resolution.conflict = make_conflict(cm::ConflictType::move_vs_move, "", std::nullopt,
                                        json{{"parentId", id(10)}, {"index", 0}}, std::nullopt);
    resolution.conflict.id = id(11);
    resolution.resolved_value = resolution.conflict.local_value;
    EXPECT_FALSE(cm::resolution_patches(doc, resolution).has_value());
}
