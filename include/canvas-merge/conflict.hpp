/// @file conflict.hpp
/// @brief Conflict detection between two diffs against a shared base.

#pragma once

#include <canvas-merge/diff.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace canvas_merge {

/// What kind of disagreement a conflict represents.
enum class ConflictType : std::uint8_t {
    delete_vs_modify,
    add_vs_add,
    move_vs_move,
    order,
    geometry,
    visibility,
    layout,
    style,
    text,
    component_props,
    content,
    name,
    metadata,
};

constexpr auto to_string_view(ConflictType type) noexcept -> std::string_view {
    switch (type) {
        case ConflictType::delete_vs_modify: return "delete-vs-modify";
        case ConflictType::add_vs_add:       return "add-vs-add";
        case ConflictType::move_vs_move:     return "move-vs-move";
        case ConflictType::order:            return "order";
        case ConflictType::geometry:         return "geometry";
        case ConflictType::visibility:       return "visibility";
        case ConflictType::layout:           return "layout";
        case ConflictType::style:            return "style";
        case ConflictType::text:             return "text";
        case ConflictType::component_props:  return "component-props";
        case ConflictType::content:          return "content";
        case ConflictType::name:             return "name";
        case ConflictType::metadata:         return "metadata";
    }
    return "unknown";
}

/// Parse a wire conflict type name.
auto parse_conflict_type(std::string_view name) -> std::optional<ConflictType>;

enum class ConflictCategory : std::uint8_t { structural, property, content, metadata };

constexpr auto to_string_view(ConflictCategory category) noexcept -> std::string_view {
    switch (category) {
        case ConflictCategory::structural: return "structural";
        case ConflictCategory::property:   return "property";
        case ConflictCategory::content:    return "content";
        case ConflictCategory::metadata:   return "metadata";
    }
    return "unknown";
}

enum class ConflictSeverity : std::uint8_t { error, warning, info };

constexpr auto to_string_view(ConflictSeverity severity) noexcept -> std::string_view {
    switch (severity) {
        case ConflictSeverity::error:   return "error";
        case ConflictSeverity::warning: return "warning";
        case ConflictSeverity::info:    return "info";
    }
    return "unknown";
}

/// Category of a conflict type.
auto category_of(ConflictType type) noexcept -> ConflictCategory;

/// Default severity of a conflict type.
auto severity_of(ConflictType type) noexcept -> ConflictSeverity;

/// Conflict type reported for a modification of the given diff field.
auto conflict_type_for_field(std::string_view field) -> ConflictType;

/// Two edits of the same element that disagree.
///
/// `id` is the base identity of the element. The values are JSON so that
/// they can carry whole nodes, single fields or placements alike; a missing
/// value means "absent on that side".
struct Conflict {
    std::string id;
    ConflictType type{ConflictType::content};
    ConflictCategory category{ConflictCategory::content};
    ConflictSeverity severity{ConflictSeverity::warning};
    std::string path;
    std::string field;
    std::optional<std::string> semantic_key;
    std::optional<nlohmann::json> base_value;
    std::optional<nlohmann::json> local_value;
    std::optional<nlohmann::json> remote_value;
    std::string message;

    auto operator==(const Conflict&) const -> bool = default;
};

/// Conflict order: path, type, id, then field.
auto conflict_less(const Conflict& a, const Conflict& b) -> bool;

/// Compare two diffs computed from the same base and report overlapping
/// edits that disagree, including nodes placed into a parent the other side
/// removed and one semantic key given to different nodes. Convergent edits
/// (same change, same value) are not conflicts. Output is sorted by path, type, id and field.
auto detect_conflicts(const DiffResult& local, const DiffResult& remote)
    -> std::vector<Conflict>;

}  // namespace canvas_merge
