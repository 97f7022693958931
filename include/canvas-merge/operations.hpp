/// @file operations.hpp
/// @brief Id-addressed node edits built on the patch engine.

#pragma once

#include <canvas-merge/document.hpp>
#include <canvas-merge/error.hpp>
#include <canvas-merge/patch.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace canvas_merge {

/// Result of a node edit.
///
/// `patches` are the applied forward patches with pre-images captured, and
/// `reverse_patches` undo them exactly. On failure `document` is the input.
struct EditResult {
    CanvasDocument document;
    std::vector<Patch> patches;
    std::vector<Patch> reverse_patches;
    std::optional<Error> error;

    auto ok() const noexcept -> bool { return !error.has_value(); }
    explicit operator bool() const noexcept { return ok(); }
};

/// Insert `node` under `parent_id` (an artboard or container node id).
/// `index` nullopt appends.
auto create_node(const CanvasDocument& document, std::string_view parent_id, Node node,
                 std::optional<std::size_t> index = std::nullopt,
                 const PatchOptions& options = {}) -> EditResult;

/// Apply field updates to a node. `fields` is a JSON object keyed by wire
/// field name (e.g. {"name": "Title", "frame": {...}}); a null value
/// removes an optional field. `id`, `type` and `children` are not updatable.
auto update_node(const CanvasDocument& document, std::string_view id,
                 const nlohmann::json& fields, const PatchOptions& options = {})
    -> EditResult;

/// Remove a node and its subtree.
auto delete_node(const CanvasDocument& document, std::string_view id,
                 const PatchOptions& options = {}) -> EditResult;

/// Move a node under `new_parent_id` at `index` (nullopt appends), with the
/// index interpreted after the node has been detached.
auto move_node(const CanvasDocument& document, std::string_view id,
               std::string_view new_parent_id, std::optional<std::size_t> index = std::nullopt,
               const PatchOptions& options = {}) -> EditResult;

/// Copy a node next to the original, with fresh ids throughout the copy.
auto duplicate_node(const CanvasDocument& document, std::string_view id,
                    const PatchOptions& options = {}) -> EditResult;

}  // namespace canvas_merge
