/// @file diff.hpp
/// @brief Semantic diff between two document snapshots.

#pragma once

#include <canvas-merge/document.hpp>
#include <canvas-merge/patch.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace canvas_merge {

/// The kind of change a DiffOperation describes. The declaration order is
/// also the tie-break order used when sorting operations.
enum class DiffType : std::uint8_t {
    added,
    removed,
    modified,
    moved,
};

constexpr auto to_string_view(DiffType type) noexcept -> std::string_view {
    switch (type) {
        case DiffType::added:    return "added";
        case DiffType::removed:  return "removed";
        case DiffType::modified: return "modified";
        case DiffType::moved:    return "moved";
    }
    return "unknown";
}

/// One change between two snapshots.
///
/// `node_id` names a node, an artboard, or the document itself (for
/// document-level fields). `field` is empty for structural changes and a
/// dotted name such as "frame.x" or "style.fills" for modifications.
struct DiffOperation {
    DiffType type{DiffType::modified};
    std::string node_id;
    std::optional<std::string> semantic_key;
    std::string path;                        ///< Pointer in the other snapshot, or in base for removals.
    std::string field;
    std::optional<nlohmann::json> old_value;
    std::optional<nlohmann::json> new_value;
    std::optional<std::string> parent_id;    ///< Destination parent for added and moved.
    std::optional<std::size_t> index;        ///< Destination index for added and moved.
    std::optional<std::string> previous_id;  ///< Base id of a node recreated under a new id.
    std::string description;

    auto operator==(const DiffOperation&) const -> bool = default;
};

/// Counts per change type.
struct DiffSummary {
    std::size_t added{0};
    std::size_t removed{0};
    std::size_t modified{0};
    std::size_t moved{0};
    std::size_t total{0};

    auto operator==(const DiffSummary&) const -> bool = default;
};

/// Which change families to report, and resource limits.
struct DiffOptions {
    bool include_structure{true};  ///< added, removed, moved
    bool include_property{true};   ///< name, visible, frame, style
    bool include_content{true};    ///< type-specific fields
    bool include_metadata{true};   ///< semanticKey, data, document fields
    std::size_t max_operations{0}; ///< 0 = unlimited. Applied after sorting.
    std::size_t max_nodes{100000};
};

/// The full result of a diff.
struct DiffResult {
    std::vector<DiffOperation> operations;
    DiffSummary summary;
    std::string from_document_id;
    std::string to_document_id;

    auto empty() const noexcept -> bool { return operations.empty(); }
    auto operator==(const DiffResult&) const -> bool = default;
};

/// Compute the ordered changes that turn `base` into `other`.
///
/// Output is sorted by path (array indices compared numerically), then by
/// change type, field and node id, so identical inputs always produce
/// identical output. Diffing a document with itself yields no operations.
///
/// @throws std::length_error if either document has more than
///   options.max_nodes nodes.
auto diff_documents(const CanvasDocument& base, const CanvasDocument& other,
                    const DiffOptions& options = {}) -> DiffResult;

/// Produce a forward patch list such that applying it to `base` yields
/// exactly `target`.
auto diff_to_patches(const CanvasDocument& base, const CanvasDocument& target)
    -> std::vector<Patch>;

}  // namespace canvas_merge
