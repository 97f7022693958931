/// @file patch.hpp
/// @brief The patch engine: apply, batch and invert RFC 6902 operations.

#pragma once

#include <canvas-merge/document.hpp>
#include <canvas-merge/error.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace canvas_merge {

/// The fixed patch vocabulary.
enum class PatchOp : std::uint8_t {
    add,
    remove,
    replace,
    move,
    copy,
    test,
};

/// Convert a PatchOp to its wire name.
constexpr auto to_string_view(PatchOp op) noexcept -> std::string_view {
    switch (op) {
        case PatchOp::add:     return "add";
        case PatchOp::remove:  return "remove";
        case PatchOp::replace: return "replace";
        case PatchOp::move:    return "move";
        case PatchOp::copy:    return "copy";
        case PatchOp::test:    return "test";
    }
    return "unknown";
}

/// Parse a wire op name, or nullopt for names outside the vocabulary.
auto parse_patch_op(std::string_view name) -> std::optional<PatchOp>;

/// A single structural edit addressed by an RFC 6901 pointer.
///
/// `old_value` is never part of the wire format sent by editors; the engine
/// fills it with the pre-image of the target when a patch is applied, which
/// is what makes remove and replace invertible.
struct Patch {
    PatchOp op{PatchOp::test};
    std::string path;
    std::optional<nlohmann::json> value;
    std::optional<std::string> from;
    std::optional<nlohmann::json> old_value;

    auto operator==(const Patch&) const -> bool = default;
};

// -- Convenience constructors -------------------------------------------------

auto add_patch(std::string path, nlohmann::json value) -> Patch;
auto remove_patch(std::string path) -> Patch;
auto replace_patch(std::string path, nlohmann::json value) -> Patch;
auto move_patch(std::string from, std::string path) -> Patch;
auto copy_patch(std::string from, std::string path) -> Patch;
auto test_patch(std::string path, nlohmann::json value) -> Patch;

/// What a batch does when a test operation fails.
enum class TestFailurePolicy : std::uint8_t {
    abort_batch,     ///< Return the input document and report the failure.
    skip_operation,  ///< Record the index as skipped and continue.
};

/// Options for patch application.
struct PatchOptions {
    /// Validate after every single patch and after every batch.
    bool validate{true};
    TestFailurePolicy on_test_failure{TestFailurePolicy::abort_batch};
    /// Give copied node subtrees fresh ids and drop their semantic keys.
    bool reassign_copied_ids{true};
    /// Id source for copies. Empty means generate_ulid().
    std::function<std::string()> id_generator;
};

/// Result of applying one patch.
///
/// On failure `document` is an untouched copy of the input and `error` is
/// set. On success `applied` holds the patch with its pre-image captured.
struct PatchResult {
    CanvasDocument document;
    std::optional<Patch> applied;
    std::optional<Error> error;

    auto ok() const noexcept -> bool { return !error.has_value(); }
    explicit operator bool() const noexcept { return ok(); }
};

/// Result of applying a list of patches.
struct BatchResult {
    CanvasDocument document;
    std::vector<Patch> applied;           ///< Successfully applied, with pre-images.
    std::vector<std::size_t> skipped;     ///< Test ops skipped under skip_operation.
    std::optional<Error> error;
    std::optional<std::size_t> failed_index;
    std::optional<Patch> failed_patch;

    auto ok() const noexcept -> bool { return !error.has_value(); }
    explicit operator bool() const noexcept { return ok(); }
};

/// Apply a single patch to a copy of `document`.
///
/// Either the result is a schema-valid document (when options.validate is
/// set) or the input is returned unchanged together with an error.
auto apply_patch(const CanvasDocument& document, const Patch& patch,
                 const PatchOptions& options = {}) -> PatchResult;

/// Apply patches in order. Any failure other than a skipped test aborts the
/// batch and returns the input document. Validation runs once at the end.
auto apply_patches(const CanvasDocument& document, const std::vector<Patch>& patches,
                   const PatchOptions& options = {}) -> BatchResult;

/// Produce the structural inverse of a patch.
///
/// @throws std::invalid_argument for remove and replace patches without a
///   captured `old_value`: the prior value cannot be reconstructed from the
///   forward patch alone.
auto invert_patch(const Patch& patch) -> Patch;

/// Invert a list: reversed order, each entry inverted. Replaying the result
/// on the patched document restores the original.
auto invert_patches(const std::vector<Patch>& patches) -> std::vector<Patch>;

}  // namespace canvas_merge
