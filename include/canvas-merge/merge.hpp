/// @file merge.hpp
/// @brief Three-way merge of two divergent snapshots against a shared base.

#pragma once

#include <canvas-merge/conflict.hpp>
#include <canvas-merge/diff.hpp>
#include <canvas-merge/document.hpp>
#include <canvas-merge/error.hpp>
#include <canvas-merge/resolution.hpp>

#include <optional>
#include <vector>

namespace canvas_merge {

/// Result of merge_documents().
struct MergeResult {
    CanvasDocument document;
    DiffResult local_diff;
    DiffResult remote_diff;
    std::vector<Conflict> conflicts;
    std::vector<MergeResolution> resolutions;
    std::vector<MergeResolution> unresolved;  ///< The review queue.
    double confidence{1.0};
    bool needs_manual_review{false};
    bool success{true};
    std::optional<Error> error;
};

/// Merge `local` and `remote`, both derived from `base`.
///
/// Every non-conflicting change from either side is carried into the
/// merged document. Conflicting elements keep their base state unless a
/// resolution clears the confidence threshold, in which case it is applied
/// through the patch engine. The merged document is validated before it is
/// returned; on failure `document` is `base` and `error` is set.
auto merge_documents(const CanvasDocument& base, const CanvasDocument& local,
                     const CanvasDocument& remote, const MergeConfig& config = {})
    -> MergeResult;

/// Weighted confidence of a set of resolutions, clamped to [0, 1].
///
/// Applied resolutions add their confidence with weight 1. Unapplied ones
/// add half their confidence but weigh 2, so every review item pulls the
/// score down. 1.0 when there are no resolutions.
auto overall_confidence(const std::vector<MergeResolution>& resolutions) -> double;

}  // namespace canvas_merge
