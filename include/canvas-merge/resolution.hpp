/// @file resolution.hpp
/// @brief Merge resolution: strategies, policy and confidence scoring.

#pragma once

#include <canvas-merge/conflict.hpp>
#include <canvas-merge/document.hpp>
#include <canvas-merge/patch.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace canvas_merge {

/// How a conflict is resolved.
enum class ResolutionStrategy : std::uint8_t {
    prefer_local,
    prefer_remote,
    prefer_base,
    merge_both,  ///< Field-level union of two objects changed on disjoint keys.
    average,     ///< Mean of two numbers.
    manual,      ///< Defer to a human.
};

constexpr auto to_string_view(ResolutionStrategy strategy) noexcept -> std::string_view {
    switch (strategy) {
        case ResolutionStrategy::prefer_local:  return "prefer_local";
        case ResolutionStrategy::prefer_remote: return "prefer_remote";
        case ResolutionStrategy::prefer_base:   return "prefer_base";
        case ResolutionStrategy::merge_both:    return "merge_both";
        case ResolutionStrategy::average:       return "average";
        case ResolutionStrategy::manual:        return "manual";
    }
    return "unknown";
}

auto parse_resolution_strategy(std::string_view name) -> std::optional<ResolutionStrategy>;

/// Conflict type to ordered strategy preference.
using StrategyPolicy = std::map<ConflictType, std::vector<ResolutionStrategy>>;

/// Strategy to fixed confidence weight in [0, 1].
using ConfidenceTable = std::map<ResolutionStrategy, double>;

/// The built-in policy table.
auto default_policy() -> StrategyPolicy;

/// The built-in confidence weights.
auto default_confidence() -> ConfidenceTable;

/// All merge and resolution settings. Passed explicitly; nothing is global.
struct MergeConfig {
    bool auto_resolve{true};
    double auto_apply_threshold{0.7};
    bool fail_on_unresolved{false};
    std::size_t max_nodes{100000};
    StrategyPolicy policy{default_policy()};
    ConfidenceTable confidence{default_confidence()};

    /// Confidence of a strategy; 0 for strategies missing from the table.
    auto confidence_of(ResolutionStrategy strategy) const -> double;

    /// Strategy preference for a conflict type; [manual] when unmapped.
    auto strategies_for(ConflictType type) const -> std::vector<ResolutionStrategy>;
};

/// The outcome for one conflict.
struct MergeResolution {
    Conflict conflict;
    ResolutionStrategy strategy{ResolutionStrategy::manual};
    std::optional<nlohmann::json> resolved_value;  ///< nullopt means "absent".
    double confidence{0.0};
    bool requires_review{true};
    std::string explanation;
    bool applied{false};

    auto operator==(const MergeResolution&) const -> bool = default;
};

/// Whether a strategy can produce a value for this conflict.
auto is_applicable(ResolutionStrategy strategy, const Conflict& conflict) -> bool;

/// True when an applicable non-manual strategy clears the threshold.
auto can_auto_resolve(const Conflict& conflict, const MergeConfig& config = {}) -> bool;

/// Resolve one conflict.
///
/// The first applicable strategy in policy order whose confidence clears
/// the threshold is accepted (`applied = true`). Otherwise the first
/// applicable strategy is reported with `requires_review = true` and
/// `applied = false`; its value is a suggestion only.
auto resolve_conflict(const Conflict& conflict, const MergeConfig& config = {})
    -> MergeResolution;

/// Resolve each conflict in isolation, preserving input order.
auto resolve_merge_conflicts(const std::vector<Conflict>& conflicts,
                             const MergeConfig& config = {})
    -> std::vector<MergeResolution>;

/// Translate an accepted resolution into patches against `document`.
///
/// Elements are located by id, falling back to the conflict's semantic key.
/// Returns an empty list when the document already holds the resolved
/// value, and nullopt when the target cannot be located.
auto resolution_patches(const CanvasDocument& document, const MergeResolution& resolution)
    -> std::optional<std::vector<Patch>>;

}  // namespace canvas_merge
