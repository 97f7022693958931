#include <canvas-merge/resolution.hpp>

#include <canvas-merge/json.hpp>
#include <canvas-merge/logging.hpp>
#include <canvas-merge/node_index.hpp>
#include <canvas-merge/pointer.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <string>
#include <utility>

namespace canvas_merge {

auto parse_resolution_strategy(std::string_view name) -> std::optional<ResolutionStrategy> {
    static constexpr auto all = std::array{
        ResolutionStrategy::prefer_local, ResolutionStrategy::prefer_remote,
        ResolutionStrategy::prefer_base,  ResolutionStrategy::merge_both,
        ResolutionStrategy::average,      ResolutionStrategy::manual,
    };
    for (auto strategy : all) {
        if (to_string_view(strategy) == name) return strategy;
    }
    return std::nullopt;
}

auto default_policy() -> StrategyPolicy {
    using S = ResolutionStrategy;
    return StrategyPolicy{
        {ConflictType::delete_vs_modify, {S::manual}},
        {ConflictType::add_vs_add,       {S::manual}},
        {ConflictType::move_vs_move,     {S::manual}},
        {ConflictType::order,            {S::prefer_local}},
        {ConflictType::geometry,         {S::prefer_remote}},
        {ConflictType::visibility,       {S::prefer_local}},
        {ConflictType::layout,           {S::merge_both, S::manual}},
        {ConflictType::style,            {S::manual}},
        {ConflictType::text,             {S::manual}},
        {ConflictType::component_props,  {S::merge_both, S::manual}},
        {ConflictType::content,          {S::prefer_remote}},
        {ConflictType::name,             {S::prefer_remote}},
        {ConflictType::metadata,         {S::prefer_remote}},
    };
}

auto default_confidence() -> ConfidenceTable {
    return ConfidenceTable{
        {ResolutionStrategy::prefer_local,  0.7},
        {ResolutionStrategy::prefer_remote, 0.8},
        {ResolutionStrategy::prefer_base,   0.6},
        {ResolutionStrategy::average,       0.6},
        {ResolutionStrategy::merge_both,    0.5},
        {ResolutionStrategy::manual,        0.0},
    };
}

auto MergeConfig::confidence_of(ResolutionStrategy strategy) const -> double {
    auto it = confidence.find(strategy);
    return it == confidence.end() ? 0.0 : it->second;
}

auto MergeConfig::strategies_for(ConflictType type) const -> std::vector<ResolutionStrategy> {
    auto it = policy.find(type);
    if (it == policy.end() || it->second.empty()) return {ResolutionStrategy::manual};
    return it->second;
}

// =============================================================================
// Strategies
// =============================================================================

namespace {

// Union of the changes two objects made to a shared base, or nullopt when
// both sides changed the same key to different values.
auto merge_objects(const nlohmann::json& base, const nlohmann::json& local,
                   const nlohmann::json& remote) -> std::optional<nlohmann::json> {
    auto changed = [&](const nlohmann::json& side, const std::string& key) {
        auto in_base = base.find(key);
        auto in_side = side.find(key);
        if ((in_base == base.end()) != (in_side == side.end())) return true;
        return in_side != side.end() && *in_side != *in_base;
    };
    auto keys = std::vector<std::string>{};
    for (const auto* object : {&base, &local, &remote}) {
        for (const auto& [key, _] : object->items()) keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

    auto result = base;
    for (const auto& key : keys) {
        const auto* source = &base;
        if (changed(local, key) && changed(remote, key)) {
            auto l = local.find(key);
            auto r = remote.find(key);
            auto same = (l == local.end()) == (r == remote.end()) && (l == local.end() || *l == *r);
            if (!same) return std::nullopt;
            source = &local;
        } else if (changed(local, key)) {
            source = &local;
        } else if (changed(remote, key)) {
            source = &remote;
        }
        if (auto it = source->find(key); it != source->end()) {
            result[key] = *it;
        } else {
            result.erase(key);
        }
    }
    return result;
}

auto merge_both(const Conflict& conflict) -> std::optional<nlohmann::json> {
    if (!conflict.local_value || !conflict.remote_value) return std::nullopt;
    if (!conflict.local_value->is_object() || !conflict.remote_value->is_object()) {
        return std::nullopt;
    }
    auto base = conflict.base_value && conflict.base_value->is_object() ? *conflict.base_value
                                                                        : nlohmann::json::object();
    return merge_objects(base, *conflict.local_value, *conflict.remote_value);
}

// The value a strategy produces. The outer optional is "not applicable",
// the inner one is "absent".
auto candidate(ResolutionStrategy strategy, const Conflict& conflict)
    -> std::optional<std::optional<nlohmann::json>> {
    switch (strategy) {
        case ResolutionStrategy::prefer_local:
            return std::optional<std::optional<nlohmann::json>>{conflict.local_value};
        case ResolutionStrategy::prefer_remote:
            return std::optional<std::optional<nlohmann::json>>{conflict.remote_value};
        case ResolutionStrategy::prefer_base:
            if (conflict.field.empty()) return std::nullopt;
            return std::optional<std::optional<nlohmann::json>>{conflict.base_value};
        case ResolutionStrategy::average:
            if (!conflict.local_value || !conflict.remote_value ||
                !conflict.local_value->is_number() || !conflict.remote_value->is_number()) {
                return std::nullopt;
            }
            return std::optional<std::optional<nlohmann::json>>{nlohmann::json(
                (conflict.local_value->get<double>() + conflict.remote_value->get<double>()) / 2.0)};
        case ResolutionStrategy::merge_both:
            if (auto merged = merge_both(conflict)) {
                return std::optional<std::optional<nlohmann::json>>{std::move(merged)};
            }
            return std::nullopt;
        case ResolutionStrategy::manual:
            return std::optional<std::optional<nlohmann::json>>{conflict.base_value};
    }
    return std::nullopt;
}

auto make_resolution(const Conflict& conflict, ResolutionStrategy strategy,
                     std::optional<nlohmann::json> value, double confidence) -> MergeResolution {
    auto resolution = MergeResolution{};
    resolution.conflict = conflict;
    resolution.strategy = strategy;
    resolution.resolved_value = std::move(value);
    resolution.confidence = confidence;
    return resolution;
}

}  // anonymous namespace

auto is_applicable(ResolutionStrategy strategy, const Conflict& conflict) -> bool {
    return candidate(strategy, conflict).has_value();
}

auto can_auto_resolve(const Conflict& conflict, const MergeConfig& config) -> bool {
    for (auto strategy : config.strategies_for(conflict.type)) {
        if (strategy == ResolutionStrategy::manual) continue;
        if (config.confidence_of(strategy) >= config.auto_apply_threshold &&
            is_applicable(strategy, conflict)) {
            return true;
        }
    }
    return false;
}

auto resolve_conflict(const Conflict& conflict, const MergeConfig& config) -> MergeResolution {
    auto suggestion = std::optional<MergeResolution>{};
    for (auto strategy : config.strategies_for(conflict.type)) {
        auto value = candidate(strategy, conflict);
        if (!value) continue;
        auto confidence = config.confidence_of(strategy);
        if (config.auto_resolve && strategy != ResolutionStrategy::manual &&
            confidence >= config.auto_apply_threshold) {
            auto resolution = make_resolution(conflict, strategy, std::move(*value), confidence);
            resolution.requires_review = false;
            resolution.applied = true;
            resolution.explanation =
                fmt::format("Resolved {} conflict with {} (confidence {:.2f})",
                            to_string_view(conflict.type), to_string_view(strategy), confidence);
            return resolution;
        }
        if (!suggestion) {
            suggestion = make_resolution(conflict, strategy, std::move(*value), confidence);
        }
    }

    auto resolution = suggestion ? std::move(*suggestion)
                                 : make_resolution(conflict, ResolutionStrategy::manual,
                                                   conflict.base_value,
                                                   config.confidence_of(ResolutionStrategy::manual));
    resolution.requires_review = true;
    resolution.applied = false;
    if (resolution.strategy == ResolutionStrategy::manual) {
        resolution.explanation = fmt::format("{} conflict requires manual review",
                                             to_string_view(conflict.type));
    } else if (!config.auto_resolve) {
        resolution.explanation =
            fmt::format("Suggested {} for {} conflict; automatic resolution is disabled",
                        to_string_view(resolution.strategy), to_string_view(conflict.type));
    } else {
        resolution.explanation =
            fmt::format("Suggested {} for {} conflict; confidence {:.2f} is below {:.2f}",
                        to_string_view(resolution.strategy), to_string_view(conflict.type),
                        resolution.confidence, config.auto_apply_threshold);
    }
    return resolution;
}

auto resolve_merge_conflicts(const std::vector<Conflict>& conflicts, const MergeConfig& config)
    -> std::vector<MergeResolution> {
    auto resolutions = std::vector<MergeResolution>{};
    resolutions.reserve(conflicts.size());
    for (const auto& conflict : conflicts) {
        resolutions.push_back(resolve_conflict(conflict, config));
    }
    return resolutions;
}

// =============================================================================
// Resolution patches
// =============================================================================

namespace {

// Where a conflicting element currently lives in the target document.
struct Located {
    std::string pointer;
    nlohmann::json fields;  // shallow
    std::optional<std::size_t> artboard;
    const NodeIndexEntry* entry{nullptr};
};

auto locate(const CanvasDocument& document, const NodeIndex& index, const Conflict& conflict)
    -> std::optional<Located> {
    if (conflict.id == document.id) {
        return Located{"", nlohmann::json{{"schemaVersion", document.schema_version},
                                          {"id", document.id},
                                          {"name", document.name}},
                       std::nullopt, nullptr};
    }
    if (auto artboard = index.find_artboard(conflict.id)) {
        return Located{artboard_pointer(*artboard), shallow_json(document.artboards[*artboard]),
                       artboard, nullptr};
    }
    const auto* entry = index.find(conflict.id);
    if (!entry && conflict.semantic_key) entry = index.find_by_semantic_key(*conflict.semantic_key);
    if (!entry) return std::nullopt;
    return Located{entry->location.pointer(), shallow_json(*entry->node), std::nullopt, entry};
}

auto field_segments(std::string_view field) -> PointerSegments {
    auto segments = PointerSegments{};
    auto start = std::size_t{0};
    while (true) {
        auto dot = field.find('.', start);
        segments.emplace_back(field.substr(start, dot - start));
        if (dot == std::string_view::npos) break;
        start = dot + 1;
    }
    return segments;
}

void field_patches(std::vector<Patch>& out, const Located& at, std::string_view field,
                   const std::optional<nlohmann::json>& value) {
    auto segments = field_segments(field);
    auto current = std::optional<nlohmann::json>{};
    const auto* cursor = &at.fields;
    auto depth = std::size_t{0};
    for (; depth < segments.size(); ++depth) {
        if (!cursor->is_object()) break;
        auto it = cursor->find(segments[depth]);
        if (it == cursor->end()) break;
        cursor = &*it;
    }
    if (depth == segments.size()) current = *cursor;

    auto path = at.pointer + format_pointer(segments);
    if (!value || value->is_null()) {
        if (current) out.push_back(remove_patch(std::move(path)));
        return;
    }
    if (current) {
        if (*current != *value) out.push_back(replace_patch(std::move(path), *value));
        return;
    }
    // Create the missing parent object, e.g. "style" for "style.opacity".
    auto wrapped = *value;
    for (auto i = segments.size() - 1; i > depth; --i) {
        wrapped = nlohmann::json{{segments[i], std::move(wrapped)}};
    }
    auto prefix = PointerSegments{segments.begin(), segments.begin() + depth + 1};
    out.push_back(add_patch(at.pointer + format_pointer(prefix), std::move(wrapped)));
}

// Move the located element under `placement.parentId` at `placement.index`,
// interpreted after detaching it.
auto placement_patches(std::vector<Patch>& out, const CanvasDocument& document,
                       const Located& at, const nlohmann::json& placement)
    -> bool {
    if (!placement.is_object()) return false;
    auto parent_id = placement.value("parentId", std::string{});
    auto wanted = placement.value("index", std::size_t{0});

    if (at.artboard) {
        auto last = document.artboards.size() - 1;
        auto to = std::min(wanted, last);
        if (to != *at.artboard) out.push_back(move_patch(at.pointer, artboard_pointer(to)));
        return true;
    }
    if (!at.entry) return false;

    // The destination is addressed in the document with the node detached.
    auto detach_options = PatchOptions{};
    detach_options.validate = false;
    auto detached = apply_patch(document, remove_patch(at.pointer), detach_options);
    if (!detached) return false;
    const auto remaining = NodeIndex{detached.document};

    auto parent_pointer = std::string{};
    if (auto artboard = remaining.find_artboard(parent_id)) {
        parent_pointer = artboard_pointer(*artboard);
    } else if (const auto* parent = remaining.find(parent_id)) {
        if (!parent->node->is_container()) return false;
        parent_pointer = parent->location.pointer();
    } else {
        return false;
    }
    auto size = remaining.children_of(parent_id).size();
    auto to = parent_pointer + "/children/" + std::to_string(std::min(wanted, size));
    if (to != at.pointer) out.push_back(move_patch(at.pointer, std::move(to)));
    return true;
}

}  // anonymous namespace

auto resolution_patches(const CanvasDocument& document, const MergeResolution& resolution)
    -> std::optional<std::vector<Patch>> {
    const auto& conflict = resolution.conflict;
    const auto& value = resolution.resolved_value;
    const auto index = NodeIndex{document};
    auto located = locate(document, index, conflict);
    auto patches = std::vector<Patch>{};

    switch (conflict.type) {
        case ConflictType::delete_vs_modify: {
            if (!value) {
                if (located) patches.push_back(remove_patch(located->pointer));
                return patches;
            }
            if (!located || !value->is_object()) return std::nullopt;
            for (const auto& [key, field_value] : value->items()) {
                if (key == "parentId" || key == "index") continue;
                field_patches(patches, *located, key, field_value);
            }
            if (value->contains("parentId") &&
                !placement_patches(patches, document, *located, *value)) {
                return std::nullopt;
            }
            return patches;
        }
        case ConflictType::add_vs_add: {
            if (!located || !located->entry || !value || !value->is_object()) return std::nullopt;
            auto node = value->value("node", nlohmann::json::object());
            if (!node.is_object()) return std::nullopt;
            if (node != located->fields) {
                node["children"] = nlohmann::json(located->entry->node->children);
                patches.push_back(replace_patch(located->pointer, std::move(node)));
            }
            if (!placement_patches(patches, document, *located, *value)) return std::nullopt;
            return patches;
        }
        case ConflictType::move_vs_move:
        case ConflictType::order:
            if (!located || !value) return std::nullopt;
            if (!placement_patches(patches, document, *located, *value)) return std::nullopt;
            return patches;
        default:
            if (!located || conflict.field.empty()) return std::nullopt;
            field_patches(patches, *located, conflict.field, value);
            return patches;
    }
}

}  // namespace canvas_merge
