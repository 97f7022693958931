#include <canvas-merge/diff.hpp>

#include <canvas-merge/json.hpp>
#include <canvas-merge/logging.hpp>
#include <canvas-merge/node_index.hpp>
#include <canvas-merge/pointer.hpp>

#include "sequence.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace canvas_merge {

namespace {

// =============================================================================
// Field comparison
// =============================================================================

enum class Family { property, content, metadata };

struct FieldChange {
    std::string field;
    std::optional<nlohmann::json> old_value;
    std::optional<nlohmann::json> new_value;
    Family family;
};

template <typename T>
auto optional_json(const std::optional<T>& value) -> std::optional<nlohmann::json> {
    if (!value) return std::nullopt;
    return nlohmann::json(*value);
}

class FieldComparer {
public:
    explicit FieldComparer(std::vector<FieldChange>& out) : out_{out} {}

    template <typename T>
    void compare(const char* field, const T& before, const T& after, Family family) {
        if (before == after) return;
        out_.push_back(FieldChange{field, nlohmann::json(before), nlohmann::json(after), family});
    }

    template <typename T>
    void compare(const char* field, const std::optional<T>& before,
                 const std::optional<T>& after, Family family) {
        if (before == after) return;
        out_.push_back(FieldChange{field, optional_json(before), optional_json(after), family});
    }

    void compare_frame(const Rect& before, const Rect& after) {
        compare("frame.x", before.x, after.x, Family::property);
        compare("frame.y", before.y, after.y, Family::property);
        compare("frame.width", before.width, after.width, Family::property);
        compare("frame.height", before.height, after.height, Family::property);
    }

    void compare_style(const std::optional<Style>& before, const std::optional<Style>& after) {
        static const auto none = Style{};
        const auto& b = before ? *before : none;
        const auto& a = after ? *after : none;
        compare("style.fills", b.fills, a.fills, Family::property);
        compare("style.strokes", b.strokes, a.strokes, Family::property);
        compare("style.radius", b.radius, a.radius, Family::property);
        compare("style.opacity", b.opacity, a.opacity, Family::property);
        compare("style.shadow", b.shadow, a.shadow, Family::property);
    }

    // Type-specific fields. Both sides are compared through their wire
    // form so that a type change reports every field it touches.
    void compare_content(const Node& before, const Node& after) {
        if (before.type() != after.type()) {
            compare("type", std::string{to_string_view(before.type())},
                    std::string{to_string_view(after.type())}, Family::content);
        } else if (before.content == after.content) {
            return;
        }
        auto b = content_fields(before);
        auto a = content_fields(after);
        auto keys = std::vector<std::string>{};
        for (const auto& [key, _] : b.items()) keys.push_back(key);
        for (const auto& [key, _] : a.items()) {
            if (!b.contains(key)) keys.push_back(key);
        }
        std::sort(keys.begin(), keys.end());
        for (const auto& key : keys) {
            auto old_value = b.contains(key) ? std::optional<nlohmann::json>{b[key]} : std::nullopt;
            auto new_value = a.contains(key) ? std::optional<nlohmann::json>{a[key]} : std::nullopt;
            if (old_value == new_value) continue;
            out_.push_back(FieldChange{key, std::move(old_value), std::move(new_value),
                                       Family::content});
        }
    }

private:
    static auto content_fields(const Node& node) -> nlohmann::json {
        static const auto keys = std::array{"layout", "path", "windingRule", "text", "textStyle",
                                            "src", "mode", "componentKey", "props"};
        auto full = shallow_json(node);
        auto result = nlohmann::json::object();
        for (const auto* key : keys) {
            if (auto it = full.find(key); it != full.end()) result[key] = *it;
        }
        return result;
    }

    std::vector<FieldChange>& out_;
};

auto compare_nodes(const Node& before, const Node& after) -> std::vector<FieldChange> {
    auto changes = std::vector<FieldChange>{};
    auto c = FieldComparer{changes};
    c.compare("id", before.id, after.id, Family::metadata);
    c.compare("name", before.name, after.name, Family::property);
    c.compare("visible", before.visible, after.visible, Family::property);
    c.compare_frame(before.frame, after.frame);
    c.compare_style(before.style, after.style);
    c.compare("semanticKey", before.semantic_key, after.semantic_key, Family::metadata);
    c.compare("data", before.data, after.data, Family::metadata);
    c.compare_content(before, after);
    return changes;
}

auto compare_artboards(const Artboard& before, const Artboard& after) -> std::vector<FieldChange> {
    auto changes = std::vector<FieldChange>{};
    auto c = FieldComparer{changes};
    c.compare("name", before.name, after.name, Family::property);
    c.compare_frame(before.frame, after.frame);
    return changes;
}

// =============================================================================
// Descriptions
// =============================================================================

auto describe_value(const std::optional<nlohmann::json>& value) -> std::string {
    if (!value) return "none";
    if (value->is_number()) {
        auto d = value->get<double>();
        if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 1e15) {
            return std::to_string(static_cast<long long>(d));
        }
    }
    return value->dump();
}

auto describe_change(const FieldChange& change) -> std::string {
    if (change.field == "name" && change.old_value && change.new_value) {
        return "Renamed from " + change.old_value->dump() + " to " + change.new_value->dump();
    }
    auto label = change.field;
    std::replace(label.begin(), label.end(), '.', ' ');
    return "Changed " + label + " from " + describe_value(change.old_value) + " to " +
           describe_value(change.new_value);
}

auto placement(const std::string& parent_id, std::size_t index) -> nlohmann::json {
    return nlohmann::json{{"parentId", parent_id}, {"index", index}};
}

// =============================================================================
// Diff builder
// =============================================================================

class DiffBuilder {
public:
    DiffBuilder(const CanvasDocument& base, const CanvasDocument& other, const DiffOptions& options)
        : base_{base}, other_{other}, options_{options}, base_index_{base}, other_index_{other} {}

    auto run() -> std::vector<DiffOperation> {
        pair_recreated_nodes();
        diff_document_fields();
        diff_artboards();
        diff_nodes();
        diff_order();
        return std::move(ops_);
    }

private:
    // A node only in `other` whose semantic key belongs to a node only in
    // `base` is the same element under a new id.
    void pair_recreated_nodes() {
        for (const auto& entry : other_index_.entries()) {
            const auto& node = *entry.node;
            if (!node.semantic_key || base_index_.find(node.id)) continue;
            const auto* before = base_index_.find_by_semantic_key(*node.semantic_key);
            if (!before || other_index_.find(before->node->id)) continue;
            previous_.emplace(node.id, before->node->id);
            successor_.emplace(before->node->id, node.id);
        }
    }

    // Base identity of an id from `other`.
    auto identity(const std::string& other_id) const -> const std::string& {
        auto it = previous_.find(other_id);
        return it == previous_.end() ? other_id : it->second;
    }

    auto previous_id(const std::string& other_id) const -> std::optional<std::string> {
        auto it = previous_.find(other_id);
        if (it == previous_.end()) return std::nullopt;
        return it->second;
    }

    auto wants(Family family) const -> bool {
        switch (family) {
            case Family::property: return options_.include_property;
            case Family::content:  return options_.include_content;
            case Family::metadata: return options_.include_metadata;
        }
        return true;
    }

    void emit_changes(const std::vector<FieldChange>& changes, const std::string& node_id,
                      const std::optional<std::string>& semantic_key, const std::string& path,
                      const std::optional<std::string>& previous) {
        for (const auto& change : changes) {
            if (!wants(change.family)) continue;
            auto op = DiffOperation{};
            op.type = DiffType::modified;
            op.node_id = node_id;
            op.semantic_key = semantic_key;
            op.path = path;
            op.field = change.field;
            op.old_value = change.old_value;
            op.new_value = change.new_value;
            op.previous_id = previous;
            op.description = describe_change(change);
            ops_.push_back(std::move(op));
        }
    }

    void diff_document_fields() {
        if (!options_.include_metadata || base_.name == other_.name) return;
        auto changes = std::vector<FieldChange>{
            FieldChange{"name", nlohmann::json(base_.name), nlohmann::json(other_.name),
                        Family::metadata}};
        emit_changes(changes, other_.id, std::nullopt, "", std::nullopt);
    }

    void diff_artboards() {
        for (std::size_t i = 0; i < other_.artboards.size(); ++i) {
            const auto& artboard = other_.artboards[i];
            auto path = artboard_pointer(i);
            auto before = base_index_.find_artboard(artboard.id);
            if (!before) {
                if (!options_.include_structure) continue;
                auto op = DiffOperation{};
                op.type = DiffType::added;
                op.node_id = artboard.id;
                op.path = path;
                op.new_value = shallow_json(artboard);
                op.parent_id = std::string{};
                op.index = i;
                op.description = "Added artboard \"" + artboard.name + "\"";
                ops_.push_back(std::move(op));
                continue;
            }
            emit_changes(compare_artboards(base_.artboards[*before], artboard), artboard.id,
                         std::nullopt, path, std::nullopt);
        }

        if (!options_.include_structure) return;
        for (std::size_t i = 0; i < base_.artboards.size(); ++i) {
            const auto& artboard = base_.artboards[i];
            if (other_index_.find_artboard(artboard.id)) continue;
            auto op = DiffOperation{};
            op.type = DiffType::removed;
            op.node_id = artboard.id;
            op.path = artboard_pointer(i);
            op.old_value = shallow_json(artboard);
            op.description = "Removed artboard \"" + artboard.name + "\"";
            ops_.push_back(std::move(op));
        }
    }

    void diff_nodes() {
        for (const auto& entry : other_index_.entries()) {
            const auto& node = *entry.node;
            const auto* before = base_index_.find(identity(node.id));
            auto path = entry.location.pointer();

            if (!before) {
                if (!options_.include_structure) continue;
                auto op = DiffOperation{};
                op.type = DiffType::added;
                op.node_id = node.id;
                op.semantic_key = node.semantic_key;
                op.path = path;
                op.new_value = shallow_json(node);
                op.parent_id = entry.parent_id;
                op.index = entry.index();
                op.description = "Added " + std::string{to_string_view(node.type())} +
                                 " node \"" + node.name + "\"";
                ops_.push_back(std::move(op));
                continue;
            }

            emit_changes(compare_nodes(*before->node, node), node.id, node.semantic_key, path,
                         previous_id(node.id));

            if (identity(entry.parent_id) != before->parent_id) {
                emit_move(entry, *before);
            }
        }

        if (!options_.include_structure) return;
        for (const auto& entry : base_index_.entries()) {
            const auto& node = *entry.node;
            if (other_index_.find(node.id) || successor_.count(node.id)) continue;
            auto op = DiffOperation{};
            op.type = DiffType::removed;
            op.node_id = node.id;
            op.semantic_key = node.semantic_key;
            op.path = entry.location.pointer();
            op.old_value = shallow_json(node);
            op.description = "Removed " + std::string{to_string_view(node.type())} +
                             " node \"" + node.name + "\"";
            ops_.push_back(std::move(op));
        }
    }

    void emit_move(const NodeIndexEntry& after, const NodeIndexEntry& before) {
        if (!options_.include_structure) return;
        const auto& node = *after.node;
        if (!moved_.insert(node.id).second) return;
        auto op = DiffOperation{};
        op.type = DiffType::moved;
        op.node_id = node.id;
        op.semantic_key = node.semantic_key;
        op.path = after.location.pointer();
        op.old_value = placement(before.parent_id, before.index());
        op.new_value = placement(after.parent_id, after.index());
        op.parent_id = after.parent_id;
        op.index = after.index();
        op.previous_id = previous_id(node.id);
        op.description = "Moved node from " + display_path(before.location.pointer()) + " to " +
                         display_path(op.path);
        ops_.push_back(std::move(op));
    }

    // Siblings that stayed under the same parent but changed relative order.
    // The longest run that kept its order stays put; the rest moved.
    void diff_order() {
        if (!options_.include_structure) return;

        diff_artboard_order();
        for (std::size_t a = 0; a < other_.artboards.size(); ++a) {
            const auto& artboard = other_.artboards[a];
            if (base_index_.find_artboard(artboard.id)) diff_children_order(artboard.id, artboard.children);
        }
        for (const auto& entry : other_index_.entries()) {
            if (!entry.node->children.empty()) diff_children_order(entry.node->id, entry.node->children);
        }
    }

    void diff_children_order(const std::string& parent_id, const std::vector<Node>& children) {
        const auto& parent_identity = identity(parent_id);
        auto entries = std::vector<std::pair<const NodeIndexEntry*, const NodeIndexEntry*>>{};
        auto positions = std::vector<std::size_t>{};
        for (const auto& child : children) {
            const auto* before = base_index_.find(identity(child.id));
            if (!before || before->parent_id != parent_identity) continue;
            entries.emplace_back(other_index_.find(child.id), before);
            positions.push_back(before->index());
        }
        auto kept = detail::longest_increasing_subsequence(positions);
        for (std::size_t i = 0; i < entries.size(); ++i) {
            if (!kept[i]) emit_move(*entries[i].first, *entries[i].second);
        }
    }

    void diff_artboard_order() {
        auto common = std::vector<std::size_t>{};      // indices in other
        auto positions = std::vector<std::size_t>{};   // indices in base
        for (std::size_t i = 0; i < other_.artboards.size(); ++i) {
            if (auto before = base_index_.find_artboard(other_.artboards[i].id)) {
                common.push_back(i);
                positions.push_back(*before);
            }
        }
        auto kept = detail::longest_increasing_subsequence(positions);
        for (std::size_t k = 0; k < common.size(); ++k) {
            if (kept[k]) continue;
            const auto& artboard = other_.artboards[common[k]];
            auto op = DiffOperation{};
            op.type = DiffType::moved;
            op.node_id = artboard.id;
            op.path = artboard_pointer(common[k]);
            op.old_value = placement("", positions[k]);
            op.new_value = placement("", common[k]);
            op.parent_id = std::string{};
            op.index = common[k];
            op.description = "Moved artboard from " + display_path(artboard_pointer(positions[k])) +
                             " to " + display_path(op.path);
            ops_.push_back(std::move(op));
        }
    }

    const CanvasDocument& base_;
    const CanvasDocument& other_;
    const DiffOptions& options_;
    NodeIndex base_index_;
    NodeIndex other_index_;
    std::unordered_map<std::string, std::string> previous_;   // other id -> base id
    std::unordered_map<std::string, std::string> successor_;  // base id -> other id
    std::unordered_set<std::string> moved_;
    std::vector<DiffOperation> ops_;
};

auto operation_less(const DiffOperation& a, const DiffOperation& b) -> bool {
    if (a.path != b.path) return pointer_less(a.path, b.path);
    if (a.type != b.type) return a.type < b.type;
    if (a.field != b.field) return a.field < b.field;
    return a.node_id < b.node_id;
}

void check_ceiling(const CanvasDocument& document, std::size_t max_nodes) {
    auto count = count_nodes(document);
    if (count > max_nodes) {
        throw std::length_error{"document " + document.id + " has " + std::to_string(count) +
                                " nodes, above the limit of " + std::to_string(max_nodes)};
    }
}

// =============================================================================
// Forward patches
// =============================================================================

// Emits patches while replaying them on a working copy, so every pointer is
// computed against the document state it will actually be applied to.
class PatchBuilder {
public:
    explicit PatchBuilder(const CanvasDocument& base) : working_{base} {
        options_.validate = false;
        options_.reassign_copied_ids = false;
    }

    void emit(Patch patch) {
        auto result = apply_patch(working_, patch, options_);
        if (!result) {
            throw std::logic_error{"diff_to_patches: generated " +
                                   std::string{to_string_view(patch.op)} + " at '" + patch.path +
                                   "' did not apply: " + result.error->message};
        }
        working_ = std::move(result.document);
        index_.reset();
        patches_.push_back(std::move(patch));
    }

    // Field patches do not change structure and are not replayed.
    void append(Patch patch) { patches_.push_back(std::move(patch)); }

    auto index() -> const NodeIndex& {
        if (!index_) index_.emplace(working_);
        return *index_;
    }

    auto working() const -> const CanvasDocument& { return working_; }
    auto take() -> std::vector<Patch> { return std::move(patches_); }

private:
    CanvasDocument working_;
    PatchOptions options_;
    std::optional<NodeIndex> index_;
    std::vector<Patch> patches_;
};

auto container_json(const Node& node) -> nlohmann::json {
    auto j = shallow_json(node);
    if (node.is_container()) j["children"] = nlohmann::json::array();
    return j;
}

void place_children(PatchBuilder& builder, const std::string& container,
                    const std::vector<Node>& children) {
    for (std::size_t i = 0; i < children.size(); ++i) {
        const auto& child = children[i];
        auto desired = container + "/children/" + std::to_string(i);
        if (const auto* entry = builder.index().find(child.id)) {
            auto current = entry->location.pointer();
            if (current != desired) builder.emit(move_patch(current, desired));
            // Fix the type early so the node can take its target children.
            const auto* placed = builder.index().find(child.id);
            if (placed->node->type() != child.type()) {
                builder.emit(replace_patch(desired + "/type",
                                           std::string{to_string_view(child.type())}));
            }
        } else {
            builder.emit(add_patch(desired, container_json(child)));
        }
    }
    for (std::size_t i = 0; i < children.size(); ++i) {
        if (children[i].is_container()) {
            place_children(builder, container + "/children/" + std::to_string(i),
                           children[i].children);
        }
    }
}

void remove_leftovers(PatchBuilder& builder, const CanvasDocument& target) {
    auto wanted = std::unordered_set<std::string>{};
    for (const auto& artboard : target.artboards) wanted.insert(artboard.id);
    const auto target_index = NodeIndex{target};
    for (const auto& entry : target_index.entries()) wanted.insert(entry.node->id);

    const auto& index = builder.index();
    const auto& working = builder.working();
    auto doomed = std::unordered_set<std::string>{};
    auto pointers = std::vector<std::string>{};  // pre-order
    for (std::size_t a = 0; a < working.artboards.size(); ++a) {
        if (wanted.count(working.artboards[a].id)) continue;
        doomed.insert(working.artboards[a].id);
        pointers.push_back(artboard_pointer(a));
    }
    // Artboard removals go last, after the nodes they no longer contain.
    auto artboard_count = pointers.size();
    for (const auto& entry : index.entries()) {
        const auto& id = entry.node->id;
        if (doomed.count(entry.parent_id)) {
            doomed.insert(id);
            continue;
        }
        if (wanted.count(id)) continue;
        doomed.insert(id);
        pointers.push_back(entry.location.pointer());
    }

    auto removals = std::vector<Patch>{};
    for (auto i = pointers.size(); i > artboard_count; --i) removals.push_back(remove_patch(pointers[i - 1]));
    for (auto i = artboard_count; i > 0; --i) removals.push_back(remove_patch(pointers[i - 1]));
    for (auto& patch : removals) builder.emit(std::move(patch));
}

void diff_fields(PatchBuilder& builder, const std::string& pointer, const nlohmann::json& current,
                 const nlohmann::json& wanted) {
    auto keys = std::vector<std::string>{};
    for (const auto& [key, _] : current.items()) keys.push_back(key);
    for (const auto& [key, _] : wanted.items()) {
        if (!current.contains(key)) keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());

    for (const auto& key : keys) {
        auto path = pointer + format_pointer({key});
        auto have = current.find(key);
        auto want = wanted.find(key);
        if (have == current.end()) {
            builder.append(add_patch(path, *want));
        } else if (want == wanted.end()) {
            builder.append(remove_patch(path));
        } else if (*have != *want) {
            if (key == "frame" && have->is_object() && want->is_object()) {
                diff_fields(builder, path, *have, *want);
            } else {
                builder.append(replace_patch(path, *want));
            }
        }
    }
}

}  // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

auto diff_documents(const CanvasDocument& base, const CanvasDocument& other,
                    const DiffOptions& options) -> DiffResult {
    check_ceiling(base, options.max_nodes);
    check_ceiling(other, options.max_nodes);
    logger()->debug("diff_documents from={} to={}", base.id, other.id);

    auto result = DiffResult{};
    result.from_document_id = base.id;
    result.to_document_id = other.id;
    result.operations = DiffBuilder{base, other, options}.run();

    std::sort(result.operations.begin(), result.operations.end(), operation_less);
    if (options.max_operations > 0 && result.operations.size() > options.max_operations) {
        result.operations.resize(options.max_operations);
    }

    for (const auto& op : result.operations) {
        switch (op.type) {
            case DiffType::added:    ++result.summary.added; break;
            case DiffType::removed:  ++result.summary.removed; break;
            case DiffType::modified: ++result.summary.modified; break;
            case DiffType::moved:    ++result.summary.moved; break;
        }
    }
    result.summary.total = result.operations.size();
    logger()->debug("diff_documents from={} to={} operations={}", base.id, other.id,
                    result.summary.total);
    return result;
}

auto diff_to_patches(const CanvasDocument& base, const CanvasDocument& target)
    -> std::vector<Patch> {
    auto builder = PatchBuilder{base};

    // 1. Place artboards and nodes in target pre-order.
    for (std::size_t i = 0; i < target.artboards.size(); ++i) {
        const auto& artboard = target.artboards[i];
        auto desired = artboard_pointer(i);
        if (auto current = builder.index().find_artboard(artboard.id)) {
            if (*current != i) builder.emit(move_patch(artboard_pointer(*current), desired));
        } else {
            auto shallow = shallow_json(artboard);
            shallow["children"] = nlohmann::json::array();
            builder.emit(add_patch(desired, std::move(shallow)));
        }
    }
    for (std::size_t i = 0; i < target.artboards.size(); ++i) {
        place_children(builder, artboard_pointer(i), target.artboards[i].children);
    }

    // 2. Remove what the target no longer has.
    remove_leftovers(builder, target);

    // 3. Field-level edits; structure now matches the target.
    const auto& working = builder.working();
    auto document_fields = [](const CanvasDocument& d) {
        return nlohmann::json{{"schemaVersion", d.schema_version}, {"id", d.id}, {"name", d.name}};
    };
    diff_fields(builder, "", document_fields(working), document_fields(target));
    for (std::size_t i = 0; i < target.artboards.size(); ++i) {
        diff_fields(builder, artboard_pointer(i), shallow_json(working.artboards[i]),
                    shallow_json(target.artboards[i]));
    }
    const auto target_index = NodeIndex{target};
    for (const auto& entry : target_index.entries()) {
        const auto* current = node_at(working, entry.location);
        if (!current) {
            throw std::logic_error{"diff_to_patches: structure mismatch at " +
                                   entry.location.pointer()};
        }
        diff_fields(builder, entry.location.pointer(), shallow_json(*current),
                    shallow_json(*entry.node));
    }
    return builder.take();
}

}  // namespace canvas_merge
