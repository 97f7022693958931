#include <canvas-merge/merge.hpp>

#include <canvas-merge/json.hpp>
#include <canvas-merge/logging.hpp>
#include <canvas-merge/node_index.hpp>
#include <canvas-merge/patch.hpp>
#include <canvas-merge/validate.hpp>

#include "executor.hpp"
#include "identity.hpp"
#include "sequence.hpp"

#include <algorithm>
#include <exception>
#include <functional>
#include <initializer_list>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace canvas_merge {

namespace {

// =============================================================================
// Flat snapshots
// =============================================================================

// One artboard or node without its children. `parent` is an identity;
// artboards hang off the root, "".
struct Element {
    nlohmann::json fields;
    std::string parent;
    bool artboard{false};

    auto is_container() const -> bool {
        if (artboard) return true;
        auto type = fields.value("type", std::string{});
        return type == "frame" || type == "group";
    }
};

struct Snapshot {
    std::map<std::string, Element> elements;
    std::unordered_map<std::string, std::vector<std::string>> children;  // "" = artboards

    auto find(const std::string& id) const -> const Element* {
        auto it = elements.find(id);
        return it == elements.end() ? nullptr : &it->second;
    }

    auto children_of(const std::string& id) const -> const std::vector<std::string>& {
        static const auto none = std::vector<std::string>{};
        auto it = children.find(id);
        return it == children.end() ? none : it->second;
    }
};

using IdentityFn = std::function<std::string(const std::string&)>;

void add_nodes(Snapshot& snapshot, const IdentityFn& identity, const std::string& parent,
               const std::vector<Node>& nodes) {
    auto& order = snapshot.children[parent];
    for (const auto& node : nodes) {
        auto id = identity(node.id);
        order.push_back(id);
        snapshot.elements[id] = Element{shallow_json(node), parent, false};
        add_nodes(snapshot, identity, id, node.children);
    }
}

auto make_snapshot(const CanvasDocument& document, const IdentityFn& identity) -> Snapshot {
    auto snapshot = Snapshot{};
    auto& artboards = snapshot.children[""];
    for (const auto& artboard : document.artboards) {
        artboards.push_back(artboard.id);
        snapshot.elements[artboard.id] = Element{shallow_json(artboard), "", true};
        add_nodes(snapshot, identity, artboard.id, artboard.children);
    }
    return snapshot;
}

// =============================================================================
// Three-way field merge
// =============================================================================

using Value = std::optional<nlohmann::json>;

// The side that changed wins; when both changed differently the base
// value stays and the conflict is reported separately.
template <typename T>
auto pick(const T& base, const T& local, const T& remote) -> T {
    if (local == remote) return local;
    if (local == base) return remote;
    if (remote == base) return local;
    return base;
}

auto member(const nlohmann::json& object, const std::string& key) -> Value {
    if (!object.is_object()) return std::nullopt;
    auto it = object.find(key);
    if (it == object.end()) return std::nullopt;
    return *it;
}

auto union_keys(std::initializer_list<const nlohmann::json*> objects) -> std::set<std::string> {
    auto keys = std::set<std::string>{};
    for (const auto* object : objects) {
        if (!object->is_object()) continue;
        for (const auto& [key, _] : object->items()) keys.insert(key);
    }
    return keys;
}

// Frame and style merge per sub-key, everything else as a whole.
auto merge_fields(const nlohmann::json& base, const nlohmann::json& local,
                  const nlohmann::json& remote) -> nlohmann::json {
    auto result = nlohmann::json::object();
    for (const auto& key : union_keys({&base, &local, &remote})) {
        auto b = member(base, key);
        auto l = member(local, key);
        auto r = member(remote, key);
        if ((key == "frame" || key == "style") && (l || r)) {
            static const auto empty = nlohmann::json::object();
            auto whole = pick(b, l, r);
            auto merged = nlohmann::json::object();
            const auto& bo = b ? *b : empty;
            const auto& lo = l ? *l : empty;
            const auto& ro = r ? *r : empty;
            for (const auto& sub : union_keys({&bo, &lo, &ro})) {
                if (auto v = pick(member(bo, sub), member(lo, sub), member(ro, sub))) {
                    merged[sub] = std::move(*v);
                }
            }
            if (whole || !merged.empty()) result[key] = std::move(merged);
            continue;
        }
        if (auto v = pick(b, l, r)) result[key] = std::move(*v);
    }
    return result;
}

// =============================================================================
// Merger
// =============================================================================

class Merger {
public:
    Merger(const CanvasDocument& base, const CanvasDocument& local, const CanvasDocument& remote,
           const DiffResult& local_diff, const DiffResult& remote_diff,
           const std::vector<Conflict>& conflicts)
        : base_document_{base}, local_document_{local}, remote_document_{remote},
          identities_{local_diff, remote_diff},
          base_{make_snapshot(base, [](const std::string& id) { return id; })},
          local_{make_snapshot(local, [this](const std::string& id) { return identities_.local(id); })},
          remote_{make_snapshot(remote, [this](const std::string& id) { return identities_.remote(id); })},
          base_index_{base} {
        for (const auto& conflict : conflicts) {
            if (conflict.type == ConflictType::delete_vs_modify) kept_.insert(conflict.id);
            if (conflict.field == "semanticKey") base_keys_.insert(conflict.id);
        }
    }

    auto run() -> CanvasDocument {
        choose_elements();
        restore_base_keys();
        settle_parents();
        return rebuild();
    }

    // Conflicts found while placing nodes: parents restored for children
    // and moves undone to break cycles.
    auto placement_conflicts() const -> const std::vector<Conflict>& { return placement_conflicts_; }

private:
    void choose_elements() {
        auto ids = std::set<std::string>{};
        for (const auto* snapshot : {&base_, &local_, &remote_}) {
            for (const auto& [id, _] : snapshot->elements) ids.insert(id);
        }
        for (const auto& id : ids) {
            const auto* b = base_.find(id);
            const auto* l = local_.find(id);
            const auto* r = remote_.find(id);
            if (b && l && r) {
                auto element = *b;
                element.fields = merge_fields(b->fields, l->fields, r->fields);
                element.parent = pick(b->parent, l->parent, r->parent);
                merged_.emplace(id, std::move(element));
            } else if (b) {
                // Removed on at least one side. A removal the other side
                // did not touch wins; against a modification base stays.
                if ((l || r) && kept_.count(id)) merged_.emplace(id, *b);
            } else if (l) {
                merged_.emplace(id, *l);
            } else if (r) {
                merged_.emplace(id, *r);
            }
        }
    }

    // A contested semantic key stays as in base until a resolution applies.
    void restore_base_keys() {
        for (const auto& id : base_keys_) {
            auto it = merged_.find(id);
            if (it == merged_.end()) continue;
            const auto* before = base_.find(id);
            if (auto key = before ? member(before->fields, "semanticKey") : Value{}) {
                it->second.fields["semanticKey"] = std::move(*key);
            } else {
                it->second.fields.erase("semanticKey");
            }
        }
    }

    auto placement_of(const Snapshot& snapshot, const std::string& id) const -> Value {
        const auto* element = snapshot.find(id);
        if (!element) return std::nullopt;
        const auto& siblings = snapshot.children_of(element->parent);
        auto index = std::find(siblings.begin(), siblings.end(), id) - siblings.begin();
        return nlohmann::json{{"parentId", element->parent}, {"index", index}};
    }

    auto report(const std::string& id, ConflictType type) -> Conflict& {
        auto& conflict = placement_conflicts_.emplace_back();
        conflict.id = id;
        conflict.type = type;
        conflict.category = category_of(type);
        conflict.severity = severity_of(type);
        if (const auto* entry = base_index_.find(id)) {
            conflict.path = entry->location.pointer();
            conflict.semantic_key = entry->node->semantic_key;
        } else if (auto artboard = base_index_.find_artboard(id)) {
            conflict.path = artboard_pointer(*artboard);
        }
        return conflict;
    }

    auto label(const std::string& id) const -> std::string {
        const auto* element = base_.find(id);
        if (!element) return id;
        return "\"" + element->fields.value("name", id) + "\"";
    }

    void report_restored(const std::string& id) {
        if (kept_.count(id)) return;
        auto deleted_locally = local_.find(id) == nullptr;
        auto& conflict = report(id, ConflictType::delete_vs_modify);
        conflict.base_value = base_.find(id)->fields;
        auto& kept_side = deleted_locally ? conflict.remote_value : conflict.local_value;
        kept_side = nlohmann::json::object();
        conflict.message = label(id) + " was deleted on the " +
                           (deleted_locally ? "local" : "remote") +
                           " side and restored to hold merged children";
    }

    void report_cycle(const std::string& id) {
        auto& conflict = report(id, ConflictType::move_vs_move);
        conflict.base_value = placement_of(base_, id);
        conflict.local_value = placement_of(local_, id);
        conflict.remote_value = placement_of(remote_, id);
        conflict.message = "Moves on both sides would nest " + label(id) +
                           " inside itself; keeping its base parent";
    }

    auto valid_parent(const Element& element) const -> bool {
        if (element.artboard) return element.parent.empty();
        auto it = merged_.find(element.parent);
        return it != merged_.end() && it->second.is_container();
    }

    // Make every node hang off a present container, and break the cycles
    // that crossed moves can introduce.
    void settle_parents() {
        auto changed = true;
        while (changed) {
            changed = false;
            auto dropped = std::vector<std::string>{};
            auto resurrected = std::vector<std::string>{};
            for (auto& [id, element] : merged_) {
                if (valid_parent(element)) continue;
                const auto* before = base_.find(id);
                if (!merged_.count(element.parent) && base_.find(element.parent) &&
                    restored_.insert(element.parent).second) {
                    resurrected.push_back(element.parent);
                } else if (before && before->parent != element.parent) {
                    element.parent = before->parent;
                } else {
                    dropped.push_back(id);
                }
                changed = true;
            }
            for (const auto& id : resurrected) {
                logger()->warn("merge: restoring {} to hold merged children", id);
                report_restored(id);
                merged_.emplace(id, *base_.find(id));
            }
            for (const auto& id : dropped) {
                logger()->warn("merge: dropping {}, no valid parent remains", id);
                merged_.erase(id);
            }
            if (!changed) changed = break_cycles();
        }
    }

    auto break_cycles() -> bool {
        auto changed = false;
        auto settled = std::unordered_set<std::string>{};
        for (const auto& [start, _] : merged_) {
            auto path = std::vector<std::string>{};
            auto on_path = std::unordered_set<std::string>{};
            auto id = start;
            while (!settled.count(id) && !on_path.count(id)) {
                auto it = merged_.find(id);
                if (it == merged_.end() || it->second.artboard) break;
                path.push_back(id);
                on_path.insert(id);
                id = it->second.parent;
            }
            if (on_path.count(id)) {
                auto first = std::find(path.begin(), path.end(), id);
                for (auto it = first; it != path.end(); ++it) {
                    const auto* before = base_.find(*it);
                    auto& element = merged_.at(*it);
                    if (before && before->parent != element.parent) {
                        logger()->warn("merge: {} would form a cycle, keeping its base parent", *it);
                        report_cycle(*it);
                        element.parent = before->parent;
                        changed = true;
                    }
                }
                return changed;
            }
            settled.insert(path.begin(), path.end());
        }
        return changed;
    }

    // Ids of `container`'s children in `snapshot` that stay in `members`.
    static auto sequence(const Snapshot& snapshot, const std::string& container,
                         const std::unordered_set<std::string>& members)
        -> std::vector<std::string> {
        auto result = std::vector<std::string>{};
        for (const auto& id : snapshot.children_of(container)) {
            if (members.count(id)) result.push_back(id);
        }
        return result;
    }

    // Elements of `side` that changed position relative to `base`.
    static auto reordered(const std::vector<std::string>& base, const std::vector<std::string>& side)
        -> std::unordered_set<std::string> {
        auto position = std::unordered_map<std::string, std::size_t>{};
        for (std::size_t i = 0; i < base.size(); ++i) position.emplace(base[i], i);
        auto common = std::vector<std::string>{};
        auto positions = std::vector<std::size_t>{};
        for (const auto& id : side) {
            if (auto it = position.find(id); it != position.end()) {
                common.push_back(id);
                positions.push_back(it->second);
            }
        }
        auto kept = detail::longest_increasing_subsequence(positions);
        auto result = std::unordered_set<std::string>{};
        for (std::size_t i = 0; i < common.size(); ++i) {
            if (!kept[i]) result.insert(common[i]);
        }
        return result;
    }

    // Insert `id` right after its nearest predecessor in `order` that is
    // already placed, or at the front.
    static void insert_after_predecessor(std::vector<std::string>& list, const std::string& id,
                                         const std::vector<std::string>& order) {
        auto at = std::find(order.begin(), order.end(), id);
        auto position = list.begin();
        while (at != order.begin()) {
            --at;
            auto found = std::find(list.begin(), list.end(), *at);
            if (found != list.end()) {
                position = std::next(found);
                break;
            }
        }
        list.insert(position, id);
    }

    auto order(const std::string& container, const std::unordered_set<std::string>& members) const
        -> std::vector<std::string> {
        auto b = sequence(base_, container, members);
        auto l = sequence(local_, container, members);
        auto r = sequence(remote_, container, members);

        auto list = l;
        auto local_moved = reordered(b, l);
        auto remote_moved = reordered(b, r);
        for (const auto& id : r) {
            if (!remote_moved.count(id) || local_moved.count(id)) continue;
            auto it = std::find(list.begin(), list.end(), id);
            if (it == list.end()) continue;
            list.erase(it);
            insert_after_predecessor(list, id, r);
        }
        for (const auto* side : {&l, &r, &b}) {
            for (const auto& id : *side) {
                if (std::find(list.begin(), list.end(), id) == list.end()) {
                    insert_after_predecessor(list, id, *side);
                }
            }
        }
        // Members no snapshot lists under this container.
        auto rest = std::vector<std::string>{};
        for (const auto& id : members) {
            if (std::find(list.begin(), list.end(), id) == list.end()) rest.push_back(id);
        }
        std::sort(rest.begin(), rest.end());
        list.insert(list.end(), rest.begin(), rest.end());
        return list;
    }

    auto build_children(const std::string& container) const -> std::vector<Node> {
        auto nodes = std::vector<Node>{};
        auto it = members_.find(container);
        if (it == members_.end()) return nodes;
        for (const auto& id : order(container, it->second)) {
            auto node = merged_.at(id).fields.get<Node>();
            node.children = build_children(id);
            nodes.push_back(std::move(node));
        }
        return nodes;
    }

    auto rebuild() -> CanvasDocument {
        for (const auto& [id, element] : merged_) members_[element.parent].insert(id);

        auto fields = [](const CanvasDocument& d) {
            return nlohmann::json{{"schemaVersion", d.schema_version}, {"id", d.id},
                                  {"name", d.name}};
        };
        auto header = merge_fields(fields(base_document_), fields(local_document_),
                                   fields(remote_document_));
        auto document = CanvasDocument{};
        document.schema_version = header.value("schemaVersion", base_document_.schema_version);
        document.id = header.value("id", base_document_.id);
        document.name = header.value("name", base_document_.name);

        if (auto it = members_.find(""); it != members_.end()) {
            for (const auto& id : order("", it->second)) {
                auto artboard = merged_.at(id).fields.get<Artboard>();
                artboard.children = build_children(id);
                document.artboards.push_back(std::move(artboard));
            }
        }
        return document;
    }

    const CanvasDocument& base_document_;
    const CanvasDocument& local_document_;
    const CanvasDocument& remote_document_;
    detail::IdentityMap identities_;
    Snapshot base_;
    Snapshot local_;
    Snapshot remote_;
    NodeIndex base_index_;
    std::unordered_set<std::string> kept_;
    std::unordered_set<std::string> base_keys_;
    std::unordered_set<std::string> restored_;
    std::vector<Conflict> placement_conflicts_;
    std::map<std::string, Element> merged_;
    std::unordered_map<std::string, std::unordered_set<std::string>> members_;
};

auto failed(MergeResult result, const CanvasDocument& base, ErrorKind kind, std::string message)
    -> MergeResult {
    logger()->warn("merge_documents: {}", message);
    result.success = false;
    result.document = base;
    result.error = Error{kind, std::move(message)};
    return result;
}

}  // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

auto overall_confidence(const std::vector<MergeResolution>& resolutions) -> double {
    if (resolutions.empty()) return 1.0;
    auto total = 0.0;
    auto weight = 0.0;
    for (const auto& resolution : resolutions) {
        if (resolution.applied) {
            total += resolution.confidence;
            weight += 1.0;
        } else {
            total += resolution.confidence * 0.5;
            weight += 2.0;
        }
    }
    return std::clamp(total / weight, 0.0, 1.0);
}

auto merge_documents(const CanvasDocument& base, const CanvasDocument& local,
                     const CanvasDocument& remote, const MergeConfig& config) -> MergeResult {
    auto result = MergeResult{};

    for (const auto* document : {&base, &local, &remote}) {
        auto count = count_nodes(*document);
        if (count > config.max_nodes) {
            return failed(std::move(result), base, ErrorKind::limit_exceeded,
                          "document " + document->id + " has " + std::to_string(count) +
                              " nodes, above the limit of " + std::to_string(config.max_nodes));
        }
    }
    logger()->debug("merge_documents base={} local={} remote={}", base.id, local.id, remote.id);

    auto diff_options = DiffOptions{};
    diff_options.max_nodes = config.max_nodes;
    auto local_error = std::exception_ptr{};
    auto remote_error = std::exception_ptr{};
    auto taskflow = tf::Taskflow{};
    taskflow.emplace(
        [&] {
            try {
                result.local_diff = diff_documents(base, local, diff_options);
            } catch (...) {
                local_error = std::current_exception();
            }
        },
        [&] {
            try {
                result.remote_diff = diff_documents(base, remote, diff_options);
            } catch (...) {
                remote_error = std::current_exception();
            }
        });
    detail::global_executor().run(taskflow).wait();
    if (local_error) std::rethrow_exception(local_error);
    if (remote_error) std::rethrow_exception(remote_error);

    result.conflicts = detect_conflicts(result.local_diff, result.remote_diff);

    try {
        auto merger = Merger{base, local, remote, result.local_diff, result.remote_diff,
                             result.conflicts};
        result.document = merger.run();
        const auto& placement = merger.placement_conflicts();
        result.conflicts.insert(result.conflicts.end(), placement.begin(), placement.end());
        std::sort(result.conflicts.begin(), result.conflicts.end(), conflict_less);
    } catch (const std::exception& e) {
        return failed(std::move(result), base, ErrorKind::validation_failure,
                      std::string{"merged element could not be decoded: "} + e.what());
    }
    result.resolutions = resolve_merge_conflicts(result.conflicts, config);

    auto patch_options = PatchOptions{};
    patch_options.validate = false;
    for (auto& resolution : result.resolutions) {
        if (resolution.applied) {
            auto patches = resolution_patches(result.document, resolution);
            auto batch = patches ? apply_patches(result.document, *patches, patch_options)
                                 : BatchResult{};
            if (patches && batch) {
                result.document = std::move(batch.document);
            } else {
                logger()->warn("merge_documents: could not apply {} for {} conflict on {}: {}",
                               to_string_view(resolution.strategy),
                               to_string_view(resolution.conflict.type), resolution.conflict.id,
                               patches ? batch.error->message : "target not found");
                resolution.applied = false;
                resolution.requires_review = true;
                resolution.explanation += "; the resolved value could not be applied";
            }
        }
        if (!resolution.applied) result.unresolved.push_back(resolution);
    }

    result.confidence = overall_confidence(result.resolutions);
    result.needs_manual_review = !result.unresolved.empty();

    if (auto validation = validate(result.document); !validation) {
        auto message = std::string{"merged document failed validation"};
        if (!validation.errors.empty()) {
            message += ": " + validation.errors.front().instance_path + " " +
                       validation.errors.front().message;
        }
        return failed(std::move(result), base, ErrorKind::validation_failure, std::move(message));
    }
    if (config.fail_on_unresolved && !result.unresolved.empty()) {
        return failed(std::move(result), base, ErrorKind::conflict_unresolved,
                      std::to_string(result.unresolved.size()) + " conflicts need manual review");
    }

    logger()->info("merge_documents base={} conflicts={} applied={} unresolved={} confidence={:.2f}",
                   base.id, result.conflicts.size(),
                   result.resolutions.size() - result.unresolved.size(), result.unresolved.size(),
                   result.confidence);
    return result;
}

}  // namespace canvas_merge
