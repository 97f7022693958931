#include <canvas-merge/conflict.hpp>

#include <canvas-merge/logging.hpp>
#include <canvas-merge/pointer.hpp>

#include "identity.hpp"

#include <algorithm>
#include <array>
#include <initializer_list>
#include <map>
#include <string>
#include <utility>

namespace canvas_merge {

auto parse_conflict_type(std::string_view name) -> std::optional<ConflictType> {
    static constexpr auto all = std::array{
        ConflictType::delete_vs_modify, ConflictType::add_vs_add, ConflictType::move_vs_move,
        ConflictType::order,            ConflictType::geometry,   ConflictType::visibility,
        ConflictType::layout,           ConflictType::style,      ConflictType::text,
        ConflictType::component_props,  ConflictType::content,    ConflictType::name,
        ConflictType::metadata,
    };
    for (auto type : all) {
        if (to_string_view(type) == name) return type;
    }
    return std::nullopt;
}

auto category_of(ConflictType type) noexcept -> ConflictCategory {
    switch (type) {
        case ConflictType::delete_vs_modify:
        case ConflictType::add_vs_add:
        case ConflictType::move_vs_move:
        case ConflictType::order:
            return ConflictCategory::structural;
        case ConflictType::geometry:
        case ConflictType::visibility:
        case ConflictType::layout:
        case ConflictType::style:
        case ConflictType::name:
            return ConflictCategory::property;
        case ConflictType::text:
        case ConflictType::component_props:
        case ConflictType::content:
            return ConflictCategory::content;
        case ConflictType::metadata:
            return ConflictCategory::metadata;
    }
    return ConflictCategory::content;
}

auto severity_of(ConflictType type) noexcept -> ConflictSeverity {
    switch (category_of(type)) {
        case ConflictCategory::structural:
            return type == ConflictType::order ? ConflictSeverity::info : ConflictSeverity::error;
        case ConflictCategory::metadata:
            return ConflictSeverity::info;
        default:
            return ConflictSeverity::warning;
    }
}

auto conflict_type_for_field(std::string_view field) -> ConflictType {
    auto starts_with = [&](std::string_view prefix) {
        return field == prefix || field.substr(0, prefix.size() + 1) == std::string{prefix} + ".";
    };
    if (field == "name") return ConflictType::name;
    if (field == "visible") return ConflictType::visibility;
    if (starts_with("frame")) return ConflictType::geometry;
    if (starts_with("style")) return ConflictType::style;
    if (field == "text" || field == "textStyle") return ConflictType::text;
    if (field == "layout") return ConflictType::layout;
    if (field == "props") return ConflictType::component_props;
    if (field == "semanticKey" || field == "data" || field == "id") return ConflictType::metadata;
    return ConflictType::content;
}

namespace {

// Every change one side made to one element.
struct Changes {
    const DiffOperation* added{nullptr};
    const DiffOperation* removed{nullptr};
    const DiffOperation* moved{nullptr};
    std::map<std::string, const DiffOperation*> fields;
    std::string path;
    std::optional<std::string> semantic_key;

    auto modified() const -> bool { return moved || !fields.empty(); }
};

using ChangeSet = std::map<std::string, Changes>;

template <typename Identity>
auto group(const DiffResult& diff, Identity identity) -> ChangeSet {
    auto result = ChangeSet{};
    for (const auto& op : diff.operations) {
        auto& changes = result[identity(op.node_id)];
        if (changes.path.empty()) changes.path = op.path;
        if (!changes.semantic_key) changes.semantic_key = op.semantic_key;
        switch (op.type) {
            case DiffType::added:    changes.added = &op; break;
            case DiffType::removed:  changes.removed = &op; break;
            case DiffType::moved:    changes.moved = &op; break;
            case DiffType::modified: changes.fields.emplace(op.field, &op); break;
        }
    }
    return result;
}

auto node_label(const DiffOperation& op) -> std::string {
    for (const auto* value : {&op.old_value, &op.new_value}) {
        if (*value && (*value)->is_object()) {
            if (auto it = (*value)->find("name"); it != (*value)->end() && it->is_string()) {
                return "\"" + it->get<std::string>() + "\"";
            }
        }
    }
    return op.node_id;
}

auto describe(const std::optional<nlohmann::json>& value) -> std::string {
    return value ? value->dump() : "none";
}

// The modifying side of a delete-vs-modify conflict: each changed field
// with its new value (null for removed fields), plus the new placement.
auto modification_json(const Changes& changes) -> nlohmann::json {
    auto result = nlohmann::json::object();
    for (const auto& [field, op] : changes.fields) {
        result[field] = op->new_value ? *op->new_value : nlohmann::json(nullptr);
    }
    if (changes.moved && changes.moved->new_value) {
        result["parentId"] = changes.moved->new_value->value("parentId", "");
        result["index"] = changes.moved->new_value->value("index", 0);
    }
    return result;
}

auto without_id(nlohmann::json value) -> nlohmann::json {
    if (value.is_object()) value.erase("id");
    return value;
}

class Detector {
public:
    Detector(const DiffResult& local, const DiffResult& remote)
        : identities_{local, remote},
          local_{group(local, [this](const std::string& id) { return identities_.local(id); })},
          remote_{group(remote, [this](const std::string& id) { return identities_.remote(id); })} {}

    auto run() -> std::vector<Conflict> {
        for (const auto& [id, local] : local_) {
            auto it = remote_.find(id);
            if (it == remote_.end()) continue;
            compare(id, local, it->second);
        }
        placed_into_removed(local_, remote_, true);
        placed_into_removed(remote_, local_, false);
        key_collisions();
        return std::move(conflicts_);
    }

private:
    auto reported(const std::string& id, ConflictType type, std::string_view field = {}) const
        -> bool {
        return std::any_of(conflicts_.begin(), conflicts_.end(), [&](const Conflict& c) {
            return c.id == id && c.type == type && c.field == field;
        });
    }

    // One side added or moved nodes into a parent the other side removed.
    void placed_into_removed(const ChangeSet& placing, const ChangeSet& removing,
                             bool placed_locally) {
        auto placed = std::map<std::string, std::vector<const DiffOperation*>>{};
        for (const auto& [id, changes] : placing) {
            for (const auto* op : {changes.added, changes.moved}) {
                if (!op || !op->parent_id || op->parent_id->empty()) continue;
                auto parent = placed_locally ? identities_.local(*op->parent_id)
                                             : identities_.remote(*op->parent_id);
                placed[parent].push_back(op);
            }
        }
        for (const auto& [parent, ops] : placed) {
            auto it = removing.find(parent);
            if (it == removing.end() || !it->second.removed) continue;
            if (reported(parent, ConflictType::delete_vs_modify)) continue;
            const auto& deleter = it->second;
            auto& conflict = emit(parent, ConflictType::delete_vs_modify, deleter);
            conflict.base_value = deleter.removed->old_value;
            auto own = placing.find(parent);
            auto modification = own != placing.end() ? modification_json(own->second)
                                                     : nlohmann::json::object();
            if (placed_locally) {
                conflict.local_value = std::move(modification);
            } else {
                conflict.remote_value = std::move(modification);
            }
            auto count = ops.size();
            conflict.message = node_label(*deleter.removed) + " was deleted on the " +
                               (placed_locally ? "remote" : "local") + " side while the " +
                               (placed_locally ? "local" : "remote") + " side placed " +
                               std::to_string(count) + (count == 1 ? " node" : " nodes") +
                               " in it";
        }
    }

    // Semantic keys each side gave to an element that did not carry them.
    static auto key_claims(const ChangeSet& changes)
        -> std::map<std::string, std::vector<std::string>> {
        auto claims = std::map<std::string, std::vector<std::string>>{};
        for (const auto& [id, c] : changes) {
            if (c.removed) continue;
            auto key = std::optional<std::string>{};
            if (c.added) {
                key = c.added->semantic_key;
            } else if (auto it = c.fields.find("semanticKey"); it != c.fields.end()) {
                const auto& value = it->second->new_value;
                if (value && value->is_string()) key = value->get<std::string>();
            }
            if (key) claims[*key].push_back(id);
        }
        return claims;
    }

    // The same semantic key given to different elements on each side.
    void key_collisions() {
        auto remote_claims = key_claims(remote_);
        for (const auto& [key, local_ids] : key_claims(local_)) {
            auto it = remote_claims.find(key);
            if (it == remote_claims.end()) continue;
            const auto& remote_ids = it->second;
            for (const auto& id : local_ids) {
                auto other = std::find_if(remote_ids.begin(), remote_ids.end(),
                                          [&](const std::string& r) { return r != id; });
                if (other == remote_ids.end()) continue;
                if (reported(id, ConflictType::metadata, "semanticKey")) continue;

                const auto& local = local_.at(id);
                auto base = std::optional<nlohmann::json>{};
                if (auto field = local.fields.find("semanticKey"); field != local.fields.end()) {
                    base = field->second->old_value;
                }
                auto remote_value = base;
                if (auto theirs = remote_.find(id); theirs != remote_.end()) {
                    if (theirs->second.added) {
                        remote_value = std::nullopt;
                    } else if (auto field = theirs->second.fields.find("semanticKey");
                               field != theirs->second.fields.end()) {
                        remote_value = field->second->new_value;
                    }
                }

                auto& conflict = emit(id, ConflictType::metadata, local);
                conflict.field = "semanticKey";
                conflict.semantic_key = base && base->is_string()
                                            ? std::optional<std::string>{base->get<std::string>()}
                                            : std::nullopt;
                conflict.base_value = base;
                conflict.local_value = nlohmann::json(key);
                conflict.remote_value = remote_value;
                conflict.message = "Both sides gave semantic key \"" + key +
                                   "\" to different nodes: local " + id + ", remote " + *other;
            }
        }
    }

    void compare(const std::string& id, const Changes& local, const Changes& remote) {
        if (local.removed || remote.removed) {
            if (local.removed && remote.removed) return;
            if (local.removed && remote.modified()) {
                delete_vs_modify(id, local, remote, true);
            } else if (remote.removed && local.modified()) {
                delete_vs_modify(id, local, remote, false);
            }
            return;
        }
        if (local.added && remote.added) {
            added_twice(id, local, remote);
            return;
        }
        if (local.moved && remote.moved) moved_twice(id, local, remote);
        for (const auto& [field, local_op] : local.fields) {
            auto it = remote.fields.find(field);
            if (it == remote.fields.end()) continue;
            const auto* remote_op = it->second;
            if (local_op->new_value == remote_op->new_value) continue;
            auto type = conflict_type_for_field(field);
            auto& conflict = emit(id, type, local);
            conflict.field = field;
            conflict.base_value = local_op->old_value;
            conflict.local_value = local_op->new_value;
            conflict.remote_value = remote_op->new_value;
            conflict.message = "Both sides changed " + field + " of " + node_label(*local_op) +
                               ": local " + describe(local_op->new_value) + ", remote " +
                               describe(remote_op->new_value);
        }
    }

    void delete_vs_modify(const std::string& id, const Changes& local, const Changes& remote,
                          bool deleted_locally) {
        const auto& deleter = deleted_locally ? local : remote;
        const auto& modifier = deleted_locally ? remote : local;
        auto& conflict = emit(id, ConflictType::delete_vs_modify, deleted_locally ? remote : local);
        conflict.base_value = deleter.removed->old_value;
        if (deleted_locally) {
            conflict.remote_value = modification_json(modifier);
        } else {
            conflict.local_value = modification_json(modifier);
        }
        conflict.message = node_label(*deleter.removed) + " was deleted on the " +
                           (deleted_locally ? "local" : "remote") + " side and modified on the " +
                           (deleted_locally ? "remote" : "local") + " side";
    }

    void added_twice(const std::string& id, const Changes& local, const Changes& remote) {
        const auto& l = *local.added;
        const auto& r = *remote.added;
        auto same_parent = identities_.local(l.parent_id.value_or("")) ==
                           identities_.remote(r.parent_id.value_or(""));
        if (same_parent && without_id(l.new_value.value_or(nullptr)) ==
                               without_id(r.new_value.value_or(nullptr))) {
            return;
        }
        auto placed = [](const DiffOperation& op) {
            return nlohmann::json{{"node", op.new_value.value_or(nullptr)},
                                  {"parentId", op.parent_id.value_or("")},
                                  {"index", op.index.value_or(0)}};
        };
        auto& conflict = emit(id, ConflictType::add_vs_add, local);
        conflict.local_value = placed(l);
        conflict.remote_value = placed(r);
        conflict.message = "Both sides added " + node_label(l) + " with different content";
    }

    void moved_twice(const std::string& id, const Changes& local, const Changes& remote) {
        const auto& l = *local.moved;
        const auto& r = *remote.moved;
        auto local_parent = identities_.local(l.parent_id.value_or(""));
        auto remote_parent = identities_.remote(r.parent_id.value_or(""));
        auto type = ConflictType::move_vs_move;
        if (local_parent == remote_parent) {
            if (l.index == r.index) return;
            type = ConflictType::order;
        }
        auto& conflict = emit(id, type, local);
        conflict.base_value = l.old_value;
        conflict.local_value = l.new_value;
        conflict.remote_value = r.new_value;
        conflict.message = type == ConflictType::order
                               ? "Both sides reordered " + node_label(l) + " to different positions"
                               : "Both sides moved " + node_label(l) + " to different parents";
    }

    auto emit(const std::string& id, ConflictType type, const Changes& at) -> Conflict& {
        auto& conflict = conflicts_.emplace_back();
        conflict.id = id;
        conflict.type = type;
        conflict.category = category_of(type);
        conflict.severity = severity_of(type);
        conflict.path = at.path;
        conflict.semantic_key = at.semantic_key;
        return conflict;
    }

    detail::IdentityMap identities_;
    ChangeSet local_;
    ChangeSet remote_;
    std::vector<Conflict> conflicts_;
};

}  // anonymous namespace

auto conflict_less(const Conflict& a, const Conflict& b) -> bool {
    if (a.path != b.path) return pointer_less(a.path, b.path);
    if (a.type != b.type) return a.type < b.type;
    if (a.id != b.id) return a.id < b.id;
    return a.field < b.field;
}

auto detect_conflicts(const DiffResult& local, const DiffResult& remote)
    -> std::vector<Conflict> {
    auto conflicts = Detector{local, remote}.run();
    std::sort(conflicts.begin(), conflicts.end(), conflict_less);
    logger()->debug("detect_conflicts local={} remote={} conflicts={}",
                    local.operations.size(), remote.operations.size(), conflicts.size());
    return conflicts;
}

}  // namespace canvas_merge
