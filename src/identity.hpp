#pragma once

// Maps element ids seen in two diffs onto one shared identity.
//
// Internal header, not installed.

#include <canvas-merge/diff.hpp>

#include <string>
#include <unordered_map>

namespace canvas_merge::detail {

/// Identity of elements across a local and a remote diff of the same base.
///
/// A recreated node (one carrying `previous_id`) maps to its base id. A
/// node added on the remote side whose semantic key matches a node added
/// on the local side under another id maps to the local id. Every other
/// id maps to itself.
class IdentityMap {
public:
    IdentityMap(const DiffResult& local, const DiffResult& remote) {
        auto local_added = std::unordered_map<std::string, std::string>{};  // key -> id
        for (const auto& op : local.operations) {
            if (op.previous_id) local_.emplace(op.node_id, *op.previous_id);
            if (op.type == DiffType::added && op.semantic_key) {
                local_added.emplace(*op.semantic_key, op.node_id);
            }
        }
        for (const auto& op : remote.operations) {
            if (op.previous_id) {
                remote_.emplace(op.node_id, *op.previous_id);
                continue;
            }
            if (op.type != DiffType::added || !op.semantic_key) continue;
            auto it = local_added.find(*op.semantic_key);
            if (it != local_added.end() && it->second != op.node_id) {
                remote_.emplace(op.node_id, it->second);
            }
        }
    }

    auto local(const std::string& id) const -> const std::string& { return lookup(local_, id); }
    auto remote(const std::string& id) const -> const std::string& { return lookup(remote_, id); }

private:
    static auto lookup(const std::unordered_map<std::string, std::string>& map,
                       const std::string& id) -> const std::string& {
        auto it = map.find(id);
        return it == map.end() ? id : it->second;
    }

    std::unordered_map<std::string, std::string> local_;
    std::unordered_map<std::string, std::string> remote_;
};

}  // namespace canvas_merge::detail
