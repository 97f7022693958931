/// @file node_index.hpp
/// @brief NodeIndex: O(1) identity-to-location lookup for a document.

#pragma once

#include <canvas-merge/document.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace canvas_merge {

/// The location of a node: its artboard and the chain of child-array
/// indices leading to it from that artboard.
struct NodeLocation {
    std::size_t artboard{0};
    std::vector<std::size_t> path;

    /// The RFC 6901 pointer, e.g. "/artboards/0/children/2/children/1".
    auto pointer() const -> std::string;

    /// The location of the containing node, or nullopt for top-level nodes.
    auto parent() const -> std::optional<NodeLocation>;

    auto operator==(const NodeLocation&) const -> bool = default;
};

/// The pointer of an artboard, e.g. "/artboards/1".
auto artboard_pointer(std::size_t artboard) -> std::string;

/// Index record for one node.
struct NodeIndexEntry {
    const Node* node{nullptr};  ///< Points into the indexed document.
    NodeLocation location;
    std::string parent_id;      ///< Container node id, or the artboard id for top-level nodes.
    std::size_t depth{0};       ///< 0 for direct children of an artboard.

    /// Index of this node in its parent's children array.
    auto index() const -> std::size_t { return location.path.back(); }
};

/// A derived lookup structure over one document snapshot.
///
/// Built in a single pre-order pass. Entries hold pointers into the
/// document, so the index must not outlive it and must be rebuilt after
/// any structural change. It is never serialized.
///
/// @code
/// auto index = NodeIndex{doc};
/// if (const auto* entry = index.find(id)) {
///     std::printf("%s at %s\n", entry->node->name.c_str(),
///                 entry->location.pointer().c_str());
/// }
/// @endcode
class NodeIndex {
public:
    explicit NodeIndex(const CanvasDocument& document);
    NodeIndex(CanvasDocument&&) = delete;

    /// Find a node by id, or nullptr.
    auto find(std::string_view id) const -> const NodeIndexEntry*;

    /// Find a node by semantic key, or nullptr.
    auto find_by_semantic_key(std::string_view key) const -> const NodeIndexEntry*;

    /// Find an artboard index by artboard id.
    auto find_artboard(std::string_view id) const -> std::optional<std::size_t>;

    /// Ids of the children of a container (artboard id or node id), in
    /// order. Empty for unknown ids and leaves.
    auto children_of(std::string_view parent_id) const -> std::vector<std::string>;

    /// All entries in document pre-order.
    auto entries() const -> const std::vector<NodeIndexEntry>& { return entries_; }

    /// Number of indexed nodes (artboards excluded).
    auto size() const noexcept -> std::size_t { return entries_.size(); }

    auto document() const -> const CanvasDocument& { return *document_; }

private:
    void index_children(const std::vector<Node>& children, const std::string& parent_id,
                        const NodeLocation& parent_location, std::size_t depth);

    const CanvasDocument* document_;
    std::vector<NodeIndexEntry> entries_;
    std::unordered_map<std::string, std::size_t> by_id_;
    std::unordered_map<std::string, std::size_t> by_semantic_key_;
    std::unordered_map<std::string, std::size_t> artboards_;
};

/// Build the index for a document.
auto build_index(const CanvasDocument& document) -> NodeIndex;

/// Find a node by id without keeping an index around.
/// Not finding the node is a normal outcome, reported as nullopt.
auto find_node_by_id(const CanvasDocument& document, std::string_view id)
    -> std::optional<NodeIndexEntry>;

/// Resolve a location to its node, or nullptr if it is out of range.
auto node_at(const CanvasDocument& document, const NodeLocation& location) -> const Node*;

/// Mutable variant of node_at().
auto node_at(CanvasDocument& document, const NodeLocation& location) -> Node*;

// -- Traversal ----------------------------------------------------------------

/// Ids of the ancestors of a node, nearest first, ending with its artboard.
auto ancestors(const NodeIndex& index, std::string_view id) -> std::vector<std::string>;

/// Ids of all descendants of a node (or artboard) in pre-order.
auto descendants(const NodeIndex& index, std::string_view id) -> std::vector<std::string>;

/// Total number of nodes in the document (artboards excluded).
auto count_nodes(const CanvasDocument& document) -> std::size_t;

}  // namespace canvas_merge
