#include <canvas-merge/node_index.hpp>

#include <string>

namespace canvas_merge {

auto artboard_pointer(std::size_t artboard) -> std::string {
    return "/artboards/" + std::to_string(artboard);
}

auto NodeLocation::pointer() const -> std::string {
    auto result = artboard_pointer(artboard);
    for (auto i : path) {
        result += "/children/";
        result += std::to_string(i);
    }
    return result;
}

auto NodeLocation::parent() const -> std::optional<NodeLocation> {
    if (path.size() < 2) return std::nullopt;
    auto result = *this;
    result.path.pop_back();
    return result;
}

// -- NodeIndex ----------------------------------------------------------------

NodeIndex::NodeIndex(const CanvasDocument& document) : document_{&document} {
    for (std::size_t a = 0; a < document.artboards.size(); ++a) {
        const auto& artboard = document.artboards[a];
        artboards_.emplace(artboard.id, a);
        index_children(artboard.children, artboard.id, NodeLocation{a, {}}, 0);
    }
}

void NodeIndex::index_children(const std::vector<Node>& children, const std::string& parent_id,
                               const NodeLocation& parent_location, std::size_t depth) {
    for (std::size_t i = 0; i < children.size(); ++i) {
        const auto& node = children[i];
        auto location = parent_location;
        location.path.push_back(i);

        auto slot = entries_.size();
        entries_.push_back(NodeIndexEntry{&node, location, parent_id, depth});
        // First occurrence wins; duplicates are a validation error, not ours.
        by_id_.emplace(node.id, slot);
        if (node.semantic_key) by_semantic_key_.emplace(*node.semantic_key, slot);

        index_children(node.children, node.id, location, depth + 1);
    }
}

auto NodeIndex::find(std::string_view id) const -> const NodeIndexEntry* {
    auto it = by_id_.find(std::string{id});
    if (it == by_id_.end()) return nullptr;
    return &entries_[it->second];
}

auto NodeIndex::find_by_semantic_key(std::string_view key) const -> const NodeIndexEntry* {
    auto it = by_semantic_key_.find(std::string{key});
    if (it == by_semantic_key_.end()) return nullptr;
    return &entries_[it->second];
}

auto NodeIndex::find_artboard(std::string_view id) const -> std::optional<std::size_t> {
    auto it = artboards_.find(std::string{id});
    if (it == artboards_.end()) return std::nullopt;
    return it->second;
}

auto NodeIndex::children_of(std::string_view parent_id) const -> std::vector<std::string> {
    const std::vector<Node>* children = nullptr;
    if (auto artboard = find_artboard(parent_id)) {
        children = &document_->artboards[*artboard].children;
    } else if (const auto* entry = find(parent_id)) {
        children = &entry->node->children;
    }

    auto ids = std::vector<std::string>{};
    if (!children) return ids;
    ids.reserve(children->size());
    for (const auto& child : *children) ids.push_back(child.id);
    return ids;
}

// -- Free functions -----------------------------------------------------------

auto build_index(const CanvasDocument& document) -> NodeIndex {
    return NodeIndex{document};
}

auto find_node_by_id(const CanvasDocument& document, std::string_view id)
    -> std::optional<NodeIndexEntry> {
    auto index = NodeIndex{document};
    if (const auto* entry = index.find(id)) return *entry;
    return std::nullopt;
}

auto node_at(const CanvasDocument& document, const NodeLocation& location) -> const Node* {
    if (location.artboard >= document.artboards.size() || location.path.empty()) return nullptr;
    const auto* children = &document.artboards[location.artboard].children;
    const Node* node = nullptr;
    for (auto i : location.path) {
        if (i >= children->size()) return nullptr;
        node = &(*children)[i];
        children = &node->children;
    }
    return node;
}

auto node_at(CanvasDocument& document, const NodeLocation& location) -> Node* {
    const auto& const_document = document;
    return const_cast<Node*>(node_at(const_document, location));
}

auto ancestors(const NodeIndex& index, std::string_view id) -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    const auto* entry = index.find(id);
    while (entry) {
        result.push_back(entry->parent_id);
        entry = index.find(entry->parent_id);
    }
    return result;
}

namespace {

void collect_descendants(const std::vector<Node>& children, std::vector<std::string>& out) {
    for (const auto& child : children) {
        out.push_back(child.id);
        collect_descendants(child.children, out);
    }
}

auto count_subtree(const std::vector<Node>& children) -> std::size_t {
    auto count = children.size();
    for (const auto& child : children) count += count_subtree(child.children);
    return count;
}

}  // anonymous namespace

auto descendants(const NodeIndex& index, std::string_view id) -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    if (auto artboard = index.find_artboard(id)) {
        collect_descendants(index.document().artboards[*artboard].children, result);
    } else if (const auto* entry = index.find(id)) {
        collect_descendants(entry->node->children, result);
    }
    return result;
}

auto count_nodes(const CanvasDocument& document) -> std::size_t {
    auto count = std::size_t{0};
    for (const auto& artboard : document.artboards) count += count_subtree(artboard.children);
    return count;
}

}  // namespace canvas_merge
