#include <canvas-merge/document.hpp>

#include <array>
#include <utility>

namespace canvas_merge {

auto parse_node_type(std::string_view name) -> std::optional<NodeType> {
    static constexpr auto types = std::array{
        NodeType::frame, NodeType::group, NodeType::vector,
        NodeType::text, NodeType::image, NodeType::component,
    };
    for (auto type : types) {
        if (to_string_view(type) == name) return type;
    }
    return std::nullopt;
}

auto make_node(NodeType type, std::string id, std::string name, Rect frame) -> Node {
    auto node = Node{};
    node.id = std::move(id);
    node.name = std::move(name);
    node.frame = frame;
    switch (type) {
        case NodeType::frame:     node.content = FrameContent{}; break;
        case NodeType::group:     node.content = GroupContent{}; break;
        case NodeType::vector:    node.content = VectorContent{}; break;
        case NodeType::text:      node.content = TextContent{}; break;
        case NodeType::image:     node.content = ImageContent{}; break;
        case NodeType::component: node.content = ComponentContent{}; break;
    }
    return node;
}

auto make_text_node(std::string id, std::string name, std::string text, Rect frame) -> Node {
    auto node = make_node(NodeType::text, std::move(id), std::move(name), frame);
    std::get<TextContent>(node.content).text = std::move(text);
    return node;
}

}  // namespace canvas_merge
