/// @file document.hpp
/// @brief The canvas document model: CanvasDocument, Artboard, Node.

#pragma once

#include <canvas-merge/value.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace canvas_merge {

/// The schema version written by this library.
inline constexpr std::string_view current_schema_version = "0.1.0";

/// An axis-aligned rectangle. Width and height are never negative in a
/// valid document.
struct Rect {
    double x{0.0};
    double y{0.0};
    double width{0.0};
    double height{0.0};

    auto operator==(const Rect&) const -> bool = default;
};

/// Typography for text nodes. Every member is optional.
struct TextStyle {
    std::optional<std::string> family;
    std::optional<double> size;
    std::optional<double> line_height;
    std::optional<std::string> weight;
    std::optional<double> letter_spacing;
    std::optional<std::string> color;

    auto operator==(const TextStyle&) const -> bool = default;
};

/// Visual styling shared by every node type.
struct Style {
    std::optional<PaintList> fills;
    std::optional<PaintList> strokes;
    std::optional<double> radius;
    std::optional<double> opacity;       ///< 0..1 when present.
    std::optional<PropertyMap> shadow;

    auto operator==(const Style&) const -> bool = default;
};

/// The six node variants.
enum class NodeType : std::uint8_t {
    frame,      ///< Container with optional layout.
    group,      ///< Logical container.
    vector,     ///< SVG path geometry.
    text,       ///< Text run.
    image,      ///< Bitmap or vector image reference.
    component,  ///< Instance of a registered component.
};

/// Convert a NodeType to its wire name.
constexpr auto to_string_view(NodeType type) noexcept -> std::string_view {
    switch (type) {
        case NodeType::frame:     return "frame";
        case NodeType::group:     return "group";
        case NodeType::vector:    return "vector";
        case NodeType::text:      return "text";
        case NodeType::image:     return "image";
        case NodeType::component: return "component";
    }
    return "unknown";
}

/// Parse a wire name into a NodeType.
auto parse_node_type(std::string_view name) -> std::optional<NodeType>;

enum class WindingRule : std::uint8_t { nonzero, evenodd };

constexpr auto to_string_view(WindingRule rule) noexcept -> std::string_view {
    switch (rule) {
        case WindingRule::nonzero: return "nonzero";
        case WindingRule::evenodd: return "evenodd";
    }
    return "unknown";
}

enum class ImageMode : std::uint8_t { cover, contain, fill, none };

constexpr auto to_string_view(ImageMode mode) noexcept -> std::string_view {
    switch (mode) {
        case ImageMode::cover:   return "cover";
        case ImageMode::contain: return "contain";
        case ImageMode::fill:    return "fill";
        case ImageMode::none:    return "none";
    }
    return "unknown";
}

// -- Variant payloads ---------------------------------------------------------

struct FrameContent {
    std::optional<PropertyMap> layout;
    auto operator==(const FrameContent&) const -> bool = default;
};

struct GroupContent {
    auto operator==(const GroupContent&) const -> bool = default;
};

struct VectorContent {
    std::string path;
    WindingRule winding_rule{WindingRule::nonzero};
    auto operator==(const VectorContent&) const -> bool = default;
};

struct TextContent {
    std::string text;
    std::optional<TextStyle> text_style;
    auto operator==(const TextContent&) const -> bool = default;
};

struct ImageContent {
    std::string src;
    ImageMode mode{ImageMode::cover};
    auto operator==(const ImageContent&) const -> bool = default;
};

struct ComponentContent {
    std::string component_key;
    PropertyMap props;
    auto operator==(const ComponentContent&) const -> bool = default;
};

/// Type-specific node fields. The alternative order matches NodeType.
using NodeContent = std::variant<
    FrameContent,
    GroupContent,
    VectorContent,
    TextContent,
    ImageContent,
    ComponentContent
>;

/// A node in the document tree.
///
/// Every node carries the shared base fields; the closed `content` variant
/// carries the type-specific ones. Only frame and group nodes may have
/// children.
struct Node {
    std::string id;                           ///< ULID, unique per document.
    std::string name;
    bool visible{true};
    Rect frame;
    std::optional<Style> style;
    std::optional<std::string> semantic_key;  ///< Stable role, e.g. "hero.title".
    std::optional<PropertyMap> data;
    NodeContent content;
    std::vector<Node> children;

    /// The variant tag of this node.
    auto type() const noexcept -> NodeType {
        return static_cast<NodeType>(content.index());
    }

    /// True for frame and group nodes.
    auto is_container() const noexcept -> bool {
        return type() == NodeType::frame || type() == NodeType::group;
    }

    auto operator==(const Node&) const -> bool = default;
};

/// A canvas page with its own viewport.
struct Artboard {
    std::string id;
    std::string name;
    Rect frame;
    std::vector<Node> children;

    auto operator==(const Artboard&) const -> bool = default;
};

/// A complete design document.
///
/// Documents are plain values: every engine operation takes snapshots by
/// const reference and returns new documents.
struct CanvasDocument {
    std::string schema_version{current_schema_version};
    std::string id;
    std::string name;
    std::vector<Artboard> artboards;

    auto operator==(const CanvasDocument&) const -> bool = default;
};

// -- Construction helpers -----------------------------------------------------

/// Create a node of the given type with default content.
auto make_node(NodeType type, std::string id, std::string name, Rect frame = {}) -> Node;

/// Create a text node.
auto make_text_node(std::string id, std::string name, std::string text,
                    Rect frame = {}) -> Node;

}  // namespace canvas_merge
