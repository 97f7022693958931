#include <canvas-merge/validate.hpp>

#include <canvas-merge/ulid.hpp>

#include <cmath>
#include <regex>
#include <string>
#include <unordered_set>
#include <utility>
#include <variant>

namespace canvas_merge {

namespace {

class Validator {
public:
    auto run(const CanvasDocument& document) -> ValidationResult {
        if (document.schema_version != current_schema_version) {
            fail("/schemaVersion", "unsupported schema version '" + document.schema_version + "'");
        }
        if (!is_valid_ulid(document.id)) fail("/id", "document id is not a ULID");
        if (document.artboards.empty()) fail("/artboards", "document has no artboards");

        for (std::size_t a = 0; a < document.artboards.size(); ++a) {
            const auto& artboard = document.artboards[a];
            auto path = "/artboards/" + std::to_string(a);
            check_id(artboard.id, path);
            check_frame(artboard.frame, path + "/frame");
            for (std::size_t i = 0; i < artboard.children.size(); ++i) {
                check_node(artboard.children[i], path + "/children/" + std::to_string(i));
            }
        }
        return std::move(result_);
    }

private:
    void fail(std::string path, std::string message) {
        result_.success = false;
        result_.errors.push_back(ValidationError{std::move(path), std::move(message)});
    }

    void check_id(const std::string& id, const std::string& path) {
        if (!is_valid_ulid(id)) {
            fail(path + "/id", "id '" + id + "' is not a ULID");
        }
        if (!ids_.insert(id).second) {
            fail(path + "/id", "duplicate id '" + id + "'");
        }
    }

    void check_frame(const Rect& frame, const std::string& path) {
        if (!std::isfinite(frame.x) || !std::isfinite(frame.y)) {
            fail(path, "frame position must be finite");
        }
        if (!std::isfinite(frame.width) || frame.width < 0.0) {
            fail(path + "/width", "width must be a non-negative number");
        }
        if (!std::isfinite(frame.height) || frame.height < 0.0) {
            fail(path + "/height", "height must be a non-negative number");
        }
    }

    void check_node(const Node& node, const std::string& path) {
        check_id(node.id, path);
        check_frame(node.frame, path + "/frame");

        if (node.semantic_key) {
            const auto& key = *node.semantic_key;
            if (!is_valid_semantic_key(key)) {
                fail(path + "/semanticKey", "invalid semantic key '" + key + "'");
            }
            if (!semantic_keys_.insert(key).second) {
                fail(path + "/semanticKey", "duplicate semantic key '" + key + "'");
            }
        }
        if (node.style && node.style->opacity) {
            auto opacity = *node.style->opacity;
            if (!(opacity >= 0.0 && opacity <= 1.0)) {
                fail(path + "/style/opacity", "opacity must be within [0, 1]");
            }
        }
        if (const auto* component = std::get_if<ComponentContent>(&node.content)) {
            if (component->component_key.empty()) {
                fail(path + "/componentKey", "componentKey must not be empty");
            }
        }
        if (!node.is_container() && !node.children.empty()) {
            fail(path + "/children",
                 "nodes of type " + std::string{to_string_view(node.type())} +
                     " cannot have children");
        }
        for (std::size_t i = 0; i < node.children.size(); ++i) {
            check_node(node.children[i], path + "/children/" + std::to_string(i));
        }
    }

    ValidationResult result_;
    std::unordered_set<std::string> ids_;
    std::unordered_set<std::string> semantic_keys_;
};

}  // anonymous namespace

auto validate(const CanvasDocument& document) -> ValidationResult {
    return Validator{}.run(document);
}

auto is_valid_semantic_key(std::string_view key) -> bool {
    static const auto pattern = std::regex{R"(^[a-z][a-z0-9]*(\.[a-z0-9]+|\[[0-9]+\])*$)"};
    return std::regex_match(key.begin(), key.end(), pattern);
}

}  // namespace canvas_merge
