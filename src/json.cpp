#include <canvas-merge/json.hpp>

#include <canvas-merge/logging.hpp>

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace canvas_merge {

namespace {

template <typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

template <typename T>
void get_optional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
        return;
    }
    out = it->template get<T>();
}

void put_json_optional(nlohmann::json& j, const char* key,
                       const std::optional<nlohmann::json>& value) {
    if (value) j[key] = *value;
}

auto parse_winding_rule(const std::string& name) -> WindingRule {
    if (name == "nonzero") return WindingRule::nonzero;
    if (name == "evenodd") return WindingRule::evenodd;
    throw std::runtime_error{"invalid windingRule: " + name};
}

auto parse_image_mode(const std::string& name) -> ImageMode {
    for (auto mode : {ImageMode::cover, ImageMode::contain, ImageMode::fill, ImageMode::none}) {
        if (to_string_view(mode) == name) return mode;
    }
    throw std::runtime_error{"invalid image mode: " + name};
}

}  // anonymous namespace

// =============================================================================
// ADL serialization: property values
// =============================================================================

void to_json(nlohmann::json& j, Null) {
    j = nullptr;
}

void to_json(nlohmann::json& j, const ColorTokenRef& t) {
    j = nlohmann::json{{"__type", "token"}, {"value", t.token}};
}

void to_json(nlohmann::json& j, const GradientStop& s) {
    j = nlohmann::json{{"offset", s.offset}, {"color", s.color}};
}

void from_json(const nlohmann::json& j, GradientStop& s) {
    s.offset = j.at("offset").get<double>();
    s.color = j.at("color").get<std::string>();
}

void to_json(nlohmann::json& j, const Gradient& g) {
    j = nlohmann::json{{"__type", "gradient"}, {"kind", g.kind}, {"angle", g.angle},
                       {"stops", g.stops}};
}

void to_json(nlohmann::json& j, const PropertyValue& v) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](double d) { j = d; },
        [&](const std::string& s) { j = s; },
        [&](const ColorTokenRef& t) { to_json(j, t); },
        [&](const Gradient& g) { to_json(j, g); },
    }, v);
}

void from_json(const nlohmann::json& j, PropertyValue& v) {
    // Check for tagged types first
    if (j.is_object() && j.contains("__type")) {
        auto type = j.at("__type").get<std::string>();
        if (type == "token") {
            v = ColorTokenRef{j.at("value").get<std::string>()};
            return;
        }
        if (type == "gradient") {
            auto g = Gradient{};
            g.kind = j.value("kind", std::string{"linear"});
            g.angle = j.value("angle", 0.0);
            g.stops = j.value("stops", std::vector<GradientStop>{});
            v = std::move(g);
            return;
        }
        throw std::runtime_error{"unknown property value tag: " + type};
    }
    if (j.is_null()) {
        v = Null{};
    } else if (j.is_boolean()) {
        v = j.get<bool>();
    } else if (j.is_number()) {
        v = j.get<double>();
    } else if (j.is_string()) {
        v = j.get<std::string>();
    } else {
        throw std::runtime_error{"cannot convert JSON to PropertyValue"};
    }
}

// =============================================================================
// ADL serialization: document model
// =============================================================================

void to_json(nlohmann::json& j, const Rect& r) {
    j = nlohmann::json{{"x", r.x}, {"y", r.y}, {"width", r.width}, {"height", r.height}};
}

void from_json(const nlohmann::json& j, Rect& r) {
    r.x = j.at("x").get<double>();
    r.y = j.at("y").get<double>();
    r.width = j.at("width").get<double>();
    r.height = j.at("height").get<double>();
}

void to_json(nlohmann::json& j, const TextStyle& s) {
    j = nlohmann::json::object();
    put_optional(j, "family", s.family);
    put_optional(j, "size", s.size);
    put_optional(j, "lineHeight", s.line_height);
    put_optional(j, "weight", s.weight);
    put_optional(j, "letterSpacing", s.letter_spacing);
    put_optional(j, "color", s.color);
}

void from_json(const nlohmann::json& j, TextStyle& s) {
    get_optional(j, "family", s.family);
    get_optional(j, "size", s.size);
    get_optional(j, "lineHeight", s.line_height);
    // Weights are written either as "600" or 600
    if (auto it = j.find("weight"); it != j.end() && it->is_number()) {
        s.weight = it->dump();
    } else {
        get_optional(j, "weight", s.weight);
    }
    get_optional(j, "letterSpacing", s.letter_spacing);
    get_optional(j, "color", s.color);
}

void to_json(nlohmann::json& j, const Style& s) {
    j = nlohmann::json::object();
    put_optional(j, "fills", s.fills);
    put_optional(j, "strokes", s.strokes);
    put_optional(j, "radius", s.radius);
    put_optional(j, "opacity", s.opacity);
    put_optional(j, "shadow", s.shadow);
}

void from_json(const nlohmann::json& j, Style& s) {
    if (!j.is_object()) throw std::runtime_error{"style must be an object"};
    get_optional(j, "fills", s.fills);
    get_optional(j, "strokes", s.strokes);
    get_optional(j, "radius", s.radius);
    get_optional(j, "opacity", s.opacity);
    get_optional(j, "shadow", s.shadow);
}

void to_json(nlohmann::json& j, const Node& n) {
    j = nlohmann::json{
        {"id", n.id},
        {"type", std::string{to_string_view(n.type())}},
        {"name", n.name},
        {"visible", n.visible},
        {"frame", n.frame},
    };
    put_optional(j, "style", n.style);
    put_optional(j, "semanticKey", n.semantic_key);
    put_optional(j, "data", n.data);

    std::visit(overload{
        [&](const FrameContent& c) { put_optional(j, "layout", c.layout); },
        [&](const GroupContent&) {},
        [&](const VectorContent& c) {
            j["path"] = c.path;
            j["windingRule"] = std::string{to_string_view(c.winding_rule)};
        },
        [&](const TextContent& c) {
            j["text"] = c.text;
            put_optional(j, "textStyle", c.text_style);
        },
        [&](const ImageContent& c) {
            j["src"] = c.src;
            j["mode"] = std::string{to_string_view(c.mode)};
        },
        [&](const ComponentContent& c) {
            j["componentKey"] = c.component_key;
            j["props"] = c.props;
        },
    }, n.content);

    if (n.is_container() || !n.children.empty()) {
        j["children"] = n.children;
    }
}

void from_json(const nlohmann::json& j, Node& n) {
    if (!j.is_object()) throw std::runtime_error{"node must be an object"};
    auto type_name = j.at("type").get<std::string>();
    auto type = parse_node_type(type_name);
    if (!type) throw std::runtime_error{"unknown node type: " + type_name};

    n = make_node(*type, j.at("id").get<std::string>(), j.at("name").get<std::string>(),
                  j.at("frame").get<Rect>());
    n.visible = j.value("visible", true);
    get_optional(j, "style", n.style);
    get_optional(j, "semanticKey", n.semantic_key);
    get_optional(j, "data", n.data);

    std::visit(overload{
        [&](FrameContent& c) { get_optional(j, "layout", c.layout); },
        [&](GroupContent&) {},
        [&](VectorContent& c) {
            c.path = j.value("path", std::string{});
            c.winding_rule = parse_winding_rule(j.value("windingRule", std::string{"nonzero"}));
        },
        [&](TextContent& c) {
            c.text = j.value("text", std::string{});
            get_optional(j, "textStyle", c.text_style);
        },
        [&](ImageContent& c) {
            c.src = j.value("src", std::string{});
            c.mode = parse_image_mode(j.value("mode", std::string{"cover"}));
        },
        [&](ComponentContent& c) {
            c.component_key = j.value("componentKey", std::string{});
            c.props = j.value("props", PropertyMap{});
        },
    }, n.content);

    if (auto it = j.find("children"); it != j.end()) {
        n.children = it->get<std::vector<Node>>();
    }
}

void to_json(nlohmann::json& j, const Artboard& a) {
    j = nlohmann::json{{"id", a.id}, {"name", a.name}, {"frame", a.frame},
                       {"children", a.children}};
}

void from_json(const nlohmann::json& j, Artboard& a) {
    if (!j.is_object()) throw std::runtime_error{"artboard must be an object"};
    a.id = j.at("id").get<std::string>();
    a.name = j.at("name").get<std::string>();
    a.frame = j.at("frame").get<Rect>();
    a.children = j.value("children", std::vector<Node>{});
}

void to_json(nlohmann::json& j, const CanvasDocument& d) {
    j = nlohmann::json{{"schemaVersion", d.schema_version}, {"id", d.id}, {"name", d.name},
                       {"artboards", d.artboards}};
}

void from_json(const nlohmann::json& j, CanvasDocument& d) {
    if (!j.is_object()) throw std::runtime_error{"document must be an object"};
    d.schema_version = j.at("schemaVersion").get<std::string>();
    d.id = j.at("id").get<std::string>();
    d.name = j.at("name").get<std::string>();
    d.artboards = j.at("artboards").get<std::vector<Artboard>>();
}

// =============================================================================
// ADL serialization: engine types
// =============================================================================

void to_json(nlohmann::json& j, const Patch& p) {
    j = nlohmann::json{{"op", std::string{to_string_view(p.op)}}, {"path", p.path}};
    put_json_optional(j, "value", p.value);
    put_optional(j, "from", p.from);
    put_json_optional(j, "oldValue", p.old_value);
}

void from_json(const nlohmann::json& j, Patch& p) {
    auto op_str = j.at("op").get<std::string>();
    auto op = parse_patch_op(op_str);
    if (!op) throw std::runtime_error{"unknown patch operation: " + op_str};
    p.op = *op;
    p.path = j.at("path").get<std::string>();
    p.value.reset();
    if (auto it = j.find("value"); it != j.end()) p.value = *it;
    get_optional(j, "from", p.from);
    p.old_value.reset();
    if (auto it = j.find("oldValue"); it != j.end()) p.old_value = *it;
}

void to_json(nlohmann::json& j, const DiffOperation& op) {
    j = nlohmann::json{
        {"type", std::string{to_string_view(op.type)}},
        {"nodeId", op.node_id},
        {"path", op.path},
        {"description", op.description},
    };
    put_optional(j, "semanticKey", op.semantic_key);
    if (!op.field.empty()) j["field"] = op.field;
    put_json_optional(j, "oldValue", op.old_value);
    put_json_optional(j, "newValue", op.new_value);
    put_optional(j, "parentId", op.parent_id);
    put_optional(j, "index", op.index);
    put_optional(j, "previousId", op.previous_id);
}

void to_json(nlohmann::json& j, const DiffSummary& s) {
    j = nlohmann::json{{"added", s.added}, {"removed", s.removed}, {"modified", s.modified},
                       {"moved", s.moved}, {"total", s.total}};
}

void to_json(nlohmann::json& j, const DiffResult& r) {
    j = nlohmann::json{{"operations", r.operations}, {"summary", r.summary},
                       {"fromDocumentId", r.from_document_id},
                       {"toDocumentId", r.to_document_id}};
}

void to_json(nlohmann::json& j, const Conflict& c) {
    j = nlohmann::json{
        {"id", c.id},
        {"type", std::string{to_string_view(c.type)}},
        {"category", std::string{to_string_view(c.category)}},
        {"severity", std::string{to_string_view(c.severity)}},
        {"path", c.path},
        {"message", c.message},
    };
    if (!c.field.empty()) j["field"] = c.field;
    put_optional(j, "semanticKey", c.semantic_key);
    put_json_optional(j, "baseValue", c.base_value);
    put_json_optional(j, "localValue", c.local_value);
    put_json_optional(j, "remoteValue", c.remote_value);
}

void to_json(nlohmann::json& j, const MergeResolution& r) {
    j = nlohmann::json{
        {"conflict", r.conflict},
        {"strategy", std::string{to_string_view(r.strategy)}},
        {"confidence", r.confidence},
        {"requiresReview", r.requires_review},
        {"explanation", r.explanation},
        {"applied", r.applied},
    };
    put_json_optional(j, "resolvedValue", r.resolved_value);
}

void to_json(nlohmann::json& j, const Error& e) {
    j = nlohmann::json{{"kind", std::string{to_string_view(e.kind)}}, {"message", e.message}};
}

void to_json(nlohmann::json& j, const MergeResult& r) {
    j = nlohmann::json{
        {"document", r.document},
        {"conflicts", r.conflicts},
        {"resolutions", r.resolutions},
        {"unresolved", r.unresolved},
        {"confidence", r.confidence},
        {"needsManualReview", r.needs_manual_review},
        {"success", r.success},
    };
    if (r.error) j["error"] = *r.error;
}

void to_json(nlohmann::json& j, const ValidationResult& r) {
    auto errors = nlohmann::json::array();
    for (const auto& e : r.errors) {
        errors.push_back({{"instancePath", e.instance_path}, {"message", e.message}});
    }
    j = nlohmann::json{{"success", r.success}, {"errors", std::move(errors)}};
}

void to_json(nlohmann::json& j, const MergeConfig& c) {
    auto policy = nlohmann::json::object();
    for (const auto& [type, strategies] : c.policy) {
        auto names = nlohmann::json::array();
        for (auto s : strategies) names.push_back(std::string{to_string_view(s)});
        policy[std::string{to_string_view(type)}] = std::move(names);
    }
    auto confidence = nlohmann::json::object();
    for (const auto& [strategy, weight] : c.confidence) {
        confidence[std::string{to_string_view(strategy)}] = weight;
    }
    j = nlohmann::json{
        {"autoResolve", c.auto_resolve},
        {"autoApplyThreshold", c.auto_apply_threshold},
        {"failOnUnresolved", c.fail_on_unresolved},
        {"maxNodes", c.max_nodes},
        {"policy", std::move(policy)},
        {"confidence", std::move(confidence)},
    };
}

void from_json(const nlohmann::json& j, MergeConfig& c) {
    c.auto_resolve = j.value("autoResolve", c.auto_resolve);
    c.auto_apply_threshold = j.value("autoApplyThreshold", c.auto_apply_threshold);
    c.fail_on_unresolved = j.value("failOnUnresolved", c.fail_on_unresolved);
    c.max_nodes = j.value("maxNodes", c.max_nodes);

    if (auto it = j.find("policy"); it != j.end()) {
        for (const auto& [key, names] : it->items()) {
            auto type = parse_conflict_type(key);
            if (!type) throw std::runtime_error{"unknown conflict type: " + key};
            auto strategies = std::vector<ResolutionStrategy>{};
            for (const auto& name : names) {
                auto s = parse_resolution_strategy(name.get<std::string>());
                if (!s) throw std::runtime_error{"unknown strategy: " + name.get<std::string>()};
                strategies.push_back(*s);
            }
            c.policy[*type] = std::move(strategies);
        }
    }
    if (auto it = j.find("confidence"); it != j.end()) {
        for (const auto& [key, weight] : it->items()) {
            auto s = parse_resolution_strategy(key);
            if (!s) throw std::runtime_error{"unknown strategy: " + key};
            c.confidence[*s] = weight.get<double>();
        }
    }
}

// =============================================================================
// Documents
// =============================================================================

auto shallow_json(const Node& node) -> nlohmann::json {
    auto j = nlohmann::json(node);
    j.erase("children");
    return j;
}

auto shallow_json(const Artboard& artboard) -> nlohmann::json {
    return nlohmann::json{{"id", artboard.id}, {"name", artboard.name}, {"frame", artboard.frame}};
}

auto parse_document(std::string_view text) -> LoadResult {
    auto rejected = [](ErrorKind kind, std::string message) {
        logger()->warn("parse_document: {}", message);
        return LoadResult{std::nullopt, Error{kind, std::move(message)}};
    };

    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) return rejected(ErrorKind::invalid_document, "malformed JSON");

    auto document = CanvasDocument{};
    try {
        document = j.get<CanvasDocument>();
    } catch (const nlohmann::json::exception& e) {
        return rejected(ErrorKind::invalid_document, e.what());
    } catch (const std::runtime_error& e) {
        return rejected(ErrorKind::invalid_document, e.what());
    }

    auto validation = validate(document);
    if (!validation) {
        const auto& first = validation.errors.front();
        return rejected(ErrorKind::validation_failure,
                        first.message + " at " + first.instance_path);
    }
    return LoadResult{std::move(document), std::nullopt};
}

auto load_document(std::string_view text) -> std::optional<CanvasDocument> {
    return parse_document(text).document;
}

auto serialize_canonical(const CanvasDocument& document) -> std::string {
    // nlohmann::json objects are std::map backed, so keys come out sorted.
    return nlohmann::json(document).dump(2) + "\n";
}

// =============================================================================
// JSON Patch (RFC 6902) wire format
// =============================================================================

auto apply_json_patch(const CanvasDocument& document, const nlohmann::json& patches,
                      const PatchOptions& options) -> BatchResult {
    auto fail = [&](ErrorKind kind, std::string message,
                    std::optional<std::size_t> index) -> BatchResult {
        logger()->warn("apply_json_patch: {}", message);
        auto result = BatchResult{document, {}, {}, Error{kind, std::move(message)}, index, {}};
        return result;
    };

    if (!patches.is_array()) {
        return fail(ErrorKind::invalid_patch, "JSON Patch must be an array", std::nullopt);
    }

    auto decoded = std::vector<Patch>{};
    decoded.reserve(patches.size());
    for (std::size_t i = 0; i < patches.size(); ++i) {
        const auto& entry = patches[i];
        auto prefix = "operation " + std::to_string(i) + ": ";
        if (!entry.is_object() || !entry.contains("op") || !entry["op"].is_string()) {
            return fail(ErrorKind::invalid_patch, prefix + "missing op", i);
        }
        auto op_str = entry["op"].get<std::string>();
        if (!parse_patch_op(op_str)) {
            return fail(ErrorKind::unknown_operation,
                        prefix + "unknown operation '" + op_str + "'", i);
        }
        try {
            decoded.push_back(entry.get<Patch>());
        } catch (const nlohmann::json::exception& e) {
            return fail(ErrorKind::invalid_patch, prefix + e.what(), i);
        }
    }
    return apply_patches(document, decoded, options);
}

auto to_json_patch(const std::vector<Patch>& patches) -> nlohmann::json {
    auto result = nlohmann::json::array();
    for (const auto& p : patches) result.push_back(p);
    return result;
}

}  // namespace canvas_merge
