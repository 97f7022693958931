#include <canvas-merge/patch.hpp>

#include <canvas-merge/json.hpp>
#include <canvas-merge/logging.hpp>
#include <canvas-merge/node_index.hpp>
#include <canvas-merge/pointer.hpp>
#include <canvas-merge/ulid.hpp>
#include <canvas-merge/validate.hpp>

#include <array>
#include <stdexcept>
#include <string>
#include <utility>

namespace canvas_merge {

namespace {

// Internal failure signal. Thrown inside the engine and converted to an
// Error value at the apply_patch / apply_patches boundary.
class PatchFailure : public std::runtime_error {
public:
    PatchFailure(ErrorKind kind, const std::string& message)
        : std::runtime_error{message}, kind_{kind} {}

    auto kind() const noexcept -> ErrorKind { return kind_; }

private:
    ErrorKind kind_;
};

[[noreturn]] void fail(ErrorKind kind, const std::string& message) {
    throw PatchFailure{kind, message};
}

[[noreturn]] void fail_missing(const std::string& pointer) {
    fail(ErrorKind::path_not_found, "path '" + pointer + "' does not exist");
}

// -- Addressing ---------------------------------------------------------------

enum class Target {
    document,        ///< ""
    document_field,  ///< "/name"
    artboard_slot,   ///< "/artboards/1"
    artboard_field,  ///< "/artboards/1/frame/x"
    node_slot,       ///< "/artboards/0/children/2"
    node_field,      ///< "/artboards/0/children/2/style/opacity"
};

struct Address {
    Target target{Target::document};
    std::size_t artboard{0};
    std::vector<std::size_t> nodes;  ///< Child indices from the artboard.
    std::string token;               ///< Array token for slot targets ("-" allowed).
    std::string field;               ///< Pointer into the shallow object for field targets.
    std::string pointer;             ///< The original pointer, for messages.
};

auto is_document_field(const std::string& name) -> bool {
    return name == "schemaVersion" || name == "id" || name == "name";
}

auto resolve(const CanvasDocument& doc, const std::string& pointer) -> Address {
    auto parsed = parse_pointer(pointer);
    if (!parsed) fail(ErrorKind::invalid_patch, "malformed pointer '" + pointer + "'");
    const auto& segs = *parsed;

    auto addr = Address{};
    addr.pointer = pointer;
    if (segs.empty()) return addr;

    if (segs[0] != "artboards") {
        if (segs.size() == 1 && is_document_field(segs[0])) {
            addr.target = Target::document_field;
            addr.field = "/" + segs[0];
            return addr;
        }
        fail_missing(pointer);
    }
    if (segs.size() == 1) {
        fail(ErrorKind::invalid_patch, "the artboards array must be addressed by index");
    }
    if (segs.size() == 2) {
        addr.target = Target::artboard_slot;
        addr.token = segs[1];
        return addr;
    }

    auto artboard = parse_index(segs[1]);
    if (!artboard || *artboard >= doc.artboards.size()) fail_missing(pointer);
    addr.artboard = *artboard;

    const auto* children = &doc.artboards[*artboard].children;
    auto pos = std::size_t{2};
    while (true) {
        if (segs[pos] != "children") {
            addr.target = addr.nodes.empty() ? Target::artboard_field : Target::node_field;
            addr.field = format_pointer(PointerSegments(segs.begin() + static_cast<std::ptrdiff_t>(pos),
                                                        segs.end()));
            return addr;
        }
        if (pos + 1 == segs.size()) {
            fail(ErrorKind::invalid_patch, "children arrays must be addressed by index");
        }
        if (pos + 2 == segs.size()) {
            addr.target = Target::node_slot;
            addr.token = segs[pos + 1];
            return addr;
        }
        auto index = parse_index(segs[pos + 1]);
        if (!index || *index >= children->size()) fail_missing(pointer);
        addr.nodes.push_back(*index);
        children = &(*children)[*index].children;
        pos += 2;
    }
}

auto existing_index(const Address& addr, std::size_t size) -> std::size_t {
    auto index = parse_index(addr.token);
    if (!index || *index >= size) fail_missing(addr.pointer);
    return *index;
}

auto insert_index(const Address& addr, std::size_t size) -> std::size_t {
    if (addr.token == "-") return size;
    auto index = parse_index(addr.token);
    if (!index || *index > size) fail_missing(addr.pointer);
    return *index;
}

auto node_ref(CanvasDocument& doc, const Address& addr) -> Node& {
    auto* node = node_at(doc, NodeLocation{addr.artboard, addr.nodes});
    if (!node) fail_missing(addr.pointer);
    return *node;
}

auto children_ref(CanvasDocument& doc, const Address& addr) -> std::vector<Node>& {
    if (addr.nodes.empty()) return doc.artboards[addr.artboard].children;
    return node_ref(doc, addr).children;
}

// -- Values -------------------------------------------------------------------

template <typename T>
auto decode(const nlohmann::json& value, const char* what) -> T {
    try {
        return value.get<T>();
    } catch (const nlohmann::json::exception& e) {
        fail(ErrorKind::validation_failure, std::string{"value is not a valid "} + what + ": " + e.what());
    } catch (const std::runtime_error& e) {
        fail(ErrorKind::validation_failure, std::string{"value is not a valid "} + what + ": " + e.what());
    }
}

auto fields_json(CanvasDocument& doc, const Address& addr) -> nlohmann::json {
    switch (addr.target) {
        case Target::document_field:
            return nlohmann::json{{"schemaVersion", doc.schema_version}, {"id", doc.id},
                                  {"name", doc.name}};
        case Target::artboard_field:
            return shallow_json(doc.artboards[addr.artboard]);
        case Target::node_field:
            return shallow_json(node_ref(doc, addr));
        default:
            break;
    }
    fail(ErrorKind::invalid_patch, "'" + addr.pointer + "' does not address a field");
}

void store_fields(CanvasDocument& doc, const Address& addr, const nlohmann::json& fields) {
    switch (addr.target) {
        case Target::document_field: {
            auto text = [&](const char* key) {
                if (!fields.contains(key)) {
                    fail(ErrorKind::validation_failure, std::string{"document "} + key + " is required");
                }
                return decode<std::string>(fields[key], key);
            };
            doc.schema_version = text("schemaVersion");
            doc.id = text("id");
            doc.name = text("name");
            return;
        }
        case Target::artboard_field: {
            auto& artboard = doc.artboards[addr.artboard];
            auto updated = decode<Artboard>(fields, "artboard");
            updated.children = std::move(artboard.children);
            artboard = std::move(updated);
            return;
        }
        case Target::node_field: {
            auto& node = node_ref(doc, addr);
            auto updated = decode<Node>(fields, "node");
            updated.children = std::move(node.children);
            node = std::move(updated);
            return;
        }
        default:
            fail(ErrorKind::invalid_patch, "'" + addr.pointer + "' does not address a field");
    }
}

auto field_at(const nlohmann::json& fields, const Address& addr) -> std::optional<nlohmann::json> {
    try {
        auto ptr = nlohmann::json::json_pointer{addr.field};
        if (!fields.contains(ptr)) return std::nullopt;
        return fields.at(ptr);
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

// The array holding the addressed field, or nullptr when its parent is an
// object.
auto field_array(const nlohmann::json& fields, const Address& addr) -> const nlohmann::json* {
    try {
        auto ptr = nlohmann::json::json_pointer{addr.field};
        if (ptr.empty()) return nullptr;
        auto parent = ptr.parent_pointer();
        if (!fields.contains(parent)) return nullptr;
        const auto& value = fields.at(parent);
        return value.is_array() ? &value : nullptr;
    } catch (const nlohmann::json::exception&) {
        return nullptr;
    }
}

void patch_fields(nlohmann::json& fields, const Address& addr, const char* op,
                  const nlohmann::json* value) {
    auto operation = nlohmann::json{{"op", op}, {"path", addr.field}};
    if (value) operation["value"] = *value;
    try {
        fields = fields.patch(nlohmann::json::array({std::move(operation)}));
    } catch (const nlohmann::json::exception&) {
        fail_missing(addr.pointer);
    }
}

auto is_field(Target target) -> bool {
    return target == Target::document_field || target == Target::artboard_field ||
           target == Target::node_field;
}

void require_container(CanvasDocument& doc, const Address& addr) {
    if (addr.nodes.empty()) return;
    const auto& parent = node_ref(doc, addr);
    if (!parent.is_container()) {
        fail(ErrorKind::validation_failure,
             "nodes of type " + std::string{to_string_view(parent.type())} +
                 " cannot have children");
    }
}

// -- Primitives ---------------------------------------------------------------

auto read_at(CanvasDocument& doc, const Address& addr) -> nlohmann::json {
    if (is_field(addr.target)) {
        auto value = field_at(fields_json(doc, addr), addr);
        if (!value) fail_missing(addr.pointer);
        return *value;
    }
    switch (addr.target) {
        case Target::artboard_slot:
            return doc.artboards[existing_index(addr, doc.artboards.size())];
        case Target::node_slot: {
            auto& children = children_ref(doc, addr);
            return children[existing_index(addr, children.size())];
        }
        default:
            return doc;
    }
}

/// Returns the value previously stored at an object member, if any. An add
/// into an array inserts and never overwrites.
auto add_at(CanvasDocument& doc, const Address& addr, const nlohmann::json& value)
    -> std::optional<nlohmann::json> {
    if (is_field(addr.target)) {
        auto fields = fields_json(doc, addr);
        auto previous = std::optional<nlohmann::json>{};
        if (!field_array(fields, addr)) previous = field_at(fields, addr);
        patch_fields(fields, addr, "add", &value);
        store_fields(doc, addr, fields);
        return previous;
    }
    switch (addr.target) {
        case Target::artboard_slot: {
            auto index = insert_index(addr, doc.artboards.size());
            auto artboard = decode<Artboard>(value, "artboard");
            doc.artboards.insert(doc.artboards.begin() + static_cast<std::ptrdiff_t>(index),
                                 std::move(artboard));
            return std::nullopt;
        }
        case Target::node_slot: {
            require_container(doc, addr);
            auto& children = children_ref(doc, addr);
            auto index = insert_index(addr, children.size());
            auto node = decode<Node>(value, "node");
            children.insert(children.begin() + static_cast<std::ptrdiff_t>(index), std::move(node));
            return std::nullopt;
        }
        default: {
            auto previous = nlohmann::json(doc);
            doc = decode<CanvasDocument>(value, "document");
            return previous;
        }
    }
}

/// Returns the removed value.
auto remove_at(CanvasDocument& doc, const Address& addr) -> nlohmann::json {
    if (is_field(addr.target)) {
        auto fields = fields_json(doc, addr);
        auto previous = field_at(fields, addr);
        if (!previous) fail_missing(addr.pointer);
        patch_fields(fields, addr, "remove", nullptr);
        store_fields(doc, addr, fields);
        return *previous;
    }
    switch (addr.target) {
        case Target::artboard_slot: {
            auto index = existing_index(addr, doc.artboards.size());
            auto removed = nlohmann::json(doc.artboards[index]);
            doc.artboards.erase(doc.artboards.begin() + static_cast<std::ptrdiff_t>(index));
            return removed;
        }
        case Target::node_slot: {
            auto& children = children_ref(doc, addr);
            auto index = existing_index(addr, children.size());
            auto removed = nlohmann::json(children[index]);
            children.erase(children.begin() + static_cast<std::ptrdiff_t>(index));
            return removed;
        }
        default:
            fail(ErrorKind::invalid_patch, "cannot remove the document root");
    }
}

/// Returns the replaced value.
auto replace_at(CanvasDocument& doc, const Address& addr, const nlohmann::json& value)
    -> nlohmann::json {
    if (is_field(addr.target)) {
        auto fields = fields_json(doc, addr);
        auto previous = field_at(fields, addr);
        if (!previous) fail_missing(addr.pointer);
        patch_fields(fields, addr, "replace", &value);
        store_fields(doc, addr, fields);
        return *previous;
    }
    switch (addr.target) {
        case Target::artboard_slot: {
            auto index = existing_index(addr, doc.artboards.size());
            auto previous = nlohmann::json(doc.artboards[index]);
            doc.artboards[index] = decode<Artboard>(value, "artboard");
            return previous;
        }
        case Target::node_slot: {
            auto& children = children_ref(doc, addr);
            auto index = existing_index(addr, children.size());
            auto previous = nlohmann::json(children[index]);
            children[index] = decode<Node>(value, "node");
            return previous;
        }
        default: {
            auto previous = nlohmann::json(doc);
            doc = decode<CanvasDocument>(value, "document");
            return previous;
        }
    }
}

// -- Copies -------------------------------------------------------------------

void reassign_node_ids(nlohmann::json& node, const std::function<std::string()>& next_id) {
    node["id"] = next_id();
    node.erase("semanticKey");
    if (auto it = node.find("children"); it != node.end() && it->is_array()) {
        for (auto& child : *it) reassign_node_ids(child, next_id);
    }
}

void reassign_ids(nlohmann::json& value, Target source,
                  const std::function<std::string()>& next_id) {
    if (!value.is_object()) return;
    if (source == Target::node_slot) {
        reassign_node_ids(value, next_id);
    } else if (source == Target::artboard_slot) {
        value["id"] = next_id();
        if (auto it = value.find("children"); it != value.end() && it->is_array()) {
            for (auto& child : *it) reassign_node_ids(child, next_id);
        }
    }
}

// -- Single patch -------------------------------------------------------------

// The pointer with a trailing "-" replaced by the index it appends at, so
// that the applied patch can be inverted.
auto concrete_pointer(CanvasDocument& doc, const Address& addr) -> std::string {
    if (is_field(addr.target)) {
        if (!addr.field.ends_with("/-")) return addr.pointer;
        auto fields = fields_json(doc, addr);
        const auto* array = field_array(fields, addr);
        if (!array) return addr.pointer;
        return addr.pointer.substr(0, addr.pointer.size() - 1) + std::to_string(array->size());
    }
    if (addr.token != "-") return addr.pointer;
    auto size = addr.target == Target::artboard_slot ? doc.artboards.size()
                                                     : children_ref(doc, addr).size();
    return addr.pointer.substr(0, addr.pointer.size() - 1) + std::to_string(size);
}

auto require_value(const Patch& patch) -> const nlohmann::json& {
    if (!patch.value) {
        fail(ErrorKind::invalid_patch,
             std::string{to_string_view(patch.op)} + " requires a value");
    }
    return *patch.value;
}

auto require_from(const Patch& patch) -> const std::string& {
    if (!patch.from) {
        fail(ErrorKind::invalid_patch,
             std::string{to_string_view(patch.op)} + " requires a from pointer");
    }
    return *patch.from;
}

/// Apply one patch to `doc` in place and return it with its pre-image.
/// On PatchFailure `doc` may be partially modified; callers discard it.
auto apply_in_place(CanvasDocument& doc, const Patch& patch, const PatchOptions& options)
    -> Patch {
    auto applied = patch;
    applied.old_value.reset();

    switch (patch.op) {
        case PatchOp::add: {
            auto addr = resolve(doc, patch.path);
            applied.path = concrete_pointer(doc, addr);
            applied.old_value = add_at(doc, addr, require_value(patch));
            break;
        }
        case PatchOp::remove:
            applied.old_value = remove_at(doc, resolve(doc, patch.path));
            break;
        case PatchOp::replace:
            applied.old_value = replace_at(doc, resolve(doc, patch.path), require_value(patch));
            break;
        case PatchOp::move: {
            const auto& from = require_from(patch);
            auto from_segments = parse_pointer(from);
            auto path_segments = parse_pointer(patch.path);
            if (!from_segments || !path_segments) {
                fail(ErrorKind::invalid_patch, "malformed pointer in move");
            }
            if (is_proper_prefix(*from_segments, *path_segments)) {
                fail(ErrorKind::invalid_patch,
                     "cannot move '" + from + "' into its own subtree '" + patch.path + "'");
            }
            auto value = remove_at(doc, resolve(doc, from));
            // The destination is evaluated after the removal.
            auto addr = resolve(doc, patch.path);
            applied.path = concrete_pointer(doc, addr);
            add_at(doc, addr, value);
            break;
        }
        case PatchOp::copy: {
            auto source = resolve(doc, require_from(patch));
            auto value = read_at(doc, source);
            if (options.reassign_copied_ids) {
                auto next_id = options.id_generator
                    ? options.id_generator
                    : std::function<std::string()>{[] { return generate_ulid(); }};
                reassign_ids(value, source.target, next_id);
            }
            auto addr = resolve(doc, patch.path);
            applied.path = concrete_pointer(doc, addr);
            add_at(doc, addr, value);
            applied.value = std::move(value);
            break;
        }
        case PatchOp::test: {
            const auto& expected = require_value(patch);
            auto actual = read_at(doc, resolve(doc, patch.path));
            if (actual != expected) {
                fail(ErrorKind::test_failed, "test failed at '" + patch.path + "'");
            }
            break;
        }
    }
    return applied;
}

void validate_or_fail(const CanvasDocument& doc) {
    auto validation = validate(doc);
    if (!validation) {
        const auto& first = validation.errors.front();
        fail(ErrorKind::validation_failure, first.message + " at " + first.instance_path);
    }
}

}  // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

auto parse_patch_op(std::string_view name) -> std::optional<PatchOp> {
    static constexpr auto ops = std::array{
        PatchOp::add, PatchOp::remove, PatchOp::replace,
        PatchOp::move, PatchOp::copy, PatchOp::test,
    };
    for (auto op : ops) {
        if (to_string_view(op) == name) return op;
    }
    return std::nullopt;
}

auto add_patch(std::string path, nlohmann::json value) -> Patch {
    return Patch{PatchOp::add, std::move(path), std::move(value), std::nullopt, std::nullopt};
}

auto remove_patch(std::string path) -> Patch {
    return Patch{PatchOp::remove, std::move(path), std::nullopt, std::nullopt, std::nullopt};
}

auto replace_patch(std::string path, nlohmann::json value) -> Patch {
    return Patch{PatchOp::replace, std::move(path), std::move(value), std::nullopt, std::nullopt};
}

auto move_patch(std::string from, std::string path) -> Patch {
    return Patch{PatchOp::move, std::move(path), std::nullopt, std::move(from), std::nullopt};
}

auto copy_patch(std::string from, std::string path) -> Patch {
    return Patch{PatchOp::copy, std::move(path), std::nullopt, std::move(from), std::nullopt};
}

auto test_patch(std::string path, nlohmann::json value) -> Patch {
    return Patch{PatchOp::test, std::move(path), std::move(value), std::nullopt, std::nullopt};
}

auto apply_patch(const CanvasDocument& document, const Patch& patch,
                 const PatchOptions& options) -> PatchResult {
    logger()->debug("apply_patch doc={} op={} path={}", document.id,
                    to_string_view(patch.op), patch.path);
    auto working = document;
    try {
        auto applied = apply_in_place(working, patch, options);
        if (options.validate) validate_or_fail(working);
        return PatchResult{std::move(working), std::move(applied), std::nullopt};
    } catch (const PatchFailure& e) {
        logger()->warn("apply_patch doc={} op={} path={} failed: {}", document.id,
                       to_string_view(patch.op), patch.path, e.what());
        return PatchResult{document, std::nullopt, Error{e.kind(), e.what()}};
    }
}

auto apply_patches(const CanvasDocument& document, const std::vector<Patch>& patches,
                   const PatchOptions& options) -> BatchResult {
    logger()->debug("apply_patches doc={} count={}", document.id, patches.size());
    auto result = BatchResult{document, {}, {}, std::nullopt, std::nullopt, std::nullopt};
    result.applied.reserve(patches.size());

    for (std::size_t i = 0; i < patches.size(); ++i) {
        const auto& patch = patches[i];
        try {
            result.applied.push_back(apply_in_place(result.document, patch, options));
        } catch (const PatchFailure& e) {
            if (e.kind() == ErrorKind::test_failed &&
                options.on_test_failure == TestFailurePolicy::skip_operation) {
                logger()->debug("apply_patches doc={} skipped test at index {}", document.id, i);
                result.skipped.push_back(i);
                continue;
            }
            logger()->warn("apply_patches doc={} aborted at index {} ({} {}): {}", document.id,
                           i, to_string_view(patch.op), patch.path, e.what());
            return BatchResult{document, {}, {}, Error{e.kind(), e.what()}, i, patch};
        }
    }

    if (options.validate) {
        try {
            validate_or_fail(result.document);
        } catch (const PatchFailure& e) {
            logger()->warn("apply_patches doc={} rejected: {}", document.id, e.what());
            return BatchResult{document, {}, {}, Error{e.kind(), e.what()}, std::nullopt,
                               std::nullopt};
        }
    }
    logger()->debug("apply_patches doc={} applied={} skipped={}", document.id,
                    result.applied.size(), result.skipped.size());
    return result;
}

auto invert_patch(const Patch& patch) -> Patch {
    switch (patch.op) {
        case PatchOp::add:
            if (patch.old_value) {
                // The add overwrote an existing field: restore it.
                return Patch{PatchOp::replace, patch.path, patch.old_value, std::nullopt,
                             patch.value};
            }
            return Patch{PatchOp::remove, patch.path, std::nullopt, std::nullopt, patch.value};
        case PatchOp::remove:
            if (!patch.old_value) {
                throw std::invalid_argument{"cannot invert remove of '" + patch.path +
                                            "' without its captured old value"};
            }
            return Patch{PatchOp::add, patch.path, patch.old_value, std::nullopt, std::nullopt};
        case PatchOp::replace:
            if (!patch.old_value) {
                throw std::invalid_argument{"cannot invert replace of '" + patch.path +
                                            "' without its captured old value"};
            }
            return Patch{PatchOp::replace, patch.path, patch.old_value, std::nullopt,
                         patch.value};
        case PatchOp::move:
            if (!patch.from) {
                throw std::invalid_argument{"cannot invert move without a from pointer"};
            }
            return Patch{PatchOp::move, *patch.from, std::nullopt, patch.path, std::nullopt};
        case PatchOp::copy:
            return Patch{PatchOp::remove, patch.path, std::nullopt, std::nullopt, patch.value};
        case PatchOp::test:
            return patch;
    }
    throw std::invalid_argument{"unknown patch operation"};
}

auto invert_patches(const std::vector<Patch>& patches) -> std::vector<Patch> {
    auto result = std::vector<Patch>{};
    result.reserve(patches.size());
    for (auto it = patches.rbegin(); it != patches.rend(); ++it) {
        result.push_back(invert_patch(*it));
    }
    return result;
}

}  // namespace canvas_merge
