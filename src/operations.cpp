#include <canvas-merge/operations.hpp>

#include <canvas-merge/json.hpp>
#include <canvas-merge/logging.hpp>
#include <canvas-merge/node_index.hpp>
#include <canvas-merge/pointer.hpp>
#include <canvas-merge/ulid.hpp>

#include <string>
#include <utility>

namespace canvas_merge {

namespace {

auto failure(const CanvasDocument& document, ErrorKind kind, std::string message) -> EditResult {
    logger()->debug("node operation failed: {}", message);
    auto result = EditResult{};
    result.document = document;
    result.error = Error{kind, std::move(message)};
    return result;
}

auto not_found(const CanvasDocument& document, std::string_view id) -> EditResult {
    return failure(document, ErrorKind::node_not_found,
                   "node " + std::string{id} + " not found");
}

auto run(const CanvasDocument& document, const std::vector<Patch>& patches,
         const PatchOptions& options) -> EditResult {
    auto batch = apply_patches(document, patches, options);
    auto result = EditResult{};
    if (!batch) {
        result.document = document;
        result.error = std::move(batch.error);
        return result;
    }
    result.document = std::move(batch.document);
    result.patches = std::move(batch.applied);
    result.reverse_patches = invert_patches(result.patches);
    return result;
}

// Pointer and child count of an artboard or container node.
struct Container {
    std::string pointer;
    std::size_t size{0};
};

auto find_container(const NodeIndex& index, std::string_view id) -> std::optional<Container> {
    if (auto artboard = index.find_artboard(id)) {
        return Container{artboard_pointer(*artboard),
                         index.document().artboards[*artboard].children.size()};
    }
    if (const auto* entry = index.find(id)) {
        return Container{entry->location.pointer(), entry->node->children.size()};
    }
    return std::nullopt;
}

auto child_pointer(const Container& container, std::size_t index) -> std::string {
    return container.pointer + "/children/" + std::to_string(index);
}

}  // anonymous namespace

auto create_node(const CanvasDocument& document, std::string_view parent_id, Node node,
                 std::optional<std::size_t> index, const PatchOptions& options) -> EditResult {
    const auto lookup = NodeIndex{document};
    auto parent = find_container(lookup, parent_id);
    if (!parent) return not_found(document, parent_id);
    if (node.id.empty()) node.id = options.id_generator ? options.id_generator() : generate_ulid();

    auto patch = add_patch(child_pointer(*parent, index.value_or(parent->size)),
                           nlohmann::json(node));
    return run(document, {std::move(patch)}, options);
}

auto update_node(const CanvasDocument& document, std::string_view id,
                 const nlohmann::json& fields, const PatchOptions& options) -> EditResult {
    if (!fields.is_object()) {
        return failure(document, ErrorKind::invalid_patch, "node updates must be an object");
    }
    const auto lookup = NodeIndex{document};
    const auto* entry = lookup.find(id);
    if (!entry) return not_found(document, id);

    auto current = shallow_json(*entry->node);
    auto pointer = entry->location.pointer();
    auto patches = std::vector<Patch>{};
    for (const auto& [key, value] : fields.items()) {
        if (key == "id" || key == "type" || key == "children") {
            return failure(document, ErrorKind::invalid_patch,
                           "field '" + key + "' cannot be updated");
        }
        auto path = pointer + format_pointer({key});
        auto present = current.contains(key);
        if (value.is_null()) {
            if (present) patches.push_back(remove_patch(std::move(path)));
        } else if (present) {
            patches.push_back(replace_patch(std::move(path), value));
        } else {
            patches.push_back(add_patch(std::move(path), value));
        }
    }
    return run(document, patches, options);
}

auto delete_node(const CanvasDocument& document, std::string_view id,
                 const PatchOptions& options) -> EditResult {
    const auto lookup = NodeIndex{document};
    const auto* entry = lookup.find(id);
    if (!entry) return not_found(document, id);
    return run(document, {remove_patch(entry->location.pointer())}, options);
}

auto move_node(const CanvasDocument& document, std::string_view id,
               std::string_view new_parent_id, std::optional<std::size_t> index,
               const PatchOptions& options) -> EditResult {
    const auto lookup = NodeIndex{document};
    const auto* entry = lookup.find(id);
    if (!entry) return not_found(document, id);
    if (!find_container(lookup, new_parent_id)) return not_found(document, new_parent_id);

    // The destination is addressed in the document with the node detached.
    auto from = entry->location.pointer();
    auto detach_options = PatchOptions{};
    detach_options.validate = false;
    auto detached = apply_patch(document, remove_patch(from), detach_options);
    if (!detached) return failure(document, detached.error->kind, detached.error->message);

    const auto remaining = NodeIndex{detached.document};
    auto parent = find_container(remaining, new_parent_id);
    if (!parent) {
        return failure(document, ErrorKind::invalid_patch,
                       "cannot move node " + std::string{id} + " into its own subtree");
    }
    auto to = child_pointer(*parent, index.value_or(parent->size));
    if (from == to) return run(document, {}, options);
    return run(document, {move_patch(std::move(from), std::move(to))}, options);
}

auto duplicate_node(const CanvasDocument& document, std::string_view id,
                    const PatchOptions& options) -> EditResult {
    const auto lookup = NodeIndex{document};
    const auto* entry = lookup.find(id);
    if (!entry) return not_found(document, id);

    auto from = entry->location.pointer();
    auto to = from.substr(0, from.rfind('/') + 1) + std::to_string(entry->index() + 1);
    auto copy_options = options;
    copy_options.reassign_copied_ids = true;
    return run(document, {copy_patch(std::move(from), std::move(to))}, copy_options);
}

}  // namespace canvas_merge
