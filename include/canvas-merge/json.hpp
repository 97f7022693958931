/// @file json.hpp
/// @brief nlohmann/json interoperability for canvas-merge.
///
/// Provides ADL serialization (to_json/from_json) for the document model and
/// engine results, canonical document output, and the RFC 6902 wire format.

#pragma once

#include <canvas-merge/conflict.hpp>
#include <canvas-merge/diff.hpp>
#include <canvas-merge/document.hpp>
#include <canvas-merge/error.hpp>
#include <canvas-merge/merge.hpp>
#include <canvas-merge/patch.hpp>
#include <canvas-merge/resolution.hpp>
#include <canvas-merge/validate.hpp>
#include <canvas-merge/value.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace canvas_merge {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Property values ----------------------------------------------------------

void to_json(nlohmann::json& j, Null);
void to_json(nlohmann::json& j, const ColorTokenRef& t);
void to_json(nlohmann::json& j, const GradientStop& s);
void from_json(const nlohmann::json& j, GradientStop& s);
void to_json(nlohmann::json& j, const Gradient& g);

void to_json(nlohmann::json& j, const PropertyValue& v);
void from_json(const nlohmann::json& j, PropertyValue& v);

// -- Document model -----------------------------------------------------------

void to_json(nlohmann::json& j, const Rect& r);
void from_json(const nlohmann::json& j, Rect& r);

void to_json(nlohmann::json& j, const TextStyle& s);
void from_json(const nlohmann::json& j, TextStyle& s);

void to_json(nlohmann::json& j, const Style& s);
void from_json(const nlohmann::json& j, Style& s);

/// Nodes serialize with their whole subtree.
void to_json(nlohmann::json& j, const Node& n);
void from_json(const nlohmann::json& j, Node& n);

void to_json(nlohmann::json& j, const Artboard& a);
void from_json(const nlohmann::json& j, Artboard& a);

void to_json(nlohmann::json& j, const CanvasDocument& d);
void from_json(const nlohmann::json& j, CanvasDocument& d);

// -- Engine types -------------------------------------------------------------

void to_json(nlohmann::json& j, const Patch& p);
/// @throws std::runtime_error for an op outside the vocabulary.
void from_json(const nlohmann::json& j, Patch& p);

void to_json(nlohmann::json& j, const DiffOperation& op);
void to_json(nlohmann::json& j, const DiffSummary& s);
void to_json(nlohmann::json& j, const DiffResult& r);
void to_json(nlohmann::json& j, const Conflict& c);
void to_json(nlohmann::json& j, const MergeResolution& r);
void to_json(nlohmann::json& j, const MergeResult& r);
void to_json(nlohmann::json& j, const ValidationResult& r);
void to_json(nlohmann::json& j, const Error& e);

void to_json(nlohmann::json& j, const MergeConfig& c);
/// Missing keys keep their defaults.
void from_json(const nlohmann::json& j, MergeConfig& c);

// =============================================================================
// Documents
// =============================================================================

/// A node without its children, as used for field-level addressing.
auto shallow_json(const Node& node) -> nlohmann::json;

/// An artboard without its children.
auto shallow_json(const Artboard& artboard) -> nlohmann::json;

/// Result of parse_document().
struct LoadResult {
    std::optional<CanvasDocument> document;
    std::optional<Error> error;

    auto ok() const noexcept -> bool { return !error.has_value(); }
    explicit operator bool() const noexcept { return ok(); }
};

/// Parse and validate a document. Malformed JSON and undecodable structure
/// fail with `invalid_document`; schema violations with `validation_failure`.
auto parse_document(std::string_view text) -> LoadResult;

/// parse_document() without the error: nullopt on any failure.
auto load_document(std::string_view text) -> std::optional<CanvasDocument>;

/// Sorted-key, two-space indented JSON with a trailing newline. Equal
/// documents always produce identical bytes.
auto serialize_canonical(const CanvasDocument& document) -> std::string;

// =============================================================================
// JSON Patch (RFC 6902) wire format
// =============================================================================

/// Apply a wire-format patch array. An entry with an op outside the
/// vocabulary fails the batch with `unknown_operation` at its index, and a
/// structurally malformed entry with `invalid_patch`.
auto apply_json_patch(const CanvasDocument& document, const nlohmann::json& patches,
                      const PatchOptions& options = {}) -> BatchResult;

/// Serialize a patch list to a wire-format array.
auto to_json_patch(const std::vector<Patch>& patches) -> nlohmann::json;

}  // namespace canvas_merge
