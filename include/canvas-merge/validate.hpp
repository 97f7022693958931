/// @file validate.hpp
/// @brief Schema validation of canvas documents.

#pragma once

#include <canvas-merge/document.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace canvas_merge {

/// One schema violation.
struct ValidationError {
    std::string instance_path;  ///< JSON pointer of the offending value.
    std::string message;

    auto operator==(const ValidationError&) const -> bool = default;
};

struct ValidationResult {
    bool success{true};
    std::vector<ValidationError> errors;

    explicit operator bool() const noexcept { return success; }
};

/// Check a document against the schema: version, id formats, frame sizes,
/// id and semantic key uniqueness, semantic key syntax, container rules,
/// opacity range and component keys. All violations are reported.
auto validate(const CanvasDocument& document) -> ValidationResult;

/// Check a semantic key against the role path syntax, e.g. "nav.items[0]".
auto is_valid_semantic_key(std::string_view key) -> bool;

}  // namespace canvas_merge
