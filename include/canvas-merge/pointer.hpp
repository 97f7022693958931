/// @file pointer.hpp
/// @brief RFC 6901 JSON Pointer helpers used for document addressing.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace canvas_merge {

/// A parsed pointer: unescaped reference tokens.
using PointerSegments = std::vector<std::string>;

/// Parse an RFC 6901 JSON Pointer into segments.
/// Empty string "" = root (0 segments).
/// "/" = one empty-string segment.
/// "/a/b/0" = ["a", "b", "0"].
/// @return nullopt if the pointer is non-empty and does not start with '/'.
auto parse_pointer(std::string_view pointer) -> std::optional<PointerSegments>;

/// Format segments back into a pointer, escaping '~' and '/'.
auto format_pointer(const PointerSegments& segments) -> std::string;

/// Parse a segment as an array index. Leading zeros are rejected except
/// for "0" itself.
auto parse_index(std::string_view segment) -> std::optional<std::size_t>;

/// Check whether `prefix` is a proper prefix of `pointer` (segment-wise).
auto is_proper_prefix(const PointerSegments& prefix, const PointerSegments& pointer) -> bool;

/// Order pointers segment by segment, comparing array indices numerically,
/// so "/artboards/0/children/2" sorts before "/artboards/0/children/10".
auto pointer_less(std::string_view a, std::string_view b) -> bool;

/// Render a pointer for humans: "/artboards/0/children/1" becomes
/// "artboards[0].children[1]".
auto display_path(std::string_view pointer) -> std::string;

}  // namespace canvas_merge
