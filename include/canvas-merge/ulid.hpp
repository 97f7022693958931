/// @file ulid.hpp
/// @brief ULID generation and validation.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace canvas_merge {

/// Length of a ULID in characters.
inline constexpr std::size_t ulid_length = 26;

/// Generate a new ULID: 48-bit millisecond timestamp followed by 80 random
/// bits, Crockford base32 encoded. Ids generated later sort after earlier
/// ones (millisecond resolution).
auto generate_ulid() -> std::string;

/// Generate a ULID for an explicit timestamp (milliseconds since epoch).
auto generate_ulid(std::uint64_t millis_since_epoch) -> std::string;

/// Check that a string is a well-formed ULID (26 Crockford base32 chars,
/// uppercase, no I/L/O/U).
auto is_valid_ulid(std::string_view id) noexcept -> bool;

}  // namespace canvas_merge
