/// @file value.hpp
/// @brief Property values: PropertyValue, ColorTokenRef, Gradient and maps.

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace canvas_merge {

/// Represents an explicit JSON null inside a property map.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// A reference to a design token (e.g. "color.brand.primary").
///
/// Tokens are resolved by the rendering layer, never by this engine;
/// the merge engine only compares references for equality.
struct ColorTokenRef {
    std::string token;  ///< Dotted token path.

    auto operator<=>(const ColorTokenRef&) const = default;
    auto operator==(const ColorTokenRef&) const -> bool = default;
};

/// One color stop of a gradient.
struct GradientStop {
    double offset{0.0};  ///< Position along the gradient, 0..1.
    std::string color;   ///< CSS color string.

    auto operator<=>(const GradientStop&) const = default;
    auto operator==(const GradientStop&) const -> bool = default;
};

/// A linear or radial gradient paint.
struct Gradient {
    std::string kind{"linear"};       ///< "linear" or "radial".
    double angle{0.0};                ///< Degrees, for linear gradients.
    std::vector<GradientStop> stops;  ///< Ordered color stops.

    auto operator==(const Gradient&) const -> bool = default;
};

/// A closed set of values stored in style, layout, data and props maps.
///
/// Alternatives: Null, bool, double, string, ColorTokenRef, Gradient.
/// Comparisons between two property values are exhaustive: values of
/// different alternatives are never equal.
using PropertyValue = std::variant<
    Null,
    bool,
    double,
    std::string,
    ColorTokenRef,
    Gradient
>;

/// An ordered string-keyed map of property values.
using PropertyMap = std::map<std::string, PropertyValue>;

/// An ordered list of paints (fills or strokes).
using PaintList = std::vector<PropertyValue>;

/// The tag name of a PropertyValue alternative.
constexpr auto type_name(const PropertyValue& v) noexcept -> std::string_view {
    switch (v.index()) {
        case 0: return "null";
        case 1: return "bool";
        case 2: return "number";
        case 3: return "string";
        case 4: return "token";
        case 5: return "gradient";
    }
    return "unknown";
}

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& s) { std::printf("%s\n", s.c_str()); },
///     [](double d) { std::printf("%g\n", d); },
///     [](auto&&) { std::printf("other\n"); },
/// }, some_variant);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- Typed extraction helpers -------------------------------------------------

/// Extract a typed alternative from a PropertyValue, or nullopt on mismatch.
/// @code
/// auto gap = get_property<double>(layout.at("gap"));
/// @endcode
template <typename T>
auto get_property(const PropertyValue& v) -> std::optional<T> {
    if (const auto* t = std::get_if<T>(&v)) {
        return *t;
    }
    return std::nullopt;
}

/// Look up a key in a property map and extract a typed alternative.
template <typename T>
auto get_property(const PropertyMap& map, std::string_view key) -> std::optional<T> {
    auto it = map.find(std::string{key});
    if (it == map.end()) return std::nullopt;
    return get_property<T>(it->second);
}

}  // namespace canvas_merge
