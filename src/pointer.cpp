#include <canvas-merge/pointer.hpp>

#include <algorithm>
#include <charconv>

namespace canvas_merge {

auto parse_pointer(std::string_view pointer) -> std::optional<PointerSegments> {
    if (pointer.empty()) return PointerSegments{};
    if (pointer[0] != '/') return std::nullopt;

    auto segments = PointerSegments{};
    auto pos = std::size_t{1};
    while (pos <= pointer.size()) {
        auto next = pointer.find('/', pos);
        auto raw = pointer.substr(pos, next == std::string_view::npos ? std::string_view::npos
                                                                       : next - pos);
        auto segment = std::string{};
        segment.reserve(raw.size());
        for (auto i = std::size_t{0}; i < raw.size(); ++i) {
            if (raw[i] != '~') {
                segment.push_back(raw[i]);
                continue;
            }
            // "~" must be followed by 0 or 1
            if (i + 1 >= raw.size()) return std::nullopt;
            if (raw[i + 1] == '0') {
                segment.push_back('~');
            } else if (raw[i + 1] == '1') {
                segment.push_back('/');
            } else {
                return std::nullopt;
            }
            ++i;
        }
        segments.push_back(std::move(segment));
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return segments;
}

auto format_pointer(const PointerSegments& segments) -> std::string {
    auto result = std::string{};
    for (const auto& segment : segments) {
        result.push_back('/');
        for (auto c : segment) {
            if (c == '~') {
                result += "~0";
            } else if (c == '/') {
                result += "~1";
            } else {
                result.push_back(c);
            }
        }
    }
    return result;
}

auto parse_index(std::string_view segment) -> std::optional<std::size_t> {
    if (segment.empty()) return std::nullopt;
    // Leading zeros are not allowed per RFC 6901 (except "0" itself)
    if (segment.size() > 1 && segment[0] == '0') return std::nullopt;
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), result);
    if (ec == std::errc{} && ptr == segment.data() + segment.size()) return result;
    return std::nullopt;
}

auto is_proper_prefix(const PointerSegments& prefix, const PointerSegments& pointer) -> bool {
    if (prefix.size() >= pointer.size()) return false;
    for (auto i = std::size_t{0}; i < prefix.size(); ++i) {
        if (prefix[i] != pointer[i]) return false;
    }
    return true;
}

auto pointer_less(std::string_view a, std::string_view b) -> bool {
    auto lhs = parse_pointer(a);
    auto rhs = parse_pointer(b);
    if (!lhs || !rhs) return a < b;

    auto n = std::min(lhs->size(), rhs->size());
    for (auto i = std::size_t{0}; i < n; ++i) {
        const auto& x = (*lhs)[i];
        const auto& y = (*rhs)[i];
        if (x == y) continue;
        auto xi = parse_index(x);
        auto yi = parse_index(y);
        if (xi && yi) return *xi < *yi;
        if (xi != yi) return xi.has_value();  // indices before names
        return x < y;
    }
    return lhs->size() < rhs->size();
}

auto display_path(std::string_view pointer) -> std::string {
    auto segments = parse_pointer(pointer);
    if (!segments) return std::string{pointer};

    auto result = std::string{};
    for (const auto& segment : *segments) {
        if (parse_index(segment)) {
            result += '[' + segment + ']';
        } else {
            if (!result.empty()) result.push_back('.');
            result += segment;
        }
    }
    return result;
}

}  // namespace canvas_merge
