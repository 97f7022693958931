// Fuzz target for JSON pointer parsing, formatting and ordering.

#include <canvas-merge/pointer.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    auto segments = canvas_merge::parse_pointer(text);
    if (segments) {
        // Formatting a parsed pointer gives back the same pointer.
        if (canvas_merge::format_pointer(*segments) != text) __builtin_trap();
        if (canvas_merge::pointer_less(text, text)) __builtin_trap();
        auto display = canvas_merge::display_path(text);
        (void)display;
        for (const auto& segment : *segments) {
            auto index = canvas_merge::parse_index(segment);
            (void)index;
        }
    }
    return 0;
}
