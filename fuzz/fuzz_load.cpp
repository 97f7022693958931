// Fuzz target for load_document(): JSON parsing, decoding and validation.
// Any document that loads is round-tripped through serialize_canonical().

#include <canvas-merge/canvas_merge.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    canvas_merge::logger()->set_level(spdlog::level::off);
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    auto doc = canvas_merge::load_document(text);
    if (doc) {
        auto saved = canvas_merge::serialize_canonical(*doc);
        auto reloaded = canvas_merge::load_document(saved);
        if (!reloaded || *reloaded != *doc) __builtin_trap();
    }
    return 0;
}
