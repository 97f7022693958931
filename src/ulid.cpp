#include <canvas-merge/ulid.hpp>

#include <array>
#include <chrono>
#include <random>

namespace canvas_merge {

namespace {

constexpr char crockford[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

auto random_engine() -> std::mt19937_64& {
    thread_local auto engine = std::mt19937_64{std::random_device{}()};
    return engine;
}

auto is_crockford(char c) noexcept -> bool {
    if (c >= '0' && c <= '9') return true;
    if (c < 'A' || c > 'Z') return false;
    return c != 'I' && c != 'L' && c != 'O' && c != 'U';
}

}  // anonymous namespace

auto generate_ulid() -> std::string {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
    return generate_ulid(static_cast<std::uint64_t>(millis));
}

auto generate_ulid(std::uint64_t millis_since_epoch) -> std::string {
    auto result = std::string(ulid_length, '0');

    // 10 chars of timestamp (48 bits, big-endian base32)
    auto time = millis_since_epoch & 0xFFFFFFFFFFFFull;
    for (int i = 9; i >= 0; --i) {
        result[static_cast<std::size_t>(i)] = crockford[time & 0x1F];
        time >>= 5;
    }

    // 16 chars of randomness (80 bits)
    auto& engine = random_engine();
    auto hi = engine() & 0xFFFFFull;  // 20 bits
    auto lo = engine();               // 60 bits used
    for (int i = 25; i >= 14; --i) {
        result[static_cast<std::size_t>(i)] = crockford[lo & 0x1F];
        lo >>= 5;
    }
    for (int i = 13; i >= 10; --i) {
        result[static_cast<std::size_t>(i)] = crockford[hi & 0x1F];
        hi >>= 5;
    }
    return result;
}

auto is_valid_ulid(std::string_view id) noexcept -> bool {
    if (id.size() != ulid_length) return false;
    for (auto c : id) {
        if (!is_crockford(c)) return false;
    }
    return true;
}

}  // namespace canvas_merge
