#include "Uuid.hpp"

#include <chrono>
#include <random>

namespace vd {

std::string generate_uuid() {
    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<uint32_t> dist(0, 15);

    const char* hex = "0123456789abcdef";
    // Format: 8-4-4-4-12
    constexpr int kPattern[] = {
        8, -1, 4, -1, 4, -1, 4, -1, 12
    };

    std::string uuid;
    uuid.reserve(36);

    for (int group : kPattern) {
        if (group == -1) {
            uuid += '-';
        } else {
            for (int i = 0; i < group; ++i) {
                uuid += hex[dist(rng)];
            }
        }
    }

    // Set version (4) and variant (8/9/a/b) bits.
    uuid[14] = '4';
    uuid[19] = hex[(dist(rng) & 0x3) | 0x8];

    return uuid;
}

int64_t now_unix() {
    return static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
}

} // namespace vd
