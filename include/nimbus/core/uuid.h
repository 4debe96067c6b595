#pragma once

#include <cstdint>
#include <random>
#include <string>

#include <fmt/format.h>

namespace nimbus::core {

/**
 * UUID v4 string (xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx) from a per-thread
 * mt19937_64 seeded by std::random_device.
 */
inline std::string generateUUID() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;
    std::uint64_t hi = dist(rng);
    std::uint64_t lo = dist(rng);

    hi = (hi & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull; // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull; // variant 1

    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", hi >> 32, (hi >> 16) & 0xFFFF,
                       hi & 0xFFFF, lo >> 48, lo & 0x0000FFFFFFFFFFFFull);
}

// Session ids are "sess-" followed by a UUID v4.
inline constexpr const char* kSessionIdPrefix = "sess-";

inline std::string generateSessionId() {
    return kSessionIdPrefix + generateUUID();
}

} // namespace nimbus::core
