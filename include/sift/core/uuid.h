#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <random>
#include <string>

namespace sift::core {

/**
 * Random (version 4, RFC 4122 variant) UUID in canonical lowercase form.
 * Job, batch and document ids all come from here.
 */
inline std::string generateUUID() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};

    std::array<uint8_t, 16> bytes{};
    for (size_t i = 0; i < bytes.size(); i += 8) {
        uint64_t word = rng();
        for (size_t j = 0; j < 8; ++j) {
            bytes[i + j] = static_cast<uint8_t>(word >> (j * 8));
        }
    }
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10)
            out.push_back('-');
        out.push_back(kHex[bytes[i] >> 4]);
        out.push_back(kHex[bytes[i] & 0x0F]);
    }
    return out;
}

// Timestamps are stored as INTEGER epoch milliseconds
inline int64_t toEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline std::chrono::system_clock::time_point fromEpochMillis(int64_t ms) {
    return std::chrono::system_clock::time_point{std::chrono::milliseconds{ms}};
}

} // namespace sift::core
