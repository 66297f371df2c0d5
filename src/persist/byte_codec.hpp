#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>

namespace persist {

// Byte-wise little-endian stores and loads; no alignment requirement.
inline void store_le16(std::uint16_t v, std::byte* out) noexcept {
    out[0] = static_cast<std::byte>(v & 0xFFu);
    out[1] = static_cast<std::byte>((v >> 8) & 0xFFu);
}

inline void store_le32(std::uint32_t v, std::byte* out) noexcept {
    for (int i = 0; i < 4; ++i) {
        out[i] = static_cast<std::byte>((v >> (8 * i)) & 0xFFu);
    }
}

inline void store_le64(std::uint64_t v, std::byte* out) noexcept {
    for (int i = 0; i < 8; ++i) {
        out[i] = static_cast<std::byte>((v >> (8 * i)) & 0xFFu);
    }
}

inline std::uint16_t load_le16(const std::byte* p) noexcept {
    return static_cast<std::uint16_t>(static_cast<std::uint16_t>(p[0]) | (static_cast<std::uint16_t>(p[1]) << 8));
}

inline std::uint32_t load_le32(const std::byte* p) noexcept {
    std::uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
        v |= static_cast<std::uint32_t>(p[i]) << (8 * i);
    }
    return v;
}

inline std::uint64_t load_le64(const std::byte* p) noexcept {
    std::uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v |= static_cast<std::uint64_t>(p[i]) << (8 * i);
    }
    return v;
}

inline void store_f64(double v, std::byte* out) noexcept { store_le64(std::bit_cast<std::uint64_t>(v), out); }

inline double load_f64(const std::byte* p) noexcept { return std::bit_cast<double>(load_le64(p)); }

} // namespace persist
