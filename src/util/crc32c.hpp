#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace util {

// Table-driven CRC32C (Castagnoli). Frames journal records; the value is stable
// across platforms, so journals written on one host verify on another.
namespace detail {

constexpr std::uint32_t crc32c_poly = 0x82F63B78u; // reflected

constexpr std::array<std::uint32_t, 256> make_crc32c_table() noexcept {
    std::array<std::uint32_t, 256> table{};
    for (std::uint32_t i = 0; i < 256; ++i) {
        std::uint32_t c = i;
        for (int k = 0; k < 8; ++k) {
            c = (c & 1u) ? (crc32c_poly ^ (c >> 1)) : (c >> 1);
        }
        table[i] = c;
    }
    return table;
}

inline constexpr std::array<std::uint32_t, 256> crc32c_table = make_crc32c_table();

} // namespace detail

class Crc32c {
public:
    static constexpr std::uint32_t initial = 0xFFFFFFFFu;
    static constexpr std::uint32_t xor_out = 0xFFFFFFFFu;

    static std::uint32_t update(std::uint32_t crc, const std::byte* data, std::size_t len) noexcept {
        std::uint32_t c = crc;
        for (std::size_t i = 0; i < len; ++i) {
            const std::uint8_t idx = static_cast<std::uint8_t>((c ^ static_cast<std::uint8_t>(data[i])) & 0xFFu);
            c = (c >> 8) ^ detail::crc32c_table[idx];
        }
        return c;
    }

    static std::uint32_t compute(const std::byte* data, std::size_t len) noexcept {
        return finalize(update(initial, data, len));
    }

    static constexpr std::uint32_t finalize(std::uint32_t crc) noexcept { return crc ^ xor_out; }
};

} // namespace util
