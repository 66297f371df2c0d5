#pragma once

#include <cstdint>
#include <cstring>
#include <string_view>

namespace util {

// 64-bit FNV-1a. Used for conflict input fingerprints and stable string keys;
// not a cryptographic hash.
class Fnv1a64 {
public:
    static constexpr std::uint64_t offset_basis = 1469598103934665603ull;
    static constexpr std::uint64_t prime = 1099511628211ull;

    void add_bytes(const void* data, std::size_t len) noexcept {
        const auto* p = static_cast<const unsigned char*>(data);
        for (std::size_t i = 0; i < len; ++i) {
            hash_ ^= p[i];
            hash_ *= prime;
        }
    }

    // Length-prefixed so that ("ab","c") and ("a","bc") differ.
    void add(std::string_view s) noexcept {
        add_u64(s.size());
        add_bytes(s.data(), s.size());
    }

    void add_u64(std::uint64_t v) noexcept {
        unsigned char buf[8];
        for (int i = 0; i < 8; ++i) {
            buf[i] = static_cast<unsigned char>(v >> (8 * i));
        }
        add_bytes(buf, sizeof(buf));
    }

    void add_i64(std::int64_t v) noexcept { add_u64(static_cast<std::uint64_t>(v)); }

    void add_double(double v) noexcept {
        std::uint64_t bits = 0;
        static_assert(sizeof(bits) == sizeof(v));
        std::memcpy(&bits, &v, sizeof(bits));
        add_u64(bits);
    }

    std::uint64_t value() const noexcept { return hash_; }

private:
    std::uint64_t hash_{offset_basis};
};

inline std::uint64_t fnv1a64(std::string_view s) noexcept {
    Fnv1a64 h;
    h.add_bytes(s.data(), s.size());
    return h.value();
}

} // namespace util
