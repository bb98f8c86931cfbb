//
// Big-endian load/store helpers for the PNG wire format
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

#include <pngme/pngme_config.h>

namespace pngme {
    // Platform endianness detection using CMake-generated config
#if PNGME_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

    inline std::uint32_t swap32(std::uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    // Conditional byte swapping based on platform
    inline std::uint32_t swap32be(std::uint32_t x) {
        return is_big_endian ? x : swap32(x);
    }

    inline std::uint32_t load32be(const std::byte* src) {
        std::uint32_t value;
        std::memcpy(&value, src, sizeof(value));
        return swap32be(value);
    }

    inline void store32be(std::byte* dst, std::uint32_t value) {
        value = swap32be(value);
        std::memcpy(dst, &value, sizeof(value));
    }
}
