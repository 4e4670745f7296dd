//
// Created by igor on 10/08/2025.
//

#pragma once

#include <cstdint>

#include <pngc/pngc_config.h>

namespace pngc {
    // Platform endianness detection using CMake-generated config
#if PNGC_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

    // Byte swapping functions
    inline uint16_t swap16(uint16_t x) {
        return static_cast<uint16_t>((x << 8) | (x >> 8));
    }

    inline uint32_t swap32(uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    // PNG stores every multi-byte integer in network (big-endian) order
    inline uint16_t swap16be(uint16_t x) {
        return is_big_endian ? x : swap16(x);
    }

    inline uint32_t swap32be(uint32_t x) {
        return is_big_endian ? x : swap32(x);
    }
}
