//
// Host byte order and byte swapping
//

#pragma once

#include <cstdint>

#include <pngme/pngme_config.h>

namespace pngme {
    // Host byte order, detected by CMake (CMAKE_CXX_BYTE_ORDER)
#if LIBPNGME_BIG_ENDIAN
    constexpr bool is_big_endian = true;
#else
    constexpr bool is_big_endian = false;
#endif

    constexpr std::uint32_t swap32(std::uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    // Host order to and from the big-endian order of PNG length and CRC fields
    constexpr std::uint32_t swap32be(std::uint32_t x) {
        return is_big_endian ? x : swap32(x);
    }
}
