//
// Chunk CRC on top of zlib
//

#include <algorithm>
#include <limits>

#include <zlib.h>

#include "crc.hh"

namespace pngme {

    std::uint32_t chunk_crc(const chunk_type& type, const std::byte* data, std::size_t size) {
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, type.bytes().data(), static_cast<uInt>(type.bytes().size()));

        // crc32() takes a uInt length, feed larger buffers in pieces
        auto p = reinterpret_cast<const Bytef*>(data);
        while (size > 0) {
            auto piece = static_cast<uInt>(std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
            crc = crc32(crc, p, piece);
            p += piece;
            size -= piece;
        }
        return static_cast<std::uint32_t>(crc);
    }
}
