//
// Chunk CRC
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

#include <pngme/chunk_type.hh>

namespace pngme {

    // CRC-32/ISO-HDLC (the PNG / zlib CRC) of the type bytes followed by the data
    std::uint32_t chunk_crc(const chunk_type& type, const std::byte* data, std::size_t size);

    inline std::uint32_t chunk_crc(const chunk_type& type, const std::vector<std::byte>& data) {
        return chunk_crc(type, data.data(), data.size());
    }
}
