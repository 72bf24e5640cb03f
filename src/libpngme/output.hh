//
// Byte buffer writer
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <vector>

#include "endian.hh"

namespace pngme {

    // Appends to a byte buffer it does not own
    class writer {
        public:
            explicit writer(std::vector<std::byte>& out) : m_out(out) {}

            void write(const void* src, std::size_t size) {
                if (size == 0) {
                    return;
                }
                auto first = static_cast<const std::byte*>(src);
                m_out.insert(m_out.end(), first, first + size);
            }

            // Big-endian u32, the encoding of PNG length and CRC fields
            void write_be32(std::uint32_t value) {
                value = swap32be(value);
                std::byte buff[sizeof(value)];
                std::memcpy(buff, &value, sizeof(value));
                write(buff, sizeof(value));
            }

        private:
            std::vector<std::byte>& m_out;
    };
}
