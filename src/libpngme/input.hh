//
// Byte buffer reader
//

#pragma once

#include <iosfwd>
#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <cstring>

#include <pngme/exceptions.hh>
#include "endian.hh"

namespace pngme {

    // Cursor over a byte buffer it does not own - throws on error
    class reader {
        public:
            enum whence_t {
                set,
                cur
            };

        public:
            reader(const void* data, std::size_t size);

            std::size_t read(void* dst, std::size_t size);
            void seek(std::uint64_t offset, whence_t whence);
            [[nodiscard]] std::uint64_t tell() const { return m_position; }
            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }

            // Pointer to the current position, valid while the buffer lives
            [[nodiscard]] const std::byte* current() const { return m_data + m_position; }

            std::vector<std::byte> read_exact(std::size_t size) {
                std::vector<std::byte> buffer(size);
                std::size_t actual = read(buffer.data(), size);
                THROW_IO_IF(actual != size, "Unexpected EOF: requested ", size, " got ", actual);
                return buffer;
            }

            // Big-endian u32, the encoding of PNG length and CRC fields
            std::uint32_t read_be32() {
                std::array<std::byte, 4> buff;
                std::size_t actual = read(buff.data(), buff.size());
                THROW_IO_IF(actual != buff.size(), "Failed to read ", buff.size(), " bytes");

                std::uint32_t value;
                std::memcpy(&value, buff.data(), sizeof(value));
                return swap32be(value);
            }

            // Read a big-endian u32 without moving the cursor
            std::uint32_t peek_be32() {
                std::size_t pos = m_position;
                std::uint32_t value = read_be32();
                m_position = pos;
                return value;
            }

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };

    // Read everything left in a stream
    std::vector<std::byte> read_stream(std::istream& is);
}
