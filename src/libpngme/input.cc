//
// Byte buffer reader and stream slurping
//

#include <istream>
#include <algorithm>
#include <string>

#include "input.hh"

namespace pngme {

    reader::reader(const void* data, std::size_t size)
        : m_data(static_cast<const std::byte*>(data)), m_size(size), m_position(0) {
        THROW_IO_IF(!data && size > 0, "Null buffer of size ", size);
    }

    std::size_t reader::read(void* dst, std::size_t size) {
        if (size == 0) {
            return 0;
        }

        THROW_IO_UNLESS(dst, "Null buffer in read");

        std::size_t available = remaining();
        if (available == 0) {
            return 0;  // EOF-like behavior
        }

        size = std::min(size, available);
        std::memcpy(dst, m_data + m_position, size);
        m_position += size;
        return size;
    }

    void reader::seek(std::uint64_t offset, whence_t whence) {
        std::uint64_t new_pos = whence == set ? offset : m_position + offset;

        if (new_pos > m_size) {
            std::string error = "Cannot seek to offset " + std::to_string(new_pos);
            error += " - buffer size is only " + std::to_string(m_size) + " bytes";
            THROW_IO(error);
        }

        m_position = static_cast<std::size_t>(new_pos);
    }

    std::vector<std::byte> read_stream(std::istream& is) {
        THROW_IO_UNLESS(is.good(), "Stream in bad state");

        std::vector<std::byte> result;
        std::array<char, 64 * 1024> buffer{};

        while (is) {
            is.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto got = static_cast<std::size_t>(is.gcount());
            auto first = reinterpret_cast<const std::byte*>(buffer.data());
            result.insert(result.end(), first, first + got);
        }

        THROW_IO_IF(is.bad(), "Stream read failed after ", result.size(), " bytes");
        return result;
    }
}
