//
// Chunk record decoding and encoding
//

#include <pngme/chunk.hh>
#include <pngme/exceptions.hh>
#include "input.hh"
#include "output.hh"
#include "crc.hh"
#include "utf8.hh"

#include <iomanip>
#include <ostream>
#include <utility>

namespace pngme {

    chunk::chunk(chunk_type type, std::vector<std::byte> data)
        : m_length(static_cast<std::uint32_t>(data.size()))
        , m_type(type)
        , m_data(std::move(data))
        , m_crc(chunk_crc(m_type, m_data)) {
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> data, std::uint32_t crc)
        : m_length(static_cast<std::uint32_t>(data.size()))
        , m_type(type)
        , m_data(std::move(data))
        , m_crc(crc) {
    }

    chunk chunk::decode(const void* data, std::size_t size,
                        const parse_options& options, std::uint64_t file_offset) {
        if (size < overhead) {
            THROW_ERROR(truncated_error, (overhead, size),
                        "Chunk record needs at least ", overhead, " bytes, got ", size);
        }

        reader in(data, size);
        auto declared_length = in.read_be32();
        auto type = chunk_type::from_bytes(in.current());
        in.seek(4, reader::cur);

        // Everything up to the trailing CRC is data
        auto payload = in.read_exact(size - overhead);
        auto declared_crc = in.read_be32();

        if (declared_length != payload.size() && options.on_warning) {
            options.on_warning(file_offset, "length_mismatch",
                build_error_msg("Chunk ", type, " declares length ", declared_length,
                                " but carries ", payload.size(), " bytes of data, using ",
                                payload.size()));
        }

        auto actual_crc = chunk_crc(type, payload);
        if (declared_crc != actual_crc) {
            THROW_ERROR(bad_checksum_error, (declared_crc, actual_crc),
                        "Bad CRC in chunk ", type, " (received ", std::hex, std::setw(8),
                        std::setfill('0'), declared_crc, ", expected ", std::setw(8), actual_crc, ")");
        }

        return chunk(type, std::move(payload), declared_crc);
    }

    chunk chunk::decode(const std::vector<std::byte>& bytes,
                        const parse_options& options, std::uint64_t file_offset) {
        return decode(bytes.data(), bytes.size(), options, file_offset);
    }

    std::string chunk::data_as_string() const {
        if (auto bad = find_invalid_utf8(m_data.data(), m_data.size())) {
            THROW_ERROR(invalid_encoding_error, (*bad),
                        "Data of chunk ", m_type, " is not valid UTF-8 (byte ", *bad, ")");
        }
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    std::vector<std::byte> chunk::encode() const {
        std::vector<std::byte> out;
        out.reserve(encoded_size());
        encode_to(out);
        return out;
    }

    void chunk::encode_to(std::vector<std::byte>& out) const {
        writer w(out);
        w.write_be32(m_length);
        w.write(m_type.bytes().data(), m_type.bytes().size());
        w.write(m_data.data(), m_data.size());
        w.write_be32(m_crc);
    }

    bool chunk::operator==(const chunk& o) const {
        return m_length == o.m_length && m_type == o.m_type &&
               m_crc == o.m_crc && m_data == o.m_data;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        os << "Chunk {\n"
           << "  Length: " << c.length() << "\n"
           << "  Type: " << c.type() << "\n"
           << "  Data: " << c.data().size() << " bytes\n"
           << "  Crc: " << c.crc() << "\n"
           << "}";
        return os;
    }

} // namespace pngme
