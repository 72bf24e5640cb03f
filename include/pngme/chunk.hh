/**
 * @file chunk.hh
 * @brief A single PNG chunk record
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>
#include <pngme/export_pngme.h>
#include <pngme/chunk_type.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @class chunk
     * @brief Length-prefixed chunk: type, opaque data and CRC
     *
     * Encoded layout, integers big-endian:
     *
     *     length (4) | type (4) | data (length) | crc (4)
     *
     * The CRC covers the type and data bytes. A chunk owns its data.
     */
    class PNGME_EXPORT chunk {
    public:
        /// Size of the length, type and crc fields together
        static constexpr std::size_t overhead = 12;

        /**
         * @brief Create a chunk, computing its length and CRC
         * @param type Chunk type
         * @param data Chunk payload
         */
        chunk(chunk_type type, std::vector<std::byte> data);

        /**
         * @brief Decode one encoded chunk record
         * @param data Pointer to the record
         * @param size Size of the whole record, including the CRC
         * @param options Warning handler for the length mismatch recovery
         * @param file_offset Offset of the record, passed to warnings
         * @return Decoded chunk
         * @throws truncated_error if size is less than 12
         * @throws invalid_identifier_error if the type has the reserved bit set
         * @throws bad_checksum_error if the stored CRC is wrong
         *
         * The data is everything between the type and the last four
         * bytes. If that does not match the declared length, a
         * "length_mismatch" warning is reported and the length is taken
         * from the data. Without an on_warning handler the recovery is
         * silent.
         */
        static chunk decode(const void* data, std::size_t size,
                            const parse_options& options = {},
                            std::uint64_t file_offset = 0);

        static chunk decode(const std::vector<std::byte>& bytes,
                            const parse_options& options = {},
                            std::uint64_t file_offset = 0);

        [[nodiscard]] std::uint32_t length() const { return m_length; }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        /**
         * @brief Interpret the data as UTF-8 text
         * @throws invalid_encoding_error if the data is not well-formed UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /**
         * @brief Encode the chunk record
         * @return length, type, data and crc as described above
         */
        [[nodiscard]] std::vector<std::byte> encode() const;

        /**
         * @brief Append the encoded record to a buffer
         */
        void encode_to(std::vector<std::byte>& out) const;

        [[nodiscard]] std::size_t encoded_size() const { return overhead + m_data.size(); }

        bool operator==(const chunk& o) const;
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk(chunk_type type, std::vector<std::byte> data, std::uint32_t crc);

        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngme
