/**
 * @file png.hh
 * @brief PNG file as an ordered sequence of chunks
 */

#pragma once

#include <array>
#include <cstddef>
#include <iosfwd>
#include <string_view>
#include <vector>
#include <pngme/export_pngme.h>
#include <pngme/chunk.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @class png
     * @brief The chunk container of a PNG file
     *
     * Holds the chunks in file order. Several chunks may share a type;
     * lookup and removal always act on the first one in file order.
     * Pixel data is never interpreted.
     */
    class PNGME_EXPORT png {
    public:
        static constexpr std::array<std::byte, 8> standard_header = {
            std::byte{0x89}, std::byte{'P'}, std::byte{'N'}, std::byte{'G'},
            std::byte{'\r'}, std::byte{'\n'}, std::byte{0x1A}, std::byte{'\n'}
        };

        png() = default;
        explicit png(std::vector<chunk> chunks);

        /**
         * @brief Parse a complete PNG file held in memory
         * @param data Pointer to the file contents
         * @param size Size of the file contents
         * @param options Parse options
         * @return Parsed container
         * @throws bad_signature_error if the data does not start with the PNG signature
         * @throws truncated_error if a chunk record runs past the end of the data
         * @throws parse_error if a chunk exceeds options.max_chunk_size in strict mode
         *
         * Errors from decoding a chunk are rethrown unchanged, located at
         * the index and offset of the failing record.
         */
        static png parse(const void* data, std::size_t size, const parse_options& options = {});
        static png parse(const std::vector<std::byte>& bytes, const parse_options& options = {});

        /**
         * @brief Read and parse a whole PNG stream
         * @throws io_error if the stream cannot be read
         */
        static png read(std::istream& stream, const parse_options& options = {});

        static const std::array<std::byte, 8>& signature() { return standard_header; }

        void append_chunk(chunk c);

        /**
         * @brief Find the first chunk of a type
         * @param type_name Textual chunk type, e.g. "IHDR"
         * @throws not_found_error if no chunk has this type
         */
        [[nodiscard]] const chunk& chunk_by_type(std::string_view type_name) const;

        /**
         * @brief Remove the first chunk of a type
         * @param type_name Textual chunk type
         * @return The removed chunk
         * @throws not_found_error if no chunk has this type
         */
        chunk remove_first_chunk(std::string_view type_name);

        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }

        /**
         * @brief Encode the file: signature followed by every chunk in order
         */
        [[nodiscard]] std::vector<std::byte> encode() const;

        /**
         * @brief Write encode() to a stream
         * @throws io_error if the stream fails
         */
        void write(std::ostream& stream) const;

    private:
        std::vector<chunk> m_chunks;
    };

    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const png& p);

} // namespace pngme
