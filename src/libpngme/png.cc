//
// PNG container parsing and editing
//

#include <pngme/png.hh>
#include <pngme/exceptions.hh>
#include "input.hh"

#include <algorithm>
#include <cstring>
#include <istream>
#include <ostream>
#include <utility>

namespace pngme {

    png::png(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    png png::parse(const void* data, std::size_t size, const parse_options& options) {
        reader in(data, size);

        // Check the signature before looking at any chunk
        if (size < standard_header.size() ||
            std::memcmp(data, standard_header.data(), standard_header.size()) != 0) {
            std::string received;
            if (data) {
                received.assign(static_cast<const char*>(data), std::min(size, standard_header.size()));
            }
            THROW_ERROR(bad_signature_error, (received),
                        "Not a PNG file: bad signature (", received.size(), " leading bytes checked)");
        }
        in.seek(standard_header.size(), reader::set);

        png result;
        std::size_t index = 0;
        while (in.remaining() > 0) {
            std::uint64_t start_pos = in.tell();
            try {
                if (in.remaining() < chunk::overhead) {
                    THROW_ERROR(truncated_error, (chunk::overhead, in.remaining()),
                                "Truncated chunk header: ", in.remaining(), " bytes left, need ",
                                chunk::overhead);
                }

                auto length = in.peek_be32();
                if (length > options.max_chunk_size) {
                    if (options.strict) {
                        THROW_PARSE("Chunk at offset ", start_pos, " has length ", length,
                                    " bytes, which exceeds maximum allowed size of ",
                                    options.max_chunk_size, " bytes");
                    } else if (options.on_warning) {
                        options.on_warning(start_pos, "size_limit",
                            build_error_msg("Chunk length ", length, " exceeds maximum ",
                                            options.max_chunk_size));
                    }
                }

                std::uint64_t record_size = chunk::overhead + std::uint64_t(length);
                if (record_size > in.remaining()) {
                    THROW_ERROR(truncated_error, (record_size, in.remaining()),
                                "Chunk declares ", length, " bytes of data but only ",
                                in.remaining(), " bytes are left in the file");
                }

                result.m_chunks.push_back(
                    chunk::decode(in.current(), static_cast<std::size_t>(record_size), options, start_pos));
                in.seek(record_size, reader::cur);
            } catch (parse_error& e) {
                e.locate(index, start_pos);
                throw;
            }
            index++;
        }

        return result;
    }

    png png::parse(const std::vector<std::byte>& bytes, const parse_options& options) {
        return parse(bytes.data(), bytes.size(), options);
    }

    png png::read(std::istream& stream, const parse_options& options) {
        auto bytes = read_stream(stream);
        return parse(bytes, options);
    }

    void png::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    namespace {
        bool type_matches(const chunk& c, std::string_view type_name) {
            const auto& b = c.type().bytes();
            return type_name.size() == b.size() &&
                   std::equal(b.begin(), b.end(), type_name.begin(),
                              [](std::uint8_t x, char y) { return x == static_cast<std::uint8_t>(y); });
        }
    }

    const chunk& png::chunk_by_type(std::string_view type_name) const {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(),
                               [type_name](const chunk& c) { return type_matches(c, type_name); });
        if (it == m_chunks.end()) {
            THROW_ERROR(not_found_error, (std::string(type_name)),
                        "No chunk of type '", type_name, "' in file");
        }
        return *it;
    }

    chunk png::remove_first_chunk(std::string_view type_name) {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(),
                               [type_name](const chunk& c) { return type_matches(c, type_name); });
        if (it == m_chunks.end()) {
            THROW_ERROR(not_found_error, (std::string(type_name)),
                        "No chunk of type '", type_name, "' to remove");
        }
        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    std::vector<std::byte> png::encode() const {
        std::size_t total = standard_header.size();
        for (const auto& c : m_chunks) {
            total += c.encoded_size();
        }

        std::vector<std::byte> out;
        out.reserve(total);
        out.insert(out.end(), standard_header.begin(), standard_header.end());
        for (const auto& c : m_chunks) {
            c.encode_to(out);
        }
        return out;
    }

    void png::write(std::ostream& stream) const {
        auto bytes = encode();
        stream.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        THROW_IO_UNLESS(stream.good(), "Failed to write ", bytes.size(), " bytes of PNG data");
    }

    std::ostream& operator<<(std::ostream& os, const png& p) {
        os << "PNG with " << p.chunks().size() << " chunks\n";
        for (const auto& c : p.chunks()) {
            os << c << "\n";
        }
        return os;
    }

} // namespace pngme
