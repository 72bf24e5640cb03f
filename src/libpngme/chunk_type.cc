//
// Chunk type validation and text form
//

#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>

#include <cstring>
#include <iomanip>

namespace pngme {

    chunk_type chunk_type::from_string(std::string_view text) {
        std::array<std::uint8_t, 4> code{};
        for (std::size_t i = 0; i < code.size(); i++) {
            // A missing character is reported as a NUL at its position
            auto byte = i < text.size() ? static_cast<std::uint8_t>(text[i]) : std::uint8_t(0);
            if (!is_valid_byte(byte)) {
                THROW_ERROR(invalid_byte_error, (byte, i),
                            "Invalid byte 0x", std::hex, std::setw(2), std::setfill('0'),
                            static_cast<unsigned>(byte), std::dec,
                            " at position ", i, " of chunk type \"", text, "\"");
            }
            code[i] = byte;
        }
        if (text.size() > code.size()) {
            auto byte = static_cast<std::uint8_t>(text[code.size()]);
            THROW_ERROR(invalid_byte_error, (byte, code.size()),
                        "Chunk type \"", text, "\" is longer than 4 characters");
        }
        return chunk_type(code);
    }

    chunk_type chunk_type::from_bytes(const std::array<std::uint8_t, 4>& bytes) {
        chunk_type result(bytes);
        if (!result.is_valid()) {
            THROW_ERROR(invalid_identifier_error, (bytes),
                        "Bad chunk type ", result, " (received [",
                        unsigned(bytes[0]), ", ", unsigned(bytes[1]), ", ",
                        unsigned(bytes[2]), ", ", unsigned(bytes[3]),
                        "]): reserved bit is set");
        }
        return result;
    }

    chunk_type chunk_type::from_bytes(const void* data) {
        std::array<std::uint8_t, 4> bytes{};
        std::memcpy(bytes.data(), data, bytes.size());
        return from_bytes(bytes);
    }

    std::string chunk_type::to_string() const {
        return {m_code.begin(), m_code.end()};
    }

    std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
        os << '\'';
        for (auto c : t.bytes()) {
            if (c >= 32 && c <= 126) {
                os << static_cast<char>(c);
            } else {
                // Escape non-printable characters
                auto flags = os.flags();
                auto fill = os.fill();
                os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                   << static_cast<unsigned>(c);
                os.flags(flags);
                os.fill(fill);
            }
        }
        os << '\'';
        return os;
    }
}
