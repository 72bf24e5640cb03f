//
// PNG chunk type code
//
#pragma once
#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <ostream>
#include <pngme/export_pngme.h>

namespace pngme {
    /**
     * @class chunk_type
     * @brief Four byte PNG chunk type code
     *
     * The case of each letter carries one property of the chunk. Bit 5
     * (0x20) of a byte is set for lowercase letters:
     *
     * | byte | property        | uppercase (bit clear) | lowercase (bit set) |
     * |------|-----------------|-----------------------|---------------------|
     * | 0    | ancillary bit   | critical              | ancillary           |
     * | 1    | private bit     | public                | private             |
     * | 2    | reserved bit    | valid                 | invalid             |
     * | 3    | safe-to-copy bit| unsafe to copy        | safe to copy        |
     *
     * Instances are immutable and can only be obtained through
     * from_string() or from_bytes().
     */
    class PNGME_EXPORT chunk_type {
    public:
        static constexpr std::uint8_t case_bit = 0x20;

        /**
         * @brief Build a chunk type from its textual form
         * @param text Exactly four ASCII letters
         * @throws invalid_byte_error on the first character that is not a letter
         *
         * The reserved bit is not checked, so "Rust" is accepted here and
         * reported as !is_valid().
         */
        static chunk_type from_string(std::string_view text);

        /**
         * @brief Build a chunk type from raw bytes read from a file
         * @param bytes The four type bytes
         * @throws invalid_identifier_error if the reserved bit is set
         */
        static chunk_type from_bytes(const std::array<std::uint8_t, 4>& bytes);
        static chunk_type from_bytes(const void* data);

        [[nodiscard]] static constexpr bool is_valid_byte(std::uint8_t byte) {
            return (byte >= 'A' && byte <= 'Z') || (byte >= 'a' && byte <= 'z');
        }

        [[nodiscard]] const std::array<std::uint8_t, 4>& bytes() const { return m_code; }

        /// Byte 0 uppercase
        [[nodiscard]] bool is_critical() const { return (m_code[0] & case_bit) == 0; }
        /// Byte 1 uppercase
        [[nodiscard]] bool is_public() const { return (m_code[1] & case_bit) == 0; }
        /// Byte 2 uppercase
        [[nodiscard]] bool is_reserved_bit_valid() const { return (m_code[2] & case_bit) == 0; }
        /// Byte 3 lowercase
        [[nodiscard]] bool is_safe_to_copy() const { return (m_code[3] & case_bit) != 0; }

        [[nodiscard]] bool is_valid() const { return is_reserved_bit_valid(); }

        [[nodiscard]] std::string to_string() const;

        bool operator==(const chunk_type& o) const { return m_code == o.m_code; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_code < o.m_code; }

    private:
        explicit chunk_type(const std::array<std::uint8_t, 4>& code) : m_code(code) {}

        std::array<std::uint8_t, 4> m_code;
    };

    // Stream output, non printable bytes escaped as \xNN
    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const chunk_type& t);

    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            const auto& b = t.bytes();
            std::uint32_t v = (std::uint32_t(b[0]) << 24) | (std::uint32_t(b[1]) << 16) |
                              (std::uint32_t(b[2]) << 8) | std::uint32_t(b[3]);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };
}

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngme::chunk_type> {
        std::size_t operator()(const pngme::chunk_type& t) const noexcept {
            return pngme::chunk_type_hash{}(t);
        }
    };
}
