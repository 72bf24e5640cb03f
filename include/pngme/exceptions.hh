/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the pngme library
 *
 * Every failure the library can report has its own exception class
 * carrying the context of that failure (offending byte, expected and
 * received checksum, ...). All of them derive from pngme_error so a
 * caller can catch everything with a single catch block.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <pngme/export_pngme.h>

namespace pngme {

    /**
     * @class pngme_error
     * @brief Base exception class for all pngme errors
     */
    class PNGME_EXPORT pngme_error : public std::runtime_error {
    public:
        explicit pngme_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when reading from or writing to a stream fails.
     */
    class PNGME_EXPORT io_error : public pngme_error {
    public:
        explicit io_error(const std::string& msg)
            : pngme_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Exception for malformed PNG data
     *
     * Base of every decoding failure. When the failure happens inside a
     * container, the index of the offending chunk and the file offset of
     * its record are attached with locate() and appended to what().
     */
    class PNGME_EXPORT parse_error : public pngme_error {
    public:
        explicit parse_error(const std::string& msg)
            : pngme_error(msg), m_what(msg) {}

        [[nodiscard]] const char* what() const noexcept override { return m_what.c_str(); }

        /**
         * @brief Attach the position of the failing chunk record
         * @param chunk_index Zero based index of the chunk in the file
         * @param offset Absolute offset of the chunk record
         */
        void locate(std::size_t chunk_index, std::uint64_t offset);

        [[nodiscard]] std::optional<std::size_t> chunk_index() const { return m_chunk_index; }
        [[nodiscard]] std::optional<std::uint64_t> offset() const { return m_offset; }

    private:
        std::string m_what;
        std::optional<std::size_t> m_chunk_index;
        std::optional<std::uint64_t> m_offset;
    };

    /**
     * @class invalid_byte_error
     * @brief A textual chunk type contains a character that is not an ASCII letter
     */
    class PNGME_EXPORT invalid_byte_error : public pngme_error {
    public:
        invalid_byte_error(const std::string& msg, std::uint8_t byte, std::size_t position)
            : pngme_error(msg), m_byte(byte), m_position(position) {}

        [[nodiscard]] std::uint8_t byte() const { return m_byte; }
        [[nodiscard]] std::size_t position() const { return m_position; }

    private:
        std::uint8_t m_byte;
        std::size_t m_position;
    };

    /**
     * @class invalid_identifier_error
     * @brief Raw chunk type bytes have the reserved bit set
     */
    class PNGME_EXPORT invalid_identifier_error : public parse_error {
    public:
        invalid_identifier_error(const std::string& msg, const std::array<std::uint8_t, 4>& bytes)
            : parse_error(msg), m_bytes(bytes) {}

        [[nodiscard]] const std::array<std::uint8_t, 4>& bytes() const { return m_bytes; }

    private:
        std::array<std::uint8_t, 4> m_bytes;
    };

    /**
     * @class bad_checksum_error
     * @brief Stored CRC of a chunk disagrees with the CRC of its type and data
     */
    class PNGME_EXPORT bad_checksum_error : public parse_error {
    public:
        bad_checksum_error(const std::string& msg, std::uint32_t received, std::uint32_t expected)
            : parse_error(msg), m_received(received), m_expected(expected) {}

        [[nodiscard]] std::uint32_t received() const { return m_received; }
        [[nodiscard]] std::uint32_t expected() const { return m_expected; }

    private:
        std::uint32_t m_received;
        std::uint32_t m_expected;
    };

    /**
     * @class bad_signature_error
     * @brief Data does not start with the PNG signature
     *
     * received() holds the leading bytes that were found (fewer than 8
     * when the input is shorter than the signature).
     */
    class PNGME_EXPORT bad_signature_error : public parse_error {
    public:
        bad_signature_error(const std::string& msg, std::string received)
            : parse_error(msg), m_received(std::move(received)) {}

        [[nodiscard]] const std::string& received() const { return m_received; }

    private:
        std::string m_received;
    };

    /**
     * @class truncated_error
     * @brief A chunk record needs more bytes than are available
     */
    class PNGME_EXPORT truncated_error : public parse_error {
    public:
        truncated_error(const std::string& msg, std::uint64_t needed, std::uint64_t available)
            : parse_error(msg), m_needed(needed), m_available(available) {}

        [[nodiscard]] std::uint64_t needed() const { return m_needed; }
        [[nodiscard]] std::uint64_t available() const { return m_available; }

    private:
        std::uint64_t m_needed;
        std::uint64_t m_available;
    };

    /**
     * @class not_found_error
     * @brief No chunk of the requested type exists in the container
     */
    class PNGME_EXPORT not_found_error : public pngme_error {
    public:
        not_found_error(const std::string& msg, std::string type_name)
            : pngme_error(msg), m_type_name(std::move(type_name)) {}

        [[nodiscard]] const std::string& type_name() const { return m_type_name; }

    private:
        std::string m_type_name;
    };

    /**
     * @class invalid_encoding_error
     * @brief Chunk data is not valid UTF-8
     */
    class PNGME_EXPORT invalid_encoding_error : public pngme_error {
    public:
        invalid_encoding_error(const std::string& msg, std::size_t offset)
            : pngme_error(msg), m_offset(offset) {}

        /// Offset of the first byte that does not start a valid sequence
        [[nodiscard]] std::size_t offset() const { return m_offset; }

    private:
        std::size_t m_offset;
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     */
    #define THROW_IO(...) \
        throw ::pngme::io_error(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_PARSE
     * @brief Throw a parse_error with formatted message
     */
    #define THROW_PARSE(...) \
        throw ::pngme::parse_error(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_ERROR
     * @brief Throw a specific pngme exception type
     * @param type Exception class to throw
     * @param context Parenthesised list of the constructor arguments that follow the message
     * @param ... Variable arguments to format into error message
     *
     * @code
     * THROW_ERROR(not_found_error, (name), "No chunk of type ", name);
     * @endcode
     */
    #define THROW_ERROR(type, context, ...) \
        throw ::pngme::type(::pngme::build_error_msg(__VA_ARGS__), PNGME_UNPACK context)

    #define PNGME_UNPACK(...) __VA_ARGS__

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_IO_UNLESS
     * @brief Throw an io_error unless condition is true
     */
    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngme
