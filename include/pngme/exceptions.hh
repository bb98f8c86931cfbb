/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the pngme library
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the pngme library.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <sstream>
#include <pngme/export_pngme.h>

namespace pngme {

    /**
     * @enum error_code
     * @brief Kind of failure carried by every pngme exception
     */
    enum class error_code {
        io,                 ///< File could not be opened, read or written
        invalid_tag_length, ///< Tag string is not exactly 4 characters
        invalid_tag_bytes,  ///< Tag contains a byte that is not an ASCII letter
        unexpected_eof,     ///< Buffer is shorter than a declared length demands
        checksum_mismatch,  ///< Stored CRC-32 disagrees with the computed one
        bad_signature,      ///< First 8 bytes are not the PNG signature
        trailing_bytes,     ///< Residual bytes too short to hold a chunk header
        chunk_too_large,    ///< Declared length exceeds parse_options::max_chunk_size
        chunk_not_found,    ///< No chunk with the requested tag
        invalid_utf8        ///< Payload cannot be decoded as UTF-8 text
    };

    /**
     * @brief Stable lower-case name of an error code
     */
    PNGME_EXPORT const char* to_string(error_code code) noexcept;

    /**
     * @class png_error
     * @brief Base exception class for all pngme errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every pngme failure with a single catch block while still
     * being able to tell the kinds apart through code().
     */
    class PNGME_EXPORT png_error : public std::runtime_error {
    public:
        png_error(error_code code, const std::string& msg)
            : std::runtime_error(msg), m_code(code) {}

        [[nodiscard]] error_code code() const noexcept { return m_code; }

    private:
        error_code m_code;
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when opening, reading or writing a file fails.
     */
    class PNGME_EXPORT io_error : public png_error {
    public:
        explicit io_error(const std::string& msg)
            : png_error(error_code::io, msg) {}
    };

    /**
     * @class parse_error
     * @brief Exception for malformed chunk streams
     *
     * Thrown when the signature, a chunk header, a tag or a checksum
     * violates the PNG framing rules. offset() is the absolute position
     * in the parsed buffer where the offending field starts.
     */
    class PNGME_EXPORT parse_error : public png_error {
    public:
        parse_error(error_code code, std::uint64_t offset, const std::string& msg)
            : png_error(code, msg), m_offset(offset) {}

        [[nodiscard]] std::uint64_t offset() const noexcept { return m_offset; }

    private:
        std::uint64_t m_offset;
    };

    /**
     * @class lookup_error
     * @brief Thrown when a chunk that must exist is missing
     */
    class PNGME_EXPORT lookup_error : public png_error {
    public:
        explicit lookup_error(const std::string& msg)
            : png_error(error_code::chunk_not_found, msg) {}
    };

    /**
     * @class encoding_error
     * @brief Thrown when a payload cannot be rendered as text
     *
     * offset() is the position of the first invalid byte inside the payload.
     */
    class PNGME_EXPORT encoding_error : public png_error {
    public:
        encoding_error(std::uint64_t offset, const std::string& msg)
            : png_error(error_code::invalid_utf8, msg), m_offset(offset) {}

        [[nodiscard]] std::uint64_t offset() const noexcept { return m_offset; }

    private:
        std::uint64_t m_offset;
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
     * @brief Throw a parse_error of the given kind at the given offset
     */
    #define THROW_PARSE(code, offset, ...) \
        throw ::pngme::parse_error((code), (offset), ::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_PARSE_IF
     * @brief Conditionally throw a parse_error
     */
    #define THROW_PARSE_IF(condition, code, offset, ...) \
        do { if (condition) THROW_PARSE(code, offset, __VA_ARGS__); } while(0)

    /**
     * @def THROW_PARSE_UNLESS
     * @brief Throw a parse_error unless condition is true
     */
    #define THROW_PARSE_UNLESS(condition, code, offset, ...) \
        do { if (!(condition)) THROW_PARSE(code, offset, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngme
