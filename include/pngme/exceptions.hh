/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the pngme library
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the library.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>
#include <cstdint>

namespace pngme {

    /**
     * @class pngme_error
     * @brief Base exception class for all pngme errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every pngme-specific error with a single catch block.
     */
    class pngme_error : public std::runtime_error {
    public:
        explicit pngme_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when a file cannot be found, opened, read or written.
     */
    class io_error : public pngme_error {
    public:
        explicit io_error(const std::string& msg)
            : pngme_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Exception for malformed input
     *
     * Thrown when the signature does not match, a record is truncated,
     * or a record violates the chunk layout.
     */
    class parse_error : public pngme_error {
    public:
        explicit parse_error(const std::string& msg)
            : pngme_error(msg) {}
    };

    /**
     * @class crc_error
     * @brief Stored checksum of a chunk does not match its contents
     */
    class crc_error : public parse_error {
    public:
        crc_error(std::uint32_t computed, std::uint32_t stored, const std::string& msg)
            : parse_error(msg), m_computed(computed), m_stored(stored) {}

        [[nodiscard]] std::uint32_t computed() const noexcept { return m_computed; }
        [[nodiscard]] std::uint32_t stored() const noexcept { return m_stored; }

    private:
        std::uint32_t m_computed;
        std::uint32_t m_stored;
    };

    /**
     * @class chunk_type_error
     * @brief A type code contains something other than four ASCII letters
     */
    class chunk_type_error : public pngme_error {
    public:
        explicit chunk_type_error(const std::string& msg)
            : pngme_error(msg) {}
    };

    /**
     * @class not_found_error
     * @brief Lookup of a chunk type that is not present in the container
     */
    class not_found_error : public pngme_error {
    public:
        explicit not_found_error(const std::string& msg)
            : pngme_error(msg) {}
    };

    /**
     * @class encoding_error
     * @brief Chunk payload cannot be interpreted as UTF-8 text
     */
    class encoding_error : public pngme_error {
    public:
        explicit encoding_error(const std::string& msg)
            : pngme_error(msg) {}
    };

    /**
     * @class size_limit_error
     * @brief Payload does not fit the 32-bit length field
     */
    class size_limit_error : public pngme_error {
    public:
        explicit size_limit_error(const std::string& msg)
            : pngme_error(msg) {}
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
     * @def THROW_CHUNK_TYPE
     * @brief Throw a chunk_type_error with formatted message
     */
    #define THROW_CHUNK_TYPE(...) \
        throw ::pngme::chunk_type_error(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_NOT_FOUND
     * @brief Throw a not_found_error with formatted message
     */
    #define THROW_NOT_FOUND(...) \
        throw ::pngme::not_found_error(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_ENCODING
     * @brief Throw an encoding_error with formatted message
     */
    #define THROW_ENCODING(...) \
        throw ::pngme::encoding_error(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_SIZE_LIMIT
     * @brief Throw a size_limit_error with formatted message
     */
    #define THROW_SIZE_LIMIT(...) \
        throw ::pngme::size_limit_error(::pngme::build_error_msg(__VA_ARGS__))

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
    #define THROW_PARSE_IF(condition, ...) \
        do { if (condition) THROW_PARSE(__VA_ARGS__); } while(0)

    /**
     * @def THROW_IO_UNLESS
     * @brief Throw an io_error unless condition is true
     */
    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_PARSE_UNLESS
     * @brief Throw a parse_error unless condition is true
     */
    #define THROW_PARSE_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_PARSE(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngme
