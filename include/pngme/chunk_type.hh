/**
 * @file chunk_type.hh
 * @brief Four letter PNG chunk type code and its property bits
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <string_view>

#include <pngme/export_pngme.h>

namespace pngme {

    namespace detail {
        constexpr bool is_ascii_letter(char c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        constexpr bool is_ascii_upper(char c) {
            return c >= 'A' && c <= 'Z';
        }

        constexpr bool is_ascii_lower(char c) {
            return c >= 'a' && c <= 'z';
        }
    }

    class chunk_type;
    constexpr chunk_type operator""_ct(const char* str, std::size_t len);

    /**
     * @class chunk_type
     * @brief Immutable 4-byte chunk type code
     *
     * Every byte is an ASCII letter. Bit 5 of each byte (the letter case)
     * carries one property:
     *  - byte 0: uppercase means critical, lowercase ancillary
     *  - byte 1: uppercase means public, lowercase private
     *  - byte 2: must be uppercase in the current PNG standard
     *  - byte 3: lowercase means safe to copy
     *
     * A type with a lowercase third letter can be constructed but
     * is_valid() reports false for it.
     */
    class PNGME_EXPORT chunk_type {
    public:
        using bytes_type = std::array<std::byte, 4>;

        /**
         * @brief Create a type from raw bytes
         * @throws chunk_type_error if any byte is not an ASCII letter
         */
        static chunk_type from_bytes(const bytes_type& bytes);

        /**
         * @brief Create a type from its 4 character text form
         * @throws chunk_type_error if the text is not exactly 4 ASCII letters
         */
        static chunk_type from_string(std::string_view text);

        /**
         * @brief Check whether raw bytes would form a constructible type
         */
        [[nodiscard]] static bool is_type_code(const bytes_type& bytes);

        [[nodiscard]] bytes_type bytes() const;

        [[nodiscard]] std::string to_string() const {
            return {m_code.data(), 4};
        }

        [[nodiscard]] std::string_view to_string_view() const {
            return {m_code.data(), 4};
        }

        // Big-endian numeric value of the code, e.g. 0x49484452 for IHDR
        [[nodiscard]] std::uint32_t to_uint32() const;

        constexpr char operator[](std::size_t i) const { return m_code[i]; }

        // Ancillary bit is 0
        [[nodiscard]] constexpr bool is_critical() const {
            return detail::is_ascii_upper(m_code[0]);
        }

        // Private bit is 0
        [[nodiscard]] constexpr bool is_public() const {
            return detail::is_ascii_upper(m_code[1]);
        }

        [[nodiscard]] constexpr bool is_reserved_bit_valid() const {
            return detail::is_ascii_upper(m_code[2]);
        }

        [[nodiscard]] constexpr bool is_safe_to_copy() const {
            return detail::is_ascii_lower(m_code[3]);
        }

        /**
         * @brief All bytes are letters and the reserved bit is clear
         */
        [[nodiscard]] constexpr bool is_valid() const {
            return detail::is_ascii_letter(m_code[0]) && detail::is_ascii_letter(m_code[1]) &&
                   detail::is_ascii_letter(m_code[2]) && detail::is_ascii_letter(m_code[3]) &&
                   is_reserved_bit_valid();
        }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return m_code == o.m_code; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_code < o.m_code; }
        bool operator<=(const chunk_type& o) const { return m_code <= o.m_code; }
        bool operator>(const chunk_type& o) const { return m_code > o.m_code; }
        bool operator>=(const chunk_type& o) const { return m_code >= o.m_code; }

        friend constexpr chunk_type operator""_ct(const char* str, std::size_t len);

    private:
        constexpr chunk_type(char c0, char c1, char c2, char c3)
            : m_code{c0, c1, c2, c3} {}

        std::array<char, 4> m_code;
    };

    /**
     * @brief Stream output
     *
     * Prints the quoted code ('RuSt'), or the big-endian value as
     * 0x%08x when the stream is in hex mode.
     */
    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const chunk_type& t);

    /**
     * @brief Compile-time chunk type literal, e.g. "IHDR"_ct
     *
     * Anything other than exactly four ASCII letters is rejected; in a
     * constant expression this is a compile error.
     */
    constexpr chunk_type operator""_ct(const char* str, std::size_t len) {
        if (len != 4) {
            throw std::invalid_argument("chunk type literal must be exactly 4 characters");
        }
        for (std::size_t i = 0; i < 4; i++) {
            if (!detail::is_ascii_letter(str[i])) {
                throw std::invalid_argument("chunk type literal must consist of ASCII letters");
            }
        }
        return {str[0], str[1], str[2], str[3]};
    }

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            // Golden-ratio multiplicative mix of the big-endian code
            return (static_cast<std::size_t>(t.to_uint32()) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

} // namespace pngme

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngme::chunk_type> {
        std::size_t operator()(const pngme::chunk_type& t) const noexcept {
            return pngme::chunk_type_hash{}(t);
        }
    };
}
