/**
 * @file chunk.hh
 * @brief A single PNG chunk record and its binary codec
 *
 * Wire layout of one record, all integers big-endian:
 *
 *     u32 length | 4-byte type | length bytes of data | u32 CRC-32(type + data)
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include <pngme/export_pngme.h>
#include <pngme/chunk_type.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @class chunk
     * @brief Immutable typed payload with a precomputed checksum
     */
    class PNGME_EXPORT chunk {
    public:
        /// Length field, type code and CRC
        static constexpr std::size_t overhead = 12;

        /**
         * @brief Create a chunk from a type and a payload
         * @throws size_limit_error if the payload does not fit a u32 length
         */
        chunk(chunk_type type, std::vector<std::byte> data);

        /**
         * @brief Create a chunk whose payload is the bytes of @p text
         */
        chunk(chunk_type type, std::string_view text);

        /**
         * @brief Decode one record starting at @p data
         *
         * Bytes following the record are ignored.
         *
         * @throws parse_error on truncated input or an oversized length field
         * @throws chunk_type_error if the type is not four letters, or (strict
         *         mode) has an invalid reserved bit
         * @throws crc_error if the stored CRC does not match
         */
        static chunk from_bytes(const std::byte* data, std::size_t size,
                                const parse_options& options = parse_options{});

        static chunk from_bytes(const std::vector<std::byte>& bytes,
                                const parse_options& options = parse_options{});

        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }
        [[nodiscard]] std::uint32_t length() const { return static_cast<std::uint32_t>(m_data.size()); }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        /// Size of the encoded record
        [[nodiscard]] std::size_t encoded_size() const { return overhead + m_data.size(); }

        /**
         * @brief Interpret the payload as UTF-8 text
         * @throws encoding_error if the payload is not well-formed UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /**
         * @brief Encode the record
         */
        [[nodiscard]] std::vector<std::byte> to_bytes() const;

        /**
         * @brief Append the encoded record to @p out
         */
        void write_to(std::vector<std::byte>& out) const;

        bool operator==(const chunk& o) const { return m_type == o.m_type && m_data == o.m_data; }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

    /**
     * @brief One-line summary: type, length, crc and a payload preview
     */
    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngme
