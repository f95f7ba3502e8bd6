/**
 * @file png.hh
 * @brief Ordered chunk container behind the PNG signature
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
     * @brief A PNG file seen as its signature followed by a list of chunks
     *
     * Chunks are kept in file order and treated as opaque records. Duplicate
     * types are allowed; lookups by type always act on the first match.
     * A png only comes into existence by parsing.
     */
    class PNGME_EXPORT png {
    public:
        static constexpr std::array<std::byte, 8> signature = {
            std::byte{0x89}, std::byte{0x50}, std::byte{0x4E}, std::byte{0x47},
            std::byte{0x0D}, std::byte{0x0A}, std::byte{0x1A}, std::byte{0x0A}
        };

        /**
         * @brief Parse a complete file image
         *
         * Checks the signature, then decodes records back to back until the
         * input is exhausted. Any failure aborts the whole parse.
         *
         * @throws parse_error, chunk_type_error, crc_error
         */
        static png parse(const std::byte* data, std::size_t size,
                         const parse_options& options = parse_options{});

        static png parse(const std::vector<std::byte>& bytes,
                         const parse_options& options = parse_options{});

        /**
         * @brief Read @p is to the end and parse the result
         * @throws io_error if the stream fails before end of file
         */
        static png parse(std::istream& is, const parse_options& options = parse_options{});

        [[nodiscard]] const std::array<std::byte, 8>& header() const { return signature; }
        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }

        void append_chunk(chunk c);

        /**
         * @brief Remove the first chunk whose type text equals @p type
         * @return The removed chunk
         * @throws not_found_error if no chunk has that type; nothing changes
         */
        chunk remove_chunk(std::string_view type);

        /**
         * @brief First chunk whose type text equals @p type
         * @return Pointer into the container, or nullptr. Invalidated by
         *         append_chunk() and remove_chunk().
         */
        [[nodiscard]] const chunk* chunk_by_type(std::string_view type) const;

        /**
         * @brief Signature followed by every encoded chunk
         */
        [[nodiscard]] std::vector<std::byte> to_bytes() const;

    private:
        png() = default;

        std::vector<chunk> m_chunks;
    };

    /**
     * @brief Multi-line listing: chunk count, then one line per chunk
     */
    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const png& p);

} // namespace pngme
