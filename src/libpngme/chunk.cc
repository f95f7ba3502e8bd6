#include <pngme/chunk.hh>
#include <pngme/crc.hh>
#include <pngme/exceptions.hh>

#include <algorithm>
#include <iomanip>
#include <limits>
#include <ostream>

#include "chunk_codec.hh"
#include "input.hh"
#include "output.hh"
#include "utf8.hh"

namespace pngme {

    namespace {
        constexpr std::uint64_t max_length = std::numeric_limits<std::uint32_t>::max();
        constexpr std::size_t text_preview = 64;
        constexpr std::size_t hex_preview = 16;

        bool is_text_byte(std::byte b) {
            auto c = static_cast<unsigned char>(b);
            return (c >= 32 && c <= 126) || c == '\n' || c == '\r' || c == '\t';
        }
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> data)
        : m_type(type)
        , m_data(std::move(data))
        , m_crc(0) {
        if (static_cast<std::uint64_t>(m_data.size()) > max_length) {
            THROW_SIZE_LIMIT("Chunk ", m_type, " payload of ", m_data.size(),
                             " bytes exceeds the maximum chunk length of ", max_length, " bytes");
        }
        m_crc = chunk_crc(m_type, m_data.data(), m_data.size());
    }

    chunk::chunk(chunk_type type, std::string_view text)
        : chunk(type, std::vector<std::byte>(reinterpret_cast<const std::byte*>(text.data()),
                                             reinterpret_cast<const std::byte*>(text.data()) + text.size())) {
    }

    chunk read_chunk(memory_reader& in, const parse_options& options) {
        const std::uint64_t offset = in.tell();

        THROW_PARSE_IF(in.remaining() < 8, "Truncated chunk header at offset ", offset,
                       ": need 8 bytes, only ", in.remaining(), " available");

        auto length = in.read<std::uint32_t>(byte_order::big);
        auto code = in.read_type_code();

        auto type = [&]() {
            try {
                return chunk_type::from_bytes(code);
            } catch (const chunk_type_error& e) {
                THROW_CHUNK_TYPE(e.what(), " (chunk at offset ", offset, ")");
            }
        }();

        if (!type.is_valid()) {
            if (options.strict) {
                THROW_CHUNK_TYPE("Chunk type ", type, " at offset ", offset,
                                 " is invalid: third letter must be uppercase (reserved bit)");
            }
            if (options.on_warning) {
                options.on_warning(offset, "reserved_bit",
                                   build_error_msg("Chunk type ", type,
                                                   " has a lowercase third letter (reserved bit set)"));
            }
        }

        if (length > options.max_chunk_size) {
            THROW_PARSE("Chunk ", type, " at offset ", offset, " has length ", length,
                        " bytes, which exceeds maximum allowed size of ", options.max_chunk_size, " bytes");
        }

        const std::uint64_t body = static_cast<std::uint64_t>(length) + 4;
        THROW_PARSE_IF(in.remaining() < body, "Truncated chunk ", type, " at offset ", offset,
                       ": need ", body, " bytes of data and CRC, only ", in.remaining(), " available");

        auto data = in.read_exact(length);
        auto stored = in.read<std::uint32_t>(byte_order::big);

        chunk result(type, std::move(data));
        if (result.crc() != stored) {
            throw crc_error(result.crc(), stored,
                            build_error_msg("CRC mismatch in chunk ", type, " at offset ", offset,
                                            ": computed ", result.crc(), ", stored ", stored));
        }
        return result;
    }

    chunk chunk::from_bytes(const std::byte* data, std::size_t size, const parse_options& options) {
        memory_reader in(data, size);
        return read_chunk(in, options);
    }

    chunk chunk::from_bytes(const std::vector<std::byte>& bytes, const parse_options& options) {
        return from_bytes(bytes.data(), bytes.size(), options);
    }

    std::string chunk::data_as_string() const {
        if (auto bad = find_invalid_utf8(m_data.data(), m_data.size())) {
            THROW_ENCODING("Chunk ", m_type, " data is not valid UTF-8 text: ill-formed sequence at byte ", *bad);
        }
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    std::vector<std::byte> chunk::to_bytes() const {
        std::vector<std::byte> out;
        out.reserve(encoded_size());
        write_to(out);
        return out;
    }

    void chunk::write_to(std::vector<std::byte>& out) const {
        memory_writer writer(out);

        auto code = m_type.bytes();
        writer.write(length(), byte_order::big);
        writer.write(code.data(), code.size());
        writer.write(m_data.data(), m_data.size());
        writer.write(m_crc, byte_order::big);
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        auto flags = os.flags();
        auto fill = os.fill();

        os << std::dec << "chunk " << c.type() << " length=" << c.length()
           << " crc=0x" << std::hex << std::setfill('0') << std::setw(8) << c.crc();

        const auto& data = c.data();
        if (data.empty()) {
            os << " data=<empty>";
        } else if (std::all_of(data.begin(), data.end(), is_text_byte)) {
            os << " data=\"";
            std::size_t n = std::min(text_preview, data.size());
            for (std::size_t i = 0; i < n; ++i) {
                char ch = static_cast<char>(data[i]);
                if (ch == '\n') {
                    os << "\\n";
                } else if (ch == '\r') {
                    os << "\\r";
                } else if (ch == '\t') {
                    os << "\\t";
                } else if (ch == '"' || ch == '\\') {
                    os << '\\' << ch;
                } else {
                    os << ch;
                }
            }
            os << '"';
            if (data.size() > n) {
                os << "...";
            }
        } else {
            os << " data=[";
            std::size_t n = std::min(hex_preview, data.size());
            for (std::size_t i = 0; i < n; ++i) {
                if (i > 0) {
                    os << ' ';
                }
                os << std::setw(2) << static_cast<unsigned>(data[i]);
            }
            os << ']';
            if (data.size() > n) {
                os << "...";
            }
        }

        os.flags(flags);
        os.fill(fill);
        return os;
    }

} // namespace pngme
