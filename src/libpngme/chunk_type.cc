#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace pngme {

    namespace {
        // Printable rendering of untrusted bytes for error messages
        std::string escape_code(const std::byte* data, std::size_t size) {
            std::ostringstream os;
            for (std::size_t i = 0; i < size; i++) {
                auto c = static_cast<unsigned char>(data[i]);
                if (c >= 32 && c <= 126) {
                    os << static_cast<char>(c);
                } else {
                    os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                       << static_cast<unsigned>(c) << std::dec;
                }
            }
            return os.str();
        }
    }

    bool chunk_type::is_type_code(const bytes_type& bytes) {
        return std::all_of(bytes.begin(), bytes.end(), [](std::byte b) {
            return detail::is_ascii_letter(static_cast<char>(b));
        });
    }

    chunk_type chunk_type::from_bytes(const bytes_type& bytes) {
        if (!is_type_code(bytes)) {
            THROW_CHUNK_TYPE("Invalid chunk type '", escape_code(bytes.data(), bytes.size()),
                             "': bytes must be ASCII letters (A-Z, a-z)");
        }
        return {static_cast<char>(bytes[0]), static_cast<char>(bytes[1]),
                static_cast<char>(bytes[2]), static_cast<char>(bytes[3])};
    }

    chunk_type chunk_type::from_string(std::string_view text) {
        if (text.size() != 4) {
            THROW_CHUNK_TYPE("Invalid chunk type '",
                             escape_code(reinterpret_cast<const std::byte*>(text.data()), text.size()),
                             "': expected 4 characters, got ", text.size());
        }
        bytes_type code;
        std::memcpy(code.data(), text.data(), 4);
        return from_bytes(code);
    }

    chunk_type::bytes_type chunk_type::bytes() const {
        bytes_type result;
        std::memcpy(result.data(), m_code.data(), 4);
        return result;
    }

    std::uint32_t chunk_type::to_uint32() const {
        return (static_cast<std::uint32_t>(static_cast<unsigned char>(m_code[0])) << 24) |
               (static_cast<std::uint32_t>(static_cast<unsigned char>(m_code[1])) << 16) |
               (static_cast<std::uint32_t>(static_cast<unsigned char>(m_code[2])) << 8) |
               static_cast<std::uint32_t>(static_cast<unsigned char>(m_code[3]));
    }

    std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
        if (os.flags() & std::ios::hex) {
            // Save and restore format flags
            auto flags = os.flags();
            auto fill = os.fill();
            os << "0x" << std::hex << std::setfill('0') << std::setw(8) << t.to_uint32();
            os.flags(flags);
            os.fill(fill);
        } else {
            os << '\'' << t.to_string_view() << '\'';
        }
        return os;
    }

} // namespace pngme
