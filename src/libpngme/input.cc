#include <algorithm>

#include "input.hh"

namespace pngme {
    memory_reader::memory_reader(const std::byte* data, std::size_t size)
        : m_data(data), m_size(size), m_position(0) {
        THROW_PARSE_IF(!data && size != 0, "Null buffer of size ", size);
    }

    memory_reader::memory_reader(const std::vector<std::byte>& data)
        : memory_reader(data.data(), data.size()) {}

    std::size_t memory_reader::read(void* dst, std::size_t size) {
        if (size == 0) {
            return 0;
        }
        THROW_PARSE_UNLESS(dst, "Null buffer in read");

        std::size_t actual = std::min(size, static_cast<std::size_t>(remaining()));
        if (actual > 0) {
            std::memcpy(dst, m_data + m_position, actual);
            m_position += actual;
        }
        return actual;
    }

    void memory_reader::require(std::uint64_t n, const char* what) const {
        THROW_PARSE_IF(n > remaining(), "Unexpected end of input at offset ", m_position,
                       ": need ", n, " bytes for ", what, ", only ", remaining(), " available");
    }

    std::vector<std::byte> memory_reader::read_exact(std::size_t size) {
        require(size, "data");
        std::vector<std::byte> buffer(size);
        read(buffer.data(), size);
        return buffer;
    }

    std::array<std::byte, 4> memory_reader::read_type_code() {
        require(4, "chunk type");
        std::array<std::byte, 4> code{};
        read(code.data(), 4);
        return code;
    }
}
