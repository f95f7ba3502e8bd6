#include <pngme/crc.hh>

#include <algorithm>
#include <limits>

#include <zlib.h>

namespace pngme {

    std::uint32_t crc32_update(std::uint32_t crc, const std::byte* data, std::size_t size) {
        uLong value = crc;
        // zlib takes uInt lengths
        while (size > 0) {
            auto n = static_cast<uInt>(std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
            value = ::crc32(value, reinterpret_cast<const Bytef*>(data), n);
            data += n;
            size -= n;
        }
        return static_cast<std::uint32_t>(value);
    }

    std::uint32_t chunk_crc(const chunk_type& type, const std::byte* data, std::size_t size) {
        auto code = type.bytes();
        std::uint32_t crc = crc32_update(0, code.data(), code.size());
        return crc32_update(crc, data, size);
    }

} // namespace pngme
