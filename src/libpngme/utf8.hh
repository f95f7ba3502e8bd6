#pragma once

#include <cstddef>
#include <optional>

#include <pngme/export_pngme.h>

namespace pngme {
    // Offset of the first byte that starts an ill-formed UTF-8 sequence,
    // or nullopt if the whole buffer is well-formed (RFC 3629).
    PNGME_EXPORT std::optional<std::size_t> find_invalid_utf8(const std::byte* data, std::size_t size);
}
