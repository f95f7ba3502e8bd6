/**
 * @file crc.hh
 * @brief CRC-32/ISO-HDLC as used by PNG chunk records
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include <pngme/export_pngme.h>
#include <pngme/chunk_type.hh>

namespace pngme {

    /**
     * @brief Checksum of a chunk record: CRC-32 over type bytes then data
     *
     * Polynomial 0x04C11DB7 reflected, init and xorout 0xFFFFFFFF.
     */
    PNGME_EXPORT std::uint32_t chunk_crc(const chunk_type& type, const std::byte* data, std::size_t size);

    /**
     * @brief Plain CRC-32/ISO-HDLC of a buffer, continuing from @p crc
     *
     * Pass 0 as @p crc for a fresh checksum.
     */
    PNGME_EXPORT std::uint32_t crc32_update(std::uint32_t crc, const std::byte* data, std::size_t size);

} // namespace pngme
