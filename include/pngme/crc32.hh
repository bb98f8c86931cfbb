/**
 * @file crc32.hh
 * @brief PNG chunk checksum
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <pngme/export_pngme.h>
#include <pngme/chunk_tag.hh>

namespace pngme {

    /**
     * @brief CRC-32 (ISO-HDLC, as used by zlib and PNG) of raw bytes
     * @param crc Running value, 0 to start a new checksum
     */
    PNGME_EXPORT std::uint32_t crc32(std::uint32_t crc, const std::byte* data, std::size_t size);

    /**
     * @brief Checksum stored in a chunk: CRC-32 over the tag bytes followed by the payload
     */
    PNGME_EXPORT std::uint32_t chunk_crc(const chunk_tag& tag, const std::byte* data, std::size_t size);

} // namespace pngme
