//
// CRC-32 through zlib
//

#include <pngme/crc32.hh>
#include <algorithm>
#include <limits>
#include <zlib.h>

namespace pngme {

    std::uint32_t crc32(std::uint32_t crc, const std::byte* data, std::size_t size) {
        uLong value = crc;
        // zlib takes a uInt length; feed larger buffers in slices
        while (size > 0) {
            auto n = static_cast<uInt>(std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
            value = ::crc32(value, reinterpret_cast<const Bytef*>(data), n);
            data += n;
            size -= n;
        }
        return static_cast<std::uint32_t>(value);
    }

    std::uint32_t chunk_crc(const chunk_tag& tag, const std::byte* data, std::size_t size) {
        auto tag_bytes = tag.bytes();
        std::uint32_t crc = crc32(0, tag_bytes.data(), tag_bytes.size());
        return crc32(crc, data, size);
    }

}
