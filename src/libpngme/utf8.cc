//
// UTF-8 validation for payload display
//

#include "utf8.hh"
#include <cstdint>

namespace pngme {

    std::optional<std::size_t> find_invalid_utf8(const std::byte* data, std::size_t size) {
        std::size_t i = 0;
        while (i < size) {
            auto c = std::to_integer<std::uint8_t>(data[i]);
            if (c < 0x80) {
                i++;
                continue;
            }

            std::size_t len;
            // Allowed range of the second byte, tighter than 80..BF for the
            // lead bytes that could otherwise encode overlongs or surrogates
            std::uint8_t lo = 0x80, hi = 0xBF;
            if (c >= 0xC2 && c <= 0xDF) {
                len = 2;
            } else if (c >= 0xE0 && c <= 0xEF) {
                len = 3;
                if (c == 0xE0) lo = 0xA0;
                if (c == 0xED) hi = 0x9F;
            } else if (c >= 0xF0 && c <= 0xF4) {
                len = 4;
                if (c == 0xF0) lo = 0x90;
                if (c == 0xF4) hi = 0x8F;
            } else {
                return i;
            }

            if (size - i < len) {
                return i;
            }
            auto c1 = std::to_integer<std::uint8_t>(data[i + 1]);
            if (c1 < lo || c1 > hi) {
                return i;
            }
            for (std::size_t k = 2; k < len; k++) {
                auto ck = std::to_integer<std::uint8_t>(data[i + k]);
                if ((ck & 0xC0) != 0x80) {
                    return i;
                }
            }
            i += len;
        }
        return std::nullopt;
    }
}
