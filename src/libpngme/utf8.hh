//
// UTF-8 validation for payload display
//

#pragma once

#include <cstddef>
#include <optional>

namespace pngme {

    // Offset of the first byte that breaks RFC 3629 UTF-8, or nullopt if
    // the whole buffer is well formed. Overlong forms, surrogates and code
    // points above U+10FFFF are rejected.
    std::optional<std::size_t> find_invalid_utf8(const std::byte* data, std::size_t size);

    inline bool is_valid_utf8(const std::byte* data, std::size_t size) {
        return !find_invalid_utf8(data, size).has_value();
    }
}
