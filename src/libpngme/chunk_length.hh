#pragma once

#include <cstddef>
#include <cstdint>
#include <pngme/exceptions.hh>

namespace pngme {

    // Largest length field PNG allows
    inline constexpr std::uint32_t max_chunk_length = 0x7FFFFFFFu;

    /**
     * @brief Payload size as a chunk length field
     * @throws png_error chunk_too_large if the size does not fit in 31 bits
     */
    inline std::uint32_t checked_chunk_length(std::size_t size) {
        if (size > max_chunk_length) {
            throw png_error(error_code::chunk_too_large, build_error_msg(
                "Chunk payload of ", size, " bytes exceeds the PNG limit of ",
                max_chunk_length, " bytes"));
        }
        return static_cast<std::uint32_t>(size);
    }

}
