//
// Bounded reader over an in-memory byte buffer
//

#pragma once

#include <cstddef>
#include <cstdint>

#include <pngme/exceptions.hh>
#include <pngme/endian.hh>
#include <pngme/chunk_tag.hh>

namespace pngme {

    // Reads forward through [data, data + size). Offsets in errors are
    // absolute: base_offset is the position of data in the whole stream.
    class reader {
        public:
            reader(const std::byte* data, std::size_t size, std::uint64_t base_offset = 0)
                : m_data(data), m_size(size), m_base(base_offset), m_position(0) {}

            // Returns a pointer to the next n bytes and advances past them
            const std::byte* read_exact(std::size_t n, const char* what);

            std::uint32_t read_u32be(const char* what) {
                return load32be(read_exact(4, what));
            }

            chunk_tag read_tag() {
                std::uint64_t at = tell();
                return chunk_tag::from_bytes(read_exact(chunk_tag::size, "chunk type"), at);
            }

            // Absolute offset of the next byte
            [[nodiscard]] std::uint64_t tell() const { return m_base + m_position; }
            [[nodiscard]] std::size_t position() const { return m_position; }
            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::uint64_t m_base;
            std::size_t m_position;
    };
}
