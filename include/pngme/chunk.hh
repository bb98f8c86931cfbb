/**
 * @file chunk.hh
 * @brief A single length-prefixed, tagged and checksummed PNG record
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>
#include <pngme/export_pngme.h>
#include <pngme/chunk_tag.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @class chunk
     * @brief One chunk of a PNG stream
     *
     * Wire layout:
     * @code
     *   [u32 BE length][4 tag bytes][length payload bytes][u32 BE CRC-32]
     * @endcode
     * The checksum covers the tag and the payload. A chunk is immutable once
     * constructed; replacing one means removing it and appending another.
     */
    class PNGME_EXPORT chunk {
    public:
        /// Bytes of framing around the payload: length, tag and checksum
        static constexpr std::size_t overhead = 12;

        /**
         * @brief Create a chunk, deriving length and checksum from the payload
         * @throws png_error chunk_too_large if the payload exceeds 2^31 - 1 bytes
         */
        chunk(const chunk_tag& tag, std::vector<std::byte> data);

        /**
         * @brief Decode the chunk at the start of a buffer
         *
         * Bytes after the chunk are not examined.
         *
         * @param data Start of the buffer
         * @param size Number of bytes available
         * @param base_offset Position of data within the enclosing stream, used in errors
         * @param options Size limit and warning handler
         * @throws parse_error unexpected_eof, invalid_tag_bytes, chunk_too_large, checksum_mismatch
         */
        static chunk parse(const std::byte* data, std::size_t size,
                           std::uint64_t base_offset, const parse_options& options);

        static chunk parse(const std::byte* data, std::size_t size, std::uint64_t base_offset = 0) {
            return parse(data, size, base_offset, parse_options{});
        }

        static chunk parse(const std::vector<std::byte>& buffer) {
            return parse(buffer.data(), buffer.size());
        }

        [[nodiscard]] std::uint32_t length() const { return m_length; }
        [[nodiscard]] const chunk_tag& tag() const { return m_tag; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }
        [[nodiscard]] std::uint32_t checksum() const { return m_checksum; }

        /// Number of bytes serialize() produces
        [[nodiscard]] std::size_t encoded_size() const { return overhead + m_data.size(); }

        /**
         * @brief Encode length, tag, payload and checksum
         */
        [[nodiscard]] std::vector<std::byte> serialize() const;

        /**
         * @brief Payload interpreted as UTF-8 text
         * @throws encoding_error if the payload is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_text() const;

        bool operator==(const chunk& o) const;
        bool operator!=(const chunk& o) const { return !(*this == o); }
        bool operator<(const chunk& o) const;

    private:
        chunk(std::uint32_t length, const chunk_tag& tag, std::vector<std::byte> data, std::uint32_t checksum);

        std::uint32_t m_length;
        chunk_tag m_tag;
        std::vector<std::byte> m_data;
        std::uint32_t m_checksum;
    };

    // Payload text, or a size placeholder for binary payloads
    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngme
