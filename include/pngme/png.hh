/**
 * @file png.hh
 * @brief Chunk-level model of a whole PNG file
 */

#pragma once

#include <array>
#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <pngme/export_pngme.h>
#include <pngme/chunk.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @class png
     * @brief The PNG signature followed by an ordered sequence of chunks
     *
     * Chunk order is the on-disk order. Parsing validates the signature and
     * every chunk's framing and checksum; the sequence itself (IHDR first,
     * IEND last, ...) is only reported through warnings.
     */
    class PNGME_EXPORT png {
    public:
        /// 89 50 4E 47 0D 0A 1A 0A
        static const std::array<std::byte, 8> signature;

        /**
         * @brief Build a container from already constructed chunks
         */
        static png from_chunks(std::vector<chunk> chunks);

        /**
         * @brief Parse a complete PNG byte stream
         *
         * @param data Start of the buffer
         * @param size Buffer size in bytes
         * @param options Size limit and warning handler
         * @throws parse_error bad_signature, trailing_bytes, or any chunk::parse failure
         */
        static png parse(const std::byte* data, std::size_t size, const parse_options& options);

        static png parse(const std::vector<std::byte>& buffer, const parse_options& options) {
            return parse(buffer.data(), buffer.size(), options);
        }

        static png parse(const std::vector<std::byte>& buffer) {
            return parse(buffer.data(), buffer.size(), parse_options{});
        }

        [[nodiscard]] const std::array<std::byte, 8>& header() const { return signature; }
        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }

        /**
         * @brief Add a chunk at the end of the sequence
         *
         * No deduplication by tag and no special treatment of IEND.
         */
        void append_chunk(chunk c);

        /**
         * @brief First chunk whose tag reads as the given text
         * @return Pointer into the container, or nullptr if there is none
         */
        [[nodiscard]] const chunk* chunk_by_type(std::string_view tag) const;

        /**
         * @brief Remove the first chunk whose tag reads as the given text
         * @return The removed chunk
         * @throws lookup_error if no chunk matches
         */
        chunk remove_chunk(std::string_view tag);

        /**
         * @brief Signature followed by every chunk, in order
         */
        [[nodiscard]] std::vector<std::byte> as_bytes() const;

        /**
         * @brief Human-readable listing, one line per chunk
         */
        [[nodiscard]] std::string to_display_text() const;

    private:
        png() = default;
        explicit png(std::vector<chunk> chunks) : m_chunks(std::move(chunks)) {}

        std::vector<chunk> m_chunks;
    };

    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const png& p);

} // namespace pngme
