/**
 * @file chunk_tag.hh
 * @brief Validated 4-byte PNG chunk type
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <pngme/export_pngme.h>

namespace pngme {

    /**
     * @class chunk_tag
     * @brief Four ASCII letters naming the purpose of a chunk
     *
     * Bit 5 (0x20) of every byte is a property flag: lower case means the
     * bit is set. Only the letter grammar is enforced; the property bits
     * are informational.
     */
    class PNGME_EXPORT chunk_tag {
    public:
        static constexpr std::size_t size = 4;

        /**
         * @brief Create a tag from 4 raw bytes
         * @param data Pointer to exactly 4 bytes
         * @param offset Position of the tag, reported if validation fails
         * @throws parse_error (invalid_tag_bytes) if a byte is not an ASCII letter
         */
        static chunk_tag from_bytes(const std::byte* data, std::uint64_t offset = 0);

        /**
         * @brief Create a tag from its textual form
         * @throws parse_error (invalid_tag_length) if s is not 4 characters long
         * @throws parse_error (invalid_tag_bytes) if a character is not an ASCII letter
         */
        static chunk_tag from_string(std::string_view s);

        [[nodiscard]] std::array<std::byte, size> bytes() const {
            std::array<std::byte, size> out{};
            std::memcpy(out.data(), b.data(), size);
            return out;
        }

        [[nodiscard]] std::string to_string() const {
            return {b.data(), size};
        }

        [[nodiscard]] std::string_view to_string_view() const {
            return {b.data(), size};
        }

        // Ancillary chunks may be ignored by decoders that do not know them
        [[nodiscard]] bool is_critical() const { return (b[0] & 0x20) == 0; }

        // Private chunks are application specific
        [[nodiscard]] bool is_public() const { return (b[1] & 0x20) == 0; }

        // Must be upper case in this version of PNG
        [[nodiscard]] bool is_reserved_bit_valid() const { return (b[2] & 0x20) == 0; }

        // Editors may copy unknown safe-to-copy chunks after modifying critical ones
        [[nodiscard]] bool is_safe_to_copy() const { return (b[3] & 0x20) != 0; }

        [[nodiscard]] bool is_valid() const { return is_reserved_bit_valid(); }

        constexpr char operator[](std::size_t i) const { return b[i]; }

        bool operator==(const chunk_tag& o) const { return b == o.b; }
        bool operator!=(const chunk_tag& o) const { return !(*this == o); }
        bool operator<(const chunk_tag& o) const { return b < o.b; }
        bool operator<=(const chunk_tag& o) const { return b <= o.b; }
        bool operator>(const chunk_tag& o) const { return b > o.b; }
        bool operator>=(const chunk_tag& o) const { return b >= o.b; }

        friend std::ostream& operator<<(std::ostream& os, const chunk_tag& t) {
            return os << '\'' << t.to_string_view() << '\'';
        }

    private:
        explicit chunk_tag(const std::array<char, size>& chars) : b(chars) {}

        std::array<char, size> b;
    };

    struct chunk_tag_hash {
        std::size_t operator()(const chunk_tag& t) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, t.to_string_view().data(), chunk_tag::size);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

} // namespace pngme

namespace std {
    template<>
    struct hash<pngme::chunk_tag> {
        std::size_t operator()(const pngme::chunk_tag& t) const noexcept {
            return pngme::chunk_tag_hash{}(t);
        }
    };
}
