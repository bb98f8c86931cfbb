//
// Chunk type validation
//

#include <pngme/chunk_tag.hh>
#include <pngme/exceptions.hh>
#include <algorithm>

namespace pngme {

    static bool is_ascii_letter(char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    static std::string describe_byte(char c) {
        auto v = static_cast<unsigned>(static_cast<unsigned char>(c));
        if (v >= 32 && v <= 126) {
            return build_error_msg('\'', c, '\'');
        }
        return build_error_msg("0x", std::hex, v);
    }

    chunk_tag chunk_tag::from_bytes(const std::byte* data, std::uint64_t offset) {
        std::array<char, size> chars{};
        std::memcpy(chars.data(), data, size);

        auto bad = std::find_if_not(chars.begin(), chars.end(), is_ascii_letter);
        THROW_PARSE_IF(bad != chars.end(), error_code::invalid_tag_bytes, offset,
                       "Invalid chunk type at offset ", offset, ": byte ", bad - chars.begin(),
                       " is ", describe_byte(*bad), ", expected an ASCII letter");
        return chunk_tag(chars);
    }

    chunk_tag chunk_tag::from_string(std::string_view s) {
        THROW_PARSE_IF(s.size() != size, error_code::invalid_tag_length, 0,
                       "Chunk type '", s, "' must be exactly 4 characters, got ", s.size());

        auto bad = std::find_if_not(s.begin(), s.end(), is_ascii_letter);
        THROW_PARSE_IF(bad != s.end(), error_code::invalid_tag_bytes, 0,
                       "Chunk type '", s, "' contains ", describe_byte(*bad),
                       ", only ASCII letters are allowed");

        std::array<char, size> chars{};
        std::copy_n(s.begin(), size, chars.begin());
        return chunk_tag(chars);
    }

}
