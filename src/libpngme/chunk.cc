//
// Chunk encoding and decoding
//

#include <pngme/chunk.hh>
#include <pngme/crc32.hh>
#include <pngme/endian.hh>
#include <pngme/exceptions.hh>
#include <algorithm>
#include <ostream>
#include <tuple>
#include <utility>

#include "chunk_length.hh"
#include "input.hh"
#include "utf8.hh"

namespace pngme {

    chunk::chunk(const chunk_tag& tag, std::vector<std::byte> data)
        : m_length(checked_chunk_length(data.size()))
        , m_tag(tag)
        , m_data(std::move(data))
        , m_checksum(chunk_crc(m_tag, m_data.data(), m_data.size())) {
    }

    chunk::chunk(std::uint32_t length, const chunk_tag& tag, std::vector<std::byte> data, std::uint32_t checksum)
        : m_length(length)
        , m_tag(tag)
        , m_data(std::move(data))
        , m_checksum(checksum) {
    }

    chunk chunk::parse(const std::byte* data, std::size_t size,
                       std::uint64_t base_offset, const parse_options& options) {
        reader in(data, size, base_offset);

        const std::uint64_t start = in.tell();
        const std::uint32_t length = in.read_u32be("chunk length");
        const chunk_tag tag = in.read_tag();

        const std::uint64_t payload_at = in.tell();
        const std::byte* payload = in.read_exact(length, "chunk data");

        if (length > options.max_chunk_size) {
            if (options.strict) {
                THROW_PARSE(error_code::chunk_too_large, start,
                            "Chunk ", tag, " at offset ", start, " has size ", length,
                            " bytes, which exceeds maximum allowed size of ",
                            options.max_chunk_size, " bytes");
            }
            if (options.on_warning) {
                options.on_warning(start, "size_limit",
                    build_error_msg("Chunk ", tag, " size ", length,
                                    " exceeds maximum ", options.max_chunk_size));
            }
        }

        const std::uint64_t crc_at = in.tell();
        const std::uint32_t stored = in.read_u32be("chunk checksum");

        const std::uint32_t computed = chunk_crc(tag, payload, length);
        THROW_PARSE_IF(stored != computed, error_code::checksum_mismatch, crc_at,
                       "Checksum mismatch in chunk ", tag, " at offset ", start,
                       ": stored 0x", std::hex, stored, ", computed 0x", computed, std::dec,
                       " over ", length, " payload bytes starting at offset ", payload_at);

        return chunk(length, tag, std::vector<std::byte>(payload, payload + length), stored);
    }

    std::vector<std::byte> chunk::serialize() const {
        std::vector<std::byte> out(encoded_size());
        std::byte* p = out.data();

        store32be(p, m_length);
        p += 4;

        auto tag_bytes = m_tag.bytes();
        p = std::copy(tag_bytes.begin(), tag_bytes.end(), p);
        p = std::copy(m_data.begin(), m_data.end(), p);

        store32be(p, m_checksum);
        return out;
    }

    std::string chunk::data_as_text() const {
        if (auto bad = find_invalid_utf8(m_data.data(), m_data.size())) {
            throw encoding_error(*bad, build_error_msg(
                "Chunk ", m_tag, " payload is not valid UTF-8: bad byte 0x", std::hex,
                std::to_integer<unsigned>(m_data[*bad]), std::dec, " at payload offset ", *bad));
        }
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    bool chunk::operator==(const chunk& o) const {
        return m_length == o.m_length && m_tag == o.m_tag &&
               m_data == o.m_data && m_checksum == o.m_checksum;
    }

    bool chunk::operator<(const chunk& o) const {
        return std::tie(m_length, m_tag, m_data, m_checksum) <
               std::tie(o.m_length, o.m_tag, o.m_data, o.m_checksum);
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        const auto& data = c.data();
        if (!is_valid_utf8(data.data(), data.size())) {
            return os << '<' << data.size() << " bytes of binary data>";
        }
        return os.write(reinterpret_cast<const char*>(data.data()),
                        static_cast<std::streamsize>(data.size()));
    }

} // namespace pngme
