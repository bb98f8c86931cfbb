//
// Whole-file chunk stream
//

#include <pngme/png.hh>
#include <pngme/exceptions.hh>
#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>

#include "input.hh"
#include "utf8.hh"

namespace pngme {

    const std::array<std::byte, 8> png::signature = {
        std::byte{0x89}, std::byte{'P'}, std::byte{'N'}, std::byte{'G'},
        std::byte{0x0D}, std::byte{0x0A}, std::byte{0x1A}, std::byte{0x0A}
    };

    // Smallest prefix that still identifies a chunk: length and type
    static constexpr std::size_t chunk_header_size = 8;

    // Longest payload shown inline by to_display_text()
    static constexpr std::size_t display_text_limit = 64;

    static bool is_displayable(const std::vector<std::byte>& data) {
        if (data.empty() || data.size() > display_text_limit) {
            return false;
        }
        bool has_control = std::any_of(data.begin(), data.end(), [](std::byte b) {
            auto v = std::to_integer<unsigned>(b);
            return v < 0x20 || v == 0x7F;
        });
        return !has_control && is_valid_utf8(data.data(), data.size());
    }

    png png::from_chunks(std::vector<chunk> chunks) {
        return png(std::move(chunks));
    }

    png png::parse(const std::byte* data, std::size_t size, const parse_options& options) {
        THROW_PARSE_IF(size < signature.size() ||
                       !std::equal(signature.begin(), signature.end(), data),
                       error_code::bad_signature, 0,
                       "Not a PNG file: the first ", signature.size(),
                       " bytes do not match the PNG signature");

        png result;
        reader in(data, size);
        in.read_exact(signature.size(), "signature");

        bool seen_trailer = false;
        while (in.remaining() > 0) {
            const std::uint64_t at = in.tell();
            THROW_PARSE_IF(in.remaining() < chunk_header_size, error_code::trailing_bytes, at,
                           in.remaining(), " trailing bytes at offset ", at,
                           " are too short to hold a chunk header");

            chunk c = chunk::parse(data + in.position(), in.remaining(), at, options);
            in.read_exact(c.encoded_size(), "chunk");

            if (options.on_warning) {
                if (result.m_chunks.empty() && c.tag().to_string_view() != "IHDR") {
                    options.on_warning(at, "missing_header",
                        build_error_msg("First chunk is ", c.tag(), ", expected 'IHDR'"));
                }
                if (seen_trailer) {
                    options.on_warning(at, "ordering",
                        build_error_msg("Chunk ", c.tag(), " follows the 'IEND' trailer"));
                }
            }
            if (c.tag().to_string_view() == "IEND") {
                seen_trailer = true;
            }

            result.m_chunks.push_back(std::move(c));
        }
        return result;
    }

    void png::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    const chunk* png::chunk_by_type(std::string_view tag) const {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [tag](const chunk& c) {
            return c.tag().to_string_view() == tag;
        });
        return it == m_chunks.end() ? nullptr : &*it;
    }

    chunk png::remove_chunk(std::string_view tag) {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [tag](const chunk& c) {
            return c.tag().to_string_view() == tag;
        });
        if (it == m_chunks.end()) {
            throw lookup_error(build_error_msg("Chunk '", tag, "' not found"));
        }
        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    std::vector<std::byte> png::as_bytes() const {
        std::size_t total = signature.size();
        for (const auto& c : m_chunks) {
            total += c.encoded_size();
        }

        std::vector<std::byte> out;
        out.reserve(total);
        out.insert(out.end(), signature.begin(), signature.end());
        for (const auto& c : m_chunks) {
            auto bytes = c.serialize();
            out.insert(out.end(), bytes.begin(), bytes.end());
        }
        return out;
    }

    std::string png::to_display_text() const {
        std::ostringstream oss;
        oss << "PNG: " << m_chunks.size() << " chunk(s)\n";

        for (std::size_t i = 0; i < m_chunks.size(); i++) {
            const auto& c = m_chunks[i];
            oss << "  [" << i << "] " << c.tag().to_string()
                << " (" << c.length() << " bytes, crc 0x"
                << std::hex << std::setfill('0') << std::setw(8) << c.checksum()
                << std::dec << std::setfill(' ') << ")";

            if (!c.tag().is_critical()) {
                oss << " ancillary";
            }

            if (is_displayable(c.data())) {
                oss << ": " << c.data_as_text();
            }
            oss << "\n";
        }
        return oss.str();
    }

    std::ostream& operator<<(std::ostream& os, const png& p) {
        return os << p.to_display_text();
    }

} // namespace pngme
