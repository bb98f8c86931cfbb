//
// Bounded reader over an in-memory byte buffer
//

#include "input.hh"

namespace pngme {

    const std::byte* reader::read_exact(std::size_t n, const char* what) {
        THROW_PARSE_IF(n > remaining(), error_code::unexpected_eof, tell(),
                       "Unexpected EOF reading ", what, " at offset ", tell(),
                       ": requested ", n, " bytes, only ", remaining(), " available");
        const std::byte* p = m_data + m_position;
        m_position += n;
        return p;
    }
}
