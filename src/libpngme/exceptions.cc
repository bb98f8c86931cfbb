//
// Error code names
//

#include <pngme/exceptions.hh>

namespace pngme {

    const char* to_string(error_code code) noexcept {
        switch (code) {
            case error_code::io: return "io";
            case error_code::invalid_tag_length: return "invalid_tag_length";
            case error_code::invalid_tag_bytes: return "invalid_tag_bytes";
            case error_code::unexpected_eof: return "unexpected_eof";
            case error_code::checksum_mismatch: return "checksum_mismatch";
            case error_code::bad_signature: return "bad_signature";
            case error_code::trailing_bytes: return "trailing_bytes";
            case error_code::chunk_too_large: return "chunk_too_large";
            case error_code::chunk_not_found: return "chunk_not_found";
            case error_code::invalid_utf8: return "invalid_utf8";
        }
        // make compiler happy
        return "unknown";
    }

}
