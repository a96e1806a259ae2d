#pragma once

#include <string>

namespace execbox {

// Byte/text conversions shared by request validation and result assembly
class Encoding {
public:
    // RFC 4648 base64, no line breaks
    static std::string base64_encode(const std::string& data);

    // Decode base64 to raw bytes; call is_base64() first, garbage in gives garbage out
    static std::string base64_decode(const std::string& encoded);

    // Non-empty, alphabet [A-Za-z0-9+/], at most two trailing '=', length a multiple of 4
    static bool is_base64(const std::string& encoded);

    // Replace every invalid UTF-8 sequence with U+FFFD (one per maximal invalid subpart)
    static std::string sanitize_utf8(const std::string& bytes);

    // Strip leading and trailing ASCII whitespace
    static std::string trim(const std::string& text);
};

} // namespace execbox
