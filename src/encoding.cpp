#include "encoding.h"
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <algorithm>
#include <climits>

namespace execbox {

namespace {

const char* const REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

std::string Encoding::base64_encode(const std::string& data) {
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bio = BIO_new(BIO_s_mem());
    bio = BIO_push(b64, bio);

    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);
    size_t offset = 0;
    while (offset < data.size()) {
        int chunk = static_cast<int>(std::min<size_t>(data.size() - offset, INT_MAX));
        int written = BIO_write(bio, data.data() + offset, chunk);
        if (written <= 0) break;
        offset += written;
    }
    (void)BIO_flush(bio);

    BUF_MEM* bufferPtr;
    BIO_get_mem_ptr(bio, &bufferPtr);

    std::string result(bufferPtr->data, bufferPtr->length);
    BIO_free_all(bio);

    return result;
}

std::string Encoding::base64_decode(const std::string& encoded) {
    if (encoded.empty()) {
        return "";
    }

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bio = BIO_new_mem_buf(encoded.data(), static_cast<int>(encoded.size()));
    bio = BIO_push(b64, bio);

    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);

    // The filter may hand the output back in pieces
    std::string result;
    result.reserve(encoded.size() / 4 * 3);
    char buffer[4096];
    int read_len;
    while ((read_len = BIO_read(bio, buffer, sizeof(buffer))) > 0) {
        result.append(buffer, read_len);
    }

    BIO_free_all(bio);
    return result;
}

bool Encoding::is_base64(const std::string& encoded) {
    if (encoded.empty() || encoded.size() % 4 != 0) {
        return false;
    }

    size_t padding = 0;
    for (size_t i = 0; i < encoded.size(); ++i) {
        char c = encoded[i];
        if (c == '=') {
            padding++;
            continue;
        }
        if (padding > 0) {
            return false;  // data after padding
        }
        bool valid = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                     (c >= '0' && c <= '9') || c == '+' || c == '/';
        if (!valid) {
            return false;
        }
    }
    return padding <= 2 && padding < encoded.size();
}

std::string Encoding::sanitize_utf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());

    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        unsigned char lead = static_cast<unsigned char>(bytes[i]);

        if (lead < 0x80) {
            out += static_cast<char>(lead);
            i++;
            continue;
        }

        size_t length = 0;
        unsigned char lo = 0x80, hi = 0xBF;  // allowed range of the second byte
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) lo = 0xA0;        // overlong
            if (lead == 0xED) hi = 0x9F;        // surrogates
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) lo = 0x90;        // overlong
            if (lead == 0xF4) hi = 0x8F;        // above U+10FFFF
        } else {
            out += REPLACEMENT_CHARACTER;
            i++;
            continue;
        }

        size_t j = i + 1;
        bool valid = true;
        for (size_t k = 1; k < length; ++k, ++j) {
            if (j >= n) {
                valid = false;
                break;
            }
            unsigned char c = static_cast<unsigned char>(bytes[j]);
            bool in_range = (k == 1) ? (c >= lo && c <= hi) : is_continuation(c);
            if (!in_range) {
                valid = false;
                break;
            }
        }

        if (valid) {
            out.append(bytes, i, length);
            i += length;
        } else {
            out += REPLACEMENT_CHARACTER;
            i = j;  // resume at the byte that broke the sequence
        }
    }

    return out;
}

std::string Encoding::trim(const std::string& text) {
    const char* whitespace = " \t\n\r\f\v";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

} // namespace execbox
