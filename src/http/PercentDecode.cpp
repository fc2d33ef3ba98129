#include "http/PercentDecode.hpp"
#include "http/MultipartError.hpp"

#include <cstdint>

namespace formdrop {
namespace http {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

[[noreturn]] void fail(const std::string& what) {
    throw MultipartError(UploadError::InvalidFilenameEncoding, "Invalid filename encoding: " + what);
}

// Strict UTF-8: no overlong forms, no surrogates, nothing above U+10FFFF
void validateUtf8(const std::string& bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        uint8_t lead = static_cast<uint8_t>(bytes[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        size_t length = 0;
        uint32_t codepoint = 0;
        uint32_t minimum = 0;
        if ((lead & 0xE0) == 0xC0) {
            length = 2; codepoint = lead & 0x1F; minimum = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3; codepoint = lead & 0x0F; minimum = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4; codepoint = lead & 0x07; minimum = 0x10000;
        } else {
            fail("unexpected UTF-8 byte");
        }

        if (i + length > bytes.size()) {
            fail("truncated UTF-8 sequence");
        }
        for (size_t k = 1; k < length; ++k) {
            uint8_t cont = static_cast<uint8_t>(bytes[i + k]);
            if ((cont & 0xC0) != 0x80) {
                fail("bad UTF-8 continuation byte");
            }
            codepoint = (codepoint << 6) | (cont & 0x3F);
        }

        if (codepoint < minimum || codepoint > 0x10FFFF ||
            (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
            fail("invalid UTF-8 code point");
        }
        i += length;
    }
}

} // namespace

std::string percentDecode(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '%') {
            result += text[i++];
            continue;
        }

        std::string run;
        while (i < text.size() && text[i] == '%') {
            if (i + 2 >= text.size()) {
                fail("truncated escape");
            }
            int hi = hexValue(text[i + 1]);
            int lo = hexValue(text[i + 2]);
            if (hi < 0 || lo < 0) {
                fail("malformed escape");
            }
            run += static_cast<char>((hi << 4) | lo);
            i += 3;
        }

        validateUtf8(run);
        result += run;
    }

    return result;
}

} // namespace http
} // namespace formdrop
