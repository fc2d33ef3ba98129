#include "http/FilenameSanitizer.hpp"

#include <cstdint>

namespace formdrop {
namespace http {

namespace {

/**
 * One decoded unit of the filename: how many bytes it spans and how many
 * UTF-16 code units it stands for once decoded.
 */
struct DecodedUnit {
    size_t bytes = 1;
    size_t codeUnits = 1;
};

// Decode the UTF-8 character at pos. An ill-formed sequence yields one
// replacement character per maximal subpart, which is a single code unit.
DecodedUnit decodeAt(const std::string& s, size_t pos) {
    uint8_t lead = static_cast<uint8_t>(s[pos]);
    DecodedUnit unit;
    if (lead < 0x80) {
        return unit;
    }

    size_t needed = 0;
    uint8_t lower = 0x80;
    uint8_t upper = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        needed = 1;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        needed = 2;
        if (lead == 0xE0) lower = 0xA0;
        if (lead == 0xED) upper = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        needed = 3;
        if (lead == 0xF0) lower = 0x90;
        if (lead == 0xF4) upper = 0x8F;
    } else {
        // 0x80..0xC1 and 0xF5..0xFF never start a sequence
        return unit;
    }

    size_t seen = 0;
    while (seen < needed) {
        size_t next = pos + 1 + seen;
        if (next >= s.size()) {
            unit.bytes = 1 + seen;
            return unit;
        }
        uint8_t byte = static_cast<uint8_t>(s[next]);
        if (byte < lower || byte > upper) {
            unit.bytes = 1 + seen;
            return unit;
        }
        lower = 0x80;
        upper = 0xBF;
        ++seen;
    }

    unit.bytes = 1 + needed;
    unit.codeUnits = (needed == 3) ? 2 : 1;
    return unit;
}

} // namespace

bool FilenameSanitizer::isAllowed(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '.' || c == '-' || c == '_';
}

std::string FilenameSanitizer::sanitize(const std::string& raw) {
    std::string result;
    result.reserve(raw.size());

    size_t pos = 0;
    while (pos < raw.size()) {
        if (isAllowed(raw[pos])) {
            result += raw[pos++];
            continue;
        }
        DecodedUnit unit = decodeAt(raw, pos);
        result.append(unit.codeUnits, '_');
        pos += unit.bytes;
    }
    return result;
}

} // namespace http
} // namespace formdrop
