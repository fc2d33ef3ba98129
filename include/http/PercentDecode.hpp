#pragma once

#include <string>

namespace formdrop {
namespace http {

/**
 * Decode %XY escapes the way URI component decoding does.
 * Bytes outside escapes are copied as-is ('+' stays '+'). Every run of
 * consecutive escapes must decode to well-formed UTF-8.
 * @throws MultipartError(InvalidFilenameEncoding) on a bad escape or bad UTF-8
 */
std::string percentDecode(const std::string& text);

} // namespace http
} // namespace formdrop
