#pragma once

#include <string>

namespace formdrop {
namespace http {

class FilenameSanitizer {
public:
    // Replace every character outside [A-Za-z0-9._-] with '_'.
    // Characters are counted as UTF-16 code units of the UTF-8 decoded name:
    // a code point above U+FFFF gives "__", and each maximal ill-formed
    // subsequence decodes to one U+FFFD and gives one '_'.
    // Empty, all-underscore and "."/".." results are passed through unchanged.
    static std::string sanitize(const std::string& raw);

    static bool isAllowed(char c);
};

} // namespace http
} // namespace formdrop
