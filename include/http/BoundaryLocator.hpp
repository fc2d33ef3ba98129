#pragma once

#include <cstddef>
#include <string>

namespace formdrop {
namespace http {

/**
 * Positions of the delimiters inside a multipart body.
 * start is the index of the opening marker, end the index of the closing
 * marker (the one suffixed with "--"), markerLength the length of "--" + boundary.
 */
struct BoundarySpan {
    size_t start = 0;
    size_t end = 0;
    size_t markerLength = 0;
};

class BoundaryLocator {
public:
    /**
     * Find the opening and closing delimiters of a multipart body.
     * Both searches are byte-exact and return the first occurrence, so a
     * payload that contains the closing marker is cut short there.
     * @param body Raw HTTP body
     * @param marker Delimiter including the leading "--"
     * @throws MultipartError(BoundaryNotFound) if either marker is missing
     */
    static BoundarySpan locate(const std::string& body, const std::string& marker);
};

} // namespace http
} // namespace formdrop
