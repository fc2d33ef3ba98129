#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include "http/BoundaryLocator.hpp"

namespace formdrop {
namespace http {

/**
 * Header block and payload of a single multipart part
 */
struct PartSections {
    std::string headerBlock;        // raw header lines, without the blank line
    std::vector<uint8_t> payload;   // binary content
};

/**
 * Splits a multipart/form-data body into its single meaningful part
 */
class MultipartParser {
public:
    /**
     * Extract boundary from Content-Type header value.
     *
     * In legacy mode the boundary is everything after the first "boundary=",
     * up to the end of the line, trailing parameters included. In strict mode
     * the parameters are tokenized on ';' and the value is unquoted.
     * @param content_type Full Content-Type header value
     * @param strict Tokenize parameters instead of taking the remainder
     * @return Boundary string (without --) or empty if not found
     */
    static std::string extractBoundary(const std::string& content_type, bool strict = false);

    /**
     * Slice the bytes between the opening delimiter line and the closing
     * delimiter. The CRLF that precedes the closing delimiter belongs to the
     * delimiter and is not returned.
     * @throws MultipartError(MalformedPart) if the region is empty
     */
    static std::string extract(const std::string& body, const BoundarySpan& span);

    /**
     * Split raw part content at the first blank line.
     * @throws MultipartError(NoHeaderTerminator) if there is no "\r\n\r\n"
     */
    static PartSections splitHeadersAndBody(const std::string& rawPart);

private:
    static std::string legacyBoundary(const std::string& content_type);
    static std::string strictBoundary(const std::string& content_type);
};

} // namespace http
} // namespace formdrop
