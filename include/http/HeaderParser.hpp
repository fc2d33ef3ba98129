#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace formdrop {
namespace http {

// Part headers keyed by lower-cased name
using PartHeaders = std::map<std::string, std::string>;

/**
 * One parameter of a header value, e.g. name="myFile"
 */
struct HeaderParam {
    std::string key;        // lower-cased
    std::string value;      // quotes removed when quoted
    bool quoted = false;
};

/**
 * Metadata recovered from a Content-Disposition header
 */
struct Disposition {
    std::string fieldName;                  // empty when not readable
    std::optional<std::string> filename;    // percent-decoded, absent when not matched
};

class HeaderParser {
public:
    /**
     * Tokenize a part header block into name/value pairs.
     * Lines are split on CRLF and at the first ':'. Lines without a colon are
     * skipped; for repeated names the first occurrence wins.
     */
    static PartHeaders parseHeaders(const std::string& headerBlock);

    /**
     * Split a header value into its leading token and its ';'-separated
     * parameters. Semicolons inside double quotes do not split.
     */
    static std::vector<HeaderParam> parseParams(const std::string& value, std::string& token);

    /**
     * Recover field name and filename from the Content-Disposition header.
     * The filename is only reported for a form-data disposition whose first
     * parameter is name="<expectedField>" and whose second parameter is a
     * non-empty quoted filename.
     * @throws MultipartError(InvalidFilenameEncoding) if the filename has bad %-escapes
     */
    static Disposition parseDisposition(const std::string& headerBlock, const std::string& expectedField);
};

} // namespace http
} // namespace formdrop
