#include "http/MultipartParser.hpp"
#include "http/MultipartError.hpp"
#include "http/StringUtils.hpp"

namespace formdrop {
namespace http {

namespace {
    const std::string kCRLF = "\r\n";
    const std::string kHeaderTerminator = "\r\n\r\n";
    const std::string kBoundaryKey = "boundary=";
}

std::string MultipartParser::extractBoundary(const std::string& content_type, bool strict) {
    return strict ? strictBoundary(content_type) : legacyBoundary(content_type);
}

std::string MultipartParser::legacyBoundary(const std::string& content_type) {
    size_t pos = content_type.find(kBoundaryKey);
    if (pos == std::string::npos) {
        return "";
    }

    std::string boundary = content_type.substr(pos + kBoundaryKey.size());
    size_t eol = boundary.find_first_of("\r\n");
    if (eol != std::string::npos) {
        boundary.erase(eol);
    }
    return boundary;
}

std::string MultipartParser::strictBoundary(const std::string& content_type) {
    std::string boundary;

    auto semicolon = content_type.find(';');
    if (semicolon == std::string::npos) {
        return boundary;
    }

    std::string params = content_type.substr(semicolon + 1);

    while (!params.empty()) {
        auto next_semi = params.find(';');
        std::string token = (next_semi == std::string::npos) ? params : params.substr(0, next_semi);
        params = (next_semi == std::string::npos) ? "" : params.substr(next_semi + 1);

        trim(token);
        if (token.empty()) continue;

        auto eq = token.find('=');
        if (eq == std::string::npos) continue;

        std::string key = token.substr(0, eq);
        std::string val = token.substr(eq + 1);
        trim(key);
        trim(val);
        toLower(key);

        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            val = val.substr(1, val.size() - 2);
        }

        if (key == "boundary") {
            boundary = val;
            break;
        }
    }

    return boundary;
}

std::string MultipartParser::extract(const std::string& body, const BoundarySpan& span) {
    // Skip the opening marker and the line terminator that follows it
    const size_t contentStart = span.start + span.markerLength + kCRLF.size();
    if (span.end <= contentStart || span.end > body.size()) {
        throw MultipartError(UploadError::MalformedPart,
                             "Empty or inverted region between multipart boundaries");
    }

    size_t contentEnd = span.end;
    if (contentEnd - contentStart >= kCRLF.size() &&
        body.compare(contentEnd - kCRLF.size(), kCRLF.size(), kCRLF) == 0) {
        // Keep the CRLF when it closes the header block of an empty payload
        size_t headersEnd = body.find(kHeaderTerminator, contentStart);
        bool closesHeaders = headersEnd != std::string::npos &&
                             headersEnd + kHeaderTerminator.size() == contentEnd;
        if (!closesHeaders) {
            contentEnd -= kCRLF.size();
        }
    }

    return body.substr(contentStart, contentEnd - contentStart);
}

PartSections MultipartParser::splitHeadersAndBody(const std::string& rawPart) {
    size_t headersEnd = rawPart.find(kHeaderTerminator);
    if (headersEnd == std::string::npos) {
        throw MultipartError(UploadError::NoHeaderTerminator,
                             "Malformed multipart part (no double CRLF)");
    }

    PartSections sections;
    sections.headerBlock = rawPart.substr(0, headersEnd);

    const char* data_ptr = rawPart.data() + headersEnd + kHeaderTerminator.size();
    size_t data_len = rawPart.size() - (headersEnd + kHeaderTerminator.size());
    sections.payload = std::vector<uint8_t>(data_ptr, data_ptr + data_len);
    return sections;
}

} // namespace http
} // namespace formdrop
