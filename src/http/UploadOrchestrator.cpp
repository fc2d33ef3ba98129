#include "http/UploadOrchestrator.hpp"
#include "http/BoundaryLocator.hpp"
#include "http/FilenameSanitizer.hpp"
#include "http/HeaderParser.hpp"
#include "http/MultipartError.hpp"
#include "http/MultipartParser.hpp"

#include <utility>

namespace formdrop {
namespace http {

namespace {
    const std::string kMultipartPrefix = "multipart/form-data";
}

UploadOrchestrator::UploadOrchestrator(MultipartOptions options)
    : options_(std::move(options)) {}

UploadResult UploadOrchestrator::failure(UploadError error, const std::string& message) {
    UploadResult result;
    result.error = error;
    result.message = message;
    return result;
}

UploadResult UploadOrchestrator::handleUpload(const std::string& contentType, const std::string& body) const {
    if (contentType.compare(0, kMultipartPrefix.size(), kMultipartPrefix) != 0) {
        return failure(UploadError::NotMultipart, "Expected multipart/form-data");
    }

    std::string boundary = MultipartParser::extractBoundary(contentType, options_.strictBoundary);
    if (boundary.empty()) {
        return failure(UploadError::MissingBoundary, "Missing boundary in Content-Type");
    }

    try {
        BoundarySpan span = BoundaryLocator::locate(body, "--" + boundary);
        std::string rawPart = MultipartParser::extract(body, span);
        PartSections sections = MultipartParser::splitHeadersAndBody(rawPart);
        Disposition disposition = HeaderParser::parseDisposition(sections.headerBlock, options_.expectedField);

        UploadResult result;
        result.success = true;
        result.fieldName = disposition.fieldName;
        if (disposition.filename) {
            result.filename = FilenameSanitizer::sanitize(*disposition.filename);
        } else {
            result.filename = options_.defaultFilename;
            result.usedDefaultFilename = true;
        }
        result.payload = std::move(sections.payload);
        return result;
    } catch (const MultipartError& e) {
        return failure(e.code(), e.what());
    }
}

} // namespace http
} // namespace formdrop
