#include "http/BoundaryLocator.hpp"
#include "http/MultipartError.hpp"

namespace formdrop {
namespace http {

BoundarySpan BoundaryLocator::locate(const std::string& body, const std::string& marker) {
    if (marker.empty()) {
        throw MultipartError(UploadError::BoundaryNotFound, "Empty multipart boundary");
    }

    size_t first = body.find(marker);
    if (first == std::string::npos) {
        throw MultipartError(UploadError::BoundaryNotFound, "Could not find multipart boundary");
    }

    size_t last = body.find(marker + "--");
    if (last == std::string::npos) {
        throw MultipartError(UploadError::BoundaryNotFound, "Could not find end multipart boundary");
    }

    BoundarySpan span;
    span.start = first;
    span.end = last;
    span.markerLength = marker.size();
    return span;
}

} // namespace http
} // namespace formdrop
