#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "const/upload_errors.hpp"
#include "config.hpp"

namespace formdrop {
namespace http {

struct MultipartOptions {
    std::string expectedField = FORMDROP_DEFAULT_FIELD_NAME;
    std::string defaultFilename = FORMDROP_DEFAULT_FILENAME;
    // Tokenize Content-Type parameters instead of taking everything after "boundary="
    bool strictBoundary = false;
};

/**
 * Outcome of parsing one upload request
 */
struct UploadResult {
    bool success = false;
    UploadError error = UploadError::None;
    std::string message;

    std::string fieldName;
    std::string filename;               // sanitized, or the default placeholder
    bool usedDefaultFilename = false;
    std::vector<uint8_t> payload;
};

/**
 * Turns a Content-Type header and a fully buffered body into a sanitized
 * filename and payload. Stateless apart from its options; safe to share
 * between threads.
 */
class UploadOrchestrator {
public:
    explicit UploadOrchestrator(MultipartOptions options = MultipartOptions());

    UploadResult handleUpload(const std::string& contentType, const std::string& body) const;

    const MultipartOptions& options() const { return options_; }

private:
    MultipartOptions options_;

    static UploadResult failure(UploadError error, const std::string& message);
};

} // namespace http
} // namespace formdrop
