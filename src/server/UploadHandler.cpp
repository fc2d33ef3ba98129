#include "server/UploadHandler.hpp"
#include <iostream>
#include <utility>

namespace formdrop {

UploadHandler::UploadHandler(const FileStorage& storage, http::MultipartOptions options)
    : storage_(storage), orchestrator_(std::move(options)) {}

std::string UploadHandler::errorMessage(UploadError error) {
    switch (error) {
        case UploadError::NotMultipart:
            return "Bad Request: Expected multipart/form-data";
        case UploadError::MissingBoundary:
            return "Bad Request: Missing boundary in Content-Type";
        case UploadError::BoundaryNotFound:
            return "Error: Could not find multipart boundary.";
        case UploadError::MalformedPart:
            return "Error: Malformed multipart part.";
        case UploadError::NoHeaderTerminator:
            return "Error: Malformed multipart part (no double CRLF).";
        case UploadError::InvalidFilenameEncoding:
            return "Error: Invalid filename encoding.";
        default:
            return "Bad Request";
    }
}

http::Response UploadHandler::handle(const http::Request& request) const {
    http::UploadResult result = orchestrator_.handleUpload(request.getHeader("content-type"), request.body);
    if (!result.success) {
        std::cerr << "Upload rejected (" << to_string(result.error) << "): " << result.message << std::endl;
        return http::Response::badRequest(errorMessage(result.error));
    }

    if (result.usedDefaultFilename) {
        std::cerr << "Warning: could not extract filename from Content-Disposition, using "
                  << result.filename << std::endl;
    }

    try {
        storage_.saveFile(result.filename, result.payload);
    } catch (const StorageError& e) {
        std::cerr << "Error writing file: " << e.what() << std::endl;
        return http::Response::error("Error saving file.");
    }

    std::cout << "File uploaded successfully: " << result.filename
              << " (" << result.payload.size() << " bytes)" << std::endl;
    return http::Response::ok("File \"" + result.filename + "\" uploaded successfully!");
}

} // namespace formdrop
