#pragma once

#include <string>
#include "http/Request.hpp"
#include "http/UploadOrchestrator.hpp"
#include "server/FileStorage.hpp"

namespace formdrop {

class UploadHandler {
public:
    UploadHandler(const FileStorage& storage, http::MultipartOptions options = http::MultipartOptions());
    
    // Parse the upload, store the file and build the response
    http::Response handle(const http::Request& request) const;

    // User-visible text for a parse failure
    static std::string errorMessage(UploadError error);

private:
    const FileStorage& storage_;
    http::UploadOrchestrator orchestrator_;
};

} // namespace formdrop
