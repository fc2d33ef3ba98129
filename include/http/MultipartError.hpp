#pragma once

#include <stdexcept>
#include <string>
#include "const/upload_errors.hpp"

namespace formdrop {
namespace http {

/**
 * Thrown by the multipart parsing stages. Carries the error kind so the
 * orchestrator can report it without inspecting the message.
 */
class MultipartError : public std::runtime_error {
public:
    MultipartError(UploadError code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    UploadError code() const { return code_; }

private:
    UploadError code_;
};

} // namespace http
} // namespace formdrop
