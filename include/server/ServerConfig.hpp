#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "http/UploadOrchestrator.hpp"

namespace formdrop {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct ServerConfig {
    uint16_t port = FORMDROP_DEFAULT_PORT;
    std::string uploadDir = FORMDROP_DEFAULT_UPLOAD_DIR;
    size_t maxBodyBytes = FORMDROP_DEFAULT_MAX_BODY_BYTES;
    // Deadline for each read or write on a client connection
    long long readTimeoutMs = FORMDROP_DEFAULT_READ_TIMEOUT_MS;
    std::string fieldName = FORMDROP_DEFAULT_FIELD_NAME;
    std::string defaultFilename = FORMDROP_DEFAULT_FILENAME;
    bool strictBoundary = false;

    // Read a JSON config file. Keys that are absent keep their defaults.
    static ServerConfig loadFromFile(const std::string& path);

    // Same as loadFromFile, from an already parsed document
    static ServerConfig fromJson(const nlohmann::json& j);

    // Apply FORMDROP_PORT / FORMDROP_UPLOAD_DIR if set
    void applyEnvironment();

    http::MultipartOptions multipartOptions() const;

    nlohmann::json toJson() const;
};

} // namespace formdrop
