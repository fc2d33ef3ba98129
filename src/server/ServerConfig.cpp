#include "server/ServerConfig.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>

namespace formdrop {

namespace {

template <typename T>
void readKey(const nlohmann::json& j, const char* key, T& target) {
    if (!j.contains(key)) return;
    try {
        target = j.at(key).get<T>();
    } catch (const nlohmann::json::type_error& e) {
        throw ConfigError(std::string("Invalid type for config key '") + key + "': " + e.what());
    }
}

uint16_t parsePort(long long value, const std::string& source) {
    if (value <= 0 || value > std::numeric_limits<uint16_t>::max()) {
        throw ConfigError("Port out of range in " + source + ": " + std::to_string(value));
    }
    return static_cast<uint16_t>(value);
}

} // namespace

ServerConfig ServerConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("Config must be a JSON object");
    }

    ServerConfig config;

    long long port = config.port;
    readKey(j, "port", port);
    config.port = parsePort(port, "config");

    readKey(j, "upload_dir", config.uploadDir);
    readKey(j, "max_body_bytes", config.maxBodyBytes);
    readKey(j, "read_timeout_ms", config.readTimeoutMs);
    readKey(j, "field_name", config.fieldName);
    readKey(j, "default_filename", config.defaultFilename);
    readKey(j, "strict_boundary", config.strictBoundary);

    if (config.readTimeoutMs <= 0) {
        throw ConfigError("read_timeout_ms must be positive");
    }
    if (config.uploadDir.empty()) {
        throw ConfigError("upload_dir must not be empty");
    }
    return config;
}

ServerConfig ServerConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("JSON parse error in " + path + ": " + e.what());
    }

    std::cout << "Loaded config from " << path << std::endl;
    return fromJson(j);
}

void ServerConfig::applyEnvironment() {
    if (const char* port_env = std::getenv(FORMDROP_ENV_PORT)) {
        try {
            port = parsePort(std::stoll(port_env), FORMDROP_ENV_PORT);
        } catch (const std::logic_error&) {
            throw ConfigError(std::string("Invalid ") + FORMDROP_ENV_PORT + ": " + port_env);
        }
    }
    if (const char* dir_env = std::getenv(FORMDROP_ENV_UPLOAD_DIR)) {
        if (*dir_env != '\0') uploadDir = dir_env;
    }
}

http::MultipartOptions ServerConfig::multipartOptions() const {
    http::MultipartOptions options;
    options.expectedField = fieldName;
    options.defaultFilename = defaultFilename;
    options.strictBoundary = strictBoundary;
    return options;
}

nlohmann::json ServerConfig::toJson() const {
    return {
        {"port", port},
        {"upload_dir", uploadDir},
        {"max_body_bytes", maxBodyBytes},
        {"read_timeout_ms", readTimeoutMs},
        {"field_name", fieldName},
        {"default_filename", defaultFilename},
        {"strict_boundary", strictBoundary}
    };
}

} // namespace formdrop
