#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace formdrop {

// I/O failure while persisting an upload
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message) : std::runtime_error(message) {}
};

class FileStorage {
public:
    // Creates basePath if it does not exist yet
    explicit FileStorage(const std::string& basePath);

    // Writes content to basePath/filename, replacing any existing file.
    // Returns the full path written. Throws StorageError on failure.
    std::string saveFile(const std::string& filename, const std::vector<uint8_t>& content) const;

    // Gets the full path for a stored file
    std::string getFullPath(const std::string& filename) const;

    // Ensures the storage directory exists. Returns true if it had to be created.
    bool ensureStorageDirectory() const;

    const std::string& basePath() const { return basePath_; }

private:
    std::string basePath_;

    // Rejects names that would resolve outside basePath
    static void validateName(const std::string& filename);
};

} // namespace formdrop
