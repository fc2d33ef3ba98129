#include "server/FileStorage.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <system_error>

namespace formdrop {

FileStorage::FileStorage(const std::string& basePath)
    : basePath_(basePath) {
    if (ensureStorageDirectory()) {
        std::cout << "Created upload directory: " << basePath_ << std::endl;
    }
}

void FileStorage::validateName(const std::string& filename) {
    if (filename.empty() || filename == "." || filename == "..") {
        throw StorageError("Refusing to store file under name '" + filename + "'");
    }
    if (filename.find_first_of(std::string("/\\\0", 3)) != std::string::npos) {
        throw StorageError("Refusing to store file with path separator in name: " + filename);
    }
}

std::string FileStorage::saveFile(const std::string& filename, const std::vector<uint8_t>& content) const {
    validateName(filename);

    std::string fullPath = getFullPath(filename);
    std::cout << "Writing " << content.size() << " bytes to: " << fullPath << std::endl;

    std::ofstream outFile(fullPath, std::ios::binary | std::ios::trunc);
    if (!outFile) {
        std::string error = "Failed to create file: " + fullPath + " (" + std::strerror(errno) + ")";
        std::cerr << error << std::endl;
        throw StorageError(error);
    }

    outFile.write(reinterpret_cast<const char*>(content.data()), content.size());
    outFile.close();
    if (!outFile) {
        std::string error = "Failed to write file: " + fullPath;
        std::cerr << error << std::endl;
        throw StorageError(error);
    }

    return fullPath;
}

std::string FileStorage::getFullPath(const std::string& filename) const {
    return (std::filesystem::path(basePath_) / filename).string();
}

bool FileStorage::ensureStorageDirectory() const {
    std::error_code ec;
    bool created = std::filesystem::create_directories(basePath_, ec);
    if (ec) {
        throw StorageError("Cannot create upload directory " + basePath_ + ": " + ec.message());
    }
    return created;
}

} // namespace formdrop
