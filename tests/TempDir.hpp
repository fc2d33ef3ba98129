#pragma once

#include <filesystem>
#include <random>
#include <string>

namespace formdrop {
namespace test {

// Unique scratch directory, removed on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("formdrop-test-" + std::to_string(rd()) + "-" + std::to_string(rd()));
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

} // namespace test
} // namespace formdrop
