#include <gtest/gtest.h>
#include "server/ServerConfig.hpp"
#include "TempDir.hpp"

#include <cstdlib>
#include <fstream>

using namespace formdrop;

TEST(ServerConfigTest, DefaultsMatchCompiledConstants) {
    ServerConfig config;

    EXPECT_EQ(config.port, 3000);
    EXPECT_EQ(config.uploadDir, "uploads");
    EXPECT_EQ(config.fieldName, "myFile");
    EXPECT_EQ(config.defaultFilename, "untitled");
    EXPECT_FALSE(config.strictBoundary);
    EXPECT_EQ(config.readTimeoutMs, 30000);
}

TEST(ServerConfigTest, JsonOverridesOnlyGivenKeys) {
    ServerConfig config = ServerConfig::fromJson(nlohmann::json{
        {"port", 8081},
        {"upload_dir", "/srv/drop"},
        {"strict_boundary", true}
    });

    EXPECT_EQ(config.port, 8081);
    EXPECT_EQ(config.uploadDir, "/srv/drop");
    EXPECT_TRUE(config.strictBoundary);
    EXPECT_EQ(config.fieldName, "myFile");

    http::MultipartOptions options = config.multipartOptions();
    EXPECT_TRUE(options.strictBoundary);
    EXPECT_EQ(options.defaultFilename, "untitled");
}

TEST(ServerConfigTest, RejectsBadValues) {
    EXPECT_THROW(ServerConfig::fromJson(nlohmann::json::array()), ConfigError);
    EXPECT_THROW(ServerConfig::fromJson(nlohmann::json{{"port", "3000"}}), ConfigError);
    EXPECT_THROW(ServerConfig::fromJson(nlohmann::json{{"port", 70000}}), ConfigError);
    EXPECT_THROW(ServerConfig::fromJson(nlohmann::json{{"upload_dir", ""}}), ConfigError);
    EXPECT_THROW(ServerConfig::fromJson(nlohmann::json{{"read_timeout_ms", 0}}), ConfigError);
}

TEST(ServerConfigTest, LoadsFromFile) {
    test::TempDir tmp;
    std::filesystem::create_directories(tmp.path());
    std::string path = (tmp.path() / "formdrop.json").string();
    {
        std::ofstream out(path);
        out << R"({"max_body_bytes": 1024, "field_name": "document", "read_timeout_ms": 2500})";
    }

    ServerConfig config = ServerConfig::loadFromFile(path);

    EXPECT_EQ(config.maxBodyBytes, 1024u);
    EXPECT_EQ(config.fieldName, "document");
    EXPECT_EQ(config.readTimeoutMs, 2500);
    EXPECT_EQ(ServerConfig::fromJson(config.toJson()).fieldName, "document");
}

TEST(ServerConfigTest, FileErrorsAreConfigErrors) {
    test::TempDir tmp;
    std::filesystem::create_directories(tmp.path());
    std::string path = (tmp.path() / "broken.json").string();
    {
        std::ofstream out(path);
        out << "{ not json";
    }

    EXPECT_THROW(ServerConfig::loadFromFile(path), ConfigError);
    EXPECT_THROW(ServerConfig::loadFromFile((tmp.path() / "absent.json").string()), ConfigError);
}

TEST(ServerConfigTest, EnvironmentOverridesApply) {
    ::setenv("FORMDROP_PORT", "9090", 1);
    ::setenv("FORMDROP_UPLOAD_DIR", "/tmp/formdrop-env", 1);

    ServerConfig config;
    config.applyEnvironment();

    EXPECT_EQ(config.port, 9090);
    EXPECT_EQ(config.uploadDir, "/tmp/formdrop-env");

    ::setenv("FORMDROP_PORT", "not-a-port", 1);
    EXPECT_THROW(config.applyEnvironment(), ConfigError);

    ::unsetenv("FORMDROP_PORT");
    ::unsetenv("FORMDROP_UPLOAD_DIR");
}
