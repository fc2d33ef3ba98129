#include <gtest/gtest.h>
#include "server/FileStorage.hpp"
#include "TempDir.hpp"

#include <fstream>
#include <iterator>

using namespace formdrop;

namespace {

std::string readAll(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

TEST(FileStorageTest, CreatesBaseDirectory) {
    test::TempDir tmp;
    std::string base = (tmp.path() / "nested" / "uploads").string();

    FileStorage storage(base);

    EXPECT_TRUE(std::filesystem::is_directory(base));
    EXPECT_FALSE(storage.ensureStorageDirectory());
}

TEST(FileStorageTest, WritesAndOverwritesFile) {
    test::TempDir tmp;
    FileStorage storage(tmp.str());

    std::string path = storage.saveFile("a_b.txt", bytes("first"));
    EXPECT_EQ(path, (tmp.path() / "a_b.txt").string());
    EXPECT_EQ(readAll(path), "first");

    storage.saveFile("a_b.txt", bytes("2nd"));
    EXPECT_EQ(readAll(path), "2nd");
}

TEST(FileStorageTest, WritesBinaryContentExactly) {
    test::TempDir tmp;
    FileStorage storage(tmp.str());
    std::string data("\x00\r\n\xff", 4);

    std::string path = storage.saveFile("blob.bin", bytes(data));

    EXPECT_EQ(readAll(path), data);
}

TEST(FileStorageTest, RejectsNamesOutsideBaseDirectory) {
    test::TempDir tmp;
    FileStorage storage(tmp.str());

    EXPECT_THROW(storage.saveFile("", bytes("x")), StorageError);
    EXPECT_THROW(storage.saveFile(".", bytes("x")), StorageError);
    EXPECT_THROW(storage.saveFile("..", bytes("x")), StorageError);
    EXPECT_THROW(storage.saveFile("../escape", bytes("x")), StorageError);
    EXPECT_THROW(storage.saveFile("dir\\file", bytes("x")), StorageError);
    EXPECT_FALSE(std::filesystem::exists(tmp.path().parent_path() / "escape"));
}

TEST(FileStorageTest, DotPrefixedNamesStayInside) {
    test::TempDir tmp;
    FileStorage storage(tmp.str());

    std::string path = storage.saveFile(".._.._etc_passwd", bytes("x"));

    EXPECT_EQ(std::filesystem::path(path).parent_path(), tmp.path());
}

TEST(FileStorageTest, UnwritableTargetThrowsStorageError) {
    test::TempDir tmp;
    FileStorage storage(tmp.str());
    std::filesystem::create_directory(tmp.path() / "taken");

    EXPECT_THROW(storage.saveFile("taken", bytes("x")), StorageError);
}
