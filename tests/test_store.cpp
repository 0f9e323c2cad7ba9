// tests/test_store.cpp
#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <string>
#include <unistd.h>
#include <vector>

#include "storage/file_store.hpp"

namespace fs = std::filesystem;
using Bytes  = std::vector<std::uint8_t>;

namespace
{
fs::path fresh_dir(const char *tag)
{
    return fs::temp_directory_path() /
           (std::string("blerx-store-ut-") + tag + "-" + std::to_string(::getpid()) + "-" +
            std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
}

Bytes read_file(const std::string &path)
{
    std::ifstream ifs(path, std::ios::binary);
    return Bytes(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}
}  // namespace

TEST(Store, NumberedName)
{
    EXPECT_EQ(storage::numbered_name("a.pdf", 2), "a-2.pdf");
    EXPECT_EQ(storage::numbered_name("archive.tar.gz", 1), "archive.tar-1.gz");
    EXPECT_EQ(storage::numbered_name("noext", 3), "noext-3");
    EXPECT_EQ(storage::numbered_name(".hidden", 1), ".hidden-1");
}

TEST(Store, DigestIsBlake2b256Hex)
{
    // BLAKE2b-256 of the empty input
    EXPECT_EQ(storage::digest_hex({}),
              "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");
    EXPECT_EQ(storage::digest_hex(Bytes{0x02, 0x41, 0x03}).size(), storage::DIGEST_SIZE * 2);
}

TEST(Store, CreatesDirectoryAndWrites)
{
    const fs::path          dir = fresh_dir("write");
    storage::DirectoryStore store(dir.string());

    const Bytes          data = {0x02, 0x25, 0x50, 0x44, 0x46, 0x03};
    storage::StoreResult r    = store.write_new("received_1.pdf", data);

    ASSERT_TRUE(r.ok) << r.detail;
    EXPECT_EQ(fs::path(r.path).filename().string(), "received_1.pdf");
    EXPECT_EQ(read_file(r.path), data);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST(Store, NeverOverwrites)
{
    const fs::path          dir = fresh_dir("collide");
    storage::DirectoryStore store(dir.string());

    auto a = store.write_new("same.pdf", Bytes{1});
    auto b = store.write_new("same.pdf", Bytes{2});
    auto c = store.write_new("same.pdf", Bytes{3});
    ASSERT_TRUE(a.ok && b.ok && c.ok);

    EXPECT_EQ(fs::path(a.path).filename().string(), "same.pdf");
    EXPECT_EQ(fs::path(b.path).filename().string(), "same-1.pdf");
    EXPECT_EQ(fs::path(c.path).filename().string(), "same-2.pdf");
    EXPECT_EQ(read_file(a.path), Bytes{1});
    EXPECT_EQ(read_file(b.path), Bytes{2});

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST(Store, RejectsBadNames)
{
    const fs::path          dir = fresh_dir("names");
    storage::DirectoryStore store(dir.string());

    EXPECT_FALSE(store.write_new("", Bytes{1}).ok);
    EXPECT_FALSE(store.write_new("..", Bytes{1}).ok);
    auto r = store.write_new("../escape.pdf", Bytes{1});
    EXPECT_FALSE(r.ok);
    EXPECT_FALSE(r.detail.empty());

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST(Store, FailsWhenDirIsAFile)
{
    const fs::path file = fresh_dir("notdir");
    {
        std::ofstream ofs(file);
        ofs << "x";
    }
    storage::DirectoryStore store(file.string());

    auto r = store.write_new("a.pdf", Bytes{1, 2, 3});
    EXPECT_FALSE(r.ok);
    EXPECT_FALSE(r.detail.empty());

    std::error_code ec;
    fs::remove(file, ec);
}
