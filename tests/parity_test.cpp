#include "parity.hpp"
#include "protocol/errors.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <set>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace parity::test {

using testing_support::TempDir;
using testing_support::write_file;

class ParityTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = base_.path() / "root";
        fs::create_directories(root_);
        write_file(root_ / "a.txt", "abc");
        write_file(root_ / "b.bin", "hello");
        write_file(root_ / "empty", "");
        fs::create_directories(root_ / "sub");
        write_file(root_ / "sub" / "nested.txt", "nested");
        fs::create_directories(root_ / "other");
        write_file(base_.path() / "secret", "top secret");
    }

    TempDir base_;
    fs::path root_;
};

TEST_F(ParityTest, ScanListsRegularFilesOnly) {
    auto entries = scan(root_);
    ASSERT_EQ(entries.size(), 3u);

    std::set<std::string> names;
    for (const auto& entry : entries) {
        names.insert(entry.name);
        EXPECT_EQ(entry.path.parent_path(), root_);
    }
    EXPECT_EQ(names, (std::set<std::string>{"a.txt", "b.bin", "empty"}));
}

TEST_F(ParityTest, ScanReportsLengths) {
    for (const auto& entry : scan(root_)) {
        if (entry.name == "a.txt") EXPECT_EQ(entry.length, 3u);
        if (entry.name == "b.bin") EXPECT_EQ(entry.length, 5u);
        if (entry.name == "empty") EXPECT_EQ(entry.length, 0u);
    }
}

TEST_F(ParityTest, ScanOfEmptyDirectory) {
    EXPECT_TRUE(scan(root_ / "other").empty());
}

TEST_F(ParityTest, ScanOfMissingRootFails) {
    EXPECT_THROW(scan(root_ / "missing"), protocol::IoError);
}

TEST_F(ParityTest, ResolveByIndexFollowsScanOrder) {
    auto entries = scan(root_);
    for (size_t i = 0; i < entries.size(); ++i) {
        auto entry = resolve_by_index(root_, i);
        ASSERT_TRUE(entry.has_value());
        EXPECT_EQ(entry->name, entries[i].name);
    }
}

TEST_F(ParityTest, ResolveByIndexPastEnd) {
    EXPECT_FALSE(resolve_by_index(root_, 3).has_value());
    EXPECT_FALSE(resolve_by_index(root_, UINT64_MAX).has_value());
}

TEST_F(ParityTest, ResolveByName) {
    auto entry = resolve_by_name(root_, "b.bin");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->name, "b.bin");
    EXPECT_EQ(entry->length, 5u);
}

TEST_F(ParityTest, ResolveByNameInSubdirectory) {
    auto entry = resolve_by_name(root_, "sub/nested.txt");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->name, "nested.txt");
    EXPECT_EQ(entry->length, 6u);
}

TEST_F(ParityTest, ResolveByNameRejectsEscapes) {
    EXPECT_FALSE(resolve_by_name(root_, "../secret").has_value());
    EXPECT_FALSE(resolve_by_name(root_, "sub/../../secret").has_value());
    EXPECT_FALSE(resolve_by_name(root_, (base_.path() / "secret").string()).has_value());
}

TEST_F(ParityTest, ResolveByNameRejectsSiblingWithSharedPrefix) {
    fs::create_directories(base_.path() / "root2");
    write_file(base_.path() / "root2" / "x", "x");
    EXPECT_FALSE(resolve_by_name(root_, "../root2/x").has_value());
}

TEST_F(ParityTest, ResolveByNameRejectsSymlinkOut) {
    std::error_code ec;
    fs::create_symlink(base_.path() / "secret", root_ / "link", ec);
    if (ec) {
        GTEST_SKIP() << "symlinks unavailable: " << ec.message();
    }
    EXPECT_FALSE(resolve_by_name(root_, "link").has_value());
}

TEST_F(ParityTest, ResolveByNameMissingFileInsideRootFails) {
    EXPECT_THROW(resolve_by_name(root_, "missing.txt"), protocol::IoError);
    EXPECT_THROW(resolve_by_name(root_, "sub"), protocol::IoError);
}

TEST_F(ParityTest, NonUtf8FileNamesAreMadeValid) {
    fs::path odd = root_ / "other" / "bad\xff.bin";
    try {
        write_file(odd, "12345");
    } catch (const std::runtime_error& e) {
        GTEST_SKIP() << "filesystem refuses non-UTF-8 names: " << e.what();
    }

    auto entries = scan(root_ / "other");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, "bad\xEF\xBF\xBD.bin");
    EXPECT_EQ(entries[0].path, odd);
    EXPECT_EQ(entries[0].length, 5u);

    EXPECT_EQ(file_entry(odd).name, "bad\xEF\xBF\xBD.bin");
}

TEST(IsWithinTest, ComponentWise) {
    EXPECT_TRUE(is_within("/data", "/data/a.txt"));
    EXPECT_TRUE(is_within("/data/", "/data/a.txt"));
    EXPECT_TRUE(is_within("/data", "/data"));
    EXPECT_FALSE(is_within("/data", "/database/a.txt"));
    EXPECT_FALSE(is_within("/data", "/etc/passwd"));
    EXPECT_FALSE(is_within("/data/sub", "/data"));
}

} // namespace parity::test
