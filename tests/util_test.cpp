#include <gtest/gtest.h>

#include <cstdlib>

#include "util.h"

using namespace snapvault;

TEST(UtilTest, FormatSize) {
    EXPECT_EQ("500 B", format_size(500));
    EXPECT_EQ("1.50 KiB", format_size(1536));
    EXPECT_EQ("2.00 GiB", format_size(2ull * 1024 * 1024 * 1024));
}

TEST(UtilTest, ParseSizeUnits) {
    uint64_t v = 0;
    ASSERT_TRUE(parse_size("100", &v));
    EXPECT_EQ(100u, v);
    ASSERT_TRUE(parse_size("10M", &v));
    EXPECT_EQ(10u * 1024 * 1024, v);
    ASSERT_TRUE(parse_size("1.5GiB", &v));
    EXPECT_EQ(1536ull * 1024 * 1024, v);
    ASSERT_TRUE(parse_size("1KB", &v));
    EXPECT_EQ(1000u, v);
    ASSERT_TRUE(parse_size("64 mib", &v));
    EXPECT_EQ(64ull * 1024 * 1024, v);
}

TEST(UtilTest, ParseSizeRejectsGarbage) {
    uint64_t v = 0;
    EXPECT_FALSE(parse_size("", &v));
    EXPECT_FALSE(parse_size("M", &v));
    EXPECT_FALSE(parse_size("10X", &v));
    EXPECT_FALSE(parse_size("ten", &v));
}

TEST(UtilTest, PathHelpers) {
    EXPECT_TRUE(path_has_parent_dir("/srv/../etc"));
    EXPECT_FALSE(path_has_parent_dir("/srv/..backup"));
    EXPECT_EQ("/a/b", path_join("/a", "b"));
    EXPECT_EQ("/b", path_join("/a", "/b"));
    EXPECT_EQ("/a", path_dirname("/a/b/"));
    EXPECT_EQ("b", path_basename("/a/b/"));
    EXPECT_EQ("/a/c", absolute_path("/a/./b/../c//"));
}

TEST(UtilTest, ShellQuoting) {
    EXPECT_EQ("plain/path-1", shell_quote("plain/path-1"));
    EXPECT_EQ("''", shell_quote(""));
    EXPECT_EQ("'it'\\''s here'", shell_quote("it's here"));
    EXPECT_EQ("btrfs receive '/mnt/my backups'", shell_join({"btrfs", "receive", "/mnt/my backups"}));
}

TEST(UtilTest, WriteFileAtomicReplacesContent) {
    char tmpl[] = "/tmp/snapvault-util-XXXXXX";
    ASSERT_NE(nullptr, mkdtemp(tmpl));
    std::string dir = tmpl;
    std::string path = path_join(dir, "nested/dir/file");
    std::string err;
    ASSERT_TRUE(make_dirs(path_dirname(path), 0755, &err)) << err;
    ASSERT_TRUE(write_file_atomic(path, "one", &err)) << err;
    ASSERT_TRUE(write_file_atomic(path, "two", &err)) << err;
    std::string content;
    ASSERT_TRUE(read_file(path, &content, &err));
    EXPECT_EQ("two", content);
    EXPECT_EQ(0, remove_tree(dir));
}
