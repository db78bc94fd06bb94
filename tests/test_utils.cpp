#include <gatedrepl/core/utils.hpp>
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <set>

using namespace gatedrepl;

TEST(UtilsTest, Trim) {
    EXPECT_EQ(trim("  a b \n"), "a b");
    EXPECT_EQ(trim(" \t\r\n"), "");
    EXPECT_EQ(ltrim("  x "), "x ");
    EXPECT_EQ(rtrim("  x "), "  x");
}

TEST(UtilsTest, SplitKeepsEmptyParts) {
    std::vector<std::string> parts = split("a\n\nb\n", '\n');
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[2], "b");
    EXPECT_EQ(parts[3], "");
    EXPECT_EQ(join(parts, "|"), "a||b|");
}

TEST(UtilsTest, PrefixAndSuffix) {
    EXPECT_TRUE(starts_with("import os", "import "));
    EXPECT_FALSE(starts_with("imp", "import"));
    EXPECT_TRUE(ends_with("context.json", ".json"));
    EXPECT_EQ(to_lower("MiXeD"), "mixed");
}

TEST(UtilsTest, TruncateSafeKeepsUtf8Intact) {
    std::string s = "ab\xC3\xA9";     // "abé"
    EXPECT_EQ(truncate_safe(s, 3), "ab");
    EXPECT_EQ(truncate_safe(s, 10), s);
}

TEST(UtilsTest, TruncateWithMarker) {
    EXPECT_EQ(truncate_with_marker("short", 10), "short");
    EXPECT_EQ(truncate_with_marker("0123456789", 4), "0123\n... [truncated, 6 chars omitted]");
}

TEST(UtilsTest, Paths) {
    EXPECT_EQ(join_path("/a/", "/b"), "/a/b");
    EXPECT_EQ(join_path("/a", "b"), "/a/b");
    EXPECT_EQ(join_path("", "b"), "b");
    EXPECT_EQ(normalize_path("/a/./b/../c"), "/a/c");
    EXPECT_EQ(normalize_path("../x"), "../x");
    EXPECT_EQ(normalize_path("a/.."), ".");
}

TEST(UtilsTest, FileHelpers) {
    test::TempDir dir;
    std::string path = dir.file("nested/deeper/file.txt");
    ASSERT_TRUE(write_file(path, "content"));
    EXPECT_TRUE(file_exists(path));

    std::string text;
    ASSERT_TRUE(read_file(path, text));
    EXPECT_EQ(text, "content");
    EXPECT_FALSE(read_file(dir.file("missing"), text));

    ASSERT_TRUE(remove_directory_recursive(dir.file("nested")));
    EXPECT_FALSE(file_exists(path));
    EXPECT_TRUE(remove_directory_recursive(dir.file("nested")));
}

TEST(UtilsTest, Sha256) {
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(sha256_hex("").size(), 64u);
}

TEST(UtilsTest, UuidFormat) {
    std::set<std::string> seen;
    for (int i = 0; i < 16; ++i) {
        std::string id = generate_uuid();
        ASSERT_EQ(id.size(), 36u);
        EXPECT_EQ(id[8], '-');
        EXPECT_EQ(id[14], '4');
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 16u);
}

TEST(UtilsTest, MonotonicClock) {
    int64_t a = monotonic_ms();
    int64_t b = monotonic_ms();
    EXPECT_LE(a, b);
    EXPECT_EQ(format_timestamp(0), "1970-01-01T00:00:00Z");
}
