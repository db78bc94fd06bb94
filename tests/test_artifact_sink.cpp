#include <gatedrepl/repl/artifact_sink.hpp>
#include <gatedrepl/core/utils.hpp>
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace gatedrepl;

TEST(DirectoryArtifactSinkTest, VersionsCountUp) {
    test::TempDir dir;
    DirectoryArtifactSink sink(dir.file("artifacts"));

    int64_t version = -1;
    ASSERT_TRUE(sink.save_artifact("session-1", "repl_code_0001.txt", "first", version));
    EXPECT_EQ(version, 0);
    ASSERT_TRUE(sink.save_artifact("session-1", "repl_code_0001.txt", "second", version));
    EXPECT_EQ(version, 1);

    std::string text;
    ASSERT_TRUE(read_file(sink.artifact_path("session-1", "repl_code_0001.txt", 0), text));
    EXPECT_EQ(text, "first");
    ASSERT_TRUE(read_file(sink.artifact_path("session-1", "repl_code_0001.txt", 1), text));
    EXPECT_EQ(text, "second");
    EXPECT_EQ(sink.artifact_path("s", "n", 2), dir.file("artifacts") + "/s/n.v2");
}

TEST(DirectoryArtifactSinkTest, SessionsGetSeparateDirectories) {
    test::TempDir dir;
    DirectoryArtifactSink sink(dir.path());
    int64_t version = -1;
    ASSERT_TRUE(sink.save_artifact("a", "code.txt", "x", version));
    ASSERT_TRUE(sink.save_artifact("b", "code.txt", "y", version));
    EXPECT_EQ(version, 0);
    EXPECT_TRUE(file_exists(dir.file("a/code.txt.v0")));
    EXPECT_TRUE(file_exists(dir.file("b/code.txt.v0")));
}

TEST(DirectoryArtifactSinkTest, RejectsPathComponents) {
    test::TempDir dir;
    DirectoryArtifactSink sink(dir.path());
    int64_t version = -1;
    EXPECT_FALSE(sink.save_artifact("..", "x.txt", "data", version));
    EXPECT_FALSE(sink.save_artifact("s", "../escape.txt", "data", version));
    EXPECT_FALSE(sink.save_artifact("", "x.txt", "data", version));
    EXPECT_EQ(version, -1);
}

TEST(DirectoryArtifactSinkTest, UnwritableRootFails) {
    test::TempDir dir;
    ASSERT_TRUE(write_file(dir.file("blocker"), "file, not a directory"));
    DirectoryArtifactSink sink(dir.file("blocker"));
    int64_t version = -1;
    EXPECT_FALSE(sink.save_artifact("s", "x.txt", "data", version));
}
