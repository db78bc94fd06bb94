#include <gatedrepl/core/jail.hpp>
#include <gatedrepl/core/utils.hpp>
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <climits>
#include <cstdlib>
#include <sys/stat.h>

using namespace gatedrepl;

namespace {

bool is_directory(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

std::string canonical(const std::string& path) {
    char resolved[PATH_MAX];
    return realpath(path.c_str(), resolved) ? std::string(resolved) : path;
}

} // namespace

// activate() is never called here: Landlock restrictions cannot be lifted
// and would leak into every later test in the process.

TEST(JailTest, InitCreatesLayout) {
    test::TempDir dir;
    Jail jail;
    ASSERT_TRUE(jail.init(dir.file("base")));

    std::string base = canonical(dir.file("base"));
    EXPECT_EQ(jail.base_dir(), base);
    EXPECT_EQ(jail.db_dir(), base + "/db");
    EXPECT_EQ(jail.jail_dir(), base + "/jail");
    EXPECT_EQ(jail.artifacts_dir(), base + "/artifacts");
    EXPECT_EQ(jail.sessions_dir(), base + "/jail/sessions");
    EXPECT_EQ(jail.state_db_path(), base + "/db/state.db");

    EXPECT_TRUE(is_directory(jail.db_dir()));
    EXPECT_TRUE(is_directory(jail.artifacts_dir()));
    EXPECT_TRUE(is_directory(jail.sessions_dir()));
    EXPECT_FALSE(jail.is_active());
}

TEST(JailTest, InitFailsWhenBaseIsAFile) {
    test::TempDir dir;
    ASSERT_TRUE(write_file(dir.file("occupied"), "x"));
    Jail jail;
    EXPECT_FALSE(jail.init(dir.file("occupied")));
}

TEST(JailTest, PathInJailRespectsBoundaries) {
    test::TempDir dir;
    Jail jail;
    ASSERT_TRUE(jail.init(dir.path()));

    EXPECT_TRUE(jail.is_path_in_jail(jail.jail_dir()));
    EXPECT_TRUE(jail.is_path_in_jail(jail.jail_dir() + "/sessions/abc"));
    EXPECT_FALSE(jail.is_path_in_jail(jail.jail_dir() + "x/file"));
    EXPECT_FALSE(jail.is_path_in_jail(jail.jail_dir() + "/../db/state.db"));
    EXPECT_FALSE(jail.is_path_in_jail("/etc/passwd"));
}

TEST(JailTest, ResolveInJail) {
    test::TempDir dir;
    Jail jail;
    ASSERT_TRUE(jail.init(dir.path()));

    EXPECT_EQ(jail.resolve_in_jail(""), jail.jail_dir());
    EXPECT_EQ(jail.resolve_in_jail("."), jail.jail_dir());
    EXPECT_EQ(jail.resolve_in_jail("sessions/x/../y"), jail.jail_dir() + "/sessions/y");
    EXPECT_EQ(jail.resolve_in_jail("/abs/path"), "/abs/path");
}

TEST(JailTest, EverythingAllowedWhileInactive) {
    test::TempDir dir;
    Jail jail;
    ASSERT_TRUE(jail.init(dir.path()));
    jail.allow_path("/var/tmp");
    EXPECT_TRUE(jail.is_path_allowed("/etc/passwd"));
    EXPECT_TRUE(jail.is_path_allowed(jail.sessions_dir()));
}
