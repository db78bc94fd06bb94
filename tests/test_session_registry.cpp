#include <gatedrepl/repl/session_registry.hpp>
#include <gatedrepl/core/utils.hpp>
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace gatedrepl;

TEST(SessionIdTest, Validation) {
    EXPECT_TRUE(is_valid_session_id("abc-123_x.y"));
    EXPECT_TRUE(is_valid_session_id("4f0c1d7e-9b2a-4c39-8f51-3d0e5a7b9c11"));
    EXPECT_FALSE(is_valid_session_id(""));
    EXPECT_FALSE(is_valid_session_id(".."));
    EXPECT_FALSE(is_valid_session_id("a/b"));
    EXPECT_FALSE(is_valid_session_id("with space"));
    EXPECT_FALSE(is_valid_session_id(std::string(129, 'a')));
}

TEST(SessionRegistryTest, CreateThenReuse) {
    test::TempDir dir;
    SessionRegistry registry(dir.path(), SandboxOptions());

    SessionOptions opts;
    opts.max_iterations = 5;
    opts.security_level = SecurityLevel::STRICT;

    bool created = false;
    SessionPtr s = registry.get_or_create("s1", opts, created);
    EXPECT_TRUE(created);
    ASSERT_TRUE(s->controller != nullptr);
    ASSERT_TRUE(s->sandbox != nullptr);
    EXPECT_EQ(s->controller->max_iterations(), 5);
    EXPECT_EQ(s->controller->security_level(), SecurityLevel::STRICT);
    EXPECT_EQ(s->staging_dir, dir.file("s1"));

    SessionPtr again = registry.get_or_create("s1", SessionOptions(), created);
    EXPECT_FALSE(created);
    EXPECT_EQ(again.get(), s.get());
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_TRUE(registry.contains("s1"));
}

TEST(SessionRegistryTest, UnknownAndInvalidIds) {
    test::TempDir dir;
    SessionRegistry registry(dir.path(), SandboxOptions());
    EXPECT_THROW(registry.get("missing"), UnknownSessionError);

    bool created = false;
    EXPECT_THROW(registry.get_or_create("../etc", SessionOptions(), created), std::invalid_argument);
    EXPECT_EQ(registry.size(), 0u);

    try {
        registry.get("ghost");
    } catch (const UnknownSessionError& e) {
        EXPECT_EQ(e.session_id(), "ghost");
        EXPECT_STREQ(e.what(), "unknown session 'ghost'");
    }
}

TEST(SessionRegistryTest, ContextIsStagedAndLoaded) {
    test::TempDir dir;
    SessionRegistry registry(dir.path(), SandboxOptions());

    SessionOptions opts;
    opts.context = "alpha beta gamma";
    bool created = false;
    SessionPtr s = registry.get_or_create("ctx", opts, created);

    std::string staged;
    ASSERT_TRUE(read_file(dir.file("ctx/context.txt"), staged));
    EXPECT_EQ(staged, "alpha beta gamma");
    EXPECT_TRUE(s->sandbox->has_context());
    EXPECT_EQ(s->sandbox->execute("len(context.split())").stdout_text, "3\n");
}

TEST(SessionRegistryTest, StructuredContext) {
    test::TempDir dir;
    SessionRegistry registry(dir.path(), SandboxOptions());

    SessionOptions opts;
    opts.context_json = Json::parse(R"({"rows": [1, 2, 3]})");
    bool created = false;
    SessionPtr s = registry.get_or_create("json-ctx", opts, created);

    EXPECT_TRUE(file_exists(dir.file("json-ctx/context.json")));
    EXPECT_EQ(s->sandbox->execute("sum(context['rows'])").stdout_text, "6\n");
}

TEST(SessionRegistryTest, SeedLocalsAppearInSnapshot) {
    test::TempDir dir;
    SessionRegistry registry(dir.path(), SandboxOptions());

    SessionOptions opts;
    opts.locals = Json::parse(R"({"threshold": 10})");
    bool created = false;
    SessionPtr s = registry.get_or_create("seeded", opts, created);
    EXPECT_EQ(s->locals_snapshot["threshold"], 10);
}

TEST(SessionRegistryTest, SessionsDoNotShareNamespaces) {
    test::TempDir dir;
    SessionRegistry registry(dir.path(), SandboxOptions());
    bool created = false;
    SessionPtr a = registry.get_or_create("a", SessionOptions(), created);
    SessionPtr b = registry.get_or_create("b", SessionOptions(), created);

    a->sandbox->execute("secret = 1");
    ExecutionResult r = b->sandbox->execute("secret");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.stderr_text.compare(0, 10, "NameError:"), 0);
}

TEST(SessionRegistryTest, TeardownReleasesSandboxAndFiles) {
    test::TempDir dir;
    SessionRegistry registry(dir.path(), SandboxOptions());
    SessionOptions opts;
    opts.context = "text";
    bool created = false;
    SessionPtr s = registry.get_or_create("t", opts, created);
    ASSERT_TRUE(file_exists(dir.file("t")));

    registry.teardown("t");
    EXPECT_TRUE(s->sandbox == nullptr);
    EXPECT_FALSE(file_exists(dir.file("t")));
    EXPECT_TRUE(registry.contains("t"));

    EXPECT_TRUE(registry.remove("t"));
    EXPECT_FALSE(registry.contains("t"));
    EXPECT_FALSE(registry.remove("t"));
}

TEST(SessionRegistryTest, ModelQueryAppliesToNewSandboxes) {
    test::TempDir dir;
    SessionRegistry registry(dir.path(), SandboxOptions());
    registry.set_model_query([](const std::string& prompt) {
        return "echo " + prompt;
    });
    bool created = false;
    SessionPtr s = registry.get_or_create("m", SessionOptions(), created);
    EXPECT_EQ(s->sandbox->execute("llm_query('ping')").stdout_text, "'echo ping'\n");

    std::vector<std::string> ids = registry.session_ids();
    ASSERT_EQ(ids.size(), 1u);
    EXPECT_EQ(ids[0], "m");
}
