#include <gatedrepl/app/application.hpp>
#include <gatedrepl/core/utils.hpp>
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace gatedrepl;

namespace {

class ApplicationTest : public ::testing::Test {
protected:
    // Overrides are dotted keys applied on top of the base config
    bool configure(Application& app, const Json& overrides = Json::object()) {
        Config cfg;
        if (!cfg.load_string(R"({"log": {"level": "error"}, "jail": {"landlock": false}, "session": {"id": "cli"}})")) {
            return false;
        }
        for (Json::const_iterator it = overrides.begin(); it != overrides.end(); ++it) {
            cfg.set(it.key(), it.value());
        }
        return app.configure(cfg, dir_.path());
    }

    static bool contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }

    test::TempDir dir_;
};

} // namespace

TEST_F(ApplicationTest, ConfigureOpensSession) {
    Application app;
    ASSERT_TRUE(configure(app));
    EXPECT_EQ(app.session_id(), "cli");
    EXPECT_EQ(app.tools().tools().size(), 6u);
    EXPECT_EQ(app.commands().size(), 9u);
    EXPECT_TRUE(file_exists(dir_.file("db/state.db")));
    EXPECT_TRUE(file_exists(dir_.file("jail/sessions")));
}

TEST_F(ApplicationTest, PlainCodeRunsAsExecuteCode) {
    Application app;
    ASSERT_TRUE(configure(app));
    std::string out = app.handle_input("x = 40\nx + 2\n");
    EXPECT_EQ(out.find("[TOOL_RESULT tool=execute_code success=true]\n"), 0u);
    EXPECT_TRUE(contains(out, "\"stdout\": \"42\\n\""));
    EXPECT_TRUE(contains(out, "\n[/TOOL_RESULT]"));

    // A dict literal is not a tool call
    out = app.handle_input("{'a': 1}");
    EXPECT_TRUE(contains(out, "\"stdout\": \"{'a': 1}\\n\""));

    EXPECT_EQ(app.handle_input("   \n"), "");
}

TEST_F(ApplicationTest, RawToolCall) {
    Application app;
    ASSERT_TRUE(configure(app));
    std::string out = app.handle_input(R"json({"tool": "execute_code", "arguments": {"code": "print('via tool')"}})json");
    EXPECT_TRUE(contains(out, "\"stdout\": \"via tool\\n\""));

    out = app.handle_input(R"({"tool": "no_such_tool"})");
    EXPECT_EQ(out.find("[TOOL_RESULT tool=no_such_tool success=false]\nError: Unknown tool: no_such_tool"), 0u);
}

TEST_F(ApplicationTest, FencedBlocksRunInOrder) {
    Application app;
    ASSERT_TRUE(configure(app));
    std::string out = app.handle_input(
        "First define it:\n"
        "```repl\n"
        "a = 1\n"
        "```\n"
        "then use it:\n"
        "```repl\n"
        "print(a + 1)\n"
        "```\n");
    EXPECT_TRUE(contains(out, "\"iteration\": 1"));
    EXPECT_TRUE(contains(out, "\"stdout\": \"2\\n\""));
    EXPECT_EQ(app.service().get_state("cli").iteration, 2);

    EXPECT_EQ(app.handle_input("```json\n{}\n```"), "No ```repl code blocks found");
}

TEST_F(ApplicationTest, RejectedBlockStopsTheRest) {
    Application app;
    ASSERT_TRUE(configure(app));
    app.handle_input("```repl\nimport os\n```\n```repl\nafter = 1\n```\n");
    SessionSnapshot snap = app.service().get_state("cli");
    EXPECT_EQ(snap.iteration, 0);
    EXPECT_EQ(snap.submission_count, 1);
}

TEST_F(ApplicationTest, FinalAnswerMarker) {
    Application app;
    ASSERT_TRUE(configure(app));
    std::string out = app.handle_input("FINAL(all done)");
    EXPECT_TRUE(contains(out, "\"final_answer\": \"all done\""));
    EXPECT_EQ(app.service().get_state("cli").state, "complete");
}

TEST_F(ApplicationTest, SlashCommands) {
    Application app;
    ASSERT_TRUE(configure(app));

    EXPECT_TRUE(contains(app.handle_input("/help"), "/finalvar - Submit a variable as the answer"));
    EXPECT_EQ(app.handle_input("/bogus"), "Unknown command: /bogus (try /help)");
    EXPECT_EQ(app.handle_input("/final"), "Usage: /final <answer>");
    EXPECT_EQ(app.handle_input("/finalvar   "), "Usage: /finalvar <name>");
    EXPECT_TRUE(contains(app.handle_input("/STATE"), "\"state\": \"idle\""));
    EXPECT_TRUE(contains(app.handle_input("/tools"), "**execute_code**"));

    app.handle_input("total = 12");
    std::string out = app.handle_input("/finalvar total");
    EXPECT_TRUE(contains(out, "\"final_answer\": \"12\""));
}

TEST_F(ApplicationTest, ResetStartsFreshSession) {
    Application app;
    ASSERT_TRUE(configure(app));
    app.handle_input("x = 1");

    std::string out = app.handle_input("/reset");
    EXPECT_EQ(out.find("Session cli destroyed. New session: "), 0u);
    EXPECT_NE(app.session_id(), "cli");
    EXPECT_EQ(app.service().get_state("cli").error_kind, "unknown_session");

    out = app.handle_input("x");
    EXPECT_TRUE(contains(out, "NameError"));
}

TEST_F(ApplicationTest, StrictReviewThroughCommands) {
    Application app;
    ASSERT_TRUE(configure(app, {{"repl.security_level", "strict"}}));

    std::string out = app.handle_input("print('reviewed')");
    EXPECT_TRUE(contains(out, "\"status\": \"pending_approval\""));

    out = app.handle_input("/approve");
    EXPECT_TRUE(contains(out, "\"stdout\": \"reviewed\\n\""));

    app.handle_input("y = 2");
    out = app.handle_input("/reject   too risky ");
    EXPECT_TRUE(contains(out, "\"reason\": \"too risky\""));
    EXPECT_EQ(app.service().get_state("cli").state, "idle");
}

TEST_F(ApplicationTest, RunReadsUnitsSeparatedByBlankLines) {
    Application app;
    ASSERT_TRUE(configure(app));

    std::istringstream in(
        "n = 3\n"
        "\n"
        "```repl\n"
        "m = n * 2\n"
        "\n"
        "print(m)\n"
        "```\n"
        "\n"
        "/state\n"
        "/quit\n"
        "print('never')\n");
    std::ostringstream out;
    EXPECT_EQ(app.run(in, out), 0);

    std::string text = out.str();
    EXPECT_EQ(text.find("gatedrepl session cli - /help for commands\n"), 0u);
    EXPECT_TRUE(contains(text, "\"stdout\": \"6\\n\""));
    EXPECT_TRUE(contains(text, "\"iteration\": 2"));
    EXPECT_TRUE(contains(text, "Bye."));
    EXPECT_FALSE(contains(text, "never"));
    EXPECT_FALSE(app.is_running());
}

TEST_F(ApplicationTest, ArtifactsAreWrittenUnderBaseDir) {
    Application app;
    ASSERT_TRUE(configure(app, {{"repl.artifacts", true}}));
    app.handle_input("print('audited')");
    EXPECT_TRUE(file_exists(dir_.file("artifacts/cli/repl_code_0001.txt.v0")));
}

TEST_F(ApplicationTest, ResumeFromStateDatabase) {
    {
        Application first;
        ASSERT_TRUE(configure(first));
        first.handle_input("kept = 'value'");
        first.shutdown();
    }

    Application second;
    ASSERT_TRUE(configure(second, {{"session.resume", true}}));
    SessionSnapshot snap = second.service().get_state("cli");
    EXPECT_EQ(snap.iteration, 1);
    std::string out = second.handle_input("print(kept)");
    EXPECT_TRUE(contains(out, "\"stdout\": \"value\\n\""));
}

TEST_F(ApplicationTest, InMemoryStateWhenNoDatabase) {
    {
        Application first;
        ASSERT_TRUE(configure(first, {{"state.db_path", ""}}));
        first.handle_input("kept = 1");
    }
    Application second;
    ASSERT_TRUE(configure(second, {{"state.db_path", ""}, {"session.resume", true}}));
    EXPECT_EQ(second.service().get_state("cli").iteration, 0);
}

TEST_F(ApplicationTest, ContextFileIsLoaded) {
    ASSERT_TRUE(write_file(dir_.file("input.json"), R"({"items": [4, 5, 6]})"));
    Application app;
    ASSERT_TRUE(configure(app, {{"session.context_file", dir_.file("input.json")}}));
    std::string out = app.handle_input("max(context['items'])");
    EXPECT_TRUE(contains(out, "\"stdout\": \"6\\n\""));
}

TEST_F(ApplicationTest, MissingContextFileFails) {
    Application app;
    ASSERT_FALSE(configure(app, {{"session.context_file", "/nonexistent/context.txt"}}));
}
