#include <gatedrepl/repl/repl_tools.hpp>
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace gatedrepl;

namespace {

class ReplToolsTest : public ::testing::Test {
protected:
    ReplToolsTest() : service_(make_options()), provider_(service_, "agent") {}

    ReplServiceOptions make_options() {
        ReplServiceOptions opts;
        opts.staging_root = dir_.file("staging");
        return opts;
    }

    void open(SecurityLevel level) {
        SessionOptions opts;
        opts.security_level = level;
        ASSERT_TRUE(service_.open_session("agent", opts).ok());
        registry_.register_provider(provider_);
    }

    Json call(const std::string& tool, const Json& params, bool expect_success = true) {
        AgentToolResult r = registry_.execute(tool, params);
        EXPECT_EQ(r.success, expect_success) << r.output << r.error;
        return Json::parse(r.success ? r.output : r.error);
    }

    test::TempDir dir_;
    ReplService service_;
    ReplToolsProvider provider_;
    ToolRegistry registry_;
};

} // namespace

TEST_F(ReplToolsTest, ProvidesAllTools) {
    open(SecurityLevel::BASIC);
    EXPECT_EQ(registry_.tools().size(), 6u);
    EXPECT_TRUE(registry_.has_tool("execute_code"));
    EXPECT_TRUE(registry_.has_tool("approve_code_execution"));
    EXPECT_TRUE(registry_.has_tool("reject_code_execution"));
    EXPECT_TRUE(registry_.has_tool("submit_final_answer"));
    EXPECT_TRUE(registry_.has_tool("submit_final_variable"));
    EXPECT_TRUE(registry_.has_tool("get_repl_state"));
    EXPECT_STREQ(provider_.tool_id(), "repl");

    std::string prompt = registry_.build_tools_prompt();
    EXPECT_NE(prompt.find("- `code` (string, required): Code to execute"), std::string::npos);
}

TEST_F(ReplToolsTest, ExecuteCode) {
    open(SecurityLevel::BASIC);
    Json j = call("execute_code", {{"code", "values = [3, 4]\nsum(values)"}});
    EXPECT_EQ(j["status"], "success");
    EXPECT_EQ(j["stdout"], "7\n");
    EXPECT_EQ(j["iteration"], 1);

    // A failing script is still a successful tool call
    j = call("execute_code", {{"code", "values[5]"}});
    EXPECT_EQ(j["status"], "error");
    EXPECT_EQ(j["error_kind"], "execution_fault");
    EXPECT_EQ(j["error"].get<std::string>().compare(0, 11, "IndexError:"), 0);
}

TEST_F(ReplToolsTest, ExecuteCodeRejectedByDenylist) {
    open(SecurityLevel::BASIC);
    Json j = call("execute_code", {{"code", "import subprocess"}});
    EXPECT_EQ(j["status"], "rejected");
    EXPECT_EQ(j["code"], "import subprocess");
    EXPECT_NE(j["reason"].get<std::string>().find("subprocess"), std::string::npos);
}

TEST_F(ReplToolsTest, MissingParameter) {
    open(SecurityLevel::BASIC);
    AgentToolResult r = registry_.execute("execute_code", Json::object());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "Missing required parameter 'code' for tool execute_code");

    // Calling the provider directly skips the registry check
    r = provider_.do_execute_code(Json::object());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(Json::parse(r.error)["message"], "Missing required parameter: code");

    r = provider_.do_execute_code({{"code", 5}});
    EXPECT_FALSE(r.success);

    r = provider_.do_submit_final_answer(Json::object());
    EXPECT_FALSE(r.success);
    Json j = Json::parse(r.error);
    EXPECT_EQ(j["status"], "error");
    EXPECT_EQ(j["message"], "Missing required parameter: answer");

    r = provider_.do_submit_final_variable({{"variable_name", true}});
    EXPECT_EQ(Json::parse(r.error)["message"], "Missing required parameter: variable_name");
}

TEST_F(ReplToolsTest, StrictApproveFlow) {
    open(SecurityLevel::STRICT);
    Json j = call("execute_code", {{"code", "print('approved run')"}});
    EXPECT_EQ(j["status"], "pending_approval");
    EXPECT_EQ(j["code"], "print('approved run')");

    j = call("get_repl_state", Json::object());
    EXPECT_EQ(j["state"], "code_pending_review");
    EXPECT_EQ(j["pending_code"], "print('approved run')");

    j = call("approve_code_execution", Json::object());
    EXPECT_EQ(j["status"], "success");
    EXPECT_EQ(j["stdout"], "approved run\n");
    EXPECT_EQ(j["approval"], "Code approved for execution");

    j = call("approve_code_execution", Json::object(), false);
    EXPECT_EQ(j["message"], "No code pending for approval");
}

TEST_F(ReplToolsTest, StrictRejectFlow) {
    open(SecurityLevel::STRICT);
    call("execute_code", {{"code", "x = 1"}});

    Json j = call("reject_code_execution", {{"reason", "not needed"}});
    EXPECT_EQ(j["status"], "rejected");
    EXPECT_EQ(j["reason"], "not needed");
    EXPECT_EQ(j["code"], "x = 1");

    j = call("get_repl_state", Json::object());
    EXPECT_EQ(j["state"], "idle");
    EXPECT_EQ(j["iteration"], 0);
    EXPECT_EQ(j["last_error"], "Code rejected: not needed");

    j = call("reject_code_execution", {{"reason", "again"}}, false);
    EXPECT_EQ(j["message"], "No code pending for rejection");
}

TEST_F(ReplToolsTest, SubmitFinalAnswerStops) {
    open(SecurityLevel::BASIC);
    AgentToolResult r = registry_.execute("submit_final_answer", {{"answer", "forty-two"}});
    EXPECT_TRUE(r.success);
    EXPECT_FALSE(r.should_continue);
    Json j = Json::parse(r.output);
    EXPECT_EQ(j["status"], "complete");
    EXPECT_EQ(j["final_answer"], "forty-two");

    j = call("execute_code", {{"code", "1"}}, false);
    EXPECT_EQ(j["error_kind"], "invalid_transition");
}

TEST_F(ReplToolsTest, SubmitFinalVariable) {
    open(SecurityLevel::BASIC);
    call("execute_code", {{"code", "summary = 'done: ' + str(3)"}});

    Json j = call("submit_final_variable", {{"variable_name", "missing"}}, false);
    EXPECT_EQ(j["message"], "Variable 'missing' not found in REPL");
    EXPECT_EQ(j["available_variables"], Json::array({"summary"}));

    AgentToolResult r = registry_.execute("submit_final_variable", {{"variable_name", "'summary'"}});
    EXPECT_TRUE(r.success);
    EXPECT_FALSE(r.should_continue);
    j = Json::parse(r.output);
    EXPECT_EQ(j["final_answer"], "done: 3");
    EXPECT_EQ(j["variable_name"], "summary");
}

TEST_F(ReplToolsTest, ToolsOnUnknownSession) {
    registry_.register_provider(provider_);
    Json j = call("get_repl_state", Json::object(), false);
    EXPECT_EQ(j["error_kind"], "unknown_session");
    j = call("execute_code", {{"code", "1"}}, false);
    EXPECT_EQ(j["error_kind"], "unknown_session");
}

TEST(ReplReplyParsingTest, FindsFencedBlocks) {
    std::string text =
        "Let me look.\n"
        "```repl\n"
        "x = 1\n"
        "print(x)\n"
        "```\n"
        "and then\n"
        "```json\n{\"a\": 1}\n```\n"
        "```python  \n"
        "y = 2\n"
        "```\n";
    std::vector<std::string> blocks = find_code_blocks(text);
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0], "x = 1\nprint(x)");
    EXPECT_EQ(blocks[1], "y = 2");

    EXPECT_TRUE(find_code_blocks("no code here").empty());
    EXPECT_TRUE(find_code_blocks("```repl\nunterminated").empty());
}

TEST(ReplReplyParsingTest, FinalMarker) {
    std::string answer;
    ASSERT_TRUE(check_for_final_answer("Done.\nFINAL(  the total is 7 )\n", answer));
    EXPECT_EQ(answer, "the total is 7");
    EXPECT_FALSE(check_for_final_answer("no marker", answer));
    EXPECT_FALSE(check_for_final_answer("FINAL(unclosed", answer));
}
