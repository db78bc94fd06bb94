#include <gatedrepl/core/tool.hpp>

#include <gtest/gtest.h>

using namespace gatedrepl;

namespace {

AgentTool make_echo_tool() {
    AgentTool tool("echo", "Echo the text back", [](const Json& params) {
        return AgentToolResult::ok(params["text"].get<std::string>());
    });
    tool.params.push_back(ToolParamSchema("text", "string", "Text to echo", true));
    tool.params.push_back(ToolParamSchema("times", "number", "Repeat count"));
    return tool;
}

class CounterProvider : public ToolProvider {
public:
    CounterProvider() : calls(0) {}

    const char* tool_id() const override { return "counter"; }
    const char* description() const override { return "Counts calls"; }

    std::vector<AgentTool> get_agent_tools() const override {
        std::vector<AgentTool> tools;
        tools.push_back(AgentTool("count", "Increment the counter", [this](const Json&) {
            ++calls;
            return AgentToolResult::ok(std::to_string(calls));
        }));
        tools.push_back(AgentTool("done", "Finish", [](const Json&) {
            return AgentToolResult::stop("finished");
        }));
        return tools;
    }

    mutable int calls;
};

} // namespace

TEST(ToolRegistryTest, RegisterAndExecute) {
    ToolRegistry registry;
    registry.register_tool(make_echo_tool());
    EXPECT_TRUE(registry.has_tool("echo"));
    EXPECT_FALSE(registry.has_tool("missing"));

    AgentToolResult r = registry.execute("echo", {{"text", "hello"}});
    EXPECT_TRUE(r.success);
    EXPECT_TRUE(r.should_continue);
    EXPECT_EQ(r.output, "hello");
}

TEST(ToolRegistryTest, MissingRequiredParameter) {
    ToolRegistry registry;
    registry.register_tool(make_echo_tool());

    AgentToolResult r = registry.execute("echo", {{"times", 2}});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "Missing required parameter 'text' for tool echo");

    r = registry.execute("echo", Json::array({"text"}));
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "Tool arguments must be a JSON object");
}

TEST(ToolRegistryTest, UnknownToolListsAvailable) {
    ToolRegistry registry;
    CounterProvider provider;
    EXPECT_EQ(registry.register_provider(provider), 2u);

    AgentToolResult r = registry.execute("nope", Json::object());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "Unknown tool: nope\nAvailable tools: count, done");
}

TEST(ToolRegistryTest, ProviderToolsShareProviderState) {
    ToolRegistry registry;
    CounterProvider provider;
    registry.register_provider(provider);

    registry.execute("count", Json::object());
    AgentToolResult r = registry.execute("count", Json::object());
    EXPECT_EQ(r.output, "2");
    EXPECT_EQ(provider.calls, 2);

    r = registry.execute("done", Json::object());
    EXPECT_TRUE(r.success);
    EXPECT_FALSE(r.should_continue);
}

TEST(ToolRegistryTest, ParseToolCall) {
    ParsedToolCall call = ToolRegistry::parse_tool_call(R"({"tool": "echo", "arguments": {"text": "x"}})");
    ASSERT_TRUE(call.valid);
    EXPECT_EQ(call.tool_name, "echo");
    EXPECT_EQ(call.params["text"], "x");

    call = ToolRegistry::parse_tool_call(R"({"tool": "get_repl_state"})");
    ASSERT_TRUE(call.valid);
    EXPECT_TRUE(call.params.is_object());
    EXPECT_TRUE(call.params.empty());

    call = ToolRegistry::parse_tool_call("{not json");
    EXPECT_FALSE(call.valid);
    EXPECT_FALSE(call.parse_error.empty());

    call = ToolRegistry::parse_tool_call(R"({"name": "echo"})");
    EXPECT_FALSE(call.valid);
    EXPECT_EQ(call.parse_error, "expected an object with a string \"tool\" field");

    call = ToolRegistry::parse_tool_call(R"({"tool": "echo", "arguments": "text"})");
    EXPECT_FALSE(call.valid);
    EXPECT_EQ(call.parse_error, "\"arguments\" must be an object");
}

TEST(ToolRegistryTest, ExecuteParsedCall) {
    ToolRegistry registry;
    registry.register_tool(make_echo_tool());

    AgentToolResult r = registry.execute(ToolRegistry::parse_tool_call(R"({"tool": "echo", "arguments": {"text": "hi"}})"));
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.output, "hi");

    r = registry.execute(ToolRegistry::parse_tool_call("[]"));
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error.find("Invalid tool call - JSON parsing failed"), 0u);
}

TEST(ToolRegistryTest, FormatToolResult) {
    EXPECT_EQ(ToolRegistry::format_tool_result("echo", AgentToolResult::ok("hello")),
              "[TOOL_RESULT tool=echo success=true]\nhello\n[/TOOL_RESULT]");
    EXPECT_EQ(ToolRegistry::format_tool_result("echo", AgentToolResult::fail("bad input")),
              "[TOOL_RESULT tool=echo success=false]\nError: bad input\n[/TOOL_RESULT]");
}

TEST(ToolRegistryTest, ToolsPrompt) {
    ToolRegistry registry;
    EXPECT_EQ(registry.build_tools_prompt(), "");

    registry.register_tool(make_echo_tool());
    std::string prompt = registry.build_tools_prompt();
    EXPECT_EQ(prompt.compare(0, 20, "## Available Tools\n\n"), 0);
    EXPECT_NE(prompt.find("**echo**: Echo the text back\n"), std::string::npos);
    EXPECT_NE(prompt.find("  - `text` (string, required): Text to echo\n"), std::string::npos);
    EXPECT_NE(prompt.find("  - `times` (number): Repeat count\n"), std::string::npos);
}
