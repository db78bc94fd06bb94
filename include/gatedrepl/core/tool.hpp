/*
 * gatedrepl C++ - Agent Tools
 *
 * Tool definitions exposed to an orchestrating model, and the registry
 * that dispatches calls to them.
 *
 * Tool Call Format:
 *   {"tool": "tool_name", "arguments": {"param1": "value1"}}
 *
 * Tool Result Format (fed back to the model as plain text):
 *   [TOOL_RESULT tool=tool_name success=true]
 *     ... result content ...
 *   [/TOOL_RESULT]
 */
#ifndef gatedrepl_CORE_TOOL_HPP
#define gatedrepl_CORE_TOOL_HPP

#include "json.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace gatedrepl {

// ============================================================================
// Tool Definition
// ============================================================================

// Schema for a tool parameter
struct ToolParamSchema {
    std::string name;
    std::string type;       // "string", "number", "boolean", "array", "object"
    std::string description;
    bool required;

    ToolParamSchema() : required(false) {}
    ToolParamSchema(const std::string& n, const std::string& t, const std::string& d, bool r = false)
        : name(n), type(t), description(d), required(r) {}
};

// Tool execution result
struct AgentToolResult {
    bool success;
    std::string output;     // Text output to show the model
    std::string error;      // Error message if failed
    bool should_continue;   // False once the task is finished

    AgentToolResult() : success(false), should_continue(true) {}

    static AgentToolResult ok(const std::string& output) {
        AgentToolResult r;
        r.success = true;
        r.output = output;
        return r;
    }

    static AgentToolResult fail(const std::string& err) {
        AgentToolResult r;
        r.success = false;
        r.error = err;
        return r;
    }

    static AgentToolResult stop(const std::string& output) {
        AgentToolResult r;
        r.success = true;
        r.output = output;
        r.should_continue = false;
        return r;
    }
};

typedef std::function<AgentToolResult(const Json& params)> ToolExecutor;

struct AgentTool {
    std::string name;
    std::string description;
    std::vector<ToolParamSchema> params;
    ToolExecutor execute;

    AgentTool() {}
    AgentTool(const std::string& n, const std::string& d, ToolExecutor e)
        : name(n), description(d), execute(e) {}
};

// ============================================================================
// Tool Provider
// ============================================================================

class ToolProvider {
public:
    virtual ~ToolProvider() {}

    virtual const char* tool_id() const = 0;
    virtual const char* description() const = 0;

    // Tools with their schemas and executors bound to this provider
    virtual std::vector<AgentTool> get_agent_tools() const = 0;
};

// ============================================================================
// Tool Registry
// ============================================================================

struct ParsedToolCall {
    std::string tool_name;
    Json params;
    bool valid;
    std::string parse_error;

    ParsedToolCall() : params(Json::object()), valid(false) {}
};

class ToolRegistry {
public:
    void register_tool(const AgentTool& tool);

    // Registers every tool of the provider; returns how many
    size_t register_provider(const ToolProvider& provider);

    const std::map<std::string, AgentTool>& tools() const { return tools_; }
    bool has_tool(const std::string& name) const;

    // Tools section for a system prompt
    std::string build_tools_prompt() const;

    // Parse one {"tool": ..., "arguments": {...}} object
    static ParsedToolCall parse_tool_call(const std::string& text);

    // Unknown tools and missing required parameters fail without running
    AgentToolResult execute(const std::string& name, const Json& params) const;
    AgentToolResult execute(const ParsedToolCall& call) const;

    static std::string format_tool_result(const std::string& tool_name, const AgentToolResult& result);

private:
    std::string available_tools() const;

    std::map<std::string, AgentTool> tools_;
};

} // namespace gatedrepl

#endif // gatedrepl_CORE_TOOL_HPP
