/*
 * gatedrepl C++ - Tool Registry Implementation
 */
#include <gatedrepl/core/tool.hpp>
#include <gatedrepl/core/logger.hpp>

#include <sstream>

namespace gatedrepl {

void ToolRegistry::register_tool(const AgentTool& tool) {
    LOG_DEBUG("[Tools] Registering tool: %s", tool.name.c_str());
    tools_[tool.name] = tool;
}

size_t ToolRegistry::register_provider(const ToolProvider& provider) {
    std::vector<AgentTool> tools = provider.get_agent_tools();
    for (size_t i = 0; i < tools.size(); ++i) {
        register_tool(tools[i]);
    }
    LOG_INFO("[Tools] Provider '%s' registered %zu tools", provider.tool_id(), tools.size());
    return tools.size();
}

bool ToolRegistry::has_tool(const std::string& name) const {
    return tools_.find(name) != tools_.end();
}

std::string ToolRegistry::build_tools_prompt() const {
    if (tools_.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "## Available Tools\n\n";
    oss << "Call a tool with this JSON format:\n\n";
    oss << "```json\n";
    oss << "{\n";
    oss << "  \"tool\": \"TOOLNAME\",\n";
    oss << "  \"arguments\": {\n";
    oss << "    \"param\": \"value\"\n";
    oss << "  }\n";
    oss << "}\n";
    oss << "```\n\n";

    oss << "### Tools:\n\n";

    for (std::map<std::string, AgentTool>::const_iterator it = tools_.begin();
         it != tools_.end(); ++it) {
        const AgentTool& tool = it->second;
        oss << "**" << tool.name << "**: " << tool.description << "\n";

        if (!tool.params.empty()) {
            oss << "  Parameters:\n";
            for (size_t i = 0; i < tool.params.size(); ++i) {
                const ToolParamSchema& param = tool.params[i];
                oss << "  - `" << param.name << "` (" << param.type;
                if (param.required) oss << ", required";
                oss << "): " << param.description << "\n";
            }
        }
        oss << "\n";
    }

    return oss.str();
}

ParsedToolCall ToolRegistry::parse_tool_call(const std::string& text) {
    ParsedToolCall call;
    Json j;
    try {
        j = Json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        call.parse_error = e.what();
        return call;
    }

    if (!j.is_object() || !j.contains("tool") || !j["tool"].is_string()) {
        call.parse_error = "expected an object with a string \"tool\" field";
        return call;
    }
    call.tool_name = j["tool"].get<std::string>();

    if (j.contains("arguments")) {
        if (!j["arguments"].is_object()) {
            call.parse_error = "\"arguments\" must be an object";
            return call;
        }
        call.params = j["arguments"];
    }
    call.valid = true;
    return call;
}

std::string ToolRegistry::available_tools() const {
    std::string names;
    for (std::map<std::string, AgentTool>::const_iterator t = tools_.begin(); t != tools_.end(); ++t) {
        if (t != tools_.begin()) names += ", ";
        names += t->first;
    }
    return names;
}

AgentToolResult ToolRegistry::execute(const std::string& name, const Json& params) const {
    std::map<std::string, AgentTool>::const_iterator it = tools_.find(name);
    if (it == tools_.end()) {
        return AgentToolResult::fail("Unknown tool: " + name + "\nAvailable tools: " + available_tools());
    }

    const AgentTool& tool = it->second;
    if (!params.is_object()) {
        return AgentToolResult::fail("Tool arguments must be a JSON object");
    }
    for (size_t i = 0; i < tool.params.size(); ++i) {
        if (tool.params[i].required && !params.contains(tool.params[i].name)) {
            return AgentToolResult::fail("Missing required parameter '" + tool.params[i].name +
                                         "' for tool " + name);
        }
    }

    LOG_DEBUG("[Tools] Executing %s", name.c_str());
    return tool.execute(params);
}

AgentToolResult ToolRegistry::execute(const ParsedToolCall& call) const {
    if (!call.valid) {
        return AgentToolResult::fail("Invalid tool call - JSON parsing failed: " + call.parse_error);
    }
    return execute(call.tool_name, call.params);
}

std::string ToolRegistry::format_tool_result(const std::string& tool_name, const AgentToolResult& result) {
    std::ostringstream oss;
    oss << "[TOOL_RESULT tool=" << tool_name
        << " success=" << (result.success ? "true" : "false") << "]\n";

    if (result.success) {
        oss << result.output;
    } else {
        oss << "Error: " << result.error;
    }

    oss << "\n[/TOOL_RESULT]";
    return oss.str();
}

} // namespace gatedrepl
