/*
 * gatedrepl C++ - REPL Agent Tools
 *
 * Exposes one ReplService session to an orchestrating model:
 * - execute_code: submit code, run it when the review approves it
 * - approve_code_execution / reject_code_execution: reviewer decision
 *   for code held under STRICT security
 * - submit_final_answer / submit_final_variable: complete the session
 * - get_repl_state: state, counters, variables and last output
 *
 * Every tool answers with a JSON document.
 */
#ifndef gatedrepl_REPL_REPL_TOOLS_HPP
#define gatedrepl_REPL_REPL_TOOLS_HPP

#include "repl_service.hpp"
#include <gatedrepl/core/tool.hpp>
#include <string>
#include <vector>

namespace gatedrepl {

class ReplToolsProvider : public ToolProvider {
public:
    // The service must outlive the provider and the tools it hands out
    ReplToolsProvider(ReplService& service, const std::string& session_id);

    const char* tool_id() const override { return "repl"; }
    const char* description() const override {
        return "Gated code execution in a persistent REPL session";
    }

    std::vector<AgentTool> get_agent_tools() const override;

    const std::string& session_id() const { return session_id_; }

    AgentToolResult do_execute_code(const Json& params) const;
    AgentToolResult do_approve(const Json& params) const;
    AgentToolResult do_reject(const Json& params) const;
    AgentToolResult do_submit_final_answer(const Json& params) const;
    AgentToolResult do_submit_final_variable(const Json& params) const;
    AgentToolResult do_get_state(const Json& params) const;

private:
    ReplService& service_;
    std::string session_id_;
};

// Bodies of ```repl / ```python fenced blocks, in order
std::vector<std::string> find_code_blocks(const std::string& text);

// Stripped text of the first FINAL(...) marker
bool check_for_final_answer(const std::string& text, std::string& answer);

} // namespace gatedrepl

#endif // gatedrepl_REPL_REPL_TOOLS_HPP
