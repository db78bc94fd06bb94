/*
 * gatedrepl C++ - REPL Agent Tools Implementation
 */
#include <gatedrepl/repl/repl_tools.hpp>
#include <gatedrepl/core/logger.hpp>
#include <gatedrepl/core/utils.hpp>

#include <cctype>

namespace gatedrepl {

// ============================================================================
// Helpers
// ============================================================================

namespace {

std::string render(const Json& j) {
    return j.dump(2, ' ', false, Json::error_handler_t::replace);
}

AgentToolResult failure(const std::string& message) {
    Json j;
    j["status"] = "error";
    j["message"] = message;
    return AgentToolResult::fail(render(j));
}

AgentToolResult failure_json(const Json& result) {
    return AgentToolResult::fail(render(result));
}

bool get_string_param(const Json& params, const char* name, std::string& out) {
    if (!params.contains(name) || !params[name].is_string()) return false;
    out = params[name].get<std::string>();
    return true;
}

} // namespace

// ============================================================================
// ReplToolsProvider
// ============================================================================

ReplToolsProvider::ReplToolsProvider(ReplService& service, const std::string& session_id)
    : service_(service)
    , session_id_(session_id) {}

std::vector<AgentTool> ReplToolsProvider::get_agent_tools() const {
    std::vector<AgentTool> tools;

    AgentTool execute_code;
    execute_code.name = "execute_code";
    execute_code.description =
        "Execute code in the persistent REPL. Variables survive between calls. "
        "The code can read `context`, call `llm_query(prompt)` and `FINAL_VAR(name)`. "
        "The last line is echoed when it is an expression.";
    execute_code.params.push_back(ToolParamSchema("code", "string", "Code to execute", true));
    execute_code.execute = [this](const Json& p) { return do_execute_code(p); };
    tools.push_back(execute_code);

    AgentTool approve;
    approve.name = "approve_code_execution";
    approve.description = "Approve the code pending review (STRICT security) and execute it";
    approve.execute = [this](const Json& p) { return do_approve(p); };
    tools.push_back(approve);

    AgentTool reject;
    reject.name = "reject_code_execution";
    reject.description = "Reject the code pending review (STRICT security)";
    reject.params.push_back(ToolParamSchema("reason", "string", "Reason for rejection", true));
    reject.execute = [this](const Json& p) { return do_reject(p); };
    tools.push_back(reject);

    AgentTool final_answer;
    final_answer.name = "submit_final_answer";
    final_answer.description = "Submit the final answer to the query and close the REPL session";
    final_answer.params.push_back(ToolParamSchema("answer", "string", "The final answer", true));
    final_answer.execute = [this](const Json& p) { return do_submit_final_answer(p); };
    tools.push_back(final_answer);

    AgentTool final_variable;
    final_variable.name = "submit_final_variable";
    final_variable.description = "Submit the value of a REPL variable as the final answer";
    final_variable.params.push_back(
        ToolParamSchema("variable_name", "string", "Name of the REPL variable", true));
    final_variable.execute = [this](const Json& p) { return do_submit_final_variable(p); };
    tools.push_back(final_variable);

    AgentTool state;
    state.name = "get_repl_state";
    state.description = "Show the REPL state: iteration, variables, last output and last error";
    state.execute = [this](const Json& p) { return do_get_state(p); };
    tools.push_back(state);

    return tools;
}

AgentToolResult ReplToolsProvider::do_execute_code(const Json& params) const {
    std::string code;
    if (!get_string_param(params, "code", code)) {
        return failure("Missing required parameter: code");
    }

    ExecuteResult result = service_.run_code(session_id_, code);

    if (result.executed) {
        // A failing script is still a completed tool call
        return AgentToolResult::ok(render(result.to_json()));
    }

    Json j;
    j["status"] = result.status;
    if (result.status == "pending_approval") {
        j["message"] = result.message;
        j["code"] = code;
        return AgentToolResult::ok(render(j));
    }
    if (result.status == "rejected") {
        j["reason"] = result.message;
        j["code"] = code;
        return AgentToolResult::ok(render(j));
    }
    return failure_json(result.to_json());
}

AgentToolResult ReplToolsProvider::do_approve(const Json& /*params*/) const {
    SessionSnapshot snap = service_.get_state(session_id_);
    if (snap.status == "error") {
        return failure_json(snap.to_json());
    }
    if (snap.pending_code.empty()) {
        return failure("No code pending for approval");
    }
    if (snap.state != repl_state_name(ReplState::PENDING_REVIEW)) {
        return failure("Invalid state for approval: " + snap.state);
    }

    OperationResult approved = service_.resolve_review(session_id_, true);
    if (!approved.ok()) {
        return failure_json(approved.to_json());
    }

    ExecuteResult result = service_.execute(session_id_);
    if (!result.executed) {
        return failure_json(result.to_json());
    }

    Json j = result.to_json();
    j["approval"] = approved.message;
    return AgentToolResult::ok(render(j));
}

AgentToolResult ReplToolsProvider::do_reject(const Json& params) const {
    std::string reason;
    get_string_param(params, "reason", reason);

    SessionSnapshot snap = service_.get_state(session_id_);
    if (snap.status == "error") {
        return failure_json(snap.to_json());
    }
    if (snap.pending_code.empty()) {
        return failure("No code pending for rejection");
    }

    OperationResult rejected = service_.resolve_review(session_id_, false, reason);
    if (!rejected.ok()) {
        return failure_json(rejected.to_json());
    }

    Json j;
    j["status"] = rejected.status;
    j["reason"] = rejected.message;
    j["code"] = rejected.code;
    return AgentToolResult::ok(render(j));
}

AgentToolResult ReplToolsProvider::do_submit_final_answer(const Json& params) const {
    std::string answer;
    if (!get_string_param(params, "answer", answer)) {
        return failure("Missing required parameter: answer");
    }

    FinalizeResult result = service_.finalize_answer(session_id_, answer);
    if (!result.ok()) {
        return failure_json(result.to_json());
    }

    Json j;
    j["status"] = result.status;
    j["final_answer"] = result.answer;
    return AgentToolResult::stop(render(j));
}

AgentToolResult ReplToolsProvider::do_submit_final_variable(const Json& params) const {
    std::string name;
    if (!get_string_param(params, "variable_name", name)) {
        return failure("Missing required parameter: variable_name");
    }

    FinalizeResult result = service_.finalize_variable(session_id_, name);
    if (!result.ok()) {
        return failure_json(result.to_json());
    }
    return AgentToolResult::stop(render(result.to_json()));
}

AgentToolResult ReplToolsProvider::do_get_state(const Json& /*params*/) const {
    SessionSnapshot snap = service_.get_state(session_id_);
    if (snap.status == "error") {
        return failure_json(snap.to_json());
    }
    return AgentToolResult::ok(render(snap.to_json()));
}

// ============================================================================
// Reply parsing
// ============================================================================

std::vector<std::string> find_code_blocks(const std::string& text) {
    static const char* const kLanguages[] = {"repl", "python", NULL};
    std::vector<std::string> blocks;

    size_t pos = 0;
    while ((pos = text.find("```", pos)) != std::string::npos) {
        size_t cursor = pos + 3;
        size_t tag_len = 0;
        for (size_t i = 0; kLanguages[i] != NULL; ++i) {
            std::string tag = kLanguages[i];
            if (text.compare(cursor, tag.size(), tag) == 0) {
                tag_len = tag.size();
                break;
            }
        }
        if (tag_len == 0) {
            ++pos;
            continue;
        }
        cursor += tag_len;

        size_t ws_end = cursor;
        while (ws_end < text.size() && std::isspace(static_cast<unsigned char>(text[ws_end]))) ++ws_end;

        // The body starts after a newline of the whitespace run, latest first
        bool matched = false;
        for (size_t nl = ws_end; nl > cursor; --nl) {
            if (text[nl - 1] != '\n') continue;
            size_t body = nl;
            size_t close = text.find("\n```", body);
            if (close == std::string::npos) continue;
            blocks.push_back(text.substr(body, close - body));
            pos = close + 4;
            matched = true;
            break;
        }
        if (!matched) ++pos;
    }

    return blocks;
}

bool check_for_final_answer(const std::string& text, std::string& answer) {
    size_t start = text.find("FINAL(");
    if (start == std::string::npos) return false;
    start += 6;
    size_t end = text.find(')', start);
    if (end == std::string::npos) return false;
    answer = trim(text.substr(start, end - start));
    return true;
}

} // namespace gatedrepl
