/*
 * gatedrepl C++ - Slash Commands Implementation
 */
#include <gatedrepl/app/commands.hpp>
#include <gatedrepl/app/application.hpp>
#include <gatedrepl/core/utils.hpp>

#include <sstream>

namespace gatedrepl {

std::vector<CommandDef> core_commands() {
    std::vector<CommandDef> cmds;
    cmds.push_back(CommandDef("/help", "Show help message", commands::cmd_help));
    cmds.push_back(CommandDef("/approve", "Approve and run the pending code", commands::cmd_approve));
    cmds.push_back(CommandDef("/reject", "Reject the pending code: /reject <reason>", commands::cmd_reject));
    cmds.push_back(CommandDef("/state", "Show the REPL state", commands::cmd_state));
    cmds.push_back(CommandDef("/final", "Submit the final answer: /final <answer>", commands::cmd_final));
    cmds.push_back(CommandDef("/finalvar", "Submit a variable as the answer: /finalvar <name>",
                              commands::cmd_finalvar));
    cmds.push_back(CommandDef("/reset", "Destroy the session and start a new one", commands::cmd_reset));
    cmds.push_back(CommandDef("/tools", "Show the agent tool descriptions", commands::cmd_tools));
    cmds.push_back(CommandDef("/quit", "Exit", commands::cmd_quit));
    return cmds;
}

// ============================================================================
// Command Implementations
// ============================================================================

namespace commands {

std::string cmd_help(Application& app, const std::string& /*args*/) {
    const std::map<std::string, CommandDef>& cmds = app.commands();

    std::ostringstream oss;
    oss << AppInfo::NAME << " v" << AppInfo::VERSION << "\n\n"
        << "Commands:\n";
    for (std::map<std::string, CommandDef>::const_iterator it = cmds.begin(); it != cmds.end(); ++it) {
        oss << it->first << " - " << it->second.description << "\n";
    }
    oss << "\nAnything else is run as code. End each input with an empty line.\n"
        << "```repl fenced blocks run one after another, FINAL(answer) completes the session.";
    return oss.str();
}

std::string cmd_approve(Application& app, const std::string& /*args*/) {
    return app.call_tool("approve_code_execution", Json::object());
}

std::string cmd_reject(Application& app, const std::string& args) {
    Json params;
    params["reason"] = trim(args);
    return app.call_tool("reject_code_execution", params);
}

std::string cmd_state(Application& app, const std::string& /*args*/) {
    return app.call_tool("get_repl_state", Json::object());
}

std::string cmd_final(Application& app, const std::string& args) {
    std::string answer = trim(args);
    if (answer.empty()) {
        return "Usage: /final <answer>";
    }
    Json params;
    params["answer"] = answer;
    return app.call_tool("submit_final_answer", params);
}

std::string cmd_finalvar(Application& app, const std::string& args) {
    std::string name = trim(args);
    if (name.empty()) {
        return "Usage: /finalvar <name>";
    }
    Json params;
    params["variable_name"] = name;
    return app.call_tool("submit_final_variable", params);
}

std::string cmd_reset(Application& app, const std::string& /*args*/) {
    std::string old_id = app.session_id();
    OperationResult result = app.service().reset(old_id);
    if (!result.ok()) {
        return "Reset failed: " + result.message;
    }
    if (!app.open_new_session()) {
        return "Session " + old_id + " destroyed, but a new session could not be opened";
    }
    return "Session " + old_id + " destroyed. New session: " + app.session_id();
}

std::string cmd_tools(Application& app, const std::string& /*args*/) {
    return app.tools().build_tools_prompt();
}

std::string cmd_quit(Application& app, const std::string& /*args*/) {
    app.stop();
    return "Bye.";
}

} // namespace commands

} // namespace gatedrepl
