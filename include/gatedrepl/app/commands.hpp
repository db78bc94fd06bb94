/*
 * gatedrepl C++ - Slash Commands
 */
#ifndef gatedrepl_APP_COMMANDS_HPP
#define gatedrepl_APP_COMMANDS_HPP

#include <functional>
#include <string>
#include <vector>

namespace gatedrepl {

class Application;

typedef std::function<std::string(Application& app, const std::string& args)> CommandHandler;

struct CommandDef {
    std::string name;           // including the leading '/'
    std::string description;
    CommandHandler handler;

    CommandDef() {}
    CommandDef(const std::string& n, const std::string& d, CommandHandler h)
        : name(n), description(d), handler(h) {}
};

namespace commands {
    std::string cmd_help(Application& app, const std::string& args);
    std::string cmd_approve(Application& app, const std::string& args);
    std::string cmd_reject(Application& app, const std::string& args);
    std::string cmd_state(Application& app, const std::string& args);
    std::string cmd_final(Application& app, const std::string& args);
    std::string cmd_finalvar(Application& app, const std::string& args);
    std::string cmd_reset(Application& app, const std::string& args);
    std::string cmd_tools(Application& app, const std::string& args);
    std::string cmd_quit(Application& app, const std::string& args);
}

// /help, /approve, /reject, /state, /final, /finalvar, /reset, /tools, /quit
std::vector<CommandDef> core_commands();

} // namespace gatedrepl

#endif // gatedrepl_APP_COMMANDS_HPP
