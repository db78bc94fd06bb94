/*
 * gatedrepl C++ - Application
 *
 * Command-line driver around one REPL session:
 *
 *   gatedrepl [options] [config.json]
 *
 * Input is read in units terminated by a blank line (or end of input):
 *   /command args        slash command, see /help
 *   {"tool": ...}        raw tool call
 *   ```repl ... ```      fenced code blocks, executed in order
 *   FINAL(answer)        submit the final answer
 *   anything else        code to execute
 */
#ifndef gatedrepl_APP_APPLICATION_HPP
#define gatedrepl_APP_APPLICATION_HPP

#include "commands.hpp"
#include <gatedrepl/core/config.hpp>
#include <gatedrepl/core/tool.hpp>
#include <gatedrepl/repl/artifact_sink.hpp>
#include <gatedrepl/repl/repl_service.hpp>
#include <gatedrepl/repl/repl_tools.hpp>
#include <gatedrepl/repl/state_store.hpp>

#include <atomic>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>

namespace gatedrepl {

struct AppInfo {
    static const char* NAME;
    static const char* VERSION;
};

class Application {
public:
    Application();
    ~Application();

    // Process-wide instance used by main() and the signal handler
    static Application& instance();

    // Parse arguments, load the config file, prepare the jail, build the
    // service and open the session, then activate Landlock.
    // Returns false for --help/--version or fatal errors.
    bool init(int argc, char* argv[]);

    // Build everything from an already loaded config under base_dir
    // (the jail layout root). Does not activate Landlock.
    bool configure(const Config& cfg, const std::string& base_dir);

    int run();
    int run(std::istream& in, std::ostream& out);
    void shutdown();

    void stop() { running_ = false; }
    bool is_running() const { return running_.load(); }

    // init() stopped after printing --help or --version
    bool info_only() const { return info_only_; }

    // One input unit -> text to print
    std::string handle_input(const std::string& input);

    // Fresh session with a new identifier (used by /reset)
    bool open_new_session();

    Config& config() { return config_; }
    ReplService& service() { return *service_; }
    ToolRegistry& tools() { return tools_; }
    const std::map<std::string, CommandDef>& commands() const { return commands_; }
    const std::string& session_id() const { return session_id_; }

    // Execute a tool against the current session, formatted for display
    std::string call_tool(const std::string& name, const Json& params);

private:
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    void setup_logging();
    bool setup_state_store(const std::string& default_db_path);
    bool setup_service(const std::string& base_dir);
    bool open_session(const std::string& session_id, bool resume);
    void activate_jail();

    std::string handle_command(const std::string& line);

    std::atomic<bool> running_;
    Config config_;
    std::string config_file_;
    std::string session_arg_;
    std::string context_file_;
    bool resume_;
    bool info_only_;

    std::unique_ptr<SqliteStateDatabase> database_;
    std::unique_ptr<ReplService> service_;
    std::unique_ptr<ReplToolsProvider> provider_;
    ToolRegistry tools_;
    std::map<std::string, CommandDef> commands_;
    std::string session_id_;
};

} // namespace gatedrepl

#endif // gatedrepl_APP_APPLICATION_HPP
