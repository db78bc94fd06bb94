/*
 * gatedrepl C++ - Application Implementation
 *
 * Wires the jail, state database, artifact sink, REPL service and tool
 * registry together and drives one session from a line-oriented stream.
 */
#include <gatedrepl/app/application.hpp>
#include <gatedrepl/core/jail.hpp>
#include <gatedrepl/core/logger.hpp>
#include <gatedrepl/core/utils.hpp>

#include <csignal>
#include <cstring>
#include <iostream>
#include <sstream>

namespace gatedrepl {

const char* AppInfo::NAME = "gatedrepl";
const char* AppInfo::VERSION = "0.1.0";

// ============================================================================
// Utility Functions
// ============================================================================

static void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - gated code execution REPL\n\n"
              << "Usage: " << prog << " [options] [config.json]\n\n"
              << "Options:\n"
              << "  -h, --help          Show this help message\n"
              << "  -v, --version       Show version\n"
              << "  --config <file>     Configuration file\n"
              << "  --session <id>      Session identifier (default: random)\n"
              << "  --resume            Reload the session from the state database\n"
              << "  --context <file>    Context file (.json files load as structured data)\n";
}

static void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

static size_t count_fences(const std::string& text) {
    size_t count = 0;
    size_t pos = 0;
    while ((pos = text.find("```", pos)) != std::string::npos) {
        ++count;
        pos += 3;
    }
    return count;
}

// ============================================================================
// Signal Handler
// ============================================================================

namespace {
    void signal_handler(int sig) {
        (void)sig;
        Application::instance().stop();
    }
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : running_(true)
    , resume_(false)
    , info_only_(false)
{}

Application::~Application() {
    shutdown();
}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            info_only_ = true;
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            info_only_ = true;
            return false;
        }
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file_ = argv[++i];
            continue;
        }
        if (strcmp(argv[i], "--session") == 0 && i + 1 < argc) {
            session_arg_ = argv[++i];
            continue;
        }
        if (strcmp(argv[i], "--context") == 0 && i + 1 < argc) {
            context_file_ = argv[++i];
            continue;
        }
        if (strcmp(argv[i], "--resume") == 0) {
            resume_ = true;
            continue;
        }
        if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return false;
        }
        config_file_ = argv[i];
    }
    return true;
}

void Application::setup_logging() {
    std::string level = config_.get_string("log.level", "info");
    Logger::instance().set_level(parse_log_level(level, LogLevel::INFO));
}

bool Application::setup_state_store(const std::string& default_db_path) {
    std::string db_path = config_.get_string("state.db_path", default_db_path);
    if (db_path.empty()) {
        LOG_INFO("[App] No state database configured, session state is kept in memory");
        return true;
    }

    // The database may live outside the base directory
    size_t slash = db_path.rfind('/');
    if (db_path != ":memory:" && slash != std::string::npos && slash > 0) {
        Jail::instance().allow_path(db_path.substr(0, slash));
    }

    std::unique_ptr<SqliteStateDatabase> db(new SqliteStateDatabase());
    if (!db->open(db_path)) {
        LOG_ERROR("[App] Failed to open state database %s: %s", db_path.c_str(), db->last_error().c_str());
        return false;
    }
    if (!db->ensure_schema()) {
        LOG_ERROR("[App] Failed to create state schema: %s", db->last_error().c_str());
        return false;
    }
    database_ = std::move(db);
    LOG_INFO("[App] State database: %s", db_path.c_str());
    return true;
}

bool Application::setup_service(const std::string& base_dir) {
    Jail& jail = Jail::instance();
    ReplServiceOptions opts = ReplServiceOptions::from_config(config_, jail.sessions_dir());
    service_.reset(new ReplService(opts));

    if (database_) {
        SqliteStateDatabase* db = database_.get();
        service_->set_state_store_factory([db](const std::string& session_id) {
            return db->session_view(session_id);
        });
    }

    if (opts.session_defaults.artifacts_enabled) {
        std::string dir = config_.get_string("artifacts.dir", jail.artifacts_dir());
        jail.allow_path(dir);
        service_->set_artifact_sink(ArtifactSinkPtr(new DirectoryArtifactSink(dir)));
        LOG_INFO("[App] Code artifacts: %s", dir.c_str());
    }

    LOG_DEBUG("[App] Service ready (base=%s, security=%s, max_iterations=%lld)",
              base_dir.c_str(), security_level_name(opts.session_defaults.security_level),
              static_cast<long long>(opts.session_defaults.max_iterations));
    return true;
}

bool Application::open_session(const std::string& session_id, bool resume) {
    SessionOptions opts = service_->session_defaults();
    opts.query = config_.get_string("session.query", "");
    opts.resume = resume;

    std::string context_file = context_file_.empty() ? config_.get_string("session.context_file", "")
                                                     : context_file_;
    if (!context_file.empty()) {
        std::string text;
        if (!read_file(context_file, text)) {
            LOG_ERROR("[App] Cannot read context file %s", context_file.c_str());
            return false;
        }
        if (ends_with(to_lower(context_file), ".json")) {
            try {
                opts.context_json = Json::parse(text);
            } catch (const nlohmann::json::parse_error& e) {
                LOG_WARN("[App] %s is not valid JSON (%s), loading it as text", context_file.c_str(), e.what());
                opts.context = text;
            }
        } else {
            opts.context = text;
        }
    }

    OperationResult result = service_->open_session(session_id, opts);
    if (!result.ok()) {
        LOG_ERROR("[App] Cannot open session %s: %s", session_id.c_str(), result.message.c_str());
        return false;
    }

    // Tools capture the provider; replace both together
    std::unique_ptr<ReplToolsProvider> provider(new ReplToolsProvider(*service_, session_id));
    ToolRegistry tools;
    tools.register_provider(*provider);
    tools_ = tools;
    provider_ = std::move(provider);
    session_id_ = session_id;

    LOG_INFO("[App] Session %s %s (state=%s)", session_id.c_str(),
             result.status.c_str(), result.state.c_str());
    return true;
}

bool Application::open_new_session() {
    return open_session(generate_uuid(), false);
}

bool Application::configure(const Config& cfg, const std::string& base_dir) {
    config_ = cfg;
    setup_logging();

    if (!Jail::instance().init(base_dir)) {
        LOG_ERROR("[App] Failed to prepare directories under %s", base_dir.c_str());
        return false;
    }
    if (!setup_state_store(Jail::instance().state_db_path())) {
        return false;
    }
    if (!setup_service(Jail::instance().base_dir())) {
        return false;
    }

    commands_.clear();
    std::vector<CommandDef> cmds = core_commands();
    for (size_t i = 0; i < cmds.size(); ++i) {
        commands_[cmds[i].name] = cmds[i];
    }

    std::string id = session_arg_.empty() ? config_.get_string("session.id", "") : session_arg_;
    bool resume = resume_ || config_.get_bool("session.resume", false);
    if (id.empty()) {
        if (resume) LOG_WARN("[App] --resume needs a session id; starting a new session");
        id = generate_uuid();
        resume = false;
    }
    return open_session(id, resume);
}

void Application::activate_jail() {
    if (!config_.get_bool("jail.landlock", true)) {
        LOG_WARN("[Jail] Landlock disabled by config (jail.landlock=false)");
        return;
    }

    Jail& jail = Jail::instance();
    if (jail.activate()) {
        LOG_INFO("[Jail] Process jailed into %s", jail.base_dir().c_str());
    } else {
        LOG_WARN("[Jail] Could not activate Landlock. The process is NOT jailed.");
    }
}

bool Application::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv)) {
        return false;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    if (!config_file_.empty()) {
        if (!config_.load_file(config_file_)) {
            LOG_ERROR("Failed to load config from %s: %s", config_file_.c_str(), config_.error().c_str());
            return false;
        }
        LOG_INFO("Loaded config from %s", config_file_.c_str());
    }

    LOG_INFO("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);

    if (!configure(config_, config_.get_string("jail.base_dir", ""))) {
        return false;
    }

    // Config, context and database are open; lock the filesystem down
    activate_jail();
    return true;
}

// ============================================================================
// Input handling
// ============================================================================

std::string Application::call_tool(const std::string& name, const Json& params) {
    AgentToolResult result = tools_.execute(name, params);
    return ToolRegistry::format_tool_result(name, result);
}

std::string Application::handle_command(const std::string& line) {
    std::string name = line;
    std::string args;
    size_t space = line.find_first_of(" \t");
    if (space != std::string::npos) {
        name = line.substr(0, space);
        args = line.substr(space + 1);
    }

    std::map<std::string, CommandDef>::const_iterator it = commands_.find(to_lower(name));
    if (it == commands_.end()) {
        return "Unknown command: " + name + " (try /help)";
    }
    return it->second.handler(*this, args);
}

std::string Application::handle_input(const std::string& input) {
    std::string text = trim(input);
    if (text.empty()) return "";

    if (text[0] == '/') {
        return handle_command(text);
    }

    if (text[0] == '{') {
        ParsedToolCall call = ToolRegistry::parse_tool_call(text);
        if (call.valid) {
            return ToolRegistry::format_tool_result(call.tool_name, tools_.execute(call));
        }
        // Not a tool call; a dict literal is code
    }

    if (text.find("```") != std::string::npos) {
        std::vector<std::string> blocks = find_code_blocks(input);
        std::string answer;
        if (blocks.empty()) {
            if (check_for_final_answer(text, answer)) {
                Json params;
                params["answer"] = answer;
                return call_tool("submit_final_answer", params);
            }
            return "No ```repl code blocks found";
        }

        std::ostringstream oss;
        for (size_t i = 0; i < blocks.size(); ++i) {
            if (i > 0) oss << "\n";
            Json params;
            params["code"] = blocks[i];
            AgentToolResult result = tools_.execute("execute_code", params);
            oss << ToolRegistry::format_tool_result("execute_code", result);

            // Held or refused code stops the remaining blocks
            if (!result.success) break;
            Json reply = Json::parse(result.output, nullptr, false);
            std::string status = reply.is_object() ? reply.value("status", std::string()) : std::string();
            if (status == "pending_approval" || status == "rejected") break;
        }
        return oss.str();
    }

    if (starts_with(text, "FINAL(")) {
        std::string answer;
        if (check_for_final_answer(text, answer)) {
            Json params;
            params["answer"] = answer;
            return call_tool("submit_final_answer", params);
        }
    }

    Json params;
    params["code"] = rtrim(input);
    return call_tool("execute_code", params);
}

int Application::run(std::istream& in, std::ostream& out) {
    out << AppInfo::NAME << " session " << session_id_ << " - /help for commands\n";

    std::string unit;
    std::string line;
    while (running_.load() && std::getline(in, line)) {
        if (unit.empty() && !line.empty() && line[0] == '/') {
            out << handle_input(line) << "\n";
            continue;
        }

        // Blank lines end a unit, except inside an open fence
        if (trim(line).empty() && count_fences(unit) % 2 == 0) {
            if (!unit.empty()) {
                out << handle_input(unit) << "\n";
                unit.clear();
            }
            continue;
        }
        unit += line + "\n";
    }

    if (running_.load() && !trim(unit).empty()) {
        out << handle_input(unit) << "\n";
    }
    out.flush();
    return 0;
}

int Application::run() {
    return run(std::cin, std::cout);
}

void Application::shutdown() {
    if (!service_ && !database_) return;
    LOG_INFO("Shutting down...");

    tools_ = ToolRegistry();
    provider_.reset();
    service_.reset();
    if (database_) {
        database_->close();
        database_.reset();
    }

    LOG_INFO("Goodbye!");
}

} // namespace gatedrepl
