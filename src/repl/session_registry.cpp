/*
 * gatedrepl C++ - Session Registry Implementation
 */
#include <gatedrepl/repl/session_registry.hpp>
#include <gatedrepl/core/logger.hpp>
#include <gatedrepl/core/utils.hpp>

#include <cctype>
#include <stdexcept>

namespace gatedrepl {

bool is_valid_session_id(const std::string& session_id) {
    if (session_id.empty() || session_id.size() > 128) return false;
    if (session_id == "." || session_id == "..") return false;
    for (size_t i = 0; i < session_id.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(session_id[i]);
        if (!std::isalnum(c) && c != '-' && c != '_' && c != '.') return false;
    }
    return true;
}

SessionRegistry::SessionRegistry(const std::string& staging_root, const SandboxOptions& sandbox_options)
    : staging_root_(staging_root)
    , sandbox_options_(sandbox_options) {}

SessionRegistry::~SessionRegistry() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (std::map<std::string, SessionPtr>::iterator it = sessions_.begin(); it != sessions_.end(); ++it) {
        release(*it->second);
    }
    sessions_.clear();
}

void SessionRegistry::set_model_query(const ModelQueryFn& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    model_query_ = fn;
}

// ============================================================================
// Lifecycle
// ============================================================================

SessionPtr SessionRegistry::get_or_create(const std::string& session_id, const SessionOptions& options,
                                          bool& created) {
    if (!is_valid_session_id(session_id)) {
        throw std::invalid_argument("invalid session id '" + session_id + "'");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, SessionPtr>::iterator it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        created = false;
        return it->second;
    }

    SessionPtr session = std::make_shared<Session>();
    session->id = session_id;
    session->options = options;
    session->controller.reset(new ReplController(options.security_level, options.max_iterations));
    session->sandbox.reset(new SandboxEnvironment(sandbox_options_));
    if (model_query_) session->sandbox->set_model_query(model_query_);
    session->staging_dir = join_path(staging_root_, session_id);

    stage_context(*session);

    size_t seeded = session->sandbox->seed_locals(options.locals);
    session->locals_snapshot = session->sandbox->snapshot();

    sessions_[session_id] = session;
    created = true;

    LOG_INFO("[Registry] Session %s created (security=%s, max_iterations=%lld, locals=%zu)",
             session_id.c_str(), security_level_name(options.security_level),
             static_cast<long long>(options.max_iterations), seeded);
    return session;
}

bool SessionRegistry::stage_context(Session& session) {
    const SessionOptions& opts = session.options;
    bool has_text = !opts.context.empty();
    bool has_json = !opts.context_json.is_null();
    if (!has_text && !has_json) return true;

    bool staged = create_directories(session.staging_dir);
    if (!staged) {
        LOG_WARN("[Registry] Cannot create staging directory '%s', loading context from memory",
                 session.staging_dir.c_str());
    }

    if (has_json) {
        std::string path = join_path(session.staging_dir, "context.json");
        std::string text;
        Json data = opts.context_json;
        if (staged && write_file(path, opts.context_json.dump(2)) && read_file(path, text)) {
            try {
                data = Json::parse(text);
            } catch (const nlohmann::json::parse_error& e) {
                LOG_WARN("[Registry] Staged context.json unreadable (%s), using in-memory copy", e.what());
            }
        } else if (staged) {
            LOG_WARN("[Registry] Failed to stage '%s', using in-memory copy", path.c_str());
        }
        session.sandbox->load_context_json(data);
    }

    // Text context wins when both are supplied
    if (has_text) {
        std::string path = join_path(session.staging_dir, "context.txt");
        std::string text;
        if (!(staged && write_file(path, opts.context) && read_file(path, text))) {
            if (staged) LOG_WARN("[Registry] Failed to stage '%s', using in-memory copy", path.c_str());
            text = opts.context;
        }
        session.sandbox->load_context(text);
    }

    return staged;
}

SessionPtr SessionRegistry::get(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, SessionPtr>::const_iterator it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        throw UnknownSessionError(session_id);
    }
    return it->second;
}

bool SessionRegistry::contains(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.find(session_id) != sessions_.end();
}

void SessionRegistry::release(Session& session) {
    std::shared_ptr<SandboxEnvironment> sandbox;
    {
        std::lock_guard<std::mutex> lock(session.sandbox_mutex);
        sandbox.swap(session.sandbox);
    }
    // A concurrent cancel() may still hold a copy
    sandbox.reset();
    if (!session.staging_dir.empty() && file_exists(session.staging_dir)) {
        if (!remove_directory_recursive(session.staging_dir)) {
            LOG_WARN("[Registry] Failed to remove staging directory '%s'", session.staging_dir.c_str());
        }
    }
}

void SessionRegistry::teardown(const std::string& session_id) {
    SessionPtr session = get(session_id);
    release(*session);
    LOG_DEBUG("[Registry] Session %s torn down", session_id.c_str());
}

bool SessionRegistry::remove(const std::string& session_id) {
    SessionPtr session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, SessionPtr>::iterator it = sessions_.find(session_id);
        if (it == sessions_.end()) return false;
        session = it->second;
        sessions_.erase(it);
    }
    release(*session);
    LOG_INFO("[Registry] Session %s removed", session_id.c_str());
    return true;
}

std::vector<std::string> SessionRegistry::session_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (std::map<std::string, SessionPtr>::const_iterator it = sessions_.begin(); it != sessions_.end(); ++it) {
        ids.push_back(it->first);
    }
    return ids;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace gatedrepl
