/*
 * gatedrepl C++ - Session Registry
 *
 * Maps session identifiers to their controller, sandbox and staged files.
 * Nothing is shared between sessions: each owns its namespace, its output
 * router and its staging directory <staging_root>/<id>/.
 *
 * The registry map is synchronized. Operations on a single session must
 * be serialized by the caller through Session::mutex.
 */
#ifndef gatedrepl_REPL_SESSION_REGISTRY_HPP
#define gatedrepl_REPL_SESSION_REGISTRY_HPP

#include "controller.hpp"
#include "sandbox_environment.hpp"
#include "state_store.hpp"
#include <gatedrepl/core/json.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace gatedrepl {

struct SessionOptions {
    std::string context;            // text context (context.txt)
    Json context_json;              // structured context (context.json), null when unused
    std::string query;
    int64_t max_iterations;
    SecurityLevel security_level;
    bool artifacts_enabled;
    Json locals;                    // seed variables, JSON object
    bool resume;                    // reload persisted fields from the state store

    SessionOptions()
        : max_iterations(20)
        , security_level(SecurityLevel::BASIC)
        , artifacts_enabled(false)
        , resume(false)
    {}
};

struct Session {
    std::string id;
    SessionOptions options;
    std::unique_ptr<ReplController> controller;
    std::shared_ptr<SandboxEnvironment> sandbox;    // null after teardown
    StateStorePtr store;
    std::string staging_dir;
    std::string last_output;
    std::string last_error;
    Json locals_snapshot;           // namespace view after the last execution
    std::mutex mutex;
    std::mutex sandbox_mutex;       // held while the sandbox pointer is swapped or copied

    // Copy of the sandbox pointer for callers that do not hold mutex
    std::shared_ptr<SandboxEnvironment> sandbox_handle() {
        std::lock_guard<std::mutex> lock(sandbox_mutex);
        return sandbox;
    }

    Session() : locals_snapshot(Json::object()) {}
};

typedef std::shared_ptr<Session> SessionPtr;

class UnknownSessionError : public std::runtime_error {
public:
    explicit UnknownSessionError(const std::string& session_id)
        : std::runtime_error("unknown session '" + session_id + "'"), session_id_(session_id) {}

    const std::string& session_id() const { return session_id_; }

private:
    std::string session_id_;
};

class SessionRegistry {
public:
    SessionRegistry(const std::string& staging_root, const SandboxOptions& sandbox_options);
    ~SessionRegistry();

    // Returns the existing session, or builds one: controller, sandbox,
    // staged and loaded context, seed locals. created reports which.
    SessionPtr get_or_create(const std::string& session_id, const SessionOptions& options, bool& created);

    // Throws UnknownSessionError
    SessionPtr get(const std::string& session_id) const;
    bool contains(const std::string& session_id) const;

    // Release the sandbox and staged files; the session entry stays
    void teardown(const std::string& session_id);

    // teardown() and forget the session
    bool remove(const std::string& session_id);

    std::vector<std::string> session_ids() const;
    size_t size() const;

    // Applied to sandboxes created afterwards
    void set_model_query(const ModelQueryFn& fn);

    const std::string& staging_root() const { return staging_root_; }

private:
    SessionRegistry(const SessionRegistry&);
    SessionRegistry& operator=(const SessionRegistry&);

    bool stage_context(Session& session);
    void release(Session& session);

    std::string staging_root_;
    SandboxOptions sandbox_options_;
    ModelQueryFn model_query_;
    mutable std::mutex mutex_;
    std::map<std::string, SessionPtr> sessions_;
};

// Session ids become directory names
bool is_valid_session_id(const std::string& session_id);

} // namespace gatedrepl

#endif // gatedrepl_REPL_SESSION_REGISTRY_HPP
