/*
 * gatedrepl C++ - REPL Service
 *
 * Facade over the registry, controller, filter, sandbox, state store and
 * artifact sink. Every method returns a result struct with a status string
 * and, on failure, an error_kind:
 *
 *   invalid_transition   operation not allowed in the current state
 *   unknown_session      no session with that id
 *   security_violation   denylist match or reviewer rejection
 *   execution_fault      uncaught runtime error in sandboxed code
 *   iteration_limit      max iterations reached, finalize instead
 *   invalid_argument     malformed id or parameter
 *
 * No exception escapes this class. Persisted fields are written to the
 * session's StateStore after each state change; store and sink failures
 * are logged and otherwise ignored.
 */
#ifndef gatedrepl_REPL_REPL_SERVICE_HPP
#define gatedrepl_REPL_REPL_SERVICE_HPP

#include "artifact_sink.hpp"
#include "security_filter.hpp"
#include "session_registry.hpp"
#include "state_store.hpp"
#include <gatedrepl/core/config.hpp>
#include <gatedrepl/core/json.hpp>

#include <functional>
#include <string>
#include <vector>

namespace gatedrepl {

struct OperationResult {
    std::string status;     // created, exists, approved, pending_approval, rejected, reset, error
    std::string state;
    std::string error_kind;
    std::string message;
    std::string code;       // pending or discarded code

    bool ok() const { return status != "error"; }
    Json to_json() const;
};

struct ExecuteResult {
    std::string status;     // success, error (or the submit status when nothing ran)
    std::string state;
    std::string error_kind;
    std::string message;
    bool executed;
    int64_t iteration;      // iteration counter after the execution
    ExecutionResult execution;

    ExecuteResult() : executed(false), iteration(0) {}

    bool ok() const { return status != "error"; }
    Json to_json() const;
};

struct SessionSnapshot {
    std::string status;     // ok, error
    std::string error_kind;
    std::string message;
    std::string session_id;
    std::string state;
    std::string security_level;
    int64_t iteration;
    int64_t max_iterations;
    int64_t submission_count;
    size_t history_count;
    std::vector<std::string> variables;
    std::string last_output;    // truncated to 500 chars
    std::string last_error;
    std::string pending_code;
    bool has_final_answer;
    std::string final_answer;

    SessionSnapshot()
        : iteration(0), max_iterations(0), submission_count(0), history_count(0), has_final_answer(false) {}

    Json to_json() const;
};

struct FinalizeResult {
    std::string status;     // complete, error
    std::string state;
    std::string error_kind;
    std::string message;
    std::string answer;
    std::string variable_name;
    std::vector<std::string> available_variables;

    bool ok() const { return status != "error"; }
    Json to_json() const;
};

struct ReplServiceOptions {
    std::string staging_root;       // per-session context staging
    SandboxOptions sandbox;
    SecurityFilter filter;
    SessionOptions session_defaults;

    // repl.* keys; staging_root falls back to the given directory
    static ReplServiceOptions from_config(const Config& cfg, const std::string& staging_root);
};

typedef std::function<StateStorePtr(const std::string& session_id)> StateStoreFactory;

class ReplService {
public:
    explicit ReplService(const ReplServiceOptions& options);
    ~ReplService();

    // Collaborators; set before opening sessions
    void set_state_store_factory(const StateStoreFactory& factory) { store_factory_ = factory; }
    void set_artifact_sink(const ArtifactSinkPtr& sink) { artifact_sink_ = sink; }
    void set_model_query(const ModelQueryFn& fn) { registry_.set_model_query(fn); }

    const ReplServiceOptions& options() const { return options_; }
    const SessionOptions& session_defaults() const { return options_.session_defaults; }

    // Register a session (idempotent: an open id reports "exists")
    OperationResult open_session(const std::string& session_id, const SessionOptions& options);

    // IDLE -> PENDING_REVIEW, then the filter decides:
    //   denylist match     -> REJECTED -> IDLE   status "rejected"
    //   NONE/BASIC clean   -> APPROVED           status "approved"
    //   STRICT clean       -> stays pending      status "pending_approval"
    OperationResult submit_code(const std::string& session_id, const std::string& code);

    // Reviewer decision for a pending submission
    OperationResult resolve_review(const std::string& session_id, bool approve, const std::string& reason = "");

    // APPROVED -> EXECUTING -> IDLE
    ExecuteResult execute(const std::string& session_id);

    // submit_code() and, when approved immediately, execute()
    ExecuteResult run_code(const std::string& session_id, const std::string& code);

    SessionSnapshot get_state(const std::string& session_id) const;

    // Any non-terminal state -> COMPLETE; releases the sandbox
    FinalizeResult finalize_answer(const std::string& session_id, const std::string& answer);
    FinalizeResult finalize_variable(const std::string& session_id, const std::string& variable_name);

    // Destroy the session and its persisted fields
    OperationResult reset(const std::string& session_id);

    // Stop a running execution (from another thread)
    bool cancel(const std::string& session_id);

    std::vector<std::string> session_ids() const { return registry_.session_ids(); }
    SessionRegistry& registry() { return registry_; }

private:
    ReplService(const ReplService&);
    ReplService& operator=(const ReplService&);

    void submit_locked(Session& session, const std::string& code, OperationResult& result);
    void execute_locked(Session& session, ExecuteResult& result);
    FinalizeResult complete_locked(Session& session, const std::string& answer);

    void restore_from_store(Session& session);
    void persist(Session& session);
    void store_set(Session& session, const char* key, const Json& value);
    void save_artifact(Session& session, const std::string& code, const ExecutionResult& result, int64_t iteration);

    ReplServiceOptions options_;
    SessionRegistry registry_;
    StateStoreFactory store_factory_;
    ArtifactSinkPtr artifact_sink_;
};

// Name of the audit artifact for a submission ("repl_code_0003.txt")
std::string artifact_name(int64_t submission);

// Audit artifact body: header comments, code, commented stdout/stderr
std::string format_artifact(const std::string& code, const ExecutionResult& result, int64_t iteration);

} // namespace gatedrepl

#endif // gatedrepl_REPL_REPL_SERVICE_HPP
