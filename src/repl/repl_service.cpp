/*
 * gatedrepl C++ - REPL Service Implementation
 */
#include <gatedrepl/repl/repl_service.hpp>
#include <gatedrepl/core/logger.hpp>
#include <gatedrepl/core/utils.hpp>

#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace gatedrepl {

static const size_t kStateOutputPreview = 500;

template <typename Result>
static void set_error(Result& result, const char* kind, const std::string& message) {
    result.status = "error";
    result.error_kind = kind;
    result.message = message;
}

// ============================================================================
// Result serialization
// ============================================================================

Json OperationResult::to_json() const {
    Json j;
    j["status"] = status;
    if (!state.empty()) j["state"] = state;
    if (!error_kind.empty()) j["error_kind"] = error_kind;
    if (!message.empty()) j["message"] = message;
    if (!code.empty()) j["code"] = code;
    return j;
}

Json ExecuteResult::to_json() const {
    Json j;
    if (executed) j = execution.to_json();
    j["status"] = status;
    if (!state.empty()) j["state"] = state;
    if (!error_kind.empty()) j["error_kind"] = error_kind;
    if (executed) {
        j["iteration"] = iteration;
        if (!execution.success) j["error"] = execution.stderr_text;
    } else if (!message.empty()) {
        j["message"] = message;
    }
    return j;
}

Json SessionSnapshot::to_json() const {
    Json j;
    j["status"] = status;
    if (status == "error") {
        j["error_kind"] = error_kind;
        j["message"] = message;
        return j;
    }
    j["session_id"] = session_id;
    j["state"] = state;
    j["security_level"] = security_level;
    j["iteration"] = iteration;
    j["max_iterations"] = max_iterations;
    j["submissions"] = submission_count;
    j["variables"] = variables;
    j["history_count"] = history_count;
    j["last_output"] = last_output;
    j["last_error"] = last_error;
    if (!pending_code.empty()) j["pending_code"] = pending_code;
    if (has_final_answer) j["final_answer"] = final_answer;
    return j;
}

Json FinalizeResult::to_json() const {
    Json j;
    j["status"] = status;
    if (!state.empty()) j["state"] = state;
    if (!error_kind.empty()) j["error_kind"] = error_kind;
    if (!message.empty()) j["message"] = message;
    if (!variable_name.empty()) j["variable_name"] = variable_name;
    if (status == "complete") j["final_answer"] = answer;
    if (!available_variables.empty()) j["available_variables"] = available_variables;
    return j;
}

// ============================================================================
// Options
// ============================================================================

ReplServiceOptions ReplServiceOptions::from_config(const Config& cfg, const std::string& staging_root) {
    ReplServiceOptions opts;
    opts.staging_root = cfg.get_string("repl.staging_dir", staging_root);
    opts.sandbox = SandboxOptions::from_config(cfg);
    opts.filter = SecurityFilter::from_config(cfg);

    SessionOptions& defaults = opts.session_defaults;
    std::string level = cfg.get_string("repl.security_level", security_level_name(defaults.security_level));
    if (!parse_security_level(level, defaults.security_level)) {
        LOG_WARN("[ReplService] Unknown security level '%s', using %s",
                 level.c_str(), security_level_name(defaults.security_level));
    }
    defaults.max_iterations = cfg.get_int("repl.max_iterations", defaults.max_iterations);
    defaults.artifacts_enabled = cfg.get_bool("repl.artifacts", defaults.artifacts_enabled);
    return opts;
}

// ============================================================================
// Artifacts
// ============================================================================

std::string artifact_name(int64_t submission) {
    char buf[32];
    snprintf(buf, sizeof(buf), "repl_code_%04lld.txt", static_cast<long long>(submission));
    return buf;
}

static void append_commented(std::ostringstream& oss, const std::string& text) {
    std::vector<std::string> lines = split(text, '\n');
    bool first = true;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].empty()) continue;
        if (!first) oss << "\n";
        oss << "# " << lines[i];
        first = false;
    }
}

std::string format_artifact(const std::string& code, const ExecutionResult& result, int64_t iteration) {
    char elapsed[32];
    snprintf(elapsed, sizeof(elapsed), "%.3fs", result.elapsed_seconds);

    std::ostringstream oss;
    oss << "# REPL Execution - Iteration " << iteration << "\n";
    oss << "# Execution time: " << elapsed << "\n";
    oss << "# Success: " << (result.success ? "True" : "False") << "\n";
    oss << "# SHA-256: " << sha256_hex(code) << "\n";
    oss << "\n" << code << "\n\n";
    oss << "# --- Output ---\n";
    oss << "# stdout:\n";
    append_commented(oss, result.stdout_text);
    oss << "\n\n# stderr:\n";
    if (result.stderr_text.empty()) {
        oss << "# (none)";
    } else {
        append_commented(oss, result.stderr_text);
    }
    oss << "\n";
    return oss.str();
}

void ReplService::save_artifact(Session& session, const std::string& code, const ExecutionResult& result,
                                int64_t iteration) {
    if (!artifact_sink_) return;

    std::string name = artifact_name(session.controller->submission_count());
    int64_t version = 0;
    if (!artifact_sink_->save_artifact(session.id, name, format_artifact(code, result, iteration), version)) {
        LOG_WARN("[ReplService] Failed to save code artifact %s for session %s",
                 name.c_str(), session.id.c_str());
        return;
    }
    LOG_DEBUG("[ReplService] Saved code artifact %s (version %lld)", name.c_str(), static_cast<long long>(version));
}

// ============================================================================
// Persistence
// ============================================================================

void ReplService::store_set(Session& session, const char* key, const Json& value) {
    if (!session.store->set(key, value)) {
        LOG_WARN("[ReplService] State store write failed for %s/%s", session.id.c_str(), key);
    }
}

void ReplService::persist(Session& session) {
    if (!session.store) return;
    const ReplController& c = *session.controller;

    Json history = Json::array();
    for (size_t i = 0; i < c.history().size(); ++i) {
        history.push_back(c.history()[i].to_json());
    }

    store_set(session, REPL_STATE_KEY, repl_state_name(c.state()));
    store_set(session, REPL_PENDING_CODE_KEY, c.pending_code().empty() ? Json() : Json(c.pending_code()));
    store_set(session, REPL_ITERATION_KEY, c.iteration());
    store_set(session, REPL_MAX_ITERATIONS_KEY, c.max_iterations());
    store_set(session, REPL_SECURITY_LEVEL_KEY, security_level_name(c.security_level()));
    store_set(session, REPL_CODE_HISTORY_KEY, history);
    store_set(session, REPL_FINAL_ANSWER_KEY, c.has_final_answer() ? Json(c.final_answer()) : Json());
    store_set(session, REPL_LAST_OUTPUT_KEY, session.last_output);
    store_set(session, REPL_LAST_ERROR_KEY, session.last_error);
    store_set(session, REPL_LOCALS_KEY, session.locals_snapshot);
}

// Snapshot placeholders ("<function>") cannot be turned back into values
static bool is_placeholder(const Json& value) {
    if (!value.is_string()) return false;
    const std::string& s = value.get_ref<const std::string&>();
    return s.size() > 2 && s.front() == '<' && s.back() == '>' && s.find(' ') == std::string::npos;
}

void ReplService::restore_from_store(Session& session) {
    if (!session.store) return;
    StateStore& store = *session.store;
    Json value;

    ReplState state = ReplState::IDLE;
    if (store.get(REPL_STATE_KEY, value) && value.is_string()) {
        if (!parse_repl_state(value.get<std::string>(), state)) {
            LOG_WARN("[ReplService] Unknown persisted state '%s' for session %s",
                     value.get<std::string>().c_str(), session.id.c_str());
            state = ReplState::IDLE;
        }
    }

    int64_t iteration = 0;
    if (store.get(REPL_ITERATION_KEY, value) && value.is_number_integer()) {
        iteration = value.get<int64_t>();
    }

    std::vector<HistoryEntry> history;
    if (store.get(REPL_CODE_HISTORY_KEY, value) && value.is_array()) {
        for (size_t i = 0; i < value.size(); ++i) {
            HistoryEntry entry;
            if (HistoryEntry::from_json(value[i], entry)) history.push_back(entry);
        }
    }

    std::string answer;
    bool has_answer = store.get(REPL_FINAL_ANSWER_KEY, value) && value.is_string();
    if (has_answer) answer = value.get<std::string>();

    if (store.get(REPL_LAST_OUTPUT_KEY, value) && value.is_string()) session.last_output = value.get<std::string>();
    if (store.get(REPL_LAST_ERROR_KEY, value) && value.is_string()) session.last_error = value.get<std::string>();

    if (store.get(REPL_LOCALS_KEY, value) && value.is_object() && session.sandbox) {
        Json locals = Json::object();
        for (Json::const_iterator it = value.begin(); it != value.end(); ++it) {
            if (!is_placeholder(it.value())) locals[it.key()] = it.value();
        }
        session.sandbox->seed_locals(locals);
        session.locals_snapshot = session.sandbox->snapshot();
    }

    session.controller->restore(state, iteration, history, has_answer ? &answer : nullptr);
    if (session.controller->is_complete()) {
        registry_.teardown(session.id);
    }

    LOG_INFO("[ReplService] Session %s resumed (state=%s, iteration=%lld, history=%zu)",
             session.id.c_str(), repl_state_name(session.controller->state()),
             static_cast<long long>(session.controller->iteration()), history.size());
}

// ============================================================================
// ReplService
// ============================================================================

ReplService::ReplService(const ReplServiceOptions& options)
    : options_(options)
    , registry_(options.staging_root, options.sandbox)
{
    store_factory_ = [](const std::string&) -> StateStorePtr {
        return StateStorePtr(new MemoryStateStore());
    };
}

ReplService::~ReplService() {}

OperationResult ReplService::open_session(const std::string& session_id, const SessionOptions& options) {
    OperationResult result;
    try {
        bool created = false;
        SessionPtr session = registry_.get_or_create(session_id, options, created);
        std::lock_guard<std::mutex> lock(session->mutex);

        if (created) {
            session->store = store_factory_ ? store_factory_(session_id) : StateStorePtr();
            if (session->store) {
                if (options.resume) restore_from_store(*session);
                store_set(*session, REPL_CONTEXT_KEY,
                          options.context_json.is_null() ? Json(options.context) : options.context_json);
                store_set(*session, REPL_QUERY_KEY, options.query);
                store_set(*session, REPL_ARTIFACT_ENABLED_KEY, options.artifacts_enabled);
                persist(*session);
            }
        }

        result.status = created ? "created" : "exists";
        result.state = repl_state_name(session->controller->state());
    } catch (const std::invalid_argument& e) {
        set_error(result, "invalid_argument", e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("[ReplService] open_session(%s) failed: %s", session_id.c_str(), e.what());
        set_error(result, "internal", e.what());
    }
    return result;
}

void ReplService::submit_locked(Session& session, const std::string& code, OperationResult& result) {
    ReplController& c = *session.controller;

    if (!c.is_complete() && c.has_exceeded_max_iterations()) {
        set_error(result, "iteration_limit",
                  "Maximum iterations (" + std::to_string(c.max_iterations()) +
                  ") reached; submit a final answer");
        result.state = repl_state_name(c.state());
        return;
    }

    c.submit(code);
    SecurityCheck check = options_.filter.check(code, c.security_level());

    if (!check.allowed) {
        c.resolve_review(false);
        result.code = c.reject_with_reason(check.reason);
        session.last_error = "Security violation: " + check.reason;
        result.status = "rejected";
        result.error_kind = "security_violation";
        result.message = check.reason;
    } else if (c.security_level() == SecurityLevel::STRICT) {
        result.status = "pending_approval";
        result.message = "Code requires security approval before execution";
        result.code = code;
    } else {
        c.resolve_review(true);
        result.status = "approved";
    }

    result.state = repl_state_name(c.state());
    persist(session);
}

OperationResult ReplService::submit_code(const std::string& session_id, const std::string& code) {
    OperationResult result;
    try {
        SessionPtr session = registry_.get(session_id);
        std::lock_guard<std::mutex> lock(session->mutex);
        submit_locked(*session, code, result);
    } catch (const UnknownSessionError& e) {
        set_error(result, "unknown_session", e.what());
    } catch (const InvalidTransitionError& e) {
        set_error(result, "invalid_transition", e.what());
        result.state = repl_state_name(e.from());
    } catch (const std::exception& e) {
        LOG_ERROR("[ReplService] submit_code(%s) failed: %s", session_id.c_str(), e.what());
        set_error(result, "internal", e.what());
    }
    return result;
}

OperationResult ReplService::resolve_review(const std::string& session_id, bool approve, const std::string& reason) {
    OperationResult result;
    try {
        SessionPtr session = registry_.get(session_id);
        std::lock_guard<std::mutex> lock(session->mutex);
        ReplController& c = *session->controller;

        c.resolve_review(approve);
        if (approve) {
            result.status = "approved";
            result.message = "Code approved for execution";
            result.code = c.pending_code();
        } else {
            std::string why = reason.empty() ? std::string("rejected by reviewer") : reason;
            result.code = c.reject_with_reason(why);
            session->last_error = "Code rejected: " + why;
            result.status = "rejected";
            result.error_kind = "security_violation";
            result.message = why;
        }
        result.state = repl_state_name(c.state());
        persist(*session);
    } catch (const UnknownSessionError& e) {
        set_error(result, "unknown_session", e.what());
    } catch (const InvalidTransitionError& e) {
        set_error(result, "invalid_transition", e.what());
        result.state = repl_state_name(e.from());
    } catch (const std::exception& e) {
        LOG_ERROR("[ReplService] resolve_review(%s) failed: %s", session_id.c_str(), e.what());
        set_error(result, "internal", e.what());
    }
    return result;
}

void ReplService::execute_locked(Session& session, ExecuteResult& result) {
    ReplController& c = *session.controller;
    if (!session.sandbox && !c.is_complete()) {
        throw std::logic_error("sandbox of session '" + session.id + "' was released");
    }

    c.begin_execution();
    std::string code = c.pending_code();
    int64_t iteration = c.iteration();

    ExecutionResult exec = session.sandbox->execute(code);
    c.finish_execution(exec.stdout_text, exec.stderr_text);

    session.last_output = exec.stdout_text;
    session.last_error = exec.stderr_text;
    session.locals_snapshot = exec.locals_snapshot;
    persist(session);

    if (session.options.artifacts_enabled) {
        save_artifact(session, code, exec, iteration);
    }

    result.executed = true;
    result.iteration = c.iteration();
    result.state = repl_state_name(c.state());
    result.execution = exec;
    if (exec.success) {
        result.status = "success";
    } else {
        set_error(result, "execution_fault", exec.stderr_text);
    }

    LOG_INFO("[ReplService] Session %s iteration %lld executed (success=%s, %.3fs)",
             session.id.c_str(), static_cast<long long>(iteration),
             exec.success ? "true" : "false", exec.elapsed_seconds);
}

ExecuteResult ReplService::execute(const std::string& session_id) {
    ExecuteResult result;
    try {
        SessionPtr session = registry_.get(session_id);
        std::lock_guard<std::mutex> lock(session->mutex);
        execute_locked(*session, result);
    } catch (const UnknownSessionError& e) {
        set_error(result, "unknown_session", e.what());
    } catch (const InvalidTransitionError& e) {
        set_error(result, "invalid_transition", e.what());
        result.state = repl_state_name(e.from());
    } catch (const std::exception& e) {
        LOG_ERROR("[ReplService] execute(%s) failed: %s", session_id.c_str(), e.what());
        set_error(result, "internal", e.what());
    }
    return result;
}

ExecuteResult ReplService::run_code(const std::string& session_id, const std::string& code) {
    ExecuteResult result;
    try {
        SessionPtr session = registry_.get(session_id);
        std::lock_guard<std::mutex> lock(session->mutex);

        OperationResult submitted;
        submit_locked(*session, code, submitted);
        if (submitted.status == "approved") {
            execute_locked(*session, result);
        } else {
            result.status = submitted.status;
            result.state = submitted.state;
            result.error_kind = submitted.error_kind;
            result.message = submitted.message;
        }
    } catch (const UnknownSessionError& e) {
        set_error(result, "unknown_session", e.what());
    } catch (const InvalidTransitionError& e) {
        set_error(result, "invalid_transition", e.what());
        result.state = repl_state_name(e.from());
    } catch (const std::exception& e) {
        LOG_ERROR("[ReplService] run_code(%s) failed: %s", session_id.c_str(), e.what());
        set_error(result, "internal", e.what());
    }
    return result;
}

SessionSnapshot ReplService::get_state(const std::string& session_id) const {
    SessionSnapshot snap;
    try {
        SessionPtr session = registry_.get(session_id);
        std::lock_guard<std::mutex> lock(session->mutex);
        const ReplController& c = *session->controller;

        snap.status = "ok";
        snap.session_id = session->id;
        snap.state = repl_state_name(c.state());
        snap.security_level = security_level_name(c.security_level());
        snap.iteration = c.iteration();
        snap.max_iterations = c.max_iterations();
        snap.submission_count = c.submission_count();
        snap.history_count = c.history().size();
        for (Json::const_iterator it = session->locals_snapshot.begin(); it != session->locals_snapshot.end(); ++it) {
            snap.variables.push_back(it.key());
        }
        snap.last_output = truncate_with_marker(session->last_output, kStateOutputPreview);
        snap.last_error = session->last_error;
        snap.pending_code = c.pending_code();
        snap.has_final_answer = c.has_final_answer();
        snap.final_answer = c.final_answer();
    } catch (const UnknownSessionError& e) {
        set_error(snap, "unknown_session", e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("[ReplService] get_state(%s) failed: %s", session_id.c_str(), e.what());
        set_error(snap, "internal", e.what());
    }
    return snap;
}

FinalizeResult ReplService::complete_locked(Session& session, const std::string& answer) {
    session.controller->force_complete(answer);
    persist(session);
    registry_.teardown(session.id);

    FinalizeResult result;
    result.status = "complete";
    result.state = repl_state_name(session.controller->state());
    result.answer = answer;
    LOG_INFO("[ReplService] Session %s complete", session.id.c_str());
    return result;
}

FinalizeResult ReplService::finalize_answer(const std::string& session_id, const std::string& answer) {
    FinalizeResult result;
    try {
        SessionPtr session = registry_.get(session_id);
        std::lock_guard<std::mutex> lock(session->mutex);
        result = complete_locked(*session, answer);
    } catch (const UnknownSessionError& e) {
        set_error(result, "unknown_session", e.what());
    } catch (const InvalidTransitionError& e) {
        set_error(result, "invalid_transition", e.what());
        result.state = repl_state_name(e.from());
    } catch (const std::exception& e) {
        LOG_ERROR("[ReplService] finalize_answer(%s) failed: %s", session_id.c_str(), e.what());
        set_error(result, "internal", e.what());
    }
    return result;
}

// Whitespace, then double quotes, then single quotes
static std::string strip_variable_name(const std::string& raw) {
    std::string name = trim(raw);
    const char quotes[] = {'"', '\''};
    for (size_t q = 0; q < 2; ++q) {
        size_t begin = name.find_first_not_of(quotes[q]);
        if (begin == std::string::npos) return std::string();
        size_t end = name.find_last_not_of(quotes[q]);
        name = name.substr(begin, end - begin + 1);
    }
    return name;
}

FinalizeResult ReplService::finalize_variable(const std::string& session_id, const std::string& variable_name) {
    FinalizeResult result;
    try {
        SessionPtr session = registry_.get(session_id);
        std::lock_guard<std::mutex> lock(session->mutex);
        ReplController& c = *session->controller;

        if (c.is_complete()) {
            throw InvalidTransitionError("finalize", c.state());
        }

        std::string name = strip_variable_name(variable_name);
        std::string value;
        if (!session->sandbox) {
            set_error(result, "invalid_argument", "REPL environment not initialized");
        } else if (!session->sandbox->variable_as_string(name, value)) {
            set_error(result, "invalid_argument", "Variable '" + name + "' not found in REPL");
            result.variable_name = name;
            result.available_variables = session->sandbox->variable_names();
            result.state = repl_state_name(c.state());
        } else {
            result = complete_locked(*session, value);
            result.variable_name = name;
        }
    } catch (const UnknownSessionError& e) {
        set_error(result, "unknown_session", e.what());
    } catch (const InvalidTransitionError& e) {
        set_error(result, "invalid_transition", e.what());
        result.state = repl_state_name(e.from());
    } catch (const std::exception& e) {
        LOG_ERROR("[ReplService] finalize_variable(%s) failed: %s", session_id.c_str(), e.what());
        set_error(result, "internal", e.what());
    }
    return result;
}

OperationResult ReplService::reset(const std::string& session_id) {
    OperationResult result;
    try {
        SessionPtr session = registry_.get(session_id);
        std::lock_guard<std::mutex> lock(session->mutex);

        registry_.remove(session_id);
        if (session->store && !session->store->clear()) {
            LOG_WARN("[ReplService] Failed to clear persisted state of session %s", session_id.c_str());
        }
        result.status = "reset";
        result.message = "Session destroyed";
    } catch (const UnknownSessionError& e) {
        set_error(result, "unknown_session", e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("[ReplService] reset(%s) failed: %s", session_id.c_str(), e.what());
        set_error(result, "internal", e.what());
    }
    return result;
}

bool ReplService::cancel(const std::string& session_id) {
    SessionPtr session;
    try {
        session = registry_.get(session_id);
    } catch (const UnknownSessionError& e) {
        LOG_WARN("[ReplService] cancel: %s", e.what());
        return false;
    }
    std::shared_ptr<SandboxEnvironment> sandbox = session->sandbox_handle();
    if (!sandbox) return false;
    sandbox->cancel();
    LOG_INFO("[ReplService] Cancel requested for session %s", session_id.c_str());
    return true;
}

} // namespace gatedrepl
