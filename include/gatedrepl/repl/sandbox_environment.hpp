/*
 * gatedrepl C++ - Sandbox Environment
 *
 * Owns one session namespace and the interpreter that evaluates code
 * against it. Execution follows interactive-shell conventions:
 *
 *   1. column-0 import/from lines run first
 *   2. when the last code line is a bare expression, everything before it
 *      runs as statements and the expression's repr() is printed once
 *   3. an uncaught fault keeps the output produced so far, appends
 *      "Type: message (line N)" to stderr and leaves the namespace with
 *      whatever mutations happened before the fault
 *
 * Script output goes through the OutputRouter; llm_query() runs the model
 * callback with the router redirected to the SECONDARY buffer.
 */
#ifndef gatedrepl_REPL_SANDBOX_ENVIRONMENT_HPP
#define gatedrepl_REPL_SANDBOX_ENVIRONMENT_HPP

#include "output_router.hpp"
#include <gatedrepl/core/config.hpp>
#include <gatedrepl/core/json.hpp>
#include <gatedrepl/script/interpreter.hpp>

#include <functional>
#include <string>
#include <vector>

namespace gatedrepl {

// Secondary-model callback: prompt in, reply out
typedef std::function<std::string(const std::string& prompt)> ModelQueryFn;

struct ExecutionResult {
    std::string stdout_text;
    std::string stderr_text;
    bool success;
    double elapsed_seconds;
    Json locals_snapshot;       // name -> JSON value or "<typename>"
    bool output_truncated;

    ExecutionResult()
        : success(false)
        , elapsed_seconds(0.0)
        , locals_snapshot(Json::object())
        , output_truncated(false)
    {}

    std::vector<std::string> variable_names() const;
    Json to_json() const;
};

struct SandboxOptions {
    script::CapabilitySet capabilities;
    script::ExecutionLimits limits;

    SandboxOptions() : capabilities(script::CapabilitySet::all()) {}

    // repl.max_steps, repl.timeout_ms, repl.max_call_depth,
    // repl.max_output_chars, repl.max_sequence_length,
    // repl.disabled_capabilities
    static SandboxOptions from_config(const Config& cfg);
};

class SandboxEnvironment : public script::ScriptHost {
public:
    explicit SandboxEnvironment(const SandboxOptions& options);
    virtual ~SandboxEnvironment();

    void set_model_query(const ModelQueryFn& fn) { model_query_ = fn; }

    // Read-only `context` view. Structured context becomes dict/list values.
    void load_context(const std::string& text);
    void load_context_json(const Json& data);
    bool has_context() const { return has_context_; }

    // Seed namespace variables from a JSON object; returns how many were set
    size_t seed_locals(const Json& locals);

    ExecutionResult execute(const std::string& code);

    // Serializable view of the namespace ("_"-prefixed names skipped)
    Json snapshot() const;
    std::vector<std::string> variable_names() const;

    // str() of a namespace variable; false when absent or None
    bool variable_as_string(const std::string& name, std::string& out) const;

    // Stop the running execution at its next step (any thread)
    void cancel();

    OutputRouter& router() { return router_; }
    const script::Interpreter& interpreter() const { return interp_; }
    const SandboxOptions& options() const { return options_; }

    // Interactive-shell heuristic for a single stripped line
    static bool is_expression(const std::string& line);

    // script::ScriptHost
    void write_output(const std::string& text) override;
    std::string query_model(const std::string& prompt) override;

private:
    SandboxEnvironment(const SandboxEnvironment&);
    SandboxEnvironment& operator=(const SandboxEnvironment&);

    void run(const std::string& code);

    SandboxOptions options_;
    script::Interpreter interp_;
    OutputRouter router_;
    ModelQueryFn model_query_;
    bool has_context_;

    // Per-execution output accounting
    size_t written_;
    size_t kept_;
};

} // namespace gatedrepl

#endif // gatedrepl_REPL_SANDBOX_ENVIRONMENT_HPP
