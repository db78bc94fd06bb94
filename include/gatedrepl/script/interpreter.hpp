/*
 * gatedrepl C++ - Script Interpreter
 *
 * Tree-walking evaluator for the sandbox language. One Interpreter owns one
 * global namespace (the session namespace) and a symbol table assembled
 * from a CapabilitySet; nothing outside those two maps is reachable from
 * script code. Host services (output, secondary model) are reached only
 * through the ScriptHost reference passed in explicitly.
 *
 * Every evaluator step is accounted against ExecutionLimits. Step and
 * wall-clock exhaustion, and cancel(), raise a fatal TimeoutError that
 * try/except cannot intercept.
 */
#ifndef gatedrepl_SCRIPT_INTERPRETER_HPP
#define gatedrepl_SCRIPT_INTERPRETER_HPP

#include "ast.hpp"
#include "builtins.hpp"
#include "errors.hpp"
#include "value.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace gatedrepl {
namespace script {

struct ExecutionLimits {
    int64_t max_steps;              // evaluator steps per execution
    int64_t timeout_ms;             // wall clock per execution, 0 disables
    int max_call_depth;             // nested user function calls
    size_t max_output_chars;        // captured stdout per execution
    int64_t max_sequence_length;    // range()/repetition/padding/materialization
    int64_t max_regex_input;        // subject size for re functions, 0 disables

    ExecutionLimits()
        : max_steps(5000000)
        , timeout_ms(10000)
        , max_call_depth(200)
        , max_output_chars(100000)
        , max_sequence_length(10000000)
        , max_regex_input(10000)
    {}
};

// Services the embedding environment provides to script code
class ScriptHost {
public:
    virtual ~ScriptHost() {}

    // Text produced by print() and auto-print
    virtual void write_output(const std::string& text) = 0;

    // Forward a prompt to the secondary model (llm_query)
    virtual std::string query_model(const std::string& prompt) = 0;
};

class Scope;
typedef std::shared_ptr<Scope> ScopePtr;

// Function-call frame. Comprehension scopes have no def.
class Scope {
public:
    Scope(const ScopePtr& parent_scope, const std::shared_ptr<const FunctionDef>& function_def)
        : parent(parent_scope), def(function_def) {}

    std::unordered_map<std::string, Value> vars;
    ScopePtr parent;
    std::shared_ptr<const FunctionDef> def;
};

typedef std::map<std::string, Value> Namespace;

// Evaluated call arguments
struct Args {
    std::string name;       // callee name for error messages
    std::vector<Value> positional;
    std::vector<std::pair<std::string, Value> > keywords;

    size_t size() const { return positional.size(); }
    const Value& operator[](size_t i) const { return positional[i]; }

    // Returns nullptr when the keyword was not passed
    const Value* keyword(const std::string& key) const;
};

enum class Flow {
    NORMAL,
    BREAK,
    CONTINUE,
    RETURN
};

class Interpreter {
public:
    Interpreter(const CapabilitySet& capabilities, const ExecutionLimits& limits);
    ~Interpreter();

    void set_host(ScriptHost* host) { host_ = host; }
    ScriptHost* host() const { return host_; }

    const CapabilitySet& capabilities() const { return capabilities_; }
    const ExecutionLimits& limits() const { return limits_; }
    void set_limits(const ExecutionLimits& limits) { limits_ = limits; }

    Namespace& globals() { return globals_; }
    const Namespace& globals() const { return globals_; }
    const SymbolTable& symbols() const { return symbols_; }

    // Injected read-only names (context); shadowed by globals of the same name
    void bind_symbol(const std::string& name, const Value& value);

    // Reset step/time accounting before a new execution
    void begin_execution();

    // Request the running execution to stop (any thread)
    void cancel() { cancel_requested_.store(true); }

    // Top-level entry points
    void exec_module(const Module& module);
    void exec_statements(const std::vector<StmtPtr>& body, size_t begin, size_t end);
    Value eval_top_level(const Expr& expr);

    // Output produced when no host is attached
    std::string take_output();

    // ---- services used by builtins ----

    Value call(const Value& callee, Args& args);
    Value call1(const Value& callee, const Value& arg);
    void write(const std::string& text);
    void tick();
    void check_sequence_length(int64_t length) const;
    int current_line() const { return current_line_; }

    // Iterate any iterable; the callback returns false to stop early
    void iterate(const Value& iterable, const std::function<bool(const Value&)>& fn);
    std::vector<Value> to_vector(const Value& iterable);

    Value binary_op(BinOp op, const Value& left, const Value& right);
    bool compare(CmpOp op, const Value& left, const Value& right);
    bool contains(const Value& container, const Value& item);
    Value get_item(const Value& container, const Value& index);
    Value get_attribute(const Value& object, const std::string& name);
    bool has_attribute(const Value& object, const std::string& name);
    Value import_module(const std::string& name);

    // Type object for a value (type(x))
    Value type_of(const Value& value) const;

private:
    // Statements
    Flow exec_block(const std::vector<StmtPtr>& body, const ScopePtr& scope, Value& ret);
    Flow exec_stmt(const Stmt& stmt, const ScopePtr& scope, Value& ret);
    Flow exec_for(const Stmt& stmt, const ScopePtr& scope, Value& ret);
    Flow exec_while(const Stmt& stmt, const ScopePtr& scope, Value& ret);
    Flow exec_try(const Stmt& stmt, const ScopePtr& scope, Value& ret);
    void exec_import(const Stmt& stmt, const ScopePtr& scope);
    void exec_augassign(const Stmt& stmt, const ScopePtr& scope);
    void exec_raise(const Stmt& stmt, const ScopePtr& scope);
    bool handler_matches(const ExceptHandler& handler, const ScriptError& error, const ScopePtr& scope);

    // Expressions
    Value eval(const Expr& expr, const ScopePtr& scope);
    Value eval_call(const Expr& expr, const ScopePtr& scope);
    Value eval_fstring(const Expr& expr, const ScopePtr& scope);
    Value eval_subscript(const Expr& expr, const ScopePtr& scope);
    Value eval_comprehension(const Expr& expr, const ScopePtr& scope);
    void comprehension_clause(const Expr& expr, size_t index, const ScopePtr& comp_scope,
                              const std::function<void(const ScopePtr&)>& emit);
    void collect_call_args(const Expr& expr, const ScopePtr& scope, Args& args);
    Value make_function(const std::shared_ptr<FunctionDef>& def, const ScopePtr& scope);

    // Names and targets
    Value load_name(const std::string& name, const ScopePtr& scope);
    void store_name(const std::string& name, const Value& value, const ScopePtr& scope);
    void delete_name(const std::string& name, const ScopePtr& scope);
    void assign(const Expr& target, const Value& value, const ScopePtr& scope);
    void delete_target(const Expr& target, const ScopePtr& scope);
    Scope* nonlocal_owner(const std::string& name, const ScopePtr& scope);

    // Calls
    Value call_function(const Value& function, Args& args);
    void bind_arguments(const FunctionObject& fn, Args& args, Scope& scope);

    // Containers
    void set_item(const Value& container, const Value& index, const Value& value);
    void delete_item(const Value& container, const Value& index);
    Value get_slice(const Value& container, const Value& lower, const Value& upper, const Value& step);
    void set_slice(const Value& container, const Value& lower, const Value& upper, const Value& step,
                   const Value& value);
    void delete_slice(const Value& container, const Value& lower, const Value& upper, const Value& step);

    CapabilitySet capabilities_;
    ExecutionLimits limits_;
    SymbolTable symbols_;
    Namespace globals_;
    std::map<std::string, Value> module_cache_;
    ScriptHost* host_;
    std::string output_;

    int64_t steps_;
    int64_t deadline_ms_;
    int call_depth_;
    int current_line_;
    std::atomic<bool> cancel_requested_;
    std::vector<ScriptError> handling_;     // exceptions being handled (bare raise)
};

// Normalize a possibly negative index against a length; throws IndexError
size_t normalize_index(int64_t index, size_t length, const char* what);

// Resolve slice bounds the way Python does; returns the selected positions
std::vector<int64_t> slice_positions(const Value& lower, const Value& upper, const Value& step, int64_t length);

// Fixed-arity check used by builtins and methods
void require_args(const Args& args, size_t min_count, size_t max_count);

// Reject keyword arguments for callables that take none
void reject_keywords(const Args& args);

// Integer conversion with a TypeError naming the argument
int64_t expect_int(const Value& v, const std::string& what);

} // namespace script
} // namespace gatedrepl

#endif // gatedrepl_SCRIPT_INTERPRETER_HPP
