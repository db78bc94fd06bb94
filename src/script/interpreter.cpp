/*
 * gatedrepl C++ - Script Interpreter Implementation
 *
 * Statement execution, expression evaluation, name resolution and calls.
 * Operators and container access live in operators.cpp.
 */
#include <gatedrepl/script/interpreter.hpp>
#include <gatedrepl/core/utils.hpp>

#include <algorithm>
#include <cstdio>

namespace gatedrepl {
namespace script {

// ============================================================================
// Args helpers
// ============================================================================

const Value* Args::keyword(const std::string& key) const {
    for (size_t i = 0; i < keywords.size(); ++i) {
        if (keywords[i].first == key) return &keywords[i].second;
    }
    return nullptr;
}

void require_args(const Args& args, size_t min_count, size_t max_count) {
    size_t n = args.size();
    if (n >= min_count && n <= max_count) return;

    std::string expected;
    if (min_count == max_count) {
        expected = min_count == 1 ? "exactly one argument" : "exactly " + std::to_string(min_count) + " arguments";
    } else if (n < min_count) {
        expected = "at least " + std::to_string(min_count) + (min_count == 1 ? " argument" : " arguments");
    } else {
        expected = "at most " + std::to_string(max_count) + (max_count == 1 ? " argument" : " arguments");
    }
    throw ScriptError("TypeError", args.name + "() takes " + expected + " (" + std::to_string(n) + " given)");
}

void reject_keywords(const Args& args) {
    if (!args.keywords.empty()) {
        throw ScriptError("TypeError", args.name + "() takes no keyword arguments");
    }
}

int64_t expect_int(const Value& v, const std::string& what) {
    if (v.is_int() || v.is_bool()) return v.as_int();
    throw ScriptError("TypeError", what + " must be an integer, not '" + v.type_name() + "'");
}

// RAII call-depth accounting
class CallDepthGuard {
public:
    CallDepthGuard(int& depth, int limit) : depth_(depth) {
        if (++depth_ > limit) {
            --depth_;
            throw ScriptError("RecursionError", "maximum recursion depth exceeded");
        }
    }
    ~CallDepthGuard() { --depth_; }

private:
    int& depth_;
};

// ============================================================================
// Construction and accounting
// ============================================================================

Interpreter::Interpreter(const CapabilitySet& capabilities, const ExecutionLimits& limits)
    : capabilities_(capabilities)
    , limits_(limits)
    , symbols_(build_symbol_table(capabilities))
    , host_(nullptr)
    , steps_(0)
    , deadline_ms_(0)
    , call_depth_(0)
    , current_line_(0)
    , cancel_requested_(false)
{}

// The namespace dies with the interpreter, cycles included
Interpreter::~Interpreter() {
    std::vector<Value> roots;
    for (Namespace::const_iterator it = globals_.begin(); it != globals_.end(); ++it) {
        roots.push_back(it->second);
    }
    for (std::map<std::string, Value>::const_iterator it = module_cache_.begin(); it != module_cache_.end(); ++it) {
        roots.push_back(it->second);
    }
    globals_.clear();
    module_cache_.clear();
    Value::break_cycles(roots);
}

void Interpreter::bind_symbol(const std::string& name, const Value& value) {
    symbols_.define(name, value);
}

void Interpreter::begin_execution() {
    steps_ = 0;
    call_depth_ = 0;
    current_line_ = 0;
    handling_.clear();
    cancel_requested_.store(false);
    deadline_ms_ = limits_.timeout_ms > 0 ? monotonic_ms() + limits_.timeout_ms : 0;
}

void Interpreter::tick() {
    ++steps_;
    if (limits_.max_steps > 0 && steps_ > limits_.max_steps) {
        throw ScriptError("TimeoutError", "execution exceeded the step budget of " +
                          std::to_string(limits_.max_steps) + " steps", current_line_, true);
    }
    if ((steps_ & 1023) == 0) {
        if (cancel_requested_.load()) {
            throw ScriptError("TimeoutError", "execution cancelled", current_line_, true);
        }
        if (deadline_ms_ > 0 && monotonic_ms() > deadline_ms_) {
            throw ScriptError("TimeoutError", "execution exceeded the time limit of " +
                              std::to_string(limits_.timeout_ms) + " ms", current_line_, true);
        }
    }
}

void Interpreter::check_sequence_length(int64_t length) const {
    if (length > limits_.max_sequence_length) {
        throw ScriptError("MemoryError", "sequence of length " + std::to_string(length) +
                          " exceeds the sandbox limit of " + std::to_string(limits_.max_sequence_length));
    }
}

void Interpreter::write(const std::string& text) {
    if (host_) {
        host_->write_output(text);
    } else {
        output_ += text;
    }
}

std::string Interpreter::take_output() {
    std::string out;
    out.swap(output_);
    return out;
}

// ============================================================================
// Top-level entry points
// ============================================================================

void Interpreter::exec_module(const Module& module) {
    exec_statements(module.body, 0, module.body.size());
}

void Interpreter::exec_statements(const std::vector<StmtPtr>& body, size_t begin, size_t end) {
    ScopePtr top;
    Value ret;
    try {
        for (size_t i = begin; i < end && i < body.size(); ++i) {
            exec_stmt(*body[i], top, ret);
        }
    } catch (ScriptError& e) {
        if (e.line() == 0) e.set_line(current_line_);
        throw;
    }
}

Value Interpreter::eval_top_level(const Expr& expr) {
    ScopePtr top;
    try {
        current_line_ = expr.line;
        return eval(expr, top);
    } catch (ScriptError& e) {
        if (e.line() == 0) e.set_line(current_line_);
        throw;
    }
}

// ============================================================================
// Statements
// ============================================================================

Flow Interpreter::exec_block(const std::vector<StmtPtr>& body, const ScopePtr& scope, Value& ret) {
    for (size_t i = 0; i < body.size(); ++i) {
        Flow flow = exec_stmt(*body[i], scope, ret);
        if (flow != Flow::NORMAL) return flow;
    }
    return Flow::NORMAL;
}

Flow Interpreter::exec_stmt(const Stmt& s, const ScopePtr& scope, Value& ret) {
    current_line_ = s.line;
    tick();

    switch (s.kind) {
        case StmtKind::EXPR:
            eval(*s.value, scope);
            return Flow::NORMAL;

        case StmtKind::ASSIGN: {
            Value value = eval(*s.value, scope);
            for (size_t i = 0; i < s.targets.size(); ++i) {
                assign(*s.targets[i], value, scope);
            }
            return Flow::NORMAL;
        }

        case StmtKind::AUGASSIGN:
            exec_augassign(s, scope);
            return Flow::NORMAL;

        case StmtKind::IF:
            if (eval(*s.test, scope).truthy()) return exec_block(s.body, scope, ret);
            return exec_block(s.orelse, scope, ret);

        case StmtKind::WHILE:
            return exec_while(s, scope, ret);

        case StmtKind::FOR:
            return exec_for(s, scope, ret);

        case StmtKind::BREAK:
            return Flow::BREAK;

        case StmtKind::CONTINUE:
            return Flow::CONTINUE;

        case StmtKind::PASS:
        case StmtKind::GLOBAL:
        case StmtKind::NONLOCAL:
            return Flow::NORMAL;

        case StmtKind::FUNCTIONDEF:
            store_name(s.func->name, make_function(s.func, scope), scope);
            return Flow::NORMAL;

        case StmtKind::RETURN:
            ret = s.value ? eval(*s.value, scope) : Value::none();
            return Flow::RETURN;

        case StmtKind::DEL:
            for (size_t i = 0; i < s.targets.size(); ++i) {
                delete_target(*s.targets[i], scope);
            }
            return Flow::NORMAL;

        case StmtKind::ASSERT:
            if (!eval(*s.test, scope).truthy()) {
                std::string message = s.value ? eval(*s.value, scope).str() : "";
                throw ScriptError("AssertionError", message, s.line);
            }
            return Flow::NORMAL;

        case StmtKind::RAISE:
            exec_raise(s, scope);
            return Flow::NORMAL;

        case StmtKind::TRY:
            return exec_try(s, scope, ret);

        case StmtKind::IMPORT:
        case StmtKind::IMPORTFROM:
            exec_import(s, scope);
            return Flow::NORMAL;
    }
    return Flow::NORMAL;
}

Flow Interpreter::exec_while(const Stmt& s, const ScopePtr& scope, Value& ret) {
    while (eval(*s.test, scope).truthy()) {
        tick();
        Flow flow = exec_block(s.body, scope, ret);
        if (flow == Flow::BREAK) return Flow::NORMAL;
        if (flow == Flow::RETURN) return flow;
        current_line_ = s.line;
    }
    return exec_block(s.orelse, scope, ret);
}

Flow Interpreter::exec_for(const Stmt& s, const ScopePtr& scope, Value& ret) {
    Value iterable = eval(*s.test, scope);
    bool broke = false;
    bool returned = false;

    iterate(iterable, [&](const Value& item) -> bool {
        tick();
        current_line_ = s.line;
        assign(*s.target, item, scope);
        Flow flow = exec_block(s.body, scope, ret);
        if (flow == Flow::BREAK) {
            broke = true;
            return false;
        }
        if (flow == Flow::RETURN) {
            returned = true;
            return false;
        }
        return true;
    });

    if (returned) return Flow::RETURN;
    if (broke) return Flow::NORMAL;
    return exec_block(s.orelse, scope, ret);
}

bool Interpreter::handler_matches(const ExceptHandler& handler, const ScriptError& error, const ScopePtr& scope) {
    if (!handler.type) return true;

    Value type = eval(*handler.type, scope);
    std::vector<Value> candidates;
    if (type.is_tuple()) {
        candidates = type.list().items;
    } else {
        candidates.push_back(type);
    }
    for (size_t i = 0; i < candidates.size(); ++i) {
        const Value& c = candidates[i];
        if (c.type() != ValueType::BUILTIN || !c.builtin().is_exception) {
            throw ScriptError("TypeError", "catching classes that do not inherit from BaseException is not allowed");
        }
        if (exception_matches(error.type(), c.builtin().name)) return true;
    }
    return false;
}

Flow Interpreter::exec_try(const Stmt& s, const ScopePtr& scope, Value& ret) {
    Flow flow = Flow::NORMAL;
    std::exception_ptr pending;
    bool raised = false;

    try {
        flow = exec_block(s.body, scope, ret);
    } catch (const ScriptError& e) {
        if (e.fatal()) throw;
        raised = true;

        const ExceptHandler* handler = nullptr;
        try {
            for (size_t i = 0; i < s.handlers.size() && !handler; ++i) {
                if (handler_matches(s.handlers[i], e, scope)) handler = &s.handlers[i];
            }
        } catch (const ScriptError& inner) {
            if (inner.fatal()) throw;
            pending = std::current_exception();
        }

        if (!handler && !pending) {
            pending = std::current_exception();
        } else if (handler) {
            current_line_ = handler->line;
            if (!handler->name.empty()) store_name(handler->name, e.to_value(), scope);
            handling_.push_back(e);
            try {
                flow = exec_block(handler->body, scope, ret);
            } catch (const ScriptError& inner) {
                if (inner.fatal()) {
                    handling_.pop_back();
                    throw;
                }
                pending = std::current_exception();
            }
            handling_.pop_back();
            if (!handler->name.empty()) {
                try {
                    delete_name(handler->name, scope);
                } catch (const ScriptError&) {
                    // handler body already deleted the name
                }
            }
        }
    }

    if (!raised && flow == Flow::NORMAL && !s.orelse.empty()) {
        try {
            flow = exec_block(s.orelse, scope, ret);
        } catch (const ScriptError& e) {
            if (e.fatal() || s.finalbody.empty()) throw;
            pending = std::current_exception();
        }
    }

    if (!s.finalbody.empty()) {
        Value final_ret;
        Flow final_flow = exec_block(s.finalbody, scope, final_ret);
        if (final_flow != Flow::NORMAL) {
            // break/continue/return in finally discards a pending exception
            if (final_flow == Flow::RETURN) ret = final_ret;
            return final_flow;
        }
    }

    if (pending) std::rethrow_exception(pending);
    return flow;
}

void Interpreter::exec_raise(const Stmt& s, const ScopePtr& scope) {
    if (!s.value) {
        if (handling_.empty()) {
            throw ScriptError("RuntimeError", "No active exception to reraise");
        }
        throw handling_.back();
    }

    Value exc = eval(*s.value, scope);
    if (exc.is_exception()) {
        throw ScriptError(exc, s.line);
    }
    if (exc.type() == ValueType::BUILTIN && exc.builtin().is_exception) {
        throw ScriptError(exc.builtin().name, "", s.line);
    }
    throw ScriptError("TypeError", "exceptions must derive from BaseException");
}

void Interpreter::exec_import(const Stmt& s, const ScopePtr& scope) {
    if (s.kind == StmtKind::IMPORT) {
        for (size_t i = 0; i < s.imports.size(); ++i) {
            const ImportName& imp = s.imports[i];
            Value module = import_module(imp.name);
            store_name(imp.asname.empty() ? imp.name : imp.asname, module, scope);
        }
        return;
    }

    Value module = import_module(s.module);
    ModuleObject& mod = module.module();
    for (size_t i = 0; i < s.imports.size(); ++i) {
        const ImportName& imp = s.imports[i];
        if (imp.name == "*") {
            for (std::map<std::string, Value>::const_iterator it = mod.attrs.begin(); it != mod.attrs.end(); ++it) {
                if (!starts_with(it->first, "_")) store_name(it->first, it->second, scope);
            }
            continue;
        }
        std::map<std::string, Value>::const_iterator it = mod.attrs.find(imp.name);
        if (it == mod.attrs.end()) {
            throw ScriptError("ImportError", "cannot import name '" + imp.name + "' from '" + s.module + "'");
        }
        store_name(imp.asname.empty() ? imp.name : imp.asname, it->second, scope);
    }
}

Value Interpreter::import_module(const std::string& name) {
    if (!capabilities_.has(Capability::MODULES)) {
        throw ScriptError("ImportError", "imports are disabled in this sandbox (import of '" + name + "')");
    }
    std::map<std::string, Value>::const_iterator cached = module_cache_.find(name);
    if (cached != module_cache_.end()) return cached->second;

    Value module;
    if (!create_module(name, module)) {
        throw ScriptError("ImportError", "import of '" + name + "' is not allowed in this sandbox");
    }
    module_cache_[name] = module;
    return module;
}

void Interpreter::exec_augassign(const Stmt& s, const ScopePtr& scope) {
    const Expr& target = *s.target;
    Value rhs = eval(*s.value, scope);

    // In-place forms mutate the existing container
    auto in_place = [&](const Value& current) -> bool {
        if (s.aug_op == BinOp::ADD && current.is_list()) {
            if (current.list().frozen) throw ScriptError("TypeError", "'list' object is read-only");
            std::vector<Value> extra = to_vector(rhs);
            check_sequence_length(static_cast<int64_t>(current.list().items.size() + extra.size()));
            current.list().items.insert(current.list().items.end(), extra.begin(), extra.end());
            return true;
        }
        if (s.aug_op == BinOp::BITOR && current.is_dict() && rhs.is_dict()) {
            if (current.dict().frozen) throw ScriptError("TypeError", "'dict' object is read-only");
            std::vector<std::pair<Value, Value> > entries = rhs.dict().entries;
            for (size_t i = 0; i < entries.size(); ++i) current.dict().set(entries[i].first, entries[i].second);
            return true;
        }
        return false;
    };

    if (target.kind == ExprKind::NAME) {
        Value current = load_name(target.id, scope);
        if (!in_place(current)) {
            store_name(target.id, binary_op(s.aug_op, current, rhs), scope);
        } else {
            store_name(target.id, current, scope);
        }
        return;
    }
    if (target.kind == ExprKind::SUBSCRIPT) {
        Value container = eval(*target.left, scope);
        if (target.right->kind == ExprKind::SLICE) {
            throw ScriptError("TypeError", "augmented assignment to a slice is not supported");
        }
        Value index = eval(*target.right, scope);
        Value current = get_item(container, index);
        if (!in_place(current)) {
            set_item(container, index, binary_op(s.aug_op, current, rhs));
        }
        return;
    }
    Value object = eval(*target.left, scope);
    throw ScriptError("AttributeError", "'" + object.type_name() + "' object attribute '" + target.id + "' is read-only");
}

// ============================================================================
// Names
// ============================================================================

Value Interpreter::load_name(const std::string& name, const ScopePtr& scope) {
    for (Scope* s = scope.get(); s; s = s->parent.get()) {
        if (s->def && s->def->global_names.count(name)) break;
        std::unordered_map<std::string, Value>::const_iterator it = s->vars.find(name);
        if (it != s->vars.end()) return it->second;
        if (s->def && s->def->local_names.count(name)) {
            throw ScriptError("UnboundLocalError", "cannot access local variable '" + name +
                              "' where it is not associated with a value");
        }
    }

    Namespace::const_iterator g = globals_.find(name);
    if (g != globals_.end()) return g->second;

    const Value* symbol = symbols_.find(name);
    if (symbol) return *symbol;

    std::string group;
    if (symbols_.is_disabled(name, group)) {
        throw ScriptError("NameError", "name '" + name + "' is not defined (capability " + group + " is disabled)");
    }
    throw ScriptError("NameError", "name '" + name + "' is not defined");
}

Scope* Interpreter::nonlocal_owner(const std::string& name, const ScopePtr& scope) {
    for (Scope* s = scope->parent.get(); s; s = s->parent.get()) {
        if (!s->def) continue;
        if (s->vars.count(name) || s->def->local_names.count(name)) return s;
    }
    throw ScriptError("SyntaxError", "no binding for nonlocal '" + name + "' found");
}

void Interpreter::store_name(const std::string& name, const Value& value, const ScopePtr& scope) {
    if (!scope) {
        globals_[name] = value;
        return;
    }
    if (scope->def) {
        if (scope->def->global_names.count(name)) {
            globals_[name] = value;
            return;
        }
        if (scope->def->nonlocal_names.count(name)) {
            nonlocal_owner(name, scope)->vars[name] = value;
            return;
        }
    }
    scope->vars[name] = value;
}

void Interpreter::delete_name(const std::string& name, const ScopePtr& scope) {
    if (scope && !(scope->def && scope->def->global_names.count(name))) {
        Scope* owner = scope.get();
        if (scope->def && scope->def->nonlocal_names.count(name)) owner = nonlocal_owner(name, scope);
        if (owner->vars.erase(name) == 0) {
            throw ScriptError("NameError", "name '" + name + "' is not defined");
        }
        return;
    }
    if (globals_.erase(name) == 0) {
        throw ScriptError("NameError", "name '" + name + "' is not defined");
    }
}

void Interpreter::assign(const Expr& target, const Value& value, const ScopePtr& scope) {
    switch (target.kind) {
        case ExprKind::NAME:
            store_name(target.id, value, scope);
            return;

        case ExprKind::TUPLE:
        case ExprKind::LIST: {
            std::vector<Value> items = to_vector(value);
            size_t n = target.items.size();
            size_t star = n;
            for (size_t i = 0; i < n; ++i) {
                if (target.items[i]->kind == ExprKind::STARRED) star = i;
            }

            if (star == n) {
                if (items.size() > n) {
                    throw ScriptError("ValueError", "too many values to unpack (expected " + std::to_string(n) + ")");
                }
                if (items.size() < n) {
                    throw ScriptError("ValueError", "not enough values to unpack (expected " + std::to_string(n) +
                                      ", got " + std::to_string(items.size()) + ")");
                }
                for (size_t i = 0; i < n; ++i) assign(*target.items[i], items[i], scope);
                return;
            }

            size_t after = n - star - 1;
            if (items.size() < star + after) {
                throw ScriptError("ValueError", "not enough values to unpack (expected at least " +
                                  std::to_string(star + after) + ", got " + std::to_string(items.size()) + ")");
            }
            for (size_t i = 0; i < star; ++i) assign(*target.items[i], items[i], scope);
            std::vector<Value> middle(items.begin() + static_cast<std::ptrdiff_t>(star),
                                      items.end() - static_cast<std::ptrdiff_t>(after));
            assign(*target.items[star]->left, Value::new_list(middle), scope);
            for (size_t i = 0; i < after; ++i) {
                assign(*target.items[star + 1 + i], items[items.size() - after + i], scope);
            }
            return;
        }

        case ExprKind::SUBSCRIPT: {
            Value container = eval(*target.left, scope);
            const Expr& index = *target.right;
            if (index.kind == ExprKind::SLICE) {
                Value lower = index.lower ? eval(*index.lower, scope) : Value::none();
                Value upper = index.upper ? eval(*index.upper, scope) : Value::none();
                Value step = index.step ? eval(*index.step, scope) : Value::none();
                set_slice(container, lower, upper, step, value);
            } else {
                set_item(container, eval(index, scope), value);
            }
            return;
        }

        case ExprKind::ATTRIBUTE: {
            Value object = eval(*target.left, scope);
            throw ScriptError("AttributeError", "'" + object.type_name() + "' object attribute '" +
                              target.id + "' is read-only");
        }

        default:
            throw ScriptError("SyntaxError", "cannot assign to expression");
    }
}

void Interpreter::delete_target(const Expr& target, const ScopePtr& scope) {
    switch (target.kind) {
        case ExprKind::NAME:
            delete_name(target.id, scope);
            return;
        case ExprKind::TUPLE:
        case ExprKind::LIST:
            for (size_t i = 0; i < target.items.size(); ++i) delete_target(*target.items[i], scope);
            return;
        case ExprKind::SUBSCRIPT: {
            Value container = eval(*target.left, scope);
            const Expr& index = *target.right;
            if (index.kind == ExprKind::SLICE) {
                Value lower = index.lower ? eval(*index.lower, scope) : Value::none();
                Value upper = index.upper ? eval(*index.upper, scope) : Value::none();
                Value step = index.step ? eval(*index.step, scope) : Value::none();
                delete_slice(container, lower, upper, step);
            } else {
                delete_item(container, eval(index, scope));
            }
            return;
        }
        default:
            throw ScriptError("SyntaxError", "cannot delete expression");
    }
}

// ============================================================================
// Expressions
// ============================================================================

Value Interpreter::eval(const Expr& e, const ScopePtr& scope) {
    tick();

    switch (e.kind) {
        case ExprKind::CONSTANT:
            return e.constant;

        case ExprKind::NAME:
            return load_name(e.id, scope);

        case ExprKind::FSTRING:
            return eval_fstring(e, scope);

        case ExprKind::LIST:
        case ExprKind::TUPLE:
        case ExprKind::SET: {
            std::vector<Value> items;
            for (size_t i = 0; i < e.items.size(); ++i) {
                if (e.items[i]->kind == ExprKind::STARRED) {
                    std::vector<Value> spread = to_vector(eval(*e.items[i]->left, scope));
                    items.insert(items.end(), spread.begin(), spread.end());
                } else {
                    items.push_back(eval(*e.items[i], scope));
                }
            }
            check_sequence_length(static_cast<int64_t>(items.size()));
            if (e.kind == ExprKind::LIST) return Value::new_list(items);
            if (e.kind == ExprKind::TUPLE) return Value::new_tuple(items);
            Value set = Value::new_set();
            for (size_t i = 0; i < items.size(); ++i) set.dict().set(items[i], Value::none());
            return set;
        }

        case ExprKind::DICT: {
            Value dict = Value::new_dict();
            for (size_t i = 0; i < e.items.size(); ++i) {
                if (!e.items[i]) {
                    Value spread = eval(*e.values[i], scope);
                    if (!spread.is_dict()) {
                        throw ScriptError("TypeError", "'" + spread.type_name() + "' object is not a mapping");
                    }
                    std::vector<std::pair<Value, Value> > entries = spread.dict().entries;
                    for (size_t k = 0; k < entries.size(); ++k) dict.dict().set(entries[k].first, entries[k].second);
                } else {
                    Value key = eval(*e.items[i], scope);
                    dict.dict().set(key, eval(*e.values[i], scope));
                }
            }
            return dict;
        }

        case ExprKind::BINOP: {
            Value left = eval(*e.left, scope);
            Value right = eval(*e.right, scope);
            return binary_op(e.bin_op, left, right);
        }

        case ExprKind::UNARYOP: {
            Value operand = eval(*e.left, scope);
            switch (e.unary_op) {
                case UnaryOp::NOT:
                    return Value::from_bool(!operand.truthy());
                case UnaryOp::NEG:
                    if (operand.is_float()) return Value::from_float(-operand.as_float());
                    if (operand.is_int() || operand.is_bool()) {
                        if (operand.as_int() == INT64_MIN) throw ScriptError("OverflowError", "integer negation overflow");
                        return Value::from_int(-operand.as_int());
                    }
                    break;
                case UnaryOp::POS:
                    if (operand.is_float()) return operand;
                    if (operand.is_int() || operand.is_bool()) return Value::from_int(operand.as_int());
                    break;
                case UnaryOp::INVERT:
                    if (operand.is_int() || operand.is_bool()) return Value::from_int(~operand.as_int());
                    break;
            }
            const char* sym = e.unary_op == UnaryOp::NEG ? "-" : (e.unary_op == UnaryOp::POS ? "+" : "~");
            throw ScriptError("TypeError", std::string("bad operand type for unary ") + sym + ": '" +
                              operand.type_name() + "'");
        }

        case ExprKind::BOOLOP: {
            Value result;
            for (size_t i = 0; i < e.items.size(); ++i) {
                result = eval(*e.items[i], scope);
                bool t = result.truthy();
                if (e.is_and ? !t : t) return result;
            }
            return result;
        }

        case ExprKind::COMPARE: {
            Value left = eval(*e.left, scope);
            for (size_t i = 0; i < e.cmp_ops.size(); ++i) {
                Value right = eval(*e.items[i], scope);
                if (!compare(e.cmp_ops[i], left, right)) return Value::from_bool(false);
                left = right;
            }
            return Value::from_bool(true);
        }

        case ExprKind::IFEXP:
            return eval(*e.cond, scope).truthy() ? eval(*e.left, scope) : eval(*e.right, scope);

        case ExprKind::CALL:
            return eval_call(e, scope);

        case ExprKind::ATTRIBUTE:
            return get_attribute(eval(*e.left, scope), e.id);

        case ExprKind::SUBSCRIPT:
            return eval_subscript(e, scope);

        case ExprKind::SLICE:
            throw ScriptError("SyntaxError", "slice outside of a subscript");

        case ExprKind::LAMBDA:
            return make_function(e.func, scope);

        case ExprKind::LISTCOMP:
        case ExprKind::SETCOMP:
        case ExprKind::DICTCOMP:
        case ExprKind::GENEXP:
            return eval_comprehension(e, scope);

        case ExprKind::STARRED:
            throw ScriptError("SyntaxError", "can't use starred expression here");
    }
    return Value::none();
}

Value Interpreter::eval_subscript(const Expr& e, const ScopePtr& scope) {
    Value container = eval(*e.left, scope);
    const Expr& index = *e.right;
    if (index.kind == ExprKind::SLICE) {
        Value lower = index.lower ? eval(*index.lower, scope) : Value::none();
        Value upper = index.upper ? eval(*index.upper, scope) : Value::none();
        Value step = index.step ? eval(*index.step, scope) : Value::none();
        return get_slice(container, lower, upper, step);
    }
    return get_item(container, eval(index, scope));
}

Value Interpreter::eval_fstring(const Expr& e, const ScopePtr& scope) {
    std::string out;
    for (size_t i = 0; i < e.parts.size(); ++i) {
        const FStringPart& part = e.parts[i];
        if (!part.expr) {
            out += part.literal;
            continue;
        }
        Value v = eval(*part.expr, scope);
        if (part.conversion == 'r' || part.conversion == 'a') {
            v = Value::from_string(v.repr());
        } else if (part.conversion == 's') {
            v = Value::from_string(v.str());
        }
        std::string spec = part.format_spec ? eval_fstring(*part.format_spec, scope).as_str() : "";
        out += format_value(v, spec);
        if (out.size() > static_cast<size_t>(limits_.max_sequence_length)) {
            check_sequence_length(static_cast<int64_t>(out.size()));
        }
    }
    return Value::from_string(out);
}

void Interpreter::collect_call_args(const Expr& e, const ScopePtr& scope, Args& args) {
    for (size_t i = 0; i < e.items.size(); ++i) {
        if (e.items[i]->kind == ExprKind::STARRED) {
            std::vector<Value> spread = to_vector(eval(*e.items[i]->left, scope));
            args.positional.insert(args.positional.end(), spread.begin(), spread.end());
        } else {
            args.positional.push_back(eval(*e.items[i], scope));
        }
    }
    for (size_t i = 0; i < e.keywords.size(); ++i) {
        const Keyword& kw = e.keywords[i];
        Value value = eval(*kw.value, scope);
        if (!kw.name.empty()) {
            args.keywords.push_back(std::make_pair(kw.name, value));
            continue;
        }
        if (!value.is_dict()) {
            throw ScriptError("TypeError", "argument after ** must be a mapping, not " + value.type_name());
        }
        const std::vector<std::pair<Value, Value> >& entries = value.dict().entries;
        for (size_t k = 0; k < entries.size(); ++k) {
            if (!entries[k].first.is_str()) {
                throw ScriptError("TypeError", "keywords must be strings");
            }
            if (args.keyword(entries[k].first.as_str())) {
                throw ScriptError("TypeError", "got multiple values for keyword argument '" +
                                  entries[k].first.as_str() + "'");
            }
            args.keywords.push_back(std::make_pair(entries[k].first.as_str(), entries[k].second));
        }
    }
}

Value Interpreter::eval_call(const Expr& e, const ScopePtr& scope) {
    // obj.method(...) dispatches without materializing a bound method
    if (e.left->kind == ExprKind::ATTRIBUTE) {
        Value object = eval(*e.left->left, scope);
        if (object.type() != ValueType::MODULE && has_method(object, e.left->id)) {
            Args args;
            args.name = e.left->id;
            collect_call_args(e, scope, args);
            int line = current_line_;
            Value result = call_method(*this, object, e.left->id, args);
            current_line_ = line;
            return result;
        }
        Value callee = get_attribute(object, e.left->id);
        Args args;
        collect_call_args(e, scope, args);
        return call(callee, args);
    }

    Value callee = eval(*e.left, scope);
    Args args;
    collect_call_args(e, scope, args);
    return call(callee, args);
}

Value Interpreter::make_function(const std::shared_ptr<FunctionDef>& def, const ScopePtr& scope) {
    std::shared_ptr<FunctionObject> fn = std::make_shared<FunctionObject>();
    fn->name = def->name;
    fn->def = def;
    fn->closure = scope;
    fn->defaults.resize(def->params.size());
    for (size_t i = 0; i < def->params.size(); ++i) {
        if (def->params[i].default_value) {
            fn->defaults[i] = eval(*def->params[i].default_value, scope);
        }
    }
    return Value::new_function(fn);
}

Value Interpreter::eval_comprehension(const Expr& e, const ScopePtr& scope) {
    ScopePtr comp = std::make_shared<Scope>(scope, std::shared_ptr<const FunctionDef>());

    if (e.kind == ExprKind::DICTCOMP) {
        Value dict = Value::new_dict();
        comprehension_clause(e, 0, comp, [&](const ScopePtr& s) {
            Value key = eval(*e.left, s);
            dict.dict().set(key, eval(*e.right, s));
        });
        return dict;
    }
    if (e.kind == ExprKind::SETCOMP) {
        Value set = Value::new_set();
        comprehension_clause(e, 0, comp, [&](const ScopePtr& s) {
            set.dict().set(eval(*e.left, s), Value::none());
        });
        return set;
    }

    // Generator expressions are evaluated eagerly into a list
    Value list = Value::new_list();
    comprehension_clause(e, 0, comp, [&](const ScopePtr& s) {
        list.list().items.push_back(eval(*e.left, s));
        check_sequence_length(static_cast<int64_t>(list.list().items.size()));
    });
    return list;
}

void Interpreter::comprehension_clause(const Expr& e, size_t index, const ScopePtr& comp_scope,
                                       const std::function<void(const ScopePtr&)>& emit) {
    if (index == e.comps.size()) {
        emit(comp_scope);
        return;
    }

    const CompClause& clause = e.comps[index];
    // The outermost iterable is evaluated in the enclosing scope
    Value iterable = eval(*clause.iter, index == 0 ? comp_scope->parent : comp_scope);
    iterate(iterable, [&](const Value& item) -> bool {
        tick();
        assign(*clause.target, item, comp_scope);
        for (size_t i = 0; i < clause.conds.size(); ++i) {
            if (!eval(*clause.conds[i], comp_scope).truthy()) return true;
        }
        comprehension_clause(e, index + 1, comp_scope, emit);
        return true;
    });
}

// ============================================================================
// Calls
// ============================================================================

Value Interpreter::call1(const Value& callee, const Value& arg) {
    Args args;
    args.positional.push_back(arg);
    return call(callee, args);
}

Value Interpreter::call(const Value& callee, Args& args) {
    tick();
    int line = current_line_;
    Value result;

    switch (callee.type()) {
        case ValueType::FUNCTION:
            args.name = callee.function().name;
            result = call_function(callee, args);
            break;
        case ValueType::BUILTIN:
            args.name = callee.builtin().name;
            if (!callee.builtin().fn) {
                throw ScriptError("TypeError", "cannot create '" + callee.builtin().name + "' instances");
            }
            result = callee.builtin().fn(*this, args);
            break;
        case ValueType::METHOD:
            args.name = callee.method().name;
            result = call_method(*this, callee.method().self, callee.method().name, args);
            break;
        default:
            throw ScriptError("TypeError", "'" + callee.type_name() + "' object is not callable");
    }

    current_line_ = line;
    return result;
}

Value Interpreter::call_function(const Value& function, Args& args) {
    const FunctionObject& fn = function.function();
    CallDepthGuard guard(call_depth_, limits_.max_call_depth);

    ScopePtr scope = std::make_shared<Scope>(fn.closure, fn.def);
    bind_arguments(fn, args, *scope);

    if (fn.def->is_lambda()) {
        return eval(*fn.def->lambda_body, scope);
    }
    Value ret;
    Flow flow = exec_block(fn.def->body, scope, ret);
    return flow == Flow::RETURN ? ret : Value::none();
}

void Interpreter::bind_arguments(const FunctionObject& fn, Args& args, Scope& scope) {
    const FunctionDef& def = *fn.def;
    std::vector<bool> bound(def.params.size(), false);

    size_t positional_params = 0;
    while (positional_params < def.params.size() && !def.params[positional_params].kw_only) {
        ++positional_params;
    }

    std::vector<Value> extra;
    for (size_t i = 0; i < args.positional.size(); ++i) {
        if (i < positional_params) {
            scope.vars[def.params[i].name] = args.positional[i];
            bound[i] = true;
        } else if (!def.vararg.empty()) {
            extra.push_back(args.positional[i]);
        } else {
            throw ScriptError("TypeError", fn.name + "() takes " + std::to_string(positional_params) +
                              " positional argument" + (positional_params == 1 ? "" : "s") + " but " +
                              std::to_string(args.positional.size()) + (args.positional.size() == 1 ? " was" : " were") +
                              " given");
        }
    }
    if (!def.vararg.empty()) scope.vars[def.vararg] = Value::new_tuple(extra);

    Value kwargs;
    if (!def.kwarg.empty()) kwargs = Value::new_dict();

    for (size_t k = 0; k < args.keywords.size(); ++k) {
        const std::string& key = args.keywords[k].first;
        size_t slot = def.params.size();
        for (size_t i = 0; i < def.params.size(); ++i) {
            if (def.params[i].name == key) {
                slot = i;
                break;
            }
        }
        if (slot < def.params.size()) {
            if (bound[slot]) {
                throw ScriptError("TypeError", fn.name + "() got multiple values for argument '" + key + "'");
            }
            scope.vars[key] = args.keywords[k].second;
            bound[slot] = true;
        } else if (!def.kwarg.empty()) {
            kwargs.dict().set(Value::from_string(key), args.keywords[k].second);
        } else {
            throw ScriptError("TypeError", fn.name + "() got an unexpected keyword argument '" + key + "'");
        }
    }
    if (!def.kwarg.empty()) scope.vars[def.kwarg] = kwargs;

    std::vector<std::string> missing;
    for (size_t i = 0; i < def.params.size(); ++i) {
        if (bound[i]) continue;
        if (def.params[i].default_value) {
            scope.vars[def.params[i].name] = fn.defaults[i];
        } else {
            missing.push_back("'" + def.params[i].name + "'");
        }
    }
    if (!missing.empty()) {
        throw ScriptError("TypeError", fn.name + "() missing " + std::to_string(missing.size()) +
                          " required argument" + (missing.size() == 1 ? "" : "s") + ": " + join(missing, ", "));
    }
}

// ============================================================================
// Iteration
// ============================================================================

void Interpreter::iterate(const Value& iterable, const std::function<bool(const Value&)>& fn) {
    switch (iterable.type()) {
        case ValueType::LIST:
        case ValueType::TUPLE: {
            Value keep = iterable;
            ListObject& list = keep.list();
            for (size_t i = 0; i < list.items.size(); ++i) {
                Value item = list.items[i];
                if (!fn(item)) return;
            }
            return;
        }
        case ValueType::STR: {
            const std::string& s = iterable.as_str();
            if (utf8::is_ascii(s)) {
                for (size_t i = 0; i < s.size(); ++i) {
                    if (!fn(Value::from_string(std::string(1, s[i])))) return;
                }
                return;
            }
            std::vector<std::string> chars = utf8::chars(s);
            for (size_t i = 0; i < chars.size(); ++i) {
                if (!fn(Value::from_string(chars[i]))) return;
            }
            return;
        }
        case ValueType::DICT:
        case ValueType::SET: {
            Value keep = iterable;
            DictObject& dict = keep.dict();
            size_t original = dict.size();
            std::vector<Value> keys;
            keys.reserve(original);
            for (size_t i = 0; i < dict.entries.size(); ++i) keys.push_back(dict.entries[i].first);
            for (size_t i = 0; i < keys.size(); ++i) {
                if (!fn(keys[i])) return;
                if (dict.size() != original) {
                    throw ScriptError("RuntimeError", std::string(iterable.is_dict() ? "dictionary" : "set") +
                                      " changed size during iteration");
                }
            }
            return;
        }
        case ValueType::RANGE: {
            const RangeObject r = iterable.range();
            int64_t n = r.length();
            for (int64_t i = 0; i < n; ++i) {
                if (!fn(Value::from_int(r.at(i)))) return;
            }
            return;
        }
        default:
            throw ScriptError("TypeError", "'" + iterable.type_name() + "' object is not iterable");
    }
}

std::vector<Value> Interpreter::to_vector(const Value& iterable) {
    if (iterable.is_list() || iterable.is_tuple()) {
        return iterable.list().items;
    }
    if (iterable.is_range()) {
        check_sequence_length(iterable.range().length());
    }
    std::vector<Value> out;
    iterate(iterable, [&](const Value& item) -> bool {
        out.push_back(item);
        return true;
    });
    return out;
}

// ============================================================================
// Attributes
// ============================================================================

Value Interpreter::get_attribute(const Value& object, const std::string& name) {
    switch (object.type()) {
        case ValueType::MODULE: {
            const ModuleObject& mod = object.module();
            std::map<std::string, Value>::const_iterator it = mod.attrs.find(name);
            if (it != mod.attrs.end()) return it->second;
            if (name == "__name__") return Value::from_string(mod.name);
            throw ScriptError("AttributeError", "module '" + mod.name + "' has no attribute '" + name + "'");
        }
        case ValueType::EXCEPTION:
            if (name == "args") {
                std::vector<Value> items;
                if (!object.exception().message.empty()) items.push_back(Value::from_string(object.exception().message));
                return Value::new_tuple(items);
            }
            break;
        case ValueType::FUNCTION:
            if (name == "__name__") return Value::from_string(object.function().name);
            break;
        case ValueType::BUILTIN:
            if (name == "__name__") return Value::from_string(object.builtin().name);
            break;
        case ValueType::RANGE:
            if (name == "start") return Value::from_int(object.range().start);
            if (name == "stop") return Value::from_int(object.range().stop);
            if (name == "step") return Value::from_int(object.range().step);
            break;
        default:
            break;
    }
    if (has_method(object, name)) {
        return Value::new_method(object, name);
    }
    throw ScriptError("AttributeError", "'" + object.type_name() + "' object has no attribute '" + name + "'");
}

bool Interpreter::has_attribute(const Value& object, const std::string& name) {
    try {
        get_attribute(object, name);
        return true;
    } catch (const ScriptError& e) {
        if (e.type() != "AttributeError") throw;
        return false;
    }
}

Value Interpreter::type_of(const Value& value) const {
    std::string name = value.type_name();
    if (value.is_exception()) name = value.exception().type;
    if (value.type() == ValueType::BUILTIN && value.builtin().is_type) name = "type";

    const Value* known = symbols_.find(name);
    if (known && known->type() == ValueType::BUILTIN && known->builtin().is_type) {
        return *known;
    }
    if (known && value.is_exception() && known->type() == ValueType::BUILTIN) {
        return *known;
    }
    // Types without a constructor in the table (NoneType, function, ...)
    return Value::new_builtin(name, nullptr, true);
}

} // namespace script
} // namespace gatedrepl
