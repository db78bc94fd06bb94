/*
 * gatedrepl C++ - Sandbox Environment Implementation
 */
#include <gatedrepl/repl/sandbox_environment.hpp>
#include <gatedrepl/core/logger.hpp>
#include <gatedrepl/core/utils.hpp>
#include <gatedrepl/script/parser.hpp>

#include <cstdio>
#include <cstring>
#include <sstream>

namespace gatedrepl {

using script::Value;

// ============================================================================
// ExecutionResult
// ============================================================================

std::vector<std::string> ExecutionResult::variable_names() const {
    std::vector<std::string> names;
    for (Json::const_iterator it = locals_snapshot.begin(); it != locals_snapshot.end(); ++it) {
        names.push_back(it.key());
    }
    return names;
}

Json ExecutionResult::to_json() const {
    char elapsed[32];
    snprintf(elapsed, sizeof(elapsed), "%.3fs", elapsed_seconds);

    Json j;
    j["success"] = success;
    j["stdout"] = stdout_text;
    j["stderr"] = stderr_text.empty() ? Json() : Json(stderr_text);
    j["execution_time"] = elapsed;
    j["variables"] = variable_names();
    if (output_truncated) j["truncated"] = true;
    return j;
}

// ============================================================================
// SandboxOptions
// ============================================================================

SandboxOptions SandboxOptions::from_config(const Config& cfg) {
    SandboxOptions opts;
    script::ExecutionLimits& limits = opts.limits;

    limits.max_steps = cfg.get_int("repl.max_steps", limits.max_steps);
    limits.timeout_ms = cfg.get_int("repl.timeout_ms", limits.timeout_ms);
    limits.max_call_depth = static_cast<int>(cfg.get_int("repl.max_call_depth", limits.max_call_depth));
    limits.max_output_chars = static_cast<size_t>(
        cfg.get_int("repl.max_output_chars", static_cast<int64_t>(limits.max_output_chars)));
    limits.max_sequence_length = cfg.get_int("repl.max_sequence_length", limits.max_sequence_length);
    limits.max_regex_input = cfg.get_int("repl.max_regex_input", limits.max_regex_input);

    std::vector<std::string> disabled = cfg.get_string_array("repl.disabled_capabilities");
    for (size_t i = 0; i < disabled.size(); ++i) {
        script::Capability cap;
        if (!script::CapabilitySet::parse(disabled[i], cap)) {
            LOG_WARN("[Sandbox] Unknown capability '%s' in repl.disabled_capabilities", disabled[i].c_str());
            continue;
        }
        opts.capabilities.disable(cap);
    }

    return opts;
}

// ============================================================================
// Construction and injected state
// ============================================================================

SandboxEnvironment::SandboxEnvironment(const SandboxOptions& options)
    : options_(options)
    , interp_(options.capabilities, options.limits)
    , has_context_(false)
    , written_(0)
    , kept_(0)
{
    interp_.set_host(this);
    LOG_DEBUG("[Sandbox] Created with capabilities: %s",
              join(options.capabilities.names(), ",").c_str());
}

SandboxEnvironment::~SandboxEnvironment() {
    interp_.set_host(nullptr);
}

void SandboxEnvironment::load_context(const std::string& text) {
    if (!options_.capabilities.has(script::Capability::CONTEXT)) {
        LOG_WARN("[Sandbox] CONTEXT capability disabled, context not loaded");
        return;
    }
    interp_.bind_symbol("context", Value::from_string(text));
    has_context_ = true;
    LOG_DEBUG("[Sandbox] Loaded text context (%zu bytes)", text.size());
}

void SandboxEnvironment::load_context_json(const Json& data) {
    if (!options_.capabilities.has(script::Capability::CONTEXT)) {
        LOG_WARN("[Sandbox] CONTEXT capability disabled, context not loaded");
        return;
    }
    Value value = script::value_from_json(data);
    script::freeze(value);
    interp_.bind_symbol("context", value);
    has_context_ = true;
    LOG_DEBUG("[Sandbox] Loaded structured context (%s)", value.type_name().c_str());
}

size_t SandboxEnvironment::seed_locals(const Json& locals) {
    if (locals.is_null()) return 0;
    if (!locals.is_object()) {
        LOG_WARN("[Sandbox] Seed locals must be a JSON object, ignoring");
        return 0;
    }

    size_t count = 0;
    script::Namespace& globals = interp_.globals();
    for (Json::const_iterator it = locals.begin(); it != locals.end(); ++it) {
        globals[it.key()] = script::value_from_json(it.value());
        ++count;
    }
    return count;
}

// ============================================================================
// Execution
// ============================================================================

bool SandboxEnvironment::is_expression(const std::string& line) {
    static const char* const kStatementStarters[] = {
        "import ", "from ", "def ", "class ", "if ", "for ", "while ",
        "try:", "with ", "return ", "yield ", "break", "continue", "pass",
        "raise ", "assert ", "del ", "global ", "nonlocal ",
        NULL
    };

    for (const char* const* s = kStatementStarters; *s; ++s) {
        if (starts_with(line, *s)) return false;
    }

    // Assignment vs comparison, judged on the first '='
    std::string code_part = line.substr(0, line.find('#'));
    size_t eq = code_part.find('=');
    if (eq != std::string::npos) {
        if (eq > 0 && std::strchr("!<>=", code_part[eq - 1]) != NULL) return true;
        if (eq + 1 < code_part.size() && code_part[eq + 1] == '=') return true;
        return false;
    }

    if (ends_with(line, ":")) return false;
    if (starts_with(line, "print(")) return false;
    return true;
}

// Bracket balance of one line, ignoring string literals and comments
static int bracket_delta(const std::string& line) {
    int depth = 0;
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote) {
            if (c == '\\') ++i;
            else if (c == quote) quote = 0;
            continue;
        }
        if (c == '#') break;
        if (c == '\'' || c == '"') quote = c;
        else if (c == '(' || c == '[' || c == '{') ++depth;
        else if (c == ')' || c == ']' || c == '}') --depth;
    }
    return depth;
}

void SandboxEnvironment::run(const std::string& code) {
    std::vector<std::string> lines = split(code, '\n');
    std::vector<std::string> hoisted(lines.size());
    std::vector<std::string> body(lines.size());
    bool any_hoisted = false;

    // Blank placeholders keep line numbers aligned with the submission
    bool continuing = false;
    int depth = 0;
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string line = lines[i];
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (continuing || starts_with(line, "import ") || starts_with(line, "from ")) {
            hoisted[i] = line;
            any_hoisted = true;
            depth += bracket_delta(line);
            continuing = depth > 0 || ends_with(line, "\\");
        } else {
            body[i] = line;
        }
    }

    std::string last_line;
    for (size_t i = body.size(); i > 0; --i) {
        std::string stripped = trim(body[i - 1]);
        if (!stripped.empty() && stripped[0] != '#') {
            last_line = stripped;
            break;
        }
    }

    // Parse everything before running anything
    script::Module imports;
    if (any_hoisted) imports = script::Parser::parse(join(hoisted, "\n"));
    script::Module program;
    if (!last_line.empty()) program = script::Parser::parse(join(body, "\n"));

    if (any_hoisted) interp_.exec_module(imports);
    if (program.body.empty()) return;

    const script::Stmt& tail = *program.body.back();
    if (tail.kind == script::StmtKind::EXPR && is_expression(last_line)) {
        interp_.exec_statements(program.body, 0, program.body.size() - 1);
        Value result = interp_.eval_top_level(*tail.value);
        if (!result.is_none()) write_output(result.repr() + "\n");
    } else {
        interp_.exec_module(program);
    }
}

ExecutionResult SandboxEnvironment::execute(const std::string& code) {
    ExecutionResult result;
    int64_t start = monotonic_ms();

    // Model-query output of the previous execution is dropped
    router_.clear(OutputTarget::SECONDARY);
    written_ = 0;
    kept_ = 0;
    interp_.begin_execution();

    try {
        run(code);
        result.success = true;
    } catch (const script::ScriptError& e) {
        result.stderr_text = e.describe();
        LOG_DEBUG("[Sandbox] Execution fault: %s", result.stderr_text.c_str());
    } catch (const std::exception& e) {
        result.stderr_text = std::string("InternalError: ") + e.what();
        LOG_ERROR("[Sandbox] Unexpected failure during execution: %s", e.what());
    }

    if (written_ > kept_) {
        std::ostringstream marker;
        marker << "\n... [truncated, " << (written_ - kept_) << " chars omitted]";
        router_.write(marker.str());
        result.output_truncated = true;
    }

    result.stdout_text = router_.buffer(OutputTarget::PRIMARY);
    router_.clear(OutputTarget::PRIMARY);
    result.elapsed_seconds = static_cast<double>(monotonic_ms() - start) / 1000.0;
    result.locals_snapshot = snapshot();

    LOG_DEBUG("[Sandbox] Executed %zu bytes in %.3fs (success=%s)",
              code.size(), result.elapsed_seconds, result.success ? "true" : "false");
    return result;
}

void SandboxEnvironment::cancel() {
    interp_.cancel();
}

// ============================================================================
// Namespace views
// ============================================================================

Json SandboxEnvironment::snapshot() const {
    Json out = Json::object();
    const script::Namespace& globals = interp_.globals();
    for (script::Namespace::const_iterator it = globals.begin(); it != globals.end(); ++it) {
        if (starts_with(it->first, "_")) continue;
        Json value;
        if (script::value_to_json(it->second, value)) {
            out[it->first] = value;
        } else {
            out[it->first] = "<" + it->second.type_name() + ">";
        }
    }
    return out;
}

std::vector<std::string> SandboxEnvironment::variable_names() const {
    std::vector<std::string> names;
    const script::Namespace& globals = interp_.globals();
    for (script::Namespace::const_iterator it = globals.begin(); it != globals.end(); ++it) {
        if (!starts_with(it->first, "_")) names.push_back(it->first);
    }
    return names;
}

bool SandboxEnvironment::variable_as_string(const std::string& name, std::string& out) const {
    const script::Namespace& globals = interp_.globals();
    script::Namespace::const_iterator it = globals.find(name);
    if (it == globals.end() || it->second.is_none()) return false;
    out = it->second.str();
    return true;
}

// ============================================================================
// ScriptHost
// ============================================================================

void SandboxEnvironment::write_output(const std::string& text) {
    size_t limit = options_.limits.max_output_chars;
    written_ += text.size();

    if (limit == 0 || kept_ + text.size() <= limit) {
        router_.write(text);
        kept_ += text.size();
        return;
    }
    if (kept_ < limit) {
        std::string head = truncate_safe(text, limit - kept_);
        router_.write(head);
        kept_ += head.size();
    }
}

std::string SandboxEnvironment::query_model(const std::string& prompt) {
    if (!model_query_) return "Error: Sub-LLM not available";

    OutputRouter::ScopedRedirect redirect(router_, OutputTarget::SECONDARY);
    try {
        return model_query_(prompt);
    } catch (const script::ScriptError&) {
        throw;
    } catch (const std::exception& e) {
        LOG_WARN("[Sandbox] llm_query callback failed: %s", e.what());
        throw script::ScriptError("RuntimeError", std::string("llm_query failed: ") + e.what());
    }
}

} // namespace gatedrepl
