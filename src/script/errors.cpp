/*
 * gatedrepl C++ - Script Errors Implementation
 */
#include <gatedrepl/script/errors.hpp>

#include <map>

namespace gatedrepl {
namespace script {

ScriptError::ScriptError(const std::string& type, const std::string& message, int line, bool fatal)
    : std::runtime_error(type + ": " + message)
    , type_(type)
    , message_(message)
    , line_(line)
    , fatal_(fatal)
{}

ScriptError::ScriptError(const Value& exception, int line)
    : std::runtime_error(exception.exception().type + ": " + exception.exception().message)
    , type_(exception.exception().type)
    , message_(exception.exception().message)
    , line_(line)
    , fatal_(false)
{}

std::string ScriptError::describe() const {
    std::string out = type_;
    if (!message_.empty()) out += ": " + message_;
    if (line_ > 0) out += " (line " + std::to_string(line_) + ")";
    return out;
}

Value ScriptError::to_value() const {
    return Value::new_exception(type_, message_);
}

// child -> parent; anything not listed derives directly from Exception
static const std::map<std::string, std::string>& exception_parents() {
    static const std::map<std::string, std::string> parents = {
        {"KeyError", "LookupError"},
        {"IndexError", "LookupError"},
        {"ZeroDivisionError", "ArithmeticError"},
        {"OverflowError", "ArithmeticError"},
        {"RecursionError", "RuntimeError"},
        {"NotImplementedError", "RuntimeError"},
        {"UnboundLocalError", "NameError"},
        {"ModuleNotFoundError", "ImportError"},
        {"IndentationError", "SyntaxError"},
        {"JSONDecodeError", "ValueError"},
    };
    return parents;
}

bool exception_matches(const std::string& raised_type, const std::string& handler_type) {
    if (handler_type == "Exception" || handler_type == "BaseException") {
        return true;
    }
    const std::map<std::string, std::string>& parents = exception_parents();
    std::string current = raised_type;
    for (int guard = 0; guard < 8; ++guard) {
        if (current == handler_type) return true;
        std::map<std::string, std::string>::const_iterator it = parents.find(current);
        if (it == parents.end()) return false;
        current = it->second;
    }
    return false;
}

const std::vector<std::string>& exception_type_names() {
    static const std::vector<std::string> names = {
        "BaseException", "Exception",
        "ValueError", "TypeError", "NameError", "UnboundLocalError",
        "AttributeError", "LookupError", "KeyError", "IndexError",
        "ArithmeticError", "ZeroDivisionError", "OverflowError",
        "ImportError", "ModuleNotFoundError",
        "RuntimeError", "RecursionError", "NotImplementedError",
        "AssertionError", "StopIteration", "TimeoutError", "SyntaxError",
        "MemoryError", "JSONDecodeError",
    };
    return names;
}

} // namespace script
} // namespace gatedrepl
