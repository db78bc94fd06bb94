/*
 * gatedrepl C++ - Script Errors
 *
 * Language-level exceptions raised while lexing, parsing or evaluating
 * sandboxed code. A ScriptError carries the script-visible exception type
 * ("TypeError", "SyntaxError", ...) and message; scripts can catch it with
 * try/except unless it is fatal (budget exhaustion, cancellation).
 */
#ifndef gatedrepl_SCRIPT_ERRORS_HPP
#define gatedrepl_SCRIPT_ERRORS_HPP

#include "value.hpp"
#include <stdexcept>
#include <string>

namespace gatedrepl {
namespace script {

class ScriptError : public std::runtime_error {
public:
    ScriptError(const std::string& type, const std::string& message, int line = 0, bool fatal = false);

    // Re-raise an exception value produced by script code ("raise e")
    explicit ScriptError(const Value& exception, int line = 0);

    const std::string& type() const { return type_; }
    const std::string& message() const { return message_; }
    int line() const { return line_; }
    void set_line(int line) { line_ = line; }

    // Fatal errors bypass except clauses
    bool fatal() const { return fatal_; }

    // "TypeError: message" (with " (line N)" when known)
    std::string describe() const;

    // Exception value bound by "except X as e"
    Value to_value() const;

private:
    std::string type_;
    std::string message_;
    int line_;
    bool fatal_;
};

// Hierarchy check used by except clauses: KeyError is a LookupError, every
// error is an Exception.
bool exception_matches(const std::string& raised_type, const std::string& handler_type);

// Known exception class names (constructors exposed to scripts)
const std::vector<std::string>& exception_type_names();

} // namespace script
} // namespace gatedrepl

#endif // gatedrepl_SCRIPT_ERRORS_HPP
