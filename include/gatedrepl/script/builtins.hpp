/*
 * gatedrepl C++ - Sandbox Capabilities and Builtins
 *
 * The sandbox symbol table is assembled from an explicit CapabilitySet.
 * Each group can be toggled independently; a name whose group is disabled
 * is simply absent (NameError), so the reachable surface can be audited by
 * listing the table.
 *
 * There is deliberately no group that provides eval/exec/compile/open or
 * any process, file or network primitive.
 */
#ifndef gatedrepl_SCRIPT_BUILTINS_HPP
#define gatedrepl_SCRIPT_BUILTINS_HPP

#include "value.hpp"
#include <gatedrepl/core/json.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace gatedrepl {
namespace script {

// ============================================================================
// Capabilities
// ============================================================================

enum class Capability : uint32_t {
    OUTPUT            = 1u << 0,    // print
    DATA_CONSTRUCTION = 1u << 1,    // str, int, float, bool, list, dict, tuple, set
    ITERATION         = 1u << 2,    // range, enumerate, zip, sorted, reversed, map, filter, any, all
    ARITHMETIC        = 1u << 3,    // min, max, sum, abs, round, pow, divmod
    STRINGS           = 1u << 4,    // chr, ord, hex, bin, oct, repr, format, ascii
    INTROSPECTION     = 1u << 5,    // len, type, isinstance, callable, hasattr, getattr, dir, id, hash
    EXCEPTIONS        = 1u << 6,    // exception constructors
    MODULES           = 1u << 7,    // import math / json / re
    CONTEXT           = 1u << 8,    // read-only context view
    MODEL_QUERY       = 1u << 9,    // llm_query
    FINAL_VAR         = 1u << 10    // FINAL_VAR
};

class CapabilitySet {
public:
    CapabilitySet() : bits_(0) {}

    static CapabilitySet all();
    static CapabilitySet none() { return CapabilitySet(); }

    CapabilitySet& enable(Capability c) { bits_ |= static_cast<uint32_t>(c); return *this; }
    CapabilitySet& disable(Capability c) { bits_ &= ~static_cast<uint32_t>(c); return *this; }
    bool has(Capability c) const { return (bits_ & static_cast<uint32_t>(c)) != 0; }
    uint32_t bits() const { return bits_; }

    // Names of the enabled groups ("OUTPUT", "ITERATION", ...)
    std::vector<std::string> names() const;

    // Group name (case-insensitive) to capability
    static bool parse(const std::string& name, Capability& out);
    static const char* name(Capability c);
    static const std::vector<Capability>& every();

private:
    uint32_t bits_;
};

// ============================================================================
// Symbol table
// ============================================================================

class SymbolTable {
public:
    void define(const std::string& name, const Value& value);
    void mark_disabled(const std::string& name, Capability group);

    const Value* find(const std::string& name) const;

    // True when name exists but its group is disabled; group receives the name
    bool is_disabled(const std::string& name, std::string& group) const;

    std::vector<std::string> names() const;
    size_t size() const { return symbols_.size(); }

private:
    std::map<std::string, Value> symbols_;
    std::map<std::string, Capability> disabled_;
};

SymbolTable build_symbol_table(const CapabilitySet& capabilities);

// Constructor shared by every exception class; the class name is args.name
Value construct_exception(Interpreter& interp, Args& args);

// Modules importable with the MODULES capability
const std::vector<std::string>& allowed_module_names();
bool create_module(const std::string& name, Value& out);

// ============================================================================
// Methods of builtin types
// ============================================================================

bool has_method(const Value& self, const std::string& name);
std::vector<std::string> method_names(const Value& self);
Value call_method(Interpreter& interp, const Value& self, const std::string& name, Args& args);

// Stable sort shared by sorted() and list.sort(); key may be None
std::vector<Value> sort_values(Interpreter& interp, const std::vector<Value>& items, const Value& key, bool reverse);

// ============================================================================
// Formatting
// ============================================================================

// format(value, spec) / f"{value:spec}"
std::string format_value(const Value& value, const std::string& spec);

// "...".format(*args, **kwargs)
std::string format_string(Interpreter& interp, const std::string& format, const Args& args);

// printf-style "%s" % args
std::string percent_format(Interpreter& interp, const std::string& format, const Value& args);

// ============================================================================
// JSON conversion
// ============================================================================

// False when the value (or a nested value) has no JSON form
bool value_to_json(const Value& value, Json& out);
Value value_from_json(const Json& json);

// Recursively mark lists and dicts read-only
void freeze(const Value& value);

} // namespace script
} // namespace gatedrepl

#endif // gatedrepl_SCRIPT_BUILTINS_HPP
