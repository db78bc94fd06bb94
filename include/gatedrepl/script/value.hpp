/*
 * gatedrepl C++ - Script Values
 *
 * Dynamically typed values of the sandbox scripting language. Scalars are
 * stored inline; strings share an immutable buffer; containers and
 * callables live behind shared_ptr so that aliasing behaves like the
 * reference semantics scripts expect ("b = a; b.append(1)" mutates a).
 *
 * All values reachable from a session namespace are owned by that session.
 * Nothing here refers back to host objects; host services are reached
 * through the ScriptHost passed to the interpreter.
 */
#ifndef gatedrepl_SCRIPT_VALUE_HPP
#define gatedrepl_SCRIPT_VALUE_HPP

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <utility>
#include <unordered_map>
#include <cstdint>

namespace gatedrepl {
namespace script {

class Interpreter;
class Scope;
struct FunctionDef;
struct Args;
class Value;

enum class ValueType {
    NONE,
    BOOL,
    INT,
    FLOAT,
    STR,
    LIST,
    TUPLE,
    DICT,
    SET,
    FUNCTION,
    BUILTIN,
    METHOD,
    MODULE,
    EXCEPTION,
    RANGE
};

// Native function signature. Builtins receive the interpreter explicitly so
// they can call back into script code (sorted(key=...)) and reach host
// services without capturing anything.
typedef Value (*BuiltinFn)(Interpreter& interp, Args& args);

struct Object;
struct ListObject;
struct DictObject;
struct FunctionObject;
struct BuiltinObject;
struct MethodObject;
struct ModuleObject;
struct ExceptionObject;
struct RangeObject;

// ============================================================================
// Value
// ============================================================================

class Value {
public:
    Value();

    static Value none();
    static Value from_bool(bool b);
    static Value from_int(int64_t i);
    static Value from_float(double d);
    static Value from_string(const std::string& s);
    static Value new_list();
    static Value new_list(const std::vector<Value>& items);
    static Value new_tuple(const std::vector<Value>& items);
    static Value new_dict();
    static Value new_set();
    static Value new_builtin(const std::string& name, BuiltinFn fn, bool is_type = false, bool is_exception = false);
    static Value new_module(const std::string& name);
    static Value new_exception(const std::string& type, const std::string& message);
    static Value new_function(const std::shared_ptr<FunctionObject>& fn);
    static Value new_method(const Value& self, const std::string& name);
    static Value new_range(int64_t start, int64_t stop, int64_t step);

    ValueType type() const { return type_; }
    bool is_none() const { return type_ == ValueType::NONE; }
    bool is_bool() const { return type_ == ValueType::BOOL; }
    bool is_int() const { return type_ == ValueType::INT; }
    bool is_float() const { return type_ == ValueType::FLOAT; }
    bool is_number() const { return type_ == ValueType::INT || type_ == ValueType::FLOAT || type_ == ValueType::BOOL; }
    bool is_str() const { return type_ == ValueType::STR; }
    bool is_list() const { return type_ == ValueType::LIST; }
    bool is_tuple() const { return type_ == ValueType::TUPLE; }
    bool is_dict() const { return type_ == ValueType::DICT; }
    bool is_set() const { return type_ == ValueType::SET; }
    bool is_range() const { return type_ == ValueType::RANGE; }
    bool is_exception() const { return type_ == ValueType::EXCEPTION; }
    bool is_callable() const;

    bool as_bool() const { return b_; }
    int64_t as_int() const;         // BOOL and INT
    double as_float() const;        // BOOL, INT and FLOAT
    const std::string& as_str() const;

    ListObject& list() const;       // LIST or TUPLE
    DictObject& dict() const;       // DICT or SET
    FunctionObject& function() const;
    BuiltinObject& builtin() const;
    MethodObject& method() const;
    ModuleObject& module() const;
    ExceptionObject& exception() const;
    RangeObject& range() const;

    // Python truthiness
    bool truthy() const;

    // Type name as scripts see it ("int", "str", "NoneType", ...)
    std::string type_name() const;

    // repr() and str() renderings
    std::string repr() const;
    std::string str() const;

    // Deep equality (==). 1 == 1.0 == True.
    bool equals(const Value& other) const;

    // Object identity (is)
    bool identical(const Value& other) const;

    // Stable hash key; false when the value is unhashable
    bool hash_key(std::string& out) const;

    // Identity token for id()
    int64_t identity() const;

    // Drops the values without recursing through nested containers, so a
    // deeply nested list is freed on a bounded stack.
    static void release(std::vector<Value>& values);

    // Empties every container and closure reachable from roots. Breaks
    // reference cycles ("a.append(a)") of a namespace being torn down.
    static void break_cycles(const std::vector<Value>& roots);

private:
    ValueType type_;
    bool b_;
    int64_t i_;
    double f_;
    std::shared_ptr<const std::string> str_;
    std::shared_ptr<Object> obj_;

    std::string repr_impl(int depth, std::vector<const Object*>& active) const;
    std::string repr_body(int depth, std::vector<const Object*>& active) const;
    bool equals_impl(const Value& other, int depth) const;
    bool hash_key_impl(std::string& out, int depth) const;
};

// ============================================================================
// Heap objects
// ============================================================================

struct Object {
    virtual ~Object() {}
};

// Backing store for LIST and TUPLE
struct ListObject : public Object {
    std::vector<Value> items;
    bool frozen;    // read-only (context view)

    ListObject() : frozen(false) {}
    ~ListObject() override;
};

// Insertion-ordered hash map; also backs SET (values unused)
struct DictObject : public Object {
    std::vector<std::pair<Value, Value> > entries;
    std::unordered_map<std::string, size_t> index;   // hash key -> entries slot
    bool frozen;

    DictObject() : frozen(false) {}
    ~DictObject() override;

    // Returns nullptr when absent. Throws TypeError for unhashable keys.
    const Value* find(const Value& key) const;
    Value* find(const Value& key);
    void set(const Value& key, const Value& value);
    bool erase(const Value& key);
    void clear();
    size_t size() const { return entries.size(); }
};

struct FunctionObject : public Object {
    std::string name;
    std::shared_ptr<const FunctionDef> def;
    std::vector<Value> defaults;        // evaluated at definition time
    std::shared_ptr<Scope> closure;     // enclosing function scope, null at top level
};

struct BuiltinObject : public Object {
    std::string name;
    BuiltinFn fn;
    bool is_type;           // int, str, list... (repr "<class 'int'>")
    bool is_exception;      // ValueError, KeyError... usable in except clauses

    BuiltinObject() : fn(nullptr), is_type(false), is_exception(false) {}
};

// Method bound to a receiver: "abc".upper, items.append
struct MethodObject : public Object {
    Value self;
    std::string name;
};

struct ModuleObject : public Object {
    std::string name;
    std::map<std::string, Value> attrs;
};

struct ExceptionObject : public Object {
    std::string type;
    std::string message;
};

// Lazy integer sequence; materialized only by list()/tuple()
struct RangeObject : public Object {
    int64_t start;
    int64_t stop;
    int64_t step;

    RangeObject() : start(0), stop(0), step(1) {}

    int64_t length() const;
    int64_t at(int64_t index) const { return start + index * step; }
};

// Shortest round-trip float rendering ("0.1", "1e+16", "3.0")
std::string format_float_repr(double d);

// String literal rendering with Python quoting rules
std::string quote_string(const std::string& s);

// Ordering used by sorted()/min()/max()/comparisons. Throws TypeError when
// the operands are not comparable.
bool value_less(const Value& a, const Value& b);

// ============================================================================
// UTF-8 aware string helpers (indexes count code points)
// ============================================================================

namespace utf8 {

bool is_ascii(const std::string& s);
size_t length(const std::string& s);
std::vector<std::string> chars(const std::string& s);
// Byte offset of code point index (index may equal length)
size_t byte_offset(const std::string& s, size_t cp_index);
std::string encode(uint32_t code_point);
// Decode the code point at byte offset pos; advances pos
uint32_t decode(const std::string& s, size_t& pos);

} // namespace utf8

} // namespace script
} // namespace gatedrepl

#endif // gatedrepl_SCRIPT_VALUE_HPP
