/*
 * gatedrepl C++ - Script Values Implementation
 */
#include <gatedrepl/script/value.hpp>
#include <gatedrepl/script/errors.hpp>
#include <gatedrepl/script/interpreter.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <unordered_set>

namespace gatedrepl {
namespace script {

static const int kMaxReprDepth = 64;
static const int kMaxCompareDepth = 1000;

static void check_compare_depth(int depth) {
    if (depth > kMaxCompareDepth) {
        throw ScriptError("RecursionError", "maximum recursion depth exceeded in comparison");
    }
}

// ============================================================================
// Construction
// ============================================================================

Value::Value()
    : type_(ValueType::NONE)
    , b_(false)
    , i_(0)
    , f_(0.0)
{}

Value Value::none() {
    return Value();
}

Value Value::from_bool(bool b) {
    Value v;
    v.type_ = ValueType::BOOL;
    v.b_ = b;
    return v;
}

Value Value::from_int(int64_t i) {
    Value v;
    v.type_ = ValueType::INT;
    v.i_ = i;
    return v;
}

Value Value::from_float(double d) {
    Value v;
    v.type_ = ValueType::FLOAT;
    v.f_ = d;
    return v;
}

Value Value::from_string(const std::string& s) {
    Value v;
    v.type_ = ValueType::STR;
    v.str_ = std::make_shared<const std::string>(s);
    return v;
}

Value Value::new_list() {
    Value v;
    v.type_ = ValueType::LIST;
    v.obj_ = std::make_shared<ListObject>();
    return v;
}

Value Value::new_list(const std::vector<Value>& items) {
    Value v = new_list();
    v.list().items = items;
    return v;
}

Value Value::new_tuple(const std::vector<Value>& items) {
    Value v;
    v.type_ = ValueType::TUPLE;
    std::shared_ptr<ListObject> obj = std::make_shared<ListObject>();
    obj->items = items;
    obj->frozen = true;
    v.obj_ = obj;
    return v;
}

Value Value::new_dict() {
    Value v;
    v.type_ = ValueType::DICT;
    v.obj_ = std::make_shared<DictObject>();
    return v;
}

Value Value::new_set() {
    Value v;
    v.type_ = ValueType::SET;
    v.obj_ = std::make_shared<DictObject>();
    return v;
}

Value Value::new_builtin(const std::string& name, BuiltinFn fn, bool is_type, bool is_exception) {
    Value v;
    v.type_ = ValueType::BUILTIN;
    std::shared_ptr<BuiltinObject> obj = std::make_shared<BuiltinObject>();
    obj->name = name;
    obj->fn = fn;
    obj->is_type = is_type;
    obj->is_exception = is_exception;
    v.obj_ = obj;
    return v;
}

Value Value::new_module(const std::string& name) {
    Value v;
    v.type_ = ValueType::MODULE;
    std::shared_ptr<ModuleObject> obj = std::make_shared<ModuleObject>();
    obj->name = name;
    v.obj_ = obj;
    return v;
}

Value Value::new_exception(const std::string& type, const std::string& message) {
    Value v;
    v.type_ = ValueType::EXCEPTION;
    std::shared_ptr<ExceptionObject> obj = std::make_shared<ExceptionObject>();
    obj->type = type;
    obj->message = message;
    v.obj_ = obj;
    return v;
}

Value Value::new_function(const std::shared_ptr<FunctionObject>& fn) {
    Value v;
    v.type_ = ValueType::FUNCTION;
    v.obj_ = fn;
    return v;
}

Value Value::new_method(const Value& self, const std::string& name) {
    Value v;
    v.type_ = ValueType::METHOD;
    std::shared_ptr<MethodObject> obj = std::make_shared<MethodObject>();
    obj->self = self;
    obj->name = name;
    v.obj_ = obj;
    return v;
}

Value Value::new_range(int64_t start, int64_t stop, int64_t step) {
    Value v;
    v.type_ = ValueType::RANGE;
    std::shared_ptr<RangeObject> obj = std::make_shared<RangeObject>();
    obj->start = start;
    obj->stop = stop;
    obj->step = step;
    v.obj_ = obj;
    return v;
}

// ============================================================================
// Accessors
// ============================================================================

bool Value::is_callable() const {
    return type_ == ValueType::FUNCTION || type_ == ValueType::BUILTIN || type_ == ValueType::METHOD;
}

int64_t Value::as_int() const {
    if (type_ == ValueType::BOOL) return b_ ? 1 : 0;
    return i_;
}

double Value::as_float() const {
    if (type_ == ValueType::FLOAT) return f_;
    return static_cast<double>(as_int());
}

const std::string& Value::as_str() const {
    static const std::string empty;
    return str_ ? *str_ : empty;
}

ListObject& Value::list() const { return static_cast<ListObject&>(*obj_); }
DictObject& Value::dict() const { return static_cast<DictObject&>(*obj_); }
FunctionObject& Value::function() const { return static_cast<FunctionObject&>(*obj_); }
BuiltinObject& Value::builtin() const { return static_cast<BuiltinObject&>(*obj_); }
MethodObject& Value::method() const { return static_cast<MethodObject&>(*obj_); }
ModuleObject& Value::module() const { return static_cast<ModuleObject&>(*obj_); }
ExceptionObject& Value::exception() const { return static_cast<ExceptionObject&>(*obj_); }
RangeObject& Value::range() const { return static_cast<RangeObject&>(*obj_); }

bool Value::truthy() const {
    switch (type_) {
        case ValueType::NONE: return false;
        case ValueType::BOOL: return b_;
        case ValueType::INT: return i_ != 0;
        case ValueType::FLOAT: return f_ != 0.0;
        case ValueType::STR: return !as_str().empty();
        case ValueType::LIST:
        case ValueType::TUPLE: return !list().items.empty();
        case ValueType::DICT:
        case ValueType::SET: return dict().size() > 0;
        case ValueType::RANGE: return range().length() > 0;
        default: return true;
    }
}

std::string Value::type_name() const {
    switch (type_) {
        case ValueType::NONE: return "NoneType";
        case ValueType::BOOL: return "bool";
        case ValueType::INT: return "int";
        case ValueType::FLOAT: return "float";
        case ValueType::STR: return "str";
        case ValueType::LIST: return "list";
        case ValueType::TUPLE: return "tuple";
        case ValueType::DICT: return "dict";
        case ValueType::SET: return "set";
        case ValueType::FUNCTION: return "function";
        case ValueType::BUILTIN: return builtin().is_type ? "type" : "builtin_function_or_method";
        case ValueType::METHOD: return "method";
        case ValueType::MODULE: return "module";
        case ValueType::EXCEPTION: return exception().type;
        case ValueType::RANGE: return "range";
    }
    return "object";
}

// ============================================================================
// Rendering
// ============================================================================

std::string Value::repr() const {
    std::vector<const Object*> active;
    return repr_impl(0, active);
}

std::string Value::str() const {
    if (type_ == ValueType::STR) return as_str();
    if (type_ == ValueType::EXCEPTION) return exception().message;
    std::vector<const Object*> active;
    return repr_impl(0, active);
}

// Containers on the active path render as "[...]" / "{...}"
std::string Value::repr_impl(int depth, std::vector<const Object*>& active) const {
    if (depth > kMaxReprDepth) return "...";

    bool container = type_ == ValueType::LIST || type_ == ValueType::TUPLE ||
                     type_ == ValueType::DICT || type_ == ValueType::SET;
    if (container) {
        if (std::find(active.begin(), active.end(), obj_.get()) != active.end()) {
            if (type_ == ValueType::LIST) return "[...]";
            if (type_ == ValueType::TUPLE) return "(...)";
            return "{...}";
        }
        active.push_back(obj_.get());
    }
    std::string out = repr_body(depth, active);
    if (container) active.pop_back();
    return out;
}

std::string Value::repr_body(int depth, std::vector<const Object*>& active) const {
    switch (type_) {
        case ValueType::NONE: return "None";
        case ValueType::BOOL: return b_ ? "True" : "False";
        case ValueType::INT: return std::to_string(i_);
        case ValueType::FLOAT: return format_float_repr(f_);
        case ValueType::STR: return quote_string(as_str());
        case ValueType::LIST:
        case ValueType::TUPLE: {
            const std::vector<Value>& items = list().items;
            std::string out = type_ == ValueType::LIST ? "[" : "(";
            for (size_t i = 0; i < items.size(); ++i) {
                if (i > 0) out += ", ";
                out += items[i].repr_impl(depth + 1, active);
            }
            if (type_ == ValueType::TUPLE && items.size() == 1) out += ",";
            out += type_ == ValueType::LIST ? "]" : ")";
            return out;
        }
        case ValueType::DICT: {
            const DictObject& d = dict();
            std::string out = "{";
            for (size_t i = 0; i < d.entries.size(); ++i) {
                if (i > 0) out += ", ";
                out += d.entries[i].first.repr_impl(depth + 1, active);
                out += ": ";
                out += d.entries[i].second.repr_impl(depth + 1, active);
            }
            return out + "}";
        }
        case ValueType::SET: {
            const DictObject& d = dict();
            if (d.entries.empty()) return "set()";
            std::string out = "{";
            for (size_t i = 0; i < d.entries.size(); ++i) {
                if (i > 0) out += ", ";
                out += d.entries[i].first.repr_impl(depth + 1, active);
            }
            return out + "}";
        }
        case ValueType::FUNCTION:
            return "<function " + function().name + ">";
        case ValueType::BUILTIN:
            if (builtin().is_type) return "<class '" + builtin().name + "'>";
            return "<built-in function " + builtin().name + ">";
        case ValueType::METHOD:
            return "<built-in method " + method().name + " of " + method().self.type_name() + " object>";
        case ValueType::MODULE:
            return "<module '" + module().name + "'>";
        case ValueType::EXCEPTION:
            return exception().type + "(" + (exception().message.empty() ? "" : quote_string(exception().message)) + ")";
        case ValueType::RANGE: {
            const RangeObject& r = range();
            std::string out = "range(" + std::to_string(r.start) + ", " + std::to_string(r.stop);
            if (r.step != 1) out += ", " + std::to_string(r.step);
            return out + ")";
        }
    }
    return "<object>";
}

// ============================================================================
// Comparison and hashing
// ============================================================================

bool Value::equals(const Value& other) const {
    return equals_impl(other, 0);
}

bool Value::equals_impl(const Value& other, int depth) const {
    check_compare_depth(depth);
    if (is_number() && other.is_number()) {
        if (type_ != ValueType::FLOAT && other.type_ != ValueType::FLOAT) {
            return as_int() == other.as_int();
        }
        return as_float() == other.as_float();
    }
    if (type_ != other.type_) return false;

    switch (type_) {
        case ValueType::NONE: return true;
        case ValueType::STR: return as_str() == other.as_str();
        case ValueType::LIST:
        case ValueType::TUPLE: {
            if (obj_ == other.obj_) return true;
            const std::vector<Value>& a = list().items;
            const std::vector<Value>& b = other.list().items;
            if (a.size() != b.size()) return false;
            for (size_t i = 0; i < a.size(); ++i) {
                if (!a[i].equals_impl(b[i], depth + 1)) return false;
            }
            return true;
        }
        case ValueType::DICT:
        case ValueType::SET: {
            if (obj_ == other.obj_) return true;
            const DictObject& a = dict();
            const DictObject& b = other.dict();
            if (a.size() != b.size()) return false;
            for (size_t i = 0; i < a.entries.size(); ++i) {
                const Value* found = b.find(a.entries[i].first);
                if (!found) return false;
                if (type_ == ValueType::DICT && !a.entries[i].second.equals_impl(*found, depth + 1)) return false;
            }
            return true;
        }
        case ValueType::RANGE: {
            const RangeObject& a = range();
            const RangeObject& b = other.range();
            int64_t n = a.length();
            if (n != b.length()) return false;
            if (n == 0) return true;
            return a.start == b.start && (n == 1 || a.step == b.step);
        }
        case ValueType::EXCEPTION:
            return obj_ == other.obj_;
        default:
            return obj_ == other.obj_;
    }
}

bool Value::identical(const Value& other) const {
    if (type_ != other.type_) return false;
    switch (type_) {
        case ValueType::NONE: return true;
        case ValueType::BOOL: return b_ == other.b_;
        case ValueType::INT: return i_ == other.i_;
        case ValueType::FLOAT: return f_ == other.f_;
        case ValueType::STR: return str_ == other.str_ || as_str() == other.as_str();
        default: return obj_ == other.obj_;
    }
}

bool Value::hash_key(std::string& out) const {
    return hash_key_impl(out, 0);
}

bool Value::hash_key_impl(std::string& out, int depth) const {
    check_compare_depth(depth);
    switch (type_) {
        case ValueType::NONE:
            out = "n";
            return true;
        case ValueType::BOOL:
        case ValueType::INT:
            out = "i:" + std::to_string(as_int());
            return true;
        case ValueType::FLOAT: {
            double d = f_;
            if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 9.2e18) {
                out = "i:" + std::to_string(static_cast<int64_t>(d));
            } else {
                out = "f:" + format_float_repr(d);
            }
            return true;
        }
        case ValueType::STR:
            out = "s:" + as_str();
            return true;
        case ValueType::TUPLE: {
            std::string key = "t(";
            const std::vector<Value>& items = list().items;
            for (size_t i = 0; i < items.size(); ++i) {
                std::string part;
                if (!items[i].hash_key_impl(part, depth + 1)) return false;
                key += std::to_string(part.size()) + ":" + part;
            }
            out = key + ")";
            return true;
        }
        case ValueType::FUNCTION:
        case ValueType::BUILTIN:
        case ValueType::MODULE:
        case ValueType::EXCEPTION:
        case ValueType::RANGE:
            out = "o:" + std::to_string(identity());
            return true;
        default:
            return false;
    }
}

int64_t Value::identity() const {
    if (obj_) return static_cast<int64_t>(reinterpret_cast<intptr_t>(obj_.get()));
    if (str_) return static_cast<int64_t>(reinterpret_cast<intptr_t>(str_.get()));
    switch (type_) {
        case ValueType::NONE: return 1;
        case ValueType::BOOL: return b_ ? 3 : 2;
        case ValueType::INT: return i_ * 2 + 1;
        default: {
            int64_t bits;
            std::memcpy(&bits, &f_, sizeof(bits));
            return bits;
        }
    }
}

// ============================================================================
// Teardown
// ============================================================================

namespace {

// Objects waiting to be dropped; set while a release drains on this thread
thread_local std::vector<std::shared_ptr<Object> >* t_release_queue = nullptr;

} // namespace

void Value::release(std::vector<Value>& values) {
    std::vector<std::shared_ptr<Object> > queue;
    std::vector<std::shared_ptr<Object> >* target = t_release_queue ? t_release_queue : &queue;
    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i].obj_) target->push_back(std::move(values[i].obj_));
    }
    values.clear();

    // A nested destructor only queues; the outermost call drains
    if (target != &queue) return;
    t_release_queue = &queue;
    while (!queue.empty()) {
        std::shared_ptr<Object> obj = std::move(queue.back());
        queue.pop_back();
        obj.reset();
    }
    t_release_queue = nullptr;
}

void Value::break_cycles(const std::vector<Value>& roots) {
    std::vector<std::shared_ptr<Object> > found;
    std::vector<std::shared_ptr<Scope> > scopes;
    std::unordered_set<const void*> seen;

    std::vector<Value> pending(roots);
    while (!pending.empty()) {
        Value v = pending.back();
        pending.pop_back();
        if (!v.obj_ || !seen.insert(v.obj_.get()).second) continue;
        found.push_back(v.obj_);

        switch (v.type_) {
            case ValueType::LIST:
            case ValueType::TUPLE:
                pending.insert(pending.end(), v.list().items.begin(), v.list().items.end());
                break;
            case ValueType::DICT:
            case ValueType::SET:
                for (size_t i = 0; i < v.dict().entries.size(); ++i) {
                    pending.push_back(v.dict().entries[i].first);
                    pending.push_back(v.dict().entries[i].second);
                }
                break;
            case ValueType::FUNCTION: {
                FunctionObject& fn = v.function();
                pending.insert(pending.end(), fn.defaults.begin(), fn.defaults.end());
                for (std::shared_ptr<Scope> scope = fn.closure; scope; scope = scope->parent) {
                    if (!seen.insert(scope.get()).second) break;
                    scopes.push_back(scope);
                    for (std::unordered_map<std::string, Value>::const_iterator it = scope->vars.begin();
                         it != scope->vars.end(); ++it) {
                        pending.push_back(it->second);
                    }
                }
                break;
            }
            case ValueType::METHOD:
                pending.push_back(v.method().self);
                break;
            case ValueType::MODULE:
                for (std::map<std::string, Value>::const_iterator it = v.module().attrs.begin();
                     it != v.module().attrs.end(); ++it) {
                    pending.push_back(it->second);
                }
                break;
            default:
                break;
        }
    }

    // Children are dropped while every object is still held by found
    std::vector<Value> dropped;
    for (size_t i = 0; i < found.size(); ++i) {
        Object* obj = found[i].get();
        if (ListObject* list = dynamic_cast<ListObject*>(obj)) {
            dropped.insert(dropped.end(), list->items.begin(), list->items.end());
            list->items.clear();
        } else if (DictObject* dict = dynamic_cast<DictObject*>(obj)) {
            for (size_t j = 0; j < dict->entries.size(); ++j) {
                dropped.push_back(dict->entries[j].first);
                dropped.push_back(dict->entries[j].second);
            }
            dict->clear();
        } else if (FunctionObject* fn = dynamic_cast<FunctionObject*>(obj)) {
            dropped.insert(dropped.end(), fn->defaults.begin(), fn->defaults.end());
            fn->defaults.clear();
            fn->closure.reset();
        } else if (MethodObject* method = dynamic_cast<MethodObject*>(obj)) {
            dropped.push_back(method->self);
            method->self = Value();
        } else if (ModuleObject* module = dynamic_cast<ModuleObject*>(obj)) {
            module->attrs.clear();
        }
    }
    for (size_t i = 0; i < scopes.size(); ++i) {
        scopes[i]->vars.clear();
        scopes[i]->parent.reset();
    }
    release(dropped);
}

ListObject::~ListObject() {
    Value::release(items);
}

DictObject::~DictObject() {
    std::vector<Value> values;
    values.reserve(entries.size() * 2);
    for (size_t i = 0; i < entries.size(); ++i) {
        values.push_back(std::move(entries[i].first));
        values.push_back(std::move(entries[i].second));
    }
    entries.clear();
    Value::release(values);
}

int64_t RangeObject::length() const {
    if (step > 0 && start < stop) return (stop - start + step - 1) / step;
    if (step < 0 && start > stop) return (start - stop - step - 1) / (-step);
    return 0;
}

// ============================================================================
// DictObject
// ============================================================================

static std::string require_hash_key(const Value& key) {
    std::string k;
    if (!key.hash_key(k)) {
        throw ScriptError("TypeError", "unhashable type: '" + key.type_name() + "'");
    }
    return k;
}

const Value* DictObject::find(const Value& key) const {
    std::unordered_map<std::string, size_t>::const_iterator it = index.find(require_hash_key(key));
    if (it == index.end()) return nullptr;
    return &entries[it->second].second;
}

Value* DictObject::find(const Value& key) {
    std::unordered_map<std::string, size_t>::iterator it = index.find(require_hash_key(key));
    if (it == index.end()) return nullptr;
    return &entries[it->second].second;
}

void DictObject::set(const Value& key, const Value& value) {
    std::string k = require_hash_key(key);
    std::unordered_map<std::string, size_t>::iterator it = index.find(k);
    if (it != index.end()) {
        entries[it->second].second = value;
        return;
    }
    index[k] = entries.size();
    entries.push_back(std::make_pair(key, value));
}

bool DictObject::erase(const Value& key) {
    std::unordered_map<std::string, size_t>::iterator it = index.find(require_hash_key(key));
    if (it == index.end()) return false;

    size_t slot = it->second;
    index.erase(it);
    entries.erase(entries.begin() + static_cast<std::ptrdiff_t>(slot));
    for (std::unordered_map<std::string, size_t>::iterator j = index.begin(); j != index.end(); ++j) {
        if (j->second > slot) --j->second;
    }
    return true;
}

void DictObject::clear() {
    entries.clear();
    index.clear();
}

// ============================================================================
// Free helpers
// ============================================================================

std::string format_float_repr(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d < 0 ? "-inf" : "inf";
    if (d == 0.0) return std::signbit(d) ? "-0.0" : "0.0";

    // Shortest %e rendering that round-trips
    char buf[64];
    for (int precision = 1; precision <= 17; ++precision) {
        snprintf(buf, sizeof(buf), "%.*e", precision - 1, d);
        if (strtod(buf, nullptr) == d) break;
    }

    std::string s(buf);
    bool negative = s[0] == '-';
    if (negative) s = s.substr(1);

    size_t epos = s.find('e');
    std::string mantissa = s.substr(0, epos);
    int exponent = atoi(s.c_str() + epos + 1);

    std::string digits;
    for (size_t i = 0; i < mantissa.size(); ++i) {
        if (mantissa[i] != '.') digits += mantissa[i];
    }
    while (digits.size() > 1 && digits.back() == '0') digits.pop_back();

    std::string out;
    if (exponent >= -4 && exponent < 16) {
        if (exponent >= 0) {
            std::string int_part = digits.substr(0, std::min(digits.size(), static_cast<size_t>(exponent + 1)));
            while (int_part.size() < static_cast<size_t>(exponent + 1)) int_part += '0';
            std::string frac = digits.size() > static_cast<size_t>(exponent + 1) ? digits.substr(exponent + 1) : "0";
            out = int_part + "." + frac;
        } else {
            out = "0." + std::string(static_cast<size_t>(-exponent - 1), '0') + digits;
        }
    } else {
        out = digits.substr(0, 1);
        if (digits.size() > 1) out += "." + digits.substr(1);
        char exp_buf[16];
        snprintf(exp_buf, sizeof(exp_buf), "e%c%02d", exponent < 0 ? '-' : '+', exponent < 0 ? -exponent : exponent);
        out += exp_buf;
    }
    return negative ? "-" + out : out;
}

std::string quote_string(const std::string& s) {
    char quote = '\'';
    if (s.find('\'') != std::string::npos && s.find('"') == std::string::npos) {
        quote = '"';
    }

    std::string out(1, quote);
    for (size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c == static_cast<unsigned char>(quote)) {
                    out += '\\';
                    out += static_cast<char>(c);
                } else if (c < 0x20 || c == 0x7f) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\x%02x", c);
                    out += buf;
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    out += quote;
    return out;
}

static bool value_less_impl(const Value& a, const Value& b, int depth) {
    check_compare_depth(depth);
    if (a.is_number() && b.is_number()) {
        if (!a.is_float() && !b.is_float()) return a.as_int() < b.as_int();
        return a.as_float() < b.as_float();
    }
    if (a.is_str() && b.is_str()) {
        return a.as_str() < b.as_str();
    }
    if ((a.is_list() && b.is_list()) || (a.is_tuple() && b.is_tuple())) {
        const std::vector<Value>& x = a.list().items;
        const std::vector<Value>& y = b.list().items;
        size_t n = std::min(x.size(), y.size());
        for (size_t i = 0; i < n; ++i) {
            if (!x[i].equals(y[i])) return value_less_impl(x[i], y[i], depth + 1);
        }
        return x.size() < y.size();
    }
    if (a.is_set() && b.is_set()) {
        // Proper subset
        if (a.dict().size() >= b.dict().size()) return false;
        for (size_t i = 0; i < a.dict().entries.size(); ++i) {
            if (!b.dict().find(a.dict().entries[i].first)) return false;
        }
        return true;
    }
    throw ScriptError("TypeError", "'<' not supported between instances of '" +
                      a.type_name() + "' and '" + b.type_name() + "'");
}

bool value_less(const Value& a, const Value& b) {
    return value_less_impl(a, b, 0);
}

// ============================================================================
// UTF-8
// ============================================================================

namespace utf8 {

bool is_ascii(const std::string& s) {
    for (size_t i = 0; i < s.size(); ++i) {
        if (static_cast<unsigned char>(s[i]) >= 0x80) return false;
    }
    return true;
}

size_t length(const std::string& s) {
    size_t n = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) ++n;
    }
    return n;
}

std::vector<std::string> chars(const std::string& s) {
    std::vector<std::string> out;
    size_t i = 0;
    while (i < s.size()) {
        size_t start = i;
        ++i;
        while (i < s.size() && (static_cast<unsigned char>(s[i]) & 0xC0) == 0x80) ++i;
        out.push_back(s.substr(start, i - start));
    }
    return out;
}

size_t byte_offset(const std::string& s, size_t cp_index) {
    size_t count = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
            if (count == cp_index) return i;
            ++count;
        }
    }
    return s.size();
}

std::string encode(uint32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
}

uint32_t decode(const std::string& s, size_t& pos) {
    unsigned char c = static_cast<unsigned char>(s[pos]);
    uint32_t cp;
    int extra;
    if (c < 0x80) { cp = c; extra = 0; }
    else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; extra = 1; }
    else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; extra = 2; }
    else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; extra = 3; }
    else { ++pos; return 0xFFFD; }

    ++pos;
    for (int i = 0; i < extra; ++i) {
        if (pos >= s.size() || (static_cast<unsigned char>(s[pos]) & 0xC0) != 0x80) {
            return 0xFFFD;
        }
        cp = (cp << 6) | (static_cast<unsigned char>(s[pos]) & 0x3F);
        ++pos;
    }
    return cp;
}

} // namespace utf8

} // namespace script
} // namespace gatedrepl
