/*
 * gatedrepl C++ - Sandbox Builtins Implementation
 *
 * Capability groups, the symbol table and the builtin functions that make
 * up the reachable surface of the sandbox.
 */
#include <gatedrepl/script/builtins.hpp>
#include <gatedrepl/script/interpreter.hpp>
#include <gatedrepl/core/utils.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <functional>

namespace gatedrepl {
namespace script {

// ============================================================================
// CapabilitySet
// ============================================================================

const std::vector<Capability>& CapabilitySet::every() {
    static const std::vector<Capability> all_groups = {
        Capability::OUTPUT, Capability::DATA_CONSTRUCTION, Capability::ITERATION,
        Capability::ARITHMETIC, Capability::STRINGS, Capability::INTROSPECTION,
        Capability::EXCEPTIONS, Capability::MODULES, Capability::CONTEXT,
        Capability::MODEL_QUERY, Capability::FINAL_VAR
    };
    return all_groups;
}

CapabilitySet CapabilitySet::all() {
    CapabilitySet set;
    const std::vector<Capability>& groups = every();
    for (size_t i = 0; i < groups.size(); ++i) set.enable(groups[i]);
    return set;
}

const char* CapabilitySet::name(Capability c) {
    switch (c) {
        case Capability::OUTPUT: return "OUTPUT";
        case Capability::DATA_CONSTRUCTION: return "DATA_CONSTRUCTION";
        case Capability::ITERATION: return "ITERATION";
        case Capability::ARITHMETIC: return "ARITHMETIC";
        case Capability::STRINGS: return "STRINGS";
        case Capability::INTROSPECTION: return "INTROSPECTION";
        case Capability::EXCEPTIONS: return "EXCEPTIONS";
        case Capability::MODULES: return "MODULES";
        case Capability::CONTEXT: return "CONTEXT";
        case Capability::MODEL_QUERY: return "MODEL_QUERY";
        case Capability::FINAL_VAR: return "FINAL_VAR";
    }
    return "UNKNOWN";
}

bool CapabilitySet::parse(const std::string& text, Capability& out) {
    std::string upper = text;
    for (size_t i = 0; i < upper.size(); ++i) {
        upper[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(upper[i])));
    }
    const std::vector<Capability>& groups = every();
    for (size_t i = 0; i < groups.size(); ++i) {
        if (upper == name(groups[i])) {
            out = groups[i];
            return true;
        }
    }
    return false;
}

std::vector<std::string> CapabilitySet::names() const {
    std::vector<std::string> out;
    const std::vector<Capability>& groups = every();
    for (size_t i = 0; i < groups.size(); ++i) {
        if (has(groups[i])) out.push_back(name(groups[i]));
    }
    return out;
}

// ============================================================================
// SymbolTable
// ============================================================================

void SymbolTable::define(const std::string& name, const Value& value) {
    symbols_[name] = value;
    disabled_.erase(name);
}

void SymbolTable::mark_disabled(const std::string& name, Capability group) {
    disabled_[name] = group;
}

const Value* SymbolTable::find(const std::string& name) const {
    std::map<std::string, Value>::const_iterator it = symbols_.find(name);
    if (it == symbols_.end()) return nullptr;
    return &it->second;
}

bool SymbolTable::is_disabled(const std::string& name, std::string& group) const {
    std::map<std::string, Capability>::const_iterator it = disabled_.find(name);
    if (it == disabled_.end()) return false;
    group = CapabilitySet::name(it->second);
    return true;
}

std::vector<std::string> SymbolTable::names() const {
    std::vector<std::string> out;
    for (std::map<std::string, Value>::const_iterator it = symbols_.begin(); it != symbols_.end(); ++it) {
        out.push_back(it->first);
    }
    return out;
}

// ============================================================================
// Argument helpers
// ============================================================================

static void allow_keywords(const Args& args, const char* const* allowed) {
    for (size_t i = 0; i < args.keywords.size(); ++i) {
        bool ok = false;
        for (const char* const* a = allowed; *a; ++a) {
            if (args.keywords[i].first == *a) {
                ok = true;
                break;
            }
        }
        if (!ok) {
            throw ScriptError("TypeError", "'" + args.keywords[i].first + "' is an invalid keyword argument for " +
                              args.name + "()");
        }
    }
}

static Value keyword_or(const Args& args, const char* key, const Value& fallback) {
    const Value* v = args.keyword(key);
    return v ? *v : fallback;
}

static const std::string& expect_str(const Value& v, const std::string& what) {
    if (!v.is_str()) {
        throw ScriptError("TypeError", what + " must be str, not " + v.type_name());
    }
    return v.as_str();
}

// ============================================================================
// OUTPUT
// ============================================================================

static Value builtin_print(Interpreter& interp, Args& args) {
    static const char* const allowed[] = {"sep", "end", "flush", NULL};
    allow_keywords(args, allowed);

    Value sep = keyword_or(args, "sep", Value::none());
    Value end = keyword_or(args, "end", Value::none());
    std::string sep_text = sep.is_none() ? " " : expect_str(sep, "sep");
    std::string end_text = end.is_none() ? "\n" : expect_str(end, "end");

    std::string line;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) line += sep_text;
        line += args[i].str();
    }
    line += end_text;
    interp.write(line);
    return Value::none();
}

// ============================================================================
// DATA_CONSTRUCTION
// ============================================================================

static bool parse_int_text(const std::string& raw, int base, int64_t& out) {
    std::string s = trim(raw);
    if (s.empty()) return false;

    size_t i = 0;
    bool negative = false;
    if (s[i] == '+' || s[i] == '-') {
        negative = s[i] == '-';
        ++i;
    }

    if (i + 1 < s.size() && s[i] == '0') {
        char p = static_cast<char>(std::tolower(static_cast<unsigned char>(s[i + 1])));
        int prefixed = p == 'x' ? 16 : (p == 'o' ? 8 : (p == 'b' ? 2 : 0));
        if (prefixed && (base == 0 || base == prefixed)) {
            base = prefixed;
            i += 2;
            if (i < s.size() && s[i] == '_') ++i;
        }
    }
    if (base == 0) {
        base = 10;
        // "010" is not a valid base-0 literal
        if (s.size() - i > 1 && s[i] == '0' && s.find_first_not_of("0_", i) != std::string::npos) return false;
    }

    uint64_t limit = negative ? static_cast<uint64_t>(INT64_MAX) + 1 : static_cast<uint64_t>(INT64_MAX);
    uint64_t value = 0;
    bool any = false;
    bool last_underscore = false;
    for (; i < s.size(); ++i) {
        char c = s[i];
        if (c == '_') {
            if (!any || last_underscore) return false;
            last_underscore = true;
            continue;
        }
        int digit;
        if (c >= '0' && c <= '9') digit = c - '0';
        else if (c >= 'a' && c <= 'z') digit = c - 'a' + 10;
        else if (c >= 'A' && c <= 'Z') digit = c - 'A' + 10;
        else return false;
        if (digit >= base) return false;

        if (value > (limit - static_cast<uint64_t>(digit)) / static_cast<uint64_t>(base)) {
            throw ScriptError("OverflowError", "int too large to convert: '" + raw + "'");
        }
        value = value * static_cast<uint64_t>(base) + static_cast<uint64_t>(digit);
        any = true;
        last_underscore = false;
    }
    if (!any || last_underscore) return false;

    if (negative) {
        out = value == static_cast<uint64_t>(INT64_MAX) + 1 ? INT64_MIN : -static_cast<int64_t>(value);
    } else {
        out = static_cast<int64_t>(value);
    }
    return true;
}

static int64_t float_to_int(double d) {
    if (std::isnan(d)) throw ScriptError("ValueError", "cannot convert float NaN to integer");
    if (std::isinf(d)) throw ScriptError("OverflowError", "cannot convert float infinity to integer");
    double t = std::trunc(d);
    if (t >= 9223372036854775808.0 || t < -9223372036854775808.0) {
        throw ScriptError("OverflowError", "float too large to convert to integer");
    }
    return static_cast<int64_t>(t);
}

static Value builtin_int(Interpreter&, Args& args) {
    static const char* const allowed[] = {"base", NULL};
    allow_keywords(args, allowed);
    require_args(args, 0, 2);

    const Value* base_kw = args.keyword("base");
    if (args.size() == 0) {
        if (base_kw) throw ScriptError("TypeError", "int() missing string argument");
        return Value::from_int(0);
    }

    const Value& x = args[0];
    bool explicit_base = args.size() == 2 || base_kw;
    if (!explicit_base) {
        if (x.is_int() || x.is_bool()) return Value::from_int(x.as_int());
        if (x.is_float()) return Value::from_int(float_to_int(x.as_float()));
    }
    if (!x.is_str()) {
        if (explicit_base) throw ScriptError("TypeError", "int() can't convert non-string with explicit base");
        throw ScriptError("TypeError", "int() argument must be a string or a number, not '" + x.type_name() + "'");
    }

    int64_t base = 10;
    if (args.size() == 2) base = expect_int(args[1], "base");
    else if (base_kw) base = expect_int(*base_kw, "base");
    if (base != 0 && (base < 2 || base > 36)) {
        throw ScriptError("ValueError", "int() base must be >= 2 and <= 36, or 0");
    }

    int64_t out;
    if (!parse_int_text(x.as_str(), static_cast<int>(base), out)) {
        throw ScriptError("ValueError", "invalid literal for int() with base " + std::to_string(base) + ": " +
                          quote_string(x.as_str()));
    }
    return Value::from_int(out);
}

static Value builtin_float(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 0, 1);
    if (args.size() == 0) return Value::from_float(0.0);

    const Value& x = args[0];
    if (x.is_number()) return Value::from_float(x.as_float());
    if (!x.is_str()) {
        throw ScriptError("TypeError", "float() argument must be a string or a real number, not '" + x.type_name() + "'");
    }

    std::string s = to_lower(trim(x.as_str()));
    std::string body = s;
    bool negative = false;
    if (!body.empty() && (body[0] == '+' || body[0] == '-')) {
        negative = body[0] == '-';
        body = body.substr(1);
    }
    if (body == "inf" || body == "infinity") return Value::from_float(negative ? -HUGE_VAL : HUGE_VAL);
    if (body == "nan") return Value::from_float(std::nan(""));

    std::string digits;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '_') digits += s[i];
    }
    bool valid = !digits.empty() && digits.find_first_not_of("0123456789+-.e") == std::string::npos;
    if (valid) {
        char* end = nullptr;
        double d = strtod(digits.c_str(), &end);
        if (end && *end == '\0') return Value::from_float(d);
    }
    throw ScriptError("ValueError", "could not convert string to float: " + quote_string(x.as_str()));
}

static Value builtin_str(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 0, 1);
    if (args.size() == 0) return Value::from_string("");
    return Value::from_string(args[0].str());
}

static Value builtin_bool(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 0, 1);
    return Value::from_bool(args.size() == 1 && args[0].truthy());
}

static Value builtin_list(Interpreter& interp, Args& args) {
    reject_keywords(args);
    require_args(args, 0, 1);
    if (args.size() == 0) return Value::new_list();
    return Value::new_list(interp.to_vector(args[0]));
}

static Value builtin_tuple(Interpreter& interp, Args& args) {
    reject_keywords(args);
    require_args(args, 0, 1);
    if (args.size() == 0) return Value::new_tuple(std::vector<Value>());
    if (args[0].is_tuple()) return args[0];
    return Value::new_tuple(interp.to_vector(args[0]));
}

static Value builtin_set(Interpreter& interp, Args& args) {
    reject_keywords(args);
    require_args(args, 0, 1);
    Value set = Value::new_set();
    if (args.size() == 1) {
        interp.iterate(args[0], [&](const Value& item) -> bool {
            set.dict().set(item, Value::none());
            return true;
        });
    }
    return set;
}

static Value builtin_dict(Interpreter& interp, Args& args) {
    require_args(args, 0, 1);
    Value dict = Value::new_dict();

    if (args.size() == 1) {
        const Value& src = args[0];
        if (src.is_dict()) {
            const std::vector<std::pair<Value, Value> >& entries = src.dict().entries;
            for (size_t i = 0; i < entries.size(); ++i) dict.dict().set(entries[i].first, entries[i].second);
        } else {
            size_t index = 0;
            interp.iterate(src, [&](const Value& item) -> bool {
                std::vector<Value> pair = interp.to_vector(item);
                if (pair.size() != 2) {
                    throw ScriptError("ValueError", "dictionary update sequence element #" + std::to_string(index) +
                                      " has length " + std::to_string(pair.size()) + "; 2 is required");
                }
                dict.dict().set(pair[0], pair[1]);
                ++index;
                return true;
            });
        }
    }
    for (size_t i = 0; i < args.keywords.size(); ++i) {
        dict.dict().set(Value::from_string(args.keywords[i].first), args.keywords[i].second);
    }
    return dict;
}

// ============================================================================
// ITERATION
// ============================================================================

static Value builtin_range(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 3);

    int64_t start = 0, stop, step = 1;
    if (args.size() == 1) {
        stop = expect_int(args[0], "range() argument");
    } else {
        start = expect_int(args[0], "range() argument");
        stop = expect_int(args[1], "range() argument");
        if (args.size() == 3) step = expect_int(args[2], "range() argument");
    }
    if (step == 0) throw ScriptError("ValueError", "range() arg 3 must not be zero");

    // Lazy; only materialization is bounded by the sequence limit
    return Value::new_range(start, stop, step);
}

static Value builtin_enumerate(Interpreter& interp, Args& args) {
    static const char* const allowed[] = {"start", NULL};
    allow_keywords(args, allowed);
    require_args(args, 1, 2);

    int64_t index = 0;
    if (args.size() == 2) index = expect_int(args[1], "start");
    else if (args.keyword("start")) index = expect_int(*args.keyword("start"), "start");

    std::vector<Value> out;
    interp.iterate(args[0], [&](const Value& item) -> bool {
        std::vector<Value> pair;
        pair.push_back(Value::from_int(index++));
        pair.push_back(item);
        out.push_back(Value::new_tuple(pair));
        interp.check_sequence_length(static_cast<int64_t>(out.size()));
        return true;
    });
    return Value::new_list(out);
}

static Value builtin_zip(Interpreter& interp, Args& args) {
    reject_keywords(args);
    std::vector<std::vector<Value> > columns;
    size_t shortest = 0;
    for (size_t i = 0; i < args.size(); ++i) {
        columns.push_back(interp.to_vector(args[i]));
        shortest = i == 0 ? columns.back().size() : std::min(shortest, columns.back().size());
    }

    std::vector<Value> out;
    for (size_t row = 0; row < shortest; ++row) {
        std::vector<Value> tuple;
        for (size_t c = 0; c < columns.size(); ++c) tuple.push_back(columns[c][row]);
        out.push_back(Value::new_tuple(tuple));
    }
    return Value::new_list(out);
}

// Decorate-sort-undecorate; stable, so reverse keeps equal items in order
std::vector<Value> sort_values(Interpreter& interp, const std::vector<Value>& items, const Value& key,
                                      bool reverse) {
    std::vector<std::pair<Value, size_t> > keyed;
    keyed.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        keyed.push_back(std::make_pair(key.is_none() ? items[i] : interp.call1(key, items[i]), i));
    }

    std::stable_sort(keyed.begin(), keyed.end(),
                     [&](const std::pair<Value, size_t>& a, const std::pair<Value, size_t>& b) {
                         interp.tick();
                         return reverse ? value_less(b.first, a.first) : value_less(a.first, b.first);
                     });

    std::vector<Value> out;
    out.reserve(items.size());
    for (size_t i = 0; i < keyed.size(); ++i) out.push_back(items[keyed[i].second]);
    return out;
}

static Value builtin_sorted(Interpreter& interp, Args& args) {
    static const char* const allowed[] = {"key", "reverse", NULL};
    allow_keywords(args, allowed);
    require_args(args, 1, 1);

    Value key = keyword_or(args, "key", Value::none());
    bool reverse = keyword_or(args, "reverse", Value::from_bool(false)).truthy();
    return Value::new_list(sort_values(interp, interp.to_vector(args[0]), key, reverse));
}

static Value builtin_reversed(Interpreter& interp, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    const Value& seq = args[0];
    if (!(seq.is_list() || seq.is_tuple() || seq.is_str() || seq.is_range() || seq.is_dict())) {
        throw ScriptError("TypeError", "'" + seq.type_name() + "' object is not reversible");
    }
    std::vector<Value> items = interp.to_vector(seq);
    std::reverse(items.begin(), items.end());
    return Value::new_list(items);
}

static Value builtin_map(Interpreter& interp, Args& args) {
    reject_keywords(args);
    if (args.size() < 2) throw ScriptError("TypeError", "map() must have at least two arguments.");

    std::vector<std::vector<Value> > columns;
    size_t shortest = 0;
    for (size_t i = 1; i < args.size(); ++i) {
        columns.push_back(interp.to_vector(args[i]));
        shortest = i == 1 ? columns.back().size() : std::min(shortest, columns.back().size());
    }

    std::vector<Value> out;
    out.reserve(shortest);
    for (size_t row = 0; row < shortest; ++row) {
        Args call_args;
        for (size_t c = 0; c < columns.size(); ++c) call_args.positional.push_back(columns[c][row]);
        out.push_back(interp.call(args[0], call_args));
    }
    return Value::new_list(out);
}

static Value builtin_filter(Interpreter& interp, Args& args) {
    reject_keywords(args);
    require_args(args, 2, 2);

    Value fn = args[0];
    std::vector<Value> out;
    interp.iterate(args[1], [&](const Value& item) -> bool {
        bool keep = fn.is_none() ? item.truthy() : interp.call1(fn, item).truthy();
        if (keep) out.push_back(item);
        return true;
    });
    return Value::new_list(out);
}

static Value builtin_any(Interpreter& interp, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    bool found = false;
    interp.iterate(args[0], [&](const Value& item) -> bool {
        found = item.truthy();
        return !found;
    });
    return Value::from_bool(found);
}

static Value builtin_all(Interpreter& interp, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    bool every = true;
    interp.iterate(args[0], [&](const Value& item) -> bool {
        every = item.truthy();
        return every;
    });
    return Value::from_bool(every);
}

// ============================================================================
// ARITHMETIC
// ============================================================================

static Value min_max(Interpreter& interp, Args& args, bool want_max) {
    static const char* const allowed[] = {"key", "default", NULL};
    allow_keywords(args, allowed);
    if (args.size() == 0) {
        throw ScriptError("TypeError", args.name + " expected at least 1 argument, got 0");
    }

    std::vector<Value> items;
    if (args.size() == 1) {
        items = interp.to_vector(args[0]);
    } else {
        if (args.keyword("default")) {
            throw ScriptError("TypeError", "Cannot specify a default for " + args.name + "() with multiple positional arguments");
        }
        items = args.positional;
    }
    if (items.empty()) {
        const Value* fallback = args.keyword("default");
        if (fallback) return *fallback;
        throw ScriptError("ValueError", args.name + "() arg is an empty sequence");
    }

    Value key = keyword_or(args, "key", Value::none());
    size_t best = 0;
    Value best_key = key.is_none() ? items[0] : interp.call1(key, items[0]);
    for (size_t i = 1; i < items.size(); ++i) {
        Value k = key.is_none() ? items[i] : interp.call1(key, items[i]);
        bool better = want_max ? value_less(best_key, k) : value_less(k, best_key);
        if (better) {
            best = i;
            best_key = k;
        }
    }
    return items[best];
}

static Value builtin_min(Interpreter& interp, Args& args) { return min_max(interp, args, false); }
static Value builtin_max(Interpreter& interp, Args& args) { return min_max(interp, args, true); }

static Value builtin_sum(Interpreter& interp, Args& args) {
    static const char* const allowed[] = {"start", NULL};
    allow_keywords(args, allowed);
    require_args(args, 1, 2);

    Value total = args.size() == 2 ? args[1] : keyword_or(args, "start", Value::from_int(0));
    if (total.is_str()) {
        throw ScriptError("TypeError", "sum() can't sum strings [use ''.join(seq) instead]");
    }
    interp.iterate(args[0], [&](const Value& item) -> bool {
        total = interp.binary_op(BinOp::ADD, total, item);
        return true;
    });
    return total;
}

static Value builtin_abs(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    const Value& x = args[0];
    if (x.is_float()) return Value::from_float(std::fabs(x.as_float()));
    if (x.is_int() || x.is_bool()) {
        int64_t i = x.as_int();
        if (i == INT64_MIN) throw ScriptError("OverflowError", "integer result out of range");
        return Value::from_int(i < 0 ? -i : i);
    }
    throw ScriptError("TypeError", "bad operand type for abs(): '" + x.type_name() + "'");
}

static int64_t round_int_half_even(int64_t value, int64_t digits) {
    if (digits >= 19) return 0;
    int64_t unit = 1;
    for (int64_t i = 0; i < digits; ++i) unit *= 10;
    int64_t q = value / unit;
    int64_t r = value % unit;
    if (r < 0) {
        r += unit;
        --q;
    }
    if (r * 2 > unit || (r * 2 == unit && (q & 1))) ++q;
    int64_t out;
    if (__builtin_mul_overflow(q, unit, &out)) throw ScriptError("OverflowError", "integer result out of range");
    return out;
}

static Value builtin_round(Interpreter&, Args& args) {
    static const char* const allowed[] = {"ndigits", NULL};
    allow_keywords(args, allowed);
    require_args(args, 1, 2);

    const Value& x = args[0];
    Value nd = args.size() == 2 ? args[1] : keyword_or(args, "ndigits", Value::none());
    if (!x.is_number()) {
        throw ScriptError("TypeError", "type " + x.type_name() + " doesn't define __round__ method");
    }

    if (!x.is_float()) {
        if (nd.is_none()) return Value::from_int(x.as_int());
        int64_t digits = expect_int(nd, "ndigits");
        if (digits >= 0) return Value::from_int(x.as_int());
        return Value::from_int(round_int_half_even(x.as_int(), -digits));
    }

    double d = x.as_float();
    if (nd.is_none()) return Value::from_int(float_to_int(std::nearbyint(d)));

    int64_t digits = expect_int(nd, "ndigits");
    if (!std::isfinite(d)) return x;
    if (digits >= 0) {
        if (digits > 17) return x;
        char buf[512];
        snprintf(buf, sizeof(buf), "%.*f", static_cast<int>(digits), d);
        return Value::from_float(strtod(buf, nullptr));
    }
    if (digits < -308) return Value::from_float(0.0);
    double unit = std::pow(10.0, static_cast<double>(-digits));
    return Value::from_float(std::nearbyint(d / unit) * unit);
}

static Value builtin_pow(Interpreter& interp, Args& args) {
    reject_keywords(args);
    require_args(args, 2, 3);
    if (args.size() == 2 || args[2].is_none()) return interp.binary_op(BinOp::POW, args[0], args[1]);

    int64_t base = expect_int(args[0], "pow() base");
    int64_t exponent = expect_int(args[1], "pow() exponent");
    int64_t mod = expect_int(args[2], "pow() modulus");
    if (mod == 0) throw ScriptError("ValueError", "pow() 3rd argument cannot be 0");
    if (exponent < 0) throw ScriptError("ValueError", "pow() negative exponent with modulus is not supported");

    __int128 m = mod;
    __int128 result = 1;
    __int128 b = ((base % m) + m) % m;
    while (exponent > 0) {
        if (exponent & 1) result = (result * b) % m;
        b = (b * b) % m;
        exponent >>= 1;
    }
    result = ((result % m) + m) % m;
    if (mod < 0 && result != 0) result += m;
    return Value::from_int(static_cast<int64_t>(result));
}

static Value builtin_divmod(Interpreter& interp, Args& args) {
    reject_keywords(args);
    require_args(args, 2, 2);
    std::vector<Value> out;
    out.push_back(interp.binary_op(BinOp::FLOORDIV, args[0], args[1]));
    out.push_back(interp.binary_op(BinOp::MOD, args[0], args[1]));
    return Value::new_tuple(out);
}

// ============================================================================
// STRINGS
// ============================================================================

static Value builtin_chr(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    int64_t cp = expect_int(args[0], "chr() argument");
    if (cp < 0 || cp > 0x10FFFF) throw ScriptError("ValueError", "chr() arg not in range(0x110000)");
    return Value::from_string(utf8::encode(static_cast<uint32_t>(cp)));
}

static Value builtin_ord(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    const std::string& s = expect_str(args[0], "ord() argument");
    size_t n = utf8::length(s);
    if (n != 1) {
        throw ScriptError("TypeError", "ord() expected a character, but string of length " +
                          std::to_string(n) + " found");
    }
    size_t pos = 0;
    return Value::from_int(utf8::decode(s, pos));
}

static std::string to_base(int64_t value, int base, const char* prefix) {
    static const char* digits = "0123456789abcdef";
    bool negative = value < 0;
    uint64_t u = negative ? static_cast<uint64_t>(-(value + 1)) + 1 : static_cast<uint64_t>(value);
    std::string body;
    do {
        body += digits[u % static_cast<uint64_t>(base)];
        u /= static_cast<uint64_t>(base);
    } while (u > 0);
    std::reverse(body.begin(), body.end());
    return (negative ? "-" : "") + std::string(prefix) + body;
}

static Value builtin_hex(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    return Value::from_string(to_base(expect_int(args[0], "hex() argument"), 16, "0x"));
}

static Value builtin_bin(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    return Value::from_string(to_base(expect_int(args[0], "bin() argument"), 2, "0b"));
}

static Value builtin_oct(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    return Value::from_string(to_base(expect_int(args[0], "oct() argument"), 8, "0o"));
}

static Value builtin_repr(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    return Value::from_string(args[0].repr());
}

static Value builtin_ascii(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    std::string r = args[0].repr();
    if (utf8::is_ascii(r)) return Value::from_string(r);

    std::string out;
    size_t pos = 0;
    while (pos < r.size()) {
        uint32_t cp = utf8::decode(r, pos);
        char buf[16];
        if (cp < 0x80) {
            out += static_cast<char>(cp);
            continue;
        }
        if (cp <= 0xFF) snprintf(buf, sizeof(buf), "\\x%02x", cp);
        else if (cp <= 0xFFFF) snprintf(buf, sizeof(buf), "\\u%04x", cp);
        else snprintf(buf, sizeof(buf), "\\U%08x", cp);
        out += buf;
    }
    return Value::from_string(out);
}

static Value builtin_format(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 2);
    std::string spec = args.size() == 2 ? expect_str(args[1], "format() spec") : "";
    return Value::from_string(format_value(args[0], spec));
}

// ============================================================================
// INTROSPECTION
// ============================================================================

static Value builtin_len(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    const Value& x = args[0];
    switch (x.type()) {
        case ValueType::STR: return Value::from_int(static_cast<int64_t>(utf8::length(x.as_str())));
        case ValueType::LIST:
        case ValueType::TUPLE: return Value::from_int(static_cast<int64_t>(x.list().items.size()));
        case ValueType::DICT:
        case ValueType::SET: return Value::from_int(static_cast<int64_t>(x.dict().size()));
        case ValueType::RANGE: return Value::from_int(x.range().length());
        default:
            throw ScriptError("TypeError", "object of type '" + x.type_name() + "' has no len()");
    }
}

static Value builtin_type(Interpreter& interp, Args& args) {
    reject_keywords(args);
    if (args.size() != 1) throw ScriptError("TypeError", "type() takes 1 argument");
    return interp.type_of(args[0]);
}

static bool instance_of(Interpreter& interp, const Value& x, const Value& cls) {
    if (cls.is_tuple()) {
        const std::vector<Value>& options = cls.list().items;
        for (size_t i = 0; i < options.size(); ++i) {
            if (instance_of(interp, x, options[i])) return true;
        }
        return false;
    }
    if (cls.type() != ValueType::BUILTIN || !cls.builtin().is_type) {
        throw ScriptError("TypeError", "isinstance() arg 2 must be a type or tuple of types");
    }
    const std::string& name = cls.builtin().name;
    if (cls.builtin().is_exception) {
        return x.is_exception() && exception_matches(x.exception().type, name);
    }
    if (name == "int" && x.is_bool()) return true;
    return interp.type_of(x).builtin().name == name;
}

static Value builtin_isinstance(Interpreter& interp, Args& args) {
    reject_keywords(args);
    require_args(args, 2, 2);
    return Value::from_bool(instance_of(interp, args[0], args[1]));
}

static Value builtin_callable(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    return Value::from_bool(args[0].is_callable());
}

static Value builtin_hasattr(Interpreter& interp, Args& args) {
    reject_keywords(args);
    require_args(args, 2, 2);
    return Value::from_bool(interp.has_attribute(args[0], expect_str(args[1], "attribute name")));
}

static Value builtin_getattr(Interpreter& interp, Args& args) {
    reject_keywords(args);
    require_args(args, 2, 3);
    const std::string& name = expect_str(args[1], "attribute name");
    if (args.size() == 2) return interp.get_attribute(args[0], name);
    if (!interp.has_attribute(args[0], name)) return args[2];
    return interp.get_attribute(args[0], name);
}

static Value builtin_dir(Interpreter& interp, Args& args) {
    reject_keywords(args);
    require_args(args, 0, 1);

    std::vector<std::string> names;
    if (args.size() == 0) {
        const Namespace& globals = interp.globals();
        for (Namespace::const_iterator it = globals.begin(); it != globals.end(); ++it) names.push_back(it->first);
    } else if (args[0].type() == ValueType::MODULE) {
        const ModuleObject& mod = args[0].module();
        for (std::map<std::string, Value>::const_iterator it = mod.attrs.begin(); it != mod.attrs.end(); ++it) {
            names.push_back(it->first);
        }
    } else {
        names = method_names(args[0]);
    }
    std::sort(names.begin(), names.end());

    std::vector<Value> out;
    for (size_t i = 0; i < names.size(); ++i) out.push_back(Value::from_string(names[i]));
    return Value::new_list(out);
}

static Value builtin_id(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    return Value::from_int(args[0].identity());
}

static Value builtin_hash(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    const Value& x = args[0];
    if (x.is_int() || x.is_bool()) return Value::from_int(x.as_int());

    std::string key;
    if (!x.hash_key(key)) throw ScriptError("TypeError", "unhashable type: '" + x.type_name() + "'");
    return Value::from_int(static_cast<int64_t>(std::hash<std::string>()(key) >> 1));
}

// ============================================================================
// EXCEPTIONS
// ============================================================================

Value construct_exception(Interpreter&, Args& args) {
    reject_keywords(args);
    std::string message;
    if (args.size() == 1) {
        message = args.name == "KeyError" ? args[0].repr() : args[0].str();
    } else if (args.size() > 1) {
        message = Value::new_tuple(args.positional).repr();
    }
    return Value::new_exception(args.name, message);
}

// ============================================================================
// MODEL_QUERY and FINAL_VAR
// ============================================================================

static Value builtin_llm_query(Interpreter& interp, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    if (!interp.host()) return Value::from_string("Error: Sub-LLM not available");
    return Value::from_string(interp.host()->query_model(args[0].str()));
}

static Value builtin_final_var(Interpreter& interp, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);

    std::string name = trim(args[0].str());
    while (!name.empty() && (name[0] == '"' || name[0] == '\'')) name.erase(0, 1);
    while (!name.empty() && (name.back() == '"' || name.back() == '\'')) name.pop_back();
    name = trim(name);

    const Namespace& globals = interp.globals();
    Namespace::const_iterator it = globals.find(name);
    if (it == globals.end() || it->second.is_none()) {
        return Value::from_string("Error: Variable '" + name + "' not found");
    }
    return Value::from_string(it->second.str());
}

// ============================================================================
// Symbol table assembly
// ============================================================================

struct BuiltinSpec {
    const char* name;
    BuiltinFn fn;
    Capability group;
    bool is_type;
};

static const BuiltinSpec kBuiltins[] = {
    {"print", builtin_print, Capability::OUTPUT, false},

    {"str", builtin_str, Capability::DATA_CONSTRUCTION, true},
    {"int", builtin_int, Capability::DATA_CONSTRUCTION, true},
    {"float", builtin_float, Capability::DATA_CONSTRUCTION, true},
    {"bool", builtin_bool, Capability::DATA_CONSTRUCTION, true},
    {"list", builtin_list, Capability::DATA_CONSTRUCTION, true},
    {"dict", builtin_dict, Capability::DATA_CONSTRUCTION, true},
    {"tuple", builtin_tuple, Capability::DATA_CONSTRUCTION, true},
    {"set", builtin_set, Capability::DATA_CONSTRUCTION, true},

    {"range", builtin_range, Capability::ITERATION, true},
    {"enumerate", builtin_enumerate, Capability::ITERATION, false},
    {"zip", builtin_zip, Capability::ITERATION, false},
    {"sorted", builtin_sorted, Capability::ITERATION, false},
    {"reversed", builtin_reversed, Capability::ITERATION, false},
    {"map", builtin_map, Capability::ITERATION, false},
    {"filter", builtin_filter, Capability::ITERATION, false},
    {"any", builtin_any, Capability::ITERATION, false},
    {"all", builtin_all, Capability::ITERATION, false},

    {"min", builtin_min, Capability::ARITHMETIC, false},
    {"max", builtin_max, Capability::ARITHMETIC, false},
    {"sum", builtin_sum, Capability::ARITHMETIC, false},
    {"abs", builtin_abs, Capability::ARITHMETIC, false},
    {"round", builtin_round, Capability::ARITHMETIC, false},
    {"pow", builtin_pow, Capability::ARITHMETIC, false},
    {"divmod", builtin_divmod, Capability::ARITHMETIC, false},

    {"chr", builtin_chr, Capability::STRINGS, false},
    {"ord", builtin_ord, Capability::STRINGS, false},
    {"hex", builtin_hex, Capability::STRINGS, false},
    {"bin", builtin_bin, Capability::STRINGS, false},
    {"oct", builtin_oct, Capability::STRINGS, false},
    {"repr", builtin_repr, Capability::STRINGS, false},
    {"format", builtin_format, Capability::STRINGS, false},
    {"ascii", builtin_ascii, Capability::STRINGS, false},

    {"len", builtin_len, Capability::INTROSPECTION, false},
    {"type", builtin_type, Capability::INTROSPECTION, true},
    {"isinstance", builtin_isinstance, Capability::INTROSPECTION, false},
    {"callable", builtin_callable, Capability::INTROSPECTION, false},
    {"hasattr", builtin_hasattr, Capability::INTROSPECTION, false},
    {"getattr", builtin_getattr, Capability::INTROSPECTION, false},
    {"dir", builtin_dir, Capability::INTROSPECTION, false},
    {"id", builtin_id, Capability::INTROSPECTION, false},
    {"hash", builtin_hash, Capability::INTROSPECTION, false},

    {"llm_query", builtin_llm_query, Capability::MODEL_QUERY, false},
    {"FINAL_VAR", builtin_final_var, Capability::FINAL_VAR, false},

    {NULL, nullptr, Capability::OUTPUT, false}
};

SymbolTable build_symbol_table(const CapabilitySet& capabilities) {
    SymbolTable table;

    for (const BuiltinSpec* spec = kBuiltins; spec->name; ++spec) {
        if (capabilities.has(spec->group)) {
            table.define(spec->name, Value::new_builtin(spec->name, spec->fn, spec->is_type));
        } else {
            table.mark_disabled(spec->name, spec->group);
        }
    }

    const std::vector<std::string>& exceptions = exception_type_names();
    for (size_t i = 0; i < exceptions.size(); ++i) {
        if (capabilities.has(Capability::EXCEPTIONS)) {
            table.define(exceptions[i], Value::new_builtin(exceptions[i], construct_exception, true, true));
        } else {
            table.mark_disabled(exceptions[i], Capability::EXCEPTIONS);
        }
    }

    if (!capabilities.has(Capability::CONTEXT)) {
        table.mark_disabled("context", Capability::CONTEXT);
    }
    return table;
}

} // namespace script
} // namespace gatedrepl
