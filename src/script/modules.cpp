/*
 * gatedrepl C++ - Importable Modules and JSON Conversion
 *
 * The only modules a script can import: math, json and a re subset backed
 * by std::regex. Also converts between script values and nlohmann::json
 * for namespace snapshots, seed locals and structured context.
 */
#include <gatedrepl/script/builtins.hpp>
#include <gatedrepl/script/interpreter.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>

namespace gatedrepl {
namespace script {

static const int kMaxJsonDepth = 64;

// ============================================================================
// math
// ============================================================================

static double number_arg(const Args& args, size_t i) {
    if (!args[i].is_number()) {
        throw ScriptError("TypeError", "must be real number, not " + args[i].type_name());
    }
    return args[i].as_float();
}

static Value checked_result(double r) {
    if (std::isnan(r)) throw ScriptError("ValueError", "math domain error");
    if (std::isinf(r)) throw ScriptError("OverflowError", "math range error");
    return Value::from_float(r);
}

static Value float_to_int_value(double d) {
    if (std::isnan(d)) throw ScriptError("ValueError", "cannot convert float NaN to integer");
    if (std::isinf(d) || d >= 9223372036854775808.0 || d < -9223372036854775808.0) {
        throw ScriptError("OverflowError", "cannot convert float infinity to integer");
    }
    return Value::from_int(static_cast<int64_t>(d));
}

#define MATH_UNARY(fname, expr)                                          \
    static Value math_##fname(Interpreter&, Args& args) {               \
        reject_keywords(args);                                           \
        require_args(args, 1, 1);                                        \
        double x = number_arg(args, 0);                                  \
        return checked_result(expr);                                     \
    }

MATH_UNARY(exp, std::exp(x))
MATH_UNARY(sin, std::sin(x))
MATH_UNARY(cos, std::cos(x))
MATH_UNARY(tan, std::tan(x))
MATH_UNARY(asin, std::asin(x))
MATH_UNARY(acos, std::acos(x))
MATH_UNARY(atan, std::atan(x))
MATH_UNARY(fabs, std::fabs(x))
MATH_UNARY(degrees, x * 180.0 / M_PI)
MATH_UNARY(radians, x * M_PI / 180.0)

#undef MATH_UNARY

static Value math_sqrt(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    double x = number_arg(args, 0);
    if (x < 0) throw ScriptError("ValueError", "math domain error");
    return Value::from_float(std::sqrt(x));
}

static Value math_log(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 2);
    double x = number_arg(args, 0);
    if (x <= 0) throw ScriptError("ValueError", "math domain error");
    if (args.size() == 1) return Value::from_float(std::log(x));
    double base = number_arg(args, 1);
    if (base <= 0 || base == 1.0) throw ScriptError("ValueError", "math domain error");
    return Value::from_float(std::log(x) / std::log(base));
}

static Value math_log2(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    double x = number_arg(args, 0);
    if (x <= 0) throw ScriptError("ValueError", "math domain error");
    return Value::from_float(std::log2(x));
}

static Value math_log10(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    double x = number_arg(args, 0);
    if (x <= 0) throw ScriptError("ValueError", "math domain error");
    return Value::from_float(std::log10(x));
}

static Value math_floor(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    if (args[0].is_int() || args[0].is_bool()) return Value::from_int(args[0].as_int());
    return float_to_int_value(std::floor(number_arg(args, 0)));
}

static Value math_ceil(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    if (args[0].is_int() || args[0].is_bool()) return Value::from_int(args[0].as_int());
    return float_to_int_value(std::ceil(number_arg(args, 0)));
}

static Value math_trunc(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    if (args[0].is_int() || args[0].is_bool()) return Value::from_int(args[0].as_int());
    return float_to_int_value(std::trunc(number_arg(args, 0)));
}

static Value math_pow(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 2, 2);
    return checked_result(std::pow(number_arg(args, 0), number_arg(args, 1)));
}

static Value math_atan2(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 2, 2);
    return Value::from_float(std::atan2(number_arg(args, 0), number_arg(args, 1)));
}

static Value math_hypot(Interpreter&, Args& args) {
    reject_keywords(args);
    double sum = 0.0;
    for (size_t i = 0; i < args.size(); ++i) {
        double x = number_arg(args, i);
        sum += x * x;
    }
    return Value::from_float(std::sqrt(sum));
}

static Value math_isnan(Interpreter&, Args& args) {
    require_args(args, 1, 1);
    return Value::from_bool(std::isnan(number_arg(args, 0)));
}

static Value math_isinf(Interpreter&, Args& args) {
    require_args(args, 1, 1);
    return Value::from_bool(std::isinf(number_arg(args, 0)));
}

static Value math_isfinite(Interpreter&, Args& args) {
    require_args(args, 1, 1);
    return Value::from_bool(std::isfinite(number_arg(args, 0)));
}

static Value math_isclose(Interpreter&, Args& args) {
    require_args(args, 2, 2);
    double a = number_arg(args, 0);
    double b = number_arg(args, 1);
    const Value* rel = args.keyword("rel_tol");
    const Value* abs_kw = args.keyword("abs_tol");
    double rel_tol = rel ? rel->as_float() : 1e-9;
    double abs_tol = abs_kw ? abs_kw->as_float() : 0.0;
    if (a == b) return Value::from_bool(true);
    if (std::isinf(a) || std::isinf(b)) return Value::from_bool(false);
    double diff = std::fabs(a - b);
    return Value::from_bool(diff <= std::fabs(rel_tol * b) || diff <= std::fabs(rel_tol * a) || diff <= abs_tol);
}

static Value math_gcd(Interpreter&, Args& args) {
    reject_keywords(args);
    int64_t g = 0;
    for (size_t i = 0; i < args.size(); ++i) {
        int64_t v = expect_int(args[i], "gcd() argument");
        if (v == INT64_MIN) throw ScriptError("OverflowError", "integer result out of range");
        v = v < 0 ? -v : v;
        while (v) {
            int64_t t = g % v;
            g = v;
            v = t;
        }
    }
    return Value::from_int(g);
}

static Value math_factorial(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    int64_t n = expect_int(args[0], "factorial() argument");
    if (n < 0) throw ScriptError("ValueError", "factorial() not defined for negative values");
    int64_t r = 1;
    for (int64_t i = 2; i <= n; ++i) {
        if (__builtin_mul_overflow(r, i, &r)) throw ScriptError("OverflowError", "integer result out of range");
    }
    return Value::from_int(r);
}

static Value math_comb(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 2, 2);
    int64_t n = expect_int(args[0], "n");
    int64_t k = expect_int(args[1], "k");
    if (n < 0 || k < 0) throw ScriptError("ValueError", "n and k must be non-negative integers");
    if (k > n) return Value::from_int(0);
    k = std::min(k, n - k);
    __int128 r = 1;
    for (int64_t i = 1; i <= k; ++i) {
        r = r * (n - k + i) / i;
        if (r > INT64_MAX) throw ScriptError("OverflowError", "integer result out of range");
    }
    return Value::from_int(static_cast<int64_t>(r));
}

static Value math_fsum(Interpreter& interp, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    // Kahan-Babuska summation
    double sum = 0.0;
    double c = 0.0;
    interp.iterate(args[0], [&](const Value& item) -> bool {
        if (!item.is_number()) throw ScriptError("TypeError", "must be real number, not " + item.type_name());
        double x = item.as_float();
        double t = sum + x;
        if (std::fabs(sum) >= std::fabs(x)) c += (sum - t) + x;
        else c += (x - t) + sum;
        sum = t;
        return true;
    });
    return Value::from_float(sum + c);
}

struct ModuleFunction {
    const char* name;
    BuiltinFn fn;
};

static const ModuleFunction kMathFunctions[] = {
    {"sqrt", math_sqrt}, {"exp", math_exp}, {"log", math_log}, {"log2", math_log2}, {"log10", math_log10},
    {"sin", math_sin}, {"cos", math_cos}, {"tan", math_tan},
    {"asin", math_asin}, {"acos", math_acos}, {"atan", math_atan}, {"atan2", math_atan2},
    {"floor", math_floor}, {"ceil", math_ceil}, {"trunc", math_trunc}, {"fabs", math_fabs},
    {"pow", math_pow}, {"hypot", math_hypot}, {"degrees", math_degrees}, {"radians", math_radians},
    {"isnan", math_isnan}, {"isinf", math_isinf}, {"isfinite", math_isfinite}, {"isclose", math_isclose},
    {"gcd", math_gcd}, {"factorial", math_factorial}, {"comb", math_comb}, {"fsum", math_fsum},
    {NULL, nullptr}
};

// ============================================================================
// json
// ============================================================================

static std::string json_quote(const std::string& s) {
    return Json(s).dump(-1, ' ', true);
}

static std::string json_key(const Value& key) {
    switch (key.type()) {
        case ValueType::STR: return key.as_str();
        case ValueType::BOOL: return key.as_bool() ? "true" : "false";
        case ValueType::NONE: return "null";
        case ValueType::INT: return std::to_string(key.as_int());
        case ValueType::FLOAT: return format_float_repr(key.as_float());
        default:
            throw ScriptError("TypeError", "keys must be str, int, float, bool or None, not " + key.type_name());
    }
}

static void json_dump(Interpreter& interp, const Value& v, int indent, int level, bool sort_keys, std::string& out) {
    interp.tick();
    if (level > kMaxJsonDepth) throw ScriptError("ValueError", "Circular reference detected");

    std::string newline;
    std::string inner;
    if (indent >= 0) {
        newline = "\n" + std::string(static_cast<size_t>(indent * level), ' ');
        inner = "\n" + std::string(static_cast<size_t>(indent * (level + 1)), ' ');
    }
    const char* item_sep = indent >= 0 ? "," : ", ";

    switch (v.type()) {
        case ValueType::NONE: out += "null"; return;
        case ValueType::BOOL: out += v.as_bool() ? "true" : "false"; return;
        case ValueType::INT: out += std::to_string(v.as_int()); return;
        case ValueType::FLOAT: {
            double d = v.as_float();
            if (std::isnan(d)) out += "NaN";
            else if (std::isinf(d)) out += d < 0 ? "-Infinity" : "Infinity";
            else out += format_float_repr(d);
            return;
        }
        case ValueType::STR: out += json_quote(v.as_str()); return;
        case ValueType::LIST:
        case ValueType::TUPLE: {
            const std::vector<Value>& items = v.list().items;
            if (items.empty()) {
                out += "[]";
                return;
            }
            out += "[";
            for (size_t i = 0; i < items.size(); ++i) {
                if (i > 0) out += item_sep;
                out += inner;
                json_dump(interp, items[i], indent, level + 1, sort_keys, out);
            }
            out += newline + "]";
            return;
        }
        case ValueType::DICT: {
            std::vector<std::pair<std::string, Value> > entries;
            const DictObject& d = v.dict();
            for (size_t i = 0; i < d.entries.size(); ++i) {
                entries.push_back(std::make_pair(json_key(d.entries[i].first), d.entries[i].second));
            }
            if (sort_keys) {
                std::stable_sort(entries.begin(), entries.end(),
                                 [](const std::pair<std::string, Value>& a, const std::pair<std::string, Value>& b) {
                                     return a.first < b.first;
                                 });
            }
            if (entries.empty()) {
                out += "{}";
                return;
            }
            out += "{";
            for (size_t i = 0; i < entries.size(); ++i) {
                if (i > 0) out += item_sep;
                out += inner + json_quote(entries[i].first) + ": ";
                json_dump(interp, entries[i].second, indent, level + 1, sort_keys, out);
            }
            out += newline + "}";
            return;
        }
        default:
            throw ScriptError("TypeError", "Object of type " + v.type_name() + " is not JSON serializable");
    }
}

static Value json_dumps(Interpreter& interp, Args& args) {
    require_args(args, 1, 1);
    Value indent = Value::none();
    bool sort_keys = false;
    for (size_t i = 0; i < args.keywords.size(); ++i) {
        const std::string& key = args.keywords[i].first;
        if (key == "indent") indent = args.keywords[i].second;
        else if (key == "sort_keys") sort_keys = args.keywords[i].second.truthy();
        else if (key != "ensure_ascii") {
            throw ScriptError("TypeError", "dumps() got an unexpected keyword argument '" + key + "'");
        }
    }
    int width = indent.is_none() ? -1 : static_cast<int>(std::max<int64_t>(0, std::min<int64_t>(16, expect_int(indent, "indent"))));

    std::string out;
    json_dump(interp, args[0], width, 0, sort_keys, out);
    return Value::from_string(out);
}

static Value json_loads(Interpreter& interp, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    if (!args[0].is_str()) {
        throw ScriptError("TypeError", "the JSON object must be str, not " + args[0].type_name());
    }
    interp.check_sequence_length(static_cast<int64_t>(args[0].as_str().size()));

    Json parsed;
    try {
        parsed = Json::parse(args[0].as_str());
    } catch (const nlohmann::json::parse_error& e) {
        throw ScriptError("JSONDecodeError", e.what());
    }
    return value_from_json(parsed);
}

static const ModuleFunction kJsonFunctions[] = {
    {"dumps", json_dumps}, {"loads", json_loads},
    {NULL, nullptr}
};

// ============================================================================
// re (std::regex, ECMAScript grammar)
// ============================================================================

static const int64_t kReIgnoreCase = 2;

// Python-only syntax that ECMAScript spells differently
static std::string translate_pattern(const std::string& pattern) {
    std::string out;
    for (size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] == '\\' && i + 1 < pattern.size()) {
            char n = pattern[i + 1];
            if (n == 'A') out += "^";
            else if (n == 'Z') out += "$";
            else {
                out += pattern[i];
                out += n;
            }
            ++i;
            continue;
        }
        if (pattern.compare(i, 4, "(?P<") == 0) {
            size_t close = pattern.find('>', i);
            if (close == std::string::npos) throw ScriptError("ValueError", "missing >, unterminated name");
            out += "(";
            i = close;
            continue;
        }
        out += pattern[i];
    }
    return out;
}

static std::regex compile_regex(const Value& pattern, int64_t flags) {
    if (!pattern.is_str()) throw ScriptError("TypeError", "first argument must be string or compiled pattern");
    std::regex::flag_type f = std::regex::ECMAScript;
    if (flags & kReIgnoreCase) f |= std::regex::icase;
    try {
        return std::regex(translate_pattern(pattern.as_str()), f);
    } catch (const std::regex_error& e) {
        throw ScriptError("ValueError", std::string("invalid regular expression: ") + e.what());
    }
}

static int64_t flags_arg(const Args& args, size_t position) {
    const Value* kw = args.keyword("flags");
    if (kw) return expect_int(*kw, "flags");
    if (args.size() > position) return expect_int(args[position], "flags");
    return 0;
}

static const std::string& subject_arg(const Args& args, size_t i) {
    if (!args[i].is_str()) throw ScriptError("TypeError", "expected string, got " + args[i].type_name());
    return args[i].as_str();
}

// std::regex recurses per matched character; long subjects would exhaust the stack
static const std::string& regex_subject(const Interpreter& interp, const Args& args, size_t i) {
    const std::string& subject = subject_arg(args, i);
    int64_t limit = interp.limits().max_regex_input;
    if (limit > 0 && static_cast<int64_t>(subject.size()) > limit) {
        throw ScriptError("ValueError", "regular expression subject of " + std::to_string(subject.size()) +
                          " characters exceeds the limit of " + std::to_string(limit));
    }
    return subject;
}

static Value re_findall(Interpreter& interp, Args& args) {
    require_args(args, 2, 3);
    std::regex re = compile_regex(args[0], flags_arg(args, 2));
    const std::string& subject = regex_subject(interp, args, 1);

    std::vector<Value> out;
    try {
        std::sregex_iterator end;
        for (std::sregex_iterator it(subject.begin(), subject.end(), re); it != end; ++it) {
            interp.tick();
            const std::smatch& m = *it;
            size_t groups = m.size() - 1;
            if (groups == 0) {
                out.push_back(Value::from_string(m.str(0)));
            } else if (groups == 1) {
                out.push_back(Value::from_string(m.str(1)));
            } else {
                std::vector<Value> tuple;
                for (size_t g = 1; g <= groups; ++g) tuple.push_back(Value::from_string(m.str(g)));
                out.push_back(Value::new_tuple(tuple));
            }
            interp.check_sequence_length(static_cast<int64_t>(out.size()));
        }
    } catch (const std::regex_error& e) {
        throw ScriptError("RuntimeError", std::string("regular expression failed: ") + e.what());
    }
    return Value::new_list(out);
}

// Python replacement syntax (\1, \g<1>, \n) to ECMAScript ($1, $$)
static std::string translate_replacement(const std::string& repl) {
    std::string out;
    for (size_t i = 0; i < repl.size(); ++i) {
        char c = repl[i];
        if (c == '$') {
            out += "$$";
            continue;
        }
        if (c != '\\' || i + 1 >= repl.size()) {
            out += c;
            continue;
        }
        char n = repl[++i];
        if (n >= '0' && n <= '9') {
            out += "$";
            out += n;
            if (i + 1 < repl.size() && std::isdigit(static_cast<unsigned char>(repl[i + 1]))) out += repl[++i];
        } else if (n == 'g' && i + 1 < repl.size() && repl[i + 1] == '<') {
            size_t close = repl.find('>', i);
            if (close == std::string::npos) throw ScriptError("ValueError", "missing >, unterminated name");
            std::string group = repl.substr(i + 2, close - i - 2);
            if (group.empty() || group.find_first_not_of("0123456789") != std::string::npos) {
                throw ScriptError("ValueError", "named group references are not supported: " + group);
            }
            out += "$" + group;
            i = close;
        } else if (n == 'n') out += '\n';
        else if (n == 't') out += '\t';
        else if (n == 'r') out += '\r';
        else if (n == '\\') out += '\\';
        else {
            out += '\\';
            out += n;
        }
    }
    return out;
}

static Value re_sub(Interpreter& interp, Args& args) {
    require_args(args, 3, 5);
    if (!args[1].is_str()) {
        throw ScriptError("TypeError", "re.sub() replacement must be a string");
    }
    std::regex re = compile_regex(args[0], flags_arg(args, 4));
    std::string replacement = translate_replacement(args[1].as_str());
    const std::string& subject = regex_subject(interp, args, 2);

    int64_t count = 0;
    const Value* count_kw = args.keyword("count");
    if (count_kw) count = expect_int(*count_kw, "count");
    else if (args.size() > 3) count = expect_int(args[3], "count");

    std::string out;
    int64_t done = 0;
    try {
        std::string::const_iterator last = subject.begin();
        std::sregex_iterator end;
        for (std::sregex_iterator it(subject.begin(), subject.end(), re); it != end; ++it) {
            if (count > 0 && done >= count) break;
            interp.tick();
            const std::smatch& m = *it;
            out.append(last, m[0].first);
            out += m.format(replacement);
            last = m[0].second;
            ++done;
            interp.check_sequence_length(static_cast<int64_t>(out.size()));
        }
        out.append(last, subject.end());
    } catch (const std::regex_error& e) {
        throw ScriptError("RuntimeError", std::string("regular expression failed: ") + e.what());
    }
    return Value::from_string(out);
}

static Value re_split(Interpreter& interp, Args& args) {
    require_args(args, 2, 4);
    std::regex re = compile_regex(args[0], flags_arg(args, 3));
    const std::string& subject = regex_subject(interp, args, 1);

    int64_t maxsplit = 0;
    const Value* max_kw = args.keyword("maxsplit");
    if (max_kw) maxsplit = expect_int(*max_kw, "maxsplit");
    else if (args.size() > 2) maxsplit = expect_int(args[2], "maxsplit");

    std::vector<Value> out;
    try {
        std::string::const_iterator last = subject.begin();
        int64_t splits = 0;
        std::sregex_iterator end;
        for (std::sregex_iterator it(subject.begin(), subject.end(), re); it != end; ++it) {
            if (maxsplit > 0 && splits >= maxsplit) break;
            interp.tick();
            const std::smatch& m = *it;
            out.push_back(Value::from_string(std::string(last, m[0].first)));
            for (size_t g = 1; g < m.size(); ++g) {
                out.push_back(m[g].matched ? Value::from_string(m.str(g)) : Value::none());
            }
            last = m[0].second;
            ++splits;
            interp.check_sequence_length(static_cast<int64_t>(out.size()));
        }
        out.push_back(Value::from_string(std::string(last, subject.end())));
    } catch (const std::regex_error& e) {
        throw ScriptError("RuntimeError", std::string("regular expression failed: ") + e.what());
    }
    return Value::new_list(out);
}

static Value re_escape(Interpreter&, Args& args) {
    reject_keywords(args);
    require_args(args, 1, 1);
    static const std::string special = "()[]{}?*+-|^$\\.&~# \t\n\r\v\f";
    const std::string& s = subject_arg(args, 0);
    std::string out;
    for (size_t i = 0; i < s.size(); ++i) {
        if (special.find(s[i]) != std::string::npos) out += '\\';
        out += s[i];
    }
    return Value::from_string(out);
}

static const ModuleFunction kReFunctions[] = {
    {"findall", re_findall}, {"sub", re_sub}, {"split", re_split}, {"escape", re_escape},
    {NULL, nullptr}
};

// ============================================================================
// Module registry
// ============================================================================

const std::vector<std::string>& allowed_module_names() {
    static const std::vector<std::string> names = {"json", "math", "re"};
    return names;
}

static Value module_from(const std::string& name, const ModuleFunction* functions) {
    Value module = Value::new_module(name);
    for (const ModuleFunction* f = functions; f->name; ++f) {
        module.module().attrs[f->name] = Value::new_builtin(f->name, f->fn);
    }
    return module;
}

bool create_module(const std::string& name, Value& out) {
    if (name == "math") {
        out = module_from(name, kMathFunctions);
        std::map<std::string, Value>& attrs = out.module().attrs;
        attrs["pi"] = Value::from_float(M_PI);
        attrs["e"] = Value::from_float(M_E);
        attrs["tau"] = Value::from_float(2.0 * M_PI);
        attrs["inf"] = Value::from_float(HUGE_VAL);
        attrs["nan"] = Value::from_float(std::nan(""));
        return true;
    }
    if (name == "json") {
        out = module_from(name, kJsonFunctions);
        out.module().attrs["JSONDecodeError"] = Value::new_builtin("JSONDecodeError", construct_exception, true, true);
        return true;
    }
    if (name == "re") {
        out = module_from(name, kReFunctions);
        out.module().attrs["IGNORECASE"] = Value::from_int(kReIgnoreCase);
        out.module().attrs["I"] = Value::from_int(kReIgnoreCase);
        return true;
    }
    return false;
}

// ============================================================================
// JSON conversion
// ============================================================================

static bool to_json_impl(const Value& value, Json& out, int depth) {
    if (depth > kMaxJsonDepth) return false;

    switch (value.type()) {
        case ValueType::NONE: out = nullptr; return true;
        case ValueType::BOOL: out = value.as_bool(); return true;
        case ValueType::INT: out = value.as_int(); return true;
        case ValueType::FLOAT:
            if (!std::isfinite(value.as_float())) return false;
            out = value.as_float();
            return true;
        case ValueType::STR: out = value.as_str(); return true;
        case ValueType::LIST:
        case ValueType::TUPLE: {
            out = Json::array();
            const std::vector<Value>& items = value.list().items;
            for (size_t i = 0; i < items.size(); ++i) {
                Json item;
                if (!to_json_impl(items[i], item, depth + 1)) return false;
                out.push_back(item);
            }
            return true;
        }
        case ValueType::DICT: {
            out = Json::object();
            const DictObject& d = value.dict();
            for (size_t i = 0; i < d.entries.size(); ++i) {
                const Value& key = d.entries[i].first;
                if (!(key.is_str() || key.is_int() || key.is_bool() || key.is_float() || key.is_none())) return false;
                Json item;
                if (!to_json_impl(d.entries[i].second, item, depth + 1)) return false;
                out[json_key(key)] = item;
            }
            return true;
        }
        default:
            return false;
    }
}

bool value_to_json(const Value& value, Json& out) {
    return to_json_impl(value, out, 0);
}

Value value_from_json(const Json& json) {
    switch (json.type()) {
        case Json::value_t::null: return Value::none();
        case Json::value_t::boolean: return Value::from_bool(json.get<bool>());
        case Json::value_t::number_integer: return Value::from_int(json.get<int64_t>());
        case Json::value_t::number_unsigned: {
            uint64_t u = json.get<uint64_t>();
            if (u > static_cast<uint64_t>(INT64_MAX)) return Value::from_float(static_cast<double>(u));
            return Value::from_int(static_cast<int64_t>(u));
        }
        case Json::value_t::number_float: return Value::from_float(json.get<double>());
        case Json::value_t::string: return Value::from_string(json.get<std::string>());
        case Json::value_t::array: {
            std::vector<Value> items;
            items.reserve(json.size());
            for (Json::const_iterator it = json.begin(); it != json.end(); ++it) items.push_back(value_from_json(*it));
            return Value::new_list(items);
        }
        case Json::value_t::object: {
            Value dict = Value::new_dict();
            for (Json::const_iterator it = json.begin(); it != json.end(); ++it) {
                dict.dict().set(Value::from_string(it.key()), value_from_json(it.value()));
            }
            return dict;
        }
        default:
            return Value::none();
    }
}

void freeze(const Value& value) {
    if (value.is_list() || value.is_tuple()) {
        ListObject& list = value.list();
        // tuples start frozen, their items may not be
        if (list.frozen && value.is_list()) return;
        list.frozen = true;
        for (size_t i = 0; i < list.items.size(); ++i) freeze(list.items[i]);
        return;
    }
    if (value.is_dict() || value.is_set()) {
        DictObject& dict = value.dict();
        if (dict.frozen) return;
        dict.frozen = true;
        for (size_t i = 0; i < dict.entries.size(); ++i) freeze(dict.entries[i].second);
    }
}

} // namespace script
} // namespace gatedrepl
