/*
 * gatedrepl C++ - Builtin Type Methods
 *
 * Methods of str, list, tuple, dict, set, int and float. Each type has a
 * NULL-terminated method table; lookups never fall through to anything
 * outside these tables.
 */
#include <gatedrepl/script/builtins.hpp>
#include <gatedrepl/script/interpreter.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace gatedrepl {
namespace script {

typedef Value (*MethodFn)(Interpreter& interp, const Value& self, Args& args);

struct MethodSpec {
    const char* name;
    MethodFn fn;
};

static void require_mutable(const Value& self) {
    bool frozen = (self.is_list() && self.list().frozen) ||
                  ((self.is_dict() || self.is_set()) && self.dict().frozen);
    if (frozen) {
        throw ScriptError("TypeError", "'" + self.type_name() + "' object is read-only");
    }
}

static const std::string& str_arg(const Args& args, size_t i, const char* what) {
    if (!args[i].is_str()) {
        throw ScriptError("TypeError", std::string(what) + " must be str, not " + args[i].type_name());
    }
    return args[i].as_str();
}

// ============================================================================
// str helpers
// ============================================================================

// Byte window [begin, end) for optional code-point start/end arguments
static void str_window(const std::string& s, const Args& args, size_t first, size_t& begin, size_t& end) {
    begin = 0;
    end = s.size();
    if (args.size() <= first) return;

    int64_t length = static_cast<int64_t>(utf8::length(s));
    int64_t lo = 0;
    int64_t hi = length;
    if (!args[first].is_none()) {
        lo = expect_int(args[first], "slice index");
        if (lo < 0) lo = std::max<int64_t>(0, lo + length);
        lo = std::min(lo, length);
    }
    if (args.size() > first + 1 && !args[first + 1].is_none()) {
        hi = expect_int(args[first + 1], "slice index");
        if (hi < 0) hi = std::max<int64_t>(0, hi + length);
        hi = std::min(hi, length);
    }
    begin = utf8::byte_offset(s, static_cast<size_t>(lo));
    end = std::max(begin, utf8::byte_offset(s, static_cast<size_t>(hi)));
}

static int64_t cp_index(const std::string& s, size_t byte) {
    return static_cast<int64_t>(utf8::length(s.substr(0, byte)));
}

static bool is_space_char(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

static std::vector<std::string> split_whitespace(const std::string& s, int64_t maxsplit) {
    std::vector<std::string> out;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && is_space_char(static_cast<unsigned char>(s[i]))) ++i;
        if (i >= s.size()) break;
        if (maxsplit >= 0 && static_cast<int64_t>(out.size()) == maxsplit) {
            size_t end = s.size();
            while (end > i && is_space_char(static_cast<unsigned char>(s[end - 1]))) --end;
            out.push_back(s.substr(i, end - i));
            break;
        }
        size_t start = i;
        while (i < s.size() && !is_space_char(static_cast<unsigned char>(s[i]))) ++i;
        out.push_back(s.substr(start, i - start));
    }
    return out;
}

static Value string_list(const std::vector<std::string>& parts) {
    std::vector<Value> out;
    out.reserve(parts.size());
    for (size_t i = 0; i < parts.size(); ++i) out.push_back(Value::from_string(parts[i]));
    return Value::new_list(out);
}

static std::string strip_chars(const std::string& s, const Value& chars, bool left, bool right) {
    size_t begin = 0;
    size_t end = s.size();
    if (chars.is_none()) {
        while (left && begin < end && is_space_char(static_cast<unsigned char>(s[begin]))) ++begin;
        while (right && end > begin && is_space_char(static_cast<unsigned char>(s[end - 1]))) --end;
        return s.substr(begin, end - begin);
    }
    if (!chars.is_str()) throw ScriptError("TypeError", "strip arg must be None or str");

    std::vector<std::string> set = utf8::chars(chars.as_str());
    std::vector<std::string> cs = utf8::chars(s);
    size_t b = 0;
    size_t e = cs.size();
    while (left && b < e && std::find(set.begin(), set.end(), cs[b]) != set.end()) ++b;
    while (right && e > b && std::find(set.begin(), set.end(), cs[e - 1]) != set.end()) --e;
    std::string out;
    for (size_t i = b; i < e; ++i) out += cs[i];
    return out;
}

typedef bool (*CharPredicate)(unsigned char c);

static bool pred_digit(unsigned char c) { return c >= '0' && c <= '9'; }
static bool pred_alpha(unsigned char c) { return std::isalpha(c) || c >= 0x80; }
static bool pred_alnum(unsigned char c) { return std::isalnum(c) || c >= 0x80; }
static bool pred_space(unsigned char c) { return is_space_char(c); }

static Value check_all(const std::string& s, CharPredicate pred) {
    if (s.empty()) return Value::from_bool(false);
    for (size_t i = 0; i < s.size(); ++i) {
        if (!pred(static_cast<unsigned char>(s[i]))) return Value::from_bool(false);
    }
    return Value::from_bool(true);
}

static std::string ascii_case(const std::string& s, bool upper) {
    std::string out = s;
    for (size_t i = 0; i < out.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(out[i]);
        if (c < 0x80) out[i] = static_cast<char>(upper ? std::toupper(c) : std::tolower(c));
    }
    return out;
}

static Value pad(Interpreter& interp, const Value& self, Args& args, int align) {
    require_args(args, 1, 2);
    int64_t width = expect_int(args[0], "width");
    interp.check_sequence_length(width);
    std::string fill = " ";
    if (args.size() == 2) {
        fill = str_arg(args, 1, "fill character");
        if (utf8::length(fill) != 1) {
            throw ScriptError("TypeError", "The fill character must be exactly one character long");
        }
    }
    const std::string& s = self.as_str();
    int64_t length = static_cast<int64_t>(utf8::length(s));
    if (width <= length) return self;

    int64_t total = width - length;
    int64_t left = align < 0 ? 0 : (align > 0 ? total : total / 2 + (total & width & 1));
    int64_t right = total - left;
    std::string out;
    for (int64_t i = 0; i < left; ++i) out += fill;
    out += s;
    for (int64_t i = 0; i < right; ++i) out += fill;
    return Value::from_string(out);
}

// ============================================================================
// str methods
// ============================================================================

static Value str_upper(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 0);
    return Value::from_string(ascii_case(self.as_str(), true));
}

static Value str_lower(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 0);
    return Value::from_string(ascii_case(self.as_str(), false));
}

static Value str_swapcase(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 0);
    std::string out = self.as_str();
    for (size_t i = 0; i < out.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(out[i]);
        if (std::isupper(c)) out[i] = static_cast<char>(std::tolower(c));
        else if (std::islower(c)) out[i] = static_cast<char>(std::toupper(c));
    }
    return Value::from_string(out);
}

static Value str_title(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 0);
    std::string out = self.as_str();
    bool in_word = false;
    for (size_t i = 0; i < out.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(out[i]);
        if (std::isalpha(c)) {
            out[i] = static_cast<char>(in_word ? std::tolower(c) : std::toupper(c));
            in_word = true;
        } else {
            in_word = c >= 0x80;
        }
    }
    return Value::from_string(out);
}

static Value str_capitalize(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 0);
    std::string out = ascii_case(self.as_str(), false);
    if (!out.empty() && static_cast<unsigned char>(out[0]) < 0x80) {
        out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    }
    return Value::from_string(out);
}

static Value str_strip(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 1);
    return Value::from_string(strip_chars(self.as_str(), args.size() ? args[0] : Value::none(), true, true));
}

static Value str_lstrip(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 1);
    return Value::from_string(strip_chars(self.as_str(), args.size() ? args[0] : Value::none(), true, false));
}

static Value str_rstrip(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 1);
    return Value::from_string(strip_chars(self.as_str(), args.size() ? args[0] : Value::none(), false, true));
}

static void split_args(Args& args, Value& sep, int64_t& maxsplit) {
    require_args(args, 0, 2);
    sep = args.size() > 0 ? args[0] : Value::none();
    maxsplit = args.size() > 1 ? expect_int(args[1], "maxsplit") : -1;
    for (size_t i = 0; i < args.keywords.size(); ++i) {
        if (args.keywords[i].first == "sep") sep = args.keywords[i].second;
        else if (args.keywords[i].first == "maxsplit") maxsplit = expect_int(args.keywords[i].second, "maxsplit");
        else throw ScriptError("TypeError", "'" + args.keywords[i].first + "' is an invalid keyword argument for split()");
    }
    if (!sep.is_none()) {
        if (!sep.is_str()) throw ScriptError("TypeError", "must be str or None, not " + sep.type_name());
        if (sep.as_str().empty()) throw ScriptError("ValueError", "empty separator");
    }
}

static Value str_split(Interpreter&, const Value& self, Args& args) {
    Value sep;
    int64_t maxsplit;
    split_args(args, sep, maxsplit);
    const std::string& s = self.as_str();
    if (sep.is_none()) return string_list(split_whitespace(s, maxsplit));

    const std::string& d = sep.as_str();
    std::vector<std::string> out;
    size_t start = 0;
    while (maxsplit < 0 || static_cast<int64_t>(out.size()) < maxsplit) {
        size_t pos = s.find(d, start);
        if (pos == std::string::npos) break;
        out.push_back(s.substr(start, pos - start));
        start = pos + d.size();
    }
    out.push_back(s.substr(start));
    return string_list(out);
}

static Value str_rsplit(Interpreter&, const Value& self, Args& args) {
    Value sep;
    int64_t maxsplit;
    split_args(args, sep, maxsplit);
    const std::string& s = self.as_str();

    std::vector<std::string> out;
    if (sep.is_none()) {
        size_t end = s.size();
        while (true) {
            while (end > 0 && is_space_char(static_cast<unsigned char>(s[end - 1]))) --end;
            if (end == 0) break;
            if (maxsplit >= 0 && static_cast<int64_t>(out.size()) == maxsplit) {
                size_t begin = 0;
                while (begin < end && is_space_char(static_cast<unsigned char>(s[begin]))) ++begin;
                out.push_back(s.substr(begin, end - begin));
                break;
            }
            size_t begin = end;
            while (begin > 0 && !is_space_char(static_cast<unsigned char>(s[begin - 1]))) --begin;
            out.push_back(s.substr(begin, end - begin));
            end = begin;
        }
    } else {
        const std::string& d = sep.as_str();
        size_t end = s.size();
        while (maxsplit < 0 || static_cast<int64_t>(out.size()) < maxsplit) {
            if (end < d.size()) break;
            size_t pos = s.rfind(d, end - d.size());
            if (pos == std::string::npos) break;
            out.push_back(s.substr(pos + d.size(), end - pos - d.size()));
            end = pos;
        }
        out.push_back(s.substr(0, end));
    }
    std::reverse(out.begin(), out.end());
    return string_list(out);
}

static Value str_splitlines(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 1);
    bool keepends = args.size() == 1 && args[0].truthy();
    const Value* kw = args.keyword("keepends");
    if (kw) keepends = kw->truthy();

    const std::string& s = self.as_str();
    std::vector<std::string> out;
    size_t start = 0;
    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '\n' || s[i] == '\r') {
            size_t eol = i;
            if (s[i] == '\r' && i + 1 < s.size() && s[i + 1] == '\n') ++i;
            ++i;
            out.push_back(s.substr(start, (keepends ? i : eol) - start));
            start = i;
        } else {
            ++i;
        }
    }
    if (start < s.size()) out.push_back(s.substr(start));
    return string_list(out);
}

static Value str_join(Interpreter& interp, const Value& self, Args& args) {
    require_args(args, 1, 1);
    std::string out;
    size_t index = 0;
    interp.iterate(args[0], [&](const Value& item) -> bool {
        if (!item.is_str()) {
            throw ScriptError("TypeError", "sequence item " + std::to_string(index) + ": expected str instance, " +
                              item.type_name() + " found");
        }
        if (index > 0) out += self.as_str();
        out += item.as_str();
        ++index;
        interp.check_sequence_length(static_cast<int64_t>(out.size()));
        return true;
    });
    return Value::from_string(out);
}

static Value str_replace(Interpreter& interp, const Value& self, Args& args) {
    require_args(args, 2, 3);
    const std::string& s = self.as_str();
    const std::string& old_text = str_arg(args, 0, "replace() argument 1");
    const std::string& new_text = str_arg(args, 1, "replace() argument 2");
    int64_t count = args.size() == 3 ? expect_int(args[2], "count") : -1;

    std::string out;
    int64_t done = 0;
    if (old_text.empty()) {
        std::vector<std::string> cs = utf8::chars(s);
        for (size_t i = 0; i <= cs.size(); ++i) {
            if (count < 0 || done < count) {
                out += new_text;
                ++done;
            }
            if (i < cs.size()) out += cs[i];
            interp.check_sequence_length(static_cast<int64_t>(out.size()));
        }
    } else {
        size_t start = 0;
        while (count < 0 || done < count) {
            size_t pos = s.find(old_text, start);
            if (pos == std::string::npos) break;
            out.append(s, start, pos - start);
            out += new_text;
            start = pos + old_text.size();
            ++done;
            interp.check_sequence_length(static_cast<int64_t>(out.size()));
        }
        out.append(s, start, std::string::npos);
    }
    interp.check_sequence_length(static_cast<int64_t>(out.size()));
    return Value::from_string(out);
}

static Value affix_match(const Value& self, Args& args, bool prefix) {
    require_args(args, 1, 3);
    const std::string& s = self.as_str();
    size_t begin, end;
    str_window(s, args, 1, begin, end);
    std::string window = s.substr(begin, end - begin);

    std::vector<Value> candidates;
    if (args[0].is_tuple()) candidates = args[0].list().items;
    else candidates.push_back(args[0]);

    for (size_t i = 0; i < candidates.size(); ++i) {
        if (!candidates[i].is_str()) {
            throw ScriptError("TypeError", std::string(prefix ? "startswith" : "endswith") +
                              " first arg must be str or a tuple of str, not " + candidates[i].type_name());
        }
        const std::string& a = candidates[i].as_str();
        bool hit = a.size() <= window.size() &&
                   (prefix ? window.compare(0, a.size(), a) == 0
                           : window.compare(window.size() - a.size(), a.size(), a) == 0);
        if (hit) return Value::from_bool(true);
    }
    return Value::from_bool(false);
}

static Value str_startswith(Interpreter&, const Value& self, Args& args) { return affix_match(self, args, true); }
static Value str_endswith(Interpreter&, const Value& self, Args& args) { return affix_match(self, args, false); }

static int64_t find_impl(const Value& self, Args& args, bool reverse) {
    require_args(args, 1, 3);
    const std::string& s = self.as_str();
    const std::string& sub = str_arg(args, 0, "substring");
    size_t begin, end;
    str_window(s, args, 1, begin, end);
    std::string window = s.substr(begin, end - begin);

    size_t pos = reverse ? window.rfind(sub) : window.find(sub);
    if (pos == std::string::npos) return -1;
    return cp_index(s, begin + pos);
}

static Value str_find(Interpreter&, const Value& self, Args& args) {
    return Value::from_int(find_impl(self, args, false));
}

static Value str_rfind(Interpreter&, const Value& self, Args& args) {
    return Value::from_int(find_impl(self, args, true));
}

static Value str_index(Interpreter&, const Value& self, Args& args) {
    int64_t i = find_impl(self, args, false);
    if (i < 0) throw ScriptError("ValueError", "substring not found");
    return Value::from_int(i);
}

static Value str_rindex(Interpreter&, const Value& self, Args& args) {
    int64_t i = find_impl(self, args, true);
    if (i < 0) throw ScriptError("ValueError", "substring not found");
    return Value::from_int(i);
}

static Value str_count(Interpreter&, const Value& self, Args& args) {
    require_args(args, 1, 3);
    const std::string& s = self.as_str();
    const std::string& sub = str_arg(args, 0, "substring");
    size_t begin, end;
    str_window(s, args, 1, begin, end);
    std::string window = s.substr(begin, end - begin);

    if (sub.empty()) return Value::from_int(static_cast<int64_t>(utf8::length(window)) + 1);
    int64_t n = 0;
    size_t pos = 0;
    while ((pos = window.find(sub, pos)) != std::string::npos) {
        ++n;
        pos += sub.size();
    }
    return Value::from_int(n);
}

static Value str_format(Interpreter& interp, const Value& self, Args& args) {
    return Value::from_string(format_string(interp, self.as_str(), args));
}

static Value str_isdigit(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 0);
    return check_all(self.as_str(), pred_digit);
}

static Value str_isalpha(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 0);
    return check_all(self.as_str(), pred_alpha);
}

static Value str_isalnum(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 0);
    return check_all(self.as_str(), pred_alnum);
}

static Value str_isspace(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 0);
    return check_all(self.as_str(), pred_space);
}

static Value case_check(const std::string& s, bool want_upper) {
    bool cased = false;
    for (size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (want_upper ? std::islower(c) : std::isupper(c)) return Value::from_bool(false);
        if (std::isalpha(c)) cased = true;
    }
    return Value::from_bool(cased);
}

static Value str_isupper(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 0);
    return case_check(self.as_str(), true);
}

static Value str_islower(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 0);
    return case_check(self.as_str(), false);
}

static Value str_center(Interpreter& interp, const Value& self, Args& args) { return pad(interp, self, args, 0); }
static Value str_ljust(Interpreter& interp, const Value& self, Args& args) { return pad(interp, self, args, -1); }
static Value str_rjust(Interpreter& interp, const Value& self, Args& args) { return pad(interp, self, args, 1); }

static Value str_zfill(Interpreter& interp, const Value& self, Args& args) {
    require_args(args, 1, 1);
    int64_t width = expect_int(args[0], "width");
    interp.check_sequence_length(width);
    std::string s = self.as_str();
    int64_t length = static_cast<int64_t>(utf8::length(s));
    if (width <= length) return self;

    std::string sign;
    if (!s.empty() && (s[0] == '+' || s[0] == '-')) {
        sign = s.substr(0, 1);
        s = s.substr(1);
    }
    return Value::from_string(sign + std::string(static_cast<size_t>(width - length), '0') + s);
}

static Value partition_impl(const Value& self, Args& args, bool reverse) {
    require_args(args, 1, 1);
    const std::string& s = self.as_str();
    const std::string& sep = str_arg(args, 0, "separator");
    if (sep.empty()) throw ScriptError("ValueError", "empty separator");

    size_t pos = reverse ? s.rfind(sep) : s.find(sep);
    std::vector<Value> out;
    if (pos == std::string::npos) {
        out.push_back(Value::from_string(reverse ? "" : s));
        out.push_back(Value::from_string(""));
        out.push_back(Value::from_string(reverse ? s : ""));
    } else {
        out.push_back(Value::from_string(s.substr(0, pos)));
        out.push_back(Value::from_string(sep));
        out.push_back(Value::from_string(s.substr(pos + sep.size())));
    }
    return Value::new_tuple(out);
}

static Value str_partition(Interpreter&, const Value& self, Args& args) { return partition_impl(self, args, false); }
static Value str_rpartition(Interpreter&, const Value& self, Args& args) { return partition_impl(self, args, true); }

static Value str_removeprefix(Interpreter&, const Value& self, Args& args) {
    require_args(args, 1, 1);
    const std::string& s = self.as_str();
    const std::string& p = str_arg(args, 0, "prefix");
    if (s.compare(0, p.size(), p) == 0) return Value::from_string(s.substr(p.size()));
    return self;
}

static Value str_removesuffix(Interpreter&, const Value& self, Args& args) {
    require_args(args, 1, 1);
    const std::string& s = self.as_str();
    const std::string& p = str_arg(args, 0, "suffix");
    if (!p.empty() && s.size() >= p.size() && s.compare(s.size() - p.size(), p.size(), p) == 0) {
        return Value::from_string(s.substr(0, s.size() - p.size()));
    }
    return self;
}

static const MethodSpec kStrMethods[] = {
    {"upper", str_upper}, {"lower", str_lower}, {"casefold", str_lower}, {"swapcase", str_swapcase},
    {"title", str_title}, {"capitalize", str_capitalize},
    {"strip", str_strip}, {"lstrip", str_lstrip}, {"rstrip", str_rstrip},
    {"split", str_split}, {"rsplit", str_rsplit}, {"splitlines", str_splitlines},
    {"join", str_join}, {"replace", str_replace},
    {"startswith", str_startswith}, {"endswith", str_endswith},
    {"find", str_find}, {"rfind", str_rfind}, {"index", str_index}, {"rindex", str_rindex},
    {"count", str_count}, {"format", str_format},
    {"isdigit", str_isdigit}, {"isdecimal", str_isdigit}, {"isnumeric", str_isdigit},
    {"isalpha", str_isalpha}, {"isalnum", str_isalnum}, {"isspace", str_isspace},
    {"isupper", str_isupper}, {"islower", str_islower},
    {"center", str_center}, {"ljust", str_ljust}, {"rjust", str_rjust}, {"zfill", str_zfill},
    {"partition", str_partition}, {"rpartition", str_rpartition},
    {"removeprefix", str_removeprefix}, {"removesuffix", str_removesuffix},
    {NULL, nullptr}
};

// ============================================================================
// list and tuple methods
// ============================================================================

static Value list_append(Interpreter& interp, const Value& self, Args& args) {
    require_args(args, 1, 1);
    require_mutable(self);
    self.list().items.push_back(args[0]);
    interp.check_sequence_length(static_cast<int64_t>(self.list().items.size()));
    return Value::none();
}

static Value list_extend(Interpreter& interp, const Value& self, Args& args) {
    require_args(args, 1, 1);
    require_mutable(self);
    std::vector<Value> extra = interp.to_vector(args[0]);
    std::vector<Value>& items = self.list().items;
    interp.check_sequence_length(static_cast<int64_t>(items.size() + extra.size()));
    items.insert(items.end(), extra.begin(), extra.end());
    return Value::none();
}

static Value list_insert(Interpreter& interp, const Value& self, Args& args) {
    require_args(args, 2, 2);
    require_mutable(self);
    std::vector<Value>& items = self.list().items;
    int64_t n = static_cast<int64_t>(items.size());
    int64_t i = expect_int(args[0], "index");
    if (i < 0) i = std::max<int64_t>(0, i + n);
    i = std::min(i, n);
    items.insert(items.begin() + i, args[1]);
    interp.check_sequence_length(n + 1);
    return Value::none();
}

static Value list_pop(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 1);
    require_mutable(self);
    std::vector<Value>& items = self.list().items;
    if (items.empty()) throw ScriptError("IndexError", "pop from empty list");
    int64_t i = args.size() == 1 ? expect_int(args[0], "index") : -1;
    size_t slot = normalize_index(i, items.size(), "pop");
    Value out = items[slot];
    items.erase(items.begin() + static_cast<std::ptrdiff_t>(slot));
    return out;
}

static Value list_remove(Interpreter&, const Value& self, Args& args) {
    require_args(args, 1, 1);
    require_mutable(self);
    std::vector<Value>& items = self.list().items;
    for (size_t i = 0; i < items.size(); ++i) {
        if (items[i].equals(args[0])) {
            items.erase(items.begin() + static_cast<std::ptrdiff_t>(i));
            return Value::none();
        }
    }
    throw ScriptError("ValueError", "list.remove(x): x not in list");
}

static Value seq_index(Interpreter&, const Value& self, Args& args) {
    require_args(args, 1, 3);
    const std::vector<Value>& items = self.list().items;
    int64_t n = static_cast<int64_t>(items.size());
    int64_t start = args.size() > 1 ? expect_int(args[1], "start") : 0;
    int64_t stop = args.size() > 2 ? expect_int(args[2], "stop") : n;
    if (start < 0) start = std::max<int64_t>(0, start + n);
    if (stop < 0) stop = std::max<int64_t>(0, stop + n);
    stop = std::min(stop, n);
    for (int64_t i = start; i < stop; ++i) {
        if (items[static_cast<size_t>(i)].equals(args[0])) return Value::from_int(i);
    }
    throw ScriptError("ValueError", args[0].repr() + " is not in " + self.type_name());
}

static Value seq_count(Interpreter&, const Value& self, Args& args) {
    require_args(args, 1, 1);
    const std::vector<Value>& items = self.list().items;
    int64_t n = 0;
    for (size_t i = 0; i < items.size(); ++i) {
        if (items[i].equals(args[0])) ++n;
    }
    return Value::from_int(n);
}

static Value list_sort(Interpreter& interp, const Value& self, Args& args) {
    require_args(args, 0, 0);
    require_mutable(self);
    Value key = Value::none();
    bool reverse = false;
    for (size_t i = 0; i < args.keywords.size(); ++i) {
        if (args.keywords[i].first == "key") key = args.keywords[i].second;
        else if (args.keywords[i].first == "reverse") reverse = args.keywords[i].second.truthy();
        else throw ScriptError("TypeError", "'" + args.keywords[i].first + "' is an invalid keyword argument for sort()");
    }
    std::vector<Value> sorted = sort_values(interp, self.list().items, key, reverse);
    self.list().items.swap(sorted);
    return Value::none();
}

static Value list_reverse(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 0);
    require_mutable(self);
    std::reverse(self.list().items.begin(), self.list().items.end());
    return Value::none();
}

static Value list_clear(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 0);
    require_mutable(self);
    self.list().items.clear();
    return Value::none();
}

static Value list_copy(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 0);
    return Value::new_list(self.list().items);
}

static const MethodSpec kListMethods[] = {
    {"append", list_append}, {"extend", list_extend}, {"insert", list_insert},
    {"pop", list_pop}, {"remove", list_remove}, {"index", seq_index}, {"count", seq_count},
    {"sort", list_sort}, {"reverse", list_reverse}, {"clear", list_clear}, {"copy", list_copy},
    {NULL, nullptr}
};

static const MethodSpec kTupleMethods[] = {
    {"index", seq_index}, {"count", seq_count},
    {NULL, nullptr}
};

// ============================================================================
// dict methods
// ============================================================================

static Value dict_keys(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 0);
    std::vector<Value> out;
    const DictObject& d = self.dict();
    for (size_t i = 0; i < d.entries.size(); ++i) out.push_back(d.entries[i].first);
    return Value::new_list(out);
}

static Value dict_values(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 0);
    std::vector<Value> out;
    const DictObject& d = self.dict();
    for (size_t i = 0; i < d.entries.size(); ++i) out.push_back(d.entries[i].second);
    return Value::new_list(out);
}

static Value dict_items(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 0);
    std::vector<Value> out;
    const DictObject& d = self.dict();
    for (size_t i = 0; i < d.entries.size(); ++i) {
        std::vector<Value> pair;
        pair.push_back(d.entries[i].first);
        pair.push_back(d.entries[i].second);
        out.push_back(Value::new_tuple(pair));
    }
    return Value::new_list(out);
}

static Value dict_get(Interpreter&, const Value& self, Args& args) {
    require_args(args, 1, 2);
    const Value* found = self.dict().find(args[0]);
    if (found) return *found;
    return args.size() == 2 ? args[1] : Value::none();
}

static Value dict_pop(Interpreter&, const Value& self, Args& args) {
    require_args(args, 1, 2);
    require_mutable(self);
    const Value* found = self.dict().find(args[0]);
    if (!found) {
        if (args.size() == 2) return args[1];
        throw ScriptError("KeyError", args[0].repr());
    }
    Value out = *found;
    self.dict().erase(args[0]);
    return out;
}

static Value dict_popitem(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 0);
    require_mutable(self);
    DictObject& d = self.dict();
    if (d.entries.empty()) throw ScriptError("KeyError", "'popitem(): dictionary is empty'");
    std::pair<Value, Value> last = d.entries.back();
    d.erase(last.first);
    std::vector<Value> pair;
    pair.push_back(last.first);
    pair.push_back(last.second);
    return Value::new_tuple(pair);
}

static Value dict_setdefault(Interpreter&, const Value& self, Args& args) {
    require_args(args, 1, 2);
    const Value* found = self.dict().find(args[0]);
    if (found) return *found;
    require_mutable(self);
    Value fallback = args.size() == 2 ? args[1] : Value::none();
    self.dict().set(args[0], fallback);
    return fallback;
}

static Value dict_update(Interpreter& interp, const Value& self, Args& args) {
    require_args(args, 0, 1);
    require_mutable(self);
    DictObject& d = self.dict();
    if (args.size() == 1) {
        if (args[0].is_dict()) {
            std::vector<std::pair<Value, Value> > entries = args[0].dict().entries;
            for (size_t i = 0; i < entries.size(); ++i) d.set(entries[i].first, entries[i].second);
        } else {
            std::vector<Value> pairs = interp.to_vector(args[0]);
            for (size_t i = 0; i < pairs.size(); ++i) {
                std::vector<Value> kv = interp.to_vector(pairs[i]);
                if (kv.size() != 2) {
                    throw ScriptError("ValueError", "dictionary update sequence element #" + std::to_string(i) +
                                      " has length " + std::to_string(kv.size()) + "; 2 is required");
                }
                d.set(kv[0], kv[1]);
            }
        }
    }
    for (size_t i = 0; i < args.keywords.size(); ++i) {
        d.set(Value::from_string(args.keywords[i].first), args.keywords[i].second);
    }
    return Value::none();
}

static Value dict_clear(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 0);
    require_mutable(self);
    self.dict().clear();
    return Value::none();
}

static Value dict_copy(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 0);
    Value out = self.is_set() ? Value::new_set() : Value::new_dict();
    const DictObject& d = self.dict();
    for (size_t i = 0; i < d.entries.size(); ++i) out.dict().set(d.entries[i].first, d.entries[i].second);
    return out;
}

static const MethodSpec kDictMethods[] = {
    {"keys", dict_keys}, {"values", dict_values}, {"items", dict_items},
    {"get", dict_get}, {"pop", dict_pop}, {"popitem", dict_popitem},
    {"setdefault", dict_setdefault}, {"update", dict_update},
    {"clear", dict_clear}, {"copy", dict_copy},
    {NULL, nullptr}
};

// ============================================================================
// set methods
// ============================================================================

static Value as_set(Interpreter& interp, const Value& v) {
    if (v.is_set()) return v;
    Value out = Value::new_set();
    interp.iterate(v, [&](const Value& item) -> bool {
        out.dict().set(item, Value::none());
        return true;
    });
    return out;
}

static Value set_add(Interpreter&, const Value& self, Args& args) {
    require_args(args, 1, 1);
    require_mutable(self);
    self.dict().set(args[0], Value::none());
    return Value::none();
}

static Value set_remove(Interpreter&, const Value& self, Args& args) {
    require_args(args, 1, 1);
    require_mutable(self);
    if (!self.dict().erase(args[0])) throw ScriptError("KeyError", args[0].repr());
    return Value::none();
}

static Value set_discard(Interpreter&, const Value& self, Args& args) {
    require_args(args, 1, 1);
    require_mutable(self);
    self.dict().erase(args[0]);
    return Value::none();
}

static Value set_pop(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 0);
    require_mutable(self);
    DictObject& d = self.dict();
    if (d.entries.empty()) throw ScriptError("KeyError", "'pop from an empty set'");
    Value first = d.entries.front().first;
    d.erase(first);
    return first;
}

static Value set_combine(Interpreter& interp, const Value& self, Args& args, BinOp op) {
    Args no_args;
    Value result = dict_copy(interp, self, no_args);
    for (size_t i = 0; i < args.size(); ++i) {
        result = interp.binary_op(op, result, as_set(interp, args[i]));
    }
    return result;
}

static Value set_union(Interpreter& interp, const Value& self, Args& args) {
    return set_combine(interp, self, args, BinOp::BITOR);
}

static Value set_intersection(Interpreter& interp, const Value& self, Args& args) {
    return set_combine(interp, self, args, BinOp::BITAND);
}

static Value set_difference(Interpreter& interp, const Value& self, Args& args) {
    return set_combine(interp, self, args, BinOp::SUB);
}

static Value set_symmetric_difference(Interpreter& interp, const Value& self, Args& args) {
    require_args(args, 1, 1);
    return interp.binary_op(BinOp::BITXOR, self, as_set(interp, args[0]));
}

static Value set_update(Interpreter& interp, const Value& self, Args& args) {
    require_mutable(self);
    for (size_t i = 0; i < args.size(); ++i) {
        interp.iterate(args[i], [&](const Value& item) -> bool {
            self.dict().set(item, Value::none());
            return true;
        });
    }
    return Value::none();
}

static Value set_issubset(Interpreter& interp, const Value& self, Args& args) {
    require_args(args, 1, 1);
    return Value::from_bool(interp.compare(CmpOp::LE, self, as_set(interp, args[0])));
}

static Value set_issuperset(Interpreter& interp, const Value& self, Args& args) {
    require_args(args, 1, 1);
    return Value::from_bool(interp.compare(CmpOp::GE, self, as_set(interp, args[0])));
}

static Value set_isdisjoint(Interpreter& interp, const Value& self, Args& args) {
    require_args(args, 1, 1);
    Value other = as_set(interp, args[0]);
    const DictObject& d = self.dict();
    for (size_t i = 0; i < d.entries.size(); ++i) {
        if (other.dict().find(d.entries[i].first)) return Value::from_bool(false);
    }
    return Value::from_bool(true);
}

static const MethodSpec kSetMethods[] = {
    {"add", set_add}, {"remove", set_remove}, {"discard", set_discard}, {"pop", set_pop},
    {"clear", dict_clear}, {"copy", dict_copy},
    {"union", set_union}, {"intersection", set_intersection}, {"difference", set_difference},
    {"symmetric_difference", set_symmetric_difference}, {"update", set_update},
    {"issubset", set_issubset}, {"issuperset", set_issuperset}, {"isdisjoint", set_isdisjoint},
    {NULL, nullptr}
};

// ============================================================================
// int and float methods
// ============================================================================

static Value int_bit_length(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 0);
    int64_t v = self.as_int();
    uint64_t u = v < 0 ? static_cast<uint64_t>(-(v + 1)) + 1 : static_cast<uint64_t>(v);
    int64_t bits = 0;
    while (u) {
        ++bits;
        u >>= 1;
    }
    return Value::from_int(bits);
}

static Value float_is_integer(Interpreter&, const Value& self, Args& args) {
    require_args(args, 0, 0);
    double d = self.as_float();
    return Value::from_bool(std::isfinite(d) && std::floor(d) == d);
}

static const MethodSpec kIntMethods[] = {
    {"bit_length", int_bit_length},
    {NULL, nullptr}
};

static const MethodSpec kFloatMethods[] = {
    {"is_integer", float_is_integer},
    {NULL, nullptr}
};

// ============================================================================
// Dispatch
// ============================================================================

static const MethodSpec* method_table(const Value& self) {
    switch (self.type()) {
        case ValueType::STR: return kStrMethods;
        case ValueType::LIST: return kListMethods;
        case ValueType::TUPLE: return kTupleMethods;
        case ValueType::DICT: return kDictMethods;
        case ValueType::SET: return kSetMethods;
        case ValueType::INT:
        case ValueType::BOOL: return kIntMethods;
        case ValueType::FLOAT: return kFloatMethods;
        default: return nullptr;
    }
}

static MethodFn find_method(const Value& self, const std::string& name) {
    const MethodSpec* table = method_table(self);
    if (!table) return nullptr;
    for (const MethodSpec* m = table; m->name; ++m) {
        if (name == m->name) return m->fn;
    }
    return nullptr;
}

bool has_method(const Value& self, const std::string& name) {
    return find_method(self, name) != nullptr;
}

std::vector<std::string> method_names(const Value& self) {
    std::vector<std::string> out;
    const MethodSpec* table = method_table(self);
    if (!table) return out;
    for (const MethodSpec* m = table; m->name; ++m) out.push_back(m->name);
    return out;
}

Value call_method(Interpreter& interp, const Value& self, const std::string& name, Args& args) {
    MethodFn fn = find_method(self, name);
    if (!fn) {
        throw ScriptError("AttributeError", "'" + self.type_name() + "' object has no attribute '" + name + "'");
    }
    args.name = name;
    // Methods that accept keywords consume them; the rest take none
    if (!args.keywords.empty() && fn != str_format && fn != list_sort && fn != dict_update &&
        fn != str_split && fn != str_rsplit && fn != str_splitlines) {
        reject_keywords(args);
    }
    return fn(interp, self, args);
}

} // namespace script
} // namespace gatedrepl
