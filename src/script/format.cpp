/*
 * gatedrepl C++ - String Formatting
 *
 * Format-spec mini language shared by format(), f-strings and str.format,
 * plus printf-style "%" formatting.
 */
#include <gatedrepl/script/builtins.hpp>
#include <gatedrepl/script/interpreter.hpp>

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace gatedrepl {
namespace script {

// ============================================================================
// Spec parsing
// ============================================================================

struct FormatSpec {
    std::string fill;
    char align;         // '<' '>' '^' '=' or 0
    char sign;          // '+' '-' ' ' or 0
    bool alternate;
    int64_t width;
    char grouping;      // ',' '_' or 0
    int precision;      // -1 when absent
    char type;          // 0 when absent

    FormatSpec()
        : fill(" "), align(0), sign(0), alternate(false)
        , width(0), grouping(0), precision(-1), type(0) {}
};

static bool is_align(char c) {
    return c == '<' || c == '>' || c == '^' || c == '=';
}

static FormatSpec parse_spec(const std::string& spec) {
    FormatSpec f;
    size_t i = 0;

    // [[fill]align]; fill may be any single code point
    if (!spec.empty()) {
        size_t first_len = 1;
        unsigned char lead = static_cast<unsigned char>(spec[0]);
        if (lead >= 0xF0) first_len = 4;
        else if (lead >= 0xE0) first_len = 3;
        else if (lead >= 0xC0) first_len = 2;

        if (spec.size() > first_len && is_align(spec[first_len])) {
            f.fill = spec.substr(0, first_len);
            f.align = spec[first_len];
            i = first_len + 1;
        } else if (is_align(spec[0])) {
            f.align = spec[0];
            i = 1;
        }
    }
    if (i < spec.size() && (spec[i] == '+' || spec[i] == '-' || spec[i] == ' ')) f.sign = spec[i++];
    if (i < spec.size() && spec[i] == '#') {
        f.alternate = true;
        ++i;
    }
    if (i < spec.size() && spec[i] == '0') {
        if (!f.align) {
            f.fill = "0";
            f.align = '=';
        }
        ++i;
    }
    while (i < spec.size() && std::isdigit(static_cast<unsigned char>(spec[i]))) {
        f.width = f.width * 10 + (spec[i++] - '0');
        if (f.width > 100000) throw ScriptError("ValueError", "Too many decimal digits in format string");
    }
    if (i < spec.size() && (spec[i] == ',' || spec[i] == '_')) f.grouping = spec[i++];
    if (i < spec.size() && spec[i] == '.') {
        ++i;
        if (i >= spec.size() || !std::isdigit(static_cast<unsigned char>(spec[i]))) {
            throw ScriptError("ValueError", "Format specifier missing precision");
        }
        f.precision = 0;
        while (i < spec.size() && std::isdigit(static_cast<unsigned char>(spec[i]))) {
            f.precision = f.precision * 10 + (spec[i++] - '0');
            if (f.precision > 1000) throw ScriptError("ValueError", "precision too big");
        }
    }
    if (i < spec.size()) f.type = spec[i++];
    if (i != spec.size()) {
        throw ScriptError("ValueError", "Invalid format specifier '" + spec + "'");
    }
    return f;
}

// ============================================================================
// Rendering
// ============================================================================

static std::string group_digits(const std::string& digits, char sep, size_t every) {
    std::string out;
    size_t n = digits.size();
    for (size_t i = 0; i < n; ++i) {
        if (i > 0 && (n - i) % every == 0) out += sep;
        out += digits[i];
    }
    return out;
}

// Pads "prefix + body" to the requested width; '=' pads between the two
static std::string pad_field(const std::string& prefix, const std::string& body, const FormatSpec& f,
                             char default_align) {
    size_t length = utf8::length(prefix) + utf8::length(body);
    if (f.width <= static_cast<int64_t>(length)) return prefix + body;

    size_t total = static_cast<size_t>(f.width) - length;
    char align = f.align ? f.align : default_align;
    std::string fill;
    switch (align) {
        case '<': {
            for (size_t i = 0; i < total; ++i) fill += f.fill;
            return prefix + body + fill;
        }
        case '^': {
            std::string left;
            std::string right;
            for (size_t i = 0; i < total / 2; ++i) left += f.fill;
            for (size_t i = 0; i < total - total / 2; ++i) right += f.fill;
            return left + prefix + body + right;
        }
        case '=': {
            for (size_t i = 0; i < total; ++i) fill += f.fill;
            return prefix + fill + body;
        }
        default: {
            for (size_t i = 0; i < total; ++i) fill += f.fill;
            return fill + prefix + body;
        }
    }
}

static std::string sign_prefix(bool negative, char sign) {
    if (negative) return "-";
    if (sign == '+') return "+";
    if (sign == ' ') return " ";
    return "";
}

static std::string format_int(int64_t value, const FormatSpec& f) {
    bool negative = value < 0;
    uint64_t u = negative ? static_cast<uint64_t>(-(value + 1)) + 1 : static_cast<uint64_t>(value);

    std::string prefix = sign_prefix(negative, f.sign);
    std::string body;
    int base = 10;
    switch (f.type) {
        case 'b': base = 2; if (f.alternate) prefix += "0b"; break;
        case 'o': base = 8; if (f.alternate) prefix += "0o"; break;
        case 'x': base = 16; if (f.alternate) prefix += "0x"; break;
        case 'X': base = 16; if (f.alternate) prefix += "0X"; break;
        case 'c':
            if (value < 0 || value > 0x10FFFF) throw ScriptError("OverflowError", "%c arg not in range(0x110000)");
            return pad_field("", utf8::encode(static_cast<uint32_t>(value)), f, '<');
        default: break;
    }

    static const char* digits = "0123456789abcdef";
    do {
        body += digits[u % static_cast<uint64_t>(base)];
        u /= static_cast<uint64_t>(base);
    } while (u > 0);
    body = std::string(body.rbegin(), body.rend());
    if (f.type == 'X') {
        for (size_t i = 0; i < body.size(); ++i) body[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(body[i])));
    }
    if (f.grouping) body = group_digits(body, f.grouping, base == 10 ? 3 : 4);
    return pad_field(prefix, body, f, '>');
}

static std::string format_float(double value, const FormatSpec& in) {
    FormatSpec f = in;
    bool negative = std::signbit(value) && !std::isnan(value);
    double magnitude = std::fabs(value);
    std::string prefix = sign_prefix(negative, f.sign);
    std::string body;

    char type = f.type;
    bool percent = type == '%';
    if (percent) {
        magnitude *= 100.0;
        type = 'f';
    }

    if (!type && f.precision < 0) {
        body = format_float_repr(magnitude);
    } else {
        int precision = f.precision < 0 ? 6 : f.precision;
        char conv = type ? type : 'g';
        if (conv == 'n') conv = 'g';
        std::string fmt = std::string("%") + (f.alternate ? "#" : "") + ".*" + conv;
        char buf[1200];
        snprintf(buf, sizeof(buf), fmt.c_str(), precision, magnitude);
        body = buf;
        if (!type && std::isfinite(magnitude) && body.find_first_of(".e") == std::string::npos) {
            body += ".0";
        }
    }

    if (f.grouping && std::isfinite(magnitude)) {
        size_t end = body.find_first_of(".eE");
        if (end == std::string::npos) end = body.size();
        body = group_digits(body.substr(0, end), f.grouping, 3) + body.substr(end);
    }
    if (percent) body += "%";
    return pad_field(prefix, body, f, '>');
}

std::string format_value(const Value& value, const std::string& spec) {
    if (spec.empty()) return value.str();
    FormatSpec f = parse_spec(spec);

    if (value.is_str()) {
        if (f.type && f.type != 's') {
            throw ScriptError("ValueError", std::string("Unknown format code '") + f.type + "' for object of type 'str'");
        }
        if (f.sign) throw ScriptError("ValueError", "Sign not allowed in string format specifier");
        if (f.align == '=') throw ScriptError("ValueError", "'=' alignment not allowed in string format specifier");
        std::string s = value.as_str();
        if (f.precision >= 0 && static_cast<size_t>(f.precision) < utf8::length(s)) {
            s = s.substr(0, utf8::byte_offset(s, static_cast<size_t>(f.precision)));
        }
        return pad_field("", s, f, '<');
    }

    if (value.is_int() || value.is_bool()) {
        switch (f.type) {
            case 0: case 'd': case 'n': case 'b': case 'o': case 'x': case 'X': case 'c':
                if (f.precision >= 0) throw ScriptError("ValueError", "Precision not allowed in integer format specifier");
                return format_int(value.as_int(), f);
            case 'e': case 'E': case 'f': case 'F': case 'g': case 'G': case '%':
                return format_float(value.as_float(), f);
            default:
                throw ScriptError("ValueError", std::string("Unknown format code '") + f.type +
                                  "' for object of type '" + value.type_name() + "'");
        }
    }

    if (value.is_float()) {
        switch (f.type) {
            case 0: case 'e': case 'E': case 'f': case 'F': case 'g': case 'G': case '%': case 'n':
                return format_float(value.as_float(), f);
            default:
                throw ScriptError("ValueError", std::string("Unknown format code '") + f.type +
                                  "' for object of type 'float'");
        }
    }

    if (f.type || f.sign || f.precision >= 0) {
        throw ScriptError("TypeError", "unsupported format string passed to " + value.type_name() + ".__format__");
    }
    return pad_field("", value.str(), f, '<');
}

// ============================================================================
// str.format
// ============================================================================

static Value resolve_field(Interpreter& interp, const std::string& field, const Args& args,
                           size_t& auto_index, int& numbering) {
    size_t i = 0;
    while (i < field.size() && field[i] != '.' && field[i] != '[') ++i;
    std::string head = field.substr(0, i);

    Value value;
    if (head.empty() || std::isdigit(static_cast<unsigned char>(head[0]))) {
        size_t index;
        if (head.empty()) {
            if (numbering == 2) {
                throw ScriptError("ValueError", "cannot switch from manual field specification to automatic field numbering");
            }
            numbering = 1;
            index = auto_index++;
        } else {
            if (numbering == 1) {
                throw ScriptError("ValueError", "cannot switch from automatic field numbering to manual field specification");
            }
            numbering = 2;
            index = static_cast<size_t>(std::strtoull(head.c_str(), nullptr, 10));
        }
        if (index >= args.size()) {
            throw ScriptError("IndexError", "Replacement index " + std::to_string(index) +
                              " out of range for positional args tuple");
        }
        value = args[index];
    } else {
        const Value* kw = args.keyword(head);
        if (!kw) throw ScriptError("KeyError", quote_string(head));
        value = *kw;
    }

    while (i < field.size()) {
        if (field[i] == '.') {
            size_t start = ++i;
            while (i < field.size() && field[i] != '.' && field[i] != '[') ++i;
            value = interp.get_attribute(value, field.substr(start, i - start));
        } else {
            size_t close = field.find(']', i);
            if (close == std::string::npos) throw ScriptError("ValueError", "Missing ']' in format string");
            std::string key = field.substr(i + 1, close - i - 1);
            bool numeric = !key.empty() && key.find_first_not_of("0123456789") == std::string::npos;
            value = interp.get_item(value, numeric ? Value::from_int(std::strtoll(key.c_str(), nullptr, 10))
                                                   : Value::from_string(key));
            i = close + 1;
        }
    }
    return value;
}

std::string format_string(Interpreter& interp, const std::string& format, const Args& args) {
    std::string out;
    size_t auto_index = 0;
    int numbering = 0;    // 0 unknown, 1 automatic, 2 manual

    size_t i = 0;
    while (i < format.size()) {
        char c = format[i];
        if (c == '}') {
            if (i + 1 < format.size() && format[i + 1] == '}') {
                out += '}';
                i += 2;
                continue;
            }
            throw ScriptError("ValueError", "Single '}' encountered in format string");
        }
        if (c != '{') {
            out += c;
            ++i;
            continue;
        }
        if (i + 1 < format.size() && format[i + 1] == '{') {
            out += '{';
            i += 2;
            continue;
        }

        // Find the matching close brace, allowing one level of nesting in the spec
        size_t depth = 1;
        size_t j = i + 1;
        while (j < format.size() && depth > 0) {
            if (format[j] == '{') ++depth;
            else if (format[j] == '}') --depth;
            if (depth > 0) ++j;
        }
        if (j >= format.size()) throw ScriptError("ValueError", "expected '}' before end of string");

        std::string body = format.substr(i + 1, j - i - 1);
        i = j + 1;

        std::string field = body;
        std::string spec;
        char conversion = 0;
        size_t colon = std::string::npos;
        size_t bang = std::string::npos;
        size_t bracket = 0;
        for (size_t k = 0; k < body.size(); ++k) {
            if (body[k] == '[') ++bracket;
            else if (body[k] == ']' && bracket > 0) --bracket;
            else if (bracket == 0 && body[k] == '!' && bang == std::string::npos) bang = k;
            else if (bracket == 0 && body[k] == ':') {
                colon = k;
                break;
            }
        }
        if (colon != std::string::npos) {
            spec = body.substr(colon + 1);
            field = body.substr(0, colon);
        }
        if (bang != std::string::npos && bang < field.size()) {
            std::string conv = field.substr(bang + 1);
            if (conv.size() != 1 || (conv[0] != 'r' && conv[0] != 's' && conv[0] != 'a')) {
                throw ScriptError("ValueError", "Unknown conversion specifier " + conv);
            }
            conversion = conv[0];
            field = field.substr(0, bang);
        }

        Value value = resolve_field(interp, field, args, auto_index, numbering);
        if (conversion == 'r' || conversion == 'a') value = Value::from_string(value.repr());
        else if (conversion == 's') value = Value::from_string(value.str());

        if (spec.find('{') != std::string::npos) {
            spec = format_string(interp, spec, args);
        }
        out += format_value(value, spec);
        interp.check_sequence_length(static_cast<int64_t>(out.size()));
    }
    return out;
}

// ============================================================================
// printf-style formatting
// ============================================================================

std::string percent_format(Interpreter& interp, const std::string& format, const Value& args) {
    std::vector<Value> items;
    const Value* mapping = nullptr;
    if (args.is_tuple()) {
        items = args.list().items;
    } else {
        items.push_back(args);
        if (args.is_dict()) mapping = &args;
    }

    std::string out;
    size_t next = 0;
    bool used_mapping = false;
    size_t i = 0;
    while (i < format.size()) {
        char c = format[i++];
        if (c != '%') {
            out += c;
            continue;
        }
        if (i >= format.size()) throw ScriptError("ValueError", "incomplete format");

        Value value;
        bool have_value = false;
        if (format[i] == '(') {
            size_t close = format.find(')', i);
            if (close == std::string::npos) throw ScriptError("ValueError", "incomplete format key");
            if (!mapping) throw ScriptError("TypeError", "format requires a mapping");
            std::string key = format.substr(i + 1, close - i - 1);
            const Value* found = mapping->dict().find(Value::from_string(key));
            if (!found) throw ScriptError("KeyError", quote_string(key));
            value = *found;
            have_value = true;
            used_mapping = true;
            i = close + 1;
        }

        FormatSpec f;
        bool left = false;
        while (i < format.size() && std::string("-+ 0#").find(format[i]) != std::string::npos) {
            switch (format[i]) {
                case '-': left = true; break;
                case '+': f.sign = '+'; break;
                case ' ': if (f.sign != '+') f.sign = ' '; break;
                case '0': f.fill = "0"; f.align = '='; break;
                case '#': f.alternate = true; break;
            }
            ++i;
        }
        while (i < format.size() && std::isdigit(static_cast<unsigned char>(format[i]))) {
            f.width = f.width * 10 + (format[i++] - '0');
            if (f.width > 100000) throw ScriptError("ValueError", "width too big");
        }
        if (i < format.size() && format[i] == '.') {
            ++i;
            f.precision = 0;
            while (i < format.size() && std::isdigit(static_cast<unsigned char>(format[i]))) {
                f.precision = f.precision * 10 + (format[i++] - '0');
                if (f.precision > 1000) throw ScriptError("ValueError", "precision too big");
            }
        }
        if (i >= format.size()) throw ScriptError("ValueError", "incomplete format");
        char conv = format[i++];
        if (conv == '%') {
            out += '%';
            continue;
        }

        if (!have_value) {
            if (next >= items.size()) throw ScriptError("TypeError", "not enough arguments for format string");
            value = items[next++];
        }
        if (left) {
            f.align = '<';
            f.fill = " ";
        }

        switch (conv) {
            case 's':
            case 'r':
            case 'a': {
                std::string s = conv == 's' ? value.str() : value.repr();
                if (f.precision >= 0 && static_cast<size_t>(f.precision) < utf8::length(s)) {
                    s = s.substr(0, utf8::byte_offset(s, static_cast<size_t>(f.precision)));
                }
                FormatSpec text = f;
                text.fill = " ";
                if (!left) text.align = '>';
                out += pad_field("", s, text, '>');
                break;
            }
            case 'd':
            case 'i':
            case 'u':
            case 'x':
            case 'X':
            case 'o': {
                int64_t n;
                if (value.is_int() || value.is_bool()) n = value.as_int();
                else if (value.is_float() && std::isfinite(value.as_float())) n = static_cast<int64_t>(std::trunc(value.as_float()));
                else throw ScriptError("TypeError", std::string("%") + conv + " format: a real number is required, not " +
                                       value.type_name());
                FormatSpec num = f;
                num.type = (conv == 'i' || conv == 'u') ? 'd' : conv;
                std::string body = format_int(n, FormatSpec());
                if (num.type != 'd') {
                    FormatSpec radix;
                    radix.type = num.type;
                    radix.alternate = num.alternate;
                    body = format_int(n, radix);
                }
                bool negative = !body.empty() && body[0] == '-';
                if (negative) body = body.substr(1);
                if (f.precision > 0 && static_cast<int64_t>(body.size()) < f.precision) {
                    body = std::string(static_cast<size_t>(f.precision) - body.size(), '0') + body;
                }
                out += pad_field(sign_prefix(negative, f.sign), body, num, '>');
                break;
            }
            case 'e':
            case 'E':
            case 'f':
            case 'F':
            case 'g':
            case 'G': {
                if (!value.is_number()) {
                    throw ScriptError("TypeError", std::string("must be real number, not ") + value.type_name());
                }
                FormatSpec num = f;
                num.type = conv;
                if (num.precision < 0) num.precision = 6;
                out += format_float(value.as_float(), num);
                break;
            }
            case 'c': {
                if (value.is_str() && utf8::length(value.as_str()) == 1) {
                    out += pad_field("", value.as_str(), f, '>');
                } else if (value.is_int()) {
                    FormatSpec ch = f;
                    ch.type = 'c';
                    out += format_int(value.as_int(), ch);
                } else {
                    throw ScriptError("TypeError", "%c requires int or char");
                }
                break;
            }
            default:
                throw ScriptError("ValueError", std::string("unsupported format character '") + conv + "'");
        }
        interp.check_sequence_length(static_cast<int64_t>(out.size()));
    }

    if (!used_mapping && !mapping && next < items.size()) {
        throw ScriptError("TypeError", "not all arguments converted during string formatting");
    }
    return out;
}

} // namespace script
} // namespace gatedrepl
