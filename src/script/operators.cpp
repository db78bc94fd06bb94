/*
 * gatedrepl C++ - Script Operators
 *
 * Arithmetic, comparison, membership, indexing and slicing. Integers are
 * 64-bit; results that do not fit raise OverflowError instead of wrapping.
 */
#include <gatedrepl/script/interpreter.hpp>

#include <algorithm>
#include <cmath>

namespace gatedrepl {
namespace script {

// ============================================================================
// Index and slice helpers
// ============================================================================

size_t normalize_index(int64_t index, size_t length, const char* what) {
    int64_t n = static_cast<int64_t>(length);
    if (index < 0) index += n;
    if (index < 0 || index >= n) {
        throw ScriptError("IndexError", std::string(what) + " index out of range");
    }
    return static_cast<size_t>(index);
}

static int64_t slice_bound(const Value& v) {
    if (v.is_int() || v.is_bool()) return v.as_int();
    throw ScriptError("TypeError", "slice indices must be integers or None");
}

static void slice_bounds(const Value& lower, const Value& upper, const Value& step_value, int64_t length,
                         int64_t& start, int64_t& stop, int64_t& step) {
    step = step_value.is_none() ? 1 : slice_bound(step_value);
    if (step == 0) throw ScriptError("ValueError", "slice step cannot be zero");

    if (step > 0) {
        start = lower.is_none() ? 0 : slice_bound(lower);
        stop = upper.is_none() ? length : slice_bound(upper);
        if (start < 0) start = std::max<int64_t>(0, start + length);
        if (stop < 0) stop = std::max<int64_t>(0, stop + length);
        start = std::min(start, length);
        stop = std::min(stop, length);
    } else {
        start = lower.is_none() ? length - 1 : slice_bound(lower);
        stop = upper.is_none() ? -1 : slice_bound(upper);
        if (!lower.is_none()) {
            if (start < 0) start = std::max<int64_t>(-1, start + length);
            start = std::min(start, length - 1);
        }
        if (!upper.is_none()) {
            if (stop < 0) stop = std::max<int64_t>(-1, stop + length);
            stop = std::min(stop, length - 1);
        }
    }
}

std::vector<int64_t> slice_positions(const Value& lower, const Value& upper, const Value& step_value, int64_t length) {
    int64_t start, stop, step;
    slice_bounds(lower, upper, step_value, length, start, stop, step);

    std::vector<int64_t> out;
    if (step > 0) {
        for (int64_t i = start; i < stop; i += step) out.push_back(i);
    } else {
        for (int64_t i = start; i > stop; i += step) out.push_back(i);
    }
    return out;
}

static void require_mutable(const Value& container) {
    bool frozen = false;
    if (container.is_list()) frozen = container.list().frozen;
    if (container.is_dict() || container.is_set()) frozen = container.dict().frozen;
    if (frozen) {
        throw ScriptError("TypeError", "'" + container.type_name() + "' object is read-only");
    }
}

// ============================================================================
// Arithmetic
// ============================================================================

static void overflow_check(bool overflowed) {
    if (overflowed) throw ScriptError("OverflowError", "integer result out of range");
}

static int64_t checked_add(int64_t a, int64_t b) {
    int64_t r;
    overflow_check(__builtin_add_overflow(a, b, &r));
    return r;
}

static int64_t checked_sub(int64_t a, int64_t b) {
    int64_t r;
    overflow_check(__builtin_sub_overflow(a, b, &r));
    return r;
}

static int64_t checked_mul(int64_t a, int64_t b) {
    int64_t r;
    overflow_check(__builtin_mul_overflow(a, b, &r));
    return r;
}

static int64_t floor_div(int64_t a, int64_t b) {
    if (b == 0) throw ScriptError("ZeroDivisionError", "integer division or modulo by zero");
    if (a == INT64_MIN && b == -1) throw ScriptError("OverflowError", "integer result out of range");
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

static int64_t floor_mod(int64_t a, int64_t b) {
    if (b == 0) throw ScriptError("ZeroDivisionError", "integer division or modulo by zero");
    if (b == -1) return 0;
    int64_t r = a % b;
    if (r != 0 && ((r < 0) != (b < 0))) r += b;
    return r;
}

static int64_t int_pow(int64_t base, int64_t exponent) {
    int64_t result = 1;
    while (exponent > 0) {
        if (exponent & 1) {
            result = checked_mul(result, base);
        }
        exponent >>= 1;
        if (exponent > 0) {
            base = checked_mul(base, base);
        }
    }
    return result;
}

static void check_repeat(Interpreter& interp, size_t size, int64_t count) {
    if (size == 0) return;
    if (count > interp.limits().max_sequence_length / static_cast<int64_t>(size)) {
        interp.check_sequence_length(interp.limits().max_sequence_length + 1);
    }
    interp.check_sequence_length(static_cast<int64_t>(size) * count);
}

static Value repeat_sequence(Interpreter& interp, const Value& seq, int64_t count) {
    if (count < 0) count = 0;
    if (seq.is_str()) {
        const std::string& s = seq.as_str();
        check_repeat(interp, s.size(), count);
        std::string out;
        out.reserve(s.size() * static_cast<size_t>(count));
        for (int64_t i = 0; i < count; ++i) out += s;
        return Value::from_string(out);
    }
    const std::vector<Value>& items = seq.list().items;
    check_repeat(interp, items.size(), count);
    std::vector<Value> out;
    out.reserve(items.size() * static_cast<size_t>(count));
    for (int64_t i = 0; i < count; ++i) out.insert(out.end(), items.begin(), items.end());
    return seq.is_list() ? Value::new_list(out) : Value::new_tuple(out);
}

static Value set_operation(BinOp op, const Value& a, const Value& b) {
    const DictObject& x = a.dict();
    const DictObject& y = b.dict();
    Value out = Value::new_set();
    DictObject& r = out.dict();

    switch (op) {
        case BinOp::BITOR:
            for (size_t i = 0; i < x.entries.size(); ++i) r.set(x.entries[i].first, Value::none());
            for (size_t i = 0; i < y.entries.size(); ++i) r.set(y.entries[i].first, Value::none());
            break;
        case BinOp::BITAND:
            for (size_t i = 0; i < x.entries.size(); ++i) {
                if (y.find(x.entries[i].first)) r.set(x.entries[i].first, Value::none());
            }
            break;
        case BinOp::SUB:
            for (size_t i = 0; i < x.entries.size(); ++i) {
                if (!y.find(x.entries[i].first)) r.set(x.entries[i].first, Value::none());
            }
            break;
        case BinOp::BITXOR:
            for (size_t i = 0; i < x.entries.size(); ++i) {
                if (!y.find(x.entries[i].first)) r.set(x.entries[i].first, Value::none());
            }
            for (size_t i = 0; i < y.entries.size(); ++i) {
                if (!x.find(y.entries[i].first)) r.set(y.entries[i].first, Value::none());
            }
            break;
        default:
            break;
    }
    return out;
}

static ScriptError unsupported(BinOp op, const Value& a, const Value& b) {
    return ScriptError("TypeError", std::string("unsupported operand type(s) for ") + binop_symbol(op) +
                       ": '" + a.type_name() + "' and '" + b.type_name() + "'");
}

Value Interpreter::binary_op(BinOp op, const Value& a, const Value& b) {
    bool ints = (a.is_int() || a.is_bool()) && (b.is_int() || b.is_bool());
    bool numbers = a.is_number() && b.is_number();

    switch (op) {
        case BinOp::ADD:
            if (ints) return Value::from_int(checked_add(a.as_int(), b.as_int()));
            if (numbers) return Value::from_float(a.as_float() + b.as_float());
            if (a.is_str() && b.is_str()) {
                check_sequence_length(static_cast<int64_t>(a.as_str().size() + b.as_str().size()));
                return Value::from_string(a.as_str() + b.as_str());
            }
            if ((a.is_list() && b.is_list()) || (a.is_tuple() && b.is_tuple())) {
                std::vector<Value> items = a.list().items;
                items.insert(items.end(), b.list().items.begin(), b.list().items.end());
                check_sequence_length(static_cast<int64_t>(items.size()));
                return a.is_list() ? Value::new_list(items) : Value::new_tuple(items);
            }
            break;

        case BinOp::SUB:
            if (ints) return Value::from_int(checked_sub(a.as_int(), b.as_int()));
            if (numbers) return Value::from_float(a.as_float() - b.as_float());
            if (a.is_set() && b.is_set()) return set_operation(op, a, b);
            break;

        case BinOp::MUL:
            if (ints) return Value::from_int(checked_mul(a.as_int(), b.as_int()));
            if (numbers) return Value::from_float(a.as_float() * b.as_float());
            if ((a.is_str() || a.is_list() || a.is_tuple()) && (b.is_int() || b.is_bool())) {
                return repeat_sequence(*this, a, b.as_int());
            }
            if ((b.is_str() || b.is_list() || b.is_tuple()) && (a.is_int() || a.is_bool())) {
                return repeat_sequence(*this, b, a.as_int());
            }
            break;

        case BinOp::DIV:
            if (numbers) {
                if (b.as_float() == 0.0) throw ScriptError("ZeroDivisionError", "division by zero");
                return Value::from_float(a.as_float() / b.as_float());
            }
            break;

        case BinOp::FLOORDIV:
            if (ints) return Value::from_int(floor_div(a.as_int(), b.as_int()));
            if (numbers) {
                if (b.as_float() == 0.0) throw ScriptError("ZeroDivisionError", "float floor division by zero");
                return Value::from_float(std::floor(a.as_float() / b.as_float()));
            }
            break;

        case BinOp::MOD:
            if (ints) return Value::from_int(floor_mod(a.as_int(), b.as_int()));
            if (numbers) {
                double y = b.as_float();
                if (y == 0.0) throw ScriptError("ZeroDivisionError", "float modulo");
                double r = std::fmod(a.as_float(), y);
                if (r != 0.0 && ((r < 0) != (y < 0))) r += y;
                return Value::from_float(r);
            }
            if (a.is_str()) return Value::from_string(percent_format(*this, a.as_str(), b));
            break;

        case BinOp::POW:
            if (ints && b.as_int() >= 0) return Value::from_int(int_pow(a.as_int(), b.as_int()));
            if (numbers) {
                double x = a.as_float();
                double y = b.as_float();
                if (x == 0.0 && y < 0) {
                    throw ScriptError("ZeroDivisionError", "0.0 cannot be raised to a negative power");
                }
                double r = std::pow(x, y);
                if (std::isnan(r) && x < 0) {
                    throw ScriptError("ValueError", "negative number cannot be raised to a fractional power");
                }
                if (std::isinf(r) && !std::isinf(x) && !std::isinf(y)) {
                    throw ScriptError("OverflowError", "numerical result out of range");
                }
                return Value::from_float(r);
            }
            break;

        case BinOp::LSHIFT:
        case BinOp::RSHIFT:
            if (ints) {
                int64_t x = a.as_int();
                int64_t n = b.as_int();
                if (n < 0) throw ScriptError("ValueError", "negative shift count");
                if (op == BinOp::RSHIFT) {
                    if (n >= 63) return Value::from_int(x < 0 ? -1 : 0);
                    return Value::from_int(x >> n);
                }
                if (x == 0) return Value::from_int(0);
                if (n >= 63) throw ScriptError("OverflowError", "integer result out of range");
                int64_t r = static_cast<int64_t>(static_cast<uint64_t>(x) << n);
                if ((r >> n) != x) throw ScriptError("OverflowError", "integer result out of range");
                return Value::from_int(r);
            }
            break;

        case BinOp::BITAND:
        case BinOp::BITOR:
        case BinOp::BITXOR:
            if (a.is_bool() && b.is_bool()) {
                bool x = a.as_bool();
                bool y = b.as_bool();
                if (op == BinOp::BITAND) return Value::from_bool(x && y);
                if (op == BinOp::BITOR) return Value::from_bool(x || y);
                return Value::from_bool(x != y);
            }
            if (ints) {
                int64_t x = a.as_int();
                int64_t y = b.as_int();
                if (op == BinOp::BITAND) return Value::from_int(x & y);
                if (op == BinOp::BITOR) return Value::from_int(x | y);
                return Value::from_int(x ^ y);
            }
            if (a.is_set() && b.is_set()) return set_operation(op, a, b);
            if (op == BinOp::BITOR && a.is_dict() && b.is_dict()) {
                Value merged = Value::new_dict();
                for (size_t i = 0; i < a.dict().entries.size(); ++i) {
                    merged.dict().set(a.dict().entries[i].first, a.dict().entries[i].second);
                }
                for (size_t i = 0; i < b.dict().entries.size(); ++i) {
                    merged.dict().set(b.dict().entries[i].first, b.dict().entries[i].second);
                }
                return merged;
            }
            break;
    }
    throw unsupported(op, a, b);
}

// ============================================================================
// Comparison and membership
// ============================================================================

static bool is_subset(const Value& a, const Value& b) {
    for (size_t i = 0; i < a.dict().entries.size(); ++i) {
        if (!b.dict().find(a.dict().entries[i].first)) return false;
    }
    return true;
}

bool Interpreter::compare(CmpOp op, const Value& a, const Value& b) {
    switch (op) {
        case CmpOp::EQ: return a.equals(b);
        case CmpOp::NE: return !a.equals(b);
        case CmpOp::IS: return a.identical(b);
        case CmpOp::IS_NOT: return !a.identical(b);
        case CmpOp::IN: return contains(b, a);
        case CmpOp::NOT_IN: return !contains(b, a);
        case CmpOp::LT: return value_less(a, b);
        case CmpOp::GT: return value_less(b, a);
        case CmpOp::LE:
            if (a.is_set() && b.is_set()) return is_subset(a, b);
            if (a.is_float() || b.is_float()) {
                if (a.is_number() && b.is_number()) return a.as_float() <= b.as_float();
            }
            return value_less(a, b) || a.equals(b);
        case CmpOp::GE:
            if (a.is_set() && b.is_set()) return is_subset(b, a);
            if (a.is_float() || b.is_float()) {
                if (a.is_number() && b.is_number()) return a.as_float() >= b.as_float();
            }
            return value_less(b, a) || a.equals(b);
    }
    return false;
}

bool Interpreter::contains(const Value& container, const Value& item) {
    switch (container.type()) {
        case ValueType::STR:
            if (!item.is_str()) {
                throw ScriptError("TypeError", "'in <string>' requires string as left operand, not " + item.type_name());
            }
            return container.as_str().find(item.as_str()) != std::string::npos;
        case ValueType::LIST:
        case ValueType::TUPLE: {
            const std::vector<Value>& items = container.list().items;
            for (size_t i = 0; i < items.size(); ++i) {
                tick();
                if (items[i].equals(item)) return true;
            }
            return false;
        }
        case ValueType::DICT:
        case ValueType::SET:
            return container.dict().find(item) != nullptr;
        case ValueType::RANGE: {
            if (!(item.is_int() || item.is_bool())) {
                bool found = false;
                iterate(container, [&](const Value& v) -> bool {
                    found = v.equals(item);
                    return !found;
                });
                return found;
            }
            const RangeObject& r = container.range();
            int64_t x = item.as_int();
            if (r.step > 0 && (x < r.start || x >= r.stop)) return false;
            if (r.step < 0 && (x > r.start || x <= r.stop)) return false;
            return (x - r.start) % r.step == 0;
        }
        default:
            throw ScriptError("TypeError", "argument of type '" + container.type_name() + "' is not iterable");
    }
}

// ============================================================================
// Items
// ============================================================================

static int64_t sequence_index(const Value& container, const Value& index) {
    if (index.is_int() || index.is_bool()) return index.as_int();
    throw ScriptError("TypeError", container.type_name() + " indices must be integers or slices, not " +
                      index.type_name());
}

Value Interpreter::get_item(const Value& container, const Value& index) {
    switch (container.type()) {
        case ValueType::LIST:
        case ValueType::TUPLE: {
            const std::vector<Value>& items = container.list().items;
            return items[normalize_index(sequence_index(container, index), items.size(), container.type_name().c_str())];
        }
        case ValueType::STR: {
            const std::string& s = container.as_str();
            int64_t i = sequence_index(container, index);
            if (utf8::is_ascii(s)) {
                return Value::from_string(std::string(1, s[normalize_index(i, s.size(), "string")]));
            }
            size_t cp = normalize_index(i, utf8::length(s), "string");
            size_t begin = utf8::byte_offset(s, cp);
            size_t end = utf8::byte_offset(s, cp + 1);
            return Value::from_string(s.substr(begin, end - begin));
        }
        case ValueType::DICT: {
            const Value* found = container.dict().find(index);
            if (!found) throw ScriptError("KeyError", index.repr());
            return *found;
        }
        case ValueType::RANGE: {
            const RangeObject& r = container.range();
            size_t i = normalize_index(sequence_index(container, index), static_cast<size_t>(r.length()), "range object");
            return Value::from_int(r.at(static_cast<int64_t>(i)));
        }
        default:
            throw ScriptError("TypeError", "'" + container.type_name() + "' object is not subscriptable");
    }
}

void Interpreter::set_item(const Value& container, const Value& index, const Value& value) {
    if (container.is_list()) {
        require_mutable(container);
        std::vector<Value>& items = container.list().items;
        items[normalize_index(sequence_index(container, index), items.size(), "list assignment")] = value;
        return;
    }
    if (container.is_dict()) {
        require_mutable(container);
        container.dict().set(index, value);
        return;
    }
    throw ScriptError("TypeError", "'" + container.type_name() + "' object does not support item assignment");
}

void Interpreter::delete_item(const Value& container, const Value& index) {
    if (container.is_list()) {
        require_mutable(container);
        std::vector<Value>& items = container.list().items;
        size_t i = normalize_index(sequence_index(container, index), items.size(), "list assignment");
        items.erase(items.begin() + static_cast<std::ptrdiff_t>(i));
        return;
    }
    if (container.is_dict()) {
        require_mutable(container);
        if (!container.dict().erase(index)) throw ScriptError("KeyError", index.repr());
        return;
    }
    throw ScriptError("TypeError", "'" + container.type_name() + "' object does not support item deletion");
}

// ============================================================================
// Slices
// ============================================================================

Value Interpreter::get_slice(const Value& container, const Value& lower, const Value& upper, const Value& step) {
    switch (container.type()) {
        case ValueType::LIST:
        case ValueType::TUPLE: {
            const std::vector<Value>& items = container.list().items;
            std::vector<int64_t> pos = slice_positions(lower, upper, step, static_cast<int64_t>(items.size()));
            std::vector<Value> out;
            out.reserve(pos.size());
            for (size_t i = 0; i < pos.size(); ++i) out.push_back(items[static_cast<size_t>(pos[i])]);
            return container.is_list() ? Value::new_list(out) : Value::new_tuple(out);
        }
        case ValueType::STR: {
            const std::string& s = container.as_str();
            if (utf8::is_ascii(s)) {
                std::vector<int64_t> pos = slice_positions(lower, upper, step, static_cast<int64_t>(s.size()));
                std::string out;
                out.reserve(pos.size());
                for (size_t i = 0; i < pos.size(); ++i) out += s[static_cast<size_t>(pos[i])];
                return Value::from_string(out);
            }
            std::vector<std::string> chars = utf8::chars(s);
            std::vector<int64_t> pos = slice_positions(lower, upper, step, static_cast<int64_t>(chars.size()));
            std::string out;
            for (size_t i = 0; i < pos.size(); ++i) out += chars[static_cast<size_t>(pos[i])];
            return Value::from_string(out);
        }
        case ValueType::RANGE: {
            const RangeObject& r = container.range();
            int64_t start, stop, s;
            slice_bounds(lower, upper, step, r.length(), start, stop, s);
            int64_t count = 0;
            if (s > 0 && start < stop) count = (stop - start + s - 1) / s;
            if (s < 0 && start > stop) count = (start - stop - s - 1) / (-s);
            int64_t new_step = r.step * s;
            int64_t new_start = count > 0 ? r.at(start) : r.start;
            return Value::new_range(new_start, new_start + count * new_step, new_step);
        }
        default:
            throw ScriptError("TypeError", "'" + container.type_name() + "' object is not subscriptable");
    }
}

void Interpreter::set_slice(const Value& container, const Value& lower, const Value& upper, const Value& step,
                            const Value& value) {
    if (!container.is_list()) {
        throw ScriptError("TypeError", "'" + container.type_name() + "' object does not support slice assignment");
    }
    require_mutable(container);

    std::vector<Value> replacement = to_vector(value);
    std::vector<Value>& items = container.list().items;
    int64_t length = static_cast<int64_t>(items.size());
    int64_t start, stop, s;
    slice_bounds(lower, upper, step, length, start, stop, s);

    if (s == 1) {
        if (stop < start) stop = start;
        check_sequence_length(length - (stop - start) + static_cast<int64_t>(replacement.size()));
        items.erase(items.begin() + start, items.begin() + stop);
        items.insert(items.begin() + start, replacement.begin(), replacement.end());
        return;
    }

    std::vector<int64_t> pos = slice_positions(lower, upper, step, length);
    if (pos.size() != replacement.size()) {
        throw ScriptError("ValueError", "attempt to assign sequence of size " + std::to_string(replacement.size()) +
                          " to extended slice of size " + std::to_string(pos.size()));
    }
    for (size_t i = 0; i < pos.size(); ++i) items[static_cast<size_t>(pos[i])] = replacement[i];
}

void Interpreter::delete_slice(const Value& container, const Value& lower, const Value& upper, const Value& step) {
    if (!container.is_list()) {
        throw ScriptError("TypeError", "'" + container.type_name() + "' object does not support item deletion");
    }
    require_mutable(container);

    std::vector<Value>& items = container.list().items;
    std::vector<int64_t> pos = slice_positions(lower, upper, step, static_cast<int64_t>(items.size()));
    std::vector<bool> drop(items.size(), false);
    for (size_t i = 0; i < pos.size(); ++i) drop[static_cast<size_t>(pos[i])] = true;

    std::vector<Value> kept;
    kept.reserve(items.size() - pos.size());
    for (size_t i = 0; i < items.size(); ++i) {
        if (!drop[i]) kept.push_back(items[i]);
    }
    items.swap(kept);
}

} // namespace script
} // namespace gatedrepl
