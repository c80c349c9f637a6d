#include <runstream/accumulate.hpp>
#include <limits>
#include <string>

namespace runstream {

namespace {

bool add_overflows(int64_t a, int64_t b) {
    if (b > 0) {
        return a > std::numeric_limits<int64_t>::max() - b;
    }
    return a < std::numeric_limits<int64_t>::min() - b;
}

[[noreturn]] void throw_unsupported(const Value& left, const Value& right) {
    throw TypeError(std::string("unsupported operand types for +: ") +
                    value_type_name(left.type()) + " and " + value_type_name(right.type()));
}

} // anonymous namespace

Value add_values(const Value& left, const Value& right) {
    // Booleans are flags, not counters
    if (left.is_bool() || right.is_bool()) {
        throw_unsupported(left, right);
    }

    if (left.is_integer() && right.is_integer()) {
        int64_t a = left.get<int64_t>();
        int64_t b = right.get<int64_t>();
        // Sums outside int64 widen to real
        if (!add_overflows(a, b)) {
            return Value(a + b);
        }
    }
    if (left.is_number() && right.is_number()) {
        return Value(left.as_real() + right.as_real());
    }
    if (left.is_string() && right.is_string()) {
        return Value(left.get<std::string>() + right.get<std::string>());
    }
    if (left.is_list() && right.is_list()) {
        ValueList joined = left.get<ValueList>();
        const auto& tail = right.get<ValueList>();
        joined.insert(joined.end(), tail.begin(), tail.end());
        return Value(std::move(joined));
    }
    if (left.is_object() && right.is_object()) {
        return Value(merge_objects(left.get<ValueObject>(), right.get<ValueObject>()));
    }

    throw_unsupported(left, right);
}

Value combine(const Value& left, const Value& right) {
    if (left.is_null()) {
        return right;
    }
    if (right.is_null()) {
        return left;
    }
    try {
        return add_values(left, right);
    } catch (const TypeError&) {
        return right;
    }
}

ValueObject merge_objects(const ValueObject& left, const ValueObject& right) {
    ValueObject merged = left;
    for (const auto& [key, value] : right) {
        Value* existing = merged.find(key);
        if (!existing) {
            merged.set(key, value);
        } else {
            *existing = combine(*existing, value);
        }
    }
    return merged;
}

Value accumulate(const std::vector<Value>& values) {
    return accumulate(values.begin(), values.end());
}

Value accumulate(Source<Value>& source) {
    Value total;
    while (auto item = source.next()) {
        total = combine(total, *item);
    }
    return total;
}

} // namespace runstream
