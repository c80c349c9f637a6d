#include <runstream/value.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace runstream {

const char* value_type_name(ValueType type) {
    switch (type) {
        case ValueType::Null: return "null";
        case ValueType::Bool: return "bool";
        case ValueType::Integer: return "integer";
        case ValueType::Real: return "real";
        case ValueType::String: return "string";
        case ValueType::List: return "list";
        case ValueType::Object: return "object";
    }
    return "unknown";
}

// ValueObject

ValueObject::ValueObject(std::initializer_list<Entry> entries) {
    for (const auto& entry : entries) {
        set(entry.first, entry.second);
    }
}

bool ValueObject::contains(const std::string& key) const {
    return find(key) != nullptr;
}

Value* ValueObject::find(const std::string& key) {
    for (auto& entry : entries_) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

const Value* ValueObject::find(const std::string& key) const {
    for (const auto& entry : entries_) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

Value& ValueObject::at(const std::string& key) {
    if (Value* value = find(key)) {
        return *value;
    }
    throw KeyError(key);
}

const Value& ValueObject::at(const std::string& key) const {
    if (const Value* value = find(key)) {
        return *value;
    }
    throw KeyError(key);
}

Value& ValueObject::operator[](const std::string& key) {
    if (Value* value = find(key)) {
        return *value;
    }
    entries_.emplace_back(key, Value{});
    return entries_.back().second;
}

void ValueObject::set(const std::string& key, Value value) {
    if (Value* existing = find(key)) {
        *existing = std::move(value);
    } else {
        entries_.emplace_back(key, std::move(value));
    }
}

bool ValueObject::erase(const std::string& key) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&key](const Entry& entry) { return entry.first == key; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

std::optional<Value> ValueObject::take(const std::string& key) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&key](const Entry& entry) { return entry.first == key; });
    if (it == entries_.end()) {
        return std::nullopt;
    }
    Value value = std::move(it->second);
    entries_.erase(it);
    return value;
}

std::vector<std::string> ValueObject::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

bool ValueObject::operator==(const ValueObject& other) const {
    if (entries_.size() != other.entries_.size()) {
        return false;
    }
    for (const auto& entry : entries_) {
        const Value* theirs = other.find(entry.first);
        if (!theirs || *theirs != entry.second) {
            return false;
        }
    }
    return true;
}

// Value

namespace {

[[noreturn]] void throw_wrong_type(const char* expected, ValueType actual) {
    throw TypeError(std::string("expected ") + expected + ", got " + value_type_name(actual));
}

void escape_string(std::ostringstream& out, const std::string& text) {
    out << '"';
    for (char c : text) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buffer[8];
                    snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(c));
                    out << buffer;
                } else {
                    out << c;
                }
        }
    }
    out << '"';
}

void render(std::ostringstream& out, const Value& value) {
    switch (value.type()) {
        case ValueType::Null:
            out << "null";
            break;
        case ValueType::Bool:
            out << (value.get<bool>() ? "true" : "false");
            break;
        case ValueType::Integer:
            out << value.get<int64_t>();
            break;
        case ValueType::Real: {
            double real = value.get<double>();
            if (std::isfinite(real) && real == std::floor(real) && std::fabs(real) < 1e15) {
                // Keep the real-ness visible: 2.0 rather than 2
                char buffer[32];
                snprintf(buffer, sizeof(buffer), "%.1f", real);
                out << buffer;
            } else {
                char buffer[32];
                snprintf(buffer, sizeof(buffer), "%.17g", real);
                out << buffer;
            }
            break;
        }
        case ValueType::String:
            escape_string(out, value.get<std::string>());
            break;
        case ValueType::List: {
            out << '[';
            bool first = true;
            for (const auto& item : value.get<ValueList>()) {
                if (!first) out << ", ";
                first = false;
                render(out, item);
            }
            out << ']';
            break;
        }
        case ValueType::Object: {
            out << '{';
            bool first = true;
            for (const auto& [key, item] : value.get<ValueObject>()) {
                if (!first) out << ", ";
                first = false;
                escape_string(out, key);
                out << ": ";
                render(out, item);
            }
            out << '}';
            break;
        }
    }
}

} // anonymous namespace

bool Value::as_bool() const {
    if (!is_bool()) throw_wrong_type("bool", type());
    return get<bool>();
}

int64_t Value::as_integer() const {
    if (!is_integer()) throw_wrong_type("integer", type());
    return get<int64_t>();
}

double Value::as_real() const {
    if (is_integer()) return static_cast<double>(get<int64_t>());
    if (!is_real()) throw_wrong_type("real", type());
    return get<double>();
}

const std::string& Value::as_string() const {
    if (!is_string()) throw_wrong_type("string", type());
    return get<std::string>();
}

const ValueList& Value::as_list() const {
    if (!is_list()) throw_wrong_type("list", type());
    return get<ValueList>();
}

ValueList& Value::as_list() {
    if (!is_list()) throw_wrong_type("list", type());
    return get<ValueList>();
}

const ValueObject& Value::as_object() const {
    if (!is_object()) throw_wrong_type("object", type());
    return get<ValueObject>();
}

ValueObject& Value::as_object() {
    if (!is_object()) throw_wrong_type("object", type());
    return get<ValueObject>();
}

bool Value::truthy() const {
    switch (type()) {
        case ValueType::Null: return false;
        case ValueType::Bool: return get<bool>();
        case ValueType::Integer: return get<int64_t>() != 0;
        case ValueType::Real: return get<double>() != 0.0;
        case ValueType::String: return !get<std::string>().empty();
        case ValueType::List: return !get<ValueList>().empty();
        case ValueType::Object: return !get<ValueObject>().empty();
    }
    return false;
}

std::string Value::to_string() const {
    std::ostringstream out;
    render(out, *this);
    return out.str();
}

bool Value::operator==(const Value& other) const {
    // 1 and 1.0 compare equal, as the tracer does not distinguish them
    if (is_number() && other.is_number() && type() != other.type()) {
        return as_real() == other.as_real();
    }
    return data == other.data;
}

} // namespace runstream
