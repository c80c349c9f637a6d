#ifndef RUNSTREAM_VALUE_HPP
#define RUNSTREAM_VALUE_HPP

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

/**
 * Dynamic tree values for the run-state log.
 * Mirrors the shapes a tracer emits: null, booleans, integers, reals,
 * strings, lists and string-keyed objects nested to any depth.
 */
namespace runstream {

// Exception types for structured error handling
class RunStreamError : public std::runtime_error {
public:
    explicit RunStreamError(const std::string& message)
        : std::runtime_error(message) {}
};

class TypeError : public RunStreamError {
public:
    explicit TypeError(const std::string& message)
        : RunStreamError("Type error: " + message) {}
};

class KeyError : public RunStreamError {
public:
    explicit KeyError(const std::string& key)
        : RunStreamError("Key error: '" + key + "' not found"), key_(key) {}

    const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

enum class ValueType : uint8_t {
    Null,
    Bool,
    Integer,
    Real,
    String,
    List,
    Object
};

const char* value_type_name(ValueType type);

struct Value;

using ValueList = std::vector<Value>;

/**
 * String-keyed mapping that keeps keys in insertion order.
 * Replacing the value of an existing key keeps its position.
 */
class ValueObject {
public:
    using Entry = std::pair<std::string, Value>;
    using Entries = std::vector<Entry>;
    using iterator = Entries::iterator;
    using const_iterator = Entries::const_iterator;

    ValueObject() = default;
    ValueObject(std::initializer_list<Entry> entries);

    size_t size() const noexcept;
    bool empty() const noexcept;

    bool contains(const std::string& key) const;
    Value* find(const std::string& key);
    const Value* find(const std::string& key) const;

    // Throws KeyError when absent
    Value& at(const std::string& key);
    const Value& at(const std::string& key) const;

    // Inserts null when absent
    Value& operator[](const std::string& key);

    void set(const std::string& key, Value value);
    bool erase(const std::string& key);

    // Removes the key and hands back its value
    std::optional<Value> take(const std::string& key);

    std::vector<std::string> keys() const;

    iterator begin();
    iterator end();
    const_iterator begin() const;
    const_iterator end() const;

    // Key order does not take part in equality
    bool operator==(const ValueObject& other) const;
    bool operator!=(const ValueObject& other) const { return !(*this == other); }

private:
    Entries entries_;
};

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmaybe-uninitialized"
#endif
struct Value {
    std::variant<
        std::monostate,   // Null / empty marker
        bool,
        int64_t,
        double,
        std::string,
        ValueList,
        ValueObject
    > data;

    Value() : data(std::monostate{}) {}
    Value(std::nullptr_t) : data(std::monostate{}) {}
    Value(bool value) : data(value) {}
    Value(int value) : data(static_cast<int64_t>(value)) {}
    Value(long value) : data(static_cast<int64_t>(value)) {}
    Value(long long value) : data(static_cast<int64_t>(value)) {}
    Value(double value) : data(value) {}
    Value(const char* value) : data(std::string(value)) {}
    Value(std::string value) : data(std::move(value)) {}
    Value(ValueList value) : data(std::move(value)) {}
    Value(ValueObject value) : data(std::move(value)) {}

    template<typename T>
    T& get() { return std::get<T>(data); }

    template<typename T>
    const T& get() const { return std::get<T>(data); }

    template<typename T>
    bool holds() const { return std::holds_alternative<T>(data); }

    ValueType type() const { return static_cast<ValueType>(data.index()); }

    bool is_null() const { return holds<std::monostate>(); }
    bool is_bool() const { return holds<bool>(); }
    bool is_integer() const { return holds<int64_t>(); }
    bool is_real() const { return holds<double>(); }
    bool is_number() const { return is_integer() || is_real(); }
    bool is_string() const { return holds<std::string>(); }
    bool is_list() const { return holds<ValueList>(); }
    bool is_object() const { return holds<ValueObject>(); }

    // Checked accessors, throw TypeError on the wrong alternative
    bool as_bool() const;
    int64_t as_integer() const;
    double as_real() const;  // accepts integers
    const std::string& as_string() const;
    const ValueList& as_list() const;
    ValueList& as_list();
    const ValueObject& as_object() const;
    ValueObject& as_object();

    // Null, false, zero and empty containers are falsy
    bool truthy() const;

    // Compact JSON-like rendering
    std::string to_string() const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }
};
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

// Defined after Value so the entry type is complete
inline size_t ValueObject::size() const noexcept { return entries_.size(); }
inline bool ValueObject::empty() const noexcept { return entries_.empty(); }
inline ValueObject::iterator ValueObject::begin() { return entries_.begin(); }
inline ValueObject::iterator ValueObject::end() { return entries_.end(); }
inline ValueObject::const_iterator ValueObject::begin() const { return entries_.begin(); }
inline ValueObject::const_iterator ValueObject::end() const { return entries_.end(); }

} // namespace runstream

#endif // RUNSTREAM_VALUE_HPP
