#pragma once

/// @file value.hpp
/// @brief Dynamically-typed External Value exchanged with callers

#include "fwd.hpp"
#include <cstdint>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace marshal_value {

// =============================================================================
// ValueType
// =============================================================================

/// Value type discriminator (matches variant index)
enum class ValueType : std::uint8_t {
    Null = 0,
    Bool,
    Int,
    Float,
    String,
    Array,
    Object,
};

/// Get string name for value type
[[nodiscard]] inline const char* value_type_name(ValueType type) noexcept {
    switch (type) {
        case ValueType::Null: return "Null";
        case ValueType::Bool: return "Bool";
        case ValueType::Int: return "Int";
        case ValueType::Float: return "Float";
        case ValueType::String: return "String";
        case ValueType::Array: return "Array";
        case ValueType::Object: return "Object";
        default: return "Unknown";
    }
}

// =============================================================================
// ValueObject
// =============================================================================

/// String-keyed map that keeps insertion order.
/// Keys are unique; setting an existing key replaces its value in place.
/// Equality ignores order.
class ValueObject {
public:
    using Entry = std::pair<std::string, Value>;
    using Storage = std::vector<Entry>;
    using iterator = Storage::iterator;
    using const_iterator = Storage::const_iterator;

    ValueObject() = default;
    ValueObject(std::initializer_list<Entry> entries);

    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }

    [[nodiscard]] bool contains(std::string_view key) const noexcept;

    /// Lookup (nullptr if absent)
    [[nodiscard]] const Value* find(std::string_view key) const noexcept;
    [[nodiscard]] Value* find(std::string_view key) noexcept;

    /// Lookup (throws std::out_of_range if absent)
    [[nodiscard]] const Value& at(std::string_view key) const;

    /// Insert or replace
    Value& set(std::string key, Value value);

    /// Insert null if absent
    Value& operator[](const std::string& key);

    /// Remove key, returns false if it was absent
    bool erase(std::string_view key);

    /// Keys in insertion order
    [[nodiscard]] std::vector<std::string> keys() const;

    iterator begin() noexcept { return m_entries.begin(); }
    iterator end() noexcept { return m_entries.end(); }
    [[nodiscard]] const_iterator begin() const noexcept { return m_entries.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return m_entries.end(); }

    bool operator==(const ValueObject& other) const;
    bool operator!=(const ValueObject& other) const { return !(*this == other); }

private:
    Storage m_entries;
};

// =============================================================================
// Value
// =============================================================================

/// External Value: null | bool | int | float | string | array | object
class Value {
public:
    using Variant = std::variant<
        std::monostate,      // Null
        bool,                // Bool
        std::int64_t,        // Int
        double,              // Float
        std::string,         // String
        ValueArray,          // Array
        ValueObject          // Object
    >;

    /// Default constructor creates null
    Value() : m_data(std::monostate{}) {}
    Value(std::nullptr_t) : m_data(std::monostate{}) {}

    Value(bool v) : m_data(v) {}

    /// Integers widen to 64 bits
    Value(int v) : m_data(static_cast<std::int64_t>(v)) {}
    Value(std::uint32_t v) : m_data(static_cast<std::int64_t>(v)) {}
    Value(std::int64_t v) : m_data(v) {}
    Value(std::uint64_t v) : m_data(static_cast<std::int64_t>(v)) {}

    /// Floats widen to double
    Value(float v) : m_data(static_cast<double>(v)) {}
    Value(double v) : m_data(v) {}

    Value(const char* v) : m_data(std::string(v)) {}
    Value(std::string v) : m_data(std::move(v)) {}
    Value(std::string_view v) : m_data(std::string(v)) {}

    Value(ValueArray v) : m_data(std::move(v)) {}
    Value(ValueObject v) : m_data(std::move(v)) {}

    // -------------------------------------------------------------------------
    // Factory methods
    // -------------------------------------------------------------------------

    [[nodiscard]] static Value null() { return Value{}; }

    /// Create array from initializer list
    [[nodiscard]] static Value array(std::initializer_list<Value> values) {
        return Value(ValueArray(values));
    }

    /// Create object from key/value pairs
    [[nodiscard]] static Value object(std::initializer_list<ValueObject::Entry> entries) {
        return Value(ValueObject(entries));
    }

    [[nodiscard]] static Value empty_array() { return Value(ValueArray{}); }
    [[nodiscard]] static Value empty_object() { return Value(ValueObject{}); }

    // -------------------------------------------------------------------------
    // Type checking
    // -------------------------------------------------------------------------

    [[nodiscard]] ValueType type() const noexcept {
        return static_cast<ValueType>(m_data.index());
    }

    [[nodiscard]] const char* type_name() const noexcept {
        return value_type_name(type());
    }

    [[nodiscard]] bool is_null() const noexcept {
        return std::holds_alternative<std::monostate>(m_data);
    }

    [[nodiscard]] bool is_bool() const noexcept {
        return std::holds_alternative<bool>(m_data);
    }

    [[nodiscard]] bool is_int() const noexcept {
        return std::holds_alternative<std::int64_t>(m_data);
    }

    [[nodiscard]] bool is_float() const noexcept {
        return std::holds_alternative<double>(m_data);
    }

    /// Int or Float
    [[nodiscard]] bool is_number() const noexcept {
        return is_int() || is_float();
    }

    [[nodiscard]] bool is_string() const noexcept {
        return std::holds_alternative<std::string>(m_data);
    }

    [[nodiscard]] bool is_array() const noexcept {
        return std::holds_alternative<ValueArray>(m_data);
    }

    [[nodiscard]] bool is_object() const noexcept {
        return std::holds_alternative<ValueObject>(m_data);
    }

    // -------------------------------------------------------------------------
    // Accessors (throw std::bad_variant_access on mismatch)
    // -------------------------------------------------------------------------

    [[nodiscard]] bool as_bool() const { return std::get<bool>(m_data); }
    [[nodiscard]] std::int64_t as_int() const { return std::get<std::int64_t>(m_data); }
    [[nodiscard]] double as_float() const { return std::get<double>(m_data); }

    /// Int or Float as double
    [[nodiscard]] double as_number() const {
        if (is_int()) {
            return static_cast<double>(as_int());
        }
        return as_float();
    }

    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(m_data); }
    [[nodiscard]] const ValueArray& as_array() const { return std::get<ValueArray>(m_data); }
    [[nodiscard]] ValueArray& as_array_mut() { return std::get<ValueArray>(m_data); }
    [[nodiscard]] const ValueObject& as_object() const { return std::get<ValueObject>(m_data); }
    [[nodiscard]] ValueObject& as_object_mut() { return std::get<ValueObject>(m_data); }

    // -------------------------------------------------------------------------
    // Optional accessors (nullopt / nullptr on mismatch)
    // -------------------------------------------------------------------------

    [[nodiscard]] std::optional<bool> try_bool() const noexcept {
        if (auto* p = std::get_if<bool>(&m_data)) return *p;
        return std::nullopt;
    }

    [[nodiscard]] std::optional<std::int64_t> try_int() const noexcept {
        if (auto* p = std::get_if<std::int64_t>(&m_data)) return *p;
        return std::nullopt;
    }

    [[nodiscard]] std::optional<double> try_float() const noexcept {
        if (auto* p = std::get_if<double>(&m_data)) return *p;
        return std::nullopt;
    }

    [[nodiscard]] std::optional<double> try_number() const noexcept {
        if (auto* i = std::get_if<std::int64_t>(&m_data)) return static_cast<double>(*i);
        if (auto* d = std::get_if<double>(&m_data)) return *d;
        return std::nullopt;
    }

    [[nodiscard]] const std::string* try_string() const noexcept {
        return std::get_if<std::string>(&m_data);
    }

    [[nodiscard]] const ValueArray* try_array() const noexcept {
        return std::get_if<ValueArray>(&m_data);
    }

    [[nodiscard]] const ValueObject* try_object() const noexcept {
        return std::get_if<ValueObject>(&m_data);
    }

    // -------------------------------------------------------------------------
    // Container operations
    // -------------------------------------------------------------------------

    /// Element count of array or object, 0 otherwise
    [[nodiscard]] std::size_t size() const noexcept;

    /// Array index access (throws if not array or out of bounds)
    [[nodiscard]] const Value& operator[](std::size_t index) const;
    [[nodiscard]] Value& operator[](std::size_t index);

    /// Object key access (throws if not object or key absent)
    [[nodiscard]] const Value& operator[](const std::string& key) const;

    /// Object key access mutable (inserts null if absent)
    [[nodiscard]] Value& operator[](const std::string& key);

    [[nodiscard]] bool contains(std::string_view key) const noexcept;

    /// Object member or nullptr
    [[nodiscard]] const Value* get(std::string_view key) const noexcept;

    /// Append to array (throws if not array)
    void push_back(Value value);

    // -------------------------------------------------------------------------
    // Comparison
    // -------------------------------------------------------------------------

    bool operator==(const Value& other) const { return m_data == other.m_data; }
    bool operator!=(const Value& other) const { return !(m_data == other.m_data); }

    [[nodiscard]] const Variant& variant() const noexcept { return m_data; }

private:
    Variant m_data;
};

} // namespace marshal_value
