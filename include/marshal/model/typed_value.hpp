#pragma once

/// @file typed_value.hpp
/// @brief Concrete host-model values produced by conversion

#include "fwd.hpp"
#include "math.hpp"
#include "type_kind.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace marshal_model {

// =============================================================================
// Compound Alternatives
// =============================================================================

/// Value of an enumeration (may hold an unnamed underlying value)
struct EnumValue {
    TypeDescriptorPtr type;
    std::int64_t value = 0;

    /// Member name, empty if the value is unnamed
    [[nodiscard]] std::string name() const;

    bool operator==(const EnumValue& other) const;
};

/// Bitmask value bound to its name table
struct MaskValue {
    FlagTablePtr table;
    std::uint32_t bits = 0;

    /// Decoded names (bit index for unnamed bits)
    [[nodiscard]] std::vector<std::string> names() const;

    bool operator==(const MaskValue& other) const { return bits == other.bits; }
};

/// Reference to a host object.
/// Hierarchy objects are held weakly so a destroyed node reads as absent;
/// assets are held strongly since a disk load has no other owner.
class ObjectRef {
public:
    ObjectRef() = default;

    [[nodiscard]] static ObjectRef from_hierarchy(const ObjectPtr& object);
    [[nodiscard]] static ObjectRef from_asset(ObjectPtr object);

    [[nodiscard]] ObjectPtr get() const;

    template<typename T>
    [[nodiscard]] std::shared_ptr<T> get_as() const {
        return std::dynamic_pointer_cast<T>(get());
    }

    [[nodiscard]] bool is_absent() const { return get() == nullptr; }
    [[nodiscard]] RefOrigin origin() const noexcept { return m_origin; }

    /// Same object (two absent references are equal)
    bool operator==(const ObjectRef& other) const { return get() == other.get(); }

private:
    ObjectPtr m_strong;
    std::weak_ptr<Object> m_weak;
    RefOrigin m_origin = RefOrigin::None;
};

/// Ordered sequence; length comes from the input
struct CollectionValue {
    TypeDescriptorPtr element_type;
    CollectionArity arity = CollectionArity::Growable;
    std::vector<TypedValue> items;

    bool operator==(const CollectionValue& other) const;
};

/// Instance of a composite type; fields kept in declaration order
struct CompositeValue {
    using Field = std::pair<std::string, TypedValue>;

    TypeDescriptorPtr type;
    std::vector<Field> fields;

    [[nodiscard]] const TypedValue* get(std::string_view name) const;
    [[nodiscard]] TypedValue* get(std::string_view name);

    /// Replace a field value or append a new field
    void set(std::string name, TypedValue value);

    bool operator==(const CompositeValue& other) const;
};

// =============================================================================
// TypedValue
// =============================================================================

namespace detail {

template<typename T, typename Variant>
struct is_alternative;

template<typename T, typename... Ts>
struct is_alternative<T, std::variant<Ts...>> : std::disjunction<std::is_same<T, Ts>...> {};

} // namespace detail

/// Closed variant over everything a converter can produce
class TypedValue {
public:
    using Variant = std::variant<
        std::monostate,   // Absent
        bool,
        std::int8_t,
        std::int16_t,
        std::int32_t,
        std::int64_t,
        std::uint8_t,
        std::uint16_t,
        std::uint32_t,
        std::uint64_t,
        float,
        double,
        char,
        std::string,
        Vec2,
        Vec3,
        Vec4,
        Vec2Int,
        Vec3Int,
        Quat,
        Color,
        Color32,
        Rect,
        RectInt,
        Bounds,
        EnumValue,
        MaskValue,
        ObjectRef,
        CollectionValue,
        CompositeValue
    >;

    /// Absent value
    TypedValue() = default;

    /// Exact alternatives only; no implicit numeric conversion
    template<typename T,
             typename = std::enable_if_t<detail::is_alternative<std::decay_t<T>, Variant>::value>>
    TypedValue(T&& value) : m_data(std::in_place_type<std::decay_t<T>>, std::forward<T>(value)) {}

    TypedValue(const char* value) : m_data(std::in_place_type<std::string>, value) {}

    [[nodiscard]] static TypedValue absent() { return TypedValue{}; }

    [[nodiscard]] bool is_absent() const noexcept {
        return std::holds_alternative<std::monostate>(m_data);
    }

    template<typename T>
    [[nodiscard]] bool is() const noexcept {
        return std::holds_alternative<T>(m_data);
    }

    /// Throws std::bad_variant_access on mismatch
    template<typename T>
    [[nodiscard]] const T& get() const { return std::get<T>(m_data); }

    template<typename T>
    [[nodiscard]] T& get() { return std::get<T>(m_data); }

    template<typename T>
    [[nodiscard]] const T* try_get() const noexcept { return std::get_if<T>(&m_data); }

    template<typename T>
    [[nodiscard]] T* try_get() noexcept { return std::get_if<T>(&m_data); }

    /// Runtime type name ("float", "Vector3", enum or composite name, ...)
    [[nodiscard]] std::string type_name() const;

    [[nodiscard]] const Variant& variant() const noexcept { return m_data; }

    bool operator==(const TypedValue& other) const { return m_data == other.m_data; }
    bool operator!=(const TypedValue& other) const { return !(m_data == other.m_data); }

private:
    Variant m_data;
};

} // namespace marshal_model
