#pragma once

/// @file type_descriptor.hpp
/// @brief Target type descriptors derived from host reflection

#include "fwd.hpp"
#include "type_kind.hpp"
#include "typed_value.hpp"
#include "flag_table.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace marshal_model {

// =============================================================================
// Members and Fields
// =============================================================================

/// Named enumeration member
struct EnumMember {
    std::string name;
    std::int64_t value = 0;

    EnumMember() = default;
    EnumMember(std::string n, std::int64_t v) : name(std::move(n)), value(v) {}
};

/// Reflected field of a composite type
struct FieldDescriptor {
    std::string name;
    TypeDescriptorPtr type;
    std::optional<TypedValue> default_value;  // Type default when unset
    bool internal = false;                    // Never serialized or assigned from payloads

    FieldDescriptor() = default;
    FieldDescriptor(std::string n, TypeDescriptorPtr t)
        : name(std::move(n)), type(std::move(t)) {}
    FieldDescriptor(std::string n, TypeDescriptorPtr t, TypedValue def)
        : name(std::move(n)), type(std::move(t)), default_value(std::move(def)) {}

    /// Mark as internal
    FieldDescriptor& as_internal() {
        internal = true;
        return *this;
    }
};

// =============================================================================
// TypeDescriptor
// =============================================================================

/// Static description of the type a conversion must produce.
/// Descriptors are immutable once built and shared by pointer.
struct TypeDescriptor {
    TypeKind kind = TypeKind::Primitive;
    std::string name;

    // For Primitive
    PrimitiveType primitive_type = PrimitiveType::Bool;

    // For Struct
    StructKind struct_kind = StructKind::Vec3;

    // For Enum
    std::vector<EnumMember> members;
    bool flags = false;  // Members combine with bitwise OR

    // For Mask
    FlagTablePtr flag_table;

    // For Reference
    ReferenceTarget reference_target = ReferenceTarget::Any;
    std::string referenced_type;

    // For Collection
    TypeDescriptorPtr element_type;
    CollectionArity arity = CollectionArity::Growable;

    // For Composite
    std::vector<FieldDescriptor> fields;

    /// Factory methods
    [[nodiscard]] static TypeDescriptorPtr primitive(PrimitiveType ptype);
    [[nodiscard]] static TypeDescriptorPtr structure(StructKind skind);
    [[nodiscard]] static TypeDescriptorPtr enumeration(std::string enum_name,
                                                       std::vector<EnumMember> enum_members,
                                                       bool is_flags = false);
    [[nodiscard]] static TypeDescriptorPtr mask(std::string mask_name, FlagTablePtr table);
    [[nodiscard]] static TypeDescriptorPtr reference(std::string target_type, ReferenceTarget target);
    [[nodiscard]] static TypeDescriptorPtr collection(TypeDescriptorPtr element, CollectionArity collection_arity);
    [[nodiscard]] static TypeDescriptorPtr composite(std::string composite_name,
                                                     std::vector<FieldDescriptor> composite_fields);

    [[nodiscard]] bool is(TypeKind k) const noexcept { return kind == k; }

    /// Case-insensitive member lookup
    [[nodiscard]] const EnumMember* find_member(std::string_view member_name) const;

    /// First member with the given value
    [[nodiscard]] const EnumMember* find_member(std::int64_t member_value) const;

    [[nodiscard]] const FieldDescriptor* find_field(std::string_view field_name) const;
};

// =============================================================================
// Descriptor Utilities
// =============================================================================

/// Default of any descriptor: zero numbers, empty string, zero-valued enum,
/// empty mask, absent reference, empty collection, composite of field defaults.
/// A null descriptor yields an absent value.
[[nodiscard]] TypedValue default_value(const TypeDescriptorPtr& type);

/// True if the runtime alternative of `value` is what `type` produces
[[nodiscard]] bool matches(const TypedValue& value, const TypeDescriptor& type);

/// Case-insensitive ASCII comparison
[[nodiscard]] bool iequals(std::string_view a, std::string_view b);

} // namespace marshal_model
