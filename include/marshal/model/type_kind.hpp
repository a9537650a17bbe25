#pragma once

/// @file type_kind.hpp
/// @brief Discriminators used by type descriptors and typed values

#include "fwd.hpp"
#include <cstdint>

namespace marshal_model {

// =============================================================================
// TypeKind
// =============================================================================

/// Descriptor family
enum class TypeKind : std::uint8_t {
    Primitive,
    Enum,
    Struct,
    Mask,
    Reference,
    Collection,
    Composite,
};

[[nodiscard]] inline const char* type_kind_name(TypeKind kind) {
    switch (kind) {
        case TypeKind::Primitive: return "Primitive";
        case TypeKind::Enum: return "Enum";
        case TypeKind::Struct: return "Struct";
        case TypeKind::Mask: return "Mask";
        case TypeKind::Reference: return "Reference";
        case TypeKind::Collection: return "Collection";
        case TypeKind::Composite: return "Composite";
        default: return "Unknown";
    }
}

// =============================================================================
// PrimitiveType
// =============================================================================

/// Primitive type enumeration
enum class PrimitiveType : std::uint8_t {
    Bool,
    I8, I16, I32, I64,
    U8, U16, U32, U64,
    F32, F64,
    Char,
    String,
};

/// Host-facing primitive type name
[[nodiscard]] inline const char* primitive_type_name(PrimitiveType type) {
    switch (type) {
        case PrimitiveType::Bool: return "bool";
        case PrimitiveType::I8: return "sbyte";
        case PrimitiveType::I16: return "short";
        case PrimitiveType::I32: return "int";
        case PrimitiveType::I64: return "long";
        case PrimitiveType::U8: return "byte";
        case PrimitiveType::U16: return "ushort";
        case PrimitiveType::U32: return "uint";
        case PrimitiveType::U64: return "ulong";
        case PrimitiveType::F32: return "float";
        case PrimitiveType::F64: return "double";
        case PrimitiveType::Char: return "char";
        case PrimitiveType::String: return "string";
        default: return "unknown";
    }
}

[[nodiscard]] inline bool is_integral(PrimitiveType type) {
    switch (type) {
        case PrimitiveType::I8: case PrimitiveType::I16:
        case PrimitiveType::I32: case PrimitiveType::I64:
        case PrimitiveType::U8: case PrimitiveType::U16:
        case PrimitiveType::U32: case PrimitiveType::U64:
            return true;
        default:
            return false;
    }
}

// =============================================================================
// StructKind
// =============================================================================

/// Built-in fixed-shape value types
enum class StructKind : std::uint8_t {
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
};

[[nodiscard]] inline const char* struct_kind_name(StructKind kind) {
    switch (kind) {
        case StructKind::Vec2: return "Vector2";
        case StructKind::Vec3: return "Vector3";
        case StructKind::Vec4: return "Vector4";
        case StructKind::Vec2Int: return "Vector2Int";
        case StructKind::Vec3Int: return "Vector3Int";
        case StructKind::Quat: return "Quaternion";
        case StructKind::Color: return "Color";
        case StructKind::Color32: return "Color32";
        case StructKind::Rect: return "Rect";
        case StructKind::RectInt: return "RectInt";
        case StructKind::Bounds: return "Bounds";
        default: return "Unknown";
    }
}

// =============================================================================
// References and Collections
// =============================================================================

/// What a reference field may point at
enum class ReferenceTarget : std::uint8_t {
    Node,
    Component,
    Asset,
    Any,
};

/// Which lookup produced a reference
enum class RefOrigin : std::uint8_t {
    None,
    Hierarchy,
    Asset,
};

/// Fixed arrays vs growable lists
enum class CollectionArity : std::uint8_t {
    Fixed,
    Growable,
};

} // namespace marshal_model
