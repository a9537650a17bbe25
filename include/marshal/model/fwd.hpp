#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for marshal_model module

#include <cstdint>
#include <memory>

namespace marshal_model {

// =============================================================================
// Value Types
// =============================================================================

struct Vec2;
struct Vec3;
struct Vec4;
struct Vec2Int;
struct Vec3Int;
struct Quat;
struct Color;
struct Color32;
struct Rect;
struct RectInt;
struct Bounds;

// =============================================================================
// Type Descriptors
// =============================================================================

enum class TypeKind : std::uint8_t;
enum class PrimitiveType : std::uint8_t;
enum class StructKind : std::uint8_t;
enum class ReferenceTarget : std::uint8_t;
enum class CollectionArity : std::uint8_t;

struct TypeDescriptor;
struct FieldDescriptor;
struct EnumMember;
class FlagTable;
class TypeRegistry;

using TypeDescriptorPtr = std::shared_ptr<const TypeDescriptor>;
using FlagTablePtr = std::shared_ptr<const FlagTable>;

// =============================================================================
// Typed Values
// =============================================================================

class TypedValue;
struct EnumValue;
struct MaskValue;
class ObjectRef;
struct CollectionValue;
struct CompositeValue;

// =============================================================================
// Object Model
// =============================================================================

class Object;
class Node;
class Component;
class Asset;
class ObjectModel;
class Scene;
class World;
class AssetDatabase;

using ObjectPtr = std::shared_ptr<Object>;
using NodePtr = std::shared_ptr<Node>;
using ComponentPtr = std::shared_ptr<Component>;
using AssetPtr = std::shared_ptr<Asset>;

} // namespace marshal_model
