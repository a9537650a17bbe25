/// @file typed_value.cpp
/// @brief TypedValue alternatives implementation

#include <marshal/model/typed_value.hpp>
#include <marshal/model/type_descriptor.hpp>
#include <marshal/model/flag_table.hpp>
#include <marshal/model/object.hpp>

namespace marshal_model {

// =============================================================================
// EnumValue / MaskValue
// =============================================================================

std::string EnumValue::name() const {
    if (!type) {
        return {};
    }
    const EnumMember* member = type->find_member(value);
    return member ? member->name : std::string{};
}

bool EnumValue::operator==(const EnumValue& other) const {
    if (value != other.value) {
        return false;
    }
    if (type == other.type) {
        return true;
    }
    return type && other.type && type->name == other.type->name;
}

std::vector<std::string> MaskValue::names() const {
    if (table) {
        return table->decode(bits);
    }
    return FlagTable{}.decode(bits);
}

// =============================================================================
// ObjectRef
// =============================================================================

ObjectRef ObjectRef::from_hierarchy(const ObjectPtr& object) {
    ObjectRef ref;
    if (object) {
        ref.m_weak = object;
        ref.m_origin = RefOrigin::Hierarchy;
    }
    return ref;
}

ObjectRef ObjectRef::from_asset(ObjectPtr object) {
    ObjectRef ref;
    if (object) {
        ref.m_strong = std::move(object);
        ref.m_origin = RefOrigin::Asset;
    }
    return ref;
}

ObjectPtr ObjectRef::get() const {
    if (m_strong) {
        return m_strong;
    }
    return m_weak.lock();
}

// =============================================================================
// CollectionValue / CompositeValue
// =============================================================================

bool CollectionValue::operator==(const CollectionValue& other) const {
    return arity == other.arity && items == other.items;
}

const TypedValue* CompositeValue::get(std::string_view name) const {
    for (const auto& [field_name, value] : fields) {
        if (field_name == name) {
            return &value;
        }
    }
    return nullptr;
}

TypedValue* CompositeValue::get(std::string_view name) {
    for (auto& [field_name, value] : fields) {
        if (field_name == name) {
            return &value;
        }
    }
    return nullptr;
}

void CompositeValue::set(std::string name, TypedValue value) {
    if (TypedValue* existing = get(name)) {
        *existing = std::move(value);
        return;
    }
    fields.emplace_back(std::move(name), std::move(value));
}

bool CompositeValue::operator==(const CompositeValue& other) const {
    if (type && other.type && type->name != other.type->name) {
        return false;
    }
    return fields == other.fields;
}

// =============================================================================
// TypedValue
// =============================================================================

std::string TypedValue::type_name() const {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return primitive_type_name(PrimitiveType::Bool);
        } else if constexpr (std::is_same_v<T, std::int8_t>) {
            return primitive_type_name(PrimitiveType::I8);
        } else if constexpr (std::is_same_v<T, std::int16_t>) {
            return primitive_type_name(PrimitiveType::I16);
        } else if constexpr (std::is_same_v<T, std::int32_t>) {
            return primitive_type_name(PrimitiveType::I32);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return primitive_type_name(PrimitiveType::I64);
        } else if constexpr (std::is_same_v<T, std::uint8_t>) {
            return primitive_type_name(PrimitiveType::U8);
        } else if constexpr (std::is_same_v<T, std::uint16_t>) {
            return primitive_type_name(PrimitiveType::U16);
        } else if constexpr (std::is_same_v<T, std::uint32_t>) {
            return primitive_type_name(PrimitiveType::U32);
        } else if constexpr (std::is_same_v<T, std::uint64_t>) {
            return primitive_type_name(PrimitiveType::U64);
        } else if constexpr (std::is_same_v<T, float>) {
            return primitive_type_name(PrimitiveType::F32);
        } else if constexpr (std::is_same_v<T, double>) {
            return primitive_type_name(PrimitiveType::F64);
        } else if constexpr (std::is_same_v<T, char>) {
            return primitive_type_name(PrimitiveType::Char);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return primitive_type_name(PrimitiveType::String);
        } else if constexpr (std::is_same_v<T, Vec2>) {
            return struct_kind_name(StructKind::Vec2);
        } else if constexpr (std::is_same_v<T, Vec3>) {
            return struct_kind_name(StructKind::Vec3);
        } else if constexpr (std::is_same_v<T, Vec4>) {
            return struct_kind_name(StructKind::Vec4);
        } else if constexpr (std::is_same_v<T, Vec2Int>) {
            return struct_kind_name(StructKind::Vec2Int);
        } else if constexpr (std::is_same_v<T, Vec3Int>) {
            return struct_kind_name(StructKind::Vec3Int);
        } else if constexpr (std::is_same_v<T, Quat>) {
            return struct_kind_name(StructKind::Quat);
        } else if constexpr (std::is_same_v<T, Color>) {
            return struct_kind_name(StructKind::Color);
        } else if constexpr (std::is_same_v<T, Color32>) {
            return struct_kind_name(StructKind::Color32);
        } else if constexpr (std::is_same_v<T, Rect>) {
            return struct_kind_name(StructKind::Rect);
        } else if constexpr (std::is_same_v<T, RectInt>) {
            return struct_kind_name(StructKind::RectInt);
        } else if constexpr (std::is_same_v<T, Bounds>) {
            return struct_kind_name(StructKind::Bounds);
        } else if constexpr (std::is_same_v<T, EnumValue>) {
            return v.type ? v.type->name : std::string("enum");
        } else if constexpr (std::is_same_v<T, MaskValue>) {
            return v.table ? v.table->name() : std::string("mask");
        } else if constexpr (std::is_same_v<T, ObjectRef>) {
            auto object = v.get();
            return object ? object->type_name() : std::string("null");
        } else if constexpr (std::is_same_v<T, CollectionValue>) {
            std::string element = v.element_type ? v.element_type->name : std::string("object");
            return v.arity == CollectionArity::Fixed ? element + "[]" : "List<" + element + ">";
        } else if constexpr (std::is_same_v<T, CompositeValue>) {
            return v.type ? v.type->name : std::string("composite");
        }
    }, m_data);
}

} // namespace marshal_model
