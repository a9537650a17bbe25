/// @file type_descriptor.cpp
/// @brief TypeDescriptor factories, defaults and runtime type matching

#include <marshal/model/type_descriptor.hpp>
#include <marshal/model/object.hpp>
#include <cctype>

namespace marshal_model {

// =============================================================================
// Factories
// =============================================================================

TypeDescriptorPtr TypeDescriptor::primitive(PrimitiveType ptype) {
    auto d = std::make_shared<TypeDescriptor>();
    d->kind = TypeKind::Primitive;
    d->name = primitive_type_name(ptype);
    d->primitive_type = ptype;
    return d;
}

TypeDescriptorPtr TypeDescriptor::structure(StructKind skind) {
    auto d = std::make_shared<TypeDescriptor>();
    d->kind = TypeKind::Struct;
    d->name = struct_kind_name(skind);
    d->struct_kind = skind;
    return d;
}

TypeDescriptorPtr TypeDescriptor::enumeration(std::string enum_name,
                                              std::vector<EnumMember> enum_members,
                                              bool is_flags) {
    auto d = std::make_shared<TypeDescriptor>();
    d->kind = TypeKind::Enum;
    d->name = std::move(enum_name);
    d->members = std::move(enum_members);
    d->flags = is_flags;
    return d;
}

TypeDescriptorPtr TypeDescriptor::mask(std::string mask_name, FlagTablePtr table) {
    auto d = std::make_shared<TypeDescriptor>();
    d->kind = TypeKind::Mask;
    d->name = std::move(mask_name);
    d->flag_table = table ? std::move(table) : std::make_shared<const FlagTable>(FlagTable::default_layers());
    return d;
}

TypeDescriptorPtr TypeDescriptor::reference(std::string target_type, ReferenceTarget target) {
    auto d = std::make_shared<TypeDescriptor>();
    d->kind = TypeKind::Reference;
    d->name = target_type;
    d->referenced_type = std::move(target_type);
    d->reference_target = target;
    return d;
}

TypeDescriptorPtr TypeDescriptor::collection(TypeDescriptorPtr element, CollectionArity collection_arity) {
    auto d = std::make_shared<TypeDescriptor>();
    d->kind = TypeKind::Collection;
    std::string element_name = element ? element->name : std::string("object");
    d->name = collection_arity == CollectionArity::Fixed
        ? element_name + "[]"
        : "List<" + element_name + ">";
    d->element_type = std::move(element);
    d->arity = collection_arity;
    return d;
}

TypeDescriptorPtr TypeDescriptor::composite(std::string composite_name,
                                            std::vector<FieldDescriptor> composite_fields) {
    auto d = std::make_shared<TypeDescriptor>();
    d->kind = TypeKind::Composite;
    d->name = std::move(composite_name);
    d->fields = std::move(composite_fields);
    return d;
}

// =============================================================================
// Lookup
// =============================================================================

const EnumMember* TypeDescriptor::find_member(std::string_view member_name) const {
    for (const auto& member : members) {
        if (iequals(member.name, member_name)) {
            return &member;
        }
    }
    return nullptr;
}

const EnumMember* TypeDescriptor::find_member(std::int64_t member_value) const {
    for (const auto& member : members) {
        if (member.value == member_value) {
            return &member;
        }
    }
    return nullptr;
}

const FieldDescriptor* TypeDescriptor::find_field(std::string_view field_name) const {
    for (const auto& field : fields) {
        if (field.name == field_name) {
            return &field;
        }
    }
    return nullptr;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// =============================================================================
// Defaults
// =============================================================================

namespace {

TypedValue default_primitive(PrimitiveType type) {
    switch (type) {
        case PrimitiveType::Bool: return false;
        case PrimitiveType::I8: return std::int8_t{0};
        case PrimitiveType::I16: return std::int16_t{0};
        case PrimitiveType::I32: return std::int32_t{0};
        case PrimitiveType::I64: return std::int64_t{0};
        case PrimitiveType::U8: return std::uint8_t{0};
        case PrimitiveType::U16: return std::uint16_t{0};
        case PrimitiveType::U32: return std::uint32_t{0};
        case PrimitiveType::U64: return std::uint64_t{0};
        case PrimitiveType::F32: return 0.0f;
        case PrimitiveType::F64: return 0.0;
        case PrimitiveType::Char: return '\0';
        case PrimitiveType::String: return std::string{};
        default: return TypedValue{};
    }
}

TypedValue default_struct(StructKind kind) {
    switch (kind) {
        case StructKind::Vec2: return Vec2{};
        case StructKind::Vec3: return Vec3{};
        case StructKind::Vec4: return Vec4{};
        case StructKind::Vec2Int: return Vec2Int{};
        case StructKind::Vec3Int: return Vec3Int{};
        case StructKind::Quat: return Quat{};
        case StructKind::Color: return Color{};
        case StructKind::Color32: return Color32{};
        case StructKind::Rect: return Rect{};
        case StructKind::RectInt: return RectInt{};
        case StructKind::Bounds: return Bounds{};
        default: return TypedValue{};
    }
}

} // anonymous namespace

TypedValue default_value(const TypeDescriptorPtr& type) {
    if (!type) {
        return TypedValue{};
    }

    switch (type->kind) {
        case TypeKind::Primitive:
            return default_primitive(type->primitive_type);
        case TypeKind::Struct:
            return default_struct(type->struct_kind);
        case TypeKind::Enum:
            return EnumValue{type, 0};
        case TypeKind::Mask:
            return MaskValue{type->flag_table, 0u};
        case TypeKind::Reference:
            return ObjectRef{};
        case TypeKind::Collection:
            return CollectionValue{type->element_type, type->arity, {}};
        case TypeKind::Composite: {
            CompositeValue composite;
            composite.type = type;
            composite.fields.reserve(type->fields.size());
            for (const auto& field : type->fields) {
                composite.fields.emplace_back(field.name,
                    field.default_value ? *field.default_value : default_value(field.type));
            }
            return composite;
        }
        default:
            return TypedValue{};
    }
}

// =============================================================================
// Matching
// =============================================================================

namespace {

bool matches_primitive(const TypedValue& value, PrimitiveType type) {
    switch (type) {
        case PrimitiveType::Bool: return value.is<bool>();
        case PrimitiveType::I8: return value.is<std::int8_t>();
        case PrimitiveType::I16: return value.is<std::int16_t>();
        case PrimitiveType::I32: return value.is<std::int32_t>();
        case PrimitiveType::I64: return value.is<std::int64_t>();
        case PrimitiveType::U8: return value.is<std::uint8_t>();
        case PrimitiveType::U16: return value.is<std::uint16_t>();
        case PrimitiveType::U32: return value.is<std::uint32_t>();
        case PrimitiveType::U64: return value.is<std::uint64_t>();
        case PrimitiveType::F32: return value.is<float>();
        case PrimitiveType::F64: return value.is<double>();
        case PrimitiveType::Char: return value.is<char>();
        case PrimitiveType::String: return value.is<std::string>();
        default: return false;
    }
}

bool matches_struct(const TypedValue& value, StructKind kind) {
    switch (kind) {
        case StructKind::Vec2: return value.is<Vec2>();
        case StructKind::Vec3: return value.is<Vec3>();
        case StructKind::Vec4: return value.is<Vec4>();
        case StructKind::Vec2Int: return value.is<Vec2Int>();
        case StructKind::Vec3Int: return value.is<Vec3Int>();
        case StructKind::Quat: return value.is<Quat>();
        case StructKind::Color: return value.is<Color>();
        case StructKind::Color32: return value.is<Color32>();
        case StructKind::Rect: return value.is<Rect>();
        case StructKind::RectInt: return value.is<RectInt>();
        case StructKind::Bounds: return value.is<Bounds>();
        default: return false;
    }
}

} // anonymous namespace

bool matches(const TypedValue& value, const TypeDescriptor& type) {
    switch (type.kind) {
        case TypeKind::Primitive:
            return matches_primitive(value, type.primitive_type);
        case TypeKind::Struct:
            return matches_struct(value, type.struct_kind);
        case TypeKind::Enum: {
            const auto* e = value.try_get<EnumValue>();
            return e && e->type && e->type->name == type.name;
        }
        case TypeKind::Mask:
            return value.is<MaskValue>();
        case TypeKind::Reference: {
            const auto* ref = value.try_get<ObjectRef>();
            if (!ref) {
                return false;
            }
            auto object = ref->get();
            if (!object) {
                return true;
            }
            if (type.reference_target != ReferenceTarget::Any && object->category() != type.reference_target) {
                return false;
            }
            return object->is_a(type.referenced_type);
        }
        case TypeKind::Collection: {
            const auto* c = value.try_get<CollectionValue>();
            if (!c || c->arity != type.arity) {
                return false;
            }
            if (!c->element_type || !type.element_type) {
                return c->element_type == type.element_type;
            }
            return c->element_type->name == type.element_type->name;
        }
        case TypeKind::Composite: {
            const auto* c = value.try_get<CompositeValue>();
            return c && c->type && c->type->name == type.name;
        }
        default:
            return false;
    }
}

} // namespace marshal_model
