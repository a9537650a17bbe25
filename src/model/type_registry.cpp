/// @file type_registry.cpp
/// @brief TypeRegistry implementation

#include <marshal/model/type_registry.hpp>
#include <marshal/core/log.hpp>

namespace marshal_model {

TypeRegistry::TypeRegistry() {
    register_builtins();
}

marshal_core::Result<void> TypeRegistry::register_type(TypeDescriptorPtr type) {
    if (!type) {
        return marshal_core::Err(marshal_core::Error(marshal_core::ErrorCode::InvalidArgument,
            "TypeRegistry: cannot register a null descriptor"));
    }
    if (contains_name(type->name)) {
        return marshal_core::Err(marshal_core::TypeRegistryError::already_registered(type->name));
    }
    m_by_name.emplace(type->name, std::move(type));
    return marshal_core::Ok();
}

TypeRegistry& TypeRegistry::register_or_replace(TypeDescriptorPtr type) {
    if (type) {
        m_by_name.insert_or_assign(type->name, std::move(type));
    }
    return *this;
}

TypeDescriptorPtr TypeRegistry::get_by_name(const std::string& name) const {
    auto it = m_by_name.find(name);
    return it != m_by_name.end() ? it->second : nullptr;
}

marshal_core::Result<TypeDescriptorPtr> TypeRegistry::get_result_by_name(const std::string& name) const {
    auto type = get_by_name(name);
    if (!type) {
        return marshal_core::Err<TypeDescriptorPtr>(marshal_core::TypeRegistryError::not_registered(name));
    }
    return marshal_core::Ok(std::move(type));
}

std::vector<std::string> TypeRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(m_by_name.size());
    for (const auto& [name, type] : m_by_name) {
        result.push_back(name);
    }
    return result;
}

void TypeRegistry::register_builtins() {
    static constexpr PrimitiveType k_primitives[] = {
        PrimitiveType::Bool,
        PrimitiveType::I8, PrimitiveType::I16, PrimitiveType::I32, PrimitiveType::I64,
        PrimitiveType::U8, PrimitiveType::U16, PrimitiveType::U32, PrimitiveType::U64,
        PrimitiveType::F32, PrimitiveType::F64,
        PrimitiveType::Char,
        PrimitiveType::String,
    };
    static constexpr StructKind k_structs[] = {
        StructKind::Vec2, StructKind::Vec3, StructKind::Vec4,
        StructKind::Vec2Int, StructKind::Vec3Int,
        StructKind::Quat,
        StructKind::Color, StructKind::Color32,
        StructKind::Rect, StructKind::RectInt,
        StructKind::Bounds,
    };

    for (auto p : k_primitives) {
        register_or_replace(TypeDescriptor::primitive(p));
    }
    for (auto s : k_structs) {
        register_or_replace(TypeDescriptor::structure(s));
    }
    register_or_replace(TypeDescriptor::mask("LayerMask",
        std::make_shared<const FlagTable>(FlagTable::default_layers())));
    register_or_replace(TypeDescriptor::reference("Node", ReferenceTarget::Node));

    marshal_core::model_logger()->trace("[TypeRegistry] {} built-in types registered", m_by_name.size());
}

} // namespace marshal_model
