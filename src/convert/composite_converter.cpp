/// @file composite_converter.cpp
/// @brief CompositeConverter implementation

#include <marshal/convert/composite_converter.hpp>
#include <marshal/convert/context.hpp>
#include <marshal/core/log.hpp>

namespace marshal_convert {

using marshal_core::ConversionError;
using marshal_core::Err;
using marshal_core::Result;
using marshal_model::CompositeValue;
using marshal_model::TypedValue;
using marshal_value::Value;

bool CompositeConverter::can_convert(const marshal_model::TypeDescriptor& target) const {
    return target.is(marshal_model::TypeKind::Composite);
}

Result<TypedValue> CompositeConverter::convert(const Value& value,
                                               const marshal_model::TypeDescriptorPtr& target,
                                               ConversionContext& ctx) const {
    TypedValue result = marshal_model::default_value(target);
    if (value.is_null()) {
        return result;
    }

    const auto* map = value.try_object();
    if (!map) {
        return Err<TypedValue>(ConversionError::invalid_input(target->name,
            std::string("expected a map, got ") + value.type_name()));
    }

    auto& composite = result.get<CompositeValue>();
    for (const auto& field : target->fields) {
        if (field.internal) {
            continue;
        }
        const Value* input = map->find(field.name);
        if (!input) {
            continue;
        }
        composite.set(field.name, ctx.convert_nested(*input, field.type, field.name));
    }

    for (const auto& [key, ignored] : *map) {
        const auto* field = target->find_field(key);
        if (!field || field->internal) {
            marshal_core::convert_logger()->debug("[CompositeConverter] Ignoring key '{}' on {}",
                key, target->name);
        }
    }

    return result;
}

} // namespace marshal_convert
