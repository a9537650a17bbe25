/// @file collection_converter.cpp
/// @brief CollectionConverter implementation

#include <marshal/convert/collection_converter.hpp>
#include <marshal/convert/context.hpp>

namespace marshal_convert {

using marshal_core::ConversionError;
using marshal_core::Err;
using marshal_core::Result;
using marshal_model::TypedValue;
using marshal_value::Value;

bool CollectionConverter::can_convert(const marshal_model::TypeDescriptor& target) const {
    return target.is(marshal_model::TypeKind::Collection);
}

Result<TypedValue> CollectionConverter::convert(const Value& value,
                                                const marshal_model::TypeDescriptorPtr& target,
                                                ConversionContext& ctx) const {
    if (value.is_null()) {
        return marshal_model::default_value(target);
    }

    const auto* list = value.try_array();
    if (!list) {
        return Err<TypedValue>(ConversionError::invalid_input(target->name,
            std::string("expected a list, got ") + value.type_name()));
    }
    if (!target->element_type) {
        return Err<TypedValue>(ConversionError::invalid_input(target->name, "collection has no element type"));
    }

    marshal_model::CollectionValue result;
    result.element_type = target->element_type;
    result.arity = target->arity;
    result.items.reserve(list->size());

    for (std::size_t i = 0; i < list->size(); ++i) {
        result.items.push_back(
            ctx.convert_nested((*list)[i], target->element_type, "[" + std::to_string(i) + "]"));
    }

    return TypedValue(std::move(result));
}

} // namespace marshal_convert
