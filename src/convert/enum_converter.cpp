/// @file enum_converter.cpp
/// @brief EnumConverter implementation

#include <marshal/convert/enum_converter.hpp>
#include <marshal/value/json.hpp>
#include "text.hpp"

#include <cmath>

namespace marshal_convert {

using marshal_core::ConversionError;
using marshal_core::Err;
using marshal_core::Result;
using marshal_model::EnumValue;
using marshal_model::TypedValue;
using marshal_value::Value;

namespace {

Result<TypedValue> from_name(const std::string& input, const marshal_model::TypeDescriptorPtr& target) {
    auto name = text::trim(input);
    if (name.empty()) {
        return Err<TypedValue>(ConversionError::invalid_input(target->name, "empty enum name"));
    }

    if (auto numeric = text::parse_int(name)) {
        return TypedValue(EnumValue{target, *numeric});
    }

    if (target->flags && name.find(',') != std::string_view::npos) {
        std::int64_t combined = 0;
        for (const auto& token : text::split_list(name)) {
            const auto* member = target->find_member(token);
            if (!member) {
                return Err<TypedValue>(ConversionError::unknown_name(target->name, token));
            }
            combined |= member->value;
        }
        return TypedValue(EnumValue{target, combined});
    }

    const auto* member = target->find_member(name);
    if (!member) {
        return Err<TypedValue>(ConversionError::unknown_name(target->name, std::string(name)));
    }
    return TypedValue(EnumValue{target, member->value});
}

} // anonymous namespace

bool EnumConverter::can_convert(const marshal_model::TypeDescriptor& target) const {
    return target.is(marshal_model::TypeKind::Enum);
}

Result<TypedValue> EnumConverter::convert(const Value& value,
                                          const marshal_model::TypeDescriptorPtr& target,
                                          ConversionContext& /*ctx*/) const {
    switch (value.type()) {
        case marshal_value::ValueType::Null:
            return marshal_model::default_value(target);

        case marshal_value::ValueType::String:
            return from_name(value.as_string(), target);

        case marshal_value::ValueType::Int:
            return TypedValue(EnumValue{target, value.as_int()});

        case marshal_value::ValueType::Float: {
            double d = value.as_float();
            if (!std::isfinite(d) || std::trunc(d) != d) {
                return Err<TypedValue>(ConversionError::invalid_input(target->name,
                    "enum value is not integral: " + marshal_value::json::dump(value)));
            }
            if (d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
                return Err<TypedValue>(ConversionError::out_of_range(target->name, marshal_value::json::dump(value)));
            }
            return TypedValue(EnumValue{target, static_cast<std::int64_t>(d)});
        }

        default:
            return Err<TypedValue>(ConversionError::invalid_input(target->name,
                std::string("cannot convert ") + value.type_name() + " to an enum"));
    }
}

Value EnumConverter::serialize(const EnumValue& value) {
    if (!value.type) {
        return Value(value.value);
    }

    if (const auto* member = value.type->find_member(value.value)) {
        return Value(member->name);
    }

    // Flag enums decompose into their single-bit members when fully covered
    if (value.type->flags && value.value != 0) {
        std::string joined;
        std::int64_t covered = 0;
        for (const auto& member : value.type->members) {
            if (member.value != 0 && (value.value & member.value) == member.value) {
                if (!joined.empty()) {
                    joined += ", ";
                }
                joined += member.name;
                covered |= member.value;
            }
        }
        if (covered == value.value) {
            return Value(joined);
        }
    }

    return Value(value.value);
}

} // namespace marshal_convert
