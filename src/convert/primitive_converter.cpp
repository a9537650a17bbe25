/// @file primitive_converter.cpp
/// @brief PrimitiveConverter implementation

#include <marshal/convert/primitive_converter.hpp>
#include <marshal/value/json.hpp>
#include "text.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <limits>
#include <type_traits>

namespace marshal_convert {

using marshal_core::ConversionError;
using marshal_core::Err;
using marshal_core::Result;
using marshal_model::PrimitiveType;
using marshal_model::TypedValue;
using marshal_value::Value;

namespace {

Result<TypedValue> out_of_range(const std::string& type, const Value& value) {
    return Err<TypedValue>(ConversionError::out_of_range(type, marshal_value::json::dump(value)));
}

Result<TypedValue> invalid(const std::string& type, const Value& value) {
    return Err<TypedValue>(ConversionError::invalid_input(type,
        std::string("cannot coerce ") + value.type_name() + " " + marshal_value::json::dump(value)));
}

template<typename T>
Result<TypedValue> integral_from_int(std::int64_t v, const std::string& type, const Value& source) {
    if constexpr (std::is_signed_v<T>) {
        if (v < static_cast<std::int64_t>(std::numeric_limits<T>::min()) ||
            v > static_cast<std::int64_t>(std::numeric_limits<T>::max())) {
            return out_of_range(type, source);
        }
    } else {
        if (v < 0 || static_cast<std::uint64_t>(v) > std::numeric_limits<T>::max()) {
            return out_of_range(type, source);
        }
    }
    return TypedValue(static_cast<T>(v));
}

template<typename T>
Result<TypedValue> integral_from_double(double d, const std::string& type, const Value& source) {
    if (!std::isfinite(d)) {
        return out_of_range(type, source);
    }
    const double truncated = std::trunc(d);
    const double lo = static_cast<double>(std::numeric_limits<T>::min());
    const double hi = std::ldexp(1.0, std::numeric_limits<T>::digits);  // exclusive
    if (truncated < lo || truncated >= hi) {
        return out_of_range(type, source);
    }
    return TypedValue(static_cast<T>(truncated));
}

template<typename T>
Result<TypedValue> to_integral(const Value& value, const std::string& type) {
    switch (value.type()) {
        case marshal_value::ValueType::Bool:
            return TypedValue(static_cast<T>(value.as_bool() ? 1 : 0));
        case marshal_value::ValueType::Int:
            return integral_from_int<T>(value.as_int(), type, value);
        case marshal_value::ValueType::Float:
            return integral_from_double<T>(value.as_float(), type, value);
        case marshal_value::ValueType::String: {
            if (auto i = text::parse_int(value.as_string())) {
                return integral_from_int<T>(*i, type, value);
            }
            if (auto d = text::parse_double(value.as_string())) {
                return integral_from_double<T>(*d, type, value);
            }
            return invalid(type, value);
        }
        default:
            return invalid(type, value);
    }
}

template<typename T>
Result<TypedValue> to_floating(const Value& value, const std::string& type) {
    switch (value.type()) {
        case marshal_value::ValueType::Bool:
            return TypedValue(static_cast<T>(value.as_bool() ? 1 : 0));
        case marshal_value::ValueType::Int:
        case marshal_value::ValueType::Float:
            return TypedValue(static_cast<T>(value.as_number()));
        case marshal_value::ValueType::String:
            if (auto d = text::parse_double(value.as_string())) {
                return TypedValue(static_cast<T>(*d));
            }
            return invalid(type, value);
        default:
            return invalid(type, value);
    }
}

Result<TypedValue> to_bool(const Value& value, const std::string& type) {
    switch (value.type()) {
        case marshal_value::ValueType::Bool:
            return TypedValue(value.as_bool());
        case marshal_value::ValueType::Int:
        case marshal_value::ValueType::Float:
            return TypedValue(value.as_number() != 0.0);
        case marshal_value::ValueType::String: {
            auto s = text::trim(value.as_string());
            if (marshal_model::iequals(s, "true")) {
                return TypedValue(true);
            }
            if (marshal_model::iequals(s, "false")) {
                return TypedValue(false);
            }
            if (auto d = text::parse_double(s)) {
                return TypedValue(*d != 0.0);
            }
            return invalid(type, value);
        }
        default:
            return invalid(type, value);
    }
}

Result<TypedValue> to_char(const Value& value, const std::string& type) {
    if (const auto* s = value.try_string()) {
        if (s->size() == 1) {
            return TypedValue((*s)[0]);
        }
        return invalid(type, value);
    }
    if (auto i = value.try_int()) {
        if (*i < 0 || *i > 127) {
            return out_of_range(type, value);
        }
        return TypedValue(static_cast<char>(*i));
    }
    return invalid(type, value);
}

Result<TypedValue> to_string(const Value& value, const std::string& type) {
    switch (value.type()) {
        case marshal_value::ValueType::String:
            return TypedValue(value.as_string());
        case marshal_value::ValueType::Bool:
            return TypedValue(std::string(value.as_bool() ? "true" : "false"));
        case marshal_value::ValueType::Int:
            return TypedValue(fmt::format("{}", value.as_int()));
        case marshal_value::ValueType::Float:
            return TypedValue(fmt::format("{}", value.as_float()));
        default:
            return invalid(type, value);
    }
}

} // anonymous namespace

bool PrimitiveConverter::can_convert(const marshal_model::TypeDescriptor& target) const {
    return target.is(marshal_model::TypeKind::Primitive);
}

Result<TypedValue> PrimitiveConverter::convert(const Value& value,
                                               const marshal_model::TypeDescriptorPtr& target,
                                               ConversionContext& /*ctx*/) const {
    if (value.is_null()) {
        return marshal_model::default_value(target);
    }

    const std::string& type = target->name;
    switch (target->primitive_type) {
        case PrimitiveType::Bool: return to_bool(value, type);
        case PrimitiveType::I8: return to_integral<std::int8_t>(value, type);
        case PrimitiveType::I16: return to_integral<std::int16_t>(value, type);
        case PrimitiveType::I32: return to_integral<std::int32_t>(value, type);
        case PrimitiveType::I64: return to_integral<std::int64_t>(value, type);
        case PrimitiveType::U8: return to_integral<std::uint8_t>(value, type);
        case PrimitiveType::U16: return to_integral<std::uint16_t>(value, type);
        case PrimitiveType::U32: return to_integral<std::uint32_t>(value, type);
        case PrimitiveType::U64: return to_integral<std::uint64_t>(value, type);
        case PrimitiveType::F32: return to_floating<float>(value, type);
        case PrimitiveType::F64: return to_floating<double>(value, type);
        case PrimitiveType::Char: return to_char(value, type);
        case PrimitiveType::String: return to_string(value, type);
    }
    return Err<TypedValue>(ConversionError::no_converter(type));
}

} // namespace marshal_convert
