/// @file mask_converter.cpp
/// @brief MaskConverter implementation

#include <marshal/convert/mask_converter.hpp>
#include <marshal/model/flag_table.hpp>
#include <marshal/value/json.hpp>
#include "text.hpp"

#include <cmath>
#include <limits>

namespace marshal_convert {

using marshal_core::ConversionError;
using marshal_core::Err;
using marshal_core::Result;
using marshal_model::FlagTable;
using marshal_model::MaskValue;
using marshal_model::TypedValue;
using marshal_value::Value;

namespace {

/// Signed 32-bit masks wrap (-1 is every bit); anything wider is out of range
Result<std::uint32_t> bits_from_number(const Value& value, const std::string& type) {
    std::int64_t raw = 0;
    if (auto i = value.try_int()) {
        raw = *i;
    } else {
        double d = value.as_float();
        if (!std::isfinite(d) || std::trunc(d) != d) {
            return Err<std::uint32_t>(ConversionError::invalid_input(type,
                "mask value is not integral: " + marshal_value::json::dump(value)));
        }
        if (d < -2147483648.0 || d > 4294967295.0) {
            return Err<std::uint32_t>(ConversionError::out_of_range(type, marshal_value::json::dump(value)));
        }
        raw = static_cast<std::int64_t>(d);
    }

    if (raw < std::numeric_limits<std::int32_t>::min() ||
        raw > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) {
        return Err<std::uint32_t>(ConversionError::out_of_range(type, std::to_string(raw)));
    }
    return static_cast<std::uint32_t>(raw);
}

Result<std::uint32_t> bits_from_names(const std::vector<std::string>& names,
                                      const FlagTable& table,
                                      const std::string& type) {
    std::uint32_t bits = 0;
    for (const auto& name : names) {
        auto resolved = table.resolve(name);
        if (!resolved) {
            return Err<std::uint32_t>(ConversionError::unknown_constant(type, name));
        }
        bits |= *resolved;
    }
    return bits;
}

Result<std::uint32_t> bits_from_list(const marshal_value::ValueArray& list,
                                     const FlagTable& table,
                                     const std::string& type) {
    std::vector<std::string> names;
    for (const auto& item : list) {
        const auto* s = item.try_string();
        if (!s) {
            return Err<std::uint32_t>(ConversionError::invalid_input(type,
                std::string("mask name list holds a ") + item.type_name()));
        }
        for (auto& token : text::split_list(*s)) {
            names.push_back(std::move(token));
        }
    }
    return bits_from_names(names, table, type);
}

Result<std::uint32_t> bits_from_names_value(const Value& value, const FlagTable& table, const std::string& type) {
    if (const auto* s = value.try_string()) {
        return bits_from_names(text::split_list(*s), table, type);
    }
    if (const auto* list = value.try_array()) {
        return bits_from_list(*list, table, type);
    }
    return Err<std::uint32_t>(ConversionError::invalid_input(type,
        std::string("mask names must be a string or list, got ") + value.type_name()));
}

Result<std::uint32_t> bits_from_map(const marshal_value::ValueObject& map,
                                    const FlagTable& table,
                                    const std::string& type) {
    const Value* raw = map.find("value");
    if (raw && !raw->is_null()) {
        if (!raw->is_number()) {
            return Err<std::uint32_t>(ConversionError::invalid_input(type, "mask 'value' must be a number"));
        }
        return bits_from_number(*raw, type);
    }

    for (const char* key : {"names", "layers"}) {
        const Value* names = map.find(key);
        if (names && !names->is_null()) {
            return bits_from_names_value(*names, table, type);
        }
    }

    return Err<std::uint32_t>(ConversionError::invalid_input(type,
        "mask map needs 'value', 'names' or 'layers'"));
}

} // anonymous namespace

bool MaskConverter::can_convert(const marshal_model::TypeDescriptor& target) const {
    return target.is(marshal_model::TypeKind::Mask);
}

Result<TypedValue> MaskConverter::convert(const Value& value,
                                          const marshal_model::TypeDescriptorPtr& target,
                                          ConversionContext& /*ctx*/) const {
    if (value.is_null()) {
        return marshal_model::default_value(target);
    }

    marshal_model::FlagTablePtr table = target->flag_table;
    if (!table) {
        table = std::make_shared<const FlagTable>(FlagTable::default_layers());
    }
    const std::string& type = target->name;

    Result<std::uint32_t> bits = Err<std::uint32_t>(ConversionError::invalid_input(type,
        std::string("cannot convert ") + value.type_name() + " to a mask"));

    if (value.is_number()) {
        bits = bits_from_number(value, type);
    } else if (value.is_string() || value.is_array()) {
        bits = bits_from_names_value(value, *table, type);
    } else if (const auto* map = value.try_object()) {
        bits = bits_from_map(*map, *table, type);
    }

    if (!bits) {
        return Err<TypedValue>(bits.error());
    }
    return TypedValue(MaskValue{table, *bits});
}

Value MaskConverter::serialize(const MaskValue& value) {
    marshal_value::ValueArray names;
    for (auto& name : value.names()) {
        names.emplace_back(std::move(name));
    }
    return Value::object({{"value", value.bits}, {"names", Value(std::move(names))}});
}

} // namespace marshal_convert
