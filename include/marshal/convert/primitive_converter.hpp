#pragma once

/// @file primitive_converter.hpp
/// @brief Numeric, boolean, character and string coercion

#include "converter.hpp"

namespace marshal_convert {

/// Coerces scalars between wire and host primitive widths.
/// Integers are range checked; floats truncate toward zero when an integer
/// is requested; numeric strings are parsed.
class PrimitiveConverter final : public ValueConverter {
public:
    [[nodiscard]] const char* name() const noexcept override { return "PrimitiveConverter"; }
    [[nodiscard]] int priority() const noexcept override { return priority::Primitive; }

    [[nodiscard]] bool can_convert(const marshal_model::TypeDescriptor& target) const override;

    [[nodiscard]] marshal_core::Result<marshal_model::TypedValue> convert(
        const marshal_value::Value& value,
        const marshal_model::TypeDescriptorPtr& target,
        ConversionContext& ctx) const override;
};

} // namespace marshal_convert
