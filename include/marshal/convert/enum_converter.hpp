#pragma once

/// @file enum_converter.hpp
/// @brief Enumeration conversion by member name or underlying value

#include "converter.hpp"

namespace marshal_convert {

/// Strings match member names case-insensitively (an unknown name is a
/// caller error); integers are taken as the underlying value even when no
/// member carries it.
class EnumConverter final : public ValueConverter {
public:
    [[nodiscard]] const char* name() const noexcept override { return "EnumConverter"; }
    [[nodiscard]] int priority() const noexcept override { return priority::Enum; }

    [[nodiscard]] bool can_convert(const marshal_model::TypeDescriptor& target) const override;

    [[nodiscard]] marshal_core::Result<marshal_model::TypedValue> convert(
        const marshal_value::Value& value,
        const marshal_model::TypeDescriptorPtr& target,
        ConversionContext& ctx) const override;

    /// Member name, comma-joined member names for flag enums, else the integer
    [[nodiscard]] static marshal_value::Value serialize(const marshal_model::EnumValue& value);
};

} // namespace marshal_convert
