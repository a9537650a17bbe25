#pragma once

/// @file composite_converter.hpp
/// @brief Reflection-driven conversion of user-defined composite types

#include "converter.hpp"

namespace marshal_convert {

/// Assigns each declared, non-internal field present in the input map.
/// Unknown keys are ignored and absent fields keep their defaults.
class CompositeConverter final : public ValueConverter {
public:
    [[nodiscard]] const char* name() const noexcept override { return "CompositeConverter"; }
    [[nodiscard]] int priority() const noexcept override { return priority::Composite; }

    [[nodiscard]] bool can_convert(const marshal_model::TypeDescriptor& target) const override;

    [[nodiscard]] marshal_core::Result<marshal_model::TypedValue> convert(
        const marshal_value::Value& value,
        const marshal_model::TypeDescriptorPtr& target,
        ConversionContext& ctx) const override;
};

} // namespace marshal_convert
