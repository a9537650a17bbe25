#pragma once

/// @file mask_converter.hpp
/// @brief Bitmask conversion against a flag name table

#include "converter.hpp"

namespace marshal_convert {

/// Accepts a raw integer, a name or comma-separated names, a list of names,
/// or a map with `value` (highest precedence), `names` or `layers`.
class MaskConverter final : public ValueConverter {
public:
    [[nodiscard]] const char* name() const noexcept override { return "MaskConverter"; }
    [[nodiscard]] int priority() const noexcept override { return priority::Mask; }

    [[nodiscard]] bool can_convert(const marshal_model::TypeDescriptor& target) const override;

    [[nodiscard]] marshal_core::Result<marshal_model::TypedValue> convert(
        const marshal_value::Value& value,
        const marshal_model::TypeDescriptorPtr& target,
        ConversionContext& ctx) const override;

    /// `{"value": bits, "names": [...]}`
    [[nodiscard]] static marshal_value::Value serialize(const marshal_model::MaskValue& value);
};

} // namespace marshal_convert
