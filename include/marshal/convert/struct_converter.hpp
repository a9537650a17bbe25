#pragma once

/// @file struct_converter.hpp
/// @brief Built-in value types from field maps, positional lists or constants

#include "converter.hpp"
#include <optional>
#include <string>
#include <vector>

namespace marshal_convert {

/// Converts vectors, rotations, colors, rectangles and bounds.
///
/// Accepted inputs:
/// - a map with some or all field names (`x`/`y`/`z`/`w`, `r`/`g`/`b`/`a`,
///   `x`/`y`/`width`/`height`, `center`/`size`); missing fields take the
///   per-type default (color channels are opaque, quaternion `w` is 1)
/// - a positional list in field order
/// - a symbolic constant such as `"red"` or `"forward"` (case-insensitive);
///   an unknown constant is a caller error
class StructConverter final : public ValueConverter {
public:
    [[nodiscard]] const char* name() const noexcept override { return "StructConverter"; }
    [[nodiscard]] int priority() const noexcept override { return priority::Struct; }

    [[nodiscard]] bool can_convert(const marshal_model::TypeDescriptor& target) const override;

    [[nodiscard]] marshal_core::Result<marshal_model::TypedValue> convert(
        const marshal_value::Value& value,
        const marshal_model::TypeDescriptorPtr& target,
        ConversionContext& ctx) const override;

    /// Field map for a built-in value type; nullopt for any other alternative
    [[nodiscard]] static std::optional<marshal_value::Value> serialize(const marshal_model::TypedValue& value);

    /// Symbolic constant names accepted for `kind`
    [[nodiscard]] static std::vector<std::string> supported_constants(marshal_model::StructKind kind);
};

} // namespace marshal_convert
