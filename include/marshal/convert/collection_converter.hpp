#pragma once

/// @file collection_converter.hpp
/// @brief Fixed and growable sequences of any element type

#include "converter.hpp"

namespace marshal_convert {

/// Converts each list element through the manager. The output always has
/// the input's length; a failed element takes its default and is recorded.
class CollectionConverter final : public ValueConverter {
public:
    [[nodiscard]] const char* name() const noexcept override { return "CollectionConverter"; }
    [[nodiscard]] int priority() const noexcept override { return priority::Collection; }

    [[nodiscard]] bool can_convert(const marshal_model::TypeDescriptor& target) const override;

    [[nodiscard]] marshal_core::Result<marshal_model::TypedValue> convert(
        const marshal_value::Value& value,
        const marshal_model::TypeDescriptorPtr& target,
        ConversionContext& ctx) const override;
};

} // namespace marshal_convert
