#pragma once

/// @file converter.hpp
/// @brief ValueConverter interface and built-in priorities

#include "fwd.hpp"
#include <marshal/core/error.hpp>
#include <marshal/model/type_descriptor.hpp>
#include <marshal/model/typed_value.hpp>
#include <marshal/value/value.hpp>
#include <string>

namespace marshal_convert {

// =============================================================================
// Priorities
// =============================================================================

/// Built-in converter priorities (higher runs first)
namespace priority {
    constexpr int Reference = 300;
    constexpr int Collection = 250;
    constexpr int Struct = 200;
    constexpr int Mask = 200;
    constexpr int Enum = 150;
    constexpr int Primitive = 100;
    constexpr int Composite = 50;
} // namespace priority

// =============================================================================
// ValueConverter
// =============================================================================

/// One conversion strategy for a family of target types.
///
/// `can_convert` must be pure. `convert` is only invoked after `can_convert`
/// returned true for the same descriptor, and reports failure through the
/// returned Result without touching caller-visible state.
class ValueConverter {
public:
    virtual ~ValueConverter() = default;

    /// Name for diagnostics
    [[nodiscard]] virtual const char* name() const noexcept = 0;

    [[nodiscard]] virtual int priority() const noexcept = 0;

    [[nodiscard]] virtual bool can_convert(const marshal_model::TypeDescriptor& target) const = 0;

    /// Convert a non-null value. Nested values go through ctx.convert_nested().
    [[nodiscard]] virtual marshal_core::Result<marshal_model::TypedValue> convert(
        const marshal_value::Value& value,
        const marshal_model::TypeDescriptorPtr& target,
        ConversionContext& ctx) const = 0;
};

} // namespace marshal_convert
