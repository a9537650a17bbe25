#pragma once

/// @file constants.hpp
/// @brief Symbolic constant tables for built-in value types

#include <marshal/model/type_kind.hpp>
#include <marshal/model/typed_value.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace marshal_convert::constants {

/// Case-insensitive lookup ("red", "zero", "positiveInfinity", ...).
/// Color32 shares the Color table, quantized.
[[nodiscard]] std::optional<marshal_model::TypedValue> lookup(marshal_model::StructKind kind,
                                                              std::string_view name);

/// Constant names accepted for a kind, in table order (empty if none)
[[nodiscard]] std::vector<std::string> supported(marshal_model::StructKind kind);

/// Named color whose channels are all within `tolerance` of `color`.
/// The closest match wins; "grey" is never returned in favour of "gray".
[[nodiscard]] std::optional<std::string> nearest_color_name(const marshal_model::Color& color,
                                                            float tolerance = 0.01f);

} // namespace marshal_convert::constants
