#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for marshal_value module

#include <cstdint>
#include <vector>

namespace marshal_value {

// =============================================================================
// External Value
// =============================================================================

enum class ValueType : std::uint8_t;
class Value;
class ValueObject;

/// Ordered list of values
using ValueArray = std::vector<Value>;

} // namespace marshal_value
