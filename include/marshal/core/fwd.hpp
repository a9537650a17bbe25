#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for marshal_core module

#include <cstdint>

namespace marshal_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct ConversionError;
struct TypeRegistryError;
struct AssetError;
class Error;
class ConversionException;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace marshal_core
