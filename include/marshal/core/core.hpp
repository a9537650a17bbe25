#pragma once

/// @file core.hpp
/// @brief Main include file for marshal_core module

// Forward declarations
#include "fwd.hpp"

// Errors and results
#include "error.hpp"

// Logging
#include "log.hpp"

/// @namespace marshal_core
/// @brief Shared error and logging infrastructure
///
/// marshal_core provides the Result/Error types every module reports
/// failures through and the named spdlog loggers used across the library.
