#pragma once

/// @file log.hpp
/// @brief Logging utilities for marshal

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <string>
#include <map>
#include <memory>
#include <optional>
#include <chrono>

// =============================================================================
// Logging Macros
// =============================================================================

#define MARSHAL_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define MARSHAL_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define MARSHAL_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define MARSHAL_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define MARSHAL_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define MARSHAL_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace marshal_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 5 * 1024 * 1024;  // 5 MB
    std::size_t max_files = 3;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Configure logging system
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Logger for error and configuration plumbing
std::shared_ptr<spdlog::logger> core_logger();

/// Logger for the object model and asset database
std::shared_ptr<spdlog::logger> model_logger();

/// Logger for converters and the conversion manager
std::shared_ptr<spdlog::logger> convert_logger();

// =============================================================================
// Log Level Management
// =============================================================================

/// Set level on every registered logger
void set_global_log_level(spdlog::level::level_enum level);

/// Set level on one logger (no-op if it does not exist)
void set_logger_level(const std::string& name, spdlog::level::level_enum level);

[[nodiscard]] spdlog::level::level_enum get_global_log_level();

/// Parse log level from string ("warn", "error", ...)
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

[[nodiscard]] const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Structured Logging
// =============================================================================

/// Log a message followed by key="value" pairs
void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// Traces entry and exit of a block with elapsed time
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name = "marshal_core");
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define MARSHAL_LOG_SCOPE(name) ::marshal_core::LogScope _log_scope_##__LINE__(name)

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

/// Drop every named logger
void shutdown_logging();

} // namespace marshal_core
