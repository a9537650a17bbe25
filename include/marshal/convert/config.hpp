#pragma once

/// @file config.hpp
/// @brief Converter configuration loaded from TOML

#include "fwd.hpp"
#include <marshal/core/error.hpp>
#include <marshal/model/fwd.hpp>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace marshal_convert {

// =============================================================================
// ConverterConfig
// =============================================================================

/// Tunables for a ConversionManager
struct ConverterConfig {
    /// Path prefixes that classify a reference string as an asset path
    std::vector<std::string> asset_roots{"Assets/", "Packages/"};

    /// Log a warning when a value has no applicable converter or fails to convert
    bool log_unconverted = true;

    /// Level applied to the marshal loggers by configure_logging callers
    std::string log_level = "info";

    /// Bit index -> layer name; empty keeps the built-in default layers
    std::map<std::uint32_t, std::string> layers;

    /// True if `path` starts with one of the asset roots
    [[nodiscard]] bool is_asset_path(const std::string& path) const;

    /// Flag table for layer masks (default layers when `layers` is empty)
    [[nodiscard]] marshal_model::FlagTablePtr layer_table() const;
};

// =============================================================================
// ConfigLoader
// =============================================================================

/// Reads `[convert]` and `[layers]` sections:
/// @code
/// [convert]
/// asset_roots = ["Assets/", "Packages/"]
/// log_unconverted = true
/// log_level = "debug"
///
/// [layers]
/// 8 = "Enemies"
/// @endcode
class ConfigLoader {
public:
    /// Load from a file; IOError if it cannot be read
    [[nodiscard]] static marshal_core::Result<ConverterConfig> load(const std::filesystem::path& path);

    /// Parse TOML text; ParseError on malformed documents or invalid entries
    [[nodiscard]] static marshal_core::Result<ConverterConfig> parse_string(const std::string& content,
                                                                            const std::string& source_name = "config.toml");

private:
    static marshal_core::Result<void> parse_convert_section(const void* tbl_ptr, ConverterConfig& config);
    static marshal_core::Result<void> parse_layers_section(const void* tbl_ptr, ConverterConfig& config);
};

} // namespace marshal_convert
