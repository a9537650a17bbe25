/// @file config.cpp
/// @brief ConverterConfig and ConfigLoader implementation

#include <marshal/convert/config.hpp>
#include <marshal/core/log.hpp>
#include <marshal/model/flag_table.hpp>

#include <toml++/toml.hpp>

#include <charconv>
#include <fstream>
#include <sstream>

namespace marshal_convert {

// =============================================================================
// ConverterConfig
// =============================================================================

bool ConverterConfig::is_asset_path(const std::string& path) const {
    for (const auto& root : asset_roots) {
        if (!root.empty() && path.rfind(root, 0) == 0) {
            return true;
        }
    }
    return false;
}

marshal_model::FlagTablePtr ConverterConfig::layer_table() const {
    if (layers.empty()) {
        return std::make_shared<const marshal_model::FlagTable>(marshal_model::FlagTable::default_layers());
    }

    auto table = std::make_shared<marshal_model::FlagTable>();
    for (const auto& [bit, name] : layers) {
        auto result = table->set_bit_name(bit, name);
        if (!result) {
            marshal_core::convert_logger()->warn("[ConverterConfig] Skipping layer {}: {}",
                bit, result.error().message());
        }
    }
    return table;
}

// =============================================================================
// ConfigLoader
// =============================================================================

marshal_core::Result<ConverterConfig> ConfigLoader::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return marshal_core::Err<ConverterConfig>(marshal_core::Error(
            marshal_core::ErrorCode::IOError, "Failed to open config file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_string(buffer.str(), path.string());
}

marshal_core::Result<ConverterConfig> ConfigLoader::parse_string(const std::string& content,
                                                                 const std::string& source_name) {
    ConverterConfig config;

    try {
        toml::table tbl = toml::parse(content, source_name);

        if (auto convert = tbl["convert"].as_table()) {
            auto result = parse_convert_section(convert, config);
            if (!result) {
                return marshal_core::Err<ConverterConfig>(result.error());
            }
        }

        if (auto layers = tbl["layers"].as_table()) {
            auto result = parse_layers_section(layers, config);
            if (!result) {
                return marshal_core::Err<ConverterConfig>(result.error());
            }
        }

    } catch (const toml::parse_error& err) {
        return marshal_core::Err<ConverterConfig>(marshal_core::Error(
            marshal_core::ErrorCode::ParseError, "TOML parse error: " + std::string(err.what())));
    }

    marshal_core::convert_logger()->debug("[ConfigLoader] Loaded '{}' ({} asset roots, {} layers)",
        source_name, config.asset_roots.size(), config.layers.size());
    return config;
}

marshal_core::Result<void> ConfigLoader::parse_convert_section(const void* tbl_ptr, ConverterConfig& config) {
    const auto& tbl = *static_cast<const toml::table*>(tbl_ptr);

    if (auto roots = tbl["asset_roots"].as_array()) {
        config.asset_roots.clear();
        for (const auto& root : *roots) {
            auto str = root.value<std::string>();
            if (!str) {
                return marshal_core::Err(marshal_core::Error(
                    marshal_core::ErrorCode::ParseError, "convert.asset_roots must contain strings"));
            }
            config.asset_roots.push_back(*str);
        }
    }

    config.log_unconverted = tbl["log_unconverted"].value_or(config.log_unconverted);

    if (auto level = tbl["log_level"].value<std::string>()) {
        if (!marshal_core::parse_log_level(*level)) {
            return marshal_core::Err(marshal_core::Error(
                marshal_core::ErrorCode::ParseError, "convert.log_level is not a log level: " + *level));
        }
        config.log_level = *level;
    }

    return marshal_core::Ok();
}

marshal_core::Result<void> ConfigLoader::parse_layers_section(const void* tbl_ptr, ConverterConfig& config) {
    const auto& tbl = *static_cast<const toml::table*>(tbl_ptr);

    for (const auto& [key, node] : tbl) {
        std::string_view key_str = key.str();
        std::uint32_t bit = 0;
        auto [ptr, ec] = std::from_chars(key_str.data(), key_str.data() + key_str.size(), bit);
        if (ec != std::errc{} || ptr != key_str.data() + key_str.size() || bit >= 32) {
            return marshal_core::Err(marshal_core::Error(
                marshal_core::ErrorCode::ParseError,
                "layers key must be a bit index 0-31: " + std::string(key_str)));
        }

        auto name = node.value<std::string>();
        if (!name) {
            return marshal_core::Err(marshal_core::Error(
                marshal_core::ErrorCode::ParseError,
                "layers." + std::string(key_str) + " must be a string"));
        }
        config.layers[bit] = *name;
    }

    return marshal_core::Ok();
}

} // namespace marshal_convert
