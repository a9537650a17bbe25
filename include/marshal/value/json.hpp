#pragma once

/// @file json.hpp
/// @brief JSON wire I/O for External Values (nlohmann ordered_json)

#include "value.hpp"
#include <marshal/core/error.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>

namespace marshal_value::json {

/// Convert a parsed JSON document into a Value.
/// Unsigned integers beyond int64 range become Float.
[[nodiscard]] Value from_json(const nlohmann::ordered_json& j);

/// Convert a Value into JSON, keeping object insertion order
[[nodiscard]] nlohmann::ordered_json to_json(const Value& value);

/// Parse JSON text
[[nodiscard]] marshal_core::Result<Value> parse(const std::string& text,
                                                const std::string& source_name = "<string>");

/// Read and parse a JSON file
[[nodiscard]] marshal_core::Result<Value> load_file(const std::filesystem::path& path);

/// Serialize to JSON text (indent < 0 gives compact output)
[[nodiscard]] std::string dump(const Value& value, int indent = -1);

} // namespace marshal_value::json
