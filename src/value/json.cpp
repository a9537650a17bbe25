/// @file json.cpp
/// @brief JSON wire I/O implementation

#include <marshal/value/json.hpp>
#include <fstream>
#include <limits>
#include <sstream>

namespace marshal_value::json {

Value from_json(const nlohmann::ordered_json& j) {
    switch (j.type()) {
        case nlohmann::ordered_json::value_t::boolean:
            return Value(j.get<bool>());
        case nlohmann::ordered_json::value_t::number_integer:
            return Value(j.get<std::int64_t>());
        case nlohmann::ordered_json::value_t::number_unsigned: {
            auto u = j.get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return Value(static_cast<double>(u));
            }
            return Value(static_cast<std::int64_t>(u));
        }
        case nlohmann::ordered_json::value_t::number_float:
            return Value(j.get<double>());
        case nlohmann::ordered_json::value_t::string:
            return Value(j.get<std::string>());
        case nlohmann::ordered_json::value_t::array: {
            ValueArray arr;
            arr.reserve(j.size());
            for (const auto& item : j) {
                arr.push_back(from_json(item));
            }
            return Value(std::move(arr));
        }
        case nlohmann::ordered_json::value_t::object: {
            ValueObject obj;
            for (const auto& [key, item] : j.items()) {
                obj.set(key, from_json(item));
            }
            return Value(std::move(obj));
        }
        default:
            return Value{};
    }
}

nlohmann::ordered_json to_json(const Value& value) {
    switch (value.type()) {
        case ValueType::Null:
            return nullptr;
        case ValueType::Bool:
            return value.as_bool();
        case ValueType::Int:
            return value.as_int();
        case ValueType::Float:
            return value.as_float();
        case ValueType::String:
            return value.as_string();
        case ValueType::Array: {
            auto arr = nlohmann::ordered_json::array();
            for (const auto& item : value.as_array()) {
                arr.push_back(to_json(item));
            }
            return arr;
        }
        case ValueType::Object: {
            auto obj = nlohmann::ordered_json::object();
            for (const auto& [key, item] : value.as_object()) {
                obj[key] = to_json(item);
            }
            return obj;
        }
        default:
            return nullptr;
    }
}

marshal_core::Result<Value> parse(const std::string& text, const std::string& source_name) {
    nlohmann::ordered_json j;
    try {
        j = nlohmann::ordered_json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return marshal_core::Err<Value>(
            marshal_core::Error(marshal_core::ErrorCode::ParseError,
                "JSON parse error in " + source_name + ": " + e.what()));
    }
    return from_json(j);
}

marshal_core::Result<Value> load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return marshal_core::Err<Value>(
            marshal_core::Error(marshal_core::ErrorCode::IOError,
                "Failed to open file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), path.string());
}

std::string dump(const Value& value, int indent) {
    // Invalid UTF-8 in strings is replaced rather than thrown
    return to_json(value).dump(indent, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

} // namespace marshal_value::json
