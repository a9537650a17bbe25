/// @file error.cpp
/// @brief Error formatting and Result instantiations for marshal_core

#include <marshal/core/error.hpp>
#include <sstream>
#include <vector>

namespace marshal_core {

// =============================================================================
// Kind Formatting
// =============================================================================

namespace detail {

const char* conversion_kind_name(ConversionError::Kind kind) {
    switch (kind) {
        case ConversionError::Kind::NoConverter: return "NoConverter";
        case ConversionError::Kind::InvalidInput: return "InvalidInput";
        case ConversionError::Kind::UnknownName: return "UnknownName";
        case ConversionError::Kind::UnknownConstant: return "UnknownConstant";
        case ConversionError::Kind::OutOfRange: return "OutOfRange";
        default: return "Unknown";
    }
}

std::string format_conversion_error(const ConversionError& err) {
    std::ostringstream oss;
    oss << "[ConversionError:" << conversion_kind_name(err.kind) << "] " << err.message;
    if (!err.type_name.empty()) {
        oss << " (type: " << err.type_name << ")";
    }
    return oss.str();
}

std::string format_type_registry_error(const TypeRegistryError& err) {
    std::ostringstream oss;
    oss << "[TypeRegistryError] " << err.message;
    if (!err.expected.empty() && !err.found.empty()) {
        oss << " (expected: " << err.expected << ", found: " << err.found << ")";
    }
    return oss.str();
}

std::string format_asset_error(const AssetError& err) {
    std::ostringstream oss;
    oss << "[AssetError] " << err.message;
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;
    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ConversionError>) {
            oss << detail::format_conversion_error(err);
        } else if constexpr (std::is_same_v<T, TypeRegistryError>) {
            oss << detail::format_type_registry_error(err);
        } else if constexpr (std::is_same_v<T, AssetError>) {
            oss << detail::format_asset_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::int64_t, Error>;
template class Result<double, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::string>, Error>;

} // namespace marshal_core
