#pragma once

/// @file error.hpp
/// @brief Error handling types for marshal_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace marshal_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    TypeMismatch,
    OutOfRange,
    NotSupported,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::TypeMismatch: return "TypeMismatch";
        case ErrorCode::OutOfRange: return "OutOfRange";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Value conversion errors
struct ConversionError {
    enum class Kind : std::uint8_t {
        NoConverter,      // No converter accepts the target type
        InvalidInput,     // Input shape cannot be parsed for the target type
        UnknownName,      // Enum or flag member name not found
        UnknownConstant,  // Symbolic constant not defined for the type
        OutOfRange,       // Numeric value does not fit the target width
    };

    Kind kind;
    std::string message;
    std::string type_name;
    std::string input;  // Short rendering of the offending input

    /// Caller errors name a value outside the vocabulary of a known type
    [[nodiscard]] bool is_caller_error() const noexcept {
        return kind == Kind::UnknownName || kind == Kind::UnknownConstant;
    }

    [[nodiscard]] static ConversionError no_converter(const std::string& type) {
        return ConversionError{Kind::NoConverter, "No converter for type: " + type, type, {}};
    }

    [[nodiscard]] static ConversionError invalid_input(const std::string& type, const std::string& reason) {
        return ConversionError{Kind::InvalidInput,
            "Cannot convert to " + type + ": " + reason, type, {}};
    }

    [[nodiscard]] static ConversionError unknown_name(const std::string& type, const std::string& name) {
        return ConversionError{Kind::UnknownName,
            "Name '" + name + "' not found in " + type, type, name};
    }

    [[nodiscard]] static ConversionError unknown_constant(const std::string& type, const std::string& name) {
        return ConversionError{Kind::UnknownConstant,
            "Unknown constant '" + name + "' for type " + type, type, name};
    }

    [[nodiscard]] static ConversionError out_of_range(const std::string& type, const std::string& input_repr) {
        return ConversionError{Kind::OutOfRange,
            "Value " + input_repr + " is out of range for " + type, type, input_repr};
    }
};

/// Type registry errors
struct TypeRegistryError {
    enum class Kind : std::uint8_t {
        NotRegistered,      // Type not registered
        AlreadyRegistered,  // Type already registered
        TypeMismatch,       // Descriptor kind mismatch
    };

    Kind kind;
    std::string message;
    std::string type_name;
    std::string expected;  // For TypeMismatch
    std::string found;     // For TypeMismatch

    [[nodiscard]] static TypeRegistryError not_registered(const std::string& name) {
        return TypeRegistryError{Kind::NotRegistered, "Type not registered: " + name, name, {}, {}};
    }

    [[nodiscard]] static TypeRegistryError already_registered(const std::string& name) {
        return TypeRegistryError{Kind::AlreadyRegistered, "Type already registered: " + name, name, {}, {}};
    }

    [[nodiscard]] static TypeRegistryError type_mismatch(const std::string& expected_t, const std::string& found_t) {
        return TypeRegistryError{Kind::TypeMismatch,
            "Type mismatch: expected " + expected_t + ", found " + found_t,
            {}, expected_t, found_t};
    }
};

/// Persisted asset errors
struct AssetError {
    enum class Kind : std::uint8_t {
        NotFound,      // No asset at path
        ParseError,    // Asset document is malformed
        TypeMismatch,  // Asset exists but is of another type
    };

    Kind kind;
    std::string message;
    std::string path;

    [[nodiscard]] static AssetError not_found(const std::string& asset_path) {
        return AssetError{Kind::NotFound, "Asset not found: " + asset_path, asset_path};
    }

    [[nodiscard]] static AssetError parse_error(const std::string& asset_path, const std::string& reason) {
        return AssetError{Kind::ParseError, "Asset '" + asset_path + "' is malformed: " + reason, asset_path};
    }

    [[nodiscard]] static AssetError type_mismatch(const std::string& asset_path, const std::string& expected,
                                                  const std::string& found) {
        return AssetError{Kind::TypeMismatch,
            "Asset '" + asset_path + "' is " + found + ", expected " + expected, asset_path};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        ConversionError,
        TypeRegistryError,
        AssetError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(ConversionError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(TypeRegistryError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(AssetError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// True for conversion errors that name a value outside a known vocabulary
    [[nodiscard]] bool is_caller_error() const {
        const auto* conv = as<ConversionError>();
        return conv != nullptr && conv->is_caller_error();
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(ConversionError::Kind kind) {
        switch (kind) {
            case ConversionError::Kind::NoConverter: return ErrorCode::NotSupported;
            case ConversionError::Kind::InvalidInput: return ErrorCode::InvalidArgument;
            case ConversionError::Kind::UnknownName: return ErrorCode::NotFound;
            case ConversionError::Kind::UnknownConstant: return ErrorCode::NotFound;
            case ConversionError::Kind::OutOfRange: return ErrorCode::OutOfRange;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(TypeRegistryError::Kind kind) {
        switch (kind) {
            case TypeRegistryError::Kind::NotRegistered: return ErrorCode::NotFound;
            case TypeRegistryError::Kind::AlreadyRegistered: return ErrorCode::AlreadyExists;
            case TypeRegistryError::Kind::TypeMismatch: return ErrorCode::TypeMismatch;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(AssetError::Kind kind) {
        switch (kind) {
            case AssetError::Kind::NotFound: return ErrorCode::NotFound;
            case AssetError::Kind::ParseError: return ErrorCode::ParseError;
            case AssetError::Kind::TypeMismatch: return ErrorCode::TypeMismatch;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// ConversionException
// =============================================================================

/// Raised by ConversionManager::convert for caller errors only
class ConversionException : public std::runtime_error {
public:
    explicit ConversionException(Error error)
        : std::runtime_error(error.message())
        , m_error(std::move(error)) {}

    [[nodiscard]] const Error& error() const noexcept { return m_error; }

private:
    Error m_error;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type (similar to Rust's Result<T, E>)
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool
    explicit operator bool() const noexcept { return m_has_value; }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

template<typename T = void>
Result<T> Err(const char* message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with code, kind details and context
std::string build_error_chain(const Error& error);

} // namespace marshal_core
