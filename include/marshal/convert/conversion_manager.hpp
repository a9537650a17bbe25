#pragma once

/// @file conversion_manager.hpp
/// @brief Priority-ordered converter registry and the public conversion API

#include "fwd.hpp"
#include "config.hpp"
#include "context.hpp"
#include "converter.hpp"
#include <marshal/model/object_model.hpp>
#include <memory>
#include <string>
#include <vector>

namespace marshal_convert {

/// Outcome of try_convert
struct ConversionResult {
    bool success = false;
    marshal_model::TypedValue value;          // Default of the target on failure
    std::vector<ConversionFailure> failures;  // Empty path for a top-level failure

    explicit operator bool() const noexcept { return success; }
};

// =============================================================================
// ConversionManager
// =============================================================================

/// Owns the converter list and dispatches by target descriptor.
///
/// Converters are kept by descending priority; a converter registered with
/// priority P goes before every existing converter with priority <= P.
/// The first converter whose can_convert() accepts the target is used and
/// there is no fallback to later converters if it fails.
class ConversionManager {
public:
    /// Built-in converters with the default configuration
    ConversionManager();
    explicit ConversionManager(ConverterConfig config);

    ConversionManager(const ConversionManager&) = delete;
    ConversionManager& operator=(const ConversionManager&) = delete;

    // -------------------------------------------------------------------------
    // Process-wide instance
    // -------------------------------------------------------------------------

    /// Lazily created shared instance
    [[nodiscard]] static ConversionManager& default_instance();

    /// Restore the shared instance to built-ins, default config and no object model
    static void reset_default_instance();

    // -------------------------------------------------------------------------
    // Registry
    // -------------------------------------------------------------------------

    void register_converter(std::unique_ptr<ValueConverter> converter);

    /// Drop custom converters and re-register the built-ins
    void reset_to_defaults();

    [[nodiscard]] std::size_t converter_count() const noexcept { return m_converters.size(); }

    /// Converter names in dispatch order
    [[nodiscard]] std::vector<std::string> converter_names() const;

    /// First converter accepting `target`, or null
    [[nodiscard]] const ValueConverter* find_converter(const marshal_model::TypeDescriptor& target) const;

    // -------------------------------------------------------------------------
    // Collaborators
    // -------------------------------------------------------------------------

    void set_object_model(std::shared_ptr<const marshal_model::ObjectModel> model) { m_model = std::move(model); }
    [[nodiscard]] const std::shared_ptr<const marshal_model::ObjectModel>& object_model() const noexcept { return m_model; }

    void set_config(ConverterConfig config) { m_config = std::move(config); }
    [[nodiscard]] const ConverterConfig& config() const noexcept { return m_config; }

    // -------------------------------------------------------------------------
    // Conversion
    // -------------------------------------------------------------------------

    /// Convert, substituting defaults for anything unconvertible.
    /// Null converts to the target's default.
    /// @throws marshal_core::ConversionException for an unknown enum name or
    ///         symbolic constant, including one nested inside the value
    [[nodiscard]] marshal_model::TypedValue convert(const marshal_value::Value& value,
                                                    const marshal_model::TypeDescriptorPtr& target) const;

    /// Returns `value` unchanged if it already matches `target`, otherwise
    /// serializes it and converts the result
    [[nodiscard]] marshal_model::TypedValue convert(const marshal_model::TypedValue& value,
                                                    const marshal_model::TypeDescriptorPtr& target) const;

    /// Convert without substitution: failures are reported, never thrown
    [[nodiscard]] ConversionResult try_convert(const marshal_value::Value& value,
                                               const marshal_model::TypeDescriptorPtr& target) const;

    /// Writes `out` only on success
    bool try_convert(const marshal_value::Value& value,
                     const marshal_model::TypeDescriptorPtr& target,
                     marshal_model::TypedValue& out) const;

    /// Inverse direction, dispatched on the runtime alternative
    [[nodiscard]] marshal_value::Value serialize(const marshal_model::TypedValue& value) const;

private:
    friend class ConversionContext;

    [[nodiscard]] marshal_core::Result<marshal_model::TypedValue> dispatch(
        const marshal_value::Value& value,
        const marshal_model::TypeDescriptorPtr& target,
        ConversionContext& ctx) const;

    void register_builtins();

    std::vector<std::unique_ptr<ValueConverter>> m_converters;
    std::shared_ptr<const marshal_model::ObjectModel> m_model;
    ConverterConfig m_config;
};

} // namespace marshal_convert
