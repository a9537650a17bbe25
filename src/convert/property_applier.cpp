/// @file property_applier.cpp
/// @brief PropertyApplier implementation

#include <marshal/convert/property_applier.hpp>
#include <marshal/convert/conversion_manager.hpp>
#include <marshal/core/log.hpp>
#include <marshal/model/type_descriptor.hpp>

#include <string>

namespace marshal_convert {

marshal_core::Result<PropertyApplyResult> PropertyApplier::apply(marshal_model::Component& component,
                                                                 const marshal_value::Value& changes) const {
    const auto* map = changes.try_object();
    if (!map) {
        return marshal_core::Err<PropertyApplyResult>(marshal_core::Error(
            marshal_core::ErrorCode::InvalidArgument,
            std::string("Property changes must be a map, got ") + changes.type_name()));
    }

    PropertyApplyResult result;
    auto fail = [&result](const std::string& property, std::string message) {
        result.failed.push_back(property);
        result.errors[property] = std::move(message);
    };

    const auto& descriptor = component.descriptor();
    for (const auto& [property, value] : *map) {
        const auto* field = descriptor ? descriptor->find_field(property) : nullptr;
        if (!field) {
            fail(property, "Unknown property '" + property + "' on " + component.type_name());
            continue;
        }
        if (field->internal) {
            fail(property, "Property '" + property + "' is internal");
            continue;
        }

        auto converted = m_manager.try_convert(value, field->type);
        if (!converted.success) {
            const auto& failure = converted.failures.front();
            fail(property, failure.path.empty()
                ? failure.error.message()
                : failure.path + ": " + failure.error.message());
            continue;
        }

        auto assigned = component.set_property(property, std::move(converted.value));
        if (!assigned) {
            fail(property, assigned.error().message());
            continue;
        }
        result.updated.push_back(property);
    }

    marshal_core::log_structured(spdlog::level::debug, "marshal_convert", "[PropertyApplier] Applied properties", {
        {"component", component.type_name()},
        {"name", component.name()},
        {"updated", std::to_string(result.updated.size())},
        {"failed", std::to_string(result.failed.size())},
    });
    return result;
}

marshal_value::Value PropertyApplier::read(const marshal_model::Component& component) const {
    return m_manager.serialize(marshal_model::TypedValue(component.properties()));
}

} // namespace marshal_convert
