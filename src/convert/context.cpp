/// @file context.cpp
/// @brief ConversionContext implementation

#include <marshal/convert/context.hpp>
#include <marshal/convert/conversion_manager.hpp>
#include <marshal/core/log.hpp>
#include <marshal/model/type_descriptor.hpp>

namespace marshal_convert {

const ConverterConfig& ConversionContext::config() const {
    return m_manager.config();
}

const marshal_model::ObjectModel* ConversionContext::object_model() const {
    return m_manager.object_model().get();
}

marshal_model::TypedValue ConversionContext::convert_nested(const marshal_value::Value& value,
                                                            const marshal_model::TypeDescriptorPtr& type,
                                                            const std::string& segment) {
    m_path.push_back(segment);
    auto result = m_manager.dispatch(value, type, *this);

    marshal_model::TypedValue out;
    if (result) {
        out = std::move(result).unwrap();
    } else {
        marshal_core::convert_logger()->debug("[ConversionContext] '{}' failed: {}",
            current_path(), result.error().message());
        record_failure(std::move(result.error()));
        out = marshal_model::default_value(type);
    }

    m_path.pop_back();
    return out;
}

std::string ConversionContext::current_path() const {
    std::string path;
    for (const auto& segment : m_path) {
        if (!path.empty() && !segment.empty() && segment.front() != '[') {
            path += '.';
        }
        path += segment;
    }
    return path;
}

void ConversionContext::record_failure(marshal_core::Error error) {
    m_failures.push_back(ConversionFailure{current_path(), std::move(error)});
}

std::optional<ConversionFailure> ConversionContext::first_caller_error() const {
    for (const auto& failure : m_failures) {
        if (failure.error.is_caller_error()) {
            return failure;
        }
    }
    return std::nullopt;
}

} // namespace marshal_convert
