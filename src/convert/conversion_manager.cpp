/// @file conversion_manager.cpp
/// @brief ConversionManager implementation

#include <marshal/convert/conversion_manager.hpp>
#include <marshal/convert/collection_converter.hpp>
#include <marshal/convert/composite_converter.hpp>
#include <marshal/convert/enum_converter.hpp>
#include <marshal/convert/mask_converter.hpp>
#include <marshal/convert/primitive_converter.hpp>
#include <marshal/convert/reference_converter.hpp>
#include <marshal/convert/struct_converter.hpp>
#include <marshal/core/log.hpp>

#include <algorithm>
#include <limits>
#include <type_traits>

namespace marshal_convert {

using marshal_core::ConversionError;
using marshal_core::Err;
using marshal_core::Result;
using marshal_model::TypedValue;
using marshal_value::Value;

namespace {

std::unique_ptr<ConversionManager>& default_slot() {
    static std::unique_ptr<ConversionManager> instance;
    return instance;
}

template<typename T>
constexpr bool is_struct_value_v =
    std::is_same_v<T, marshal_model::Vec2> || std::is_same_v<T, marshal_model::Vec3> ||
    std::is_same_v<T, marshal_model::Vec4> || std::is_same_v<T, marshal_model::Vec2Int> ||
    std::is_same_v<T, marshal_model::Vec3Int> || std::is_same_v<T, marshal_model::Quat> ||
    std::is_same_v<T, marshal_model::Color> || std::is_same_v<T, marshal_model::Color32> ||
    std::is_same_v<T, marshal_model::Rect> || std::is_same_v<T, marshal_model::RectInt> ||
    std::is_same_v<T, marshal_model::Bounds>;

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

ConversionManager::ConversionManager()
    : ConversionManager(ConverterConfig{}) {}

ConversionManager::ConversionManager(ConverterConfig config)
    : m_config(std::move(config)) {
    register_builtins();
}

ConversionManager& ConversionManager::default_instance() {
    auto& slot = default_slot();
    if (!slot) {
        slot = std::make_unique<ConversionManager>();
        marshal_core::convert_logger()->debug("[ConversionManager] Default instance created");
    }
    return *slot;
}

void ConversionManager::reset_default_instance() {
    auto& slot = default_slot();
    if (!slot) {
        return;
    }
    slot->reset_to_defaults();
    slot->set_config(ConverterConfig{});
    slot->set_object_model(nullptr);
}

// =============================================================================
// Registry
// =============================================================================

void ConversionManager::register_converter(std::unique_ptr<ValueConverter> converter) {
    if (!converter) {
        return;
    }

    const int priority = converter->priority();
    auto pos = std::find_if(m_converters.begin(), m_converters.end(),
        [priority](const std::unique_ptr<ValueConverter>& existing) {
            return existing->priority() <= priority;
        });

    marshal_core::convert_logger()->debug("[ConversionManager] Registered {} (priority {})",
        converter->name(), priority);
    m_converters.insert(pos, std::move(converter));
}

void ConversionManager::reset_to_defaults() {
    m_converters.clear();
    register_builtins();
}

void ConversionManager::register_builtins() {
    register_converter(std::make_unique<CompositeConverter>());
    register_converter(std::make_unique<PrimitiveConverter>());
    register_converter(std::make_unique<EnumConverter>());
    register_converter(std::make_unique<MaskConverter>());
    register_converter(std::make_unique<StructConverter>());
    register_converter(std::make_unique<CollectionConverter>());
    register_converter(std::make_unique<ReferenceConverter>());
}

std::vector<std::string> ConversionManager::converter_names() const {
    std::vector<std::string> names;
    names.reserve(m_converters.size());
    for (const auto& converter : m_converters) {
        names.emplace_back(converter->name());
    }
    return names;
}

const ValueConverter* ConversionManager::find_converter(const marshal_model::TypeDescriptor& target) const {
    for (const auto& converter : m_converters) {
        if (converter->can_convert(target)) {
            return converter.get();
        }
    }
    return nullptr;
}

// =============================================================================
// Conversion
// =============================================================================

Result<TypedValue> ConversionManager::dispatch(const Value& value,
                                               const marshal_model::TypeDescriptorPtr& target,
                                               ConversionContext& ctx) const {
    if (!target) {
        return Err<TypedValue>(marshal_core::Error(marshal_core::ErrorCode::InvalidArgument,
            "Conversion target is null"));
    }
    if (value.is_null()) {
        return marshal_model::default_value(target);
    }

    const ValueConverter* converter = find_converter(*target);
    if (!converter) {
        return Err<TypedValue>(ConversionError::no_converter(target->name));
    }
    return converter->convert(value, target, ctx);
}

TypedValue ConversionManager::convert(const Value& value, const marshal_model::TypeDescriptorPtr& target) const {
    auto logger = marshal_core::convert_logger();
    ConversionContext ctx(*this);

    auto result = dispatch(value, target, ctx);
    if (!result) {
        const auto& error = result.error();
        if (error.is_caller_error()) {
            logger->warn("[ConversionManager] {}", marshal_core::build_error_chain(error));
            throw marshal_core::ConversionException(error);
        }
        if (m_config.log_unconverted) {
            logger->warn("[ConversionManager] Unconverted value for {}: {}",
                target ? target->name : std::string("<null>"), marshal_core::build_error_chain(error));
        }
        return marshal_model::default_value(target);
    }

    if (auto caller_error = ctx.first_caller_error()) {
        marshal_core::Error error = caller_error->error;
        error.with_context("path", caller_error->path);
        logger->warn("[ConversionManager] {}", marshal_core::build_error_chain(error));
        throw marshal_core::ConversionException(std::move(error));
    }

    if (m_config.log_unconverted) {
        for (const auto& failure : ctx.failures()) {
            logger->warn("[ConversionManager] Unconverted '{}' in {}: {}",
                failure.path, target->name, marshal_core::build_error_chain(failure.error));
        }
    }

    return std::move(result).unwrap();
}

TypedValue ConversionManager::convert(const TypedValue& value, const marshal_model::TypeDescriptorPtr& target) const {
    if (target && marshal_model::matches(value, *target)) {
        return value;
    }
    return convert(serialize(value), target);
}

ConversionResult ConversionManager::try_convert(const Value& value,
                                                const marshal_model::TypeDescriptorPtr& target) const {
    ConversionContext ctx(*this);
    auto result = dispatch(value, target, ctx);

    ConversionResult out;
    out.failures = ctx.failures();
    if (result) {
        out.value = std::move(result).unwrap();
        out.success = out.failures.empty();
    } else {
        marshal_core::convert_logger()->debug("[ConversionManager] try_convert failed: {}",
            result.error().message());
        out.value = marshal_model::default_value(target);
        out.failures.push_back(ConversionFailure{"", result.error()});
        out.success = false;
    }
    return out;
}

bool ConversionManager::try_convert(const Value& value,
                                    const marshal_model::TypeDescriptorPtr& target,
                                    TypedValue& out) const {
    auto result = try_convert(value, target);
    if (!result.success) {
        return false;
    }
    out = std::move(result.value);
    return true;
}

// =============================================================================
// Serialization
// =============================================================================

Value ConversionManager::serialize(const TypedValue& value) const {
    return std::visit([this, &value](const auto& v) -> Value {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return Value::null();
        } else if constexpr (std::is_same_v<T, bool>) {
            return Value(v);
        } else if constexpr (std::is_same_v<T, char>) {
            return Value(std::string(1, v));
        } else if constexpr (std::is_same_v<T, std::uint64_t>) {
            if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return Value(static_cast<double>(v));
            }
            return Value(static_cast<std::int64_t>(v));
        } else if constexpr (std::is_integral_v<T>) {
            return Value(static_cast<std::int64_t>(v));
        } else if constexpr (std::is_floating_point_v<T>) {
            return Value(static_cast<double>(v));
        } else if constexpr (std::is_same_v<T, std::string>) {
            return Value(v);
        } else if constexpr (is_struct_value_v<T>) {
            return StructConverter::serialize(value).value_or(Value::null());
        } else if constexpr (std::is_same_v<T, marshal_model::EnumValue>) {
            return EnumConverter::serialize(v);
        } else if constexpr (std::is_same_v<T, marshal_model::MaskValue>) {
            return MaskConverter::serialize(v);
        } else if constexpr (std::is_same_v<T, marshal_model::ObjectRef>) {
            return ReferenceConverter::serialize(v);
        } else if constexpr (std::is_same_v<T, marshal_model::CollectionValue>) {
            marshal_value::ValueArray items;
            items.reserve(v.items.size());
            for (const auto& item : v.items) {
                items.push_back(serialize(item));
            }
            return Value(std::move(items));
        } else {
            static_assert(std::is_same_v<T, marshal_model::CompositeValue>, "unhandled TypedValue alternative");
            marshal_value::ValueObject fields;
            if (v.type) {
                for (const auto& field : v.type->fields) {
                    if (field.internal) {
                        continue;
                    }
                    if (const auto* fv = v.get(field.name)) {
                        fields.set(field.name, serialize(*fv));
                    }
                }
            } else {
                for (const auto& [name, fv] : v.fields) {
                    fields.set(name, serialize(fv));
                }
            }
            return Value(std::move(fields));
        }
    }, value.variant());
}

} // namespace marshal_convert
