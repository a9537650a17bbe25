/// @file struct_converter.cpp
/// @brief StructConverter implementation

#include <marshal/convert/struct_converter.hpp>
#include <marshal/convert/constants.hpp>
#include "text.hpp"

#include <cmath>
#include <vector>

namespace marshal_convert {

using marshal_core::ConversionError;
using marshal_core::Err;
using marshal_core::Result;
using marshal_model::StructKind;
using marshal_model::TypedValue;
using marshal_value::Value;

namespace {

struct FieldSlot {
    const char* name;
    double fallback;
};

std::vector<FieldSlot> field_slots(StructKind kind) {
    switch (kind) {
        case StructKind::Vec2:
        case StructKind::Vec2Int:
            return {{"x", 0}, {"y", 0}};
        case StructKind::Vec3:
        case StructKind::Vec3Int:
            return {{"x", 0}, {"y", 0}, {"z", 0}};
        case StructKind::Vec4:
            return {{"x", 0}, {"y", 0}, {"z", 0}, {"w", 0}};
        case StructKind::Quat:
            return {{"x", 0}, {"y", 0}, {"z", 0}, {"w", 1}};
        case StructKind::Color:
            return {{"r", 1}, {"g", 1}, {"b", 1}, {"a", 1}};
        case StructKind::Color32:
            return {{"r", 255}, {"g", 255}, {"b", 255}, {"a", 255}};
        case StructKind::Rect:
        case StructKind::RectInt:
            return {{"x", 0}, {"y", 0}, {"width", 0}, {"height", 0}};
        case StructKind::Bounds:
            return {};
    }
    return {};
}

/// Field values in field order from a map or a positional list
Result<std::vector<double>> read_fields(const Value& value,
                                        const std::vector<FieldSlot>& slots,
                                        const std::string& type) {
    std::vector<double> out;
    out.reserve(slots.size());
    for (const auto& slot : slots) {
        out.push_back(slot.fallback);
    }

    if (const auto* obj = value.try_object()) {
        for (std::size_t i = 0; i < slots.size(); ++i) {
            const Value* field = obj->find(slots[i].name);
            if (!field || field->is_null()) {
                continue;
            }
            auto number = field->try_number();
            if (!number) {
                return Err<std::vector<double>>(ConversionError::invalid_input(type,
                    std::string("field '") + slots[i].name + "' must be a number"));
            }
            out[i] = *number;
        }
        return out;
    }

    if (const auto* arr = value.try_array()) {
        if (arr->size() > slots.size()) {
            return Err<std::vector<double>>(ConversionError::invalid_input(type,
                "expected at most " + std::to_string(slots.size()) + " components, got " +
                std::to_string(arr->size())));
        }
        for (std::size_t i = 0; i < arr->size(); ++i) {
            auto number = (*arr)[i].try_number();
            if (!number) {
                return Err<std::vector<double>>(ConversionError::invalid_input(type,
                    "component " + std::to_string(i) + " must be a number"));
            }
            out[i] = *number;
        }
        return out;
    }

    return Err<std::vector<double>>(ConversionError::invalid_input(type,
        std::string("expected a map, list or constant name, got ") + value.type_name()));
}

/// Integral component in [lo, hi] after truncation
bool checked_integral(double d, double lo, double hi, std::int64_t& out) {
    if (!std::isfinite(d)) {
        return false;
    }
    double truncated = std::trunc(d);
    if (truncated < lo || truncated > hi) {
        return false;
    }
    out = static_cast<std::int64_t>(truncated);
    return true;
}

Result<TypedValue> build(StructKind kind, const std::vector<double>& v, const std::string& type) {
    auto f = [&v](std::size_t i) { return static_cast<float>(v[i]); };

    std::vector<std::int64_t> ints(v.size());
    if (kind == StructKind::Vec2Int || kind == StructKind::Vec3Int ||
        kind == StructKind::RectInt || kind == StructKind::Color32) {
        const bool byte = kind == StructKind::Color32;
        const double lo = byte ? 0.0 : -2147483648.0;
        const double hi = byte ? 255.0 : 2147483647.0;
        for (std::size_t i = 0; i < v.size(); ++i) {
            if (!checked_integral(v[i], lo, hi, ints[i])) {
                return Err<TypedValue>(ConversionError::out_of_range(type, std::to_string(v[i])));
            }
        }
    }
    auto n = [&ints](std::size_t i) { return static_cast<std::int32_t>(ints[i]); };
    auto b = [&ints](std::size_t i) { return static_cast<std::uint8_t>(ints[i]); };

    switch (kind) {
        case StructKind::Vec2: return TypedValue(marshal_model::Vec2{f(0), f(1)});
        case StructKind::Vec3: return TypedValue(marshal_model::Vec3{f(0), f(1), f(2)});
        case StructKind::Vec4: return TypedValue(marshal_model::Vec4{f(0), f(1), f(2), f(3)});
        case StructKind::Vec2Int: return TypedValue(marshal_model::Vec2Int{n(0), n(1)});
        case StructKind::Vec3Int: return TypedValue(marshal_model::Vec3Int{n(0), n(1), n(2)});
        case StructKind::Quat: return TypedValue(marshal_model::Quat{f(0), f(1), f(2), f(3)});
        case StructKind::Color: return TypedValue(marshal_model::Color{f(0), f(1), f(2), f(3)});
        case StructKind::Color32: return TypedValue(marshal_model::Color32{b(0), b(1), b(2), b(3)});
        case StructKind::Rect: return TypedValue(marshal_model::Rect{f(0), f(1), f(2), f(3)});
        case StructKind::RectInt: return TypedValue(marshal_model::RectInt{n(0), n(1), n(2), n(3)});
        case StructKind::Bounds: break;
    }
    return Err<TypedValue>(ConversionError::no_converter(type));
}

Result<marshal_model::Vec3> read_vec3(const Value* value, const std::string& type) {
    if (!value || value->is_null()) {
        return marshal_model::Vec3::zero();
    }
    auto fields = read_fields(*value, field_slots(StructKind::Vec3), type);
    if (!fields) {
        return Err<marshal_model::Vec3>(fields.error());
    }
    const auto& v = *fields;
    return marshal_model::Vec3{static_cast<float>(v[0]), static_cast<float>(v[1]), static_cast<float>(v[2])};
}

Result<TypedValue> build_bounds(const Value& value, const std::string& type) {
    const Value* center = nullptr;
    const Value* size = nullptr;

    if (const auto* obj = value.try_object()) {
        center = obj->find("center");
        size = obj->find("size");
    } else if (const auto* arr = value.try_array()) {
        if (arr->size() > 2) {
            return Err<TypedValue>(ConversionError::invalid_input(type,
                "expected [center, size], got " + std::to_string(arr->size()) + " elements"));
        }
        if (!arr->empty()) center = &(*arr)[0];
        if (arr->size() > 1) size = &(*arr)[1];
    } else {
        return Err<TypedValue>(ConversionError::invalid_input(type,
            std::string("expected a map or list, got ") + value.type_name()));
    }

    auto c = read_vec3(center, type);
    if (!c) {
        return Err<TypedValue>(c.error());
    }
    auto s = read_vec3(size, type);
    if (!s) {
        return Err<TypedValue>(s.error());
    }
    return TypedValue(marshal_model::Bounds{*c, *s});
}

Value vec3_map(const marshal_model::Vec3& v) {
    return Value::object({{"x", v.x}, {"y", v.y}, {"z", v.z}});
}

} // anonymous namespace

bool StructConverter::can_convert(const marshal_model::TypeDescriptor& target) const {
    return target.is(marshal_model::TypeKind::Struct);
}

Result<TypedValue> StructConverter::convert(const Value& value,
                                            const marshal_model::TypeDescriptorPtr& target,
                                            ConversionContext& /*ctx*/) const {
    if (value.is_null()) {
        return marshal_model::default_value(target);
    }

    const StructKind kind = target->struct_kind;

    if (const auto* s = value.try_string()) {
        auto constant = constants::lookup(kind, text::trim(*s));
        if (!constant) {
            return Err<TypedValue>(ConversionError::unknown_constant(target->name, *s));
        }
        return *constant;
    }

    if (kind == StructKind::Bounds) {
        return build_bounds(value, target->name);
    }

    auto fields = read_fields(value, field_slots(kind), target->name);
    if (!fields) {
        return Err<TypedValue>(fields.error());
    }
    return build(kind, *fields, target->name);
}

std::optional<Value> StructConverter::serialize(const TypedValue& value) {
    using namespace marshal_model;

    if (const auto* v = value.try_get<Vec2>()) {
        return Value::object({{"x", v->x}, {"y", v->y}});
    }
    if (const auto* v = value.try_get<Vec3>()) {
        return vec3_map(*v);
    }
    if (const auto* v = value.try_get<Vec4>()) {
        return Value::object({{"x", v->x}, {"y", v->y}, {"z", v->z}, {"w", v->w}});
    }
    if (const auto* v = value.try_get<Vec2Int>()) {
        return Value::object({{"x", v->x}, {"y", v->y}});
    }
    if (const auto* v = value.try_get<Vec3Int>()) {
        return Value::object({{"x", v->x}, {"y", v->y}, {"z", v->z}});
    }
    if (const auto* v = value.try_get<Quat>()) {
        return Value::object({{"x", v->x}, {"y", v->y}, {"z", v->z}, {"w", v->w}});
    }
    if (const auto* v = value.try_get<Color>()) {
        return Value::object({{"r", v->r}, {"g", v->g}, {"b", v->b}, {"a", v->a}});
    }
    if (const auto* v = value.try_get<Color32>()) {
        return Value::object({{"r", static_cast<int>(v->r)}, {"g", static_cast<int>(v->g)},
                              {"b", static_cast<int>(v->b)}, {"a", static_cast<int>(v->a)}});
    }
    if (const auto* v = value.try_get<Rect>()) {
        return Value::object({{"x", v->x}, {"y", v->y}, {"width", v->width}, {"height", v->height}});
    }
    if (const auto* v = value.try_get<RectInt>()) {
        return Value::object({{"x", v->x}, {"y", v->y}, {"width", v->width}, {"height", v->height}});
    }
    if (const auto* v = value.try_get<Bounds>()) {
        return Value::object({{"center", vec3_map(v->center)}, {"size", vec3_map(v->size)}});
    }
    return std::nullopt;
}

std::vector<std::string> StructConverter::supported_constants(StructKind kind) {
    return constants::supported(kind);
}

} // namespace marshal_convert
