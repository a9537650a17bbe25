/// @file constants.cpp
/// @brief Symbolic constant tables

#include <marshal/convert/constants.hpp>
#include <marshal/model/type_descriptor.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

namespace marshal_convert::constants {

using namespace marshal_model;

namespace {

template<typename T>
using Table = std::vector<std::pair<const char*, T>>;

const Table<Color>& color_table() {
    static const Table<Color> table{
        {"red", Color::red()},
        {"green", Color::green()},
        {"blue", Color::blue()},
        {"white", Color::white()},
        {"black", Color::black()},
        {"yellow", Color::yellow()},
        {"cyan", Color::cyan()},
        {"magenta", Color::magenta()},
        {"gray", Color::gray()},
        {"grey", Color::gray()},
        {"clear", Color::clear()},
    };
    return table;
}

const Table<Vec2>& vec2_table() {
    static const Table<Vec2> table{
        {"zero", Vec2::zero()},
        {"one", Vec2::one()},
        {"up", Vec2::up()},
        {"down", Vec2::down()},
        {"left", Vec2::left()},
        {"right", Vec2::right()},
        {"positiveInfinity", Vec2::positive_infinity()},
        {"negativeInfinity", Vec2::negative_infinity()},
    };
    return table;
}

const Table<Vec3>& vec3_table() {
    static const Table<Vec3> table{
        {"zero", Vec3::zero()},
        {"one", Vec3::one()},
        {"up", Vec3::up()},
        {"down", Vec3::down()},
        {"left", Vec3::left()},
        {"right", Vec3::right()},
        {"forward", Vec3::forward()},
        {"back", Vec3::back()},
        {"positiveInfinity", Vec3::positive_infinity()},
        {"negativeInfinity", Vec3::negative_infinity()},
    };
    return table;
}

const Table<Vec4>& vec4_table() {
    static const Table<Vec4> table{
        {"zero", Vec4::zero()},
        {"one", Vec4::one()},
        {"positiveInfinity", Vec4::positive_infinity()},
        {"negativeInfinity", Vec4::negative_infinity()},
    };
    return table;
}

const Table<Vec2Int>& vec2int_table() {
    static const Table<Vec2Int> table{
        {"zero", Vec2Int::zero()},
        {"one", Vec2Int::one()},
        {"up", Vec2Int::up()},
        {"down", Vec2Int::down()},
        {"left", Vec2Int::left()},
        {"right", Vec2Int::right()},
    };
    return table;
}

const Table<Vec3Int>& vec3int_table() {
    static const Table<Vec3Int> table{
        {"zero", Vec3Int::zero()},
        {"one", Vec3Int::one()},
        {"up", Vec3Int::up()},
        {"down", Vec3Int::down()},
        {"left", Vec3Int::left()},
        {"right", Vec3Int::right()},
        {"forward", Vec3Int::forward()},
        {"back", Vec3Int::back()},
    };
    return table;
}

const Table<Quat>& quat_table() {
    static const Table<Quat> table{
        {"identity", Quat::identity()},
    };
    return table;
}

template<typename T>
std::optional<TypedValue> find_in(const Table<T>& table, std::string_view name) {
    for (const auto& [key, value] : table) {
        if (iequals(key, name)) {
            return TypedValue(value);
        }
    }
    return std::nullopt;
}

template<typename T>
std::vector<std::string> names_of(const Table<T>& table) {
    std::vector<std::string> names;
    names.reserve(table.size());
    for (const auto& entry : table) {
        names.emplace_back(entry.first);
    }
    return names;
}

} // anonymous namespace

std::optional<TypedValue> lookup(StructKind kind, std::string_view name) {
    switch (kind) {
        case StructKind::Vec2: return find_in(vec2_table(), name);
        case StructKind::Vec3: return find_in(vec3_table(), name);
        case StructKind::Vec4: return find_in(vec4_table(), name);
        case StructKind::Vec2Int: return find_in(vec2int_table(), name);
        case StructKind::Vec3Int: return find_in(vec3int_table(), name);
        case StructKind::Quat: return find_in(quat_table(), name);
        case StructKind::Color: return find_in(color_table(), name);
        case StructKind::Color32: {
            auto color = find_in(color_table(), name);
            if (!color) {
                return std::nullopt;
            }
            return TypedValue(Color32::from_color(color->get<Color>()));
        }
        default:
            return std::nullopt;
    }
}

std::vector<std::string> supported(StructKind kind) {
    switch (kind) {
        case StructKind::Vec2: return names_of(vec2_table());
        case StructKind::Vec3: return names_of(vec3_table());
        case StructKind::Vec4: return names_of(vec4_table());
        case StructKind::Vec2Int: return names_of(vec2int_table());
        case StructKind::Vec3Int: return names_of(vec3int_table());
        case StructKind::Quat: return names_of(quat_table());
        case StructKind::Color:
        case StructKind::Color32: return names_of(color_table());
        default: return {};
    }
}

std::optional<std::string> nearest_color_name(const Color& color, float tolerance) {
    std::optional<std::string> best;
    float best_distance = 0.0f;

    for (const auto& [key, value] : color_table()) {
        std::array<float, 4> diffs{
            std::fabs(color.r - value.r),
            std::fabs(color.g - value.g),
            std::fabs(color.b - value.b),
            std::fabs(color.a - value.a),
        };
        if (*std::max_element(diffs.begin(), diffs.end()) > tolerance) {
            continue;
        }

        float distance = diffs[0] + diffs[1] + diffs[2] + diffs[3];
        // Strict comparison keeps the first of two aliases ("gray" over "grey")
        if (!best || distance < best_distance) {
            best = key;
            best_distance = distance;
        }
    }
    return best;
}

} // namespace marshal_convert::constants
