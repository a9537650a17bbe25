#pragma once

/// @file math.hpp
/// @brief Built-in fixed-shape value types of the host model

#include <cstdint>
#include <limits>

namespace marshal_model {

// =============================================================================
// Vectors
// =============================================================================

/// 2D vector
struct Vec2 {
    float x{0}, y{0};

    constexpr Vec2() = default;
    constexpr Vec2(float x_, float y_) : x(x_), y(y_) {}

    constexpr bool operator==(const Vec2& other) const = default;

    static constexpr Vec2 zero() { return {0, 0}; }
    static constexpr Vec2 one() { return {1, 1}; }
    static constexpr Vec2 up() { return {0, 1}; }
    static constexpr Vec2 down() { return {0, -1}; }
    static constexpr Vec2 left() { return {-1, 0}; }
    static constexpr Vec2 right() { return {1, 0}; }
    static constexpr Vec2 positive_infinity() {
        constexpr float inf = std::numeric_limits<float>::infinity();
        return {inf, inf};
    }
    static constexpr Vec2 negative_infinity() {
        constexpr float inf = std::numeric_limits<float>::infinity();
        return {-inf, -inf};
    }
};

/// 3D vector
struct Vec3 {
    float x{0}, y{0}, z{0};

    constexpr Vec3() = default;
    constexpr Vec3(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}

    constexpr bool operator==(const Vec3& other) const = default;

    static constexpr Vec3 zero() { return {0, 0, 0}; }
    static constexpr Vec3 one() { return {1, 1, 1}; }
    static constexpr Vec3 up() { return {0, 1, 0}; }
    static constexpr Vec3 down() { return {0, -1, 0}; }
    static constexpr Vec3 left() { return {-1, 0, 0}; }
    static constexpr Vec3 right() { return {1, 0, 0}; }
    static constexpr Vec3 forward() { return {0, 0, 1}; }
    static constexpr Vec3 back() { return {0, 0, -1}; }
    static constexpr Vec3 positive_infinity() {
        constexpr float inf = std::numeric_limits<float>::infinity();
        return {inf, inf, inf};
    }
    static constexpr Vec3 negative_infinity() {
        constexpr float inf = std::numeric_limits<float>::infinity();
        return {-inf, -inf, -inf};
    }
};

/// 4D vector
struct Vec4 {
    float x{0}, y{0}, z{0}, w{0};

    constexpr Vec4() = default;
    constexpr Vec4(float x_, float y_, float z_, float w_) : x(x_), y(y_), z(z_), w(w_) {}

    constexpr bool operator==(const Vec4& other) const = default;

    static constexpr Vec4 zero() { return {0, 0, 0, 0}; }
    static constexpr Vec4 one() { return {1, 1, 1, 1}; }
    static constexpr Vec4 positive_infinity() {
        constexpr float inf = std::numeric_limits<float>::infinity();
        return {inf, inf, inf, inf};
    }
    static constexpr Vec4 negative_infinity() {
        constexpr float inf = std::numeric_limits<float>::infinity();
        return {-inf, -inf, -inf, -inf};
    }
};

/// 2D integer vector
struct Vec2Int {
    std::int32_t x{0}, y{0};

    constexpr Vec2Int() = default;
    constexpr Vec2Int(std::int32_t x_, std::int32_t y_) : x(x_), y(y_) {}

    constexpr bool operator==(const Vec2Int& other) const = default;

    static constexpr Vec2Int zero() { return {0, 0}; }
    static constexpr Vec2Int one() { return {1, 1}; }
    static constexpr Vec2Int up() { return {0, 1}; }
    static constexpr Vec2Int down() { return {0, -1}; }
    static constexpr Vec2Int left() { return {-1, 0}; }
    static constexpr Vec2Int right() { return {1, 0}; }
};

/// 3D integer vector
struct Vec3Int {
    std::int32_t x{0}, y{0}, z{0};

    constexpr Vec3Int() = default;
    constexpr Vec3Int(std::int32_t x_, std::int32_t y_, std::int32_t z_) : x(x_), y(y_), z(z_) {}

    constexpr bool operator==(const Vec3Int& other) const = default;

    static constexpr Vec3Int zero() { return {0, 0, 0}; }
    static constexpr Vec3Int one() { return {1, 1, 1}; }
    static constexpr Vec3Int up() { return {0, 1, 0}; }
    static constexpr Vec3Int down() { return {0, -1, 0}; }
    static constexpr Vec3Int left() { return {-1, 0, 0}; }
    static constexpr Vec3Int right() { return {1, 0, 0}; }
    static constexpr Vec3Int forward() { return {0, 0, 1}; }
    static constexpr Vec3Int back() { return {0, 0, -1}; }
};

// =============================================================================
// Rotation
// =============================================================================

/// Quaternion (default is identity)
struct Quat {
    float x{0}, y{0}, z{0}, w{1};

    constexpr Quat() = default;
    constexpr Quat(float x_, float y_, float z_, float w_) : x(x_), y(y_), z(z_), w(w_) {}

    constexpr bool operator==(const Quat& other) const = default;

    [[nodiscard]] static constexpr Quat identity() { return {0, 0, 0, 1}; }
};

// =============================================================================
// Colors
// =============================================================================

/// Linear RGBA color, channels in [0, 1] (default is clear)
struct Color {
    float r{0}, g{0}, b{0}, a{0};

    constexpr Color() = default;
    constexpr Color(float r_, float g_, float b_, float a_ = 1.0f) : r(r_), g(g_), b(b_), a(a_) {}

    constexpr bool operator==(const Color& other) const = default;

    static constexpr Color red() { return {1, 0, 0, 1}; }
    static constexpr Color green() { return {0, 1, 0, 1}; }
    static constexpr Color blue() { return {0, 0, 1, 1}; }
    static constexpr Color white() { return {1, 1, 1, 1}; }
    static constexpr Color black() { return {0, 0, 0, 1}; }
    static constexpr Color yellow() { return {1, 0.92156863f, 0.015686275f, 1}; }
    static constexpr Color cyan() { return {0, 1, 1, 1}; }
    static constexpr Color magenta() { return {1, 0, 1, 1}; }
    static constexpr Color gray() { return {0.5f, 0.5f, 0.5f, 1}; }
    static constexpr Color clear() { return {0, 0, 0, 0}; }
};

/// 8-bit RGBA color
struct Color32 {
    std::uint8_t r{0}, g{0}, b{0}, a{0};

    constexpr Color32() = default;
    constexpr Color32(std::uint8_t r_, std::uint8_t g_, std::uint8_t b_, std::uint8_t a_)
        : r(r_), g(g_), b(b_), a(a_) {}

    constexpr bool operator==(const Color32& other) const = default;

    /// Quantize a float color (channels clamped to [0, 1])
    [[nodiscard]] static constexpr Color32 from_color(const Color& c) {
        return {quantize(c.r), quantize(c.g), quantize(c.b), quantize(c.a)};
    }

    [[nodiscard]] constexpr Color to_color() const {
        return {r / 255.0f, g / 255.0f, b / 255.0f, a / 255.0f};
    }

private:
    static constexpr std::uint8_t quantize(float v) {
        if (v <= 0.0f) return 0;
        if (v >= 1.0f) return 255;
        return static_cast<std::uint8_t>(v * 255.0f + 0.5f);
    }
};

// =============================================================================
// Rectangles and Bounds
// =============================================================================

/// Axis-aligned 2D rectangle
struct Rect {
    float x{0}, y{0}, width{0}, height{0};

    constexpr Rect() = default;
    constexpr Rect(float x_, float y_, float w_, float h_) : x(x_), y(y_), width(w_), height(h_) {}

    constexpr bool operator==(const Rect& other) const = default;
};

/// Integer rectangle
struct RectInt {
    std::int32_t x{0}, y{0}, width{0}, height{0};

    constexpr RectInt() = default;
    constexpr RectInt(std::int32_t x_, std::int32_t y_, std::int32_t w_, std::int32_t h_)
        : x(x_), y(y_), width(w_), height(h_) {}

    constexpr bool operator==(const RectInt& other) const = default;
};

/// Axis-aligned box given by center and full size
struct Bounds {
    Vec3 center;
    Vec3 size;

    constexpr Bounds() = default;
    constexpr Bounds(const Vec3& center_, const Vec3& size_) : center(center_), size(size_) {}

    constexpr bool operator==(const Bounds& other) const = default;

    [[nodiscard]] constexpr Vec3 extents() const {
        return {size.x * 0.5f, size.y * 0.5f, size.z * 0.5f};
    }
};

} // namespace marshal_model
