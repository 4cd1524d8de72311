#ifndef REARLINK_MATH_VEC2_HPP
#define REARLINK_MATH_VEC2_HPP

#include <cmath>
#include <cstddef>

namespace rearlink {

// Planar point/vector in image space (pixels).
// Double precision: relaxation and finite-difference leverage both
// accumulate small differences of large coordinates.
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    constexpr Vec2() = default;
    constexpr Vec2(double x_, double y_) : x(x_), y(y_) {}

    // Arithmetic operators
    constexpr Vec2 operator+(const Vec2& other) const {
        return {x + other.x, y + other.y};
    }

    constexpr Vec2 operator-(const Vec2& other) const {
        return {x - other.x, y - other.y};
    }

    constexpr Vec2 operator*(double scalar) const {
        return {x * scalar, y * scalar};
    }

    constexpr Vec2 operator/(double scalar) const {
        return {x / scalar, y / scalar};
    }

    constexpr Vec2 operator-() const {
        return {-x, -y};
    }

    // Compound assignment
    constexpr Vec2& operator+=(const Vec2& other) {
        x += other.x; y += other.y;
        return *this;
    }

    constexpr Vec2& operator-=(const Vec2& other) {
        x -= other.x; y -= other.y;
        return *this;
    }

    constexpr Vec2& operator*=(double scalar) {
        x *= scalar; y *= scalar;
        return *this;
    }

    constexpr double dot(const Vec2& other) const {
        return x * other.x + y * other.y;
    }

    // Z component of the 3D cross product
    constexpr double cross(const Vec2& other) const {
        return x * other.y - y * other.x;
    }

    constexpr double length_squared() const {
        return x * x + y * y;
    }

    double length() const {
        return std::hypot(x, y);
    }

    double distance_to(const Vec2& other) const {
        return (*this - other).length();
    }

    // Comparison (exact)
    constexpr bool operator==(const Vec2& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Vec2& other) const {
        return !(*this == other);
    }
};

constexpr Vec2 operator*(double scalar, const Vec2& v) {
    return v * scalar;
}

constexpr Vec2 lerp(const Vec2& a, const Vec2& b, double t) {
    return a * (1.0 - t) + b * t;
}

namespace vec2 {
    constexpr Vec2 zero() { return {0.0, 0.0}; }
    constexpr Vec2 unit_x() { return {1.0, 0.0}; }
    constexpr Vec2 unit_y() { return {0.0, 1.0}; }
}

}  // namespace rearlink

#endif // REARLINK_MATH_VEC2_HPP
