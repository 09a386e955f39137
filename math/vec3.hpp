#ifndef OSTIAMESH_MATH_VEC3_HPP
#define OSTIAMESH_MATH_VEC3_HPP

#include <cmath>
#include <cstddef>

namespace ostiamesh {

struct Vec3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    constexpr Vec3() = default;
    constexpr Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    // Arithmetic operators
    constexpr Vec3 operator+(const Vec3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    constexpr Vec3 operator-(const Vec3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    constexpr Vec3 operator*(double scalar) const {
        return {x * scalar, y * scalar, z * scalar};
    }

    constexpr Vec3 operator/(double scalar) const {
        return {x / scalar, y / scalar, z / scalar};
    }

    constexpr Vec3 operator-() const {
        return {-x, -y, -z};
    }

    // Compound assignment
    constexpr Vec3& operator+=(const Vec3& other) {
        x += other.x; y += other.y; z += other.z;
        return *this;
    }

    constexpr Vec3& operator*=(double scalar) {
        x *= scalar; y *= scalar; z *= scalar;
        return *this;
    }

    // Dot product
    constexpr double dot(const Vec3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    // Cross product
    constexpr Vec3 cross(const Vec3& other) const {
        return {
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        };
    }

    // Magnitude squared (no sqrt)
    constexpr double length_squared() const {
        return x * x + y * y + z * z;
    }

    // Magnitude
    double length() const {
        return std::sqrt(length_squared());
    }

    // Normalized vector
    Vec3 normalized() const {
        double len = length();
        if (len > 0.0) {
            return *this / len;
        }
        return {0.0, 0.0, 0.0};
    }

    // Same direction, given magnitude (zero stays zero)
    Vec3 with_length(double magnitude) const {
        double len = length();
        if (len > 0.0) {
            return *this * (magnitude / len);
        }
        return {0.0, 0.0, 0.0};
    }

    // Distance to another point
    double distance_to(const Vec3& other) const {
        return (*this - other).length();
    }

    constexpr bool is_zero() const {
        return x == 0.0 && y == 0.0 && z == 0.0;
    }

    // Comparison (exact)
    constexpr bool operator==(const Vec3& other) const {
        return x == other.x && y == other.y && z == other.z;
    }

    // Array access
    constexpr double operator[](std::size_t i) const {
        if (i == 0) return x;
        if (i == 1) return y;
        return z;
    }
};

// Common constants
namespace vec3 {
    constexpr Vec3 unit_z() { return {0.0, 0.0, 1.0}; }
}

}  // namespace ostiamesh

#endif // OSTIAMESH_MATH_VEC3_HPP
