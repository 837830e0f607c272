#pragma once

#include <algorithm>
#include <cmath>

namespace subvox::math {

struct Vector2 {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vector2() = default;
    constexpr Vector2(float xIn, float yIn) : x(xIn), y(yIn) {}

    constexpr bool operator==(const Vector2&) const = default;
};

struct Vector3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vector3() = default;
    constexpr Vector3(float xIn, float yIn, float zIn) : x(xIn), y(yIn), z(zIn) {}

    constexpr bool operator==(const Vector3&) const = default;

    constexpr Vector3 operator+(const Vector3& rhs) const { return Vector3{x + rhs.x, y + rhs.y, z + rhs.z}; }
    constexpr Vector3 operator-(const Vector3& rhs) const { return Vector3{x - rhs.x, y - rhs.y, z - rhs.z}; }
    constexpr Vector3 operator-() const { return Vector3{-x, -y, -z}; }
    constexpr Vector3 operator*(float scalar) const { return Vector3{x * scalar, y * scalar, z * scalar}; }
    constexpr Vector3 operator/(float scalar) const { return Vector3{x / scalar, y / scalar, z / scalar}; }

    Vector3& operator+=(const Vector3& rhs) {
        x += rhs.x;
        y += rhs.y;
        z += rhs.z;
        return *this;
    }

    Vector3& operator-=(const Vector3& rhs) {
        x -= rhs.x;
        y -= rhs.y;
        z -= rhs.z;
        return *this;
    }
};

inline constexpr Vector3 operator*(float scalar, const Vector3& v) {
    return v * scalar;
}

inline float dot(const Vector3& a, const Vector3& b) {
    return (a.x * b.x) + (a.y * b.y) + (a.z * b.z);
}

inline float lengthSquared(const Vector3& v) {
    return dot(v, v);
}

inline float length(const Vector3& v) {
    return std::sqrt(lengthSquared(v));
}

inline float distance(const Vector3& a, const Vector3& b) {
    return length(a - b);
}

inline bool isFinite(const Vector3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

struct Vector4 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
    float w = 0.0f;

    constexpr Vector4() = default;
    constexpr Vector4(float xIn, float yIn, float zIn, float wIn) : x(xIn), y(yIn), z(zIn), w(wIn) {}

    constexpr bool operator==(const Vector4&) const = default;
};

// World-space axis-aligned box. Bounds are closed on both ends.
struct Aabb {
    Vector3 min{};
    Vector3 max{};

    constexpr bool operator==(const Aabb&) const = default;

    [[nodiscard]] bool intersects(const Aabb& other) const {
        return min.x <= other.max.x && max.x >= other.min.x &&
               min.y <= other.max.y && max.y >= other.min.y &&
               min.z <= other.max.z && max.z >= other.min.z;
    }

    [[nodiscard]] bool valid() const {
        return isFinite(min) && isFinite(max) &&
               min.x <= max.x && min.y <= max.y && min.z <= max.z;
    }

    void include(const Aabb& other) {
        min.x = std::min(min.x, other.min.x);
        min.y = std::min(min.y, other.min.y);
        min.z = std::min(min.z, other.min.z);
        max.x = std::max(max.x, other.max.x);
        max.y = std::max(max.y, other.max.y);
        max.z = std::max(max.z, other.max.z);
    }
};

} // namespace subvox::math
