#ifndef QUILTBLOCK_MATH_VEC2_HPP
#define QUILTBLOCK_MATH_VEC2_HPP

#include <cmath>
#include <vector>

namespace quiltblock {

// Pixel-space point. y grows downward, matching the rendering surface.
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    constexpr Vec2() = default;
    constexpr Vec2(double x_, double y_) : x(x_), y(y_) {}

    constexpr Vec2 operator+(const Vec2& other) const {
        return {x + other.x, y + other.y};
    }

    constexpr Vec2 operator-(const Vec2& other) const {
        return {x - other.x, y - other.y};
    }

    constexpr Vec2 operator*(double scalar) const {
        return {x * scalar, y * scalar};
    }

    // Z component of the 3D cross product
    constexpr double cross(const Vec2& other) const {
        return x * other.y - y * other.x;
    }

    double distance_to(const Vec2& other) const {
        return std::hypot(x - other.x, y - other.y);
    }

    // Comparison (exact)
    constexpr bool operator==(const Vec2& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Vec2& other) const {
        return !(*this == other);
    }
};

// Axis-aligned rectangle (top-left origin)
struct Rect {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    constexpr double right() const { return x + width; }
    constexpr double bottom() const { return y + height; }
    constexpr double area() const { return width * height; }

    // Grow (or shrink, with a negative amount) equally on all four sides
    constexpr Rect inset(double amount) const {
        return {x + amount, y + amount, width - amount * 2.0, height - amount * 2.0};
    }

    constexpr Rect expanded(double amount) const {
        return inset(-amount);
    }

    // Corners in clockwise order starting top-left
    std::vector<Vec2> corners() const {
        return {{x, y}, {right(), y}, {right(), bottom()}, {x, bottom()}};
    }

    constexpr bool operator==(const Rect& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
};

// Signed area of a simple polygon (shoelace). Positive for clockwise
// winding in y-down coordinates.
inline double polygon_signed_area(const std::vector<Vec2>& points) {
    double twice_area = 0.0;
    for (size_t i = 0; i < points.size(); ++i) {
        const Vec2& a = points[i];
        const Vec2& b = points[(i + 1) % points.size()];
        twice_area += a.cross(b);
    }
    return twice_area * 0.5;
}

inline double polygon_area(const std::vector<Vec2>& points) {
    return std::abs(polygon_signed_area(points));
}

}  // namespace quiltblock

#endif // QUILTBLOCK_MATH_VEC2_HPP
