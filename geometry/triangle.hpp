#ifndef QUILTBLOCK_GEOMETRY_TRIANGLE_HPP
#define QUILTBLOCK_GEOMETRY_TRIANGLE_HPP

#include <math/vec2.hpp>
#include <array>
#include <cmath>
#include <string>
#include <vector>

namespace quiltblock {

// A triangle tagged with the patch whose color fills it
struct Triangle {
    std::string patch_id;
    std::array<Vec2, 3> points;

    double area() const {
        return std::abs((points[1] - points[0]).cross(points[2] - points[0])) * 0.5;
    }

    // [x1, y1, x2, y2, x3, y3] for polygon renderers
    std::vector<double> flat_points() const {
        return {points[0].x, points[0].y, points[1].x, points[1].y, points[2].x, points[2].y};
    }

    bool operator==(const Triangle&) const = default;
};

using TriangleGroup = std::vector<Triangle>;

inline double total_area(const TriangleGroup& triangles) {
    double sum = 0.0;
    for (const auto& t : triangles) {
        sum += t.area();
    }
    return sum;
}

}  // namespace quiltblock

#endif // QUILTBLOCK_GEOMETRY_TRIANGLE_HPP
