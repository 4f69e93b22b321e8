#ifndef QUILTBLOCK_GEOMETRY_PRIMITIVES_HPP
#define QUILTBLOCK_GEOMETRY_PRIMITIVES_HPP

// Triangle layouts for each primitive. Every function tiles the
// width x height rectangle exactly; no vertex leaves [0,w] x [0,h].

#include "triangle.hpp"
#include <model/unit.hpp>

namespace quiltblock {

namespace patch {
    constexpr const char* FILL = "fill";
    constexpr const char* PRIMARY = "primary";
    constexpr const char* SECONDARY = "secondary";
    constexpr const char* GOOSE = "goose";
    constexpr const char* SKY1 = "sky1";
    constexpr const char* SKY2 = "sky2";
    constexpr const char* TOP = "top";
    constexpr const char* RIGHT = "right";
    constexpr const char* BOTTOM = "bottom";
    constexpr const char* LEFT = "left";
}

namespace geometry {

// Whole cell as two triangles of the same patch (same split as HST nw)
TriangleGroup square_triangles(double width, double height);

// Primary triangle fills the corner named by the variant
TriangleGroup hst_triangles(HstVariant variant, double width, double height);

// Goose points toward `direction`; sky1 and sky2 flank it
TriangleGroup flying_geese_triangles(FlyingGeeseDirection direction, double width, double height);

// Four triangles meeting at the center: top, right, bottom, left
TriangleGroup qst_triangles(double width, double height);

}  // namespace geometry
}  // namespace quiltblock

#endif // QUILTBLOCK_GEOMETRY_PRIMITIVES_HPP
