#include "primitives.hpp"

namespace quiltblock {
namespace geometry {

TriangleGroup square_triangles(double width, double height) {
    return {
        {patch::FILL, {{{0, 0}, {width, 0}, {0, height}}}},
        {patch::FILL, {{{width, 0}, {width, height}, {0, height}}}},
    };
}

TriangleGroup hst_triangles(HstVariant variant, double width, double height) {
    switch (variant) {
        case HstVariant::NW:
            // Diagonal from top-right to bottom-left
            return {
                {patch::PRIMARY, {{{0, 0}, {width, 0}, {0, height}}}},
                {patch::SECONDARY, {{{width, 0}, {width, height}, {0, height}}}},
            };
        case HstVariant::NE:
            // Diagonal from top-left to bottom-right
            return {
                {patch::PRIMARY, {{{0, 0}, {width, 0}, {width, height}}}},
                {patch::SECONDARY, {{{0, 0}, {width, height}, {0, height}}}},
            };
        case HstVariant::SW:
            return {
                {patch::PRIMARY, {{{0, 0}, {0, height}, {width, height}}}},
                {patch::SECONDARY, {{{0, 0}, {width, 0}, {width, height}}}},
            };
        case HstVariant::SE:
            return {
                {patch::PRIMARY, {{{width, 0}, {width, height}, {0, height}}}},
                {patch::SECONDARY, {{{0, 0}, {width, 0}, {0, height}}}},
            };
    }
    return {};
}

TriangleGroup flying_geese_triangles(FlyingGeeseDirection direction, double width, double height) {
    const double half_w = width / 2.0;
    const double half_h = height / 2.0;

    switch (direction) {
        case FlyingGeeseDirection::Right:
            return {
                {patch::GOOSE, {{{0, 0}, {width, half_h}, {0, height}}}},
                {patch::SKY1, {{{0, 0}, {width, 0}, {width, half_h}}}},
                {patch::SKY2, {{{0, height}, {width, half_h}, {width, height}}}},
            };
        case FlyingGeeseDirection::Left:
            return {
                {patch::GOOSE, {{{width, 0}, {0, half_h}, {width, height}}}},
                {patch::SKY1, {{{0, 0}, {width, 0}, {0, half_h}}}},
                {patch::SKY2, {{{0, half_h}, {width, height}, {0, height}}}},
            };
        case FlyingGeeseDirection::Down:
            return {
                {patch::GOOSE, {{{0, 0}, {half_w, height}, {width, 0}}}},
                {patch::SKY1, {{{0, 0}, {0, height}, {half_w, height}}}},
                {patch::SKY2, {{{width, 0}, {half_w, height}, {width, height}}}},
            };
        case FlyingGeeseDirection::Up:
            return {
                {patch::GOOSE, {{{0, height}, {half_w, 0}, {width, height}}}},
                {patch::SKY1, {{{0, 0}, {half_w, 0}, {0, height}}}},
                {patch::SKY2, {{{half_w, 0}, {width, 0}, {width, height}}}},
            };
    }
    return {};
}

TriangleGroup qst_triangles(double width, double height) {
    const Vec2 center{width / 2.0, height / 2.0};
    return {
        {patch::TOP, {{{0, 0}, {width, 0}, center}}},
        {patch::RIGHT, {{{width, 0}, {width, height}, center}}},
        {patch::BOTTOM, {{{width, height}, {0, height}, center}}},
        {patch::LEFT, {{{0, height}, {0, 0}, center}}},
    };
}

}  // namespace geometry
}  // namespace quiltblock
