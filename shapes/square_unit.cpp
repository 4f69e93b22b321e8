#include "square_unit.hpp"
#include <geometry/primitives.hpp>

namespace quiltblock {

const std::vector<PatchDefinition>& SquareUnit::patches() const {
    static const std::vector<PatchDefinition> patches = {
        {patch::FILL, "Fill", "background"},
    };
    return patches;
}

TriangleGroup SquareUnit::get_triangles(const UnitConfig&, double width, double height) const {
    return geometry::square_triangles(width, height);
}

ConfigSchema SquareUnit::config_schema() const {
    return {{}, {patch::FILL}};
}

Thumbnail SquareUnit::thumbnail() const {
    return {"0 0 24 24", {{"3,3 21,3 21,21 3,21", "currentColor"}}};
}

}  // namespace quiltblock
