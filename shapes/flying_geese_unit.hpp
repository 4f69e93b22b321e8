#ifndef QUILTBLOCK_SHAPES_FLYING_GEESE_UNIT_HPP
#define QUILTBLOCK_SHAPES_FLYING_GEESE_UNIT_HPP

#include <registry/unit_definition.hpp>

namespace quiltblock {

// Flying geese: 2:1 unit with a goose triangle pointing along the
// direction and two sky triangles beside it. Horizontal directions span
// 1x2, vertical ones 2x1. Placed with two taps.
class FlyingGeeseUnit : public UnitDefinition {
public:
    std::string type_id() const override { return "flying_geese"; }
    std::string display_name() const override { return "Flying Geese"; }
    UnitCategory category() const override { return UnitCategory::Compound; }
    std::string description() const override {
        return "A 2:1 ratio unit with a center triangle and two flanking triangles";
    }

    Span default_span() const override { return {1, 2}; }
    SpanBehavior span_behavior() const override;
    const std::vector<PatchDefinition>& patches() const override;

    const std::vector<VariantDefinition>& variants() const override;
    std::optional<std::string> default_variant() const override { return "right"; }

    TriangleGroup get_triangles(const UnitConfig& config, double width, double height) const override;

    std::optional<std::string> rotate_variant(const std::string& current) const override;
    std::optional<std::string> flip_horizontal_variant(const std::string& current) const override;
    std::optional<std::string> flip_vertical_variant(const std::string& current) const override;

    // Both flips swap the sky roles; used when the direction is unchanged
    std::optional<PatchRoles> flip_horizontal_patch_roles(const PatchRoles& current) const override;
    std::optional<PatchRoles> flip_vertical_patch_roles(const PatchRoles& current) const override;

    ConfigSchema config_schema() const override;

    // Valid when at least one 4-neighbour is inside the grid and empty;
    // those neighbours are the candidates for the second tap.
    std::optional<PlacementValidation> validate_placement(
        const GridPosition& position, int grid_size, const CellOccupancy& is_cell_occupied) const override;

    Thumbnail thumbnail() const override;
    PlacementMode placement_mode() const override { return PlacementMode::TwoTap; }
    bool supports_batch_placement() const override { return false; }
    bool wide_in_picker() const override { return true; }
};

// Span for a direction: 1x2 for left/right, 2x1 for up/down
Span flying_geese_span(FlyingGeeseDirection direction);

}  // namespace quiltblock

#endif // QUILTBLOCK_SHAPES_FLYING_GEESE_UNIT_HPP
