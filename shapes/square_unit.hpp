#ifndef QUILTBLOCK_SHAPES_SQUARE_UNIT_HPP
#define QUILTBLOCK_SHAPES_SQUARE_UNIT_HPP

#include <registry/unit_definition.hpp>

namespace quiltblock {

// Solid square filling one cell. Rendered as two triangles so every unit
// shares the triangle pipeline.
class SquareUnit : public UnitDefinition {
public:
    std::string type_id() const override { return "square"; }
    std::string display_name() const override { return "Square"; }
    UnitCategory category() const override { return UnitCategory::Basic; }
    std::string description() const override { return "A solid square filling one grid cell"; }

    Span default_span() const override { return {1, 1}; }
    SpanBehavior span_behavior() const override { return span_behavior::Fixed{{1, 1}}; }
    const std::vector<PatchDefinition>& patches() const override;

    TriangleGroup get_triangles(const UnitConfig& config, double width, double height) const override;

    ConfigSchema config_schema() const override;
    Thumbnail thumbnail() const override;
};

}  // namespace quiltblock

#endif // QUILTBLOCK_SHAPES_SQUARE_UNIT_HPP
