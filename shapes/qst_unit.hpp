#ifndef QUILTBLOCK_SHAPES_QST_UNIT_HPP
#define QUILTBLOCK_SHAPES_QST_UNIT_HPP

#include <registry/unit_definition.hpp>

namespace quiltblock {

// Quarter-square triangle. Symmetric, so it has no variants: rotation and
// flips permute the four patch roles instead.
class QstUnit : public UnitDefinition {
public:
    std::string type_id() const override { return "qst"; }
    std::string display_name() const override { return "Quarter-Square Triangle"; }
    UnitCategory category() const override { return UnitCategory::Basic; }
    std::string description() const override {
        return "Four triangles meeting at the center, each independently colorable";
    }

    Span default_span() const override { return {1, 1}; }
    SpanBehavior span_behavior() const override { return span_behavior::Fixed{{1, 1}}; }
    const std::vector<PatchDefinition>& patches() const override;

    TriangleGroup get_triangles(const UnitConfig& config, double width, double height) const override;

    // Clockwise: the role on top moves to the right, and so on
    std::optional<PatchRoles> rotate_patch_roles(const PatchRoles& current) const override;
    std::optional<PatchRoles> flip_horizontal_patch_roles(const PatchRoles& current) const override;
    std::optional<PatchRoles> flip_vertical_patch_roles(const PatchRoles& current) const override;

    ConfigSchema config_schema() const override;
    Thumbnail thumbnail() const override;
};

}  // namespace quiltblock

#endif // QUILTBLOCK_SHAPES_QST_UNIT_HPP
