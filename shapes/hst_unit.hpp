#ifndef QUILTBLOCK_SHAPES_HST_UNIT_HPP
#define QUILTBLOCK_SHAPES_HST_UNIT_HPP

#include <registry/unit_definition.hpp>

namespace quiltblock {

// Half-square triangle. The variant names the corner the primary
// triangle fills; transforms change only the variant.
class HstUnit : public UnitDefinition {
public:
    std::string type_id() const override { return "hst"; }
    std::string display_name() const override { return "Half-Square Triangle"; }
    UnitCategory category() const override { return UnitCategory::Basic; }
    std::string description() const override { return "Two triangles in one cell, divided by a diagonal"; }

    Span default_span() const override { return {1, 1}; }
    SpanBehavior span_behavior() const override { return span_behavior::Fixed{{1, 1}}; }
    const std::vector<PatchDefinition>& patches() const override;

    const std::vector<VariantDefinition>& variants() const override;
    std::optional<std::string> default_variant() const override { return "nw"; }

    TriangleGroup get_triangles(const UnitConfig& config, double width, double height) const override;

    std::optional<std::string> rotate_variant(const std::string& current) const override;
    std::optional<std::string> flip_horizontal_variant(const std::string& current) const override;
    std::optional<std::string> flip_vertical_variant(const std::string& current) const override;

    ConfigSchema config_schema() const override;
    Thumbnail thumbnail() const override;
};

}  // namespace quiltblock

#endif // QUILTBLOCK_SHAPES_HST_UNIT_HPP
