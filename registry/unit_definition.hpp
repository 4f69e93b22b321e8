#ifndef QUILTBLOCK_REGISTRY_UNIT_DEFINITION_HPP
#define QUILTBLOCK_REGISTRY_UNIT_DEFINITION_HPP

#include <geometry/triangle.hpp>
#include <model/unit.hpp>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace quiltblock {

// Type-erased unit instance data, as the registry sees it
struct UnitConfig {
    std::optional<std::string> variant;
    PatchRoles patch_roles;

    bool operator==(const UnitConfig&) const = default;
};

// A colorable region of a unit
struct PatchDefinition {
    std::string id;
    std::string name;
    ColorRoleId default_role;
};

// An orientation/arrangement a unit can take
struct VariantDefinition {
    std::string id;
    std::string label;
    std::string symbol;
};

enum class UnitCategory { Basic, Compound, Advanced };

enum class PlacementMode { SingleTap, TwoTap };

std::string_view to_string(UnitCategory category);
std::string_view to_string(PlacementMode mode);

namespace span_behavior {

struct Fixed {
    Span span;
};

// Span is a function of the variant (flying geese orientation)
struct VariantDependent {
    std::function<Span(const std::string& variant)> get_span;
};

}  // namespace span_behavior

using SpanBehavior = std::variant<span_behavior::Fixed, span_behavior::VariantDependent>;

// Outcome of a placement check for a unit's first cell
struct PlacementValidation {
    bool valid = true;
    std::string reason;
    std::vector<GridPosition> valid_adjacent_cells;
};

using CellOccupancy = std::function<bool(const GridPosition&)>;

// Structural check results
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;

    void add_warning(const std::string& msg) {
        warnings.push_back(msg);
    }

    void add_error(const std::string& msg) {
        errors.push_back(msg);
        valid = false;
    }
};

// Structural schema of a unit's config: the allowed variants (empty means
// the unit takes no variant) and the patch ids that must carry a role.
struct ConfigSchema {
    std::vector<std::string> variants;
    std::vector<std::string> required_patches;

    ValidationResult validate(const UnitConfig& config) const;
};

struct SvgPath {
    std::string points;
    std::string fill;
};

// Picker icon
struct Thumbnail {
    std::string view_box;
    std::vector<SvgPath> paths;
};

// Describes one kind of unit: its patches, variants, geometry and
// transforms. Concrete definitions live in shapes/.
class UnitDefinition {
public:
    virtual ~UnitDefinition() = default;

    // Identity
    virtual std::string type_id() const = 0;
    virtual std::string display_name() const = 0;
    virtual UnitCategory category() const = 0;
    virtual std::string description() const = 0;

    // Geometry configuration
    virtual Span default_span() const = 0;
    virtual SpanBehavior span_behavior() const = 0;
    virtual const std::vector<PatchDefinition>& patches() const = 0;

    // Variants. Empty list and nullopt default for symmetric units.
    virtual const std::vector<VariantDefinition>& variants() const;
    virtual std::optional<std::string> default_variant() const { return std::nullopt; }

    // Triangles tiling width x height, tagged with patch ids
    virtual TriangleGroup get_triangles(const UnitConfig& config, double width, double height) const = 0;

    // Optional transforms. nullopt means the unit does not transform
    // that way.
    virtual std::optional<std::string> rotate_variant(const std::string& current) const;
    virtual std::optional<std::string> flip_horizontal_variant(const std::string& current) const;
    virtual std::optional<std::string> flip_vertical_variant(const std::string& current) const;
    virtual std::optional<PatchRoles> rotate_patch_roles(const PatchRoles& current) const;
    virtual std::optional<PatchRoles> flip_horizontal_patch_roles(const PatchRoles& current) const;
    virtual std::optional<PatchRoles> flip_vertical_patch_roles(const PatchRoles& current) const;

    // Validation
    virtual ConfigSchema config_schema() const = 0;
    virtual std::optional<PlacementValidation> validate_placement(
        const GridPosition& position, int grid_size, const CellOccupancy& is_cell_occupied) const;

    // UI metadata
    virtual Thumbnail thumbnail() const = 0;
    virtual PlacementMode placement_mode() const { return PlacementMode::SingleTap; }
    virtual bool supports_batch_placement() const { return true; }
    virtual bool wide_in_picker() const { return false; }

    // Span for a variant, resolved through span_behavior()
    Span span_for_variant(const std::optional<std::string>& variant) const;

    // Patch id lookup; nullptr when the id is unknown
    const PatchDefinition* find_patch(const std::string& patch_id) const;

    // Config with every patch at its default role and the default variant
    UnitConfig default_config() const;
};

}  // namespace quiltblock

#endif // QUILTBLOCK_REGISTRY_UNIT_DEFINITION_HPP
