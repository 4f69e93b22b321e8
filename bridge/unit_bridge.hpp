#ifndef QUILTBLOCK_BRIDGE_UNIT_BRIDGE_HPP
#define QUILTBLOCK_BRIDGE_UNIT_BRIDGE_HPP

// Conversions between typed units and the registry's generic UnitConfig.
// Transforms return partial updates; the caller decides whether to apply
// them and how to record them.

#include <model/palette.hpp>
#include <model/unit.hpp>
#include <registry/unit_registry.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace quiltblock {

// Generic view of a typed unit
UnitConfig to_unit_config(const Unit& unit);

// Merge a partial update into a typed unit. Patch ids that do not belong
// to the unit's type are ignored. A variant change without an explicit
// span takes the span the definition assigns to the new variant.
Unit apply_unit_update(const Unit& unit, const UnitUpdate& update,
                       const UnitRegistry& registry = builtin_registry());

// Typed unit built from a generic config. Patches the config leaves out
// take the definition's default roles, a missing variant the default
// variant, and the span follows the definition. Throws
// UnknownUnitTypeError for unregistered types and std::invalid_argument
// for a variant the definition does not list.
Unit make_unit(const UnitId& id, const GridPosition& position, UnitType type,
               const UnitConfig& config = {}, const UnitRegistry& registry = builtin_registry());

// Values the unit currently holds for every field the update sets; the
// "prev" side of an update operation
UnitUpdate capture_prev(const Unit& unit, const UnitUpdate& next);

// Rotate 90 degrees clockwise. nullopt when the unit does not rotate.
std::optional<UnitUpdate> apply_rotation(const Unit& unit,
                                         const UnitRegistry& registry = builtin_registry());

// Mirror left-right / top-bottom. Patch roles are swapped only when the
// variant stays the same. nullopt when nothing changes.
std::optional<UnitUpdate> apply_flip_horizontal(const Unit& unit,
                                                const UnitRegistry& registry = builtin_registry());
std::optional<UnitUpdate> apply_flip_vertical(const Unit& unit,
                                              const UnitRegistry& registry = builtin_registry());

struct RoleAssignment {
    UnitUpdate prev;
    UnitUpdate next;
};

// Set one patch to a role. An absent or unknown patch id targets the
// definition's first patch. prev carries all current roles.
RoleAssignment assign_patch_role(const Unit& unit, const ColorRoleId& role_id,
                                 const std::optional<std::string>& patch_id = std::nullopt,
                                 const UnitRegistry& registry = builtin_registry());

// Update moving every patch using old_role to new_role; empty when the
// unit does not use old_role
UnitUpdate replace_role(const Unit& unit, const ColorRoleId& old_role, const ColorRoleId& new_role);

// Role ids of all patches, in patch-id order (duplicates kept)
std::vector<ColorRoleId> get_all_role_ids(const Unit& unit);
bool unit_uses_role(const Unit& unit, const ColorRoleId& role_id);

// Span the definition assigns to a type and variant. A missing variant
// resolves to the default variant.
Span get_span_for_unit(const std::string& type_id, const std::optional<std::string>& variant = std::nullopt,
                       const UnitRegistry& registry = builtin_registry());

// Override, then palette, then neutral gray
HexColor resolve_color(const ColorRoleId& role_id, const Palette& palette,
                       const PaletteOverrides& overrides = {});

struct ColoredTriangle {
    std::vector<double> points;  // x1, y1, x2, y2, x3, y3
    HexColor color;
};

// Triangles of a unit sized span * cell_size, each with its fill color
std::vector<ColoredTriangle> get_unit_triangles_with_colors(
    const Unit& unit, double cell_size, const Palette& palette,
    const PaletteOverrides& overrides = {},
    const UnitRegistry& registry = builtin_registry());

}  // namespace quiltblock

#endif // QUILTBLOCK_BRIDGE_UNIT_BRIDGE_HPP
