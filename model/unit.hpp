#ifndef QUILTBLOCK_MODEL_UNIT_HPP
#define QUILTBLOCK_MODEL_UNIT_HPP

#include <compare>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace quiltblock {

using UnitId = std::string;
using ColorRoleId = std::string;

// Fabric role assigned to each colorable patch, keyed by patch id
using PatchRoles = std::map<std::string, ColorRoleId>;

// Top-left cell of a unit (0-indexed)
struct GridPosition {
    int row = 0;
    int col = 0;

    bool operator==(const GridPosition&) const = default;
    auto operator<=>(const GridPosition&) const = default;
};

// Cells occupied by a unit
struct Span {
    int rows = 1;
    int cols = 1;

    bool operator==(const Span&) const = default;
};

enum class UnitType { Square, Hst, FlyingGeese, Qst };

// Which corner the primary HST triangle fills
enum class HstVariant { NW, NE, SW, SE };

// Direction the center "goose" triangle points
enum class FlyingGeeseDirection { Up, Down, Left, Right };

namespace unit {

struct FlyingGeeseRoles {
    ColorRoleId goose;
    ColorRoleId sky1;
    ColorRoleId sky2;

    bool operator==(const FlyingGeeseRoles&) const = default;
};

struct QstRoles {
    ColorRoleId top;
    ColorRoleId right;
    ColorRoleId bottom;
    ColorRoleId left;

    bool operator==(const QstRoles&) const = default;
};

// Solid 1x1 square
struct Square {
    ColorRoleId color_role;

    bool operator==(const Square&) const = default;
};

// Two triangles split along a diagonal
struct Hst {
    HstVariant variant = HstVariant::NW;
    ColorRoleId color_role;
    ColorRoleId secondary_color_role;

    bool operator==(const Hst&) const = default;
};

// 2:1 rectangle: one goose triangle flanked by two sky triangles
struct FlyingGeese {
    FlyingGeeseDirection direction = FlyingGeeseDirection::Right;
    FlyingGeeseRoles roles;

    bool operator==(const FlyingGeese&) const = default;
};

// Four triangles meeting at the center. No variant: the shape is
// symmetric, so rotation and flips only permute the colors.
struct Qst {
    QstRoles roles;

    bool operator==(const Qst&) const = default;
};

}  // namespace unit

using UnitShape = std::variant<unit::Square, unit::Hst, unit::FlyingGeese, unit::Qst>;

// One placed primitive inside a block grid
struct Unit {
    UnitId id;
    GridPosition position;
    Span span;
    UnitShape shape;

    bool operator==(const Unit&) const = default;
};

// Partial set of unit fields, used by update operations and the bridge.
// Patch roles are keyed by the definition's patch ids; unset fields are
// left untouched when the update is applied.
struct UnitUpdate {
    std::optional<GridPosition> position;
    std::optional<Span> span;
    std::optional<std::string> variant;
    PatchRoles patch_roles;

    bool empty() const {
        return !position && !span && !variant && patch_roles.empty();
    }

    bool operator==(const UnitUpdate&) const = default;
};

// Type discriminator of a unit
UnitType unit_type(const Unit& unit);

// Registry type id ("square", "hst", "flying_geese", "qst")
std::string_view type_id(UnitType type);
std::optional<UnitType> unit_type_from_id(std::string_view id);

std::string_view to_string(HstVariant variant);
std::optional<HstVariant> hst_variant_from_string(std::string_view value);

std::string_view to_string(FlyingGeeseDirection direction);
std::optional<FlyingGeeseDirection> direction_from_string(std::string_view value);

// Grid cells covered by a unit's span
std::vector<GridPosition> covered_cells(const Unit& unit);

// True if the unit's footprint includes the given cell
bool unit_covers(const Unit& unit, const GridPosition& cell);

// Whole footprint inside a grid_size x grid_size grid
bool fits_grid(const Unit& unit, int grid_size);

// Find a unit by id in a collection
const Unit* find_unit(const std::vector<Unit>& units, const UnitId& id);

}  // namespace quiltblock

#endif // QUILTBLOCK_MODEL_UNIT_HPP
