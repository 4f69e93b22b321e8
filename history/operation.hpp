#ifndef QUILTBLOCK_HISTORY_OPERATION_HPP
#define QUILTBLOCK_HISTORY_OPERATION_HPP

// Invertible edits over a design. Every mutation of units, grid size,
// palette or borders is expressed as an Operation so it can be undone.

#include <model/border.hpp>
#include <model/palette.hpp>
#include <model/unit.hpp>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace quiltblock {
namespace op {

struct AddUnit {
    Unit unit;
    bool operator==(const AddUnit&) const = default;
};

struct RemoveUnit {
    Unit unit;
    bool operator==(const RemoveUnit&) const = default;
};

// prev and next set the same fields
struct UpdateUnit {
    UnitId unit_id;
    UnitUpdate prev;
    UnitUpdate next;
    bool operator==(const UpdateUnit&) const = default;
};

struct UpdatePalette {
    ColorRoleId role_id;
    HexColor prev_color;
    HexColor next_color;
    bool operator==(const UpdatePalette&) const = default;
};

// removed_units holds what a shrink dropped, so growing back restores it
struct ResizeGrid {
    int prev_size = 0;
    int next_size = 0;
    std::vector<Unit> removed_units;
    bool operator==(const ResizeGrid&) const = default;
};

// index is the insertion point; appended when absent
struct AddRole {
    ColorRole role;
    std::optional<size_t> index;
    bool operator==(const AddRole&) const = default;
};

struct AffectedUnit {
    UnitId unit_id;
    PatchRoles prev_roles;  // All patch roles before the reassignment
    bool operator==(const AffectedUnit&) const = default;
};

// Removes the role from the palette only. The units that used it are
// reassigned by separate UpdateUnit operations; affected_units records
// their prior roles so the inverse can restore them.
struct RemoveRole {
    ColorRole role;
    size_t index = 0;
    std::vector<AffectedUnit> affected_units;
    ColorRoleId fallback_role_id;
    bool operator==(const RemoveRole&) const = default;
};

struct RenameRole {
    ColorRoleId role_id;
    std::string prev_name;
    std::string next_name;
    bool operator==(const RenameRole&) const = default;
};

struct AddBorder {
    BorderSpec border;
    std::optional<size_t> index;
    bool operator==(const AddBorder&) const = default;
};

struct RemoveBorder {
    BorderSpec border;
    size_t index = 0;
    bool operator==(const RemoveBorder&) const = default;
};

struct UpdateBorder {
    BorderId border_id;
    BorderUpdate prev;
    BorderUpdate next;
    bool operator==(const UpdateBorder&) const = default;
};

struct SetBordersEnabled {
    bool prev = false;
    bool next = false;
    bool operator==(const SetBordersEnabled&) const = default;
};

// Move the border at `from` so it ends up at `to`
struct ReorderBorders {
    size_t from = 0;
    size_t to = 0;
    bool operator==(const ReorderBorders&) const = default;
};

// Forward declaration for Batch
struct Batch;

}  // namespace op

using Operation = std::variant<
    op::AddUnit, op::RemoveUnit, op::UpdateUnit,
    op::UpdatePalette, op::ResizeGrid,
    op::AddRole, op::RemoveRole, op::RenameRole,
    op::AddBorder, op::RemoveBorder, op::UpdateBorder,
    op::SetBordersEnabled, op::ReorderBorders,
    op::Batch
>;

namespace op {

// One undo step made of several operations, applied in order
struct Batch {
    std::vector<Operation> operations;
    bool operator==(const Batch&) const = default;
};

}  // namespace op

// Tag used in logs and JSON ("add_unit", "batch", ...)
std::string_view operation_type(const Operation& operation);

// The operation that undoes `operation`. Batches invert each member and
// reverse their order.
Operation invert_operation(const Operation& operation);

// Everything an operation can change
struct DesignState {
    std::vector<Unit> units;
    int grid_size = 3;
    Palette palette;
    BorderConfig border_config;

    bool operator==(const DesignState&) const = default;
};

// Each returns a new value; operations that do not concern the target
// return it unchanged, as do unknown unit, role and border ids.
std::vector<Unit> apply_to_units(const std::vector<Unit>& units, const Operation& operation);
Palette apply_to_palette(const Palette& palette, const Operation& operation);
int apply_to_grid_size(int grid_size, const Operation& operation);
BorderConfig apply_to_border_config(const BorderConfig& config, const Operation& operation);

DesignState apply_operation(const DesignState& state, const Operation& operation);

// Units that would not fit a grid of `grid_size`
std::vector<Unit> get_units_out_of_bounds(const std::vector<Unit>& units, int grid_size);

}  // namespace quiltblock

#endif // QUILTBLOCK_HISTORY_OPERATION_HPP
