#ifndef QUILTBLOCK_HISTORY_PATTERN_OPERATION_HPP
#define QUILTBLOCK_HISTORY_PATTERN_OPERATION_HPP

// Invertible edits over a pattern. Palette and border edits reuse the
// block operations; placed blocks and the rows x cols grid have their own.

#include "operation.hpp"
#include <model/border.hpp>
#include <model/palette.hpp>
#include <model/pattern.hpp>
#include <string_view>
#include <variant>
#include <vector>

namespace quiltblock {
namespace pattern_op {

struct AddBlockInstance {
    BlockInstance instance;
    bool operator==(const AddBlockInstance&) const = default;
};

struct RemoveBlockInstance {
    BlockInstance instance;
    bool operator==(const RemoveBlockInstance&) const = default;
};

// prev and next set the same fields
struct UpdateBlockInstance {
    BlockInstanceId instance_id;
    BlockInstanceUpdate prev;
    BlockInstanceUpdate next;
    bool operator==(const UpdateBlockInstance&) const = default;
};

// Instances are moved by the shift first, then those outside next_size are
// dropped. A resize that grows either dimension puts removed_instances back
// at their recorded positions. Each resize changes the grid in one
// direction only, so growing never drops anything.
struct ResizeGrid {
    QuiltGridSize prev_size;
    QuiltGridSize next_size;
    std::vector<BlockInstance> removed_instances;
    int row_shift = 0;
    int col_shift = 0;
    bool operator==(const ResizeGrid&) const = default;
};

// Forward declaration for Batch
struct Batch;

}  // namespace pattern_op

using PatternOperation = std::variant<
    pattern_op::AddBlockInstance, pattern_op::RemoveBlockInstance, pattern_op::UpdateBlockInstance,
    pattern_op::ResizeGrid,
    op::UpdatePalette, op::AddRole, op::RemoveRole, op::RenameRole,
    op::AddBorder, op::RemoveBorder, op::UpdateBorder,
    op::SetBordersEnabled, op::ReorderBorders,
    pattern_op::Batch
>;

namespace pattern_op {

// One undo step made of several operations, applied in order
struct Batch {
    std::vector<PatternOperation> operations;
    bool operator==(const Batch&) const = default;
};

}  // namespace pattern_op

std::string_view operation_type(const PatternOperation& operation);
PatternOperation invert_operation(const PatternOperation& operation);

// Everything a pattern operation can change
struct PatternState {
    std::vector<BlockInstance> instances;
    QuiltGridSize grid_size;
    Palette palette;
    BorderConfig border_config;

    bool operator==(const PatternState&) const = default;
};

std::vector<BlockInstance> apply_to_instances(const std::vector<BlockInstance>& instances,
                                              const PatternOperation& operation);
QuiltGridSize apply_to_grid_size(const QuiltGridSize& grid_size, const PatternOperation& operation);
Palette apply_to_palette(const Palette& palette, const PatternOperation& operation);
BorderConfig apply_to_border_config(const BorderConfig& config, const PatternOperation& operation);

PatternState apply_operation(const PatternState& state, const PatternOperation& operation);

// Instances left outside `grid_size` after moving by the shift, at their
// unshifted positions
std::vector<BlockInstance> get_instances_out_of_bounds(const std::vector<BlockInstance>& instances,
                                                       const QuiltGridSize& grid_size,
                                                       int row_shift = 0, int col_shift = 0);

}  // namespace quiltblock

#endif // QUILTBLOCK_HISTORY_PATTERN_OPERATION_HPP
