#include "pattern_operation.hpp"
#include <algorithm>
#include <iterator>
#include <type_traits>

namespace quiltblock {

namespace {

// Palette and border operations, applied and inverted as block operations
template <typename T>
constexpr bool is_shared_operation_v =
    std::is_same_v<T, op::UpdatePalette> || std::is_same_v<T, op::AddRole> ||
    std::is_same_v<T, op::RemoveRole> || std::is_same_v<T, op::RenameRole> ||
    std::is_same_v<T, op::AddBorder> || std::is_same_v<T, op::RemoveBorder> ||
    std::is_same_v<T, op::UpdateBorder> || std::is_same_v<T, op::SetBordersEnabled> ||
    std::is_same_v<T, op::ReorderBorders>;

bool grows(const pattern_op::ResizeGrid& resize) {
    return resize.next_size.rows > resize.prev_size.rows || resize.next_size.cols > resize.prev_size.cols;
}

GridPosition shifted(const GridPosition& position, int row_shift, int col_shift) {
    return {position.row + row_shift, position.col + col_shift};
}

}  // namespace

std::string_view operation_type(const PatternOperation& operation) {
    return std::visit([](const auto& o) -> std::string_view {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, pattern_op::AddBlockInstance>) return "add_block_instance";
        else if constexpr (std::is_same_v<T, pattern_op::RemoveBlockInstance>) return "remove_block_instance";
        else if constexpr (std::is_same_v<T, pattern_op::UpdateBlockInstance>) return "update_block_instance";
        else if constexpr (std::is_same_v<T, pattern_op::ResizeGrid>) return "resize_grid";
        else if constexpr (is_shared_operation_v<T>) return operation_type(Operation(o));
        else return "batch";
    }, operation);
}

PatternOperation invert_operation(const PatternOperation& operation) {
    return std::visit([](const auto& o) -> PatternOperation {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, pattern_op::AddBlockInstance>) {
            return pattern_op::RemoveBlockInstance{o.instance};
        } else if constexpr (std::is_same_v<T, pattern_op::RemoveBlockInstance>) {
            return pattern_op::AddBlockInstance{o.instance};
        } else if constexpr (std::is_same_v<T, pattern_op::UpdateBlockInstance>) {
            return pattern_op::UpdateBlockInstance{o.instance_id, o.next, o.prev};
        } else if constexpr (std::is_same_v<T, pattern_op::ResizeGrid>) {
            return pattern_op::ResizeGrid{o.next_size, o.prev_size, o.removed_instances,
                                          -o.row_shift, -o.col_shift};
        } else if constexpr (std::is_same_v<T, op::RemoveRole>) {
            // Pattern roles are never reassigned on removal, so there are no
            // units to restore
            return op::AddRole{o.role, o.index};
        } else if constexpr (is_shared_operation_v<T>) {
            return std::visit([](auto&& inverse) -> PatternOperation {
                using I = std::decay_t<decltype(inverse)>;
                if constexpr (is_shared_operation_v<I>) {
                    return inverse;
                } else {
                    return pattern_op::Batch{};
                }
            }, invert_operation(Operation(o)));
        } else {
            pattern_op::Batch inverted;
            inverted.operations.reserve(o.operations.size());
            for (auto it = o.operations.rbegin(); it != o.operations.rend(); ++it) {
                inverted.operations.push_back(invert_operation(*it));
            }
            return inverted;
        }
    }, operation);
}

std::vector<BlockInstance> apply_to_instances(const std::vector<BlockInstance>& instances,
                                              const PatternOperation& operation) {
    return std::visit([&](const auto& o) -> std::vector<BlockInstance> {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, pattern_op::AddBlockInstance>) {
            std::vector<BlockInstance> result = instances;
            if (!find_instance(result, o.instance.id)) {
                result.push_back(o.instance);
            }
            return result;
        } else if constexpr (std::is_same_v<T, pattern_op::RemoveBlockInstance>) {
            std::vector<BlockInstance> result;
            std::copy_if(instances.begin(), instances.end(), std::back_inserter(result),
                         [&](const BlockInstance& i) { return i.id != o.instance.id; });
            return result;
        } else if constexpr (std::is_same_v<T, pattern_op::UpdateBlockInstance>) {
            std::vector<BlockInstance> result;
            result.reserve(instances.size());
            for (const auto& i : instances) {
                result.push_back(i.id == o.instance_id ? apply_instance_update(i, o.next) : i);
            }
            return result;
        } else if constexpr (std::is_same_v<T, pattern_op::ResizeGrid>) {
            std::vector<BlockInstance> result;
            for (const auto& i : instances) {
                BlockInstance moved = i;
                moved.position = shifted(i.position, o.row_shift, o.col_shift);
                if (in_pattern_grid(moved.position, o.next_size)) {
                    result.push_back(std::move(moved));
                }
            }
            if (grows(o)) {
                for (const auto& removed : o.removed_instances) {
                    if (!find_instance(result, removed.id)) {
                        result.push_back(removed);
                    }
                }
            }
            return result;
        } else if constexpr (std::is_same_v<T, pattern_op::Batch>) {
            std::vector<BlockInstance> result = instances;
            for (const auto& member : o.operations) {
                result = apply_to_instances(result, member);
            }
            return result;
        } else {
            return instances;
        }
    }, operation);
}

QuiltGridSize apply_to_grid_size(const QuiltGridSize& grid_size, const PatternOperation& operation) {
    if (const auto* resize = std::get_if<pattern_op::ResizeGrid>(&operation)) {
        return resize->next_size;
    }
    QuiltGridSize result = grid_size;
    if (const auto* batch = std::get_if<pattern_op::Batch>(&operation)) {
        for (const auto& member : batch->operations) {
            result = apply_to_grid_size(result, member);
        }
    }
    return result;
}

Palette apply_to_palette(const Palette& palette, const PatternOperation& operation) {
    return std::visit([&](const auto& o) -> Palette {
        using T = std::decay_t<decltype(o)>;
        if constexpr (is_shared_operation_v<T>) {
            return apply_to_palette(palette, Operation(o));
        } else if constexpr (std::is_same_v<T, pattern_op::Batch>) {
            Palette result = palette;
            for (const auto& member : o.operations) {
                result = apply_to_palette(result, member);
            }
            return result;
        } else {
            return palette;
        }
    }, operation);
}

BorderConfig apply_to_border_config(const BorderConfig& config, const PatternOperation& operation) {
    return std::visit([&](const auto& o) -> BorderConfig {
        using T = std::decay_t<decltype(o)>;
        if constexpr (is_shared_operation_v<T>) {
            return apply_to_border_config(config, Operation(o));
        } else if constexpr (std::is_same_v<T, pattern_op::Batch>) {
            BorderConfig result = config;
            for (const auto& member : o.operations) {
                result = apply_to_border_config(result, member);
            }
            return result;
        } else {
            return config;
        }
    }, operation);
}

PatternState apply_operation(const PatternState& state, const PatternOperation& operation) {
    PatternState next;
    next.instances = apply_to_instances(state.instances, operation);
    next.grid_size = apply_to_grid_size(state.grid_size, operation);
    next.palette = apply_to_palette(state.palette, operation);
    next.border_config = apply_to_border_config(state.border_config, operation);
    return next;
}

std::vector<BlockInstance> get_instances_out_of_bounds(const std::vector<BlockInstance>& instances,
                                                       const QuiltGridSize& grid_size,
                                                       int row_shift, int col_shift) {
    std::vector<BlockInstance> result;
    for (const auto& i : instances) {
        if (!in_pattern_grid(shifted(i.position, row_shift, col_shift), grid_size)) {
            result.push_back(i);
        }
    }
    return result;
}

}  // namespace quiltblock
