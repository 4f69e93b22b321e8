#include "operation.hpp"
#include <bridge/unit_bridge.hpp>
#include <algorithm>
#include <iterator>
#include <limits>
#include <set>
#include <type_traits>

namespace quiltblock {

namespace {

// Index used when an insertion point was not recorded; insertion clamps
// it to the end
constexpr size_t APPEND_INDEX = std::numeric_limits<size_t>::max();

template <typename T>
void insert_clamped(std::vector<T>& items, T item, size_t index) {
    index = std::min(index, items.size());
    items.insert(items.begin() + static_cast<std::ptrdiff_t>(index), std::move(item));
}

Operation invert_remove_role(const op::RemoveRole& remove) {
    op::Batch batch;
    batch.operations.push_back(op::AddRole{remove.role, remove.index});

    for (const auto& affected : remove.affected_units) {
        for (const auto& [patch_id, role_id] : affected.prev_roles) {
            if (role_id != remove.role.id) {
                continue;
            }
            op::UpdateUnit restore;
            restore.unit_id = affected.unit_id;
            restore.prev.patch_roles[patch_id] = remove.fallback_role_id;
            restore.next.patch_roles[patch_id] = role_id;
            batch.operations.push_back(std::move(restore));
        }
    }
    return batch;
}

}  // namespace

std::string_view operation_type(const Operation& operation) {
    return std::visit([](const auto& o) -> std::string_view {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, op::AddUnit>) return "add_unit";
        else if constexpr (std::is_same_v<T, op::RemoveUnit>) return "remove_unit";
        else if constexpr (std::is_same_v<T, op::UpdateUnit>) return "update_unit";
        else if constexpr (std::is_same_v<T, op::UpdatePalette>) return "update_palette";
        else if constexpr (std::is_same_v<T, op::ResizeGrid>) return "resize_grid";
        else if constexpr (std::is_same_v<T, op::AddRole>) return "add_role";
        else if constexpr (std::is_same_v<T, op::RemoveRole>) return "remove_role";
        else if constexpr (std::is_same_v<T, op::RenameRole>) return "rename_role";
        else if constexpr (std::is_same_v<T, op::AddBorder>) return "add_border";
        else if constexpr (std::is_same_v<T, op::RemoveBorder>) return "remove_border";
        else if constexpr (std::is_same_v<T, op::UpdateBorder>) return "update_border";
        else if constexpr (std::is_same_v<T, op::SetBordersEnabled>) return "set_borders_enabled";
        else if constexpr (std::is_same_v<T, op::ReorderBorders>) return "reorder_borders";
        else return "batch";
    }, operation);
}

Operation invert_operation(const Operation& operation) {
    return std::visit([](const auto& o) -> Operation {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, op::AddUnit>) {
            return op::RemoveUnit{o.unit};
        } else if constexpr (std::is_same_v<T, op::RemoveUnit>) {
            return op::AddUnit{o.unit};
        } else if constexpr (std::is_same_v<T, op::UpdateUnit>) {
            return op::UpdateUnit{o.unit_id, o.next, o.prev};
        } else if constexpr (std::is_same_v<T, op::UpdatePalette>) {
            return op::UpdatePalette{o.role_id, o.next_color, o.prev_color};
        } else if constexpr (std::is_same_v<T, op::ResizeGrid>) {
            return op::ResizeGrid{o.next_size, o.prev_size, o.removed_units};
        } else if constexpr (std::is_same_v<T, op::AddRole>) {
            // Adding a role never touched a unit
            return op::RemoveRole{o.role, o.index.value_or(APPEND_INDEX), {}, {}};
        } else if constexpr (std::is_same_v<T, op::RemoveRole>) {
            return invert_remove_role(o);
        } else if constexpr (std::is_same_v<T, op::RenameRole>) {
            return op::RenameRole{o.role_id, o.next_name, o.prev_name};
        } else if constexpr (std::is_same_v<T, op::AddBorder>) {
            return op::RemoveBorder{o.border, o.index.value_or(APPEND_INDEX)};
        } else if constexpr (std::is_same_v<T, op::RemoveBorder>) {
            return op::AddBorder{o.border, o.index};
        } else if constexpr (std::is_same_v<T, op::UpdateBorder>) {
            return op::UpdateBorder{o.border_id, o.next, o.prev};
        } else if constexpr (std::is_same_v<T, op::SetBordersEnabled>) {
            return op::SetBordersEnabled{o.next, o.prev};
        } else if constexpr (std::is_same_v<T, op::ReorderBorders>) {
            return op::ReorderBorders{o.to, o.from};
        } else {
            op::Batch inverted;
            inverted.operations.reserve(o.operations.size());
            for (auto it = o.operations.rbegin(); it != o.operations.rend(); ++it) {
                inverted.operations.push_back(invert_operation(*it));
            }
            return inverted;
        }
    }, operation);
}

std::vector<Unit> apply_to_units(const std::vector<Unit>& units, const Operation& operation) {
    return std::visit([&](const auto& o) -> std::vector<Unit> {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, op::AddUnit>) {
            std::vector<Unit> result = units;
            if (!find_unit(result, o.unit.id)) {
                result.push_back(o.unit);
            }
            return result;
        } else if constexpr (std::is_same_v<T, op::RemoveUnit>) {
            std::vector<Unit> result;
            std::copy_if(units.begin(), units.end(), std::back_inserter(result),
                         [&](const Unit& u) { return u.id != o.unit.id; });
            return result;
        } else if constexpr (std::is_same_v<T, op::UpdateUnit>) {
            std::vector<Unit> result;
            result.reserve(units.size());
            for (const auto& u : units) {
                result.push_back(u.id == o.unit_id ? apply_unit_update(u, o.next) : u);
            }
            return result;
        } else if constexpr (std::is_same_v<T, op::ResizeGrid>) {
            if (o.next_size < o.prev_size) {
                std::set<UnitId> dropped;
                for (const auto& u : get_units_out_of_bounds(units, o.next_size)) {
                    dropped.insert(u.id);
                }
                std::vector<Unit> result;
                std::copy_if(units.begin(), units.end(), std::back_inserter(result),
                             [&](const Unit& u) { return dropped.count(u.id) == 0; });
                return result;
            }
            if (o.next_size > o.prev_size) {
                std::vector<Unit> result = units;
                for (const auto& u : o.removed_units) {
                    if (!find_unit(result, u.id)) {
                        result.push_back(u);
                    }
                }
                return result;
            }
            return units;
        } else if constexpr (std::is_same_v<T, op::Batch>) {
            std::vector<Unit> result = units;
            for (const auto& member : o.operations) {
                result = apply_to_units(result, member);
            }
            return result;
        } else {
            return units;
        }
    }, operation);
}

Palette apply_to_palette(const Palette& palette, const Operation& operation) {
    return std::visit([&](const auto& o) -> Palette {
        using T = std::decay_t<decltype(o)>;
        Palette result = palette;
        if constexpr (std::is_same_v<T, op::UpdatePalette>) {
            for (auto& role : result.roles) {
                if (role.id == o.role_id) {
                    role.color = o.next_color;
                }
            }
        } else if constexpr (std::is_same_v<T, op::AddRole>) {
            if (!result.contains(o.role.id)) {
                insert_clamped(result.roles, o.role, o.index.value_or(APPEND_INDEX));
            }
        } else if constexpr (std::is_same_v<T, op::RemoveRole>) {
            result.roles.erase(std::remove_if(result.roles.begin(), result.roles.end(),
                                              [&](const ColorRole& r) { return r.id == o.role.id; }),
                               result.roles.end());
        } else if constexpr (std::is_same_v<T, op::RenameRole>) {
            for (auto& role : result.roles) {
                if (role.id == o.role_id) {
                    role.name = o.next_name;
                }
            }
        } else if constexpr (std::is_same_v<T, op::Batch>) {
            for (const auto& member : o.operations) {
                result = apply_to_palette(result, member);
            }
        }
        return result;
    }, operation);
}

int apply_to_grid_size(int grid_size, const Operation& operation) {
    if (const auto* resize = std::get_if<op::ResizeGrid>(&operation)) {
        return resize->next_size;
    }
    if (const auto* batch = std::get_if<op::Batch>(&operation)) {
        for (const auto& member : batch->operations) {
            grid_size = apply_to_grid_size(grid_size, member);
        }
    }
    return grid_size;
}

BorderConfig apply_to_border_config(const BorderConfig& config, const Operation& operation) {
    return std::visit([&](const auto& o) -> BorderConfig {
        using T = std::decay_t<decltype(o)>;
        BorderConfig result = config;
        auto& borders = result.borders;
        if constexpr (std::is_same_v<T, op::AddBorder>) {
            if (!result.find(o.border.id)) {
                insert_clamped(borders, o.border, o.index.value_or(APPEND_INDEX));
            }
        } else if constexpr (std::is_same_v<T, op::RemoveBorder>) {
            borders.erase(std::remove_if(borders.begin(), borders.end(),
                                         [&](const BorderSpec& b) { return b.id == o.border.id; }),
                          borders.end());
        } else if constexpr (std::is_same_v<T, op::UpdateBorder>) {
            for (auto& border : borders) {
                if (border.id == o.border_id) {
                    border = apply_border_update(border, o.next);
                }
            }
        } else if constexpr (std::is_same_v<T, op::SetBordersEnabled>) {
            result.enabled = o.next;
        } else if constexpr (std::is_same_v<T, op::ReorderBorders>) {
            if (o.from < borders.size() && o.to < borders.size() && o.from != o.to) {
                BorderSpec moved = borders[o.from];
                borders.erase(borders.begin() + static_cast<std::ptrdiff_t>(o.from));
                insert_clamped(borders, std::move(moved), o.to);
            }
        } else if constexpr (std::is_same_v<T, op::Batch>) {
            for (const auto& member : o.operations) {
                result = apply_to_border_config(result, member);
            }
        }
        return result;
    }, operation);
}

DesignState apply_operation(const DesignState& state, const Operation& operation) {
    DesignState next;
    next.units = apply_to_units(state.units, operation);
    next.grid_size = apply_to_grid_size(state.grid_size, operation);
    next.palette = apply_to_palette(state.palette, operation);
    next.border_config = apply_to_border_config(state.border_config, operation);
    return next;
}

std::vector<Unit> get_units_out_of_bounds(const std::vector<Unit>& units, int grid_size) {
    std::vector<Unit> result;
    for (const auto& u : units) {
        if (!fits_grid(u, grid_size)) {
            result.push_back(u);
        }
    }
    return result;
}

}  // namespace quiltblock
