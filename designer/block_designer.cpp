#include "block_designer.hpp"
#include "uuid.hpp"
#include <common/logging.hpp>
#include <serialization/json_serialization.hpp>
#include <algorithm>
#include <stdexcept>

namespace quiltblock {

namespace {

bool in_grid(const GridPosition& cell, int grid_size) {
    return cell.row >= 0 && cell.row < grid_size && cell.col >= 0 && cell.col < grid_size;
}

}  // namespace

BlockDesigner::BlockDesigner(const UnitRegistry& registry)
    : registry_(registry), rng_(std::random_device{}()) {
    init_block();
}

void BlockDesigner::init_block(int grid_size, const std::string& creator_id) {
    Block block;
    block.creator_id = creator_id;
    block.grid_size = std::clamp(grid_size, constants::MIN_GRID_SIZE, constants::MAX_GRID_SIZE);
    block.preview_palette = default_palette();
    block.created_at = json::get_timestamp();
    block.updated_at = block.created_at;
    load_block(std::move(block));
}

void BlockDesigner::load_block(Block block) {
    block_ = std::move(block);
    undo_.clear();
    fg_placement_.reset();

    auto log = logging::get_logger();
    log->debug("Loaded block '{}' ({}x{}, {} units)", block_.id, block_.grid_size,
               block_.grid_size, block_.units.size());
}

bool BlockDesigner::update_metadata(const BlockMetadataUpdate& update) {
    if (update.title && utf8_length(*update.title) > constants::BLOCK_TITLE_MAX_LENGTH) {
        return false;
    }
    if (update.description && *update.description &&
        utf8_length(**update.description) > constants::BLOCK_DESCRIPTION_MAX_LENGTH) {
        return false;
    }
    if (update.hashtags) {
        for (const auto& tag : *update.hashtags) {
            if (utf8_length(tag) > constants::HASHTAG_MAX_LENGTH) {
                return false;
            }
        }
    }

    if (update.title) block_.title = *update.title;
    if (update.description) block_.description = *update.description;
    if (update.hashtags) block_.hashtags = *update.hashtags;
    block_.updated_at = json::get_timestamp();
    return true;
}

std::vector<Unit> BlockDesigner::set_grid_size(int size) {
    if (size == block_.grid_size || size < constants::MIN_GRID_SIZE || size > constants::MAX_GRID_SIZE) {
        return {};
    }

    std::vector<Unit> removed = get_units_out_of_bounds(block_.units, size);
    commit(op::ResizeGrid{block_.grid_size, size, removed});
    return removed;
}

// Placement

std::optional<UnitId> BlockDesigner::add_square(const GridPosition& position, const ColorRoleId& color_role) {
    return place(Unit{generate_id(), position, {1, 1}, unit::Square{color_role}});
}

std::optional<UnitId> BlockDesigner::add_hst(const GridPosition& position, HstVariant variant,
                                             const ColorRoleId& color_role,
                                             const ColorRoleId& secondary_color_role) {
    return place(Unit{generate_id(), position, {1, 1}, unit::Hst{variant, color_role, secondary_color_role}});
}

std::optional<UnitId> BlockDesigner::add_flying_geese(const GridPosition& position, FlyingGeeseDirection direction,
                                                      const std::optional<unit::FlyingGeeseRoles>& roles) {
    Unit u = make_unit(generate_id(), position, UnitType::FlyingGeese,
                       UnitConfig{std::string(to_string(direction)), {}}, registry_);
    if (roles) {
        std::get<unit::FlyingGeese>(u.shape).roles = *roles;
    }
    return place(std::move(u));
}

std::optional<UnitId> BlockDesigner::add_qst(const GridPosition& position,
                                             const std::optional<unit::QstRoles>& roles) {
    Unit u = make_unit(generate_id(), position, UnitType::Qst, {}, registry_);
    if (roles) {
        std::get<unit::Qst>(u.shape).roles = *roles;
    }
    return place(std::move(u));
}

std::vector<UnitId> BlockDesigner::add_units_batch(const std::vector<GridPosition>& positions, UnitType type,
                                                   const std::optional<std::string>& variant) {
    const UnitDefinition& def = registry_.get_or_throw(std::string(type_id(type)));
    if (!def.supports_batch_placement() || positions.empty()) {
        return {};
    }

    // Every unit of the batch is a copy of this one at its own cell
    Unit prototype;
    try {
        prototype = make_unit("", {0, 0}, type, UnitConfig{variant, {}}, registry_);
    } catch (const std::invalid_argument& e) {
        logging::get_logger()->debug("Rejected batch of {}: {}", def.type_id(), e.what());
        return {};
    }

    op::Batch batch;
    std::vector<UnitId> ids;
    std::vector<Unit> pending = block_.units;

    for (const auto& position : positions) {
        Unit u = prototype;
        u.id = generate_id();
        u.position = position;

        if (!fits_grid(u, block_.grid_size) ||
            std::any_of(pending.begin(), pending.end(),
                        [&](const Unit& other) { return unit_covers(other, position); })) {
            continue;
        }

        pending.push_back(u);
        ids.push_back(u.id);
        batch.operations.push_back(op::AddUnit{std::move(u)});
    }

    if (!batch.operations.empty()) {
        commit(std::move(batch));
    }
    return ids;
}

bool BlockDesigner::remove_unit(const UnitId& unit_id) {
    const Unit* existing = find_unit(block_.units, unit_id);
    if (!existing) {
        return false;
    }
    commit(op::RemoveUnit{*existing});
    return true;
}

PlacementValidation BlockDesigner::start_flying_geese_placement(const GridPosition& position) {
    fg_placement_.reset();

    PlacementValidation result;
    if (!in_grid(position, block_.grid_size) || is_cell_occupied(position)) {
        result.valid = false;
        result.reason = "Cell is not available";
        return result;
    }

    const UnitDefinition& def = registry_.get_or_throw("flying_geese");
    auto validation = def.validate_placement(position, block_.grid_size,
                                             [this](const GridPosition& cell) { return is_cell_occupied(cell); });
    if (validation) {
        result = *validation;
    } else {
        result.valid_adjacent_cells = valid_adjacent_cells(position);
    }

    if (result.valid) {
        fg_placement_ = FlyingGeesePlacement{position, result.valid_adjacent_cells};
    }
    return result;
}

std::optional<UnitId> BlockDesigner::complete_flying_geese_placement(const GridPosition& second_position) {
    if (!fg_placement_) {
        return std::nullopt;
    }

    const FlyingGeesePlacement placement = *fg_placement_;
    fg_placement_.reset();

    const auto& valid = placement.valid_adjacent_cells;
    if (std::find(valid.begin(), valid.end(), second_position) == valid.end()) {
        auto log = logging::get_logger();
        log->debug("Flying geese second tap ({}, {}) is not adjacent and free; cancelled",
                   second_position.row, second_position.col);
        return std::nullopt;
    }

    const GridPosition& first = placement.first_cell;
    const int row_diff = second_position.row - first.row;
    const int col_diff = second_position.col - first.col;

    FlyingGeeseDirection direction = FlyingGeeseDirection::Up;
    if (col_diff == 1) direction = FlyingGeeseDirection::Right;
    else if (col_diff == -1) direction = FlyingGeeseDirection::Left;
    else if (row_diff == 1) direction = FlyingGeeseDirection::Down;

    const GridPosition position{std::min(first.row, second_position.row),
                                std::min(first.col, second_position.col)};
    return add_flying_geese(position, direction);
}

void BlockDesigner::cancel_flying_geese_placement() {
    fg_placement_.reset();
}

// Unit edits

bool BlockDesigner::assign_patch_role(const UnitId& unit_id, const ColorRoleId& role_id,
                                      const std::optional<std::string>& patch_id) {
    const Unit* existing = find_unit(block_.units, unit_id);
    if (!existing) {
        return false;
    }

    RoleAssignment assignment = quiltblock::assign_patch_role(*existing, role_id, patch_id, registry_);
    if (assignment.prev == assignment.next) {
        return false;
    }
    commit(op::UpdateUnit{unit_id, std::move(assignment.prev), std::move(assignment.next)});
    return true;
}

bool BlockDesigner::rotate_unit(const UnitId& unit_id) {
    const Unit* existing = find_unit(block_.units, unit_id);
    if (!existing) {
        return false;
    }
    return transform_unit(unit_id, apply_rotation(*existing, registry_), "rotate");
}

bool BlockDesigner::flip_unit_horizontal(const UnitId& unit_id) {
    const Unit* existing = find_unit(block_.units, unit_id);
    if (!existing) {
        return false;
    }
    return transform_unit(unit_id, apply_flip_horizontal(*existing, registry_), "flip horizontally");
}

bool BlockDesigner::flip_unit_vertical(const UnitId& unit_id) {
    const Unit* existing = find_unit(block_.units, unit_id);
    if (!existing) {
        return false;
    }
    return transform_unit(unit_id, apply_flip_vertical(*existing, registry_), "flip vertically");
}

bool BlockDesigner::transform_unit(const UnitId& unit_id, std::optional<UnitUpdate> update, const char* what) {
    if (!update) {
        return false;
    }

    const Unit& current = *find_unit(block_.units, unit_id);
    Unit transformed = apply_unit_update(current, *update, registry_);
    if (!can_place(transformed, unit_id)) {
        auto log = logging::get_logger();
        log->debug("Cannot {} unit {}: new footprint {}x{} at ({}, {}) does not fit",
                   what, unit_id, transformed.span.rows, transformed.span.cols,
                   transformed.position.row, transformed.position.col);
        return false;
    }

    UnitUpdate prev = capture_prev(current, *update);
    commit(op::UpdateUnit{unit_id, std::move(prev), std::move(*update)});
    return true;
}

// Palette

bool BlockDesigner::set_role_color(const ColorRoleId& role_id, const HexColor& color) {
    if (!is_valid_hex_color(color)) {
        logging::get_logger()->debug("Rejected color '{}' for role '{}': expected #RRGGBB", color, role_id);
        return false;
    }
    const ColorRole* existing = block_.preview_palette.find(role_id);
    if (!existing || existing->color == color) {
        return false;
    }
    commit(op::UpdatePalette{role_id, existing->color, color});
    return true;
}

std::optional<ColorRoleId> BlockDesigner::add_role(const std::optional<std::string>& name,
                                                   const std::optional<HexColor>& color) {
    const Palette& palette = block_.preview_palette;
    if (palette.size() >= constants::MAX_PALETTE_ROLES || (color && !is_valid_hex_color(*color))) {
        return std::nullopt;
    }

    const int count = static_cast<int>(palette.size());
    ColorRoleId id = "accent" + std::to_string(count - 1);
    int counter = count;
    while (palette.contains(id)) {
        id = "accent" + std::to_string(counter++);
    }

    const int color_count = static_cast<int>(constants::ADDITIONAL_ROLE_COLORS.size());
    const int color_index = std::max(0, (count - 4) % color_count);

    ColorRole new_role;
    new_role.id = id;
    new_role.name = name.value_or("Accent " + std::to_string(count - 1));
    new_role.color = color.value_or(HexColor(constants::ADDITIONAL_ROLE_COLORS[color_index]));

    commit(op::AddRole{new_role, palette.size()});
    return id;
}

bool BlockDesigner::remove_role(const ColorRoleId& role_id, const std::optional<ColorRoleId>& fallback_role_id) {
    const Palette& palette = block_.preview_palette;
    if (!can_remove_role()) {
        return false;
    }

    auto index = palette.index_of(role_id);
    if (!index) {
        return false;
    }

    ColorRoleId fallback;
    if (fallback_role_id && *fallback_role_id != role_id && palette.contains(*fallback_role_id)) {
        fallback = *fallback_role_id;
    } else {
        fallback = palette.roles[0].id == role_id ? palette.roles[1].id : palette.roles[0].id;
    }

    op::RemoveRole remove;
    remove.role = palette.roles[*index];
    remove.index = *index;
    remove.fallback_role_id = fallback;

    // Reassignments first, so replaying the batch leaves no dangling role
    op::Batch batch;
    for (const auto& u : block_.units) {
        if (!unit_uses_role(u, role_id)) {
            continue;
        }
        remove.affected_units.push_back({u.id, to_unit_config(u).patch_roles});
        UnitUpdate next = replace_role(u, role_id, fallback);
        UnitUpdate prev = capture_prev(u, next);
        batch.operations.push_back(op::UpdateUnit{u.id, std::move(prev), std::move(next)});
    }

    auto log = logging::get_logger();
    log->debug("Remove role '{}' ({} units fall back to '{}')", role_id, remove.affected_units.size(), fallback);

    batch.operations.push_back(std::move(remove));
    commit(std::move(batch));
    return true;
}

bool BlockDesigner::rename_role(const ColorRoleId& role_id, const std::string& name) {
    const ColorRole* existing = block_.preview_palette.find(role_id);
    if (!existing || existing->name == name) {
        return false;
    }
    commit(op::RenameRole{role_id, existing->name, name});
    return true;
}

// Borders

std::optional<BorderId> BlockDesigner::add_border(double width_inches, CornerStyle corner_style,
                                                  const ColorRoleId& color_role,
                                                  const std::optional<ColorRoleId>& cornerstone_color_role) {
    if (!can_add_border() || width_inches <= 0.0) {
        return std::nullopt;
    }

    BorderSpec border;
    border.id = generate_id();
    border.width_inches = width_inches;
    border.corner_style = corner_style;
    border.color_role = color_role;
    border.cornerstone_color_role = cornerstone_color_role;

    op::AddBorder add{border, block_.border_config.borders.size()};
    if (block_.border_config.enabled) {
        commit(std::move(add));
    } else {
        op::Batch batch;
        batch.operations.push_back(op::SetBordersEnabled{false, true});
        batch.operations.push_back(std::move(add));
        commit(std::move(batch));
    }
    return border.id;
}

bool BlockDesigner::remove_border(const BorderId& border_id) {
    auto index = block_.border_config.index_of(border_id);
    if (!index) {
        return false;
    }
    commit(op::RemoveBorder{block_.border_config.borders[*index], *index});
    return true;
}

bool BlockDesigner::update_border(const BorderId& border_id, const BorderUpdate& update) {
    const BorderSpec* existing = block_.border_config.find(border_id);
    if (!existing || update.empty()) {
        return false;
    }
    if (update.width_inches && *update.width_inches <= 0.0) {
        return false;
    }

    BorderUpdate prev;
    if (update.width_inches) prev.width_inches = existing->width_inches;
    if (update.corner_style) prev.corner_style = existing->corner_style;
    if (update.color_role) prev.color_role = existing->color_role;
    if (update.cornerstone_color_role) prev.cornerstone_color_role = existing->cornerstone_color_role;

    if (apply_border_update(*existing, update) == *existing) {
        return false;
    }
    commit(op::UpdateBorder{border_id, std::move(prev), update});
    return true;
}

bool BlockDesigner::set_borders_enabled(bool enabled) {
    if (block_.border_config.enabled == enabled) {
        return false;
    }
    commit(op::SetBordersEnabled{block_.border_config.enabled, enabled});
    return true;
}

bool BlockDesigner::reorder_borders(size_t from_index, size_t to_index) {
    const size_t count = block_.border_config.borders.size();
    if (from_index >= count || to_index >= count || from_index == to_index) {
        return false;
    }
    commit(op::ReorderBorders{from_index, to_index});
    return true;
}

// History

bool BlockDesigner::undo() {
    auto inverse = undo_.undo();
    if (!inverse) {
        return false;
    }
    apply(*inverse);
    return true;
}

bool BlockDesigner::redo() {
    auto operation = undo_.redo();
    if (!operation) {
        return false;
    }
    apply(*operation);
    return true;
}

// Queries

const Unit* BlockDesigner::unit_at(const GridPosition& cell) const {
    for (const auto& u : block_.units) {
        if (unit_covers(u, cell)) {
            return &u;
        }
    }
    return nullptr;
}

std::vector<GridPosition> BlockDesigner::valid_adjacent_cells(const GridPosition& cell) const {
    const GridPosition candidates[] = {
        {cell.row - 1, cell.col},
        {cell.row + 1, cell.col},
        {cell.row, cell.col - 1},
        {cell.row, cell.col + 1},
    };

    std::vector<GridPosition> result;
    for (const auto& candidate : candidates) {
        if (in_grid(candidate, block_.grid_size) && !is_cell_occupied(candidate)) {
            result.push_back(candidate);
        }
    }
    return result;
}

std::vector<Unit> BlockDesigner::units_using_role(const ColorRoleId& role_id) const {
    std::vector<Unit> result;
    for (const auto& u : block_.units) {
        if (unit_uses_role(u, role_id)) {
            result.push_back(u);
        }
    }
    return result;
}

std::vector<Unit> BlockDesigner::units_out_of_bounds(int grid_size) const {
    return get_units_out_of_bounds(block_.units, grid_size);
}

std::vector<GridPosition> BlockDesigner::range_fill_positions(const GridPosition& anchor,
                                                              const GridPosition& end) const {
    const int min_row = std::max(0, std::min(anchor.row, end.row));
    const int max_row = std::min(block_.grid_size - 1, std::max(anchor.row, end.row));
    const int min_col = std::max(0, std::min(anchor.col, end.col));
    const int max_col = std::min(block_.grid_size - 1, std::max(anchor.col, end.col));

    std::vector<GridPosition> positions;
    for (int row = min_row; row <= max_row; ++row) {
        for (int col = min_col; col <= max_col; ++col) {
            if (!is_cell_occupied({row, col})) {
                positions.push_back({row, col});
            }
        }
    }
    return positions;
}

std::vector<ColoredTriangle> BlockDesigner::render_unit(const UnitId& unit_id, double cell_size,
                                                        const PaletteOverrides& overrides) const {
    const Unit* existing = find_unit(block_.units, unit_id);
    if (!existing) {
        return {};
    }
    return get_unit_triangles_with_colors(*existing, cell_size, block_.preview_palette, overrides, registry_);
}

// Internals

void BlockDesigner::commit(Operation operation) {
    apply(operation);
    undo_.record(std::move(operation));
}

void BlockDesigner::apply(const Operation& operation) {
    DesignState state{block_.units, block_.grid_size, block_.preview_palette, block_.border_config};
    state = apply_operation(state, operation);

    block_.units = std::move(state.units);
    block_.grid_size = state.grid_size;
    block_.preview_palette = std::move(state.palette);
    block_.border_config = std::move(state.border_config);
    block_.updated_at = json::get_timestamp();

    // A pending two-tap placement may no longer be valid
    fg_placement_.reset();
}

bool BlockDesigner::can_place(const Unit& unit, const UnitId& ignore) const {
    if (!fits_grid(unit, block_.grid_size)) {
        return false;
    }

    for (const auto& cell : covered_cells(unit)) {
        for (const auto& other : block_.units) {
            if (other.id != ignore && unit_covers(other, cell)) {
                return false;
            }
        }
    }
    return true;
}

std::optional<UnitId> BlockDesigner::place(Unit unit) {
    if (!can_place(unit)) {
        auto log = logging::get_logger();
        log->debug("Rejected {} at ({}, {}): out of bounds or overlapping",
                   type_id(unit_type(unit)), unit.position.row, unit.position.col);
        return std::nullopt;
    }

    UnitId id = unit.id;
    commit(op::AddUnit{std::move(unit)});
    return id;
}

UnitId BlockDesigner::generate_id() {
    return generate_uuid(rng_);
}

}  // namespace quiltblock
