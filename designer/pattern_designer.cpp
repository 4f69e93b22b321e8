#include "pattern_designer.hpp"
#include "uuid.hpp"
#include <borders/border_sizing.hpp>
#include <common/logging.hpp>
#include <serialization/json_serialization.hpp>
#include <algorithm>
#include <set>

namespace quiltblock {

namespace {

bool uses_color(const std::vector<BlockInstance>& instances, const HexColor& color) {
    return std::any_of(instances.begin(), instances.end(), [&](const BlockInstance& i) {
        return std::any_of(i.palette_overrides.begin(), i.palette_overrides.end(),
                           [&](const auto& entry) { return same_color(entry.second, color); });
    });
}

bool has_color(const Palette& palette, const HexColor& color) {
    return std::any_of(palette.roles.begin(), palette.roles.end(),
                       [&](const ColorRole& r) { return same_color(r.color, color); });
}

pattern_op::UpdateBlockInstance overrides_update(const BlockInstance& instance, PaletteOverrides next) {
    BlockInstanceUpdate update;
    update.palette_overrides = std::move(next);
    return {instance.id, capture_prev(instance, update), update};
}

}  // namespace

PatternDesigner::PatternDesigner() : rng_(std::random_device{}()) {
    init_pattern();
}

void PatternDesigner::init_pattern(const QuiltGridSize& grid_size, const std::string& creator_id) {
    Pattern pattern;
    pattern.creator_id = creator_id;
    pattern.grid_size.rows = std::clamp(grid_size.rows, constants::PATTERN_MIN_GRID_SIZE,
                                        constants::PATTERN_MAX_GRID_SIZE);
    pattern.grid_size.cols = std::clamp(grid_size.cols, constants::PATTERN_MIN_GRID_SIZE,
                                        constants::PATTERN_MAX_GRID_SIZE);
    pattern.physical_size = calculate_physical_size(pattern.grid_size, pattern.block_size_inches);
    pattern.palette = default_palette();
    pattern.created_at = json::get_timestamp();
    pattern.updated_at = pattern.created_at;
    load_pattern(std::move(pattern));
}

void PatternDesigner::load_pattern(Pattern pattern) {
    pattern_ = std::move(pattern);
    undo_.clear();
    dirty_ = false;

    auto log = logging::get_logger();
    log->debug("Loaded pattern '{}' ({}x{}, {} blocks)", pattern_.id, pattern_.grid_size.rows,
               pattern_.grid_size.cols, pattern_.block_instances.size());
}

bool PatternDesigner::update_metadata(const PatternMetadataUpdate& update) {
    if (update.title && utf8_length(*update.title) > constants::PATTERN_TITLE_MAX_LENGTH) {
        return false;
    }
    if (update.description && *update.description &&
        utf8_length(**update.description) > constants::PATTERN_DESCRIPTION_MAX_LENGTH) {
        return false;
    }
    if (update.hashtags) {
        if (update.hashtags->size() > constants::PATTERN_MAX_HASHTAGS) {
            return false;
        }
        for (const auto& tag : *update.hashtags) {
            if (utf8_length(tag) > constants::HASHTAG_MAX_LENGTH) {
                return false;
            }
        }
    }

    if (update.title) pattern_.title = *update.title;
    if (update.description) pattern_.description = *update.description;
    if (update.hashtags) pattern_.hashtags = *update.hashtags;
    if (update.difficulty) pattern_.difficulty = *update.difficulty;
    if (update.category) pattern_.category = *update.category;
    pattern_.updated_at = json::get_timestamp();
    dirty_ = true;
    return true;
}

void PatternDesigner::mark_as_saved(const std::optional<std::string>& pattern_id) {
    if (pattern_id) {
        pattern_.id = *pattern_id;
    }
    dirty_ = false;
}

// Placement

std::optional<BlockInstanceId> PatternDesigner::add_block_instance(const std::string& block_id,
                                                                   const GridPosition& position,
                                                                   std::optional<Rotation> rotation) {
    auto ids = add_block_instances_batch(block_id, {position}, rotation);
    if (ids.empty()) {
        return std::nullopt;
    }
    return ids.front();
}

std::vector<BlockInstanceId> PatternDesigner::add_block_instances_batch(const std::string& block_id,
                                                                        const std::vector<GridPosition>& positions,
                                                                        std::optional<Rotation> rotation) {
    if (block_id.empty()) {
        return {};
    }

    pattern_op::Batch batch;
    std::vector<BlockInstanceId> ids;
    std::set<GridPosition> placed;

    for (const auto& position : positions) {
        if (!in_pattern_grid(position, pattern_.grid_size) || !placed.insert(position).second) {
            logging::get_logger()->debug("Skipped block {} at ({}, {})", block_id, position.row, position.col);
            continue;
        }

        if (const BlockInstance* existing = block_instance_at(position)) {
            batch.operations.push_back(pattern_op::RemoveBlockInstance{*existing});
        }

        BlockInstance instance;
        instance.id = generate_id();
        instance.block_id = block_id;
        instance.position = position;
        instance.rotation = rotation.value_or(placement_rotation_);
        ids.push_back(instance.id);
        batch.operations.push_back(pattern_op::AddBlockInstance{std::move(instance)});
    }

    if (!batch.operations.empty()) {
        commit_with_cleanup(std::move(batch));
    }
    return ids;
}

bool PatternDesigner::remove_block_instance(const BlockInstanceId& instance_id) {
    const BlockInstance* existing = find_instance(pattern_.block_instances, instance_id);
    if (!existing) {
        return false;
    }
    pattern_op::Batch batch;
    batch.operations.push_back(pattern_op::RemoveBlockInstance{*existing});
    commit_with_cleanup(std::move(batch));
    return true;
}

bool PatternDesigner::update_block_instance(const BlockInstanceId& instance_id, const BlockInstanceUpdate& update) {
    const BlockInstance* existing = find_instance(pattern_.block_instances, instance_id);
    if (!existing || update.empty() || apply_instance_update(*existing, update) == *existing) {
        return false;
    }
    if (update.palette_overrides) {
        for (const auto& [role_id, color] : *update.palette_overrides) {
            if (!is_valid_hex_color(color)) {
                logging::get_logger()->debug("Rejected override '{}' for role '{}': expected #RRGGBB", color, role_id);
                return false;
            }
        }
    }

    pattern_op::Batch batch;
    batch.operations.push_back(pattern_op::UpdateBlockInstance{instance_id, capture_prev(*existing, update), update});
    commit_with_cleanup(std::move(batch));
    return true;
}

const BlockInstance* PatternDesigner::block_instance_at(const GridPosition& position) const {
    return instance_at(pattern_.block_instances, position);
}

bool PatternDesigner::rotate_block_instance(const BlockInstanceId& instance_id) {
    const BlockInstance* existing = find_instance(pattern_.block_instances, instance_id);
    if (!existing) {
        return false;
    }
    BlockInstanceUpdate update;
    update.rotation = rotate_clockwise(existing->rotation);
    return update_block_instance(instance_id, update);
}

bool PatternDesigner::flip_block_instance_horizontal(const BlockInstanceId& instance_id) {
    const BlockInstance* existing = find_instance(pattern_.block_instances, instance_id);
    if (!existing) {
        return false;
    }
    BlockInstanceUpdate update;
    update.flip_horizontal = !existing->flip_horizontal;
    return update_block_instance(instance_id, update);
}

bool PatternDesigner::flip_block_instance_vertical(const BlockInstanceId& instance_id) {
    const BlockInstance* existing = find_instance(pattern_.block_instances, instance_id);
    if (!existing) {
        return false;
    }
    BlockInstanceUpdate update;
    update.flip_vertical = !existing->flip_vertical;
    return update_block_instance(instance_id, update);
}

// Per-instance colors

bool PatternDesigner::set_instance_role_color(const BlockInstanceId& instance_id, const ColorRoleId& role_id,
                                              const HexColor& color) {
    const BlockInstance* existing = find_instance(pattern_.block_instances, instance_id);
    const ColorRole* role = pattern_.palette.find(role_id);
    if (!existing || !role) {
        return false;
    }
    if (!is_valid_hex_color(color)) {
        logging::get_logger()->debug("Rejected override '{}' for role '{}': expected #RRGGBB", color, role_id);
        return false;
    }
    if (same_color(role->color, color)) {
        return reset_instance_role_color(instance_id, role_id);
    }

    PaletteOverrides overrides = existing->palette_overrides;
    auto current = overrides.find(role_id);
    if (current != overrides.end() && same_color(current->second, color)) {
        return false;
    }
    overrides[role_id] = color;
    return set_instance_overrides(*existing, std::move(overrides), color);
}

bool PatternDesigner::reset_instance_role_color(const BlockInstanceId& instance_id, const ColorRoleId& role_id) {
    const BlockInstance* existing = find_instance(pattern_.block_instances, instance_id);
    if (!existing || existing->palette_overrides.count(role_id) == 0) {
        return false;
    }
    PaletteOverrides overrides = existing->palette_overrides;
    overrides.erase(role_id);
    return set_instance_overrides(*existing, std::move(overrides), std::nullopt);
}

bool PatternDesigner::reset_instance_colors(const BlockInstanceId& instance_id) {
    const BlockInstance* existing = find_instance(pattern_.block_instances, instance_id);
    if (!existing || existing->palette_overrides.empty()) {
        return false;
    }
    return set_instance_overrides(*existing, {}, std::nullopt);
}

HexColor PatternDesigner::effective_color(const BlockInstanceId& instance_id, const ColorRoleId& role_id) const {
    if (const BlockInstance* instance = find_instance(pattern_.block_instances, instance_id)) {
        auto it = instance->palette_overrides.find(role_id);
        if (it != instance->palette_overrides.end()) {
            return it->second;
        }
    }
    if (const ColorRole* role = pattern_.palette.find(role_id)) {
        return role->color;
    }
    return HexColor(constants::NEUTRAL_COLOR);
}

bool PatternDesigner::set_instance_overrides(const BlockInstance& instance, PaletteOverrides overrides,
                                             const std::optional<HexColor>& new_color) {
    pattern_op::Batch batch;

    const Palette& palette = pattern_.palette;
    if (new_color && !has_color(palette, *new_color)) {
        if (palette.size() < constants::MAX_PALETTE_ROLES) {
            ColorRole variant;
            variant.id = next_variant_role_id(palette);
            variant.name = "Variant " + variant.id.substr(std::string("variant").size());
            variant.color = *new_color;
            variant.is_variant_color = true;
            batch.operations.push_back(op::AddRole{std::move(variant), palette.size()});
        } else {
            logging::get_logger()->debug("Palette is full; override {} has no variant role", *new_color);
        }
    }

    batch.operations.push_back(overrides_update(instance, std::move(overrides)));
    commit_with_cleanup(std::move(batch));
    return true;
}

// Palette

bool PatternDesigner::set_role_color(const ColorRoleId& role_id, const HexColor& color) {
    if (!is_valid_hex_color(color)) {
        logging::get_logger()->debug("Rejected color '{}' for role '{}': expected #RRGGBB", color, role_id);
        return false;
    }
    const ColorRole* existing = pattern_.palette.find(role_id);
    if (!existing || existing->color == color) {
        return false;
    }

    pattern_op::Batch batch;
    batch.operations.push_back(op::UpdatePalette{role_id, existing->color, color});

    if (existing->is_variant_color) {
        for (const auto& instance : pattern_.block_instances) {
            PaletteOverrides overrides = instance.palette_overrides;
            bool changed = false;
            for (auto& entry : overrides) {
                if (same_color(entry.second, existing->color)) {
                    entry.second = color;
                    changed = true;
                }
            }
            if (changed) {
                batch.operations.push_back(overrides_update(instance, std::move(overrides)));
            }
        }
    }

    commit_with_cleanup(std::move(batch));
    return true;
}

std::optional<ColorRoleId> PatternDesigner::add_role(const std::optional<std::string>& name,
                                                     const std::optional<HexColor>& color) {
    const Palette& palette = pattern_.palette;
    if (color) {
        if (!is_valid_hex_color(*color)) {
            return std::nullopt;
        }
        auto match = std::find_if(palette.roles.begin(), palette.roles.end(),
                                  [&](const ColorRole& r) { return same_color(r.color, *color); });
        if (match != palette.roles.end()) {
            return match->id;
        }
    }
    if (palette.size() >= constants::MAX_PALETTE_ROLES) {
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

bool PatternDesigner::remove_role(const ColorRoleId& role_id) {
    const Palette& palette = pattern_.palette;
    auto index = palette.index_of(role_id);
    if (!can_remove_role() || !index) {
        return false;
    }
    const ColorRole& role = palette.roles[*index];

    // Overrides first, so the inverse restores the role before them
    pattern_op::Batch batch;
    for (const auto& instance : pattern_.block_instances) {
        PaletteOverrides overrides = instance.palette_overrides;
        for (auto it = overrides.begin(); it != overrides.end();) {
            if (it->first == role_id || (role.is_variant_color && same_color(it->second, role.color))) {
                it = overrides.erase(it);
            } else {
                ++it;
            }
        }
        if (overrides != instance.palette_overrides) {
            batch.operations.push_back(overrides_update(instance, std::move(overrides)));
        }
    }
    batch.operations.push_back(op::RemoveRole{role, *index, {}, {}});

    logging::get_logger()->debug("Remove pattern role '{}' ({} instances lose overrides)",
                                 role_id, batch.operations.size() - 1);
    commit_with_cleanup(std::move(batch));
    return true;
}

bool PatternDesigner::rename_role(const ColorRoleId& role_id, const std::string& name) {
    const ColorRole* existing = pattern_.palette.find(role_id);
    if (!existing || existing->name == name) {
        return false;
    }
    commit(op::RenameRole{role_id, existing->name, name});
    return true;
}

// Grid

bool PatternDesigner::add_row() {
    QuiltGridSize next = pattern_.grid_size;
    ++next.rows;
    return resize(next, anchor_ == ResizeAnchor::Start ? 1 : 0, 0);
}

bool PatternDesigner::remove_row() {
    QuiltGridSize next = pattern_.grid_size;
    --next.rows;
    return resize(next, anchor_ == ResizeAnchor::Start ? -1 : 0, 0);
}

bool PatternDesigner::add_column() {
    QuiltGridSize next = pattern_.grid_size;
    ++next.cols;
    return resize(next, 0, anchor_ == ResizeAnchor::Start ? 1 : 0);
}

bool PatternDesigner::remove_column() {
    QuiltGridSize next = pattern_.grid_size;
    --next.cols;
    return resize(next, 0, anchor_ == ResizeAnchor::Start ? -1 : 0);
}

bool PatternDesigner::resize_grid(const QuiltGridSize& size) {
    const QuiltGridSize prev = pattern_.grid_size;
    if (!valid_pattern_grid_size(size) || size == prev) {
        return false;
    }

    // Shrink first, then grow, so each step changes the grid one way
    const QuiltGridSize shrunk{std::min(prev.rows, size.rows), std::min(prev.cols, size.cols)};

    pattern_op::Batch batch;
    if (shrunk != prev) {
        batch.operations.push_back(pattern_op::ResizeGrid{
            prev, shrunk, get_instances_out_of_bounds(pattern_.block_instances, shrunk), 0, 0});
    }
    if (size != shrunk) {
        batch.operations.push_back(pattern_op::ResizeGrid{shrunk, size, {}, 0, 0});
    }
    commit_with_cleanup(std::move(batch));
    return true;
}

bool PatternDesigner::resize(const QuiltGridSize& next_size, int row_shift, int col_shift) {
    if (!valid_pattern_grid_size(next_size)) {
        logging::get_logger()->debug("Grid stays {}x{}: {}x{} is out of range", pattern_.grid_size.rows,
                                     pattern_.grid_size.cols, next_size.rows, next_size.cols);
        return false;
    }

    pattern_op::Batch batch;
    batch.operations.push_back(pattern_op::ResizeGrid{
        pattern_.grid_size, next_size,
        get_instances_out_of_bounds(pattern_.block_instances, next_size, row_shift, col_shift),
        row_shift, col_shift});
    commit_with_cleanup(std::move(batch));
    return true;
}

bool PatternDesigner::has_blocks_in_row(int row) const {
    return std::any_of(pattern_.block_instances.begin(), pattern_.block_instances.end(),
                       [&](const BlockInstance& i) { return i.position.row == row; });
}

bool PatternDesigner::has_blocks_in_column(int col) const {
    return std::any_of(pattern_.block_instances.begin(), pattern_.block_instances.end(),
                       [&](const BlockInstance& i) { return i.position.col == col; });
}

bool PatternDesigner::is_grid_large() const {
    return pattern_.grid_size.rows > constants::GRID_SIZE_WARNING_THRESHOLD ||
           pattern_.grid_size.cols > constants::GRID_SIZE_WARNING_THRESHOLD;
}

// Fill

size_t PatternDesigner::fill_empty(const std::string& block_id) {
    std::vector<GridPosition> empty;
    for (int row = 0; row < pattern_.grid_size.rows; ++row) {
        for (int col = 0; col < pattern_.grid_size.cols; ++col) {
            if (!is_position_occupied({row, col})) {
                empty.push_back({row, col});
            }
        }
    }
    if (empty.empty()) {
        return 0;
    }
    return add_block_instances_batch(block_id, empty, Rotation::Deg0).size();
}

size_t PatternDesigner::empty_slot_count() const {
    std::set<GridPosition> filled;
    for (const auto& instance : pattern_.block_instances) {
        if (in_pattern_grid(instance.position, pattern_.grid_size)) {
            filled.insert(instance.position);
        }
    }
    const size_t total = static_cast<size_t>(pattern_.grid_size.rows) * static_cast<size_t>(pattern_.grid_size.cols);
    return total - filled.size();
}

std::vector<GridPosition> PatternDesigner::range_fill_positions(const GridPosition& anchor,
                                                                const GridPosition& end) const {
    const int min_row = std::max(0, std::min(anchor.row, end.row));
    const int max_row = std::min(pattern_.grid_size.rows - 1, std::max(anchor.row, end.row));
    const int min_col = std::max(0, std::min(anchor.col, end.col));
    const int max_col = std::min(pattern_.grid_size.cols - 1, std::max(anchor.col, end.col));

    std::vector<GridPosition> positions;
    for (int row = min_row; row <= max_row; ++row) {
        for (int col = min_col; col <= max_col; ++col) {
            if (!is_position_occupied({row, col})) {
                positions.push_back({row, col});
            }
        }
    }
    return positions;
}

// Borders

std::optional<BorderId> PatternDesigner::add_border(double width_inches, CornerStyle corner_style,
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

    op::AddBorder add{border, pattern_.border_config.borders.size()};
    if (pattern_.border_config.enabled) {
        commit(std::move(add));
    } else {
        pattern_op::Batch batch;
        batch.operations.push_back(op::SetBordersEnabled{false, true});
        batch.operations.push_back(std::move(add));
        commit(std::move(batch));
    }
    return border.id;
}

bool PatternDesigner::remove_border(const BorderId& border_id) {
    auto index = pattern_.border_config.index_of(border_id);
    if (!index) {
        return false;
    }
    commit(op::RemoveBorder{pattern_.border_config.borders[*index], *index});
    return true;
}

bool PatternDesigner::update_border(const BorderId& border_id, const BorderUpdate& update) {
    const BorderSpec* existing = pattern_.border_config.find(border_id);
    if (!existing || update.empty() || (update.width_inches && *update.width_inches <= 0.0)) {
        return false;
    }
    if (apply_border_update(*existing, update) == *existing) {
        return false;
    }

    BorderUpdate prev;
    if (update.width_inches) prev.width_inches = existing->width_inches;
    if (update.corner_style) prev.corner_style = existing->corner_style;
    if (update.color_role) prev.color_role = existing->color_role;
    if (update.cornerstone_color_role) prev.cornerstone_color_role = existing->cornerstone_color_role;

    commit(op::UpdateBorder{border_id, std::move(prev), update});
    return true;
}

bool PatternDesigner::set_borders_enabled(bool enabled) {
    if (pattern_.border_config.enabled == enabled) {
        return false;
    }
    commit(op::SetBordersEnabled{pattern_.border_config.enabled, enabled});
    return true;
}

bool PatternDesigner::reorder_borders(size_t from_index, size_t to_index) {
    const size_t count = pattern_.border_config.borders.size();
    if (from_index >= count || to_index >= count || from_index == to_index) {
        return false;
    }
    commit(op::ReorderBorders{from_index, to_index});
    return true;
}

double PatternDesigner::total_border_width() const {
    const BorderConfig& config = pattern_.border_config;
    if (!config.enabled) {
        return 0.0;
    }
    double total = 0.0;
    for (const auto& border : config.borders) {
        total += border.width_inches;
    }
    return total;
}

PhysicalSize PatternDesigner::final_quilt_size() const {
    return calculate_quilt_size_with_borders(pattern_.physical_size, pattern_.border_config);
}

// History

bool PatternDesigner::undo() {
    auto inverse = undo_.undo();
    if (!inverse) {
        return false;
    }
    apply(*inverse);
    return true;
}

bool PatternDesigner::redo() {
    auto operation = undo_.redo();
    if (!operation) {
        return false;
    }
    apply(*operation);
    return true;
}

// Internals

void PatternDesigner::commit(PatternOperation operation) {
    apply(operation);
    undo_.record(std::move(operation));
}

void PatternDesigner::apply(const PatternOperation& operation) {
    PatternState state{pattern_.block_instances, pattern_.grid_size, pattern_.palette, pattern_.border_config};
    state = apply_operation(state, operation);

    pattern_.block_instances = std::move(state.instances);
    pattern_.grid_size = state.grid_size;
    pattern_.palette = std::move(state.palette);
    pattern_.border_config = std::move(state.border_config);
    pattern_.physical_size = calculate_physical_size(pattern_.grid_size, pattern_.block_size_inches);
    pattern_.updated_at = json::get_timestamp();
    dirty_ = true;
}

void PatternDesigner::commit_with_cleanup(pattern_op::Batch batch) {
    PatternState after{pattern_.block_instances, pattern_.grid_size, pattern_.palette, pattern_.border_config};
    after = apply_operation(after, batch);

    // Highest index first, so the inverse re-inserts in ascending order
    for (size_t i = after.palette.roles.size(); i-- > 0;) {
        const ColorRole& role = after.palette.roles[i];
        if (role.is_variant_color && !uses_color(after.instances, role.color)) {
            logging::get_logger()->debug("Remove unused variant role '{}' ({})", role.id, role.color);
            batch.operations.push_back(op::RemoveRole{role, i, {}, {}});
        }
    }

    if (batch.operations.size() == 1) {
        PatternOperation single = std::move(batch.operations.front());
        commit(std::move(single));
    } else {
        commit(std::move(batch));
    }
}

ColorRoleId PatternDesigner::next_variant_role_id(const Palette& palette) const {
    int n = 1;
    while (palette.contains("variant" + std::to_string(n))) {
        ++n;
    }
    return "variant" + std::to_string(n);
}

BlockInstanceId PatternDesigner::generate_id() {
    return generate_uuid(rng_);
}

}  // namespace quiltblock
