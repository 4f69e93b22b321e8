#include "pattern.hpp"
#include <algorithm>

namespace quiltblock {

Rotation rotate_clockwise(Rotation rotation) {
    switch (rotation) {
        case Rotation::Deg0: return Rotation::Deg90;
        case Rotation::Deg90: return Rotation::Deg180;
        case Rotation::Deg180: return Rotation::Deg270;
        case Rotation::Deg270: return Rotation::Deg0;
    }
    return Rotation::Deg0;
}

std::optional<Rotation> rotation_from_degrees(int degrees) {
    switch (degrees) {
        case 0: return Rotation::Deg0;
        case 90: return Rotation::Deg90;
        case 180: return Rotation::Deg180;
        case 270: return Rotation::Deg270;
        default: return std::nullopt;
    }
}

std::string_view to_string(PatternDifficulty difficulty) {
    switch (difficulty) {
        case PatternDifficulty::Beginner: return "beginner";
        case PatternDifficulty::Intermediate: return "intermediate";
        case PatternDifficulty::Advanced: return "advanced";
    }
    return "beginner";
}

std::string_view to_string(PatternCategory category) {
    switch (category) {
        case PatternCategory::Traditional: return "traditional";
        case PatternCategory::Modern: return "modern";
        case PatternCategory::Art: return "art";
        case PatternCategory::Seasonal: return "seasonal";
        case PatternCategory::Other: return "other";
    }
    return "other";
}

std::optional<PatternDifficulty> pattern_difficulty_from_string(std::string_view value) {
    if (value == "beginner") return PatternDifficulty::Beginner;
    if (value == "intermediate") return PatternDifficulty::Intermediate;
    if (value == "advanced") return PatternDifficulty::Advanced;
    return std::nullopt;
}

std::optional<PatternCategory> pattern_category_from_string(std::string_view value) {
    if (value == "traditional") return PatternCategory::Traditional;
    if (value == "modern") return PatternCategory::Modern;
    if (value == "art") return PatternCategory::Art;
    if (value == "seasonal") return PatternCategory::Seasonal;
    if (value == "other") return PatternCategory::Other;
    return std::nullopt;
}

PhysicalSize calculate_physical_size(const QuiltGridSize& grid_size, double block_size_inches) {
    return {grid_size.cols * block_size_inches, grid_size.rows * block_size_inches};
}

bool valid_pattern_grid_size(const QuiltGridSize& grid_size) {
    auto in_range = [](int n) {
        return n >= constants::PATTERN_MIN_GRID_SIZE && n <= constants::PATTERN_MAX_GRID_SIZE;
    };
    return in_range(grid_size.rows) && in_range(grid_size.cols);
}

bool in_pattern_grid(const GridPosition& position, const QuiltGridSize& grid_size) {
    return position.row >= 0 && position.row < grid_size.rows &&
           position.col >= 0 && position.col < grid_size.cols;
}

const BlockInstance* find_instance(const std::vector<BlockInstance>& instances, const BlockInstanceId& id) {
    auto it = std::find_if(instances.begin(), instances.end(),
                           [&](const BlockInstance& i) { return i.id == id; });
    return it == instances.end() ? nullptr : &*it;
}

const BlockInstance* instance_at(const std::vector<BlockInstance>& instances, const GridPosition& position) {
    auto it = std::find_if(instances.begin(), instances.end(),
                           [&](const BlockInstance& i) { return i.position == position; });
    return it == instances.end() ? nullptr : &*it;
}

BlockInstance apply_instance_update(const BlockInstance& instance, const BlockInstanceUpdate& update) {
    BlockInstance result = instance;
    if (update.rotation) result.rotation = *update.rotation;
    if (update.flip_horizontal) result.flip_horizontal = *update.flip_horizontal;
    if (update.flip_vertical) result.flip_vertical = *update.flip_vertical;
    if (update.palette_overrides) result.palette_overrides = *update.palette_overrides;
    return result;
}

BlockInstanceUpdate capture_prev(const BlockInstance& instance, const BlockInstanceUpdate& update) {
    BlockInstanceUpdate prev;
    if (update.rotation) prev.rotation = instance.rotation;
    if (update.flip_horizontal) prev.flip_horizontal = instance.flip_horizontal;
    if (update.flip_vertical) prev.flip_vertical = instance.flip_vertical;
    if (update.palette_overrides) prev.palette_overrides = instance.palette_overrides;
    return prev;
}

}  // namespace quiltblock
