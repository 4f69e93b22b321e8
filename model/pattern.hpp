#ifndef QUILTBLOCK_MODEL_PATTERN_HPP
#define QUILTBLOCK_MODEL_PATTERN_HPP

// A quilt pattern: a rows x cols grid of placed blocks. The pattern owns
// the palette every placed block renders with.

#include "block.hpp"
#include "border.hpp"
#include "constants.hpp"
#include "palette.hpp"
#include "unit.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quiltblock {

using BlockInstanceId = std::string;

// Quilt size in blocks
struct QuiltGridSize {
    int rows = constants::DEFAULT_PATTERN_ROWS;
    int cols = constants::DEFAULT_PATTERN_COLS;

    bool operator==(const QuiltGridSize&) const = default;
};

// Quarter turns, stored as degrees
enum class Rotation { Deg0 = 0, Deg90 = 90, Deg180 = 180, Deg270 = 270 };

inline int degrees(Rotation rotation) { return static_cast<int>(rotation); }
Rotation rotate_clockwise(Rotation rotation);
std::optional<Rotation> rotation_from_degrees(int degrees);

enum class PatternDifficulty { Beginner, Intermediate, Advanced };
enum class PatternCategory { Traditional, Modern, Art, Seasonal, Other };

std::string_view to_string(PatternDifficulty difficulty);
std::string_view to_string(PatternCategory category);
std::optional<PatternDifficulty> pattern_difficulty_from_string(std::string_view value);
std::optional<PatternCategory> pattern_category_from_string(std::string_view value);

// A block placed at one grid cell with its own transform and colors
struct BlockInstance {
    BlockInstanceId id;
    std::string block_id;
    GridPosition position;
    Rotation rotation = Rotation::Deg0;
    bool flip_horizontal = false;
    bool flip_vertical = false;
    PaletteOverrides palette_overrides;  // Empty when the instance uses the pattern palette

    bool operator==(const BlockInstance&) const = default;
};

// Partial instance fields for update operations
struct BlockInstanceUpdate {
    std::optional<Rotation> rotation;
    std::optional<bool> flip_horizontal;
    std::optional<bool> flip_vertical;
    std::optional<PaletteOverrides> palette_overrides;

    bool empty() const {
        return !rotation && !flip_horizontal && !flip_vertical && !palette_overrides;
    }

    bool operator==(const BlockInstanceUpdate&) const = default;
};

struct Pattern {
    std::string id;
    std::string creator_id;

    std::string title;
    std::optional<std::string> description;
    std::vector<std::string> hashtags;
    PatternDifficulty difficulty = PatternDifficulty::Beginner;
    std::optional<PatternCategory> category;

    QuiltGridSize grid_size;
    double block_size_inches = constants::DEFAULT_BLOCK_SIZE_INCHES;
    PhysicalSize physical_size;  // Grid only; borders are added on top

    Palette palette;
    std::vector<BlockInstance> block_instances;
    BorderConfig border_config;

    BlockStatus status = BlockStatus::Draft;
    bool is_premium = false;
    std::optional<int> price_cents;
    std::optional<Timestamp> published_at;
    std::optional<std::string> thumbnail_url;
    Timestamp created_at;
    Timestamp updated_at;
};

// Finished size of the block grid alone
PhysicalSize calculate_physical_size(const QuiltGridSize& grid_size, double block_size_inches);

bool valid_pattern_grid_size(const QuiltGridSize& grid_size);
bool in_pattern_grid(const GridPosition& position, const QuiltGridSize& grid_size);

const BlockInstance* find_instance(const std::vector<BlockInstance>& instances, const BlockInstanceId& id);
const BlockInstance* instance_at(const std::vector<BlockInstance>& instances, const GridPosition& position);

BlockInstance apply_instance_update(const BlockInstance& instance, const BlockInstanceUpdate& update);

// The current values of the fields `update` sets
BlockInstanceUpdate capture_prev(const BlockInstance& instance, const BlockInstanceUpdate& update);

}  // namespace quiltblock

#endif // QUILTBLOCK_MODEL_PATTERN_HPP
