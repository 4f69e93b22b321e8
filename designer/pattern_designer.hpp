#ifndef QUILTBLOCK_DESIGNER_PATTERN_DESIGNER_HPP
#define QUILTBLOCK_DESIGNER_PATTERN_DESIGNER_HPP

#include <history/pattern_operation.hpp>
#include <history/undo_manager.hpp>
#include <model/constants.hpp>
#include <model/pattern.hpp>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace quiltblock {

// Unset fields are left alone; a holder of an empty optional clears the
// description or category.
struct PatternMetadataUpdate {
    std::optional<std::string> title;
    std::optional<std::optional<std::string>> description;
    std::optional<std::vector<std::string>> hashtags;
    std::optional<PatternDifficulty> difficulty;
    std::optional<std::optional<PatternCategory>> category;
};

// Side of the grid where rows and columns are added or removed
enum class ResizeAnchor { Start, End };

// Owns one pattern and its undo history. Placed blocks, the grid, the
// palette and the borders change only through recorded operations.
//
// A per-instance color that no palette role has yet is added to the
// palette as a variant role; variant roles no instance uses any more are
// removed in the same undo step.
class PatternDesigner {
public:
    PatternDesigner();

    // Document lifecycle. Both reset the history and the dirty flag.
    void init_pattern(const QuiltGridSize& grid_size = {}, const std::string& creator_id = "");
    void load_pattern(Pattern pattern);
    const Pattern& pattern() const { return pattern_; }

    // Not undoable. Returns false when a value exceeds its limit; lengths
    // are counted in UTF-8 code points.
    bool update_metadata(const PatternMetadataUpdate& update);
    void mark_as_saved(const std::optional<std::string>& pattern_id = std::nullopt);
    bool is_dirty() const { return dirty_; }

    // Placement. An occupied cell has its instance replaced in the same
    // undo step. Rotation defaults to the placement rotation.
    std::optional<BlockInstanceId> add_block_instance(const std::string& block_id, const GridPosition& position,
                                                      std::optional<Rotation> rotation = std::nullopt);
    // Cells outside the grid and repeated cells are skipped
    std::vector<BlockInstanceId> add_block_instances_batch(const std::string& block_id,
                                                           const std::vector<GridPosition>& positions,
                                                           std::optional<Rotation> rotation = std::nullopt);
    bool remove_block_instance(const BlockInstanceId& instance_id);
    bool update_block_instance(const BlockInstanceId& instance_id, const BlockInstanceUpdate& update);
    const BlockInstance* block_instance_at(const GridPosition& position) const;
    bool is_position_occupied(const GridPosition& position) const { return block_instance_at(position) != nullptr; }

    bool rotate_block_instance(const BlockInstanceId& instance_id);
    bool flip_block_instance_horizontal(const BlockInstanceId& instance_id);
    bool flip_block_instance_vertical(const BlockInstanceId& instance_id);

    // Per-instance colors. Setting a role back to its palette color drops
    // the override.
    bool set_instance_role_color(const BlockInstanceId& instance_id, const ColorRoleId& role_id,
                                 const HexColor& color);
    bool reset_instance_role_color(const BlockInstanceId& instance_id, const ColorRoleId& role_id);
    bool reset_instance_colors(const BlockInstanceId& instance_id);
    // Override, then palette, then the neutral color
    HexColor effective_color(const BlockInstanceId& instance_id, const ColorRoleId& role_id) const;

    // Palette. Changing a variant role's color moves the overrides that
    // used it along.
    bool set_role_color(const ColorRoleId& role_id, const HexColor& color);
    // A color some role already has returns that role instead
    std::optional<ColorRoleId> add_role(const std::optional<std::string>& name = std::nullopt,
                                        const std::optional<HexColor>& color = std::nullopt);
    // Overrides keyed by the role, or using a removed variant color, are
    // dropped with it
    bool remove_role(const ColorRoleId& role_id);
    bool rename_role(const ColorRoleId& role_id, const std::string& name);
    bool can_remove_role() const { return pattern_.palette.size() > constants::MIN_PALETTE_ROLES; }

    // Grid. Rows and columns are added or removed at the resize anchor;
    // at the start, the other instances shift to make room or close up.
    void set_resize_anchor(ResizeAnchor anchor) { anchor_ = anchor; }
    ResizeAnchor resize_anchor() const { return anchor_; }
    bool add_row();
    bool remove_row();
    bool add_column();
    bool remove_column();
    // Drops instances outside the new size; false outside 2..25
    bool resize_grid(const QuiltGridSize& size);
    bool has_blocks_in_row(int row) const;
    bool has_blocks_in_column(int col) const;
    bool is_grid_large() const;

    // Place block_id in every empty cell as one undo step; returns the count
    size_t fill_empty(const std::string& block_id);
    size_t empty_slot_count() const;
    // Empty cells in the rectangle spanned by two corners, row by row
    std::vector<GridPosition> range_fill_positions(const GridPosition& anchor, const GridPosition& end) const;

    Rotation placement_rotation() const { return placement_rotation_; }
    void rotate_placement_clockwise() { placement_rotation_ = rotate_clockwise(placement_rotation_); }
    void reset_placement_rotation() { placement_rotation_ = Rotation::Deg0; }

    // Borders. Adding a border to a disabled frame enables it.
    std::optional<BorderId> add_border(double width_inches = constants::DEFAULT_BORDER_WIDTH_INCHES,
                                       CornerStyle corner_style = CornerStyle::Butted,
                                       const ColorRoleId& color_role = ColorRoleId(constants::DEFAULT_BORDER_ROLE),
                                       const std::optional<ColorRoleId>& cornerstone_color_role = std::nullopt);
    bool remove_border(const BorderId& border_id);
    bool update_border(const BorderId& border_id, const BorderUpdate& update);
    bool set_borders_enabled(bool enabled);
    bool reorder_borders(size_t from_index, size_t to_index);
    bool can_add_border() const { return pattern_.border_config.borders.size() < constants::MAX_BORDERS; }

    // Sum of border widths on one side; zero when the frame is disabled
    double total_border_width() const;
    // Grid size plus borders on both sides
    PhysicalSize final_quilt_size() const;

    // History
    bool undo();
    bool redo();
    bool can_undo() const { return undo_.can_undo(); }
    bool can_redo() const { return undo_.can_redo(); }
    const PatternUndoManager& history() const { return undo_; }

private:
    void commit(PatternOperation operation);
    void apply(const PatternOperation& operation);
    // Adds the removal of variant roles the batch leaves unused, then
    // commits; a batch of one is recorded as that operation
    void commit_with_cleanup(pattern_op::Batch batch);

    bool set_instance_overrides(const BlockInstance& instance, PaletteOverrides overrides,
                                const std::optional<HexColor>& new_color);
    bool resize(const QuiltGridSize& next_size, int row_shift, int col_shift);
    ColorRoleId next_variant_role_id(const Palette& palette) const;

    BlockInstanceId generate_id();

    Pattern pattern_;
    PatternUndoManager undo_;
    bool dirty_ = false;
    ResizeAnchor anchor_ = ResizeAnchor::End;
    Rotation placement_rotation_ = Rotation::Deg0;
    std::mt19937_64 rng_;
};

}  // namespace quiltblock

#endif // QUILTBLOCK_DESIGNER_PATTERN_DESIGNER_HPP
