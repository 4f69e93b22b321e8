#ifndef QUILTBLOCK_DESIGNER_BLOCK_DESIGNER_HPP
#define QUILTBLOCK_DESIGNER_BLOCK_DESIGNER_HPP

#include <bridge/unit_bridge.hpp>
#include <history/operation.hpp>
#include <history/undo_manager.hpp>
#include <model/block.hpp>
#include <model/constants.hpp>
#include <registry/unit_registry.hpp>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace quiltblock {

// Title, description and hashtags. Unset fields are left alone; a
// description holding an empty std::optional<std::string> clears it.
struct BlockMetadataUpdate {
    std::optional<std::string> title;
    std::optional<std::optional<std::string>> description;
    std::optional<std::vector<std::string>> hashtags;
};

// First tap of a flying geese placement, waiting for the second
struct FlyingGeesePlacement {
    GridPosition first_cell;
    std::vector<GridPosition> valid_adjacent_cells;
};

// Owns one block and its undo history. Every content change goes through
// an Operation that is applied to the block and recorded, so any edit
// can be undone. Edits that would leave the grid or overlap another unit
// are rejected and leave the block untouched.
class BlockDesigner {
public:
    explicit BlockDesigner(const UnitRegistry& registry = builtin_registry());

    // Document lifecycle. Both reset the history.
    void init_block(int grid_size = constants::DEFAULT_GRID_SIZE, const std::string& creator_id = "");
    void load_block(Block block);
    const Block& block() const { return block_; }

    // Not undoable. Returns false when a value exceeds its length limit,
    // counted in UTF-8 code points.
    bool update_metadata(const BlockMetadataUpdate& update);

    // Resize the grid, dropping units that no longer fit. Returns the
    // dropped units; a size outside 2..9 or equal to the current size is
    // ignored.
    std::vector<Unit> set_grid_size(int size);

    // Placement. nullopt when the footprint is out of bounds or taken.
    std::optional<UnitId> add_square(const GridPosition& position,
                                     const ColorRoleId& color_role = ColorRoleId(constants::DEFAULT_ROLE));
    std::optional<UnitId> add_hst(const GridPosition& position, HstVariant variant,
                                  const ColorRoleId& color_role = ColorRoleId(constants::DEFAULT_ROLE),
                                  const ColorRoleId& secondary_color_role = ColorRoleId(constants::DEFAULT_ROLE));
    std::optional<UnitId> add_flying_geese(const GridPosition& position, FlyingGeeseDirection direction,
                                           const std::optional<unit::FlyingGeeseRoles>& roles = std::nullopt);
    std::optional<UnitId> add_qst(const GridPosition& position,
                                  const std::optional<unit::QstRoles>& roles = std::nullopt);

    // Place one unit per free position as a single undo step. Units are
    // built from the registry definition with its default roles; variant
    // falls back to the definition's default. Only types that support
    // batch placement are accepted; flying geese or an unknown variant
    // yields no ids.
    std::vector<UnitId> add_units_batch(const std::vector<GridPosition>& positions, UnitType type,
                                        const std::optional<std::string>& variant = std::nullopt);

    bool remove_unit(const UnitId& unit_id);

    // Two-tap flying geese placement
    PlacementValidation start_flying_geese_placement(const GridPosition& position);
    std::optional<UnitId> complete_flying_geese_placement(const GridPosition& second_position);
    void cancel_flying_geese_placement();
    const std::optional<FlyingGeesePlacement>& flying_geese_placement() const { return fg_placement_; }

    // Unit edits
    bool assign_patch_role(const UnitId& unit_id, const ColorRoleId& role_id,
                           const std::optional<std::string>& patch_id = std::nullopt);
    bool rotate_unit(const UnitId& unit_id);
    bool flip_unit_horizontal(const UnitId& unit_id);
    bool flip_unit_vertical(const UnitId& unit_id);

    // Palette. Colors must be "#RRGGBB".
    bool set_role_color(const ColorRoleId& role_id, const HexColor& color);
    std::optional<ColorRoleId> add_role(const std::optional<std::string>& name = std::nullopt,
                                        const std::optional<HexColor>& color = std::nullopt);
    // Units using the role move to the fallback (first other role when
    // unset). The last role cannot be removed.
    bool remove_role(const ColorRoleId& role_id, const std::optional<ColorRoleId>& fallback_role_id = std::nullopt);
    bool rename_role(const ColorRoleId& role_id, const std::string& name);
    bool can_remove_role() const { return block_.preview_palette.size() > constants::MIN_PALETTE_ROLES; }

    // Borders. Adding a border to a disabled frame enables it.
    std::optional<BorderId> add_border(double width_inches = constants::DEFAULT_BORDER_WIDTH_INCHES,
                                       CornerStyle corner_style = CornerStyle::Butted,
                                       const ColorRoleId& color_role = ColorRoleId(constants::DEFAULT_BORDER_ROLE),
                                       const std::optional<ColorRoleId>& cornerstone_color_role = std::nullopt);
    bool remove_border(const BorderId& border_id);
    bool update_border(const BorderId& border_id, const BorderUpdate& update);
    bool set_borders_enabled(bool enabled);
    bool reorder_borders(size_t from_index, size_t to_index);
    bool can_add_border() const { return block_.border_config.borders.size() < constants::MAX_BORDERS; }

    // History
    bool undo();
    bool redo();
    bool can_undo() const { return undo_.can_undo(); }
    bool can_redo() const { return undo_.can_redo(); }
    const UndoManager& history() const { return undo_; }

    // Queries
    const Unit* unit_at(const GridPosition& cell) const;
    bool is_cell_occupied(const GridPosition& cell) const { return unit_at(cell) != nullptr; }
    std::vector<GridPosition> valid_adjacent_cells(const GridPosition& cell) const;
    std::vector<Unit> units_using_role(const ColorRoleId& role_id) const;
    std::vector<Unit> units_out_of_bounds(int grid_size) const;
    // Free cells in the rectangle spanned by two corners, row by row
    std::vector<GridPosition> range_fill_positions(const GridPosition& anchor, const GridPosition& end) const;
    std::vector<ColoredTriangle> render_unit(const UnitId& unit_id, double cell_size,
                                             const PaletteOverrides& overrides = {}) const;

private:
    // Apply to the block and push onto the undo stack
    void commit(Operation operation);
    void apply(const Operation& operation);

    // Footprint inside the grid and clear of every unit but `ignore`
    bool can_place(const Unit& unit, const UnitId& ignore = "") const;
    std::optional<UnitId> place(Unit unit);
    bool transform_unit(const UnitId& unit_id, std::optional<UnitUpdate> update, const char* what);

    UnitId generate_id();

    const UnitRegistry& registry_;
    Block block_;
    UndoManager undo_;
    std::optional<FlyingGeesePlacement> fg_placement_;
    std::mt19937_64 rng_;
};

}  // namespace quiltblock

#endif // QUILTBLOCK_DESIGNER_BLOCK_DESIGNER_HPP
