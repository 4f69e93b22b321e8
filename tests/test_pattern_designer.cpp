#include <gtest/gtest.h>
#include <designer/pattern_designer.hpp>
#include "test_helpers.hpp"
#include <algorithm>

using namespace quiltblock;
using namespace quiltblock::test;

namespace {

size_t variant_role_count(const Palette& palette) {
    return static_cast<size_t>(std::count_if(palette.roles.begin(), palette.roles.end(),
                                             [](const ColorRole& r) { return r.is_variant_color; }));
}

}  // namespace

// ============================================
// Lifecycle
// ============================================

TEST(PatternDesignerTest, InitPatternDefaults) {
    PatternDesigner designer;
    const Pattern& pattern = designer.pattern();
    EXPECT_EQ(pattern.grid_size, (QuiltGridSize{4, 4}));
    EXPECT_EQ(pattern.physical_size, (PhysicalSize{48, 48}));
    EXPECT_EQ(pattern.palette, default_palette());
    EXPECT_EQ(pattern.difficulty, PatternDifficulty::Beginner);
    EXPECT_FALSE(pattern.category.has_value());
    EXPECT_TRUE(pattern.block_instances.empty());
    EXPECT_FALSE(designer.is_dirty());
    EXPECT_FALSE(designer.can_undo());
}

TEST(PatternDesignerTest, InitClampsGridSize) {
    PatternDesigner designer;
    designer.init_pattern({1, 40}, "user-1");
    EXPECT_EQ(designer.pattern().grid_size, (QuiltGridSize{2, 25}));
    EXPECT_EQ(designer.pattern().creator_id, "user-1");
}

TEST(PatternDesignerTest, EditsMarkDirtyUntilSaved) {
    PatternDesigner designer;
    designer.add_block_instance("block-1", {0, 0});
    EXPECT_TRUE(designer.is_dirty());

    designer.mark_as_saved(std::string("pattern-7"));
    EXPECT_FALSE(designer.is_dirty());
    EXPECT_EQ(designer.pattern().id, "pattern-7");
}

TEST(PatternDesignerTest, MetadataLimits) {
    PatternDesigner designer;
    PatternMetadataUpdate update;
    update.title = "Log Cabin Sampler";
    update.difficulty = PatternDifficulty::Advanced;
    update.category = PatternCategory::Traditional;
    EXPECT_TRUE(designer.update_metadata(update));
    EXPECT_EQ(designer.pattern().title, "Log Cabin Sampler");
    EXPECT_EQ(designer.pattern().category, PatternCategory::Traditional);
    EXPECT_FALSE(designer.can_undo());

    PatternMetadataUpdate too_many;
    too_many.hashtags = std::vector<std::string>(11, "quilt");
    EXPECT_FALSE(designer.update_metadata(too_many));

    // 2000 two-byte characters fit; one more does not
    std::string description;
    for (int i = 0; i < 2000; ++i) description += "\xC3\xA9";
    PatternMetadataUpdate long_description;
    long_description.description = description;
    EXPECT_TRUE(designer.update_metadata(long_description));
    long_description.description = description + "x";
    EXPECT_FALSE(designer.update_metadata(long_description));

    PatternMetadataUpdate clear;
    clear.category = std::optional<PatternCategory>{};
    EXPECT_TRUE(designer.update_metadata(clear));
    EXPECT_FALSE(designer.pattern().category.has_value());
}

// ============================================
// Placement
// ============================================

TEST(PatternDesignerTest, AddBlockInstance) {
    PatternDesigner designer;
    auto id = designer.add_block_instance("block-1", {1, 2});
    ASSERT_TRUE(id.has_value());

    const BlockInstance* placed = designer.block_instance_at({1, 2});
    ASSERT_NE(placed, nullptr);
    EXPECT_EQ(placed->id, *id);
    EXPECT_EQ(placed->block_id, "block-1");
    EXPECT_EQ(placed->rotation, Rotation::Deg0);
    EXPECT_TRUE(designer.is_position_occupied({1, 2}));

    EXPECT_FALSE(designer.add_block_instance("block-1", {4, 0}).has_value());
    EXPECT_FALSE(designer.add_block_instance("", {0, 0}).has_value());
}

TEST(PatternDesignerTest, PlacingOnAnOccupiedCellReplacesInOneStep) {
    PatternDesigner designer;
    auto first = designer.add_block_instance("block-1", {0, 0});
    auto second = designer.add_block_instance("block-2", {0, 0});

    ASSERT_EQ(designer.pattern().block_instances.size(), 1u);
    EXPECT_EQ(designer.block_instance_at({0, 0})->id, *second);
    EXPECT_EQ(designer.history().undo_size(), 2u);

    designer.undo();
    EXPECT_EQ(designer.block_instance_at({0, 0})->id, *first);
}

TEST(PatternDesignerTest, PlacementRotation) {
    PatternDesigner designer;
    designer.rotate_placement_clockwise();
    designer.rotate_placement_clockwise();
    EXPECT_EQ(designer.placement_rotation(), Rotation::Deg180);

    designer.add_block_instance("block-1", {0, 0});
    EXPECT_EQ(designer.block_instance_at({0, 0})->rotation, Rotation::Deg180);

    designer.add_block_instance("block-1", {0, 1}, Rotation::Deg90);
    EXPECT_EQ(designer.block_instance_at({0, 1})->rotation, Rotation::Deg90);

    designer.reset_placement_rotation();
    EXPECT_EQ(designer.placement_rotation(), Rotation::Deg0);
}

TEST(PatternDesignerTest, BatchSkipsRepeatsAndOutsideCells) {
    PatternDesigner designer;
    auto ids = designer.add_block_instances_batch("block-1", {{0, 0}, {0, 1}, {0, 0}, {9, 9}});
    EXPECT_EQ(ids.size(), 2u);
    EXPECT_EQ(designer.pattern().block_instances.size(), 2u);
    EXPECT_EQ(designer.history().undo_size(), 1u);

    designer.undo();
    EXPECT_TRUE(designer.pattern().block_instances.empty());
}

TEST(PatternDesignerTest, RemoveBlockInstance) {
    PatternDesigner designer;
    auto id = designer.add_block_instance("block-1", {2, 2});
    EXPECT_TRUE(designer.remove_block_instance(*id));
    EXPECT_FALSE(designer.is_position_occupied({2, 2}));
    EXPECT_FALSE(designer.remove_block_instance(*id));

    designer.undo();
    EXPECT_TRUE(designer.is_position_occupied({2, 2}));
}

TEST(PatternDesignerTest, RotateAndFlip) {
    PatternDesigner designer;
    auto id = *designer.add_block_instance("block-1", {0, 0});

    for (int i = 0; i < 3; ++i) designer.rotate_block_instance(id);
    EXPECT_EQ(designer.block_instance_at({0, 0})->rotation, Rotation::Deg270);
    designer.rotate_block_instance(id);
    EXPECT_EQ(designer.block_instance_at({0, 0})->rotation, Rotation::Deg0);

    EXPECT_TRUE(designer.flip_block_instance_horizontal(id));
    EXPECT_TRUE(designer.flip_block_instance_vertical(id));
    EXPECT_TRUE(designer.block_instance_at({0, 0})->flip_horizontal);
    EXPECT_TRUE(designer.block_instance_at({0, 0})->flip_vertical);

    designer.undo();
    EXPECT_FALSE(designer.block_instance_at({0, 0})->flip_vertical);
    EXPECT_FALSE(designer.rotate_block_instance("missing"));
}

TEST(PatternDesignerTest, FillEmptyAndRangeFill) {
    PatternDesigner designer;
    designer.init_pattern({2, 3});
    designer.add_block_instance("block-1", {0, 1});

    EXPECT_EQ(designer.range_fill_positions({1, 2}, {0, 0}),
              (std::vector<GridPosition>{{0, 0}, {0, 2}, {1, 0}, {1, 1}, {1, 2}}));

    EXPECT_EQ(designer.empty_slot_count(), 5u);
    EXPECT_EQ(designer.fill_empty("block-2"), 5u);
    EXPECT_EQ(designer.empty_slot_count(), 0u);
    EXPECT_EQ(designer.block_instance_at({0, 1})->block_id, "block-1");
    EXPECT_EQ(designer.fill_empty("block-2"), 0u);

    designer.undo();
    EXPECT_EQ(designer.empty_slot_count(), 5u);
}

// ============================================
// Per-instance colors
// ============================================

TEST(PatternDesignerTest, OverrideWithNewColorAddsVariantRole) {
    PatternDesigner designer;
    auto id = *designer.add_block_instance("block-1", {0, 0});

    EXPECT_TRUE(designer.set_instance_role_color(id, "feature", "#AA0000"));
    EXPECT_EQ(designer.effective_color(id, "feature"), "#AA0000");
    EXPECT_EQ(designer.effective_color(id, "background"), "#F5F5DC");

    const Palette& palette = designer.pattern().palette;
    ASSERT_EQ(palette.size(), 5u);
    EXPECT_EQ(palette.roles.back().id, "variant1");
    EXPECT_EQ(palette.roles.back().name, "Variant 1");
    EXPECT_EQ(palette.roles.back().color, "#AA0000");
    EXPECT_TRUE(palette.roles.back().is_variant_color);

    // One undo step removes both the override and the variant role
    designer.undo();
    EXPECT_EQ(designer.pattern().palette, default_palette());
    EXPECT_TRUE(designer.block_instance_at({0, 0})->palette_overrides.empty());
}

TEST(PatternDesignerTest, OverrideWithKnownColorAddsNoRole) {
    PatternDesigner designer;
    auto a = *designer.add_block_instance("block-1", {0, 0});
    auto b = *designer.add_block_instance("block-1", {0, 1});

    // Palette colors match regardless of case
    EXPECT_TRUE(designer.set_instance_role_color(a, "feature", "#daa520"));
    EXPECT_EQ(variant_role_count(designer.pattern().palette), 0u);

    designer.set_instance_role_color(a, "background", "#123456");
    designer.set_instance_role_color(b, "background", "#123456");
    EXPECT_EQ(variant_role_count(designer.pattern().palette), 1u);
}

TEST(PatternDesignerTest, UnusedVariantRolesAreRemoved) {
    PatternDesigner designer;
    auto a = *designer.add_block_instance("block-1", {0, 0});
    auto b = *designer.add_block_instance("block-1", {0, 1});
    designer.set_instance_role_color(a, "feature", "#123456");
    designer.set_instance_role_color(b, "feature", "#123456");

    // Still used by b
    EXPECT_TRUE(designer.reset_instance_colors(a));
    EXPECT_EQ(variant_role_count(designer.pattern().palette), 1u);

    EXPECT_TRUE(designer.remove_block_instance(b));
    EXPECT_EQ(variant_role_count(designer.pattern().palette), 0u);

    designer.undo();
    EXPECT_EQ(variant_role_count(designer.pattern().palette), 1u);
    EXPECT_EQ(designer.effective_color(b, "feature"), "#123456");
}

TEST(PatternDesignerTest, SettingThePaletteColorDropsTheOverride) {
    PatternDesigner designer;
    auto id = *designer.add_block_instance("block-1", {0, 0});
    designer.set_instance_role_color(id, "feature", "#654321");

    EXPECT_TRUE(designer.set_instance_role_color(id, "feature", "#2C3E50"));
    EXPECT_TRUE(designer.block_instance_at({0, 0})->palette_overrides.empty());
    EXPECT_EQ(variant_role_count(designer.pattern().palette), 0u);
    EXPECT_FALSE(designer.reset_instance_role_color(id, "feature"));
}

TEST(PatternDesignerTest, OverrideRejectsBadInput) {
    PatternDesigner designer;
    auto id = *designer.add_block_instance("block-1", {0, 0});
    EXPECT_FALSE(designer.set_instance_role_color(id, "feature", "red"));
    EXPECT_FALSE(designer.set_instance_role_color(id, "feature", "#12345G"));
    EXPECT_FALSE(designer.set_instance_role_color(id, "missing", "#123456"));
    EXPECT_FALSE(designer.set_instance_role_color("missing", "feature", "#123456"));
    EXPECT_EQ(designer.history().undo_size(), 1u);
}

// ============================================
// Palette
// ============================================

TEST(PatternDesignerTest, VariantColorChangeMovesOverrides) {
    PatternDesigner designer;
    auto id = *designer.add_block_instance("block-1", {0, 0});
    designer.set_instance_role_color(id, "feature", "#123456");

    EXPECT_TRUE(designer.set_role_color("variant1", "#654321"));
    EXPECT_EQ(designer.effective_color(id, "feature"), "#654321");
    EXPECT_EQ(variant_role_count(designer.pattern().palette), 1u);

    designer.undo();
    EXPECT_EQ(designer.effective_color(id, "feature"), "#123456");
    EXPECT_FALSE(designer.set_role_color("feature", "navy"));
}

TEST(PatternDesignerTest, AddRoleReusesMatchingColor) {
    PatternDesigner designer;
    EXPECT_EQ(designer.add_role("Navy", std::string("#2c3e50")), std::optional<ColorRoleId>("feature"));
    EXPECT_EQ(designer.pattern().palette.size(), 4u);

    auto added = designer.add_role("Rust", std::string("#B7410E"));
    ASSERT_TRUE(added.has_value());
    EXPECT_EQ(designer.pattern().palette.size(), 5u);
    EXPECT_FALSE(designer.add_role("Bad", std::string("#B7410")).has_value());
}

TEST(PatternDesignerTest, RemoveRoleDropsItsOverrides) {
    PatternDesigner designer;
    auto id = *designer.add_block_instance("block-1", {0, 0});
    designer.set_instance_role_color(id, "accent2", "#0000FF");
    ASSERT_EQ(designer.pattern().palette.size(), 5u);

    EXPECT_TRUE(designer.remove_role("accent2"));
    EXPECT_TRUE(designer.block_instance_at({0, 0})->palette_overrides.empty());
    // The variant color lost its last user too
    EXPECT_EQ(designer.pattern().palette.size(), 3u);

    designer.undo();
    EXPECT_EQ(designer.pattern().palette.size(), 5u);
    EXPECT_EQ(designer.effective_color(id, "accent2"), "#0000FF");
}

TEST(PatternDesignerTest, RenameRoleIsUndoable) {
    PatternDesigner designer;
    EXPECT_TRUE(designer.rename_role("feature", "Navy"));
    EXPECT_EQ(designer.pattern().palette.find("feature")->name, "Navy");
    designer.undo();
    EXPECT_EQ(designer.pattern().palette.find("feature")->name, "Feature");
}

// ============================================
// Grid
// ============================================

TEST(PatternDesignerTest, AddRowAtStartShiftsBlocksDown) {
    PatternDesigner designer;
    designer.add_block_instance("block-1", {0, 0});
    designer.set_resize_anchor(ResizeAnchor::Start);

    EXPECT_TRUE(designer.add_row());
    EXPECT_EQ(designer.pattern().grid_size, (QuiltGridSize{5, 4}));
    EXPECT_EQ(designer.pattern().physical_size, (PhysicalSize{48, 60}));
    EXPECT_FALSE(designer.is_position_occupied({0, 0}));
    EXPECT_TRUE(designer.is_position_occupied({1, 0}));

    designer.undo();
    EXPECT_EQ(designer.pattern().grid_size, (QuiltGridSize{4, 4}));
    EXPECT_TRUE(designer.is_position_occupied({0, 0}));
}

TEST(PatternDesignerTest, RemoveRowAtEndDropsLastRow) {
    PatternDesigner designer;
    designer.add_block_instance("block-1", {3, 1});
    designer.add_block_instance("block-1", {0, 1});
    EXPECT_TRUE(designer.has_blocks_in_row(3));

    EXPECT_TRUE(designer.remove_row());
    EXPECT_EQ(designer.pattern().block_instances.size(), 1u);
    EXPECT_FALSE(designer.has_blocks_in_row(3));

    designer.undo();
    EXPECT_TRUE(designer.is_position_occupied({3, 1}));
}

TEST(PatternDesignerTest, RemoveColumnAtStartClosesUp) {
    PatternDesigner designer;
    auto dropped = *designer.add_block_instance("block-1", {2, 0});
    designer.add_block_instance("block-2", {2, 3});
    designer.set_instance_role_color(dropped, "feature", "#ABCDEF");
    designer.set_resize_anchor(ResizeAnchor::Start);

    EXPECT_TRUE(designer.remove_column());
    EXPECT_EQ(designer.pattern().grid_size, (QuiltGridSize{4, 3}));
    ASSERT_EQ(designer.pattern().block_instances.size(), 1u);
    EXPECT_EQ(designer.block_instance_at({2, 2})->block_id, "block-2");
    // The dropped block was the only user of its variant color
    EXPECT_EQ(variant_role_count(designer.pattern().palette), 0u);

    designer.undo();
    EXPECT_EQ(designer.block_instance_at({2, 0})->id, dropped);
    EXPECT_EQ(designer.block_instance_at({2, 3})->block_id, "block-2");
    EXPECT_EQ(variant_role_count(designer.pattern().palette), 1u);
}

TEST(PatternDesignerTest, GridLimits) {
    PatternDesigner designer;
    designer.init_pattern({2, 25});
    EXPECT_FALSE(designer.remove_row());
    EXPECT_FALSE(designer.add_column());
    EXPECT_TRUE(designer.is_grid_large());
    EXPECT_FALSE(designer.can_undo());

    EXPECT_FALSE(designer.resize_grid({26, 4}));
    EXPECT_FALSE(designer.resize_grid({2, 25}));
}

TEST(PatternDesignerTest, ResizeGrowingOneAxisAndShrinkingTheOther) {
    PatternDesigner designer;
    designer.add_block_instance("block-1", {0, 3});
    designer.add_block_instance("block-1", {3, 0});

    EXPECT_TRUE(designer.resize_grid({6, 2}));
    EXPECT_EQ(designer.pattern().grid_size, (QuiltGridSize{6, 2}));
    EXPECT_EQ(designer.pattern().block_instances.size(), 1u);
    EXPECT_EQ(designer.history().undo_size(), 3u);

    designer.undo();
    EXPECT_EQ(designer.pattern().grid_size, (QuiltGridSize{4, 4}));
    EXPECT_TRUE(designer.is_position_occupied({0, 3}));
    EXPECT_TRUE(designer.is_position_occupied({3, 0}));

    designer.redo();
    EXPECT_EQ(designer.pattern().block_instances.size(), 1u);
}

// ============================================
// Borders and size
// ============================================

TEST(PatternDesignerTest, BordersAddToFinishedSize) {
    PatternDesigner designer;
    auto inner = designer.add_border(2.5);
    auto outer = designer.add_border(4.0, CornerStyle::Cornerstone, "feature", std::string("accent2"));
    ASSERT_TRUE(inner && outer);
    EXPECT_TRUE(designer.pattern().border_config.enabled);
    EXPECT_EQ(designer.pattern().border_config.borders[0].color_role, "accent1");

    EXPECT_DOUBLE_EQ(designer.total_border_width(), 6.5);
    EXPECT_EQ(designer.final_quilt_size(), (PhysicalSize{61, 61}));

    EXPECT_TRUE(designer.set_borders_enabled(false));
    EXPECT_DOUBLE_EQ(designer.total_border_width(), 0.0);
    EXPECT_EQ(designer.final_quilt_size(), (PhysicalSize{48, 48}));
    designer.undo();

    EXPECT_TRUE(designer.reorder_borders(0, 1));
    EXPECT_EQ(designer.pattern().border_config.borders[0].id, *outer);

    BorderUpdate wider;
    wider.width_inches = 6.0;
    EXPECT_TRUE(designer.update_border(*outer, wider));
    EXPECT_TRUE(designer.remove_border(*inner));
    EXPECT_EQ(designer.final_quilt_size(), (PhysicalSize{60, 60}));
}

TEST(PatternDesignerTest, BorderLimits) {
    PatternDesigner designer;
    EXPECT_FALSE(designer.add_border(0.0).has_value());
    for (int i = 0; i < 4; ++i) {
        EXPECT_TRUE(designer.add_border().has_value());
    }
    EXPECT_FALSE(designer.can_add_border());
    EXPECT_FALSE(designer.add_border().has_value());
}
