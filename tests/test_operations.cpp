#include <gtest/gtest.h>
#include <history/operation.hpp>
#include <bridge/unit_bridge.hpp>
#include "test_helpers.hpp"
#include <limits>

using namespace quiltblock;
using namespace quiltblock::test;

namespace {

BorderSpec make_border(const std::string& id, double width = 2.0) {
    BorderSpec border;
    border.id = id;
    border.width_inches = width;
    border.color_role = "accent1";
    return border;
}

DesignState sample_state() {
    DesignState state;
    state.grid_size = 3;
    state.units = {
        make_square("s1", 0, 0, "feature"),
        make_hst("h1", 1, 1, HstVariant::NE, "accent1", "background"),
        make_flying_geese("f1", 2, 0, FlyingGeeseDirection::Right, {"feature", "accent1", "background"}),
    };
    state.palette = default_palette();
    state.border_config.enabled = true;
    state.border_config.borders = {make_border("b1"), make_border("b2", 3.0)};
    return state;
}

void expect_round_trip(const DesignState& state, const Operation& operation) {
    DesignState applied = apply_operation(state, operation);
    DesignState restored = apply_operation(applied, invert_operation(operation));
    EXPECT_EQ(restored, state) << "operation " << operation_type(operation);
}

}  // namespace

// ============================================
// Inversion round trip
// ============================================

TEST(OperationTest, EveryOperationInverts) {
    const DesignState state = sample_state();

    UnitUpdate prev_update;
    prev_update.variant = "ne";
    UnitUpdate next_update;
    next_update.variant = "se";

    BorderUpdate prev_border;
    prev_border.width_inches = 2.0;
    BorderUpdate next_border;
    next_border.width_inches = 4.5;

    const std::vector<Operation> operations = {
        op::AddUnit{make_qst("q1", 0, 2)},
        op::RemoveUnit{state.units.back()},
        op::UpdateUnit{"h1", prev_update, next_update},
        op::UpdatePalette{"feature", "#2C3E50", "#000000"},
        op::ResizeGrid{3, 5, {}},
        op::AddRole{ColorRole{"accent3", "Accent 3", "#C0392B"}, 4},
        op::RenameRole{"accent2", "Accent 2", "Gold"},
        op::AddBorder{make_border("b3"), 1},
        op::RemoveBorder{state.border_config.borders[0], 0},
        op::UpdateBorder{"b1", prev_border, next_border},
        op::SetBordersEnabled{true, false},
        op::ReorderBorders{0, 1},
    };

    for (const auto& operation : operations) {
        expect_round_trip(state, operation);
    }
}

TEST(OperationTest, ApplyDoesNotChangeOtherDimensions) {
    const DesignState state = sample_state();
    DesignState applied = apply_operation(state, op::UpdatePalette{"feature", "#2C3E50", "#000000"});
    EXPECT_EQ(applied.units, state.units);
    EXPECT_EQ(applied.grid_size, state.grid_size);
    EXPECT_EQ(applied.border_config, state.border_config);
    EXPECT_EQ(applied.palette.find("feature")->color, "#000000");
}

TEST(OperationTest, UnknownTargetsAreNoOps) {
    const DesignState state = sample_state();
    UnitUpdate update;
    update.variant = "sw";

    EXPECT_EQ(apply_operation(state, op::UpdateUnit{"nope", {}, update}), state);
    EXPECT_EQ(apply_operation(state, op::UpdatePalette{"nope", "#000", "#111"}), state);
    EXPECT_EQ(apply_operation(state, op::RemoveBorder{make_border("nope"), 0}), state);
    EXPECT_EQ(apply_operation(state, op::ReorderBorders{0, 7}), state);
}

// Removing and re-adding appends, so only the last unit keeps its slot
TEST(OperationTest, ReaddedUnitMovesToEnd) {
    const DesignState state = sample_state();
    op::RemoveUnit remove{state.units.front()};

    DesignState restored = apply_operation(apply_operation(state, remove), invert_operation(remove));
    ASSERT_EQ(restored.units.size(), state.units.size());
    EXPECT_EQ(restored.units.back(), state.units.front());
}

TEST(OperationTest, AddUnitSkipsDuplicateId) {
    const DesignState state = sample_state();
    DesignState applied = apply_operation(state, op::AddUnit{make_square("s1", 2, 2)});
    EXPECT_EQ(applied.units, state.units);
}

// ============================================
// Batches
// ============================================

TEST(OperationTest, BatchInversionReversesOrder) {
    op::Batch batch;
    batch.operations.push_back(op::AddUnit{make_square("a", 0, 2)});
    batch.operations.push_back(op::UpdatePalette{"feature", "#2C3E50", "#000000"});
    batch.operations.push_back(op::SetBordersEnabled{true, false});

    Operation inverted = invert_operation(batch);
    const auto* inverse = std::get_if<op::Batch>(&inverted);
    ASSERT_NE(inverse, nullptr);
    ASSERT_EQ(inverse->operations.size(), 3u);

    EXPECT_EQ(inverse->operations[0], Operation(op::SetBordersEnabled{false, true}));
    EXPECT_EQ(inverse->operations[1], Operation(op::UpdatePalette{"feature", "#000000", "#2C3E50"}));
    EXPECT_EQ(inverse->operations[2], Operation(op::RemoveUnit{make_square("a", 0, 2)}));

    expect_round_trip(sample_state(), batch);
}

TEST(OperationTest, NestedBatchInverts) {
    op::Batch inner;
    inner.operations.push_back(op::AddUnit{make_square("a", 0, 2)});
    inner.operations.push_back(op::RemoveUnit{sample_state().units.back()});

    op::Batch outer;
    outer.operations.push_back(inner);
    outer.operations.push_back(op::ResizeGrid{3, 4, {}});

    expect_round_trip(sample_state(), outer);
    EXPECT_EQ(operation_type(outer), "batch");
}

// ============================================
// Grid resize
// ============================================

TEST(OperationTest, ShrinkDropsAndGrowRestores) {
    const DesignState state = sample_state();
    std::vector<Unit> removed = get_units_out_of_bounds(state.units, 2);

    // f1 sits on row 2; h1 at (1,1) still fits a 2x2 grid
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0].id, "f1");

    op::ResizeGrid shrink{3, 2, removed};
    DesignState shrunk = apply_operation(state, shrink);
    EXPECT_EQ(shrunk.grid_size, 2);
    EXPECT_EQ(shrunk.units.size(), 2u);

    DesignState restored = apply_operation(shrunk, invert_operation(shrink));
    EXPECT_EQ(restored.grid_size, 3);
    EXPECT_EQ(restored.units.size(), 3u);
    EXPECT_NE(find_unit(restored.units, "f1"), nullptr);
}

TEST(OperationTest, UnitsOutOfBoundsByFootprint) {
    std::vector<Unit> units = {
        make_square("inside", 1, 1),
        make_flying_geese("overhang", 1, 1, FlyingGeeseDirection::Right),
        make_square("outside", 2, 0),
    };
    auto out = get_units_out_of_bounds(units, 2);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].id, "overhang");
    EXPECT_EQ(out[1].id, "outside");
}

TEST(OperationTest, FootprintChecksDoNotOverflow) {
    const int max = std::numeric_limits<int>::max();
    Unit far = make_square("far", max, max);
    Unit edge = make_flying_geese("edge", 0, max, FlyingGeeseDirection::Right);

    EXPECT_FALSE(fits_grid(far, 9));
    EXPECT_FALSE(fits_grid(edge, 9));
    EXPECT_FALSE(fits_grid(make_square("negative", -1, 0), 9));
    EXPECT_TRUE(fits_grid(make_square("corner", 8, 8), 9));

    // The sum position + span would wrap in 32 bits
    EXPECT_FALSE(unit_covers(edge, {0, std::numeric_limits<int>::min()}));
    EXPECT_TRUE(unit_covers(edge, {0, max}));
    ASSERT_EQ(covered_cells(edge).size(), 1u);
    EXPECT_EQ(covered_cells(edge)[0], (GridPosition{0, max}));

    EXPECT_EQ(get_units_out_of_bounds({far, edge}, 9).size(), 2u);
}

// ============================================
// Roles
// ============================================

TEST(OperationTest, RoleRemovalRoundTrip) {
    const DesignState state = sample_state();
    const ColorRoleId removed_id = "accent1";

    op::RemoveRole remove;
    remove.role = *state.palette.find(removed_id);
    remove.index = *state.palette.index_of(removed_id);
    remove.fallback_role_id = "background";

    op::Batch batch;
    for (const auto& u : state.units) {
        if (!unit_uses_role(u, removed_id)) {
            continue;
        }
        remove.affected_units.push_back({u.id, to_unit_config(u).patch_roles});
        UnitUpdate next = replace_role(u, removed_id, "background");
        batch.operations.push_back(op::UpdateUnit{u.id, capture_prev(u, next), next});
    }
    ASSERT_EQ(remove.affected_units.size(), 2u);
    batch.operations.push_back(remove);

    DesignState applied = apply_operation(state, batch);
    EXPECT_FALSE(applied.palette.contains(removed_id));
    for (const auto& u : applied.units) {
        EXPECT_FALSE(unit_uses_role(u, removed_id)) << u.id;
    }

    DesignState restored = apply_operation(applied, invert_operation(batch));
    EXPECT_EQ(restored, state);
    EXPECT_EQ(restored.palette.index_of(removed_id), remove.index);
}

TEST(OperationTest, RemoveRoleInverseRestoresAffectedPatches) {
    op::RemoveRole remove;
    remove.role = ColorRole{"accent1", "Accent 1", "#8B4513"};
    remove.index = 2;
    remove.fallback_role_id = "background";
    remove.affected_units = {{"h1", {{"primary", "accent1"}, {"secondary", "background"}}}};

    Operation inverted = invert_operation(remove);
    const auto& batch = std::get<op::Batch>(inverted);
    ASSERT_EQ(batch.operations.size(), 2u);
    EXPECT_EQ(batch.operations[0], Operation(op::AddRole{remove.role, 2}));

    const auto& restore = std::get<op::UpdateUnit>(batch.operations[1]);
    EXPECT_EQ(restore.unit_id, "h1");
    EXPECT_EQ(restore.prev.patch_roles, (PatchRoles{{"primary", "background"}}));
    EXPECT_EQ(restore.next.patch_roles, (PatchRoles{{"primary", "accent1"}}));
}

TEST(OperationTest, AddRoleWithoutIndexAppendsAndInverts) {
    const DesignState state = sample_state();
    op::AddRole add{ColorRole{"accent3", "Accent 3", "#C0392B"}, std::nullopt};

    DesignState applied = apply_operation(state, add);
    EXPECT_EQ(applied.palette.roles.back().id, "accent3");
    expect_round_trip(state, add);
}

// ============================================
// Borders
// ============================================

TEST(OperationTest, ReorderBorders) {
    DesignState state = sample_state();
    state.border_config.borders.push_back(make_border("b3"));

    DesignState moved = apply_operation(state, op::ReorderBorders{0, 2});
    ASSERT_EQ(moved.border_config.borders.size(), 3u);
    EXPECT_EQ(moved.border_config.borders[0].id, "b2");
    EXPECT_EQ(moved.border_config.borders[1].id, "b3");
    EXPECT_EQ(moved.border_config.borders[2].id, "b1");

    expect_round_trip(state, op::ReorderBorders{0, 2});
}

TEST(OperationTest, UpdateBorderMergesFields) {
    const DesignState state = sample_state();
    BorderUpdate next;
    next.corner_style = CornerStyle::Cornerstone;
    next.cornerstone_color_role = "feature";

    DesignState applied = apply_operation(state, op::UpdateBorder{"b2", {}, next});
    const BorderSpec* b2 = applied.border_config.find("b2");
    ASSERT_NE(b2, nullptr);
    EXPECT_EQ(b2->corner_style, CornerStyle::Cornerstone);
    EXPECT_EQ(b2->cornerstone_color_role, std::optional<ColorRoleId>("feature"));
    EXPECT_DOUBLE_EQ(b2->width_inches, 3.0);
}

TEST(OperationTest, TypeTags) {
    EXPECT_EQ(operation_type(op::AddUnit{}), "add_unit");
    EXPECT_EQ(operation_type(op::ResizeGrid{}), "resize_grid");
    EXPECT_EQ(operation_type(op::SetBordersEnabled{}), "set_borders_enabled");
    EXPECT_EQ(operation_type(op::Batch{}), "batch");
}
