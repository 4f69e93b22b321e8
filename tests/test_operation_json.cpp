#include <gtest/gtest.h>
#include <serialization/operation_json.hpp>
#include "test_helpers.hpp"

using namespace quiltblock;
using namespace quiltblock::test;

namespace {

void expect_json_round_trip(const Operation& operation) {
    nlohmann::json j = operation_to_json(operation);
    // Through text, as a history dump would be read back
    Operation parsed = operation_from_json(nlohmann::json::parse(j.dump()));
    EXPECT_EQ(parsed, operation) << j.dump();
}

}  // namespace

TEST(OperationJsonTest, UnitOperations) {
    nlohmann::json j = operation_to_json(op::AddUnit{make_hst("h1", 1, 2, HstVariant::SW)});
    EXPECT_EQ(j["type"], "add_unit");
    EXPECT_EQ(j["unit"]["id"], "h1");
    EXPECT_EQ(j["unit"]["variant"], "sw");

    expect_json_round_trip(op::AddUnit{make_flying_geese("g1", 0, 0, FlyingGeeseDirection::Up)});
    expect_json_round_trip(op::RemoveUnit{make_qst("q1", 2, 2)});

    UnitUpdate prev;
    prev.variant = "right";
    prev.span = Span{1, 2};
    UnitUpdate next;
    next.variant = "down";
    next.span = Span{2, 1};
    next.patch_roles = {{"sky1", "accent1"}, {"sky2", "feature"}};
    expect_json_round_trip(op::UpdateUnit{"g1", prev, next});
}

TEST(OperationJsonTest, UpdateUnitWritesOnlySetFields) {
    UnitUpdate next;
    next.position = GridPosition{1, 1};
    nlohmann::json j = operation_to_json(op::UpdateUnit{"s1", {}, next});

    EXPECT_EQ(j["prev"], nlohmann::json::object());
    EXPECT_EQ(j["next"], (nlohmann::json{{"position", {{"row", 1}, {"col", 1}}}}));
}

TEST(OperationJsonTest, GridAndPaletteOperations) {
    expect_json_round_trip(op::UpdatePalette{"feature", "#2C3E50", "#000000"});
    expect_json_round_trip(op::ResizeGrid{4, 3, {make_square("s1", 3, 3), make_hst("h1", 0, 3)}});
    expect_json_round_trip(op::ResizeGrid{3, 4, {}});
    expect_json_round_trip(op::RenameRole{"accent1", "Accent 1", "Rust"});

    expect_json_round_trip(op::AddRole{ColorRole{"accent3", "Accent 3", "#C0392B", false}, std::nullopt});
    expect_json_round_trip(op::AddRole{ColorRole{"accent3", "Accent 3", "#C0392B", true}, 2});
}

TEST(OperationJsonTest, RemoveRoleKeepsAffectedUnits) {
    op::RemoveRole remove;
    remove.role = ColorRole{"accent1", "Accent 1", "#8B4513", false};
    remove.index = 2;
    remove.affected_units = {{"h1", {{"primary", "accent1"}, {"secondary", "background"}}}};
    remove.fallback_role_id = "feature";

    nlohmann::json j = operation_to_json(remove);
    EXPECT_EQ(j["type"], "remove_role");
    EXPECT_EQ(j["fallbackRoleId"], "feature");
    ASSERT_EQ(j["affectedUnits"].size(), 1u);
    EXPECT_EQ(j["affectedUnits"][0]["unitId"], "h1");
    EXPECT_EQ(j["affectedUnits"][0]["prevRoles"]["primary"], "accent1");

    expect_json_round_trip(remove);
}

TEST(OperationJsonTest, BorderOperations) {
    const BorderSpec border{"b1", 2.5, CornerStyle::Cornerstone, "accent1", "feature"};
    expect_json_round_trip(op::AddBorder{border, std::nullopt});
    expect_json_round_trip(op::AddBorder{border, 0});
    expect_json_round_trip(op::RemoveBorder{border, 1});
    expect_json_round_trip(op::SetBordersEnabled{false, true});
    expect_json_round_trip(op::ReorderBorders{0, 2});

    BorderUpdate prev;
    prev.width_inches = 2.5;
    BorderUpdate next;
    next.width_inches = 3.0;
    next.corner_style = CornerStyle::Mitered;
    expect_json_round_trip(op::UpdateBorder{"b1", prev, next});

    nlohmann::json j = operation_to_json(op::ReorderBorders{1, 0});
    EXPECT_EQ(j["fromIndex"], 1);
    EXPECT_EQ(j["toIndex"], 0);
}

TEST(OperationJsonTest, ClearedCornerstoneSurvives) {
    BorderUpdate prev;
    prev.cornerstone_color_role = std::optional<ColorRoleId>{};
    BorderUpdate next;
    next.cornerstone_color_role = std::optional<ColorRoleId>("feature");

    nlohmann::json j = operation_to_json(op::UpdateBorder{"b1", prev, next});
    EXPECT_TRUE(j["prev"]["cornerstoneFabricRole"].is_null());
    EXPECT_EQ(j["next"]["cornerstoneFabricRole"], "feature");

    expect_json_round_trip(op::UpdateBorder{"b1", prev, next});
}

TEST(OperationJsonTest, NestedBatch) {
    op::Batch inner;
    inner.operations.push_back(op::SetBordersEnabled{false, true});
    inner.operations.push_back(op::AddBorder{BorderSpec{"b1", 2.0, CornerStyle::Butted, "accent1", std::nullopt}, 0});

    op::Batch outer;
    outer.operations.push_back(op::AddUnit{make_square("s1", 0, 0)});
    outer.operations.push_back(inner);

    nlohmann::json j = operation_to_json(outer);
    EXPECT_EQ(j["type"], "batch");
    ASSERT_EQ(j["operations"].size(), 2u);
    EXPECT_EQ(j["operations"][1]["type"], "batch");
    EXPECT_EQ(j["operations"][1]["operations"][0]["type"], "set_borders_enabled");

    expect_json_round_trip(outer);
    expect_json_round_trip(op::Batch{});
}

TEST(OperationJsonTest, UnknownTypeThrows) {
    EXPECT_THROW(operation_from_json({{"type", "paint_cell"}}), std::runtime_error);
    EXPECT_THROW(operation_from_json(nlohmann::json::object()), nlohmann::json::exception);
}

TEST(OperationJsonTest, HistoryDump) {
    UndoManager history;
    history.record(op::AddUnit{make_square("s1", 0, 0)});
    history.record(op::UpdatePalette{"feature", "#2C3E50", "#000000"});
    history.undo();

    nlohmann::json j = history_to_json(history);
    ASSERT_EQ(j["undo"].size(), 1u);
    ASSERT_EQ(j["redo"].size(), 1u);
    EXPECT_EQ(j["undo"][0]["type"], "add_unit");
    EXPECT_EQ(j["redo"][0]["type"], "update_palette");
    EXPECT_EQ(j["redo"][0]["nextColor"], "#000000");
}
