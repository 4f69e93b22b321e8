#include <gtest/gtest.h>
#include <borders/border_geometry.hpp>
#include <model/constants.hpp>
#include <model/palette.hpp>

using namespace quiltblock;

namespace {

BorderSpec border(const std::string& id, double width, CornerStyle style = CornerStyle::Butted,
                  const std::string& role = "feature") {
    BorderSpec spec;
    spec.id = id;
    spec.width_inches = width;
    spec.corner_style = style;
    spec.color_role = role;
    return spec;
}

BorderConfig frame(std::vector<BorderSpec> borders, bool enabled = true) {
    BorderConfig config;
    config.enabled = enabled;
    config.borders = std::move(borders);
    return config;
}

double fill_area(const BorderRing& ring) {
    double sum = 0.0;
    for (const auto& fill : ring.fills) {
        sum += polygon_area(fill.polygon);
    }
    return sum;
}

const Rect GRID{0, 0, 100, 100};

}  // namespace

// ============================================
// Frame layout
// ============================================

TEST(BorderGeometryTest, DisabledOrEmptyYieldsNothing) {
    Palette palette = default_palette();

    BorderGeometry disabled = compute_border_geometry(frame({border("a", 2)}, false), GRID, 10, palette);
    EXPECT_TRUE(disabled.empty());
    EXPECT_EQ(disabled.outer_rect, GRID);
    EXPECT_FALSE(disabled.outline.has_value());
    EXPECT_DOUBLE_EQ(disabled.total_thickness, 0.0);

    BorderGeometry empty = compute_border_geometry(frame({}), GRID, 10, palette);
    EXPECT_TRUE(empty.empty());
    EXPECT_EQ(empty.outer_rect, GRID);
}

TEST(BorderGeometryTest, NestedBordersShareEdges) {
    // Innermost 2", outermost 3", at 10 px per inch
    BorderConfig config = frame({border("inner", 2), border("outer", 3)});
    BorderGeometry geometry = compute_border_geometry(config, GRID, 10, default_palette());

    EXPECT_DOUBLE_EQ(geometry.total_thickness, 50.0);
    EXPECT_EQ(geometry.outer_rect, (Rect{-50, -50, 200, 200}));

    ASSERT_EQ(geometry.rings.size(), 2u);
    const BorderRing& outer = geometry.rings[0];
    const BorderRing& inner = geometry.rings[1];

    EXPECT_EQ(outer.border_id, "outer");
    EXPECT_EQ(outer.outer, geometry.outer_rect);
    EXPECT_EQ(outer.inner, (Rect{-20, -20, 140, 140}));

    EXPECT_EQ(inner.border_id, "inner");
    EXPECT_EQ(inner.outer, outer.inner);
    EXPECT_EQ(inner.inner, GRID);

    ASSERT_TRUE(geometry.outline.has_value());
    EXPECT_EQ(geometry.outline->rect, geometry.outer_rect);
    EXPECT_EQ(geometry.outline->color, std::string(constants::BORDER_OUTLINE_COLOR));
    EXPECT_DOUBLE_EQ(geometry.outline->width, 2.0);
}

TEST(BorderGeometryTest, FillsCoverEachRingExactly) {
    for (auto style : {CornerStyle::Butted, CornerStyle::Mitered, CornerStyle::Cornerstone}) {
        BorderConfig config = frame({border("a", 1.5, style), border("b", 2.5, style)});
        BorderGeometry geometry = compute_border_geometry(config, GRID, 10, default_palette());

        for (const auto& ring : geometry.rings) {
            EXPECT_NEAR(fill_area(ring), ring.outer.area() - ring.inner.area(), 1e-9)
                << to_string(style) << " ring " << ring.border_id;
        }
    }
}

// ============================================
// Corner styles
// ============================================

TEST(BorderGeometryTest, ButtedStripsAndSeams) {
    BorderGeometry geometry = compute_border_geometry(frame({border("a", 2)}), GRID, 10, default_palette());
    const BorderRing& ring = geometry.rings[0];

    ASSERT_EQ(ring.fills.size(), 4u);
    EXPECT_EQ(ring.fills[0].part, BorderPart::TopStrip);
    // Top strip runs the full outer width
    EXPECT_DOUBLE_EQ(polygon_area(ring.fills[0].polygon), 140.0 * 20.0);
    // Sides sit between top and bottom
    EXPECT_DOUBLE_EQ(polygon_area(ring.fills[2].polygon), 20.0 * 100.0);

    ASSERT_EQ(ring.seams.size(), 4u);
    for (const auto& seam : ring.seams) {
        EXPECT_DOUBLE_EQ(seam.from.y, seam.to.y);
        EXPECT_DOUBLE_EQ(seam.from.distance_to(seam.to), 20.0);
    }
    EXPECT_EQ(geometry.seam_color, std::string(constants::BORDER_SEAM_COLOR));
}

TEST(BorderGeometryTest, MiteredSeamsFollowDiagonals) {
    BorderGeometry geometry = compute_border_geometry(
        frame({border("a", 2, CornerStyle::Mitered)}), GRID, 10, default_palette());
    const BorderRing& ring = geometry.rings[0];

    ASSERT_EQ(ring.fills.size(), 4u);
    for (const auto& fill : ring.fills) {
        EXPECT_EQ(fill.polygon.size(), 4u);
        EXPECT_DOUBLE_EQ(polygon_area(fill.polygon), (140.0 + 100.0) / 2.0 * 20.0);
    }

    ASSERT_EQ(ring.seams.size(), 4u);
    EXPECT_EQ(ring.seams[0].from, (Vec2{-20, -20}));
    EXPECT_EQ(ring.seams[0].to, (Vec2{0, 0}));
}

TEST(BorderGeometryTest, CornerstoneColors) {
    Palette palette = default_palette();
    BorderSpec with_corner = border("a", 2, CornerStyle::Cornerstone, "feature");
    with_corner.cornerstone_color_role = "accent2";
    BorderSpec without_corner = border("b", 1, CornerStyle::Cornerstone, "accent1");

    BorderGeometry geometry = compute_border_geometry(frame({with_corner, without_corner}), GRID, 10, palette);
    ASSERT_EQ(geometry.rings.size(), 2u);

    auto corner_colors = [](const BorderRing& ring) {
        std::vector<HexColor> colors;
        for (const auto& fill : ring.fills) {
            if (fill.part == BorderPart::Cornerstone) {
                colors.push_back(fill.color);
            }
        }
        return colors;
    };

    // Outermost first: "b" has no cornerstone role and reuses its strip color
    auto outer_corners = corner_colors(geometry.rings[0]);
    ASSERT_EQ(outer_corners.size(), 4u);
    EXPECT_EQ(outer_corners[0], palette.find("accent1")->color);

    auto inner_corners = corner_colors(geometry.rings[1]);
    ASSERT_EQ(inner_corners.size(), 4u);
    EXPECT_EQ(inner_corners[0], palette.find("accent2")->color);
    EXPECT_EQ(geometry.rings[1].fills[0].color, palette.find("feature")->color);
}

TEST(BorderGeometryTest, UnknownRoleIsNeutral) {
    BorderGeometry geometry = compute_border_geometry(
        frame({border("a", 1, CornerStyle::Butted, "missing")}), GRID, 10, default_palette());
    EXPECT_EQ(geometry.rings[0].fills[0].color, std::string(constants::NEUTRAL_COLOR));
}

TEST(BorderGeometryTest, CustomResolver) {
    BorderGeometry geometry = compute_border_geometry(
        frame({border("a", 1)}), GRID, 4,
        [](const ColorRoleId& role) { return role == "feature" ? "#123456" : "#000000"; });
    EXPECT_EQ(geometry.rings[0].fills[0].color, "#123456");
    EXPECT_DOUBLE_EQ(geometry.total_thickness, 4.0);
}
