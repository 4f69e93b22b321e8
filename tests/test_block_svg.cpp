#include <gtest/gtest.h>
#include <render/block_svg.hpp>
#include "test_helpers.hpp"

using namespace quiltblock;
using namespace quiltblock::test;

namespace {

size_t count_occurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

}  // namespace

TEST(BlockSvgTest, EmptyGrid) {
    std::string svg = block_to_svg(make_block(2));

    EXPECT_EQ(svg.rfind("<svg", 0), 0u);
    EXPECT_NE(svg.find("width=\"120.00\""), std::string::npos);
    EXPECT_NE(svg.find("translate(0.00,0.00)"), std::string::npos);
    // One vertical and one horizontal divider
    EXPECT_EQ(count_occurrences(svg, "#E5E7EB"), 2u);
    EXPECT_EQ(count_occurrences(svg, "class=\"unit\""), 0u);
}

TEST(BlockSvgTest, UnitsUsePaletteColors) {
    Block block = make_block(2, {make_square("s1", 0, 0, "feature"), make_hst("h1", 1, 1)});
    std::string svg = block_to_svg(block);

    EXPECT_EQ(count_occurrences(svg, "class=\"unit\""), 2u);
    EXPECT_NE(svg.find("data-unit-id=\"h1\" data-type=\"hst\" transform=\"translate(60.00,60.00)\""),
              std::string::npos);
    EXPECT_NE(svg.find("fill=\"#1E3A5F\""), std::string::npos);
    // Square as two triangles, HST as two
    EXPECT_EQ(count_occurrences(svg, "<polygon"), 4u);
}

TEST(BlockSvgTest, GridLinesOptional) {
    SvgOptions options;
    options.show_grid = false;
    options.cell_size = 10.0;
    std::string svg = block_to_svg(make_block(3), options);

    EXPECT_EQ(count_occurrences(svg, "#E5E7EB"), 0u);
    EXPECT_NE(svg.find("width=\"30.00\""), std::string::npos);
}

TEST(BlockSvgTest, BordersGrowTheCanvas) {
    Block block = make_block(2, {make_square("s1", 0, 0)});
    block.border_config.enabled = true;
    block.border_config.borders.push_back(BorderSpec{"b1", 2.0, CornerStyle::Butted, "accent1", std::nullopt});

    std::string svg = block_to_svg(block);
    // 2in at 10px/in on each side, plus the 2px outline
    EXPECT_NE(svg.find("width=\"164.00\""), std::string::npos);
    EXPECT_NE(svg.find("translate(22.00,22.00)"), std::string::npos);
    EXPECT_NE(svg.find("data-border-id=\"b1\""), std::string::npos);
    EXPECT_NE(svg.find("fill=\"#8B4513\""), std::string::npos);

    block.border_config.enabled = false;
    EXPECT_EQ(block_to_svg(block).find("data-border-id"), std::string::npos);
}

TEST(BlockSvgTest, AttributeValuesAreEscaped) {
    Block block = make_block(2, {make_square("s1\"&", 0, 0, "feature")});
    block.preview_palette.roles[1].color = "red\"/><script>alert(1)</script><x a=\"";
    block.border_config.enabled = true;
    block.border_config.borders.push_back(BorderSpec{"b'1", 1.0, CornerStyle::Butted, "feature", std::nullopt});

    std::string svg = block_to_svg(block);
    EXPECT_EQ(svg.find("<script>"), std::string::npos);
    EXPECT_NE(svg.find("fill=\"red&quot;/&gt;&lt;script&gt;alert(1)&lt;/script&gt;&lt;x a=&quot;\""),
              std::string::npos);
    EXPECT_NE(svg.find("data-unit-id=\"s1&quot;&amp;\""), std::string::npos);
    EXPECT_NE(svg.find("data-border-id=\"b&apos;1\""), std::string::npos);
}
