#ifndef QUILTBLOCK_BORDERS_BORDER_GEOMETRY_HPP
#define QUILTBLOCK_BORDERS_BORDER_GEOMETRY_HPP

#include <math/vec2.hpp>
#include <model/border.hpp>
#include <model/palette.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace quiltblock {

// Which piece of a border ring a fill represents
enum class BorderPart {
    TopStrip,
    BottomStrip,
    LeftStrip,
    RightStrip,
    Cornerstone,
};

std::string_view to_string(BorderPart part);

// One filled polygon (a rectangle or, for mitered corners, a trapezoid)
struct BorderFill {
    BorderPart part;
    std::vector<Vec2> polygon;
    HexColor color;
};

// Guide line along a seam between pieces
struct SeamLine {
    Vec2 from;
    Vec2 to;
};

// Geometry for one border. The fills cover the annulus between outer and
// inner exactly.
struct BorderRing {
    BorderId border_id;
    CornerStyle corner_style = CornerStyle::Butted;
    Rect outer;
    Rect inner;
    std::vector<BorderFill> fills;
    std::vector<SeamLine> seams;
};

// Unfilled rectangle drawn around the outermost border
struct OutlineStroke {
    Rect rect;
    HexColor color;
    double width = 0.0;
};

struct BorderGeometry {
    std::vector<BorderRing> rings;  // Outermost first
    Rect outer_rect;
    double total_thickness = 0.0;   // Pixels, all borders combined
    std::optional<OutlineStroke> outline;

    HexColor seam_color;
    double seam_width = 0.0;

    bool empty() const { return rings.empty(); }
};

// Maps a color role id to a concrete color
using ColorResolver = std::function<HexColor(const ColorRoleId&)>;

// Nested frame geometry around grid_rect. Widths are in inches and
// scaled by pixels_per_inch. A disabled or empty config yields no rings
// and no outline, with outer_rect equal to grid_rect.
BorderGeometry compute_border_geometry(const BorderConfig& config, const Rect& grid_rect,
                                       double pixels_per_inch, const ColorResolver& resolve);

// Resolves colors through the palette, falling back to neutral gray
BorderGeometry compute_border_geometry(const BorderConfig& config, const Rect& grid_rect,
                                       double pixels_per_inch, const Palette& palette);

}  // namespace quiltblock

#endif // QUILTBLOCK_BORDERS_BORDER_GEOMETRY_HPP
