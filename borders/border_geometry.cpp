#include "border_geometry.hpp"
#include <bridge/unit_bridge.hpp>
#include <common/logging.hpp>
#include <model/constants.hpp>

namespace quiltblock {

namespace {

std::vector<Vec2> rect_polygon(double x, double y, double width, double height) {
    return Rect{x, y, width, height}.corners();
}

// Top and bottom run the full outer width; sides fill between them
void emit_butted(BorderRing& ring, double w, const HexColor& color) {
    const Rect& o = ring.outer;
    const Rect& i = ring.inner;

    ring.fills.push_back({BorderPart::TopStrip, rect_polygon(o.x, o.y, o.width, w), color});
    ring.fills.push_back({BorderPart::BottomStrip, rect_polygon(o.x, o.bottom() - w, o.width, w), color});
    ring.fills.push_back({BorderPart::LeftStrip, rect_polygon(o.x, o.y + w, w, o.height - w * 2.0), color});
    ring.fills.push_back({BorderPart::RightStrip, rect_polygon(o.right() - w, o.y + w, w, o.height - w * 2.0), color});

    ring.seams = {
        {{o.x, i.y}, {i.x, i.y}},
        {{i.right(), i.y}, {o.right(), i.y}},
        {{o.x, i.bottom()}, {i.x, i.bottom()}},
        {{i.right(), i.bottom()}, {o.right(), i.bottom()}},
    };
}

// Four corner squares in the cornerstone color, strips between them
void emit_cornerstone(BorderRing& ring, double w, const HexColor& color, const HexColor& corner_color) {
    const Rect& o = ring.outer;
    const Rect& i = ring.inner;

    ring.fills.push_back({BorderPart::TopStrip, rect_polygon(o.x + w, o.y, o.width - w * 2.0, w), color});
    ring.fills.push_back({BorderPart::BottomStrip, rect_polygon(o.x + w, o.bottom() - w, o.width - w * 2.0, w), color});
    ring.fills.push_back({BorderPart::LeftStrip, rect_polygon(o.x, o.y + w, w, o.height - w * 2.0), color});
    ring.fills.push_back({BorderPart::RightStrip, rect_polygon(o.right() - w, o.y + w, w, o.height - w * 2.0), color});

    ring.fills.push_back({BorderPart::Cornerstone, rect_polygon(o.x, o.y, w, w), corner_color});
    ring.fills.push_back({BorderPart::Cornerstone, rect_polygon(o.right() - w, o.y, w, w), corner_color});
    ring.fills.push_back({BorderPart::Cornerstone, rect_polygon(o.x, o.bottom() - w, w, w), corner_color});
    ring.fills.push_back({BorderPart::Cornerstone, rect_polygon(o.right() - w, o.bottom() - w, w, w), corner_color});

    ring.seams = {
        {{i.x, o.y}, {i.x, i.y}},
        {{o.x, i.y}, {i.x, i.y}},
        {{i.right(), o.y}, {i.right(), i.y}},
        {{i.right(), i.y}, {o.right(), i.y}},
        {{i.x, i.bottom()}, {i.x, o.bottom()}},
        {{o.x, i.bottom()}, {i.x, i.bottom()}},
        {{i.right(), i.bottom()}, {i.right(), o.bottom()}},
        {{i.right(), i.bottom()}, {o.right(), i.bottom()}},
    };
}

// Trapezoids meeting along the corner diagonals
void emit_mitered(BorderRing& ring, const HexColor& color) {
    const Rect& o = ring.outer;
    const Rect& i = ring.inner;

    const Vec2 o_tl{o.x, o.y}, o_tr{o.right(), o.y}, o_br{o.right(), o.bottom()}, o_bl{o.x, o.bottom()};
    const Vec2 i_tl{i.x, i.y}, i_tr{i.right(), i.y}, i_br{i.right(), i.bottom()}, i_bl{i.x, i.bottom()};

    ring.fills.push_back({BorderPart::TopStrip, {o_tl, o_tr, i_tr, i_tl}, color});
    ring.fills.push_back({BorderPart::BottomStrip, {i_bl, i_br, o_br, o_bl}, color});
    ring.fills.push_back({BorderPart::LeftStrip, {o_tl, i_tl, i_bl, o_bl}, color});
    ring.fills.push_back({BorderPart::RightStrip, {i_tr, o_tr, o_br, i_br}, color});

    ring.seams = {
        {o_tl, i_tl},
        {o_tr, i_tr},
        {o_bl, i_bl},
        {o_br, i_br},
    };
}

}  // namespace

std::string_view to_string(BorderPart part) {
    switch (part) {
        case BorderPart::TopStrip: return "top";
        case BorderPart::BottomStrip: return "bottom";
        case BorderPart::LeftStrip: return "left";
        case BorderPart::RightStrip: return "right";
        case BorderPart::Cornerstone: return "cornerstone";
    }
    return "top";
}

BorderGeometry compute_border_geometry(const BorderConfig& config, const Rect& grid_rect,
                                       double pixels_per_inch, const ColorResolver& resolve) {
    BorderGeometry geometry;
    geometry.outer_rect = grid_rect;
    geometry.seam_color = HexColor(constants::BORDER_SEAM_COLOR);
    geometry.seam_width = constants::BORDER_SEAM_WIDTH;

    if (!config.enabled || config.borders.empty()) {
        return geometry;
    }

    for (const auto& border : config.borders) {
        geometry.total_thickness += border.width_inches * pixels_per_inch;
    }
    geometry.outer_rect = grid_rect.expanded(geometry.total_thickness);

    auto log = logging::get_logger();
    log->debug("Border frame: {} borders, {:.1f}px total thickness",
               config.borders.size(), geometry.total_thickness);

    // Walk outermost to innermost, shrinking the working rectangle
    Rect current = geometry.outer_rect;
    for (auto it = config.borders.rbegin(); it != config.borders.rend(); ++it) {
        const BorderSpec& border = *it;
        const double w = border.width_inches * pixels_per_inch;

        BorderRing ring;
        ring.border_id = border.id;
        ring.corner_style = border.corner_style;
        ring.outer = current;
        ring.inner = current.inset(w);

        const HexColor color = resolve(border.color_role);

        switch (border.corner_style) {
            case CornerStyle::Butted:
                emit_butted(ring, w, color);
                break;
            case CornerStyle::Cornerstone: {
                HexColor corner_color = border.cornerstone_color_role
                    ? resolve(*border.cornerstone_color_role)
                    : color;
                emit_cornerstone(ring, w, color, corner_color);
                break;
            }
            case CornerStyle::Mitered:
                emit_mitered(ring, color);
                break;
        }

        current = ring.inner;
        geometry.rings.push_back(std::move(ring));
    }

    geometry.outline = OutlineStroke{
        geometry.outer_rect,
        HexColor(constants::BORDER_OUTLINE_COLOR),
        constants::BORDER_OUTLINE_WIDTH,
    };

    return geometry;
}

BorderGeometry compute_border_geometry(const BorderConfig& config, const Rect& grid_rect,
                                       double pixels_per_inch, const Palette& palette) {
    return compute_border_geometry(config, grid_rect, pixels_per_inch,
                                   [&palette](const ColorRoleId& role_id) {
                                       return resolve_color(role_id, palette);
                                   });
}

}  // namespace quiltblock
