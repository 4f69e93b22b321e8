#include "block_svg.hpp"
#include <borders/border_geometry.hpp>
#include <bridge/unit_bridge.hpp>
#include <common/logging.hpp>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace quiltblock {

namespace {

constexpr const char* GRID_BACKGROUND = "#FFFFFF";
constexpr const char* GRID_LINE_COLOR = "#E5E7EB";

// Text safe inside a double-quoted XML attribute
std::string escape_attribute(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c; break;
        }
    }
    return out;
}

void write_points(std::ostringstream& ss, const std::vector<Vec2>& points) {
    for (size_t i = 0; i < points.size(); ++i) {
        if (i > 0) ss << " ";
        ss << points[i].x << "," << points[i].y;
    }
}

void write_borders(std::ostringstream& ss, const BorderGeometry& geometry) {
    for (const auto& ring : geometry.rings) {
        ss << "  <g class=\"border\" data-border-id=\"" << escape_attribute(ring.border_id) << "\">\n";
        for (const auto& fill : ring.fills) {
            ss << "    <polygon data-part=\"" << to_string(fill.part) << "\" points=\"";
            write_points(ss, fill.polygon);
            ss << "\" fill=\"" << escape_attribute(fill.color) << "\"/>\n";
        }
        for (const auto& seam : ring.seams) {
            ss << "    <line x1=\"" << seam.from.x << "\" y1=\"" << seam.from.y
               << "\" x2=\"" << seam.to.x << "\" y2=\"" << seam.to.y
               << "\" stroke=\"" << escape_attribute(geometry.seam_color)
               << "\" stroke-width=\"" << geometry.seam_width << "\"/>\n";
        }
        ss << "  </g>\n";
    }

    if (geometry.outline) {
        const Rect& r = geometry.outline->rect;
        ss << "  <rect x=\"" << r.x << "\" y=\"" << r.y << "\" width=\"" << r.width
           << "\" height=\"" << r.height << "\" fill=\"none\" stroke=\""
           << escape_attribute(geometry.outline->color)
           << "\" stroke-width=\"" << geometry.outline->width << "\"/>\n";
    }
}

void write_unit(std::ostringstream& ss, const Unit& unit, const Block& block,
                double cell_size, const UnitRegistry& registry) {
    const double x0 = unit.position.col * cell_size;
    const double y0 = unit.position.row * cell_size;

    ss << "  <g class=\"unit\" data-unit-id=\"" << escape_attribute(unit.id) << "\" data-type=\""
       << type_id(unit_type(unit)) << "\" transform=\"translate(" << x0 << "," << y0 << ")\">\n";
    for (const auto& triangle : get_unit_triangles_with_colors(unit, cell_size, block.preview_palette, {}, registry)) {
        const auto& p = triangle.points;
        ss << "    <polygon points=\"" << p[0] << "," << p[1] << " " << p[2] << "," << p[3]
           << " " << p[4] << "," << p[5] << "\" fill=\"" << escape_attribute(triangle.color) << "\"/>\n";
    }
    ss << "  </g>\n";
}

}  // namespace

std::string block_to_svg(const Block& block, const SvgOptions& options, const UnitRegistry& registry) {
    const double grid_extent = block.grid_size * options.cell_size;
    const Rect grid_rect{0.0, 0.0, grid_extent, grid_extent};

    BorderGeometry borders = compute_border_geometry(
        block.border_config, grid_rect, options.pixels_per_inch, block.preview_palette);

    // Shift everything so the outermost border (and its outline) starts at 0,0
    const double margin = borders.outline ? borders.outline->width : 0.0;
    const double offset = borders.total_thickness + margin;
    const double size = grid_extent + offset * 2.0;

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);

    ss << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << size << "\" height=\"" << size
       << "\" viewBox=\"0 0 " << size << " " << size << "\">\n";
    ss << "<g transform=\"translate(" << offset << "," << offset << ")\">\n";

    write_borders(ss, borders);

    ss << "  <rect x=\"0\" y=\"0\" width=\"" << grid_extent << "\" height=\"" << grid_extent
       << "\" fill=\"" << GRID_BACKGROUND << "\"/>\n";

    if (options.show_grid) {
        for (int i = 1; i < block.grid_size; ++i) {
            const double at = i * options.cell_size;
            ss << "  <line x1=\"" << at << "\" y1=\"0\" x2=\"" << at << "\" y2=\"" << grid_extent
               << "\" stroke=\"" << GRID_LINE_COLOR << "\"/>\n";
            ss << "  <line x1=\"0\" y1=\"" << at << "\" x2=\"" << grid_extent << "\" y2=\"" << at
               << "\" stroke=\"" << GRID_LINE_COLOR << "\"/>\n";
        }
    }

    for (const auto& unit : block.units) {
        write_unit(ss, unit, block, options.cell_size, registry);
    }

    ss << "</g>\n</svg>\n";

    logging::get_logger()->debug("Rendered block {} to SVG: {} units, {} border rings",
                                 block.id, block.units.size(), borders.rings.size());
    return ss.str();
}

}  // namespace quiltblock
