#ifndef QUILTBLOCK_RENDER_BLOCK_SVG_HPP
#define QUILTBLOCK_RENDER_BLOCK_SVG_HPP

#include <model/block.hpp>
#include <registry/unit_registry.hpp>
#include <string>

namespace quiltblock {

struct SvgOptions {
    double cell_size = 60.0;        // Pixels per grid cell
    double pixels_per_inch = 10.0;  // Border width scale
    bool show_grid = true;          // Thin lines between empty cells
};

// Standalone SVG document of the block: border rings outermost first,
// then the grid and every unit filled from the preview palette.
std::string block_to_svg(const Block& block, const SvgOptions& options = {},
                         const UnitRegistry& registry = builtin_registry());

}  // namespace quiltblock

#endif // QUILTBLOCK_RENDER_BLOCK_SVG_HPP
