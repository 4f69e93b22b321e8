#include "cli_common.hpp"
#include <common/logging.hpp>
#include <render/block_svg.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/persistence.hpp>

namespace quiltblock::cli {

int command_render(int argc, char** argv) {
    auto log = quiltblock::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty()) {
            std::cerr << "Usage: quiltblock render <block.json> [-o <block.svg>] [--cell-size N] [--ppi N]\n";
            return 1;
        }

        std::string output_path = resolve_output_path(ctx.input_path, ".svg", ctx.output_path);
        log->info("Rendering block: {}", ctx.input_path);

        Block block = deserialize_block_from_storage(json::read_json_file(ctx.input_path));

        SvgOptions options;
        options.cell_size = ctx.cell_size;
        options.pixels_per_inch = ctx.pixels_per_inch;
        std::string svg = block_to_svg(block, options);

        json::write_text_file(output_path, svg);

        log->info("Wrote SVG to {}", output_path);
        std::cerr << "Wrote " << output_path << " ("
                  << block.units.size() << " units, "
                  << block.border_config.borders.size() << " borders)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace quiltblock::cli
