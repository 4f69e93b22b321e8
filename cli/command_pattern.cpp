#include "cli_common.hpp"
#include <common/logging.hpp>
#include <designer/pattern_designer.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/persistence.hpp>

namespace quiltblock::cli {

int command_pattern(int argc, char** argv) {
    auto log = quiltblock::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty()) {
            std::cerr << "Usage: quiltblock pattern <pattern.json> [-o <summary.json>]\n";
            return 1;
        }

        log->info("Reading pattern record: {}", ctx.input_path);

        PatternDesigner designer;
        designer.load_pattern(deserialize_pattern_from_storage(json::read_json_file(ctx.input_path)));
        const Pattern& pattern = designer.pattern();

        const PhysicalSize finished = designer.final_quilt_size();
        const PublishValidation publish = validate_pattern_for_publish(pattern);

        if (designer.is_grid_large()) {
            log->warn("Grid is {}x{}; patterns above {} blocks per side are slow to edit",
                      pattern.grid_size.rows, pattern.grid_size.cols, constants::GRID_SIZE_WARNING_THRESHOLD);
        }

        if (!ctx.output_path.empty()) {
            nlohmann::json summary = {
                {"id", pattern.id},
                {"rows", pattern.grid_size.rows},
                {"cols", pattern.grid_size.cols},
                {"blockCount", pattern.block_instances.size()},
                {"emptySlots", designer.empty_slot_count()},
                {"finishedWidthInches", finished.width_inches},
                {"finishedHeightInches", finished.height_inches},
                {"publishable", publish.valid},
                {"checkedAt", json::get_timestamp()},
            };
            if (publish.error) {
                summary["error"] = *publish.error;
            }
            json::write_json_file(ctx.output_path, summary);
            log->info("Wrote summary to {}", ctx.output_path);
        }

        std::cout << pattern.grid_size.rows << "x" << pattern.grid_size.cols << " grid, "
                  << pattern.block_instances.size() << " blocks placed, "
                  << designer.empty_slot_count() << " empty\n";
        std::cout << "Finished size: " << finished.width_inches << "\" x " << finished.height_inches << "\"\n";
        if (publish.valid) {
            std::cout << "Ready to publish\n";
        } else {
            std::cout << "Not ready to publish: " << publish.error.value_or("") << "\n";
        }
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace quiltblock::cli
