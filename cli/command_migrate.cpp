#include "cli_common.hpp"
#include <common/logging.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/persistence.hpp>

namespace quiltblock::cli {

// Read a record in any supported layout and write it back in the current one
int command_migrate(int argc, char** argv) {
    auto log = quiltblock::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty()) {
            std::cerr << "Usage: quiltblock migrate <block.json> [-o <migrated.json>]\n";
            return 1;
        }

        std::string output_path = resolve_output_path(ctx.input_path, ".migrated.json", ctx.output_path);
        log->info("Migrating block record: {}", ctx.input_path);

        Block block = deserialize_block_from_storage(json::read_json_file(ctx.input_path));
        json::write_json_file(output_path, block_to_record(block));

        log->info("Wrote migrated record to {}", output_path);
        std::cerr << "Wrote " << output_path << " (" << block.units.size() << " units)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace quiltblock::cli
