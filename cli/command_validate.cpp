#include "cli_common.hpp"
#include <common/logging.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/persistence.hpp>

namespace quiltblock::cli {

int command_validate(int argc, char** argv) {
    auto log = quiltblock::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty()) {
            std::cerr << "Usage: quiltblock validate <block.json> [-o <report.json>]\n";
            return 1;
        }

        log->info("Validating block record: {}", ctx.input_path);

        Block block = deserialize_block_from_storage(json::read_json_file(ctx.input_path));
        PublishValidation result = validate_for_publish(block);

        if (!ctx.output_path.empty()) {
            nlohmann::json report = {
                {"id", block.id},
                {"valid", result.valid},
                {"pieceCount", block.units.size()},
                {"checkedAt", json::get_timestamp()},
            };
            if (result.error) {
                report["error"] = *result.error;
            }
            json::write_json_file(ctx.output_path, report);
            log->info("Wrote report to {}", ctx.output_path);
        }

        if (!result.valid) {
            std::cout << "Not ready to publish: " << result.error.value_or("") << "\n";
            return 1;
        }

        std::cout << "Ready to publish (" << block.units.size() << " units)\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace quiltblock::cli
