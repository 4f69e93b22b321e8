#include "cli_common.hpp"
#include <common/logging.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/persistence.hpp>

namespace quiltblock::cli {

int command_hashtags(int argc, char** argv) {
    auto log = quiltblock::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty() && !ctx.text) {
            std::cerr << "Usage: quiltblock hashtags (<description.txt> | --text \"...\")\n";
            return 1;
        }

        std::string text = ctx.text ? *ctx.text : json::read_text_file(ctx.input_path);
        std::vector<std::string> tags = extract_hashtags(text);
        log->debug("Found {} hashtags in {} characters", tags.size(), text.size());

        nlohmann::json out = tags;
        if (ctx.output_path.empty()) {
            std::cout << out.dump() << "\n";
        } else {
            json::write_json_file(ctx.output_path, out);
            log->info("Wrote {} hashtags to {}", tags.size(), ctx.output_path);
        }

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace quiltblock::cli
