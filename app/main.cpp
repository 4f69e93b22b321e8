#include <iostream>
#include <string>

#include <cli/cli_common.hpp>
#include <common/logging.hpp>

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options] <input>\n";
    std::cerr << "\n";
    std::cerr << "Works with stored quilt block and pattern records (JSON).\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  validate   Check that a block is ready to publish\n";
    std::cerr << "  render     Write an SVG of the block and its borders\n";
    std::cerr << "  hashtags   Extract #hashtags from a description\n";
    std::cerr << "  migrate    Rewrite a legacy record in the current format\n";
    std::cerr << "  pattern    Summarize a pattern: grid, finished size, publish check\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -o, --output <path>   Output file\n";
    std::cerr << "  --cell-size <px>      Pixels per grid cell (render, default 60)\n";
    std::cerr << "  --ppi <px>            Pixels per inch of border (render, default 10)\n";
    std::cerr << "  --text <string>       Inline description (hashtags)\n";
    std::cerr << "  -v, --verbose         Debug logging\n";
    std::cerr << "  --log-level <level>   trace, debug, info, warn, error or off\n";
    std::cerr << "  -h, --help            Show this help message\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  QUILTBLOCK_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

int main(int argc, char* argv[]) {
    auto log = quiltblock::logging::get_logger();

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        print_usage(argv[0]);
        return 0;
    }

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-v" || arg == "--verbose") {
            quiltblock::logging::set_level("debug");
        } else if (arg == "--log-level" && i + 1 < argc) {
            if (!quiltblock::logging::set_level(argv[i + 1])) {
                std::cerr << "Unknown log level: " << argv[i + 1] << "\n";
                return 1;
            }
            ++i;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
    }

    log->debug("Running command: {}", command);

    if (command == "validate") {
        return quiltblock::cli::command_validate(argc, argv);
    } else if (command == "render") {
        return quiltblock::cli::command_render(argc, argv);
    } else if (command == "hashtags") {
        return quiltblock::cli::command_hashtags(argc, argv);
    } else if (command == "migrate") {
        return quiltblock::cli::command_migrate(argc, argv);
    } else if (command == "pattern") {
        return quiltblock::cli::command_pattern(argc, argv);
    }

    log->error("Unknown command: {}", command);
    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
