#include <iostream>
#include <string>

#include <cli/cli_common.hpp>
#include <common/logging.hpp>

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options] <job.json>\n";
    std::cerr << "\n";
    std::cerr << "Tracks across bicubic surfaces and bridges ring boundaries with\n";
    std::cerr << "annular bands of Hermite elements.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  track      Track directions and distances across a surface\n";
    std::cerr << "  annulus    Build annulus meshes between pairs of rings\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -o, --output FILE   Output file (default: derived from input)\n";
    std::cerr << "  -v, --verbose       Debug logging\n";
    std::cerr << "  -h, --help          Show help for a command\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  OSTIAMESH_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        print_usage(argv[0]);
        return 0;
    }
    if (command == "track") {
        return ostiamesh::cli::command_track(argc, argv);
    }
    if (command == "annulus") {
        return ostiamesh::cli::command_annulus(argc, argv);
    }

    ostiamesh::logging::get_logger()->error("Unknown command: {}", command);
    print_usage(argv[0]);
    return 1;
}
