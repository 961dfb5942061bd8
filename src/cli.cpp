#include "cli.hpp"

#include <cstring>

namespace {
// ─────────────────────────────────────
uint16_t ParsePort(const std::string &value) {
    std::size_t used = 0;
    long port = 0;
    try {
        port = std::stol(value, &used);
    } catch (const std::exception &) {
        throw CliError("invalid port: " + value);
    }
    if (used != value.size() || port < 1 || port > 65535) {
        throw CliError("invalid port: " + value);
    }
    return static_cast<uint16_t>(port);
}
} // namespace

// ─────────────────────────────────────
CliOptions ParseArgs(int argc, const char *const *argv) {
    CliOptions options;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](const char *name) -> std::string {
            if (i + 1 >= argc) {
                throw CliError(std::string("missing value for ") + name);
            }
            return argv[++i];
        };

        if (arg == "--port") {
            options.port = ParsePort(value("--port"));
        } else if (arg.rfind("--port=", 0) == 0) {
            options.port = ParsePort(arg.substr(std::strlen("--port=")));
        } else if (arg == "--config") {
            options.config_path = value("--config");
        } else if (arg.rfind("--config=", 0) == 0) {
            options.config_path = arg.substr(std::strlen("--config="));
        } else if (arg == "--minimized") {
            options.minimized = true;
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (arg == "--download-modules") {
            options.download_modules = true;
        } else if (arg == "--list-modules") {
            options.list_modules = true;
        } else if (arg == "--version") {
            options.version = true;
        } else if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else {
            throw CliError("unknown option: " + arg);
        }
    }
    return options;
}

// ─────────────────────────────────────
std::string Usage(const std::string &program) {
    return "Usage: " + program +
           " [options]\n"
           "\n"
           "Tray shell that starts and supervises ActivityWatch watchers.\n"
           "\n"
           "Options:\n"
           "  --port <n>          Port of the ActivityWatch server (overrides config)\n"
           "  --config <path>     Config file to use\n"
           "  --minimized         Do not open the dashboard on start\n"
           "  -v, --verbose       Debug logging\n"
           "  --download-modules  Download the watchers for this system and exit\n"
           "  --list-modules      Print the discovered watchers and exit\n"
           "  --version           Print the version and exit\n"
           "  -h, --help          Show this help\n";
}
