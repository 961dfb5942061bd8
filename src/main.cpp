#include <csignal>
#include <iostream>

#include <spdlog/spdlog.h>

#include "autostart.hpp"
#include "awtray.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "dirs.hpp"
#include "logging.hpp"
#include "modules_dl.hpp"
#include "registry.hpp"

namespace {
// ─────────────────────────────────────
void OnSignal(int) {
    AwTray::RequestShutdown();
}

// ─────────────────────────────────────
int ListModules(const UserConfig &config) {
    ModuleRegistry registry = DiscoverModules(DefaultSearchDirs(config.defaults.discovery_path));
    for (const auto &name : registry.Names()) {
        std::cout << name << "\t" << registry.Resolve(name) << "\n";
    }
    return 0;
}

// ─────────────────────────────────────
int DownloadAndExit(const UserConfig &config) {
    try {
        DownloadModules(config.defaults.discovery_path);
    } catch (const DownloadError &e) {
        spdlog::error("Module download failed: {}", e.what());
        return 1;
    }
    return 0;
}
} // namespace

int main(int argc, char **argv) {
    CliOptions cli;
    try {
        cli = ParseArgs(argc, argv);
    } catch (const CliError &e) {
        std::cerr << AW_TRAY_NAME << ": " << e.what() << "\n\n" << Usage(argv[0]);
        return 2;
    }

    if (cli.help) {
        std::cout << Usage(argv[0]);
        return 0;
    }
    if (cli.version) {
        std::cout << AW_TRAY_NAME << " " << AW_TRAY_VERSION << "\n";
        return 0;
    }

    try {
        SetupLogging(LogLevelFromEnv(cli.verbose), GetLogPath());

        const auto configPath = cli.config_path.empty() ? GetConfigPath() : cli.config_path;

        if (cli.list_modules || cli.download_modules) {
            const auto [config, firstRun] = Config::LoadOrCreate(configPath);
            return cli.download_modules ? DownloadAndExit(config) : ListModules(config);
        }

        std::signal(SIGINT, OnSignal);
        std::signal(SIGTERM, OnSignal);
        // Writes to a closed socket or pipe must not kill the process
        std::signal(SIGPIPE, SIG_IGN);

        AppOptions options;
        options.port = cli.port;
        options.config_path = configPath;
        options.exec_path = CurrentExecutable(argv[0]);
        options.minimized = cli.minimized;
        options.verbose = cli.verbose;

        AwTray app(std::move(options));
        return app.Run();
    } catch (const ConfigError &e) {
        spdlog::error("{}", e.what());
        return 1;
    } catch (const DirsError &e) {
        spdlog::error("{}", e.what());
        return 1;
    } catch (const std::exception &e) {
        spdlog::critical("Unexpected error: {}", e.what());
        return 1;
    }
}
