#include "backup/backup_cli.hpp"
#include "common/logger.hpp"
#include "common/orchestration_context.hpp"
#include "common/settings.hpp"
#include "storage/job_store.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr const char* kVersion = "1.0.0";

std::string defaultConfigPath() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return (fs::path(home) / ".zipvault" / "settings.json").string();
    }
    return "zipvault_settings.json";
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    // Check for help and version flags first, before any initialization
    if (!args.empty() && (args[0] == "--help" || args[0] == "-h")) {
        BackupCLI::printUsage();
        return 0;
    }
    if (!args.empty() && (args[0] == "--version" || args[0] == "-v")) {
        std::cout << "ZipVault version " << kVersion << "\n";
        return 0;
    }

    std::string configPath = defaultConfigPath();
    if (!args.empty() && args[0] == "--config") {
        if (args.size() < 2) {
            std::cerr << "Error: --config needs a file path\n";
            BackupCLI::printUsage();
            return 1;
        }
        configPath = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty()) {
        std::cerr << "Error: No command specified\n";
        BackupCLI::printUsage();
        return 1;
    }

    Settings settings;
    const bool loaded = settings.load(configPath);

    const std::string logPath = settings.getString(settings_keys::kLogPath).value_or("/tmp/zipvault.log");
    const LogLevel level = Logger::parseLevel(settings.getString(settings_keys::kLogLevel).value_or("info"));
    if (!Logger::initialize(logPath, level)) {
        std::cerr << "Failed to initialize logger at " << logPath << std::endl;
        return 1;
    }
    if (!loaded) {
        Logger::info("Using default settings; " + configPath + " was not loaded");
    }

    const std::string storePath = settings.getString(settings_keys::kStorePath)
        .value_or((fs::path(configPath).parent_path() / "store.json").string());

    int status = 1;
    try {
        JsonJobStore store(storePath);
        OrchestrationContext context(store, settings);
        BackupCLI cli(context);
        status = cli.run(args);
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        Logger::error("Error in main: " + std::string(e.what()));
        status = 1;
    }

    Logger::shutdown();
    return status;
}
