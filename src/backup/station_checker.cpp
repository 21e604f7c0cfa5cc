#include "backup/station_checker.hpp"
#include "backup/transfer_provider.hpp"
#include "backup/zip_archiver.hpp"
#include "common/logger.hpp"
#include "common/orchestration_context.hpp"
#include "storage/job_store.hpp"
#include <filesystem>
#include <fstream>
#include <optional>

namespace fs = std::filesystem;

namespace {

bool writeScratchFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        Logger::error("Failed to create scratch file " + path.string());
        return false;
    }
    out << content;
    return out.good();
}

void removeIfPresent(const fs::path& path) {
    std::error_code ec;
    if (fs::remove(path, ec)) {
        Logger::debug("Cleaned up " + path.string());
    } else if (ec) {
        Logger::warning("Failed to clean up " + path.string() + ": " + ec.message());
    }
}

} // namespace

namespace station_checker {

bool checkPacking(Packager& packager, const std::string& tempDir) {
    Logger::info("Running packing station check...");
    const fs::path testFile = fs::path(tempDir) / "packing_test_file.txt";
    std::optional<std::string> archivePath;
    bool ok = false;

    try {
        fs::create_directories(tempDir);
        if (writeScratchFile(testFile, "This is a test.")) {
            PackResult result = packager.pack(testFile.string(), tempDir, ConflictPolicy::Overwrite,
                                              makeCancellationToken());
            archivePath = result.archivePath;
            if (!archivePath || !fs::exists(*archivePath)) {
                Logger::error("Packing station check failed: archive was not created");
            } else {
                ok = true;
            }
        }
    } catch (const std::exception& e) {
        Logger::error(std::string("Packing station check failed: ") + e.what());
    }

    removeIfPresent(testFile);
    if (archivePath) {
        removeIfPresent(*archivePath);
    }

    if (ok) {
        Logger::info("Packing station check successful");
    }
    return ok;
}

bool checkShipping(OrchestrationContext& context, const std::string& tempDir) {
    Logger::info("Running shipping station check...");

    std::vector<DestinationRef> cloudDestinations;
    try {
        for (const auto& destination : context.getStore().listDestinations()) {
            if (isCloudProvider(destination.provider)) {
                cloudDestinations.push_back(destination);
            }
        }
    } catch (const std::exception& e) {
        Logger::error(std::string("Could not read destinations: ") + e.what());
        return false;
    }

    if (cloudDestinations.empty()) {
        Logger::info("No cloud destinations configured; shipping check skipped");
        return true;
    }

    const fs::path testFile = fs::path(tempDir) / "shipping_test_file.txt";
    bool ok = true;
    try {
        fs::create_directories(tempDir);
        if (!writeScratchFile(testFile, "This is a shipping test file.")) {
            return false;
        }

        for (const auto& destination : cloudDestinations) {
            Logger::info("Testing destination '" + destination.name + "' (" + providerTag(destination.provider) + ")");
            auto provider = context.createProvider(destination.provider);
            if (!provider) {
                Logger::error("No provider available for destination '" + destination.name + "'");
                ok = false;
                break;
            }
            if (!provider->isAuthenticated() && !provider->authenticate()) {
                Logger::error("Authentication with '" + destination.name + "' failed: " + provider->getLastError());
                ok = false;
                break;
            }

            auto remoteId = provider->upload(testFile.string(), destination.location);
            if (!remoteId) {
                Logger::error("Upload to '" + destination.name + "' failed: " + provider->getLastError());
                ok = false;
                break;
            }
            Logger::info("Upload to '" + destination.name + "' successful, file ID: " + *remoteId);

            if (!provider->deleteRemote(*remoteId)) {
                Logger::warning("Failed to delete remote test file '" + *remoteId + "' from '" +
                                destination.name + "'. Manual cleanup may be required.");
            }
        }
    } catch (const std::exception& e) {
        Logger::error(std::string("Shipping station check failed: ") + e.what());
        ok = false;
    }

    removeIfPresent(testFile);
    if (ok) {
        Logger::info("Shipping station check successful for all destinations");
    }
    return ok;
}

} // namespace station_checker
