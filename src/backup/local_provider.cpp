#include "backup/local_provider.hpp"
#include "backup/conflict_resolver.hpp"
#include "common/file_hash.hpp"
#include "common/logger.hpp"
#include <filesystem>

namespace fs = std::filesystem;

std::optional<uint64_t> LocalTransferProvider::getFreeSpace() {
    const fs::path root = rootPath_.empty() ? fs::current_path() : fs::path(rootPath_);
    std::error_code ec;
    auto info = fs::space(root, ec);
    if (ec) {
        lastError_ = "Failed to query free space of " + root.string() + ": " + ec.message();
        Logger::error(lastError_);
        return std::nullopt;
    }
    return static_cast<uint64_t>(info.available);
}

std::optional<std::string> LocalTransferProvider::upload(const std::string& localPath, const std::string& remoteFolder) {
    try {
        fs::create_directories(remoteFolder);
        rootPath_ = remoteFolder;

        const fs::path initial = fs::path(remoteFolder) / fs::path(localPath).filename();
        auto target = resolveConflict(initial.string(), ConflictPolicy::Rename);
        if (!target) {
            lastError_ = "No target name available in " + remoteFolder;
            return std::nullopt;
        }

        fs::copy_file(localPath, *target);
        Logger::info("Copied " + localPath + " to " + *target);
        return *target;
    } catch (const std::exception& e) {
        lastError_ = std::string("Failed to copy ") + localPath + " to " + remoteFolder + ": " + e.what();
        Logger::error(lastError_);
        return std::nullopt;
    }
}

bool LocalTransferProvider::download(const std::string& remoteId, const std::string& localPath) {
    std::error_code ec;
    const fs::path target(localPath);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
    }
    fs::copy_file(remoteId, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        lastError_ = "Failed to copy " + remoteId + " to " + localPath + ": " + ec.message();
        Logger::error(lastError_);
        return false;
    }
    return true;
}

std::optional<RemoteHash> LocalTransferProvider::getRemoteHash(const std::string& remoteId) {
    auto digest = calculateFileDigest(remoteId, "sha256");
    if (!digest) {
        lastError_ = "Failed to hash " + remoteId;
        return std::nullopt;
    }
    return RemoteHash{"sha256", *digest};
}

bool LocalTransferProvider::deleteRemote(const std::string& remoteId) {
    std::error_code ec;
    if (!fs::remove(remoteId, ec)) {
        lastError_ = "Failed to delete " + remoteId + (ec ? ": " + ec.message() : ": not found");
        Logger::warning(lastError_);
        return false;
    }
    return true;
}
