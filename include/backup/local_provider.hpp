#pragma once

#include "backup/transfer_provider.hpp"
#include <string>

// Copies archives into a directory on a mounted filesystem. The remote id is
// the path of the copy.
class LocalTransferProvider : public TransferProvider {
public:
    LocalTransferProvider() = default;

    ProviderKind getKind() const override { return ProviderKind::Local; }

    bool authenticate() override { return true; }
    bool isAuthenticated() const override { return true; }
    std::optional<uint64_t> getFreeSpace() override;

    std::optional<std::string> upload(const std::string& localPath, const std::string& remoteFolder) override;
    bool download(const std::string& remoteId, const std::string& localPath) override;
    std::optional<RemoteHash> getRemoteHash(const std::string& remoteId) override;
    bool deleteRemote(const std::string& remoteId) override;

    std::string getDisplayName() const override { return "Local filesystem"; }
    std::string getLastError() const override { return lastError_; }

    // Folder used by getFreeSpace; the last upload folder until set.
    void setRootPath(const std::string& path) { rootPath_ = path; }

private:
    std::string rootPath_;
    std::string lastError_;
};
