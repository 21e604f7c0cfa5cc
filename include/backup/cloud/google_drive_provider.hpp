#pragma once

#include "backup/transfer_provider.hpp"
#include "common/http_client.hpp"
#include <memory>
#include <string>

// Google Drive v3 REST. Archives land in a folder path below My Drive,
// created on demand.
class GoogleDriveProvider : public TransferProvider {
public:
    explicit GoogleDriveProvider(const std::string& accessToken,
                                 const std::string& apiBase = "https://www.googleapis.com");

    ProviderKind getKind() const override { return ProviderKind::GoogleDrive; }

    bool authenticate() override;
    bool isAuthenticated() const override { return authenticated_; }
    std::optional<uint64_t> getFreeSpace() override;

    std::optional<std::string> upload(const std::string& localPath, const std::string& remoteFolder) override;
    bool download(const std::string& remoteId, const std::string& localPath) override;
    std::optional<RemoteHash> getRemoteHash(const std::string& remoteId) override;
    bool deleteRemote(const std::string& remoteId) override;

    std::string getDisplayName() const override;
    std::string getLastError() const override { return lastError_; }

private:
    bool ensureAuthenticated();
    std::optional<std::string> findOrCreateFolder(const std::string& name, const std::string& parentId);
    std::optional<std::string> resolveFolderPath(const std::string& folderPath);

    std::unique_ptr<HttpClient> http_;
    std::string accessToken_;
    std::string apiBase_;
    std::string accountName_;
    bool authenticated_{false};
    std::string lastError_;
};
