#pragma once

#include "backup/transfer_provider.hpp"
#include "common/http_client.hpp"
#include <memory>
#include <string>

// OneDrive through Microsoft Graph. Uploads always go through an upload
// session so large archives are sent in chunks.
class OneDriveProvider : public TransferProvider {
public:
    // Graph requires chunk sizes that are multiples of 320 KiB.
    static constexpr size_t kChunkSize = 320 * 1024 * 12;

    explicit OneDriveProvider(const std::string& accessToken,
                              const std::string& apiBase = "https://graph.microsoft.com/v1.0");

    ProviderKind getKind() const override { return ProviderKind::OneDrive; }

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
    std::optional<std::string> createUploadSession(const std::string& remotePath);
    std::optional<std::string> uploadChunks(const std::string& localPath, const std::string& uploadUrl);

    std::unique_ptr<HttpClient> http_;
    std::string accessToken_;
    std::string apiBase_;
    std::string accountName_;
    bool authenticated_{false};
    std::string lastError_;
};
