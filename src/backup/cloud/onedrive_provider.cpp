#include "backup/cloud/onedrive_provider.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

using json = nlohmann::json;

namespace {

// Path segments are escaped one by one so the separators survive.
std::string encodePath(const std::string& path) {
    std::stringstream ss(path);
    std::string segment;
    std::string encoded;
    while (std::getline(ss, segment, '/')) {
        if (segment.empty()) {
            continue;
        }
        if (!encoded.empty()) {
            encoded += '/';
        }
        encoded += utils::urlEncode(segment);
    }
    return encoded;
}

} // namespace

OneDriveProvider::OneDriveProvider(const std::string& accessToken, const std::string& apiBase)
    : http_(std::make_unique<HttpClient>())
    , accessToken_(accessToken)
    , apiBase_(apiBase) {
    http_->setBearerToken(accessToken_);
}

bool OneDriveProvider::authenticate() {
    authenticated_ = false;
    if (accessToken_.empty()) {
        lastError_ = "No OneDrive access token configured";
        Logger::error(lastError_);
        return false;
    }

    json drive;
    if (!http_->requestJson("GET", apiBase_ + "/me/drive", nullptr, drive)) {
        lastError_ = "OneDrive authentication failed: " + http_->getLastError();
        Logger::error(lastError_);
        return false;
    }

    const json owner = drive.value("owner", json::object());
    if (owner.contains("user") && owner["user"].is_object()) {
        accountName_ = owner["user"].value("displayName", "");
    }
    authenticated_ = true;
    Logger::info("Authenticated with OneDrive" + (accountName_.empty() ? "" : " as " + accountName_));
    return true;
}

bool OneDriveProvider::ensureAuthenticated() {
    return authenticated_ || authenticate();
}

std::string OneDriveProvider::getDisplayName() const {
    return accountName_.empty() ? "OneDrive" : "OneDrive (" + accountName_ + ")";
}

std::optional<uint64_t> OneDriveProvider::getFreeSpace() {
    if (!ensureAuthenticated()) {
        return std::nullopt;
    }

    json drive;
    if (!http_->requestJson("GET", apiBase_ + "/me/drive?select=quota", nullptr, drive)) {
        lastError_ = "Failed to fetch OneDrive quota: " + http_->getLastError();
        Logger::error(lastError_);
        return std::nullopt;
    }

    const json quota = drive.value("quota", json::object());
    if (!quota.contains("remaining") || !quota["remaining"].is_number()) {
        return std::nullopt;
    }
    return quota["remaining"].get<uint64_t>();
}

std::optional<std::string> OneDriveProvider::createUploadSession(const std::string& remotePath) {
    const json body = {{"item", {{"@microsoft.graph.conflictBehavior", "rename"}}}};
    json session;
    if (!http_->requestJson("POST", apiBase_ + "/me/drive/root:/" + encodePath(remotePath) + ":/createUploadSession",
                            body, session)) {
        lastError_ = "Failed to create upload session for " + remotePath + ": " + http_->getLastError();
        Logger::error(lastError_);
        return std::nullopt;
    }

    std::string uploadUrl = session.value("uploadUrl", "");
    if (uploadUrl.empty()) {
        lastError_ = "Upload session response carried no uploadUrl";
        Logger::error(lastError_);
        return std::nullopt;
    }
    return uploadUrl;
}

std::optional<std::string> OneDriveProvider::uploadChunks(const std::string& localPath, const std::string& uploadUrl) {
    std::ifstream file(localPath, std::ios::binary);
    if (!file.is_open()) {
        lastError_ = "Failed to open " + localPath + " for upload";
        Logger::error(lastError_);
        return std::nullopt;
    }

    const uint64_t totalSize = std::filesystem::file_size(localPath);
    std::vector<char> buffer(kChunkSize);
    uint64_t start = 0;
    HttpResponse response;

    // A zero-byte file still needs one (empty) request to finish the session.
    do {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const uint64_t count = static_cast<uint64_t>(file.gcount());
        const uint64_t end = count > 0 ? start + count - 1 : start;

        const std::vector<std::string> headers = {
            "Content-Length: " + std::to_string(count),
            "Content-Range: bytes " + std::to_string(start) + "-" + std::to_string(end) + "/" + std::to_string(totalSize)
        };

        // The session URL is pre-authenticated; Graph rejects a bearer token on it.
        if (!http_->request("PUT", uploadUrl, headers, std::string(buffer.data(), count), response, false) ||
            !response.ok()) {
            lastError_ = "Chunk upload failed at byte " + std::to_string(start) + ": " + http_->getLastError();
            Logger::error(lastError_);
            return std::nullopt;
        }

        start += count;
        Logger::debug("Uploaded " + std::to_string(start) + "/" + std::to_string(totalSize) + " bytes of " + localPath);
    } while (start < totalSize);

    try {
        std::string id = json::parse(response.body).value("id", "");
        if (id.empty()) {
            lastError_ = "Upload session finished without an item id";
            Logger::error(lastError_);
            return std::nullopt;
        }
        return id;
    } catch (const json::exception& e) {
        lastError_ = std::string("Failed to parse final upload response: ") + e.what();
        Logger::error(lastError_);
        return std::nullopt;
    }
}

std::optional<std::string> OneDriveProvider::upload(const std::string& localPath, const std::string& remoteFolder) {
    if (!ensureAuthenticated()) {
        return std::nullopt;
    }

    const std::string fileName = std::filesystem::path(localPath).filename().string();
    const std::string folder = utils::trim(remoteFolder);
    const std::string remotePath = folder.empty() ? fileName : folder + "/" + fileName;

    Logger::info("Uploading '" + localPath + "' to OneDrive path '" + remotePath + "'");
    auto uploadUrl = createUploadSession(remotePath);
    if (!uploadUrl) {
        return std::nullopt;
    }

    auto id = uploadChunks(localPath, *uploadUrl);
    if (id) {
        Logger::info("Uploaded '" + localPath + "' to OneDrive, item ID: " + *id);
    }
    return id;
}

bool OneDriveProvider::download(const std::string& remoteId, const std::string& localPath) {
    if (!ensureAuthenticated()) {
        return false;
    }
    Logger::info("Downloading OneDrive item " + remoteId + " to " + localPath);
    if (!http_->downloadToFile(apiBase_ + "/me/drive/items/" + utils::urlEncode(remoteId) + "/content", localPath)) {
        lastError_ = http_->getLastError();
        return false;
    }
    return true;
}

std::optional<RemoteHash> OneDriveProvider::getRemoteHash(const std::string& remoteId) {
    if (!ensureAuthenticated()) {
        return std::nullopt;
    }

    json item;
    if (!http_->requestJson("GET", apiBase_ + "/me/drive/items/" + utils::urlEncode(remoteId) + "?select=file",
                            nullptr, item)) {
        lastError_ = "Failed to get remote file hash for ID " + remoteId + ": " + http_->getLastError();
        Logger::error(lastError_);
        return std::nullopt;
    }

    const json hashes = item.value("file", json::object()).value("hashes", json::object());
    std::string sha256 = hashes.value("sha256Hash", "");
    if (!sha256.empty()) {
        return RemoteHash{"sha256", sha256};
    }
    std::string quickXor = hashes.value("quickXorHash", "");
    if (!quickXor.empty()) {
        return RemoteHash{"quickxor", quickXor};
    }
    return std::nullopt;
}

bool OneDriveProvider::deleteRemote(const std::string& remoteId) {
    if (!ensureAuthenticated()) {
        return false;
    }

    HttpResponse response;
    if (!http_->request("DELETE", apiBase_ + "/me/drive/items/" + utils::urlEncode(remoteId), {}, "", response) ||
        !response.ok()) {
        lastError_ = "Failed to delete OneDrive item " + remoteId + ": " + http_->getLastError();
        Logger::error(lastError_);
        return false;
    }
    return true;
}
