#include "backup/cloud/google_drive_provider.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace {
constexpr const char* kFolderMimeType = "application/vnd.google-apps.folder";
constexpr const char* kBoundary = "zipvault_multipart_boundary_7f3c9a";

std::string escapeQueryLiteral(const std::string& value) {
    std::string escaped;
    for (char c : value) {
        if (c == '\'' || c == '\\') {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}
} // namespace

GoogleDriveProvider::GoogleDriveProvider(const std::string& accessToken, const std::string& apiBase)
    : http_(std::make_unique<HttpClient>())
    , accessToken_(accessToken)
    , apiBase_(apiBase) {
    http_->setBearerToken(accessToken_);
}

bool GoogleDriveProvider::authenticate() {
    authenticated_ = false;
    if (accessToken_.empty()) {
        lastError_ = "No Google Drive access token configured";
        Logger::error(lastError_);
        return false;
    }

    json about;
    if (!http_->requestJson("GET", apiBase_ + "/drive/v3/about?fields=user", nullptr, about)) {
        lastError_ = "Google Drive authentication failed: " + http_->getLastError();
        Logger::error(lastError_);
        return false;
    }

    if (about.contains("user") && about["user"].is_object()) {
        accountName_ = about["user"].value("emailAddress", about["user"].value("displayName", ""));
    }
    authenticated_ = true;
    Logger::info("Authenticated with Google Drive" + (accountName_.empty() ? "" : " as " + accountName_));
    return true;
}

bool GoogleDriveProvider::ensureAuthenticated() {
    return authenticated_ || authenticate();
}

std::string GoogleDriveProvider::getDisplayName() const {
    return accountName_.empty() ? "Google Drive" : "Google Drive (" + accountName_ + ")";
}

std::optional<uint64_t> GoogleDriveProvider::getFreeSpace() {
    if (!ensureAuthenticated()) {
        return std::nullopt;
    }

    json about;
    if (!http_->requestJson("GET", apiBase_ + "/drive/v3/about?fields=storageQuota", nullptr, about)) {
        lastError_ = "Failed to fetch Google Drive storage quota: " + http_->getLastError();
        Logger::error(lastError_);
        return std::nullopt;
    }

    const json quota = about.value("storageQuota", json::object());
    // Quota values arrive as decimal strings; no limit means unlimited storage.
    if (!quota.contains("limit")) {
        Logger::info("Google Drive account has no storage limit");
        return std::nullopt;
    }
    try {
        const uint64_t limit = std::stoull(quota["limit"].get<std::string>());
        const uint64_t usage = std::stoull(quota.value("usage", std::string("0")));
        return limit > usage ? limit - usage : 0;
    } catch (const std::exception& e) {
        lastError_ = std::string("Unexpected storage quota format: ") + e.what();
        Logger::error(lastError_);
        return std::nullopt;
    }
}

std::optional<std::string> GoogleDriveProvider::findOrCreateFolder(const std::string& name, const std::string& parentId) {
    std::string query = "mimeType='" + std::string(kFolderMimeType) + "' and name='" +
                        escapeQueryLiteral(name) + "' and trashed=false";
    if (!parentId.empty()) {
        query += " and '" + escapeQueryLiteral(parentId) + "' in parents";
    }

    json listing;
    if (!http_->requestJson("GET", apiBase_ + "/drive/v3/files?fields=files(id,name)&q=" + utils::urlEncode(query),
                            nullptr, listing)) {
        lastError_ = "Failed to look up folder '" + name + "': " + http_->getLastError();
        Logger::error(lastError_);
        return std::nullopt;
    }

    const json files = listing.value("files", json::array());
    if (!files.empty()) {
        std::string id = files[0].value("id", "");
        Logger::debug("Found Google Drive folder '" + name + "' with ID: " + id);
        return id;
    }

    Logger::info("Google Drive folder '" + name + "' not found, creating it");
    json metadata = {{"name", name}, {"mimeType", kFolderMimeType}};
    if (!parentId.empty()) {
        metadata["parents"] = json::array({parentId});
    }
    json created;
    if (!http_->requestJson("POST", apiBase_ + "/drive/v3/files?fields=id", metadata, created)) {
        lastError_ = "Failed to create folder '" + name + "': " + http_->getLastError();
        Logger::error(lastError_);
        return std::nullopt;
    }
    return created.value("id", "");
}

// "Backups/laptop" becomes two nested folders. An empty path is My Drive itself.
std::optional<std::string> GoogleDriveProvider::resolveFolderPath(const std::string& folderPath) {
    std::string parentId;
    std::stringstream ss(folderPath);
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        segment = utils::trim(segment);
        if (segment.empty()) {
            continue;
        }
        auto id = findOrCreateFolder(segment, parentId);
        if (!id || id->empty()) {
            return std::nullopt;
        }
        parentId = *id;
    }
    return parentId;
}

std::optional<std::string> GoogleDriveProvider::upload(const std::string& localPath, const std::string& remoteFolder) {
    if (!ensureAuthenticated()) {
        return std::nullopt;
    }

    auto folderId = resolveFolderPath(remoteFolder);
    if (!folderId) {
        return std::nullopt;
    }

    std::ifstream file(localPath, std::ios::binary);
    if (!file.is_open()) {
        lastError_ = "Failed to open " + localPath + " for upload";
        Logger::error(lastError_);
        return std::nullopt;
    }
    std::stringstream content;
    content << file.rdbuf();

    json metadata = {{"name", std::filesystem::path(localPath).filename().string()}};
    if (!folderId->empty()) {
        metadata["parents"] = json::array({*folderId});
    }

    std::string body;
    body += std::string("--") + kBoundary + "\r\n";
    body += "Content-Type: application/json; charset=UTF-8\r\n\r\n";
    body += metadata.dump() + "\r\n";
    body += std::string("--") + kBoundary + "\r\n";
    body += "Content-Type: application/zip\r\n\r\n";
    body += content.str();
    body += std::string("\r\n--") + kBoundary + "--\r\n";

    Logger::info("Starting multipart upload of '" + localPath + "' to folder '" + remoteFolder + "'");
    HttpResponse response;
    const std::vector<std::string> headers = {
        std::string("Content-Type: multipart/related; boundary=") + kBoundary,
        "Accept: application/json"
    };
    if (!http_->request("POST", apiBase_ + "/upload/drive/v3/files?uploadType=multipart&fields=id",
                        headers, body, response)) {
        lastError_ = "Upload failed: " + http_->getLastError();
        return std::nullopt;
    }
    if (!response.ok()) {
        lastError_ = "Upload failed: " + http_->getLastError();
        Logger::error(lastError_);
        return std::nullopt;
    }

    try {
        std::string id = json::parse(response.body).value("id", "");
        if (id.empty()) {
            lastError_ = "Upload response carried no file id";
            Logger::error(lastError_);
            return std::nullopt;
        }
        Logger::info("Uploaded '" + localPath + "' to Google Drive, file ID: " + id);
        return id;
    } catch (const json::exception& e) {
        lastError_ = std::string("Failed to parse upload response: ") + e.what();
        Logger::error(lastError_);
        return std::nullopt;
    }
}

bool GoogleDriveProvider::download(const std::string& remoteId, const std::string& localPath) {
    if (!ensureAuthenticated()) {
        return false;
    }
    Logger::info("Downloading Google Drive file " + remoteId + " to " + localPath);
    if (!http_->downloadToFile(apiBase_ + "/drive/v3/files/" + utils::urlEncode(remoteId) + "?alt=media", localPath)) {
        lastError_ = http_->getLastError();
        return false;
    }
    return true;
}

std::optional<RemoteHash> GoogleDriveProvider::getRemoteHash(const std::string& remoteId) {
    if (!ensureAuthenticated()) {
        return std::nullopt;
    }

    json metadata;
    if (!http_->requestJson("GET", apiBase_ + "/drive/v3/files/" + utils::urlEncode(remoteId) + "?fields=md5Checksum",
                            nullptr, metadata)) {
        lastError_ = "Failed to get remote file hash for ID " + remoteId + ": " + http_->getLastError();
        Logger::error(lastError_);
        return std::nullopt;
    }

    std::string md5 = metadata.value("md5Checksum", "");
    if (md5.empty()) {
        return std::nullopt;
    }
    return RemoteHash{"md5", md5};
}

bool GoogleDriveProvider::deleteRemote(const std::string& remoteId) {
    if (!ensureAuthenticated()) {
        return false;
    }

    HttpResponse response;
    if (!http_->request("DELETE", apiBase_ + "/drive/v3/files/" + utils::urlEncode(remoteId), {}, "", response) ||
        !response.ok()) {
        lastError_ = "Failed to delete Google Drive file " + remoteId + ": " + http_->getLastError();
        Logger::error(lastError_);
        return false;
    }
    return true;
}
