#include "common/http_client.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <cstdio>
#include <mutex>
#include <stdexcept>

namespace {
std::once_flag curlInitFlag;
}

HttpClient::HttpClient()
    : curl_(nullptr) {
    std::call_once(curlInitFlag, [] { curl_global_init(CURL_GLOBAL_ALL); });
    curl_ = curl_easy_init();
    if (!curl_) {
        Logger::error("Failed to initialize CURL");
        throw std::runtime_error("Failed to initialize CURL");
    }
}

HttpClient::~HttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
}

size_t HttpClient::writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t realsize = size * nmemb;
    userp->append(static_cast<char*>(contents), realsize);
    return realsize;
}

size_t HttpClient::headerCallback(char* buffer, size_t size, size_t nitems, std::map<std::string, std::string>* userp) {
    size_t realsize = size * nitems;
    std::string line(buffer, realsize);
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        (*userp)[utils::toLower(utils::trim(line.substr(0, colon)))] = utils::trim(line.substr(colon + 1));
    }
    return realsize;
}

size_t HttpClient::fileWriteCallback(void* contents, size_t size, size_t nmemb, std::FILE* file) {
    return std::fwrite(contents, size, nmemb, file);
}

void HttpClient::applyCommonOptions(struct curl_slist*& headers, bool includeAuth) {
    curl_easy_reset(curl_);
    if (includeAuth && !bearerToken_.empty()) {
        std::string authHeader = "Authorization: Bearer " + bearerToken_;
        headers = curl_slist_append(headers, authHeader.c_str());
    }
    curl_easy_setopt(curl_, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl_, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl_, CURLOPT_TCP_KEEPINTVL, 30L);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    if (timeoutSeconds_ > 0) {
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeoutSeconds_);
    }
}

bool HttpClient::request(const std::string& method,
                         const std::string& url,
                         const std::vector<std::string>& headers,
                         const std::string& body,
                         HttpResponse& response,
                         bool withAuth) {
    response = HttpResponse();
    Logger::debug("Making " + method + " request to: " + url);

    struct curl_slist* headerList = nullptr;
    for (const auto& header : headers) {
        headerList = curl_slist_append(headerList, header.c_str());
    }
    applyCommonOptions(headerList, withAuth);

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headerList);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response.headers);

    if (method == "GET") {
        curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
    } else if (method == "DELETE") {
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, "DELETE");
    } else {
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    CURLcode res = curl_easy_perform(curl_);
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.statusCode);
    curl_slist_free_all(headerList);

    if (res != CURLE_OK) {
        lastError_ = std::string("Request failed: ") + curl_easy_strerror(res);
        Logger::error(lastError_ + " (" + method + " " + url + ")");
        return false;
    }

    Logger::debug("Response code: " + std::to_string(response.statusCode));
    if (!response.ok()) {
        lastError_ = "HTTP " + std::to_string(response.statusCode) + " from " + url + ": " + response.body;
    }
    return true;
}

bool HttpClient::requestJson(const std::string& method,
                             const std::string& url,
                             const nlohmann::json& data,
                             nlohmann::json& response) {
    std::vector<std::string> headers = {"Accept: application/json"};
    std::string body;
    if (!data.is_null()) {
        headers.push_back("Content-Type: application/json");
        body = data.dump();
    }

    HttpResponse raw;
    if (!request(method, url, headers, body, raw)) {
        return false;
    }
    if (!raw.ok()) {
        Logger::error(lastError_);
        return false;
    }

    if (raw.body.empty()) {
        response = nlohmann::json::object();
        return true;
    }
    try {
        response = nlohmann::json::parse(raw.body);
    } catch (const nlohmann::json::exception& e) {
        lastError_ = std::string("Failed to parse response from ") + url + ": " + e.what();
        Logger::error(lastError_);
        return false;
    }
    return true;
}

bool HttpClient::downloadToFile(const std::string& url, const std::string& localPath) {
    std::FILE* file = std::fopen(localPath.c_str(), "wb");
    if (!file) {
        lastError_ = "Failed to open " + localPath + " for writing";
        Logger::error(lastError_);
        return false;
    }

    struct curl_slist* headerList = nullptr;
    applyCommonOptions(headerList, true);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headerList);
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, fileWriteCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, file);

    CURLcode res = curl_easy_perform(curl_);
    long httpCode = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &httpCode);
    curl_slist_free_all(headerList);
    const bool closed = std::fclose(file) == 0;

    if (res != CURLE_OK || httpCode < 200 || httpCode >= 300 || !closed) {
        lastError_ = res != CURLE_OK
            ? std::string("Download failed: ") + curl_easy_strerror(res)
            : "Download of " + url + " failed with HTTP code: " + std::to_string(httpCode);
        Logger::error(lastError_);
        std::remove(localPath.c_str());
        return false;
    }
    return true;
}
