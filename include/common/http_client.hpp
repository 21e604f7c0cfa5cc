#pragma once

#include <string>
#include <vector>
#include <map>
#include <cstdio>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

struct HttpResponse {
    long statusCode{0};
    std::string body;
    std::map<std::string, std::string> headers;   // names lower-cased

    bool ok() const { return statusCode >= 200 && statusCode < 300; }
};

// Thin libcurl wrapper shared by the cloud providers. One instance owns one
// easy handle and must not be used from two threads at once.
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    void setBearerToken(const std::string& token) { bearerToken_ = token; }
    void setTimeoutSeconds(long seconds) { timeoutSeconds_ = seconds; }

    // False only when the transfer itself failed; HTTP error codes are
    // returned in the response for the caller to judge. Pre-authenticated
    // URLs (upload sessions) pass withAuth = false.
    bool request(const std::string& method,
                 const std::string& url,
                 const std::vector<std::string>& headers,
                 const std::string& body,
                 HttpResponse& response,
                 bool withAuth = true);

    // JSON in, JSON out. False on transport errors, non-2xx codes or an unparsable body.
    bool requestJson(const std::string& method,
                     const std::string& url,
                     const nlohmann::json& data,
                     nlohmann::json& response);

    // Streams the response body into localPath. Redirects are followed.
    bool downloadToFile(const std::string& url, const std::string& localPath);

    std::string getLastError() const { return lastError_; }

private:
    void applyCommonOptions(struct curl_slist*& headers, bool includeAuth);
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, std::map<std::string, std::string>* userp);
    static size_t fileWriteCallback(void* contents, size_t size, size_t nmemb, std::FILE* file);

    CURL* curl_;
    std::string bearerToken_;
    long timeoutSeconds_{0};
    std::string lastError_;
};
