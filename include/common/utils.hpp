#pragma once

#include <string>
#include <cstdint>
#include <cstdio>
#include <algorithm>
#include <cctype>
#include <curl/curl.h>

namespace utils {

inline std::string urlEncode(const std::string& str) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return str;
    }

    char* encoded = curl_easy_escape(curl, str.c_str(), static_cast<int>(str.length()));
    std::string result = encoded ? std::string(encoded) : str;
    curl_free(encoded);
    curl_easy_cleanup(curl);
    return result;
}

inline std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

inline std::string trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    auto first = str.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    auto last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

inline bool iequals(const std::string& a, const std::string& b) {
    return toLower(a) == toLower(b);
}

inline bool startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

// Human readable size, e.g. "1.5 KB". Negative sizes mean unknown.
inline std::string formatSize(int64_t sizeBytes) {
    if (sizeBytes < 0) {
        return "N/A";
    }

    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(sizeBytes);
    char buffer[32];
    for (const char* unit : units) {
        if (size < 1024.0) {
            std::snprintf(buffer, sizeof(buffer), "%.1f %s", size, unit);
            return buffer;
        }
        size /= 1024.0;
    }
    std::snprintf(buffer, sizeof(buffer), "%.1f PB", size);
    return buffer;
}

} // namespace utils
