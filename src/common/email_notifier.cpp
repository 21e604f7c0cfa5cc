#include "common/email_notifier.hpp"
#include "common/logger.hpp"
#include "common/settings.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <curl/curl.h>

namespace {

struct UploadCursor {
    const std::string* data;
    size_t offset;
};

size_t readCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* cursor = static_cast<UploadCursor*>(userp);
    const size_t room = size * nitems;
    const size_t remaining = cursor->data->size() - cursor->offset;
    const size_t count = std::min(room, remaining);
    std::memcpy(buffer, cursor->data->data() + cursor->offset, count);
    cursor->offset += count;
    return count;
}

std::string baseName(const std::string& entryName) {
    std::string name = std::filesystem::path(entryName).filename().string();
    return name.empty() ? entryName : name;
}

} // namespace

SmtpEmailNotifier::SmtpEmailNotifier(const Settings& settings)
    : settings_(settings) {
}

std::string SmtpEmailNotifier::buildMessage(const std::string& from,
                                            const std::string& to,
                                            const std::string& subject,
                                            const std::string& body) {
    char date[64];
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    std::strftime(date, sizeof(date), "%a, %d %b %Y %H:%M:%S +0000", &tm);

    // SMTP wants CRLF line endings throughout.
    std::string normalized;
    for (size_t i = 0; i < body.size(); ++i) {
        if (body[i] == '\n' && (i == 0 || body[i - 1] != '\r')) {
            normalized += '\r';
        }
        normalized += body[i];
    }

    std::string message;
    message += "Date: " + std::string(date) + "\r\n";
    message += "To: " + to + "\r\n";
    message += "From: " + from + "\r\n";
    message += "Subject: " + subject + "\r\n";
    message += "MIME-Version: 1.0\r\n";
    message += "Content-Type: text/plain; charset=UTF-8\r\n";
    message += "\r\n";
    message += normalized + "\r\n";
    return message;
}

bool SmtpEmailNotifier::notify(const std::string& subject, const std::string& body, const std::string& recipient) {
    const auto url = settings_.getString(settings_keys::kSmtpUrl);
    const auto from = settings_.getString(settings_keys::kSmtpFrom);
    if (!url || !from || recipient.empty()) {
        lastError_ = "Missing SMTP configuration (smtp_url, smtp_from) or recipient; cannot send email";
        Logger::error(lastError_);
        return false;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        lastError_ = "Failed to initialize CURL for email";
        Logger::error(lastError_);
        return false;
    }

    const std::string message = buildMessage(*from, recipient, subject, body);
    UploadCursor cursor{&message, 0};
    const std::string mailFrom = "<" + *from + ">";
    const std::string mailTo = "<" + recipient + ">";
    struct curl_slist* recipients = curl_slist_append(nullptr, mailTo.c_str());

    curl_easy_setopt(curl, CURLOPT_URL, url->c_str());
    curl_easy_setopt(curl, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_TRY));
    if (auto user = settings_.getString(settings_keys::kSmtpUsername)) {
        curl_easy_setopt(curl, CURLOPT_USERNAME, user->c_str());
    }
    const auto password = settings_.getString(settings_keys::kSmtpPassword);
    if (password) {
        curl_easy_setopt(curl, CURLOPT_PASSWORD, password->c_str());
    }
    curl_easy_setopt(curl, CURLOPT_MAIL_FROM, mailFrom.c_str());
    curl_easy_setopt(curl, CURLOPT_MAIL_RCPT, recipients);
    curl_easy_setopt(curl, CURLOPT_READFUNCTION, readCallback);
    curl_easy_setopt(curl, CURLOPT_READDATA, &cursor);
    curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(recipients);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        lastError_ = "Failed to send email to " + recipient + ": " + curl_easy_strerror(res);
        Logger::error(lastError_);
        return false;
    }

    Logger::info("Email sent successfully to " + recipient);
    return true;
}

std::string formatBackupSubject(const std::string& jobName, const std::string& status) {
    return "Job '" + jobName + "' Completion Status: " + status;
}

std::string formatBackupBody(const BackupSummary& summary) {
    char totalMb[64];
    std::snprintf(totalMb, sizeof(totalMb), "%.2f", static_cast<double>(summary.totalBytes) / 1024.0 / 1024.0);

    std::string body = "The job '" + summary.jobName + "' finished with status: " + summary.status + ".\n\n" +
                       "Final message: " + summary.message + "\n\n" +
                       "Files processed: " + std::to_string(summary.fileCount) + "\n" +
                       "Total size: " + totalMb + " MB";

    if (!summary.files.empty()) {
        body += "\n\nFiles in archive:\n";
        for (const auto& file : summary.files) {
            body += "- " + baseName(file.first) + " (" + utils::formatSize(file.second) + ")\n";
        }
    }
    return body;
}

std::string formatRestoreSubject(const std::string& jobName, const std::string& status) {
    return "Restore Job '" + jobName + "' Completion Status: " + status;
}

std::string formatRestoreBody(const std::string& jobName,
                              const std::string& status,
                              const std::vector<std::string>& restoredEntries) {
    std::string body = "The restore job '" + jobName + "' finished with status: " + status + ".";
    if (!restoredEntries.empty()) {
        body += "\n\nFiles restored:\n";
        for (const auto& entry : restoredEntries) {
            body += "- " + baseName(entry) + "\n";
        }
    }
    return body;
}
