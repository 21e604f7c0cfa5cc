#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

class Settings;

// End-of-run message delivery. Failures are reported, never thrown.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual bool notify(const std::string& subject, const std::string& body, const std::string& recipient) = 0;
    virtual std::string getLastError() const = 0;
};

// Plain-text mail over SMTP (libcurl), upgraded with STARTTLS when the server
// offers it. Reads smtp_url, smtp_username, smtp_password and smtp_from.
class SmtpEmailNotifier : public Notifier {
public:
    explicit SmtpEmailNotifier(const Settings& settings);

    bool notify(const std::string& subject, const std::string& body, const std::string& recipient) override;
    std::string getLastError() const override { return lastError_; }

    static std::string buildMessage(const std::string& from,
                                    const std::string& to,
                                    const std::string& subject,
                                    const std::string& body);

private:
    const Settings& settings_;
    std::string lastError_;
};

struct BackupSummary {
    std::string jobName;
    std::string status;
    std::string message;
    int64_t fileCount{0};
    int64_t totalBytes{0};
    // Entry name and size of every archived file; listed only on success.
    std::vector<std::pair<std::string, int64_t>> files;
};

std::string formatBackupSubject(const std::string& jobName, const std::string& status);
std::string formatBackupBody(const BackupSummary& summary);

std::string formatRestoreSubject(const std::string& jobName, const std::string& status);
std::string formatRestoreBody(const std::string& jobName,
                              const std::string& status,
                              const std::vector<std::string>& restoredEntries);
