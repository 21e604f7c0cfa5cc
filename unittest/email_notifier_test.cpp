#include "test_support.hpp"
#include "common/email_notifier.hpp"
#include "common/settings.hpp"

TEST(EmailFormatTest, BackupSummaryListsArchivedFiles) {
    BackupSummary summary;
    summary.jobName = "Nightly";
    summary.status = "Completed";
    summary.message = "Upload complete (Google Drive).";
    summary.fileCount = 2;
    summary.totalBytes = 3 * 1024 * 1024 / 2;
    summary.files = {{"docs/report.pdf", 2048}, {"a.txt", 17}};

    EXPECT_EQ(formatBackupSubject("Nightly", "Completed"), "Job 'Nightly' Completion Status: Completed");
    EXPECT_EQ(formatBackupBody(summary),
              "The job 'Nightly' finished with status: Completed.\n\n"
              "Final message: Upload complete (Google Drive).\n\n"
              "Files processed: 2\n"
              "Total size: 1.50 MB\n\n"
              "Files in archive:\n"
              "- report.pdf (2.0 KB)\n"
              "- a.txt (17.0 B)\n");
}

TEST(EmailFormatTest, FailedBackupHasNoFileList) {
    BackupSummary summary;
    summary.jobName = "Nightly";
    summary.status = "Failed";
    summary.message = "Job failed: Staging path is not configured";

    EXPECT_EQ(formatBackupBody(summary),
              "The job 'Nightly' finished with status: Failed.\n\n"
              "Final message: Job failed: Staging path is not configured\n\n"
              "Files processed: 0\n"
              "Total size: 0.00 MB");
}

TEST(EmailFormatTest, RestoreSummary) {
    EXPECT_EQ(formatRestoreSubject("Restore to tmp", "Failed"), "Restore Job 'Restore to tmp' Completion Status: Failed");
    EXPECT_EQ(formatRestoreBody("Restore to tmp", "Failed", {}),
              "The restore job 'Restore to tmp' finished with status: Failed.");
    EXPECT_EQ(formatRestoreBody("Restore to tmp", "Completed", {"sub/b.txt", "a.txt"}),
              "The restore job 'Restore to tmp' finished with status: Completed.\n\n"
              "Files restored:\n- b.txt\n- a.txt\n");
}

TEST(EmailFormatTest, MessageUsesCrlfAndCarriesHeaders) {
    const std::string message =
        SmtpEmailNotifier::buildMessage("vault@example.com", "ops@example.com", "Subject line", "one\ntwo\r\nthree");

    EXPECT_NE(message.find("To: ops@example.com\r\n"), std::string::npos);
    EXPECT_NE(message.find("From: vault@example.com\r\n"), std::string::npos);
    EXPECT_NE(message.find("Subject: Subject line\r\n"), std::string::npos);
    EXPECT_NE(message.find("Content-Type: text/plain; charset=UTF-8\r\n\r\n"), std::string::npos);
    EXPECT_NE(message.find("one\r\ntwo\r\nthree\r\n"), std::string::npos);
    EXPECT_EQ(message.find("\r\r\n"), std::string::npos);
    EXPECT_EQ(message.rfind("Date: ", 0), 0u);
}

TEST(SmtpEmailNotifierTest, RefusesToSendWithoutConfiguration) {
    Settings settings;
    SmtpEmailNotifier notifier(settings);
    EXPECT_FALSE(notifier.notify("subject", "body", "ops@example.com"));
    EXPECT_NE(notifier.getLastError().find("smtp_url"), std::string::npos);

    settings.set(settings_keys::kSmtpUrl, "smtp://127.0.0.1:1");
    settings.set(settings_keys::kSmtpFrom, "vault@example.com");
    EXPECT_FALSE(notifier.notify("subject", "body", ""));
}
