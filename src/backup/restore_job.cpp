#include "backup/restore_job.hpp"
#include "backup/transfer_provider.hpp"
#include "backup/zip_archiver.hpp"
#include "common/email_notifier.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/orchestration_context.hpp"
#include "common/settings.hpp"
#include "storage/job_store.hpp"
#include <filesystem>
#include <map>

namespace fs = std::filesystem;

namespace {

// Provider of a "<tag>://<remote id>" archive path; none for local archives.
// Throws TransferError when the remote id names no file.
std::optional<ProviderKind> cloudProviderOf(const std::string& archivePath, std::string& remoteId) {
    const auto pos = archivePath.find("://");
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    auto kind = parseProviderTag(archivePath.substr(0, pos));
    if (!kind || !isCloudProvider(*kind)) {
        return std::nullopt;
    }
    remoteId = archivePath.substr(pos + 3);
    if (fs::path(remoteId).filename().empty()) {
        throw TransferError("Archive path '" + archivePath + "' has no remote file id");
    }
    return kind;
}

// Removes a downloaded archive when the restore of that archive ends.
class StagedDownload {
public:
    StagedDownload() = default;
    ~StagedDownload() {
        if (path_.empty()) {
            return;
        }
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            Logger::warning("Failed to remove staged download " + path_ + ": " + ec.message());
        }
    }

    StagedDownload(const StagedDownload&) = delete;
    StagedDownload& operator=(const StagedDownload&) = delete;

    void set(const std::string& path) { path_ = path; }

private:
    std::string path_;
};

} // namespace

RestoreJob::RestoreJob(OrchestrationContext& context, const RestoreRequest& request, RunOptions options)
    : context_(context)
    , request_(request)
    , options_(std::move(options))
    , runId_(generateRunId()) {
    if (!options_.cancelToken) {
        options_.cancelToken = makeCancellationToken();
    }
    if (request_.name.empty()) {
        fs::path destination = fs::path(request_.destinationPath).lexically_normal();
        if (!destination.has_filename()) {
            destination = destination.parent_path();
        }
        jobName_ = "Restore to " + destination.filename().string();
    } else {
        jobName_ = request_.name;
    }
}

void RestoreJob::prepare() {
    if (prepared_) {
        return;
    }
    prepared_ = true;
    runStart_ = context_.now();

    JobPayload payload;
    payload.name = jobName_;
    payload.destination.location = request_.destinationPath;
    if (!request_.files.empty()) {
        payload.sourcePath = request_.files.front().archivePath;
    }
    runId_ = context_.getJobManager().registerJob(payload, JobKind::Restore, options_.cancelToken, runId_);
    message_ = "Initializing restore...";
    Logger::info("Restore job '" + jobName_ + "' (run " + runId_ + ") registered with " +
                 std::to_string(request_.files.size()) + " file(s)");
}

JobStatus RestoreJob::run() {
    prepare();

    JobStatus finalStatus = JobStatus::Failed;
    try {
        execute();
        finalStatus = JobStatus::Completed;
        message_ = "Restore complete.";
    } catch (const JobCancelledError& e) {
        message_ = "Restore cancelled.";
        Logger::warning("Restore job '" + jobName_ + "' was interrupted: " + e.what());
    } catch (const JobError& e) {
        message_ = std::string("Restore failed: ") + e.what();
        Logger::error("Restore job '" + jobName_ + "' failed: " + e.what());
    } catch (const std::exception& e) {
        message_ = std::string("Restore failed: ") + e.what();
        Logger::error("Unhandled error in restore job '" + jobName_ + "' (run " + runId_ + "): " + e.what());
    }

    finish(finalStatus);
    return finalStatus;
}

void RestoreJob::execute() {
    if (request_.files.empty() || request_.destinationPath.empty()) {
        throw ConfigurationError("Missing files to restore or destination path");
    }

    RestoreHistoryEntry history;
    history.jobName = jobName_;
    history.destinationPath = request_.destinationPath;
    history.status = "Initializing";
    history.startedAt = runStart_;
    for (const auto& file : request_.files) {
        history.filesRestored.push_back(file.entryName);
    }
    historyId_ = context_.getStore().addRestoreHistory(history);

    checkCancelled("Restore job was cancelled before start");

    // One pass per archive, in the order archives first appear in the request.
    std::vector<std::string> archiveOrder;
    std::map<std::string, std::vector<std::string>> grouped;
    for (const auto& file : request_.files) {
        auto& entries = grouped[file.archivePath];
        if (entries.empty()) {
            archiveOrder.push_back(file.archivePath);
        }
        entries.push_back(file.entryName);
    }

    auto staging = context_.getSettings().getString(settings_keys::kStagingPath);
    if (!staging) {
        throw ConfigurationError("Staging path not set");
    }

    for (const auto& archivePath : archiveOrder) {
        checkCancelled("Restore job was cancelled");
        restoreFromArchive(archivePath, grouped[archivePath], *staging);
    }
}

void RestoreJob::restoreFromArchive(const std::string& archivePath,
                                    const std::vector<std::string>& entryNames,
                                    const std::string& stagingPath) {
    std::string localArchive = archivePath;
    StagedDownload staged;

    std::string remoteId;
    if (auto kind = cloudProviderOf(archivePath, remoteId)) {
        transition(JobStatus::Transferring, "Downloading " + archivePath);

        auto provider = context_.createProvider(*kind);
        if (!provider) {
            throw ConfigurationError("No transfer provider available for '" + providerTag(*kind) + "'");
        }
        if (!provider->isAuthenticated() && !provider->authenticate()) {
            throw TransferError("Failed to authenticate with " + provider->getDisplayName() + ": " +
                                provider->getLastError());
        }

        fs::create_directories(stagingPath);
        localArchive = (fs::path(stagingPath) / fs::path(remoteId).filename()).string();
        staged.set(localArchive);
        if (!provider->download(remoteId, localArchive)) {
            throw TransferError("Failed to download " + archivePath + ": " + provider->getLastError());
        }
    }

    checkCancelled("Restore job was cancelled");

    auto extractor = context_.getExtractor();
    if (!extractor) {
        throw ConfigurationError("No extractor configured");
    }

    transition(JobStatus::Packaging, "Extracting from " + fs::path(localArchive).filename().string());
    Logger::info("Extracting " + std::to_string(entryNames.size()) + " file(s) to '" +
                 request_.destinationPath + "' from '" + localArchive + "'");

    const std::string destination = request_.destinationPath;
    const CancellationTokenPtr token = options_.cancelToken;
    auto future = context_.getTaskManager().addTask([extractor, localArchive, entryNames, destination, token]() {
        return extractor->extract(localArchive, entryNames, destination, token);
    });
    auto written = future.get();
    writtenFiles_.insert(writtenFiles_.end(), written.begin(), written.end());
}

void RestoreJob::finish(JobStatus finalStatus) {
    if (historyId_ > 0) {
        try {
            context_.getStore().updateRestoreHistory(historyId_, toString(finalStatus), context_.now());
        } catch (const std::exception& e) {
            Logger::error("Failed to update restore history for '" + jobName_ + "': " + e.what());
        }
    }

    JobManager& jobManager = context_.getJobManager();
    jobManager.setStatus(runId_, finalStatus);
    Logger::info("Restore job '" + jobName_ + "' finished with status " + toString(finalStatus) + ": " + message_);

    if (!request_.recipient.empty()) {
        jobManager.setStatus(runId_, JobStatus::NotifyingSender);
        sendSummary(finalStatus);
        jobManager.setStatus(runId_, finalStatus);
    }

    jobManager.unregisterJob(runId_);
    if (options_.refreshCallback) {
        context_.getEventNotifier().post(options_.refreshCallback);
    }
}

void RestoreJob::sendSummary(JobStatus finalStatus) {
    auto notifier = context_.getEmailNotifier();
    if (!notifier) {
        Logger::warning("Email requested for restore '" + jobName_ + "' but no notifier is configured");
        return;
    }

    std::vector<std::string> entries;
    if (finalStatus == JobStatus::Completed) {
        for (const auto& file : request_.files) {
            entries.push_back(file.entryName);
        }
    }

    try {
        const std::string status = toString(finalStatus);
        if (!notifier->notify(formatRestoreSubject(jobName_, status),
                              formatRestoreBody(jobName_, status, entries), request_.recipient)) {
            Logger::warning("Summary email for restore '" + jobName_ + "' was not sent: " +
                            notifier->getLastError());
        }
    } catch (const std::exception& e) {
        Logger::error("Summary email for restore '" + jobName_ + "' failed: " + e.what());
    }
}

void RestoreJob::transition(JobStatus status, const std::string& message) {
    message_ = message;
    context_.getJobManager().setStatus(runId_, status);
    Logger::info("Restore Job Status Update for '" + jobName_ + "': " + message);
}

void RestoreJob::checkCancelled(const std::string& reason) const {
    if (options_.cancelToken->isCancelled()) {
        throw JobCancelledError(reason);
    }
}

std::string startRestoreJob(OrchestrationContext& context, const RestoreRequest& request, RunOptions options) {
    auto job = std::make_shared<RestoreJob>(context, request, std::move(options));
    job->prepare();
    const std::string runId = job->getRunId();

    try {
        context.getRunTracker().launch("restore '" + job->getJobName() + "'", [job]() { job->run(); });
    } catch (const std::exception& e) {
        Logger::error("Failed to start a thread for restore '" + job->getJobName() + "': " + e.what());
        context.getJobManager().unregisterJob(runId);
        throw;
    }
    return runId;
}
