#include "backup/backup_job.hpp"
#include "backup/schedule.hpp"
#include "backup/transfer_provider.hpp"
#include "common/email_notifier.hpp"
#include "common/errors.hpp"
#include "common/file_hash.hpp"
#include "common/logger.hpp"
#include "common/orchestration_context.hpp"
#include "common/settings.hpp"
#include "common/utils.hpp"
#include "storage/job_store.hpp"
#include <filesystem>

namespace fs = std::filesystem;

BackupJob::BackupJob(OrchestrationContext& context,
                     const JobDescriptor& descriptor,
                     ConflictPolicy policy,
                     RunOptions options)
    : context_(context)
    , descriptor_(descriptor)
    , policy_(policy)
    , options_(std::move(options))
    , runId_(generateRunId()) {
    if (!options_.cancelToken) {
        options_.cancelToken = makeCancellationToken();
    }
}

void BackupJob::prepare() {
    if (prepared_) {
        return;
    }
    prepared_ = true;
    runStart_ = context_.now();

    JobPayload payload;
    if (descriptor_.id > 0) {
        payload.jobId = descriptor_.id;
    }
    payload.name = descriptor_.name;
    payload.sourcePath = descriptor_.sourcePath;
    payload.destination = descriptor_.destination;
    runId_ = context_.getJobManager().registerJob(payload, JobKind::Backup, options_.cancelToken, runId_);

    Logger::info("Job '" + descriptor_.name + "' (run " + runId_ + ") starting with provider '" +
                 providerTag(descriptor_.destination.provider) + "' and destination '" +
                 descriptor_.destination.location + "'");

    if (descriptor_.id > 0) {
        try {
            if (!context_.getStore().updateStatus(descriptor_.id, JobStatus::Pending,
                                                  std::nullopt, std::nullopt, std::nullopt)) {
                Logger::warning("Job '" + descriptor_.name + "' is no longer in the store");
            }
        } catch (const std::exception& e) {
            Logger::error("Failed to persist Pending for job '" + descriptor_.name + "': " + e.what());
        }
    }
    message_ = "Initializing job...";
}

JobStatus BackupJob::run() {
    prepare();

    JobStatus finalStatus = JobStatus::Failed;
    try {
        execute();
        finalStatus = JobStatus::Completed;
    } catch (const JobCancelledError& e) {
        message_ = std::string("Job cancelled: ") + e.what();
        Logger::warning("Job '" + descriptor_.name + "' was interrupted: " + e.what());
    } catch (const ConfigurationError& e) {
        message_ = std::string("Job failed: ") + e.what();
        Logger::error("Configuration error in job '" + descriptor_.name + "': " + e.what());
    } catch (const JobError& e) {
        message_ = std::string("Job failed: ") + e.what();
        Logger::error("Job '" + descriptor_.name + "' failed: " + e.what());
    } catch (const std::exception& e) {
        message_ = std::string("Job failed: ") + e.what();
        Logger::error("Unhandled error in job '" + descriptor_.name + "' (run " + runId_ + ", source " +
                      descriptor_.sourcePath + "): " + e.what());
    }

    finish(finalStatus);
    return finalStatus;
}

void BackupJob::execute() {
    checkCancelled("Job was cancelled before start");

    transition(JobStatus::Packaging, "Zipping files...");
    const std::string outputRoot = resolveOutputRoot();
    packageSource(outputRoot);

    const std::string archivePath = *packResult_.archivePath;
    catalogueKey_ = archivePath;
    const std::string archiveName = fs::path(archivePath).filename().string();
    transition(JobStatus::AwaitingTransfer, "Package created: " + archiveName);

    if (isCloudProvider(descriptor_.destination.provider)) {
        shipToCloud(archivePath);
    } else {
        message_ = "Completed locally: " + archiveName;
        Logger::info("Job '" + descriptor_.name + "' completed locally");
    }

    if (descriptor_.moveFiles) {
        removeSourceFiles();
    }
}

std::string BackupJob::resolveOutputRoot() const {
    if (!isCloudProvider(descriptor_.destination.provider)) {
        if (descriptor_.destination.location.empty()) {
            throw ConfigurationError("Destination path is not configured for job '" + descriptor_.name + "'");
        }
        return descriptor_.destination.location;
    }

    auto staging = context_.getSettings().getString(settings_keys::kStagingPath);
    if (!staging) {
        throw ConfigurationError("Staging path is not configured; it is required for cloud destination '" +
                                 descriptor_.destination.name + "'");
    }
    return *staging;
}

void BackupJob::packageSource(const std::string& outputRoot) {
    auto packager = context_.getPackager();
    if (!packager) {
        throw ConfigurationError("No packager configured");
    }

    const std::string source = descriptor_.sourcePath;
    const ConflictPolicy policy = policy_;
    const CancellationTokenPtr token = options_.cancelToken;
    const ConflictPrompt prompt = options_.prompt;

    Logger::info("Packaging '" + source + "' into " + outputRoot);
    auto future = context_.getTaskManager().addTask([packager, source, outputRoot, policy, token, prompt]() {
        return packager->pack(source, outputRoot, policy, token, prompt);
    });
    packResult_ = future.get();

    if (packResult_.action == "cancelled" || !packResult_.archivePath) {
        throw JobCancelledError("Zip operation was cancelled: the archive already exists");
    }
}

void BackupJob::shipToCloud(const std::string& archivePath) {
    checkCancelled("Job was cancelled before upload");

    const ProviderKind kind = descriptor_.destination.provider;
    const std::string tag = providerTag(kind);
    transition(JobStatus::Transferring, "Uploading to " + tag + "...");

    auto provider = context_.createProvider(kind);
    if (!provider) {
        throw ConfigurationError("No transfer provider available for '" + tag + "'");
    }
    if (!provider->isAuthenticated() && !provider->authenticate()) {
        throw TransferError("Failed to authenticate with " + provider->getDisplayName() + ": " +
                            provider->getLastError());
    }

    auto remoteId = provider->upload(archivePath, descriptor_.destination.location);
    if (!remoteId || remoteId->empty()) {
        throw TransferError("Upload to " + tag + " failed: " + provider->getLastError());
    }

    transition(JobStatus::Verifying, "Upload complete (" + provider->getDisplayName() + ").");
    verifyUpload(*provider, *remoteId, archivePath);

    const std::string remoteUri = tag + "://" + *remoteId;
    const size_t moved = context_.getStore().updateArchiveLocation(archivePath, remoteUri);
    catalogueKey_ = remoteUri;
    Logger::info("Uploaded " + archivePath + " as " + remoteUri + " (" + std::to_string(moved) +
                 " catalogue entries moved)");

    std::error_code ec;
    fs::remove(archivePath, ec);
    if (ec) {
        Logger::warning("Failed to remove staged archive " + archivePath + ": " + ec.message());
    } else {
        Logger::info("Removed local staged file '" + archivePath + "' after upload");
    }
}

void BackupJob::verifyUpload(TransferProvider& provider, const std::string& remoteId, const std::string& archivePath) {
    auto remote = provider.getRemoteHash(remoteId);
    if (!remote || remote->value.empty()) {
        Logger::warning("No checksum reported for " + remoteId + "; upload accepted unverified");
        return;
    }

    const std::string algorithm = utils::toLower(remote->algorithm);
    if (algorithm != "md5" && algorithm != "sha256") {
        Logger::info("Checksum algorithm '" + remote->algorithm + "' is not checked locally; upload accepted");
        return;
    }

    auto local = calculateFileDigest(archivePath, algorithm);
    if (!local) {
        Logger::warning("Could not hash " + archivePath + "; upload accepted unverified");
        return;
    }
    if (!utils::iequals(*local, remote->value)) {
        throw TransferError("Checksum mismatch for " + archivePath + ": local " + algorithm + " " + *local +
                            ", remote " + remote->value);
    }
    Logger::info("Verified " + algorithm + " checksum of " + remoteId);
}

void BackupJob::removeSourceFiles() {
    size_t removed = 0;
    for (const auto& path : packResult_.sourceFiles) {
        std::error_code ec;
        if (fs::remove(path, ec)) {
            ++removed;
        } else if (ec) {
            Logger::warning("Failed to remove archived source file " + path + ": " + ec.message());
        }
    }
    Logger::info("Moved " + std::to_string(removed) + " file(s) of job '" + descriptor_.name + "' into the archive");
}

void BackupJob::finish(JobStatus finalStatus) {
    const ScheduleSpec& schedule = descriptor_.schedule;
    const JobStatus persisted =
        (finalStatus == JobStatus::Completed && schedule.kind == ScheduleKind::Once) ? JobStatus::Completed
                                                                                       : JobStatus::Idle;

    if (descriptor_.id > 0) {
        try {
            context_.getStore().updateStatus(descriptor_.id, persisted, runStart_, finalStatus,
                                             computeNextRunAfterStart(schedule, runStart_));
        } catch (const std::exception& e) {
            Logger::error("Failed to persist the outcome of job '" + descriptor_.name + "': " + e.what());
        }
    }

    JobManager& jobManager = context_.getJobManager();
    jobManager.setStatus(runId_, finalStatus);
    Logger::info("Job '" + descriptor_.name + "' finished with status " + toString(finalStatus) + ": " + message_);

    if (descriptor_.sendEmail && !descriptor_.recipient.empty()) {
        jobManager.setStatus(runId_, JobStatus::NotifyingSender);
        sendSummary(finalStatus);
        jobManager.setStatus(runId_, finalStatus);
    }

    jobManager.unregisterJob(runId_);
    if (options_.refreshCallback) {
        context_.getEventNotifier().post(options_.refreshCallback);
    }
}

void BackupJob::sendSummary(JobStatus finalStatus) {
    auto notifier = context_.getEmailNotifier();
    if (!notifier) {
        Logger::warning("Email requested for job '" + descriptor_.name + "' but no notifier is configured");
        return;
    }

    BackupSummary summary;
    summary.jobName = descriptor_.name;
    summary.status = toString(finalStatus);
    summary.message = message_;
    summary.fileCount = packResult_.fileCount;
    summary.totalBytes = packResult_.totalBytes;

    try {
        if (finalStatus == JobStatus::Completed && !catalogueKey_.empty()) {
            for (const auto& file : context_.getStore().getFilesInArchive(catalogueKey_)) {
                summary.files.emplace_back(file.entryName, file.fileSize);
            }
        }

        if (!notifier->notify(formatBackupSubject(summary.jobName, summary.status),
                              formatBackupBody(summary), descriptor_.recipient)) {
            Logger::warning("Summary email for job '" + descriptor_.name + "' was not sent: " +
                            notifier->getLastError());
        }
    } catch (const std::exception& e) {
        Logger::error("Summary email for job '" + descriptor_.name + "' failed: " + e.what());
    }
}

void BackupJob::transition(JobStatus status, const std::string& message) {
    message_ = message;
    context_.getJobManager().setStatus(runId_, status);
    Logger::info("Job Status Update for '" + descriptor_.name + "': " + message + " [" + toString(status) + "]");
}

void BackupJob::checkCancelled(const std::string& reason) const {
    if (options_.cancelToken->isCancelled()) {
        throw JobCancelledError(reason);
    }
}

std::string startBackupJob(OrchestrationContext& context,
                           const JobDescriptor& descriptor,
                           ConflictPolicy policy,
                           RunOptions options) {
    auto job = std::make_shared<BackupJob>(context, descriptor, policy, std::move(options));
    job->prepare();
    const std::string runId = job->getRunId();

    try {
        context.getRunTracker().launch("backup '" + descriptor.name + "'", [job]() { job->run(); });
    } catch (const std::exception& e) {
        Logger::error("Failed to start a thread for job '" + descriptor.name + "': " + e.what());
        context.getJobManager().unregisterJob(runId);
        throw;
    }
    return runId;
}
