#include "backup/backup_scheduler.hpp"
#include "backup/schedule.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/orchestration_context.hpp"
#include "common/settings.hpp"
#include "storage/job_store.hpp"
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

bool sourceExists(const std::string& path) {
    std::error_code ec;
    return !path.empty() && fs::exists(path, ec);
}

} // namespace

BackupScheduler::BackupScheduler(OrchestrationContext& context)
    : context_(context) {
    const Settings& settings = context_.getSettings();
    const int pollSeconds = settings.getInt(settings_keys::kPollIntervalSeconds, 60);
    const int graceSeconds = settings.getInt(settings_keys::kShutdownGraceSeconds, 10);
    pollInterval_ = std::chrono::seconds(pollSeconds > 0 ? pollSeconds : 60);
    gracePeriod_ = std::chrono::seconds(graceSeconds >= 0 ? graceSeconds : 10);
}

BackupScheduler::~BackupScheduler() {
    stop();
}

void BackupScheduler::start() {
    if (running_) {
        return;
    }

    const size_t recovered = recoverInterruptedJobs();
    if (recovered > 0) {
        Logger::warning("Reset " + std::to_string(recovered) + " job(s) interrupted by a previous shutdown");
    }

    stopRequested_ = false;
    running_ = true;
    schedulerThread_ = std::thread(&BackupScheduler::schedulerLoop, this);
}

void BackupScheduler::stop() {
    if (!running_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        stopRequested_ = true;
    }
    wakeCondition_.notify_all();
    if (schedulerThread_.joinable()) {
        schedulerThread_.join();
    }

    context_.getJobManager().requestCancelAll();
    if (!context_.getRunTracker().waitForIdle(gracePeriod_)) {
        Logger::warning(std::to_string(context_.getRunTracker().activeCount()) +
                        " run(s) still active after the shutdown grace period");
    }

    running_ = false;
    Logger::info("Scheduler stopped");
}

void BackupScheduler::schedulerLoop() {
    Logger::info("Scheduler started, checking every " +
                 std::to_string(std::chrono::duration_cast<std::chrono::seconds>(pollInterval_).count()) +
                 " second(s)");

    while (!stopRequested_) {
        try {
            checkSchedules();
        } catch (const std::exception& e) {
            Logger::error(std::string("Error in scheduler loop: ") + e.what());
        }

        std::unique_lock<std::mutex> lock(waitMutex_);
        wakeCondition_.wait_for(lock, pollInterval_, [this] { return stopRequested_.load(); });
    }
}

size_t BackupScheduler::checkSchedules() {
    const TimePoint now = context_.now();
    Logger::debug("Checking for scheduled jobs at " + formatIso8601(now));

    std::vector<JobDescriptor> due;
    try {
        due = context_.getStore().listDue(now);
    } catch (const std::exception& e) {
        Logger::error(std::string("Failed to read due jobs: ") + e.what());
        return 0;
    }

    size_t started = 0;
    for (const auto& job : due) {
        try {
            if (startIfDue(job, now)) {
                ++started;
            }
        } catch (const std::exception& e) {
            Logger::error("Error processing job '" + job.name + "' in scheduler: " + e.what());
        }
    }
    return started;
}

bool BackupScheduler::startIfDue(const JobDescriptor& job, TimePoint now) {
    if (context_.getJobManager().isJobRunning(job.id)) {
        Logger::debug("Job '" + job.name + "' is already running; skipped");
        return false;
    }

    if (!sourceExists(job.sourcePath)) {
        markSourceMissing(job, now);
        return false;
    }

    if (!context_.getStore().claimForRun(job.id)) {
        Logger::debug("Job '" + job.name + "' was claimed elsewhere; skipped");
        return false;
    }

    Logger::info("Job '" + job.name + "' is due to run (scheduled " +
                 (job.nextRunAt ? formatIso8601(*job.nextRunAt) : std::string("now")) + "); starting");
    try {
        startBackupJob(context_, job, ConflictPolicy::Rename);
    } catch (const std::exception&) {
        // Release the claim so the next pass can try again.
        context_.getStore().updateStatus(job.id, JobStatus::Idle, job.lastRunAt, job.lastRunOutcome, job.nextRunAt);
        throw;
    }
    return true;
}

void BackupScheduler::markSourceMissing(const JobDescriptor& job, TimePoint now) {
    Logger::error("Source path for job '" + job.name + "' does not exist: " + job.sourcePath);
    context_.getStore().updateStatus(job.id, JobStatus::Idle, now, JobStatus::Failed,
                                     computeNextRun(job.schedule, now));
}

std::string BackupScheduler::runNow(const std::string& jobName, ConflictPolicy policy, RunOptions options) {
    auto job = context_.getStore().getJob(jobName);
    if (!job) {
        throw std::runtime_error("Job not found: " + jobName);
    }
    if (context_.getJobManager().isJobRunning(job->id)) {
        throw std::runtime_error("Job '" + jobName + "' is already running");
    }
    if (!sourceExists(job->sourcePath)) {
        Logger::error("Source path for job '" + jobName + "' does not exist: " + job->sourcePath);
        throw SourceMissingError("Source path for job '" + jobName + "' does not exist: " + job->sourcePath);
    }

    if (!context_.getStore().claimForRun(job->id)) {
        throw std::runtime_error("Job '" + jobName + "' is already claimed by another run");
    }

    Logger::info("Starting job '" + jobName + "' on request");
    try {
        return startBackupJob(context_, *job, policy, std::move(options));
    } catch (const std::exception&) {
        context_.getStore().updateStatus(job->id, job->status, job->lastRunAt, job->lastRunOutcome, job->nextRunAt);
        throw;
    }
}

size_t BackupScheduler::recoverInterruptedJobs() {
    const TimePoint now = context_.now();
    size_t recovered = 0;

    for (const auto& job : context_.getStore().listJobs()) {
        if (job.status == JobStatus::Idle || job.status == JobStatus::Completed) {
            continue;
        }
        if (context_.getJobManager().isJobRunning(job.id)) {
            continue;
        }

        Logger::warning("Job '" + job.name + "' was left in status " + toString(job.status) + "; resetting to Idle");
        context_.getStore().updateStatus(job.id, JobStatus::Idle, job.lastRunAt, JobStatus::Failed,
                                         computeNextRun(job.schedule, now));
        ++recovered;
    }
    return recovered;
}
