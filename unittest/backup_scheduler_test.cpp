#include "test_support.hpp"
#include "backup/backup_scheduler.hpp"
#include "backup/backup_job.hpp"
#include "common/errors.hpp"
#include "common/orchestration_context.hpp"
#include <atomic>
#include <set>
#include <stdexcept>
#include <thread>

using namespace testing_support;
namespace fs = std::filesystem;

namespace {

// Store whose claims fail for chosen jobs and whose first listDue calls throw.
class FlakyJobStore : public JsonJobStore {
public:
    bool claimForRun(int64_t id) override {
        if (brokenClaims.count(id) > 0) {
            throw std::runtime_error("claim failed for job " + std::to_string(id));
        }
        return JsonJobStore::claimForRun(id);
    }

    std::vector<JobDescriptor> listDue(TimePoint now) const override {
        if (failingListDue > 0) {
            --failingListDue;
            throw std::runtime_error("store unavailable");
        }
        return JsonJobStore::listDue(now);
    }

    std::set<int64_t> brokenClaims;
    mutable std::atomic<int> failingListDue{0};
};

} // namespace

class BackupSchedulerTest : public OrchestrationTest {
protected:
    void SetUp() override {
        OrchestrationTest::SetUp();
        setNow(utcTime(2024, 1, 1, 1, 0));
        addDestination("nas", ProviderKind::Local, (temp_ / "nas").string());
        scheduler_ = std::make_unique<BackupScheduler>(*context_);
    }

    void TearDown() override {
        scheduler_.reset();
        OrchestrationTest::TearDown();
    }

    static ScheduleSpec nightly() {
        ScheduleSpec spec;
        spec.kind = ScheduleKind::Daily;
        spec.hour = 2;
        return spec;
    }

    // Installs a packager that holds every run inside pack() until released.
    std::shared_ptr<BlockingPackager> holdRuns() {
        auto packager = std::make_shared<BlockingPackager>();
        context_->setPackager(packager);
        return packager;
    }

    // A second context over a FlakyJobStore with a "nas" destination and the
    // fixture's clock.
    std::unique_ptr<OrchestrationContext> flakyContext(FlakyJobStore& store) {
        DestinationRef nas;
        nas.name = "nas";
        nas.provider = ProviderKind::Local;
        nas.location = (temp_ / "nas").string();
        store.addDestination(nas);

        auto context = std::make_unique<OrchestrationContext>(store, settings_);
        context->setEmailNotifier(mailer_);
        context->setClock([this]() { return now(); });
        return context;
    }

    static JobDescriptor jobFor(JobStore& store, const std::string& name, const fs::path& source) {
        JobDescriptor job;
        job.name = name;
        job.sourcePath = source.string();
        job.destination = store.getDestination("nas").value();
        job.schedule = nightly();
        job.nextRunAt = utcTime(2024, 1, 1, 2, 0);
        return job;
    }

    std::unique_ptr<BackupScheduler> scheduler_;
};

TEST_F(BackupSchedulerTest, ReadsIntervalsFromSettings) {
    settings_.set(settings_keys::kPollIntervalSeconds, 5);
    settings_.set(settings_keys::kShutdownGraceSeconds, 3);
    BackupScheduler scheduler(*context_);
    EXPECT_EQ(scheduler.getPollInterval(), std::chrono::seconds(5));
    EXPECT_EQ(scheduler.getGracePeriod(), std::chrono::seconds(3));
    EXPECT_EQ(scheduler_->getPollInterval(), std::chrono::seconds(60));
}

TEST_F(BackupSchedulerTest, ManualJobsAreNeverStarted) {
    addJob("Manual", makeSource("Photos").string(), "nas");
    setNow(utcTime(2030, 1, 1, 0, 0));

    EXPECT_EQ(scheduler_->checkSchedules(), 0u);
    EXPECT_EQ(context_->getJobManager().runningCount(), 0u);
}

TEST_F(BackupSchedulerTest, JobIsNotStartedBeforeItsTime) {
    addJob("Nightly", makeSource("Photos").string(), "nas", nightly());
    setNow(utcTime(2024, 1, 1, 1, 59));
    EXPECT_EQ(scheduler_->checkSchedules(), 0u);
}

TEST_F(BackupSchedulerTest, DueJobStartsExactlyOnce) {
    auto packager = holdRuns();
    JobDescriptor job = addJob("Nightly", makeSource("Photos").string(), "nas", nightly());
    setNow(utcTime(2024, 1, 1, 2, 0));

    EXPECT_EQ(scheduler_->checkSchedules(), 1u);
    ASSERT_TRUE(packager->waitForEntered(1, std::chrono::seconds(5)));
    EXPECT_TRUE(context_->getJobManager().isJobRunning(job.id));
    EXPECT_EQ(store_.getJob("Nightly")->status, JobStatus::Pending);

    EXPECT_EQ(scheduler_->checkSchedules(), 0u);
    EXPECT_EQ(context_->getJobManager().runningCount(), 1u);

    packager->release();
    ASSERT_TRUE(waitForRuns());
}

TEST_F(BackupSchedulerTest, FinishedRunAdvancesTheSchedule) {
    addJob("Nightly", makeSource("Photos").string(), "nas", nightly());
    setNow(utcTime(2024, 1, 1, 2, 0));

    ASSERT_EQ(scheduler_->checkSchedules(), 1u);
    ASSERT_TRUE(waitForRuns());

    auto stored = store_.getJob("Nightly").value();
    EXPECT_EQ(stored.status, JobStatus::Idle);
    EXPECT_EQ(stored.lastRunOutcome, JobStatus::Completed);
    EXPECT_EQ(stored.lastRunAt, utcTime(2024, 1, 1, 2, 0));
    EXPECT_EQ(formatIso8601(stored.nextRunAt.value()), "2024-01-02T02:00:00Z");
    EXPECT_TRUE(fs::exists(temp_ / "nas" / "Photos.zip"));

    EXPECT_EQ(scheduler_->checkSchedules(), 0u);
}

TEST_F(BackupSchedulerTest, MissingSourceIsMarkedFailedAndRescheduled) {
    addJob("Nightly", (temp_ / "gone").string(), "nas", nightly());
    setNow(utcTime(2024, 1, 1, 2, 0));

    EXPECT_EQ(scheduler_->checkSchedules(), 0u);
    EXPECT_EQ(context_->getJobManager().runningCount(), 0u);

    auto stored = store_.getJob("Nightly").value();
    EXPECT_EQ(stored.status, JobStatus::Idle);
    EXPECT_EQ(stored.lastRunOutcome, JobStatus::Failed);
    EXPECT_EQ(stored.lastRunAt, utcTime(2024, 1, 1, 2, 0));
    EXPECT_EQ(formatIso8601(stored.nextRunAt.value()), "2024-01-02T02:00:00Z");
}

TEST_F(BackupSchedulerTest, RunNowRejectsUnknownAndMissingSources) {
    EXPECT_THROW(scheduler_->runNow("Nobody"), std::runtime_error);

    addJob("Gone", (temp_ / "gone").string(), "nas");
    EXPECT_THROW(scheduler_->runNow("Gone"), SourceMissingError);
    EXPECT_EQ(context_->getJobManager().runningCount(), 0u);
}

TEST_F(BackupSchedulerTest, RunNowRefusesASecondRunOfTheSameJob) {
    auto packager = holdRuns();
    addJob("Photos", makeSource("Photos").string(), "nas");

    scheduler_->runNow("Photos");
    EXPECT_THROW(scheduler_->runNow("Photos"), std::runtime_error);

    ASSERT_TRUE(packager->waitForEntered(1, std::chrono::seconds(5)));
    packager->release();
    ASSERT_TRUE(waitForRuns());
    EXPECT_EQ(store_.getJob("Photos")->lastRunOutcome, JobStatus::Completed);
}

TEST_F(BackupSchedulerTest, ConcurrentRunsAreCancelledIndependently) {
    auto packager = holdRuns();
    addJob("Photos", makeSource("Photos").string(), "nas");
    addJob("Music", makeSource("Music").string(), "nas");

    const std::string photosRun = scheduler_->runNow("Photos");
    const std::string musicRun = scheduler_->runNow("Music");
    EXPECT_NE(photosRun, musicRun);

    auto running = context_->getJobManager().listRunning();
    ASSERT_EQ(running.size(), 2u);
    EXPECT_NE(running[0].cancelToken, running[1].cancelToken);

    ASSERT_TRUE(packager->waitForEntered(2, std::chrono::seconds(5)));
    EXPECT_TRUE(context_->getJobManager().requestCancel(photosRun));
    packager->release();
    ASSERT_TRUE(waitForRuns());

    EXPECT_EQ(store_.getJob("Photos")->lastRunOutcome, JobStatus::Failed);
    EXPECT_EQ(store_.getJob("Music")->lastRunOutcome, JobStatus::Completed);
    EXPECT_FALSE(fs::exists(temp_ / "nas" / "Photos.zip"));
    EXPECT_TRUE(fs::exists(temp_ / "nas" / "Music.zip"));
}

TEST_F(BackupSchedulerTest, InterruptedJobsAreRecovered) {
    JobDescriptor job = addJob("Nightly", makeSource("Photos").string(), "nas", nightly());
    store_.updateStatus(job.id, JobStatus::Transferring, utcTime(2023, 12, 31, 2, 0), JobStatus::Completed,
                        utcTime(2024, 1, 1, 2, 0));
    addJob("Idle", makeSource("Music").string(), "nas");

    EXPECT_EQ(scheduler_->recoverInterruptedJobs(), 1u);

    auto stored = store_.getJob("Nightly").value();
    EXPECT_EQ(stored.status, JobStatus::Idle);
    EXPECT_EQ(stored.lastRunOutcome, JobStatus::Failed);
    EXPECT_EQ(stored.lastRunAt, utcTime(2023, 12, 31, 2, 0));
    EXPECT_EQ(formatIso8601(stored.nextRunAt.value()), "2024-01-01T02:00:00Z");
    EXPECT_EQ(scheduler_->recoverInterruptedJobs(), 0u);
}

TEST_F(BackupSchedulerTest, LoopPicksUpDueJobsUntilStopped) {
    addJob("Nightly", makeSource("Photos").string(), "nas", nightly());
    setNow(utcTime(2024, 1, 1, 2, 0));
    scheduler_->setPollInterval(std::chrono::milliseconds(20));

    scheduler_->start();
    EXPECT_TRUE(scheduler_->isRunning());

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (!store_.getJob("Nightly")->lastRunOutcome && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    scheduler_->stop();

    EXPECT_FALSE(scheduler_->isRunning());
    EXPECT_EQ(store_.getJob("Nightly")->lastRunOutcome, JobStatus::Completed);
}

TEST_F(BackupSchedulerTest, StopCancelsRunsInFlight) {
    auto packager = holdRuns();
    addJob("Photos", makeSource("Photos").string(), "nas");
    scheduler_->setGracePeriod(std::chrono::milliseconds(50));
    scheduler_->start();

    scheduler_->runNow("Photos");
    ASSERT_TRUE(packager->waitForEntered(1, std::chrono::seconds(5)));

    scheduler_->stop();
    packager->release();
    ASSERT_TRUE(waitForRuns());

    EXPECT_EQ(store_.getJob("Photos")->lastRunOutcome, JobStatus::Failed);
    EXPECT_FALSE(fs::exists(temp_ / "nas" / "Photos.zip"));
}

TEST_F(BackupSchedulerTest, RunNowRespectsAClaimTakenByTheScheduler) {
    auto packager = holdRuns();
    JobDescriptor job = addJob("Nightly", makeSource("Photos").string(), "nas", nightly());
    ASSERT_TRUE(store_.claimForRun(job.id));

    EXPECT_THROW(scheduler_->runNow("Nightly"), std::runtime_error);
    EXPECT_EQ(context_->getJobManager().runningCount(), 0u);
    EXPECT_EQ(store_.getJob("Nightly")->status, JobStatus::Pending);

    startBackupJob(*context_, store_.getJob("Nightly").value(), ConflictPolicy::Rename);
    ASSERT_TRUE(packager->waitForEntered(1, std::chrono::seconds(5)));
    EXPECT_EQ(context_->getJobManager().runningCount(), 1u);

    packager->release();
    ASSERT_TRUE(waitForRuns());
    EXPECT_EQ(store_.getJob("Nightly")->lastRunOutcome, JobStatus::Completed);
}

TEST_F(BackupSchedulerTest, ScheduledPassCannotClaimAManualRun) {
    auto packager = holdRuns();
    addJob("Nightly", makeSource("Photos").string(), "nas", nightly());
    setNow(utcTime(2024, 1, 1, 2, 0));

    scheduler_->runNow("Nightly");
    EXPECT_EQ(store_.getJob("Nightly")->status, JobStatus::Pending);
    EXPECT_EQ(scheduler_->checkSchedules(), 0u);

    ASSERT_TRUE(packager->waitForEntered(1, std::chrono::seconds(5)));
    packager->release();
    ASSERT_TRUE(waitForRuns());
    EXPECT_EQ(context_->getJobManager().runningCount(), 0u);
}

TEST_F(BackupSchedulerTest, FinishedOnceJobCanBeRunAgain) {
    ScheduleSpec once;
    once.kind = ScheduleKind::Once;
    once.date = "2024-01-01";
    once.hour = 3;
    addJob("Once", makeSource("Photos").string(), "nas", once);

    scheduler_->runNow("Once");
    ASSERT_TRUE(waitForRuns());
    ASSERT_EQ(store_.getJob("Once")->status, JobStatus::Completed);

    scheduler_->runNow("Once");
    ASSERT_TRUE(waitForRuns());
    EXPECT_EQ(store_.getJob("Once")->lastRunOutcome, JobStatus::Completed);
    EXPECT_TRUE(fs::exists(temp_ / "nas" / "Photos_1.zip"));
}

TEST_F(BackupSchedulerTest, FailingJobDoesNotStopTheRestOfThePass) {
    FlakyJobStore store;
    auto context = flakyContext(store);
    const int64_t broken = store.addJob(jobFor(store, "Broken", makeSource("Photos")));
    store.addJob(jobFor(store, "Healthy", makeSource("Music")));
    store.brokenClaims.insert(broken);
    setNow(utcTime(2024, 1, 1, 2, 0));

    BackupScheduler scheduler(*context);
    EXPECT_EQ(scheduler.checkSchedules(), 1u);
    ASSERT_TRUE(context->getRunTracker().waitForIdle(std::chrono::seconds(10)));

    EXPECT_EQ(store.getJob("Healthy")->lastRunOutcome, JobStatus::Completed);
    EXPECT_EQ(store.getJob("Broken")->status, JobStatus::Idle);
    EXPECT_FALSE(store.getJob("Broken")->lastRunOutcome);
    EXPECT_TRUE(fs::exists(temp_ / "nas" / "Music.zip"));
}

TEST_F(BackupSchedulerTest, LoopSurvivesAFailingPass) {
    FlakyJobStore store;
    auto context = flakyContext(store);
    store.addJob(jobFor(store, "Nightly", makeSource("Photos")));
    store.failingListDue = 2;
    setNow(utcTime(2024, 1, 1, 2, 0));

    BackupScheduler scheduler(*context);
    scheduler.setPollInterval(std::chrono::milliseconds(20));
    scheduler.start();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (!store.getJob("Nightly")->lastRunOutcome && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    scheduler.stop();

    EXPECT_EQ(store.failingListDue.load(), 0);
    EXPECT_EQ(store.getJob("Nightly")->lastRunOutcome, JobStatus::Completed);
}
