#include "test_support.hpp"
#include "storage/job_store.hpp"

using namespace testing_support;

namespace {

DestinationRef makeDestination(const std::string& name, ProviderKind provider, const std::string& location) {
    DestinationRef destination;
    destination.name = name;
    destination.provider = provider;
    destination.location = location;
    return destination;
}

ArchivedFile makeArchived(const std::string& entry, const std::string& archive, TimePoint recordedAt) {
    ArchivedFile file;
    file.originalPath = "/data/" + entry;
    file.entryName = entry;
    file.archivePath = archive;
    file.fileSize = 10;
    file.compressedSize = 6;
    file.recordedAt = recordedAt;
    return file;
}

} // namespace

class JobStoreTest : public ::testing::Test {
protected:
    JobDescriptor makeJob(const std::string& name, int64_t destinationId) {
        JobDescriptor job;
        job.name = name;
        job.sourcePath = "/data/" + name;
        job.destination.id = destinationId;
        job.schedule.kind = ScheduleKind::Daily;
        job.schedule.hour = 2;
        job.nextRunAt = utcTime(2024, 1, 1, 2, 0);
        return job;
    }

    TempDir temp_;
};

TEST_F(JobStoreTest, AddedJobResolvesItsDestination) {
    JsonJobStore store;
    const int64_t destinationId = store.addDestination(makeDestination("nas", ProviderKind::Local, "/mnt/nas"));
    const int64_t id = store.addJob(makeJob("Nightly", destinationId));

    auto job = store.getJob("Nightly");
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->id, id);
    EXPECT_EQ(job->status, JobStatus::Idle);
    EXPECT_EQ(job->destination.name, "nas");
    EXPECT_EQ(job->destination.location, "/mnt/nas");
    EXPECT_NE(job->createdAt, TimePoint{});
    EXPECT_EQ(store.getJobById(id)->name, "Nightly");
    EXPECT_FALSE(store.getJob("Weekly").has_value());
}

TEST_F(JobStoreTest, NamesAreUnique) {
    JsonJobStore store;
    store.addJob(makeJob("Nightly", 0));
    EXPECT_THROW(store.addJob(makeJob("Nightly", 0)), std::invalid_argument);
    EXPECT_THROW(store.addJob(makeJob("", 0)), std::invalid_argument);

    store.addDestination(makeDestination("nas", ProviderKind::Local, "/mnt/nas"));
    EXPECT_THROW(store.addDestination(makeDestination("nas", ProviderKind::GoogleDrive, "Backups")),
                 std::invalid_argument);
}

TEST_F(JobStoreTest, ListDueOnlyReturnsIdleJobsWhoseTimeHasCome) {
    JsonJobStore store;
    store.addJob(makeJob("due", 0));

    auto later = makeJob("later", 0);
    later.nextRunAt = utcTime(2024, 1, 2, 2, 0);
    store.addJob(later);

    auto manual = makeJob("manual", 0);
    manual.schedule = ScheduleSpec{};
    manual.nextRunAt.reset();
    store.addJob(manual);

    auto busy = makeJob("busy", 0);
    busy.status = JobStatus::Packaging;
    store.addJob(busy);

    auto due = store.listDue(utcTime(2024, 1, 1, 2, 0));
    ASSERT_EQ(due.size(), 1u);
    EXPECT_EQ(due[0].name, "due");
}

TEST_F(JobStoreTest, ClaimSucceedsOnce) {
    JsonJobStore store;
    const int64_t id = store.addJob(makeJob("Nightly", 0));

    EXPECT_TRUE(store.claimForRun(id));
    EXPECT_FALSE(store.claimForRun(id));
    EXPECT_EQ(store.getJobById(id)->status, JobStatus::Pending);
    EXPECT_FALSE(store.claimForRun(id + 100));
}

TEST_F(JobStoreTest, FinishedOnceJobCanBeClaimedAgain) {
    JsonJobStore store;
    const int64_t id = store.addJob(makeJob("Once", 0));
    store.updateStatus(id, JobStatus::Completed, std::nullopt, JobStatus::Completed, std::nullopt);
    EXPECT_TRUE(store.claimForRun(id));

    store.updateStatus(id, JobStatus::Transferring, std::nullopt, std::nullopt, std::nullopt);
    EXPECT_FALSE(store.claimForRun(id));
}

TEST_F(JobStoreTest, UpdateStatusOverwritesEveryRunField) {
    JsonJobStore store;
    const int64_t id = store.addJob(makeJob("Nightly", 0));

    ASSERT_TRUE(store.updateStatus(id, JobStatus::Idle, utcTime(2024, 1, 1, 2, 0),
                                   JobStatus::Completed, utcTime(2024, 1, 2, 2, 0)));
    auto job = store.getJobById(id);
    EXPECT_EQ(job->lastRunAt, utcTime(2024, 1, 1, 2, 0));
    EXPECT_EQ(job->lastRunOutcome, JobStatus::Completed);
    EXPECT_EQ(job->nextRunAt, utcTime(2024, 1, 2, 2, 0));

    ASSERT_TRUE(store.updateStatus(id, JobStatus::Completed, std::nullopt, std::nullopt, std::nullopt));
    job = store.getJobById(id);
    EXPECT_EQ(job->status, JobStatus::Completed);
    EXPECT_FALSE(job->lastRunAt.has_value());
    EXPECT_FALSE(job->lastRunOutcome.has_value());
    EXPECT_FALSE(job->nextRunAt.has_value());

    EXPECT_FALSE(store.updateStatus(id + 1, JobStatus::Idle, std::nullopt, std::nullopt, std::nullopt));
}

TEST_F(JobStoreTest, FileBackedStoreReloads) {
    const std::string path = (temp_ / "store.json").string();
    int64_t jobId = 0;
    {
        JsonJobStore store(path);
        const int64_t destinationId =
            store.addDestination(makeDestination("drive", ProviderKind::GoogleDrive, "Backups"));
        auto job = makeJob("Weekly", destinationId);
        job.schedule.kind = ScheduleKind::Weekly;
        job.schedule.dayOfWeek = 4;
        job.sendEmail = true;
        job.recipient = "ops@example.com";
        jobId = store.addJob(job);
        store.updateStatus(jobId, JobStatus::Idle, utcTime(2024, 1, 5, 2, 0), JobStatus::Failed,
                           utcTime(2024, 1, 12, 2, 0));
        store.recordArchivedFile(makeArchived("a.txt", "/staging/Weekly.zip", utcTime(2024, 1, 5, 2, 1)));

        RestoreHistoryEntry entry;
        entry.jobName = "Restore to tmp";
        entry.destinationPath = "/tmp";
        entry.status = "Initializing";
        entry.startedAt = utcTime(2024, 1, 6, 0, 0);
        entry.filesRestored = {"a.txt"};
        store.addRestoreHistory(entry);
    }

    JsonJobStore reloaded(path);
    auto job = reloaded.getJobById(jobId);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->name, "Weekly");
    EXPECT_EQ(job->schedule.kind, ScheduleKind::Weekly);
    EXPECT_EQ(job->schedule.dayOfWeek, 4);
    EXPECT_TRUE(job->sendEmail);
    EXPECT_EQ(job->recipient, "ops@example.com");
    EXPECT_EQ(job->destination.provider, ProviderKind::GoogleDrive);
    EXPECT_EQ(job->lastRunOutcome, JobStatus::Failed);
    EXPECT_EQ(job->nextRunAt, utcTime(2024, 1, 12, 2, 0));
    EXPECT_EQ(reloaded.getFilesInArchive("/staging/Weekly.zip").size(), 1u);
    ASSERT_EQ(reloaded.listRestoreHistory().size(), 1u);
    EXPECT_EQ(reloaded.listRestoreHistory()[0].filesRestored, std::vector<std::string>{"a.txt"});

    // Ids keep counting past the reloaded ones.
    EXPECT_GT(reloaded.addJob(makeJob("Another", 0)), jobId);
}

TEST_F(JobStoreTest, CorruptFileIsReported) {
    writeFile(temp_ / "store.json", "[1, 2");
    EXPECT_THROW({ JsonJobStore store((temp_ / "store.json").string()); }, std::runtime_error);
}

TEST_F(JobStoreTest, DestinationInUseCannotBeDeleted) {
    JsonJobStore store;
    const int64_t destinationId = store.addDestination(makeDestination("nas", ProviderKind::Local, "/mnt/nas"));
    store.addJob(makeJob("Nightly", destinationId));

    EXPECT_FALSE(store.deleteDestination("nas"));
    ASSERT_TRUE(store.deleteJob("Nightly"));
    EXPECT_TRUE(store.deleteDestination("nas"));
    EXPECT_FALSE(store.deleteDestination("nas"));
    EXPECT_TRUE(store.listDestinations().empty());
}

TEST_F(JobStoreTest, ArchiveLocationMovesEveryCatalogueRow) {
    JsonJobStore store;
    store.recordArchivedFile(makeArchived("a.txt", "/staging/Nightly.zip", utcTime(2024, 1, 1, 2, 0)));
    store.recordArchivedFile(makeArchived("b.txt", "/staging/Nightly.zip", utcTime(2024, 1, 1, 2, 0)));
    store.recordArchivedFile(makeArchived("c.txt", "/staging/Other.zip", utcTime(2024, 1, 1, 2, 0)));

    EXPECT_EQ(store.updateArchiveLocation("/staging/Nightly.zip", "gdrive://abc"), 2u);
    EXPECT_TRUE(store.getFilesInArchive("/staging/Nightly.zip").empty());
    EXPECT_EQ(store.getFilesInArchive("gdrive://abc").size(), 2u);
    EXPECT_EQ(store.getFilesInArchive("/staging/Other.zip").size(), 1u);
    EXPECT_EQ(store.updateArchiveLocation("/staging/Missing.zip", "gdrive://def"), 0u);
}

TEST_F(JobStoreTest, SearchMatchesAnyTextFieldNewestFirst) {
    JsonJobStore store;
    store.recordArchivedFile(makeArchived("Report.PDF", "/a.zip", utcTime(2024, 1, 1, 0, 0)));
    store.recordArchivedFile(makeArchived("notes.txt", "/b.zip", utcTime(2024, 1, 3, 0, 0)));
    auto described = makeArchived("scan.png", "/c.zip", utcTime(2024, 1, 2, 0, 0));
    described.description = "quarterly report scan";
    store.recordArchivedFile(described);

    auto hits = store.searchFiles("report");
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].entryName, "scan.png");
    EXPECT_EQ(hits[1].entryName, "Report.PDF");

    auto newest = store.searchFiles("", 1);
    ASSERT_EQ(newest.size(), 1u);
    EXPECT_EQ(newest[0].entryName, "notes.txt");
}

TEST_F(JobStoreTest, DuplicatesAreGroupedByEntryName) {
    JsonJobStore store;
    store.recordArchivedFile(makeArchived("a.txt", "/one.zip", utcTime(2024, 1, 1, 0, 0)));
    store.recordArchivedFile(makeArchived("a.txt", "/two.zip", utcTime(2024, 1, 2, 0, 0)));
    store.recordArchivedFile(makeArchived("b.txt", "/two.zip", utcTime(2024, 1, 2, 0, 0)));

    auto duplicates = store.findDuplicateFiles();
    ASSERT_EQ(duplicates.size(), 1u);
    EXPECT_EQ(duplicates[0].entryName, "a.txt");
    EXPECT_EQ(duplicates[0].archivePaths, (std::vector<std::string>{"/one.zip", "/two.zip"}));
}

TEST_F(JobStoreTest, RestoreHistoryIsFinishedInPlace) {
    JsonJobStore store;
    RestoreHistoryEntry first;
    first.jobName = "first";
    first.status = "Initializing";
    first.startedAt = utcTime(2024, 1, 1, 0, 0);
    const int64_t firstId = store.addRestoreHistory(first);

    RestoreHistoryEntry second = first;
    second.jobName = "second";
    second.startedAt = utcTime(2024, 1, 2, 0, 0);
    store.addRestoreHistory(second);

    ASSERT_TRUE(store.updateRestoreHistory(firstId, "Completed", utcTime(2024, 1, 1, 0, 5)));
    EXPECT_FALSE(store.updateRestoreHistory(999, "Completed", utcTime(2024, 1, 1, 0, 5)));

    auto history = store.listRestoreHistory();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].jobName, "second");
    EXPECT_EQ(history[1].status, "Completed");
    EXPECT_EQ(history[1].finishedAt, utcTime(2024, 1, 1, 0, 5));
}
