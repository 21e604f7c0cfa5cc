#pragma once

#include "backup/provider_factory.hpp"
#include "common/email_notifier.hpp"
#include "common/event_notifier.hpp"
#include "common/job.hpp"
#include "common/job_manager.hpp"
#include "common/parallel_task_manager.hpp"
#include "common/run_tracker.hpp"
#include <functional>
#include <memory>

class JobStore;
class Settings;
class Packager;
class Extractor;

// Everything a scheduler and its executors share for the lifetime of the
// process. Tests build one per case with fakes swapped in.
class OrchestrationContext {
public:
    using Clock = std::function<TimePoint()>;

    // Defaults: ZipArchiver over the store, SMTP mail from settings,
    // providers from createTransferProvider, the system clock.
    OrchestrationContext(JobStore& store, Settings& settings, size_t packagingThreads = 2);
    ~OrchestrationContext();

    OrchestrationContext(const OrchestrationContext&) = delete;
    OrchestrationContext& operator=(const OrchestrationContext&) = delete;

    JobStore& getStore() { return store_; }
    Settings& getSettings() { return settings_; }
    EventNotifier& getEventNotifier() { return eventNotifier_; }
    JobManager& getJobManager() { return jobManager_; }
    ParallelTaskManager& getTaskManager() { return taskManager_; }
    RunTracker& getRunTracker() { return runTracker_; }

    std::shared_ptr<Packager> getPackager() const { return packager_; }
    void setPackager(std::shared_ptr<Packager> packager) { packager_ = std::move(packager); }
    std::shared_ptr<Extractor> getExtractor() const { return extractor_; }
    void setExtractor(std::shared_ptr<Extractor> extractor) { extractor_ = std::move(extractor); }
    std::shared_ptr<Notifier> getEmailNotifier() const { return emailNotifier_; }
    void setEmailNotifier(std::shared_ptr<Notifier> notifier) { emailNotifier_ = std::move(notifier); }

    void setProviderFactory(ProviderFactory factory) { providerFactory_ = std::move(factory); }
    std::unique_ptr<TransferProvider> createProvider(ProviderKind kind) const;

    void setClock(Clock clock) { clock_ = std::move(clock); }
    TimePoint now() const { return clock_(); }

private:
    JobStore& store_;
    Settings& settings_;
    EventNotifier eventNotifier_;
    JobManager jobManager_;
    ParallelTaskManager taskManager_;
    std::shared_ptr<Packager> packager_;
    std::shared_ptr<Extractor> extractor_;
    std::shared_ptr<Notifier> emailNotifier_;
    ProviderFactory providerFactory_;
    Clock clock_;
    // Declared last: its threads are joined before anything above goes away.
    RunTracker runTracker_;
};
