#include "common/orchestration_context.hpp"
#include "backup/zip_archiver.hpp"
#include "common/logger.hpp"
#include "common/settings.hpp"
#include "storage/job_store.hpp"

OrchestrationContext::OrchestrationContext(JobStore& store, Settings& settings, size_t packagingThreads)
    : store_(store)
    , settings_(settings)
    , jobManager_(eventNotifier_)
    , taskManager_(packagingThreads)
    , emailNotifier_(std::make_shared<SmtpEmailNotifier>(settings))
    , clock_([] { return std::chrono::system_clock::now(); }) {
    auto archiver = std::make_shared<ZipArchiver>(&store);
    packager_ = archiver;
    extractor_ = archiver;

    providerFactory_ = [&settings](ProviderKind kind) {
        return createTransferProvider(kind, settings);
    };
}

OrchestrationContext::~OrchestrationContext() {
    jobManager_.requestCancelAll();
    runTracker_.joinAll();
    taskManager_.shutdown();
}

std::unique_ptr<TransferProvider> OrchestrationContext::createProvider(ProviderKind kind) const {
    if (!providerFactory_) {
        Logger::error("No transfer provider factory configured");
        return nullptr;
    }
    return providerFactory_(kind);
}
