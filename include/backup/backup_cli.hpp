#pragma once

#include <string>
#include <vector>

class OrchestrationContext;

// Command dispatcher behind the zipvault executable. Each handler returns the
// process exit status.
class BackupCLI {
public:
    explicit BackupCLI(OrchestrationContext& context);

    int run(const std::vector<std::string>& args);
    static void printUsage();

private:
    int handleServeCommand(const std::vector<std::string>& args);
    int handleRunCommand(const std::vector<std::string>& args);
    int handleListCommand(const std::vector<std::string>& args);
    int handleAddDestinationCommand(const std::vector<std::string>& args);
    int handleAddJobCommand(const std::vector<std::string>& args);
    int handleDeleteJobCommand(const std::vector<std::string>& args);
    int handleRestoreCommand(const std::vector<std::string>& args);
    int handleSearchCommand(const std::vector<std::string>& args);
    int handleDuplicatesCommand(const std::vector<std::string>& args);
    int handleHistoryCommand(const std::vector<std::string>& args);
    int handleCheckCommand(const std::vector<std::string>& args);

    void waitForRuns() const;

    OrchestrationContext& context_;
};
