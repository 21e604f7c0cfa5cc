#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// Owns the threads that executor runs are launched on, so shutdown can wait
// for them and nothing outlives the objects they reference.
class RunTracker {
public:
    RunTracker() = default;
    ~RunTracker();

    RunTracker(const RunTracker&) = delete;
    RunTracker& operator=(const RunTracker&) = delete;

    // Runs body on a new thread. Exceptions escaping body are logged.
    void launch(const std::string& label, std::function<void()> body);

    // True once no launched body is still running, false on timeout.
    bool waitForIdle(std::chrono::milliseconds timeout);
    size_t activeCount() const;

    // Blocks until every launched thread has finished.
    void joinAll();

private:
    struct Entry {
        std::thread thread;
        std::shared_ptr<bool> done;
    };

    void reapFinished();

    std::list<Entry> threads_;
    size_t active_{0};
    mutable std::mutex mutex_;
    std::condition_variable idleCondition_;
};
