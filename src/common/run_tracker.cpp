#include "common/run_tracker.hpp"
#include "common/logger.hpp"
#include <exception>

RunTracker::~RunTracker() {
    joinAll();
}

void RunTracker::launch(const std::string& label, std::function<void()> body) {
    std::lock_guard<std::mutex> lock(mutex_);
    reapFinished();

    auto done = std::make_shared<bool>(false);
    ++active_;
    threads_.push_back(Entry{std::thread([this, label, done, body = std::move(body)]() {
        try {
            body();
        } catch (const std::exception& e) {
            Logger::error("Run '" + label + "' terminated with an exception: " + e.what());
        }

        {
            std::lock_guard<std::mutex> guard(mutex_);
            --active_;
            *done = true;
        }
        idleCondition_.notify_all();
    }), done});
}

bool RunTracker::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idleCondition_.wait_for(lock, timeout, [this] { return active_ == 0; });
}

size_t RunTracker::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

void RunTracker::joinAll() {
    std::list<Entry> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(threads_);
    }
    for (auto& entry : pending) {
        if (entry.thread.joinable()) {
            entry.thread.join();
        }
    }
}

// Caller holds mutex_. A thread marked done has already released the lock.
void RunTracker::reapFinished() {
    for (auto it = threads_.begin(); it != threads_.end();) {
        if (*it->done) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = threads_.erase(it);
        } else {
            ++it;
        }
    }
}
