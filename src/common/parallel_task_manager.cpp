#include "common/parallel_task_manager.hpp"
#include "common/logger.hpp"
#include <exception>

ParallelTaskManager::ParallelTaskManager(size_t numThreads) {
    if (numThreads == 0) {
        numThreads = std::max<size_t>(1, std::thread::hardware_concurrency());
    }

    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&ParallelTaskManager::workerThread, this);
    }
}

ParallelTaskManager::~ParallelTaskManager() {
    shutdown();
}

void ParallelTaskManager::enqueue(std::function<void()> func, TaskPriority priority) {
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (stop_) {
            throw std::runtime_error("Cannot add task to stopped task manager");
        }

        tasks_.push(Task{std::move(func), priority, nextSequence_++});
        stats_.totalTasks++;
        stats_.currentQueueSize = tasks_.size();
    }
    condition_.notify_one();
}

void ParallelTaskManager::waitForAll() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    idleCondition_.wait(lock, [this] {
        return tasks_.empty() && activeTasks_ == 0;
    });
}

void ParallelTaskManager::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (stop_ && workers_.empty()) {
            return;
        }
        stop_ = true;
    }
    condition_.notify_all();

    for (auto& thread : workers_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workers_.clear();
}

bool ParallelTaskManager::isShutdown() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return stop_;
}

void ParallelTaskManager::workerThread() {
    while (true) {
        std::function<void()> taskFunc;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this] {
                return !tasks_.empty() || stop_;
            });

            // Queued work still runs after shutdown so no future is left broken.
            if (stop_ && tasks_.empty()) {
                return;
            }

            taskFunc = tasks_.top().func;
            tasks_.pop();
            stats_.currentQueueSize = tasks_.size();
            ++activeTasks_;
        }

        try {
            taskFunc();
        } catch (const std::exception& e) {
            Logger::error(std::string("Worker task failed: ") + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            --activeTasks_;
            stats_.completedTasks++;
            if (tasks_.empty() && activeTasks_ == 0) {
                idleCondition_.notify_all();
            }
        }
    }
}

size_t ParallelTaskManager::getThreadCount() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return workers_.size();
}

TaskStats ParallelTaskManager::getStats() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return stats_;
}
