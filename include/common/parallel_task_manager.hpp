#pragma once

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <type_traits>

struct TaskStats {
    size_t totalTasks{0};
    size_t completedTasks{0};
    size_t currentQueueSize{0};
};

enum class TaskPriority {
    LOW,
    NORMAL,
    HIGH
};

// Fixed-size worker pool. Packaging runs here so the coordinating executor
// thread only blocks on the returned future.
class ParallelTaskManager {
public:
    explicit ParallelTaskManager(size_t numThreads = std::thread::hardware_concurrency());
    ~ParallelTaskManager();

    ParallelTaskManager(const ParallelTaskManager&) = delete;
    ParallelTaskManager& operator=(const ParallelTaskManager&) = delete;

    template<typename F, typename... Args>
    auto addTask(F&& f, Args&&... args)
        -> std::future<typename std::result_of<F(Args...)>::type>;

    template<typename F, typename... Args>
    auto addPriorityTask(TaskPriority priority, F&& f, Args&&... args)
        -> std::future<typename std::result_of<F(Args...)>::type>;

    // Wait for all queued and running tasks to complete
    void waitForAll();

    // Drains the queue and joins the workers. Further submissions throw.
    void shutdown();
    bool isShutdown() const;

    size_t getThreadCount() const;
    TaskStats getStats() const;

private:
    struct Task {
        std::function<void()> func;
        TaskPriority priority;
        uint64_t sequence;
    };

    // Higher priority first, FIFO within a priority.
    struct TaskOrder {
        bool operator()(const Task& a, const Task& b) const {
            if (a.priority != b.priority) {
                return a.priority < b.priority;
            }
            return a.sequence > b.sequence;
        }
    };

    void workerThread();
    void enqueue(std::function<void()> func, TaskPriority priority);

    std::vector<std::thread> workers_;
    std::priority_queue<Task, std::vector<Task>, TaskOrder> tasks_;
    mutable std::mutex queueMutex_;
    std::condition_variable condition_;
    std::condition_variable idleCondition_;
    bool stop_{false};
    uint64_t nextSequence_{0};
    size_t activeTasks_{0};
    TaskStats stats_;
};

template<typename F, typename... Args>
auto ParallelTaskManager::addTask(F&& f, Args&&... args)
    -> std::future<typename std::result_of<F(Args...)>::type> {
    return addPriorityTask(TaskPriority::NORMAL, std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto ParallelTaskManager::addPriorityTask(TaskPriority priority, F&& f, Args&&... args)
    -> std::future<typename std::result_of<F(Args...)>::type> {
    using return_type = typename std::result_of<F(Args...)>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();
    enqueue([task]() { (*task)(); }, priority);
    return result;
}
