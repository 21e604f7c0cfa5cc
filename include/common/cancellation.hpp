#pragma once

#include <atomic>
#include <memory>

// Cooperative stop signal shared between a run and whoever may cancel it.
// Setting it never interrupts work; executors poll it at checkpoints.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool isCancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

inline CancellationTokenPtr makeCancellationToken() {
    return std::make_shared<CancellationToken>();
}
