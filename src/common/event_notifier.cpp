#include "common/event_notifier.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <exception>

bool EventNotifier::addListener(const std::string& key, Listener listener) {
    if (!listener) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
                           [&key](const auto& entry) { return entry.first == key; });
    if (it != listeners_.end()) {
        return false;
    }
    listeners_.emplace_back(key, std::move(listener));
    return true;
}

bool EventNotifier::removeListener(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
                           [&key](const auto& entry) { return entry.first == key; });
    if (it == listeners_.end()) {
        return false;
    }
    listeners_.erase(it);
    return true;
}

size_t EventNotifier::listenerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

void EventNotifier::setDispatcher(Dispatcher dispatcher) {
    std::lock_guard<std::mutex> lock(mutex_);
    dispatcher_ = std::move(dispatcher);
}

bool EventNotifier::hasDispatcher() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(dispatcher_);
}

void EventNotifier::publish() {
    std::vector<std::pair<std::string, Listener>> listeners;
    Dispatcher dispatcher;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = listeners_;
        dispatcher = dispatcher_;
    }

    for (const auto& entry : listeners) {
        if (dispatcher) {
            const auto key = entry.first;
            const auto listener = entry.second;
            dispatcher([key, listener]() { invokeIsolated(key, listener); });
        } else {
            invokeIsolated(entry.first, entry.second);
        }
    }
}

void EventNotifier::post(std::function<void()> callback) {
    if (!callback) {
        return;
    }

    Dispatcher dispatcher;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dispatcher = dispatcher_;
    }

    if (dispatcher) {
        dispatcher([callback]() { invokeIsolated("posted callback", callback); });
    } else {
        invokeIsolated("posted callback", callback);
    }
}

void EventNotifier::invokeIsolated(const std::string& key, const Listener& listener) {
    try {
        listener();
    } catch (const std::exception& e) {
        Logger::error("Listener '" + key + "' failed: " + e.what());
    } catch (...) {
        Logger::error("Listener '" + key + "' failed with a non-standard exception");
    }
}
