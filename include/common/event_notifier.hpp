#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// Fans "something changed" out to listeners. A presentation layer can attach a
// dispatcher so callbacks run on its own serial context instead of the
// publishing thread.
class EventNotifier {
public:
    using Listener = std::function<void()>;
    using Dispatcher = std::function<void(std::function<void()>)>;

    EventNotifier() = default;
    EventNotifier(const EventNotifier&) = delete;
    EventNotifier& operator=(const EventNotifier&) = delete;

    // Adding an existing key replaces nothing and returns false.
    bool addListener(const std::string& key, Listener listener);
    bool removeListener(const std::string& key);
    size_t listenerCount() const;

    void setDispatcher(Dispatcher dispatcher);
    bool hasDispatcher() const;

    void publish();

    // Runs a single callback on the dispatch context (inline if none).
    void post(std::function<void()> callback);

private:
    static void invokeIsolated(const std::string& key, const Listener& listener);

    mutable std::mutex mutex_;
    std::vector<std::pair<std::string, Listener>> listeners_;
    Dispatcher dispatcher_;
};
