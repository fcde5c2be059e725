#pragma once
#include <dyematch/log/LogSink.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>

namespace DM {

// Asynchronous stderr logger. Callers queue messages and a background thread formats them.
// Tags in `skipTags` never print; DYEMATCH_LOG_TAGS narrows output to an explicit set.
class TaggedLogger {
public:
    struct LogMessage {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           threadName;
        std::source_location                  location;
    };

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto setThreadName(const std::string& name) -> void;
    auto clearThreadName() -> void;
    auto namedThreadCount() const -> std::size_t;
    auto setLoggingEnabled(bool enabled) -> void;

    static std::mutex coutMutex;

private:
    std::queue<LogMessage>  messageQueue;
    std::mutex              queueMutex;
    std::condition_variable cv;
    std::thread             workerThread;
    std::atomic<bool>       running;
    std::atomic<bool>       loggingEnabled;

    // Fixed at construction.
    std::set<std::string> const skipTags{"DEBUG", "Fetch.Head", "Decode.Handle"};
    std::set<std::string> const enabledTags;

    // Only threads that named themselves; unnamed threads are labelled from their id.
    std::unordered_map<std::thread::id, std::string> threadNames;
    mutable std::mutex                               threadNamesMutex;

    auto processQueue() -> void;
    auto shouldWrite(const LogMessage& msg) const -> bool;
    auto writeToStderr(const LogMessage& msg) const -> void;
    auto threadNameOf(const std::thread::id& id) const -> std::string;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!loggingEnabled)
        return;

    auto logMessage = LogMessage{.timestamp  = std::chrono::system_clock::now(),
                                 .tags       = {std::string(std::forward<Tags>(tags))...},
                                 .message    = message,
                                 .threadName = threadNameOf(std::this_thread::get_id()),
                                 .location   = location};

    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->messageQueue.push(std::move(logMessage));
        this->cv.notify_one();
    }
}

#define dm_log(message, ...) ::DM::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

// Names the calling thread for its lifetime in this scope, then forgets it.
class ScopedThreadName {
public:
    explicit ScopedThreadName(const std::string& name) { logger().setThreadName(name); }
    ~ScopedThreadName() { logger().clearThreadName(); }

    ScopedThreadName(const ScopedThreadName&)            = delete;
    ScopedThreadName& operator=(const ScopedThreadName&) = delete;
};

} // namespace DM
