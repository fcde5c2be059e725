#include "TaggedLogger.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <ranges>
#include <sstream>
#include <string_view>

namespace DM {

namespace {

auto env_logging_enabled() -> bool {
    if (const char* raw = std::getenv("DYEMATCH_LOG")) {
        return std::strcmp(raw, "0") != 0;
    }
    return false;
}

// DYEMATCH_LOG_TAGS="Fetch,Decode" restricts output to messages carrying one of those tags.
auto env_enabled_tags() -> std::set<std::string> {
    std::set<std::string> tags;
    const char*           raw = std::getenv("DYEMATCH_LOG_TAGS");
    if (raw == nullptr) {
        return tags;
    }
    for (auto part : std::string_view{raw} | std::views::split(',')) {
        std::string tag(part.begin(), part.end());
        if (!tag.empty()) {
            tags.insert(std::move(tag));
        }
    }
    return tags;
}

// "src/dyematch/image/Foo.cpp" -> "image/Foo.cpp"
auto short_path(const char* filepath) -> std::string {
    std::filesystem::path const path{filepath};
    if (!path.has_parent_path()) {
        return path.filename().string();
    }
    return (path.parent_path().filename() / path.filename()).string();
}

} // namespace

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger()
    : running(true), loggingEnabled(env_logging_enabled()), enabledTags(env_enabled_tags()) {
    this->workerThread = std::thread(&TaggedLogger::processQueue, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->running = false;
        this->cv.notify_one();
    }
    if (this->workerThread.joinable()) {
        this->workerThread.join();
    }
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    threadNames[std::this_thread::get_id()] = name;
}

auto TaggedLogger::clearThreadName() -> void {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    threadNames.erase(std::this_thread::get_id());
}

auto TaggedLogger::namedThreadCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    return threadNames.size();
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    loggingEnabled.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::processQueue() -> void {
    while (true) {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->cv.wait(lock, [this] { return !this->messageQueue.empty() || !this->running; });

        if (!this->running && this->messageQueue.empty()) {
            return;
        }

        while (!this->messageQueue.empty()) {
            const auto msg = std::move(this->messageQueue.front());
            this->messageQueue.pop();
            lock.unlock();
            if (this->shouldWrite(msg))
                this->writeToStderr(msg);
            lock.lock();
        }
    }
}

auto TaggedLogger::shouldWrite(const LogMessage& msg) const -> bool {
    if (!this->enabledTags.empty()
        && std::ranges::none_of(msg.tags, [this](auto const& tag) { return this->enabledTags.contains(tag); })) {
        return false;
    }
    return std::ranges::none_of(msg.tags, [this](auto const& tag) { return this->skipTags.contains(tag); });
}

auto TaggedLogger::writeToStderr(const LogMessage& msg) const -> void {
    const auto  nowMs    = std::chrono::duration_cast<std::chrono::milliseconds>(msg.timestamp.time_since_epoch()) % 1000;
    const auto  nowTimeT = std::chrono::system_clock::to_time_t(msg.timestamp);
    const auto* nowTm    = std::localtime(&nowTimeT);

    std::ostringstream oss;
    oss << std::put_time(nowTm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << nowMs.count() << ' ';
    for (auto const& tag : msg.tags)
        oss << '[' << tag << ']';
    oss << " [" << msg.threadName << "] ";
    oss << "[" << short_path(msg.location.file_name()) << ":" << msg.location.line() << "] ";
    oss << msg.message << '\n';

    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << oss.str() << std::flush;
}

auto TaggedLogger::threadNameOf(const std::thread::id& id) const -> std::string {
    {
        std::lock_guard<std::mutex> lock(threadNamesMutex);
        if (auto it = threadNames.find(id); it != threadNames.end()) {
            return it->second;
        }
    }
    std::ostringstream oss;
    oss << "Thread " << id;
    return oss.str();
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace DM
