#pragma once

#include <string>
#include <string_view>

namespace DM {

// Structured reporting seam handed to components that need to surface anomalies
// (decode cleanup failures, catalog exhaustion, fetch redirects).
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void info(std::string_view tag, std::string const& message)  = 0;
    virtual void warn(std::string_view tag, std::string const& message)  = 0;
    virtual void error(std::string_view tag, std::string const& message) = 0;
};

// Forwards to the process-wide TaggedLogger (enabled through DYEMATCH_LOG).
class TaggedLogSink final : public LogSink {
public:
    void info(std::string_view tag, std::string const& message) override;
    void warn(std::string_view tag, std::string const& message) override;
    void error(std::string_view tag, std::string const& message) override;
};

auto default_log_sink() -> LogSink&;

// Process-wide switches of the logger behind TaggedLogSink.
void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace DM
