#include <dyematch/log/LogSink.hpp>

#include "TaggedLogger.hpp"

namespace DM {

void TaggedLogSink::info(std::string_view tag, std::string const& message) {
    dm_log(message, tag, "INFO");
}

void TaggedLogSink::warn(std::string_view tag, std::string const& message) {
    dm_log(message, tag, "WARN");
}

void TaggedLogSink::error(std::string_view tag, std::string const& message) {
    dm_log(message, tag, "ERROR");
}

auto default_log_sink() -> LogSink& {
    static TaggedLogSink sink;
    return sink;
}

} // namespace DM
