#include "../DyeMatchTestHelper.hpp"

#include "log/TaggedLogger.hpp"

#include <cstdlib>
#include <cstring>
#include <thread>

using namespace DM;

namespace {

// Turns logging on for one test and restores what the environment asked for.
struct LoggingOn {
    LoggingOn() { set_logging_enabled(true); }
    ~LoggingOn() {
        char const* raw = std::getenv("DYEMATCH_LOG");
        set_logging_enabled(raw != nullptr && std::strcmp(raw, "0") != 0);
    }
};

} // namespace

TEST_SUITE("log.tagged") {

TEST_CASE("a scoped thread name lasts until the scope ends") {
    auto const baseline = logger().namedThreadCount();
    std::size_t inside   = 0;

    std::thread worker([&] {
        ScopedThreadName const name{"Worker"};
        inside = logger().namedThreadCount();
    });
    worker.join();

    CHECK(inside == baseline + 1);
    CHECK(logger().namedThreadCount() == baseline);
}

TEST_CASE("threads that log without a name are not remembered") {
    LoggingOn on;
    auto const baseline = logger().namedThreadCount();

    for (int i = 0; i < 8; ++i) {
        std::thread worker([] { dm_log("unnamed worker", "DEBUG"); });
        worker.join();
    }
    CHECK(logger().namedThreadCount() == baseline);
}

}
