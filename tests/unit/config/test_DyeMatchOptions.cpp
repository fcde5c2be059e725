#include "../DyeMatchTestHelper.hpp"

#include "dyematch/config/DyeMatchOptions.hpp"

#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace {

struct EnvGuard {
    explicit EnvGuard(const char* key, const char* value)
        : key_(key) {
        if (const char* existing = std::getenv(key)) {
            original_ = std::string{existing};
        }
        if (value != nullptr) {
            setenv(key, value, 1);
        } else {
            unsetenv(key);
        }
    }

    ~EnvGuard() {
        if (original_.has_value()) {
            setenv(key_.c_str(), original_->c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
    }

    std::string                key_;
    std::optional<std::string> original_;
};

struct ArgvBuilder {
    explicit ArgvBuilder(std::initializer_list<const char*> args) {
        storage.reserve(args.size());
        for (auto value : args) {
            storage.emplace_back(value);
        }
        pointers.reserve(storage.size());
        for (auto& entry : storage) {
            pointers.push_back(entry.data());
        }
    }

    auto argc() const -> int { return static_cast<int>(pointers.size()); }
    auto argv() -> char** { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char*>       pointers;
};

} // namespace

using namespace DM;
using namespace DM::Config;

TEST_SUITE("config.options") {

TEST_CASE("defaults match the documented limits") {
    DyeMatchOptions options{};
    CHECK_FALSE(ValidateDyeMatchOptions(options).has_value());

    auto limits = ToImageLimits(options);
    CHECK(limits.max_file_size_bytes == 10 * 1024 * 1024);
    CHECK(limits.max_dimension == 4096);
    CHECK(limits.max_pixel_count == 16'000'000);
    CHECK(ToDecoderOptions(options).max_decoded_pixels == limits.max_pixel_count);

    auto guard = ToUrlGuardOptions(options);
    CHECK(guard.allowed_hosts == std::vector<std::string>{"cdn.discordapp.com", "media.discordapp.net"});

    auto pipeline = ToPipelineOptions(options);
    CHECK(pipeline.fetch.timeout == std::chrono::milliseconds{10000});
    CHECK(pipeline.process.max_dimension == 256);
    CHECK(pipeline.process.filter == Image::SamplingFilter::CatmullRom);
    CHECK(pipeline.raster.scale == 2);
    CHECK(pipeline.raster.timeout == std::chrono::milliseconds{5000});
    CHECK(pipeline.matcher.max_attempts == 20);
    CHECK(pipeline.exclude_category == std::optional<std::string>{"Facewear"});
}

TEST_CASE("the decoder ceiling follows the pixel limit") {
    DyeMatchOptions options{};
    options.max_pixel_count = 2'000'000;
    CHECK(ToDecoderOptions(options).max_decoded_pixels == 2'000'000);
    CHECK(ToImageLimits(options).max_pixel_count == 2'000'000);
}

TEST_CASE("validation names the offending flag") {
    DyeMatchOptions options{};
    options.raster_scale = 9;
    auto error           = ValidateDyeMatchOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--scale") != std::string::npos);

    options.raster_scale = 2;
    options.filter       = "lanczos";
    error                = ValidateDyeMatchOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--filter") != std::string::npos);

    options.filter = "box";
    options.allowed_hosts.clear();
    error = ValidateDyeMatchOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--allowed-host") != std::string::npos);
}

TEST_CASE("sampling filter names") {
    CHECK(ParseSamplingFilter("nearest") == Image::SamplingFilter::Nearest);
    CHECK(ParseSamplingFilter("Catmull-Rom") == Image::SamplingFilter::CatmullRom);
    CHECK(ParseSamplingFilter("MITCHELL") == Image::SamplingFilter::Mitchell);
    CHECK_FALSE(ParseSamplingFilter("bicubic").has_value());
}

TEST_CASE("command, arguments and flags are parsed") {
    EnvGuard hosts{"DYEMATCH_ALLOWED_HOSTS", nullptr};
    ArgvBuilder argv{"dyematch", "compare", "--catalog", "dyes.json", "5729", "#96BDB9", "--scale", "3", "--count", "4", "--verbose"};
    auto        parsed = ParseDyeMatchArguments(argv.argc(), argv.argv());

    REQUIRE(parsed.has_value());
    CHECK(parsed->command == "compare");
    CHECK(parsed->arguments == std::vector<std::string>{"5729", "#96BDB9"});
    CHECK(parsed->catalog_path == "dyes.json");
    CHECK(parsed->raster_scale == 3);
    CHECK(parsed->color_count == 4);
    CHECK(parsed->verbose);
    CHECK_FALSE(parsed->show_help);
}

TEST_CASE("allowed hosts from flags replace the defaults") {
    EnvGuard hosts{"DYEMATCH_ALLOWED_HOSTS", nullptr};
    ArgvBuilder argv{"dyematch", "probe", "--allowed-host", "Images.Example.com", "--allowed-host", "cdn.example.org"};
    auto        parsed = ParseDyeMatchArguments(argv.argc(), argv.argv());

    REQUIRE(parsed.has_value());
    CHECK(parsed->allowed_hosts == std::vector<std::string>{"images.example.com", "cdn.example.org"});
}

TEST_CASE("an empty exclude category turns the exclusion off") {
    EnvGuard category{"DYEMATCH_EXCLUDE_CATEGORY", ""};
    ArgvBuilder argv{"dyematch", "match", "#B01515"};
    auto        parsed = ParseDyeMatchArguments(argv.argc(), argv.argv());

    REQUIRE(parsed.has_value());
    CHECK_FALSE(ExcludedCategory(*parsed).has_value());
}

TEST_CASE("environment overrides apply to defaults") {
    EnvGuard hosts{"DYEMATCH_ALLOWED_HOSTS", "a.example, B.example ,"};
    EnvGuard timeout{"DYEMATCH_FETCH_TIMEOUT_MS", "2500"};
    EnvGuard filter{"DYEMATCH_FILTER", "Triangle"};
    EnvGuard scale{"DYEMATCH_RASTER_SCALE", "4"};

    ArgvBuilder argv{"dyematch"};
    auto        parsed = ParseDyeMatchArguments(argv.argc(), argv.argv());

    REQUIRE(parsed.has_value());
    CHECK(parsed->allowed_hosts == std::vector<std::string>{"a.example", "b.example"});
    CHECK(parsed->fetch_timeout_ms == 2500);
    CHECK(parsed->filter == "triangle");
    CHECK(parsed->raster_scale == 4);
}

TEST_CASE("the label font comes from the environment or the command line") {
    EnvGuard font{"DYEMATCH_FONT", "/fonts/env.ttf"};

    ArgvBuilder plain{"dyematch", "compare", "1", "2"};
    auto        from_env = ParseDyeMatchArguments(plain.argc(), plain.argv());
    REQUIRE(from_env.has_value());
    CHECK(from_env->font_path == "/fonts/env.ttf");

    ArgvBuilder flagged{"dyematch", "compare", "--font", "/fonts/flag.ttf", "1", "2"};
    auto        from_flag = ParseDyeMatchArguments(flagged.argc(), flagged.argv());
    REQUIRE(from_flag.has_value());
    CHECK(from_flag->font_path == "/fonts/flag.ttf");
}

TEST_CASE("command line flags win over the environment") {
    EnvGuard scale{"DYEMATCH_RASTER_SCALE", "4"};
    ArgvBuilder argv{"dyematch", "--scale", "1"};
    auto        parsed = ParseDyeMatchArguments(argv.argc(), argv.argv());

    REQUIRE(parsed.has_value());
    CHECK(parsed->raster_scale == 1);
}

TEST_CASE("invalid environment override fails early") {
    EnvGuard scale{"DYEMATCH_RASTER_SCALE", "12"};
    ArgvBuilder argv{"dyematch"};
    CHECK_FALSE(ParseDyeMatchArguments(argv.argc(), argv.argv()).has_value());
}

TEST_CASE("bad flags are rejected") {
    {
        ArgvBuilder argv{"dyematch", "--scale"};
        CHECK_FALSE(ParseDyeMatchArguments(argv.argc(), argv.argv()).has_value());
    }
    {
        ArgvBuilder argv{"dyematch", "--count", "6"};
        CHECK_FALSE(ParseDyeMatchArguments(argv.argc(), argv.argv()).has_value());
    }
    {
        ArgvBuilder argv{"dyematch", "--max-dimension", "12px"};
        CHECK_FALSE(ParseDyeMatchArguments(argv.argc(), argv.argv()).has_value());
    }
    {
        ArgvBuilder argv{"dyematch", "--frobnicate"};
        CHECK_FALSE(ParseDyeMatchArguments(argv.argc(), argv.argv()).has_value());
    }
}

TEST_CASE("help skips validation") {
    EnvGuard hosts{"DYEMATCH_ALLOWED_HOSTS", nullptr};
    ArgvBuilder argv{"dyematch", "--help"};
    auto        parsed = ParseDyeMatchArguments(argv.argc(), argv.argv());
    REQUIRE(parsed.has_value());
    CHECK(parsed->show_help);
}

}
