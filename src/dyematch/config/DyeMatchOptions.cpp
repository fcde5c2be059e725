#include <dyematch/config/DyeMatchOptions.hpp>

#include <algorithm>
#include <charconv>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <limits>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>

namespace DM::Config {

namespace {

constexpr std::int64_t kMaxTimeoutMs   = 10 * 60 * 1000;
constexpr int          kMaxRasterScale = 8;

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T value{};
    if (!parse_integer(text, value)) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

auto lowercase(std::string_view text) -> std::string {
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return normalized;
}

// "a.example, b.example" -> {"a.example", "b.example"}
auto split_hosts(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> hosts;
    for (auto part : text | std::views::split(',')) {
        std::string host(part.begin(), part.end());
        auto        first = host.find_first_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        auto last = host.find_last_not_of(" \t");
        hosts.push_back(lowercase(std::string_view{host}.substr(first, last - first + 1)));
    }
    return hosts;
}

} // namespace

auto ParseSamplingFilter(std::string_view name) -> std::optional<Image::SamplingFilter> {
    auto normalized = lowercase(name);
    if (normalized == "nearest") {
        return Image::SamplingFilter::Nearest;
    }
    if (normalized == "box") {
        return Image::SamplingFilter::Box;
    }
    if (normalized == "triangle") {
        return Image::SamplingFilter::Triangle;
    }
    if (normalized == "catmull-rom") {
        return Image::SamplingFilter::CatmullRom;
    }
    if (normalized == "mitchell") {
        return Image::SamplingFilter::Mitchell;
    }
    return std::nullopt;
}

auto ValidateDyeMatchOptions(DyeMatchOptions const& options) -> std::optional<std::string> {
    if (options.allowed_hosts.empty()) {
        return std::string{"--allowed-host must name at least one host"};
    }
    if (std::ranges::any_of(options.allowed_hosts, [](std::string const& host) { return host.empty(); })) {
        return std::string{"--allowed-host must not be empty"};
    }
    if (options.max_file_size_bytes <= 0) {
        return std::string{"--max-file-size must be > 0"};
    }
    if (options.max_dimension <= 0) {
        return std::string{"--max-dimension must be > 0"};
    }
    if (options.max_pixel_count <= 0) {
        return std::string{"--max-pixels must be > 0"};
    }
    if (options.fetch_timeout_ms <= 0 || options.fetch_timeout_ms > kMaxTimeoutMs) {
        return std::string{"--fetch-timeout-ms must be within 1-600000"};
    }
    if (options.process_max_dimension <= 0) {
        return std::string{"--process-max-dimension must be > 0"};
    }
    if (!ParseSamplingFilter(options.filter)) {
        return std::string{"--filter must be one of nearest, box, triangle, catmull-rom, mitchell"};
    }
    if (options.rasterize_timeout_ms <= 0 || options.rasterize_timeout_ms > kMaxTimeoutMs) {
        return std::string{"--rasterize-timeout-ms must be within 1-600000"};
    }
    if (options.raster_scale < 1 || options.raster_scale > kMaxRasterScale) {
        return std::string{"--scale must be within 1-8"};
    }
    if (options.match_attempts < 1) {
        return std::string{"--match-attempts must be >= 1"};
    }
    if (options.user_agent.empty()) {
        return std::string{"--user-agent must not be empty"};
    }
    return std::nullopt;
}

bool ApplyDyeMatchEnvOverrides(DyeMatchOptions& options) {
    if (!apply_env("DYEMATCH_ALLOWED_HOSTS", [&](std::string_view value) {
            auto hosts = split_hosts(value);
            if (hosts.empty()) {
                std::cerr << "DYEMATCH_ALLOWED_HOSTS must name at least one host\n";
                return false;
            }
            options.allowed_hosts = std::move(hosts);
            return true;
        })) {
        return false;
    }

    auto apply_positive_i64 = [&](char const* key, std::int64_t& target, std::int64_t max) {
        return apply_env(key, [&](std::string_view value) {
            std::int64_t parsed = target;
            if (!parse_integer_in_range<std::int64_t>(value, 1, max, parsed)) {
                std::cerr << key << " must be within 1-" << max << "\n";
                return false;
            }
            target = parsed;
            return true;
        });
    };

    auto apply_positive_int = [&](char const* key, int& target, int max) {
        return apply_env(key, [&](std::string_view value) {
            int parsed = target;
            if (!parse_integer_in_range<int>(value, 1, max, parsed)) {
                std::cerr << key << " must be within 1-" << max << "\n";
                return false;
            }
            target = parsed;
            return true;
        });
    };

    constexpr auto kMaxI64 = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMaxInt = std::numeric_limits<int>::max();

    if (!apply_positive_i64("DYEMATCH_MAX_FILE_SIZE", options.max_file_size_bytes, kMaxI64)) {
        return false;
    }
    if (!apply_positive_int("DYEMATCH_MAX_DIMENSION", options.max_dimension, kMaxInt)) {
        return false;
    }
    if (!apply_positive_i64("DYEMATCH_MAX_PIXELS", options.max_pixel_count, kMaxI64)) {
        return false;
    }
    if (!apply_positive_i64("DYEMATCH_FETCH_TIMEOUT_MS", options.fetch_timeout_ms, kMaxTimeoutMs)) {
        return false;
    }
    if (!apply_positive_int("DYEMATCH_PROCESS_MAX_DIMENSION", options.process_max_dimension, kMaxInt)) {
        return false;
    }
    if (!apply_positive_i64("DYEMATCH_RASTERIZE_TIMEOUT_MS", options.rasterize_timeout_ms, kMaxTimeoutMs)) {
        return false;
    }
    if (!apply_positive_int("DYEMATCH_RASTER_SCALE", options.raster_scale, kMaxRasterScale)) {
        return false;
    }

    if (!apply_env("DYEMATCH_FILTER", [&](std::string_view value) {
            if (!ParseSamplingFilter(value)) {
                std::cerr << "DYEMATCH_FILTER must be one of nearest, box, triangle, catmull-rom, mitchell\n";
                return false;
            }
            options.filter = lowercase(value);
            return true;
        })) {
        return false;
    }

    if (!apply_env("DYEMATCH_CATALOG", [&](std::string_view value) {
            options.catalog_path = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("DYEMATCH_FONT", [&](std::string_view value) {
            options.font_path = std::string{value};
            return true;
        })) {
        return false;
    }

    // An empty value turns the category exclusion off.
    if (!apply_env("DYEMATCH_EXCLUDE_CATEGORY", [&](std::string_view value) {
            options.exclude_category = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("DYEMATCH_USER_AGENT", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "DYEMATCH_USER_AGENT must not be empty\n";
                return false;
            }
            options.user_agent = std::string{value};
            return true;
        })) {
        return false;
    }

    return true;
}

void PrintDyeMatchUsage() {
    std::cout << "Usage: dyematch <command> [options] [arguments]\n"
              << "Commands:\n"
              << "  probe <url>               Fetch and validate an image, print its format and size\n"
              << "  match <#hex>              Closest catalog entries for a color\n"
              << "  compare <id|#hex>...      Comparison grid for 2-4 dyes\n"
              << "  matrix <id|#hex>...       Contrast matrix for 2-4 dyes\n"
              << "  info <#hex>               Color conversions, luminance and readable text color\n"
              << "Options:\n"
              << "  --catalog <path>          Dye catalog JSON (required for match/compare/matrix)\n"
              << "  --count <n>               Matches to list (1-5, default 1)\n"
              << "  --out <path>              Write the rendered PNG here\n"
              << "  --svg <path>              Write the composed scene as SVG here\n"
              << "  --font <path>             TrueType font for PNG labels (labels are left out without one)\n"
              << "  --allowed-host <host>     Add an allowed image host (repeatable, replaces defaults)\n"
              << "  --max-file-size <bytes>   Download ceiling (default 10485760)\n"
              << "  --max-dimension <px>      Per-axis ceiling (default 4096)\n"
              << "  --max-pixels <n>          Pixel count ceiling (default 16000000)\n"
              << "  --fetch-timeout-ms <ms>   Fetch deadline (default 10000)\n"
              << "  --process-max-dimension <px> Downscale target before extraction (default 256)\n"
              << "  --filter <name>           Resampling filter (default catmull-rom)\n"
              << "  --rasterize-timeout-ms <ms> Rasterization deadline (default 5000)\n"
              << "  --scale <n>               Raster scale factor (1-8, default 2)\n"
              << "  --match-attempts <n>      Catalog lookups per palette slot (default 20)\n"
              << "  --exclude-category <name> Category skipped by matching (default Facewear, empty for none)\n"
              << "  --user-agent <text>       User-Agent for image fetches\n"
              << "  --verbose                 Enable tagged logging on stderr\n"
              << "  --help                    Show this message\n"
              << "Environment overrides: DYEMATCH_ALLOWED_HOSTS, DYEMATCH_MAX_FILE_SIZE, DYEMATCH_MAX_DIMENSION,\n"
              << "  DYEMATCH_MAX_PIXELS, DYEMATCH_FETCH_TIMEOUT_MS, DYEMATCH_PROCESS_MAX_DIMENSION, DYEMATCH_FILTER,\n"
              << "  DYEMATCH_RASTERIZE_TIMEOUT_MS, DYEMATCH_RASTER_SCALE, DYEMATCH_CATALOG,\n"
              << "  DYEMATCH_EXCLUDE_CATEGORY, DYEMATCH_USER_AGENT\n";
}

auto ParseDyeMatchArguments(int argc, char** argv) -> std::optional<DyeMatchOptions> {
    DyeMatchOptions options{};
    if (!ApplyDyeMatchEnvOverrides(options)) {
        return std::nullopt;
    }

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    auto parse_i64_flag = [&](int& index, std::string_view flag, std::int64_t min, std::int64_t max, std::int64_t& target) {
        auto value = require_value(index, flag);
        if (!value) {
            return false;
        }
        std::int64_t parsed = target;
        if (!parse_integer_in_range<std::int64_t>(*value, min, max, parsed)) {
            std::cerr << flag << " must be within " << min << "-" << max << "\n";
            return false;
        }
        target = parsed;
        return true;
    };

    auto parse_int_flag = [&](int& index, std::string_view flag, int min, int max, int& target) {
        std::int64_t wide = target;
        if (!parse_i64_flag(index, flag, min, max, wide)) {
            return false;
        }
        target = static_cast<int>(wide);
        return true;
    };

    bool hosts_from_flags = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--catalog") {
            if (auto value = require_value(i, "--catalog")) {
                options.catalog_path = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--count") {
            if (!parse_int_flag(i, "--count", 1, 5, options.color_count)) {
                return std::nullopt;
            }
        } else if (arg == "--out") {
            if (auto value = require_value(i, "--out")) {
                options.out_path = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--svg") {
            if (auto value = require_value(i, "--svg")) {
                options.svg_path = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--font") {
            if (auto value = require_value(i, "--font")) {
                options.font_path = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--allowed-host") {
            if (auto value = require_value(i, "--allowed-host")) {
                if (value->empty()) {
                    std::cerr << "--allowed-host must not be empty\n";
                    return std::nullopt;
                }
                if (!hosts_from_flags) {
                    options.allowed_hosts.clear();
                    hosts_from_flags = true;
                }
                options.allowed_hosts.push_back(lowercase(*value));
            } else {
                return std::nullopt;
            }
        } else if (arg == "--max-file-size") {
            if (!parse_i64_flag(i, "--max-file-size", 1, std::numeric_limits<std::int64_t>::max(), options.max_file_size_bytes)) {
                return std::nullopt;
            }
        } else if (arg == "--max-dimension") {
            if (!parse_int_flag(i, "--max-dimension", 1, std::numeric_limits<int>::max(), options.max_dimension)) {
                return std::nullopt;
            }
        } else if (arg == "--max-pixels") {
            if (!parse_i64_flag(i, "--max-pixels", 1, std::numeric_limits<std::int64_t>::max(), options.max_pixel_count)) {
                return std::nullopt;
            }
        } else if (arg == "--fetch-timeout-ms") {
            if (!parse_i64_flag(i, "--fetch-timeout-ms", 1, kMaxTimeoutMs, options.fetch_timeout_ms)) {
                return std::nullopt;
            }
        } else if (arg == "--process-max-dimension") {
            if (!parse_int_flag(i, "--process-max-dimension", 1, std::numeric_limits<int>::max(), options.process_max_dimension)) {
                return std::nullopt;
            }
        } else if (arg == "--filter") {
            if (auto value = require_value(i, "--filter")) {
                if (!ParseSamplingFilter(*value)) {
                    std::cerr << "--filter must be one of nearest, box, triangle, catmull-rom, mitchell\n";
                    return std::nullopt;
                }
                options.filter = lowercase(*value);
            } else {
                return std::nullopt;
            }
        } else if (arg == "--rasterize-timeout-ms") {
            if (!parse_i64_flag(i, "--rasterize-timeout-ms", 1, kMaxTimeoutMs, options.rasterize_timeout_ms)) {
                return std::nullopt;
            }
        } else if (arg == "--scale") {
            if (!parse_int_flag(i, "--scale", 1, kMaxRasterScale, options.raster_scale)) {
                return std::nullopt;
            }
        } else if (arg == "--match-attempts") {
            if (!parse_int_flag(i, "--match-attempts", 1, 1000, options.match_attempts)) {
                return std::nullopt;
            }
        } else if (arg == "--exclude-category") {
            if (auto value = require_value(i, "--exclude-category")) {
                options.exclude_category = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--user-agent") {
            if (auto value = require_value(i, "--user-agent")) {
                options.user_agent = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg.starts_with("--")) {
            std::cerr << "Unknown option: " << arg << "\n";
            return std::nullopt;
        } else if (options.command.empty()) {
            options.command = std::string{arg};
        } else {
            options.arguments.emplace_back(arg);
        }
    }

    if (options.show_help) {
        return options;
    }
    if (auto error = ValidateDyeMatchOptions(options)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }
    return options;
}

auto ToImageLimits(DyeMatchOptions const& options) -> Image::ImageLimits {
    return Image::ImageLimits{
        .max_file_size_bytes = options.max_file_size_bytes,
        .max_dimension       = options.max_dimension,
        .max_pixel_count     = options.max_pixel_count,
    };
}

auto ToUrlGuardOptions(DyeMatchOptions const& options) -> Image::UrlGuardOptions {
    return Image::UrlGuardOptions{.allowed_hosts = options.allowed_hosts};
}

auto ToFetchOptions(DyeMatchOptions const& options) -> Image::FetchOptions {
    return Image::FetchOptions{
        .timeout    = std::chrono::milliseconds{options.fetch_timeout_ms},
        .limits     = ToImageLimits(options),
        .user_agent = options.user_agent,
    };
}

auto ToDecoderOptions(DyeMatchOptions const& options) -> Image::StbDecoderOptions {
    return Image::StbDecoderOptions{.max_decoded_pixels = options.max_pixel_count};
}

auto ToProcessOptions(DyeMatchOptions const& options) -> Image::ProcessOptions {
    return Image::ProcessOptions{
        .max_dimension = options.process_max_dimension,
        .filter        = ParseSamplingFilter(options.filter).value_or(Image::kBestQualityFilter),
    };
}

auto ToRasterizeOptions(DyeMatchOptions const& options) -> Scene::RasterizeOptions {
    Scene::RasterizeOptions raster{};
    raster.scale   = options.raster_scale;
    raster.timeout = std::chrono::milliseconds{options.rasterize_timeout_ms};
    return raster;
}

auto ToMatcherOptions(DyeMatchOptions const& options) -> Catalog::MatcherOptions {
    return Catalog::MatcherOptions{.max_attempts = options.match_attempts};
}

auto ExcludedCategory(DyeMatchOptions const& options) -> std::optional<std::string> {
    if (options.exclude_category.empty()) {
        return std::nullopt;
    }
    return options.exclude_category;
}

auto ToPipelineOptions(DyeMatchOptions const& options) -> Pipeline::PipelineOptions {
    Pipeline::PipelineOptions pipeline{};
    pipeline.fetch            = ToFetchOptions(options);
    pipeline.process          = ToProcessOptions(options);
    pipeline.matcher          = ToMatcherOptions(options);
    pipeline.raster           = ToRasterizeOptions(options);
    pipeline.exclude_category = ExcludedCategory(options);
    return pipeline;
}

} // namespace DM::Config
