#pragma once
#include "dyematch/core/Error.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace DM::Image {

struct ImageLimits {
    std::int64_t max_file_size_bytes = 10 * 1024 * 1024;
    int          max_dimension       = 4096;
    // Checked on its own so a tall, thin image cannot slip past the per-axis ceiling.
    std::int64_t max_pixel_count = 16'000'000;
};

// Human-readable rejection, or nullopt when the value is acceptable.
auto validate_file_size(std::int64_t size_bytes, ImageLimits const& limits = {}) -> std::optional<std::string>;
auto validate_dimensions(int width, int height, ImageLimits const& limits = {}) -> std::optional<std::string>;

// Same checks, typed: InvalidImage for empty/non-positive input, TooLarge tagged with the tripped limit.
auto check_file_size(std::int64_t size_bytes, ImageLimits const& limits = {}) -> Expected<void>;
auto check_dimensions(int width, int height, ImageLimits const& limits = {}) -> Expected<void>;

} // namespace DM::Image
