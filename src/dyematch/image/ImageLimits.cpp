#include <dyematch/image/ImageLimits.hpp>

#include <iomanip>
#include <sstream>

namespace DM::Image {

namespace {

constexpr double kBytesPerMiB     = 1024.0 * 1024.0;
constexpr double kPixelsPerMegapx = 1'000'000.0;

auto fixed(double value, int precision) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

auto empty_file_message() -> std::string {
    return "Image file is empty";
}

auto file_too_large_message(std::int64_t size_bytes, ImageLimits const& limits) -> std::string {
    return "Image too large (" + fixed(static_cast<double>(size_bytes) / kBytesPerMiB, 1) + "MB). Maximum size is "
           + fixed(static_cast<double>(limits.max_file_size_bytes) / kBytesPerMiB, 0) + "MB";
}

auto pixel_count(int width, int height) -> std::int64_t {
    return static_cast<std::int64_t>(width) * static_cast<std::int64_t>(height);
}

} // namespace

auto validate_file_size(std::int64_t size_bytes, ImageLimits const& limits) -> std::optional<std::string> {
    if (size_bytes <= 0) {
        return empty_file_message();
    }
    if (size_bytes > limits.max_file_size_bytes) {
        return file_too_large_message(size_bytes, limits);
    }
    return std::nullopt;
}

auto validate_dimensions(int width, int height, ImageLimits const& limits) -> std::optional<std::string> {
    if (width <= 0 || height <= 0) {
        return std::string{"Image has invalid dimensions"};
    }
    if (width > limits.max_dimension || height > limits.max_dimension) {
        return "Image too large (" + std::to_string(width) + "x" + std::to_string(height) + "). Maximum dimension is "
               + std::to_string(limits.max_dimension) + "px";
    }
    auto const pixels = pixel_count(width, height);
    if (pixels > limits.max_pixel_count) {
        return "Image has too many pixels (" + fixed(static_cast<double>(pixels) / kPixelsPerMegapx, 1) + "MP). Maximum is "
               + fixed(static_cast<double>(limits.max_pixel_count) / kPixelsPerMegapx, 0) + "MP";
    }
    return std::nullopt;
}

auto check_file_size(std::int64_t size_bytes, ImageLimits const& limits) -> Expected<void> {
    if (size_bytes <= 0) {
        return std::unexpected(Error{Error::Code::InvalidImage, empty_file_message()});
    }
    if (size_bytes > limits.max_file_size_bytes) {
        Error error{Error::Code::TooLarge, file_too_large_message(size_bytes, limits)};
        error.limit = Error::Limit::Bytes;
        return std::unexpected(std::move(error));
    }
    return {};
}

auto check_dimensions(int width, int height, ImageLimits const& limits) -> Expected<void> {
    auto message = validate_dimensions(width, height, limits);
    if (!message) {
        return {};
    }
    if (width <= 0 || height <= 0) {
        return std::unexpected(Error{Error::Code::InvalidImage, std::move(*message)});
    }
    Error error{Error::Code::TooLarge, std::move(*message)};
    error.limit = (width > limits.max_dimension || height > limits.max_dimension) ? Error::Limit::Dimensions
                                                                                  : Error::Limit::PixelCount;
    return std::unexpected(std::move(error));
}

} // namespace DM::Image
