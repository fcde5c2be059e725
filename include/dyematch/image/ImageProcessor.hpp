#pragma once
#include "dyematch/color/ColorMath.hpp"
#include "dyematch/core/Error.hpp"
#include "dyematch/image/ImageDecoder.hpp"
#include "dyematch/log/LogSink.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace DM::Image {

struct ProcessOptions {
    int            max_dimension = 256;
    SamplingFilter filter        = kBestQualityFilter;
};

struct ProcessedImage {
    std::vector<std::uint8_t> pixels; // RGBA8
    int                       width{0};
    int                       height{0};
};

// Owns one decoder handle and releases it on scope exit. Release failures are logged, never thrown.
class ScopedNativeImage {
public:
    ScopedNativeImage(ImageDecoder& decoder, LogSink& log, NativeImage image);
    ~ScopedNativeImage();

    ScopedNativeImage(ScopedNativeImage const&)            = delete;
    ScopedNativeImage& operator=(ScopedNativeImage const&) = delete;

    [[nodiscard]] auto get() const -> NativeImage { return *image_; }
    // Stops tracking the handle; used when another guard owns the same handle.
    void disown() { image_.reset(); }

private:
    ImageDecoder&              decoder_;
    LogSink&                   log_;
    std::optional<NativeImage> image_;
};

// Larger axis becomes max_dimension, the other is scaled and rounded, never below 1.
// Returns the input unchanged when both axes already fit.
auto compute_resize_target(int width, int height, int max_dimension) -> ImageDimensions;

// RGB samples of pixels whose alpha is at least alpha_threshold.
auto opaque_pixels(ProcessedImage const& image, std::uint8_t alpha_threshold = 128) -> std::vector<Color::Rgb>;

class ImageProcessor {
public:
    explicit ImageProcessor(ImageDecoder& decoder, LogSink& log = default_log_sink());

    auto process(std::span<std::uint8_t const> bytes, ProcessOptions const& options = {}) -> Expected<ProcessedImage>;
    // Header size only; no handle is allocated.
    auto dimensions(std::span<std::uint8_t const> bytes) const -> Expected<ImageDimensions>;

private:
    ImageDecoder& decoder_;
    LogSink&      log_;
};

} // namespace DM::Image
