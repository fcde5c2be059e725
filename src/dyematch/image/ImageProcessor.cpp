#include <dyematch/image/ImageProcessor.hpp>

#include <algorithm>
#include <cmath>
#include <exception>

namespace DM::Image {

namespace {

auto wrap_decode_error(std::string message, Error const& underlying) -> Error {
    Error error{Error::Code::DecodeFailed, std::move(message)};
    error.cause = underlying.message.value_or(std::string{errorCodeToString(underlying.code)});
    return error;
}

auto read_dimensions(ImageDecoder const& decoder, NativeImage image) -> Expected<ImageDimensions> {
    auto width = decoder.width(image);
    if (!width) {
        return std::unexpected(wrap_decode_error("Failed to read image dimensions", width.error()));
    }
    auto height = decoder.height(image);
    if (!height) {
        return std::unexpected(wrap_decode_error("Failed to read image dimensions", height.error()));
    }
    return ImageDimensions{*width, *height};
}

} // namespace

ScopedNativeImage::ScopedNativeImage(ImageDecoder& decoder, LogSink& log, NativeImage image)
    : decoder_(decoder), log_(log), image_(image) {}

ScopedNativeImage::~ScopedNativeImage() {
    if (!image_) {
        return;
    }
    try {
        decoder_.release(*image_);
    } catch (std::exception const& ex) {
        log_.warn("Decode", "failed to release image handle " + std::to_string(image_->id) + ": " + ex.what());
    } catch (...) {
        log_.warn("Decode", "failed to release image handle " + std::to_string(image_->id) + ": unknown exception");
    }
}

auto compute_resize_target(int width, int height, int max_dimension) -> ImageDimensions {
    if (width <= max_dimension && height <= max_dimension) {
        return {width, height};
    }
    if (width >= height) {
        auto scaled = static_cast<int>(std::lround(static_cast<double>(height) * max_dimension / width));
        return {max_dimension, std::max(scaled, 1)};
    }
    auto scaled = static_cast<int>(std::lround(static_cast<double>(width) * max_dimension / height));
    return {std::max(scaled, 1), max_dimension};
}

auto opaque_pixels(ProcessedImage const& image, std::uint8_t alpha_threshold) -> std::vector<Color::Rgb> {
    std::vector<Color::Rgb> samples;
    samples.reserve(image.pixels.size() / 4u);
    for (std::size_t i = 0; i + 3 < image.pixels.size(); i += 4) {
        if (image.pixels[i + 3] < alpha_threshold) {
            continue;
        }
        samples.push_back(Color::Rgb{image.pixels[i], image.pixels[i + 1], image.pixels[i + 2]});
    }
    return samples;
}

ImageProcessor::ImageProcessor(ImageDecoder& decoder, LogSink& log)
    : decoder_(decoder), log_(log) {}

auto ImageProcessor::process(std::span<std::uint8_t const> bytes, ProcessOptions const& options) -> Expected<ProcessedImage> {
    if (options.max_dimension <= 0) {
        return std::unexpected(Error{Error::Code::InvalidImage, "max_dimension must be positive"});
    }

    auto loaded = decoder_.load(bytes);
    if (!loaded) {
        return std::unexpected(wrap_decode_error("Failed to decode image", loaded.error()));
    }
    ScopedNativeImage original(decoder_, log_, *loaded);

    auto source = read_dimensions(decoder_, original.get());
    if (!source) {
        return std::unexpected(std::move(source.error()));
    }

    auto const target = compute_resize_target(source->width, source->height, options.max_dimension);
    bool const resize = target.width != source->width || target.height != source->height;

    auto produced = resize ? decoder_.resize(original.get(), target.width, target.height, options.filter)
                           : decoder_.duplicate(original.get());
    if (!produced) {
        return std::unexpected(wrap_decode_error("Failed to resize image", produced.error()));
    }
    // Destroyed before `original`, so the resized handle is released first.
    ScopedNativeImage resized(decoder_, log_, *produced);
    if (resized.get() == original.get()) {
        original.disown();
    }

    auto final_size = read_dimensions(decoder_, resized.get());
    if (!final_size) {
        return std::unexpected(std::move(final_size.error()));
    }
    auto pixels = decoder_.raw_pixels(resized.get());
    if (!pixels) {
        return std::unexpected(wrap_decode_error("Failed to read image pixels", pixels.error()));
    }
    auto const expected_size = static_cast<std::size_t>(final_size->width) * static_cast<std::size_t>(final_size->height) * 4u;
    if (pixels->size() != expected_size) {
        return std::unexpected(Error{Error::Code::DecodeFailed, "Decoded pixel buffer has an unexpected size"});
    }

    return ProcessedImage{std::move(*pixels), final_size->width, final_size->height};
}

auto ImageProcessor::dimensions(std::span<std::uint8_t const> bytes) const -> Expected<ImageDimensions> {
    auto size = decoder_.probe(bytes);
    if (!size) {
        return std::unexpected(wrap_decode_error("Failed to read image header", size.error()));
    }
    return *size;
}

} // namespace DM::Image
