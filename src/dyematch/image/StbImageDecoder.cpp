#include <dyematch/image/StbImageDecoder.hpp>
#include <dyematch/image/FormatSniffer.hpp>

#include "log/TaggedLogger.hpp"

#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_STDIO
#include <stb/stb_image.h>
#undef STB_IMAGE_IMPLEMENTATION

#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include <stb/stb_image_resize2.h>
#undef STB_IMAGE_RESIZE_IMPLEMENTATION

#include <webp/decode.h>

#include <limits>
#include <memory>
#include <stdexcept>

namespace DM::Image {

namespace {

auto decode_error(std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{Error::Code::DecodeFailed, std::move(message)});
}

auto unknown_handle(NativeImage image) -> std::unexpected<Error> {
    return decode_error("unknown image handle " + std::to_string(image.id));
}

auto to_stbir_filter(SamplingFilter filter) -> stbir_filter {
    switch (filter) {
    case SamplingFilter::Nearest:
        return STBIR_FILTER_POINT_SAMPLE;
    case SamplingFilter::Box:
        return STBIR_FILTER_BOX;
    case SamplingFilter::Triangle:
        return STBIR_FILTER_TRIANGLE;
    case SamplingFilter::CatmullRom:
        return STBIR_FILTER_CATMULLROM;
    case SamplingFilter::Mitchell:
        return STBIR_FILTER_MITCHELL;
    }
    return STBIR_FILTER_DEFAULT;
}

auto rgba_size(int width, int height) -> std::size_t {
    return static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4u;
}

} // namespace

StbImageDecoder::StbImageDecoder(StbDecoderOptions options)
    : options_(options) {}

auto StbImageDecoder::probe(std::span<std::uint8_t const> bytes) const -> Expected<ImageDimensions> {
    if (bytes.empty()) {
        return decode_error("empty image buffer");
    }
    if (bytes.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return decode_error("image buffer too large to decode");
    }

    ImageDimensions size;
    if (detect_image_format(bytes) == ImageFormat::Webp) {
        if (WebPGetInfo(bytes.data(), bytes.size(), &size.width, &size.height) == 0) {
            return decode_error("invalid webp header");
        }
    } else {
        int channels = 0;
        if (stbi_info_from_memory(bytes.data(), static_cast<int>(bytes.size()), &size.width, &size.height, &channels) == 0) {
            auto const* reason = stbi_failure_reason();
            return decode_error(reason ? reason : "unrecognised image data");
        }
    }
    if (size.width <= 0 || size.height <= 0) {
        return decode_error("image header reports no pixels");
    }
    return size;
}

auto StbImageDecoder::load(std::span<std::uint8_t const> bytes) -> Expected<NativeImage> {
    auto header = probe(bytes);
    if (!header) {
        return std::unexpected(std::move(header.error()));
    }
    if (static_cast<std::int64_t>(header->width) * header->height > options_.max_decoded_pixels) {
        return decode_error("image exceeds decoder pixel ceiling");
    }

    Bitmap bitmap;
    if (detect_image_format(bytes) == ImageFormat::Webp) {
        std::unique_ptr<std::uint8_t, void (*)(void*)> pixels(
                WebPDecodeRGBA(bytes.data(), bytes.size(), &bitmap.width, &bitmap.height), WebPFree);
        if (!pixels) {
            return decode_error("failed to decode webp image");
        }
        bitmap.rgba.assign(pixels.get(), pixels.get() + rgba_size(bitmap.width, bitmap.height));
    } else {
        int            channels = 0;
        unsigned char* decoded  = stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()), &bitmap.width, &bitmap.height,
                                                        &channels, STBI_rgb_alpha);
        if (!decoded || bitmap.width <= 0 || bitmap.height <= 0) {
            if (decoded) {
                stbi_image_free(decoded);
            }
            auto const* reason = stbi_failure_reason();
            return decode_error(reason ? reason : "failed to decode image");
        }
        std::unique_ptr<unsigned char, void (*)(void*)> pixels(decoded, stbi_image_free);
        bitmap.rgba.assign(pixels.get(), pixels.get() + rgba_size(bitmap.width, bitmap.height));
    }
    return store(std::move(bitmap));
}

auto StbImageDecoder::width(NativeImage image) const -> Expected<int> {
    std::lock_guard const lock{mutex_};
    auto const*           bitmap = find_locked(image);
    if (!bitmap) {
        return unknown_handle(image);
    }
    return bitmap->width;
}

auto StbImageDecoder::height(NativeImage image) const -> Expected<int> {
    std::lock_guard const lock{mutex_};
    auto const*           bitmap = find_locked(image);
    if (!bitmap) {
        return unknown_handle(image);
    }
    return bitmap->height;
}

auto StbImageDecoder::resize(NativeImage image, int width, int height, SamplingFilter filter) -> Expected<NativeImage> {
    if (width <= 0 || height <= 0) {
        return decode_error("invalid resize target");
    }
    Bitmap source;
    {
        std::lock_guard const lock{mutex_};
        auto const*           bitmap = find_locked(image);
        if (!bitmap) {
            return unknown_handle(image);
        }
        source = *bitmap;
    }

    Bitmap target;
    target.width  = width;
    target.height = height;
    target.rgba.resize(rgba_size(width, height));
    auto* result = stbir_resize(source.rgba.data(), source.width, source.height, 0,
                                target.rgba.data(), width, height, 0,
                                STBIR_RGBA, STBIR_TYPE_UINT8, STBIR_EDGE_CLAMP, to_stbir_filter(filter));
    if (!result) {
        return decode_error("failed to resize image");
    }
    return store(std::move(target));
}

auto StbImageDecoder::duplicate(NativeImage image) -> Expected<NativeImage> {
    Bitmap copy;
    {
        std::lock_guard const lock{mutex_};
        auto const*           bitmap = find_locked(image);
        if (!bitmap) {
            return unknown_handle(image);
        }
        copy = *bitmap;
    }
    return store(std::move(copy));
}

auto StbImageDecoder::raw_pixels(NativeImage image) const -> Expected<std::vector<std::uint8_t>> {
    std::lock_guard const lock{mutex_};
    auto const*           bitmap = find_locked(image);
    if (!bitmap) {
        return unknown_handle(image);
    }
    return bitmap->rgba;
}

void StbImageDecoder::release(NativeImage image) {
    std::lock_guard const lock{mutex_};
    if (bitmaps_.erase(image.id) == 0) {
        throw std::invalid_argument("release of unknown or already released image handle " + std::to_string(image.id));
    }
    dm_log("released handle " + std::to_string(image.id), "Decode.Handle", "DEBUG");
}

auto StbImageDecoder::live_handles() const -> std::size_t {
    std::lock_guard const lock{mutex_};
    return bitmaps_.size();
}

auto StbImageDecoder::store(Bitmap bitmap) -> NativeImage {
    std::lock_guard const lock{mutex_};
    NativeImage           handle{next_id_++};
    bitmaps_.emplace(handle.id, std::move(bitmap));
    dm_log("allocated handle " + std::to_string(handle.id), "Decode.Handle", "DEBUG");
    return handle;
}

auto StbImageDecoder::find_locked(NativeImage image) const -> Bitmap const* {
    auto it = bitmaps_.find(image.id);
    if (it == bitmaps_.end()) {
        return nullptr;
    }
    return &it->second;
}

} // namespace DM::Image
