#pragma once
#include "dyematch/image/ImageDecoder.hpp"
#include "dyematch/image/ImageLimits.hpp"

#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace DM::Image {

struct StbDecoderOptions {
    // Hard ceiling on what the decoder will allocate, read from the header before decoding.
    std::int64_t max_decoded_pixels = ImageLimits{}.max_pixel_count;
};

// PNG, JPEG, GIF and BMP through stb_image, WebP through libwebp, resampling through
// stb_image_resize2. Handles live in a per-instance table.
class StbImageDecoder final : public ImageDecoder {
public:
    StbImageDecoder() = default;
    explicit StbImageDecoder(StbDecoderOptions options);

    auto probe(std::span<std::uint8_t const> bytes) const -> Expected<ImageDimensions> override;
    auto load(std::span<std::uint8_t const> bytes) -> Expected<NativeImage> override;
    auto width(NativeImage image) const -> Expected<int> override;
    auto height(NativeImage image) const -> Expected<int> override;
    auto resize(NativeImage image, int width, int height, SamplingFilter filter) -> Expected<NativeImage> override;
    auto duplicate(NativeImage image) -> Expected<NativeImage> override;
    auto raw_pixels(NativeImage image) const -> Expected<std::vector<std::uint8_t>> override;
    void release(NativeImage image) override;

    [[nodiscard]] auto live_handles() const -> std::size_t;

private:
    struct Bitmap {
        int                       width{0};
        int                       height{0};
        std::vector<std::uint8_t> rgba;
    };

    auto store(Bitmap bitmap) -> NativeImage;
    // Caller holds mutex_.
    auto find_locked(NativeImage image) const -> Bitmap const*;

    StbDecoderOptions                          options_{};
    mutable std::mutex                         mutex_;
    std::unordered_map<std::uint64_t, Bitmap>  bitmaps_;
    std::uint64_t                              next_id_{1};
};

} // namespace DM::Image
