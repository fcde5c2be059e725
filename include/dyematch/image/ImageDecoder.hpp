#pragma once
#include "dyematch/core/Error.hpp"

#include <compare>
#include <cstdint>
#include <span>
#include <vector>

namespace DM::Image {

// Opaque handle into the decoder that issued it. Every handle returned by load, resize or
// duplicate must be passed to release exactly once.
struct NativeImage {
    std::uint64_t id{0};

    friend constexpr auto operator==(NativeImage const&, NativeImage const&) -> bool = default;
};

struct ImageDimensions {
    int width{0};
    int height{0};
};

enum class SamplingFilter {
    Nearest,
    Box,
    Triangle,
    CatmullRom,
    Mitchell
};

inline constexpr SamplingFilter kBestQualityFilter = SamplingFilter::CatmullRom;

class ImageDecoder {
public:
    virtual ~ImageDecoder() = default;

    // Width and height from the header alone. Allocates no handle and decodes no pixels.
    virtual auto probe(std::span<std::uint8_t const> bytes) const -> Expected<ImageDimensions>                    = 0;
    virtual auto load(std::span<std::uint8_t const> bytes) -> Expected<NativeImage>                               = 0;
    virtual auto width(NativeImage image) const -> Expected<int>                                                  = 0;
    virtual auto height(NativeImage image) const -> Expected<int>                                                 = 0;
    virtual auto resize(NativeImage image, int width, int height, SamplingFilter filter) -> Expected<NativeImage> = 0;
    // A new handle with the same pixels; used when no resize is needed so cleanup stays uniform.
    virtual auto duplicate(NativeImage image) -> Expected<NativeImage> = 0;
    // Tightly packed RGBA8, row-major.
    virtual auto raw_pixels(NativeImage image) const -> Expected<std::vector<std::uint8_t>> = 0;
    // Throws when the handle is unknown to this decoder or was already released.
    virtual void release(NativeImage image) = 0;
};

} // namespace DM::Image
