#include <dyematch/image/FormatSniffer.hpp>

#include <algorithm>
#include <array>

namespace DM::Image {

namespace {

constexpr std::size_t kMinimumSniffBytes = 12;

constexpr std::array<std::uint8_t, 4> kPngMagic{0x89, 0x50, 0x4E, 0x47};
constexpr std::array<std::uint8_t, 3> kJpegMagic{0xFF, 0xD8, 0xFF};
constexpr std::array<std::uint8_t, 3> kGifMagic{0x47, 0x49, 0x46};
constexpr std::array<std::uint8_t, 4> kRiffMagic{0x52, 0x49, 0x46, 0x46};
constexpr std::array<std::uint8_t, 4> kWebpMarker{0x57, 0x45, 0x42, 0x50};
constexpr std::array<std::uint8_t, 2> kBmpMagic{0x42, 0x4D};

template <std::size_t N>
auto matches_at(std::span<std::uint8_t const> bytes, std::size_t offset, std::array<std::uint8_t, N> const& magic) -> bool {
    if (bytes.size() < offset + N) {
        return false;
    }
    return std::ranges::equal(bytes.subspan(offset, N), magic);
}

} // namespace

auto detect_image_format(std::span<std::uint8_t const> bytes) -> std::optional<ImageFormat> {
    if (bytes.size() < kMinimumSniffBytes) {
        return std::nullopt;
    }
    if (matches_at(bytes, 0, kPngMagic))
        return ImageFormat::Png;
    if (matches_at(bytes, 0, kJpegMagic))
        return ImageFormat::Jpeg;
    if (matches_at(bytes, 0, kGifMagic))
        return ImageFormat::Gif;
    if (matches_at(bytes, 0, kRiffMagic) && matches_at(bytes, 8, kWebpMarker))
        return ImageFormat::Webp;
    if (matches_at(bytes, 0, kBmpMagic))
        return ImageFormat::Bmp;
    return std::nullopt;
}

auto validate_image_format(std::span<std::uint8_t const> bytes) -> Expected<ImageFormat> {
    if (auto format = detect_image_format(bytes)) {
        return *format;
    }
    return std::unexpected(Error{Error::Code::UnsupportedFormat, "Unsupported image format. Use PNG, JPEG, GIF, WebP, or BMP"});
}

auto format_name(ImageFormat format) -> std::string_view {
    switch (format) {
    case ImageFormat::Png:
        return "png";
    case ImageFormat::Jpeg:
        return "jpeg";
    case ImageFormat::Gif:
        return "gif";
    case ImageFormat::Webp:
        return "webp";
    case ImageFormat::Bmp:
        return "bmp";
    }
    return "unknown";
}

auto format_mime_type(ImageFormat format) -> std::string_view {
    switch (format) {
    case ImageFormat::Png:
        return "image/png";
    case ImageFormat::Jpeg:
        return "image/jpeg";
    case ImageFormat::Gif:
        return "image/gif";
    case ImageFormat::Webp:
        return "image/webp";
    case ImageFormat::Bmp:
        return "image/bmp";
    }
    return "application/octet-stream";
}

} // namespace DM::Image
