#pragma once
#include "dyematch/core/Error.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace DM::Image {

enum class ImageFormat {
    Png,
    Jpeg,
    Gif,
    Webp,
    Bmp
};

// Signature match on the leading bytes. Buffers shorter than 12 bytes never match.
auto detect_image_format(std::span<std::uint8_t const> bytes) -> std::optional<ImageFormat>;
auto validate_image_format(std::span<std::uint8_t const> bytes) -> Expected<ImageFormat>;

auto format_name(ImageFormat format) -> std::string_view;
auto format_mime_type(ImageFormat format) -> std::string_view;

} // namespace DM::Image
