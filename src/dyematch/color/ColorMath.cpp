#include <dyematch/color/ColorMath.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <sstream>

namespace DM::Color {

namespace {

auto hex_digit(char ch) -> std::optional<std::uint8_t> {
    if (ch >= '0' && ch <= '9') {
        return static_cast<std::uint8_t>(ch - '0');
    }
    if (ch >= 'a' && ch <= 'f') {
        return static_cast<std::uint8_t>(10 + ch - 'a');
    }
    if (ch >= 'A' && ch <= 'F') {
        return static_cast<std::uint8_t>(10 + ch - 'A');
    }
    return std::nullopt;
}

auto strip_marker(std::string_view input) -> std::string_view {
    if (!input.empty() && input.front() == '#') {
        input.remove_prefix(1);
    }
    return input;
}

auto all_hex(std::string_view digits) -> bool {
    return std::ranges::all_of(digits, [](char ch) { return hex_digit(ch).has_value(); });
}

auto srgb_channel_to_linear(std::uint8_t channel) -> double {
    auto const s = static_cast<double>(channel) / 255.0;
    if (s <= 0.03928) {
        return s / 12.92;
    }
    return std::pow((s + 0.055) / 1.055, 2.4);
}

} // namespace

auto hex_to_rgb(std::string_view hex) -> std::optional<Rgb> {
    auto digits = strip_marker(hex);
    if (digits.size() != 6 || !all_hex(digits)) {
        return std::nullopt;
    }
    auto channel = [&](std::size_t offset) {
        return static_cast<std::uint8_t>((*hex_digit(digits[offset]) << 4) | *hex_digit(digits[offset + 1]));
    };
    return Rgb{channel(0), channel(2), channel(4)};
}

auto rgb_to_hex(Rgb rgb, HexCase letter_case) -> std::string {
    static constexpr char kLower[] = "0123456789abcdef";
    static constexpr char kUpper[] = "0123456789ABCDEF";
    char const*           digits   = letter_case == HexCase::Upper ? kUpper : kLower;

    std::string hex;
    hex.reserve(7);
    hex.push_back('#');
    for (std::uint8_t channel : {rgb.r, rgb.g, rgb.b}) {
        hex.push_back(digits[(channel >> 4) & 0x0F]);
        hex.push_back(digits[channel & 0x0F]);
    }
    return hex;
}

auto is_valid_hex(std::string_view input, bool allow_shorthand) -> bool {
    auto digits = strip_marker(input);
    if (!all_hex(digits)) {
        return false;
    }
    return digits.size() == 6 || (allow_shorthand && digits.size() == 3);
}

auto normalize_hex(std::string_view input) -> std::optional<std::string> {
    if (!is_valid_hex(input)) {
        return std::nullopt;
    }
    auto        digits = strip_marker(input);
    std::string expanded;
    expanded.reserve(7);
    expanded.push_back('#');
    for (char ch : digits) {
        auto upper = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        expanded.push_back(upper);
        if (digits.size() == 3) {
            expanded.push_back(upper);
        }
    }
    return expanded;
}

auto rgb_to_hsv(Rgb rgb) -> Hsv {
    auto const r = static_cast<double>(rgb.r) / 255.0;
    auto const g = static_cast<double>(rgb.g) / 255.0;
    auto const b = static_cast<double>(rgb.b) / 255.0;

    auto const max   = std::max({r, g, b});
    auto const min   = std::min({r, g, b});
    auto const delta = max - min;

    Hsv hsv{};
    hsv.v = max * 100.0;
    hsv.s = max == 0.0 ? 0.0 : (delta / max) * 100.0;
    if (delta == 0.0) {
        return hsv;
    }

    double hue = 0.0;
    if (max == r) {
        hue = (g - b) / delta + (g < b ? 6.0 : 0.0);
    } else if (max == g) {
        hue = (b - r) / delta + 2.0;
    } else {
        hue = (r - g) / delta + 4.0;
    }
    hsv.h = std::fmod(hue * 60.0, 360.0);
    return hsv;
}

auto color_distance(Rgb a, Rgb b) -> double {
    auto const dr = static_cast<double>(a.r) - static_cast<double>(b.r);
    auto const dg = static_cast<double>(a.g) - static_cast<double>(b.g);
    auto const db = static_cast<double>(a.b) - static_cast<double>(b.b);
    return std::sqrt(dr * dr + dg * dg + db * db);
}

auto color_distance(std::string_view hex_a, std::string_view hex_b) -> std::optional<double> {
    auto a = hex_to_rgb(hex_a);
    auto b = hex_to_rgb(hex_b);
    if (!a || !b) {
        return std::nullopt;
    }
    return color_distance(*a, *b);
}

auto relative_luminance(Rgb rgb) -> double {
    return 0.2126 * srgb_channel_to_linear(rgb.r)
           + 0.7152 * srgb_channel_to_linear(rgb.g)
           + 0.0722 * srgb_channel_to_linear(rgb.b);
}

auto relative_luminance(std::string_view hex) -> std::optional<double> {
    auto rgb = hex_to_rgb(hex);
    if (!rgb) {
        return std::nullopt;
    }
    return relative_luminance(*rgb);
}

auto contrast_ratio(Rgb a, Rgb b) -> double {
    auto const la      = relative_luminance(a);
    auto const lb      = relative_luminance(b);
    auto const lighter = std::max(la, lb);
    auto const darker  = std::min(la, lb);
    return (lighter + 0.05) / (darker + 0.05);
}

auto contrast_ratio(std::string_view hex_a, std::string_view hex_b) -> std::optional<double> {
    auto a = hex_to_rgb(hex_a);
    auto b = hex_to_rgb(hex_b);
    if (!a || !b) {
        return std::nullopt;
    }
    return contrast_ratio(*a, *b);
}

auto contrast_text_color(Rgb background) -> Rgb {
    return relative_luminance(background) > kTextLuminanceThreshold ? kBlack : kWhite;
}

auto format_rgb(Rgb rgb) -> std::string {
    std::ostringstream oss;
    oss << "RGB(" << static_cast<int>(rgb.r) << ", " << static_cast<int>(rgb.g) << ", " << static_cast<int>(rgb.b) << ")";
    return oss.str();
}

auto format_hsv(Hsv hsv) -> std::string {
    auto hue = static_cast<int>(std::lround(hsv.h)) % 360;
    std::ostringstream oss;
    oss << "HSV(" << hue << ", " << std::lround(hsv.s) << "%, " << std::lround(hsv.v) << "%)";
    return oss.str();
}

} // namespace DM::Color
