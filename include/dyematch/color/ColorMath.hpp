#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace DM::Color {

struct Rgb {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    friend constexpr auto operator==(Rgb const&, Rgb const&) -> bool = default;
};

// Hue in degrees [0, 360); saturation and value as percentages [0, 100].
struct Hsv {
    double h = 0.0;
    double s = 0.0;
    double v = 0.0;
};

enum class HexCase {
    Lower,
    Upper
};

// Background luminance above which black label text reads better than white.
// 0.179 is where the WCAG contrast against black and against white are equal.
inline constexpr double kTextLuminanceThreshold = 0.179;

inline constexpr Rgb kBlack{0, 0, 0};
inline constexpr Rgb kWhite{255, 255, 255};

// Accepts "RRGGBB" or "#RRGGBB", any case. Shorthand is not accepted here.
auto hex_to_rgb(std::string_view hex) -> std::optional<Rgb>;
auto rgb_to_hex(Rgb rgb, HexCase letter_case = HexCase::Lower) -> std::string;

auto is_valid_hex(std::string_view input, bool allow_shorthand = true) -> bool;
// "#f00" / "F00" / "ff0000" -> "#FF0000"; nullopt when the input is not a hex color.
auto normalize_hex(std::string_view input) -> std::optional<std::string>;

auto rgb_to_hsv(Rgb rgb) -> Hsv;

auto color_distance(Rgb a, Rgb b) -> double;
auto color_distance(std::string_view hex_a, std::string_view hex_b) -> std::optional<double>;

auto relative_luminance(Rgb rgb) -> double;
auto relative_luminance(std::string_view hex) -> std::optional<double>;

auto contrast_ratio(Rgb a, Rgb b) -> double;
auto contrast_ratio(std::string_view hex_a, std::string_view hex_b) -> std::optional<double>;

auto contrast_text_color(Rgb background) -> Rgb;

auto format_rgb(Rgb rgb) -> std::string;
auto format_hsv(Hsv hsv) -> std::string;

} // namespace DM::Color
