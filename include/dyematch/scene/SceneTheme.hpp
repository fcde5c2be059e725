#pragma once
#include "dyematch/color/ColorMath.hpp"

#include <string_view>

namespace DM::Scene {

enum class FontRole {
    Header,
    Primary,
    Mono
};

namespace Theme {
inline constexpr Color::Rgb kBackground{0x1a, 0x1a, 0x2e};
inline constexpr Color::Rgb kBackgroundLight{0x2d, 0x2d, 0x3d};
inline constexpr Color::Rgb kText{0xff, 0xff, 0xff};
inline constexpr Color::Rgb kTextMuted{0x90, 0x90, 0x90};
inline constexpr Color::Rgb kTextDim{0x66, 0x66, 0x66};
inline constexpr Color::Rgb kAccent{0x58, 0x65, 0xf2};
inline constexpr Color::Rgb kBorder{0x40, 0x40, 0x50};
inline constexpr Color::Rgb kSuccess{0x57, 0xf2, 0x87};
inline constexpr Color::Rgb kWarning{0xfe, 0xe7, 0x5c};
inline constexpr Color::Rgb kError{0xed, 0x42, 0x45};

inline constexpr Color::Rgb kBlue{0x3b, 0x82, 0xf6};
inline constexpr Color::Rgb kGreen{0x22, 0xc5, 0x5e};
inline constexpr Color::Rgb kAmber{0xf5, 0x9e, 0x0b};
} // namespace Theme

inline constexpr auto font_family(FontRole role) -> std::string_view {
    switch (role) {
    case FontRole::Header:
        return "Space Grotesk";
    case FontRole::Primary:
        return "Onest";
    case FontRole::Mono:
        return "Habibi";
    }
    return "Onest";
}

} // namespace DM::Scene
