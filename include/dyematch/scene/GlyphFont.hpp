#pragma once
#include "dyematch/core/Error.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace DM::Scene {

// One coverage bitmap per glyph, positioned relative to the pen on the baseline.
struct GlyphBitmap {
    int                       left{0};
    int                       top{0};
    int                       width{0};
    int                       height{0};
    std::vector<std::uint8_t> coverage;
};

struct TextLayout {
    double                   width{0.0};
    double                   ascent{0.0};
    double                   descent{0.0}; // negative, below the baseline
    std::vector<GlyphBitmap> glyphs;
};

// TrueType face read through stb_truetype. Copies share the loaded font data.
class GlyphFont {
public:
    static auto from_file(std::filesystem::path const& path) -> Expected<GlyphFont>;
    static auto from_bytes(std::vector<std::uint8_t> bytes) -> Expected<GlyphFont>;

    // `text` is UTF-8; `pixel_size` is the em size in device pixels.
    auto layout(std::string_view text, double pixel_size) const -> TextLayout;

private:
    struct Face;
    explicit GlyphFont(std::shared_ptr<Face const> face);

    std::shared_ptr<Face const> face_;
};

// Plain text of an already-escaped SVG label.
auto unescape_markup(std::string_view markup) -> std::string;

} // namespace DM::Scene
