#include <dyematch/scene/GlyphFont.hpp>

#define STB_TRUETYPE_IMPLEMENTATION
#include <stb/stb_truetype.h>
#undef STB_TRUETYPE_IMPLEMENTATION

#include <array>
#include <cmath>
#include <fstream>
#include <iterator>
#include <utility>

namespace DM::Scene {

struct GlyphFont::Face {
    std::vector<std::uint8_t> bytes;
    stbtt_fontinfo            info{};
};

namespace {

constexpr char32_t kReplacementChar = 0xFFFD;

auto font_error(std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{Error::Code::MalformedInput, std::move(message)});
}

// Malformed sequences decode to U+FFFD one byte at a time.
auto decode_utf8(std::string_view text) -> std::vector<char32_t> {
    std::vector<char32_t> codepoints;
    codepoints.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        auto const lead = static_cast<unsigned char>(text[i]);
        int        extra = 0;
        char32_t   value = 0;
        if (lead < 0x80) {
            value = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            value = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            value = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            value = lead & 0x07;
        } else {
            codepoints.push_back(kReplacementChar);
            ++i;
            continue;
        }
        if (i + static_cast<std::size_t>(extra) >= text.size()) {
            codepoints.push_back(kReplacementChar);
            ++i;
            continue;
        }
        bool valid = true;
        for (int k = 1; k <= extra; ++k) {
            auto const next = static_cast<unsigned char>(text[i + static_cast<std::size_t>(k)]);
            if ((next & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            value = (value << 6) | (next & 0x3F);
        }
        if (!valid) {
            codepoints.push_back(kReplacementChar);
            ++i;
            continue;
        }
        codepoints.push_back(value);
        i += static_cast<std::size_t>(extra) + 1;
    }
    return codepoints;
}

} // namespace

GlyphFont::GlyphFont(std::shared_ptr<Face const> face)
    : face_(std::move(face)) {}

auto GlyphFont::from_file(std::filesystem::path const& path) -> Expected<GlyphFont> {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return font_error("cannot open font file " + path.string());
    }
    std::vector<std::uint8_t> bytes{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
    auto font = from_bytes(std::move(bytes));
    if (!font) {
        font.error().message = "font file " + path.string() + " is not a TrueType font";
    }
    return font;
}

auto GlyphFont::from_bytes(std::vector<std::uint8_t> bytes) -> Expected<GlyphFont> {
    // Offset table plus one table record is the smallest header stb_truetype will walk.
    if (bytes.size() < 28) {
        return font_error("font data is truncated");
    }
    auto face   = std::make_shared<Face>();
    face->bytes = std::move(bytes);
    int const offset = stbtt_GetFontOffsetForIndex(face->bytes.data(), 0);
    if (offset < 0 || stbtt_InitFont(&face->info, face->bytes.data(), offset) == 0) {
        return font_error("font data is not a TrueType font");
    }
    return GlyphFont{std::move(face)};
}

auto GlyphFont::layout(std::string_view text, double pixel_size) const -> TextLayout {
    TextLayout result;
    if (pixel_size <= 0.0) {
        return result;
    }
    auto const& info  = face_->info;
    float const scale = stbtt_ScaleForMappingEmToPixels(&info, static_cast<float>(pixel_size));

    int ascent = 0, descent = 0, line_gap = 0;
    stbtt_GetFontVMetrics(&info, &ascent, &descent, &line_gap);
    result.ascent  = ascent * scale;
    result.descent = descent * scale;

    double pen      = 0.0;
    int    previous = 0;
    for (char32_t codepoint : decode_utf8(text)) {
        int const glyph = stbtt_FindGlyphIndex(&info, static_cast<int>(codepoint));
        if (previous != 0) {
            pen += scale * stbtt_GetGlyphKernAdvance(&info, previous, glyph);
        }

        double const origin = std::floor(pen);
        float const  shift  = static_cast<float>(pen - origin);
        int          x0 = 0, y0 = 0, x1 = 0, y1 = 0;
        stbtt_GetGlyphBitmapBoxSubpixel(&info, glyph, scale, scale, shift, 0.0f, &x0, &y0, &x1, &y1);
        if (x1 > x0 && y1 > y0) {
            GlyphBitmap bitmap;
            bitmap.left   = static_cast<int>(origin) + x0;
            bitmap.top    = y0;
            bitmap.width  = x1 - x0;
            bitmap.height = y1 - y0;
            bitmap.coverage.resize(static_cast<std::size_t>(bitmap.width) * static_cast<std::size_t>(bitmap.height));
            stbtt_MakeGlyphBitmapSubpixel(&info, bitmap.coverage.data(), bitmap.width, bitmap.height, bitmap.width, scale, scale,
                                          shift, 0.0f, glyph);
            result.glyphs.push_back(std::move(bitmap));
        }

        int advance = 0, left_bearing = 0;
        stbtt_GetGlyphHMetrics(&info, glyph, &advance, &left_bearing);
        pen += advance * scale;
        previous = glyph;
    }
    result.width = pen;
    return result;
}

auto unescape_markup(std::string_view markup) -> std::string {
    static constexpr std::array<std::pair<std::string_view, char>, 5> kEntities{{
            {"&amp;", '&'},
            {"&lt;", '<'},
            {"&gt;", '>'},
            {"&quot;", '"'},
            {"&apos;", '\''},
    }};
    std::string text;
    text.reserve(markup.size());
    std::size_t i = 0;
    while (i < markup.size()) {
        bool replaced = false;
        if (markup[i] == '&') {
            for (auto const& [entity, ch] : kEntities) {
                if (markup.substr(i).starts_with(entity)) {
                    text.push_back(ch);
                    i += entity.size();
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) {
            text.push_back(markup[i]);
            ++i;
        }
    }
    return text;
}

} // namespace DM::Scene
