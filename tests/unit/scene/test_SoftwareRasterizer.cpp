#include "../DyeMatchTestHelper.hpp"
#include "SceneTestHelper.hpp"

#include "dyematch/scene/SoftwareRasterizer.hpp"

#include <stb/stb_image.h>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <string>
#include <utility>

using namespace DM;
using namespace DM::Scene;
using DM::Test::test_font;

namespace {

struct DecodedPng {
    int                       width{0};
    int                       height{0};
    std::vector<std::uint8_t> rgba;

    auto at(int x, int y) const -> std::array<std::uint8_t, 4> {
        auto const offset = (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)) * 4u;
        return {rgba[offset], rgba[offset + 1], rgba[offset + 2], rgba[offset + 3]};
    }
};

auto decode(std::vector<std::uint8_t> const& png) -> DecodedPng {
    DecodedPng decoded;
    int        channels = 0;
    auto*      pixels   = stbi_load_from_memory(png.data(), static_cast<int>(png.size()), &decoded.width, &decoded.height, &channels, 4);
    REQUIRE(pixels != nullptr);
    decoded.rgba.assign(pixels, pixels + static_cast<std::size_t>(decoded.width) * static_cast<std::size_t>(decoded.height) * 4u);
    stbi_image_free(pixels);
    return decoded;
}

auto filled_rect(double x, double y, double w, double h, Color::Rgb fill) -> Element {
    RectElement rect;
    rect.x      = x;
    rect.y      = y;
    rect.width  = w;
    rect.height = h;
    rect.fill   = fill;
    return Element{rect};
}

auto sized_scene(int width, int height) -> ::DM::Scene::Scene {
    ::DM::Scene::Scene scene;
    scene.width  = width;
    scene.height = height;
    return scene;
}

using Pixel = std::array<std::uint8_t, 4>;

auto label(double x, double y, std::string markup, TextAnchor anchor) -> Element {
    TextElement text;
    text.x         = x;
    text.y         = y;
    text.markup    = std::move(markup);
    text.fill      = Color::kBlack;
    text.font_size = 14.0;
    text.anchor    = anchor;
    text.baseline  = TextBaseline::Middle;
    return Element{text};
}

// Columns holding at least one non-white pixel.
auto inked_columns(DecodedPng const& decoded) -> std::pair<int, int> {
    int first = decoded.width;
    int last  = -1;
    for (int y = 0; y < decoded.height; ++y) {
        for (int x = 0; x < decoded.width; ++x) {
            auto const pixel = decoded.at(x, y);
            if (pixel[0] < 200 || pixel[1] < 200 || pixel[2] < 200) {
                first = std::min(first, x);
                last  = std::max(last, x);
            }
        }
    }
    return {first, last};
}

} // namespace

TEST_SUITE("scene.raster") {

TEST_CASE("device size is the logical size times the scale") {
    auto scene = sized_scene(10, 4);
    scene.elements.push_back(filled_rect(0, 0, 10, 4, Color::Rgb{0xB0, 0x15, 0x15}));

    SoftwareRasterizer rasterizer;
    RasterizeOptions   options{};
    options.scale = 3;
    auto png      = rasterizer.rasterize(scene, options);
    REQUIRE(png.has_value());

    auto decoded = decode(*png);
    CHECK(decoded.width == 30);
    CHECK(decoded.height == 12);
    CHECK(decoded.at(0, 0) == Pixel{0xB0, 0x15, 0x15, 255});
    CHECK(decoded.at(29, 11) == Pixel{0xB0, 0x15, 0x15, 255});
}

TEST_CASE("uncovered pixels stay transparent unless a background is set") {
    auto scene = sized_scene(4, 4);
    scene.elements.push_back(filled_rect(0, 0, 2, 4, Color::kWhite));

    SoftwareRasterizer rasterizer;
    RasterizeOptions   options{};
    options.scale = 1;

    auto bare = decode(*rasterizer.rasterize(scene, options));
    CHECK(bare.at(0, 0) == Pixel{255, 255, 255, 255});
    CHECK(bare.at(3, 0)[3] == 0);

    options.background = Color::Rgb{0x12, 0x34, 0x56};
    auto backed        = decode(*rasterizer.rasterize(scene, options));
    CHECK(backed.at(3, 0) == Pixel{0x12, 0x34, 0x56, 255});
    CHECK(backed.at(1, 3) == Pixel{255, 255, 255, 255});
}

TEST_CASE("later elements paint over earlier ones and opacity blends") {
    auto scene = sized_scene(4, 2);
    scene.elements.push_back(filled_rect(0, 0, 4, 2, Color::kBlack));
    RectElement half;
    half.width   = 2;
    half.height  = 2;
    half.fill    = Color::kWhite;
    half.opacity = 0.5;
    scene.elements.push_back(Element{half});
    scene.elements.push_back(filled_rect(3, 0, 1, 2, Color::Rgb{0, 0xFF, 0}));

    SoftwareRasterizer rasterizer;
    RasterizeOptions   options{};
    options.scale = 1;
    auto decoded  = decode(*rasterizer.rasterize(scene, options));

    auto blended = decoded.at(0, 0);
    CHECK(blended[0] == 128);
    CHECK(blended[3] == 255);
    CHECK(decoded.at(2, 1) == Pixel{0, 0, 0, 255});
    CHECK(decoded.at(3, 1) == Pixel{0, 0xFF, 0, 255});
}

TEST_CASE("circles and polygons cover their interiors only") {
    auto scene = sized_scene(20, 20);
    scene.elements.push_back(Element{CircleElement{5, 5, 4, Color::kWhite}});
    scene.elements.push_back(Element{PolygonElement{{{10, 10}, {20, 10}, {20, 20}}, Color::kWhite}});

    SoftwareRasterizer rasterizer;
    RasterizeOptions   options{};
    options.scale = 1;
    auto decoded  = decode(*rasterizer.rasterize(scene, options));

    CHECK(decoded.at(5, 5)[3] == 255);
    CHECK(decoded.at(0, 0)[3] == 0);
    CHECK(decoded.at(18, 12)[3] == 255);
    CHECK(decoded.at(11, 18)[3] == 0);
}

TEST_CASE("text is skipped without a font and the render still succeeds") {
    auto scene = sized_scene(4, 4);
    TextElement label;
    label.markup = "Dalamud Red Dye";
    scene.elements.push_back(Element{label});

    SoftwareRasterizer rasterizer;
    auto png = rasterizer.rasterize(scene, RasterizeOptions{});
    REQUIRE(png.has_value());
    auto decoded = decode(*png);
    CHECK(decoded.width == 8);
    CHECK(std::ranges::all_of(decoded.rgba, [](std::uint8_t byte) { return byte == 0; }));
}

TEST_CASE("labels are drawn when a font is loaded") {
    auto font = test_font();
    if (!font) {
        MESSAGE("DYEMATCH_TEST_FONT not set, label rendering not checked");
        return;
    }
    SoftwareRasterizer rasterizer{*font};
    RasterizeOptions   options{};
    options.scale      = 1;
    options.background = Color::kWhite;

    auto scene = sized_scene(120, 30);
    scene.elements.push_back(label(60, 15, "Dalamud &amp; Red", TextAnchor::Middle));
    auto png = rasterizer.rasterize(scene, options);
    REQUIRE(png.has_value());
    auto decoded        = decode(*png);
    auto [first, last]  = inked_columns(decoded);
    REQUIRE(last >= first);
    CHECK(first > 0);
    CHECK(last < 119);
    CHECK(std::abs((first + last) / 2 - 60) <= 4);
    CHECK(decoded.at(0, 0) == Pixel{255, 255, 255, 255});
    CHECK(decoded.at(60, 0) == Pixel{255, 255, 255, 255});
}

TEST_CASE("the text anchor decides which side of x a label lands on") {
    auto font = test_font();
    if (!font) {
        MESSAGE("DYEMATCH_TEST_FONT not set, label anchoring not checked");
        return;
    }
    SoftwareRasterizer rasterizer{*font};
    RasterizeOptions   options{};
    options.scale      = 1;
    options.background = Color::kWhite;

    auto starts = sized_scene(120, 30);
    starts.elements.push_back(label(60, 15, "Snow", TextAnchor::Start));
    auto start_png = rasterizer.rasterize(starts, options);
    REQUIRE(start_png.has_value());
    auto [start_first, start_last] = inked_columns(decode(*start_png));
    CHECK(start_first >= 59);
    CHECK(start_last > 60);

    auto ends = sized_scene(120, 30);
    ends.elements.push_back(label(60, 15, "Snow", TextAnchor::End));
    auto end_png = rasterizer.rasterize(ends, options);
    REQUIRE(end_png.has_value());
    auto [end_first, end_last] = inked_columns(decode(*end_png));
    CHECK(end_last <= 61);
    CHECK(end_first < 60);
}

TEST_CASE("invalid canvases are rejected") {
    SoftwareRasterizer rasterizer;

    RasterizeOptions bad_scale{};
    bad_scale.scale = 0;
    auto scaled     = rasterizer.rasterize(sized_scene(4, 4), bad_scale);
    REQUIRE_FALSE(scaled.has_value());
    CHECK(scaled.error().code == Error::Code::RasterizeFailed);
    CHECK(scaled.error().message == "scale must be positive");

    auto empty = rasterizer.rasterize(sized_scene(0, 10), RasterizeOptions{});
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error().message == "invalid canvas 0x20");

    auto huge = rasterizer.rasterize(sized_scene(10000, 10), RasterizeOptions{});
    REQUIRE_FALSE(huge.has_value());
    CHECK(huge.error().code == Error::Code::RasterizeFailed);
}

}
