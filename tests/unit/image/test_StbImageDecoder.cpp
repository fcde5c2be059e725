#include "../DyeMatchTestHelper.hpp"

#include "dyematch/image/ImageProcessor.hpp"
#include "dyematch/image/StbImageDecoder.hpp"

#include <cstdlib>
#include <stdexcept>

using namespace DM;
using namespace DM::Image;
using DM::Test::make_png;
using DM::Test::to_bytes;

TEST_SUITE("image.stb") {

TEST_CASE("decodes a generated PNG to tightly packed RGBA") {
    StbImageDecoder decoder;
    auto const      png = make_png(8, 4, Color::Rgb{0xB0, 0x15, 0x15});

    auto image = decoder.load(png);
    REQUIRE(image.has_value());
    CHECK(decoder.width(*image) == 8);
    CHECK(decoder.height(*image) == 4);

    auto pixels = decoder.raw_pixels(*image);
    REQUIRE(pixels.has_value());
    REQUIRE(pixels->size() == 8u * 4u * 4u);
    CHECK((*pixels)[0] == 0xB0);
    CHECK((*pixels)[1] == 0x15);
    CHECK((*pixels)[2] == 0x15);
    CHECK((*pixels)[3] == 0xFF);

    decoder.release(*image);
    CHECK(decoder.live_handles() == 0);
}

TEST_CASE("resize produces a new handle with the requested size") {
    StbImageDecoder decoder;
    auto            image = decoder.load(make_png(16, 8, Color::Rgb{40, 120, 200}));
    REQUIRE(image.has_value());

    auto resized = decoder.resize(*image, 4, 2, SamplingFilter::CatmullRom);
    REQUIRE(resized.has_value());
    CHECK_FALSE(*resized == *image);
    CHECK(decoder.width(*resized) == 4);
    CHECK(decoder.height(*resized) == 2);
    CHECK(decoder.live_handles() == 2);

    auto pixels = decoder.raw_pixels(*resized);
    REQUIRE(pixels.has_value());
    CHECK(std::abs(static_cast<int>((*pixels)[0]) - 40) <= 1);
    CHECK(std::abs(static_cast<int>((*pixels)[1]) - 120) <= 1);
    CHECK(std::abs(static_cast<int>((*pixels)[2]) - 200) <= 1);

    decoder.release(*resized);
    decoder.release(*image);
    CHECK(decoder.live_handles() == 0);
}

TEST_CASE("handles are single-use") {
    StbImageDecoder decoder;
    auto            image = decoder.load(make_png(2, 2, Color::kWhite));
    REQUIRE(image.has_value());
    decoder.release(*image);
    CHECK_THROWS_AS(decoder.release(*image), std::invalid_argument);

    auto width = decoder.width(*image);
    REQUIRE_FALSE(width.has_value());
    CHECK(width.error().code == Error::Code::DecodeFailed);
}

TEST_CASE("garbage bytes fail to decode without leaking a handle") {
    StbImageDecoder decoder;
    auto            image = decoder.load(to_bytes("\x89PNG\r\n\x1a\n-definitely-not-a-png"));
    REQUIRE_FALSE(image.has_value());
    CHECK(image.error().code == Error::Code::DecodeFailed);
    CHECK(decoder.live_handles() == 0);

    CHECK_FALSE(decoder.load({}).has_value());
}

TEST_CASE("the decoder pixel ceiling is checked from the header") {
    StbImageDecoder decoder{StbDecoderOptions{.max_decoded_pixels = 100}};
    auto            image = decoder.load(make_png(20, 20, Color::kBlack));
    REQUIRE_FALSE(image.has_value());
    CHECK(image.error().message == "image exceeds decoder pixel ceiling");
}

TEST_CASE("probe reads the header without allocating a handle") {
    StbImageDecoder decoder{StbDecoderOptions{.max_decoded_pixels = 100}};
    auto            size = decoder.probe(make_png(40, 30, Color::kWhite));
    REQUIRE(size.has_value());
    CHECK(size->width == 40);
    CHECK(size->height == 30);
    CHECK(decoder.live_handles() == 0);

    auto garbage = decoder.probe(to_bytes("not an image at all"));
    REQUIRE_FALSE(garbage.has_value());
    CHECK(garbage.error().code == Error::Code::DecodeFailed);
    CHECK_FALSE(decoder.probe({}).has_value());
}

TEST_CASE("processing a real PNG end to end leaves no live handles") {
    StbImageDecoder decoder;
    ImageProcessor  processor{decoder};
    auto const      png = make_png(512, 128, Color::Rgb{0x96, 0xBD, 0xB9});

    auto processed = processor.process(png);
    REQUIRE(processed.has_value());
    CHECK(processed->width == 256);
    CHECK(processed->height == 64);
    CHECK(decoder.live_handles() == 0);

    auto samples = opaque_pixels(*processed);
    CHECK(samples.size() == 256u * 64u);
}

TEST_CASE("fully transparent images yield no opaque samples") {
    StbImageDecoder decoder;
    ImageProcessor  processor{decoder};
    auto            processed = processor.process(make_png(4, 4, Color::kWhite, 0));
    REQUIRE(processed.has_value());
    CHECK(opaque_pixels(*processed).empty());
}

}
