#pragma once

#include "dyematch/catalog/CatalogMatcher.hpp"
#include "dyematch/image/ImageDecoder.hpp"
#include "dyematch/image/ImageFetcher.hpp"
#include "dyematch/image/ImageLimits.hpp"
#include "dyematch/image/ImageProcessor.hpp"
#include "dyematch/image/StbImageDecoder.hpp"
#include "dyematch/image/UrlGuard.hpp"
#include "dyematch/pipeline/MatchImagePipeline.hpp"
#include "dyematch/scene/Rasterizer.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace DM::Config {

struct DyeMatchOptions {
    std::vector<std::string> allowed_hosts{"cdn.discordapp.com", "media.discordapp.net"};
    std::int64_t             max_file_size_bytes{10 * 1024 * 1024};
    int                      max_dimension{4096};
    std::int64_t             max_pixel_count{16'000'000};
    std::int64_t             fetch_timeout_ms{10000};
    int                      process_max_dimension{256};
    std::string              filter{"catmull-rom"};
    std::int64_t             rasterize_timeout_ms{5000};
    int                      raster_scale{2};
    int                      match_attempts{20};
    std::string              catalog_path;
    std::string              font_path;
    std::string              exclude_category{"Facewear"};
    std::string              user_agent{"dyematch/1.0"};
    bool                     verbose{false};
    bool                     show_help{false};

    // Command line only.
    std::string              command;
    std::vector<std::string> arguments;
    int                      color_count{1};
    std::string              out_path;
    std::string              svg_path;
};

auto ParseDyeMatchArguments(int argc, char** argv) -> std::optional<DyeMatchOptions>;

void PrintDyeMatchUsage();

bool ApplyDyeMatchEnvOverrides(DyeMatchOptions& options);

auto ValidateDyeMatchOptions(DyeMatchOptions const& options) -> std::optional<std::string>;

// "nearest", "box", "triangle", "catmull-rom" or "mitchell".
auto ParseSamplingFilter(std::string_view name) -> std::optional<Image::SamplingFilter>;

auto ToImageLimits(DyeMatchOptions const& options) -> Image::ImageLimits;
auto ToUrlGuardOptions(DyeMatchOptions const& options) -> Image::UrlGuardOptions;
auto ToFetchOptions(DyeMatchOptions const& options) -> Image::FetchOptions;
// The decoder ceiling follows the configured pixel limit.
auto ToDecoderOptions(DyeMatchOptions const& options) -> Image::StbDecoderOptions;
auto ToProcessOptions(DyeMatchOptions const& options) -> Image::ProcessOptions;
auto ToRasterizeOptions(DyeMatchOptions const& options) -> Scene::RasterizeOptions;
auto ToMatcherOptions(DyeMatchOptions const& options) -> Catalog::MatcherOptions;
auto ExcludedCategory(DyeMatchOptions const& options) -> std::optional<std::string>;
auto ToPipelineOptions(DyeMatchOptions const& options) -> Pipeline::PipelineOptions;

} // namespace DM::Config
