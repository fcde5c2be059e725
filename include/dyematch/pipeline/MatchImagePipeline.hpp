#pragma once
#include "dyematch/catalog/CatalogMatcher.hpp"
#include "dyematch/catalog/ColorCatalog.hpp"
#include "dyematch/catalog/PaletteExtractor.hpp"
#include "dyematch/core/Error.hpp"
#include "dyematch/image/FormatSniffer.hpp"
#include "dyematch/image/HttpTransport.hpp"
#include "dyematch/image/ImageDecoder.hpp"
#include "dyematch/image/ImageFetcher.hpp"
#include "dyematch/image/ImageProcessor.hpp"
#include "dyematch/image/UrlGuard.hpp"
#include "dyematch/log/LogSink.hpp"
#include "dyematch/scene/Rasterizer.hpp"
#include "dyematch/scene/SceneComposer.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace DM::Pipeline {

inline constexpr int kMinColorCount = 1;
inline constexpr int kMaxColorCount = 5;

auto clamp_color_count(int requested) -> int;

// Collaborators are constructed once by the host and shared across requests.
struct PipelineServices {
    Image::UrlGuard                                guard;
    std::shared_ptr<Image::HttpTransport>          transport;
    std::shared_ptr<Image::ImageDecoder>           decoder;
    std::shared_ptr<Catalog::PaletteExtractor>     extractor;
    std::shared_ptr<Catalog::ColorCatalog const>   catalog;
    std::shared_ptr<Scene::Rasterizer>             rasterizer;
    LogSink*                                       log = &default_log_sink();
};

struct PipelineOptions {
    Image::FetchOptions        fetch{};
    Image::ProcessOptions      process{};
    Catalog::MatcherOptions    matcher{};
    Scene::RasterizeOptions    raster{};
    std::uint8_t               alpha_threshold = 128;
    std::optional<std::string> exclude_category{"Facewear"};
};

struct MatchImageRequest {
    std::string url;
    int         color_count = 1;
};

struct MatchImageResult {
    std::vector<std::uint8_t>          png;
    std::vector<Catalog::PaletteEntry> entries;
    std::string                        summary;
    std::string                        title;
    Image::ImageFormat                 format{Image::ImageFormat::Png};
    int                                width{0}; // source image, before downscaling
    int                                height{0};
};

class MatchImagePipeline {
public:
    explicit MatchImagePipeline(PipelineServices services, PipelineOptions options = {});

    auto run(MatchImageRequest const& request) -> Expected<MatchImageResult>;

private:
    auto log() -> LogSink& { return *services_.log; }

    PipelineServices services_;
    PipelineOptions  options_;
};

auto palette_title(int color_count) -> std::string;

// "**1.** **Dalamud Red** (`#AA1111`) [EXCELLENT] - 42% · Δ8.5", one line per entry.
auto build_match_summary(std::span<Catalog::PaletteEntry const> entries) -> std::string;
auto build_comparison_summary(Scene::ComparisonAnalysis const& analysis) -> std::string;

// Copy for the end user, chosen by error kind. Validation messages pass through verbatim.
auto user_message(Error const& error) -> std::string;
// Timeouts and transport or rendering hiccups, where asking the user to try again makes sense.
auto is_retryable(Error const& error) -> bool;

} // namespace DM::Pipeline
