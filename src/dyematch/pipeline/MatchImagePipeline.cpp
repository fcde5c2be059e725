#include <dyematch/pipeline/MatchImagePipeline.hpp>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace DM::Pipeline {

namespace {

auto fixed(double value, int precision) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

auto format_percent(double value) -> std::string {
    if (std::abs(value - std::round(value)) < 1e-9) {
        return std::to_string(static_cast<long long>(std::llround(value)));
    }
    return fixed(value, 1);
}

auto upper_hex(Color::Rgb rgb) -> std::string {
    return Color::rgb_to_hex(rgb, Color::HexCase::Upper);
}

auto describe_pair(Scene::DyePair const& pair) -> std::string {
    return std::to_string(pair.index1 + 1) + " ↔ " + std::to_string(pair.index2 + 1) + " (Δ" + fixed(pair.distance, 1) + ", "
           + std::string{Color::distance_band_label(Color::distance_band(pair.distance))} + ", contrast "
           + fixed(pair.contrast_ratio, 2) + ":1 " + std::string{Color::contrast_rating_label(Color::contrast_rating(pair.contrast_ratio))}
           + ")";
}

} // namespace

auto clamp_color_count(int requested) -> int {
    return std::clamp(requested, kMinColorCount, kMaxColorCount);
}

auto palette_title(int color_count) -> std::string {
    if (color_count == 1) {
        return "Color Match";
    }
    return std::to_string(color_count) + " Color Palette";
}

MatchImagePipeline::MatchImagePipeline(PipelineServices services, PipelineOptions options)
    : services_(std::move(services)), options_(std::move(options)) {
    if (services_.log == nullptr) {
        services_.log = &default_log_sink();
    }
}

auto MatchImagePipeline::run(MatchImageRequest const& request) -> Expected<MatchImageResult> {
    if (!services_.transport || !services_.decoder || !services_.extractor || !services_.catalog || !services_.rasterizer) {
        return std::unexpected(Error{Error::Code::MalformedInput, "pipeline is missing a collaborator"});
    }

    auto fail = [this](Error error) -> Expected<MatchImageResult> {
        log().warn("Pipeline", describeError(error));
        return std::unexpected(std::move(error));
    };

    auto url = services_.guard.validate(request.url);
    if (!url) {
        return fail(std::move(url.error()));
    }

    Image::ImageFetcher fetcher(services_.guard, *services_.transport, options_.fetch, log());
    auto                fetched = fetcher.fetch(*url);
    if (!fetched) {
        return std::unexpected(std::move(fetched.error())); // the fetcher already logged it
    }
    std::span<std::uint8_t const> bytes{fetched->bytes};

    auto format = Image::validate_image_format(bytes);
    if (!format) {
        return fail(std::move(format.error()));
    }

    Image::ImageProcessor processor(*services_.decoder, log());
    auto                  source = processor.dimensions(bytes);
    if (!source) {
        return fail(std::move(source.error()));
    }
    if (auto within = Image::check_dimensions(source->width, source->height, options_.fetch.limits); !within) {
        return fail(std::move(within.error()));
    }

    auto processed = processor.process(bytes, options_.process);
    if (!processed) {
        return fail(std::move(processed.error()));
    }

    auto samples = Image::opaque_pixels(*processed, options_.alpha_threshold);
    if (samples.empty()) {
        return fail(Error{Error::Code::NoColorsExtracted, "image has no opaque pixels"});
    }

    int const color_count = clamp_color_count(request.color_count);
    auto      extracted   = services_.extractor->extract(samples, color_count);
    if (!extracted) {
        return fail(std::move(extracted.error()));
    }
    if (extracted->empty()) {
        return fail(Error{Error::Code::NoColorsExtracted, "palette extractor returned no colors"});
    }

    Catalog::CatalogMatcher matcher(*services_.catalog, log(), options_.matcher);
    auto                    entries = matcher.match_palette(*extracted, options_.exclude_category);
    if (entries.empty()) {
        return fail(Error{Error::Code::NoMatchFound, "no catalog entry matched the extracted colors"});
    }

    MatchImageResult result;
    result.title  = palette_title(color_count);
    result.format = *format;
    result.width  = source->width;
    result.height = source->height;

    Scene::PaletteGridOptions grid;
    grid.title = result.title;
    auto scene = Scene::compose_palette_grid(entries, grid);

    auto png = Scene::rasterize_with_deadline(services_.rasterizer, std::move(scene), options_.raster);
    if (!png) {
        return fail(std::move(png.error()));
    }

    result.png     = std::move(*png);
    result.summary = build_match_summary(entries);
    result.entries = std::move(entries);
    log().info("Pipeline", "matched " + std::to_string(result.entries.size()) + " colors from " + url->normalized_url());
    return result;
}

auto build_match_summary(std::span<Catalog::PaletteEntry const> entries) -> std::string {
    std::string summary;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        auto const& entry = entries[i];
        if (i > 0) {
            summary.push_back('\n');
        }
        summary += "**" + std::to_string(i + 1) + ".** **" + entry.matched.name + "** (`" + upper_hex(entry.matched.rgb()) + "`) ["
                   + std::string{Color::match_quality_short_label(Color::match_quality(entry.distance))} + "] - "
                   + format_percent(entry.dominance) + "% · Δ" + fixed(entry.distance, 1);
    }
    return summary;
}

auto build_comparison_summary(Scene::ComparisonAnalysis const& analysis) -> std::string {
    std::ostringstream out;
    for (std::size_t i = 0; i < analysis.entries.size(); ++i) {
        auto const& entry = analysis.entries[i];
        out << "**" << (i + 1) << ".** **" << entry.name << "**\n";
        out << "`" << upper_hex(entry.rgb()) << "` · `" << Color::format_rgb(entry.rgb()) << "` · `"
            << Color::format_hsv(Color::rgb_to_hsv(entry.rgb())) << "`\n";
    }
    out << "**Most Similar:** " << describe_pair(analysis.most_similar) << '\n';
    out << "**Most Different:** " << describe_pair(analysis.most_different);
    return out.str();
}

auto user_message(Error const& error) -> std::string {
    switch (error.code) {
    case Error::Code::InvalidUrl:
    case Error::Code::TooLarge:
    case Error::Code::InvalidImage:
        return error.message.value_or("The image could not be accepted.");
    case Error::Code::UnsafeRedirect:
        return "Only images uploaded directly to Discord can be analyzed.";
    case Error::Code::FetchTimeout:
        return "Image download timed out. Please try again.";
    case Error::Code::FetchFailed:
        return "Could not download the image. Please try again.";
    case Error::Code::UnsupportedFormat:
        return "Unsupported image format. Please use PNG, JPEG, GIF, WebP, or BMP.";
    case Error::Code::DecodeFailed:
        return "The image could not be decoded. It may be corrupted.";
    case Error::Code::NoColorsExtracted:
        return "The image appears to be fully transparent or too small to analyze.";
    case Error::Code::NoMatchFound:
        return "Could not find any matching dyes in the database.";
    case Error::Code::RasterizeFailed:
        return "Could not render the result image. Please try again.";
    case Error::Code::MalformedInput:
        break;
    }
    return "An error occurred while processing the image.";
}

auto is_retryable(Error const& error) -> bool {
    switch (error.code) {
    case Error::Code::FetchTimeout:
    case Error::Code::RasterizeFailed:
        return true;
    case Error::Code::FetchFailed:
        return !error.http_status || *error.http_status == 0 || *error.http_status >= 500;
    default:
        return false;
    }
}

} // namespace DM::Pipeline
