#include <dyematch/catalog/CatalogMatcher.hpp>
#include <dyematch/catalog/JsonColorCatalog.hpp>
#include <dyematch/color/Banding.hpp>
#include <dyematch/color/ColorMath.hpp>
#include <dyematch/config/DyeMatchOptions.hpp>
#include <dyematch/image/FormatSniffer.hpp>
#include <dyematch/image/HttplibTransport.hpp>
#include <dyematch/image/ImageFetcher.hpp>
#include <dyematch/image/ImageLimits.hpp>
#include <dyematch/image/ImageProcessor.hpp>
#include <dyematch/image/StbImageDecoder.hpp>
#include <dyematch/image/UrlGuard.hpp>
#include <dyematch/log/LogSink.hpp>
#include <dyematch/pipeline/MatchImagePipeline.hpp>
#include <dyematch/scene/SceneComposer.hpp>
#include <dyematch/scene/SoftwareRasterizer.hpp>
#include <dyematch/scene/SvgWriter.hpp>

#include <nlohmann/json.hpp>

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

using json = nlohmann::json;
using DM::Config::DyeMatchOptions;

auto fail(DM::Error const& error) -> int {
    std::cerr << "error: " << DM::describeError(error) << "\n";
    std::cerr << DM::Pipeline::user_message(error) << "\n";
    return EXIT_FAILURE;
}

auto fail(std::string_view message) -> int {
    std::cerr << "error: " << message << "\n";
    return EXIT_FAILURE;
}

auto write_file(std::string const& path, std::string_view bytes) -> bool {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(out);
}

auto rgb_json(DM::Color::Rgb rgb) -> json {
    return json{{"r", rgb.r}, {"g", rgb.g}, {"b", rgb.b}};
}

auto entry_json(DM::Catalog::CatalogEntry const& entry) -> json {
    return json{{"id", entry.id}, {"name", entry.name}, {"hex", entry.hex}, {"category", entry.category}, {"rgb", rgb_json(entry.rgb())}};
}

auto load_catalog(DyeMatchOptions const& options) -> DM::Expected<std::shared_ptr<DM::Catalog::JsonColorCatalog const>> {
    if (options.catalog_path.empty()) {
        return std::unexpected(DM::Error{DM::Error::Code::MalformedInput, "--catalog (or DYEMATCH_CATALOG) is required"});
    }
    auto catalog = DM::Catalog::JsonColorCatalog::load_file(options.catalog_path);
    if (!catalog) {
        return std::unexpected(catalog.error());
    }
    return std::make_shared<DM::Catalog::JsonColorCatalog const>(std::move(*catalog));
}

// "#AA1111" resolves to the closest catalog entry, anything else must be a catalog id.
auto resolve_dye(DM::Catalog::ColorCatalog const& catalog, std::string_view token) -> DM::Expected<DM::Catalog::CatalogEntry> {
    if (token.starts_with('#')) {
        auto hex = DM::Color::normalize_hex(token);
        if (!hex) {
            return std::unexpected(DM::Error{DM::Error::Code::MalformedInput, "Invalid hex color: " + std::string{token}});
        }
        if (auto entry = catalog.find_closest(*DM::Color::hex_to_rgb(*hex), {})) {
            return *entry;
        }
        return std::unexpected(DM::Error{DM::Error::Code::NoMatchFound, "No catalog entry near " + *hex});
    }
    DM::Catalog::CatalogId id = 0;
    auto result = std::from_chars(token.data(), token.data() + token.size(), id);
    if (result.ec != std::errc{} || result.ptr != token.data() + token.size()) {
        return std::unexpected(DM::Error{DM::Error::Code::MalformedInput, "Not a dye id or hex color: " + std::string{token}});
    }
    if (auto entry = catalog.find_by_id(id)) {
        return *entry;
    }
    return std::unexpected(DM::Error{DM::Error::Code::NoMatchFound, "Unknown dye id " + std::string{token}});
}

auto make_rasterizer(DyeMatchOptions const& options) -> DM::Expected<std::shared_ptr<DM::Scene::Rasterizer>> {
    if (options.font_path.empty()) {
        return std::make_shared<DM::Scene::SoftwareRasterizer>();
    }
    auto font = DM::Scene::GlyphFont::from_file(options.font_path);
    if (!font) {
        return std::unexpected(font.error());
    }
    return std::make_shared<DM::Scene::SoftwareRasterizer>(std::move(*font));
}

auto write_scene(DyeMatchOptions const& options, DM::Scene::Scene const& scene) -> int {
    if (!options.svg_path.empty()) {
        if (!write_file(options.svg_path, DM::Scene::to_svg(scene))) {
            return fail("could not write " + options.svg_path);
        }
    }
    if (!options.out_path.empty()) {
        auto rasterizer = make_rasterizer(options);
        if (!rasterizer) {
            return fail(rasterizer.error());
        }
        auto png = DM::Scene::rasterize_with_deadline(std::move(*rasterizer), scene, DM::Config::ToRasterizeOptions(options));
        if (!png) {
            return fail(png.error());
        }
        std::string_view bytes{reinterpret_cast<char const*>(png->data()), png->size()};
        if (!write_file(options.out_path, bytes)) {
            return fail("could not write " + options.out_path);
        }
    }
    return EXIT_SUCCESS;
}

auto run_probe(DyeMatchOptions const& options) -> int {
    if (options.arguments.size() != 1) {
        return fail("probe takes exactly one URL");
    }
    DM::Image::UrlGuard guard{DM::Config::ToUrlGuardOptions(options)};
    auto                url = guard.validate(options.arguments.front());
    if (!url) {
        return fail(url.error());
    }

    DM::Image::HttplibTransport transport;
    auto const                  fetch_options = DM::Config::ToFetchOptions(options);
    DM::Image::ImageFetcher     fetcher{guard, transport, fetch_options};
    auto                        fetched = fetcher.fetch(*url);
    if (!fetched) {
        return fail(fetched.error());
    }

    std::span<std::uint8_t const> bytes{fetched->bytes};
    auto                          format = DM::Image::validate_image_format(bytes);
    if (!format) {
        return fail(format.error());
    }

    DM::Image::StbImageDecoder decoder{DM::Config::ToDecoderOptions(options)};
    DM::Image::ImageProcessor  processor{decoder};
    auto                       size = processor.dimensions(bytes);
    if (!size) {
        return fail(size.error());
    }
    if (auto checked = DM::Image::check_dimensions(size->width, size->height, fetch_options.limits); !checked) {
        return fail(checked.error());
    }

    json report{
            {"url", url->normalized_url()},
            {"final_url", fetched->final_url},
            {"redirected", fetched->redirected},
            {"bytes", fetched->bytes.size()},
            {"format", DM::Image::format_name(*format)},
            {"mime_type", DM::Image::format_mime_type(*format)},
            {"width", size->width},
            {"height", size->height},
    };
    if (fetched->declared_content_length) {
        report["content_length"] = *fetched->declared_content_length;
    }
    std::cout << report.dump(2) << "\n";
    return EXIT_SUCCESS;
}

auto run_match(DyeMatchOptions const& options) -> int {
    if (options.arguments.size() != 1) {
        return fail("match takes exactly one hex color");
    }
    auto hex = DM::Color::normalize_hex(options.arguments.front());
    if (!hex) {
        return fail("Invalid hex color: " + options.arguments.front());
    }
    auto catalog = load_catalog(options);
    if (!catalog) {
        return fail(catalog.error());
    }

    auto const                    target = *DM::Color::hex_to_rgb(*hex);
    DM::Catalog::CatalogMatcher   matcher{**catalog, DM::default_log_sink(), DM::Config::ToMatcherOptions(options)};
    auto                          matches = matcher.match_many(target, options.color_count, DM::Config::ExcludedCategory(options));
    if (matches.empty()) {
        return fail(DM::Error{DM::Error::Code::NoMatchFound, "No matching dyes found"});
    }

    std::vector<DM::Catalog::PaletteEntry> entries;
    json                                   listing = json::array();
    for (auto const& match : matches) {
        entries.push_back(DM::Catalog::PaletteEntry{target, match.entry, match.distance, 100.0});
        auto quality = DM::Color::match_quality(match.distance);
        listing.push_back(json{
                {"dye", entry_json(match.entry)},
                {"distance", match.distance},
                {"quality", DM::Color::match_quality_label(quality)},
        });
    }

    json report{
            {"target", *hex},
            {"matches", listing},
            {"summary", DM::Pipeline::build_match_summary(entries)},
    };
    std::cout << report.dump(2) << "\n";

    DM::Scene::PaletteGridOptions grid{};
    grid.title = DM::Pipeline::palette_title(static_cast<int>(entries.size()));
    return write_scene(options, DM::Scene::compose_palette_grid(entries, grid));
}

auto resolve_dyes(DyeMatchOptions const& options, DM::Catalog::ColorCatalog const& catalog)
        -> DM::Expected<std::vector<DM::Catalog::CatalogEntry>> {
    std::vector<DM::Catalog::CatalogEntry> dyes;
    for (auto const& token : options.arguments) {
        auto dye = resolve_dye(catalog, token);
        if (!dye) {
            return std::unexpected(dye.error());
        }
        dyes.push_back(std::move(*dye));
    }
    return dyes;
}

auto run_compare(DyeMatchOptions const& options) -> int {
    auto catalog = load_catalog(options);
    if (!catalog) {
        return fail(catalog.error());
    }
    auto dyes = resolve_dyes(options, **catalog);
    if (!dyes) {
        return fail(dyes.error());
    }
    auto analysis = DM::Scene::analyze_comparison(*dyes);
    if (!analysis) {
        return fail("compare needs at least 2 dyes");
    }
    json report{
            {"dyes", json::array()},
            {"summary", DM::Pipeline::build_comparison_summary(*analysis)},
    };
    for (auto const& dye : analysis->entries) {
        report["dyes"].push_back(entry_json(dye));
    }
    std::cout << report.dump(2) << "\n";
    return write_scene(options, DM::Scene::compose_comparison_grid(*dyes));
}

auto run_matrix(DyeMatchOptions const& options) -> int {
    auto catalog = load_catalog(options);
    if (!catalog) {
        return fail(catalog.error());
    }
    auto dyes = resolve_dyes(options, **catalog);
    if (!dyes) {
        return fail(dyes.error());
    }
    if (dyes->size() < DM::Scene::kMinComparisonEntries || dyes->size() > DM::Scene::kMaxComparisonEntries) {
        return fail("matrix takes 2-4 dyes");
    }

    json cells = json::array();
    for (std::size_t i = 0; i < dyes->size(); ++i) {
        for (std::size_t j = i + 1; j < dyes->size(); ++j) {
            auto ratio = DM::Color::contrast_ratio((*dyes)[i].rgb(), (*dyes)[j].rgb());
            cells.push_back(json{
                    {"a", (*dyes)[i].name},
                    {"b", (*dyes)[j].name},
                    {"ratio", ratio},
                    {"rating", DM::Color::contrast_rating_label(DM::Color::contrast_rating(ratio))},
            });
        }
    }
    std::cout << json{{"pairs", cells}}.dump(2) << "\n";
    return write_scene(options, DM::Scene::compose_contrast_matrix(*dyes));
}

auto run_info(DyeMatchOptions const& options) -> int {
    if (options.arguments.size() != 1) {
        return fail("info takes exactly one hex color");
    }
    auto hex = DM::Color::normalize_hex(options.arguments.front());
    if (!hex) {
        return fail("Invalid hex color: " + options.arguments.front());
    }
    auto const rgb  = *DM::Color::hex_to_rgb(*hex);
    auto const text = DM::Color::contrast_text_color(rgb);
    json       report{
            {"hex", *hex},
            {"rgb", DM::Color::format_rgb(rgb)},
            {"hsv", DM::Color::format_hsv(DM::Color::rgb_to_hsv(rgb))},
            {"luminance", DM::Color::relative_luminance(rgb)},
            {"text_color", DM::Color::rgb_to_hex(text, DM::Color::HexCase::Upper)},
            {"contrast_with_text", DM::Color::contrast_ratio(rgb, text)},
    };
    std::cout << report.dump(2) << "\n";
    return EXIT_SUCCESS;
}

void set_thread_and_logging(DyeMatchOptions const& options) {
    DM::set_thread_name("Main");
    if (options.verbose) {
        DM::set_logging_enabled(true);
    }
}

} // namespace

int main(int argc, char** argv) {
    auto options_opt = DM::Config::ParseDyeMatchArguments(argc, argv);
    if (!options_opt) {
        return EXIT_FAILURE;
    }

    auto options = *options_opt;
    if (options.show_help || options.command.empty()) {
        DM::Config::PrintDyeMatchUsage();
        return options.show_help ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    set_thread_and_logging(options);

    if (options.command == "probe") {
        return run_probe(options);
    }
    if (options.command == "match") {
        return run_match(options);
    }
    if (options.command == "compare") {
        return run_compare(options);
    }
    if (options.command == "matrix") {
        return run_matrix(options);
    }
    if (options.command == "info") {
        return run_info(options);
    }
    std::cerr << "Unknown command: " << options.command << "\n";
    DM::Config::PrintDyeMatchUsage();
    return EXIT_FAILURE;
}
